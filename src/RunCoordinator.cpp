#include "RunCoordinator.hpp"

#include "FileCollector.hpp"
#include "Placer.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

std::string formatDuration(std::chrono::milliseconds duration) {
    const long long millis = duration.count();
    if (millis < 1000) {
        return std::to_string(millis) + "ms";
    }

    std::ostringstream text;
    text << millis / 1000 << '.' << std::setw(3) << std::setfill('0') << millis % 1000 << 's';
    return text.str();
}

std::chrono::milliseconds roundToMilliseconds(std::chrono::nanoseconds elapsed) {
    return std::chrono::round<std::chrono::milliseconds>(elapsed);
}

RunCoordinator::RunCoordinator(RunConfig config, std::ostream& out, std::ostream& err)
    : m_config(std::move(config)), m_out(out), m_err(err),
      m_engine(m_config.mode, m_config.dryRun, m_config.verbose, out) {}

TransferEngine& RunCoordinator::engine() {
    return m_engine;
}

RunSummary RunCoordinator::run() {
    const auto start = std::chrono::steady_clock::now();

    const auto files = collectFiles(m_config.sourceRoot, m_config.recursive);
    if (m_config.verbose) {
        m_out << "Files found: " << files.size() << std::endl;
    }

    RunSummary summary;
    summary.processed = files.size();

    for (const auto& file : files) {
        const auto placement = place(file, m_config.sourceRoot, m_config.destRoot);
        if (!placement) {
            ++summary.failed;
            m_err << "WARN: cannot build relative path for " << file.string() << " under " << m_config.sourceRoot.string() << std::endl;
            continue;
        }

        if (placement->collision) {
            ++summary.skipped;
            continue;
        }

        const TransferOutcome outcome = m_engine.transfer(*placement);
        if (outcome.success) {
            ++summary.succeeded;
            continue;
        }

        ++summary.failed;
        if (outcome.directoryFailure) {
            m_err << "WARN: " << outcome.reason << std::endl;
        } else {
            m_err << "WARN: " << transferModeName(m_config.mode) << " failed: " << outcome.reason << std::endl;
        }
    }

    summary.duration = roundToMilliseconds(std::chrono::steady_clock::now() - start);
    return summary;
}

void RunCoordinator::printSummary(const RunSummary& summary) const {
    m_out << "Done." << std::endl;
    m_out << "Processed: " << summary.processed << std::endl;
    m_out << "Succeeded: " << summary.succeeded << std::endl;
    m_out << "Skipped: " << summary.skipped << std::endl;
    m_out << "Failed: " << summary.failed << std::endl;
    m_out << "Duration: " << formatDuration(summary.duration) << std::endl;
}
