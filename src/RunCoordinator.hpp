#ifndef RUN_COORDINATOR_HPP
#define RUN_COORDINATOR_HPP

#include "RunConfig.hpp"
#include "TransferEngine.hpp"

#include <chrono>
#include <cstddef>
#include <iostream>
#include <string>

// Counters for one pass over the source tree.
struct RunSummary {
    std::size_t processed = 0;
    std::size_t succeeded = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    std::chrono::milliseconds duration{0};
};

// Format a duration the way the summary prints it: "250ms" or "1.204s".
std::string formatDuration(std::chrono::milliseconds duration);
// Nearest whole millisecond, as reported in the summary.
std::chrono::milliseconds roundToMilliseconds(std::chrono::nanoseconds elapsed);

// Sorts every file under the source root into category folders, one file at a time.
class RunCoordinator {
public:
    explicit RunCoordinator(RunConfig config, std::ostream& out = std::cout, std::ostream& err = std::cerr);

    // Collect, place and transfer every candidate. Per-file failures are counted, not thrown;
    // a CollectionError from enumeration propagates and no summary is produced.
    RunSummary run();
    // Write the fixed summary block to the output stream.
    void printSummary(const RunSummary& summary) const;

    // Access to the engine so callers can adjust how moves are performed.
    TransferEngine& engine();

private:
    RunConfig m_config;
    std::ostream& m_out;
    std::ostream& m_err;
    TransferEngine m_engine;
};

#endif
