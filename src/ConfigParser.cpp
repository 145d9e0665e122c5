#include "ConfigParser.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

ConfigParser::ConfigParser(std::ostream& err) : m_err(err) {}

RunOptions& ConfigParser::options() {
    return m_options;
}

const RunOptions& ConfigParser::options() const {
    return m_options;
}

bool ConfigParser::load(const std::string& filePath) {
    std::ifstream jsonFile(filePath);
    if (!jsonFile) {
        m_err << "ERROR: failed to open configuration file: " << filePath << std::endl;
        return false;
    }

    json data;
    try {
        jsonFile >> data;
    } catch (const json::parse_error& e) {
        m_err << "ERROR: failed to parse configuration file: " << e.what() << std::endl;
        return false;
    }

    if (!data.is_object()) {
        m_err << "ERROR: configuration file must contain a JSON object." << std::endl;
        return false;
    }

    loadPlaceholders(data);

    try {
        if (auto it = data.find("source"); it != data.end()) {
            m_options.source = applyPlaceholders(it->get<std::string>());
        }
        if (auto it = data.find("destination"); it != data.end()) {
            m_options.destination = applyPlaceholders(it->get<std::string>());
        }
        if (auto it = data.find("mode"); it != data.end()) {
            m_options.mode = it->get<std::string>();
        }
    } catch (const json::exception& e) {
        m_err << "ERROR: invalid configuration value: " << e.what() << std::endl;
        return false;
    }

    const std::pair<const char*, bool*> flags[] = {
        {"recursive", &m_options.recursive},
        {"dry_run", &m_options.dryRun},
        {"verbose", &m_options.verbose},
    };
    for (const auto& [key, target] : flags) {
        if (auto it = data.find(key); it != data.end()) {
            if (!it->is_boolean()) {
                m_err << "ERROR: `" << key << "` must be a boolean value." << std::endl;
                return false;
            }
            *target = it->get<bool>();
        }
    }

    return true;
}

namespace {
// "/a/b/" normalizes to "/a/b/" with an empty filename; drop it so comparisons and joins agree.
fs::path withoutTrailingSeparator(fs::path path) {
    if (!path.has_filename() && path.has_parent_path() && path != path.root_path()) {
        path = path.parent_path();
    }
    return path;
}
} // namespace

bool ConfigParser::buildRunConfig(RunConfig& config) const {
    if (m_options.source.empty()) {
        m_err << "ERROR: missing required flag: --src" << std::endl;
        return false;
    }

    std::error_code ec;
    const fs::path source = withoutTrailingSeparator(fs::absolute(m_options.source, ec).lexically_normal());
    if (ec) {
        m_err << "ERROR: cannot resolve source `" << m_options.source << "`: " << ec.message() << std::endl;
        return false;
    }

    fs::path destination = source;
    if (!m_options.destination.empty()) {
        destination = withoutTrailingSeparator(fs::absolute(m_options.destination, ec).lexically_normal());
        if (ec) {
            m_err << "ERROR: cannot resolve destination `" << m_options.destination << "`: " << ec.message() << std::endl;
            return false;
        }
    }

    const auto mode = parseTransferMode(m_options.mode);
    if (!mode) {
        m_err << "ERROR: invalid --mode `" << m_options.mode << "` (use 'move' or 'copy')" << std::endl;
        return false;
    }

    const fs::file_status status = fs::status(source, ec);
    if (ec || !fs::exists(status)) {
        m_err << "ERROR: source `" << source.string() << "` is not accessible: " << (ec ? ec.message() : "path does not exist") << std::endl;
        return false;
    }
    if (!fs::is_directory(status)) {
        m_err << "ERROR: --src must be a directory: " << source.string() << std::endl;
        return false;
    }

    if (m_options.dryRun) {
        if (!destinationCreatable(destination)) {
            return false;
        }
    } else {
        fs::create_directories(destination, ec);
        if (ec) {
            m_err << "ERROR: cannot create destination `" << destination.string() << "`: " << ec.message() << std::endl;
            return false;
        }
        if (!fs::is_directory(destination, ec)) {
            m_err << "ERROR: destination `" << destination.string() << "` is not a directory." << std::endl;
            return false;
        }
    }

    config.sourceRoot = source;
    config.destRoot = destination;
    config.mode = *mode;
    config.recursive = m_options.recursive;
    config.dryRun = m_options.dryRun;
    config.verbose = m_options.verbose;
    return true;
}

bool ConfigParser::destinationCreatable(const fs::path& destination) const {
    fs::path probe = destination;
    std::error_code ec;
    while (!fs::exists(probe, ec)) {
        if (ec) {
            m_err << "ERROR: cannot inspect destination `" << probe.string() << "`: " << ec.message() << std::endl;
            return false;
        }
        if (!probe.has_parent_path() || probe.parent_path() == probe) {
            break;
        }
        probe = probe.parent_path();
    }

    if (!fs::is_directory(probe, ec)) {
        m_err << "ERROR: cannot create destination `" << destination.string() << "`: `" << probe.string() << "` is not a directory." << std::endl;
        return false;
    }
    return true;
}

void ConfigParser::loadPlaceholders(const json& data) {
    m_placeholders.clear();

    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        m_placeholders["home"] = home;
    }

    auto placeholdersIt = data.find("placeholders");
    if (placeholdersIt == data.end()) {
        return;
    }

    if (!placeholdersIt->is_object()) {
        m_err << "Warning: `placeholders` must be an object of key/value strings." << std::endl;
        return;
    }

    for (auto it = placeholdersIt->begin(); it != placeholdersIt->end(); ++it) {
        if (!it.value().is_string()) {
            m_err << "Warning: placeholder `" << it.key() << "` must be a string." << std::endl;
            continue;
        }
        m_placeholders[it.key()] = it.value().get<std::string>();
    }
}

std::string ConfigParser::applyPlaceholders(const std::string& value) const {
    std::string result = value;
    for (const auto& [key, replacement] : m_placeholders) {
        const std::string token = "{{" + key + "}}";
        std::size_t pos = 0;
        while ((pos = result.find(token, pos)) != std::string::npos) {
            result.replace(pos, token.size(), replacement);
            pos += replacement.size();
        }
    }

    if (result.find("{{") != std::string::npos) {
        m_err << "Warning: unresolved placeholder detected in value `" << result << "`." << std::endl;
    }

    return result;
}
