#ifndef CONFIG_PARSER_HPP
#define CONFIG_PARSER_HPP

#include "RunConfig.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <unordered_map>

#include <nlohmann/json_fwd.hpp>

// Gathers run options from an optional JSON file and command-line overrides,
// then validates them into a RunConfig.
class ConfigParser {
public:
    explicit ConfigParser(std::ostream& err = std::cerr);

    // Load defaults from a JSON configuration file; returns false on I/O, parse or type errors.
    bool load(const std::string& filePath);
    // Options collected so far; command-line values are written here after load().
    RunOptions& options();
    const RunOptions& options() const;
    // Validate the options, create the destination root (unless dry run) and fill config.
    bool buildRunConfig(RunConfig& config) const;

private:
    // Collect placeholder tokens (built-in and user-defined) for later substitution.
    void loadPlaceholders(const nlohmann::json& data);
    // Replace placeholder tokens in strings, logging warnings for unresolved entries.
    std::string applyPlaceholders(const std::string& value) const;
    // Check that the destination could be created without touching the filesystem.
    bool destinationCreatable(const std::filesystem::path& destination) const;

    std::ostream& m_err;
    RunOptions m_options;
    std::unordered_map<std::string, std::string> m_placeholders;
};

#endif
