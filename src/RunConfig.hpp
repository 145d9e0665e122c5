#ifndef RUN_CONFIG_HPP
#define RUN_CONFIG_HPP

#include <filesystem>
#include <optional>
#include <string>

enum class TransferMode {
    Move,
    Copy
};

// Upper-case verb printed in action lines ("MOVE" / "COPY").
const char* transferVerb(TransferMode mode);
// Lower-case name as accepted on the command line ("move" / "copy").
const char* transferModeName(TransferMode mode);
// Parse a mode name after trimming whitespace and lower-casing; empty on unknown names.
std::optional<TransferMode> parseTransferMode(std::string name);

// Raw values gathered from the configuration file and the command line, not yet validated.
struct RunOptions {
    std::string source;
    std::string destination;
    std::string mode = "move";
    bool recursive = false;
    bool dryRun = false;
    bool verbose = false;
};

// Validated settings for one run. Both roots are absolute and lexically normalized.
struct RunConfig {
    std::filesystem::path sourceRoot;
    std::filesystem::path destRoot;
    TransferMode mode = TransferMode::Move;
    bool recursive = false;
    bool dryRun = false;
    bool verbose = false;
};

#endif
