#ifndef TRANSFER_ENGINE_HPP
#define TRANSFER_ENGINE_HPP

#include "Placer.hpp"
#include "RunConfig.hpp"

#include <filesystem>
#include <functional>
#include <iostream>
#include <string>
#include <system_error>

// Result of one transfer. reason is empty on success.
struct TransferOutcome {
    bool success = false;
    std::string reason;
    // Set when the category folder could not be created and nothing was attempted.
    bool directoryFailure = false;
};

// Moves or copies a placed file into its category folder, or only reports it under dry run.
class TransferEngine {
public:
    using RenameFunction = std::function<void(const std::filesystem::path&, const std::filesystem::path&, std::error_code&)>;
    using RemoveFunction = std::function<bool(const std::filesystem::path&, std::error_code&)>;

    TransferEngine(TransferMode mode, bool dryRun, bool verbose, std::ostream& out = std::cout);

    // Ensure the category folder exists, then move or copy the file.
    TransferOutcome transfer(const Placement& placement) const;
    // Swap the primitive used for the same-filesystem move attempt.
    void setRenameFunction(RenameFunction rename);
    // Swap the primitive that deletes the source after a fallback copy.
    void setRemoveFunction(RemoveFunction remove);

    // Stream source into a freshly truncated destination and fsync it before closing.
    static TransferOutcome copyFile(const std::filesystem::path& source, const std::filesystem::path& destination);

private:
    TransferOutcome ensureDirectory(const std::filesystem::path& directory) const;
    TransferOutcome moveFile(const std::filesystem::path& source, const std::filesystem::path& destination) const;

    TransferMode m_mode;
    bool m_dryRun;
    bool m_verbose;
    std::ostream& m_out;
    RenameFunction m_rename;
    RemoveFunction m_remove;
};

#endif
