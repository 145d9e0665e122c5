#include <cstdlib>
#include <iostream>
#include <string>

#include <CLI/CLI.hpp>

#include "ConfigParser.hpp"
#include "FileCollector.hpp"
#include "RunCoordinator.hpp"

int main(int argc, char** argv) {
    CLI::App app{"Sort files into category folders (images, videos, audio, documents, archives, code, ...) by extension."};

    std::string configPath;
    std::string source;
    std::string destination;
    std::string mode;
    bool recursive = false;
    bool dryRun = false;
    bool verbose = false;

    app.add_option("--config", configPath, "JSON file providing defaults for the options below")->check(CLI::ExistingFile);
    auto* srcOpt = app.add_option("--src", source, "Source directory to organize");
    auto* destOpt = app.add_option("--dest", destination, "Destination root directory (default: same as src)");
    auto* modeOpt = app.add_option("--mode", mode, "Operation mode: move or copy (default: move)");
    auto* recursiveOpt = app.add_flag("--recursive", recursive, "Scan directories recursively");
    auto* dryRunOpt = app.add_flag("--dry-run", dryRun, "Show what would happen without changing files");
    auto* verboseOpt = app.add_flag("--verbose", verbose, "Print detailed actions");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    ConfigParser parser;
    if (!configPath.empty() && !parser.load(configPath)) {
        return EXIT_FAILURE;
    }

    // Flags given on the command line win over the configuration file.
    RunOptions& options = parser.options();
    if (srcOpt->count() > 0) {
        options.source = source;
    }
    if (destOpt->count() > 0) {
        options.destination = destination;
    }
    if (modeOpt->count() > 0) {
        options.mode = mode;
    }
    if (recursiveOpt->count() > 0) {
        options.recursive = recursive;
    }
    if (dryRunOpt->count() > 0) {
        options.dryRun = dryRun;
    }
    if (verboseOpt->count() > 0) {
        options.verbose = verbose;
    }

    RunConfig config;
    if (!parser.buildRunConfig(config)) {
        return EXIT_FAILURE;
    }

    RunCoordinator coordinator(config);
    try {
        const RunSummary summary = coordinator.run();
        coordinator.printSummary(summary);
    } catch (const CollectionError& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
