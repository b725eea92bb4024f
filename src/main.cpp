#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include <CLI/CLI.hpp>

#include "ConfigParser.hpp"
#include "FileScanner.hpp"
#include "Organizer.hpp"

#ifndef TAGMV_VERSION
#define TAGMV_VERSION "0.0.0"
#endif

namespace {
// Return the absolute path for the currently running executable, or empty on failure.
std::filesystem::path getExecutablePath() {
    std::error_code ec;
    auto resolved = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return {};
    }
    return resolved;
}

// Pick the directory to sort: command line first, then the configured sort root, then cwd.
std::filesystem::path chooseSortRoot(const std::string& pathArg, const ConfigParser& parser) {
    if (!pathArg.empty()) {
        return pathArg;
    }
    if (!parser.getSortRoot().empty()) {
        return parser.getSortRoot();
    }

    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        std::cerr << "Could not determine current directory. Please specify a path." << std::endl;
        return {};
    }
    return cwd;
}
} // namespace

int main(int argc, char** argv) {
    CLI::App app{"Organize music files into `Artist - Album` folders by audio tags", "tagmv"};

    std::string pathArg;
    bool execute = false;
    bool recursive = false;
    std::string configRootArg;
    app.add_option("path", pathArg, "Directory to sort (defaults to the configured sort root or the current directory)");
    app.add_flag("--execute", execute, "Actually move files (default is a dry-run preview)");
    app.add_flag("-r,--recursive", recursive, "Scan subdirectories");
    app.add_option("--config", configRootArg, "Directory holding config/tagmv.json (defaults to the executable's folder)");
    app.set_version_flag("--version", TAGMV_VERSION);

    CLI11_PARSE(app, argc, argv);

    std::filesystem::path configRoot = configRootArg;
    if (configRoot.empty()) {
        const std::filesystem::path executablePath = getExecutablePath();
        configRoot = executablePath.empty() ? std::filesystem::path(".") : executablePath.parent_path();
    }

    ConfigParser parser;
    if (!parser.load(configRoot.string())) {
        std::cerr << "Failed to load configuration. Exiting." << std::endl;
        return EXIT_FAILURE;
    }

    const std::filesystem::path requested = chooseSortRoot(pathArg, parser);
    if (requested.empty()) {
        return EXIT_FAILURE;
    }

    std::error_code ec;
    const std::filesystem::path sortRoot = std::filesystem::canonical(requested, ec);
    if (ec) {
        std::cerr << "Cannot resolve path `" << requested.string() << "`: " << ec.message() << std::endl;
        return EXIT_FAILURE;
    }

    if (!std::filesystem::is_directory(sortRoot, ec) || ec) {
        std::cerr << "Not a directory: `" << sortRoot.string() << "`" << std::endl;
        return EXIT_FAILURE;
    }

    ScanOptions scanOptions;
    scanOptions.recursive = recursive || parser.isRecursive();
    scanOptions.extensions.insert(parser.getAudioExtensions().begin(), parser.getAudioExtensions().end());

    std::cout << "tagmv v" << TAGMV_VERSION << " -- "
              << (execute ? "EXECUTING" : "DRY RUN (use --execute to move files)") << "\n" << std::endl;
    std::cout << "Scanning: " << sortRoot.string() << std::endl;

    std::vector<std::filesystem::path> files;
    if (!scanAudioFiles(sortRoot, scanOptions, files)) {
        return EXIT_FAILURE;
    }
    std::cout << "Found " << files.size() << " audio files\n" << std::endl;

    if (files.empty()) {
        return EXIT_SUCCESS;
    }

    Organizer organizer(sortRoot);
    organizer.plan(files);
    organizer.printPreview(std::cout);

    if (!execute) {
        return EXIT_SUCCESS;
    }

    std::cout << std::endl;
    const MoveSummary summary = organizer.executeAll();
    std::cout << "Moved " << summary.moved << " files successfully";
    if (summary.failed > 0) {
        std::cout << ", " << summary.failed << " errors";
    }
    std::cout << std::endl;

    return summary.failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
