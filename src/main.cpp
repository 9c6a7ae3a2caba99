#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <getopt.h>

#include "ConfigParser.hpp"
#include "EventSink.hpp"
#include "Organizer.hpp"
#include "OrganizerErrors.hpp"
#include "RunSummary.hpp"

namespace {
constexpr const char* kBanner = "TidyTree - rule-based file organizer with dry-run and undo.";
constexpr const char* kDefaultManifest = ".undo_manifest.json";

enum LongOption {
    kOptMode = 1000,
    kOptManifest,
    kOptNoHidden,
    kOptDryRun
};

struct CommandLine {
    std::string command;
    std::filesystem::path source;
    std::filesystem::path dest;
    std::optional<std::filesystem::path> config;
    PlacementMode mode = PlacementMode::Move;
    std::filesystem::path manifest = kDefaultManifest;
    bool noHidden = false;
    bool dryRun = false;
};

void printUsage(const char* program) {
    std::cout << kBanner << "\n\n"
              << "Usage:\n"
              << "  " << program << " organize -s SRC -d DEST [options] [--dry-run]\n"
              << "  " << program << " plan     -s SRC -d DEST [options]\n"
              << "  " << program << " undo     [-m MANIFEST]\n\n"
              << "Options:\n"
              << "  -s, --source DIR       Source directory\n"
              << "  -d, --dest DIR         Destination directory\n"
              << "  -c, --config FILE      JSON rules file (defaults apply when omitted)\n"
              << "      --mode MODE        move | copy | hardlink (default: move)\n"
              << "  -m, --manifest FILE    Undo manifest path (default: " << kDefaultManifest << ")\n"
              << "      --no-hidden        Exclude hidden files and folders (overrides config)\n"
              << "      --dry-run          Plan only; don't modify files\n"
              << "  -h, --help             Show this help\n";
}

// Returns std::nullopt after printing an error when the arguments are unusable.
std::optional<CommandLine> parseCommandLine(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return std::nullopt;
    }

    CommandLine cli;
    cli.command = argv[1];
    if (cli.command == "-h" || cli.command == "--help") {
        printUsage(argv[0]);
        std::exit(EXIT_SUCCESS);
    }
    if (cli.command != "organize" && cli.command != "plan" && cli.command != "undo") {
        std::cerr << "Unknown command `" << cli.command << "`." << std::endl;
        printUsage(argv[0]);
        return std::nullopt;
    }
    cli.dryRun = cli.command == "plan";

    static const option longOptions[] = {
        {"source", required_argument, nullptr, 's'},
        {"dest", required_argument, nullptr, 'd'},
        {"config", required_argument, nullptr, 'c'},
        {"manifest", required_argument, nullptr, 'm'},
        {"mode", required_argument, nullptr, kOptMode},
        {"no-hidden", no_argument, nullptr, kOptNoHidden},
        {"dry-run", no_argument, nullptr, kOptDryRun},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    // Parse everything after the subcommand.
    optind = 1;
    int opt = 0;
    while ((opt = getopt_long(argc - 1, argv + 1, "s:d:c:m:h", longOptions, nullptr)) != -1) {
        switch (opt) {
        case 's':
            cli.source = optarg;
            break;
        case 'd':
            cli.dest = optarg;
            break;
        case 'c':
            cli.config = std::filesystem::path(optarg);
            break;
        case 'm':
            cli.manifest = optarg;
            break;
        case kOptMode: {
            const auto mode = modeFromString(optarg);
            if (!mode) {
                std::cerr << "Error: Invalid mode \"" << optarg << "\". Choose from move, copy, hardlink." << std::endl;
                return std::nullopt;
            }
            cli.mode = *mode;
            break;
        }
        case kOptNoHidden:
            cli.noHidden = true;
            break;
        case kOptDryRun:
            if (cli.command == "undo") {
                std::cerr << "Error: --dry-run is not supported by undo." << std::endl;
                return std::nullopt;
            }
            cli.dryRun = true;
            break;
        case 'h':
            printUsage(argv[0]);
            std::exit(EXIT_SUCCESS);
        default:
            return std::nullopt;
        }
    }

    if (optind < argc - 1) {
        std::cerr << "Unexpected argument `" << argv[optind + 1] << "`." << std::endl;
        return std::nullopt;
    }

    if (cli.command != "undo" && (cli.source.empty() || cli.dest.empty())) {
        std::cerr << "Both --source and --dest are required for `" << cli.command << "`." << std::endl;
        return std::nullopt;
    }

    return cli;
}

int runOrganize(const CommandLine& cli, EventSink& sink) {
    ConfigParser parser;
    if (cli.config && !parser.load(*cli.config)) {
        std::cerr << "Failed to load configuration. Exiting." << std::endl;
        return EXIT_FAILURE;
    }

    RuleSet rules = parser.getRules();
    if (cli.noHidden) {
        rules.excludeHidden = true;
    }

    std::cout << kBanner << "\n"
              << "Source: " << cli.source.string() << "\n"
              << "Dest:   " << cli.dest.string() << "\n"
              << "Mode:   " << toString(cli.mode) << "\n"
              << "DryRun: " << (cli.dryRun ? "true" : "false") << std::endl;

    std::optional<std::filesystem::path> manifest;
    if (!cli.dryRun) {
        manifest = cli.manifest;
    }

    const auto results = organize(cli.source, cli.dest, rules, cli.mode, cli.dryRun, manifest, sink);
    std::cout << "Done: " << summarize(results) << std::endl;
    return EXIT_SUCCESS;
}

int runUndo(const CommandLine& cli, EventSink& sink) {
    std::cout << kBanner << std::endl;
    const auto results = undoRun(cli.manifest, sink);
    std::cout << "Done: " << summarize(results) << std::endl;
    return EXIT_SUCCESS;
}
} // namespace

int main(int argc, char* argv[]) {
    const auto cli = parseCommandLine(argc, argv);
    if (!cli) {
        return EXIT_FAILURE;
    }

    ConsoleEventSink sink(std::cout, std::cerr);
    try {
        if (cli->command == "undo") {
            return runUndo(*cli, sink);
        }
        return runOrganize(*cli, sink);
    } catch (const OrganizerError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
