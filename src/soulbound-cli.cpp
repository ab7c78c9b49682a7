// SOULBOUND CLI - Command Line Interface
// Copyright (c) 2024 SOULBOUND Developers
// MIT License
//
// The soulbound-cli tool operates a soul registry stored in a data
// directory. Every invocation opens the registry, runs one command and
// closes it again.

#include <soulbound/cli/commands.h>
#include <soulbound/db/database.h>
#include <soulbound/registry/registry.h>
#include <soulbound/util/config.h>
#include <soulbound/util/logging.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace soulbound {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "SOULBOUND CLI";

// ============================================================================
// CLI Configuration
// ============================================================================

struct CLIConfig {
    // Paths
    std::string dataDir;
    std::string configFile;

    // Identity used for authorization checks
    std::string caller;

    // Command
    std::string method;
    std::vector<std::string> args;

    // Flags
    bool showHelp{false};
    bool showVersion{false};
    bool debug{false};
};

// ============================================================================
// Help Text
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: soulbound-cli [options] <command> [params]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -v, --version              Show version information\n";
    std::cout << "  -c, --conf=FILE            Config file path\n";
    std::cout << "  -d, --datadir=DIR          Data directory path\n";
    std::cout << "  --caller=ADDRESS           Address the command runs as (default: admin)\n";
    std::cout << "  --debug                    Enable debug logging\n";
    std::cout << "\nCommands:\n";
    for (const auto& entry : GetCommands()) {
        std::string usage = entry.second.usage;
        usage.resize(std::max<size_t>(usage.size() + 1, 39), ' ');
        std::cout << "  " << usage << entry.second.description << "\n";
    }
    std::cout << "\nConfiguration (soulbound.conf in the data directory):\n";
    std::cout << "  admin=<address>  baseasset=<address>  chainid=<n>\n";
    std::cout << "  identifiermode=faithful|corrected  releaseidentityonburn=0|1\n";
    std::cout << "\nExamples:\n";
    std::cout << "  soulbound-cli mint 0x1111111111111111111111111111111111111111 alice https://a.example\n";
    std::cout << "  soulbound-cli getsoul 0x1111111111111111111111111111111111111111 metadata\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 SOULBOUND Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Command Line Parsing
// ============================================================================

bool ParseCommandLine(int argc, char* argv[], CLIConfig& config) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"conf", required_argument, nullptr, 'c'},
        {"datadir", required_argument, nullptr, 'd'},
        {"caller", required_argument, nullptr, 1001},
        {"debug", no_argument, nullptr, 1002},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;

    // Reset getopt
    optind = 1;

    while ((opt = getopt_long(argc, argv, "hvc:d:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                config.showHelp = true;
                return true;
            case 'v':
                config.showVersion = true;
                return true;
            case 'c':
                config.configFile = optarg;
                break;
            case 'd':
                config.dataDir = optarg;
                break;
            case 1001:  // --caller
                config.caller = optarg;
                break;
            case 1002:  // --debug
                config.debug = true;
                break;
            case '?':
            default:
                return false;
        }
    }

    // Remaining arguments are command and params
    for (int i = optind; i < argc; ++i) {
        if (config.method.empty()) {
            config.method = argv[i];
        } else {
            config.args.push_back(argv[i]);
        }
    }

    return true;
}

// ============================================================================
// Configuration Loading
// ============================================================================

/// Merge command-line settings with the config file. Command-line values win.
bool LoadConfiguration(const CLIConfig& cli, util::ConfigManager& config) {
    if (!cli.dataDir.empty()) {
        config.SetDataDir(cli.dataDir);
    }
    if (!cli.caller.empty()) {
        config.Set(util::ConfigKeys::CALLER, cli.caller);
    }
    if (cli.debug) {
        config.Set(util::ConfigKeys::DEBUG, "1");
    }

    std::filesystem::path confPath = cli.configFile.empty()
        ? std::filesystem::path(config.GetDataDir()) / util::DEFAULT_CONFIG_FILENAME
        : std::filesystem::path(util::ConfigManager::ExpandTilde(cli.configFile));

    std::error_code ec;
    if (!std::filesystem::exists(confPath, ec)) {
        if (!cli.configFile.empty()) {
            std::cerr << "Error: Config file not found: " << confPath.string() << "\n";
            return false;
        }
        return true;
    }

    util::ConfigParseResult result = config.ParseFile(confPath.string());
    if (!result.success) {
        std::cerr << "Error: " << result.ToString() << "\n";
        return false;
    }
    return true;
}

void SetupLogging(const util::ConfigManager& config) {
    util::LogLevel level = config.GetBool(util::ConfigKeys::DEBUG, false)
        ? util::LogLevel::Debug
        : util::LogLevelFromString(config.GetString(util::ConfigKeys::LOGLEVEL, "warn"));

    auto& logger = util::Logger::Instance();
    logger.SetLevel(level);

    if (config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, true)) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = level;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    std::string logFile = config.GetPath(util::ConfigKeys::LOGFILE);
    if (!logFile.empty()) {
        util::FileSink::Config fileConfig;
        fileConfig.path = logFile;
        fileConfig.level = level;
        logger.AddSink(std::make_shared<util::FileSink>(fileConfig));
    }
}

// ============================================================================
// Argument Helpers
// ============================================================================

bool ParseAddressArg(const std::string& arg, const char* what, Address& out) {
    auto addr = Address::TryFromHex(arg);
    if (!addr) {
        std::cerr << "Error: Invalid " << what << " address: " << arg << "\n";
        return false;
    }
    out = *addr;
    return true;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    CLIConfig cli;

    // Parse command line
    if (!ParseCommandLine(argc, argv, cli)) {
        std::cerr << "Error parsing command line. Use --help for usage.\n";
        return 1;
    }

    // Handle special flags
    if (cli.showHelp) {
        PrintHelp();
        return 0;
    }

    if (cli.showVersion) {
        PrintVersion();
        return 0;
    }

    // Check for command
    if (cli.method.empty()) {
        std::cerr << "Error: No command specified.\n";
        std::cerr << "Use 'soulbound-cli --help' for usage information.\n";
        return 1;
    }

    if (!FindCommand(cli.method, cli.args.size(), std::cerr)) {
        return 1;
    }

    // Load config file
    util::ConfigManager config;
    if (!LoadConfiguration(cli, config)) {
        return 1;
    }
    SetupLogging(config);

    std::string configError;
    auto options = registry::RegistryOptions::FromConfig(config, &configError);
    if (!options) {
        std::cerr << "Error: " << configError << "\n";
        return 1;
    }
    if (options->baseAsset.IsNull()) {
        std::cerr << "Error: No base asset configured (set baseasset=<address>)\n";
        return 1;
    }

    Address caller = options->administrator;
    std::string callerArg = config.GetString(util::ConfigKeys::CALLER, "");
    if (!callerArg.empty() && !ParseAddressArg(callerArg, "caller", caller)) {
        return 1;
    }

    // Open storage
    db::Options dbOptions;
    dbOptions.create_if_missing = true;
    dbOptions.block_cache_size =
        static_cast<size_t>(config.GetUInt(util::ConfigKeys::DBCACHE, 8)) * 1024 * 1024;

    std::filesystem::path dbPath = std::filesystem::path(config.GetDataDir()) / "registry";
    auto [status, database] = db::OpenDatabase(dbPath, dbOptions);
    if (!status.ok()) {
        std::cerr << "Error: Cannot open registry at " << dbPath.string() << ": "
                  << status.ToString() << "\n";
        return 1;
    }

    auto [openErr, soulRegistry] = registry::SoulRegistry::Open(std::move(database), *options);
    if (openErr != registry::RegistryError::OK) {
        std::cerr << "error: " << registry::RegistryErrorToString(openErr) << "\n";
        return 1;
    }

    int result = RunCommand(*soulRegistry, caller, cli.method, cli.args,
                            std::cout, std::cerr);

    util::Logger::Instance().Flush();
    return result;
}

} // namespace cli
} // namespace soulbound

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return soulbound::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
