#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <curl/curl.h>

#include "cache.hpp"
#include "catalog.hpp"
#include "config.hpp"
#include "environment.hpp"
#include "errors.hpp"
#include "fetch.hpp"
#include "install_state.hpp"
#include "list.hpp"
#include "orchestrator.hpp"
#include "platform.hpp"
#include "utils.hpp"

namespace {

Toolpack::CancellationToken interruptToken;

extern "C" void handleInterrupt(int)
{
    interruptToken.cancel();
}

/**
 * Options shared by every command.
 */
struct CommandLine
{
    std::string command;
    std::vector<std::string> targets;
    std::vector<std::string> positional;
    std::string defaultHost;
    std::string configPath;
    bool all = false;
};

/**
 * Initialises libcurl for the lifetime of the program.
 */
class CurlGlobal
{
public:
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

void printHelp()
{
    std::cout << "toolpack 0.1\n"
              << "Usage: toolpack <command> [options] [COMPONENT[@VERSION]...]\n\n"
              << "toolpack installs cross-compilation toolchains and their companion\n"
              << "components into the user's home directory and configures the\n"
              << "environment to use them.\n\n"
              << "Commands:\n"
              << "  install      - Install or upgrade components\n"
              << "  uninstall    - Remove components (--all removes everything)\n"
              << "  update       - Upgrade components to the newest matching version\n"
              << "  list         - List installed components\n"
              << "  env          - Print the environment of the installed components\n"
              << "  clean        - Remove stale downloads and interrupted extractions\n\n"
              << "Options:\n"
              << "  --target <triple>        Target to install for (repeatable, default: host)\n"
              << "  --default-host <triple>  Override the detected host triple\n"
              << "  --config <file>          Configuration file\n"
              << "  --all                    With uninstall: remove every component\n"
              << "  -v, --verbose            Print debug messages\n\n"
              << "Components:\n"
              << "  toolchain, standard-library, linker-toolchain, clang-runtime, build-tool\n";
}

bool parseCommandLine(int argc, char* argv[], CommandLine& cli)
{
    cli.command = argv[1];

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--target" || arg == "--default-host" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires an argument.\n";
                return false;
            }
            std::string value = argv[++i];
            if (arg == "--target") {
                cli.targets.push_back(value);
            } else if (arg == "--default-host") {
                cli.defaultHost = value;
            } else {
                cli.configPath = value;
            }
        }
        else if (arg == "-v" || arg == "--verbose") {
            Toolpack::setVerbose(true);
        }
        else if (arg == "--all") {
            cli.all = true;
        }
        else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option '" << arg << "'.\n";
            return false;
        }
        else {
            cli.positional.push_back(arg);
        }
    }
    return true;
}

/**
 * Expands "name[@version]" arguments into one Component per target.
 */
bool parseComponents(const std::vector<std::string>& arguments,
                     const std::vector<std::string>& targets,
                     std::vector<Toolpack::Component>& components)
{
    for (const auto& argument : arguments) {
        std::string name = argument;
        std::string version;
        auto at = argument.find('@');
        if (at != std::string::npos) {
            name = argument.substr(0, at);
            version = argument.substr(at + 1);
        }

        auto kind = Toolpack::parseComponentKind(name);
        if (!kind) {
            std::cerr << "Error: Unknown component '" << name << "'.\n";
            return false;
        }
        for (const auto& target : targets) {
            components.push_back(Toolpack::Component{Toolpack::ComponentId{*kind, target}, version});
        }
    }
    return true;
}

} // namespace

int main(int argc, char* argv[])
{
    // If no command is supplied, show the help message
    if (argc < 2) {
        printHelp();
        return 0;
    }

    CommandLine cli;
    if (!parseCommandLine(argc, argv, cli)) {
        return 1;
    }

    if (cli.command == "help" || cli.command == "--help" || cli.command == "-h") {
        printHelp();
        return 0;
    }
    if (cli.command != "install" && cli.command != "uninstall" && cli.command != "update" &&
        cli.command != "list" && cli.command != "env" && cli.command != "clean") {
        std::cerr << "Unknown command '" << cli.command << "'. Run 'toolpack help'.\n";
        return 1;
    }

    // -------------------------------------------------------------
    // Configuration and host
    // -------------------------------------------------------------
    Toolpack::Config config;
    Toolpack::HostPlatform host;
    try {
        config = Toolpack::Config::loadFromFile(
            cli.configPath.empty() ? Toolpack::Config::defaultConfigPath() : Toolpack::expandHome(cli.configPath));

        std::string hostTriple = !cli.defaultHost.empty() ? cli.defaultHost : config.host;
        host = hostTriple.empty() ? Toolpack::describeHost() : Toolpack::parseHostTriple(hostTriple);
    } catch (const std::exception& e) {
        Toolpack::log_error(e.what());
        return 1;
    }
    if (Toolpack::isVerbose()) {
        config.print();
    }
    Toolpack::log_debug("Host triple: " + host.triple);

    if (cli.targets.empty()) {
        cli.targets.push_back(host.triple);
    }

    // -------------------------------------------------------------
    // Clean Command
    // -------------------------------------------------------------
    if (cli.command == "clean") {
        Toolpack::Cache::clean(config.stagingDir, config.installRoot);
        return 0;
    }

    Toolpack::StateTracker tracker(config.stateFile);
    try {
        tracker.load();
    } catch (const Toolpack::InstallError& e) {
        Toolpack::log_error(e.what());
        return 1;
    }

    // -------------------------------------------------------------
    // List Command
    // -------------------------------------------------------------
    if (cli.command == "list") {
        Toolpack::List::showInstalledComponents(tracker.state(), std::cout);
        return 0;
    }

    // -------------------------------------------------------------
    // Env Command
    // -------------------------------------------------------------
    if (cli.command == "env") {
        Toolpack::EnvironmentSet environment = Toolpack::computeEnvironment(tracker.state(), host);
        if (host.usesExportFile()) {
            std::cout << Toolpack::PosixExportFile::render(environment);
        } else {
            Toolpack::List::showEnvironment(environment, std::cout);
        }
        return 0;
    }

    // -------------------------------------------------------------
    // Install / Update / Uninstall Commands
    // -------------------------------------------------------------
    std::vector<Toolpack::Component> components;
    if (!parseComponents(cli.positional, cli.targets, components)) {
        return 1;
    }
    if (cli.command == "install" && components.empty()) {
        std::cerr << "Usage: toolpack install [--target <triple>]... COMPONENT[@VERSION]...\n";
        return 1;
    }
    if (cli.command == "uninstall" && components.empty() && !cli.all) {
        std::cerr << "Usage: toolpack uninstall [--target <triple>]... COMPONENT... | --all\n";
        return 1;
    }

    CurlGlobal curlGlobal;
    std::signal(SIGINT, handleInterrupt);

    Toolpack::Catalog catalog;
    std::unique_ptr<Toolpack::EnvironmentTarget> environment;
    try {
        if (cli.command != "uninstall") {
            catalog = Toolpack::Catalog::load(config.catalog);
        }
        environment = Toolpack::makeEnvironmentTarget(host, config.exportFile);
    } catch (const std::exception& e) {
        Toolpack::log_error(e.what());
        return 1;
    }

    Toolpack::CurlTransport transport;
    Toolpack::Fetcher fetcher(transport, config.retry, config.stagingDir);

    Toolpack::OrchestratorOptions options;
    options.installRoot = config.installRoot;
    options.fetchTimeout = config.fetchTimeout;
    options.extractTimeout = config.extractTimeout;
    options.workers = config.workers;

    Toolpack::Orchestrator orchestrator(catalog, fetcher, tracker, *environment, host, options, &interruptToken);

    Toolpack::RunReport report;
    if (cli.command == "install") {
        report = orchestrator.install(components);
    }
    else if (cli.command == "update") {
        report = orchestrator.update(components);
    }
    else if (cli.all) {
        report = orchestrator.uninstallAll();
    }
    else {
        std::vector<Toolpack::ComponentId> ids;
        for (const auto& component : components) {
            ids.push_back(component.id);
        }
        report = orchestrator.uninstall(ids);
    }

    std::cout << std::endl;
    report.print(std::cout);

    if (interruptToken.isCancelled()) {
        Toolpack::log_warning("Interrupted. Re-run the command to finish the remaining components.");
    }

    std::string hint = environment->activationHint();
    if (cli.command != "uninstall" && !hint.empty() && !tracker.state().empty()) {
        std::cout << "\n" << hint << std::endl;
    }

    return report.exitCode();
}
