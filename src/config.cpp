#include "config.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace Toolpack {

    namespace {

        template <typename T>
        T readValue(const YAML::Node& node, const std::string& key, const T& fallback)
        {
            if (!node[key]) {
                return fallback;
            }
            try {
                return node[key].as<T>();
            } catch (const YAML::Exception& e) {
                throw std::runtime_error("Invalid value for '" + key + "': " + e.what());
            }
        }

        fs::path readPath(const YAML::Node& node, const std::string& key, const fs::path& fallback)
        {
            std::string value = trim(readValue<std::string>(node, key, ""));
            return value.empty() ? fallback : expandHome(value);
        }

    } // namespace

    fs::path Config::toolpackHome() {
        const char* value = std::getenv("TOOLPACK_HOME");
        if (value && *value) {
            return expandHome(value);
        }
        return homeDirectory() / ".toolpack";
    }

    fs::path Config::defaultConfigPath() {
        const char* value = std::getenv("TOOLPACK_CONFIG");
        if (value && *value) {
            return expandHome(value);
        }
        return toolpackHome() / "config.yaml";
    }

    Config Config::defaults(const fs::path& home) {
        Config config;
        config.home = home;
        config.installRoot = home / "toolchains";
        config.stagingDir = home / "staging";
        config.stateFile = home / "install-state.yaml";
        config.exportFile = expandHome("~/export-toolpack.sh");
        config.catalog = (home / "catalog.yaml").string();

        unsigned int cores = std::thread::hardware_concurrency();
        config.workers = cores == 0 ? 1 : cores;
        return config;
    }

    Config Config::loadFromFile(const fs::path& path) {
        fs::path home = toolpackHome();

        if (!fs::exists(path)) {
            log_debug("Configuration file not found: " + path.string() + ", using defaults");
            return defaults(home);
        }

        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Unable to open configuration file: " + path.string());
        }
        std::stringstream buffer;
        buffer << file.rdbuf();

        try {
            return loadFromString(buffer.str(), home);
        } catch (const std::exception& e) {
            throw std::runtime_error("Configuration file " + path.string() + ": " + e.what());
        }
    }

    Config Config::loadFromString(const std::string& yamlText, const fs::path& home) {
        Config config = defaults(home);

        YAML::Node root;
        try {
            root = YAML::Load(yamlText);
        } catch (const YAML::Exception& e) {
            throw std::runtime_error(std::string("Malformed YAML: ") + e.what());
        }
        if (!root || root.IsNull()) {
            return config;
        }
        if (!root.IsMap()) {
            throw std::runtime_error("Expected a mapping at the top level");
        }

        config.installRoot = readPath(root, "install_root", config.installRoot);
        config.stagingDir = readPath(root, "staging_dir", config.stagingDir);
        config.stateFile = readPath(root, "state_file", config.stateFile);
        config.exportFile = readPath(root, "export_file", config.exportFile);

        std::string catalog = trim(readValue<std::string>(root, "catalog", ""));
        if (!catalog.empty()) {
            config.catalog = isRemoteLocation(catalog) ? catalog : expandHome(catalog).string();
        }
        config.host = trim(readValue<std::string>(root, "host", config.host));

        int workers = readValue<int>(root, "workers", static_cast<int>(config.workers));
        if (workers < 1) {
            throw std::runtime_error("'workers' must be at least 1");
        }
        config.workers = static_cast<size_t>(workers);

        long long fetchSeconds = readValue<long long>(root, "fetch_timeout_seconds", config.fetchTimeout.count());
        long long extractSeconds = readValue<long long>(root, "extract_timeout_seconds", config.extractTimeout.count());
        if (fetchSeconds <= 0 || extractSeconds <= 0) {
            throw std::runtime_error("Timeouts must be positive");
        }
        config.fetchTimeout = std::chrono::seconds(fetchSeconds);
        config.extractTimeout = std::chrono::seconds(extractSeconds);

        if (root["retry"]) {
            const YAML::Node& retry = root["retry"];
            if (!retry.IsMap()) {
                throw std::runtime_error("'retry' must be a mapping");
            }
            config.retry.maxAttempts = readValue<int>(retry, "max_attempts", config.retry.maxAttempts);
            config.retry.baseDelay = std::chrono::milliseconds(
                readValue<long long>(retry, "base_delay_ms", config.retry.baseDelay.count()));
            config.retry.maxDelay = std::chrono::milliseconds(
                readValue<long long>(retry, "max_delay_ms", config.retry.maxDelay.count()));
            config.retry.maxTotalWait = std::chrono::milliseconds(
                readValue<long long>(retry, "max_total_wait_ms", config.retry.maxTotalWait.count()));
            config.retry.jitter = readValue<double>(retry, "jitter", config.retry.jitter);

            if (config.retry.maxAttempts < 1) {
                throw std::runtime_error("'retry.max_attempts' must be at least 1");
            }
            if (config.retry.jitter < 0.0 || config.retry.jitter > 1.0) {
                throw std::runtime_error("'retry.jitter' must be between 0 and 1");
            }
        }

        return config;
    }

    void Config::print() const {
        std::cout << "Configuration:" << std::endl;
        std::cout << "  home:         " << home.string() << std::endl;
        std::cout << "  install_root: " << installRoot.string() << std::endl;
        std::cout << "  staging_dir:  " << stagingDir.string() << std::endl;
        std::cout << "  state_file:   " << stateFile.string() << std::endl;
        std::cout << "  export_file:  " << exportFile.string() << std::endl;
        std::cout << "  catalog:      " << catalog << std::endl;
        std::cout << "  host:         " << (host.empty() ? "(detected)" : host) << std::endl;
        std::cout << "  workers:      " << workers << std::endl;
    }

} // namespace Toolpack
