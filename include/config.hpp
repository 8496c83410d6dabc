#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

#include "fetch.hpp"

namespace Toolpack {

class Config
{
public:
    /** Per-user toolpack directory ($TOOLPACK_HOME or ~/.toolpack). */
    std::filesystem::path home;

    std::filesystem::path installRoot;
    std::filesystem::path stagingDir;
    std::filesystem::path stateFile;

    /** Sourceable export file written on POSIX hosts. */
    std::filesystem::path exportFile;

    /** Catalog location: a local path or an http(s) URL. */
    std::string catalog;

    /** Host triple override; empty means detect. */
    std::string host;

    size_t workers = 1;
    std::chrono::seconds fetchTimeout{600};
    std::chrono::seconds extractTimeout{600};
    RetryPolicy retry;

    /**
     * @return $TOOLPACK_HOME, or ~/.toolpack.
     */
    static std::filesystem::path toolpackHome();

    /**
     * @return $TOOLPACK_CONFIG, or config.yaml in the toolpack home.
     */
    static std::filesystem::path defaultConfigPath();

    /**
     * @brief Default configuration rooted at the given toolpack home.
     */
    static Config defaults(const std::filesystem::path& home);

    /**
     * @brief Loads configuration from a file on disk. A missing file yields
     *        the defaults.
     * @throws std::runtime_error if the file is not valid YAML or a value
     *         has the wrong type.
     */
    static Config loadFromFile(const std::filesystem::path& path);

    /**
     * @brief Parses configuration text on top of the defaults for `home`.
     * @throws std::runtime_error on malformed input.
     */
    static Config loadFromString(const std::string& yamlText, const std::filesystem::path& home);

    /**
     * @brief Prints the effective configuration to standard output.
     */
    void print() const;
};

} // namespace Toolpack

#endif // CONFIG_HPP
