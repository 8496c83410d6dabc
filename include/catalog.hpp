#ifndef CATALOG_HPP
#define CATALOG_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "component.hpp"
#include "platform.hpp"

namespace Toolpack {

/**
 * @struct CatalogEntry
 * @brief One published artifact family: a component for one target on one
 *        host (or every host), available in one or more versions.
 *
 * The url and installSubpath fields are templates; "{name}", "{version}",
 * "{target}" and "{host}" are substituted at resolution time.
 */
struct CatalogEntry
{
    ComponentKind kind = ComponentKind::Toolchain;
    std::string target;
    std::string host = "*";
    std::vector<std::string> versions;
    std::string urlTemplate;
    std::optional<ArchiveFormat> format;

    /** Version -> expected SHA-256 (lowercase hex). */
    std::map<std::string, std::string> checksums;
    std::optional<std::uintmax_t> size;

    std::string installSubpath = "{name}-{version}";
    int stripComponents = 0;
    std::optional<std::vector<std::string>> pathEntries;
    std::map<std::string, std::string> variables;

    /** @return True if this entry is published for the given host triple. */
    bool servesHost(const std::string& hostTriple) const
    {
        return host == "*" || host == hostTriple;
    }
};

/**
 * @class Catalog
 * @brief In-memory component metadata. Resolution is a pure table lookup;
 *        all I/O happens in the load functions.
 */
class Catalog
{
public:
    /**
     * @brief Parses a catalog from YAML text. Malformed entries are skipped
     *        with a warning.
     * @throws std::runtime_error if the document is not valid YAML or has no
     *         "components" sequence.
     */
    static Catalog loadFromString(const std::string& yamlText);

    /**
     * @brief Loads a catalog from a local file.
     * @throws std::runtime_error if the file is missing or malformed.
     */
    static Catalog loadFromFile(const std::filesystem::path& path);

    /**
     * @brief Loads a catalog from a local path or an http(s) URL.
     */
    static Catalog load(const std::string& location);

    /**
     * @brief Adds an entry (used by tests and by the loaders).
     */
    void addEntry(CatalogEntry entry);

    const std::vector<CatalogEntry>& entries() const { return catalogEntries; }

    /**
     * @brief Resolves a requested component to a concrete artifact for a host.
     *
     * @param component   The requested component and version constraint.
     * @param host        The host the artifact must run on.
     * @param installRoot Directory under which the install path is placed.
     * @throws InstallError(UnknownComponent) if no entry serves the
     *         (name, target, host) combination.
     * @throws InstallError(VersionNotFound) if no version satisfies the constraint.
     */
    ArtifactReference resolve(const Component& component,
                              const HostPlatform& host,
                              const std::filesystem::path& installRoot) const;

    /**
     * @return All published versions of a component for a host, newest first.
     */
    std::vector<std::string> availableVersions(const ComponentId& id,
                                               const HostPlatform& host) const;

private:
    std::vector<CatalogEntry> catalogEntries;
};

/**
 * @brief Substitutes "{key}" placeholders in a template. Unknown placeholders
 *        are left as they are.
 */
std::string expandTemplate(const std::string& text,
                           const std::map<std::string, std::string>& values);

} // namespace Toolpack

#endif // CATALOG_HPP
