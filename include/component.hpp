#ifndef COMPONENT_HPP
#define COMPONENT_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Toolpack {

/**
 * @brief The closed set of installable components.
 */
enum class ComponentKind
{
    Toolchain,
    StandardLibrary,
    LinkerToolchain,
    ClangRuntime,
    BuildTool
};

/**
 * @brief Container formats an artifact can be published in.
 */
enum class ArchiveFormat
{
    Zip,
    TarGz,
    TarXz
};

/**
 * @return The canonical name of a component kind ("toolchain", "standard-library", ...).
 */
std::string componentKindName(ComponentKind kind);

/**
 * @brief Parses a canonical component name.
 * @return The kind, or std::nullopt for unknown names.
 */
std::optional<ComponentKind> parseComponentKind(const std::string& name);

/**
 * @return The canonical format tag ("zip", "tar.gz", "tar.xz").
 */
std::string archiveFormatName(ArchiveFormat format);

/**
 * @brief Parses a format tag. Accepts "zip", "tar.gz", "tgz", "tar.xz", "txz".
 */
std::optional<ArchiveFormat> parseArchiveFormat(const std::string& tag);

/**
 * @struct ComponentId
 * @brief Identity of a component: its kind and the target triple it serves.
 */
struct ComponentId
{
    ComponentKind kind = ComponentKind::Toolchain;
    std::string targetTriple;

    /** @return "<name>:<target>", used as the key in the install state. */
    std::string key() const;

    bool operator==(const ComponentId& other) const
    {
        return kind == other.kind && targetTriple == other.targetTriple;
    }
    bool operator!=(const ComponentId& other) const { return !(*this == other); }
    bool operator<(const ComponentId& other) const { return key() < other.key(); }
};

/**
 * @struct Component
 * @brief A requested component: identity plus version constraint.
 */
struct Component
{
    ComponentId id;

    /** Exact version, dotted prefix, comparison or "latest" (empty = latest). */
    std::string version;
};

/**
 * @struct ArtifactReference
 * @brief Fully resolved download descriptor for one component on one host.
 */
struct ArtifactReference
{
    ComponentId id;
    std::string version;
    std::string url;
    ArchiveFormat format = ArchiveFormat::TarXz;
    std::optional<std::string> sha256;
    std::optional<std::uintmax_t> size;
    std::filesystem::path installPath;
    int stripComponents = 0;

    /** Sub-directories of installPath prepended to PATH. */
    std::vector<std::string> pathEntries;

    /** Variable name -> sub-path of installPath. */
    std::map<std::string, std::string> variables;
};

/**
 * @return The PATH sub-directories a component exports when the catalog
 *         does not say otherwise.
 */
std::vector<std::string> defaultPathEntries(ComponentKind kind);

} // namespace Toolpack

#endif // COMPONENT_HPP
