#ifndef EXTRACT_HPP
#define EXTRACT_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "component.hpp"
#include "errors.hpp"

namespace Toolpack {

/**
 * @struct ExtractOptions
 * @brief Optional knobs for Extractor::extract().
 */
struct ExtractOptions
{
    /** Number of leading path components removed from every entry. */
    int stripComponents = 0;

    /** Extraction fails with Timeout once this point is passed. */
    std::optional<std::chrono::steady_clock::time_point> deadline;

    /** Polled between entries. */
    const CancellationToken* cancel = nullptr;
};

/**
 * @struct ExtractedPaths
 * @brief Result of a successful extraction.
 */
struct ExtractedPaths
{
    std::filesystem::path root;

    /** Entry paths relative to root, in archive order. */
    std::vector<std::string> entries;
};

/**
 * @class Extractor
 * @brief Unpacks zip, tar.gz and tar.xz archives with libarchive.
 */
class Extractor
{
public:
    /**
     * @brief Extracts an archive into destination.
     *
     * The archive is streamed into a hidden sibling directory which is renamed
     * to destination only when every entry was written. A pre-existing
     * destination is replaced at that point. On any failure the partial
     * directory is removed and destination is left as it was.
     *
     * @throws InstallError UnsafeArchiveEntry, ExtractionFailed, Timeout or Cancelled.
     */
    static ExtractedPaths extract(const std::filesystem::path& archivePath,
                                  ArchiveFormat format,
                                  const std::filesystem::path& destination,
                                  const ExtractOptions& options = ExtractOptions());

    /**
     * @brief Normalises an archive entry path ("a/./b/../c" -> "a/c").
     *
     * @return The normalised relative path ("" for the archive root), or
     *         std::nullopt if the path is absolute or climbs above the root.
     */
    static std::optional<std::string> normalizeEntryPath(const std::string& entryPath);

    /**
     * @brief Strips the specified number of leading path components
     *        (e.g. "dir1/dir2/file" -> "file" for 2).
     */
    static std::string stripPathComponents(const std::string& path, int stripComponents);
};

} // namespace Toolpack

#endif // EXTRACT_HPP
