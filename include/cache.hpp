#ifndef CACHE_HPP
#define CACHE_HPP

#include <cstddef>
#include <filesystem>
#include <string>

namespace Toolpack {

class Cache
{
public:
    /**
     * @brief Removes stale downloads from the staging directory and
     *        interrupted or superseded extraction trees from the install root.
     *
     * @return The number of entries removed.
     */
    static size_t clean(const std::filesystem::path& stagingDir,
                        const std::filesystem::path& installRoot);

    /**
     * @brief Removes downloads abandoned in the staging directory by an
     *        earlier run. Called at the start of every install and update.
     *
     * @return The number of files removed.
     */
    static size_t sweepStaging(const std::filesystem::path& stagingDir);

private:
    /**
     * @brief Deletes entries of a directory whose file name matches a pattern.
     *
     * @param directory   Directory to scan (not recursively).
     * @param pattern     Regular expression matched against the whole file name.
     * @param directories Match directories instead of regular files.
     */
    static size_t removeMatching(const std::filesystem::path& directory,
                                 const std::string& pattern,
                                 bool directories);
};

} // namespace Toolpack

#endif // CACHE_HPP
