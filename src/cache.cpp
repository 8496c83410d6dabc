#include "cache.hpp"
#include "utils.hpp"

#include <regex>
#include <system_error>

namespace fs = std::filesystem;

namespace Toolpack {

    size_t Cache::clean(const fs::path& stagingDir, const fs::path& installRoot) {
        log_message("Cleaning up toolpack staging and install directories...");

        size_t removed = sweepStaging(stagingDir);

        // Trees left by an interrupted extraction, and trees moved aside while
        // a newer one was swapped in.
        removed += removeMatching(installRoot, R"(\..+\.partial_\d{6})", true);
        removed += removeMatching(installRoot, R"(\..+\.old_\d{6})", true);

        log_message("Cleanup completed, " + std::to_string(removed) + " item(s) removed.");
        return removed;
    }

    size_t Cache::sweepStaging(const fs::path& stagingDir) {
        return removeMatching(stagingDir, R"(.+_\d{6}\.download)", false);
    }

    size_t Cache::removeMatching(const fs::path& directory, const std::string& pattern, bool directories) {
        size_t removed = 0;
        try {
            if (!fs::exists(directory)) {
                log_debug("Directory not found: " + directory.string());
                return 0;
            }

            std::regex regexPattern(pattern);

            for (const auto& entry : fs::directory_iterator(directory)) {
                bool kindMatches = directories ? entry.is_directory() : entry.is_regular_file();
                if (!kindMatches) {
                    continue;
                }
                std::string filename = entry.path().filename().string();
                if (!std::regex_match(filename, regexPattern)) {
                    continue;
                }

                std::error_code ec;
                if (directories) {
                    fs::remove_all(entry.path(), ec);
                } else {
                    fs::remove(entry.path(), ec);
                }
                if (ec) {
                    log_warning("Could not remove " + entry.path().string() + ": " + ec.message());
                    continue;
                }
                log_debug("Removed: " + entry.path().string());
                ++removed;
            }
        } catch (const std::exception& e) {
            log_error("Error cleaning directory " + directory.string() + ": " + e.what());
        }
        return removed;
    }

} // namespace Toolpack
