#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <ostream>
#include <iostream>
#include <filesystem>

// ANSI color codes for console output.
#define COLOR_RESET "\033[0m"
#define COLOR_DEBUG "\033[36m"
#define COLOR_INFO  "\033[32m"
#define COLOR_WARN  "\033[33m"
#define COLOR_ERROR "\033[31m"

namespace Toolpack {

/**
 * @brief Enables or disables [DEBUG] output. Also enabled when the
 *        TOOLPACK_LOG environment variable is set to "debug".
 */
void setVerbose(bool verbose);

/**
 * @return True if debug messages are currently printed.
 */
bool isVerbose();

/**
 * @brief Logs a debug message to standard error (only in verbose mode).
 *
 * @param message The message to log.
 */
void log_debug(const std::string &message);

/**
 * @brief Logs an informational message to standard error with green coloring.
 *
 * @param message The message to log.
 */
void log_message(const std::string &message);

/**
 * @brief Logs a warning message to standard error with yellow coloring.
 *
 * @param message The warning message to log.
 */
void log_warning(const std::string &message);

/**
 * @brief Logs an error message to standard error with red coloring.
 *
 * @param message The error message to log.
 */
void log_error(const std::string &message);

// ---------------------------------------------------------------------------
// Other utility function declarations
// ---------------------------------------------------------------------------

/**
 * @brief libcurl write callback function.
 *
 * Appends data received from a libcurl request to a std::string.
 *
 * @param contents Pointer to the received data.
 * @param size Size of each element.
 * @param nmemb Number of elements.
 * @param userp Pointer to the std::string to append data to.
 * @return The total number of bytes processed.
 */
size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

/**
 * @brief Downloads a small text document (e.g. a catalog) from a URL.
 *
 * @param url The URL to fetch.
 * @return The response body.
 * @throws std::runtime_error on transfer errors or HTTP status >= 400.
 */
std::string fetchRemoteText(const std::string& url);

/**
 * @brief Removes leading and trailing whitespace from the given string.
 */
std::string trim(const std::string& s);

/**
 * @brief Creates a random file name "<prefix>_<digits>" inside baseDir
 *        (the system temp directory if baseDir is empty). The file is not created.
 */
std::filesystem::path generateTempFilename(const std::string& prefix,
                                           const std::filesystem::path& baseDir);

/**
 * @brief Writes content to a temporary file next to target and renames it
 *        over target, so readers never observe a partially written file.
 *
 * @throws std::runtime_error if the temporary file cannot be written or renamed.
 *         The previous content of target is left untouched in that case.
 */
void writeFileAtomically(const std::filesystem::path& target, const std::string& content);

/**
 * @return The current UTC time formatted as ISO 8601 ("2024-01-31T12:00:00Z").
 */
std::string currentTimestampUtc();

/**
 * @return The user's home directory (HOME, or USERPROFILE on Windows).
 * @throws std::runtime_error if neither is set.
 */
std::filesystem::path homeDirectory();

/**
 * @brief Expands a leading "~" to the user's home directory.
 */
std::filesystem::path expandHome(const std::string& path);

/**
 * @return True if the string starts with "http://" or "https://".
 */
bool isRemoteLocation(const std::string& location);

/**
 * @brief True if the relative path stays below the directory it is joined to.
 *        Both '/' and '\\' count as separators.
 */
bool isContainedSubpath(const std::string& subpath);

} // namespace Toolpack

#endif // UTILS_HPP
