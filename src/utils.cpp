#include "utils.hpp"
#include <curl/curl.h>
#include <stdexcept>
#include <iostream>
#include <fstream>
#include <mutex>
#include <atomic>
#include <random>
#include <ctime>
#include <cstdlib>
#include <system_error>
#include <algorithm>
#include <sstream>

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace Toolpack {

namespace {

    // Installs run on worker threads; keep log lines whole.
    std::mutex logMutex;

    std::atomic<bool> verboseFlag{false};

    bool debugRequestedByEnvironment()
    {
        const char* level = std::getenv("TOOLPACK_LOG");
        return level && std::string(level) == "debug";
    }

    bool colorsEnabled()
    {
        return std::getenv("NO_COLOR") == nullptr;
    }

    void emit(const char* color, const char* tag, const std::string& message)
    {
        std::lock_guard<std::mutex> lock(logMutex);
        if (colorsEnabled()) {
            std::cerr << color << tag << COLOR_RESET << message << std::endl;
        } else {
            std::cerr << tag << message << std::endl;
        }
    }

#ifndef _WIN32
    // Flushes a file to stable storage before it is renamed into place.
    void syncFile(const fs::path& path)
    {
        int fd = ::open(path.c_str(), O_RDONLY);
        if (fd >= 0) {
            ::fsync(fd);
            ::close(fd);
        }
    }
#endif

} // namespace

void setVerbose(bool verbose)
{
    verboseFlag = verbose;
}

bool isVerbose()
{
    return verboseFlag || debugRequestedByEnvironment();
}

void log_debug(const std::string &message)
{
    if (isVerbose()) {
        emit(COLOR_DEBUG, "[DEBUG] ", message);
    }
}

void log_message(const std::string &message)
{
    emit(COLOR_INFO, "[INFO] ", message);
}

void log_warning(const std::string &message)
{
    emit(COLOR_WARN, "[WARN] ", message);
}

void log_error(const std::string &message)
{
    emit(COLOR_ERROR, "[ERROR] ", message);
}

/**
 * @brief libcurl callback function. Appends downloaded data into a std::string.
 */
size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp)
{
    size_t totalSize      = size * nmemb;
    std::string* response = static_cast<std::string*>(userp);

    try {
        response->append(static_cast<char*>(contents), totalSize);
    } catch (const std::exception& e) {
        log_error(std::string("Error appending data to response: ") + e.what());
        return 0; // Signal failure to libcurl
    }

    return totalSize;
}

/**
 * @brief Fetches a text document from a given URL using libcurl. Returns
 *        the response as a string. Throws on error.
 */
std::string fetchRemoteText(const std::string& url)
{
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize libcurl");
    }

    std::string response;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 15L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 60L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "toolpack/0.1");

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        curl_easy_cleanup(curl);
        throw std::runtime_error(
            "Failed to fetch " + url + ": " +
            std::string(curl_easy_strerror(res))
        );
    }

    curl_easy_cleanup(curl);
    return response;
}

std::string trim(const std::string& s)
{
    const char* whitespace = " \t\n\r";
    size_t start = s.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(whitespace);
    return s.substr(start, end - start + 1);
}

/**
 * @brief Creates a random temporary filename. If baseDir is empty, uses the
 *        system temporary directory.
 */
fs::path generateTempFilename(const std::string& prefix, const fs::path& baseDir)
{
    fs::path tempDir = baseDir;
    if (baseDir.empty()) {
        tempDir = fs::temp_directory_path();
    }

    // Create a random numeric suffix
    static thread_local std::mt19937 mt(std::random_device{}());
    std::uniform_int_distribution<unsigned long> dist(100000, 999999);
    std::string filename = prefix + "_" + std::to_string(dist(mt));

    return tempDir / filename;
}

void writeFileAtomically(const fs::path& target, const std::string& content)
{
    fs::path parent = target.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw std::runtime_error("Cannot create directory " + parent.string()
                                     + ": " + ec.message());
        }
    }

    fs::path tempPath = generateTempFilename("." + target.filename().string() + ".tmp", parent);
    {
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot open temporary file " + tempPath.string());
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out.good()) {
            out.close();
            std::error_code ignored;
            fs::remove(tempPath, ignored);
            throw std::runtime_error("Failed writing temporary file " + tempPath.string());
        }
    }

#ifndef _WIN32
    syncFile(tempPath);
#endif

    std::error_code ec;
    fs::rename(tempPath, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        throw std::runtime_error("Cannot replace " + target.string() + ": " + ec.message());
    }
}

std::string currentTimestampUtc()
{
    std::time_t now = std::time(nullptr);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &now);
#else
    gmtime_r(&now, &tm);
#endif
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buffer);
}

fs::path homeDirectory()
{
    const char* home = std::getenv("HOME");
#if defined(_WIN32)
    if (!home || !*home) {
        home = std::getenv("USERPROFILE");
    }
#endif
    if (!home || !*home) {
        throw std::runtime_error("Cannot determine the home directory (HOME is not set)");
    }
    return fs::path(home);
}

fs::path expandHome(const std::string& path)
{
    if (path == "~") {
        return homeDirectory();
    }
    if (path.rfind("~/", 0) == 0 || path.rfind("~\\", 0) == 0) {
        return homeDirectory() / path.substr(2);
    }
    return fs::path(path);
}

bool isRemoteLocation(const std::string& location)
{
    return location.rfind("http://", 0) == 0 || location.rfind("https://", 0) == 0;
}

bool isContainedSubpath(const std::string& subpath)
{
    if (subpath.empty()) {
        return false;
    }
    std::string generic = subpath;
    std::replace(generic.begin(), generic.end(), '\\', '/');
    if (generic[0] == '/' || (generic.size() >= 2 && generic[1] == ':')) {
        return false;
    }

    std::stringstream ss(generic);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

} // namespace Toolpack
