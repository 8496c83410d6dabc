#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "component.hpp"
#include "environment.hpp"
#include "fetch.hpp"

namespace ToolpackTest {

/**
 * A fresh directory under the system temp directory, removed on destruction.
 */
class TempDir
{
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return root; }
    std::filesystem::path operator/(const std::string& relative) const { return root / relative; }

private:
    std::filesystem::path root;
};

struct ArchiveItem
{
    enum class Type { File, Directory, Symlink, Hardlink };

    std::string path;
    std::string content;
    int mode = 0644;
    Type type = Type::File;

    /** Symlink or hard link target. */
    std::string target;

    static ArchiveItem file(const std::string& path, const std::string& content, int mode = 0644);
    static ArchiveItem directory(const std::string& path);
    static ArchiveItem symlink(const std::string& path, const std::string& target);
    static ArchiveItem hardlink(const std::string& path, const std::string& target);
};

/**
 * Writes an archive in the given format with libarchive's writer.
 */
void writeArchive(const std::filesystem::path& archivePath,
                  Toolpack::ArchiveFormat format,
                  const std::vector<ArchiveItem>& items);

std::string readFile(const std::filesystem::path& path);
void writeFile(const std::filesystem::path& path, const std::string& content);

/** Lowercase hex SHA-256 of a string. */
std::string sha256Of(const std::string& content);

/** @return Number of directory entries whose name contains `fragment`. */
size_t countEntriesContaining(const std::filesystem::path& dir, const std::string& fragment);

/**
 * Scripted Transport: serves registered URLs from memory and can fail a
 * number of attempts first.
 */
class FakeTransport : public Toolpack::Transport
{
public:
    /** Serves `content` for `url`. */
    void serve(const std::string& url, const std::string& content);

    /** Serves the bytes of a local file for `url`. */
    void serveFile(const std::string& url, const std::filesystem::path& file);

    /** The next `count` attempts for any URL fail with the given result. */
    void failNext(int count, bool transient, long httpStatus = 503);

    /** Called at the start of every download, before anything is written. */
    void onDownload(std::function<void(const std::string&)> hook);

    int calls() const { return callCount.load(); }
    std::vector<std::string> requestedUrls() const;

    Toolpack::TransferResult download(const std::string& url,
                                      const std::filesystem::path& output,
                                      std::chrono::milliseconds timeout,
                                      const Toolpack::CancellationToken* cancel) override;

private:
    mutable std::mutex mutex;
    std::map<std::string, std::string> bodies;
    std::vector<std::string> urls;
    int failuresLeft = 0;
    bool failTransient = true;
    long failStatus = 503;
    std::function<void(const std::string&)> hook;
    std::atomic<int> callCount{0};
};

/**
 * UserEnvironmentStore backed by a map, standing in for the registry.
 */
class InMemoryEnvironmentStore : public Toolpack::UserEnvironmentStore
{
public:
    std::optional<std::string> get(const std::string& name) override;
    void set(const std::string& name, const std::string& value) override;
    void remove(const std::string& name) override;
    void notifyChanged() override { ++notifications; }

    std::map<std::string, std::string> values;
    int notifications = 0;
    bool failWrites = false;
};

} // namespace ToolpackTest

#endif // TEST_HELPERS_HPP
