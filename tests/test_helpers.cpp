#include "test_helpers.hpp"

#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <archive.h>
#include <archive_entry.h>
#include <openssl/evp.h>

namespace fs = std::filesystem;

namespace ToolpackTest {

TempDir::TempDir()
{
    static thread_local std::mt19937 mt(std::random_device{}());
    std::uniform_int_distribution<unsigned long> dist(100000000, 999999999);
    root = fs::temp_directory_path() / ("toolpack_test_" + std::to_string(dist(mt)));
    fs::create_directories(root);
}

TempDir::~TempDir()
{
    std::error_code ec;
    fs::remove_all(root, ec);
}

ArchiveItem ArchiveItem::file(const std::string& path, const std::string& content, int mode)
{
    ArchiveItem item;
    item.path = path;
    item.content = content;
    item.mode = mode;
    return item;
}

ArchiveItem ArchiveItem::directory(const std::string& path)
{
    ArchiveItem item;
    item.path = path;
    item.mode = 0755;
    item.type = Type::Directory;
    return item;
}

ArchiveItem ArchiveItem::symlink(const std::string& path, const std::string& target)
{
    ArchiveItem item;
    item.path = path;
    item.mode = 0777;
    item.type = Type::Symlink;
    item.target = target;
    return item;
}

ArchiveItem ArchiveItem::hardlink(const std::string& path, const std::string& target)
{
    ArchiveItem item;
    item.path = path;
    item.type = Type::Hardlink;
    item.target = target;
    return item;
}

void writeArchive(const fs::path& archivePath,
                  Toolpack::ArchiveFormat format,
                  const std::vector<ArchiveItem>& items)
{
    struct archive* a = archive_write_new();
    switch (format) {
        case Toolpack::ArchiveFormat::Zip:
            archive_write_set_format_zip(a);
            break;
        case Toolpack::ArchiveFormat::TarGz:
            archive_write_set_format_pax_restricted(a);
            archive_write_add_filter_gzip(a);
            break;
        case Toolpack::ArchiveFormat::TarXz:
            archive_write_set_format_pax_restricted(a);
            archive_write_add_filter_xz(a);
            break;
    }

    if (archive_write_open_filename(a, archivePath.string().c_str()) != ARCHIVE_OK) {
        std::string message = archive_error_string(a) ? archive_error_string(a) : "unknown error";
        archive_write_free(a);
        throw std::runtime_error("Cannot create test archive: " + message);
    }

    for (const auto& item : items) {
        struct archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, item.path.c_str());
        archive_entry_set_mtime(entry, 1700000000, 0);

        switch (item.type) {
            case ArchiveItem::Type::File:
                archive_entry_set_filetype(entry, AE_IFREG);
                archive_entry_set_perm(entry, static_cast<mode_t>(item.mode));
                archive_entry_set_size(entry, static_cast<la_int64_t>(item.content.size()));
                break;
            case ArchiveItem::Type::Directory:
                archive_entry_set_filetype(entry, AE_IFDIR);
                archive_entry_set_perm(entry, static_cast<mode_t>(item.mode));
                archive_entry_set_size(entry, 0);
                break;
            case ArchiveItem::Type::Symlink:
                archive_entry_set_filetype(entry, AE_IFLNK);
                archive_entry_set_perm(entry, static_cast<mode_t>(item.mode));
                archive_entry_set_symlink(entry, item.target.c_str());
                archive_entry_set_size(entry, 0);
                break;
            case ArchiveItem::Type::Hardlink:
                archive_entry_set_filetype(entry, AE_IFREG);
                archive_entry_set_perm(entry, 0644);
                archive_entry_set_hardlink(entry, item.target.c_str());
                archive_entry_set_size(entry, 0);
                break;
        }

        if (archive_write_header(a, entry) != ARCHIVE_OK) {
            std::string message = archive_error_string(a) ? archive_error_string(a) : "unknown error";
            archive_entry_free(entry);
            archive_write_free(a);
            throw std::runtime_error("Cannot add '" + item.path + "' to test archive: " + message);
        }
        if (item.type == ArchiveItem::Type::File && !item.content.empty()) {
            archive_write_data(a, item.content.data(), item.content.size());
        }
        archive_entry_free(entry);
    }

    archive_write_close(a);
    archive_write_free(a);
}

std::string readFile(const fs::path& path)
{
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void writeFile(const fs::path& path, const std::string& content)
{
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

std::string sha256Of(const std::string& content)
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    EVP_Digest(content.data(), content.size(), digest, &length, EVP_sha256(), nullptr);

    static const char hex[] = "0123456789abcdef";
    std::string result;
    for (unsigned int i = 0; i < length; ++i) {
        result += hex[digest[i] >> 4];
        result += hex[digest[i] & 0x0f];
    }
    return result;
}

size_t countEntriesContaining(const fs::path& dir, const std::string& fragment)
{
    size_t count = 0;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return 0;
    }
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.path().filename().string().find(fragment) != std::string::npos) {
            ++count;
        }
    }
    return count;
}

//============================================================================
// FakeTransport
//============================================================================

void FakeTransport::serve(const std::string& url, const std::string& content)
{
    std::lock_guard<std::mutex> lock(mutex);
    bodies[url] = content;
}

void FakeTransport::serveFile(const std::string& url, const fs::path& file)
{
    serve(url, readFile(file));
}

void FakeTransport::failNext(int count, bool transient, long httpStatus)
{
    std::lock_guard<std::mutex> lock(mutex);
    failuresLeft = count;
    failTransient = transient;
    failStatus = httpStatus;
}

void FakeTransport::onDownload(std::function<void(const std::string&)> callback)
{
    std::lock_guard<std::mutex> lock(mutex);
    hook = std::move(callback);
}

std::vector<std::string> FakeTransport::requestedUrls() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return urls;
}

Toolpack::TransferResult FakeTransport::download(const std::string& url,
                                                 const fs::path& output,
                                                 std::chrono::milliseconds /*timeout*/,
                                                 const Toolpack::CancellationToken* cancel)
{
    ++callCount;

    std::function<void(const std::string&)> callback;
    {
        std::lock_guard<std::mutex> lock(mutex);
        urls.push_back(url);
        callback = hook;
    }
    if (callback) {
        callback(url);
    }

    Toolpack::TransferResult result;
    if (cancel && cancel->isCancelled()) {
        result.cancelled = true;
        result.cause = "transfer cancelled";
        return result;
    }

    std::string body;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (failuresLeft > 0) {
            --failuresLeft;
            // Leave a partial body behind, as an interrupted transfer would.
            writeFile(output, "partial");
            result.transient = failTransient;
            result.httpStatus = failStatus;
            result.cause = "server responded with HTTP " + std::to_string(failStatus);
            return result;
        }
        auto it = bodies.find(url);
        if (it == bodies.end()) {
            result.httpStatus = 404;
            result.cause = "server responded with HTTP 404";
            return result;
        }
        body = it->second;
    }

    writeFile(output, body);
    result.ok = true;
    result.httpStatus = 200;
    return result;
}

//============================================================================
// InMemoryEnvironmentStore
//============================================================================

std::optional<std::string> InMemoryEnvironmentStore::get(const std::string& name)
{
    auto it = values.find(name);
    if (it == values.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryEnvironmentStore::set(const std::string& name, const std::string& value)
{
    if (failWrites) {
        throw std::runtime_error("access denied");
    }
    values[name] = value;
}

void InMemoryEnvironmentStore::remove(const std::string& name)
{
    if (failWrites) {
        throw std::runtime_error("access denied");
    }
    values.erase(name);
}

} // namespace ToolpackTest
