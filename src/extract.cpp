#include "extract.hpp"
#include "utils.hpp"

#include <memory>
#include <sstream>
#include <archive.h>
#include <archive_entry.h>

namespace fs = std::filesystem;

namespace Toolpack {

namespace {

    // 64 KB read blocks; archives are streamed, never loaded whole.
    const size_t archiveBufferSize = 65536;

    struct ArchiveReadDeleter {
        void operator()(struct archive* a) const { archive_read_free(a); }
    };
    struct ArchiveWriteDeleter {
        void operator()(struct archive* a) const { archive_write_free(a); }
    };

    using ArchiveReader = std::unique_ptr<struct archive, ArchiveReadDeleter>;
    using ArchiveWriter = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

    /**
     * Removes the partial extraction directory unless it has been committed.
     */
    class PartialDirectory
    {
    public:
        explicit PartialDirectory(fs::path dir) : dir(std::move(dir)) {}
        ~PartialDirectory()
        {
            if (committed) {
                return;
            }
            std::error_code ec;
            fs::remove_all(dir, ec);
            if (ec) {
                log_warning("Could not remove partial directory " + dir.string() + ": " + ec.message());
            }
        }

        const fs::path& path() const { return dir; }
        void commit() { committed = true; }

    private:
        fs::path dir;
        bool committed = false;
    };

    std::string archiveError(struct archive* a)
    {
        const char* message = archive_error_string(a);
        return message ? message : "unknown libarchive error";
    }

    /**
     * Copies data blocks of the current entry from the reader to the disk writer.
     */
    int copy_data(struct archive* ar, struct archive* aw)
    {
        const void* buff;
        size_t size;
        la_int64_t offset;
        int r;

        while (true) {
            r = archive_read_data_block(ar, &buff, &size, &offset);
            if (r == ARCHIVE_EOF) {
                return ARCHIVE_OK;
            }
            if (r == ARCHIVE_RETRY) {
                continue;
            }
            if (r != ARCHIVE_OK) {
                return r;
            }
            if (archive_write_data_block(aw, buff, size, offset) < ARCHIVE_OK) {
                return ARCHIVE_FATAL;
            }
        }
    }

    void enableFormat(struct archive* a, ArchiveFormat format)
    {
        switch (format) {
            case ArchiveFormat::Zip:
                archive_read_support_format_zip(a);
                break;
            case ArchiveFormat::TarGz:
                archive_read_support_format_tar(a);
                archive_read_support_filter_gzip(a);
                break;
            case ArchiveFormat::TarXz:
                archive_read_support_format_tar(a);
                archive_read_support_filter_xz(a);
                break;
        }
    }

    bool isAbsoluteEntry(const std::string& path)
    {
        if (path.empty()) {
            return false;
        }
        if (path[0] == '/' || path[0] == '\\') {
            return true;
        }
        // Drive-letter paths such as "C:\evil" or "C:evil".
        return path.size() >= 2 && path[1] == ':';
    }

    void checkBoundary(const ExtractOptions& options, const fs::path& archivePath)
    {
        if (options.cancel) {
            options.cancel->throwIfCancelled("next entry of " + archivePath.filename().string());
        }
        if (options.deadline && std::chrono::steady_clock::now() > *options.deadline) {
            throw InstallError(ErrorKind::Timeout,
                               "Timed out extracting " + archivePath.filename().string());
        }
    }

    /**
     * Moves the finished tree into place, replacing any previous destination.
     */
    void commitTree(const fs::path& partial, const fs::path& destination)
    {
        std::error_code ec;
        if (!fs::exists(destination, ec)) {
            fs::rename(partial, destination, ec);
            if (ec) {
                throw InstallError(ErrorKind::ExtractionFailed,
                                   "Cannot move extracted tree into " + destination.string()
                                   + ": " + ec.message());
            }
            return;
        }

        fs::path backup = generateTempFilename("." + destination.filename().string() + ".old",
                                               destination.parent_path());
        fs::rename(destination, backup, ec);
        if (ec) {
            throw InstallError(ErrorKind::ExtractionFailed,
                               "Cannot move aside existing " + destination.string() + ": " + ec.message());
        }
        fs::rename(partial, destination, ec);
        if (ec) {
            std::error_code restore;
            fs::rename(backup, destination, restore);
            throw InstallError(ErrorKind::ExtractionFailed,
                               "Cannot move extracted tree into " + destination.string()
                               + ": " + ec.message());
        }
        fs::remove_all(backup, ec);
        if (ec) {
            log_warning("Could not remove superseded tree " + backup.string() + ": " + ec.message());
        }
    }

} // namespace

std::optional<std::string> Extractor::normalizeEntryPath(const std::string& entryPath)
{
    if (isAbsoluteEntry(entryPath)) {
        return std::nullopt;
    }

    std::vector<std::string> parts;
    std::string token;
    auto flush = [&]() -> bool {
        if (token.empty() || token == ".") {
            // nothing
        } else if (token == "..") {
            if (parts.empty()) {
                return false;
            }
            parts.pop_back();
        } else {
            parts.push_back(token);
        }
        token.clear();
        return true;
    };

    for (char c : entryPath) {
        if (c == '/' || c == '\\') {
            if (!flush()) {
                return std::nullopt;
            }
        } else {
            token += c;
        }
    }
    if (!flush()) {
        return std::nullopt;
    }

    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += '/';
        }
        result += parts[i];
    }
    return result;
}

std::string Extractor::stripPathComponents(const std::string& path, int stripComponents)
{
    if (stripComponents <= 0 || path.empty()) {
        return path;
    }

    std::istringstream iss(path);
    std::string token;
    std::string result;
    int count = 0;

    while (std::getline(iss, token, '/')) {
        // Skip '.' or empty path components
        if (token.empty() || token == ".") {
            continue;
        }
        if (count < stripComponents) {
            count++;
            continue;
        }
        if (!result.empty()) {
            result += '/';
        }
        result += token;
    }
    return result;
}

ExtractedPaths Extractor::extract(const fs::path& archivePath,
                                  ArchiveFormat format,
                                  const fs::path& destination,
                                  const ExtractOptions& options)
{
    const std::string archiveName = archivePath.filename().string();
    fs::path parent = destination.parent_path();

    std::error_code ec;
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            throw InstallError(ErrorKind::ExtractionFailed,
                               "Cannot create " + parent.string() + ": " + ec.message());
        }
    }

    PartialDirectory partial(generateTempFilename("." + destination.filename().string() + ".partial", parent));
    fs::create_directories(partial.path(), ec);
    if (ec) {
        throw InstallError(ErrorKind::ExtractionFailed,
                           "Cannot create " + partial.path().string() + ": " + ec.message());
    }

    ArchiveReader reader(archive_read_new());
    ArchiveWriter writer(archive_write_disk_new());
    if (!reader || !writer) {
        throw InstallError(ErrorKind::ExtractionFailed, "archive_read_new or archive_write_disk_new failed");
    }

    enableFormat(reader.get(), format);

    // Entry names are rewritten to absolute paths under the partial directory,
    // so only the symlink and dot-dot guards apply here.
    int extractFlags = ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                       ARCHIVE_EXTRACT_SECURE_SYMLINKS |
                       ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    archive_write_disk_set_options(writer.get(), extractFlags);
    archive_write_disk_set_standard_lookup(writer.get());

    if (archive_read_open_filename(reader.get(), archivePath.string().c_str(), archiveBufferSize) != ARCHIVE_OK) {
        throw InstallError(ErrorKind::ExtractionFailed,
                           "Error opening archive '" + archiveName + "' as "
                           + archiveFormatName(format) + ": " + archiveError(reader.get()));
    }

    ExtractedPaths extracted;
    extracted.root = destination;

    struct archive_entry* entry = nullptr;
    while (true) {
        checkBoundary(options, archivePath);

        int r = archive_read_next_header(reader.get(), &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r < ARCHIVE_WARN) {
            throw InstallError(ErrorKind::ExtractionFailed,
                               "Error reading archive header in '" + archiveName + "': "
                               + archiveError(reader.get()));
        }

        const char* rawName = archive_entry_pathname(entry);
        if (!rawName) {
            throw InstallError(ErrorKind::ExtractionFailed, "Archive entry without a path in '" + archiveName + "'");
        }

        auto normalized = normalizeEntryPath(rawName);
        if (!normalized) {
            throw InstallError(ErrorKind::UnsafeArchiveEntry,
                               "Entry '" + std::string(rawName) + "' escapes the destination directory");
        }

        std::string relative = stripPathComponents(*normalized, options.stripComponents);
        if (relative.empty()) {
            archive_read_data_skip(reader.get());
            continue;
        }

        const char* hardlink = archive_entry_hardlink(entry);
        if (hardlink) {
            auto target = normalizeEntryPath(hardlink);
            if (!target) {
                throw InstallError(ErrorKind::UnsafeArchiveEntry,
                                   "Hard link '" + std::string(rawName) + "' points outside the destination");
            }
            std::string strippedTarget = stripPathComponents(*target, options.stripComponents);
            if (strippedTarget.empty()) {
                throw InstallError(ErrorKind::ExtractionFailed,
                                   "Hard link '" + std::string(rawName) + "' has an empty target");
            }
            archive_entry_set_hardlink(entry, (partial.path() / strippedTarget).string().c_str());
        }

        if (archive_entry_filetype(entry) == AE_IFLNK) {
            const char* linkTarget = archive_entry_symlink(entry);
            std::string target = linkTarget ? linkTarget : "";
            std::string linkDir = fs::path(relative).parent_path().generic_string();
            if (isAbsoluteEntry(target) ||
                !normalizeEntryPath(linkDir.empty() ? target : linkDir + "/" + target)) {
                throw InstallError(ErrorKind::UnsafeArchiveEntry,
                                   "Symbolic link '" + std::string(rawName) + "' -> '" + target
                                   + "' points outside the destination");
            }
        }

        fs::path fullDestPath = partial.path() / relative;
        archive_entry_set_pathname(entry, fullDestPath.string().c_str());

        r = archive_write_header(writer.get(), entry);
        if (r < ARCHIVE_WARN) {
            throw InstallError(ErrorKind::ExtractionFailed,
                               "Cannot write '" + relative + "': " + archiveError(writer.get()));
        }
        if (r == ARCHIVE_WARN) {
            log_debug("Warning writing '" + relative + "': " + archiveError(writer.get()));
        }

        // Zip entries written with a data descriptor report no size up front.
        if (archive_entry_filetype(entry) == AE_IFREG && !hardlink) {
            if (copy_data(reader.get(), writer.get()) != ARCHIVE_OK) {
                throw InstallError(ErrorKind::ExtractionFailed,
                                   "Error copying data for '" + relative + "': "
                                   + archiveError(writer.get()) + " (read error: "
                                   + archiveError(reader.get()) + ")");
            }
        }

        r = archive_write_finish_entry(writer.get());
        if (r < ARCHIVE_WARN) {
            throw InstallError(ErrorKind::ExtractionFailed,
                               "Cannot finish '" + relative + "': " + archiveError(writer.get()));
        }

        extracted.entries.push_back(relative);
    }

    if (archive_write_close(writer.get()) != ARCHIVE_OK) {
        throw InstallError(ErrorKind::ExtractionFailed,
                           "Cannot finalise extraction of '" + archiveName + "': "
                           + archiveError(writer.get()));
    }
    archive_read_close(reader.get());

    commitTree(partial.path(), destination);
    partial.commit();

    log_debug("Extracted " + std::to_string(extracted.entries.size()) + " entries from "
              + archiveName + " into " + destination.string());
    return extracted;
}

} // namespace Toolpack
