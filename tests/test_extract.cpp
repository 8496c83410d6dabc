#include <gtest/gtest.h>

#include <algorithm>

#include "errors.hpp"
#include "extract.hpp"
#include "test_helpers.hpp"

using namespace Toolpack;
using ToolpackTest::ArchiveItem;
using ToolpackTest::TempDir;

namespace fs = std::filesystem;

namespace {

std::string extensionFor(ArchiveFormat format)
{
    return "." + archiveFormatName(format);
}

ErrorKind extractError(const fs::path& archive, ArchiveFormat format, const fs::path& destination,
                       const ExtractOptions& options = ExtractOptions())
{
    try {
        Extractor::extract(archive, format, destination, options);
    } catch (const InstallError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "extraction of " << archive.string() << " unexpectedly succeeded";
    return ErrorKind::ExtractionFailed;
}

class ArchiveFormatTest : public ::testing::TestWithParam<ArchiveFormat>
{
protected:
    TempDir dir;

    fs::path archivePath() const { return dir / ("artifact" + extensionFor(GetParam())); }
};

} // namespace

TEST_P(ArchiveFormatTest, ExtractsNestedTree)
{
    ToolpackTest::writeArchive(archivePath(), GetParam(), {
        ArchiveItem::directory("toolchain-1.2.0/"),
        ArchiveItem::directory("toolchain-1.2.0/bin/"),
        ArchiveItem::file("toolchain-1.2.0/bin/cc", "#!/bin/sh\necho cc\n", 0755),
        ArchiveItem::file("toolchain-1.2.0/share/doc/README", "readme"),
    });

    fs::path destination = dir / "install" / "toolchain-1.2.0";
    ExtractOptions options;
    options.stripComponents = 1;
    ExtractedPaths extracted = Extractor::extract(archivePath(), GetParam(), destination, options);

    EXPECT_EQ(extracted.root.string(), destination.string());
    EXPECT_EQ(ToolpackTest::readFile(destination / "bin" / "cc"), "#!/bin/sh\necho cc\n");
    EXPECT_EQ(ToolpackTest::readFile(destination / "share" / "doc" / "README"), "readme");
    EXPECT_NE(std::find(extracted.entries.begin(), extracted.entries.end(), "bin/cc"), extracted.entries.end());
    EXPECT_EQ(ToolpackTest::countEntriesContaining(dir / "install", ".partial"), 0u);

#ifndef _WIN32
    fs::perms perms = fs::status(destination / "bin" / "cc").permissions();
    EXPECT_NE(perms & fs::perms::owner_exec, fs::perms::none);
    perms = fs::status(destination / "share" / "doc" / "README").permissions();
    EXPECT_EQ(perms & fs::perms::owner_exec, fs::perms::none);
#endif
}

TEST_P(ArchiveFormatTest, RejectsTraversalAndLeavesNothingBehind)
{
    ToolpackTest::writeArchive(archivePath(), GetParam(), {
        ArchiveItem::file("bin/cc", "cc"),
        ArchiveItem::file("../../evil", "evil"),
    });

    fs::path destination = dir / "install" / "toolchain-1.2.0";
    EXPECT_EQ(extractError(archivePath(), GetParam(), destination), ErrorKind::UnsafeArchiveEntry);

    EXPECT_FALSE(fs::exists(destination));
    EXPECT_FALSE(fs::exists(dir / "evil"));
    EXPECT_FALSE(fs::exists(dir.path().parent_path() / "evil"));
    EXPECT_EQ(ToolpackTest::countEntriesContaining(dir / "install", ".partial"), 0u);
}

TEST_P(ArchiveFormatTest, FailedExtractionKeepsTheExistingTree)
{
    fs::path destination = dir / "install" / "toolchain-1.2.0";
    ToolpackTest::writeFile(destination / "bin" / "cc", "old");

    ToolpackTest::writeArchive(archivePath(), GetParam(), {
        ArchiveItem::file("bin/cc", "new"),
        ArchiveItem::file("bin/../../../evil", "evil"),
    });

    EXPECT_EQ(extractError(archivePath(), GetParam(), destination), ErrorKind::UnsafeArchiveEntry);
    EXPECT_EQ(ToolpackTest::readFile(destination / "bin" / "cc"), "old");
    EXPECT_EQ(ToolpackTest::countEntriesContaining(dir / "install", ".partial"), 0u);
}

INSTANTIATE_TEST_SUITE_P(AllFormats, ArchiveFormatTest,
                         ::testing::Values(ArchiveFormat::Zip, ArchiveFormat::TarGz, ArchiveFormat::TarXz));

TEST(ExtractTest, ReplacesAnExistingTreeOnSuccess)
{
    TempDir dir;
    fs::path destination = dir / "install" / "toolchain";
    ToolpackTest::writeFile(destination / "stale.txt", "stale");

    fs::path archive = dir / "new.tar.gz";
    ToolpackTest::writeArchive(archive, ArchiveFormat::TarGz, {ArchiveItem::file("fresh.txt", "fresh")});
    Extractor::extract(archive, ArchiveFormat::TarGz, destination);

    EXPECT_EQ(ToolpackTest::readFile(destination / "fresh.txt"), "fresh");
    EXPECT_FALSE(fs::exists(destination / "stale.txt"));
    EXPECT_EQ(ToolpackTest::countEntriesContaining(dir / "install", ".old"), 0u);
}

TEST(ExtractTest, RejectsSymlinksPointingOutside)
{
    TempDir dir;
    fs::path archive = dir / "links.tar.gz";
    ToolpackTest::writeArchive(archive, ArchiveFormat::TarGz, {
        ArchiveItem::file("bin/cc", "cc"),
        ArchiveItem::symlink("bin/escape", "../../../etc"),
    });

    fs::path destination = dir / "install" / "toolchain";
    EXPECT_EQ(extractError(archive, ArchiveFormat::TarGz, destination), ErrorKind::UnsafeArchiveEntry);
    EXPECT_FALSE(fs::exists(destination));
}

TEST(ExtractTest, AcceptsSymlinksInsideTheTree)
{
    TempDir dir;
    fs::path archive = dir / "links.tar.gz";
    ToolpackTest::writeArchive(archive, ArchiveFormat::TarGz, {
        ArchiveItem::file("bin/cc-13", "cc"),
        ArchiveItem::symlink("bin/cc", "cc-13"),
    });

    fs::path destination = dir / "install" / "toolchain";
    Extractor::extract(archive, ArchiveFormat::TarGz, destination);
#ifndef _WIN32
    EXPECT_TRUE(fs::is_symlink(destination / "bin" / "cc"));
    EXPECT_EQ(ToolpackTest::readFile(destination / "bin" / "cc"), "cc");
#endif
}

TEST(ExtractTest, RejectsHardLinksPointingOutside)
{
    TempDir dir;
    fs::path archive = dir / "hard.tar.xz";
    ToolpackTest::writeArchive(archive, ArchiveFormat::TarXz, {
        ArchiveItem::file("bin/cc", "cc"),
        ArchiveItem::hardlink("bin/passwd", "../../etc/passwd"),
    });

    fs::path destination = dir / "install" / "toolchain";
    EXPECT_EQ(extractError(archive, ArchiveFormat::TarXz, destination), ErrorKind::UnsafeArchiveEntry);
    EXPECT_FALSE(fs::exists(destination));
}

TEST(ExtractTest, CorruptArchiveFails)
{
    TempDir dir;
    fs::path archive = dir / "corrupt.tar.xz";
    ToolpackTest::writeFile(archive, "this is not an archive at all");

    fs::path destination = dir / "install" / "toolchain";
    EXPECT_EQ(extractError(archive, ArchiveFormat::TarXz, destination), ErrorKind::ExtractionFailed);
    EXPECT_FALSE(fs::exists(destination));
    EXPECT_EQ(ToolpackTest::countEntriesContaining(dir / "install", ".partial"), 0u);
}

TEST(ExtractTest, CancellationDiscardsThePartialTree)
{
    TempDir dir;
    fs::path archive = dir / "a.zip";
    ToolpackTest::writeArchive(archive, ArchiveFormat::Zip, {ArchiveItem::file("bin/cc", "cc")});

    CancellationToken token;
    token.cancel();
    ExtractOptions options;
    options.cancel = &token;

    fs::path destination = dir / "install" / "toolchain";
    EXPECT_EQ(extractError(archive, ArchiveFormat::Zip, destination, options), ErrorKind::Cancelled);
    EXPECT_FALSE(fs::exists(destination));
    EXPECT_EQ(ToolpackTest::countEntriesContaining(dir / "install", ".partial"), 0u);
}

TEST(ExtractTest, ExpiredDeadlineIsATimeout)
{
    TempDir dir;
    fs::path archive = dir / "a.zip";
    ToolpackTest::writeArchive(archive, ArchiveFormat::Zip, {ArchiveItem::file("bin/cc", "cc")});

    ExtractOptions options;
    options.deadline = std::chrono::steady_clock::now() - std::chrono::seconds(1);

    fs::path destination = dir / "install" / "toolchain";
    EXPECT_EQ(extractError(archive, ArchiveFormat::Zip, destination, options), ErrorKind::Timeout);
    EXPECT_FALSE(fs::exists(destination));
}

TEST(ExtractTest, NormalizesEntryPaths)
{
    EXPECT_EQ(Extractor::normalizeEntryPath("a/./b/../c").value_or("?"), "a/c");
    EXPECT_EQ(Extractor::normalizeEntryPath("./").value_or("?"), "");
    EXPECT_EQ(Extractor::normalizeEntryPath("dir\\file").value_or("?"), "dir/file");
    EXPECT_FALSE(Extractor::normalizeEntryPath("../../evil").has_value());
    EXPECT_FALSE(Extractor::normalizeEntryPath("a/../../evil").has_value());
    EXPECT_FALSE(Extractor::normalizeEntryPath("/etc/passwd").has_value());
    EXPECT_FALSE(Extractor::normalizeEntryPath("C:\\Windows\\evil").has_value());
}

TEST(ExtractTest, StripsLeadingComponents)
{
    EXPECT_EQ(Extractor::stripPathComponents("dir1/dir2/file", 2), "file");
    EXPECT_EQ(Extractor::stripPathComponents("dir1/file", 0), "dir1/file");
    EXPECT_EQ(Extractor::stripPathComponents("dir1", 1), "");
    EXPECT_EQ(Extractor::stripPathComponents("./dir1/file", 1), "file");
}
