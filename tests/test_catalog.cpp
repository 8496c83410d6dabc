#include <gtest/gtest.h>

#include "catalog.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace Toolpack;

namespace {

const char* sampleCatalog = R"(
components:
  - name: toolchain
    target: xtensa-esp32-espidf
    host: "*"
    versions: ["1.2.0", "1.3.0"]
    url: https://example.org/{name}/{version}/{name}-{version}-{host}.tar.xz
    install_subpath: "{name}-{version}"
    strip_components: 1
    checksums:
      "1.3.0": "ABCDEF"
  - name: toolchain
    target: xtensa-esp32-espidf
    host: x86_64-pc-windows-msvc
    versions: ["1.3.0"]
    url: https://example.org/win/{version}.zip
    format: zip
  - name: linker-toolchain
    target: xtensa-esp32-elf
    host: x86_64-unknown-linux-gnu
    version: "13.2.0"
    url: https://example.org/gcc/{version}/{target}-{host}.tar.gz
    format: tgz
    sha256: "0123abcd"
    size: 4096
    install_subpath: "{name}-{version}-{target}"
    path_entries: [bin, libexec]
  - name: clang-runtime
    target: xtensa-esp32-elf
    version: "17.0.1"
    url: https://example.org/clang/{version}.tar.xz
    variables:
      LIBCLANG_PATH: lib
  - name: not-a-component
    target: x
    version: "1.0.0"
    url: https://example.org/x
  - name: build-tool
    target: x
    versions: ["1.0", "banana"]
    url: https://example.org/x
)";

const HostPlatform linuxHost = parseHostTriple("x86_64-unknown-linux-gnu");
const HostPlatform windowsHost = parseHostTriple("x86_64-pc-windows-msvc");

Component request(ComponentKind kind, const std::string& target, const std::string& version)
{
    return Component{ComponentId{kind, target}, version};
}

} // namespace

TEST(CatalogTest, SkipsUnusableEntries)
{
    Catalog catalog = Catalog::loadFromString(sampleCatalog);
    EXPECT_EQ(catalog.entries().size(), 4u);
}

TEST(CatalogTest, ResolvesTemplatesForTheHost)
{
    Catalog catalog = Catalog::loadFromString(sampleCatalog);
    ArtifactReference ref = catalog.resolve(request(ComponentKind::Toolchain, "xtensa-esp32-espidf", "1.2.0"),
                                            linuxHost, "/opt/install");

    EXPECT_EQ(ref.version, "1.2.0");
    EXPECT_EQ(ref.url, "https://example.org/toolchain/1.2.0/toolchain-1.2.0-x86_64-unknown-linux-gnu.tar.xz");
    EXPECT_EQ(ref.format, ArchiveFormat::TarXz);
    EXPECT_EQ(ref.installPath.string(), (std::filesystem::path("/opt/install") / "toolchain-1.2.0").string());
    EXPECT_EQ(ref.stripComponents, 1);
    EXPECT_EQ(ref.pathEntries, std::vector<std::string>{"bin"});
    EXPECT_FALSE(ref.sha256.has_value());
}

TEST(CatalogTest, LatestAndPerVersionChecksums)
{
    Catalog catalog = Catalog::loadFromString(sampleCatalog);
    ArtifactReference ref = catalog.resolve(request(ComponentKind::Toolchain, "xtensa-esp32-espidf", ""),
                                            linuxHost, "/opt/install");
    EXPECT_EQ(ref.version, "1.3.0");
    ASSERT_TRUE(ref.sha256.has_value());
    EXPECT_EQ(*ref.sha256, "ABCDEF");
}

TEST(CatalogTest, PrefersHostSpecificEntries)
{
    Catalog catalog = Catalog::loadFromString(sampleCatalog);
    ArtifactReference ref = catalog.resolve(request(ComponentKind::Toolchain, "xtensa-esp32-espidf", "latest"),
                                            windowsHost, "C:/toolpack");
    EXPECT_EQ(ref.url, "https://example.org/win/1.3.0.zip");
    EXPECT_EQ(ref.format, ArchiveFormat::Zip);

    // 1.2.0 is only published through the wildcard entry.
    ArtifactReference older = catalog.resolve(request(ComponentKind::Toolchain, "xtensa-esp32-espidf", "1.2.0"),
                                              windowsHost, "C:/toolpack");
    EXPECT_EQ(older.format, ArchiveFormat::Zip);
    EXPECT_NE(older.url.find("x86_64-pc-windows-msvc"), std::string::npos);
}

TEST(CatalogTest, SingleVersionEntryCarriesChecksumAndSize)
{
    Catalog catalog = Catalog::loadFromString(sampleCatalog);
    ArtifactReference ref = catalog.resolve(request(ComponentKind::LinkerToolchain, "xtensa-esp32-elf", ""),
                                            linuxHost, "/opt/install");
    EXPECT_EQ(ref.format, ArchiveFormat::TarGz);
    EXPECT_EQ(ref.url, "https://example.org/gcc/13.2.0/xtensa-esp32-elf-x86_64-unknown-linux-gnu.tar.gz");
    EXPECT_EQ(ref.installPath.filename().string(), "linker-toolchain-13.2.0-xtensa-esp32-elf");
    EXPECT_EQ(ref.sha256.value_or(""), "0123abcd");
    EXPECT_EQ(ref.size.value_or(0), 4096u);
    EXPECT_EQ(ref.pathEntries, (std::vector<std::string>{"bin", "libexec"}));
}

TEST(CatalogTest, VariablesAndDefaultPathEntries)
{
    Catalog catalog = Catalog::loadFromString(sampleCatalog);
    ArtifactReference ref = catalog.resolve(request(ComponentKind::ClangRuntime, "xtensa-esp32-elf", ""),
                                            linuxHost, "/opt/install");
    EXPECT_TRUE(ref.pathEntries.empty());
    ASSERT_EQ(ref.variables.count("LIBCLANG_PATH"), 1u);
    EXPECT_EQ(ref.variables.at("LIBCLANG_PATH"), "lib");
}

TEST(CatalogTest, UnknownComponentForTargetOrHost)
{
    Catalog catalog = Catalog::loadFromString(sampleCatalog);
    try {
        catalog.resolve(request(ComponentKind::StandardLibrary, "xtensa-esp32-elf", ""), linuxHost, "/opt");
        FAIL() << "expected UnknownComponent";
    } catch (const InstallError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnknownComponent);
    }

    // The linker toolchain is only published for Linux.
    try {
        catalog.resolve(request(ComponentKind::LinkerToolchain, "xtensa-esp32-elf", ""), windowsHost, "/opt");
        FAIL() << "expected UnknownComponent";
    } catch (const InstallError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnknownComponent);
    }
}

TEST(CatalogTest, VersionNotFound)
{
    Catalog catalog = Catalog::loadFromString(sampleCatalog);
    for (const std::string constraint : {"9.9.9", "1.2", "not-a-version", ">=2"}) {
        try {
            catalog.resolve(request(ComponentKind::Toolchain, "xtensa-esp32-espidf", constraint), linuxHost, "/opt");
            FAIL() << "expected VersionNotFound for " << constraint;
        } catch (const InstallError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::VersionNotFound) << constraint;
        }
    }
}

TEST(CatalogTest, RejectsInstallPathsOutsideTheRoot)
{
    Catalog catalog;
    CatalogEntry entry;
    entry.target = "x";
    entry.versions = {"1.0.0"};
    entry.urlTemplate = "https://example.org/x";
    entry.installSubpath = "../outside";
    EXPECT_THROW(catalog.addEntry(entry), std::runtime_error);

    entry.installSubpath = "/abs/path";
    EXPECT_THROW(catalog.addEntry(entry), std::runtime_error);

    // A target name can still smuggle ".." in through a placeholder.
    entry.installSubpath = "{target}";
    entry.target = "..";
    catalog.addEntry(entry);
    try {
        catalog.resolve(request(ComponentKind::Toolchain, "..", ""), linuxHost, "/opt");
        FAIL() << "expected UnknownComponent";
    } catch (const InstallError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnknownComponent);
    }
}

TEST(CatalogTest, MalformedDocumentsThrow)
{
    EXPECT_THROW(Catalog::loadFromString("components: [unclosed"), std::runtime_error);
    EXPECT_THROW(Catalog::loadFromString("packages: []"), std::runtime_error);
}

TEST(CatalogTest, LoadsFromFile)
{
    ToolpackTest::TempDir dir;
    ToolpackTest::writeFile(dir / "catalog.yaml", sampleCatalog);
    Catalog catalog = Catalog::load((dir / "catalog.yaml").string());
    EXPECT_EQ(catalog.entries().size(), 4u);

    EXPECT_THROW(Catalog::load((dir / "missing.yaml").string()), std::runtime_error);
}

TEST(CatalogTest, ExpandTemplateLeavesUnknownPlaceholders)
{
    std::map<std::string, std::string> values = {{"name", "toolchain"}, {"version", "1.0.0"}};
    EXPECT_EQ(expandTemplate("{name}-{version}-{other}", values), "toolchain-1.0.0-{other}");
    EXPECT_EQ(expandTemplate("no placeholders", values), "no placeholders");
    EXPECT_EQ(expandTemplate("{unclosed", values), "{unclosed");
}

TEST(CatalogTest, DropsUnsafeVariablesAndPathEntries)
{
    Catalog catalog = Catalog::loadFromString(R"(
components:
  - name: clang-runtime
    target: xtensa-esp32-elf
    version: "17.0.1"
    url: https://example.org/clang/{version}.tar.xz
    path_entries: [bin, ../../usr/bin, /usr/local/bin]
    variables:
      "LIBCLANG_PATH=x; echo INJECTED-COMMAND-RAN; X": lib
      PATH: tools
      Path: tools
      ESCAPE: ../../etc
      "1ST": lib
      LIBCLANG_PATH: lib
)");
    ArtifactReference ref = catalog.resolve(request(ComponentKind::ClangRuntime, "xtensa-esp32-elf", ""),
                                            linuxHost, "/opt/install");

    EXPECT_EQ(ref.pathEntries, std::vector<std::string>{"bin"});
    ASSERT_EQ(ref.variables.size(), 1u);
    EXPECT_EQ(ref.variables.at("LIBCLANG_PATH"), "lib");
}
