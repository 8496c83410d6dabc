#include "component.hpp"

namespace Toolpack {

namespace {

    const std::map<std::string, ComponentKind> kindNames = {
        {"toolchain",        ComponentKind::Toolchain},
        {"standard-library", ComponentKind::StandardLibrary},
        {"linker-toolchain", ComponentKind::LinkerToolchain},
        {"clang-runtime",    ComponentKind::ClangRuntime},
        {"build-tool",       ComponentKind::BuildTool}
    };

} // namespace

std::string componentKindName(ComponentKind kind)
{
    for (const auto& [name, value] : kindNames) {
        if (value == kind) {
            return name;
        }
    }
    return "unknown";
}

std::optional<ComponentKind> parseComponentKind(const std::string& name)
{
    auto it = kindNames.find(name);
    if (it == kindNames.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string archiveFormatName(ArchiveFormat format)
{
    switch (format) {
        case ArchiveFormat::Zip:   return "zip";
        case ArchiveFormat::TarGz: return "tar.gz";
        case ArchiveFormat::TarXz: return "tar.xz";
    }
    return "unknown";
}

std::optional<ArchiveFormat> parseArchiveFormat(const std::string& tag)
{
    if (tag == "zip") {
        return ArchiveFormat::Zip;
    }
    if (tag == "tar.gz" || tag == "tgz") {
        return ArchiveFormat::TarGz;
    }
    if (tag == "tar.xz" || tag == "txz") {
        return ArchiveFormat::TarXz;
    }
    return std::nullopt;
}

std::string ComponentId::key() const
{
    return componentKindName(kind) + ":" + targetTriple;
}

std::vector<std::string> defaultPathEntries(ComponentKind kind)
{
    // Library sources and the clang runtime are consumed through variables, not PATH.
    if (kind == ComponentKind::StandardLibrary || kind == ComponentKind::ClangRuntime) {
        return {};
    }
    return {"bin"};
}

} // namespace Toolpack
