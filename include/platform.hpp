#ifndef PLATFORM_HPP
#define PLATFORM_HPP

#include <string>
#include <vector>

#include "component.hpp"

namespace Toolpack {

enum class OsFamily { Linux, MacOS, Windows };

enum class CpuArch { X86_64, Aarch64 };

/**
 * @struct HostPlatform
 * @brief Everything the catalog and the environment configurator need to
 *        know about the machine toolpack runs on.
 */
struct HostPlatform
{
    OsFamily os = OsFamily::Linux;
    CpuArch arch = CpuArch::X86_64;

    /** Host triple used to select artifacts (e.g. "x86_64-unknown-linux-gnu"). */
    std::string triple;

    /** Separator between PATH entries (':' or ';'). */
    char pathListSeparator = ':';

    /** Archive format published for this host when the catalog names none. */
    ArchiveFormat defaultArchiveFormat = ArchiveFormat::TarXz;

    /**
     * @return True if environment changes are persisted in a sourced export
     *         file, false if the host has a persistent per-user store.
     */
    bool usesExportFile() const { return os != OsFamily::Windows; }
};

/**
 * @brief Describes the running host by querying the kernel name and machine.
 * @throws InstallError(UnsupportedPlatform) for unrecognised combinations.
 */
HostPlatform describeHost();

/**
 * @brief Pure variant of describeHost() taking the OS name (as reported by
 *        uname, e.g. "Linux", "Darwin", "Windows") and machine string
 *        (e.g. "x86_64", "arm64").
 * @throws InstallError(UnsupportedPlatform)
 */
HostPlatform describeHost(const std::string& osName, const std::string& machine);

/**
 * @brief Builds a HostPlatform from an explicit host triple.
 * @throws InstallError(UnsupportedPlatform) if the triple is not supported.
 */
HostPlatform parseHostTriple(const std::string& triple);

/**
 * @return The host triples toolpack can install for.
 */
const std::vector<std::string>& supportedHostTriples();

} // namespace Toolpack

#endif // PLATFORM_HPP
