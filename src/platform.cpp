#include "platform.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>

#ifndef _WIN32
#include <sys/utsname.h>
#endif

namespace Toolpack {

namespace {

    std::string toLower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    HostPlatform makePlatform(OsFamily os, CpuArch arch, const std::string& triple)
    {
        HostPlatform host;
        host.os = os;
        host.arch = arch;
        host.triple = triple;
        if (os == OsFamily::Windows) {
            host.pathListSeparator = ';';
            host.defaultArchiveFormat = ArchiveFormat::Zip;
        } else {
            host.pathListSeparator = ':';
            host.defaultArchiveFormat = ArchiveFormat::TarXz;
        }
        return host;
    }

} // namespace

const std::vector<std::string>& supportedHostTriples()
{
    static const std::vector<std::string> triples = {
        "x86_64-unknown-linux-gnu",
        "aarch64-unknown-linux-gnu",
        "x86_64-apple-darwin",
        "aarch64-apple-darwin",
        "x86_64-pc-windows-msvc",
        "x86_64-pc-windows-gnu"
    };
    return triples;
}

HostPlatform describeHost(const std::string& osName, const std::string& machine)
{
    std::string os = toLower(osName);
    std::string cpu = toLower(machine);

    CpuArch arch;
    if (cpu == "x86_64" || cpu == "amd64" || cpu == "x64") {
        arch = CpuArch::X86_64;
    } else if (cpu == "aarch64" || cpu == "arm64") {
        arch = CpuArch::Aarch64;
    } else {
        throw InstallError(ErrorKind::UnsupportedPlatform,
                           "Unsupported CPU architecture: " + machine);
    }
    std::string archName = (arch == CpuArch::X86_64) ? "x86_64" : "aarch64";

    if (os == "linux") {
        return makePlatform(OsFamily::Linux, arch, archName + "-unknown-linux-gnu");
    }
    if (os == "darwin" || os == "macos") {
        return makePlatform(OsFamily::MacOS, arch, archName + "-apple-darwin");
    }
    if (os == "windows" || os.rfind("mingw", 0) == 0 || os.rfind("msys", 0) == 0) {
        if (arch != CpuArch::X86_64) {
            throw InstallError(ErrorKind::UnsupportedPlatform,
                               "Unsupported host: Windows on " + machine);
        }
        return makePlatform(OsFamily::Windows, arch, "x86_64-pc-windows-msvc");
    }

    throw InstallError(ErrorKind::UnsupportedPlatform, "Unsupported operating system: " + osName);
}

HostPlatform describeHost()
{
#if defined(_WIN32)
    return describeHost("Windows", "x86_64");
#else
    struct utsname info{};
    if (uname(&info) != 0) {
        throw InstallError(ErrorKind::UnsupportedPlatform, "uname() failed");
    }
    HostPlatform host = describeHost(info.sysname, info.machine);
    log_debug("Detected host triple: " + host.triple);
    return host;
#endif
}

HostPlatform parseHostTriple(const std::string& triple)
{
    const auto& known = supportedHostTriples();
    if (std::find(known.begin(), known.end(), triple) == known.end()) {
        throw InstallError(ErrorKind::UnsupportedPlatform, "Unsupported host triple: " + triple);
    }

    CpuArch arch = (triple.rfind("aarch64", 0) == 0) ? CpuArch::Aarch64 : CpuArch::X86_64;
    if (triple.find("linux") != std::string::npos) {
        return makePlatform(OsFamily::Linux, arch, triple);
    }
    if (triple.find("darwin") != std::string::npos) {
        return makePlatform(OsFamily::MacOS, arch, triple);
    }
    return makePlatform(OsFamily::Windows, arch, triple);
}

} // namespace Toolpack
