#include "environment.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace fs = std::filesystem;

namespace Toolpack {

namespace {

    std::string joinInstallPath(const fs::path& installPath, const std::string& subpath,
                                const HostPlatform& host)
    {
        fs::path full = (subpath.empty() || subpath == ".") ? installPath : installPath / subpath;
        std::string text = full.lexically_normal().string();
        if (host.os == OsFamily::Windows) {
            std::replace(text.begin(), text.end(), '/', '\\');
        }
        while (text.size() > 1 && (text.back() == '/' || text.back() == '\\')) {
            text.pop_back();
        }
        return text;
    }

    std::string comparableEntry(std::string entry, bool caseInsensitive)
    {
        while (entry.size() > 1 && (entry.back() == '/' || entry.back() == '\\')) {
            entry.pop_back();
        }
        if (caseInsensitive) {
            std::transform(entry.begin(), entry.end(), entry.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        }
        return entry;
    }

    // Escapes a value for use inside double quotes in a POSIX shell.
    std::string shellQuote(const std::string& value)
    {
        std::string quoted;
        quoted.reserve(value.size() + 2);
        for (char c : value) {
            if (c == '\\' || c == '"' || c == '$' || c == '`') {
                quoted += '\\';
            }
            quoted += c;
        }
        return quoted;
    }

    std::vector<std::string> retiredEntries(const EnvironmentSet& desired, const EnvironmentSet& previous)
    {
        std::vector<std::string> retired;
        for (const auto& entry : previous.pathEntries) {
            if (std::find(desired.pathEntries.begin(), desired.pathEntries.end(), entry) ==
                desired.pathEntries.end()) {
                retired.push_back(entry);
            }
        }
        return retired;
    }

#if defined(_WIN32)
    std::wstring widen(const std::string& text)
    {
        if (text.empty()) {
            return std::wstring();
        }
        int length = MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), nullptr, 0);
        std::wstring result(static_cast<size_t>(length), L'\0');
        MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), result.data(), length);
        return result;
    }

    std::string narrow(const std::wstring& text)
    {
        if (text.empty()) {
            return std::string();
        }
        int length = WideCharToMultiByte(CP_UTF8, 0, text.data(), static_cast<int>(text.size()),
                                         nullptr, 0, nullptr, nullptr);
        std::string result(static_cast<size_t>(length), '\0');
        WideCharToMultiByte(CP_UTF8, 0, text.data(), static_cast<int>(text.size()),
                            result.data(), length, nullptr, nullptr);
        return result;
    }

    /**
     * Opens HKCU\Environment for the lifetime of the object.
     */
    class EnvironmentKey
    {
    public:
        EnvironmentKey()
        {
            LONG rc = RegOpenKeyExW(HKEY_CURRENT_USER, L"Environment", 0,
                                    KEY_READ | KEY_WRITE, &key);
            if (rc != ERROR_SUCCESS) {
                throw std::runtime_error("Cannot open HKCU\\Environment (error " + std::to_string(rc) + ")");
            }
        }
        ~EnvironmentKey() { RegCloseKey(key); }

        EnvironmentKey(const EnvironmentKey&) = delete;
        EnvironmentKey& operator=(const EnvironmentKey&) = delete;

        HKEY get() const { return key; }

    private:
        HKEY key = nullptr;
    };
#endif

} // namespace

//============================================================================
// Environment computation
//============================================================================

bool isValidVariableName(const std::string& name)
{
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0]))) {
        return false;
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return comparableEntry(name, true) != "path";
}

EnvironmentSet computeEnvironment(const InstallState& state, const HostPlatform& host)
{
    EnvironmentSet environment;

    for (const auto& [key, record] : state.records()) {
        for (const auto& entry : record.pathEntries) {
            if (!entry.empty() && !isContainedSubpath(entry)) {
                log_warning("Ignoring PATH entry '" + entry + "' of " + key + ": it leaves "
                            + record.installPath.string());
                continue;
            }
            std::string full = joinInstallPath(record.installPath, entry, host);
            if (std::find(environment.pathEntries.begin(), environment.pathEntries.end(), full) ==
                environment.pathEntries.end()) {
                environment.pathEntries.push_back(full);
            }
        }
        for (const auto& [name, subpath] : record.variables) {
            if (!isValidVariableName(name) || (!subpath.empty() && !isContainedSubpath(subpath))) {
                log_warning("Ignoring variable '" + name + "' of " + key);
                continue;
            }
            std::string value = joinInstallPath(record.installPath, subpath, host);
            auto existing = environment.variables.find(name);
            if (existing != environment.variables.end() && existing->second != value) {
                log_warning(name + " is exported by several components; using the one from " + key);
            }
            environment.variables[name] = value;
        }
    }
    return environment;
}

std::string mergePathList(const std::string& existing,
                          const std::vector<std::string>& desired,
                          const std::vector<std::string>& retired,
                          char separator,
                          bool caseInsensitive)
{
    std::set<std::string> managed;
    for (const auto& entry : desired) {
        managed.insert(comparableEntry(entry, caseInsensitive));
    }
    for (const auto& entry : retired) {
        managed.insert(comparableEntry(entry, caseInsensitive));
    }

    std::vector<std::string> merged;
    std::set<std::string> seen;
    for (const auto& entry : desired) {
        std::string key = comparableEntry(entry, caseInsensitive);
        if (seen.insert(key).second) {
            merged.push_back(entry);
        }
    }

    std::stringstream ss(existing);
    std::string item;
    while (std::getline(ss, item, separator)) {
        if (item.empty()) {
            continue;
        }
        if (managed.count(comparableEntry(item, caseInsensitive))) {
            continue;
        }
        merged.push_back(item);
    }

    std::string result;
    for (size_t i = 0; i < merged.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += merged[i];
    }
    return result;
}

//============================================================================
// PosixExportFile
//============================================================================

PosixExportFile::PosixExportFile(fs::path exportFile) : exportFile(std::move(exportFile)) {}

std::string PosixExportFile::render(const EnvironmentSet& environment)
{
    std::ostringstream out;
    out << "# Generated by toolpack. This file is rewritten on every install and uninstall.\n";

    for (const auto& [name, value] : environment.variables) {
        if (!isValidVariableName(name)) {
            continue;
        }
        out << "export " << name << "=\"" << shellQuote(value) << "\"\n";
    }

    if (!environment.pathEntries.empty()) {
        out << "export PATH=\"";
        for (const auto& entry : environment.pathEntries) {
            out << shellQuote(entry) << ":";
        }
        out << "$PATH\"\n";
    }
    return out.str();
}

void PosixExportFile::apply(const EnvironmentSet& desired, const EnvironmentSet& /*previous*/)
{
    try {
        writeFileAtomically(exportFile, render(desired));
    } catch (const std::exception& e) {
        throw InstallError(ErrorKind::EnvironmentWriteFailed,
                           "Cannot write export file " + exportFile.string() + ": " + e.what());
    }
    log_debug("Wrote " + exportFile.string());
}

std::string PosixExportFile::describe() const
{
    return "export file " + exportFile.string();
}

std::string PosixExportFile::activationHint() const
{
    return "To use the installed tools, run '. " + exportFile.string()
           + "' in your shell, or add that line to your shell profile.";
}

//============================================================================
// WindowsUserEnvironment
//============================================================================

WindowsUserEnvironment::WindowsUserEnvironment(std::unique_ptr<UserEnvironmentStore> store)
    : store(std::move(store))
{
}

void WindowsUserEnvironment::apply(const EnvironmentSet& desired, const EnvironmentSet& previous)
{
    try {
        for (const auto& [name, value] : previous.variables) {
            if (isValidVariableName(name) && desired.variables.find(name) == desired.variables.end()) {
                store->remove(name);
            }
        }
        for (const auto& [name, value] : desired.variables) {
            if (!isValidVariableName(name)) {
                continue;
            }
            auto current = store->get(name);
            if (!current || *current != value) {
                store->set(name, value);
            }
        }

        std::string existingPath = store->get("PATH").value_or("");
        std::string mergedPath = mergePathList(existingPath, desired.pathEntries,
                                               retiredEntries(desired, previous), ';', true);
        if (mergedPath != existingPath) {
            store->set("PATH", mergedPath);
        }

        store->notifyChanged();
    } catch (const InstallError&) {
        throw;
    } catch (const std::exception& e) {
        throw InstallError(ErrorKind::EnvironmentWriteFailed,
                           std::string("Cannot update user environment: ") + e.what());
    }
}

std::string WindowsUserEnvironment::describe() const
{
    return "user environment variables";
}

#if defined(_WIN32)
//============================================================================
// RegistryEnvironmentStore
//============================================================================

std::optional<std::string> RegistryEnvironmentStore::get(const std::string& name)
{
    EnvironmentKey key;
    std::wstring wideName = widen(name);

    DWORD type = 0;
    DWORD size = 0;
    LONG rc = RegQueryValueExW(key.get(), wideName.c_str(), nullptr, &type, nullptr, &size);
    if (rc == ERROR_FILE_NOT_FOUND) {
        return std::nullopt;
    }
    if (rc != ERROR_SUCCESS) {
        throw std::runtime_error("Cannot read " + name + " (error " + std::to_string(rc) + ")");
    }

    std::wstring value(size / sizeof(wchar_t), L'\0');
    rc = RegQueryValueExW(key.get(), wideName.c_str(), nullptr, &type,
                          reinterpret_cast<LPBYTE>(value.data()), &size);
    if (rc != ERROR_SUCCESS) {
        throw std::runtime_error("Cannot read " + name + " (error " + std::to_string(rc) + ")");
    }
    while (!value.empty() && value.back() == L'\0') {
        value.pop_back();
    }
    return narrow(value);
}

void RegistryEnvironmentStore::set(const std::string& name, const std::string& value)
{
    EnvironmentKey key;
    std::wstring wideName = widen(name);
    std::wstring wideValue = widen(value);

    // PATH commonly holds %VARIABLES%; keep it expandable.
    DWORD type = (name == "PATH" || name == "Path") ? REG_EXPAND_SZ : REG_SZ;
    LONG rc = RegSetValueExW(key.get(), wideName.c_str(), 0, type,
                             reinterpret_cast<const BYTE*>(wideValue.c_str()),
                             static_cast<DWORD>((wideValue.size() + 1) * sizeof(wchar_t)));
    if (rc != ERROR_SUCCESS) {
        throw std::runtime_error("Cannot write " + name + " (error " + std::to_string(rc) + ")");
    }
}

void RegistryEnvironmentStore::remove(const std::string& name)
{
    EnvironmentKey key;
    LONG rc = RegDeleteValueW(key.get(), widen(name).c_str());
    if (rc != ERROR_SUCCESS && rc != ERROR_FILE_NOT_FOUND) {
        throw std::runtime_error("Cannot delete " + name + " (error " + std::to_string(rc) + ")");
    }
}

void RegistryEnvironmentStore::notifyChanged()
{
    DWORD_PTR result = 0;
    SendMessageTimeoutW(HWND_BROADCAST, WM_SETTINGCHANGE, 0,
                        reinterpret_cast<LPARAM>(L"Environment"),
                        SMTO_ABORTIFHUNG, 5000, &result);
}
#endif

std::unique_ptr<EnvironmentTarget> makeEnvironmentTarget(const HostPlatform& host,
                                                         const fs::path& exportFile)
{
    if (host.usesExportFile()) {
        return std::make_unique<PosixExportFile>(exportFile);
    }
#if defined(_WIN32)
    return std::make_unique<WindowsUserEnvironment>(std::make_unique<RegistryEnvironmentStore>());
#else
    throw InstallError(ErrorKind::UnsupportedPlatform,
                       "Windows user environment can only be configured from a Windows build");
#endif
}

} // namespace Toolpack
