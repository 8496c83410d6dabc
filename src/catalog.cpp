#include "catalog.hpp"
#include "environment.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include "version.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace Toolpack {

namespace {

    bool isScalar(const YAML::Node& node, const char* key)
    {
        return node[key] && node[key].IsScalar();
    }

    std::vector<std::string> scalarList(const YAML::Node& node)
    {
        std::vector<std::string> values;
        if (node && node.IsSequence()) {
            for (const auto& item : node) {
                if (item.IsScalar()) {
                    values.push_back(item.as<std::string>());
                }
            }
        }
        return values;
    }

    /**
     * Converts one YAML node from the "components" sequence into an entry.
     * Returns std::nullopt (after a warning) if the node is unusable.
     */
    std::optional<CatalogEntry> parseEntry(const YAML::Node& node, size_t index)
    {
        std::string where = "catalog entry #" + std::to_string(index);

        if (!isScalar(node, "name")) {
            log_warning("Skipping " + where + ": missing 'name'");
            return std::nullopt;
        }
        auto kind = parseComponentKind(node["name"].as<std::string>());
        if (!kind) {
            log_warning("Skipping " + where + ": unknown component '"
                        + node["name"].as<std::string>() + "'");
            return std::nullopt;
        }

        CatalogEntry entry;
        entry.kind = *kind;

        if (!isScalar(node, "target") || !isScalar(node, "url")) {
            log_warning("Skipping " + where + ": 'target' and 'url' are required");
            return std::nullopt;
        }
        entry.target = node["target"].as<std::string>();
        entry.urlTemplate = node["url"].as<std::string>();

        if (isScalar(node, "host")) {
            entry.host = node["host"].as<std::string>();
        }

        std::vector<std::string> declared;
        if (isScalar(node, "version")) {
            declared.push_back(node["version"].as<std::string>());
        }
        for (const auto& v : scalarList(node["versions"])) {
            declared.push_back(v);
        }
        for (const auto& v : declared) {
            if (isValidVersion(v)) {
                entry.versions.push_back(v);
            } else {
                log_warning("Ignoring malformed version '" + v + "' in " + where);
            }
        }
        if (entry.versions.empty()) {
            log_warning("Skipping " + where + ": no valid versions");
            return std::nullopt;
        }

        if (isScalar(node, "format")) {
            auto format = parseArchiveFormat(node["format"].as<std::string>());
            if (!format) {
                log_warning("Skipping " + where + ": unsupported format '"
                            + node["format"].as<std::string>() + "'");
                return std::nullopt;
            }
            entry.format = format;
        }

        if (isScalar(node, "sha256")) {
            if (entry.versions.size() != 1) {
                log_warning("Ignoring 'sha256' in " + where
                            + ": it lists several versions, use 'checksums'");
            } else {
                entry.checksums[entry.versions.front()] = node["sha256"].as<std::string>();
            }
        }
        if (node["checksums"] && node["checksums"].IsMap()) {
            for (const auto& item : node["checksums"]) {
                entry.checksums[item.first.as<std::string>()] = item.second.as<std::string>();
            }
        }
        if (isScalar(node, "size")) {
            entry.size = node["size"].as<std::uintmax_t>();
        }
        if (isScalar(node, "install_subpath")) {
            entry.installSubpath = node["install_subpath"].as<std::string>();
        }
        if (isScalar(node, "strip_components")) {
            entry.stripComponents = std::max(0, node["strip_components"].as<int>());
        }
        if (node["path_entries"]) {
            std::vector<std::string> pathEntries;
            for (const auto& subpath : scalarList(node["path_entries"])) {
                if (subpath.empty() || isContainedSubpath(subpath)) {
                    pathEntries.push_back(subpath);
                } else {
                    log_warning("Ignoring path entry '" + subpath + "' in " + where
                                + ": it leaves the install directory");
                }
            }
            entry.pathEntries = pathEntries;
        }
        if (node["variables"] && node["variables"].IsMap()) {
            for (const auto& item : node["variables"]) {
                std::string name = item.first.as<std::string>();
                std::string subpath = item.second.as<std::string>();
                if (!isValidVariableName(name)) {
                    log_warning("Ignoring variable '" + name + "' in " + where
                                + ": not a valid environment variable name");
                    continue;
                }
                if (!subpath.empty() && !isContainedSubpath(subpath)) {
                    log_warning("Ignoring variable " + name + " in " + where
                                + ": '" + subpath + "' leaves the install directory");
                    continue;
                }
                entry.variables[name] = subpath;
            }
        }

        return entry;
    }

} // namespace

std::string expandTemplate(const std::string& text,
                           const std::map<std::string, std::string>& values)
{
    std::string result;
    result.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find('{', pos);
        if (open == std::string::npos) {
            result.append(text, pos, std::string::npos);
            break;
        }
        size_t close = text.find('}', open);
        if (close == std::string::npos) {
            result.append(text, pos, std::string::npos);
            break;
        }
        result.append(text, pos, open - pos);
        std::string key = text.substr(open + 1, close - open - 1);
        auto it = values.find(key);
        if (it != values.end()) {
            result += it->second;
        } else {
            result.append(text, open, close - open + 1);
        }
        pos = close + 1;
    }
    return result;
}

Catalog Catalog::loadFromString(const std::string& yamlText)
{
    YAML::Node root;
    try {
        root = YAML::Load(yamlText);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Malformed catalog: ") + e.what());
    }

    if (!root["components"] || !root["components"].IsSequence()) {
        throw std::runtime_error("Malformed catalog: missing 'components' sequence");
    }

    Catalog catalog;
    size_t index = 0;
    for (const YAML::Node& node : root["components"]) {
        try {
            auto entry = parseEntry(node, index);
            if (entry) {
                catalog.addEntry(std::move(*entry));
            }
        } catch (const YAML::Exception& e) {
            log_warning("Skipping catalog entry #" + std::to_string(index) + ": " + e.what());
        }
        ++index;
    }

    log_debug("Loaded " + std::to_string(catalog.entries().size()) + " catalog entries");
    return catalog;
}

Catalog Catalog::loadFromFile(const fs::path& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open catalog file: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadFromString(buffer.str());
}

Catalog Catalog::load(const std::string& location)
{
    if (isRemoteLocation(location)) {
        log_message("Fetching component catalog from " + location);
        return loadFromString(fetchRemoteText(location));
    }
    return loadFromFile(expandHome(location));
}

void Catalog::addEntry(CatalogEntry entry)
{
    if (!isContainedSubpath(entry.installSubpath)) {
        throw std::runtime_error("Catalog install_subpath must be a relative path inside the install root: '"
                                 + entry.installSubpath + "'");
    }
    catalogEntries.push_back(std::move(entry));
}

std::vector<std::string> Catalog::availableVersions(const ComponentId& id,
                                                    const HostPlatform& host) const
{
    std::vector<std::string> versions;
    for (const auto& entry : catalogEntries) {
        if (entry.kind != id.kind || entry.target != id.targetTriple ||
            !entry.servesHost(host.triple)) {
            continue;
        }
        for (const auto& v : entry.versions) {
            if (std::find(versions.begin(), versions.end(), v) == versions.end()) {
                versions.push_back(v);
            }
        }
    }
    std::sort(versions.begin(), versions.end(),
              [](const std::string& a, const std::string& b) {
                  return compareVersions(a, b) > 0;
              });
    return versions;
}

ArtifactReference Catalog::resolve(const Component& component,
                                   const HostPlatform& host,
                                   const fs::path& installRoot) const
{
    const ComponentId& id = component.id;
    std::vector<std::string> versions = availableVersions(id, host);
    if (versions.empty()) {
        throw InstallError(ErrorKind::UnknownComponent,
                           "No artifact published for " + id.key() + " on host " + host.triple);
    }

    auto selected = selectVersion(versions, component.version);
    if (!selected) {
        throw InstallError(ErrorKind::VersionNotFound,
                           "No version of " + id.key() + " matches '" + component.version + "'");
    }

    // Host-specific entries take precedence over wildcard ones.
    const CatalogEntry* chosen = nullptr;
    for (const auto& entry : catalogEntries) {
        if (entry.kind != id.kind || entry.target != id.targetTriple ||
            !entry.servesHost(host.triple)) {
            continue;
        }
        if (std::find(entry.versions.begin(), entry.versions.end(), *selected) == entry.versions.end()) {
            continue;
        }
        if (!chosen || (chosen->host == "*" && entry.host != "*")) {
            chosen = &entry;
        }
    }
    if (!chosen) {
        throw InstallError(ErrorKind::VersionNotFound,
                           "Version " + *selected + " of " + id.key() + " has no artifact");
    }

    std::map<std::string, std::string> values = {
        {"name",    componentKindName(id.kind)},
        {"version", *selected},
        {"target",  id.targetTriple},
        {"host",    host.triple}
    };

    ArtifactReference ref;
    ref.id = id;
    ref.version = *selected;
    ref.url = expandTemplate(chosen->urlTemplate, values);
    ref.format = chosen->format.value_or(host.defaultArchiveFormat);
    auto checksum = chosen->checksums.find(*selected);
    if (checksum != chosen->checksums.end()) {
        ref.sha256 = checksum->second;
    }
    if (chosen->versions.size() == 1) {
        ref.size = chosen->size;
    }
    std::string subpath = expandTemplate(chosen->installSubpath, values);
    if (!isContainedSubpath(subpath)) {
        throw InstallError(ErrorKind::UnknownComponent,
                           "Install path '" + subpath + "' for " + id.key() + " escapes the install root");
    }
    ref.installPath = installRoot / subpath;
    ref.stripComponents = chosen->stripComponents;
    ref.pathEntries = chosen->pathEntries.value_or(defaultPathEntries(id.kind));
    ref.variables = chosen->variables;
    return ref;
}

} // namespace Toolpack
