#include "install_state.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace Toolpack {

namespace {

    std::string requireScalar(const YAML::Node& node, const char* key, size_t index)
    {
        if (!node[key] || !node[key].IsScalar()) {
            throw InstallError(ErrorKind::StateLoadFailed,
                               "Install state entry #" + std::to_string(index)
                               + " is missing '" + key + "'");
        }
        return node[key].as<std::string>();
    }

    InstallRecord parseRecord(const YAML::Node& node, size_t index)
    {
        InstallRecord record;

        std::string name = requireScalar(node, "name", index);
        auto kind = parseComponentKind(name);
        if (!kind) {
            throw InstallError(ErrorKind::StateLoadFailed,
                               "Install state entry #" + std::to_string(index)
                               + " has unknown component '" + name + "'");
        }
        record.id.kind = *kind;
        record.id.targetTriple = requireScalar(node, "target_triple", index);
        record.version = requireScalar(node, "version", index);
        record.installPath = fs::path(requireScalar(node, "install_path", index));
        if (node["installed_at"] && node["installed_at"].IsScalar()) {
            record.installedAt = node["installed_at"].as<std::string>();
        }
        if (node["path_entries"] && node["path_entries"].IsSequence()) {
            for (const auto& item : node["path_entries"]) {
                record.pathEntries.push_back(item.as<std::string>());
            }
        } else {
            record.pathEntries = defaultPathEntries(record.id.kind);
        }
        if (node["variables"] && node["variables"].IsMap()) {
            for (const auto& item : node["variables"]) {
                record.variables[item.first.as<std::string>()] = item.second.as<std::string>();
            }
        }
        return record;
    }

    // Removes ".<state file>.tmp_NNNNNN" files left behind by an interrupted persist.
    void removeStaleTemporaries(const fs::path& stateFile)
    {
        fs::path dir = stateFile.parent_path().empty() ? fs::path(".") : stateFile.parent_path();
        std::string prefix = "." + stateFile.filename().string() + ".tmp_";

        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            return;
        }
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            std::string name = entry.path().filename().string();
            if (name.rfind(prefix, 0) == 0) {
                std::error_code removeError;
                fs::remove(entry.path(), removeError);
                log_debug("Removed stale state temporary " + entry.path().string());
            }
        }
    }

} // namespace

bool InstallRecord::operator==(const InstallRecord& other) const
{
    return id == other.id &&
           version == other.version &&
           installPath == other.installPath &&
           installedAt == other.installedAt &&
           pathEntries == other.pathEntries &&
           variables == other.variables;
}

const InstallRecord* InstallState::find(const ComponentId& id) const
{
    auto it = entries.find(id.key());
    return it == entries.end() ? nullptr : &it->second;
}

void InstallState::put(InstallRecord record)
{
    std::string key = record.id.key();
    entries[key] = std::move(record);
}

bool InstallState::erase(const ComponentId& id)
{
    return entries.erase(id.key()) > 0;
}

bool InstallState::isPathUsed(const fs::path& installPath, const ComponentId& except) const
{
    for (const auto& [key, record] : entries) {
        if (record.id != except && record.installPath == installPath) {
            return true;
        }
    }
    return false;
}

StateTracker::StateTracker(fs::path stateFile) : stateFile(std::move(stateFile)) {}

const InstallState& StateTracker::load()
{
    current = InstallState();
    removeStaleTemporaries(stateFile);

    std::error_code ec;
    if (!fs::exists(stateFile, ec)) {
        log_debug("No install state at " + stateFile.string() + ", starting empty");
        return current;
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(stateFile.string());
    } catch (const YAML::Exception& e) {
        throw InstallError(ErrorKind::StateLoadFailed,
                           "Cannot parse install state " + stateFile.string() + ": " + e.what());
    }

    if (!root || root.IsNull()) {
        return current;
    }
    if (!root["components"] || !root["components"].IsSequence()) {
        throw InstallError(ErrorKind::StateLoadFailed,
                           "Install state " + stateFile.string() + " has no 'components' sequence");
    }

    try {
        size_t index = 0;
        for (const auto& node : root["components"]) {
            current.put(parseRecord(node, index++));
        }
    } catch (const YAML::Exception& e) {
        throw InstallError(ErrorKind::StateLoadFailed,
                           "Malformed install state " + stateFile.string() + ": " + e.what());
    }
    return current;
}

void StateTracker::record(const ComponentId& id, InstallRecord installRecord)
{
    installRecord.id = id;
    current.put(std::move(installRecord));
}

bool StateTracker::remove(const ComponentId& id)
{
    return current.erase(id);
}

void StateTracker::reset(InstallState state)
{
    current = std::move(state);
}

std::string StateTracker::serialize() const
{
    YAML::Emitter out;
    out << YAML::Comment("Managed by toolpack. Do not edit.");
    out << YAML::BeginMap;
    out << YAML::Key << "components" << YAML::Value << YAML::BeginSeq;
    for (const auto& [key, record] : current.records()) {
        out << YAML::BeginMap;
        out << YAML::Key << "name"          << YAML::Value << componentKindName(record.id.kind);
        out << YAML::Key << "target_triple" << YAML::Value << record.id.targetTriple;
        out << YAML::Key << "version"       << YAML::Value << YAML::DoubleQuoted << record.version;
        out << YAML::Key << "install_path"  << YAML::Value << record.installPath.string();
        out << YAML::Key << "installed_at"  << YAML::Value << record.installedAt;
        out << YAML::Key << "path_entries"  << YAML::Value << YAML::Flow << YAML::BeginSeq;
        for (const auto& entry : record.pathEntries) {
            out << entry;
        }
        out << YAML::EndSeq;
        out << YAML::Key << "variables" << YAML::Value << YAML::BeginMap;
        for (const auto& [name, subpath] : record.variables) {
            out << YAML::Key << name << YAML::Value << subpath;
        }
        out << YAML::EndMap;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    return std::string(out.c_str()) + "\n";
}

void StateTracker::persist() const
{
    try {
        writeFileAtomically(stateFile, serialize());
    } catch (const std::exception& e) {
        throw InstallError(ErrorKind::StatePersistFailed,
                           "Failed to persist install state: " + std::string(e.what()));
    }
    log_debug("Persisted " + std::to_string(current.size()) + " install record(s) to " + stateFile.string());
}

} // namespace Toolpack
