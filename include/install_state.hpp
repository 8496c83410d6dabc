#ifndef INSTALL_STATE_HPP
#define INSTALL_STATE_HPP

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "component.hpp"

namespace Toolpack {

/**
 * @struct InstallRecord
 * @brief A successfully installed component.
 */
struct InstallRecord
{
    ComponentId id;
    std::string version;
    std::filesystem::path installPath;

    /** UTC, ISO 8601. */
    std::string installedAt;

    std::vector<std::string> pathEntries;
    std::map<std::string, std::string> variables;

    bool operator==(const InstallRecord& other) const;
    bool operator!=(const InstallRecord& other) const { return !(*this == other); }
};

/**
 * @class InstallState
 * @brief All install records of the current user, keyed by ComponentId::key().
 */
class InstallState
{
public:
    /** @return The record for id, or nullptr. */
    const InstallRecord* find(const ComponentId& id) const;

    /** Inserts or replaces the record for record.id. */
    void put(InstallRecord record);

    /** @return True if a record was removed. */
    bool erase(const ComponentId& id);

    /** @return True if any record other than `except` uses the given install path. */
    bool isPathUsed(const std::filesystem::path& installPath, const ComponentId& except) const;

    const std::map<std::string, InstallRecord>& records() const { return entries; }
    bool empty() const { return entries.empty(); }
    size_t size() const { return entries.size(); }

    bool operator==(const InstallState& other) const { return entries == other.entries; }
    bool operator!=(const InstallState& other) const { return !(*this == other); }

private:
    std::map<std::string, InstallRecord> entries;
};

/**
 * @class StateTracker
 * @brief Owns the install state of a user and its file on disk.
 *
 * The file is YAML with a "components" sequence sorted by identity. persist()
 * writes a temporary file next to it and renames it into place.
 */
class StateTracker
{
public:
    explicit StateTracker(std::filesystem::path stateFile);

    /**
     * @brief Reads the state file. A missing file yields an empty state.
     *        Leftover temporary files from an interrupted persist are removed.
     * @throws InstallError(StateLoadFailed) if the file exists but is malformed.
     */
    const InstallState& load();

    /** @return The state as last loaded or modified. */
    const InstallState& state() const { return current; }

    /** Adds or replaces a record in memory. */
    void record(const ComponentId& id, InstallRecord installRecord);

    /** Drops a record in memory. @return True if it existed. */
    bool remove(const ComponentId& id);

    /** Replaces the in-memory state (used to roll back a failed commit). */
    void reset(InstallState state);

    /**
     * @brief Atomically writes the in-memory state to disk.
     * @throws InstallError(StatePersistFailed). The previous file stays intact.
     */
    void persist() const;

    /** @return The YAML document persist() would write. */
    std::string serialize() const;

    const std::filesystem::path& path() const { return stateFile; }

private:
    std::filesystem::path stateFile;
    InstallState current;
};

} // namespace Toolpack

#endif // INSTALL_STATE_HPP
