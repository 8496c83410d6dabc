#ifndef ENVIRONMENT_HPP
#define ENVIRONMENT_HPP

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "install_state.hpp"
#include "platform.hpp"

namespace Toolpack {

/**
 * @struct EnvironmentSet
 * @brief The complete set of environment assignments derived from the
 *        install state: plain variables and PATH entries (in priority order).
 */
struct EnvironmentSet
{
    std::map<std::string, std::string> variables;
    std::vector<std::string> pathEntries;

    bool empty() const { return variables.empty() && pathEntries.empty(); }

    bool operator==(const EnvironmentSet& other) const
    {
        return variables == other.variables && pathEntries == other.pathEntries;
    }
    bool operator!=(const EnvironmentSet& other) const { return !(*this == other); }
};

/**
 * @brief True for a name a component may export: a shell identifier
 *        ([A-Za-z_][A-Za-z0-9_]*) other than PATH in any letter case.
 */
bool isValidVariableName(const std::string& name);

/**
 * @brief Computes the environment for every installed component.
 *
 * Records are visited in identity order, so the result depends only on the
 * state. When two components export the same variable, the later identity wins.
 */
EnvironmentSet computeEnvironment(const InstallState& state, const HostPlatform& host);

/**
 * @brief Merges component entries into an existing PATH value.
 *
 * Entries listed in `retired` or `desired` are removed from their current
 * position, then `desired` is prepended in order. Every other entry keeps its
 * original relative order. Trailing separators are ignored when comparing.
 *
 * @param existing        Current PATH value.
 * @param desired         Component entries that must be present.
 * @param retired         Component entries that must be removed.
 * @param separator       ':' or ';'.
 * @param caseInsensitive Compare entries ignoring case (Windows).
 */
std::string mergePathList(const std::string& existing,
                          const std::vector<std::string>& desired,
                          const std::vector<std::string>& retired,
                          char separator,
                          bool caseInsensitive);

/**
 * @class EnvironmentTarget
 * @brief Where environment assignments are persisted on a host.
 */
class EnvironmentTarget
{
public:
    virtual ~EnvironmentTarget() = default;

    /**
     * @brief Persists `desired`. `previous` is the set applied before this
     *        call; anything only in `previous` is withdrawn.
     * @throws InstallError(EnvironmentWriteFailed)
     */
    virtual void apply(const EnvironmentSet& desired, const EnvironmentSet& previous) = 0;

    /** @return A short description for log messages. */
    virtual std::string describe() const = 0;

    /** @return A line telling the user how to activate the environment, or "". */
    virtual std::string activationHint() const { return ""; }
};

/**
 * @class PosixExportFile
 * @brief Writes a shell file of "export NAME=VALUE" lines. The user's own
 *        profile scripts are never modified.
 */
class PosixExportFile : public EnvironmentTarget
{
public:
    explicit PosixExportFile(std::filesystem::path exportFile);

    void apply(const EnvironmentSet& desired, const EnvironmentSet& previous) override;
    std::string describe() const override;
    std::string activationHint() const override;

    /**
     * @brief Renders the file content. Variables are sorted by name and PATH
     *        comes last; identical input always yields identical bytes.
     */
    static std::string render(const EnvironmentSet& environment);

    const std::filesystem::path& path() const { return exportFile; }

private:
    std::filesystem::path exportFile;
};

/**
 * @class UserEnvironmentStore
 * @brief A persistent per-user variable store. Implementations throw
 *        std::runtime_error when a read or write fails.
 */
class UserEnvironmentStore
{
public:
    virtual ~UserEnvironmentStore() = default;

    virtual std::optional<std::string> get(const std::string& name) = 0;
    virtual void set(const std::string& name, const std::string& value) = 0;
    virtual void remove(const std::string& name) = 0;

    /** Tells running programs that the environment changed. */
    virtual void notifyChanged() {}
};

#if defined(_WIN32)
/**
 * @class RegistryEnvironmentStore
 * @brief HKEY_CURRENT_USER\\Environment, followed by a WM_SETTINGCHANGE broadcast.
 */
class RegistryEnvironmentStore : public UserEnvironmentStore
{
public:
    std::optional<std::string> get(const std::string& name) override;
    void set(const std::string& name, const std::string& value) override;
    void remove(const std::string& name) override;
    void notifyChanged() override;
};
#endif

/**
 * @class WindowsUserEnvironment
 * @brief Persists assignments as user variables, merging PATH instead of
 *        replacing it.
 */
class WindowsUserEnvironment : public EnvironmentTarget
{
public:
    explicit WindowsUserEnvironment(std::unique_ptr<UserEnvironmentStore> store);

    void apply(const EnvironmentSet& desired, const EnvironmentSet& previous) override;
    std::string describe() const override;

private:
    std::unique_ptr<UserEnvironmentStore> store;
};

/**
 * @brief Selects the environment target for a host, once, at startup.
 * @throws InstallError(UnsupportedPlatform) for a Windows host on a build
 *         without registry support.
 */
std::unique_ptr<EnvironmentTarget> makeEnvironmentTarget(const HostPlatform& host,
                                                         const std::filesystem::path& exportFile);

} // namespace Toolpack

#endif // ENVIRONMENT_HPP
