#ifndef ORCHESTRATOR_HPP
#define ORCHESTRATOR_HPP

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "catalog.hpp"
#include "component.hpp"
#include "environment.hpp"
#include "errors.hpp"
#include "extract.hpp"
#include "fetch.hpp"
#include "install_state.hpp"
#include "platform.hpp"

namespace Toolpack {

/**
 * @brief Lifecycle of one component within a run.
 *
 * Install: Pending -> Resolved -> Downloading -> Verifying -> Extracting
 *          -> Recorded -> Configured.
 * Uninstall: Pending -> Removing -> Removed.
 * Any stage may end in Failed.
 */
enum class InstallPhase
{
    Pending,
    Resolved,
    Downloading,
    Verifying,
    Extracting,
    Recorded,
    Configured,
    Removing,
    Removed,
    Failed
};

const char* installPhaseName(InstallPhase phase);

/**
 * @brief What a run did to a component.
 */
enum class ComponentAction
{
    Installed,
    Upgraded,
    Unchanged,
    Removed,
    NotInstalled,
    Failed
};

const char* componentActionName(ComponentAction action);

/**
 * @struct ComponentOutcome
 * @brief Per-component result collected by the Orchestrator.
 */
struct ComponentOutcome
{
    ComponentId id;
    std::string requestedVersion;

    /** Version installed (or removed) by this run, empty if unresolved. */
    std::string version;

    /** Version recorded before the run, for upgrades and removals. */
    std::string previousVersion;

    ComponentAction action = ComponentAction::Failed;
    InstallPhase phase = InstallPhase::Pending;

    /** Last phase reached before a failure. */
    InstallPhase failedDuring = InstallPhase::Pending;

    std::optional<ErrorKind> error;
    std::string message;

    bool succeeded() const { return !error.has_value(); }
};

/**
 * @struct RunReport
 * @brief Outcomes of a run, in request order.
 */
struct RunReport
{
    std::vector<ComponentOutcome> outcomes;

    /** True if any commit could not persist the install state. */
    bool statePersistFailed = false;

    bool allSucceeded() const;

    /**
     * @return 0 on full success, 3 if the state could not be persisted,
     *         2 if any component failed otherwise.
     */
    int exitCode() const;

    /** Writes the end-of-run summary. */
    void print(std::ostream& out) const;
};

/**
 * @struct OrchestratorOptions
 */
struct OrchestratorOptions
{
    std::filesystem::path installRoot;
    std::chrono::milliseconds fetchTimeout{std::chrono::seconds(600)};
    std::chrono::milliseconds extractTimeout{std::chrono::seconds(600)};

    /** Upper bound on components processed concurrently. */
    size_t workers = 1;
};

/**
 * @class Orchestrator
 * @brief Drives install, upgrade and uninstall of components.
 *
 * Components are processed on a bounded set of workers. Work on one identity
 * is serialised by a per-identity lock, and every commit (record, environment
 * apply, persist) runs under a single commit lock. A failure ends only the
 * component it belongs to.
 */
class Orchestrator
{
public:
    using PhaseObserver = std::function<void(const ComponentId&, InstallPhase)>;

    Orchestrator(const Catalog& catalog,
                 Fetcher& fetcher,
                 StateTracker& tracker,
                 EnvironmentTarget& environment,
                 HostPlatform host,
                 OrchestratorOptions options,
                 const CancellationToken* cancel = nullptr);

    /**
     * @brief Installs or upgrades the requested components. A component
     *        already installed at the resolved version is left untouched
     *        without any network access.
     */
    RunReport install(const std::vector<Component>& components);

    /**
     * @brief Re-resolves components against their constraints ("latest" when
     *        empty) and upgrades those whose resolved version changed. With
     *        no components, every installed component is updated.
     */
    RunReport update(const std::vector<Component>& components);

    /**
     * @brief Removes components. Identities that are not installed succeed
     *        as NotInstalled.
     */
    RunReport uninstall(const std::vector<ComponentId>& ids);

    /** Removes every installed component. */
    RunReport uninstallAll();

    /**
     * @brief Called on every phase change, from worker threads.
     *
     * The observer never runs under the commit lock, so it may start another
     * run. It does run while the component's own identity is locked: a run it
     * starts must not touch that identity.
     */
    void setPhaseObserver(PhaseObserver observer) { phaseObserver = std::move(observer); }

private:
    ComponentOutcome installOne(const Component& component);
    ComponentOutcome uninstallOne(const ComponentId& id);

    void transition(ComponentOutcome& outcome, InstallPhase phase);

    /** Updates the outcome's phase without notifying the observer. */
    void enterPhase(ComponentOutcome& outcome, InstallPhase phase);
    void notifyObserver(const ComponentId& id, const std::vector<InstallPhase>& reached);
    void fail(ComponentOutcome& outcome, ErrorKind kind, const std::string& message);

    /**
     * @brief Records the component, applies the environment and persists the
     *        state, restoring the previous state if any step fails.
     */
    void commitInstall(const ArtifactReference& artifact, ComponentOutcome& outcome);

    /**
     * @param root Where the artifact's tree was extracted to.
     * @return An empty string if the tree is usable, else the problem found.
     */
    std::string healthCheck(const ArtifactReference& artifact, const std::filesystem::path& root) const;

    /**
     * @brief Applies the environment for the tracker's current state and
     *        persists it. Must be called with commitMutex held.
     * @param before The state the environment currently reflects.
     */
    void applyAndPersist(const InstallState& before);

    std::mutex& identityLock(const ComponentId& id);

    std::optional<InstallRecord> findRecord(const ComponentId& id);

    const Catalog& catalog;
    Fetcher& fetcher;
    StateTracker& tracker;
    EnvironmentTarget& environment;
    HostPlatform host;
    OrchestratorOptions options;
    const CancellationToken* cancel;
    PhaseObserver phaseObserver;

    std::mutex commitMutex;
    std::mutex identityLocksMutex;
    std::map<std::string, std::unique_ptr<std::mutex>> identityLocks;

    /** Install paths being written by an in-flight install, guarded by commitMutex. */
    std::map<std::filesystem::path, std::string> reservedPaths;
    std::atomic<bool> statePersistFailed{false};
};

} // namespace Toolpack

#endif // ORCHESTRATOR_HPP
