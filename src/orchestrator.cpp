#include "orchestrator.hpp"
#include "cache.hpp"
#include "utils.hpp"

#include <algorithm>
#include <future>
#include <iomanip>

namespace fs = std::filesystem;

namespace Toolpack {

namespace {

    /**
     * Runs task(0..count-1) on at most `workers` threads and returns the
     * results in index order. task must not throw.
     */
    std::vector<ComponentOutcome> runOnWorkers(size_t count, size_t workers,
                                               const std::function<ComponentOutcome(size_t)>& task)
    {
        std::vector<ComponentOutcome> outcomes(count);
        if (count == 0) {
            return outcomes;
        }

        std::atomic<size_t> next{0};
        size_t threads = std::min(count, std::max<size_t>(1, workers));

        std::vector<std::future<void>> futures;
        for (size_t w = 0; w < threads; ++w) {
            futures.push_back(std::async(std::launch::async, [&]() {
                for (size_t i = next++; i < count; i = next++) {
                    outcomes[i] = task(i);
                }
            }));
        }
        for (auto& fut : futures) {
            fut.get();
        }
        return outcomes;
    }

    // Kind reported for unexpected exceptions, based on the stage that raised them.
    ErrorKind errorKindForPhase(InstallPhase phase)
    {
        switch (phase) {
            case InstallPhase::Pending:
            case InstallPhase::Resolved:
            case InstallPhase::Downloading:
                return ErrorKind::DownloadFailed;
            case InstallPhase::Verifying:
                return ErrorKind::IntegrityMismatch;
            case InstallPhase::Recorded:
            case InstallPhase::Configured:
                return ErrorKind::StatePersistFailed;
            case InstallPhase::Removing:
            case InstallPhase::Removed:
                return ErrorKind::RemovalFailed;
            default:
                return ErrorKind::ExtractionFailed;
        }
    }

    /**
     * Holds an install path for one identity until the install finishes.
     * hold() expects the mutex to be locked by the caller.
     */
    class PathReservation
    {
    public:
        PathReservation(std::mutex& mutex, std::map<fs::path, std::string>& paths)
            : mutex(mutex), paths(paths) {}

        ~PathReservation()
        {
            if (held.empty()) {
                return;
            }
            std::lock_guard<std::mutex> lock(mutex);
            paths.erase(held);
        }

        PathReservation(const PathReservation&) = delete;
        PathReservation& operator=(const PathReservation&) = delete;

        void hold(const fs::path& path, const std::string& owner)
        {
            paths[path] = owner;
            held = path;
        }

    private:
        std::mutex& mutex;
        std::map<fs::path, std::string>& paths;
        fs::path held;
    };

    /**
     * Puts a freshly extracted tree in place of an installed one. The old tree
     * is moved aside and comes back on destruction unless keep() was called.
     */
    class TreeReplacement
    {
    public:
        TreeReplacement(const fs::path& extracted, const fs::path& destination)
            : destination(destination)
        {
            std::error_code ec;
            fs::path aside = generateTempFilename("." + destination.filename().string() + ".old",
                                                  destination.parent_path());
            fs::rename(destination, aside, ec);
            if (ec) {
                fs::remove_all(extracted, ec);
                throw InstallError(ErrorKind::ExtractionFailed,
                                   "Cannot move aside existing " + destination.string() + ": " + ec.message());
            }
            fs::rename(extracted, destination, ec);
            if (ec) {
                std::string reason = ec.message();
                fs::rename(aside, destination, ec);
                fs::remove_all(extracted, ec);
                throw InstallError(ErrorKind::ExtractionFailed,
                                   "Cannot move extracted tree into " + destination.string() + ": " + reason);
            }
            backup = aside;
        }

        ~TreeReplacement()
        {
            if (backup.empty()) {
                return;
            }
            std::error_code ec;
            fs::remove_all(destination, ec);
            fs::rename(backup, destination, ec);
            if (ec) {
                log_error("Could not restore " + destination.string() + " from " + backup.string()
                          + ": " + ec.message());
            }
        }

        TreeReplacement(const TreeReplacement&) = delete;
        TreeReplacement& operator=(const TreeReplacement&) = delete;

        void keep()
        {
            std::error_code ec;
            fs::remove_all(backup, ec);
            if (ec) {
                log_warning("Could not remove superseded tree " + backup.string() + ": " + ec.message());
            }
            backup.clear();
        }

    private:
        fs::path destination;
        fs::path backup;
    };

    bool directoryHasEntries(const fs::path& dir)
    {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            return false;
        }
        return fs::directory_iterator(dir, ec) != fs::directory_iterator();
    }

} // namespace

const char* installPhaseName(InstallPhase phase)
{
    switch (phase) {
        case InstallPhase::Pending:     return "Pending";
        case InstallPhase::Resolved:    return "Resolved";
        case InstallPhase::Downloading: return "Downloading";
        case InstallPhase::Verifying:   return "Verifying";
        case InstallPhase::Extracting:  return "Extracting";
        case InstallPhase::Recorded:    return "Recorded";
        case InstallPhase::Configured:  return "Configured";
        case InstallPhase::Removing:    return "Removing";
        case InstallPhase::Removed:     return "Removed";
        case InstallPhase::Failed:      return "Failed";
    }
    return "Unknown";
}

const char* componentActionName(ComponentAction action)
{
    switch (action) {
        case ComponentAction::Installed:    return "installed";
        case ComponentAction::Upgraded:     return "upgraded";
        case ComponentAction::Unchanged:    return "already installed";
        case ComponentAction::Removed:      return "removed";
        case ComponentAction::NotInstalled: return "not installed";
        case ComponentAction::Failed:       return "FAILED";
    }
    return "unknown";
}

//============================================================================
// RunReport
//============================================================================

bool RunReport::allSucceeded() const
{
    return !statePersistFailed &&
           std::all_of(outcomes.begin(), outcomes.end(),
                       [](const ComponentOutcome& o) { return o.succeeded(); });
}

int RunReport::exitCode() const
{
    if (statePersistFailed) {
        return 3;
    }
    return allSucceeded() ? 0 : 2;
}

void RunReport::print(std::ostream& out) const
{
    if (outcomes.empty()) {
        out << "Nothing to do.\n";
        return;
    }

    size_t width = 0;
    for (const auto& outcome : outcomes) {
        width = std::max(width, outcome.id.key().size());
    }

    out << "Summary:\n";
    for (const auto& outcome : outcomes) {
        out << "  " << std::left << std::setw(static_cast<int>(width)) << outcome.id.key() << "  ";
        std::string version = outcome.version.empty() ? "-" : outcome.version;
        out << std::setw(12) << version << " ";

        if (outcome.succeeded()) {
            out << componentActionName(outcome.action);
            if (outcome.action == ComponentAction::Upgraded && !outcome.previousVersion.empty()) {
                out << " (from " << outcome.previousVersion << ")";
            }
        } else {
            out << COLOR_ERROR << "FAILED" << COLOR_RESET
                << " [" << errorKindName(*outcome.error) << " during "
                << installPhaseName(outcome.failedDuring) << "] " << outcome.message;
        }
        out << "\n";
    }

    if (statePersistFailed) {
        out << COLOR_ERROR << "The install state could not be saved; re-run the command." << COLOR_RESET << "\n";
    }
}

//============================================================================
// Orchestrator
//============================================================================

Orchestrator::Orchestrator(const Catalog& catalog,
                           Fetcher& fetcher,
                           StateTracker& tracker,
                           EnvironmentTarget& environment,
                           HostPlatform host,
                           OrchestratorOptions options,
                           const CancellationToken* cancel)
    : catalog(catalog),
      fetcher(fetcher),
      tracker(tracker),
      environment(environment),
      host(std::move(host)),
      options(std::move(options)),
      cancel(cancel)
{
}

RunReport Orchestrator::install(const std::vector<Component>& components)
{
    statePersistFailed = false;
    Cache::sweepStaging(fetcher.stagingDirectory());

    RunReport report;
    report.outcomes = runOnWorkers(components.size(), options.workers,
                                   [&](size_t i) { return installOne(components[i]); });
    report.statePersistFailed = statePersistFailed;
    return report;
}

RunReport Orchestrator::update(const std::vector<Component>& components)
{
    std::vector<Component> requested = components;
    if (requested.empty()) {
        std::lock_guard<std::mutex> lock(commitMutex);
        for (const auto& [key, record] : tracker.state().records()) {
            requested.push_back(Component{record.id, "latest"});
        }
    }
    for (auto& component : requested) {
        if (component.version.empty()) {
            component.version = "latest";
        }
    }

    if (requested.empty()) {
        log_message("No components are installed; nothing to update.");
    }
    return install(requested);
}

RunReport Orchestrator::uninstall(const std::vector<ComponentId>& ids)
{
    statePersistFailed = false;

    RunReport report;
    report.outcomes = runOnWorkers(ids.size(), options.workers,
                                   [&](size_t i) { return uninstallOne(ids[i]); });
    report.statePersistFailed = statePersistFailed;
    return report;
}

RunReport Orchestrator::uninstallAll()
{
    std::vector<ComponentId> ids;
    {
        std::lock_guard<std::mutex> lock(commitMutex);
        for (const auto& [key, record] : tracker.state().records()) {
            ids.push_back(record.id);
        }
    }
    return uninstall(ids);
}

std::mutex& Orchestrator::identityLock(const ComponentId& id)
{
    std::lock_guard<std::mutex> lock(identityLocksMutex);
    auto& slot = identityLocks[id.key()];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

std::optional<InstallRecord> Orchestrator::findRecord(const ComponentId& id)
{
    std::lock_guard<std::mutex> lock(commitMutex);
    const InstallRecord* record = tracker.state().find(id);
    if (!record) {
        return std::nullopt;
    }
    return *record;
}

void Orchestrator::enterPhase(ComponentOutcome& outcome, InstallPhase phase)
{
    if (phase != InstallPhase::Failed) {
        outcome.failedDuring = phase;
    }
    outcome.phase = phase;
    log_debug(outcome.id.key() + ": " + installPhaseName(phase));
}

void Orchestrator::notifyObserver(const ComponentId& id, const std::vector<InstallPhase>& reached)
{
    if (!phaseObserver) {
        return;
    }
    for (InstallPhase phase : reached) {
        phaseObserver(id, phase);
    }
}

void Orchestrator::transition(ComponentOutcome& outcome, InstallPhase phase)
{
    enterPhase(outcome, phase);
    notifyObserver(outcome.id, {phase});
}

void Orchestrator::fail(ComponentOutcome& outcome, ErrorKind kind, const std::string& message)
{
    outcome.error = kind;
    outcome.message = message;
    outcome.action = ComponentAction::Failed;
    log_error(outcome.id.key() + ": " + message);
    transition(outcome, InstallPhase::Failed);
}

ComponentOutcome Orchestrator::installOne(const Component& component)
{
    ComponentOutcome outcome;
    outcome.id = component.id;
    outcome.requestedVersion = component.version;

    std::lock_guard<std::mutex> identityGuard(identityLock(component.id));
    PathReservation reservation(commitMutex, reservedPaths);

    try {
        transition(outcome, InstallPhase::Pending);
        if (cancel) {
            cancel->throwIfCancelled("resolving " + component.id.key());
        }

        ArtifactReference artifact = catalog.resolve(component, host, options.installRoot);
        outcome.version = artifact.version;
        transition(outcome, InstallPhase::Resolved);

        std::optional<InstallRecord> existing = findRecord(component.id);
        if (existing) {
            outcome.previousVersion = existing->version;
            std::error_code ec;
            if (existing->version == artifact.version && fs::exists(existing->installPath, ec)) {
                log_message(component.id.key() + " " + artifact.version + " is already installed.");
                outcome.action = ComponentAction::Unchanged;
                transition(outcome, InstallPhase::Configured);
                return outcome;
            }
        }

        {
            std::lock_guard<std::mutex> lock(commitMutex);
            for (const auto& [key, record] : tracker.state().records()) {
                if (record.id != component.id && record.installPath == artifact.installPath) {
                    throw InstallError(ErrorKind::ExtractionFailed,
                                       "Install path " + artifact.installPath.string()
                                       + " is already used by " + key);
                }
            }
            auto inFlight = reservedPaths.find(artifact.installPath);
            if (inFlight != reservedPaths.end() && inFlight->second != component.id.key()) {
                throw InstallError(ErrorKind::ExtractionFailed,
                                   "Install path " + artifact.installPath.string()
                                   + " is being written by " + inFlight->second);
            }
            reservation.hold(artifact.installPath, component.id.key());
        }

        bool upgrading = existing && existing->version != artifact.version;
        log_message((upgrading ? "Upgrading " : "Installing ") + component.id.key() + " "
                    + artifact.version + (upgrading ? " (from " + existing->version + ")" : ""));

        transition(outcome, InstallPhase::Downloading);
        StagedFile staged = fetcher.download(artifact, options.fetchTimeout, cancel);

        if (cancel) {
            cancel->throwIfCancelled("verifying " + component.id.key());
        }
        transition(outcome, InstallPhase::Verifying);
        Fetcher::verify(staged, artifact);

        if (cancel) {
            cancel->throwIfCancelled("extracting " + component.id.key());
        }
        transition(outcome, InstallPhase::Extracting);
        ExtractOptions extractOptions;
        extractOptions.stripComponents = artifact.stripComponents;
        extractOptions.deadline = std::chrono::steady_clock::now() + options.extractTimeout;
        extractOptions.cancel = cancel;

        // A recorded tree at the same path stays in place until the new one
        // has passed the health check and been committed.
        std::error_code ec;
        bool replacesInPlace = existing && existing->installPath == artifact.installPath
                               && fs::exists(artifact.installPath, ec);
        fs::path extracted = artifact.installPath;
        if (replacesInPlace) {
            extracted = generateTempFilename("." + artifact.installPath.filename().string() + ".partial",
                                             artifact.installPath.parent_path());
        }
        Extractor::extract(staged.path(), artifact.format, extracted, extractOptions);
        staged.discard();

        std::string problem = healthCheck(artifact, extracted);
        if (!problem.empty()) {
            fs::remove_all(extracted, ec);
            throw InstallError(ErrorKind::ExtractionFailed,
                               "Installed tree failed the health check: " + problem);
        }

        if (cancel && cancel->isCancelled()) {
            if (replacesInPlace) {
                fs::remove_all(extracted, ec);
            }
            cancel->throwIfCancelled("recording " + component.id.key());
        }

        // A failed commit keeps a newly extracted tree; the next run replaces it.
        std::optional<TreeReplacement> replacement;
        if (replacesInPlace) {
            replacement.emplace(extracted, artifact.installPath);
        }
        commitInstall(artifact, outcome);
        if (replacement) {
            replacement->keep();
        }
        outcome.action = upgrading ? ComponentAction::Upgraded : ComponentAction::Installed;

        if (upgrading && existing->installPath != artifact.installPath) {
            bool stillUsed;
            {
                std::lock_guard<std::mutex> lock(commitMutex);
                stillUsed = tracker.state().isPathUsed(existing->installPath, component.id);
            }
            if (!stillUsed) {
                std::error_code ec;
                fs::remove_all(existing->installPath, ec);
                if (ec) {
                    log_warning("Could not remove " + existing->installPath.string() + ": " + ec.message()
                                + ". Run 'toolpack clean' or remove it manually.");
                } else {
                    log_debug("Removed superseded " + existing->installPath.string());
                }
            }
        }

        log_message(component.id.key() + " " + artifact.version + " "
                    + componentActionName(outcome.action) + " in " + artifact.installPath.string());
    } catch (const InstallError& e) {
        fail(outcome, e.kind(), e.what());
    } catch (const std::exception& e) {
        fail(outcome, errorKindForPhase(outcome.failedDuring), e.what());
    }
    return outcome;
}

std::string Orchestrator::healthCheck(const ArtifactReference& artifact, const fs::path& root) const
{
    if (!directoryHasEntries(root)) {
        return artifact.installPath.string() + " is empty";
    }
    for (const auto& entry : artifact.pathEntries) {
        if (entry.empty() || entry == ".") {
            continue;
        }
        std::error_code ec;
        if (!fs::is_directory(root / entry, ec)) {
            return "missing '" + entry + "' in " + artifact.installPath.string();
        }
    }
    return "";
}

void Orchestrator::commitInstall(const ArtifactReference& artifact, ComponentOutcome& outcome)
{
    std::vector<InstallPhase> reached;
    try {
        std::lock_guard<std::mutex> lock(commitMutex);

        InstallState before = tracker.state();

        InstallRecord record;
        record.id = artifact.id;
        record.version = artifact.version;
        record.installPath = artifact.installPath;
        record.installedAt = currentTimestampUtc();
        record.pathEntries = artifact.pathEntries;
        record.variables = artifact.variables;
        tracker.record(artifact.id, record);
        enterPhase(outcome, InstallPhase::Recorded);
        reached.push_back(InstallPhase::Recorded);

        applyAndPersist(before);
        enterPhase(outcome, InstallPhase::Configured);
        reached.push_back(InstallPhase::Configured);
    } catch (const std::exception&) {
        notifyObserver(outcome.id, reached);
        throw;
    }
    notifyObserver(outcome.id, reached);
}

void Orchestrator::applyAndPersist(const InstallState& before)
{
    EnvironmentSet previous = computeEnvironment(before, host);
    EnvironmentSet desired = computeEnvironment(tracker.state(), host);

    try {
        environment.apply(desired, previous);
    } catch (const InstallError&) {
        tracker.reset(before);
        throw;
    }

    try {
        tracker.persist();
    } catch (const InstallError&) {
        statePersistFailed = true;
        tracker.reset(before);
        try {
            environment.apply(previous, desired);
        } catch (const InstallError& e) {
            log_error(std::string("Could not restore ") + environment.describe() + ": " + e.what());
        }
        throw;
    }
}

ComponentOutcome Orchestrator::uninstallOne(const ComponentId& id)
{
    ComponentOutcome outcome;
    outcome.id = id;

    std::lock_guard<std::mutex> identityGuard(identityLock(id));

    try {
        transition(outcome, InstallPhase::Pending);
        if (cancel) {
            cancel->throwIfCancelled("removing " + id.key());
        }

        fs::path installPath;
        bool installed = false;
        bool pathStillUsed = false;
        std::vector<InstallPhase> reached;
        try {
            std::lock_guard<std::mutex> lock(commitMutex);
            const InstallRecord* record = tracker.state().find(id);
            if (record) {
                installed = true;
                outcome.version = record->version;
                outcome.previousVersion = record->version;
                installPath = record->installPath;
                enterPhase(outcome, InstallPhase::Removing);
                reached.push_back(InstallPhase::Removing);

                InstallState before = tracker.state();
                tracker.remove(id);
                applyAndPersist(before);
                pathStillUsed = tracker.state().isPathUsed(installPath, id);
            }
        } catch (const std::exception&) {
            notifyObserver(id, reached);
            throw;
        }
        notifyObserver(id, reached);

        if (!installed) {
            log_message(id.key() + " is not installed.");
            outcome.action = ComponentAction::NotInstalled;
            transition(outcome, InstallPhase::Removed);
            return outcome;
        }

        if (pathStillUsed) {
            log_debug(installPath.string() + " is still used by another component; keeping it");
        } else {
            std::error_code ec;
            fs::remove_all(installPath, ec);
            if (ec) {
                throw InstallError(ErrorKind::RemovalFailed,
                                   "Deregistered, but could not delete " + installPath.string()
                                   + ": " + ec.message());
            }
        }

        outcome.action = ComponentAction::Removed;
        transition(outcome, InstallPhase::Removed);
        log_message("Removed " + id.key() + " " + outcome.version);
    } catch (const InstallError& e) {
        fail(outcome, e.kind(), e.what());
    } catch (const std::exception& e) {
        fail(outcome, errorKindForPhase(outcome.failedDuring), e.what());
    }
    return outcome;
}

} // namespace Toolpack
