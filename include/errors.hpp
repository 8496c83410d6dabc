#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <string>
#include <stdexcept>
#include <atomic>

namespace Toolpack {

/**
 * @brief Failure categories reported per component.
 */
enum class ErrorKind
{
    UnsupportedPlatform,
    UnknownComponent,
    VersionNotFound,
    DownloadFailed,
    IntegrityMismatch,
    UnsafeArchiveEntry,
    ExtractionFailed,
    EnvironmentWriteFailed,
    StatePersistFailed,
    StateLoadFailed,
    RemovalFailed,
    Timeout,
    Cancelled
};

/**
 * @return A stable name for the error kind (e.g. "DownloadFailed").
 */
const char* errorKindName(ErrorKind kind);

/**
 * @class InstallError
 * @brief Exception carrying an ErrorKind. Thrown by every installation stage
 *        and collected per component by the Orchestrator.
 */
class InstallError : public std::runtime_error
{
public:
    InstallError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return errorKind; }

private:
    ErrorKind errorKind;
};

/**
 * @class CancellationToken
 * @brief Shared flag set by the interrupt handler and polled at state
 *        transitions and between archive entries.
 */
class CancellationToken
{
public:
    void cancel() noexcept { cancelled.store(true); }
    bool isCancelled() const noexcept { return cancelled.load(); }

    /**
     * @brief Throws InstallError(Cancelled) if cancellation was requested.
     * @param stage Human readable name of the boundary being crossed.
     */
    void throwIfCancelled(const std::string& stage) const;

private:
    std::atomic<bool> cancelled{false};
};

} // namespace Toolpack

#endif // ERRORS_HPP
