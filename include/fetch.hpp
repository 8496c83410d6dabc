#ifndef FETCH_HPP
#define FETCH_HPP

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>

#include "component.hpp"
#include "errors.hpp"

namespace Toolpack {

/**
 * @struct RetryPolicy
 * @brief Exponential backoff parameters for transient download failures.
 */
struct RetryPolicy
{
    int maxAttempts = 3;
    std::chrono::milliseconds baseDelay{500};
    std::chrono::milliseconds maxDelay{8000};

    /** Upper bound on the sum of all backoff sleeps of one fetch. */
    std::chrono::milliseconds maxTotalWait{30000};

    /** Fraction of the delay randomised in either direction (0 disables jitter). */
    double jitter = 0.2;

    /**
     * @brief Delay before retry number `retry` (1 = first retry).
     * @param randomUnit A value in [0, 1] used to apply jitter.
     */
    std::chrono::milliseconds delayBefore(int retry, double randomUnit) const;
};

/**
 * @struct TransferResult
 * @brief Outcome of a single download attempt.
 */
struct TransferResult
{
    bool ok = false;
    bool transient = false;
    bool cancelled = false;
    long httpStatus = 0;
    std::string cause;
};

/**
 * @class Transport
 * @brief Performs one GET of a URL into a local file. Retrying is the
 *        Fetcher's business, not the transport's.
 */
class Transport
{
public:
    virtual ~Transport() = default;

    virtual TransferResult download(const std::string& url,
                                    const std::filesystem::path& output,
                                    std::chrono::milliseconds timeout,
                                    const CancellationToken* cancel) = 0;
};

/**
 * @class CurlTransport
 * @brief libcurl implementation of Transport. curl_global_init() must have
 *        been called by the program before use.
 */
class CurlTransport : public Transport
{
public:
    TransferResult download(const std::string& url,
                            const std::filesystem::path& output,
                            std::chrono::milliseconds timeout,
                            const CancellationToken* cancel) override;
};

/**
 * @class StagedFile
 * @brief Owns a downloaded, not yet extracted artifact and deletes it when
 *        it goes out of scope.
 */
class StagedFile
{
public:
    StagedFile() = default;
    explicit StagedFile(std::filesystem::path path);
    ~StagedFile();

    StagedFile(const StagedFile&) = delete;
    StagedFile& operator=(const StagedFile&) = delete;
    StagedFile(StagedFile&& other) noexcept;
    StagedFile& operator=(StagedFile&& other) noexcept;

    const std::filesystem::path& path() const { return filePath; }
    bool valid() const { return !filePath.empty(); }

    /**
     * @brief Deletes the file now. Safe to call more than once.
     */
    void discard() noexcept;

private:
    std::filesystem::path filePath;
};

/**
 * @class Fetcher
 * @brief Downloads artifacts into the staging directory with retry and
 *        integrity verification.
 */
class Fetcher
{
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    /**
     * @param transport  Network backend.
     * @param policy     Retry policy for transient failures.
     * @param stagingDir Directory receiving the temporary files.
     * @param sleeper    Used for backoff waits; defaults to std::this_thread::sleep_for.
     */
    Fetcher(Transport& transport, RetryPolicy policy,
            std::filesystem::path stagingDir, Sleeper sleeper = Sleeper());

    /**
     * @brief Downloads and verifies an artifact.
     *
     * @throws InstallError DownloadFailed, IntegrityMismatch, Timeout or Cancelled.
     *         No staged file remains when an exception is thrown.
     */
    StagedFile fetch(const ArtifactReference& artifact,
                     std::chrono::milliseconds timeout,
                     const CancellationToken* cancel = nullptr);

    /**
     * @brief The download half of fetch(), retrying transient failures.
     */
    StagedFile download(const ArtifactReference& artifact,
                        std::chrono::milliseconds timeout,
                        const CancellationToken* cancel = nullptr);

    /**
     * @brief Checks the expected size and SHA-256 of a staged file, if the
     *        artifact declares them. Discards the file on mismatch.
     * @throws InstallError(IntegrityMismatch)
     */
    static void verify(StagedFile& staged, const ArtifactReference& artifact);

    /**
     * @return Lowercase hex SHA-256 digest of a file, read in blocks.
     * @throws std::runtime_error if the file cannot be read.
     */
    static std::string sha256File(const std::filesystem::path& path);

    const std::filesystem::path& stagingDirectory() const { return stagingDir; }

private:
    Transport& transport;
    RetryPolicy policy;
    std::filesystem::path stagingDir;
    Sleeper sleeper;
};

} // namespace Toolpack

#endif // FETCH_HPP
