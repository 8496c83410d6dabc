//============================================================================
// Includes
//============================================================================

#include "fetch.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <memory>
#include <random>
#include <thread>
#include <vector>
#include <curl/curl.h>
#include <openssl/evp.h>

namespace fs = std::filesystem;

using namespace std::chrono;

namespace Toolpack {

    namespace {

        // Same block size as the archive reader.
        const size_t hashBufferSize = 65536;

        /**
         * -------------------------------------------------------------------
         * WriteCallback
         *
         * cURL write callback writing received data straight to the staged
         * file stream.
         * -------------------------------------------------------------------
         */
        size_t WriteCallback(void* ptr, size_t size, size_t nmemb, void* userdata) {
            std::ofstream* outFile = static_cast<std::ofstream*>(userdata);
            size_t totalSize = size * nmemb;

            if (!outFile || !outFile->is_open()) {
                return 0; // Signal error to cURL
            }
            outFile->write(static_cast<char*>(ptr), static_cast<std::streamsize>(totalSize));
            if (!outFile->good()) {
                return 0;
            }
            return totalSize;
        }

        /**
         * -------------------------------------------------------------------
         * XferInfoCallback
         *
         * Aborts the transfer when cancellation has been requested.
         * -------------------------------------------------------------------
         */
        int XferInfoCallback(void* clientp,
                             curl_off_t /*totalToDownload*/,
                             curl_off_t /*nowDownloaded*/,
                             curl_off_t /*totalToUpload*/,
                             curl_off_t /*nowUploaded*/) {
            const auto* cancel = static_cast<const CancellationToken*>(clientp);
            return (cancel && cancel->isCancelled()) ? 1 : 0;
        }

        bool isTransientCurlError(CURLcode code) {
            switch (code) {
                case CURLE_OPERATION_TIMEDOUT:
                case CURLE_COULDNT_CONNECT:
                case CURLE_COULDNT_RESOLVE_HOST:
                case CURLE_COULDNT_RESOLVE_PROXY:
                case CURLE_RECV_ERROR:
                case CURLE_SEND_ERROR:
                case CURLE_GOT_NOTHING:
                case CURLE_PARTIAL_FILE:
                case CURLE_SSL_CONNECT_ERROR:
                case CURLE_HTTP2:
                case CURLE_HTTP2_STREAM:
                    return true;
                default:
                    return false;
            }
        }

        bool isTransientHttpStatus(long status) {
            return status >= 500 || status == 408 || status == 429;
        }

        std::string toLower(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        double randomUnit() {
            static thread_local std::mt19937 mt(std::random_device{}());
            std::uniform_real_distribution<double> dist(0.0, 1.0);
            return dist(mt);
        }

    } // end anonymous namespace

    //========================================================================
    // RetryPolicy
    //========================================================================

    milliseconds RetryPolicy::delayBefore(int retry, double unit) const {
        double delay = static_cast<double>(baseDelay.count());
        for (int i = 1; i < retry; ++i) {
            delay *= 2.0;
            if (delay >= static_cast<double>(maxDelay.count())) {
                break;
            }
        }
        delay = std::min(delay, static_cast<double>(maxDelay.count()));

        double spread = std::clamp(jitter, 0.0, 1.0);
        double factor = 1.0 + spread * (2.0 * std::clamp(unit, 0.0, 1.0) - 1.0);
        return milliseconds(std::llround(delay * factor));
    }

    //========================================================================
    // CurlTransport
    //========================================================================

    TransferResult CurlTransport::download(const std::string& url,
                                           const fs::path& output,
                                           milliseconds timeout,
                                           const CancellationToken* cancel) {
        TransferResult result;

        CURL* curl = curl_easy_init();
        if (!curl) {
            result.cause = "Failed to initialize curl";
            return result;
        }

        std::ofstream outFile(output, std::ios::binary | std::ios::trunc);
        if (!outFile) {
            curl_easy_cleanup(curl);
            result.cause = "Failed to open file for writing: " + output.string();
            return result;
        }

        // Configure cURL
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &outFile);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, XferInfoCallback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<CancellationToken*>(cancel));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 15L);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(std::max<long long>(1, timeout.count())));
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, 30L);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, "toolpack/0.1");

        CURLcode res = curl_easy_perform(curl);
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.httpStatus);
        curl_easy_cleanup(curl);
        outFile.close();

        if (res == CURLE_OK && result.httpStatus < 400) {
            result.ok = true;
            return result;
        }

        if (res == CURLE_ABORTED_BY_CALLBACK) {
            result.cancelled = true;
            result.cause = "transfer cancelled";
        } else if (res == CURLE_HTTP_RETURNED_ERROR || (res == CURLE_OK && result.httpStatus >= 400)) {
            result.transient = isTransientHttpStatus(result.httpStatus);
            result.cause = "server responded with HTTP " + std::to_string(result.httpStatus);
        } else {
            result.transient = isTransientCurlError(res);
            result.cause = curl_easy_strerror(res);
        }
        return result;
    }

    //========================================================================
    // StagedFile
    //========================================================================

    StagedFile::StagedFile(fs::path path) : filePath(std::move(path)) {}

    StagedFile::~StagedFile() {
        discard();
    }

    StagedFile::StagedFile(StagedFile&& other) noexcept : filePath(std::move(other.filePath)) {
        other.filePath.clear();
    }

    StagedFile& StagedFile::operator=(StagedFile&& other) noexcept {
        if (this != &other) {
            discard();
            filePath = std::move(other.filePath);
            other.filePath.clear();
        }
        return *this;
    }

    void StagedFile::discard() noexcept {
        if (filePath.empty()) {
            return;
        }
        std::error_code ec;
        fs::remove(filePath, ec);
        if (ec) {
            log_warning("Could not remove staged file " + filePath.string() + ": " + ec.message());
        }
        filePath.clear();
    }

    //========================================================================
    // Fetcher
    //========================================================================

    Fetcher::Fetcher(Transport& transport, RetryPolicy policy,
                     fs::path stagingDir, Sleeper sleeper)
        : transport(transport),
          policy(policy),
          stagingDir(std::move(stagingDir)),
          sleeper(std::move(sleeper)) {
        if (!this->sleeper) {
            this->sleeper = [](milliseconds d) { std::this_thread::sleep_for(d); };
        }
        if (this->policy.maxAttempts < 1) {
            this->policy.maxAttempts = 1;
        }
    }

    StagedFile Fetcher::fetch(const ArtifactReference& artifact,
                              milliseconds timeout,
                              const CancellationToken* cancel) {
        StagedFile staged = download(artifact, timeout, cancel);
        verify(staged, artifact);
        return staged;
    }

    StagedFile Fetcher::download(const ArtifactReference& artifact,
                                 milliseconds timeout,
                                 const CancellationToken* cancel) {
        std::error_code ec;
        fs::create_directories(stagingDir, ec);
        if (ec) {
            throw InstallError(ErrorKind::DownloadFailed,
                               "Cannot create staging directory " + stagingDir.string()
                               + ": " + ec.message());
        }

        const auto deadline = steady_clock::now() + timeout;
        const std::string stem = componentKindName(artifact.id.kind) + "-" + artifact.version;
        milliseconds waited{0};
        std::string lastCause = "no attempt made";

        for (int attempt = 1; attempt <= policy.maxAttempts; ++attempt) {
            if (cancel) {
                cancel->throwIfCancelled("download of " + artifact.url);
            }

            auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
            if (remaining <= milliseconds::zero()) {
                throw InstallError(ErrorKind::Timeout, "Timed out downloading " + artifact.url);
            }

            fs::path target = stagingDir / (generateTempFilename(stem, "").filename().string() + ".download");
            StagedFile staged(target);

            log_debug("Downloading " + artifact.url + " (attempt " + std::to_string(attempt)
                      + "/" + std::to_string(policy.maxAttempts) + ")");
            TransferResult result = transport.download(artifact.url, staged.path(), remaining, cancel);
            if (result.ok) {
                return staged;
            }

            staged.discard();
            lastCause = result.cause;

            if (result.cancelled) {
                throw InstallError(ErrorKind::Cancelled, "Download of " + artifact.url + " cancelled");
            }
            if (steady_clock::now() >= deadline) {
                throw InstallError(ErrorKind::Timeout,
                                   "Timed out downloading " + artifact.url + ": " + result.cause);
            }
            if (!result.transient) {
                throw InstallError(ErrorKind::DownloadFailed,
                                   "Failed to download " + artifact.url + ": " + result.cause);
            }
            if (attempt == policy.maxAttempts) {
                break;
            }

            milliseconds delay = policy.delayBefore(attempt, randomUnit());
            if (waited + delay > policy.maxTotalWait) {
                log_debug("Retry budget exhausted for " + artifact.url);
                break;
            }
            log_warning("Download of " + artifact.url + " failed (" + result.cause
                        + "), retrying in " + std::to_string(delay.count()) + " ms");
            sleeper(delay);
            waited += delay;
        }

        throw InstallError(ErrorKind::DownloadFailed,
                           "Failed to download " + artifact.url + ": " + lastCause);
    }

    void Fetcher::verify(StagedFile& staged, const ArtifactReference& artifact) {
        if (artifact.size) {
            std::error_code ec;
            std::uintmax_t actual = fs::file_size(staged.path(), ec);
            if (ec || actual != *artifact.size) {
                staged.discard();
                throw InstallError(ErrorKind::IntegrityMismatch,
                                   "Size mismatch for " + artifact.url + ": expected "
                                   + std::to_string(*artifact.size) + " bytes, got "
                                   + (ec ? ec.message() : std::to_string(actual)));
            }
        }

        if (artifact.sha256) {
            std::string actual;
            try {
                actual = sha256File(staged.path());
            } catch (const std::exception& e) {
                staged.discard();
                throw InstallError(ErrorKind::IntegrityMismatch, e.what());
            }
            if (actual != toLower(trim(*artifact.sha256))) {
                staged.discard();
                throw InstallError(ErrorKind::IntegrityMismatch,
                                   "Checksum mismatch for " + artifact.url + ": expected "
                                   + *artifact.sha256 + ", got " + actual);
            }
        }
    }

    std::string Fetcher::sha256File(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw std::runtime_error("Cannot open " + path.string() + " for hashing");
        }

        std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
        if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("Cannot initialise SHA-256 digest");
        }

        std::vector<char> buffer(hashBufferSize);
        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            std::streamsize got = in.gcount();
            if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got)) != 1) {
                throw std::runtime_error("SHA-256 update failed for " + path.string());
            }
        }
        if (in.bad()) {
            throw std::runtime_error("Read error while hashing " + path.string());
        }

        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int length = 0;
        if (EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
            throw std::runtime_error("SHA-256 finalisation failed for " + path.string());
        }

        static const char hex[] = "0123456789abcdef";
        std::string result;
        result.reserve(length * 2);
        for (unsigned int i = 0; i < length; ++i) {
            result += hex[digest[i] >> 4];
            result += hex[digest[i] & 0x0f];
        }
        return result;
    }

} // namespace Toolpack
