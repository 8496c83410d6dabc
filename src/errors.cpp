#include "errors.hpp"

namespace Toolpack {

const char* errorKindName(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::UnsupportedPlatform:    return "UnsupportedPlatform";
        case ErrorKind::UnknownComponent:       return "UnknownComponent";
        case ErrorKind::VersionNotFound:        return "VersionNotFound";
        case ErrorKind::DownloadFailed:         return "DownloadFailed";
        case ErrorKind::IntegrityMismatch:      return "IntegrityMismatch";
        case ErrorKind::UnsafeArchiveEntry:     return "UnsafeArchiveEntry";
        case ErrorKind::ExtractionFailed:       return "ExtractionFailed";
        case ErrorKind::EnvironmentWriteFailed: return "EnvironmentWriteFailed";
        case ErrorKind::StatePersistFailed:     return "StatePersistFailed";
        case ErrorKind::StateLoadFailed:        return "StateLoadFailed";
        case ErrorKind::RemovalFailed:          return "RemovalFailed";
        case ErrorKind::Timeout:                return "Timeout";
        case ErrorKind::Cancelled:              return "Cancelled";
    }
    return "Unknown";
}

InstallError::InstallError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), errorKind(kind)
{
}

void CancellationToken::throwIfCancelled(const std::string& stage) const
{
    if (isCancelled()) {
        throw InstallError(ErrorKind::Cancelled, "Cancelled before " + stage);
    }
}

} // namespace Toolpack
