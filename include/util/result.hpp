#pragma once
#include <string>
#include <string_view>
#include <utility>

namespace hotupdate {

enum class ErrorCode : int {
    None = 0,
    UrlRequired,
    UpdateDataRequired,
    DownloadInProgress,
    DownloadFailed,
    HttpError,
    TempDirError,
    ExtractionFailed,
    WwwNotFound,
    NoUpdateReady,
    UpdateFilesNotFound,
    InstallFailed,
    VersionRequired,
    CanaryPending,
    VersionNotEligible,
    DownloadCancelled,
    RollbackFailed,
    StateIoError,
    ConfigError,
};

// Wire name surfaced to the host bridge, e.g. "NO_UPDATE_READY".
std::string_view ErrorCodeName(ErrorCode code);

struct Result {
    bool ok{true};
    ErrorCode code{ErrorCode::None};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorCode c, std::string m) {
        return {.ok = false, .code = c, .msg = std::move(m)};
    }
};

} // namespace hotupdate
