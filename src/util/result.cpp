#include "util/result.hpp"

namespace hotupdate {

std::string_view ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                return "OK";
        case ErrorCode::UrlRequired:         return "URL_REQUIRED";
        case ErrorCode::UpdateDataRequired:  return "UPDATE_DATA_REQUIRED";
        case ErrorCode::DownloadInProgress:  return "DOWNLOAD_IN_PROGRESS";
        case ErrorCode::DownloadFailed:      return "DOWNLOAD_FAILED";
        case ErrorCode::HttpError:           return "HTTP_ERROR";
        case ErrorCode::TempDirError:        return "TEMP_DIR_ERROR";
        case ErrorCode::ExtractionFailed:    return "EXTRACTION_FAILED";
        case ErrorCode::WwwNotFound:         return "WWW_NOT_FOUND";
        case ErrorCode::NoUpdateReady:       return "NO_UPDATE_READY";
        case ErrorCode::UpdateFilesNotFound: return "UPDATE_FILES_NOT_FOUND";
        case ErrorCode::InstallFailed:       return "INSTALL_FAILED";
        case ErrorCode::VersionRequired:     return "VERSION_REQUIRED";
        case ErrorCode::CanaryPending:       return "CANARY_PENDING";
        case ErrorCode::VersionNotEligible:  return "VERSION_NOT_ELIGIBLE";
        case ErrorCode::DownloadCancelled:   return "DOWNLOAD_CANCELLED";
        case ErrorCode::RollbackFailed:      return "ROLLBACK_FAILED";
        case ErrorCode::StateIoError:        return "STATE_IO_ERROR";
        case ErrorCode::ConfigError:         return "CONFIG_ERROR";
    }
    return "UNKNOWN_ERROR";
}

} // namespace hotupdate
