#include <assetsync/downloader/http_adapter.h>

namespace assetsync::downloader {

ErrorCode classifyHttpStatus(long status) {
    if (status >= 200 && status < 300)
        return ErrorCode::Success;
    if (status >= 500 || status == 408 || status == 429)
        return ErrorCode::ServerError;
    if (status == 404 || status == 410)
        return ErrorCode::NotFound;
    if (status == 401 || status == 403)
        return ErrorCode::PermissionDenied;
    if (status >= 400)
        return ErrorCode::ClientError;
    return ErrorCode::NetworkError;
}

} // namespace assetsync::downloader
