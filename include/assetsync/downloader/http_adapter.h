#pragma once

#include <assetsync/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace assetsync::downloader {

struct Header {
    std::string name;
    std::string value;
};

// Range: bytes=offset-(offset+length-1), or open-ended when length is absent
struct ByteRange {
    std::uint64_t offset = 0;
    std::optional<std::uint64_t> length;
};

struct RequestOptions {
    std::vector<Header> headers;
    std::chrono::milliseconds timeout{std::chrono::seconds(180)};
    std::chrono::milliseconds connectTimeout{std::chrono::seconds(30)};
    std::chrono::seconds stallTimeout{60}; // zero disables stall detection
    bool acceptCompressed = false; // transparently decoded by the adapter
    bool useHttp2 = true;
    std::size_t bufferSize = 32768;
};

struct ResponseMeta {
    long status = 0;
    std::optional<std::uint64_t> contentLength;
    bool acceptRangesBytes = false;
    std::optional<std::string> etag;
    std::optional<std::string> lastModified;
    std::optional<std::string> contentEncoding;
    std::optional<std::string> contentRange;
    std::uint64_t bytesReceived = 0; // body bytes delivered to the sink
};

using ByteSink = std::function<Result<void>(std::span<const std::byte>)>;

/**
 * @brief Minimal HTTP client seam used by the resume engine and the orchestrator.
 *
 * HTTP status codes are reported in ResponseMeta, not as errors; only transport
 * failures, cancellation and sink failures produce an Error. Body bytes reach the sink
 * only for 2xx responses; for a ranged request only for a 206 whose Content-Range starts
 * at the requested offset, otherwise the transfer is abandoned and the status returned.
 * Implementations must be safe to call from many threads.
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    virtual Result<ResponseMeta> head(std::string_view url, const RequestOptions& options) = 0;

    virtual Result<ResponseMeta> get(std::string_view url, const RequestOptions& options,
                                     const std::optional<ByteRange>& range, const ByteSink& sink,
                                     const ShouldCancel& shouldCancel) = 0;
};

// 5xx, 408 and 429 map to ServerError (retryable); other 4xx to NotFound, PermissionDenied
// or ClientError
ErrorCode classifyHttpStatus(long status);

// libcurl-backed adapter sharing DNS, TLS sessions and the connection cache across threads
std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter(std::size_t maxConnections = 150);

} // namespace assetsync::downloader
