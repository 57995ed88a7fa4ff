/*
 * http_adapter_curl.cpp
 *
 * libcurl easy-API implementation of IHttpAdapter.
 * - One easy handle per request; DNS cache, TLS sessions and connections are shared
 *   between handles through a CURLSH object guarded by per-lock-data mutexes.
 * - The header callback tracks the status line so that redirect hops reset the parsed
 *   headers and only the final response is reported.
 * - Cancellation is polled both per received chunk and from the transfer-info callback,
 *   so a stalled connection is abandoned too.
 */

#include <assetsync/downloader/http_adapter.h>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <mutex>
#include <string_view>

namespace assetsync::downloader {

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::Success;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_BAD_CONTENT_ENCODING:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorCode::PermissionDenied;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::InvalidArgument;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

// Parsed headers of the current response; reset on every status line
struct HeaderParseContext {
    ResponseMeta meta;
};

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<HeaderParseContext*>(userdata);
    std::string_view line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.remove_suffix(1);

    if (line.size() > 5 && line.substr(0, 5) == "HTTP/") {
        // New response (first one or after a redirect / 100-continue)
        ctx->meta = ResponseMeta{};
        auto sp = line.find(' ');
        if (sp != std::string_view::npos) {
            long status = 0;
            auto code = line.substr(sp + 1, 3);
            auto res = std::from_chars(code.data(), code.data() + code.size(), status);
            if (res.ec == std::errc())
                ctx->meta.status = status;
        }
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    auto key = to_lower(trim(line.substr(0, colon)));
    auto val = trim(line.substr(colon + 1));

    if (key == "accept-ranges") {
        if (to_lower(val) == "bytes")
            ctx->meta.acceptRangesBytes = true;
    } else if (key == "content-length") {
        std::uint64_t tmp{0};
        auto res = std::from_chars(val.data(), val.data() + val.size(), tmp);
        if (res.ec == std::errc())
            ctx->meta.contentLength = tmp;
    } else if (key == "etag") {
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
            val = val.substr(1, val.size() - 2);
        ctx->meta.etag = std::move(val);
    } else if (key == "last-modified") {
        ctx->meta.lastModified = std::move(val);
    } else if (key == "content-encoding") {
        auto enc = to_lower(val);
        if (!enc.empty() && enc != "identity")
            ctx->meta.contentEncoding = std::move(enc);
    } else if (key == "content-range") {
        ctx->meta.contentRange = std::move(val);
    }
    return total;
}

struct WriteContext {
    const HeaderParseContext* headers = nullptr;
    const ByteSink* sink = nullptr;
    const ShouldCancel* shouldCancel = nullptr;
    std::optional<std::uint64_t> rangeOffset;
    std::uint64_t delivered{0};
    bool cancelRequested{false};
    bool rangeRejected{false};
    std::optional<Error> sinkError;
};

// Start offset of "bytes <start>-<end>/<total>"
std::optional<std::uint64_t> contentRangeStart(std::string_view value) {
    auto pos = value.find_first_of("0123456789");
    if (pos == std::string_view::npos)
        return std::nullopt;
    std::uint64_t start = 0;
    auto res = std::from_chars(value.data() + pos, value.data() + value.size(), start);
    if (res.ec != std::errc())
        return std::nullopt;
    return start;
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr || total == 0)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (*ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelRequested = true;
        return 0; // CURLE_WRITE_ERROR
    }

    const auto& meta = ctx->headers->meta;
    if (meta.status < 200 || meta.status >= 300) {
        // Error page bodies are drained and dropped
        return total;
    }
    if (ctx->rangeOffset) {
        // A ranged request only accepts the exact range it asked for
        bool ok = meta.status == 206;
        if (ok && meta.contentRange) {
            auto start = contentRangeStart(*meta.contentRange);
            ok = start && *start == *ctx->rangeOffset;
        }
        if (!ok) {
            ctx->rangeRejected = true;
            return 0;
        }
    }

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    if (*ctx->sink) {
        auto r = (*ctx->sink)(bytes);
        if (!r) {
            ctx->sinkError = r.error();
            return 0;
        }
    }
    ctx->delivered += static_cast<std::uint64_t>(total);
    return total;
}

int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    if (ctx && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelRequested = true;
        return 1; // CURLE_ABORTED_BY_CALLBACK
    }
    return 0;
}

curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

void ensureGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            spdlog::error("curl_global_init failed: {}", curl_easy_strerror(rc));
        }
    });
}

// Shared DNS/TLS/connection caches for all easy handles of one adapter
class CurlShare {
public:
    CurlShare() : share_(curl_share_init()) {
        if (!share_)
            return;
        curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, &CurlShare::lock);
        curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, &CurlShare::unlock);
        curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
        curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
        curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    }

    ~CurlShare() {
        if (share_)
            curl_share_cleanup(share_);
    }

    CurlShare(const CurlShare&) = delete;
    CurlShare& operator=(const CurlShare&) = delete;

    CURLSH* get() const { return share_; }

private:
    static void lock(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
        auto* self = static_cast<CurlShare*>(userptr);
        self->mutexes_[static_cast<size_t>(data) % self->mutexes_.size()].lock();
    }

    static void unlock(CURL*, curl_lock_data data, void* userptr) {
        auto* self = static_cast<CurlShare*>(userptr);
        self->mutexes_[static_cast<size_t>(data) % self->mutexes_.size()].unlock();
    }

    CURLSH* share_;
    std::array<std::mutex, CURL_LOCK_DATA_LAST> mutexes_;
};

// RAII owner of an easy handle and its header list
struct EasyRequest {
    CURL* curl = nullptr;
    curl_slist* headers = nullptr;

    EasyRequest() : curl(curl_easy_init()) {}
    ~EasyRequest() {
        if (headers)
            curl_slist_free_all(headers);
        if (curl)
            curl_easy_cleanup(curl);
    }
    EasyRequest(const EasyRequest&) = delete;
    EasyRequest& operator=(const EasyRequest&) = delete;
};

class CurlHttpAdapter final : public IHttpAdapter {
public:
    explicit CurlHttpAdapter(std::size_t maxConnections) : maxConnections_(maxConnections) {
        ensureGlobalInit();
        share_ = std::make_unique<CurlShare>();
    }
    ~CurlHttpAdapter() override = default;

    Result<ResponseMeta> head(std::string_view url, const RequestOptions& options) override {
        EasyRequest req;
        if (!req.curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }
        req.headers = build_header_list(options.headers);

        HeaderParseContext hctx{};
        const std::string urlStr(url);
        curl_easy_setopt(req.curl, CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(req.curl, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(req.curl, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(req.curl, CURLOPT_HEADERDATA, &hctx);
        curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.headers);
        configure_common(req.curl, options);

        CURLcode rc = curl_easy_perform(req.curl);
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "HEAD " + urlStr);
        }
        long http_status = 0;
        curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &http_status);
        hctx.meta.status = http_status;
        if (hctx.meta.etag) {
            spdlog::debug("HEAD {} captured ETag: {}", urlStr, *hctx.meta.etag);
        }
        return hctx.meta;
    }

    Result<ResponseMeta> get(std::string_view url, const RequestOptions& options,
                             const std::optional<ByteRange>& range, const ByteSink& sink,
                             const ShouldCancel& shouldCancel) override {
        EasyRequest req;
        if (!req.curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }
        req.headers = build_header_list(options.headers);
        if (range) {
            std::string rangeHeader = "Range: bytes=" + std::to_string(range->offset) + "-";
            if (range->length && *range->length > 0)
                rangeHeader += std::to_string(range->offset + *range->length - 1);
            req.headers = curl_slist_append(req.headers, rangeHeader.c_str());
        }

        const std::string urlStr(url);
        curl_easy_setopt(req.curl, CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(req.curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.headers);

        HeaderParseContext hctx{};
        curl_easy_setopt(req.curl, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(req.curl, CURLOPT_HEADERDATA, &hctx);

        WriteContext wctx;
        wctx.headers = &hctx;
        wctx.sink = &sink;
        wctx.shouldCancel = &shouldCancel;
        if (range)
            wctx.rangeOffset = range->offset;
        curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &wctx);
        curl_easy_setopt(req.curl, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(req.curl, CURLOPT_XFERINFODATA, &wctx);
        curl_easy_setopt(req.curl, CURLOPT_NOPROGRESS, 0L);
        if (options.acceptCompressed) {
            // Empty string: every encoding libcurl can decode
            curl_easy_setopt(req.curl, CURLOPT_ACCEPT_ENCODING, "");
        }
        configure_common(req.curl, options);

        CURLcode rc = curl_easy_perform(req.curl);

        long http_status = 0;
        curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &http_status);

        if (wctx.cancelRequested) {
            return Error{ErrorCode::OperationCancelled, "transfer cancelled"};
        }
        if (wctx.sinkError) {
            return *wctx.sinkError;
        }
        if (wctx.rangeRejected) {
            // Server ignored or misapplied the range; report the response without a body
            spdlog::debug("GET {} answered {} to a ranged request, body discarded", urlStr,
                          http_status);
            hctx.meta.status = http_status;
            hctx.meta.bytesReceived = 0;
            return hctx.meta;
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "GET " + urlStr);
        }

        hctx.meta.status = http_status;
        hctx.meta.bytesReceived = wctx.delivered;
        return hctx.meta;
    }

private:
    void configure_common(CURL* curl, const RequestOptions& options) const {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout.count()));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(options.connectTimeout.count()));
        if (options.stallTimeout.count() > 0) {
            // Below 1 byte/s for stallTimeout seconds counts as a stalled transfer
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME,
                             static_cast<long>(options.stallTimeout.count()));
        }

        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, "assetsync/1.0");

        curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
        curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(options.bufferSize));
        curl_easy_setopt(curl, CURLOPT_MAXCONNECTS, static_cast<long>(maxConnections_));
        curl_easy_setopt(curl, CURLOPT_HTTP_VERSION,
                         options.useHttp2 ? CURL_HTTP_VERSION_2TLS : CURL_HTTP_VERSION_1_1);
        if (share_->get()) {
            curl_easy_setopt(curl, CURLOPT_SHARE, share_->get());
        }
    }

    std::size_t maxConnections_;
    std::unique_ptr<CurlShare> share_;
};

} // namespace

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter(std::size_t maxConnections) {
    return std::make_unique<CurlHttpAdapter>(maxConnections);
}

} // namespace assetsync::downloader
