/*
 * http_transport_curl.cpp
 *
 * Notes
 * - libcurl easy API, one handle per request; no redirects, no connection reuse.
 * - The HTTP status is checked before the first body byte is passed on, so error bodies
 *   never reach the caller's sink; they are decoded into a typed Error instead.
 * - Stall detection uses CURLOPT_LOW_SPEED_LIMIT/TIME (1 byte/s for stallTimeout seconds).
 */

#include <gamefetch/client/http_transport.h>
#include <gamefetch/protocol/wire_json.h>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <optional>

namespace gamefetch::client {

namespace {

// Error bodies are small JSON documents; anything beyond this is dropped.
constexpr std::size_t kMaxErrorBody = 64 * 1024;

std::once_flag curlInitFlag;

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
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::InvalidArgument;
            break;
        default:
            err.code = ErrorCode::NetworkError;
            break;
    }
    return err;
}

struct HeaderContext {
    std::map<std::string, std::string> headers;
};

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<HeaderContext*>(userdata);
    std::string_view line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.remove_suffix(1);

    // A new status line starts a new header block (e.g. after 100 Continue).
    if (line.substr(0, 5) == "HTTP/") {
        ctx->headers.clear();
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;
    ctx->headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    return total;
}

struct WriteContext {
    CURL* curl{nullptr};
    const ByteSink* sink{nullptr}; // streaming mode
    std::string* buffer{nullptr};  // buffered mode
    long status{0};
    std::string errorBody;
    std::uint64_t received{0};
    std::optional<Error> sinkError;
};

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    auto* ctx = static_cast<WriteContext*>(userdata);
    if (total == 0)
        return 0;

    if (ctx->status == 0)
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &ctx->status);

    if (ctx->status < 200 || ctx->status >= 300) {
        if (ctx->errorBody.size() < kMaxErrorBody)
            ctx->errorBody.append(ptr, std::min(total, kMaxErrorBody - ctx->errorBody.size()));
        return total;
    }

    if (ctx->sink) {
        auto r = (*ctx->sink)(ByteSpan{reinterpret_cast<const std::byte*>(ptr), total});
        if (!r) {
            ctx->sinkError = r.error();
            return 0; // CURLE_WRITE_ERROR
        }
    } else if (ctx->buffer) {
        ctx->buffer->append(ptr, total);
    }
    ctx->received += total;
    return total;
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

void configure_common(CURL* curl, const RequestOptions& options) {
    if (options.totalTimeout.count() > 0)
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options.totalTimeout.count()));
    if (options.connectTimeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(options.connectTimeout.count()));
    }
    if (options.stallTimeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME,
                         static_cast<long>(options.stallTimeout.count()));
    }
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
}

class CurlHttpTransport final : public IHttpTransport {
public:
    CurlHttpTransport() {
        std::call_once(curlInitFlag, []() { curl_global_init(CURL_GLOBAL_ALL); });
    }
    ~CurlHttpTransport() override = default;

    Result<std::string> get(std::string_view url, const std::vector<Header>& headers,
                            const RequestOptions& options) override {
        std::string body;
        auto r = perform(url, headers, options, nullptr, &body);
        if (!r)
            return r.error();
        return body;
    }

    Result<StreamResponse> fetch(std::string_view url, const std::vector<Header>& headers,
                                 const RequestOptions& options, const ByteSink& sink) override {
        return perform(url, headers, options, &sink, nullptr);
    }

private:
    Result<StreamResponse> perform(std::string_view url, const std::vector<Header>& headers,
                                   const RequestOptions& options, const ByteSink* sink,
                                   std::string* buffer) {
        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(),
                                                                  &curl_easy_cleanup);
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }
        std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> list(
            build_header_list(headers), &curl_slist_free_all);

        const std::string urlStr(url);
        curl_easy_setopt(curl.get(), CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());

        WriteContext wctx;
        wctx.curl = curl.get();
        wctx.sink = sink;
        wctx.buffer = buffer;
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &wctx);

        HeaderContext hctx;
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &hctx);

        configure_common(curl.get(), options);

        spdlog::debug("GET {}", urlStr);
        CURLcode rc = curl_easy_perform(curl.get());

        long http_status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);

        if (wctx.sinkError) {
            return *wctx.sinkError;
        }
        if (http_status >= 300) {
            auto err = protocol::errorFromResponse(static_cast<int>(http_status), wctx.errorBody);
            spdlog::debug("GET {} -> HTTP {} ({})", urlStr, http_status, err.code);
            return err;
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "GET " + urlStr);
        }

        StreamResponse out;
        out.status = http_status;
        out.headers = std::move(hctx.headers);
        out.bytesReceived = wctx.received;
        return out;
    }
};

} // namespace

std::unique_ptr<IHttpTransport> makeCurlHttpTransport() {
    return std::make_unique<CurlHttpTransport>();
}

} // namespace gamefetch::client
