#include "katafetch/http_session.hpp"
#include "katafetch/log.hpp"

#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>

namespace katafetch {

// ============================================================================
// Utility functions
// ============================================================================

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

bool is_throttle_status(int status) {
    // The origin answers 429 when rate limited and 503 while shedding load
    return status == static_cast<int>(HttpStatus::TooManyRequests) ||
           status == static_cast<int>(HttpStatus::ServiceUnavailable);
}

bool is_transient_status(int status) {
    return status == 408 ||
           status == static_cast<int>(HttpStatus::InternalServerError) ||
           status == static_cast<int>(HttpStatus::BadGateway) ||
           status == static_cast<int>(HttpStatus::GatewayTimeout);
}

namespace {

std::optional<uint64_t> parse_u64(const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

}  // namespace

std::optional<ContentRange> parse_content_range(const std::string& value) {
    // bytes <first>-<last>/<total|*>   or   bytes */<total>
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return std::nullopt;
    std::string v = value.substr(start);
    if (v.compare(0, 6, "bytes ") != 0) return std::nullopt;
    v = v.substr(6);

    size_t slash = v.find('/');
    if (slash == std::string::npos) return std::nullopt;
    std::string range = v.substr(0, slash);
    std::string total = v.substr(slash + 1);
    while (!total.empty() && std::isspace(static_cast<unsigned char>(total.back()))) total.pop_back();

    ContentRange result;
    if (total != "*") {
        result.total = parse_u64(total);
        if (!result.total) return std::nullopt;
    }

    if (range != "*") {
        size_t dash = range.find('-');
        if (dash == std::string::npos) return std::nullopt;
        result.first = parse_u64(range.substr(0, dash));
        result.last = parse_u64(range.substr(dash + 1));
        if (!result.first || !result.last || *result.last < *result.first) return std::nullopt;
    } else if (!result.total) {
        return std::nullopt;  // "bytes */*" carries no information
    }
    return result;
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)].push_back(value);
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it != headers_.end() && !it->second.empty()) {
        return it->second[0];
    }
    return std::nullopt;
}

bool HttpHeaders::has(const std::string& name) const {
    return headers_.find(normalize_name(name)) != headers_.end();
}

std::optional<uint64_t> HttpHeaders::content_length() const {
    auto val = get("Content-Length");
    if (!val) return std::nullopt;
    return parse_u64(*val);
}

// ============================================================================
// CURL callback functions
// ============================================================================

namespace {

struct StreamContext {
    CURL* curl = nullptr;
    ResponseHandler* handler = nullptr;
    HttpHeaders* headers = nullptr;
    bool started = false;
    bool accept_body = false;
    bool aborted = false;
    uint64_t body_bytes = 0;
};

// Deliver status + headers to the handler exactly once
void begin_response(StreamContext* ctx) {
    if (ctx->started) return;
    ctx->started = true;
    long code = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &code);
    ctx->accept_body = ctx->handler->on_response(static_cast<int>(code), *ctx->headers);
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<StreamContext*>(userdata);
    size_t bytes = size * nmemb;

    begin_response(ctx);
    if (!ctx->accept_body) return bytes;  // Error body: drain and drop

    if (!ctx->handler->on_data(ptr, bytes)) {
        ctx->aborted = true;
        return 0;  // Signals CURLE_WRITE_ERROR
    }
    ctx->body_bytes += bytes;
    return bytes;
}

int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<StreamContext*>(clientp);
    if (ctx->handler->keep_going()) return 0;
    ctx->aborted = true;
    return 1;  // Signals CURLE_ABORTED_BY_CALLBACK
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);

    // Remove trailing CRLF
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    if (line.empty()) return bytes;

    // A new status line starts a new header block (redirects, 100-continue)
    if (line.starts_with("HTTP/")) {
        headers->clear();
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);

        size_t start = value.find_first_not_of(" \t");
        value = (start != std::string::npos) ? value.substr(start) : std::string();

        headers->add(name, value);
    }

    return bytes;
}

}  // namespace

// ============================================================================
// CurlSession
// ============================================================================

CurlSession::CurlSession(const HttpSessionConfig& config) : config_(config) {
    // Initialize CURL globally (thread-safe)
    static std::once_flag curl_init_flag;
    std::call_once(curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_ALL);
    });

    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("curl_easy_init failed");
    }
    curl_ = curl;

    // Identity headers sent with every request
    if (!config_.referer.empty()) {
        headers_list_ = curl_slist_append(headers_list_, ("Referer: " + config_.referer).c_str());
    }
    if (!config_.accept.empty()) {
        headers_list_ = curl_slist_append(headers_list_, ("Accept: " + config_.accept).c_str());
    }
    if (!config_.accept_language.empty()) {
        headers_list_ = curl_slist_append(headers_list_,
                                          ("Accept-Language: " + config_.accept_language).c_str());
    }
    headers_list_ = curl_slist_append(headers_list_, "Connection: keep-alive");

    if (!config_.user_agent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_list_);
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

    // Timeouts
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT,
                     static_cast<long>(config_.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME,
                     static_cast<long>(config_.stall_timeout.count()));

    if (config_.tcp_keepalive) {
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE,
                         static_cast<long>(config_.tcp_keepalive_idle.count()));
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL,
                         static_cast<long>(config_.tcp_keepalive_interval.count()));
    }

    // Follow simple redirects only
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, config_.max_redirects);

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (config_.verbose) {
        curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
    }
}

CurlSession::~CurlSession() {
    if (curl_) curl_easy_cleanup(static_cast<CURL*>(curl_));
    if (headers_list_) curl_slist_free_all(headers_list_);
}

HttpResult CurlSession::get(const HttpRequest& request, ResponseHandler& handler) {
    HttpResult result;
    CURL* curl = static_cast<CURL*>(curl_);

    StreamContext ctx;
    ctx.curl = curl;
    ctx.handler = &handler;
    ctx.headers = &result.headers;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &result.headers);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);

    // Byte range (resume)
    std::string range;
    if (request.range_start && *request.range_start > 0) {
        range = std::to_string(*request.range_start) + "-";
        curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
    } else {
        curl_easy_setopt(curl, CURLOPT_RANGE, nullptr);
    }

    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);

    CURLcode res = curl_easy_perform(curl);

    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    result.status_code = static_cast<int>(code);

    if (res == CURLE_OK) {
        // Empty bodies never reach write_callback
        begin_response(&ctx);
    } else if (res == CURLE_WRITE_ERROR && ctx.aborted) {
        result.error = "transfer aborted by receiver";
        result.aborted = true;
    } else if (res == CURLE_ABORTED_BY_CALLBACK && ctx.aborted) {
        result.error = "transfer cancelled";
        result.aborted = true;
    } else {
        result.error = errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(res));
        result.is_network_error = true;
    }
    result.body_bytes = ctx.body_bytes;

    // Stack buffers must not outlive this call
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, nullptr);
    curl_easy_setopt(curl, CURLOPT_RANGE, nullptr);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, nullptr);

    log_debug("GET %s%s -> %d (%llu bytes)%s%s", request.url.c_str(),
              range.empty() ? "" : (" range=" + range).c_str(), result.status_code,
              static_cast<unsigned long long>(result.body_bytes),
              result.error.empty() ? "" : ": ", result.error.c_str());
    return result;
}

}  // namespace katafetch
