#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Forward declarations
struct curl_slist;

namespace katafetch {

// HTTP status codes the transfer engine distinguishes
enum class HttpStatus {
    OK = 200,
    PartialContent = 206,
    NotFound = 404,
    RangeNotSatisfiable = 416,
    TooManyRequests = 429,
    InternalServerError = 500,
    BadGateway = 502,
    ServiceUnavailable = 503,
    GatewayTimeout = 504
};

bool is_success_status(int status);
bool is_throttle_status(int status);
bool is_transient_status(int status);

// HTTP headers (case-insensitive)
class HttpHeaders {
public:
    void add(const std::string& name, const std::string& value);
    void clear() { headers_.clear(); }

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;

    std::optional<uint64_t> content_length() const;

private:
    // Headers stored as lowercase name -> values
    std::map<std::string, std::vector<std::string>> headers_;

    static std::string normalize_name(const std::string& name);
};

/// Parsed "Content-Range" value: "bytes 100-199/1000" or "bytes */1000".
struct ContentRange {
    std::optional<uint64_t> first;
    std::optional<uint64_t> last;
    std::optional<uint64_t> total;  // Empty for "/*"
};

std::optional<ContentRange> parse_content_range(const std::string& value);

struct HttpRequest {
    std::string url;
    std::optional<uint64_t> range_start;  // Sends "Range: bytes=<start>-"
};

/// Receives the final response of a request.
class ResponseHandler {
public:
    virtual ~ResponseHandler() = default;

    /// Called once with the final status and headers, before any body bytes.
    /// Return true to receive the body through on_data(); false discards it.
    virtual bool on_response(int status_code, const HttpHeaders& headers) = 0;

    /// Return false to abort the transfer.
    virtual bool on_data(const char* data, size_t size) = 0;

    /// Polled while the request is in flight, also when no bytes arrive.
    /// Return false to cancel it.
    virtual bool keep_going() { return true; }
};

struct HttpResult {
    int status_code = 0;
    HttpHeaders headers;
    uint64_t body_bytes = 0;  // Bytes delivered to on_data()

    std::string error;
    bool is_network_error = false;  // Connection reset, timeout, DNS...
    bool aborted = false;           // Handler returned false from on_data() or keep_going()
};

/// One logical connection to the origin.
class HttpSession {
public:
    virtual ~HttpSession() = default;

    /// Perform a GET and stream the response to the handler.
    virtual HttpResult get(const HttpRequest& request, ResponseHandler& handler) = 0;
};

struct HttpSessionConfig {
    std::string user_agent = "katafetch/1.0";
    std::string referer;
    std::string accept = "application/octet-stream, application/x-bzip2, */*";
    std::string accept_language = "en-US,en;q=0.9";

    std::chrono::seconds connect_timeout{30};
    // Abort when less than 1 byte/s arrives for this long (no total timeout:
    // archives are large and the origin is slow)
    std::chrono::seconds stall_timeout{60};

    long max_redirects = 5;

    // TCP keep-alive so the persistent connection survives pacing gaps
    bool tcp_keepalive = true;
    std::chrono::seconds tcp_keepalive_idle{60};
    std::chrono::seconds tcp_keepalive_interval{15};

    bool verbose = false;
};

/// libcurl session reusing a single easy handle, so the connection and the
/// client identity persist across every request of a run.
class CurlSession : public HttpSession {
public:
    explicit CurlSession(const HttpSessionConfig& config = {});
    ~CurlSession() override;

    CurlSession(const CurlSession&) = delete;
    CurlSession& operator=(const CurlSession&) = delete;

    HttpResult get(const HttpRequest& request, ResponseHandler& handler) override;

    const HttpSessionConfig& config() const { return config_; }

private:
    HttpSessionConfig config_;
    void* curl_ = nullptr;  // CURL*
    curl_slist* headers_list_ = nullptr;
};

}  // namespace katafetch
