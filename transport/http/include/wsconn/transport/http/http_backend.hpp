#pragma once

/**
 * @file http_backend.hpp
 * @brief Abstract HTTP backend interface
 *
 * Defines the wire-level request, the transport options shared by every
 * request of one backend (timeouts, TLS policy, proxy), the streaming
 * response interface and the backend interface itself.
 */

#include <wsconn/common/error.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wsconn::transport::http {

using common::Error;
using common::ErrorCode;
using common::Result;

//=============================================================================
// HTTP Methods and Status
//=============================================================================

/**
 * @brief HTTP methods
 */
enum class Method : uint8_t { GET, POST };

/**
 * @brief Get HTTP method string
 */
constexpr std::string_view method_to_string(Method method) noexcept {
    switch (method) {
        case Method::GET:
            return "GET";
        case Method::POST:
            return "POST";
        default:
            return "GET";
    }
}

/**
 * @brief HTTP status code categories
 */
enum class StatusCategory : uint8_t {
    INFORMATIONAL,  // 1xx
    SUCCESS,        // 2xx
    REDIRECTION,    // 3xx
    CLIENT_ERROR,   // 4xx
    SERVER_ERROR    // 5xx
};

/**
 * @brief Get status category from code
 */
constexpr StatusCategory status_category(int code) noexcept {
    if (code >= 100 && code < 200)
        return StatusCategory::INFORMATIONAL;
    if (code >= 200 && code < 300)
        return StatusCategory::SUCCESS;
    if (code >= 300 && code < 400)
        return StatusCategory::REDIRECTION;
    if (code >= 400 && code < 500)
        return StatusCategory::CLIENT_ERROR;
    return StatusCategory::SERVER_ERROR;
}

//=============================================================================
// Headers
//=============================================================================

/**
 * @brief Ordered header list, names may repeat
 */
using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief ASCII case-insensitive comparison of header names
 */
bool header_name_equals(std::string_view a, std::string_view b) noexcept;

/**
 * @brief Received response headers
 *
 * Keeps arrival order and repeated names. Lookups ignore ASCII case.
 */
class ResponseHeaders {
public:
    void add(std::string name, std::string value) {
        entries_.emplace_back(std::move(name), std::move(value));
    }

    /**
     * @brief Append a continuation line to the last header value
     */
    void append_to_last(std::string_view continuation);

    /**
     * @brief First value for a name
     * @return std::nullopt when the header is absent
     */
    std::optional<std::string_view> find(std::string_view name) const noexcept;

    /**
     * @brief All values for a name, in arrival order
     */
    std::vector<std::string_view> find_all(std::string_view name) const;

    bool contains(std::string_view name) const noexcept { return find(name).has_value(); }

    const HeaderList& entries() const noexcept { return entries_; }
    size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }
    void clear() noexcept { entries_.clear(); }

private:
    HeaderList entries_;
};

//=============================================================================
// Transport Options
//=============================================================================

/**
 * @brief TLS protocol versions
 */
enum class TlsVersion : uint8_t { TLS_1_0, TLS_1_1, TLS_1_2, TLS_1_3 };

constexpr std::string_view tls_version_name(TlsVersion version) noexcept {
    switch (version) {
        case TlsVersion::TLS_1_0:
            return "1.0";
        case TlsVersion::TLS_1_1:
            return "1.1";
        case TlsVersion::TLS_1_2:
            return "1.2";
        case TlsVersion::TLS_1_3:
            return "1.3";
        default:
            return "unknown";
    }
}

/**
 * @brief Parse "1.0", "1.1", "1.2" or "1.3" (an optional "TLSv" prefix is accepted)
 */
std::optional<TlsVersion> parse_tls_version(std::string_view text) noexcept;

/**
 * @brief Default cipher list: strong suites only, no anonymous or export ciphers
 */
inline constexpr std::string_view DEFAULT_CIPHER_LIST =
    "HIGH:!aNULL:!eNULL:!MD5:!RC4:!3DES:!DES:!EXPORT:!PSK:!SRP";

/**
 * @brief TLS negotiation policy
 *
 * SSLv2 and SSLv3 can never be enabled. Plain http URLs bypass TLS.
 */
struct TlsPolicy {
    TlsVersion min_version  = TlsVersion::TLS_1_0;
    TlsVersion max_version  = TlsVersion::TLS_1_2;
    std::string cipher_list = std::string(DEFAULT_CIPHER_LIST);
    bool verify_peer        = true;
    std::string ca_file;  // empty = system CA bundle
};

/**
 * @brief Proxy kinds
 */
enum class ProxyType : uint8_t {
    DIRECT,  ///< Never use a proxy, ignore environment settings
    HTTP,
    SOCKS4,
    SOCKS5
};

constexpr std::string_view proxy_type_name(ProxyType type) noexcept {
    switch (type) {
        case ProxyType::DIRECT:
            return "direct";
        case ProxyType::HTTP:
            return "http";
        case ProxyType::SOCKS4:
            return "socks4";
        case ProxyType::SOCKS5:
            return "socks5";
        default:
            return "unknown";
    }
}

/**
 * @brief Explicit proxy endpoint
 */
struct ProxySpec {
    ProxyType type = ProxyType::HTTP;
    std::string host;
    uint16_t port = 0;

    static ProxySpec direct() { return ProxySpec{ProxyType::DIRECT, {}, 0}; }

    static ProxySpec http(std::string host, uint16_t port) {
        return ProxySpec{ProxyType::HTTP, std::move(host), port};
    }

    static ProxySpec socks5(std::string host, uint16_t port) {
        return ProxySpec{ProxyType::SOCKS5, std::move(host), port};
    }
};

/**
 * @brief Settings fixed for the lifetime of a backend
 *
 * A zero timeout waits indefinitely for that phase.
 */
struct TransportOptions {
    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds read_timeout{60000};

    TlsPolicy tls;

    // Unset = proxies from the environment (http_proxy, https_proxy, no_proxy)
    std::optional<ProxySpec> proxy;

    int max_redirects = 20;
};

//=============================================================================
// Request
//=============================================================================

/**
 * @brief Fully resolved outbound request
 */
struct Request {
    Method method = Method::GET;
    std::string url;
    HeaderList headers;
    std::vector<uint8_t> body;

    // Empty for GET and for POST without a body
    std::string content_type;

    void add_header(std::string name, std::string value) {
        headers.emplace_back(std::move(name), std::move(value));
    }
};

//=============================================================================
// Response Stream
//=============================================================================

/**
 * @brief Response whose body is pulled from the network on demand
 *
 * The transport resource (pooled handle and connection) is held until the
 * body reaches end of stream, a read fails, or the stream is closed or
 * destroyed.
 */
class IResponseStream {
public:
    virtual ~IResponseStream() = default;

    virtual int status_code() const noexcept = 0;

    virtual const ResponseHeaders& headers() const noexcept = 0;

    /**
     * @brief URL that produced this response (after redirects)
     */
    virtual const std::string& url() const noexcept = 0;

    /**
     * @brief Read body bytes into @p buffer
     * @return Number of bytes copied, 0 at end of stream
     */
    virtual Result<size_t> read(std::span<uint8_t> buffer) = 0;

    /**
     * @brief Release the transport resource, discarding unread bytes
     */
    virtual void close() noexcept = 0;

    /**
     * @brief True while the transport resource is still held
     */
    virtual bool is_open() const noexcept = 0;
};

//=============================================================================
// Backend Statistics
//=============================================================================

/**
 * @brief Backend statistics snapshot
 */
struct BackendStats {
    uint64_t requests_sent      = 0;
    uint64_t responses_received = 0;
    uint64_t requests_failed    = 0;
    uint64_t bytes_sent         = 0;
    uint64_t bytes_received     = 0;

    // Time until the response headers were available
    uint64_t total_request_time_us = 0;

    constexpr uint64_t avg_request_time_us() const noexcept {
        return responses_received > 0 ? total_request_time_us / responses_received : 0;
    }
};

/**
 * @brief Lock-free counters behind BackendStats
 */
struct AtomicBackendStats {
    std::atomic<uint64_t> requests_sent{0};
    std::atomic<uint64_t> responses_received{0};
    std::atomic<uint64_t> requests_failed{0};
    std::atomic<uint64_t> bytes_sent{0};
    std::atomic<uint64_t> bytes_received{0};
    std::atomic<uint64_t> total_request_time_us{0};

    BackendStats snapshot() const noexcept {
        BackendStats s;
        s.requests_sent         = requests_sent.load(std::memory_order_relaxed);
        s.responses_received    = responses_received.load(std::memory_order_relaxed);
        s.requests_failed       = requests_failed.load(std::memory_order_relaxed);
        s.bytes_sent            = bytes_sent.load(std::memory_order_relaxed);
        s.bytes_received        = bytes_received.load(std::memory_order_relaxed);
        s.total_request_time_us = total_request_time_us.load(std::memory_order_relaxed);
        return s;
    }

    void reset() noexcept {
        requests_sent.store(0, std::memory_order_relaxed);
        responses_received.store(0, std::memory_order_relaxed);
        requests_failed.store(0, std::memory_order_relaxed);
        bytes_sent.store(0, std::memory_order_relaxed);
        bytes_received.store(0, std::memory_order_relaxed);
        total_request_time_us.store(0, std::memory_order_relaxed);
    }
};

//=============================================================================
// IHTTPBackend Interface
//=============================================================================

/**
 * @brief Abstract HTTP backend interface
 *
 * Implementations must accept concurrent execute() calls.
 */
class IHTTPBackend {
public:
    virtual ~IHTTPBackend() = default;

    //=========================================================================
    // Backend Info
    //=========================================================================

    virtual std::string_view name() const noexcept = 0;

    virtual std::string_view version() const noexcept = 0;

    virtual const TransportOptions& options() const noexcept = 0;

    //=========================================================================
    // Request Execution
    //=========================================================================

    /**
     * @brief Execute a request on the calling thread
     *
     * Returns once the response status and headers are known. Any HTTP
     * status is a success; I/O failures are ErrorCode::TRANSPORT_FAILED with
     * the specific failure as cause.
     */
    virtual Result<std::unique_ptr<IResponseStream>> execute(const Request& request) = 0;

    //=========================================================================
    // Connection Management
    //=========================================================================

    /**
     * @brief Drop idle pooled handles
     */
    virtual void close_all() = 0;

    //=========================================================================
    // Statistics
    //=========================================================================

    virtual BackendStats stats() const noexcept = 0;

    virtual void reset_stats() noexcept = 0;
};

//=============================================================================
// Backend Factory
//=============================================================================

/**
 * @brief Create the libcurl backend
 * @return Backend, or PLATFORM_ERROR if libcurl cannot be initialized
 */
Result<std::unique_ptr<IHTTPBackend>> create_backend(TransportOptions options);

/**
 * @brief Wrap an I/O failure as the single transport error kind
 *
 * Message "Fail to request <url>", context "url", @p cause attached.
 */
Error transport_failure(std::string_view url, Error cause);

}  // namespace wsconn::transport::http
