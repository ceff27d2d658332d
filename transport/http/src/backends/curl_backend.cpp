/**
 * @file curl_backend.cpp
 * @brief libcurl HTTP backend implementation
 *
 * Each pooled slot pairs an easy handle with its own multi handle. The multi
 * handle keeps the slot's live connections, so a slot returned to the pool
 * carries its keep-alive connections to the next request. DNS and TLS
 * session caches are shared by all slots of one backend.
 */

#include "wsconn/transport/http/backends/curl_backend.hpp"

#include <wsconn/common/debug.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstring>
#include <limits>
#include <mutex>
#include <vector>

#include <curl/curl.h>

namespace wsconn::transport::http {

namespace category = common::debug::category;

//=============================================================================
// CURL Helpers
//=============================================================================

namespace {

using Clock = std::chrono::steady_clock;

// Idle slots kept for reuse; extra slots are destroyed on release
constexpr size_t MAX_IDLE_HANDLES = 16;

// Upper bound of a single wait, so timeouts are checked regularly
constexpr int POLL_INTERVAL_MS = 1000;

struct SlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;

Result<void> slist_append(SlistPtr& list, const std::string& line) {
    curl_slist* head = curl_slist_append(list.get(), line.c_str());
    if (head == nullptr) {
        return Result<void>(ErrorCode::OUT_OF_MEMORY, "curl_slist_append failed");
    }
    (void)list.release();
    list.reset(head);
    return common::ok();
}

ErrorCode map_curl_code(CURLcode rc) noexcept {
    switch (rc) {
        case CURLE_COULDNT_CONNECT:
            return ErrorCode::CONNECTION_REFUSED;
        case CURLE_COULDNT_RESOLVE_HOST:
            return ErrorCode::DNS_RESOLUTION_FAILED;
        case CURLE_COULDNT_RESOLVE_PROXY:
            return ErrorCode::PROXY_RESOLUTION_FAILED;
        case CURLE_OPERATION_TIMEDOUT:
            return ErrorCode::CONNECTION_TIMEOUT;
        case CURLE_SSL_CONNECT_ERROR:
            return ErrorCode::SECURITY_HANDSHAKE_FAILED;
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_ISSUER_ERROR:
        case CURLE_SSL_PINNEDPUBKEYNOTMATCH:
            return ErrorCode::CERTIFICATE_ERROR;
        case CURLE_SSL_ENGINE_INITFAILED:
        case CURLE_SSL_CIPHER:
            return ErrorCode::SECURITY_SSL_INIT_FAILED;
        case CURLE_SEND_ERROR:
            return ErrorCode::WRITE_ERROR;
        case CURLE_RECV_ERROR:
            return ErrorCode::READ_ERROR;
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return ErrorCode::CONNECTION_CLOSED;
        case CURLE_TOO_MANY_REDIRECTS:
            return ErrorCode::TOO_MANY_REDIRECTS;
        case CURLE_UNSUPPORTED_PROTOCOL:
            return ErrorCode::UNSUPPORTED_PROTOCOL;
        case CURLE_WEIRD_SERVER_REPLY:
            return ErrorCode::PROTOCOL_ERROR;
        case CURLE_OUT_OF_MEMORY:
            return ErrorCode::OUT_OF_MEMORY;
        default:
            return ErrorCode::CONNECTION_FAILED;
    }
}

Error curl_error(CURLcode rc, const char* detail) {
    std::string message = curl_easy_strerror(rc);
    if (detail != nullptr && detail[0] != '\0') {
        message += ": ";
        message += detail;
    }
    Error error(map_curl_code(rc), message);
    error.with_context("curl_code", std::to_string(static_cast<int>(rc)));
    return error;
}

Error multi_error(CURLMcode mc) {
    ErrorCode code =
        mc == CURLM_OUT_OF_MEMORY ? ErrorCode::OUT_OF_MEMORY : ErrorCode::CONNECTION_FAILED;
    return Error(code, curl_multi_strerror(mc));
}

long connect_timeout_ms(std::chrono::milliseconds timeout) noexcept {
    // libcurl reads 0 as its 300 s default, not as "no limit"
    if (timeout.count() <= 0) {
        return static_cast<long>(std::numeric_limits<int>::max());
    }
    return static_cast<long>(
        std::min<int64_t>(timeout.count(), std::numeric_limits<int>::max()));
}

long ssl_version_range(const TlsPolicy& tls) noexcept {
    long min_version = CURL_SSLVERSION_TLSv1_0;
    switch (tls.min_version) {
        case TlsVersion::TLS_1_0:
            min_version = CURL_SSLVERSION_TLSv1_0;
            break;
        case TlsVersion::TLS_1_1:
            min_version = CURL_SSLVERSION_TLSv1_1;
            break;
        case TlsVersion::TLS_1_2:
            min_version = CURL_SSLVERSION_TLSv1_2;
            break;
        case TlsVersion::TLS_1_3:
            min_version = CURL_SSLVERSION_TLSv1_3;
            break;
    }

    long max_version = CURL_SSLVERSION_MAX_TLSv1_2;
    switch (tls.max_version) {
        case TlsVersion::TLS_1_0:
            max_version = CURL_SSLVERSION_MAX_TLSv1_0;
            break;
        case TlsVersion::TLS_1_1:
            max_version = CURL_SSLVERSION_MAX_TLSv1_1;
            break;
        case TlsVersion::TLS_1_2:
            max_version = CURL_SSLVERSION_MAX_TLSv1_2;
            break;
        case TlsVersion::TLS_1_3:
            max_version = CURL_SSLVERSION_MAX_TLSv1_3;
            break;
    }

    return min_version | max_version;
}

long proxy_type_value(ProxyType type) noexcept {
    switch (type) {
        case ProxyType::SOCKS4:
            return CURLPROXY_SOCKS4A;
        case ProxyType::SOCKS5:
            return CURLPROXY_SOCKS5_HOSTNAME;
        case ProxyType::HTTP:
        default:
            return CURLPROXY_HTTP;
    }
}

//=============================================================================
// Transfer State and Callbacks
//=============================================================================

/**
 * @brief Per-request state written by libcurl callbacks
 */
struct TransferState {
    std::vector<uint8_t> pending;
    size_t pending_offset = 0;
    ResponseHeaders headers;

    bool connected = false;
    Clock::time_point last_activity;

    bool done       = false;
    CURLcode result = CURLE_OK;

    uint64_t bytes_received = 0;
    curl_off_t bytes_uploaded = 0;
    char error_buffer[CURL_ERROR_SIZE] = {};

    size_t available() const noexcept { return pending.size() - pending_offset; }
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* state       = static_cast<TransferState*>(userdata);
    size_t total_size = size * nmemb;

    if (state->pending_offset == state->pending.size()) {
        state->pending.clear();
        state->pending_offset = 0;
    }
    state->pending.insert(state->pending.end(), ptr, ptr + total_size);
    state->bytes_received += total_size;
    state->last_activity = Clock::now();
    return total_size;
}

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
        text.remove_suffix(1);
    }
    return text;
}

size_t header_callback(char* buffer, size_t size, size_t nmemb, void* userdata) {
    auto* state       = static_cast<TransferState*>(userdata);
    size_t total_size = size * nmemb;
    state->last_activity = Clock::now();

    std::string_view line(buffer, total_size);

    // Remove trailing CRLF
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    if (line.empty()) {
        return total_size;
    }

    // A status line starts a new header block (interim response or redirect)
    if (line.starts_with("HTTP/")) {
        state->headers.clear();
        return total_size;
    }

    // Obsolete line folding
    if (line.front() == ' ' || line.front() == '\t') {
        state->headers.append_to_last(trim(line));
        return total_size;
    }

    auto colon = line.find(':');
    if (colon != std::string_view::npos) {
        state->headers.add(std::string(trim(line.substr(0, colon))),
                           std::string(trim(line.substr(colon + 1))));
    }

    return total_size;
}

int prereq_callback(void* userdata, char*, char*, int, int) {
    auto* state          = static_cast<TransferState*>(userdata);
    state->connected     = true;
    state->last_activity = Clock::now();
    return CURL_PREREQFUNC_OK;
}

// Request body progress restarts the read-idle clock
int xferinfo_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t ulnow) {
    auto* state = static_cast<TransferState*>(userdata);
    if (ulnow > state->bytes_uploaded) {
        state->bytes_uploaded = ulnow;
        state->last_activity  = Clock::now();
    }
    return 0;
}

//=============================================================================
// Handle Pool
//=============================================================================

/**
 * @brief Easy handle with the multi handle that drives it
 */
struct CurlHandle {
    CURL* easy    = nullptr;
    CURLM* multi  = nullptr;
    bool attached = false;

    CurlHandle() = default;
    CurlHandle(const CurlHandle&)            = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    ~CurlHandle() {
        if (attached) {
            curl_multi_remove_handle(multi, easy);
        }
        if (easy != nullptr) {
            curl_easy_cleanup(easy);
        }
        if (multi != nullptr) {
            curl_multi_cleanup(multi);
        }
    }
};

struct ShareLocks {
    std::array<std::mutex, CURL_LOCK_DATA_LAST> mutexes;
};

void share_lock(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
    static_cast<ShareLocks*>(userptr)->mutexes[static_cast<size_t>(data)].lock();
}

void share_unlock(CURL*, curl_lock_data data, void* userptr) {
    static_cast<ShareLocks*>(userptr)->mutexes[static_cast<size_t>(data)].unlock();
}

/**
 * @brief State shared by a backend and the response streams it produced
 */
class CurlContext {
public:
    explicit CurlContext(TransportOptions options) : options_(std::move(options)) {
        idle_.reserve(MAX_IDLE_HANDLES);

        share_ = curl_share_init();
        if (share_ == nullptr) {
            WSCONN_LOG_WARN(category::TRANSPORT, "curl_share_init failed, caches not shared");
            return;
        }

        CURLSHcode rc = curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, share_lock);
        if (rc == CURLSHE_OK)
            rc = curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, share_unlock);
        if (rc == CURLSHE_OK)
            rc = curl_share_setopt(share_, CURLSHOPT_USERDATA, &locks_);
        if (rc == CURLSHE_OK)
            rc = curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        if (rc == CURLSHE_OK)
            rc = curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);

        if (rc != CURLSHE_OK) {
            WSCONN_LOG_WARN(category::TRANSPORT,
                            "curl share setup failed: " << curl_share_strerror(rc));
            curl_share_cleanup(share_);
            share_ = nullptr;
        }
    }

    ~CurlContext() {
        // Handles reference the share object and must go first
        idle_.clear();
        if (share_ != nullptr) {
            curl_share_cleanup(share_);
        }
    }

    CurlContext(const CurlContext&)            = delete;
    CurlContext& operator=(const CurlContext&) = delete;

    const TransportOptions& options() const noexcept { return options_; }
    AtomicBackendStats& stats() noexcept { return stats_; }

    Result<std::unique_ptr<CurlHandle>> acquire() {
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            if (!idle_.empty()) {
                auto handle = std::move(idle_.back());
                idle_.pop_back();
                return Result<std::unique_ptr<CurlHandle>>(std::move(handle));
            }
        }

        auto handle   = std::make_unique<CurlHandle>();
        handle->easy  = curl_easy_init();
        handle->multi = curl_multi_init();
        if (handle->easy == nullptr || handle->multi == nullptr) {
            return Result<std::unique_ptr<CurlHandle>>(ErrorCode::OUT_OF_MEMORY,
                                                       "Cannot create libcurl handle");
        }

        if (share_ != nullptr) {
            CURLcode rc = curl_easy_setopt(handle->easy, CURLOPT_SHARE, share_);
            if (rc != CURLE_OK) {
                return Result<std::unique_ptr<CurlHandle>>(curl_error(rc, "CURLOPT_SHARE"));
            }
        }

        return Result<std::unique_ptr<CurlHandle>>(std::move(handle));
    }

    void release(std::unique_ptr<CurlHandle> handle) noexcept {
        if (handle->attached) {
            curl_multi_remove_handle(handle->multi, handle->easy);
            handle->attached = false;
        }
        // Reset also detaches the share object
        curl_easy_reset(handle->easy);
        if (share_ != nullptr && curl_easy_setopt(handle->easy, CURLOPT_SHARE, share_) != CURLE_OK) {
            return;
        }

        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (idle_.size() < MAX_IDLE_HANDLES) {
            idle_.push_back(std::move(handle));
        }
    }

    void close_idle() {
        std::vector<std::unique_ptr<CurlHandle>> dropped;
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            dropped.swap(idle_);
            idle_.reserve(MAX_IDLE_HANDLES);
        }
    }

    size_t idle_count() const noexcept {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        return idle_.size();
    }

    /**
     * @brief Apply request and backend settings to a fresh easy handle
     */
    Result<void> configure(CURL* easy, const Request& request, TransferState& state,
                           SlistPtr& headers, SlistPtr& proxy_headers) const {
        CURLcode rc = CURLE_OK;
        auto set    = [&](CURLoption option, auto value) {
            if (rc == CURLE_OK) {
                rc = curl_easy_setopt(easy, option, value);
            }
        };

        // Setup URL and protocol
        set(CURLOPT_URL, request.url.c_str());
        set(CURLOPT_NOSIGNAL, 1L);
        set(CURLOPT_HTTP_VERSION, static_cast<long>(CURL_HTTP_VERSION_1_1));
        set(CURLOPT_PROTOCOLS_STR, "http,https");
        set(CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
        set(CURLOPT_FOLLOWLOCATION, 1L);
        set(CURLOPT_MAXREDIRS, static_cast<long>(options_.max_redirects));
        set(CURLOPT_ERRORBUFFER, state.error_buffer);

        // Setup callbacks
        set(CURLOPT_WRITEFUNCTION, write_callback);
        set(CURLOPT_WRITEDATA, static_cast<void*>(&state));
        set(CURLOPT_HEADERFUNCTION, header_callback);
        set(CURLOPT_HEADERDATA, static_cast<void*>(&state));
        set(CURLOPT_PREREQFUNCTION, prereq_callback);
        set(CURLOPT_PREREQDATA, static_cast<void*>(&state));
        set(CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
        set(CURLOPT_XFERINFODATA, static_cast<void*>(&state));
        set(CURLOPT_NOPROGRESS, 0L);

        // Setup timeouts (the read timeout is enforced while driving the transfer)
        set(CURLOPT_CONNECTTIMEOUT_MS, connect_timeout_ms(options_.connect_timeout));

        // Setup TLS
        const auto& tls = options_.tls;
        set(CURLOPT_SSLVERSION, ssl_version_range(tls));
        if (!tls.cipher_list.empty()) {
            set(CURLOPT_SSL_CIPHER_LIST, tls.cipher_list.c_str());
        }
        set(CURLOPT_SSL_VERIFYPEER, tls.verify_peer ? 1L : 0L);
        set(CURLOPT_SSL_VERIFYHOST, tls.verify_peer ? 2L : 0L);
        if (!tls.ca_file.empty()) {
            set(CURLOPT_CAINFO, tls.ca_file.c_str());
        }

        // Setup proxy
        if (options_.proxy) {
            const auto& proxy = *options_.proxy;
            if (proxy.type == ProxyType::DIRECT) {
                set(CURLOPT_PROXY, "");
            } else {
                set(CURLOPT_PROXY, proxy.host.c_str());
                set(CURLOPT_PROXYPORT, static_cast<long>(proxy.port));
                set(CURLOPT_PROXYTYPE, proxy_type_value(proxy.type));
            }
        }
        set(CURLOPT_SUPPRESS_CONNECT_HEADERS, 1L);

        // Setup method and body
        if (request.method == Method::POST) {
            set(CURLOPT_POST, 1L);
            set(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
            set(CURLOPT_COPYPOSTFIELDS,
                request.body.empty() ? ""
                                     : reinterpret_cast<const char*>(request.body.data()));
        } else {
            set(CURLOPT_HTTPGET, 1L);
        }

        if (rc != CURLE_OK) {
            return curl_error(rc, state.error_buffer);
        }

        // Setup headers, Proxy-Authorization goes to the proxy only
        for (const auto& [name, value] : request.headers) {
            std::string line = value.empty() ? name + ";" : name + ": " + value;
            SlistPtr& target =
                header_name_equals(name, "Proxy-Authorization") ? proxy_headers : headers;
            WSCONN_TRY(slist_append(target, line));
        }
        if (!request.content_type.empty()) {
            WSCONN_TRY(slist_append(headers, "Content-Type: " + request.content_type));
        } else if (request.method == Method::POST) {
            // Drop the form content type libcurl adds to every POST
            WSCONN_TRY(slist_append(headers, "Content-Type:"));
        }
        WSCONN_TRY(slist_append(headers, "Expect:"));

        set(CURLOPT_HTTPHEADER, headers.get());
        if (proxy_headers) {
            set(CURLOPT_PROXYHEADER, proxy_headers.get());
        }
        set(CURLOPT_HEADEROPT, static_cast<long>(CURLHEADER_SEPARATE));

        if (rc != CURLE_OK) {
            return curl_error(rc, state.error_buffer);
        }
        return common::ok();
    }

private:
    TransportOptions options_;
    ShareLocks locks_;
    CURLSH* share_ = nullptr;

    mutable std::mutex pool_mutex_;
    std::vector<std::unique_ptr<CurlHandle>> idle_;

    AtomicBackendStats stats_;
};

//=============================================================================
// Response Stream
//=============================================================================

class CurlResponseStream final : public IResponseStream {
public:
    CurlResponseStream(std::shared_ptr<CurlContext> context, std::unique_ptr<CurlHandle> handle,
                       std::string url)
        : context_(std::move(context)), handle_(std::move(handle)), url_(std::move(url)) {}

    ~CurlResponseStream() override { close(); }

    CurlResponseStream(const CurlResponseStream&)            = delete;
    CurlResponseStream& operator=(const CurlResponseStream&) = delete;

    /**
     * @brief Send the request and wait for the first body bytes or completion
     */
    Result<void> start(const Request& request) {
        WSCONN_TRY(context_->configure(handle_->easy, request, state_, request_headers_,
                                       proxy_headers_));

        CURLMcode mc = curl_multi_add_handle(handle_->multi, handle_->easy);
        if (mc != CURLM_OK) {
            return multi_error(mc);
        }
        handle_->attached = true;

        WSCONN_TRY(pump());

        if (state_.done && state_.result != CURLE_OK) {
            return curl_error(state_.result, state_.error_buffer);
        }
        return common::ok();
    }

    int status_code() const noexcept override { return status_code_; }

    const ResponseHeaders& headers() const noexcept override { return state_.headers; }

    const std::string& url() const noexcept override { return url_; }

    Result<size_t> read(std::span<uint8_t> buffer) override {
        if (closed_) {
            return Result<size_t>(ErrorCode::INVALID_STATE, "Response body stream is closed");
        }
        if (buffer.empty()) {
            return size_t{0};
        }

        if (state_.available() == 0 && handle_) {
            auto pumped = pump();
            if (pumped.is_error()) {
                close();
                return transport_failure(url_, pumped.error());
            }
        }

        if (state_.available() > 0) {
            size_t n = std::min(buffer.size(), state_.available());
            std::memcpy(buffer.data(), state_.pending.data() + state_.pending_offset, n);
            state_.pending_offset += n;
            return n;
        }

        if (state_.result != CURLE_OK) {
            return transport_failure(url_, curl_error(state_.result, state_.error_buffer));
        }
        return size_t{0};
    }

    void close() noexcept override {
        if (handle_ && !state_.done) {
            WSCONN_LOG_DEBUG(category::TRANSPORT,
                             "Closing unfinished transfer, connection dropped: " << url_);
        }
        release();
        state_.pending.clear();
        state_.pending_offset = 0;
        closed_               = true;
    }

    bool is_open() const noexcept override { return handle_ != nullptr; }

private:
    /**
     * @brief Drive the transfer until body bytes are buffered or it completes
     */
    Result<void> pump() {
        while (!state_.done && state_.available() == 0) {
            int running  = 0;
            CURLMcode mc = curl_multi_perform(handle_->multi, &running);
            if (mc != CURLM_OK) {
                return multi_error(mc);
            }
            collect_completion();
            if (state_.done || state_.available() > 0) {
                break;
            }

            WSCONN_TRY(check_read_timeout());

            int numfds = 0;
            mc         = curl_multi_poll(handle_->multi, nullptr, 0, poll_timeout_ms(), &numfds);
            if (mc != CURLM_OK) {
                return multi_error(mc);
            }
        }

        capture_response_info();
        if (state_.done) {
            release();
        }
        return common::ok();
    }

    void collect_completion() noexcept {
        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(handle_->multi, &queued)) {
            if (msg->msg == CURLMSG_DONE && msg->easy_handle == handle_->easy) {
                state_.done   = true;
                state_.result = msg->data.result;
            }
        }
    }

    Result<void> check_read_timeout() const {
        auto timeout = context_->options().read_timeout;
        if (!state_.connected || timeout.count() <= 0) {
            return common::ok();
        }
        if (Clock::now() - state_.last_activity >= timeout) {
            return Result<void>(ErrorCode::READ_TIMEOUT, "Read timed out after " +
                                                             std::to_string(timeout.count()) +
                                                             " ms");
        }
        return common::ok();
    }

    int poll_timeout_ms() const noexcept {
        auto timeout = context_->options().read_timeout;
        if (!state_.connected || timeout.count() <= 0) {
            return POLL_INTERVAL_MS;
        }
        auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() -
                                                                          state_.last_activity);
        auto remaining = timeout - idle;
        return static_cast<int>(std::clamp<int64_t>(remaining.count(), 1, POLL_INTERVAL_MS));
    }

    void capture_response_info() noexcept {
        if (!handle_) {
            return;
        }
        long code = 0;
        if (curl_easy_getinfo(handle_->easy, CURLINFO_RESPONSE_CODE, &code) == CURLE_OK) {
            status_code_ = static_cast<int>(code);
        }
        char* effective = nullptr;
        if (curl_easy_getinfo(handle_->easy, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK &&
            effective != nullptr) {
            url_ = effective;
        }
    }

    void release() noexcept {
        if (!handle_) {
            return;
        }
        context_->stats().bytes_received.fetch_add(state_.bytes_received,
                                                   std::memory_order_relaxed);
        context_->release(std::move(handle_));
        request_headers_.reset();
        proxy_headers_.reset();
    }

    std::shared_ptr<CurlContext> context_;
    std::unique_ptr<CurlHandle> handle_;
    std::string url_;
    int status_code_ = 0;
    bool closed_     = false;

    TransferState state_;
    SlistPtr request_headers_;
    SlistPtr proxy_headers_;
};

}  // anonymous namespace

//=============================================================================
// CurlBackend Implementation
//=============================================================================

class CurlBackend::Impl {
public:
    explicit Impl(TransportOptions options)
        : context_(std::make_shared<CurlContext>(std::move(options))) {}

    Result<std::unique_ptr<IResponseStream>> execute(const Request& request) {
        auto& stats = context_->stats();
        stats.requests_sent.fetch_add(1, std::memory_order_relaxed);
        stats.bytes_sent.fetch_add(request.body.size(), std::memory_order_relaxed);

        auto failed = [&](Error cause) {
            stats.requests_failed.fetch_add(1, std::memory_order_relaxed);
            WSCONN_LOG_WARN(category::TRANSPORT, "Request failed: "
                                                     << method_to_string(request.method) << " "
                                                     << request.url << ": "
                                                     << error_name(cause.code()) << " "
                                                     << cause.message());
            return Result<std::unique_ptr<IResponseStream>>(
                transport_failure(request.url, std::move(cause)));
        };

        auto initialized = CurlBackend::global_init();
        if (initialized.is_error()) {
            return failed(initialized.error());
        }

        auto start = Clock::now();

        auto acquired = context_->acquire();
        if (acquired.is_error()) {
            return failed(acquired.error());
        }

        auto stream = std::make_unique<CurlResponseStream>(
            context_, std::move(acquired).value(), request.url);
        auto started = stream->start(request);
        if (started.is_error()) {
            return failed(started.error());
        }

        auto elapsed =
            std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
        stats.responses_received.fetch_add(1, std::memory_order_relaxed);
        stats.total_request_time_us.fetch_add(static_cast<uint64_t>(elapsed.count()),
                                              std::memory_order_relaxed);

        WSCONN_LOG_DEBUG(category::TRANSPORT, method_to_string(request.method)
                                                  << " " << stream->url() << " -> "
                                                  << stream->status_code() << " in "
                                                  << elapsed.count() << "us");

        return Result<std::unique_ptr<IResponseStream>>(
            std::unique_ptr<IResponseStream>(std::move(stream)));
    }

    const std::shared_ptr<CurlContext>& context() const noexcept { return context_; }

private:
    std::shared_ptr<CurlContext> context_;
};

Result<void> CurlBackend::global_init() {
    static std::once_flag once;
    static CURLcode init_result = CURLE_OK;
    std::call_once(once, [] { init_result = curl_global_init(CURL_GLOBAL_DEFAULT); });

    if (init_result != CURLE_OK) {
        return Result<void>(ErrorCode::PLATFORM_ERROR,
                            std::string("curl_global_init failed: ") +
                                curl_easy_strerror(init_result));
    }
    return common::ok();
}

CurlBackend::CurlBackend(TransportOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

CurlBackend::~CurlBackend() = default;

std::string_view CurlBackend::version() const noexcept {
    static const std::string version = curl_version();
    return version;
}

const TransportOptions& CurlBackend::options() const noexcept {
    return impl_->context()->options();
}

Result<std::unique_ptr<IResponseStream>> CurlBackend::execute(const Request& request) {
    return impl_->execute(request);
}

void CurlBackend::close_all() {
    impl_->context()->close_idle();
}

BackendStats CurlBackend::stats() const noexcept {
    return impl_->context()->stats().snapshot();
}

void CurlBackend::reset_stats() noexcept {
    impl_->context()->stats().reset();
}

size_t CurlBackend::idle_handles() const noexcept {
    return impl_->context()->idle_count();
}

}  // namespace wsconn::transport::http
