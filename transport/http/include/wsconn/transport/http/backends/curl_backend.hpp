#pragma once

/**
 * @file curl_backend.hpp
 * @brief libcurl HTTP backend implementation
 *
 * Features:
 * - Pool of reusable easy/multi handle pairs
 * - DNS and TLS session cache shared across handles, connections kept per handle
 * - Response body streamed on demand through the multi interface
 * - Idle read timeout enforced between received chunks
 * - TLS version range and cipher list from TlsPolicy
 */

#include "../http_backend.hpp"

#include <memory>

namespace wsconn::transport::http {

/**
 * @brief libcurl HTTP Backend
 */
class CurlBackend : public IHTTPBackend {
public:
    explicit CurlBackend(TransportOptions options);
    ~CurlBackend() override;

    // Non-copyable, non-movable
    CurlBackend(const CurlBackend&)            = delete;
    CurlBackend& operator=(const CurlBackend&) = delete;

    /**
     * @brief Process-wide libcurl initialization, performed once
     */
    static Result<void> global_init();

    //=========================================================================
    // IHTTPBackend Implementation
    //=========================================================================

    std::string_view name() const noexcept override { return "libcurl"; }
    std::string_view version() const noexcept override;
    const TransportOptions& options() const noexcept override;

    Result<std::unique_ptr<IResponseStream>> execute(const Request& request) override;

    void close_all() override;

    BackendStats stats() const noexcept override;
    void reset_stats() noexcept override;

    /**
     * @brief Number of idle handles waiting in the pool
     */
    size_t idle_handles() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace wsconn::transport::http
