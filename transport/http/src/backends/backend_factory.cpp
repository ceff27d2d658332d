/**
 * @file backend_factory.cpp
 * @brief HTTP backend factory implementation
 */

#include "wsconn/transport/http/backends/curl_backend.hpp"
#include "wsconn/transport/http/http_backend.hpp"

namespace wsconn::transport::http {

Result<std::unique_ptr<IHTTPBackend>> create_backend(TransportOptions options) {
    WSCONN_TRY(CurlBackend::global_init());
    return Result<std::unique_ptr<IHTTPBackend>>(
        std::unique_ptr<IHTTPBackend>(std::make_unique<CurlBackend>(std::move(options))));
}

}  // namespace wsconn::transport::http
