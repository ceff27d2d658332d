/**
 * @file mock_http_server.hpp
 * @brief Loopback HTTP/1.1 server for end-to-end connector tests
 *
 * Features:
 * - Binds 127.0.0.1 on an ephemeral port
 * - One thread per connection, one request per connection
 * - Records every request (method, target, headers, body)
 * - Scripted responses, with optional delays to exercise timeouts
 * - Optional paced body reads, to emulate a slow upload link
 * - Also answers absolute-form targets, so it can stand in for an HTTP proxy
 *
 * Usage:
 *   wsconn::test::MockHttpServer server;
 *   server.set_handler([](const RecordedRequest&) {
 *       return MockResponse::text(200, "{}", "application/json");
 *   });
 *   // ... call server.url() ...
 *   auto request = server.last_request();
 */

#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace wsconn::test {

using HeaderPairs = std::vector<std::pair<std::string, std::string>>;

inline bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

/**
 * @brief A request as received on the wire
 */
struct RecordedRequest {
    std::string method;
    std::string target;  // origin-form "/path?q" or absolute-form when proxied
    HeaderPairs headers;
    std::string body;

    std::optional<std::string> header(std::string_view name) const {
        for (const auto& [key, value] : headers) {
            if (iequals(key, name)) {
                return value;
            }
        }
        return std::nullopt;
    }

    size_t header_count(std::string_view name) const {
        return static_cast<size_t>(std::count_if(headers.begin(), headers.end(),
                                                 [&](const auto& h) { return iequals(h.first, name); }));
    }
};

/**
 * @brief Scripted reply
 */
struct MockResponse {
    int status         = 200;
    std::string reason = "OK";
    HeaderPairs headers;
    std::string body;

    std::chrono::milliseconds delay{0};       // before anything is sent
    std::chrono::milliseconds body_delay{0};  // between the head and the body

    static MockResponse text(int status, std::string body,
                             std::string content_type = "text/plain") {
        MockResponse response;
        response.status = status;
        response.reason = status < 400 ? "OK" : "Error";
        response.headers.emplace_back("Content-Type", std::move(content_type));
        response.body = std::move(body);
        return response;
    }
};

class MockHttpServer {
public:
    using Handler = std::function<MockResponse(const RecordedRequest&)>;

    MockHttpServer() {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) {
            throw std::runtime_error("socket() failed");
        }

        int reuse = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        sockaddr_in addr{};
        addr.sin_family      = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port        = 0;
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listen_fd_, 64) != 0) {
            ::close(listen_fd_);
            throw std::runtime_error("bind()/listen() failed");
        }

        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        running_       = true;
        accept_thread_ = std::thread([this] { accept_loop(); });
    }

    ~MockHttpServer() { stop(); }

    MockHttpServer(const MockHttpServer&)            = delete;
    MockHttpServer& operator=(const MockHttpServer&) = delete;

    uint16_t port() const noexcept { return port_; }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }

    void set_handler(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    /**
     * @brief Read request bodies at most @p chunk bytes per @p interval
     */
    void set_body_read_pace(size_t chunk, std::chrono::milliseconds interval) {
        std::lock_guard<std::mutex> lock(mutex_);
        pace_chunk_    = chunk;
        pace_interval_ = interval;
    }

    std::vector<RecordedRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    size_t request_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    std::optional<RecordedRequest> last_request() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (requests_.empty()) {
            return std::nullopt;
        }
        return requests_.back();
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) {
                return;
            }
            running_ = false;
            for (int fd : client_fds_) {
                ::shutdown(fd, SHUT_RDWR);
            }
        }
        stop_cv_.notify_all();

        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }
        ::close(listen_fd_);

        std::vector<std::thread> workers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            workers.swap(workers_);
        }
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

private:
    void accept_loop() {
        while (is_running()) {
            pollfd pfd{listen_fd_, POLLIN, 0};
            int ready = ::poll(&pfd, 1, 50);
            if (ready <= 0) {
                continue;
            }

            int client = ::accept(listen_fd_, nullptr, nullptr);
            if (client < 0) {
                continue;
            }

            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) {
                ::close(client);
                break;
            }
            if (pace_chunk_ > 0) {
                int rcvbuf = static_cast<int>(pace_chunk_);
                ::setsockopt(client, SOL_SOCKET, SO_RCVBUF, &rcvbuf, sizeof(rcvbuf));
            }
            client_fds_.insert(client);
            workers_.emplace_back([this, client] { serve(client); });
        }
    }

    void serve(int fd) {
        RecordedRequest request;
        if (read_request(fd, request)) {
            Handler handler;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(request);
                handler = handler_;
            }

            MockResponse response = handler ? handler(request) : MockResponse{};
            if (wait(response.delay)) {
                std::string head = "HTTP/1.1 " + std::to_string(response.status) + " " +
                                   response.reason + "\r\n";
                bool has_length = false;
                for (const auto& [key, value] : response.headers) {
                    head += key + ": " + value + "\r\n";
                    has_length = has_length || iequals(key, "Content-Length");
                }
                if (!has_length) {
                    head += "Content-Length: " + std::to_string(response.body.size()) + "\r\n";
                }
                head += "Connection: close\r\n\r\n";

                if (send_all(fd, head) && wait(response.body_delay)) {
                    send_all(fd, response.body);
                }
            }
        }

        ::shutdown(fd, SHUT_WR);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            client_fds_.erase(fd);
        }
        ::close(fd);
    }

    bool read_request(int fd, RecordedRequest& out) {
        std::string buffer;
        size_t head_end = std::string::npos;
        char chunk[4096];

        while ((head_end = buffer.find("\r\n\r\n")) == std::string::npos) {
            ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
            if (n <= 0) {
                return false;
            }
            buffer.append(chunk, static_cast<size_t>(n));
        }

        std::string_view head(buffer.data(), head_end);
        size_t line_end       = head.find("\r\n");
        std::string_view line = head.substr(0, line_end);

        size_t sp1 = line.find(' ');
        size_t sp2 = line.find(' ', sp1 + 1);
        if (sp1 == std::string_view::npos || sp2 == std::string_view::npos) {
            return false;
        }
        out.method = std::string(line.substr(0, sp1));
        out.target = std::string(line.substr(sp1 + 1, sp2 - sp1 - 1));

        size_t content_length = 0;
        size_t pos            = line_end == std::string_view::npos ? head.size() : line_end + 2;
        while (pos < head.size()) {
            size_t end = head.find("\r\n", pos);
            if (end == std::string_view::npos) {
                end = head.size();
            }
            std::string_view header = head.substr(pos, end - pos);
            size_t colon            = header.find(':');
            if (colon != std::string_view::npos) {
                std::string name(header.substr(0, colon));
                std::string_view value = header.substr(colon + 1);
                while (!value.empty() && value.front() == ' ') {
                    value.remove_prefix(1);
                }
                if (iequals(name, "Content-Length")) {
                    content_length = std::stoul(std::string(value));
                }
                out.headers.emplace_back(std::move(name), std::string(value));
            }
            pos = end + 2;
        }

        size_t pace_chunk = 0;
        std::chrono::milliseconds pace_interval{0};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pace_chunk    = pace_chunk_;
            pace_interval = pace_interval_;
        }

        out.body = buffer.substr(head_end + 4);
        std::vector<char> body_chunk(64 * 1024);
        while (out.body.size() < content_length) {
            size_t want = body_chunk.size();
            if (pace_chunk > 0) {
                want = std::min(want, pace_chunk);
            }
            ssize_t n = ::recv(fd, body_chunk.data(), want, 0);
            if (n <= 0) {
                return false;
            }
            out.body.append(body_chunk.data(), static_cast<size_t>(n));
            if (pace_interval.count() > 0 && !wait(pace_interval)) {
                return false;
            }
        }
        return true;
    }

    static bool send_all(int fd, std::string_view data) {
        while (!data.empty()) {
            ssize_t n = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
            if (n <= 0) {
                return false;
            }
            data.remove_prefix(static_cast<size_t>(n));
        }
        return true;
    }

    /**
     * @brief Sleep unless the server stops first
     * @return false when stopped
     */
    bool wait(std::chrono::milliseconds delay) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (delay.count() > 0) {
            stop_cv_.wait_for(lock, delay, [this] { return !running_; });
        }
        return running_;
    }

    bool is_running() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

    int listen_fd_ = -1;
    uint16_t port_ = 0;

    mutable std::mutex mutex_;
    std::condition_variable stop_cv_;
    bool running_ = false;

    Handler handler_;
    size_t pace_chunk_ = 0;
    std::chrono::milliseconds pace_interval_{0};
    std::vector<RecordedRequest> requests_;
    std::set<int> client_fds_;
    std::thread accept_thread_;
    std::vector<std::thread> workers_;
};

}  // namespace wsconn::test
