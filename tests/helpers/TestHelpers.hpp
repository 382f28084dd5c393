#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace hostwatch::test {

/**
 * @brief Scratch directory under temp_directory_path(), removed on destruction.
 */
class TempDir {
public:
    explicit TempDir(const std::string& name)
        : path_(std::filesystem::temp_directory_path() /
                ("hostwatch_" + name + "_" + std::to_string(::getpid()))) {
        cleanup();
        std::filesystem::create_directories(path_);
    }

    ~TempDir() { cleanup(); }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    void cleanup() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::filesystem::path path_;
};

/**
 * @brief Minimal HTTP/1.1 server on 127.0.0.1 answering every request with one status.
 *
 * Serves connections one at a time on a background thread and records each
 * raw request, body included. With respond set to false it reads the request
 * and never answers.
 */
class LocalHttpServer {
public:
    explicit LocalHttpServer(int statusCode = 200, bool respond = true)
        : acceptor_(io_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)),
          statusCode_(statusCode), respond_(respond) {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this]() { serve(); });
    }

    ~LocalHttpServer() { stop(); }

    LocalHttpServer(const LocalHttpServer&) = delete;
    LocalHttpServer& operator=(const LocalHttpServer&) = delete;

    uint16_t port() const { return port_; }

    std::string url(const std::string& target = "/") const {
        return "http://127.0.0.1:" + std::to_string(port_) + target;
    }

    std::vector<std::string> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    size_t requestCount() const {
        std::lock_guard lock(mutex_);
        return requests_.size();
    }

    void stop() {
        if (stopping_.exchange(true)) {
            return;
        }

        // Wake the blocking accept.
        asio::io_context wake;
        asio::ip::tcp::socket socket(wake);
        asio::error_code ec;
        socket.connect({asio::ip::make_address("127.0.0.1"), port_}, ec);

        if (thread_.joinable()) {
            thread_.join();
        }
        acceptor_.close(ec);
    }

private:
    void serve() {
        while (!stopping_) {
            asio::ip::tcp::socket socket(io_);
            asio::error_code ec;
            acceptor_.accept(socket, ec);
            if (ec || stopping_) {
                continue;
            }

            asio::streambuf buffer;
            std::size_t headerBytes = asio::read_until(socket, buffer, "\r\n\r\n", ec);
            if (ec) {
                continue;
            }

            std::string data(asio::buffers_begin(buffer.data()), asio::buffers_end(buffer.data()));
            std::size_t contentLength = parseContentLength(data.substr(0, headerBytes));
            std::size_t bodyBytes = data.size() - headerBytes;
            if (bodyBytes < contentLength) {
                asio::read(socket, buffer, asio::transfer_exactly(contentLength - bodyBytes), ec);
                data.assign(asio::buffers_begin(buffer.data()), asio::buffers_end(buffer.data()));
            }

            {
                std::lock_guard lock(mutex_);
                requests_.push_back(data);
            }

            if (!respond_) {
                // Hold the connection until the client gives up.
                char byte;
                socket.read_some(asio::buffer(&byte, 1), ec);
                continue;
            }

            std::string response = "HTTP/1.1 " + std::to_string(statusCode_) +
                                   " Test\r\nContent-Length: 2\r\nConnection: close\r\n\r\nok";
            asio::write(socket, asio::buffer(response), ec);
            socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
            socket.close(ec);
        }
    }

    static std::size_t parseContentLength(const std::string& head) {
        auto pos = head.find("Content-Length: ");
        if (pos == std::string::npos) {
            return 0;
        }
        return static_cast<std::size_t>(std::stoul(head.substr(pos + 16)));
    }

    asio::io_context io_;
    asio::ip::tcp::acceptor acceptor_;
    uint16_t port_{0};
    int statusCode_;
    bool respond_;
    std::thread thread_;
    std::atomic<bool> stopping_{false};
    mutable std::mutex mutex_;
    std::vector<std::string> requests_;
};

/**
 * @brief Listener on 127.0.0.1 that accepts every connection and closes it at once.
 */
class HangupServer {
public:
    HangupServer()
        : acceptor_(io_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this]() {
            while (!stopping_) {
                asio::ip::tcp::socket socket(io_);
                asio::error_code ec;
                acceptor_.accept(socket, ec);
                if (!ec && !stopping_) {
                    ++accepted_;
                }
                socket.close(ec);
            }
        });
    }

    ~HangupServer() {
        stopping_ = true;
        asio::io_context wake;
        asio::ip::tcp::socket socket(wake);
        asio::error_code ec;
        socket.connect({asio::ip::make_address("127.0.0.1"), port_}, ec);
        if (thread_.joinable()) {
            thread_.join();
        }
        acceptor_.close(ec);
    }

    HangupServer(const HangupServer&) = delete;
    HangupServer& operator=(const HangupServer&) = delete;

    uint16_t port() const { return port_; }
    int accepted() const { return accepted_; }

private:
    asio::io_context io_;
    asio::ip::tcp::acceptor acceptor_;
    uint16_t port_{0};
    std::thread thread_;
    std::atomic<bool> stopping_{false};
    std::atomic<int> accepted_{0};
};

/**
 * @brief Returns a loopback port with nothing listening on it.
 */
inline uint16_t unusedPort() {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io,
                                     asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    uint16_t port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}

/**
 * @brief Polls a condition until it holds or the timeout elapses.
 */
template <typename Predicate>
bool waitFor(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}

} // namespace hostwatch::test
