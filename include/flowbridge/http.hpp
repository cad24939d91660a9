// filename: http.hpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "flowbridge/timer.hpp"

namespace flowbridge {

struct HttpRequest {
    std::string method;
    std::string target;
    std::string version{"HTTP/1.1"};
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    // Case-insensitive lookup; empty when absent.
    std::string header(const std::string& name) const;
    // Target without any query string.
    std::string path() const;
};

struct HttpResponse {
    int status{200};
    std::string contentType{"text/plain; charset=utf-8"};
    std::string body;
};

const char* reasonPhrase(int status);

// Owns a socket descriptor.
class Socket {
public:
    Socket() = default;
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket() { close(); }

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
    Socket(Socket&& other) noexcept : fd_(other.release()) {}
    Socket& operator=(Socket&& other) noexcept;

    int fd() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    int release() noexcept;
    void close() noexcept;

private:
    int fd_{-1};
};

/**
 * @brief Listening TCP socket. Port 0 binds an ephemeral port; port() reports it.
 */
class HttpListener {
public:
    HttpListener(const std::string& host, std::uint16_t port);

    std::uint16_t port() const { return port_; }

    // Waits up to timeout for a client. Empty when nothing arrived.
    std::optional<Socket> accept(Millis timeout);

private:
    Socket socket_;
    std::uint16_t port_{0};
};

/**
 * @brief Reads one request with a Content-Length body.
 *
 * Throws HttpError carrying 400 for malformed input, 408 on timeout and 413
 * when the declared body exceeds maxBodyBytes.
 */
HttpRequest readHttpRequest(const Socket& socket, std::size_t maxBodyBytes, Millis timeout);

// Never throws. False when the peer is gone or the write failed.
bool writeHttpResponse(const Socket& socket, const HttpResponse& response);

// Half-closes, discards unread input until the peer closes or timeout passes,
// then closes. Keeps a reply from being lost to a reset when the request body
// was not consumed.
void lingeringClose(Socket& socket, Millis timeout) noexcept;

std::string formatHttpRequest(const std::string& method,
                              const std::string& host,
                              std::uint16_t port,
                              const std::string& target,
                              const std::string& body);

bool sendAll(const Socket& socket, const std::string& bytes);

Socket connectTcp(const std::string& host, std::uint16_t port, Millis timeout);

// Blocking request/response round trip. Throws HttpError on connect failure or timeout.
HttpResponse httpExchange(const std::string& host,
                          std::uint16_t port,
                          const std::string& method,
                          const std::string& target,
                          const std::string& body,
                          Millis timeout);

/**
 * @brief An exchange still in flight on a connected socket, driven without blocking.
 *
 * The request bytes are written as the peer accepts them; whatever the socket
 * buffer cannot take yet stays queued for the next poll(). Only after the whole
 * request is out does poll() start reading the response.
 */
class PendingResponse {
public:
    enum class State { Waiting, Complete, Closed };

    PendingResponse(Socket socket, std::string outgoing);

    // Writes what the socket will take, drains what it has buffered, never blocks.
    State poll();

    State state() const { return state_; }
    const HttpResponse& response() const { return response_; }
    std::size_t unsentBytes() const { return outgoing_.size() - sent_; }

private:
    bool flushOutgoing();

    Socket socket_;
    std::string outgoing_;
    std::size_t sent_{0};
    std::string buffer_;
    HttpResponse response_;
    State state_{State::Waiting};
};

}  // namespace flowbridge
