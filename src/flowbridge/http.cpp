// filename: http.cpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#include "flowbridge/http.hpp"

#include "flowbridge/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace flowbridge {
namespace {

constexpr std::size_t kMaxHeaderBytes = 64U * 1024U;
constexpr const char* kHeaderEnd = "\r\n\r\n";

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return text;
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

struct MessageHead {
    std::string startLine;
    std::vector<std::pair<std::string, std::string>> headers;
    std::optional<std::size_t> contentLength;
};

MessageHead parseHead(const std::string& head) {
    MessageHead parsed{};
    std::istringstream lines(head);
    std::string line;
    if (!std::getline(lines, line)) {
        throw HttpError("Empty HTTP message", 400);
    }
    parsed.startLine = trim(line);
    while (std::getline(lines, line)) {
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            throw HttpError("Malformed HTTP header line: " + line, 400);
        }
        std::string name = trim(line.substr(0, colon));
        std::string value = trim(line.substr(colon + 1));
        if (toLower(name) == "content-length") {
            if (value.empty() || !std::all_of(value.begin(), value.end(),
                                              [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
                throw HttpError("Invalid Content-Length: " + value, 400);
            }
            try {
                parsed.contentLength = static_cast<std::size_t>(std::stoull(value));
            } catch (const std::out_of_range&) {
                throw HttpError("Content-Length out of range", 413);
            }
        }
        parsed.headers.emplace_back(std::move(name), std::move(value));
    }
    return parsed;
}

// Waits for readability; false on timeout.
bool waitReadable(int fd, Millis timeout) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    for (;;) {
        const int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (rc < 0 && errno == EINTR) {
            continue;
        }
        if (rc < 0) {
            throw HttpError(std::string("poll failed: ") + std::strerror(errno));
        }
        return rc > 0;
    }
}

// Returns bytes read, 0 on EOF, -1 when a non-blocking read finds nothing.
long recvChunk(int fd, std::string& buffer, int flags) {
    char chunk[8192];
    for (;;) {
        const ssize_t r = ::recv(fd, chunk, sizeof(chunk), flags);
        if (r < 0 && errno == EINTR) {
            continue;
        }
        if (r < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return -1;
            }
            throw HttpError(std::string("recv failed: ") + std::strerror(errno));
        }
        buffer.append(chunk, static_cast<std::size_t>(r));
        return static_cast<long>(r);
    }
}

// A complete response from buffer, or empty when more bytes are needed.
std::optional<HttpResponse> tryParseResponse(const std::string& buffer, bool eof) {
    const auto headEnd = buffer.find(kHeaderEnd);
    if (headEnd == std::string::npos) {
        if (eof) {
            throw HttpError("Connection closed before response headers");
        }
        return std::nullopt;
    }
    const MessageHead head = parseHead(buffer.substr(0, headEnd));
    const std::size_t bodyStart = headEnd + std::strlen(kHeaderEnd);
    const std::size_t available = buffer.size() - bodyStart;
    if (head.contentLength) {
        if (available < *head.contentLength) {
            if (eof) {
                throw HttpError("Connection closed before response body completed");
            }
            return std::nullopt;
        }
    } else if (!eof) {
        return std::nullopt;
    }

    HttpResponse response{};
    std::istringstream status(head.startLine);
    std::string version;
    status >> version >> response.status;
    if (!status || version.rfind("HTTP/", 0) != 0) {
        throw HttpError("Malformed HTTP status line: " + head.startLine);
    }
    for (const auto& header : head.headers) {
        if (toLower(header.first) == "content-type") {
            response.contentType = header.second;
        }
    }
    response.body = buffer.substr(bodyStart, head.contentLength ? *head.contentLength : available);
    return response;
}

sockaddr_in resolveIpv4(const std::string& host, std::uint16_t port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (host.empty() || host == "0.0.0.0") {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        return addr;
    }
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) == 1) {
        return addr;
    }
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* result = nullptr;
    const int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &result);
    if (rc != 0 || result == nullptr) {
        throw HttpError("Cannot resolve host " + host + ": " + ::gai_strerror(rc));
    }
    addr.sin_addr = reinterpret_cast<const sockaddr_in*>(result->ai_addr)->sin_addr;
    ::freeaddrinfo(result);
    return addr;
}

}  // namespace

std::string HttpRequest::header(const std::string& name) const {
    const std::string wanted = toLower(name);
    for (const auto& entry : headers) {
        if (toLower(entry.first) == wanted) {
            return entry.second;
        }
    }
    return {};
}

std::string HttpRequest::path() const {
    const auto query = target.find('?');
    return query == std::string::npos ? target : target.substr(0, query);
}

const char* reasonPhrase(int status) {
    switch (status) {
        case 200:
            return "OK";
        case 400:
            return "Bad Request";
        case 404:
            return "Not Found";
        case 405:
            return "Method Not Allowed";
        case 408:
            return "Request Timeout";
        case 413:
            return "Payload Too Large";
        case 500:
            return "Internal Server Error";
        case 503:
            return "Service Unavailable";
        default:
            return "Unknown";
    }
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.release();
    }
    return *this;
}

int Socket::release() noexcept {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

void Socket::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

HttpListener::HttpListener(const std::string& host, std::uint16_t port) {
    socket_ = Socket(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!socket_.valid()) {
        throw HttpError(std::string("socket failed: ") + std::strerror(errno));
    }

    int yes = 1;
    ::setsockopt(socket_.fd(), SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    const sockaddr_in addr = resolveIpv4(host, port);
    if (::bind(socket_.fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
        throw HttpError("bind to " + host + ":" + std::to_string(port) + " failed: " + std::strerror(errno));
    }
    if (::listen(socket_.fd(), 16) != 0) {
        throw HttpError(std::string("listen failed: ") + std::strerror(errno));
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(socket_.fd(), reinterpret_cast<sockaddr*>(&bound), &len) != 0) {
        throw HttpError(std::string("getsockname failed: ") + std::strerror(errno));
    }
    port_ = ntohs(bound.sin_port);
}

std::optional<Socket> HttpListener::accept(Millis timeout) {
    if (!waitReadable(socket_.fd(), timeout)) {
        return std::nullopt;
    }
    sockaddr_in caddr{};
    socklen_t clen = sizeof(caddr);
    const int client = ::accept4(socket_.fd(), reinterpret_cast<sockaddr*>(&caddr), &clen, SOCK_CLOEXEC);
    if (client < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED) {
            return std::nullopt;
        }
        throw HttpError(std::string("accept failed: ") + std::strerror(errno));
    }
    return Socket(client);
}

HttpRequest readHttpRequest(const Socket& socket, std::size_t maxBodyBytes, Millis timeout) {
    const Deadline deadline(timeout);
    std::string buffer;
    std::size_t headEnd = std::string::npos;

    while ((headEnd = buffer.find(kHeaderEnd)) == std::string::npos) {
        if (buffer.size() > kMaxHeaderBytes) {
            throw HttpError("Request headers too large", 400);
        }
        if (!waitReadable(socket.fd(), deadline.remaining())) {
            throw HttpError("Timed out reading request headers", 408);
        }
        if (recvChunk(socket.fd(), buffer, 0) == 0) {
            throw HttpError("Connection closed before request headers completed", 400);
        }
    }

    const MessageHead head = parseHead(buffer.substr(0, headEnd));
    HttpRequest request{};
    std::istringstream start(head.startLine);
    start >> request.method >> request.target >> request.version;
    if (request.method.empty() || request.target.empty() || request.version.rfind("HTTP/", 0) != 0) {
        throw HttpError("Malformed request line: " + head.startLine, 400);
    }
    request.headers = head.headers;

    const std::size_t length = head.contentLength.value_or(0);
    if (length > maxBodyBytes) {
        throw HttpError("Request body of " + std::to_string(length) + " bytes exceeds limit of " +
                            std::to_string(maxBodyBytes),
                        413);
    }

    request.body = buffer.substr(headEnd + std::strlen(kHeaderEnd));
    while (request.body.size() < length) {
        if (!waitReadable(socket.fd(), deadline.remaining())) {
            throw HttpError("Timed out reading request body", 408);
        }
        if (recvChunk(socket.fd(), request.body, 0) == 0) {
            throw HttpError("Connection closed before request body completed", 400);
        }
    }
    request.body.resize(length);
    return request;
}

bool sendAll(const Socket& socket, const std::string& bytes) {
    std::size_t sent = 0;
    while (sent < bytes.size()) {
        const ssize_t r = ::send(socket.fd(), bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
        if (r < 0 && errno == EINTR) {
            continue;
        }
        if (r <= 0) {
            return false;
        }
        sent += static_cast<std::size_t>(r);
    }
    return true;
}

bool writeHttpResponse(const Socket& socket, const HttpResponse& response) {
    std::ostringstream out;
    out << "HTTP/1.1 " << response.status << ' ' << reasonPhrase(response.status) << "\r\n"
        << "Content-Type: " << response.contentType << "\r\n"
        << "Content-Length: " << response.body.size() << "\r\n"
        << "Connection: close\r\n\r\n"
        << response.body;
    return socket.valid() && sendAll(socket, out.str());
}

void lingeringClose(Socket& socket, Millis timeout) noexcept {
    if (!socket.valid()) {
        return;
    }
    ::shutdown(socket.fd(), SHUT_WR);
    const Deadline deadline(timeout);
    char scratch[4096];
    while (!deadline.expired()) {
        pollfd pfd{};
        pfd.fd = socket.fd();
        pfd.events = POLLIN;
        const int rc = ::poll(&pfd, 1, static_cast<int>(deadline.remaining().count()));
        if (rc < 0 && errno == EINTR) {
            continue;
        }
        if (rc <= 0) {
            break;
        }
        const ssize_t r = ::recv(socket.fd(), scratch, sizeof(scratch), 0);
        if (r <= 0 && !(r < 0 && errno == EINTR)) {
            break;
        }
    }
    socket.close();
}

std::string formatHttpRequest(const std::string& method,
                              const std::string& host,
                              std::uint16_t port,
                              const std::string& target,
                              const std::string& body) {
    std::ostringstream out;
    out << method << ' ' << target << " HTTP/1.1\r\n"
        << "Host: " << host << ':' << port << "\r\n"
        << "Connection: close\r\n";
    if (!body.empty() || method == "POST") {
        out << "Content-Type: application/json\r\n"
            << "Content-Length: " << body.size() << "\r\n";
    }
    out << "\r\n" << body;
    return out.str();
}

Socket connectTcp(const std::string& host, std::uint16_t port, Millis timeout) {
    const sockaddr_in addr = resolveIpv4(host, port);
    Socket socket(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0));
    if (!socket.valid()) {
        throw HttpError(std::string("socket failed: ") + std::strerror(errno));
    }

    const std::string where = host + ":" + std::to_string(port);
    if (::connect(socket.fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
        if (errno != EINPROGRESS) {
            throw HttpError("connect to " + where + " failed: " + std::strerror(errno));
        }
        pollfd pfd{};
        pfd.fd = socket.fd();
        pfd.events = POLLOUT;
        int rc = 0;
        do {
            rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        } while (rc < 0 && errno == EINTR);
        if (rc == 0) {
            throw HttpError("connect to " + where + " timed out");
        }
        int soError = 0;
        socklen_t len = sizeof(soError);
        if (rc < 0 || ::getsockopt(socket.fd(), SOL_SOCKET, SO_ERROR, &soError, &len) != 0 || soError != 0) {
            throw HttpError("connect to " + where + " failed: " + std::strerror(soError != 0 ? soError : errno));
        }
    }

    const int flags = ::fcntl(socket.fd(), F_GETFL, 0);
    ::fcntl(socket.fd(), F_SETFL, flags & ~O_NONBLOCK);
    return socket;
}

HttpResponse httpExchange(const std::string& host,
                          std::uint16_t port,
                          const std::string& method,
                          const std::string& target,
                          const std::string& body,
                          Millis timeout) {
    const Deadline deadline(timeout);
    Socket socket = connectTcp(host, port, timeout);
    if (!sendAll(socket, formatHttpRequest(method, host, port, target, body))) {
        throw HttpError("Failed to send " + method + " " + target);
    }

    std::string buffer;
    for (;;) {
        if (!waitReadable(socket.fd(), deadline.remaining())) {
            throw HttpError("Timed out waiting for response to " + method + " " + target);
        }
        const bool eof = recvChunk(socket.fd(), buffer, 0) == 0;
        if (auto response = tryParseResponse(buffer, eof)) {
            return *response;
        }
    }
}

PendingResponse::PendingResponse(Socket socket, std::string outgoing)
    : socket_(std::move(socket)), outgoing_(std::move(outgoing)) {}

// True once every request byte is out. A failed write ends the upload; the peer
// may still have answered (413), so reading goes ahead either way.
bool PendingResponse::flushOutgoing() {
    while (sent_ < outgoing_.size()) {
        const ssize_t r = ::send(socket_.fd(), outgoing_.data() + sent_, outgoing_.size() - sent_,
                                 MSG_NOSIGNAL | MSG_DONTWAIT);
        if (r < 0 && errno == EINTR) {
            continue;
        }
        if (r < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return false;
        }
        if (r <= 0) {
            sent_ = outgoing_.size();
            break;
        }
        sent_ += static_cast<std::size_t>(r);
    }
    outgoing_.clear();
    outgoing_.shrink_to_fit();
    sent_ = 0;
    return true;
}

PendingResponse::State PendingResponse::poll() {
    if (state_ != State::Waiting) {
        return state_;
    }
    if (!flushOutgoing()) {
        return state_;
    }
    try {
        for (;;) {
            const long got = recvChunk(socket_.fd(), buffer_, MSG_DONTWAIT);
            if (got < 0) {
                return state_;
            }
            const bool eof = got == 0;
            if (auto response = tryParseResponse(buffer_, eof)) {
                response_ = std::move(*response);
                state_ = State::Complete;
                socket_.close();
                return state_;
            }
            if (eof) {
                break;
            }
        }
    } catch (const HttpError&) {
        // Fall through: the peer closed without a usable response.
    }
    state_ = State::Closed;
    socket_.close();
    return state_;
}

}  // namespace flowbridge
