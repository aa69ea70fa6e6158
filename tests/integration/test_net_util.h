#pragma once

// Blocking socket helpers and a scripted backend for the integration tests.

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <optional>
#include <string>
#include <thread>

namespace testutil {

static bool pollReadable(int fd, int timeoutMs) {
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN | POLLHUP | POLLERR;
    int ret = ::poll(&pfd, 1, timeoutMs);
    return ret == 1;
}

static void sendAll(int fd, const std::string& s) {
    size_t off = 0;
    while (off < s.size()) {
        ssize_t n = ::send(fd, s.data() + off, s.size() - off, MSG_NOSIGNAL);
        if (n <= 0) return;
        off += static_cast<size_t>(n);
    }
}

static int connectTo(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr) != 1) {
        ::close(fd);
        return -1;
    }
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

static std::optional<uint16_t> bindEphemeralPort(int* listenFdOut) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return std::nullopt;
    int opt = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(0);
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(fd, 16) != 0) {
        ::close(fd);
        return std::nullopt;
    }
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        ::close(fd);
        return std::nullopt;
    }
    *listenFdOut = fd;
    return ntohs(addr.sin_port);
}

// A port nobody listens on (bound once, then released).
static std::optional<uint16_t> reserveFreePort() {
    int fd = -1;
    auto port = bindEphemeralPort(&fd);
    if (fd >= 0) ::close(fd);
    return port;
}

static bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        char ca = a[i];
        char cb = b[i];
        if (ca >= 'A' && ca <= 'Z') ca = static_cast<char>(ca - 'A' + 'a');
        if (cb >= 'A' && cb <= 'Z') cb = static_cast<char>(cb - 'A' + 'a');
        if (ca != cb) return false;
    }
    return true;
}

// Finds the first header named key in a raw head.
static bool findHeaderCI(const std::string& head, const std::string& key, std::string* value) {
    size_t pos = head.find("\r\n");
    while (pos != std::string::npos) {
        pos += 2;
        const size_t lineEnd = head.find("\r\n", pos);
        if (lineEnd == std::string::npos || lineEnd == pos) break;
        const std::string line = head.substr(pos, lineEnd - pos);
        const size_t colon = line.find(':');
        if (colon != std::string::npos && iequals(line.substr(0, colon), key)) {
            std::string v = line.substr(colon + 1);
            while (!v.empty() && (v.front() == ' ' || v.front() == '\t')) v.erase(v.begin());
            *value = v;
            return true;
        }
        pos = lineEnd;
    }
    return false;
}

static std::string headerValueCI(const std::string& head, const std::string& key) {
    std::string v;
    findHeaderCI(head, key, &v);
    return v;
}

static bool hasHeaderCI(const std::string& head, const std::string& key) {
    std::string v;
    return findHeaderCI(head, key, &v);
}

// Reads more bytes into *pending; false on EOF, error or timeout.
static bool recvMore(int fd, std::string* pending, int timeoutMs) {
    if (!pollReadable(fd, timeoutMs)) return false;
    char buf[8192];
    ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
    if (n <= 0) return false;
    pending->append(buf, buf + n);
    return true;
}

// Bytes of a complete chunked body at the front of raw, or npos. Payload goes to *out.
static size_t decodeChunked(const std::string& raw, std::string* out) {
    std::string payload;
    size_t pos = 0;
    while (true) {
        const size_t lineEnd = raw.find("\r\n", pos);
        if (lineEnd == std::string::npos) return std::string::npos;
        const size_t size = std::strtoul(raw.substr(pos, lineEnd - pos).c_str(), nullptr, 16);
        pos = lineEnd + 2;
        if (size == 0) {
            const size_t end = raw.find("\r\n", pos);
            if (end == std::string::npos) return std::string::npos;
            if (end != pos) {
                const size_t trailersEnd = raw.find("\r\n\r\n", pos);
                if (trailersEnd == std::string::npos) return std::string::npos;
                pos = trailersEnd + 4;
            } else {
                pos = end + 2;
            }
            *out = payload;
            return pos;
        }
        if (raw.size() < pos + size + 2) return std::string::npos;
        payload.append(raw, pos, size);
        pos += size + 2;
    }
}

struct HttpReply {
    std::string head;
    std::string body;    // decoded payload
    std::string rawBody; // bytes on the wire after the head
    bool complete{false};
    bool closed{false};  // EOF or timeout while reading

    int status() const { return head.size() > 12 ? std::atoi(head.c_str() + 9) : 0; }
};

// Reads one response; leftover bytes stay in *pending for the next call.
static HttpReply readResponse(int fd, std::string* pending, bool headRequest = false, int timeoutMs = 3000) {
    HttpReply r;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    auto remainingMs = [&deadline]() {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        return left.count() > 0 ? static_cast<int>(left.count()) : 0;
    };

    size_t hdrEnd;
    while ((hdrEnd = pending->find("\r\n\r\n")) == std::string::npos) {
        if (remainingMs() == 0 || !recvMore(fd, pending, remainingMs())) {
            r.closed = true;
            return r;
        }
    }
    r.head = pending->substr(0, hdrEnd + 4);
    pending->erase(0, hdrEnd + 4);

    const int status = r.status();
    if (headRequest || (status >= 100 && status < 200) || status == 204 || status == 304) {
        r.complete = true;
        return r;
    }

    const std::string te = headerValueCI(r.head, "Transfer-Encoding");
    const std::string cl = headerValueCI(r.head, "Content-Length");
    while (true) {
        if (te.find("chunked") != std::string::npos) {
            const size_t used = decodeChunked(*pending, &r.body);
            if (used != std::string::npos) {
                r.rawBody = pending->substr(0, used);
                pending->erase(0, used);
                r.complete = true;
                return r;
            }
        } else if (!cl.empty()) {
            const size_t need = static_cast<size_t>(std::stoull(cl));
            if (pending->size() >= need) {
                r.body = pending->substr(0, need);
                r.rawBody = r.body;
                pending->erase(0, need);
                r.complete = true;
                return r;
            }
        }
        if (remainingMs() == 0 || !recvMore(fd, pending, remainingMs())) {
            r.closed = true;
            if (te.empty() && cl.empty()) {
                r.body = *pending;
                r.rawBody = *pending;
                pending->clear();
                r.complete = true;
            } else {
                r.rawBody = *pending;
            }
            return r;
        }
    }
}

// True once the peer has closed (EOF or reset) within timeoutMs.
static bool waitClosed(int fd, int timeoutMs) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (!pollReadable(fd, 100)) continue;
        char buf[4096];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return true;
    }
    return false;
}

struct RawRequest {
    std::string head;
    std::string body;

    std::string requestLine() const { return head.substr(0, head.find("\r\n")); }
};

// Reads one request with a Content-Length (or no) body.
static bool readRequest(int fd, std::string* pending, RawRequest* out, int timeoutMs = 3000) {
    size_t hdrEnd;
    while ((hdrEnd = pending->find("\r\n\r\n")) == std::string::npos) {
        if (!recvMore(fd, pending, timeoutMs)) return false;
    }
    out->head = pending->substr(0, hdrEnd + 4);
    pending->erase(0, hdrEnd + 4);
    const std::string cl = headerValueCI(out->head, "Content-Length");
    const size_t need = cl.empty() ? 0 : static_cast<size_t>(std::stoull(cl));
    while (pending->size() < need) {
        if (!recvMore(fd, pending, timeoutMs)) return false;
    }
    out->body = pending->substr(0, need);
    pending->erase(0, need);
    return true;
}

// Accepts connections on a loopback port and runs handler(fd) for each one,
// one at a time, on its own thread.
class ScriptedBackend {
public:
    using Handler = std::function<void(int fd)>;

    explicit ScriptedBackend(Handler handler) : handler_(std::move(handler)) {
        auto port = bindEphemeralPort(&listenFd_);
        port_ = port ? *port : 0;
        thread_ = std::thread([this]() { Run(); });
    }

    ~ScriptedBackend() { Stop(); }

    void Stop() {
        stop_.store(true);
        if (thread_.joinable()) thread_.join();
        if (listenFd_ >= 0) {
            ::close(listenFd_);
            listenFd_ = -1;
        }
    }

    uint16_t port() const { return port_; }
    int accepted() const { return accepted_.load(); }
    bool stopping() const { return stop_.load(); }

private:
    void Run() {
        while (!stop_.load()) {
            if (!pollReadable(listenFd_, 100)) continue;
            int cfd = ::accept(listenFd_, nullptr, nullptr);
            if (cfd < 0) continue;
            accepted_.fetch_add(1);
            handler_(cfd);
            ::close(cfd);
        }
    }

    Handler handler_;
    int listenFd_{-1};
    uint16_t port_{0};
    std::atomic<bool> stop_{false};
    std::atomic<int> accepted_{0};
    std::thread thread_;
};

} // namespace testutil
