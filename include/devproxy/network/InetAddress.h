#pragma once

#include <netinet/in.h>
#include <string>

namespace devproxy {
namespace network {

// IPv4 endpoint.
class InetAddress {
public:
    explicit InetAddress(uint16_t port = 0, bool loopbackOnly = false);
    // ip must be a dotted quad; an unparsable string yields INADDR_NONE.
    InetAddress(const std::string& ip, uint16_t port);
    explicit InetAddress(const struct sockaddr_in& addr)
        : addr_(addr) {}

    sa_family_t family() const { return addr_.sin_family; }
    std::string toIp() const;
    std::string toIpPort() const;
    uint16_t toPort() const;
    bool valid() const { return addr_.sin_addr.s_addr != htonl(INADDR_NONE); }

    const struct sockaddr* getSockAddr() const { return reinterpret_cast<const struct sockaddr*>(&addr_); }
    void setSockAddr(const struct sockaddr_in& addr) { addr_ = addr; }

    // Blocking getaddrinfo lookup; only used while building configuration.
    // Returns false and leaves *out untouched if host has no IPv4 address.
    static bool Resolve(const std::string& host, uint16_t port, InetAddress* out);

    static InetAddress LocalOf(int sockfd);
    static InetAddress PeerOf(int sockfd);

private:
    struct sockaddr_in addr_;
};

} // namespace network
} // namespace devproxy
