#pragma once

#include "devproxy/common/noncopyable.h"

#include <string>

struct ssl_ctx_st;

namespace devproxy {
namespace network {

// Client-side OpenSSL context used for https upstream targets.
class TlsContext : devproxy::common::noncopyable {
public:
    TlsContext();
    ~TlsContext();

    // verifyPeer: require a certificate chain that validates against caFile
    // (or the system trust store when caFile is empty).
    bool InitClient(bool verifyPeer, const std::string& caFile = std::string());

    ssl_ctx_st* ctx() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }
    bool verifyPeer() const { return verifyPeer_; }

    // Most recent OpenSSL error queue entry as text, or empty.
    static std::string LastError();

private:
    ssl_ctx_st* ctx_{nullptr};
    bool verifyPeer_{false};
};

} // namespace network
} // namespace devproxy
