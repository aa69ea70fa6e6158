#pragma once

#include "devproxy/protocol/HttpContext.h"
#include "devproxy/router/ForwardSession.h"

#include <memory>

namespace devproxy {

// Per client connection state, stored in TcpConnection's context.
// One exchange at a time: while session is set, later requests stay buffered.
struct ClientContext {
    protocol::HttpContext http;
    router::ForwardSessionPtr session;
    // Shutdown was requested; further input is discarded.
    bool closing{false};
};

using ClientContextPtr = std::shared_ptr<ClientContext>;

} // namespace devproxy
