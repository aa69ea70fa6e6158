#include "devproxy/monitor/Stats.h"

#include <sstream>

namespace devproxy {
namespace monitor {

Stats& Stats::Instance() {
    static Stats instance;
    return instance;
}

std::string Stats::Summary() const {
    std::ostringstream os;
    os << "requests=" << GetTotalRequests()
       << " forwarded=" << GetForwardedRequests()
       << " unmatched=" << GetUnmatchedRequests()
       << " upstream_unavailable=" << GetUpstreamUnavailable()
       << " upstream_stream_errors=" << GetUpstreamStreamErrors()
       << " client_aborts=" << GetClientAborts()
       << " active_connections=" << GetActiveConnections()
       << " bytes_in=" << GetBytesIn()
       << " bytes_out=" << GetBytesOut();
    return os.str();
}

void Stats::Reset() {
    totalRequests_ = 0;
    unmatchedRequests_ = 0;
    forwardedRequests_ = 0;
    upstreamUnavailable_ = 0;
    upstreamStreamErrors_ = 0;
    clientAborts_ = 0;
    activeConnections_ = 0;
    bytesIn_ = 0;
    bytesOut_ = 0;
}

} // namespace monitor
} // namespace devproxy
