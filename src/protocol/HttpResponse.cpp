#include "devproxy/protocol/HttpResponse.h"
#include "devproxy/network/Buffer.h"

#include <cstdio>

namespace devproxy {
namespace protocol {

const char* HttpResponse::reasonPhrase(HttpStatusCode code) {
    switch (code) {
        case k200Ok: return "OK";
        case k400BadRequest: return "Bad Request";
        case k404NotFound: return "Not Found";
        case k431RequestHeaderFieldsTooLarge: return "Request Header Fields Too Large";
        case k500InternalServerError: return "Internal Server Error";
        case k502BadGateway: return "Bad Gateway";
        default: return "Unknown";
    }
}

HttpResponse HttpResponse::makeText(HttpStatusCode code, const std::string& body, bool close) {
    HttpResponse resp(close);
    resp.setStatusCode(code);
    resp.setStatusMessage(reasonPhrase(code));
    resp.setContentType("text/plain; charset=utf-8");
    resp.setBody(body);
    return resp;
}

std::string HttpResponse::toString() const {
    std::string out;
    char buf[64];
    snprintf(buf, sizeof buf, "HTTP/1.1 %d ", static_cast<int>(statusCode_));
    out.append(buf);
    out.append(statusMessage_);
    out.append("\r\n");

    snprintf(buf, sizeof buf, "Content-Length: %zu\r\n", body_.size());
    out.append(buf);
    out.append(closeConnection_ ? "Connection: close\r\n" : "Connection: keep-alive\r\n");
    headers_.appendTo(&out);
    out.append("\r\n");
    if (!headOnly_) {
        out.append(body_);
    }
    return out;
}

void HttpResponse::appendToBuffer(devproxy::network::Buffer* output) const {
    output->Append(toString());
}

} // namespace protocol
} // namespace devproxy
