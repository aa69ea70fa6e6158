#pragma once

#include "devproxy/protocol/HttpHeaders.h"

#include <string>

namespace devproxy {
namespace network {
class Buffer;
}

namespace protocol {

// Responses the dev server produces itself (fallback and proxy errors).
class HttpResponse {
public:
    enum HttpStatusCode {
        kUnknown,
        k200Ok = 200,
        k400BadRequest = 400,
        k404NotFound = 404,
        k431RequestHeaderFieldsTooLarge = 431,
        k500InternalServerError = 500,
        k502BadGateway = 502,
    };

    explicit HttpResponse(bool close)
        : statusCode_(kUnknown), closeConnection_(close) {}

    void setStatusCode(HttpStatusCode code) { statusCode_ = code; }
    HttpStatusCode statusCode() const { return statusCode_; }
    void setStatusMessage(const std::string& message) { statusMessage_ = message; }
    void setCloseConnection(bool on) { closeConnection_ = on; }
    bool closeConnection() const { return closeConnection_; }
    void setContentType(const std::string& contentType) { headers_.set("Content-Type", contentType); }
    void addHeader(const std::string& key, const std::string& value) { headers_.set(key, value); }

    void setBody(const std::string& body) { body_ = body; }
    const std::string& body() const { return body_; }
    // HEAD responses announce the length but carry no payload.
    void setHeadOnly(bool on) { headOnly_ = on; }

    void appendToBuffer(devproxy::network::Buffer* output) const;
    std::string toString() const;

    // Plain-text response with the standard reason phrase.
    static HttpResponse makeText(HttpStatusCode code, const std::string& body, bool close);
    static const char* reasonPhrase(HttpStatusCode code);

private:
    HttpStatusCode statusCode_;
    std::string statusMessage_;
    bool closeConnection_;
    bool headOnly_{false};
    HttpHeaders headers_;
    std::string body_;
};

} // namespace protocol
} // namespace devproxy
