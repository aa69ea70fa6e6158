#include "devproxy/protocol/BodyFramer.h"
#include "devproxy/protocol/ChunkedEncoder.h"
#include "devproxy/common/Logger.h"
#include <cassert>
#include <string>

using namespace devproxy::protocol;
using namespace devproxy::common;

// Feeds text one byte at a time and returns how many bytes were taken.
static size_t feedBytewise(BodyFramer* f, const std::string& text) {
    size_t taken = 0;
    for (char c : text) {
        if (f->done() || f->hasError()) break;
        taken += f->consume(&c, 1);
    }
    return taken;
}

void testContentLength() {
    BodyFramer f;
    f.reset(BodyFramer::kContentLength, 5);
    const std::string in = "hel";
    assert(f.consume(in.data(), in.size()) == 3);
    assert(!f.done());
    const std::string rest = "loGET /next";
    assert(f.consume(rest.data(), rest.size()) == 2);
    assert(f.done());
    assert(f.payloadBytes() == 5);

    f.reset(BodyFramer::kContentLength, 0);
    assert(f.done());
    LOG_INFO << "Content-Length Framing PASS";
}

void testChunked() {
    const std::string body = "4\r\nWiki\r\n5;ext=1\r\npedia\r\nE\r\n in\r\n\r\nchunks.\r\n0\r\nX-Trailer: t\r\n\r\n";
    const std::string tail = "HTTP/1.1 200 OK\r\n";

    BodyFramer f;
    f.reset(BodyFramer::kChunked);
    const std::string all = body + tail;
    assert(f.consume(all.data(), all.size()) == body.size());
    assert(f.done());
    assert(f.payloadBytes() == 23);

    BodyFramer g;
    g.reset(BodyFramer::kChunked);
    assert(feedBytewise(&g, all) == body.size());
    assert(g.done());
    LOG_INFO << "Chunked Framing PASS";
}

void testChunkedErrors() {
    const char* bad[] = {
        "zz\r\nabc\r\n",
        "3\r\nabcX\r\n",
        "\r\n",
    };
    for (const char* text : bad) {
        BodyFramer f;
        f.reset(BodyFramer::kChunked);
        const std::string in = text;
        f.consume(in.data(), in.size());
        assert(f.hasError());
    }
    LOG_INFO << "Chunked Errors PASS";
}

void testEof() {
    BodyFramer f;
    f.reset(BodyFramer::kUntilClose);
    const std::string in = "anything at all";
    assert(f.consume(in.data(), in.size()) == in.size());
    assert(!f.done());
    f.onEof();
    assert(f.done());
    assert(!f.truncated());

    BodyFramer g;
    g.reset(BodyFramer::kContentLength, 10);
    g.consume(in.data(), 3);
    g.onEof();
    assert(g.hasError());
    assert(g.truncated());
    LOG_INFO << "EOF PASS";
}

void testChunkedEncoder() {
    ChunkedEncoder enc;
    std::string out;
    enc.encode("hello", 5, &out);
    enc.encode("", 0, &out);
    enc.encode("0123456789abcdefXYZ", 19, &out);
    assert(!enc.finished());
    enc.finish(&out);
    enc.finish(&out);
    assert(enc.finished());
    assert(enc.payloadBytes() == 24);
    assert(out == "5\r\nhello\r\n13\r\n0123456789abcdefXYZ\r\n0\r\n\r\n");

    // Whatever the encoder writes, the framer must read back as one complete body.
    BodyFramer f;
    f.reset(BodyFramer::kChunked);
    assert(f.consume(out.data(), out.size()) == out.size());
    assert(f.done());
    assert(f.payloadBytes() == 24);
    LOG_INFO << "Chunked Encoder PASS";
}

void testPayloadExtraction() {
    // Split mid-size-line and mid-data; only chunk data reaches the payload.
    const std::string wire = "5\r\nhello\r\n6;ext=1\r\n world\r\n0\r\nX-Trailer: t\r\n\r\nNEXT";
    BodyFramer f;
    f.reset(BodyFramer::kChunked);
    std::string payload;
    size_t used = f.consume(wire.data(), 1, &payload);
    used += f.consume(wire.data() + used, 5, &payload);
    assert(payload == "hel");
    used += f.consume(wire.data() + used, wire.size() - used, &payload);
    assert(f.done());
    assert(used == wire.size() - 4);
    assert(payload == "hello world");

    BodyFramer g;
    g.reset(BodyFramer::kContentLength, 4);
    payload.clear();
    assert(g.consume("abcdef", 6, &payload) == 4);
    assert(payload == "abcd");
    LOG_INFO << "Payload Extraction PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testContentLength();
    testChunked();
    testChunkedErrors();
    testEof();
    testChunkedEncoder();
    testPayloadExtraction();
    return 0;
}
