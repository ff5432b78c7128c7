#include "portico/protocol/RequestParser.h"
#include "portico/network/Buffer.h"
#include "portico/common/Logger.h"

#include <cassert>
#include <string>
#include <vector>

using namespace portico::protocol;
using namespace portico::network;
using namespace portico::common;

struct Body {
    std::string data;
    int lastCount = 0;
    int calls = 0;

    RequestParser::BodyCallback callback() {
        return [this](const char* p, size_t n, bool last) {
            ++calls;
            data.append(p, n);
            if (last) ++lastCount;
        };
    }
};

void testParseRequest() {
    RequestParser parser;
    Buffer buf;

    // Simulate partial arrival
    buf.Append("GeT /index.html?id=123&x HTTP/1.1\r\nHost: ");
    assert(parser.parseHead(&buf));
    assert(!parser.headComplete());

    buf.Append("localhost\r\nX-Dup: 1\r\nx-dup: 2\r\nUser-Agent:  curl/7.68.0  \r\n\r\n");
    assert(parser.parseHead(&buf));
    assert(parser.headComplete());

    const RequestHead& head = parser.head();
    assert(head.method() == "GeT");
    assert(head.path() == "/index.html");
    assert(head.query() == "id=123&x");
    assert(head.version() == RequestHead::kHttp11);
    assert(head.header("host") == "localhost");
    assert(head.header("User-Agent") == "curl/7.68.0");
    assert(head.headers().size() == 4);
    assert(head.keepAlive());

    Body body;
    assert(parser.parseBody(&buf, body.callback()));
    assert(parser.complete());
    assert(body.calls == 1 && body.lastCount == 1 && body.data.empty());
    LOG_INFO << "Parse request PASS";
}

void testContentLengthBodyInPieces() {
    RequestParser parser;
    Buffer buf;
    buf.Append("POST /submit HTTP/1.1\r\nContent-Length: 10\r\n\r\nhello");
    assert(parser.parseHead(&buf));
    Body body;
    assert(parser.parseBody(&buf, body.callback()));
    assert(!parser.complete());
    assert(body.data == "hello" && body.lastCount == 0);

    // The next request's bytes stay in the buffer.
    buf.Append("worldGET / HTTP/1.1\r\n\r\n");
    assert(parser.parseBody(&buf, body.callback()));
    assert(parser.complete());
    assert(body.data == "helloworld" && body.lastCount == 1);
    assert(std::string(buf.Peek(), buf.ReadableBytes()) == "GET / HTTP/1.1\r\n\r\n");

    parser.reset();
    assert(parser.parseHead(&buf));
    assert(parser.headComplete());
    assert(parser.head().method() == "GET");
    LOG_INFO << "Content-Length body PASS";
}

void testChunkedBody() {
    RequestParser parser;
    Buffer buf;
    buf.Append("POST /up HTTP/1.1\r\nTransfer-Encoding: gzip, chunked\r\nContent-Length: 99\r\n\r\n");
    assert(parser.parseHead(&buf));
    assert(parser.chunked());

    Body body;
    buf.Append("5;ext=1\r\nhel");
    assert(parser.parseBody(&buf, body.callback()));
    buf.Append("lo\r\n6\r\n world\r\n0\r\nX-Trailer: t\r\n");
    assert(parser.parseBody(&buf, body.callback()));
    assert(!parser.complete());
    buf.Append("\r\n");
    assert(parser.parseBody(&buf, body.callback()));
    assert(parser.complete());
    assert(body.data == "hello world");
    assert(body.lastCount == 1);
    LOG_INFO << "Chunked body PASS";
}

void testMalformedInput() {
    {
        RequestParser parser;
        Buffer buf;
        buf.Append("GET /nover\r\n\r\n");
        assert(!parser.parseHead(&buf));
    }
    {
        RequestParser parser;
        Buffer buf;
        buf.Append("GET / HTTP/2.0\r\n\r\n");
        assert(!parser.parseHead(&buf));
    }
    {
        RequestParser parser;
        Buffer buf;
        buf.Append("POST / HTTP/1.1\r\nContent-Length: 12abc\r\n\r\n");
        assert(!parser.parseHead(&buf));
    }
    {
        RequestParser parser;
        Buffer buf;
        buf.Append("POST / HTTP/1.1\r\nTransfer-Encoding: gzip\r\n\r\n");
        assert(!parser.parseHead(&buf));
    }
    {
        RequestParser parser;
        Buffer buf;
        buf.Append("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n");
        assert(parser.parseHead(&buf));
        Body body;
        assert(!parser.parseBody(&buf, body.callback()));
    }
    {
        RequestParser parser;
        Buffer buf;
        buf.Append("GET / HTTP/1.1\r\nNoColonHere\r\n\r\n");
        assert(!parser.parseHead(&buf));
    }
    {
        RequestParser parser;
        Buffer buf;
        buf.Append("GET / HTTP/1.1\r\nX-Big: ");
        buf.Append(std::string(RequestParser::kMaxHeaderBytes, 'a'));
        assert(!parser.parseHead(&buf));
    }
    LOG_INFO << "Malformed input PASS";
}

void testKeepAliveRules() {
    RequestParser parser;
    Buffer buf;
    buf.Append("\r\nGET / HTTP/1.0\r\nConnection: Keep-Alive\r\n\r\n");
    assert(parser.parseHead(&buf));
    assert(parser.head().version() == RequestHead::kHttp10);
    assert(parser.head().keepAlive());

    parser.reset();
    buf.Append("GET / HTTP/1.0\r\n\r\n");
    assert(parser.parseHead(&buf));
    assert(!parser.head().keepAlive());

    parser.reset();
    buf.Append("GET / HTTP/1.1\r\nConnection: upgrade, close\r\n\r\n");
    assert(parser.parseHead(&buf));
    assert(!parser.head().keepAlive());
    LOG_INFO << "Keep-alive PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testParseRequest();
    testContentLengthBodyInPieces();
    testChunkedBody();
    testMalformedInput();
    testKeepAliveRules();
    return 0;
}
