#include "gateway/protocol/HttpContext.h"
#include "gateway/protocol/HttpResponse.h"
#include "gateway/protocol/HttpResponseContext.h"
#include "gateway/network/Buffer.h"
#include "gateway/common/Logger.h"
#include <cassert>

using namespace gateway::protocol;
using namespace gateway::network;
using namespace gateway::common;

void testParseRequest() {
    HttpContext context;
    Buffer buf;

    // Simulate partial arrival
    std::string inputPart1 = "GET /index.html?id=123 HTTP/1.1\r\nHost: ";
    std::string inputPart2 = "localhost\r\nUser-Agent: curl/7.68.0\r\nAccept: */*\r\n\r\n";

    buf.Append(inputPart1);
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(!context.gotAll());

    buf.Append(inputPart2);
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(context.gotAll());
    const HttpRequest& req = context.request();
    assert(req.method() == "GET");
    assert(req.path() == "/index.html");
    assert(req.query() == "?id=123");
    assert(req.getHeader("host") == "localhost");
    assert(req.getHeader("User-Agent") == "curl/7.68.0");
    LOG_INFO << "Parse Request PASS";
}

void testParseContentLengthBody() {
    HttpContext context;
    Buffer buf;
    std::string input =
        "POST /submit HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Length: 5\r\n"
        "\r\n"
        "hello";
    buf.Append(input);
    bool ok = context.parseRequest(&buf, std::chrono::system_clock::now());
    assert(ok);
    assert(context.gotAll());
    const HttpRequest& req = context.request();
    assert(req.method() == "POST");
    assert(req.path() == "/submit");
    assert(req.body() == "hello");
    LOG_INFO << "Parse Content-Length Body PASS";
}

void testParseChunkedBody() {
    HttpContext context;
    Buffer buf;
    std::string input =
        "POST /chunk HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "5\r\n"
        "hello\r\n"
        "0\r\n"
        "\r\n";
    buf.Append(input);
    bool ok = context.parseRequest(&buf, std::chrono::system_clock::now());
    assert(ok);
    assert(context.gotAll());
    const HttpRequest& req = context.request();
    assert(req.path() == "/chunk");
    assert(req.body() == "hello");
    LOG_INFO << "Parse Chunked Body PASS";
}

void testCustomMethodAndBadRequestLine() {
    HttpContext context;
    Buffer buf;
    buf.Append("PURGE /cache HTTP/1.1\r\nHost: x\r\n\r\n");
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(context.gotAll());
    assert(context.request().method() == "PURGE");

    HttpContext bad;
    Buffer junk;
    junk.Append("this is not http\r\n\r\n");
    assert(!bad.parseRequest(&junk, std::chrono::system_clock::now()));
    LOG_INFO << "Method tokens PASS";
}

void testResponseGen() {
    HttpResponse resp(true);
    resp.setStatusCode(HttpResponse::k200Ok);
    resp.setStatusMessage("OK");
    resp.setContentType("text/plain");
    resp.addHeader("Server", "datum-gateway");
    resp.setBody("Hello World");

    Buffer buf;
    resp.appendToBuffer(&buf);
    std::string output = buf.RetrieveAllAsString();
    assert(output.find("HTTP/1.1 200 OK\r\n") == 0);
    assert(output.find("Content-Length: 11\r\n") != std::string::npos);
    assert(output.find("Connection: close\r\n") != std::string::npos);
    assert(output.find("\r\n\r\nHello World") != std::string::npos);

    HttpResponse head = HttpResponse::Plain(200, "Hello World");
    head.setHeadOnly(true);
    head.addHeader("Content-Length", "11");
    Buffer headBuf;
    head.appendToBuffer(&headBuf);
    std::string headOut = headBuf.RetrieveAllAsString();
    assert(headOut.find("Content-Length: 11\r\n") != std::string::npos);
    assert(headOut.find("Hello World") == std::string::npos);
    LOG_INFO << "Response Gen PASS";
}

void testParseBackendResponse() {
    HttpResponseContext ctx;
    Buffer buf;
    buf.Append("HTTP/1.1 503 Service Unavailable\r\nContent-Length: 4\r\nRetry-After: 1\r\n\r\nbu");
    assert(ctx.parseResponse(&buf));
    assert(ctx.headersComplete());
    assert(!ctx.gotAll());
    buf.Append("sy");
    assert(ctx.parseResponse(&buf));
    assert(ctx.gotAll());
    assert(ctx.statusCode() == 503);
    assert(ctx.response().body() == "busy");
    assert(ctx.response().getHeader("retry-after") == "1");

    HttpResponseContext chunked;
    Buffer cbuf;
    cbuf.Append("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabc\r\n2\r\nde\r\n0\r\n\r\n");
    assert(chunked.parseResponse(&cbuf));
    assert(chunked.gotAll());
    assert(chunked.response().body() == "abcde");

    HttpResponseContext untilClose;
    Buffer ebuf;
    ebuf.Append("HTTP/1.0 200 OK\r\n\r\npartial");
    assert(untilClose.parseResponse(&ebuf));
    assert(!untilClose.gotAll());
    assert(untilClose.finishOnEof());
    assert(untilClose.response().body() == "partial");

    HttpResponseContext head(true);
    Buffer hbuf;
    hbuf.Append("HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\n");
    assert(head.parseResponse(&hbuf));
    assert(head.gotAll());

    HttpResponseContext garbage;
    Buffer gbuf;
    gbuf.Append("SSH-2.0-OpenSSH\r\n\r\n");
    assert(!garbage.parseResponse(&gbuf));
    assert(garbage.hasError());
    LOG_INFO << "Backend response parse PASS";
}

void testBufferLines() {
    Buffer buf;
    std::string line = "untouched";
    buf.Append("1a;ext=1\r");
    assert(!buf.RetrieveLine(&line));
    assert(line == "untouched");
    assert(buf.ReadableBytes() == 9);

    buf.Append("\nabc\n\r\n");
    assert(buf.RetrieveLine(&line));
    assert(line == "1a;ext=1");
    // a bare LF does not end a line
    assert(buf.RetrieveLine(&line));
    assert(line == "abc\n");
    assert(buf.ReadableBytes() == 0);

    buf.Append("\r");
    assert(!buf.RetrieveCRLF());
    buf.Append("\nX");
    assert(buf.RetrieveCRLF());
    assert(!buf.RetrieveCRLF());
    assert(buf.RetrieveAllAsString() == "X");
    LOG_INFO << "Buffer lines PASS";
}

void testChunkWithoutTerminatorRejected() {
    HttpContext request;
    Buffer in;
    in.Append("POST /up HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabcX\r\n0\r\n\r\n");
    assert(!request.parseRequest(&in, std::chrono::system_clock::now()));

    HttpResponseContext response;
    Buffer out;
    out.Append("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n2\r\nhi\r\n0\r\nX-Trailer: 1\r\n");
    assert(response.parseResponse(&out));
    assert(!response.gotAll());
    out.Append("\r\n");
    assert(response.parseResponse(&out));
    assert(response.gotAll());
    assert(response.response().body() == "hi");
    LOG_INFO << "Chunk terminator PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testParseRequest();
    testParseContentLengthBody();
    testParseChunkedBody();
    testCustomMethodAndBadRequestLine();
    testResponseGen();
    testParseBackendResponse();
    testBufferLines();
    testChunkWithoutTerminatorRejected();
    return 0;
}
