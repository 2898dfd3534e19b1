#pragma once

#include "api_routes.hpp"
#include <atomic>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include <libwebsockets.h>

const size_t MAX_REQUEST_BODY = 4096;
const size_t MAX_RESPONSE_BODY = 8192;

// Per-connection state, allocated and zeroed by libwebsockets
struct HttpSession {
    char method[8];
    char path[256];
    char body[MAX_REQUEST_BODY];
    size_t bodyLength;
    bool bodyTooLarge;
    char response[MAX_RESPONSE_BODY];
    size_t responseLength;
};

// Status line, headers and body for one response
struct HttpReply {
    int status = 200;
    std::string contentType = "application/json";
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

// Clear the session and record the request line
void beginRequest(HttpSession& session, const char* method, const char* path);

// Add a body chunk. Returns false once the body passes MAX_REQUEST_BODY;
// the request is then answered with 413.
bool appendBodyChunk(HttpSession& session, const char* data, size_t length);

// Route a collected request. Exceptions become 500, and the body always
// fits MAX_RESPONSE_BODY.
HttpReply buildReply(ApiRoutes& routes, const HttpSession& session);

// Plain HTTP/1.1 listener on libwebsockets, serving ApiRoutes
class HttpServer {
public:
    HttpServer(ApiRoutes& routes, int port);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Create the listening context. Returns false if the port can't be bound.
    bool start();

    // Service loop, returns once quit is set
    void run(const std::atomic<bool>& quit);

    void stop();

private:
    static int callbackHttp(struct lws* wsi, enum lws_callback_reasons reason, void* user, void* in, size_t len);
    int respond(struct lws* wsi, HttpSession* session);

    static struct lws_protocols protocols[];
    struct lws_context* context;
    ApiRoutes& routes;
    int port;
};
