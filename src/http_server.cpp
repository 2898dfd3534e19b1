#include "http_server.hpp"
#include "logger.hpp"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>

using namespace std;

void beginRequest(HttpSession& session, const char* method, const char* path) {
    memset(&session, 0, sizeof(session));
    snprintf(session.method, sizeof(session.method), "%s", method);
    snprintf(session.path, sizeof(session.path), "%s", path ? path : "/");
}

bool appendBodyChunk(HttpSession& session, const char* data, size_t length) {
    if (session.bodyTooLarge || session.bodyLength + length > sizeof(session.body)) {
        session.bodyTooLarge = true;
        return false;
    }
    memcpy(session.body + session.bodyLength, data, length);
    session.bodyLength += length;
    return true;
}

HttpReply buildReply(ApiRoutes& routes, const HttpSession& session) {
    ApiResponse response;
    if (session.bodyTooLarge) {
        response = { 413, nlohmann::json{ {"error", "Request body too large"} } };
    } else {
        try {
            response = routes.handle(session.method, session.path, string(session.body, session.bodyLength));
        } catch (const exception& e) {
            LOG_ERROR(string("Request failed: ") + e.what());
            response = { 500, nlohmann::json{ {"error", e.what()} } };
        }
    }

    HttpReply reply;
    reply.status = response.status;
    reply.body = response.body.dump();
    if (reply.body.size() > MAX_RESPONSE_BODY) {
        LOG_ERRORF("Response for %s too large (%zu bytes)", session.path, reply.body.size());
        reply.status = 500;
        reply.body = R"({"error":"Response too large"})";
    }
    reply.headers.push_back({"access-control-allow-origin:", "*"});
    return reply;
}

HttpServer::HttpServer(ApiRoutes& routes, int port) : context(nullptr), routes(routes), port(port) {}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    struct lws_context_creation_info info;
    memset(&info, 0, sizeof info);

    // Only log errors and warnings
    lws_set_log_level(LLL_ERR | LLL_WARN, NULL);

    info.port = port;
    info.protocols = protocols;
    info.gid = -1;
    info.uid = -1;
    info.user = this;

    context = lws_create_context(&info);
    if (!context) {
        LOG_ERRORF("Failed to create HTTP server on port %d", port);
        return false;
    }
    LOG_INFOF("Server running on http://0.0.0.0:%d", port);
    return true;
}

void HttpServer::run(const atomic<bool>& quit) {
    if (!context) return;
    while (!quit) {
        if (lws_service(context, 50) < 0) {
            LOG_ERROR("HTTP service loop failed");
            break;
        }
    }
}

void HttpServer::stop() {
    if (context) {
        lws_context_destroy(context);
        context = nullptr;
    }
}

int HttpServer::respond(struct lws* wsi, HttpSession* session) {
    HttpReply reply = buildReply(routes, *session);
    memcpy(session->response, reply.body.data(), reply.body.size());
    session->responseLength = reply.body.size();

    // Headers
    unsigned char buffer[LWS_PRE + 512];
    unsigned char* start = &buffer[LWS_PRE];
    unsigned char* p = start;
    unsigned char* end = &buffer[sizeof(buffer) - 1];
    if (lws_add_http_common_headers(wsi, reply.status, reply.contentType.c_str(), reply.body.size(), &p, end)) return 1;
    for (const auto& header : reply.headers) {
        if (lws_add_http_header_by_name(wsi, (const unsigned char*)header.first.c_str(),
                                        (const unsigned char*)header.second.c_str(),
                                        (int)header.second.size(), &p, end)) return 1;
    }
    if (lws_finalize_write_http_header(wsi, start, &p, end)) return 1;

    // Body goes out when the socket is writable
    lws_callback_on_writable(wsi);
    return 0;
}

int HttpServer::callbackHttp(struct lws* wsi, enum lws_callback_reasons reason, void* user, void* in, size_t len) {
    auto* session = static_cast<HttpSession*>(user);
    switch (reason) {
        case LWS_CALLBACK_HTTP: {
            auto* server = static_cast<HttpServer*>(lws_context_user(lws_get_context(wsi)));
            const char* path = in ? static_cast<const char*>(in) : "/";

            if (lws_hdr_total_length(wsi, WSI_TOKEN_POST_URI) > 0) {
                beginRequest(*session, "POST", path);

                // Wait for the body if there is one
                char length[32] = {0};
                if (lws_hdr_copy(wsi, length, sizeof(length), WSI_TOKEN_HTTP_CONTENT_LENGTH) > 0 && atol(length) > 0) {
                    return 0;
                }
            } else if (lws_hdr_total_length(wsi, WSI_TOKEN_GET_URI) > 0) {
                beginRequest(*session, "GET", path);
            } else {
                beginRequest(*session, "OTHER", path);
            }
            return server->respond(wsi, session);
        }

        case LWS_CALLBACK_HTTP_BODY:
            if (in && len > 0 && !appendBodyChunk(*session, static_cast<const char*>(in), len)) {
                LOG_WARNF("Request body for %s over %zu bytes", session->path, MAX_REQUEST_BODY);
            }
            return 0;

        case LWS_CALLBACK_HTTP_BODY_COMPLETION: {
            auto* server = static_cast<HttpServer*>(lws_context_user(lws_get_context(wsi)));
            return server->respond(wsi, session);
        }

        case LWS_CALLBACK_HTTP_WRITEABLE: {
            if (!session || session->responseLength == 0) break;

            // libwebsockets needs LWS_PRE bytes of headroom before the payload
            size_t length = session->responseLength;
            vector<unsigned char> buf(LWS_PRE + length);
            memcpy(buf.data() + LWS_PRE, session->response, length);
            session->responseLength = 0;
            if (lws_write(wsi, buf.data() + LWS_PRE, length, LWS_WRITE_HTTP_FINAL) != static_cast<int>(length)) {
                return 1;
            }
            if (lws_http_transaction_completed(wsi)) {
                return -1;
            }
            return 0;
        }

        default:
            break;
    }
    return lws_callback_http_dummy(wsi, reason, user, in, len);
}

// Definition of the HTTP protocol
struct lws_protocols HttpServer::protocols[] = {
    {
        "http",
        HttpServer::callbackHttp,
        sizeof(HttpSession),
        0,
    },
    { nullptr, nullptr, 0, 0 }
};
