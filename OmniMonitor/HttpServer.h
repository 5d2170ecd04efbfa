// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// HttpServer.h
// Minimal HTTP/1.1 listener on blocking sockets: one accept thread,
// one thread per connection, RFC 6455 upgrade on a single path.
// =================================================================
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>
#include "MonitorError.h"
#include "ShutdownSignal.h"
#include "SocketCompat.h"
#include "WebSocketFrame.h"

namespace omnimon {

    struct HttpRequest {
        std::string method;
        std::string target;
        std::string path;
        std::string query;
        std::string version;
        std::map<std::string, std::string> headers;   // lower-case names

        std::optional<std::string> header(std::string_view name) const;
        bool isWebSocketUpgrade() const;
    };

    struct HttpResponse {
        int status = 200;
        std::string contentType = "application/json; charset=utf-8";
        std::vector<std::pair<std::string, std::string>> headers;
        std::string body;
    };

    const char* reasonPhrase(int status);

    // Parses the request line and headers (everything before the blank line)
    std::expected<HttpRequest, MonitorError> parseRequestHead(std::string_view head);

    std::string serializeResponse(const HttpResponse& response);

    // One upgraded connection. Sends are serialized; reads belong to one thread.
    class WebSocketSession {
    public:
        WebSocketSession(socket_t sock, std::string buffered);

        WebSocketSession(const WebSocketSession&) = delete;
        WebSocketSession& operator=(const WebSocketSession&) = delete;

        bool sendText(std::string_view text);
        bool sendPing();
        bool sendPong(std::string_view payload);
        bool sendClose(uint16_t code = 1000);

        // Blocks for the next client frame; fails on EOF, transport error or protocol violation
        std::expected<WsFrame, MonitorError> readFrame();

        // Ends both directions without waiting on a stalled sender: wakes waiters,
        // sends a close frame only if the socket is free, then shuts it down
        void cancel();
        bool cancelled() const { return cancelled_.requested(); }

        // Sleeps up to `timeout`; true once the session is cancelled
        bool waitCancelled(std::chrono::milliseconds timeout) const { return cancelled_.waitFor(timeout); }

    private:
        bool sendFrame(WsOpcode opcode, std::string_view payload);

        socket_t sock_;
        std::mutex sendMtx;
        bool closeSent_ = false;
        std::string readBuf_;
        ShutdownSignal cancelled_;
    };

    class HttpServer {
    public:
        using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;
        using WebSocketHandler = std::function<void(const HttpRequest&, WebSocketSession&)>;

        HttpServer(RequestHandler onRequest, WebSocketHandler onWebSocket, std::string webSocketPath = "/ws");
        ~HttpServer();

        HttpServer(const HttpServer&) = delete;
        HttpServer& operator=(const HttpServer&) = delete;

        // Binds and listens; port 0 picks an ephemeral port. Fails with BindFailed.
        std::expected<void, MonitorError> listen(const std::string& address, int port);
        void start();
        void stop();

        int boundPort() const { return boundPort_; }

    private:
        struct Worker {
            std::thread thread;
            std::shared_ptr<std::atomic<bool>> done;
        };

        void acceptLoop();
        void serveConnection(socket_t client);
        void serveWebSocket(socket_t client, const HttpRequest& request, std::string leftover);
        void reapWorkers();

        RequestHandler onRequest_;
        WebSocketHandler onWebSocket_;
        const std::string webSocketPath_;

        std::atomic<socket_t> listenSock_{ kInvalidSocket };
        int boundPort_ = 0;
        bool wsaStarted_ = false;

        std::atomic<bool> isRunning;
        std::thread acceptThread;

        std::mutex workersMtx;
        std::list<Worker> workers_;

        std::mutex connMtx;
        std::set<socket_t> connections_;
        std::set<WebSocketSession*> sessions_;
    };

} // namespace omnimon
