// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// HttpServer.cpp
// =================================================================
#include "HttpServer.h"
#include "JsonWriter.h"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>

namespace omnimon {

    namespace {
        constexpr size_t kMaxHeadBytes = 16 * 1024;
        constexpr int kRequestTimeoutMs = 10000;
        constexpr int kSendTimeoutMs = 5000;

#ifdef _WIN32
        constexpr int kSendFlags = 0;
        constexpr int kNoWaitSendFlags = 0;
#else
        constexpr int kSendFlags = MSG_NOSIGNAL;
        constexpr int kNoWaitSendFlags = MSG_NOSIGNAL | MSG_DONTWAIT;
#endif

        std::string toLower(std::string_view s) {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        std::string_view trim(std::string_view s) {
            while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
            while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
            return s;
        }

        bool sendAll(socket_t sock, std::string_view data) {
            size_t sent = 0;
            while (sent < data.size()) {
                const int n = ::send(sock, data.data() + sent, static_cast<int>(data.size() - sent), kSendFlags);
                if (n <= 0) return false;
                sent += static_cast<size_t>(n);
            }
            return true;
        }

        // 0 disables the timeout
        void setTimeout(socket_t sock, int option, int ms) {
#ifdef _WIN32
            DWORD tv = static_cast<DWORD>(ms);
            setsockopt(sock, SOL_SOCKET, option, reinterpret_cast<const char*>(&tv), sizeof(tv));
#else
            timeval tv{};
            tv.tv_sec = ms / 1000;
            tv.tv_usec = (ms % 1000) * 1000;
            setsockopt(sock, SOL_SOCKET, option, &tv, sizeof(tv));
#endif
        }

        void setRecvTimeout(socket_t sock, int ms) { setTimeout(sock, SO_RCVTIMEO, ms); }
        void setSendTimeout(socket_t sock, int ms) { setTimeout(sock, SO_SNDTIMEO, ms); }

        std::string closePayload(uint16_t code) {
            return { static_cast<char>(code >> 8), static_cast<char>(code & 0xFF) };
        }

        std::string errorBody(std::string_view message) {
            JsonWriter w;
            w.beginObject();
            w.field("ok", false);
            w.field("error", message);
            w.endObject();
            return w.str();
        }

        HttpResponse errorResponse(int status, std::string_view message) {
            HttpResponse r;
            r.status = status;
            r.body = errorBody(message);
            return r;
        }
    }

    // ---------------- Request / response ----------------

    std::optional<std::string> HttpRequest::header(std::string_view name) const {
        auto it = headers.find(toLower(name));
        if (it == headers.end()) return std::nullopt;
        return it->second;
    }

    bool HttpRequest::isWebSocketUpgrade() const {
        if (method != "GET") return false;
        auto upgrade = header("upgrade");
        auto connection = header("connection");
        auto key = header("sec-websocket-key");
        if (!upgrade || !connection || !key || key->empty()) return false;
        return toLower(*upgrade).find("websocket") != std::string::npos
            && toLower(*connection).find("upgrade") != std::string::npos;
    }

    const char* reasonPhrase(int status) {
        switch (status) {
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        default:  return "Unknown";
        }
    }

    std::expected<HttpRequest, MonitorError> parseRequestHead(std::string_view head) {
        HttpRequest req;
        const auto lineEnd = head.find("\r\n");
        std::string_view requestLine = head.substr(0, lineEnd);

        const auto sp1 = requestLine.find(' ');
        const auto sp2 = requestLine.rfind(' ');
        if (sp1 == std::string_view::npos || sp2 == sp1) return std::unexpected(MonitorError::InvalidValue);
        req.method = std::string(requestLine.substr(0, sp1));
        req.target = std::string(requestLine.substr(sp1 + 1, sp2 - sp1 - 1));
        req.version = std::string(requestLine.substr(sp2 + 1));
        if (req.target.empty() || req.target.front() != '/' || req.version.rfind("HTTP/", 0) != 0) {
            return std::unexpected(MonitorError::InvalidValue);
        }

        const auto q = req.target.find('?');
        req.path = req.target.substr(0, q);
        if (q != std::string::npos) req.query = req.target.substr(q + 1);

        if (lineEnd == std::string_view::npos) return req;
        std::string_view rest = head.substr(lineEnd + 2);
        while (!rest.empty()) {
            const auto end = rest.find("\r\n");
            std::string_view line = rest.substr(0, end);
            rest = end == std::string_view::npos ? std::string_view{} : rest.substr(end + 2);
            if (line.empty()) continue;
            const auto colon = line.find(':');
            if (colon == std::string_view::npos) return std::unexpected(MonitorError::InvalidValue);
            req.headers[toLower(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
        }
        return req;
    }

    std::string serializeResponse(const HttpResponse& response) {
        std::ostringstream out;
        out << "HTTP/1.1 " << response.status << ' ' << reasonPhrase(response.status) << "\r\n";
        if (!response.body.empty()) out << "Content-Type: " << response.contentType << "\r\n";
        out << "Content-Length: " << response.body.size() << "\r\n";
        out << "Connection: close\r\n";
        for (const auto& [name, value] : response.headers) {
            out << name << ": " << value << "\r\n";
        }
        out << "\r\n" << response.body;
        return out.str();
    }

    // ---------------- WebSocketSession ----------------

    WebSocketSession::WebSocketSession(socket_t sock, std::string buffered)
        : sock_(sock), readBuf_(std::move(buffered)) {}

    bool WebSocketSession::sendFrame(WsOpcode opcode, std::string_view payload) {
        std::lock_guard<std::mutex> lock(sendMtx);
        if (closeSent_ || cancelled_.requested()) return false;
        if (opcode == WsOpcode::Close) closeSent_ = true;
        return sendAll(sock_, encodeFrame(opcode, payload));
    }

    bool WebSocketSession::sendText(std::string_view text) {
        return sendFrame(WsOpcode::Text, text);
    }

    bool WebSocketSession::sendPing() {
        return sendFrame(WsOpcode::Ping, {});
    }

    bool WebSocketSession::sendPong(std::string_view payload) {
        return sendFrame(WsOpcode::Pong, payload);
    }

    bool WebSocketSession::sendClose(uint16_t code) {
        return sendFrame(WsOpcode::Close, closePayload(code));
    }

    std::expected<WsFrame, MonitorError> WebSocketSession::readFrame() {
        char chunk[4096];
        while (true) {
            auto decoded = decodeFrame(readBuf_, true);
            if (!decoded) return std::unexpected(decoded.error());
            if (*decoded) return std::move(**decoded);

            const int n = ::recv(sock_, chunk, sizeof(chunk), 0);
            if (n <= 0) return std::unexpected(MonitorError::IOError);
            readBuf_.append(chunk, static_cast<size_t>(n));
        }
    }

    void WebSocketSession::cancel() {
        cancelled_.request();
        {
            // A sender stuck on a peer that stopped reading holds the lock: skip the close frame
            std::unique_lock<std::mutex> lock(sendMtx, std::try_to_lock);
            if (lock.owns_lock() && !closeSent_) {
                closeSent_ = true;
                const std::string frame = encodeFrame(WsOpcode::Close, closePayload(1000));
                ::send(sock_, frame.data(), static_cast<int>(frame.size()), kNoWaitSendFlags);
            }
        }
        // Also fails any send still blocked on this socket
        shutdownBoth(sock_);
    }

    // ---------------- HttpServer ----------------

    HttpServer::HttpServer(RequestHandler onRequest, WebSocketHandler onWebSocket, std::string webSocketPath)
        : onRequest_(std::move(onRequest)), onWebSocket_(std::move(onWebSocket)),
          webSocketPath_(std::move(webSocketPath)), isRunning(false) {}

    HttpServer::~HttpServer() {
        stop();
        const socket_t listener = listenSock_.exchange(kInvalidSocket);
        if (listener != kInvalidSocket) closeSocket(listener);
#ifdef _WIN32
        if (wsaStarted_) WSACleanup();
#endif
    }

    std::expected<void, MonitorError> HttpServer::listen(const std::string& address, int port) {
#ifdef _WIN32
        if (!wsaStarted_) {
            WSADATA wsaData;
            if (WSAStartup(MAKEWORD(2, 2), &wsaData) != 0) {
                std::cerr << "[Server] WSAStartup failed." << std::endl;
                return std::unexpected(MonitorError::BindFailed);
            }
            wsaStarted_ = true;
        }
#endif
        socket_t sock = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
        if (sock == kInvalidSocket) {
            std::cerr << "[Server] socket() failed: " << lastSocketError() << std::endl;
            return std::unexpected(MonitorError::BindFailed);
        }

#ifndef _WIN32
        int reuse = 1;
        setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
#endif

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(port));
        if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
            std::cerr << "[Server] Invalid listen address: " << address << std::endl;
            closeSocket(sock);
            return std::unexpected(MonitorError::BindFailed);
        }

        if (::bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0
            || ::listen(sock, SOMAXCONN) != 0)
        {
            std::cerr << "[Server] Bind failed on " << address << ":" << port
                << " (error " << lastSocketError() << ")" << std::endl;
            closeSocket(sock);
            return std::unexpected(MonitorError::BindFailed);
        }

        sockaddr_in bound{};
        socklen_t len = sizeof(bound);
        if (getsockname(sock, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
            boundPort_ = ntohs(bound.sin_port);
        }
        else {
            boundPort_ = port;
        }
        listenSock_ = sock;
        std::cout << "[Server] Listening on " << address << ":" << boundPort_ << std::endl;
        return {};
    }

    void HttpServer::start() {
        if (isRunning || listenSock_ == kInvalidSocket) return;
        isRunning = true;
        acceptThread = std::thread(&HttpServer::acceptLoop, this);
    }

    void HttpServer::stop() {
        if (isRunning) {
            isRunning = false;

            // Wakes the blocked accept(); Winsock only does so on close
            const socket_t listener = listenSock_.exchange(kInvalidSocket);
            if (listener != kInvalidSocket) {
                shutdownBoth(listener);
#ifdef _WIN32
                closeSocket(listener);
#endif
            }

            {
                std::lock_guard<std::mutex> lock(connMtx);
                for (auto* session : sessions_) session->cancel();
                for (socket_t s : connections_) shutdownBoth(s);
            }

            if (acceptThread.joinable()) acceptThread.join();
#ifndef _WIN32
            if (listener != kInvalidSocket) closeSocket(listener);
#endif

            std::list<Worker> remaining;
            {
                std::lock_guard<std::mutex> lock(workersMtx);
                remaining.swap(workers_);
            }
            for (auto& w : remaining) {
                if (w.thread.joinable()) w.thread.join();
            }
            std::cout << "[Server] Stopped." << std::endl;
        }
    }

    void HttpServer::reapWorkers() {
        std::lock_guard<std::mutex> lock(workersMtx);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->done->load()) {
                if (it->thread.joinable()) it->thread.join();
                it = workers_.erase(it);
            }
            else {
                ++it;
            }
        }
    }

    void HttpServer::acceptLoop() {
        const socket_t listener = listenSock_.load();
        while (isRunning) {
            sockaddr_in peer{};
            socklen_t len = sizeof(peer);
            socket_t client = ::accept(listener, reinterpret_cast<sockaddr*>(&peer), &len);
            if (client == kInvalidSocket) {
                if (!isRunning) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                continue;
            }

            {
                std::lock_guard<std::mutex> lock(connMtx);
                if (!isRunning) {
                    closeSocket(client);
                    break;
                }
                connections_.insert(client);
            }

            reapWorkers();
            auto done = std::make_shared<std::atomic<bool>>(false);
            std::lock_guard<std::mutex> lock(workersMtx);
            workers_.push_back(Worker{ std::thread([this, client, done] {
                serveConnection(client);
                done->store(true);
            }), done });
        }
    }

    void HttpServer::serveConnection(socket_t client) {
        setRecvTimeout(client, kRequestTimeoutMs);
        setSendTimeout(client, kSendTimeoutMs);

        std::string buffer;
        char chunk[4096];
        size_t headEnd = std::string::npos;
        bool complete = true;
        while ((headEnd = buffer.find("\r\n\r\n")) == std::string::npos) {
            if (buffer.size() > kMaxHeadBytes) {
                sendAll(client, serializeResponse(errorResponse(431, "Request headers too large")));
                complete = false;
                break;
            }
            const int n = ::recv(client, chunk, sizeof(chunk), 0);
            if (n <= 0) {
                complete = false;
                break;
            }
            buffer.append(chunk, static_cast<size_t>(n));
        }

        if (complete) {
            auto request = parseRequestHead(std::string_view(buffer).substr(0, headEnd));
            if (!request) {
                sendAll(client, serializeResponse(errorResponse(400, "Malformed request")));
            }
            else if (request->path == webSocketPath_) {
                if (request->isWebSocketUpgrade()) {
                    serveWebSocket(client, *request, buffer.substr(headEnd + 4));
                }
                else {
                    HttpResponse bad;
                    bad.status = 400;
                    sendAll(client, serializeResponse(bad));
                }
            }
            else {
                HttpResponse response;
                try {
                    response = onRequest_(*request);
                }
                catch (const std::exception& e) {
                    std::cerr << "[Server] " << request->method << " " << request->path
                        << " failed: " << e.what() << std::endl;
                    response = errorResponse(500, e.what());
                }
                sendAll(client, serializeResponse(response));
            }
        }

        {
            std::lock_guard<std::mutex> lock(connMtx);
            connections_.erase(client);
        }
        shutdownBoth(client);
        closeSocket(client);
    }

    void HttpServer::serveWebSocket(socket_t client, const HttpRequest& request, std::string leftover) {
        auto accept = computeAcceptKey(*request.header("sec-websocket-key"));
        if (!accept) {
            sendAll(client, serializeResponse(errorResponse(500, describe(accept.error()))));
            return;
        }

        std::string handshake = "HTTP/1.1 101 Switching Protocols\r\n"
            "Upgrade: websocket\r\n"
            "Connection: Upgrade\r\n"
            "Sec-WebSocket-Accept: " + *accept + "\r\n\r\n";
        if (!sendAll(client, handshake)) return;

        setRecvTimeout(client, 0);
        WebSocketSession session(client, std::move(leftover));
        {
            std::lock_guard<std::mutex> lock(connMtx);
            if (!isRunning) return;
            sessions_.insert(&session);
        }

        try {
            onWebSocket_(request, session);
        }
        catch (const std::exception& e) {
            std::cerr << "[WS] Session failed: " << e.what() << std::endl;
        }
        session.cancel();

        std::lock_guard<std::mutex> lock(connMtx);
        sessions_.erase(&session);
    }

} // namespace omnimon
