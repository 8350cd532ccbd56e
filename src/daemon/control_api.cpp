// src/daemon/control_api.cpp
#include "control_api.h"
#include <openssl/crypto.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>
#include <iostream>
#include <sstream>
#include <algorithm>
#include <cstring>
#include <cerrno>
#include <cctype>

namespace logwarden {
namespace daemon {

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(tolower(c)); });
    return s;
}

std::string Trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

std::string UrlDecode(const std::string& s) {
    std::string out;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size() &&
            isxdigit(static_cast<unsigned char>(s[i + 1])) &&
            isxdigit(static_cast<unsigned char>(s[i + 2]))) {
            out += static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else if (s[i] == '+') {
            out += ' ';
        } else {
            out += s[i];
        }
    }
    return out;
}

const char* ReasonPhrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
    }
    return "Unknown";
}

} // namespace

std::string HttpRequest::Header(const std::string& name) const {
    auto it = headers.find(ToLower(name));
    return it == headers.end() ? "" : it->second;
}

HttpReply HttpReply::Ok(nlohmann::json extra) {
    HttpReply reply;
    reply.status = 200;
    reply.body = {{"ok", true}};
    if (extra.is_object()) {
        reply.body.update(extra);
    }
    return reply;
}

HttpReply HttpReply::Error(int status, const std::string& message) {
    HttpReply reply;
    reply.status = status;
    reply.body = {{"ok", false}, {"error", message}};
    return reply;
}

ControlApi::ControlApi()
    : socket_fd_(-1), bound_port_(0), running_(false) {
}

ControlApi::~ControlApi() {
    Stop();
}

bool ControlApi::Initialize(const std::string& address, int port) {
    if (!IsLoopbackAddress(address)) {
        std::cerr << "Control API must bind a loopback address, got " << address << std::endl;
        return false;
    }

    bool is_v6 = address.find(':') != std::string::npos;
    socket_fd_ = socket(is_v6 ? AF_INET6 : AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (socket_fd_ < 0) {
        std::cerr << "Failed to create socket: " << strerror(errno) << std::endl;
        return false;
    }

    int optval = 1;
    setsockopt(socket_fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

    int rc;
    if (is_v6) {
        struct sockaddr_in6 addr;
        memset(&addr, 0, sizeof(addr));
        addr.sin6_family = AF_INET6;
        addr.sin6_port = htons(static_cast<uint16_t>(port));
        inet_pton(AF_INET6, address.c_str(), &addr.sin6_addr);
        rc = bind(socket_fd_, (struct sockaddr*)&addr, sizeof(addr));
    } else {
        struct sockaddr_in addr;
        memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(port));
        inet_pton(AF_INET, address.c_str(), &addr.sin_addr);
        rc = bind(socket_fd_, (struct sockaddr*)&addr, sizeof(addr));
    }

    if (rc < 0) {
        std::cerr << "Failed to bind control API to " << address << ":" << port
                  << ": " << strerror(errno) << std::endl;
        close(socket_fd_);
        socket_fd_ = -1;
        return false;
    }

    if (listen(socket_fd_, 16) < 0) {
        std::cerr << "Failed to listen on control API socket: " << strerror(errno) << std::endl;
        close(socket_fd_);
        socket_fd_ = -1;
        return false;
    }

    struct sockaddr_storage bound;
    socklen_t bound_len = sizeof(bound);
    if (getsockname(socket_fd_, (struct sockaddr*)&bound, &bound_len) == 0) {
        bound_port_ = ntohs(bound.ss_family == AF_INET6
                                ? ((struct sockaddr_in6*)&bound)->sin6_port
                                : ((struct sockaddr_in*)&bound)->sin_port);
    }

    std::cout << "✓ Control API listening on " << address << ":" << bound_port_ << std::endl;
    return true;
}

bool ControlApi::Start() {
    if (socket_fd_ < 0) {
        std::cerr << "Control API not initialized" << std::endl;
        return false;
    }
    if (running_.exchange(true)) {
        return true;
    }

    thread_ = std::thread(&ControlApi::Run, this);
    return true;
}

void ControlApi::Stop() {
    bool was_running = running_.exchange(false);

    if (was_running && thread_.joinable()) {
        thread_.join();
    }

    if (socket_fd_ >= 0) {
        close(socket_fd_);
        socket_fd_ = -1;
    }
}

void ControlApi::RegisterRoute(const std::string& method, const std::string& path,
                               RouteHandler handler) {
    routes_[{method, path}] = std::move(handler);
}

void ControlApi::SetToken(const std::string& token) {
    std::lock_guard<std::mutex> lock(token_mutex_);
    token_ = token;
}

void ControlApi::Run() {
    while (running_) {
        struct pollfd pfd;
        pfd.fd = socket_fd_;
        pfd.events = POLLIN;

        // Short timeout so Stop() is noticed
        int rc = poll(&pfd, 1, 500);
        if (rc <= 0) {
            if (rc < 0 && errno != EINTR) {
                std::cerr << "Control API poll failed: " << strerror(errno) << std::endl;
            }
            continue;
        }

        struct sockaddr_storage client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept4(socket_fd_, (struct sockaddr*)&client_addr, &client_len, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (errno != EINTR && errno != EAGAIN) {
                std::cerr << "Accept failed: " << strerror(errno) << std::endl;
            }
            continue;
        }

        char host[INET6_ADDRSTRLEN] = {0};
        if (client_addr.ss_family == AF_INET6) {
            inet_ntop(AF_INET6, &((struct sockaddr_in6*)&client_addr)->sin6_addr, host, sizeof(host));
        } else if (client_addr.ss_family == AF_INET) {
            inet_ntop(AF_INET, &((struct sockaddr_in*)&client_addr)->sin_addr, host, sizeof(host));
        }

        // Handle client in same thread (requests are small and fast)
        HandleClient(client_fd, host);
        close(client_fd);
    }
}

void ControlApi::HandleClient(int client_fd, const std::string& peer_address) {
    struct timeval tv;
    tv.tv_sec = READ_TIMEOUT_SECONDS;
    tv.tv_usec = 0;
    setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    // Read the request head
    std::string raw;
    size_t head_end = std::string::npos;
    char buffer[4096];

    while (head_end == std::string::npos) {
        ssize_t bytes = read(client_fd, buffer, sizeof(buffer));
        if (bytes <= 0) {
            return;  // Closed or timed out before a full head arrived
        }
        raw.append(buffer, static_cast<size_t>(bytes));
        head_end = raw.find("\r\n\r\n");
        if (head_end == std::string::npos && raw.size() > MAX_HEADER_SIZE) {
            SendReply(client_fd, HttpReply::Error(400, "request header too large"));
            return;
        }
    }

    HttpRequest request;
    if (!ParseRequestHead(raw.substr(0, head_end), request)) {
        SendReply(client_fd, HttpReply::Error(400, "malformed request"));
        return;
    }
    request.peer_address = peer_address;
    request.peer_loopback = IsLoopbackAddress(peer_address);

    // Authorization is decided on the head alone, before any body is read
    int denied = Authorize(request);
    if (denied != 0) {
        SendReply(client_fd, HttpReply::Error(denied, denied == 403 ? "forbidden" : "unauthorized"));
        return;
    }

    if (!request.Header("transfer-encoding").empty()) {
        SendReply(client_fd, HttpReply::Error(400, "chunked bodies are not supported"));
        return;
    }

    size_t content_length = 0;
    std::string length_header = request.Header("content-length");
    if (!length_header.empty()) {
        if (length_header.size() > 10 ||
            length_header.find_first_not_of("0123456789") != std::string::npos) {
            SendReply(client_fd, HttpReply::Error(400, "invalid content-length"));
            return;
        }
        content_length = std::stoul(length_header);
    }
    if (content_length > MAX_BODY_SIZE) {
        SendReply(client_fd, HttpReply::Error(413, "body too large"));
        return;
    }

    request.body = raw.substr(head_end + 4);
    while (request.body.size() < content_length) {
        ssize_t bytes = read(client_fd, buffer, sizeof(buffer));
        if (bytes <= 0) {
            SendReply(client_fd, HttpReply::Error(400, "incomplete body"));
            return;
        }
        request.body.append(buffer, static_cast<size_t>(bytes));
    }
    request.body.resize(content_length);

    HttpReply reply = Dispatch(request);
    SendReply(client_fd, reply);

    if (reply.after_send) {
        // Let the client see the end of the reply before the action runs
        shutdown(client_fd, SHUT_WR);
        try {
            reply.after_send();
        } catch (const std::exception& e) {
            std::cerr << "Control API action failed: " << e.what() << std::endl;
        }
    }
}

int ControlApi::Authorize(const HttpRequest& request) const {
    if (!request.peer_loopback) {
        std::cerr << "Rejected control request from non-loopback peer "
                  << request.peer_address << std::endl;
        return 403;
    }

    std::string token;
    {
        std::lock_guard<std::mutex> lock(token_mutex_);
        token = token_;
    }

    auto it = request.headers.find("x-agent-token");
    if (token.empty() || it == request.headers.end() || !TokensEqual(it->second, token)) {
        return 401;
    }
    return 0;
}

HttpReply ControlApi::Dispatch(const HttpRequest& request) {
    int denied = Authorize(request);
    if (denied != 0) {
        return HttpReply::Error(denied, denied == 403 ? "forbidden" : "unauthorized");
    }

    if (request.body.size() > MAX_BODY_SIZE) {
        return HttpReply::Error(413, "body too large");
    }

    auto it = routes_.find({request.method, request.path});
    if (it == routes_.end()) {
        return HttpReply::Error(404, "not found");
    }

    try {
        return it->second(request);
    } catch (const std::exception& e) {
        std::cerr << "Control API handler " << request.path << " failed: " << e.what() << std::endl;
        return HttpReply::Error(500, "internal error");
    }
}

bool ControlApi::SendReply(int client_fd, const HttpReply& reply) {
    std::string data = SerializeReply(reply);
    size_t sent = 0;

    while (sent < data.size()) {
        ssize_t n = send(client_fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool ControlApi::ParseRequestHead(const std::string& head, HttpRequest& request) {
    std::istringstream iss(head);
    std::string line;

    if (!std::getline(iss, line)) {
        return false;
    }
    line = Trim(line);

    std::istringstream request_line(line);
    std::string target, version;
    if (!(request_line >> request.method >> target >> version)) {
        return false;
    }
    if (version.compare(0, 5, "HTTP/") != 0 || target.empty() || target[0] != '/') {
        return false;
    }

    size_t question = target.find('?');
    request.path = target.substr(0, question);
    if (question != std::string::npos) {
        std::istringstream qs(target.substr(question + 1));
        std::string pair;
        while (std::getline(qs, pair, '&')) {
            if (pair.empty()) continue;
            size_t eq = pair.find('=');
            std::string key = UrlDecode(pair.substr(0, eq));
            std::string value = eq == std::string::npos ? "" : UrlDecode(pair.substr(eq + 1));
            request.query[key] = value;
        }
    }

    while (std::getline(iss, line)) {
        line = Trim(line);
        if (line.empty()) continue;

        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return false;
        }
        request.headers[ToLower(Trim(line.substr(0, colon)))] = Trim(line.substr(colon + 1));
    }

    return true;
}

std::string ControlApi::SerializeReply(const HttpReply& reply) {
    std::string body = reply.body.is_null() ? "{}" : reply.body.dump();

    std::ostringstream oss;
    oss << "HTTP/1.1 " << reply.status << " " << ReasonPhrase(reply.status) << "\r\n"
        << "Content-Type: application/json\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "Connection: close\r\n"
        << "\r\n"
        << body;
    return oss.str();
}

bool ControlApi::IsLoopbackAddress(const std::string& address) {
    struct in_addr v4;
    if (inet_pton(AF_INET, address.c_str(), &v4) == 1) {
        return (ntohl(v4.s_addr) >> 24) == 127;
    }

    struct in6_addr v6;
    if (inet_pton(AF_INET6, address.c_str(), &v6) == 1) {
        if (IN6_IS_ADDR_LOOPBACK(&v6)) {
            return true;
        }
        // ::ffff:127.x.x.x
        return IN6_IS_ADDR_V4MAPPED(&v6) && v6.s6_addr[12] == 127;
    }

    return false;
}

bool ControlApi::TokensEqual(const std::string& a, const std::string& b) {
    if (a.size() != b.size() || a.empty()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace daemon
} // namespace logwarden
