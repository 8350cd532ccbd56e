// src/daemon/control_api.h
#ifndef LOGWARDEN_CONTROL_API_H
#define LOGWARDEN_CONTROL_API_H

#include <nlohmann/json.hpp>
#include <string>
#include <map>
#include <functional>
#include <thread>
#include <atomic>
#include <mutex>

namespace logwarden {
namespace daemon {

struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;   // lower-case names
    std::string body;
    std::string peer_address;
    bool peer_loopback = false;

    std::string Header(const std::string& name) const;
};

struct HttpReply {
    int status = 200;
    nlohmann::json body;
    std::function<void()> after_send;   // runs once the reply is written

    static HttpReply Ok(nlohmann::json extra = nlohmann::json::object());
    static HttpReply Error(int status, const std::string& message);
};

/**
 * Local Control API
 * Minimal HTTP/1.1 listener on a loopback address.
 *
 * Every request passes, in order:
 *   1. peer must be loopback           (403)
 *   2. x-agent-token must match        (401)
 *   3. body at most 64 KiB             (413)
 *   4. route lookup                    (404)
 * One request per connection.
 */
class ControlApi {
public:
    using RouteHandler = std::function<HttpReply(const HttpRequest& request)>;

    static constexpr size_t MAX_BODY_SIZE = 64 * 1024;
    static constexpr size_t MAX_HEADER_SIZE = 16 * 1024;
    static constexpr int READ_TIMEOUT_SECONDS = 5;

    ControlApi();
    ~ControlApi();

    /**
     * Bind and listen. Port 0 picks a free port (see BoundPort()).
     */
    bool Initialize(const std::string& address, int port);

    bool Start();
    void Stop();
    bool IsRunning() const { return running_.load(); }
    int BoundPort() const { return bound_port_; }

    void RegisterRoute(const std::string& method, const std::string& path, RouteHandler handler);

    /**
     * An empty token rejects every request
     */
    void SetToken(const std::string& token);

    /**
     * Authorize and route one parsed request
     */
    HttpReply Dispatch(const HttpRequest& request);

    static bool ParseRequestHead(const std::string& head, HttpRequest& request);
    static std::string SerializeReply(const HttpReply& reply);
    static bool IsLoopbackAddress(const std::string& address);
    static bool TokensEqual(const std::string& a, const std::string& b);

private:
    int socket_fd_;
    int bound_port_;
    std::atomic<bool> running_;
    std::thread thread_;

    std::map<std::pair<std::string, std::string>, RouteHandler> routes_;

    mutable std::mutex token_mutex_;
    std::string token_;

    void Run();
    void HandleClient(int client_fd, const std::string& peer_address);
    int Authorize(const HttpRequest& request) const;
    bool SendReply(int client_fd, const HttpReply& reply);
};

} // namespace daemon
} // namespace logwarden

#endif // LOGWARDEN_CONTROL_API_H
