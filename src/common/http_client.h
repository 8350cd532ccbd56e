// src/common/http_client.h
#ifndef LOGWARDEN_HTTP_CLIENT_H
#define LOGWARDEN_HTTP_CLIENT_H

#include <string>
#include <vector>

namespace logwarden {
namespace common {

struct HttpResponse {
    long status = 0;
    std::string body;
    std::string error;      // Transport error, empty when a response arrived

    bool ok() const { return error.empty() && status >= 200 && status < 300; }
};

/**
 * Outbound HTTP used by heartbeat, update and geo refresh.
 * Headers are passed as "Name: value" lines.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse Get(const std::string& url,
                             const std::vector<std::string>& headers = {}) = 0;
    virtual HttpResponse Post(const std::string& url, const std::string& body,
                              const std::vector<std::string>& headers = {}) = 0;

    /**
     * Stream the body of url into dest_path. The file is removed on failure.
     */
    virtual bool Download(const std::string& url, const std::string& dest_path,
                          std::string& error) = 0;
};

/**
 * libcurl implementation, one easy handle per request
 */
class CurlHttpClient : public HttpTransport {
public:
    explicit CurlHttpClient(long timeout_seconds = 30);

    HttpResponse Get(const std::string& url,
                     const std::vector<std::string>& headers = {}) override;
    HttpResponse Post(const std::string& url, const std::string& body,
                      const std::vector<std::string>& headers = {}) override;
    bool Download(const std::string& url, const std::string& dest_path,
                  std::string& error) override;

    // Call once per process before any thread issues requests
    static bool GlobalInit();
    static void GlobalCleanup();

private:
    long timeout_seconds_;

    HttpResponse Perform(const std::string& url, const std::string* post_body,
                         const std::vector<std::string>& headers);
};

} // namespace common
} // namespace logwarden

#endif // LOGWARDEN_HTTP_CLIENT_H
