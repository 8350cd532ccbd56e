// src/common/http_client.cpp
#include "http_client.h"
#include <curl/curl.h>
#include <cstdio>
#include <unistd.h>

namespace logwarden {
namespace common {

// Callback for curl to write data to string
static size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append((char*)contents, total_size);
    return total_size;
}

static size_t FileWriteCallback(void* contents, size_t size, size_t nmemb, FILE* file) {
    return fwrite(contents, size, nmemb, file) * size;
}

CurlHttpClient::CurlHttpClient(long timeout_seconds)
    : timeout_seconds_(timeout_seconds) {
}

bool CurlHttpClient::GlobalInit() {
    return curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
}

void CurlHttpClient::GlobalCleanup() {
    curl_global_cleanup();
}

HttpResponse CurlHttpClient::Get(const std::string& url,
                                 const std::vector<std::string>& headers) {
    return Perform(url, nullptr, headers);
}

HttpResponse CurlHttpClient::Post(const std::string& url, const std::string& body,
                                  const std::vector<std::string>& headers) {
    return Perform(url, &body, headers);
}

HttpResponse CurlHttpClient::Perform(const std::string& url, const std::string* post_body,
                                     const std::vector<std::string>& headers) {
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "Failed to initialize curl";
        return response;
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& header : headers) {
        header_list = curl_slist_append(header_list, header.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }
    if (post_body) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, post_body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
    }

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        response.error = curl_easy_strerror(res);
    } else {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);
    return response;
}

bool CurlHttpClient::Download(const std::string& url, const std::string& dest_path,
                              std::string& error) {
    FILE* file = fopen(dest_path.c_str(), "wb");
    if (!file) {
        error = "Cannot open " + dest_path + " for writing";
        return false;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        fclose(file);
        unlink(dest_path.c_str());
        error = "Failed to initialize curl";
        return false;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, FileWriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, file);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_cleanup(curl);

    bool closed = (fclose(file) == 0);

    if (res != CURLE_OK || !closed) {
        error = (res != CURLE_OK) ? curl_easy_strerror(res) : "Write error on " + dest_path;
        unlink(dest_path.c_str());
        return false;
    }

    return true;
}

} // namespace common
} // namespace logwarden
