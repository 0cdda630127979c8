#ifndef HTTP_CLIENT_H
#define HTTP_CLIENT_H

#include <chrono>
#include <string>
#include <vector>
#include <json/json.h>

struct HttpResponse {
    long status = 0;
    std::string body;
};

/**
 * Minimal blocking HTTP client on libcurl. Each request uses its own easy
 * handle, so one client can be shared by every worker thread.
 *
 * Transport failures and timeouts throw GatewayError; HTTP status codes are
 * returned as-is by get/post and mapped to GatewayError by the JSON helpers.
 */
class HttpClient {
public:
    HttpClient(std::string baseUrl, std::chrono::milliseconds timeout,
               std::vector<std::string> headers = {});

    HttpResponse get(const std::string& path) const;
    HttpResponse post(const std::string& path, const std::string& body) const;

    // POST a JSON body and parse a JSON reply. Non-2xx and unparseable
    // bodies throw GatewayError.
    Json::Value postJson(const std::string& path, const Json::Value& body) const;
    // Same, but the reply body is ignored beyond its status code.
    void postJsonNoReply(const std::string& path, const Json::Value& body) const;

    const std::string& baseUrl() const { return baseUrl_; }
    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    HttpResponse perform(const std::string& path, const std::string* body) const;
    std::string urlFor(const std::string& path) const;

    std::string baseUrl_;
    std::chrono::milliseconds timeout_;
    std::vector<std::string> headers_;
};

// Compact single-line JSON.
std::string writeJson(const Json::Value& value);
// Throws GatewayError(Malformed) on a parse failure.
Json::Value parseJson(const std::string& text);

#endif
