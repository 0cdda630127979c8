#include "net/HttpClient.h"
#include "net/GatewayError.h"
#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <utility>

namespace {

std::once_flag g_curlInit;

std::size_t writeCallback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

struct CurlDeleter {
    void operator()(CURL* h) const { curl_easy_cleanup(h); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

void checkStatus(const std::string& path, const HttpResponse& res) {
    if (res.status >= 200 && res.status < 300) return;
    const auto kind = res.status >= 500 ? GatewayError::Kind::ServerError
                                        : GatewayError::Kind::ClientError;
    throw GatewayError(kind, path + " returned HTTP " + std::to_string(res.status), res.status);
}

std::string trimSlashes(std::string s) {
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

}  // namespace

HttpClient::HttpClient(std::string baseUrl, std::chrono::milliseconds timeout,
                       std::vector<std::string> headers)
    : baseUrl_(trimSlashes(std::move(baseUrl))), timeout_(timeout), headers_(std::move(headers)) {
    std::call_once(g_curlInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string HttpClient::urlFor(const std::string& path) const {
    if (path.empty()) return baseUrl_;
    if (path.front() == '/') return baseUrl_ + path;
    return baseUrl_ + "/" + path;
}

HttpResponse HttpClient::get(const std::string& path) const {
    return perform(path, nullptr);
}

HttpResponse HttpClient::post(const std::string& path, const std::string& body) const {
    return perform(path, &body);
}

HttpResponse HttpClient::perform(const std::string& path, const std::string* body) const {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw GatewayError(GatewayError::Kind::Transport, "curl_easy_init failed");
    }

    const std::string url = urlFor(path);
    HttpResponse res;
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_slist* raw = nullptr;
    raw = curl_slist_append(raw, "Content-Type: application/json");
    for (const auto& h : headers_) raw = curl_slist_append(raw, h.c_str());
    std::unique_ptr<curl_slist, SlistDeleter> headerList(raw);

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);  // required for timeouts off the main thread
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headerList.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &res.body);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    if (body) {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }

    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        std::string msg = url + ": " + (errbuf[0] ? errbuf : curl_easy_strerror(rc));
        if (rc == CURLE_OPERATION_TIMEDOUT) {
            throw GatewayError(GatewayError::Kind::Timeout, msg);
        }
        throw GatewayError(GatewayError::Kind::Transport, msg);
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &res.status);
    return res;
}

Json::Value HttpClient::postJson(const std::string& path, const Json::Value& body) const {
    HttpResponse res = post(path, writeJson(body));
    checkStatus(path, res);
    if (res.body.empty()) return Json::Value();
    return parseJson(res.body);
}

void HttpClient::postJsonNoReply(const std::string& path, const Json::Value& body) const {
    checkStatus(path, post(path, writeJson(body)));
}

std::string writeJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

Json::Value parseJson(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errs;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
        throw GatewayError(GatewayError::Kind::Malformed, "invalid JSON reply: " + errs);
    }
    return root;
}
