#include "http_client.hpp"
#include "util.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <memory>

namespace {

struct CurlDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

CurlHttpClient::CurlHttpClient()
    : user_agent_("chainrail/1.0")
{}

CurlHttpClient::~CurlHttpClient() = default;

size_t CurlHttpClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

HttpResponse CurlHttpClient::perform(const std::string& url, const std::string* body, int timeout_ms) {
    HttpResponse response;

    // One easy handle per request keeps concurrent probes independent
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        response.error = "Failed to initialize CURL";
        return response;
    }

    std::unique_ptr<curl_slist, SlistDeleter> headers;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 3L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());

    if (body) {
        headers.reset(curl_slist_append(nullptr, "Content-Type: application/json"));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        response.error = curl_easy_strerror(res);
        spdlog::debug("HTTP request to {} failed: {}", util::mask_url(url), response.error);
        return response;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

HttpResponse CurlHttpClient::post_json(const std::string& url, const std::string& body, int timeout_ms) {
    return perform(url, &body, timeout_ms);
}

HttpResponse CurlHttpClient::get(const std::string& url, int timeout_ms) {
    return perform(url, nullptr, timeout_ms);
}

std::string CurlHttpClient::escape(const std::string& value) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        return value;
    }

    char* escaped = curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        return value;
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
}
