#pragma once

#include <string>

struct HttpResponse {
    long status = 0;
    std::string body;
    std::string error;   // transport failure, empty when a response arrived

    bool ok() const { return error.empty() && status >= 200 && status < 300; }
};

// Transport seam shared by the RPC, registry and verification clients.
// Implementations must be safe to call from several threads at once.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse post_json(const std::string& url, const std::string& body, int timeout_ms) = 0;
    virtual HttpResponse get(const std::string& url, int timeout_ms) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    // Disable copy
    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse post_json(const std::string& url, const std::string& body, int timeout_ms) override;
    HttpResponse get(const std::string& url, int timeout_ms) override;

    static std::string escape(const std::string& value);

private:
    std::string user_agent_;

    HttpResponse perform(const std::string& url, const std::string* body, int timeout_ms);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
