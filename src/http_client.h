#pragma once

#include <string>

#include <curl/curl.h>

struct HttpResponse {
    bool transport_ok;    // false when the request never got an HTTP answer
    long status;
    std::string body;
    std::string error;    // transport error text, if any

    HttpResponse() : transport_ok(false), status(0) {}

    bool ok() const { return transport_ok && status >= 200 && status < 300; }
};

// Plain HTTP GET
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse get(const std::string& url) = 0;
};

// libcurl-backed client. Each call uses its own easy handle so one client
// can be shared between worker threads.
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(long timeout_seconds = 10);
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get(const std::string& url) override;

private:
    long timeout_value;
    struct curl_slist* headers;

    CURL* init_curl();
};

// Percent-encode a query parameter value
std::string url_escape(const std::string& value);
