#include "http_client.h"

#include <memory>
#include <stdexcept>

namespace {

// Memory write callback for CURL
size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* buffer) {
    size_t total_size = size * nmemb;
    buffer->append(static_cast<char*>(contents), total_size);
    return total_size;
}

struct CurlHandleDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;

}

CurlHttpClient::CurlHttpClient(long timeout_seconds) : timeout_value(timeout_seconds), headers(nullptr) {
    if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
        throw std::runtime_error("Failed to initialize libcurl");
    }

    headers = curl_slist_append(headers, "User-Agent: streetview_crawler/1.0");
    headers = curl_slist_append(headers, "Accept: application/json,image/jpeg,image/*,*/*;q=0.8");
}

CurlHttpClient::~CurlHttpClient() {
    if (headers) {
        curl_slist_free_all(headers);
    }

    curl_global_cleanup();
}

// Method to initialize CURL with common settings
CURL* CurlHttpClient::init_curl() {
    CURL* handle = curl_easy_init();
    if (!handle) {
        return nullptr;
    }
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_TIMEOUT, timeout_value);
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    return handle;
}

HttpResponse CurlHttpClient::get(const std::string& url) {
    HttpResponse response;

    CurlHandle curl(init_curl());
    if (!curl) {
        response.error = "Failed to initialize CURL";
        return response;
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        response.error = curl_easy_strerror(res);
        response.body.clear();
        return response;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    response.transport_ok = true;
    return response;
}

std::string url_escape(const std::string& value) {
    // curl_easy_init would otherwise run the global init lazily, which is
    // not safe when several workers build URLs at once
    static const bool curl_ready = (curl_global_init(CURL_GLOBAL_ALL) == CURLE_OK);
    if (!curl_ready) {
        throw std::runtime_error("Failed to initialize libcurl");
    }

    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL for URL escaping");
    }

    char* escaped = curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        throw std::runtime_error("Failed to escape URL component: " + value);
    }

    std::string result(escaped);
    curl_free(escaped);
    return result;
}
