#pragma once

#include <memory>
#include <string>
#include <vector>

#include "http_client.h"
#include "image_request.h"
#include "logger.h"

// Raw image bytes and the request that produced them
struct AcquiredImage {
    std::string bytes;
    ImageRequest request;

    AcquiredImage() {}
    AcquiredImage(std::string data, const ImageRequest& rq) : bytes(std::move(data)), request(rq) {}
};

// Result of one image request, successful or not
struct AcquireOutcome {
    ImageRequest request;
    bool success;
    long status;         // HTTP status, 0 when the transport failed
    std::string error;   // transport error text
    std::string bytes;   // empty unless success

    AcquireOutcome() : success(false), status(0) {}
};

// Executes image requests one at a time. Failures are logged and dropped;
// nothing is retried.
class Acquirer {
public:
    Acquirer(std::shared_ptr<HttpClient> http, std::shared_ptr<Logger> logger);

    AcquireOutcome acquire_one(const ImageRequest& request);

    // One outcome per request, in input order
    std::vector<AcquireOutcome> acquire_each(const std::vector<ImageRequest>& requests);

    // Successful images only, in input order
    std::vector<AcquiredImage> acquire(const std::vector<ImageRequest>& requests);

private:
    std::shared_ptr<HttpClient> http;
    std::shared_ptr<Logger> logger;
};
