#include "acquirer.h"

Acquirer::Acquirer(std::shared_ptr<HttpClient> http_client, std::shared_ptr<Logger> log)
    : http(std::move(http_client)), logger(std::move(log)) {}

AcquireOutcome Acquirer::acquire_one(const ImageRequest& request) {
    AcquireOutcome outcome;
    outcome.request = request;

    logger->info("Downloading '" + request.url + "' ...");
    HttpResponse response = http->get(request.url);
    outcome.status = response.status;
    outcome.error = response.error;

    if (!response.transport_ok) {
        logger->warning("Got error downloading '" + request.url + "' : " + response.error + ".");
        return outcome;
    }
    if (!response.ok()) {
        logger->warning("Got error downloading '" + request.url + "' : " + std::to_string(response.status) + ".");
        return outcome;
    }
    if (response.body.empty()) {
        logger->warning("Got empty image for '" + request.url + "'.");
        return outcome;
    }

    outcome.success = true;
    outcome.bytes = std::move(response.body);
    return outcome;
}

std::vector<AcquireOutcome> Acquirer::acquire_each(const std::vector<ImageRequest>& requests) {
    std::vector<AcquireOutcome> outcomes;
    outcomes.reserve(requests.size());
    for (const auto& request : requests) {
        outcomes.push_back(acquire_one(request));
    }
    return outcomes;
}

std::vector<AcquiredImage> Acquirer::acquire(const std::vector<ImageRequest>& requests) {
    std::vector<AcquiredImage> images;
    for (auto& outcome : acquire_each(requests)) {
        if (outcome.success) {
            images.emplace_back(std::move(outcome.bytes), outcome.request);
        }
    }
    return images;
}
