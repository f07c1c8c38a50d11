#include "image_request.h"

#include "errors.h"
#include "http_client.h"

void validate_fov(int fov) {
    if (fov <= 0 || fov > 360 || 360 % fov != 0) {
        throw ConfigurationError("Field of view must evenly divide 360, got " + std::to_string(fov));
    }
}

ImageRequestBuilder::ImageRequestBuilder(const std::string& key, int w, int h)
    : api_key(key), width(w), height(h) {
    if (width <= 0 || height <= 0) {
        throw ConfigurationError("Image size must be positive, got " +
            std::to_string(width) + "x" + std::to_string(height));
    }
}

std::string ImageRequestBuilder::url_for(const std::string& pano_id, int fov, int heading) const {
    return std::string(kEndpoint) + "?size=" + std::to_string(width) + "x" + std::to_string(height) +
        "&pano=" + url_escape(pano_id) +
        "&heading=" + std::to_string(heading) +
        "&fov=" + std::to_string(fov) +
        "&key=" + url_escape(api_key) +
        "&return_error_code=true";
}

std::vector<ImageRequest> ImageRequestBuilder::requests(const PanoramaRecord& record, int fov) const {
    validate_fov(fov);

    std::vector<ImageRequest> result;
    result.reserve(360 / fov);
    for (int heading = 0; heading < 360; heading += fov) {
        result.emplace_back(url_for(record.pano_id, fov, heading), fov, heading);
    }
    return result;
}
