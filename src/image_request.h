#pragma once

#include <string>
#include <vector>

#include "panorama.h"

// One directional image of a panorama
struct ImageRequest {
    std::string url;
    int fov;
    int heading;

    ImageRequest() : fov(0), heading(0) {}
    ImageRequest(const std::string& u, int f, int h) : url(u), fov(f), heading(h) {}
};

// Throws ConfigurationError unless fov is positive and divides 360
void validate_fov(int fov);

// Builds the full-rotation set of image requests for a panorama.
// Imagery is addressed by panorama id; the location is not sent.
class ImageRequestBuilder {
public:
    static constexpr const char* kEndpoint = "https://maps.googleapis.com/maps/api/streetview";
    static constexpr int kDefaultWidth = 600;
    static constexpr int kDefaultHeight = 400;

    explicit ImageRequestBuilder(const std::string& api_key, int width = kDefaultWidth, int height = kDefaultHeight);

    // Headings 0, fov, 2*fov, ..., 360-fov in ascending order
    std::vector<ImageRequest> requests(const PanoramaRecord& record, int fov) const;

    std::string url_for(const std::string& pano_id, int fov, int heading) const;

    int image_width() const { return width; }

private:
    std::string api_key;
    int width;
    int height;
};
