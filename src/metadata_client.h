#pragma once

#include <memory>
#include <optional>
#include <string>

#include "coordinate.h"
#include "http_client.h"

// Status values reported by the metadata endpoint, plus two of our own
// for answers that never made it to a parsable JSON body.
namespace metadata_status {
constexpr const char* kOk = "OK";
constexpr const char* kZeroResults = "ZERO_RESULTS";
constexpr const char* kHttpError = "HTTP_ERROR";
constexpr const char* kInvalidResponse = "INVALID_RESPONSE";
}

struct MetadataResponse {
    std::string status;
    std::optional<std::string> pano_id;
    std::optional<Coordinate> location;
};

// Street View metadata lookup for a single coordinate
class MetadataClient {
public:
    virtual ~MetadataClient() = default;
    virtual MetadataResponse lookup(const Coordinate& point) = 0;
};

class StreetViewMetadataClient : public MetadataClient {
public:
    static constexpr const char* kEndpoint = "https://maps.googleapis.com/maps/api/streetview/metadata";

    StreetViewMetadataClient(std::shared_ptr<HttpClient> http, const std::string& api_key);

    MetadataResponse lookup(const Coordinate& point) override;

    std::string url_for(const Coordinate& point) const;

private:
    std::shared_ptr<HttpClient> http;
    std::string api_key;
};

// Parse a metadata JSON body. Never throws; a body that is not a JSON object
// with a string "status" gives kInvalidResponse.
MetadataResponse parse_metadata(const std::string& body);
