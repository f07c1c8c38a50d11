#include "metadata_client.h"

#include <rapidjson/document.h>

StreetViewMetadataClient::StreetViewMetadataClient(std::shared_ptr<HttpClient> http_client, const std::string& key)
    : http(std::move(http_client)), api_key(key) {}

std::string StreetViewMetadataClient::url_for(const Coordinate& point) const {
    return std::string(kEndpoint) + "?location=" + url_escape(point.to_string()) +
        "&key=" + url_escape(api_key);
}

MetadataResponse StreetViewMetadataClient::lookup(const Coordinate& point) {
    HttpResponse response = http->get(url_for(point));

    if (!response.ok()) {
        MetadataResponse failed;
        failed.status = metadata_status::kHttpError;
        return failed;
    }

    return parse_metadata(response.body);
}

MetadataResponse parse_metadata(const std::string& body) {
    MetadataResponse result;
    result.status = metadata_status::kInvalidResponse;

    rapidjson::Document document;
    document.Parse(body.c_str(), body.size());
    if (document.HasParseError() || !document.IsObject()) {
        return result;
    }

    auto status = document.FindMember("status");
    if (status == document.MemberEnd() || !status->value.IsString()) {
        return result;
    }
    result.status = status->value.GetString();

    auto pano_id = document.FindMember("pano_id");
    if (pano_id != document.MemberEnd() && pano_id->value.IsString()) {
        result.pano_id = std::string(pano_id->value.GetString(), pano_id->value.GetStringLength());
    }

    auto location = document.FindMember("location");
    if (location != document.MemberEnd() && location->value.IsObject()) {
        const rapidjson::Value& loc = location->value;
        auto lat = loc.FindMember("lat");
        auto lng = loc.FindMember("lng");
        if (lat != loc.MemberEnd() && lat->value.IsNumber() &&
            lng != loc.MemberEnd() && lng->value.IsNumber()) {
            result.location = Coordinate(lat->value.GetDouble(), lng->value.GetDouble());
        }
    }

    return result;
}
