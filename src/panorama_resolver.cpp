#include "panorama_resolver.h"

std::optional<MetadataResponse> ResolverCache::get(const Coordinate& point) const {
    std::lock_guard<std::mutex> lock(cache_lock);
    auto it = entries.find(point);
    if (it != entries.end()) {
        return it->second;
    }
    return std::nullopt;
}

void ResolverCache::put(const Coordinate& point, const MetadataResponse& response) {
    std::lock_guard<std::mutex> lock(cache_lock);
    entries[point] = response;
}

size_t ResolverCache::size() const {
    std::lock_guard<std::mutex> lock(cache_lock);
    return entries.size();
}

void ResolverCache::clear() {
    std::lock_guard<std::mutex> lock(cache_lock);
    entries.clear();
}

PanoramaResolver::PanoramaResolver(std::shared_ptr<MetadataClient> metadata_client)
    : client(std::move(metadata_client)) {}

MetadataResponse PanoramaResolver::response_for(const Coordinate& point) {
    auto cached = response_cache.get(point);
    if (cached) {
        return *cached;
    }

    MetadataResponse response = client->lookup(point);
    response_cache.put(point, response);
    return response;
}

std::optional<PanoramaRecord> PanoramaResolver::resolve(const Coordinate& point) {
    MetadataResponse response = response_for(point);

    if (response.status != metadata_status::kOk) {
        return std::nullopt;
    }
    if (!response.pano_id || !response.location) {
        return std::nullopt;
    }

    return PanoramaRecord(*response.pano_id, *response.location);
}
