#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "coordinate.h"
#include "metadata_client.h"
#include "panorama.h"

// Metadata responses keyed by the exact query coordinate
class ResolverCache {
public:
    std::optional<MetadataResponse> get(const Coordinate& point) const;
    void put(const Coordinate& point, const MetadataResponse& response);

    size_t size() const;
    void clear();

private:
    mutable std::mutex cache_lock;
    std::unordered_map<Coordinate, MetadataResponse, CoordinateHash> entries;
};

// Maps a sample coordinate to the panorama nearest to it, if any
class PanoramaResolver {
public:
    explicit PanoramaResolver(std::shared_ptr<MetadataClient> client);

    // Only an OK answer carrying both an id and a location yields a record.
    // ZERO_RESULTS and every other status yield nothing.
    std::optional<PanoramaRecord> resolve(const Coordinate& point);

    const ResolverCache& cache() const { return response_cache; }

private:
    std::shared_ptr<MetadataClient> client;
    ResolverCache response_cache;

    MetadataResponse response_for(const Coordinate& point);
};
