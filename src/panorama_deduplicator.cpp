#include "panorama_deduplicator.h"

void PanoramaDeduplicator::fold(std::map<std::string, Coordinate>& ids, const Coordinate& point,
    const ResolveFunction& resolve) {
    logger->info("Getting pano id for " + point.to_string() + "...");

    std::optional<PanoramaRecord> record = resolve(point);
    if (record) {
        ids[record->pano_id] = record->location;
    }
    else {
        logger->info("Got no pano id for " + point.to_string() + ".");
    }
}

std::vector<PanoramaRecord> PanoramaDeduplicator::to_records(const std::map<std::string, Coordinate>& ids) {
    std::vector<PanoramaRecord> records;
    records.reserve(ids.size());
    for (const auto& [pano_id, location] : ids) {
        records.emplace_back(pano_id, location);
    }
    return records;
}
