#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "coordinate.h"
#include "logger.h"
#include "panorama.h"

using ResolveFunction = std::function<std::optional<PanoramaRecord>(const Coordinate&)>;

// Folds resolved sample points into one record per panorama id
class PanoramaDeduplicator {
public:
    explicit PanoramaDeduplicator(std::shared_ptr<Logger> log) : logger(std::move(log)) {}

    // Points that resolve to nothing are dropped. A later point resolving to
    // an id already seen replaces its location. Output is sorted by id.
    template<class PointRange>
    std::vector<PanoramaRecord> dedupe(const PointRange& points, const ResolveFunction& resolve) {
        std::map<std::string, Coordinate> ids;
        for (const Coordinate& point : points) {
            fold(ids, point, resolve);
        }
        return to_records(ids);
    }

private:
    std::shared_ptr<Logger> logger;

    void fold(std::map<std::string, Coordinate>& ids, const Coordinate& point, const ResolveFunction& resolve);
    static std::vector<PanoramaRecord> to_records(const std::map<std::string, Coordinate>& ids);
};
