#pragma once

#include <string>

#include "coordinate.h"

// A panorama as resolved from the metadata service. Identity is the id.
struct PanoramaRecord {
    std::string pano_id;
    Coordinate location;  // canonical capture location

    PanoramaRecord() {}
    PanoramaRecord(const std::string& id, const Coordinate& canonical) : pano_id(id), location(canonical) {}
};
