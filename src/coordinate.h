#pragma once

#include <cstddef>
#include <functional>
#include <string>

// Latitude/longitude pair in degrees
struct Coordinate {
    double latitude;
    double longitude;

    Coordinate() : latitude(0.0), longitude(0.0) {}
    Coordinate(double lat, double lng) : latitude(lat), longitude(lng) {}

    // Exact comparison, only meant for cache keys
    bool operator==(const Coordinate& other) const {
        return latitude == other.latitude && longitude == other.longitude;
    }
    bool operator!=(const Coordinate& other) const { return !(*this == other); }

    // "lat,lng" with enough digits to read back the same doubles
    std::string to_string() const;
};

// Parse "lat,lng" (whitespace around either number is allowed).
// Throws ConfigurationError on malformed input.
Coordinate parse_coordinate(const std::string& text);

struct CoordinateHash {
    size_t operator()(const Coordinate& c) const {
        size_t h1 = std::hash<double>()(c.latitude);
        size_t h2 = std::hash<double>()(c.longitude);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};
