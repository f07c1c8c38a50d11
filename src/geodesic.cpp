#include "geodesic.h"

#include <cmath>

namespace {

double deg_to_rad(double deg) { return deg * M_PI / 180.0; }
double rad_to_deg(double rad) { return rad * 180.0 / M_PI; }

}

Coordinate SphericalGeodesic::destination(const Coordinate& start, double bearing_deg, double meters) const {
    double lat1 = deg_to_rad(start.latitude);
    double lon1 = deg_to_rad(start.longitude);
    double brng = deg_to_rad(bearing_deg);
    double d = meters / kEarthRadiusMeters;

    double lat2 = std::asin(std::sin(lat1) * std::cos(d) +
        std::cos(lat1) * std::sin(d) * std::cos(brng));
    double lon2 = lon1 + std::atan2(std::sin(brng) * std::sin(d) * std::cos(lat1),
        std::cos(d) - std::sin(lat1) * std::sin(lat2));

    // Normalize longitude to [-180, 180)
    double lng = std::fmod(rad_to_deg(lon2) + 540.0, 360.0) - 180.0;
    return Coordinate(rad_to_deg(lat2), lng);
}

double SphericalGeodesic::distance(const Coordinate& a, const Coordinate& b) const {
    double lat1 = deg_to_rad(a.latitude);
    double lat2 = deg_to_rad(b.latitude);
    double d_lat = deg_to_rad(b.latitude - a.latitude);
    double d_lon = deg_to_rad(b.longitude - a.longitude);

    double h = std::sin(d_lat / 2) * std::sin(d_lat / 2) +
        std::cos(lat1) * std::cos(lat2) * std::sin(d_lon / 2) * std::sin(d_lon / 2);
    return kEarthRadiusMeters * 2 * std::atan2(std::sqrt(h), std::sqrt(1 - h));
}
