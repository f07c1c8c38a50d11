#pragma once

#include "coordinate.h"

// Define M_PI if not already defined (Windows MSVC)
#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

// Destination-point and distance calculations on the earth's surface.
// Bearings are compass degrees (0 = north, 90 = east).
class Geodesic {
public:
    virtual ~Geodesic() = default;

    virtual Coordinate destination(const Coordinate& start, double bearing_deg, double meters) const = 0;
    virtual double distance(const Coordinate& a, const Coordinate& b) const = 0;
};

// Great-circle model on a sphere of mean earth radius
class SphericalGeodesic : public Geodesic {
public:
    static constexpr double kEarthRadiusMeters = 6371008.8;

    Coordinate destination(const Coordinate& start, double bearing_deg, double meters) const override;
    double distance(const Coordinate& a, const Coordinate& b) const override;
};
