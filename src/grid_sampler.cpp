#include "grid_sampler.h"

#include <stdexcept>
#include <string>

#include "errors.h"

GridSampler::GridSampler(const GridSpec& spec, const Geodesic& geo)
    : grid_spec(spec), geodesic(geo), per_axis(0) {
    if (spec.side < 0) {
        throw ConfigurationError("Square side must not be negative: " + std::to_string(spec.side));
    }
    if (spec.stride <= 0) {
        throw ConfigurationError("Sampling stride must be positive: " + std::to_string(spec.stride));
    }

    // West by half the side, then north by half the side
    double half = spec.side / 2.0;
    Coordinate left = geodesic.destination(spec.center, 270.0, half);
    corner = geodesic.destination(left, 0.0, half);

    per_axis = static_cast<size_t>(spec.side / spec.stride) + 1;
}

Coordinate GridSampler::at(size_t k) const {
    if (k >= size()) {
        throw std::out_of_range("Grid sample index " + std::to_string(k) +
            " out of range (size " + std::to_string(size()) + ")");
    }

    double south = static_cast<double>((k / per_axis) * grid_spec.stride);
    double east = static_cast<double>((k % per_axis) * grid_spec.stride);

    // East first, then south, as two separate hops
    Coordinate shifted = geodesic.destination(corner, 90.0, east);
    return geodesic.destination(shifted, 180.0, south);
}

std::vector<Coordinate> GridSampler::to_vector() const {
    std::vector<Coordinate> points;
    points.reserve(size());
    for (const auto& point : *this) {
        points.push_back(point);
    }
    return points;
}
