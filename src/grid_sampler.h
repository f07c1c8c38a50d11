#pragma once

#include <cstddef>
#include <iterator>
#include <vector>

#include "coordinate.h"
#include "geodesic.h"

// Square sampling region. Side, step and stride are in meters.
struct GridSpec {
    static constexpr int kDefaultStride = 30;

    Coordinate center;
    int side;
    int step;     // requested by the caller, not used for sampling
    int stride;   // actual lattice spacing

    GridSpec() : side(0), step(kDefaultStride), stride(kDefaultStride) {}
    GridSpec(const Coordinate& c, int side_m, int step_m, int stride_m = kDefaultStride)
        : center(c), side(side_m), step(step_m), stride(stride_m) {}
};

// Lazily enumerates a regular lattice over a GridSpec square, row-major,
// both edges included. Points are computed on demand from the upper-left
// corner so the sampler can be walked any number of times.
class GridSampler {
public:
    class const_iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Coordinate;
        using difference_type = std::ptrdiff_t;
        using pointer = const Coordinate*;
        using reference = Coordinate;

        const_iterator(const GridSampler* owner, size_t position) : sampler(owner), index(position) {}

        Coordinate operator*() const { return sampler->at(index); }
        const_iterator& operator++() { ++index; return *this; }
        const_iterator operator++(int) { const_iterator tmp = *this; ++index; return tmp; }
        bool operator==(const const_iterator& other) const { return index == other.index && sampler == other.sampler; }
        bool operator!=(const const_iterator& other) const { return !(*this == other); }

    private:
        const GridSampler* sampler;
        size_t index;
    };

    // Throws ConfigurationError when side < 0 or stride <= 0
    GridSampler(const GridSpec& spec, const Geodesic& geodesic);

    const GridSpec& spec() const { return grid_spec; }
    const Coordinate& upper_left_corner() const { return corner; }

    size_t points_per_axis() const { return per_axis; }
    size_t size() const { return per_axis * per_axis; }

    // k-th sample in row-major order, k < size()
    Coordinate at(size_t k) const;

    const_iterator begin() const { return const_iterator(this, 0); }
    const_iterator end() const { return const_iterator(this, size()); }

    std::vector<Coordinate> to_vector() const;

private:
    GridSpec grid_spec;
    const Geodesic& geodesic;
    Coordinate corner;
    size_t per_axis;
};
