#include "coordinate.h"

#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

#include "errors.h"

std::string Coordinate::to_string() const {
    std::ostringstream out;
    out << std::setprecision(std::numeric_limits<double>::max_digits10) << latitude << "," << longitude;
    return out.str();
}

Coordinate parse_coordinate(const std::string& text) {
    size_t comma = text.find(',');
    if (comma == std::string::npos || text.find(',', comma + 1) != std::string::npos) {
        throw ConfigurationError("Expected LAT,LNG but got '" + text + "'");
    }

    double lat = 0.0;
    double lng = 0.0;
    try {
        size_t used = 0;
        std::string lat_text = text.substr(0, comma);
        std::string lng_text = text.substr(comma + 1);

        lat = std::stod(lat_text, &used);
        if (lat_text.find_first_not_of(" \t", used) != std::string::npos) {
            throw std::invalid_argument(lat_text);
        }
        lng = std::stod(lng_text, &used);
        if (lng_text.find_first_not_of(" \t", used) != std::string::npos) {
            throw std::invalid_argument(lng_text);
        }
    }
    catch (const std::logic_error&) {
        throw ConfigurationError("Expected LAT,LNG but got '" + text + "'");
    }

    if (!std::isfinite(lat) || !std::isfinite(lng) ||
        lat < -90.0 || lat > 90.0 || lng < -180.0 || lng > 180.0) {
        throw ConfigurationError("Coordinate out of range: '" + text + "'");
    }

    return Coordinate(lat, lng);
}
