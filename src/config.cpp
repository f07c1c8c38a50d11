#include "config.h"

#include <cctype>
#include <climits>
#include <cstdlib>
#include <ostream>
#include <stdexcept>

#include "errors.h"
#include "image_request.h"

namespace {

constexpr int kDefaultSide = 2000;
constexpr int kDefaultStep = 10;
constexpr int kDefaultFov = 90;
constexpr long kMaxWorkers = 256;
constexpr long kMaxTimeoutSeconds = 3600;

long parse_number(const std::string& option, const std::string& value, long min_value, long max_value = INT_MAX) {
    size_t used = 0;
    long number = 0;
    try {
        number = std::stol(value, &used);
    }
    catch (const std::logic_error&) {
        throw ConfigurationError("Invalid value for " + option + ": '" + value + "'");
    }
    if (used != value.size()) {
        throw ConfigurationError("Invalid value for " + option + ": '" + value + "'");
    }
    if (number < min_value) {
        throw ConfigurationError(option + " must be at least " + std::to_string(min_value) + ", got " + value);
    }
    if (number > max_value) {
        throw ConfigurationError(option + " must be at most " + std::to_string(max_value) + ", got " + value);
    }
    return number;
}

}

CrawlerConfig::CrawlerConfig() :
    fov(kDefaultFov),
    image_width(ImageRequestBuilder::kDefaultWidth),
    image_height(ImageRequestBuilder::kDefaultHeight),
    workers(1),
    timeout_seconds(10),
    log_file("streetview_crawler.log"),
    console_output(true),
    show_help(false)
{
    grid.side = kDefaultSide;
    grid.step = kDefaultStep;
    grid.stride = GridSpec::kDefaultStride;
}

CrawlerConfig parse_arguments(int argc, const char* const argv[]) {
    CrawlerConfig config;
    bool has_center = false;
    bool has_output = false;
    bool glued = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next_value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw ConfigurationError("Missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
            return config;
        }
        else if (arg == "--side") {
            config.grid.side = static_cast<int>(parse_number(arg, next_value(), 0));
        }
        else if (arg == "--step") {
            config.grid.step = static_cast<int>(parse_number(arg, next_value(), 1));
        }
        else if (arg == "--stride") {
            config.grid.stride = static_cast<int>(parse_number(arg, next_value(), 1));
        }
        else if (arg == "--fov") {
            config.fov = static_cast<int>(parse_number(arg, next_value(), 1));
        }
        else if (arg == "--width") {
            config.image_width = static_cast<int>(parse_number(arg, next_value(), 1));
        }
        else if (arg == "--height") {
            config.image_height = static_cast<int>(parse_number(arg, next_value(), 1));
        }
        else if (arg == "--glued") {
            glued = true;
        }
        else if (arg == "--no-seam") {
            config.persistence.duplicate_seam = false;
        }
        else if (arg == "--sort-by-heading") {
            config.persistence.glue_order = PersistenceStrategy::GlueOrder::ByHeading;
        }
        else if (arg == "-w" || arg == "--workers") {
            config.workers = static_cast<size_t>(parse_number(arg, next_value(), 1, kMaxWorkers));
        }
        else if (arg == "--timeout") {
            config.timeout_seconds = parse_number(arg, next_value(), 1, kMaxTimeoutSeconds);
        }
        else if (arg == "--log") {
            config.log_file = next_value();
        }
        else if (arg == "-q" || arg == "--quiet") {
            config.console_output = false;
        }
        else if (!arg.empty() && arg[0] == '-' && !(arg.size() > 1 && (std::isdigit(static_cast<unsigned char>(arg[1])) || arg[1] == '.'))) {
            throw ConfigurationError("Unknown option: " + arg);
        }
        else if (!has_center) {
            config.grid.center = parse_coordinate(arg);
            has_center = true;
        }
        else if (!has_output) {
            config.output_dir = arg;
            has_output = true;
        }
        else {
            throw ConfigurationError("Unexpected argument: " + arg);
        }
    }

    if (!has_center || !has_output) {
        throw ConfigurationError("Expected LAT,LNG and OUTPUT_DIR");
    }

    validate_fov(config.fov);
    config.persistence.mode = glued ? PersistenceStrategy::Mode::Glued : PersistenceStrategy::Mode::Simple;
    return config;
}

std::string api_key_from_environment() {
    const char* key = std::getenv("STREETVIEW_API_KEY");
    if (!key || std::string(key).empty()) {
        throw ConfigurationError("STREETVIEW_API_KEY is not set");
    }
    return key;
}

void print_usage(std::ostream& out, const char* program_name) {
    out << "Street View Crawler - samples a square area and downloads every panorama in it" << std::endl;
    out << "Usage: " << program_name << " LAT,LNG OUTPUT_DIR [options]" << std::endl;
    out << std::endl;
    out << "The API key is read from the STREETVIEW_API_KEY environment variable." << std::endl;
    out << std::endl;
    out << "Sampling options:" << std::endl;
    out << "  --side N              Side of the square in meters (default: " << kDefaultSide << ")" << std::endl;
    out << "  --step N              Requested sampling step in meters, informational (default: " << kDefaultStep << ")" << std::endl;
    out << "  --stride N            Lattice spacing actually used, in meters (default: " << GridSpec::kDefaultStride << ")" << std::endl;
    out << std::endl;
    out << "Image options:" << std::endl;
    out << "  --fov N               Field of view per image, must divide 360 (default: " << kDefaultFov << ")" << std::endl;
    out << "  --width N             Image width in pixels (default: " << ImageRequestBuilder::kDefaultWidth << ")" << std::endl;
    out << "  --height N            Image height in pixels (default: " << ImageRequestBuilder::kDefaultHeight << ")" << std::endl;
    out << "  --glued               Save one horizontal composite per panorama" << std::endl;
    out << "  --no-seam             Do not repeat the last image at the composite's left edge" << std::endl;
    out << "  --sort-by-heading     Order composite images by heading instead of fov" << std::endl;
    out << std::endl;
    out << "Other options:" << std::endl;
    out << "  -w, --workers N       Panoramas downloaded concurrently, at most " << kMaxWorkers << " (default: 1)" << std::endl;
    out << "  --timeout N           Request timeout in seconds (default: 10)" << std::endl;
    out << "  --log FILE            Log file, empty to disable (default: streetview_crawler.log)" << std::endl;
    out << "  -q, --quiet           No console logging" << std::endl;
    out << "  -h, --help            Show this help message" << std::endl;
}
