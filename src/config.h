#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>

#include "grid_sampler.h"
#include "persistence.h"

namespace fs = std::filesystem;

struct CrawlerConfig {
    GridSpec grid;
    fs::path output_dir;

    int fov;
    int image_width;
    int image_height;
    PersistenceStrategy persistence;

    size_t workers;
    long timeout_seconds;
    std::string log_file;
    bool console_output;
    bool show_help;

    std::string api_key;

    CrawlerConfig();
};

// Parse the command line. Throws ConfigurationError on bad or missing
// arguments unless -h/--help was given.
CrawlerConfig parse_arguments(int argc, const char* const argv[]);

// Read the API key from STREETVIEW_API_KEY; throws ConfigurationError if unset
std::string api_key_from_environment();

void print_usage(std::ostream& out, const char* program_name);
