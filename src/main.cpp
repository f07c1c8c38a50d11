#include <chrono>
#include <iostream>
#include <memory>

#include "acquirer.h"
#include "catalogue.h"
#include "config.h"
#include "errors.h"
#include "geodesic.h"
#include "grid_sampler.h"
#include "http_client.h"
#include "image_request.h"
#include "logger.h"
#include "metadata_client.h"
#include "panorama_resolver.h"

namespace {

int run(const CrawlerConfig& config) {
    auto logger = std::make_shared<Logger>(config.log_file, config.console_output);

    try {
        auto http = std::make_shared<CurlHttpClient>(config.timeout_seconds);

        SphericalGeodesic geodesic;
        GridSampler sampler(config.grid, geodesic);
        PanoramaResolver resolver(std::make_shared<StreetViewMetadataClient>(http, config.api_key));

        Catalogue catalogue(config.output_dir,
            std::make_shared<Acquirer>(http, logger),
            ImageRequestBuilder(config.api_key, config.image_width, config.image_height),
            config.persistence,
            config.fov,
            logger,
            config.workers);

        logger->info("Output directory: " + config.output_dir.string());

        auto start_time = std::chrono::steady_clock::now();
        CatalogueSummary summary = catalogue.add(sampler, resolver);
        auto end_time = std::chrono::steady_clock::now();

        double duration = std::chrono::duration<double>(end_time - start_time).count();
        logger->info("Processing complete in " + std::to_string(duration) + " seconds");
        logger->info("Successful: " + std::to_string(summary.successful) + "/" + std::to_string(summary.total()));
        logger->info("Failed: " + std::to_string(summary.failed) + "/" + std::to_string(summary.total()));
        logger->info("Metadata lookups: " + std::to_string(resolver.cache().size()));
        return 0;
    }
    catch (const std::exception& e) {
        logger->error(std::string("Fatal error: ") + e.what());
        return 1;
    }
}

}

// Main entry point
int main(int argc, char* argv[]) {
    CrawlerConfig config;
    try {
        config = parse_arguments(argc, argv);
        if (config.show_help) {
            print_usage(std::cout, argv[0]);
            return 0;
        }
        config.api_key = api_key_from_environment();
    }
    catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << std::endl << std::endl;
        print_usage(std::cerr, argv[0]);
        return 1;
    }

    return run(config);
}
