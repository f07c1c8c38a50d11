#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "acquirer.h"
#include "grid_sampler.h"
#include "image_request.h"
#include "index_file.h"
#include "logger.h"
#include "panorama.h"
#include "panorama_resolver.h"
#include "persistence.h"

namespace fs = std::filesystem;

struct CatalogueSummary {
    int successful;
    int failed;

    CatalogueSummary() : successful(0), failed(0) {}
    int total() const { return successful + failed; }
};

// Downloads panoramas into an output directory and keeps index.csv
// in step with what actually landed on disk.
class Catalogue {
public:
    // Throws ConfigurationError for a field of view that does not divide 360,
    // or one too small for a Glued composite to be written
    Catalogue(const fs::path& directory,
        std::shared_ptr<Acquirer> acquirer,
        const ImageRequestBuilder& request_builder,
        const PersistenceStrategy& strategy,
        int fov,
        std::shared_ptr<Logger> logger,
        size_t workers = 1);

    // Throws OutputExistsError, before touching the filesystem, when the
    // index file is already present.
    CatalogueSummary add(const std::vector<PanoramaRecord>& panoramas);

    // Sample, resolve and deduplicate first, then add the result
    CatalogueSummary add(const GridSampler& sampler, PanoramaResolver& resolver);

    fs::path index_path() const { return directory / IndexWriter::kFileName; }

private:
    fs::path directory;
    std::shared_ptr<Acquirer> acquirer;
    ImageRequestBuilder request_builder;
    PanoramaStore store;
    int fov;
    std::shared_ptr<Logger> logger;
    size_t worker_count;

    void ensure_index_absent() const;
    bool download(const PanoramaRecord& pano);
};
