#include "catalogue.h"

#include <algorithm>
#include <future>

#include "errors.h"
#include "panorama_deduplicator.h"
#include "thread_pool.h"

Catalogue::Catalogue(const fs::path& dir,
    std::shared_ptr<Acquirer> acq,
    const ImageRequestBuilder& builder,
    const PersistenceStrategy& strategy,
    int field_of_view,
    std::shared_ptr<Logger> log,
    size_t workers)
    : directory(dir),
    acquirer(std::move(acq)),
    request_builder(builder),
    store(dir, strategy, log),
    fov(field_of_view),
    logger(std::move(log)),
    worker_count(std::max<size_t>(1, workers)) {
    validate_fov(fov);
    validate_composite(strategy, fov, request_builder.image_width());
}

void Catalogue::ensure_index_absent() const {
    if (fs::exists(index_path())) {
        throw OutputExistsError(std::string(IndexWriter::kFileName) + " already exists in " + directory.string());
    }
}

// Request, acquire and save a single panorama
bool Catalogue::download(const PanoramaRecord& pano) {
    std::vector<AcquiredImage> images = acquirer->acquire(request_builder.requests(pano, fov));
    if (images.empty()) {
        logger->warning("No images downloaded for " + pano.pano_id);
        return false;
    }

    try {
        std::vector<fs::path> written = store.save(pano.pano_id, images);
        logger->info("Saved " + std::to_string(written.size()) + " file(s) for " + pano.pano_id +
            " from " + std::to_string(images.size()) + " image(s)");
    }
    catch (const std::exception& e) {
        logger->error("Error saving " + pano.pano_id + ": " + e.what());
        return false;
    }

    return true;
}

CatalogueSummary Catalogue::add(const std::vector<PanoramaRecord>& panoramas) {
    ensure_index_absent();
    fs::create_directories(directory);

    IndexWriter index(index_path());
    CatalogueSummary summary;

    int total = static_cast<int>(panoramas.size());
    logger->info("Got " + std::to_string(total) + " panos to explore.");

    auto record = [&](const PanoramaRecord& pano, bool success) {
        if (success) {
            index.append(CatalogueIndexEntry(pano.pano_id, pano.location.latitude, pano.location.longitude));
            summary.successful++;
        }
        else {
            summary.failed++;
        }
    };

    if (worker_count == 1) {
        for (int i = 0; i < total; ++i) {
            logger->info("Getting pano " + std::to_string(i + 1) + " of " + std::to_string(total) + "...");
            record(panoramas[i], download(panoramas[i]));
        }
    }
    else {
        ThreadPool pool(worker_count);
        logger->info("Processing panoramas with " + std::to_string(worker_count) + " workers");

        // Batches keep memory bounded; rows are written in submission order
        const int batch_size = static_cast<int>(worker_count) * 2;
        for (int start = 0; start < total; start += batch_size) {
            int end = std::min(start + batch_size, total);

            std::vector<std::future<bool>> futures;
            futures.reserve(end - start);
            for (int i = start; i < end; ++i) {
                const PanoramaRecord& pano = panoramas[i];
                futures.push_back(pool.enqueue([this, &pano]() { return download(pano); }));
            }

            for (int i = start; i < end; ++i) {
                bool success = futures[i - start].get();
                logger->info("Got pano " + std::to_string(i + 1) + " of " + std::to_string(total) + ".");
                record(panoramas[i], success);
            }
        }
    }

    logger->info("Completed: " + std::to_string(summary.successful) + " successful, " +
        std::to_string(summary.failed) + " failed");
    return summary;
}

CatalogueSummary Catalogue::add(const GridSampler& sampler, PanoramaResolver& resolver) {
    ensure_index_absent();

    const GridSpec& spec = sampler.spec();
    logger->info("Sampling " + std::to_string(sampler.size()) + " points over a " +
        std::to_string(spec.side) + " m square around " + spec.center.to_string() +
        " (stride " + std::to_string(spec.stride) + " m, requested step " + std::to_string(spec.step) + " m)");

    PanoramaDeduplicator deduplicator(logger);
    std::vector<PanoramaRecord> panoramas = deduplicator.dedupe(sampler,
        [&resolver](const Coordinate& point) { return resolver.resolve(point); });

    return add(panoramas);
}
