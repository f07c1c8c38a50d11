#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "acquirer.h"
#include "logger.h"

namespace fs = std::filesystem;

// How acquired images of a panorama end up on disk
struct PersistenceStrategy {
    enum class Mode {
        Simple,   // one file per image
        Glued     // one horizontal composite per panorama
    };

    // Ordering of images inside a composite
    enum class GlueOrder {
        ByFov,      // stable, keeps acquisition order when all fovs match
        ByHeading
    };

    Mode mode;
    bool duplicate_seam;   // Glued only: repeat the last image at the left edge
    GlueOrder glue_order;

    PersistenceStrategy() : mode(Mode::Simple), duplicate_seam(true), glue_order(GlueOrder::ByFov) {}

    static PersistenceStrategy simple() { return PersistenceStrategy(); }
    static PersistenceStrategy glued(bool seam = true, GlueOrder order = GlueOrder::ByFov) {
        PersistenceStrategy strategy;
        strategy.mode = Mode::Glued;
        strategy.duplicate_seam = seam;
        strategy.glue_order = order;
        return strategy;
    }
};

// "{fov}-{heading}"
std::string tile_stem(const ImageRequest& request);

// "--"-joined stems of the parts, left to right, plus ".jpg"
std::string composite_file_name(const std::vector<ImageRequest>& parts);

// Throws ConfigurationError when a Glued composite of a full rotation at
// this fov could not be written: the file name would exceed NAME_MAX or
// the image would be wider than a JPEG allows. No-op in Simple mode.
void validate_composite(const PersistenceStrategy& strategy, int fov, int image_width);

// Paste images left to right on a canvas as tall as the tallest one.
// Shorter images are top-aligned and the rows below them stay black.
cv::Mat compose_horizontal(const std::vector<cv::Mat>& images);

// Writes images of one panorama under <root>/<pano_id>/
class PanoramaStore {
public:
    PanoramaStore(const fs::path& root, const PersistenceStrategy& strategy, std::shared_ptr<Logger> logger);

    // Returns the written paths. The panorama directory is created only when
    // there is something to write. Throws std::runtime_error on I/O failure.
    std::vector<fs::path> save(const std::string& pano_id, const std::vector<AcquiredImage>& images) const;

    const PersistenceStrategy& strategy() const { return persistence; }

private:
    fs::path root;
    PersistenceStrategy persistence;
    std::shared_ptr<Logger> logger;

    std::vector<fs::path> save_simple(const fs::path& folder, const std::vector<AcquiredImage>& images) const;
    std::vector<fs::path> save_glued(const fs::path& folder, const std::vector<AcquiredImage>& images) const;
};
