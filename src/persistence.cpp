#include "persistence.h"

#include <algorithm>
#include <fstream>
#include <stdexcept>

#include <opencv2/imgcodecs.hpp>

#include "errors.h"

namespace {

constexpr size_t kMaxFileNameLength = 255;
constexpr long kMaxJpegWidth = 65535;

struct DecodedImage {
    cv::Mat image;
    ImageRequest request;
};

}

std::string tile_stem(const ImageRequest& request) {
    return std::to_string(request.fov) + "-" + std::to_string(request.heading);
}

std::string composite_file_name(const std::vector<ImageRequest>& parts) {
    std::string name;
    for (const auto& part : parts) {
        if (!name.empty()) {
            name += "--";
        }
        name += tile_stem(part);
    }
    return name + ".jpg";
}

void validate_composite(const PersistenceStrategy& strategy, int fov, int image_width) {
    if (strategy.mode != PersistenceStrategy::Mode::Glued) {
        return;
    }
    validate_fov(fov);

    std::vector<ImageRequest> parts;
    for (int heading = 0; heading < 360; heading += fov) {
        parts.emplace_back("", fov, heading);
    }
    if (strategy.duplicate_seam) {
        ImageRequest seam = parts.back();
        parts.insert(parts.begin(), seam);
    }

    size_t name_length = composite_file_name(parts).size();
    if (name_length > kMaxFileNameLength) {
        throw ConfigurationError("Glued mode needs a larger field of view: a composite at fov " +
            std::to_string(fov) + " would be named with " + std::to_string(name_length) +
            " characters, the limit is " + std::to_string(kMaxFileNameLength));
    }

    long total_width = static_cast<long>(parts.size()) * image_width;
    if (total_width > kMaxJpegWidth) {
        throw ConfigurationError("Glued composite would be " + std::to_string(total_width) +
            " pixels wide, JPEG allows at most " + std::to_string(kMaxJpegWidth));
    }
}

cv::Mat compose_horizontal(const std::vector<cv::Mat>& images) {
    if (images.empty()) {
        return cv::Mat();
    }

    int total_width = 0;
    int max_height = 0;
    for (const auto& img : images) {
        total_width += img.cols;
        max_height = std::max(max_height, img.rows);
    }

    cv::Mat composite(max_height, total_width, images.front().type(), cv::Scalar::all(0));

    int pos_x = 0;
    for (const auto& img : images) {
        cv::Rect roi(pos_x, 0, img.cols, img.rows);
        cv::Mat destination = composite(roi);
        img.copyTo(destination);
        pos_x += img.cols;
    }

    return composite;
}

PanoramaStore::PanoramaStore(const fs::path& root_dir, const PersistenceStrategy& strategy, std::shared_ptr<Logger> log)
    : root(root_dir), persistence(strategy), logger(std::move(log)) {}

std::vector<fs::path> PanoramaStore::save(const std::string& pano_id, const std::vector<AcquiredImage>& images) const {
    if (images.empty()) {
        return {};
    }

    fs::path folder = root / pano_id;
    switch (persistence.mode) {
    case PersistenceStrategy::Mode::Glued:
        return save_glued(folder, images);
    case PersistenceStrategy::Mode::Simple:
    default:
        return save_simple(folder, images);
    }
}

std::vector<fs::path> PanoramaStore::save_simple(const fs::path& folder, const std::vector<AcquiredImage>& images) const {
    fs::create_directories(folder);

    std::vector<fs::path> written;
    for (const auto& image : images) {
        fs::path output_path = folder / (tile_stem(image.request) + ".jpg");

        std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("Could not open file: " + output_path.string());
        }
        out.write(image.bytes.data(), static_cast<std::streamsize>(image.bytes.size()));
        if (!out) {
            throw std::runtime_error("Could not write file: " + output_path.string());
        }

        written.push_back(output_path);
    }

    return written;
}

std::vector<fs::path> PanoramaStore::save_glued(const fs::path& folder, const std::vector<AcquiredImage>& images) const {
    std::vector<DecodedImage> decoded;
    decoded.reserve(images.size() + 1);

    for (const auto& image : images) {
        std::vector<uchar> buffer(image.bytes.begin(), image.bytes.end());
        cv::Mat img = cv::imdecode(buffer, cv::IMREAD_COLOR);
        if (img.empty()) {
            logger->warning("Could not decode image " + tile_stem(image.request) + " for " + folder.filename().string());
            continue;
        }
        decoded.push_back({ img, image.request });
    }

    if (decoded.empty()) {
        return {};
    }

    if (persistence.glue_order == PersistenceStrategy::GlueOrder::ByHeading) {
        std::stable_sort(decoded.begin(), decoded.end(), [](const DecodedImage& a, const DecodedImage& b) {
            return a.request.heading < b.request.heading;
        });
    }
    else {
        std::stable_sort(decoded.begin(), decoded.end(), [](const DecodedImage& a, const DecodedImage& b) {
            return a.request.fov < b.request.fov;
        });
    }

    // The 360 -> 0 seam is shown twice, once at each edge
    if (persistence.duplicate_seam) {
        DecodedImage seam = decoded.back();
        decoded.insert(decoded.begin(), seam);
    }

    std::vector<cv::Mat> parts;
    std::vector<ImageRequest> order;
    for (const auto& part : decoded) {
        parts.push_back(part.image);
        order.push_back(part.request);
    }

    cv::Mat composite = compose_horizontal(parts);

    fs::create_directories(folder);
    fs::path output_path = folder / composite_file_name(order);
    if (!cv::imwrite(output_path.string(), composite)) {
        throw std::runtime_error("Could not write composite: " + output_path.string());
    }

    logger->info("Saved composite of " + std::to_string(parts.size()) + " images: " + output_path.string());
    return { output_path };
}
