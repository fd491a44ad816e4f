#include "image_processor.h"
#include "../exceptions/pipeline_exceptions.h"
#include "../utils/logger.h"
#include "../utils/metrics.h"
#include <algorithm>
#include <cmath>
#include <new>

namespace prism {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

vips::VImage loadFromBuffer(const std::vector<char>& data) {
    return vips::VImage::new_from_buffer(data.data(), data.size(), "");
}

std::string formatFromLoader(const std::string& loader) {
    if (loader.find("jpeg") != std::string::npos) return "jpeg";
    if (loader.find("png") != std::string::npos) return "png";
    if (loader.find("webp") != std::string::npos) return "webp";
    if (loader.find("tiff") != std::string::npos) return "tiff";
    if (loader.find("gif") != std::string::npos) return "gif";
    if (loader.find("ppm") != std::string::npos) return "ppm";
    return "";
}

} // namespace

ImageProcessor::ImageProcessor(int default_quality,
                               std::shared_ptr<WatermarkService> watermark_service)
    : default_quality_(default_quality),
      watermark_service_(watermark_service ? std::move(watermark_service)
                                           : std::make_shared<WatermarkService>()) {
    if (default_quality_ < TransformLimits::MIN_QUALITY || default_quality_ > TransformLimits::MAX_QUALITY) {
        LOG_WARN("Invalid default quality {}, using {}", default_quality_, TransformLimits::DEFAULT_QUALITY);
        default_quality_ = TransformLimits::DEFAULT_QUALITY;
    }
}

ImageProcessor::~ImageProcessor() {
}

bool ImageProcessor::initialize() {
    if (VIPS_INIT("prism")) {
        LOG_CRITICAL("Failed to initialize libvips");
        METRICS_COUNT("LibVipsErrors", 1.0, "Count", {{"error_type", "init_failed"}});
        return false;
    }
    LOG_INFO("libvips initialized successfully");
    return true;
}

void ImageProcessor::shutdown() {
    vips_shutdown();
}

Artifact ImageProcessor::execute(const std::vector<char>& source,
                                 const TransformSpec& spec,
                                 const std::string& output_format,
                                 const std::string& fingerprint,
                                 const OverlayLoader& overlay_loader) const {
    std::string target_format = image_formats::requireSupported(
        spec.formatOverride().value_or(output_format));
    int quality = spec.qualityOverride().value_or(default_quality_);

    auto timer = prism::Metrics::get()->start_timer("TransformDuration", {
        {"format", target_format}
    });

    spec.validate();

    try {
        vips::VImage image = loadFromBuffer(source);

        for (const auto& operation : spec.operations()) {
            image = applyOperation(image, operation, overlay_loader);
        }

        std::vector<char> encoded = encode(image, target_format, quality);

        Artifact artifact;
        artifact.fingerprint = fingerprint;
        artifact.format = target_format;
        artifact.width = image.width();
        artifact.height = image.height();
        artifact.size_bytes = encoded.size();
        artifact.created_at = std::time(nullptr);
        artifact.data = std::make_shared<const std::vector<char>>(std::move(encoded));

        METRICS_COUNT("ImageTransformations", 1.0, "Count", {
            {"format", target_format},
            {"status", "success"}
        });

        return artifact;

    } catch (const vips::VError& e) {
        prism::Logger::log_structured(spdlog::level::err, "Image transformation failed", {
            {"fingerprint", fingerprint},
            {"source_bytes", source.size()},
            {"spec", spec.canonicalize()},
            {"target_format", target_format},
            {"error", e.what()}
        });
        METRICS_COUNT("ImageTransformations", 1.0, "Count", {
            {"format", target_format},
            {"status", "error"}
        });
        throw exceptions::ExecutionException(std::string("Image transformation failed: ") + e.what());
    } catch (const std::bad_alloc&) {
        prism::Logger::log_structured(spdlog::level::err, "Image transformation ran out of memory", {
            {"fingerprint", fingerprint},
            {"source_bytes", source.size()}
        });
        METRICS_COUNT("ImageTransformations", 1.0, "Count", {
            {"format", target_format},
            {"status", "resource_exhausted"}
        });
        throw exceptions::ExecutionException("Image transformation failed: out of memory");
    }
}

vips::VImage ImageProcessor::applyOperation(const vips::VImage& image,
                                            const Operation& operation,
                                            const OverlayLoader& overlay_loader) const {
    return std::visit(overloaded{
        [&](const ops::Resize& resize) { return applyResize(image, resize); },
        [&](const ops::Crop& crop) { return applyCrop(image, crop); },
        [&](const ops::Rotate& rotate) { return applyRotate(image, rotate); },
        [&](const ops::Flip& flip) {
            return image.flip(flip.axis == FlipAxis::HORIZONTAL
                ? VIPS_DIRECTION_HORIZONTAL : VIPS_DIRECTION_VERTICAL);
        },
        [&](const ops::Watermark& watermark) {
            return applyWatermark(image, watermark, overlay_loader);
        },
        // format and compress only change how the final image is encoded
        [&](const ops::Format&) { return image; },
        [&](const ops::Grayscale&) { return image.colourspace(VIPS_INTERPRETATION_B_W); },
        [&](const ops::Sepia&) { return applySepia(image); },
        [&](const ops::Mirror&) { return image.flip(VIPS_DIRECTION_HORIZONTAL); },
        [&](const ops::Compress&) { return image; }
    }, operation);
}

vips::VImage ImageProcessor::applyResize(const vips::VImage& image, const ops::Resize& resize) const {
    int original_width = image.width();
    int original_height = image.height();

    Dimensions target = resizedDimensions({original_width, original_height}, resize);
    int target_width = target.width;
    int target_height = target.height;

    if (target_width == original_width && target_height == original_height) {
        return image;
    }

    double h_scale = static_cast<double>(target_width) / original_width;
    double v_scale = static_cast<double>(target_height) / original_height;

    vips::VImage resized = image.resize(h_scale, vips::VImage::option()
        ->set("vscale", v_scale)
        ->set("kernel", VIPS_KERNEL_LANCZOS3));

    // resize rounds each axis on its own; pin the result to the exact target
    if (resized.width() > target_width || resized.height() > target_height) {
        resized = resized.extract_area(0, 0,
            std::min(resized.width(), target_width),
            std::min(resized.height(), target_height));
    }
    if (resized.width() < target_width || resized.height() < target_height) {
        resized = resized.embed(0, 0, target_width, target_height,
            vips::VImage::option()->set("extend", VIPS_EXTEND_COPY));
    }

    return resized;
}

vips::VImage ImageProcessor::applyCrop(const vips::VImage& image, const ops::Crop& crop) const {
    if (static_cast<long long>(crop.x) + crop.width > image.width() ||
        static_cast<long long>(crop.y) + crop.height > image.height()) {
        throw exceptions::ValidationException(
            "Crop region " + std::to_string(crop.width) + "x" + std::to_string(crop.height) +
            "+" + std::to_string(crop.x) + "+" + std::to_string(crop.y) +
            " exceeds image bounds " + std::to_string(image.width()) + "x" +
            std::to_string(image.height()));
    }

    return image.extract_area(crop.x, crop.y, crop.width, crop.height);
}

vips::VImage ImageProcessor::applyRotate(const vips::VImage& image, const ops::Rotate& rotate) const {
    switch (rotate.degrees) {
        case 0: return image;
        case 90: return image.rot90();
        case 180: return image.rot180();
        case 270: return image.rot270();
        default: break;
    }

    // Arbitrary angles grow the canvas; uncovered corners get a black
    // (or fully transparent) background
    rotatedDimensions({image.width(), image.height()}, rotate.degrees);

    std::vector<double> background(image.bands(), 0.0);
    return image.rotate(static_cast<double>(rotate.degrees), vips::VImage::option()
        ->set("background", background));
}

vips::VImage ImageProcessor::applySepia(const vips::VImage& image) const {
    vips::VImage rgb = image.colourspace(VIPS_INTERPRETATION_sRGB);
    if (rgb.format() != VIPS_FORMAT_UCHAR) {
        rgb = rgb.cast(VIPS_FORMAT_UCHAR);
    }

    vips::VImage alpha;
    bool has_alpha = rgb.has_alpha();
    if (has_alpha) {
        alpha = rgb.extract_band(3);
        rgb = rgb.extract_band(0, vips::VImage::option()->set("n", 3));
    }

    vips::VImage matrix = vips::VImage::new_matrixv(3, 3,
        0.393, 0.769, 0.189,
        0.349, 0.686, 0.168,
        0.272, 0.534, 0.131);

    // cast clips the recombined values back into 0..255
    vips::VImage sepia = rgb.recomb(matrix).cast(VIPS_FORMAT_UCHAR)
        .copy(vips::VImage::option()->set("interpretation", VIPS_INTERPRETATION_sRGB));

    if (has_alpha) {
        sepia = sepia.bandjoin(alpha);
    }
    return sepia;
}

vips::VImage ImageProcessor::applyWatermark(const vips::VImage& image,
                                            const ops::Watermark& watermark,
                                            const OverlayLoader& overlay_loader) const {
    if (!overlay_loader) {
        throw exceptions::ExecutionException("No overlay source configured for watermark '" +
                                             watermark.overlay_id + "'");
    }

    std::vector<char> overlay_bytes = overlay_loader(watermark.overlay_id);
    if (overlay_bytes.empty()) {
        throw exceptions::ExecutionException("Watermark overlay not found: " + watermark.overlay_id);
    }

    vips::VImage overlay = loadFromBuffer(overlay_bytes);
    return watermark_service_->applyOverlay(image, overlay, watermark.position, watermark.opacity);
}

std::vector<char> ImageProcessor::encode(const vips::VImage& image,
                                         const std::string& format,
                                         int quality) const {
    vips::VImage output = image;
    vips::VOption* save_options = vips::VImage::option();

    if (format == "jpeg") {
        // JPEG has no alpha channel
        if (output.has_alpha()) {
            output = output.flatten(vips::VImage::option()
                ->set("background", std::vector<double>{255, 255, 255}));
        }
        save_options->set("Q", quality);
        save_options->set("strip", true);
        save_options->set("optimize_coding", true);
    } else if (format == "png") {
        save_options->set("compression", 6);
        save_options->set("strip", true);
    } else if (format == "webp") {
        save_options->set("Q", quality);
        save_options->set("strip", true);
    } else if (format == "tiff") {
        save_options->set("strip", true);
    } else if (format == "gif") {
        save_options->set("strip", true);
    }

    if (output.format() != VIPS_FORMAT_UCHAR) {
        output = output.cast(VIPS_FORMAT_UCHAR);
    }

    std::string suffix = formatToSuffix(format);

    void* buffer = nullptr;
    size_t length = 0;
    output.write_to_buffer(suffix.c_str(), &buffer, &length, save_options);

    std::vector<char> encoded(static_cast<char*>(buffer), static_cast<char*>(buffer) + length);
    g_free(buffer);

    return encoded;
}

ImageInfo ImageProcessor::getImageInfo(const std::vector<char>& data) const {
    ImageInfo info;
    info.size_bytes = data.size();

    if (data.empty()) {
        return info;
    }

    try {
        vips::VImage image = loadFromBuffer(data);

        info.width = image.width();
        info.height = image.height();
        info.is_valid = true;

        if (image.get_typeof("vips-loader") != 0) {
            info.format = formatFromLoader(image.get_string("vips-loader"));
        }

    } catch (const vips::VError& e) {
        prism::Logger::log_structured(spdlog::level::warn, "Failed to get image info", {
            {"size_bytes", data.size()},
            {"error", e.what()}
        });
    }

    return info;
}

bool ImageProcessor::isValidImage(const std::vector<char>& data) const {
    if (data.empty()) {
        return false;
    }

    try {
        vips::VImage image = loadFromBuffer(data);
        // Force a decode so truncated bodies are rejected, not just bad headers
        image.avg();
        return true;
    } catch (const vips::VError& e) {
        LOG_DEBUG("Buffer rejected as image: {}", e.what());
        return false;
    }
}

std::string ImageProcessor::formatToSuffix(const std::string& format) const {
    std::string lower_format = image_formats::normalize(format);

    if (lower_format == "jpeg") return ".jpg";
    if (lower_format == "png") return ".png";
    if (lower_format == "webp") return ".webp";
    if (lower_format == "tiff") return ".tif";
    if (lower_format == "gif") return ".gif";

    throw exceptions::ValidationException("Unsupported output format '" + format + "'");
}

} // namespace prism
