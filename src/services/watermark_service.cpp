#include "watermark_service.h"
#include "../exceptions/pipeline_exceptions.h"
#include "../utils/logger.h"
#include "../utils/metrics.h"
#include <algorithm>
#include <cmath>

namespace prism {

WatermarkService::WatermarkService(int margin)
    : margin_(margin < 0 ? 0 : margin) {
}

vips::VImage WatermarkService::applyOverlay(const vips::VImage& image,
                                            const vips::VImage& overlay,
                                            WatermarkPosition position,
                                            double opacity) const {
    auto timer = prism::Metrics::get()->start_timer("WatermarkDuration", {{"operation", "apply"}});

    try {
        int imageWidth = image.width();
        int imageHeight = image.height();

        vips::VImage fitted = fitOverlay(overlay, imageWidth, imageHeight);
        vips::VImage prepared = prepareOverlay(fitted, opacity);

        auto [x, y] = calculatePosition(imageWidth, imageHeight,
                                        prepared.width(), prepared.height(), position);

        vips::VImage result = compositeWatermark(image, prepared, x, y);

        METRICS_COUNT("WatermarkOperations", 1.0, "Count", {{"status", "success"}});
        return result;

    } catch (const vips::VError& e) {
        prism::Logger::log_structured(spdlog::level::err, "Watermark application failed", {
            {"image_width", image.width()},
            {"image_height", image.height()},
            {"position", watermarkPositionToString(position)},
            {"opacity", opacity},
            {"error", e.what()}
        });
        METRICS_COUNT("WatermarkOperations", 1.0, "Count", {{"status", "error"}});
        throw exceptions::ExecutionException(std::string("Watermark failed: ") + e.what());
    }
}

vips::VImage WatermarkService::fitOverlay(const vips::VImage& overlay,
                                          int imageWidth, int imageHeight) const {
    if (overlay.width() <= imageWidth && overlay.height() <= imageHeight) {
        return overlay;
    }

    double scale = std::min(static_cast<double>(imageWidth) / overlay.width(),
                            static_cast<double>(imageHeight) / overlay.height());

    vips::VImage scaled = overlay.resize(scale, vips::VImage::option()
        ->set("kernel", VIPS_KERNEL_LANCZOS3));

    // Rounding inside resize can leave the overlay a pixel too large
    int width = std::min(scaled.width(), imageWidth);
    int height = std::min(scaled.height(), imageHeight);
    if (width != scaled.width() || height != scaled.height()) {
        scaled = scaled.extract_area(0, 0, width, height);
    }

    prism::Logger::log_structured(spdlog::level::debug, "Overlay scaled to fit base image", {
        {"overlay_width", overlay.width()},
        {"overlay_height", overlay.height()},
        {"scaled_width", scaled.width()},
        {"scaled_height", scaled.height()}
    });

    return scaled;
}

vips::VImage WatermarkService::prepareOverlay(const vips::VImage& overlay, double opacity) const {
    vips::VImage img = overlay.colourspace(VIPS_INTERPRETATION_sRGB);

    if (img.format() != VIPS_FORMAT_UCHAR) {
        img = img.cast(VIPS_FORMAT_UCHAR);
    }

    if (!img.has_alpha()) {
        img = img.bandjoin(255);  // Add opaque alpha channel
    }

    if (opacity < 1.0) {
        vips::VImage rgb = img.extract_band(0, vips::VImage::option()
            ->set("n", img.bands() - 1));
        vips::VImage alpha = img.extract_band(img.bands() - 1);
        alpha = alpha.linear(opacity, 0).cast(VIPS_FORMAT_UCHAR);
        img = rgb.bandjoin(alpha);
    }

    return img;
}

std::pair<int, int> WatermarkService::calculatePosition(int imageWidth, int imageHeight,
                                                        int overlayWidth, int overlayHeight,
                                                        WatermarkPosition position) const {
    int x = 0, y = 0;

    switch (position) {
        case WatermarkPosition::BOTTOM_RIGHT:
            x = imageWidth - overlayWidth - margin_;
            y = imageHeight - overlayHeight - margin_;
            break;
        case WatermarkPosition::BOTTOM_LEFT:
            x = margin_;
            y = imageHeight - overlayHeight - margin_;
            break;
        case WatermarkPosition::TOP_RIGHT:
            x = imageWidth - overlayWidth - margin_;
            y = margin_;
            break;
        case WatermarkPosition::TOP_LEFT:
            x = margin_;
            y = margin_;
            break;
        case WatermarkPosition::CENTER:
            x = (imageWidth - overlayWidth) / 2;
            y = (imageHeight - overlayHeight) / 2;
            break;
    }

    // The margin is dropped when the overlay fills the base
    x = std::clamp(x, 0, std::max(0, imageWidth - overlayWidth));
    y = std::clamp(y, 0, std::max(0, imageHeight - overlayHeight));

    return {x, y};
}

vips::VImage WatermarkService::compositeWatermark(const vips::VImage& image,
                                                  const vips::VImage& watermark,
                                                  int x, int y) const {
    vips::VImage img = image.colourspace(VIPS_INTERPRETATION_sRGB);
    bool had_alpha = img.has_alpha();
    if (!had_alpha) {
        img = img.bandjoin(255);
    }

    // Embed watermark on a transparent canvas the size of the image
    vips::VImage positioned = watermark.embed(x, y, img.width(), img.height(),
        vips::VImage::option()->set("extend", VIPS_EXTEND_BACKGROUND)
            ->set("background", std::vector<double>{0, 0, 0, 0}));

    vips::VImage result = img.composite2(positioned, VIPS_BLEND_MODE_OVER);

    // Composite produces float; return to 8-bit
    result = result.cast(VIPS_FORMAT_UCHAR);

    if (!had_alpha) {
        result = result.extract_band(0, vips::VImage::option()->set("n", 3));
    }

    return result;
}

} // namespace prism
