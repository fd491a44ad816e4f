#ifndef PRISM_WATERMARK_SERVICE_H
#define PRISM_WATERMARK_SERVICE_H

#include <vips/vips8>
#include <utility>
#include "../models/transform_spec.h"

namespace prism {

/**
 * @brief Composites an overlay image onto a base image
 *
 * Errors are raised as exceptions::ExecutionException; a failed watermark
 * fails the whole transform rather than silently returning the base.
 */
class WatermarkService {
public:
    // margin: pixels kept between the overlay and the nearest edges
    explicit WatermarkService(int margin = 20);

    vips::VImage applyOverlay(const vips::VImage& image,
                              const vips::VImage& overlay,
                              WatermarkPosition position,
                              double opacity) const;

    int getMargin() const { return margin_; }

private:
    int margin_;

    // Shrink the overlay (aspect preserved) until it fits inside the base
    vips::VImage fitOverlay(const vips::VImage& overlay, int imageWidth, int imageHeight) const;

    // Ensure an sRGB + alpha overlay with the alpha multiplied by opacity
    vips::VImage prepareOverlay(const vips::VImage& overlay, double opacity) const;

    // Returns (x, y) coordinates for top-left corner of overlay
    std::pair<int, int> calculatePosition(int imageWidth, int imageHeight,
                                          int overlayWidth, int overlayHeight,
                                          WatermarkPosition position) const;

    vips::VImage compositeWatermark(const vips::VImage& image,
                                    const vips::VImage& watermark,
                                    int x, int y) const;
};

} // namespace prism

#endif // PRISM_WATERMARK_SERVICE_H
