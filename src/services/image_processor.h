#ifndef PRISM_IMAGE_PROCESSOR_H
#define PRISM_IMAGE_PROCESSOR_H

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <vips/vips8>
#include "../models/artifact.h"
#include "../models/transform_spec.h"
#include "watermark_service.h"

namespace prism {

struct ImageInfo {
    int width = 0;
    int height = 0;
    std::string format;
    size_t size_bytes = 0;
    bool is_valid = false;
};

// Returns the encoded bytes of an overlay image, empty if it does not exist
using OverlayLoader = std::function<std::vector<char>(const std::string& overlay_id)>;

/**
 * @brief Transform executor: applies a TransformSpec to an encoded image
 *
 * Stateless per call and safe to use from several worker threads at once.
 * The source buffer is only read. Identical inputs always produce
 * byte-identical output because every encoder strips metadata and runs
 * with fixed options.
 */
class ImageProcessor {
public:
    explicit ImageProcessor(int default_quality = TransformLimits::DEFAULT_QUALITY,
                            std::shared_ptr<WatermarkService> watermark_service = nullptr);
    ~ImageProcessor();

    // Initialize libvips (call once at startup)
    static bool initialize();

    // Shutdown libvips (call once at shutdown)
    static void shutdown();

    /**
     * @brief Run every operation of the spec in order and encode the result
     * @param source Encoded original image
     * @param spec Operations to apply
     * @param output_format Format to encode to unless the spec has a format op
     * @param fingerprint Recorded on the returned artifact
     * @param overlay_loader Resolves watermark overlay ids to encoded bytes
     * @return Complete artifact; nothing is returned on failure
     * @throws exceptions::ValidationException when an operation does not fit the
     *         image (crop outside the bounds)
     * @throws exceptions::ExecutionException on corrupt input, unsupported
     *         conversions, missing overlays or resource exhaustion
     */
    Artifact execute(const std::vector<char>& source,
                     const TransformSpec& spec,
                     const std::string& output_format,
                     const std::string& fingerprint,
                     const OverlayLoader& overlay_loader = nullptr) const;

    // Read dimensions and format from the header only
    ImageInfo getImageInfo(const std::vector<char>& data) const;

    // Validate that the buffer decodes as an image
    bool isValidImage(const std::vector<char>& data) const;

    int getDefaultQuality() const { return default_quality_; }

private:
    int default_quality_;
    std::shared_ptr<WatermarkService> watermark_service_;

    vips::VImage applyOperation(const vips::VImage& image,
                                const Operation& operation,
                                const OverlayLoader& overlay_loader) const;

    vips::VImage applyResize(const vips::VImage& image, const ops::Resize& resize) const;
    vips::VImage applyCrop(const vips::VImage& image, const ops::Crop& crop) const;
    vips::VImage applyRotate(const vips::VImage& image, const ops::Rotate& rotate) const;
    vips::VImage applySepia(const vips::VImage& image) const;
    vips::VImage applyWatermark(const vips::VImage& image,
                                const ops::Watermark& watermark,
                                const OverlayLoader& overlay_loader) const;

    std::vector<char> encode(const vips::VImage& image, const std::string& format, int quality) const;

    // Convert format name to libvips suffix
    std::string formatToSuffix(const std::string& format) const;
};

} // namespace prism

#endif // PRISM_IMAGE_PROCESSOR_H
