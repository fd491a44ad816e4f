#include "transform_spec.h"
#include "../exceptions/pipeline_exceptions.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>

namespace prism {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

constexpr double PI = 3.14159265358979323846;

[[noreturn]] void fail(const std::string& message) {
    throw exceptions::ValidationException(message);
}

// Snap to the grid the canonical form prints, so equal fingerprints imply
// equal executor input
double quantizeOpacity(double opacity) {
    if (!std::isfinite(opacity)) {
        return opacity;
    }
    return std::round(opacity * TransformLimits::OPACITY_STEPS) / TransformLimits::OPACITY_STEPS;
}

void rejectUnknownKeys(const nlohmann::json& obj, const std::string& op,
                       const std::set<std::string>& allowed) {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (it.key() == "op") {
            continue;
        }
        if (allowed.find(it.key()) == allowed.end()) {
            fail("Unknown parameter '" + it.key() + "' for operation '" + op + "'");
        }
    }
}

// Integral JSON numbers only; 400.0 is accepted and normalized to 400
std::optional<int> readInt(const nlohmann::json& obj, const std::string& op,
                           const std::string& key, bool required) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        if (required) {
            fail("Missing required parameter '" + key + "' for operation '" + op + "'");
        }
        return std::nullopt;
    }

    if (it->is_number_integer()) {
        auto value = it->get<long long>();
        if (value < -1000000000LL || value > 1000000000LL) {
            fail("Parameter '" + key + "' for operation '" + op + "' is out of range");
        }
        return static_cast<int>(value);
    }

    if (it->is_number_float()) {
        double value = it->get<double>();
        if (!std::isfinite(value) || std::floor(value) != value ||
            std::fabs(value) > 1000000000.0) {
            fail("Parameter '" + key + "' for operation '" + op + "' must be an integer");
        }
        return static_cast<int>(value);
    }

    fail("Parameter '" + key + "' for operation '" + op + "' must be a number");
}

std::optional<std::string> readString(const nlohmann::json& obj, const std::string& op,
                                      const std::string& key, bool required) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        if (required) {
            fail("Missing required parameter '" + key + "' for operation '" + op + "'");
        }
        return std::nullopt;
    }
    if (!it->is_string()) {
        fail("Parameter '" + key + "' for operation '" + op + "' must be a string");
    }
    return it->get<std::string>();
}

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), ::tolower);
    return value;
}

FlipAxis parseAxis(const std::string& value) {
    std::string axis = lower(value);
    if (axis == "horizontal") return FlipAxis::HORIZONTAL;
    if (axis == "vertical") return FlipAxis::VERTICAL;
    fail("Invalid flip axis '" + value + "': must be 'horizontal' or 'vertical'");
}

WatermarkPosition parsePosition(const std::string& value) {
    std::string position = lower(value);
    if (position == "top-left") return WatermarkPosition::TOP_LEFT;
    if (position == "top-right") return WatermarkPosition::TOP_RIGHT;
    if (position == "bottom-left") return WatermarkPosition::BOTTOM_LEFT;
    if (position == "bottom-right") return WatermarkPosition::BOTTOM_RIGHT;
    if (position == "center") return WatermarkPosition::CENTER;
    fail("Invalid watermark position '" + value + "'");
}

int normalizeDegrees(int degrees) {
    int normalized = degrees % 360;
    return normalized < 0 ? normalized + 360 : normalized;
}

// Overlay ids appear inside the canonical encoding, so delimiters are not allowed
bool isSafeReference(const std::string& ref) {
    if (ref.empty() || ref.size() > 256) {
        return false;
    }
    return std::all_of(ref.begin(), ref.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
    });
}

Operation parseOperation(const nlohmann::json& obj) {
    if (!obj.is_object()) {
        fail("Each operation must be a JSON object");
    }

    auto op_it = obj.find("op");
    if (op_it == obj.end() || !op_it->is_string()) {
        fail("Each operation must have a string 'op' field");
    }
    const std::string op = lower(op_it->get<std::string>());

    if (op == "resize") {
        rejectUnknownKeys(obj, op, {"width", "height"});
        ops::Resize resize;
        resize.width = readInt(obj, op, "width", false).value_or(0);
        resize.height = readInt(obj, op, "height", false).value_or(0);
        if (obj.find("width") == obj.end() && obj.find("height") == obj.end()) {
            fail("Operation 'resize' requires at least one of 'width' or 'height'");
        }
        if ((obj.contains("width") && resize.width <= 0) ||
            (obj.contains("height") && resize.height <= 0)) {
            fail("Resize dimensions must be positive");
        }
        return resize;
    }

    if (op == "crop") {
        rejectUnknownKeys(obj, op, {"x", "y", "width", "height"});
        ops::Crop crop;
        crop.x = *readInt(obj, op, "x", true);
        crop.y = *readInt(obj, op, "y", true);
        crop.width = *readInt(obj, op, "width", true);
        crop.height = *readInt(obj, op, "height", true);
        return crop;
    }

    if (op == "rotate") {
        rejectUnknownKeys(obj, op, {"degrees"});
        return ops::Rotate{normalizeDegrees(*readInt(obj, op, "degrees", true))};
    }

    if (op == "flip") {
        rejectUnknownKeys(obj, op, {"axis"});
        return ops::Flip{parseAxis(*readString(obj, op, "axis", true))};
    }

    if (op == "watermark") {
        rejectUnknownKeys(obj, op, {"overlay", "position", "opacity"});
        ops::Watermark watermark;
        watermark.overlay_id = *readString(obj, op, "overlay", true);

        auto position = readString(obj, op, "position", false);
        if (position) {
            watermark.position = parsePosition(*position);
        }

        auto opacity_it = obj.find("opacity");
        if (opacity_it != obj.end() && !opacity_it->is_null()) {
            if (!opacity_it->is_number()) {
                fail("Parameter 'opacity' for operation 'watermark' must be a number");
            }
            watermark.opacity = quantizeOpacity(opacity_it->get<double>());
        }
        return watermark;
    }

    if (op == "format") {
        rejectUnknownKeys(obj, op, {"target"});
        return ops::Format{image_formats::normalize(*readString(obj, op, "target", true))};
    }

    if (op == "grayscale") {
        rejectUnknownKeys(obj, op, {});
        return ops::Grayscale{};
    }

    if (op == "sepia") {
        rejectUnknownKeys(obj, op, {});
        return ops::Sepia{};
    }

    if (op == "mirror") {
        rejectUnknownKeys(obj, op, {});
        return ops::Mirror{};
    }

    if (op == "compress") {
        rejectUnknownKeys(obj, op, {"quality"});
        return ops::Compress{*readInt(obj, op, "quality", true)};
    }

    fail("Unknown operation '" + op + "'");
}

void validateOperation(const Operation& operation) {
    std::visit(overloaded{
        [](const ops::Resize& r) {
            if (r.width == 0 && r.height == 0) {
                fail("Operation 'resize' requires at least one of 'width' or 'height'");
            }
            if (r.width < 0 || r.height < 0) {
                fail("Resize dimensions must be positive");
            }
            if (r.width > TransformLimits::MAX_DIMENSION || r.height > TransformLimits::MAX_DIMENSION) {
                fail("Resize dimensions must not exceed " + std::to_string(TransformLimits::MAX_DIMENSION));
            }
        },
        [](const ops::Crop& c) {
            if (c.x < 0 || c.y < 0) {
                fail("Crop origin must be non-negative");
            }
            if (c.width <= 0 || c.height <= 0) {
                fail("Crop dimensions must be positive");
            }
        },
        [](const ops::Rotate& r) {
            if (r.degrees < 0 || r.degrees >= 360) {
                fail("Rotation must be normalized into [0, 360)");
            }
        },
        [](const ops::Flip&) {},
        [](const ops::Watermark& w) {
            if (!isSafeReference(w.overlay_id)) {
                fail("Watermark overlay must be a valid image id");
            }
            if (!std::isfinite(w.opacity) || w.opacity < 0.0 || w.opacity > 1.0) {
                fail("Watermark opacity must be between 0.0 and 1.0");
            }
        },
        [](const ops::Format& f) {
            image_formats::requireSupported(f.target);
        },
        [](const ops::Grayscale&) {},
        [](const ops::Sepia&) {},
        [](const ops::Mirror&) {},
        [](const ops::Compress& c) {
            if (c.quality < TransformLimits::MIN_QUALITY || c.quality > TransformLimits::MAX_QUALITY) {
                fail("Compress quality must be between 0 and 100, got " + std::to_string(c.quality));
            }
        }
    }, operation);
}

std::string formatOpacity(double opacity) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4) << opacity;
    return oss.str();
}

// Keys inside each rendering are listed in lexicographic order
std::string renderOperation(const Operation& operation) {
    return std::visit(overloaded{
        [](const ops::Resize& r) {
            std::string params;
            if (r.height > 0) params += "height=" + std::to_string(r.height);
            if (r.width > 0) {
                if (!params.empty()) params += ",";
                params += "width=" + std::to_string(r.width);
            }
            return "resize(" + params + ")";
        },
        [](const ops::Crop& c) {
            return "crop(height=" + std::to_string(c.height) +
                   ",width=" + std::to_string(c.width) +
                   ",x=" + std::to_string(c.x) +
                   ",y=" + std::to_string(c.y) + ")";
        },
        [](const ops::Rotate& r) {
            return "rotate(degrees=" + std::to_string(r.degrees) + ")";
        },
        [](const ops::Flip& f) {
            return "flip(axis=" + flipAxisToString(f.axis) + ")";
        },
        [](const ops::Watermark& w) {
            return "watermark(opacity=" + formatOpacity(w.opacity) +
                   ",overlay=" + w.overlay_id +
                   ",position=" + watermarkPositionToString(w.position) + ")";
        },
        [](const ops::Format& f) {
            return "format(target=" + image_formats::normalize(f.target) + ")";
        },
        [](const ops::Grayscale&) { return std::string("grayscale()"); },
        [](const ops::Sepia&) { return std::string("sepia()"); },
        [](const ops::Mirror&) { return std::string("mirror()"); },
        [](const ops::Compress& c) {
            return "compress(quality=" + std::to_string(c.quality) + ")";
        }
    }, operation);
}

nlohmann::json operationToJson(const Operation& operation) {
    nlohmann::json j = {{"op", operationName(operation)}};
    std::visit(overloaded{
        [&j](const ops::Resize& r) {
            if (r.width > 0) j["width"] = r.width;
            if (r.height > 0) j["height"] = r.height;
        },
        [&j](const ops::Crop& c) {
            j["x"] = c.x;
            j["y"] = c.y;
            j["width"] = c.width;
            j["height"] = c.height;
        },
        [&j](const ops::Rotate& r) { j["degrees"] = r.degrees; },
        [&j](const ops::Flip& f) { j["axis"] = flipAxisToString(f.axis); },
        [&j](const ops::Watermark& w) {
            j["overlay"] = w.overlay_id;
            j["position"] = watermarkPositionToString(w.position);
            j["opacity"] = w.opacity;
        },
        [&j](const ops::Format& f) { j["target"] = f.target; },
        [](const ops::Grayscale&) {},
        [](const ops::Sepia&) {},
        [](const ops::Mirror&) {},
        [&j](const ops::Compress& c) { j["quality"] = c.quality; }
    }, operation);
    return j;
}

} // namespace

TransformSpec::TransformSpec(std::vector<Operation> operations)
    : operations_(std::move(operations)) {
    for (auto& operation : operations_) {
        if (auto* rotate = std::get_if<ops::Rotate>(&operation)) {
            rotate->degrees = normalizeDegrees(rotate->degrees);
        } else if (auto* format = std::get_if<ops::Format>(&operation)) {
            format->target = image_formats::normalize(format->target);
        } else if (auto* watermark = std::get_if<ops::Watermark>(&operation)) {
            watermark->opacity = quantizeOpacity(watermark->opacity);
        }
    }
}

TransformSpec TransformSpec::fromJson(const nlohmann::json& j) {
    const nlohmann::json* list = &j;
    if (j.is_object()) {
        auto it = j.find("operations");
        if (it == j.end()) {
            fail("Transform spec must contain an 'operations' array");
        }
        list = &(*it);
    }

    if (!list->is_array()) {
        fail("Transform spec operations must be an array");
    }
    if (list->size() > static_cast<size_t>(TransformLimits::MAX_OPERATIONS)) {
        fail("Transform spec exceeds the maximum of " +
             std::to_string(TransformLimits::MAX_OPERATIONS) + " operations");
    }

    std::vector<Operation> operations;
    operations.reserve(list->size());
    for (const auto& item : *list) {
        operations.push_back(parseOperation(item));
    }

    TransformSpec spec(std::move(operations));
    spec.validate();
    return spec;
}

nlohmann::json TransformSpec::toJson() const {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& operation : operations_) {
        list.push_back(operationToJson(operation));
    }
    return {{"operations", list}};
}

void TransformSpec::validate() const {
    if (operations_.size() > static_cast<size_t>(TransformLimits::MAX_OPERATIONS)) {
        fail("Transform spec exceeds the maximum of " +
             std::to_string(TransformLimits::MAX_OPERATIONS) + " operations");
    }
    for (const auto& operation : operations_) {
        validateOperation(operation);
    }
}

std::string TransformSpec::canonicalize() const {
    validate();

    std::string canonical;
    for (size_t i = 0; i < operations_.size(); ++i) {
        if (i > 0) {
            canonical += "|";
        }
        canonical += renderOperation(operations_[i]);
    }
    return canonical;
}

std::optional<std::string> TransformSpec::formatOverride() const {
    std::optional<std::string> target;
    for (const auto& operation : operations_) {
        if (const auto* format = std::get_if<ops::Format>(&operation)) {
            target = image_formats::normalize(format->target);
        }
    }
    return target;
}

std::optional<int> TransformSpec::qualityOverride() const {
    std::optional<int> quality;
    for (const auto& operation : operations_) {
        if (const auto* compress = std::get_if<ops::Compress>(&operation)) {
            quality = compress->quality;
        }
    }
    return quality;
}

std::vector<std::string> TransformSpec::overlayReferences() const {
    std::vector<std::string> refs;
    for (const auto& operation : operations_) {
        if (const auto* watermark = std::get_if<ops::Watermark>(&operation)) {
            refs.push_back(watermark->overlay_id);
        }
    }
    return refs;
}

namespace {

int boundedDimension(double value, const std::string& what) {
    if (!(value <= TransformLimits::MAX_DIMENSION)) {
        fail(what + " would be " + std::to_string(static_cast<long long>(std::min(value, 1e18))) +
             " pixels, above the maximum of " + std::to_string(TransformLimits::MAX_DIMENSION));
    }
    return std::max(1, static_cast<int>(value));
}

} // namespace

Dimensions resizedDimensions(const Dimensions& current, const ops::Resize& resize) {
    if (resize.width > 0 && resize.height > 0) {
        return {resize.width, resize.height};
    }
    // Unknown source dimensions cannot be derived from
    if (current.width <= 0 || current.height <= 0) {
        return {resize.width, resize.height};
    }

    double aspect_ratio = static_cast<double>(current.width) / current.height;
    if (resize.width > 0) {
        return {resize.width, boundedDimension(std::round(resize.width / aspect_ratio), "Resized height")};
    }
    if (resize.height > 0) {
        return {boundedDimension(std::round(resize.height * aspect_ratio), "Resized width"), resize.height};
    }
    return current;
}

Dimensions rotatedDimensions(const Dimensions& current, int degrees) {
    if (degrees == 90 || degrees == 270) {
        return {current.height, current.width};
    }
    if (degrees % 180 == 0) {
        return current;
    }

    double radians = degrees * PI / 180.0;
    double c = std::fabs(std::cos(radians));
    double s = std::fabs(std::sin(radians));
    return {
        boundedDimension(std::ceil(current.width * c + current.height * s - 1e-9), "Rotated width"),
        boundedDimension(std::ceil(current.width * s + current.height * c - 1e-9), "Rotated height")
    };
}

Dimensions TransformSpec::planOutputDimensions(const Dimensions& source) const {
    Dimensions current = source;

    for (const auto& operation : operations_) {
        std::visit(overloaded{
            [&current](const ops::Resize& r) {
                current = resizedDimensions(current, r);
            },
            [&current](const ops::Crop& c) {
                // Unknown source dimensions cannot be checked here
                if (current.width <= 0 || current.height <= 0) {
                    current = {c.width, c.height};
                    return;
                }
                if (static_cast<long long>(c.x) + c.width > current.width ||
                    static_cast<long long>(c.y) + c.height > current.height) {
                    fail("Crop region " + std::to_string(c.width) + "x" + std::to_string(c.height) +
                         "+" + std::to_string(c.x) + "+" + std::to_string(c.y) +
                         " exceeds image bounds " + std::to_string(current.width) + "x" +
                         std::to_string(current.height));
                }
                current = {c.width, c.height};
            },
            [&current](const ops::Rotate& r) {
                if (current.width > 0 && current.height > 0) {
                    current = rotatedDimensions(current, r.degrees);
                }
            },
            [](const ops::Flip&) {},
            [](const ops::Watermark&) {},
            [](const ops::Format&) {},
            [](const ops::Grayscale&) {},
            [](const ops::Sepia&) {},
            [](const ops::Mirror&) {},
            [](const ops::Compress&) {}
        }, operation);
    }

    return current;
}

bool TransformSpec::operator==(const TransformSpec& other) const {
    if (operations_.size() != other.operations_.size()) {
        return false;
    }
    for (size_t i = 0; i < operations_.size(); ++i) {
        if (renderOperation(operations_[i]) != renderOperation(other.operations_[i])) {
            return false;
        }
    }
    return true;
}

std::string operationName(const Operation& op) {
    return std::visit(overloaded{
        [](const ops::Resize&) { return std::string("resize"); },
        [](const ops::Crop&) { return std::string("crop"); },
        [](const ops::Rotate&) { return std::string("rotate"); },
        [](const ops::Flip&) { return std::string("flip"); },
        [](const ops::Watermark&) { return std::string("watermark"); },
        [](const ops::Format&) { return std::string("format"); },
        [](const ops::Grayscale&) { return std::string("grayscale"); },
        [](const ops::Sepia&) { return std::string("sepia"); },
        [](const ops::Mirror&) { return std::string("mirror"); },
        [](const ops::Compress&) { return std::string("compress"); }
    }, op);
}

std::string flipAxisToString(FlipAxis axis) {
    return axis == FlipAxis::HORIZONTAL ? "horizontal" : "vertical";
}

std::string watermarkPositionToString(WatermarkPosition position) {
    switch (position) {
        case WatermarkPosition::TOP_LEFT: return "top-left";
        case WatermarkPosition::TOP_RIGHT: return "top-right";
        case WatermarkPosition::BOTTOM_LEFT: return "bottom-left";
        case WatermarkPosition::BOTTOM_RIGHT: return "bottom-right";
        case WatermarkPosition::CENTER: return "center";
    }
    return "bottom-right";
}

namespace image_formats {

std::string normalize(const std::string& format) {
    std::string value = lower(format);
    if (value == "jpg") return "jpeg";
    if (value == "tif") return "tiff";
    return value;
}

bool isSupported(const std::string& format) {
    static const std::vector<std::string> supported = {"jpeg", "png", "webp", "tiff", "gif"};
    std::string value = normalize(format);
    return std::find(supported.begin(), supported.end(), value) != supported.end();
}

std::string requireSupported(const std::string& format) {
    std::string value = normalize(format);
    if (!isSupported(value)) {
        fail("Unsupported output format '" + format + "'");
    }
    return value;
}

} // namespace image_formats

} // namespace prism
