#include "image_controller.h"
#include "../middleware/auth_middleware.h"
#include "../utils/file_utils.h"
#include "../utils/logger.h"
#include "../utils/metrics.h"

using json = nlohmann::json;

namespace prism {

ImageController::ImageController(std::shared_ptr<ImageService> image_service,
                                 std::shared_ptr<TransformPipeline> pipeline,
                                 std::shared_ptr<ConfigServiceInterface> config_service)
    : image_service_(std::move(image_service)),
      pipeline_(std::move(pipeline)),
      config_service_(std::move(config_service)) {
}

RequestIdentity ImageController::identify(const crow::request& req) {
    return middleware::AuthMiddleware::authenticate(req, *config_service_);
}

crow::response ImageController::handleUpload(const crow::request& req) {
    return http::handleErrors("/api/images", [&]() {
        RequestIdentity identity = identify(req);

        std::vector<char> file_data;
        std::string filename;

        // Extract uploaded file from multipart form data
        if (!extractUploadedFile(req, file_data, filename)) {
            throw exceptions::ValidationException(
                "Failed to extract file from request. Please upload a valid image file");
        }

        ImageMetadata metadata = image_service_->uploadImage(file_data, filename, identity);

        METRICS_COUNT("APIRequests", 1.0, "Count", {{"endpoint", "/upload"}, {"status", "success"}});
        return http::jsonResponse(201, metadata.toJson());
    });
}

crow::response ImageController::handleListImages(const crow::request& req) {
    return http::handleErrors("/api/images", [&]() {
        RequestIdentity identity = identify(req);

        int limit = parseIntParam(req, "limit").value_or(ImageUploadLimits::DEFAULT_LIST_LIMIT);
        int offset = parseIntParam(req, "offset").value_or(0);

        std::vector<ImageMetadata> images = image_service_->listImages(identity, limit, offset);

        json images_json = json::array();
        for (const auto& image : images) {
            images_json.push_back(image.toJson());
        }

        return http::jsonResponse(200, {
            {"images", images_json},
            {"count", images.size()},
            {"limit", limit},
            {"offset", offset}
        });
    });
}

crow::response ImageController::handleGetImage(const crow::request& req, const std::string& image_id) {
    return http::handleErrors("/api/images/:id", [&]() {
        RequestIdentity identity = identify(req);

        Delivery delivery = pipeline_->getImage(image_id, std::nullopt, "", identity);
        if (!delivery.ready()) {
            return http::pendingResponse(*delivery.job);
        }
        return http::artifactResponse(*delivery.artifact, delivery.from_cache);
    });
}

crow::response ImageController::handleDeleteImage(const crow::request& req, const std::string& image_id) {
    return http::handleErrors("/api/images/:id", [&]() {
        RequestIdentity identity = identify(req);
        image_service_->deleteImage(image_id, identity);

        crow::response resp(204);
        http::addCorsHeaders(resp);
        return resp;
    });
}

crow::response ImageController::handleSubmitTransform(const crow::request& req, const std::string& image_id) {
    return http::handleErrors("/api/images/:id/transforms", [&]() {
        RequestIdentity identity = identify(req);

        auto [spec, format] = parseTransformBody(json::parse(req.body));

        Delivery delivery = pipeline_->submitTransform(image_id, spec, format, identity);
        if (!delivery.ready()) {
            return http::pendingResponse(*delivery.job);
        }

        json body = delivery.artifact->toJson();
        body["imageId"] = image_id;
        body["cached"] = delivery.from_cache;
        return http::jsonResponse(200, body);
    });
}

crow::response ImageController::handleRender(const crow::request& req, const std::string& image_id) {
    return http::handleErrors("/api/images/:id/render", [&]() {
        RequestIdentity identity = identify(req);

        std::optional<TransformSpec> spec;
        if (const char* ops = req.url_params.get("ops")) {
            spec = TransformSpec::fromJson(json::parse(ops));
        }

        const char* format_param = req.url_params.get("format");
        std::string format = format_param ? format_param : "";

        Delivery delivery = pipeline_->getImage(image_id, spec, format, identity);
        if (!delivery.ready()) {
            return http::pendingResponse(*delivery.job);
        }
        return http::artifactResponse(*delivery.artifact, delivery.from_cache);
    });
}

std::pair<TransformSpec, std::string> ImageController::parseTransformBody(const json& body) {
    std::string format;
    if (body.is_object()) {
        auto format_it = body.find("format");
        if (format_it != body.end()) {
            if (!format_it->is_string()) {
                throw exceptions::ValidationException("'format' must be a string");
            }
            format = format_it->get<std::string>();
        }

        json operations = json::object();
        for (auto it = body.begin(); it != body.end(); ++it) {
            if (it.key() == "operations") {
                operations["operations"] = it.value();
            } else if (it.key() != "format") {
                throw exceptions::ValidationException("Unknown field '" + it.key() + "'");
            }
        }
        if (!operations.contains("operations")) {
            throw exceptions::ValidationException("Missing 'operations'");
        }
        return {TransformSpec::fromJson(operations), format};
    }

    return {TransformSpec::fromJson(body), format};
}

bool ImageController::extractUploadedFile(const crow::request& req,
                                          std::vector<char>& file_data,
                                          std::string& filename) {
    // Parse multipart form data
    crow::multipart::message msg(req);

    for (const auto& part : msg.parts) {
        auto it = part.headers.find("Content-Disposition");
        if (it != part.headers.end()) {
            const auto& disposition = it->second;

            // Check if this part contains a file
            auto filename_it = disposition.params.find("filename");
            if (filename_it != disposition.params.end()) {
                filename = filename_it->second;
                file_data.assign(part.body.begin(), part.body.end());
                return true;
            }
        }
    }

    return false;
}

std::optional<int> ImageController::parseIntParam(const crow::request& req, const char* name) {
    const char* value = req.url_params.get(name);
    if (!value) {
        return std::nullopt;
    }

    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != std::string(value).size() || parsed < 0) {
            throw exceptions::ValidationException(std::string("Invalid value for '") + name + "'");
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw exceptions::ValidationException(std::string("Invalid value for '") + name + "'");
    }
}

} // namespace prism
