#ifndef PRISM_IMAGE_CONTROLLER_H
#define PRISM_IMAGE_CONTROLLER_H

#include <crow.h>
#include <memory>
#include <optional>
#include "http_responses.h"
#include "../interfaces/config_service_interface.h"
#include "../services/image_service.h"
#include "../services/transform_pipeline.h"

namespace prism {

class ImageController {
public:
    ImageController(std::shared_ptr<ImageService> image_service,
                    std::shared_ptr<TransformPipeline> pipeline,
                    std::shared_ptr<ConfigServiceInterface> config_service);

    // Register routes with Crow app (templated to support middleware)
    template<typename App>
    void registerRoutes(App& app);

    /**
     * Parse a transform body: {"operations": [...], "format": "webp"}
     * or a bare operations array. format is optional.
     * @throws exceptions::ValidationException
     */
    static std::pair<TransformSpec, std::string> parseTransformBody(const nlohmann::json& body);

private:
    std::shared_ptr<ImageService> image_service_;
    std::shared_ptr<TransformPipeline> pipeline_;
    std::shared_ptr<ConfigServiceInterface> config_service_;

    crow::response handleUpload(const crow::request& req);
    crow::response handleListImages(const crow::request& req);
    crow::response handleGetImage(const crow::request& req, const std::string& image_id);
    crow::response handleDeleteImage(const crow::request& req, const std::string& image_id);
    crow::response handleSubmitTransform(const crow::request& req, const std::string& image_id);
    crow::response handleRender(const crow::request& req, const std::string& image_id);

    RequestIdentity identify(const crow::request& req);

    // Helper: Parse multipart form data and extract file
    bool extractUploadedFile(const crow::request& req,
                             std::vector<char>& file_data,
                             std::string& filename);

    // Helper: Parse a non-negative integer query parameter
    static std::optional<int> parseIntParam(const crow::request& req, const char* name);
};

// Template implementation must be in header
template<typename App>
void ImageController::registerRoutes(App& app) {
    // Upload image
    CROW_ROUTE(app, "/api/images").methods("POST"_method)
    ([this](const crow::request& req) {
        return handleUpload(req);
    });

    // List the caller's images
    CROW_ROUTE(app, "/api/images").methods("GET"_method)
    ([this](const crow::request& req) {
        return handleListImages(req);
    });

    // Original bytes
    CROW_ROUTE(app, "/api/images/<string>").methods("GET"_method)
    ([this](const crow::request& req, const std::string& image_id) {
        return handleGetImage(req, image_id);
    });

    CROW_ROUTE(app, "/api/images/<string>").methods("DELETE"_method)
    ([this](const crow::request& req, const std::string& image_id) {
        return handleDeleteImage(req, image_id);
    });

    // Submit a transform spec
    CROW_ROUTE(app, "/api/images/<string>/transforms").methods("POST"_method)
    ([this](const crow::request& req, const std::string& image_id) {
        return handleSubmitTransform(req, image_id);
    });

    // Transformed bytes, or 202 while the job runs
    CROW_ROUTE(app, "/api/images/<string>/render").methods("GET"_method)
    ([this](const crow::request& req, const std::string& image_id) {
        return handleRender(req, image_id);
    });

    // OPTIONS handlers for CORS preflight
    CROW_ROUTE(app, "/api/images").methods("OPTIONS"_method)
    ([](const crow::request&) {
        return http::preflightResponse();
    });

    CROW_ROUTE(app, "/api/images/<string>").methods("OPTIONS"_method)
    ([](const crow::request&, const std::string&) {
        return http::preflightResponse();
    });

    CROW_ROUTE(app, "/api/images/<string>/transforms").methods("OPTIONS"_method)
    ([](const crow::request&, const std::string&) {
        return http::preflightResponse();
    });

    CROW_ROUTE(app, "/api/images/<string>/render").methods("OPTIONS"_method)
    ([](const crow::request&, const std::string&) {
        return http::preflightResponse();
    });
}

} // namespace prism

#endif // PRISM_IMAGE_CONTROLLER_H
