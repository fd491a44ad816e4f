#ifndef PRISM_JOB_CONTROLLER_H
#define PRISM_JOB_CONTROLLER_H

#include <crow.h>
#include <chrono>
#include <memory>
#include "http_responses.h"
#include "../interfaces/config_service_interface.h"
#include "../services/transform_pipeline.h"

namespace prism {

namespace JobPollLimits {
    constexpr int MAX_WAIT_MS = 10000;
}

class JobController {
public:
    JobController(std::shared_ptr<TransformPipeline> pipeline,
                  std::shared_ptr<ConfigServiceInterface> config_service);

    template<typename App>
    void registerRoutes(App& app);

    /**
     * Parse the wait_ms query value, clamped to [0, MAX_WAIT_MS]
     * @throws exceptions::ValidationException if not an integer
     */
    static std::chrono::milliseconds parseWait(const char* value);

private:
    std::shared_ptr<TransformPipeline> pipeline_;
    std::shared_ptr<ConfigServiceInterface> config_service_;

    crow::response handleStatus(const crow::request& req, const std::string& job_id);
    crow::response handleResult(const crow::request& req, const std::string& job_id);
    crow::response handleCancel(const crow::request& req, const std::string& job_id);
};

template<typename App>
void JobController::registerRoutes(App& app) {
    // Job status, optionally long-polling with ?wait_ms=
    CROW_ROUTE(app, "/api/jobs/<string>").methods("GET"_method)
    ([this](const crow::request& req, const std::string& job_id) {
        return handleStatus(req, job_id);
    });

    CROW_ROUTE(app, "/api/jobs/<string>").methods("DELETE"_method)
    ([this](const crow::request& req, const std::string& job_id) {
        return handleCancel(req, job_id);
    });

    // Artifact bytes of a finished job
    CROW_ROUTE(app, "/api/jobs/<string>/result").methods("GET"_method)
    ([this](const crow::request& req, const std::string& job_id) {
        return handleResult(req, job_id);
    });

    CROW_ROUTE(app, "/api/jobs/<string>").methods("OPTIONS"_method)
    ([](const crow::request&, const std::string&) {
        return http::preflightResponse();
    });

    CROW_ROUTE(app, "/api/jobs/<string>/result").methods("OPTIONS"_method)
    ([](const crow::request&, const std::string&) {
        return http::preflightResponse();
    });
}

} // namespace prism

#endif // PRISM_JOB_CONTROLLER_H
