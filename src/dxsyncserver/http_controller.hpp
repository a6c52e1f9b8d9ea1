#pragma once

#include <functional>
#include <memory>
#include <string>

#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <drogon/HttpTypes.h>

#include "dxsyncserver/artifact_service.hpp"
#include "util/logger.hpp"

namespace dxsync {

static constexpr const char* STREAM_CONTENT_TYPE = "application/vnd.dxsync-stream";
static constexpr const char* UPDATE_KIND_HEADER = "X-Dxsync-Update";

// HTTP front of an ArtifactService.
// Negotiates with If-None-Match / ETag and streams chunk streams to clients.
class HttpController {
public:
    HttpController(std::shared_ptr<ArtifactService> service, const Logger& logger);

    // Register HTTP routes with Drogon. Must be called before app().run().
    void register_routes(const std::string& path_prefix);

    // GET /api/v1/stream
    void stream(const drogon::HttpRequestPtr& req,
                std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    // GET /api/v1/health
    void health(const drogon::HttpRequestPtr& req,
                std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    // GET /api/v1/info
    void info(const drogon::HttpRequestPtr& req,
              std::function<void(const drogon::HttpResponsePtr&)>&& callback);

private:
    std::shared_ptr<ArtifactService> service_;
    Logger logger_;

    static drogon::HttpResponsePtr make_error_response(
        drogon::HttpStatusCode status, const std::string& message);
};

} // namespace dxsync
