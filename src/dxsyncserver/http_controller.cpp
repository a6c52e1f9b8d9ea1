#include "dxsyncserver/http_controller.hpp"

#include <drogon/HttpAppFramework.h>
#include <json/json.h>

#include "core/version_hash.hpp"

namespace dxsync {

HttpController::HttpController(std::shared_ptr<ArtifactService> service,
                               const Logger& logger)
    : service_(std::move(service)), logger_(logger.child("http")) {}

void HttpController::register_routes(const std::string& path_prefix) {
    std::string prefix = path_prefix;
    if (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }

    auto self = this;

    drogon::app().registerHandler(
        prefix + "/api/v1/stream",
        [self](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            self->stream(req, std::move(callback));
        },
        {drogon::Get});

    drogon::app().registerHandler(
        prefix + "/api/v1/health",
        [self](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            self->health(req, std::move(callback));
        },
        {drogon::Get});

    drogon::app().registerHandler(
        prefix + "/api/v1/info",
        [self](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            self->info(req, std::move(callback));
        },
        {drogon::Get});
}

void HttpController::stream(
    const drogon::HttpRequestPtr& req,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    std::optional<VersionToken> client_token;
    const std::string& inm = req->getHeader("If-None-Match");
    if (!inm.empty()) {
        client_token = parse_etag(inm);
        if (!client_token) {
            logger_.debug("Ignoring unparsable If-None-Match: %s", inm.c_str());
        }
    }

    UpdatePlan plan;
    if (!service_->plan_update(client_token, plan)) {
        callback(make_error_response(drogon::k503ServiceUnavailable,
                                     "No artifact published yet"));
        return;
    }

    std::string etag = format_etag(plan.token);
    std::string from = client_token ? format_token(*client_token) : "-";

    if (plan.kind == NegotiationResult::Kind::kNotModified) {
        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setStatusCode(drogon::k304NotModified);
        resp->addHeader("ETag", etag);
        logger_.debug("%s: not modified (%s)", req->peerAddr().toIpPort().c_str(),
                      from.c_str());
        callback(resp);
        return;
    }

    bool is_patch = plan.kind == NegotiationResult::Kind::kPatch;
    if (is_patch) {
        logger_.info("%s: patch %s -> %s (%zu blocks, %zu bytes)",
                     req->peerAddr().toIpPort().c_str(), from.c_str(),
                     format_token(plan.token).c_str(),
                     plan.patch_blocks, plan.patch_bytes);
    } else {
        logger_.info("%s: full %s (%zu bytes)",
                     req->peerAddr().toIpPort().c_str(),
                     format_token(plan.token).c_str(), plan.stream.total_size());
    }

    // The generator is pulled from Drogon's I/O thread as the socket drains.
    auto gen = std::make_shared<StreamGenerator>(std::move(plan.stream));
    auto resp = drogon::HttpResponse::newStreamResponse(
        [gen](char* buf, std::size_t len) -> std::size_t {
            if (buf == nullptr) return 0;
            return gen->read(reinterpret_cast<uint8_t*>(buf), len);
        });
    resp->setContentTypeString(STREAM_CONTENT_TYPE);
    resp->addHeader("ETag", etag);
    resp->addHeader(UPDATE_KIND_HEADER, is_patch ? "patch" : "full");
    resp->addHeader("Cache-Control", "no-cache");
    callback(resp);
}

void HttpController::health(
    const drogon::HttpRequestPtr& /*req*/,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    Json::Value body;
    auto token = service_->current_token();
    if (token) {
        body["status"] = "ok";
        body["version"] = format_token(*token);
        callback(drogon::HttpResponse::newHttpJsonResponse(std::move(body)));
    } else {
        body["status"] = "starting";
        body["version"] = Json::Value(Json::nullValue);
        auto resp = drogon::HttpResponse::newHttpJsonResponse(std::move(body));
        resp->setStatusCode(drogon::k503ServiceUnavailable);
        callback(resp);
    }
}

void HttpController::info(
    const drogon::HttpRequestPtr& /*req*/,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    callback(drogon::HttpResponse::newHttpJsonResponse(service_->info_json()));
}

drogon::HttpResponsePtr HttpController::make_error_response(
    drogon::HttpStatusCode status, const std::string& message) {
    Json::Value body;
    body["error"] = message;
    auto resp = drogon::HttpResponse::newHttpJsonResponse(std::move(body));
    resp->setStatusCode(status);
    return resp;
}

} // namespace dxsync
