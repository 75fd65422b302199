#include "API/controllers/VirtualMachineController.hpp"

#include <drogon/HttpResponse.h>

#include "System/Logger.hpp"

namespace glidex::api {

using drogon::HttpRequestPtr;
using drogon::HttpResponse;
using drogon::HttpResponsePtr;

namespace {

HttpResponsePtr toHttp(const ApiResponse& response) {
    HttpResponsePtr out;
    if (response.body.isNull()) {
        out = HttpResponse::newHttpResponse();
    } else {
        out = HttpResponse::newHttpJsonResponse(response.body);
    }
    out->setStatusCode(static_cast<drogon::HttpStatusCode>(response.status));
    return out;
}

} // namespace

VirtualMachineController::VirtualMachineController(std::shared_ptr<VirtualMachineManager> manager,
                                                   std::size_t workers)
    : manager_(std::move(manager)), workers_(workers, "api-workers") {}

VirtualMachineController::~VirtualMachineController() {
    workers_.stop();
}

void VirtualMachineController::respond(Callback&& callback, std::function<ApiResponse()> work) {
    workers_.dispatch([callback = std::move(callback), work = std::move(work)] {
        ApiResponse response;
        try {
            response = work();
        } catch (const std::exception& e) {
            GXLOG_ERROR("api: request failed: {}", e.what());
            response = ResponseMapper::error(Error(VmErrc::IOError, e.what()));
        }
        callback(toHttp(response));
    });
}

void VirtualMachineController::health(const HttpRequestPtr&, Callback&& callback) {
    Json::Value body;
    body["status"] = manager_->health() ? "ok" : "shutting_down";
    callback(toHttp({manager_->health() ? 200 : 503, body}));
}

void VirtualMachineController::listVms(const HttpRequestPtr&, Callback&& callback) {
    respond(std::move(callback), [this] {
        return ApiResponse{200, ResponseMapper::vmListToJson(manager_->list())};
    });
}

void VirtualMachineController::createVm(const HttpRequestPtr& req, Callback&& callback) {
    auto json = req->getJsonObject();
    if (!json) {
        callback(toHttp(ResponseMapper::badRequest("malformed JSON: " + req->getJsonError())));
        return;
    }
    respond(std::move(callback), [this, body = *json] {
        auto parsed = ResponseMapper::parseCreate(body);
        if (!parsed) return ResponseMapper::error(parsed.error());
        return ResponseMapper::vm(manager_->create(std::move(parsed->name), std::move(parsed->config)), 201);
    });
}

void VirtualMachineController::getVm(const HttpRequestPtr&, Callback&& callback, std::string id) {
    respond(std::move(callback), [this, id = std::move(id)] { return ResponseMapper::vm(manager_->get(id)); });
}

void VirtualMachineController::deleteVm(const HttpRequestPtr&, Callback&& callback, std::string id) {
    respond(std::move(callback), [this, id = std::move(id)] {
        auto removed = manager_->remove(id);
        if (!removed) return ResponseMapper::error(removed.error());
        return ApiResponse{204, Json::Value()};
    });
}

void VirtualMachineController::startVm(const HttpRequestPtr&, Callback&& callback, std::string id) {
    respond(std::move(callback), [this, id = std::move(id)] { return ResponseMapper::vm(manager_->start(id)); });
}

void VirtualMachineController::stopVm(const HttpRequestPtr&, Callback&& callback, std::string id) {
    respond(std::move(callback), [this, id = std::move(id)] { return ResponseMapper::vm(manager_->stop(id)); });
}

void VirtualMachineController::pauseVm(const HttpRequestPtr&, Callback&& callback, std::string id) {
    respond(std::move(callback), [this, id = std::move(id)] { return ResponseMapper::vm(manager_->pause(id)); });
}

void VirtualMachineController::resumeVm(const HttpRequestPtr&, Callback&& callback, std::string id) {
    respond(std::move(callback), [this, id = std::move(id)] { return ResponseMapper::vm(manager_->resume(id)); });
}

void VirtualMachineController::consoleInfo(const HttpRequestPtr&, Callback&& callback, std::string id) {
    respond(std::move(callback), [this, id = std::move(id)] {
        auto info = manager_->consoleInfo(id);
        if (!info) return ResponseMapper::error(info.error());
        return ApiResponse{200, ResponseMapper::consoleInfoToJson(*info)};
    });
}

void VirtualMachineController::consoleLog(const HttpRequestPtr&, Callback&& callback, std::string id) {
    workers_.dispatch([this, callback = std::move(callback), id = std::move(id)] {
        auto log = manager_->consoleLog(id);
        if (!log) {
            callback(toHttp(ResponseMapper::error(log.error())));
            return;
        }
        auto resp = HttpResponse::newHttpResponse();
        resp->setContentTypeCode(drogon::CT_TEXT_PLAIN);
        resp->setBody(std::move(*log));
        callback(resp);
    });
}

} // namespace glidex::api
