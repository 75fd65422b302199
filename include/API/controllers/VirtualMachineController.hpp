#pragma once
#include <drogon/HttpController.h>
#include <functional>
#include <memory>
#include <string>

#include "API/ResponseMapper.hpp"
#include "Core/concurrency/EventDispatcher.hpp"
#include "Virtualization/vmm/VirtualMachineManager.hpp"

namespace glidex::api {

/**
 * @brief REST surface over VirtualMachineManager.
 *
 * Lifecycle calls can block for seconds (spawn, control requests, graceful
 * shutdown), so every handler runs on a worker pool instead of the drogon
 * event loop and answers through the callback when done.
 */
class VirtualMachineController : public drogon::HttpController<VirtualMachineController, false> {
public:
    using Callback = std::function<void(const drogon::HttpResponsePtr&)>;

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(VirtualMachineController::health, "/health", drogon::Get);
    ADD_METHOD_TO(VirtualMachineController::listVms, "/vms", drogon::Get);
    ADD_METHOD_TO(VirtualMachineController::createVm, "/vms", drogon::Post);
    ADD_METHOD_TO(VirtualMachineController::getVm, "/vms/{1}", drogon::Get);
    ADD_METHOD_TO(VirtualMachineController::deleteVm, "/vms/{1}", drogon::Delete);
    ADD_METHOD_TO(VirtualMachineController::startVm, "/vms/{1}/start", drogon::Post);
    ADD_METHOD_TO(VirtualMachineController::stopVm, "/vms/{1}/stop", drogon::Post);
    ADD_METHOD_TO(VirtualMachineController::pauseVm, "/vms/{1}/pause", drogon::Post);
    ADD_METHOD_TO(VirtualMachineController::resumeVm, "/vms/{1}/resume", drogon::Post);
    ADD_METHOD_TO(VirtualMachineController::consoleInfo, "/vms/{1}/console", drogon::Get);
    ADD_METHOD_TO(VirtualMachineController::consoleLog, "/vms/{1}/console/log", drogon::Get);
    METHOD_LIST_END

    VirtualMachineController(std::shared_ptr<VirtualMachineManager> manager, std::size_t workers);
    ~VirtualMachineController() override;

    void health(const drogon::HttpRequestPtr& req, Callback&& callback);
    void listVms(const drogon::HttpRequestPtr& req, Callback&& callback);
    void createVm(const drogon::HttpRequestPtr& req, Callback&& callback);
    void getVm(const drogon::HttpRequestPtr& req, Callback&& callback, std::string id);
    void deleteVm(const drogon::HttpRequestPtr& req, Callback&& callback, std::string id);
    void startVm(const drogon::HttpRequestPtr& req, Callback&& callback, std::string id);
    void stopVm(const drogon::HttpRequestPtr& req, Callback&& callback, std::string id);
    void pauseVm(const drogon::HttpRequestPtr& req, Callback&& callback, std::string id);
    void resumeVm(const drogon::HttpRequestPtr& req, Callback&& callback, std::string id);
    void consoleInfo(const drogon::HttpRequestPtr& req, Callback&& callback, std::string id);
    void consoleLog(const drogon::HttpRequestPtr& req, Callback&& callback, std::string id);

private:
    // Run @p work on the worker pool and send what it returns.
    void respond(Callback&& callback, std::function<ApiResponse()> work);

    std::shared_ptr<VirtualMachineManager> manager_;
    CONCURRENCY::EventDispatcher workers_;
};

} // namespace glidex::api
