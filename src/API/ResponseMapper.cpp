#include "API/ResponseMapper.hpp"

#include <fmt/format.h>

namespace glidex::api {

int ResponseMapper::statusFor(VmErrc code) noexcept {
    switch (code) {
        case VmErrc::Success: return 200;
        case VmErrc::NotFound: return 404;
        case VmErrc::DuplicateName: return 409;
        case VmErrc::InvalidTransition: return 400;
        case VmErrc::InvalidConfig: return 422;
        case VmErrc::ConsoleUnavailable: return 409;
        case VmErrc::SpawnError:
        case VmErrc::ConfigurationError:
        case VmErrc::ControlChannelError:
        case VmErrc::ProcessCrashed:
        case VmErrc::IOError:
        case VmErrc::StorageError: return 500;
    }
    return 500;
}

Json::Value ResponseMapper::vmToJson(const VmRecord& record) {
    Json::Value out;
    out["id"] = record.id;
    out["name"] = record.name;
    out["state"] = toString(record.state);
    out["vcpu_count"] = Json::Int64(record.config.vcpuCount);
    out["mem_size_mib"] = Json::Int64(record.config.memSizeMib);
    out["console_socket_path"] = record.paths.consoleSocket;
    out["log_path"] = record.paths.logFile;
    return out;
}

Json::Value ResponseMapper::vmListToJson(const std::vector<VmRecord>& records) {
    Json::Value out(Json::arrayValue);
    for (const auto& record : records) out.append(vmToJson(record));
    return out;
}

Json::Value ResponseMapper::consoleInfoToJson(const ConsoleInfo& info) {
    Json::Value out;
    out["vm_id"] = info.vmId;
    out["console_socket_path"] = info.consoleSocketPath;
    out["log_path"] = info.logPath;
    out["available"] = info.available;
    return out;
}

ApiResponse ResponseMapper::error(const Error& error) {
    Json::Value body;
    body["error"] = errorTag(error.errc());
    body["message"] = error.message();
    return {statusFor(error.errc()), std::move(body)};
}

ApiResponse ResponseMapper::badRequest(const std::string& message) {
    Json::Value body;
    body["error"] = "bad_request";
    body["message"] = message;
    return {400, std::move(body)};
}

ApiResponse ResponseMapper::vm(const Result<VmRecord>& result, int okStatus) {
    if (!result) return error(result.error());
    return {okStatus, vmToJson(*result)};
}

Result<CreateVmRequest> ResponseMapper::parseCreate(const Json::Value& body) {
    if (!body.isObject()) return fail(VmErrc::InvalidConfig, "request body must be a JSON object");

    auto requireString = [&](const char* field) -> Result<std::string> {
        if (!body[field].isString()) return fail(VmErrc::InvalidConfig, fmt::format("'{}' must be a string", field));
        return body[field].asString();
    };
    auto requireInt = [&](const char* field) -> Result<std::int64_t> {
        if (!body[field].isIntegral()) {
            return fail(VmErrc::InvalidConfig, fmt::format("'{}' must be an integer", field));
        }
        return body[field].asInt64();
    };

    CreateVmRequest req;
    auto name = requireString("name");
    if (!name) return std::unexpected(name.error());
    auto vcpus = requireInt("vcpu_count");
    if (!vcpus) return std::unexpected(vcpus.error());
    auto mem = requireInt("mem_size_mib");
    if (!mem) return std::unexpected(mem.error());
    auto kernel = requireString("kernel_image_path");
    if (!kernel) return std::unexpected(kernel.error());
    auto rootfs = requireString("rootfs_path");
    if (!rootfs) return std::unexpected(rootfs.error());

    req.name = std::move(*name);
    req.config.vcpuCount = *vcpus;
    req.config.memSizeMib = *mem;
    req.config.kernelImagePath = std::move(*kernel);
    req.config.rootfsPath = std::move(*rootfs);

    if (body.isMember("kernel_args") && !body["kernel_args"].isNull()) {
        auto args = requireString("kernel_args");
        if (!args) return std::unexpected(args.error());
        req.config.kernelArgs = std::move(*args);
    }
    return req;
}

} // namespace glidex::api
