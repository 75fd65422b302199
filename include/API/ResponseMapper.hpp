#pragma once
#include <json/value.h>
#include <string>
#include <utility>
#include <vector>

#include "Utils/Result.hpp"
#include "Virtualization/vmm/VirtualMachineManager.hpp"

namespace glidex::api {

struct ApiResponse {
    int status{200};
    // null for 204
    Json::Value body;
};

struct CreateVmRequest {
    std::string name;
    VmConfig config;
};

/**
 * @brief JSON shapes and status codes of the REST surface.
 *
 * Kept free of any HTTP server type so the mapping can be tested on its own.
 */
class ResponseMapper {
public:
    [[nodiscard]] static int statusFor(VmErrc code) noexcept;

    [[nodiscard]] static Json::Value vmToJson(const VmRecord& record);
    [[nodiscard]] static Json::Value vmListToJson(const std::vector<VmRecord>& records);
    [[nodiscard]] static Json::Value consoleInfoToJson(const ConsoleInfo& info);

    // {"error": <tag>, "message": <text>}
    [[nodiscard]] static ApiResponse error(const Error& error);
    [[nodiscard]] static ApiResponse badRequest(const std::string& message);

    [[nodiscard]] static ApiResponse vm(const Result<VmRecord>& result, int okStatus = 200);

    /// Fields: name, vcpu_count, mem_size_mib, kernel_image_path, rootfs_path,
    /// optional kernel_args. Missing or mistyped fields are InvalidConfig.
    [[nodiscard]] static Result<CreateVmRequest> parseCreate(const Json::Value& body);
};

} // namespace glidex::api
