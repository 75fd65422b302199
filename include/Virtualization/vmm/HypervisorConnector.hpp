#pragma once

#include <boost/beast/http/verb.hpp>
#include <json/value.h>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace glidex {

struct ControlResponse {
    unsigned status{0};
    std::string body;

    [[nodiscard]] bool ok() const noexcept { return status >= 200 && status < 300; }

    /// Firecracker's `fault_message` if the body carries one, the raw body otherwise.
    [[nodiscard]] std::string faultMessage() const;
};

/**
 * @brief Client for the hypervisor's control API.
 *
 * Speaks HTTP/1.1 over the VM's private Unix socket. Every call opens its own
 * connection ("Connection: close") and is bounded by the request timeout.
 * Transport failures and timeouts throw ControlChannelException; HTTP error
 * statuses are returned to the caller untouched.
 */
class HypervisorConnector {
public:
    explicit HypervisorConnector(std::string socketPath,
                                 std::chrono::milliseconds timeout = std::chrono::seconds(30));

    HypervisorConnector(const HypervisorConnector&) = delete;
    HypervisorConnector& operator=(const HypervisorConnector&) = delete;

    [[nodiscard]] ControlResponse request(boost::beast::http::verb method, std::string_view target,
                                          const Json::Value& body);

    // PUT /machine-config
    [[nodiscard]] ControlResponse putMachineConfig(std::int64_t vcpuCount, std::int64_t memSizeMib);
    // PUT /boot-source
    [[nodiscard]] ControlResponse putBootSource(const std::string& kernelImagePath, const std::string& bootArgs);
    // PUT /drives/{driveId}
    [[nodiscard]] ControlResponse putDrive(const std::string& driveId, const std::string& pathOnHost,
                                           bool isRootDevice, bool isReadOnly);
    // PUT /actions
    [[nodiscard]] ControlResponse putAction(const std::string& actionType);
    // PATCH /vm
    [[nodiscard]] ControlResponse patchVmState(const std::string& state);

    [[nodiscard]] const std::string& socketPath() const noexcept { return socketPath_; }

private:
    std::string socketPath_;
    std::chrono::milliseconds timeout_;
};

} // namespace glidex
