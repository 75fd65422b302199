#pragma once
#include <cstdint>
#include <string>
#include <string_view>

#include "System/Logger.hpp"
#include "Utils/Result.hpp"
#include "Virtualization/vmm/VirtualMachineManager.hpp"

namespace glidex {

struct ApiSettings {
    std::string address = "0.0.0.0";
    std::uint16_t port = 8080;
    std::size_t threads = 2;
};

/**
 * @brief Daemon configuration, read from an XML file.
 *
 * @code{.xml}
 * <glidex>
 *   <hypervisor binary="firecracker" socket-timeout-ms="5000" socket-poll-ms="100"
 *               request-timeout-ms="30000" shutdown-grace-ms="3000"/>
 *   <runtime dir="/tmp" database="/var/lib/glidex/records"/>
 *   <console replay-bytes="65536" client-queue-bytes="1048576" io-threads="2"/>
 *   <api address="0.0.0.0" port="8080" threads="2"/>
 *   <logging level="info" file="logs/glidex.log" console="true" file-enabled="true"/>
 * </glidex>
 * @endcode
 *
 * Every element and attribute is optional.
 */
struct Settings {
    ManagerOptions manager;
    std::string databasePath = "/var/lib/glidex/records";
    ApiSettings api;
    LogConfig logging;

    /// InvalidConfig if the file is unreadable, malformed or holds bad values.
    [[nodiscard]] static Result<Settings> load(const std::string& path);
    [[nodiscard]] static Result<Settings> parse(std::string_view xml);

    /// The effective settings in the same XML format.
    [[nodiscard]] std::string toXml() const;
};

} // namespace glidex
