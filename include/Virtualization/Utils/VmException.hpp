#pragma once
#include <stdexcept>
#include <string>

#include "Virtualization/Utils/VmError.hpp"

namespace glidex {

class VmException : public std::runtime_error {
public:
    explicit VmException(const std::string& msg, VmErrc code = VmErrc::IOError)
        : std::runtime_error(msg), code_(code) {}

    [[nodiscard]] VmErrc code() const noexcept { return code_; }

private:
    VmErrc code_;
};

class SpawnException : public VmException {
public:
    explicit SpawnException(const std::string& msg) : VmException("[Spawn] " + msg, VmErrc::SpawnError) {}
};

/// A control call failed on the wire or the hypervisor answered with a non-2xx status
class ControlChannelException : public VmException {
public:
    ControlChannelException(const std::string& msg, unsigned status = 0, std::string payload = {})
        : VmException("[Control] " + msg, VmErrc::ControlChannelError),
          status_(status), payload_(std::move(payload)) {}

    // 0 when no response was received
    [[nodiscard]] unsigned status() const noexcept { return status_; }
    [[nodiscard]] const std::string& payload() const noexcept { return payload_; }

private:
    unsigned status_;
    std::string payload_;
};

class ConfigurationException : public VmException {
public:
    ConfigurationException(std::string step, std::string payload)
        : VmException("[Configure] " + step + ": " + payload, VmErrc::ConfigurationError),
          step_(std::move(step)), payload_(std::move(payload)) {}

    [[nodiscard]] const std::string& step() const noexcept { return step_; }
    [[nodiscard]] const std::string& payload() const noexcept { return payload_; }

private:
    std::string step_;
    std::string payload_;
};

class ConsoleException : public VmException {
public:
    explicit ConsoleException(const std::string& msg) : VmException("[Console] " + msg, VmErrc::IOError) {}
};

class StorageException : public VmException {
public:
    explicit StorageException(const std::string& msg) : VmException("[Storage] " + msg, VmErrc::StorageError) {}
};

} // namespace glidex
