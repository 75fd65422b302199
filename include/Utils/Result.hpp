#pragma once
#include <expected>
#include <string>
#include <system_error>
#include <utility>

#include "Virtualization/Utils/VmError.hpp"

namespace glidex {

class Error {
public:
    Error(VmErrc code, std::string message)
        : code_(make_error_code(code)), message_(std::move(message)) {}

    [[nodiscard]] const std::error_code& code() const noexcept { return code_; }
    [[nodiscard]] VmErrc errc() const noexcept { return static_cast<VmErrc>(code_.value()); }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    // "<category message>: <detail>"
    [[nodiscard]] std::string what() const { return code_.message() + ": " + message_; }

private:
    std::error_code code_;
    std::string message_;
};

template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] inline std::unexpected<Error> fail(VmErrc code, std::string message) {
    return std::unexpected<Error>(Error(code, std::move(message)));
}

} // namespace glidex
