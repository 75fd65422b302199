#include "Virtualization/vmm/HypervisorConnector.hpp"

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <json/reader.h>
#include <json/writer.h>
#include <memory>
#include <fmt/format.h>

#include "System/Logger.hpp"
#include "Virtualization/Utils/VmException.hpp"

namespace glidex {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using local = asio::local::stream_protocol;

namespace {

std::string toCompactJson(const Json::Value& value) {
    if (value.isNull()) return {};
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

std::string verbName(http::verb method) {
    auto name = http::to_string(method);
    return std::string(name.data(), name.size());
}

} // namespace

std::string ControlResponse::faultMessage() const {
    if (body.empty()) return fmt::format("HTTP {}", status);

    Json::Value root;
    std::string errs;
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    if (reader->parse(body.data(), body.data() + body.size(), &root, &errs) &&
        root.isObject() && root["fault_message"].isString()) {
        return root["fault_message"].asString();
    }
    return body;
}

HypervisorConnector::HypervisorConnector(std::string socketPath, std::chrono::milliseconds timeout)
    : socketPath_(std::move(socketPath)), timeout_(timeout) {}

ControlResponse HypervisorConnector::request(http::verb method, std::string_view target, const Json::Value& body) {
    asio::io_context ioc;
    local::socket socket(ioc);
    beast::flat_buffer buffer;

    http::request<http::string_body> req{method, std::string(target), 11};
    req.set(http::field::host, "localhost");
    req.set(http::field::accept, "application/json");
    req.set(http::field::content_type, "application/json");
    req.keep_alive(false);
    req.body() = toCompactJson(body);
    req.prepare_payload();

    local::endpoint endpoint;
    try {
        endpoint = local::endpoint(socketPath_);
    } catch (const boost::system::system_error& e) {
        throw ControlChannelException(fmt::format("bad control socket path {}: {}", socketPath_, e.what()));
    }

    http::response<http::string_body> res;
    beast::error_code result = asio::error::would_block;
    const char* stage = "connect";

    socket.async_connect(endpoint, [&](beast::error_code connectEc) {
        if (connectEc) { result = connectEc; return; }
        stage = "write";
        http::async_write(socket, req, [&](beast::error_code writeEc, std::size_t) {
            if (writeEc) { result = writeEc; return; }
            stage = "read";
            http::async_read(socket, buffer, res, [&](beast::error_code readEc, std::size_t) {
                result = readEc;
            });
        });
    });

    ioc.run_for(timeout_);
    if (!ioc.stopped()) {
        beast::error_code ignored;
        socket.close(ignored);
        ioc.run();
        throw ControlChannelException(fmt::format("{} {} on {}: no answer within {} ms ({})",
                                                  verbName(method), target, socketPath_,
                                                  timeout_.count(), stage));
    }
    if (result) {
        throw ControlChannelException(fmt::format("{} {} on {}: {} failed: {}",
                                                  verbName(method), target, socketPath_,
                                                  stage, result.message()));
    }

    GXLOG_DEBUG("control {} {} -> {}", verbName(method), target, res.result_int());
    return ControlResponse{res.result_int(), std::move(res.body())};
}

ControlResponse HypervisorConnector::putMachineConfig(std::int64_t vcpuCount, std::int64_t memSizeMib) {
    Json::Value body;
    body["vcpu_count"] = Json::Int64(vcpuCount);
    body["mem_size_mib"] = Json::Int64(memSizeMib);
    return request(http::verb::put, "/machine-config", body);
}

ControlResponse HypervisorConnector::putBootSource(const std::string& kernelImagePath, const std::string& bootArgs) {
    Json::Value body;
    body["kernel_image_path"] = kernelImagePath;
    body["boot_args"] = bootArgs;
    return request(http::verb::put, "/boot-source", body);
}

ControlResponse HypervisorConnector::putDrive(const std::string& driveId, const std::string& pathOnHost,
                                              bool isRootDevice, bool isReadOnly) {
    Json::Value body;
    body["drive_id"] = driveId;
    body["path_on_host"] = pathOnHost;
    body["is_root_device"] = isRootDevice;
    body["is_read_only"] = isReadOnly;
    return request(http::verb::put, "/drives/" + driveId, body);
}

ControlResponse HypervisorConnector::putAction(const std::string& actionType) {
    Json::Value body;
    body["action_type"] = actionType;
    return request(http::verb::put, "/actions", body);
}

ControlResponse HypervisorConnector::patchVmState(const std::string& state) {
    Json::Value body;
    body["state"] = state;
    return request(http::verb::patch, "/vm", body);
}

} // namespace glidex
