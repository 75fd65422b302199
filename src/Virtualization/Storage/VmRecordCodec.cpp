#include "Virtualization/Storage/VmRecordCodec.hpp"

#include <json/reader.h>
#include <json/value.h>
#include <json/writer.h>
#include <memory>
#include <fmt/format.h>

namespace glidex::VmRecordCodec {

std::string encode(const VmRecord& record) {
    Json::Value root;
    root["id"] = record.id;
    root["name"] = record.name;
    root["state"] = toString(record.state);

    Json::Value& config = root["config"];
    config["vcpu_count"] = Json::Int64(record.config.vcpuCount);
    config["mem_size_mib"] = Json::Int64(record.config.memSizeMib);
    config["kernel_image_path"] = record.config.kernelImagePath;
    config["rootfs_path"] = record.config.rootfsPath;
    if (record.config.kernelArgs) config["kernel_args"] = *record.config.kernelArgs;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}

Result<VmRecord> decode(std::string_view json) {
    Json::Value root;
    std::string errs;
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    if (!reader->parse(json.data(), json.data() + json.size(), &root, &errs)) {
        return fail(VmErrc::StorageError, "stored record is not JSON: " + errs);
    }
    if (!root.isObject() || !root["id"].isString() || !root["name"].isString() ||
        !root["state"].isString() || !root["config"].isObject()) {
        return fail(VmErrc::StorageError, "stored record is missing fields");
    }

    VmRecord record;
    record.id = root["id"].asString();
    record.name = root["name"].asString();

    auto state = vmStateFromString(root["state"].asString());
    if (!state) {
        return fail(VmErrc::StorageError,
                    fmt::format("vm {}: unknown stored state '{}'", record.id, root["state"].asString()));
    }
    record.state = *state;

    const Json::Value& config = root["config"];
    if (!config["vcpu_count"].isIntegral() || !config["mem_size_mib"].isIntegral() ||
        !config["kernel_image_path"].isString() || !config["rootfs_path"].isString()) {
        return fail(VmErrc::StorageError, fmt::format("vm {}: stored config is incomplete", record.id));
    }
    record.config.vcpuCount = config["vcpu_count"].asInt64();
    record.config.memSizeMib = config["mem_size_mib"].asInt64();
    record.config.kernelImagePath = config["kernel_image_path"].asString();
    record.config.rootfsPath = config["rootfs_path"].asString();
    if (config["kernel_args"].isString()) record.config.kernelArgs = config["kernel_args"].asString();

    return record;
}

} // namespace glidex::VmRecordCodec
