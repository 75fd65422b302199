#include "System/Settings.hpp"

#include <charconv>
#include <limits>
#include <pugixml.hpp>
#include <fmt/format.h>

namespace glidex {

namespace {

// Reads optional attributes of one element, remembering the first bad value.
class AttributeReader {
public:
    AttributeReader(pugi::xml_node node, std::string& error) : node_(node), error_(error) {}

    void text(const char* name, std::string& out) {
        if (auto attr = node_.attribute(name)) out = attr.as_string();
    }

    template <typename T>
    void number(const char* name, T& out, T min, T max = std::numeric_limits<T>::max()) {
        auto attr = node_.attribute(name);
        if (!attr || !error_.empty()) return;
        std::string_view value = attr.as_string();
        T parsed{};
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
        if (ec != std::errc() || ptr != value.data() + value.size() || parsed < min || parsed > max) {
            error_ = fmt::format("<{} {}=\"{}\">: expected a number in [{}, {}]", node_.name(), name, value, min, max);
            return;
        }
        out = parsed;
    }

    void millis(const char* name, std::chrono::milliseconds& out, std::int64_t min = 1) {
        auto count = static_cast<std::int64_t>(out.count());
        number<std::int64_t>(name, count, min);
        out = std::chrono::milliseconds(count);
    }

    void flag(const char* name, bool& out) {
        auto attr = node_.attribute(name);
        if (!attr || !error_.empty()) return;
        std::string_view value = attr.as_string();
        if (value == "true" || value == "1" || value == "yes") {
            out = true;
        } else if (value == "false" || value == "0" || value == "no") {
            out = false;
        } else {
            error_ = fmt::format("<{} {}=\"{}\">: expected true or false", node_.name(), name, value);
        }
    }

private:
    pugi::xml_node node_;
    std::string& error_;
};

Result<Settings> fromDocument(const pugi::xml_document& doc) {
    auto root = doc.child("glidex");
    if (!root) return fail(VmErrc::InvalidConfig, "settings: missing <glidex> root element");

    Settings settings;
    std::string error;

    {
        AttributeReader r(root.child("hypervisor"), error);
        auto& sup = settings.manager.supervisor;
        r.text("binary", sup.hypervisorBinary);
        r.millis("socket-timeout-ms", sup.apiSocketTimeout);
        r.millis("socket-poll-ms", sup.apiSocketPoll);
        r.millis("request-timeout-ms", sup.requestTimeout);
        r.millis("shutdown-grace-ms", sup.shutdownGrace, 0);
    }
    {
        AttributeReader r(root.child("runtime"), error);
        r.text("dir", settings.manager.runtimeDir);
        r.text("database", settings.databasePath);
    }
    {
        AttributeReader r(root.child("console"), error);
        auto& console = settings.manager.console;
        r.number<std::size_t>("replay-bytes", console.replayBytes, 0);
        r.number<std::size_t>("client-queue-bytes", console.clientQueueBytes, 1);
        r.number<std::size_t>("io-threads", settings.manager.consoleThreads, 1, 64);
    }
    {
        AttributeReader r(root.child("api"), error);
        r.text("address", settings.api.address);
        r.number<std::uint16_t>("port", settings.api.port, 1);
        r.number<std::size_t>("threads", settings.api.threads, 1, 64);
    }
    {
        AttributeReader r(root.child("logging"), error);
        std::string level;
        r.text("level", level);
        if (!level.empty()) {
            auto parsed = spdlog::level::from_str(level);
            if (parsed == spdlog::level::off && level != "off") {
                error = fmt::format("<logging level=\"{}\">: unknown level", level);
            }
            settings.logging.level = parsed;
        }
        r.text("file", settings.logging.file_path);
        r.flag("console", settings.logging.enable_console);
        r.flag("file-enabled", settings.logging.enable_file);
    }

    if (!error.empty()) return fail(VmErrc::InvalidConfig, "settings: " + error);
    if (settings.manager.supervisor.hypervisorBinary.empty()) {
        return fail(VmErrc::InvalidConfig, "settings: <hypervisor binary> must not be empty");
    }
    if (settings.manager.runtimeDir.empty()) {
        return fail(VmErrc::InvalidConfig, "settings: <runtime dir> must not be empty");
    }
    if (!ConsolePaths::forVm(settings.manager.runtimeDir, "00000000-0000-0000-0000-000000000000").socketsFit()) {
        return fail(VmErrc::InvalidConfig, "settings: <runtime dir> is too long for a unix socket path");
    }
    if (settings.manager.console.replayBytes > settings.manager.console.clientQueueBytes) {
        return fail(VmErrc::InvalidConfig, "settings: console replay-bytes exceeds client-queue-bytes");
    }
    return settings;
}

} // namespace

Result<Settings> Settings::load(const std::string& path) {
    pugi::xml_document doc;
    auto parsed = doc.load_file(path.c_str());
    if (!parsed) {
        return fail(VmErrc::InvalidConfig,
                    fmt::format("settings {}: {} at offset {}", path, parsed.description(), parsed.offset));
    }
    return fromDocument(doc);
}

Result<Settings> Settings::parse(std::string_view xml) {
    pugi::xml_document doc;
    auto parsed = doc.load_buffer(xml.data(), xml.size());
    if (!parsed) {
        return fail(VmErrc::InvalidConfig,
                    fmt::format("settings: {} at offset {}", parsed.description(), parsed.offset));
    }
    return fromDocument(doc);
}

std::string Settings::toXml() const {
    pugi::xml_document doc;
    auto root = doc.append_child("glidex");

    const auto& sup = manager.supervisor;
    auto hypervisor = root.append_child("hypervisor");
    hypervisor.append_attribute("binary") = sup.hypervisorBinary.c_str();
    hypervisor.append_attribute("socket-timeout-ms") = static_cast<long long>(sup.apiSocketTimeout.count());
    hypervisor.append_attribute("socket-poll-ms") = static_cast<long long>(sup.apiSocketPoll.count());
    hypervisor.append_attribute("request-timeout-ms") = static_cast<long long>(sup.requestTimeout.count());
    hypervisor.append_attribute("shutdown-grace-ms") = static_cast<long long>(sup.shutdownGrace.count());

    auto runtime = root.append_child("runtime");
    runtime.append_attribute("dir") = manager.runtimeDir.c_str();
    runtime.append_attribute("database") = databasePath.c_str();

    auto console = root.append_child("console");
    console.append_attribute("replay-bytes") = static_cast<unsigned long long>(manager.console.replayBytes);
    console.append_attribute("client-queue-bytes") = static_cast<unsigned long long>(manager.console.clientQueueBytes);
    console.append_attribute("io-threads") = static_cast<unsigned long long>(manager.consoleThreads);

    auto apiNode = root.append_child("api");
    apiNode.append_attribute("address") = api.address.c_str();
    apiNode.append_attribute("port") = static_cast<unsigned>(api.port);
    apiNode.append_attribute("threads") = static_cast<unsigned long long>(api.threads);

    auto log = root.append_child("logging");
    auto level = spdlog::level::to_string_view(logging.level);
    log.append_attribute("level") = std::string(level.data(), level.size()).c_str();
    log.append_attribute("file") = logging.file_path.c_str();
    log.append_attribute("console") = logging.enable_console;
    log.append_attribute("file-enabled") = logging.enable_file;

    struct xml_string_writer : pugi::xml_writer {
        std::string result;
        void write(const void* data, size_t size) override {
            result.append(static_cast<const char*>(data), size);
        }
    };
    xml_string_writer writer;
    doc.save(writer, "  ", pugi::format_default | pugi::format_indent);
    return writer.result;
}

} // namespace glidex
