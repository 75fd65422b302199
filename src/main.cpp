#include <drogon/drogon.h>
#include <getopt.h>
#include <unistd.h>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "API/controllers/VirtualMachineController.hpp"
#include "System/Logger.hpp"
#include "System/Settings.hpp"
#include "Virtualization/Storage/MemoryVmStore.hpp"
#include "Virtualization/Storage/RocksDbVmStore.hpp"
#include "Virtualization/vmm/VirtualMachineManager.hpp"

namespace {

constexpr const char* kBanner = R"(
   ____ _ _     _
  / ___| (_) __| | _____  __
 | |  _| | |/ _` |/ _ \ \/ /
 | |_| | | | (_| |  __/>  <
  \____|_|_|\__,_|\___/_/\_\   microVM control plane
)";

void usage(const char* progname) {
    std::cout << "Usage: " << progname << " [options]\n"
              << "  -c, --config <file>   settings XML (defaults apply when omitted)\n"
              << "  -e, --ephemeral       keep VM records in memory only\n"
              << "  -d, --dump-config     print the effective settings and exit\n"
              << "  -h, --help            show this help\n";
}

bool checkKvm() {
    const char* kvm = "/dev/kvm";
    if (!std::filesystem::exists(kvm)) {
        GXLOG_CRITICAL("{} not found: enable virtualization in the firmware and load kvm_intel or kvm_amd", kvm);
        return false;
    }
    if (::access(kvm, R_OK | W_OK) != 0) {
        GXLOG_CRITICAL("{} is not accessible: add this user to the 'kvm' group or run as root", kvm);
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    std::optional<std::string> configPath;
    bool ephemeral = false;
    bool dumpConfig = false;

    static const struct option longopts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"ephemeral", no_argument, nullptr, 'e'},
        {"dump-config", no_argument, nullptr, 'd'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };
    int c;
    while ((c = getopt_long(argc, argv, "c:edh", longopts, nullptr)) >= 0) {
        switch (c) {
            case 'c': configPath = optarg; break;
            case 'e': ephemeral = true; break;
            case 'd': dumpConfig = true; break;
            case 'h': usage(argv[0]); return EXIT_SUCCESS;
            default: usage(argv[0]); return EXIT_FAILURE;
        }
    }

    glidex::Settings settings;
    if (configPath) {
        auto loaded = glidex::Settings::load(*configPath);
        if (!loaded) {
            std::cerr << loaded.error().what() << std::endl;
            return EXIT_FAILURE;
        }
        settings = std::move(*loaded);
    }
    if (dumpConfig) {
        std::cout << settings.toXml();
        return EXIT_SUCCESS;
    }

    std::cout << kBanner << std::endl;
    glidex::SafeLogger::initialize(settings.logging);

    if (!checkKvm()) return EXIT_FAILURE;

    std::shared_ptr<glidex::IVmStore> store;
    if (ephemeral) {
        GXLOG_WARN("ephemeral mode: VM records are not persisted");
        store = std::make_shared<glidex::MemoryVmStore>();
    } else {
        try {
            auto parent = std::filesystem::path(settings.databasePath).parent_path();
            if (!parent.empty()) std::filesystem::create_directories(parent);
            store = std::make_shared<glidex::RocksDbVmStore>(settings.databasePath);
        } catch (const std::exception& e) {
            GXLOG_CRITICAL("cannot open record store {}: {}", settings.databasePath, e.what());
            return EXIT_FAILURE;
        }
    }

    auto manager = std::make_shared<glidex::VirtualMachineManager>(settings.manager, store);
    if (auto ready = manager->initialize(); !ready) {
        GXLOG_CRITICAL("initialization failed: {}", ready.error().what());
        return EXIT_FAILURE;
    }
    manager->setCrashCallback([](const glidex::VmCrashEvent& event) {
        GXLOG_ERROR("vm '{}' ({}) crashed: hypervisor pid {} {}", event.name, event.vmId, event.pid, event.reason);
    });

    auto controller = std::make_shared<glidex::api::VirtualMachineController>(manager, settings.api.threads);
    drogon::app()
        .registerController(controller)
        .addListener(settings.api.address, settings.api.port)
        .setThreadNum(settings.api.threads);

    GXLOG_INFO("listening on {}:{}", settings.api.address, settings.api.port);
    drogon::app().run();

    GXLOG_INFO("shutting down");
    manager->shutdown();
    return EXIT_SUCCESS;
}
