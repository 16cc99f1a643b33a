/**
 * @file server/InfoProvider.cpp
 */

#include "InfoProvider.h"
#include "../shared/ConnectionRegistry.h"
#include <sys/utsname.h>
#include <unistd.h>
#include <climits>
#include <thread>

namespace duplex {

std::string HostnameInfo::value() const {
    char name[HOST_NAME_MAX + 1] = {};
    if (::gethostname(name, sizeof(name) - 1) != 0 || !name[0]) {
        return "Unknown";
    }
    return name;
}

std::string OsInfo::value() const {
    utsname info{};
    if (::uname(&info) != 0) {
        return "Unknown";
    }
    return std::string(info.sysname) + " " + info.release;
}

std::string CpuInfo::value() const {
    const auto cores = std::thread::hardware_concurrency();
    if (!cores) return "Unknown CPU";
    return std::to_string(cores) + " cores";
}

std::string ConnectionsInfo::value() const {
    return std::to_string(_registry->size()) + " live";
}

InfoProviders defaultInfoProviders(std::shared_ptr<const ConnectionRegistry> registry) {
    InfoProviders providers;
    providers.push_back(std::make_unique<HostnameInfo>());
    providers.push_back(std::make_unique<OsInfo>());
    providers.push_back(std::make_unique<CpuInfo>());
    providers.push_back(std::make_unique<ConnectionsInfo>(std::move(registry)));
    return providers;
}

} // namespace duplex
