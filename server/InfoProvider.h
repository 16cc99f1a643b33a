/**
 * @file server/InfoProvider.h
 * @brief Labelled facts about the running server, printed by the `/info` admin command.
 *
 * @details
 * Every provider exposes the same two capabilities, a label and a value, and
 * the admin console walks a collection of them without knowing their types.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

namespace duplex {

class ConnectionRegistry;

class InfoProvider {
public:
    virtual ~InfoProvider() = default;
    virtual std::string label() const = 0;
    virtual std::string value() const = 0;
};

class HostnameInfo : public InfoProvider {
public:
    std::string label() const override { return "Hostname"; }
    std::string value() const override;
};

class OsInfo : public InfoProvider {
public:
    std::string label() const override { return "OS"; }
    std::string value() const override;
};

class CpuInfo : public InfoProvider {
public:
    std::string label() const override { return "CPU"; }
    std::string value() const override;
};

class ConnectionsInfo : public InfoProvider {
public:
    explicit ConnectionsInfo(std::shared_ptr<const ConnectionRegistry> registry)
        : _registry(std::move(registry)) {}

    std::string label() const override { return "Connections"; }
    std::string value() const override;

private:
    std::shared_ptr<const ConnectionRegistry> _registry;
};

using InfoProviders = std::vector<std::unique_ptr<InfoProvider>>;

/// Host name, OS, CPU and live connection count, in that order
InfoProviders defaultInfoProviders(std::shared_ptr<const ConnectionRegistry> registry);

} // namespace duplex
