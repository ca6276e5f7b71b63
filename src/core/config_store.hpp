#pragma once

#include <string>
#include <filesystem>
#include "config.hpp"

namespace fs = std::filesystem;

// Persistence backend for Config. The file backend reads and writes
// config.yml and hosts.yml; the memory backend keeps a snapshot so tests can
// run without touching disk.
class ConfigStore {
public:
    virtual ~ConfigStore() = default;

    virtual Result<void> load(Config& config) = 0;
    virtual Result<void> save(const Config& config) = 0;
};

class FileConfigStore : public ConfigStore {
public:
    explicit FileConfigStore(fs::path dir = get_config_dir());

    Result<void> load(Config& config) override;
    Result<void> save(const Config& config) override;

    const fs::path& dir() const { return dir_; }

private:
    fs::path dir_;
};

class MemoryConfigStore : public ConfigStore {
public:
    MemoryConfigStore() = default;

    Result<void> load(Config& config) override;
    Result<void> save(const Config& config) override;

    void seed(HostsData hosts) { hosts_ = std::move(hosts); }

    int save_count() const { return save_count_; }
    const HostsData& saved_hosts() const { return hosts_; }

    // Make the next save fail, to exercise error propagation.
    void fail_next_save(const std::string& error) { fail_next_ = error; }

private:
    std::map<std::string, std::string> settings_;
    HostsData hosts_;
    int save_count_ = 0;
    std::string fail_next_;
};

// YAML (de)serialization of hosts.yml, exposed for tests.
std::string hosts_to_yaml(const HostsData& hosts);
Result<HostsData> hosts_from_yaml(const std::string& text);
