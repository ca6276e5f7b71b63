#pragma once

#include <memory>
#include <mutex>
#include "config.hpp"
#include "config_store.hpp"

// The single owned, lock-guarded configuration handle for one process.
// Every component that reads or mutates configuration receives a reference
// to it; mutations hold mutex() for their whole read-modify-write cycle.
// Nothing coordinates separate processes: the last save() wins.
class SharedConfig {
public:
    explicit SharedConfig(std::unique_ptr<ConfigStore> store, EnvLookup env = process_env)
        : config_(env), store_(std::move(store)), env_(std::move(env)) {}

    // Load from the backing store, replacing in-memory state.
    Result<void> load() {
        std::lock_guard<std::mutex> lock(mutex_);
        Config fresh(env_);
        auto r = store_->load(fresh);
        if (r.is_err()) return r;
        config_ = std::move(fresh);
        return Result<void>::Ok();
    }

    // Callers must hold mutex().
    Result<void> save() { return store_->save(config_); }

    std::mutex& mutex() { return mutex_; }
    Config& config() { return config_; }
    const Config& config() const { return config_; }
    const EnvLookup& env() const { return env_; }

private:
    Config config_;
    std::unique_ptr<ConfigStore> store_;
    EnvLookup env_;
    std::mutex mutex_;
};
