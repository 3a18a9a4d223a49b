#pragma once

#include "config/config_loader.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <stop_token>
#include <string>
#include <thread>

namespace ingestgate {

/**
 * @brief Background config file watcher with hot-reload support
 *
 * Polls the TOML file's modification time. On change the file is re-parsed
 * and validated through ConfigLoader; only a config that loads cleanly is
 * handed to the callback. A broken edit is logged and the previous config
 * stays in effect.
 *
 * The callback runs on the watcher thread and must be thread-safe with
 * respect to request threads.
 */
class ConfigWatcher {
public:
    using ReloadCallback = std::function<void(const GatewayConfig& new_config)>;

    explicit ConfigWatcher(
        std::string config_path,
        std::chrono::seconds poll_interval = std::chrono::seconds{5});

    ~ConfigWatcher();

    ConfigWatcher(const ConfigWatcher&) = delete;
    ConfigWatcher& operator=(const ConfigWatcher&) = delete;

    void set_callback(ReloadCallback callback);

    void start();
    void stop();

    /**
     * @brief Run one poll cycle synchronously
     * @return true if a changed file was loaded and the callback invoked
     */
    bool poll_once();

    [[nodiscard]] bool is_running() const { return running_.load(); }
    [[nodiscard]] uint64_t reload_count() const { return reloads_.load(); }
    [[nodiscard]] uint64_t failed_reload_count() const { return failed_reloads_.load(); }

private:
    void watch_loop(std::stop_token stop);

    std::string config_path_;
    std::chrono::seconds poll_interval_;
    ReloadCallback callback_;

    std::filesystem::file_time_type last_mtime_{};
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> reloads_{0};
    std::atomic<uint64_t> failed_reloads_{0};
    std::jthread watch_thread_;
};

} // namespace ingestgate
