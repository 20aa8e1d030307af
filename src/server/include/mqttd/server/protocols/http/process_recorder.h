#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mqttd {
namespace server {
namespace protocols {
namespace http {

/**
 * @brief Resource usage of this process at one point in time
 */
struct ProcessSample {
    std::chrono::system_clock::time_point time;
    double cpuPercent = 0.0;
    uint64_t rssBytes = 0;
    uint64_t vmsBytes = 0;
    int64_t threads = 0;
    size_t openFiles = 0;
};

void to_json(nlohmann::json& j, const ProcessSample& sample);

/**
 * @brief Periodically samples /proc/self and keeps a bounded history
 *
 * Served by the control plane at /processrecords.
 */
class ProcessRecorder {
public:
    struct Options {
        std::string name = "MQTT Broker";
        std::chrono::milliseconds interval{std::chrono::seconds(60)};
        std::chrono::milliseconds retention{std::chrono::hours(24 * 7)};
    };

    explicit ProcessRecorder(Options options);
    ~ProcessRecorder();

    ProcessRecorder(const ProcessRecorder&) = delete;
    ProcessRecorder& operator=(const ProcessRecorder&) = delete;

    /**
     * @brief Takes a first sample and starts the sampling thread
     */
    void start();

    void stop();
    bool isRunning() const;

    /**
     * @brief Takes one sample now; returns false when /proc is unreadable
     */
    bool sampleNow();

    std::vector<ProcessSample> samples() const;
    nlohmann::json toJson() const;

    const Options& options() const { return options_; }

private:
    struct CpuTimes {
        uint64_t ticks = 0;
        std::chrono::steady_clock::time_point at;
        bool valid = false;
    };

    void run();
    std::optional<ProcessSample> collect();
    void evictOlderThan(std::chrono::system_clock::time_point cutoff);

    Options options_;
    std::mutex collectMutex_;
    CpuTimes previousCpu_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ProcessSample> samples_;
    std::thread thread_;
    bool running_ = false;
};

} // namespace http
} // namespace protocols
} // namespace server
} // namespace mqttd
