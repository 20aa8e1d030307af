#include "mqttd/server/protocols/http/process_recorder.h"
#include "mqttd/core/utils.h"
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace mqttd {
namespace server {
namespace protocols {
namespace http {

namespace fs = std::filesystem;

namespace {
std::string readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return "";
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}
} // namespace

void to_json(nlohmann::json& j, const ProcessSample& sample) {
    j = nlohmann::json{
        {"time", core::formatTime(sample.time)},
        {"cpu_percent", sample.cpuPercent},
        {"rss", sample.rssBytes},
        {"vms", sample.vmsBytes},
        {"threads", sample.threads},
        {"open_files", sample.openFiles}
    };
}

ProcessRecorder::ProcessRecorder(Options options)
    : options_(std::move(options)) {
}

ProcessRecorder::~ProcessRecorder() {
    stop();
}

void ProcessRecorder::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return;
        }
        running_ = true;
    }

    sampleNow();
    thread_ = std::thread(&ProcessRecorder::run, this);
    spdlog::debug("Process recorder '{}' started ({} ms interval)", options_.name, options_.interval.count());
}

void ProcessRecorder::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }

    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool ProcessRecorder::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

bool ProcessRecorder::sampleNow() {
    std::optional<ProcessSample> sample;
    {
        std::lock_guard<std::mutex> lock(collectMutex_);
        sample = collect();
    }
    if (!sample) {
        spdlog::warn("Process recorder could not read /proc/self");
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    samples_.push_back(*sample);
    evictOlderThan(sample->time - options_.retention);
    return true;
}

std::vector<ProcessSample> ProcessRecorder::samples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<ProcessSample>(samples_.begin(), samples_.end());
}

nlohmann::json ProcessRecorder::toJson() const {
    nlohmann::json j;
    j["name"] = options_.name;
    j["interval_seconds"] = std::chrono::duration_cast<std::chrono::seconds>(options_.interval).count();
    j["records"] = samples();
    return j;
}

void ProcessRecorder::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (cv_.wait_for(lock, options_.interval, [this] { return !running_; })) {
            break;
        }
        lock.unlock();
        sampleNow();
        lock.lock();
    }
}

std::optional<ProcessSample> ProcessRecorder::collect() {
    std::string stat = readFile("/proc/self/stat");
    size_t commEnd = stat.rfind(')');
    if (stat.empty() || commEnd == std::string::npos || commEnd + 2 >= stat.size()) {
        return std::nullopt;
    }

    // Fields after "pid (comm) "
    std::istringstream iss(stat.substr(commEnd + 2));
    char state;
    int64_t ppid, pgrp, session, ttyNr, tpgid;
    uint64_t flags, minflt, cminflt, majflt, cmajflt, utime, stime;
    int64_t cutime, cstime, priority, nice, numThreads, itrealvalue;
    uint64_t starttime, vsize, rss;

    iss >> state >> ppid >> pgrp >> session >> ttyNr >> tpgid >> flags
        >> minflt >> cminflt >> majflt >> cmajflt >> utime >> stime
        >> cutime >> cstime >> priority >> nice >> numThreads >> itrealvalue
        >> starttime >> vsize >> rss;
    if (!iss) {
        return std::nullopt;
    }

    ProcessSample sample;
    sample.time = std::chrono::system_clock::now();
    sample.threads = numThreads;
    sample.vmsBytes = vsize;
    sample.rssBytes = rss * static_cast<uint64_t>(sysconf(_SC_PAGESIZE));

    auto now = std::chrono::steady_clock::now();
    uint64_t ticks = utime + stime;
    if (previousCpu_.valid) {
        double elapsed = std::chrono::duration<double>(now - previousCpu_.at).count();
        long ticksPerSecond = sysconf(_SC_CLK_TCK);
        if (elapsed > 0 && ticksPerSecond > 0 && ticks >= previousCpu_.ticks) {
            double cpuSeconds = static_cast<double>(ticks - previousCpu_.ticks) / ticksPerSecond;
            sample.cpuPercent = cpuSeconds / elapsed * 100.0;
        }
    }
    previousCpu_.ticks = ticks;
    previousCpu_.at = now;
    previousCpu_.valid = true;

    std::error_code ec;
    for (fs::directory_iterator it("/proc/self/fd", ec), end; !ec && it != end; it.increment(ec)) {
        sample.openFiles++;
    }
    return sample;
}

void ProcessRecorder::evictOlderThan(std::chrono::system_clock::time_point cutoff) {
    while (!samples_.empty() && samples_.front().time < cutoff) {
        samples_.pop_front();
    }
}

} // namespace http
} // namespace protocols
} // namespace server
} // namespace mqttd
