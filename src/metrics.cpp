// src/metrics.cpp
// Metric registry and process resource sampling

#include "telemetry/metrics.hpp"
#include <algorithm>
#include <chrono>
#include <dirent.h>
#include <fstream>
#include <sys/resource.h>
#include <unistd.h>

namespace telemetry {

std::string metric_type_to_string(MetricType type) {
    switch (type) {
        case MetricType::COUNTER: return "counter";
        case MetricType::GAUGE: return "gauge";
        case MetricType::HISTOGRAM: return "histogram";
        case MetricType::SUMMARY: return "summary";
        default: return "unknown";
    }
}

void MetricRegistry::register_metric(const MetricDefinition& definition) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = metrics_.find(definition.name);
    if (it != metrics_.end()) {
        it->second->set_definition(definition);
        return;
    }
    metrics_[definition.name] = std::make_shared<Metric>(definition);
}

void MetricRegistry::record(const std::string& name, double value,
                            const std::optional<std::string>& unit, Timestamp timestamp) {
    std::shared_ptr<Metric> metric;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = metrics_.find(name);
        if (it == metrics_.end()) {
            MetricDefinition definition;
            definition.name = name;
            definition.description = "Auto-registered metric: " + name;
            definition.unit = unit.value_or("unspecified");
            definition.type = MetricType::GAUGE;
            metric = std::make_shared<Metric>(definition);
            metrics_[name] = metric;
        } else {
            metric = it->second;
        }
    }
    metric->record(value, timestamp);
}

bool MetricRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_.find(name) != metrics_.end();
}

std::optional<MetricSnapshot> MetricRegistry::get(const std::string& name) const {
    std::shared_ptr<Metric> metric;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = metrics_.find(name);
        if (it == metrics_.end()) {
            return std::nullopt;
        }
        metric = it->second;
    }
    return metric->snapshot();
}

std::vector<MetricSnapshot> MetricRegistry::all() const {
    std::vector<std::shared_ptr<Metric>> metrics;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        metrics.reserve(metrics_.size());
        for (const auto& pair : metrics_) {
            metrics.push_back(pair.second);
        }
    }

    std::vector<MetricSnapshot> snapshots;
    snapshots.reserve(metrics.size());
    for (const auto& metric : metrics) {
        snapshots.push_back(metric->snapshot());
    }
    std::sort(snapshots.begin(), snapshots.end(), [](const MetricSnapshot& a, const MetricSnapshot& b) {
        return a.definition.name < b.definition.name;
    });
    return snapshots;
}

size_t MetricRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_.size();
}

namespace ResourceMonitor {

namespace {

uint32_t count_open_fds() {
    uint32_t count = 0;
    DIR* dir = opendir("/proc/self/fd");
    if (!dir) {
        return 0;
    }
    while (struct dirent* entry = readdir(dir)) {
        if (entry->d_name[0] != '.') {
            count++;
        }
    }
    closedir(dir);
    return count > 0 ? count - 1 : 0;  // the directory stream itself
}

// Process CPU time over wall time since the previous sample
double sample_cpu_percent() {
    using SteadyClock = std::chrono::steady_clock;
    static std::mutex mutex;
    static SteadyClock::time_point last_wall = SteadyClock::now();
    static double last_cpu_seconds = 0.0;

    struct rusage usage{};
    if (getrusage(RUSAGE_SELF, &usage) != 0) {
        return 0.0;
    }
    double cpu_seconds = usage.ru_utime.tv_sec + usage.ru_utime.tv_usec / 1e6 +
                         usage.ru_stime.tv_sec + usage.ru_stime.tv_usec / 1e6;

    std::lock_guard<std::mutex> lock(mutex);
    auto now = SteadyClock::now();
    double wall_seconds = std::chrono::duration<double>(now - last_wall).count();
    double percent = wall_seconds > 0.0 ? (cpu_seconds - last_cpu_seconds) / wall_seconds * 100.0 : 0.0;
    last_wall = now;
    last_cpu_seconds = cpu_seconds;
    return std::max(percent, 0.0);
}

} // namespace

ResourceUsage current_usage() {
    ResourceUsage usage;
    long page_size = sysconf(_SC_PAGESIZE);

    std::ifstream statm("/proc/self/statm");
    uint64_t total_pages = 0;
    uint64_t resident_pages = 0;
    if (statm >> total_pages >> resident_pages && page_size > 0) {
        usage.memory_rss_bytes = resident_pages * static_cast<uint64_t>(page_size);
    }

    long physical_pages = sysconf(_SC_PHYS_PAGES);
    if (physical_pages > 0 && page_size > 0) {
        double physical_bytes = static_cast<double>(physical_pages) * page_size;
        usage.memory_percent = usage.memory_rss_bytes / physical_bytes * 100.0;
    }

    std::ifstream io("/proc/self/io");
    std::string key;
    uint64_t value = 0;
    while (io >> key >> value) {
        if (key == "read_bytes:") {
            usage.disk_io_read_bytes = value;
        } else if (key == "write_bytes:") {
            usage.disk_io_write_bytes = value;
        }
    }

    usage.cpu_percent = sample_cpu_percent();
    usage.open_file_descriptors = count_open_fds();
    return usage;
}

} // namespace ResourceMonitor

} // namespace telemetry
