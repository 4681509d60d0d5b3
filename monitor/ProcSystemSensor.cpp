#include "ProcSystemSensor.hpp"
#include "pool/PoolErrors.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>

#if defined(__linux__)
#include <sys/statvfs.h>
#endif

namespace ProcSync {

namespace {

[[noreturn]] void sensor_failure(const std::string& what) {
    throw std::system_error(make_error_code(Errc::SensorReadError), what);
}

} // namespace

ProcSystemSensor::ProcSystemSensor(std::string disk_path)
    : disk_path_(std::move(disk_path)) {}

SampleEvent ProcSystemSensor::sample() {
#if defined(__linux__)
    SampleEvent ev;
    ev.cpu_percent = read_cpu_percent();
    ev.memory_percent = read_memory_percent();
    ev.disk_percent = read_disk_percent();
    ev.network_bytes = read_network_bytes();
    return ev;
#else
    throw std::system_error(make_error_code(Errc::SensorReadError), "procfs sensor requires Linux");
#endif
}

double ProcSystemSensor::read_cpu_percent() {
    std::ifstream stat_file("/proc/stat");
    std::string cpu;
    std::uint64_t user = 0, nice = 0, system = 0, idle = 0, iowait = 0, irq = 0, softirq = 0, steal = 0;
    if (!(stat_file >> cpu >> user >> nice >> system >> idle >> iowait >> irq >> softirq >> steal) || cpu != "cpu") {
        sensor_failure("cannot parse /proc/stat");
    }
    const CpuTimes now{user + nice + system + idle + iowait + irq + softirq + steal, idle + iowait};
    const double percent = cpu_busy_percent(last_, now);
    last_ = now;
    return percent;
}

double ProcSystemSensor::cpu_busy_percent(const CpuTimes& prev, const CpuTimes& cur) {
    if (prev.total == 0) return 0.0;
    const double d_total = static_cast<double>(cur.total) - static_cast<double>(prev.total);
    if (d_total <= 0.0) return 0.0;
    const double d_idle = static_cast<double>(cur.idle) - static_cast<double>(prev.idle);
    return std::clamp((d_total - d_idle) / d_total * 100.0, 0.0, 100.0);
}

double ProcSystemSensor::read_memory_percent() const {
    std::ifstream meminfo("/proc/meminfo");
    if (!meminfo) sensor_failure("cannot open /proc/meminfo");
    return parse_memory_percent(meminfo);
}

double ProcSystemSensor::parse_memory_percent(std::istream& meminfo) {
    std::optional<std::uint64_t> total_kb;
    std::optional<std::uint64_t> available_kb;
    std::string key;
    std::uint64_t value = 0;
    std::string line;
    while (std::getline(meminfo, line)) {
        std::istringstream iss(line);
        if (!(iss >> key >> value)) continue;
        if (key == "MemTotal:") total_kb = value;
        else if (key == "MemAvailable:") available_kb = value;
    }
    if (!total_kb || *total_kb == 0) sensor_failure("MemTotal missing from /proc/meminfo");
    if (!available_kb) sensor_failure("MemAvailable missing from /proc/meminfo");

    const double total = static_cast<double>(*total_kb);
    const double used = total - static_cast<double>(*available_kb);
    return std::clamp(used / total * 100.0, 0.0, 100.0);
}

double ProcSystemSensor::read_disk_percent() const {
#if defined(__linux__)
    struct statvfs fs {};
    if (::statvfs(disk_path_.c_str(), &fs) != 0) {
        throw std::system_error(errno, std::system_category(), "statvfs " + disk_path_);
    }
    const double total = static_cast<double>(fs.f_blocks) * fs.f_frsize;
    if (total <= 0.0) return 0.0;
    const double used = static_cast<double>(fs.f_blocks - fs.f_bfree) * fs.f_frsize;
    const double available_to_user = static_cast<double>(fs.f_bavail) * fs.f_frsize;
    // Same convention as df: used / (used + available to unprivileged users)
    const double denominator = used + available_to_user;
    return denominator > 0.0 ? used / denominator * 100.0 : 0.0;
#else
    return 0.0;
#endif
}

std::uint64_t ProcSystemSensor::read_network_bytes() const {
    std::ifstream netdev("/proc/net/dev");
    if (!netdev) sensor_failure("cannot open /proc/net/dev");

    std::string line;
    // Two header lines
    std::getline(netdev, line);
    std::getline(netdev, line);

    std::uint64_t total = 0;
    while (std::getline(netdev, line)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string iface = line.substr(0, colon);
        iface.erase(0, iface.find_first_not_of(' '));
        if (iface == "lo") continue;

        std::istringstream iss(line.substr(colon + 1));
        std::uint64_t fields[16] = {};
        for (auto& f : fields) {
            if (!(iss >> f)) break;
        }
        total += fields[0] + fields[8]; // rx bytes, tx bytes
    }
    return total;
}

} // namespace ProcSync
