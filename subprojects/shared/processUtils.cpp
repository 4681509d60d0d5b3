#include "processUtils.hpp"
#if defined(__linux__) || defined(__APPLE__)
#include <pthread.h>
#endif

#ifdef _WIN32
#include <windows.h>
#include <psapi.h>

ProcessUsage ProcessUtils::get_process_usage() {
    static ULONGLONG last_time = 0, last_sys_time = 0, last_user_time = 0;
    FILETIME sys_idle, sys_kernel, sys_user;
    FILETIME proc_creation, proc_exit, proc_kernel, proc_user;
    GetSystemTimes(&sys_idle, &sys_kernel, &sys_user);

    HANDLE hProcess = GetCurrentProcess();
    GetProcessTimes(hProcess, &proc_creation, &proc_exit, &proc_kernel, &proc_user);

    ULONGLONG sys_time = (((ULONGLONG)sys_kernel.dwHighDateTime) << 32) | sys_kernel.dwLowDateTime;
    ULONGLONG user_time = (((ULONGLONG)sys_user.dwHighDateTime) << 32) | sys_user.dwLowDateTime;
    ULONGLONG proc_sys_time = (((ULONGLONG)proc_kernel.dwHighDateTime) << 32) | proc_kernel.dwLowDateTime;
    ULONGLONG proc_user_time = (((ULONGLONG)proc_user.dwHighDateTime) << 32) | proc_user.dwLowDateTime;

    double cpu_percent = 0.0;
    ULONGLONG now = sys_time + user_time;
    ULONGLONG proc_now = proc_sys_time + proc_user_time;
    if (last_time != 0 && now > last_time) {
        cpu_percent = double(proc_now - last_user_time - last_sys_time) / double(now - last_time) * 100.0;
    }
    last_time = now;
    last_sys_time = proc_sys_time;
    last_user_time = proc_user_time;

    PROCESS_MEMORY_COUNTERS pmc;
    SIZE_T mem = 0;
    if (GetProcessMemoryInfo(hProcess, &pmc, sizeof(pmc))) {
        mem = pmc.WorkingSetSize;
    }
    return {cpu_percent, mem};
}

#elif defined(__linux__)
#include <fstream>
#include <string>
#include <unistd.h>

ProcessUsage ProcessUtils::get_process_usage() {
    static unsigned long long last_total_time = 0, last_proc_time = 0;

    std::ifstream stat_file("/proc/stat");
    std::string cpu;
    unsigned long long user = 0, nice = 0, system = 0, idle = 0, iowait = 0, irq = 0, softirq = 0, steal = 0;
    stat_file >> cpu >> user >> nice >> system >> idle >> iowait >> irq >> softirq >> steal;
    unsigned long long total_time = user + nice + system + idle + iowait + irq + softirq + steal;

    std::ifstream proc_file("/proc/self/stat");
    std::string ignore;
    unsigned long utime = 0, stime = 0;
    for (int i = 0; i < 13; ++i) proc_file >> ignore;
    proc_file >> utime >> stime;
    unsigned long long proc_time = utime + stime;

    double cpu_percent = 0.0;
    if (last_total_time != 0 && total_time > last_total_time) {
        cpu_percent = double(proc_time - last_proc_time) / double(total_time - last_total_time) * 100.0;
    }
    last_total_time = total_time;
    last_proc_time = proc_time;

    std::ifstream statm_file("/proc/self/statm");
    unsigned long size = 0, resident = 0;
    statm_file >> size >> resident;
    std::size_t mem = resident * static_cast<std::size_t>(sysconf(_SC_PAGESIZE));

    return {cpu_percent, mem};
}

#elif defined(__APPLE__)
#include <mach/mach.h>
#include <sys/resource.h>
#include <sys/time.h>

ProcessUsage ProcessUtils::get_process_usage() {
    static uint64_t last_wall_time = 0, last_proc_time = 0;

    // Get process CPU time (in microseconds)
    struct rusage usage;
    getrusage(RUSAGE_SELF, &usage);
    uint64_t proc_time = usage.ru_utime.tv_sec * 1000000ULL + usage.ru_utime.tv_usec +
                         usage.ru_stime.tv_sec * 1000000ULL + usage.ru_stime.tv_usec;

    // Get wall clock time (in microseconds)
    struct timeval tv;
    gettimeofday(&tv, nullptr);
    uint64_t wall_time = tv.tv_sec * 1000000ULL + tv.tv_usec;

    double cpu_percent = 0.0;
    if (last_wall_time != 0) {
        // Percentage of one CPU core used since the previous call
        uint64_t delta_proc = proc_time - last_proc_time;
        uint64_t delta_wall = wall_time - last_wall_time;
        if (delta_wall > 0) {
            cpu_percent = (double(delta_proc) / double(delta_wall)) * 100.0;
        }
    }
    last_wall_time = wall_time;
    last_proc_time = proc_time;

    struct task_basic_info t_info;
    mach_msg_type_number_t t_info_count = TASK_BASIC_INFO_COUNT;
    task_info(mach_task_self(), TASK_BASIC_INFO, (task_info_t)&t_info, &t_info_count);
    std::size_t mem = t_info.resident_size;

    return {cpu_percent, mem};
}

#else
ProcessUsage ProcessUtils::get_process_usage() {
    return {0.0, 0};
}
#endif

// Cross-platform thread naming
void ProcessUtils::set_current_thread_name(const std::string& name) {
#if defined(_WIN32)
    std::wstring wname(name.begin(), name.end());
    // Best-effort: ignore failures on older Windows versions
    ::SetThreadDescription(::GetCurrentThread(), wname.c_str());
#elif defined(__APPLE__)
    // macOS supports setting name for current thread only
    pthread_setname_np(name.c_str());
#elif defined(__linux__)
    // Linux limits names to 16 chars including NUL
    pthread_setname_np(pthread_self(), name.substr(0, 15).c_str());
#else
    (void)name; // no-op on unsupported platforms
#endif
}
