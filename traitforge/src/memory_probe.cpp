#include <traitforge/memory_probe.hpp>
#include <cstdio>
#include <cstring>
#include <thread>
#include <unistd.h>

namespace traitforge {

std::optional<MemorySnapshot> read_system_memory() {
    FILE* file = fopen("/proc/meminfo", "r");
    if (!file) return std::nullopt;

    std::size_t total_kb = 0;
    std::size_t available_kb = 0;
    bool have_total = false;
    bool have_available = false;

    char line[256];
    while (fgets(line, sizeof(line), file)) {
        unsigned long long value = 0;
        if (std::strncmp(line, "MemTotal:", 9) == 0 && sscanf(line + 9, "%llu", &value) == 1) {
            total_kb = static_cast<std::size_t>(value);
            have_total = true;
        } else if (std::strncmp(line, "MemAvailable:", 13) == 0 && sscanf(line + 13, "%llu", &value) == 1) {
            available_kb = static_cast<std::size_t>(value);
            have_available = true;
        }
        if (have_total && have_available) break;
    }
    fclose(file);

    if (!have_total || !have_available || total_kb == 0) return std::nullopt;

    MemorySnapshot snapshot;
    snapshot.limit_bytes = total_kb * 1024;
    snapshot.used_bytes = (total_kb > available_kb ? total_kb - available_kb : 0) * 1024;
    return snapshot;
}

MemoryProbe system_memory_probe() {
    return [] { return read_system_memory(); };
}

DeviceProfile DeviceProfile::detect() {
    DeviceProfile profile;
    unsigned hw = std::thread::hardware_concurrency();
    profile.cores = hw == 0 ? 1 : hw;

    long pages = sysconf(_SC_PHYS_PAGES);
    long page_size = sysconf(_SC_PAGE_SIZE);
    if (pages > 0 && page_size > 0) {
        profile.memory_gb = static_cast<double>(pages) * static_cast<double>(page_size) /
                            (1024.0 * 1024.0 * 1024.0);
    }

    profile.constrained = profile.cores <= 2 || profile.memory_gb <= 2.0;
    return profile;
}

} // namespace traitforge
