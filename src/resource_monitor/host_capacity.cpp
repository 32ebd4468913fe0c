/**
 * @file host_capacity.cpp
 * @brief Host capacity probing from Linux pseudo-filesystems.
 */

#include "resource_monitor/host_capacity.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <thread>

namespace model_mesh {

uint64_t parse_meminfo_total_kb(std::istream& in) {
    std::string line;
    while (std::getline(in, line)) {
        if (line.starts_with("MemTotal:")) {
            std::istringstream iss(line.substr(9));
            uint64_t total_kb = 0;
            iss >> total_kb;
            return total_kb;
        }
    }
    return 0;
}

Result<ResourceQuota> detect_host_capacity(LicenseTier tier,
                                           const std::filesystem::path& meminfo_path) {
    std::ifstream ifs(meminfo_path);
    if (!ifs.is_open()) {
        return Error{"cannot read " + meminfo_path.string()};
    }

    auto quota = default_quota_for_tier(tier);

    const auto total_kb = parse_meminfo_total_kb(ifs);
    if (total_kb > 0) {
        quota.memory_gb = static_cast<double>(total_kb) / (1024.0 * 1024.0);
    }

    const auto cores = std::thread::hardware_concurrency();
    if (cores > 0) {
        quota.cpu_cores = static_cast<double>(cores);
    }
    return quota;
}

}  // namespace model_mesh
