/**
 * @file host_capacity.hpp
 * @brief Detect the raw hardware capacity offered to the allocator.
 *
 * CPU cores come from std::thread::hardware_concurrency() and memory from
 * /proc/meminfo. Dimensions the host cannot report (GPU memory, bandwidth,
 * slot and connection counts) take the license tier's default quota.
 */

#pragma once

#include "core/quota.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <istream>

namespace model_mesh {

/// MemTotal in kB from a /proc/meminfo-formatted stream; 0 if absent.
[[nodiscard]] uint64_t parse_meminfo_total_kb(std::istream& in);

/**
 * @brief Probe the host.
 *
 * Fails with Internal when @p meminfo_path cannot be read.
 */
Result<ResourceQuota> detect_host_capacity(LicenseTier tier,
                                           const std::filesystem::path& meminfo_path = "/proc/meminfo");

}  // namespace model_mesh
