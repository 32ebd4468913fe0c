/**
 * @file license_gate.hpp
 * @brief LicenseGate: entitlement checks consumed by every privileged operation.
 *
 * Cryptographic license validation lives outside this project; components
 * only see the verdict through this interface. A single gate instance is
 * owned by the service runner and passed by reference to each component.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace model_mesh {

/// Entry in allowed_models() granting access to every model.
inline constexpr std::string_view ANY_MODEL = "*";

/**
 * @brief Abstract license gate.
 */
class LicenseGate {
public:
    virtual ~LicenseGate() = default;

    [[nodiscard]] virtual bool is_valid() const = 0;
    [[nodiscard]] virtual LicenseTier tier() const = 0;
    [[nodiscard]] virtual std::vector<ModelId> allowed_models() const = 0;
    [[nodiscard]] virtual uint32_t max_clients() const = 0;

    /// True if the license is valid and @p model_id is listed (or "*" is).
    [[nodiscard]] bool allows_model(const ModelId& model_id) const;
};

/**
 * @brief Gate backed by fixed values from the [license] config section.
 *
 * Values may be changed at runtime (license refresh, tests); all accessors
 * are thread-safe.
 */
class StaticLicenseGate : public LicenseGate {
public:
    StaticLicenseGate(bool valid, LicenseTier tier,
                      std::vector<ModelId> allowed_models, uint32_t max_clients);

    [[nodiscard]] bool is_valid() const override;
    [[nodiscard]] LicenseTier tier() const override;
    [[nodiscard]] std::vector<ModelId> allowed_models() const override;
    [[nodiscard]] uint32_t max_clients() const override;

    void set_valid(bool valid);
    void set_tier(LicenseTier tier);
    void set_allowed_models(std::vector<ModelId> models);
    void set_max_clients(uint32_t max_clients);

private:
    mutable std::mutex mutex_;
    bool valid_;
    LicenseTier tier_;
    std::vector<ModelId> allowed_models_;
    uint32_t max_clients_;
};

}  // namespace model_mesh
