/**
 * @file license_gate.cpp
 * @brief LicenseGate helpers and StaticLicenseGate.
 */

#include "core/license_gate.hpp"

#include <algorithm>

namespace model_mesh {

bool LicenseGate::allows_model(const ModelId& model_id) const {
    if (!is_valid()) return false;
    auto models = allowed_models();
    return std::any_of(models.begin(), models.end(), [&](const ModelId& m) {
        return m == ANY_MODEL || m == model_id;
    });
}

StaticLicenseGate::StaticLicenseGate(bool valid, LicenseTier tier,
                                     std::vector<ModelId> allowed_models,
                                     uint32_t max_clients)
    : valid_(valid)
    , tier_(tier)
    , allowed_models_(std::move(allowed_models))
    , max_clients_(max_clients) {}

bool StaticLicenseGate::is_valid() const {
    std::lock_guard lock(mutex_);
    return valid_;
}

LicenseTier StaticLicenseGate::tier() const {
    std::lock_guard lock(mutex_);
    return tier_;
}

std::vector<ModelId> StaticLicenseGate::allowed_models() const {
    std::lock_guard lock(mutex_);
    return allowed_models_;
}

uint32_t StaticLicenseGate::max_clients() const {
    std::lock_guard lock(mutex_);
    return max_clients_;
}

void StaticLicenseGate::set_valid(bool valid) {
    std::lock_guard lock(mutex_);
    valid_ = valid;
}

void StaticLicenseGate::set_tier(LicenseTier tier) {
    std::lock_guard lock(mutex_);
    tier_ = tier;
}

void StaticLicenseGate::set_allowed_models(std::vector<ModelId> models) {
    std::lock_guard lock(mutex_);
    allowed_models_ = std::move(models);
}

void StaticLicenseGate::set_max_clients(uint32_t max_clients) {
    std::lock_guard lock(mutex_);
    max_clients_ = max_clients;
}

}  // namespace model_mesh
