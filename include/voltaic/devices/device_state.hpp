#pragma once

/**
 * @file device_state.hpp
 * @brief Outbound snapshot of a powered device for state replication.
 */

#include "entt/entt.hpp"
#include <optional>
#include <utility>
#include <vector>

#include <voltaic/power/energy_store.hpp>

namespace voltaic {
namespace entities {
class World;
}

namespace devices {

/**
 * @brief Replicated device state. Charge fields are empty without a store.
 */
struct PoweredDeviceState {
    std::optional<float> current_charge;
    std::optional<float> max_charge;
    bool has_store = false;
    power::SizeClass slot_size_class = power::SizeClass::SMALL;
};

PoweredDeviceState get_component_state(const entities::World& world, entt::entity device);

/**
 * @brief Snapshot every dirty device and clear its dirty flag.
 */
std::vector<std::pair<entt::entity, PoweredDeviceState>> collect_dirty_states(entities::World& world);

} // namespace devices
} // namespace voltaic
