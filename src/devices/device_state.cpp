#include <voltaic/devices/device_state.hpp>
#include <voltaic/devices/powered_device.hpp>
#include <voltaic/entities/world.hpp>

namespace voltaic {
namespace devices {

PoweredDeviceState get_component_state(const entities::World& world, entt::entity device) {
    PoweredDeviceState state;
    state.slot_size_class = world.registry().get<PoweredDevice>(device).slot_size_class;

    if (const auto* store = PoweredDeviceSystem::installed_store(world, device)) {
        state.current_charge = store->current_charge();
        state.max_charge = store->max_capacity();
        state.has_store = true;
    }
    return state;
}

std::vector<std::pair<entt::entity, PoweredDeviceState>> collect_dirty_states(entities::World& world) {
    std::vector<std::pair<entt::entity, PoweredDeviceState>> result;

    auto view = world.registry().view<PoweredDevice>();
    for (auto [entity, powered] : view.each()) {
        if (!powered.dirty) continue;
        result.emplace_back(entity, get_component_state(world, entity));
        powered.dirty = false;
    }
    return result;
}

} // namespace devices
} // namespace voltaic
