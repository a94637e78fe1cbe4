#include <voltaic/devices/device_verbs.hpp>
#include <voltaic/devices/powered_device.hpp>
#include <voltaic/entities/world.hpp>

namespace voltaic {
namespace devices {

bool DeviceVerbs::can_interact(const entities::World& world, entt::entity actor) {
    const auto& registry = world.registry();
    if (actor == entt::null || !registry.valid(actor)) return false;

    const auto* hands = registry.try_get<entities::Hands>(actor);
    return hands && hands->can_interact;
}

VerbData DeviceVerbs::get_eject_verb(const entities::World& world, entt::entity actor, entt::entity device) {
    VerbData data;
    if (!can_interact(world, actor)) {
        data.visibility = VerbVisibility::INVISIBLE;
        return data;
    }

    const auto& powered = world.registry().get<PoweredDevice>(device);
    std::string noun = powered.accepted_kind == power::StoreKind::BATTERY ? "battery" : "cell";
    if (!PoweredDeviceSystem::installed_store(world, device)) {
        data.text = "Eject " + noun + " (" + noun + " missing)";
        data.visibility = VerbVisibility::DISABLED;
    } else {
        data.text = "Eject " + noun;
    }
    return data;
}

VerbData DeviceVerbs::get_toggle_verb(const entities::World& world, entt::entity actor, entt::entity device) {
    VerbData data;
    if (!can_interact(world, actor)) {
        data.visibility = VerbVisibility::INVISIBLE;
        return data;
    }

    const auto& powered = world.registry().get<PoweredDevice>(device);
    data.text = powered.discharging ? "Turn off" : "Turn on";
    if (!powered.discharging && !PoweredDeviceSystem::installed_store(world, device)) {
        data.visibility = VerbVisibility::DISABLED;
    }
    return data;
}

bool DeviceVerbs::activate_eject(entities::World& world, entt::entity actor, entt::entity device) {
    if (get_eject_verb(world, actor, device).visibility != VerbVisibility::VISIBLE) {
        return false;
    }

    entt::entity before = world.occupant(device);
    PoweredDeviceSystem::eject_store(world, device, actor);
    return before != entt::null && world.occupant(device) == entt::null;
}

bool DeviceVerbs::activate_toggle(entities::World& world, entt::entity actor, entt::entity device) {
    if (get_toggle_verb(world, actor, device).visibility != VerbVisibility::VISIBLE) {
        return false;
    }

    bool was_on = world.registry().get<PoweredDevice>(device).discharging;
    PoweredDeviceSystem::toggle_discharging(world, device);
    return world.registry().get<PoweredDevice>(device).discharging != was_on;
}

} // namespace devices
} // namespace voltaic
