#include <voltaic/devices/powered_device.hpp>
#include <voltaic/entities/world.hpp>

namespace voltaic {
namespace devices {

using entities::World;

const power::EnergyStore* PoweredDeviceSystem::installed_store(const World& world, entt::entity device) {
    const auto& registry = world.registry();
    const auto* powered = registry.try_get<PoweredDevice>(device);
    if (!powered) return nullptr;

    entt::entity occupant = world.occupant(device);
    if (occupant == entt::null || !registry.valid(occupant)) return nullptr;

    const auto* store = registry.try_get<power::EnergyStore>(occupant);
    if (!store || store->kind() != powered->accepted_kind) return nullptr;
    return store;
}

power::EnergyStore* PoweredDeviceSystem::installed_store(World& world, entt::entity device) {
    return const_cast<power::EnergyStore*>(installed_store(static_cast<const World&>(world), device));
}

bool PoweredDeviceSystem::toggle_discharging(World& world, entt::entity device) {
    const auto& powered = world.registry().get<PoweredDevice>(device);
    return powered.discharging ? stop_discharging(world, device)
                               : start_discharging(world, device);
}

bool PoweredDeviceSystem::stop_discharging(World& world, entt::entity device) {
    set_discharging(world, device, false);
    return true;
}

bool PoweredDeviceSystem::start_discharging(World& world, entt::entity device) {
    const auto& powered = world.registry().get<PoweredDevice>(device);
    if (powered.discharging) {
        return true;
    }

    const power::EnergyStore* store = installed_store(world, device);
    if (!store) {
        return false;
    }

    // Frame time is unknown here, so demand a full second of charge up front
    if (powered.wattage_active > store->current_charge() * constants::MILLI_PER_UNIT) {
        return false;
    }

    set_discharging(world, device, true);
    return true;
}

void PoweredDeviceSystem::update(World& world, entt::entity device, double dt) {
    power::EnergyStore* store = installed_store(world, device);
    if (!store) return;

    auto& powered = world.registry().get<PoweredDevice>(device);
    float required = powered.discharging ? powered.wattage_active : powered.wattage_standby;
    if (required == 0.0f) {
        return;
    }

    if (!store->try_draw_power(required, static_cast<float>(dt))) {
        bool was_on = powered.discharging;
        stop_discharging(world, device);
        if (was_on) {
            world.dispatcher().enqueue(entities::DeviceShutoff{device});
        }
    }
    powered.dirty = true;
}

bool PoweredDeviceSystem::insert_store(World& world, entt::entity device, entt::entity store) {
    auto& registry = world.registry();
    const auto* powered = registry.try_get<PoweredDevice>(device);
    if (!powered || !registry.valid(store)) {
        return false;
    }

    const auto* energy = registry.try_get<power::EnergyStore>(store);
    if (!energy) {
        return false;
    }
    if (energy->kind() != powered->accepted_kind ||
        energy->size_class() != powered->slot_size_class) {
        return false;
    }

    if (!world.insert(device, store)) {
        return false;
    }

    registry.get<PoweredDevice>(device).dirty = true;
    world.dispatcher().enqueue(entities::StoreInserted{device, store});
    return true;
}

void PoweredDeviceSystem::eject_store(World& world, entt::entity device, entt::entity actor, bool force) {
    auto& registry = world.registry();
    if (!installed_store(world, device)) {
        return;
    }

    if (!force && !registry.get<PoweredDevice>(device).removable) {
        return;
    }

    entt::entity store = world.remove(device);
    if (store == entt::null) {
        return;
    }
    registry.get<PoweredDevice>(device).dirty = true;

    entt::entity receiver = entt::null;
    if (actor != entt::null && registry.valid(actor) && registry.all_of<entities::Hands>(actor)) {
        if (world.put_in_hand(actor, store)) {
            receiver = actor;
        } else if (const auto* actor_pos = registry.try_get<entities::Position>(actor)) {
            // Hands full: drop it at the actor's feet
            entities::Position drop = *actor_pos;
            world.place_at(store, drop);
        }
    } else if (const auto* device_pos = registry.try_get<entities::Position>(device)) {
        entities::Position drop = *device_pos;
        world.place_at(store, drop);
    }

    world.dispatcher().enqueue(entities::StoreEjected{device, store, receiver});
}

void PoweredDeviceSystem::map_init(World& world, entt::entity device) {
    if (world.occupant(device) != entt::null) {
        return;
    }

    const auto& powered = world.registry().get<PoweredDevice>(device);
    const char* archetype_id = entities::ArchetypeCatalog::standard_store_for(
        powered.accepted_kind, powered.slot_size_class);

    entities::Position at{0.0f, 0.0f, 0};
    if (const auto* pos = world.registry().try_get<entities::Position>(device)) {
        at = *pos;
    }

    entt::entity store = world.spawn(archetype_id, at.x, at.y, at.z);
    if (!insert_store(world, device, store)) {
        // Catalog entry doesn't fit the slot it was picked for
        world.destroy(store);
    }
}

void PoweredDeviceSystem::set_discharging(World& world, entt::entity device, bool on) {
    auto& powered = world.registry().get<PoweredDevice>(device);
    if (powered.discharging != on) {
        powered.discharging = on;
        powered.dirty = true;
    }
}

} // namespace devices
} // namespace voltaic
