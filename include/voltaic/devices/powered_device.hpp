#pragma once

/**
 * @file powered_device.hpp
 * @brief Devices that run off a removable battery or power cell.
 *
 * One component covers both battery- and cell-powered tools; the store kind
 * a slot accepts is configuration, not a separate type.
 */

#include "entt/entt.hpp"
#include <voltaic/core/constants.hpp>
#include <voltaic/power/energy_store.hpp>

namespace voltaic {
namespace entities {
class World;
}

namespace devices {

/**
 * @brief Device state. The store itself sits in the entity's ContainerSlot.
 */
struct PoweredDevice {
  float wattage_active = constants::DEFAULT_WATTAGE;   // W while on
  float wattage_standby = constants::DEFAULT_STANDBY_WATTAGE; // W while off
  bool discharging = false;
  bool removable = false;
  power::SizeClass slot_size_class = power::SizeClass::SMALL;
  power::StoreKind accepted_kind = power::StoreKind::POWER_CELL;
  bool dirty = false; // changed since the last replication snapshot
};

/**
 * @brief Operations on PoweredDevice entities.
 *
 * Every call takes the World and a device entity carrying PoweredDevice and
 * ContainerSlot. Gameplay failures are reported through the return value.
 */
class PoweredDeviceSystem {
public:
    /**
     * @brief The store in the device's slot, or nullptr.
     *
     * An occupant without an EnergyStore, or of the wrong store kind, counts
     * as no store.
     */
    static power::EnergyStore* installed_store(entities::World& world, entt::entity device);
    static const power::EnergyStore* installed_store(const entities::World& world, entt::entity device);

    static bool toggle_discharging(entities::World& world, entt::entity device);

    /**
     * @brief Turn the device on.
     *
     * Requires a store holding at least one second of active draw
     * (wattage_active <= charge * 1000).
     * @return true if the device is on afterwards.
     */
    static bool start_discharging(entities::World& world, entt::entity device);

    // Always succeeds
    static bool stop_discharging(entities::World& world, entt::entity device);

    /**
     * @brief Draw one tick's worth of power.
     * @param dt Delta time in seconds
     *
     * Turns the device off if the store can't cover the draw.
     */
    static void update(entities::World& world, entt::entity device, double dt);

    /**
     * @brief Slot a store into the device.
     *
     * Rejects an occupied slot, a non-store entity, and a store whose kind or
     * size class doesn't match the slot.
     */
    static bool insert_store(entities::World& world, entt::entity device, entt::entity store);

    /**
     * @brief Pop the store out.
     * @param actor Who asked; receives the store in hand if possible
     * @param force Ignore the removable flag
     */
    static void eject_store(entities::World& world, entt::entity device,
                            entt::entity actor = entt::null, bool force = false);

    /**
     * @brief Map-init hook: fill an empty slot with the standard store.
     * @throws std::invalid_argument if the slot size class is invalid.
     */
    static void map_init(entities::World& world, entt::entity device);

private:
    static void set_discharging(entities::World& world, entt::entity device, bool on);
};

} // namespace devices
} // namespace voltaic
