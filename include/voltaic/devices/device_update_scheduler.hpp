#pragma once

#include "entt/entt.hpp"
#include <voltaic/devices/powered_device.hpp>

namespace voltaic {
namespace entities {
class World;
}

namespace devices {

/**
 * @brief Per-frame driver for every PoweredDevice.
 *
 * Runs each live device's update once per call, in registry order. Updates
 * are synchronous and never add or remove entities, so the view stays valid
 * for the whole pass.
 */
class DeviceUpdateScheduler {
public:
    /**
     * @brief Tick all devices.
     * @param dt Delta time in seconds (negative values are treated as zero)
     * @param world The world owning the devices
     * @return Number of devices updated
     */
    static size_t update(double dt, entities::World& world);
};

} // namespace devices
} // namespace voltaic
