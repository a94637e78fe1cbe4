#include <voltaic/devices/device_update_scheduler.hpp>
#include <voltaic/entities/world.hpp>

#include <cmath>

namespace voltaic {
namespace devices {

size_t DeviceUpdateScheduler::update(double dt, entities::World& world) {
    if (std::isnan(dt) || dt < 0.0) {
        dt = 0.0;
    }

    auto view = world.registry().view<PoweredDevice>();
    size_t updated = 0;

    for (auto entity : view) {
        PoweredDeviceSystem::update(world, entity, dt);
        ++updated;
    }

    return updated;
}

} // namespace devices
} // namespace voltaic
