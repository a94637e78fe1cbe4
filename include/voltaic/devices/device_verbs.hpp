#pragma once

/**
 * @file device_verbs.hpp
 * @brief Context-menu actions an actor can run on a powered device.
 */

#include "entt/entt.hpp"
#include <string>

namespace voltaic {
namespace entities {
class World;
}

namespace devices {

enum class VerbVisibility { VISIBLE, DISABLED, INVISIBLE };

/**
 * @brief What the menu shows for one verb.
 */
struct VerbData {
    std::string text;
    VerbVisibility visibility = VerbVisibility::VISIBLE;
};

class DeviceVerbs {
public:
    // Stand-in for the host's action blocker: needs hands that aren't restrained
    static bool can_interact(const entities::World& world, entt::entity actor);

    static VerbData get_eject_verb(const entities::World& world, entt::entity actor, entt::entity device);
    static VerbData get_toggle_verb(const entities::World& world, entt::entity actor, entt::entity device);

    /**
     * @brief Run the verb if it is currently visible and enabled.
     * @return true if the store left the slot
     */
    static bool activate_eject(entities::World& world, entt::entity actor, entt::entity device);

    // Returns true if the device changed state
    static bool activate_toggle(entities::World& world, entt::entity actor, entt::entity device);
};

} // namespace devices
} // namespace voltaic
