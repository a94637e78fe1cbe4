#pragma once

/**
 * @file events.hpp
 * @brief Events queued on the World dispatcher.
 *
 * Systems never print; they enqueue one of these and the application drains
 * the queue once per frame (World::update) into its event log.
 */

#include "entt/entt.hpp"

namespace voltaic {
namespace entities {

// Device ran its store dry mid-tick and switched itself off
struct DeviceShutoff {
  entt::entity device;
};

struct StoreInserted {
  entt::entity device;
  entt::entity store;
};

// receiver is the actor whose hand got the store, or null when dropped
struct StoreEjected {
  entt::entity device;
  entt::entity store;
  entt::entity receiver;
};

} // namespace entities
} // namespace voltaic
