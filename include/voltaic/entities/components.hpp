#pragma once

#include "raylib.h"
#include "entt/entt.hpp"
#include <string>

namespace voltaic {
namespace entities {

/**
 * @brief Position in the 3D grid.
 */
struct Position {
  float x;
  float y;
  int z;
};

/**
 * @brief Visual representation.
 */
struct Renderable {
  char glyph;
  Color color;
};

/**
 * @brief Display name and the archetype the entity was spawned from.
 */
struct Label {
  std::string name;
  std::string archetype_id;
};

/**
 * @brief Tag component for entities that can be picked up.
 */
struct Item {};

/**
 * @brief Single-occupant container (battery slot, cell slot).
 */
struct ContainerSlot {
  entt::entity occupant = entt::null;
};

/**
 * @brief Back-reference from an occupant to whatever holds it.
 */
struct Contained {
  entt::entity holder = entt::null;
};

/**
 * @brief An actor's hand.
 */
struct Hands {
  entt::entity held = entt::null;
  bool can_interact = true; // false while stunned, cuffed, etc.
};

/**
 * @brief Charge level shown on power cell sprites (0-1).
 */
struct ChargeIndicator {
  float level = 0.0f;
};

} // namespace entities
} // namespace voltaic
