#pragma once

#include "entt/entt.hpp"
#include <voltaic/entities/archetypes.hpp>
#include <voltaic/entities/components.hpp>
#include <voltaic/entities/events.hpp>
#include <voltaic/entities/spatial_index.hpp>
#include <string>
#include <vector>

namespace voltaic {
namespace entities {

/**
 * @brief World dimensions used for the spatial index.
 */
struct WorldConfig {
  int width = 200;
  int height = 200;
};

/**
 * @brief Owns the ECS registry and stands in for the host engine.
 *
 * Provides archetype spawning, the single-slot container and hand transfers
 * that devices rely on, spatial lookups and the event dispatcher. Systems
 * receive it by reference; nothing reaches for a global.
 */
class World {
public:
  World() = default;
  ~World() = default;

  // Listeners bound to stores capture this World
  World(const World &) = delete;
  World &operator=(const World &) = delete;

  // Lifecycle
  void init(const WorldConfig &config = WorldConfig{});

  /**
   * @brief Create an entity from a named archetype.
   * @throws std::out_of_range if the archetype id is unknown.
   */
  entt::entity spawn(const std::string &archetype_id, float x, float y, int z);

  // Destroys the entity and whatever sits in its slot; a held item is dropped
  void destroy(entt::entity entity);

  // === Containers ===

  /**
   * @brief Put @p item into the slot of @p container.
   *
   * Fails if the container has no slot, the slot is taken, or the item is
   * the container itself. The item is detached from any previous holder.
   */
  bool insert(entt::entity container, entt::entity item);

  // Empties the slot of @p container; returns the former occupant or null
  entt::entity remove(entt::entity container);

  entt::entity occupant(entt::entity container) const;

  // Fails if the actor has no free hand or the item can't be carried
  bool put_in_hand(entt::entity actor, entt::entity item);

  // Detaches the entity from any holder and drops it at the given position
  void place_at(entt::entity entity, const Position &position);

  // Systems
  void update(double dt);

  // Queries
  entt::entity get_entity_at(float x, float y, int z, float radius = 0.5f) const;

  // Returns all placed entities within the given radius of the point.
  std::vector<entt::entity> get_entities_in_radius(float x, float y, int z, float radius) const;

  // Accessors
  entt::registry &registry() { return registry_; }
  const entt::registry &registry() const { return registry_; }
  entt::dispatcher &dispatcher() { return dispatcher_; }
  ArchetypeCatalog &catalog() { return catalog_; }
  const ArchetypeCatalog &catalog() const { return catalog_; }

  size_t count_devices() const;

private:
  entt::registry registry_;
  entt::dispatcher dispatcher_;
  ArchetypeCatalog catalog_;
  SpatialIndex spatial_index_;

  void bind_charge_listener(entt::entity entity);
  void detach(entt::entity entity);
  void update_spatial_index();
};

} // namespace entities
} // namespace voltaic
