#include <voltaic/entities/world.hpp>
#include <voltaic/devices/powered_device.hpp>
#include <voltaic/power/energy_store.hpp>

namespace voltaic {
namespace entities {

void World::init(const WorldConfig &config) {
  registry_.clear();
  dispatcher_.clear();
  spatial_index_.init(config.width, config.height);
}

entt::entity World::spawn(const std::string &archetype_id, float x, float y, int z) {
  // Look up first so an unknown id leaves no half-built entity behind
  const Archetype &archetype = catalog_.get(archetype_id);

  auto entity = registry_.create();
  registry_.emplace<Position>(entity, x, y, z);
  registry_.emplace<Renderable>(entity, archetype.glyph, archetype.color);
  registry_.emplace<Label>(entity, archetype.name, archetype.id);

  if (archetype.has_store) {
    const StoreSpec &spec = archetype.store;
    float starting = spec.kind == power::StoreKind::POWER_CELL ? spec.max_charge
                                                               : spec.starting_charge;
    registry_.emplace<power::EnergyStore>(entity, spec.max_charge, starting, spec.size, spec.kind);
    registry_.emplace<Item>(entity);
    if (spec.kind == power::StoreKind::POWER_CELL) {
      registry_.emplace<ChargeIndicator>(entity);
      bind_charge_listener(entity);
    }
  }

  if (archetype.has_device) {
    const DeviceSpec &spec = archetype.device;
    devices::PoweredDevice device;
    device.wattage_active = spec.wattage;
    device.wattage_standby = spec.wattage_standby;
    device.removable = spec.removable;
    device.slot_size_class = spec.slot_size;
    device.accepted_kind = spec.accepted_kind;
    device.dirty = true;
    registry_.emplace<devices::PoweredDevice>(entity, device);
    registry_.emplace<ContainerSlot>(entity);
    registry_.emplace<Item>(entity);
  }

  if (archetype.has_hands) {
    registry_.emplace<Hands>(entity);
  }

  return entity;
}

void World::destroy(entt::entity entity) {
  if (!registry_.valid(entity)) return;

  if (auto *slot = registry_.try_get<ContainerSlot>(entity)) {
    entt::entity inner = slot->occupant;
    slot->occupant = entt::null;
    if (registry_.valid(inner)) {
      registry_.remove<Contained>(inner);
      destroy(inner);
    }
  }

  if (auto *hands = registry_.try_get<Hands>(entity)) {
    entt::entity held = hands->held;
    const auto *pos = registry_.try_get<Position>(entity);
    if (registry_.valid(held) && pos) {
      Position drop = *pos;
      place_at(held, drop);
    }
  }

  detach(entity);
  registry_.destroy(entity);
}

bool World::insert(entt::entity container, entt::entity item) {
  if (container == item || !registry_.valid(container) || !registry_.valid(item)) {
    return false;
  }

  auto *slot = registry_.try_get<ContainerSlot>(container);
  if (!slot || slot->occupant != entt::null) {
    return false;
  }

  detach(item);
  slot->occupant = item;
  registry_.emplace_or_replace<Contained>(item, container);
  if (const auto *pos = registry_.try_get<Position>(container)) {
    registry_.emplace_or_replace<Position>(item, *pos);
  }
  return true;
}

entt::entity World::remove(entt::entity container) {
  auto *slot = registry_.try_get<ContainerSlot>(container);
  if (!slot || slot->occupant == entt::null) {
    return entt::null;
  }

  entt::entity item = slot->occupant;
  slot->occupant = entt::null;
  if (registry_.valid(item)) {
    registry_.remove<Contained>(item);
  }
  return item;
}

entt::entity World::occupant(entt::entity container) const {
  const auto *slot = registry_.try_get<ContainerSlot>(container);
  return slot ? slot->occupant : entt::null;
}

bool World::put_in_hand(entt::entity actor, entt::entity item) {
  if (actor == item || !registry_.valid(actor) || !registry_.valid(item)) {
    return false;
  }
  if (!registry_.all_of<Item>(item)) {
    return false;
  }

  auto *hands = registry_.try_get<Hands>(actor);
  if (!hands || hands->held != entt::null) {
    return false;
  }

  detach(item);
  hands->held = item;
  registry_.emplace_or_replace<Contained>(item, actor);
  if (const auto *pos = registry_.try_get<Position>(actor)) {
    registry_.emplace_or_replace<Position>(item, *pos);
  }
  return true;
}

void World::place_at(entt::entity entity, const Position &position) {
  if (!registry_.valid(entity)) return;
  detach(entity);
  registry_.emplace_or_replace<Position>(entity, position);
}

void World::update(double dt) {
  (void)dt;
  update_spatial_index();
  dispatcher_.update();
}

entt::entity World::get_entity_at(float target_x, float target_y, int target_z, float radius) const {
  // Fast lookup using spatial index
  int gx = static_cast<int>(target_x);
  int gy = static_cast<int>(target_y);

  const auto &candidates = spatial_index_.get_entities_at(gx, gy);
  if (candidates.empty()) return entt::null;

  // If multiple entities in cell, find closest to exact click
  entt::entity found = entt::null;
  float min_dist_sq = radius * radius;

  for (auto entity : candidates) {
    if (!registry_.valid(entity)) continue;

    const auto *pos = registry_.try_get<Position>(entity);
    if (!pos || pos->z != target_z) continue;

    float dx = pos->x - target_x;
    float dy = pos->y - target_y;
    float dist_sq = dx * dx + dy * dy;

    if (dist_sq <= min_dist_sq) {
      min_dist_sq = dist_sq;
      found = entity;
    }
  }

  return found;
}

std::vector<entt::entity> World::get_entities_in_radius(float x, float y, int z, float radius) const {
  std::vector<entt::entity> result;

  // Broad phase: cells overlapping the circle's bounding box
  std::vector<entt::entity> candidates;
  candidates.reserve(16);
  spatial_index_.query_range(static_cast<int>(x - radius), static_cast<int>(y - radius),
                             static_cast<int>(x + radius), static_cast<int>(y + radius),
                             candidates);

  // Narrow phase: exact distance check
  float r_sq = radius * radius;
  for (auto entity : candidates) {
    if (!registry_.valid(entity)) continue;

    const auto *pos = registry_.try_get<Position>(entity);
    if (!pos || pos->z != z) continue;

    float dx = pos->x - x;
    float dy = pos->y - y;
    if (dx * dx + dy * dy <= r_sq) {
      result.push_back(entity);
    }
  }

  return result;
}

size_t World::count_devices() const {
  return registry_.view<const devices::PoweredDevice>().size();
}

void World::bind_charge_listener(entt::entity entity) {
  auto &store = registry_.get<power::EnergyStore>(entity);
  registry_.get<ChargeIndicator>(entity).level = store.charge_ratio();

  store.set_charge_listener([this, entity](const power::EnergyStore &changed) {
    if (auto *indicator = registry_.try_get<ChargeIndicator>(entity)) {
      indicator->level = changed.charge_ratio();
    }
  });
}

void World::detach(entt::entity entity) {
  auto *contained = registry_.try_get<Contained>(entity);
  if (!contained) return;

  entt::entity holder = contained->holder;
  if (registry_.valid(holder)) {
    if (auto *slot = registry_.try_get<ContainerSlot>(holder); slot && slot->occupant == entity) {
      slot->occupant = entt::null;
    }
    if (auto *hands = registry_.try_get<Hands>(holder); hands && hands->held == entity) {
      hands->held = entt::null;
    }
  }
  registry_.remove<Contained>(entity);
}

void World::update_spatial_index() {
  spatial_index_.clear();
  auto view = registry_.view<const Position>(entt::exclude<Contained>);
  for (auto [entity, pos] : view.each()) {
    spatial_index_.insert(entity, static_cast<int>(pos.x), static_cast<int>(pos.y));
  }
}

} // namespace entities
} // namespace voltaic
