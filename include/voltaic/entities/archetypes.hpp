#pragma once

/**
 * @file archetypes.hpp
 * @brief Named spawn templates (cells, batteries, devices, actors).
 */

#include "raylib.h"
#include <string>
#include <unordered_map>
#include <vector>

#include <voltaic/core/constants.hpp>
#include <voltaic/power/energy_store.hpp>

namespace voltaic {
namespace entities {

/**
 * @brief Energy store settings of an archetype (charges in mWh).
 */
struct StoreSpec {
  float max_charge = constants::DEFAULT_MAX_CHARGE;
  float starting_charge = constants::DEFAULT_STARTING_CHARGE;
  power::SizeClass size = power::SizeClass::SMALL;
  power::StoreKind kind = power::StoreKind::BATTERY;
};

/**
 * @brief Powered device settings of an archetype.
 */
struct DeviceSpec {
  float wattage = constants::DEFAULT_WATTAGE;
  float wattage_standby = constants::DEFAULT_STANDBY_WATTAGE;
  bool removable = false;
  power::SizeClass slot_size = power::SizeClass::SMALL;
  power::StoreKind accepted_kind = power::StoreKind::POWER_CELL;
};

struct Archetype {
  std::string id;
  std::string name;
  char glyph = '?';
  Color color = {200, 200, 200, 255};

  bool has_store = false;
  StoreSpec store;

  bool has_device = false;
  DeviceSpec device;

  bool has_hands = false;
};

/**
 * @brief Lookup table of archetypes by id, seeded with the built-in set.
 */
class ArchetypeCatalog {
public:
  ArchetypeCatalog();

  // Inserts or replaces by id
  void add(const Archetype &archetype);

  bool contains(const std::string &id) const;

  /**
   * @brief Archetype for @p id.
   * @throws std::out_of_range if no archetype has that id.
   */
  const Archetype &get(const std::string &id) const;

  std::vector<std::string> ids() const;

  /**
   * @brief Standard cell archetype that fits a slot of @p size.
   * @throws std::invalid_argument for a size outside Small/Medium/Large.
   */
  static const char *standard_cell_for(power::SizeClass size);

  // Same for either store kind; batteries resolve to the Battery*Standard set
  static const char *standard_store_for(power::StoreKind kind, power::SizeClass size);

private:
  std::unordered_map<std::string, Archetype> archetypes_;

  void add_defaults();
};

} // namespace entities
} // namespace voltaic
