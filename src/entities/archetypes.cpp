#include <voltaic/entities/archetypes.hpp>

#include <algorithm>
#include <stdexcept>

namespace voltaic {
namespace entities {

namespace {

Archetype make_cell(const std::string &id, const std::string &name,
                    power::SizeClass size, float max_charge) {
  Archetype a;
  a.id = id;
  a.name = name;
  a.glyph = '=';
  a.color = {90, 200, 90, 255};
  a.has_store = true;
  a.store.max_charge = max_charge;
  a.store.starting_charge = max_charge; // cells ship full
  a.store.size = size;
  a.store.kind = power::StoreKind::POWER_CELL;
  return a;
}

Archetype make_battery(const std::string &id, const std::string &name,
                       power::SizeClass size, float max_charge, float starting_charge) {
  Archetype a;
  a.id = id;
  a.name = name;
  a.glyph = '-';
  a.color = {200, 160, 60, 255};
  a.has_store = true;
  a.store.max_charge = max_charge;
  a.store.starting_charge = starting_charge;
  a.store.size = size;
  a.store.kind = power::StoreKind::BATTERY;
  return a;
}

Archetype make_device(const std::string &id, const std::string &name, char glyph,
                      Color color, const DeviceSpec &device) {
  Archetype a;
  a.id = id;
  a.name = name;
  a.glyph = glyph;
  a.color = color;
  a.has_device = true;
  a.device = device;
  return a;
}

} // namespace

ArchetypeCatalog::ArchetypeCatalog() { add_defaults(); }

void ArchetypeCatalog::add(const Archetype &archetype) {
  archetypes_[archetype.id] = archetype;
}

bool ArchetypeCatalog::contains(const std::string &id) const {
  return archetypes_.find(id) != archetypes_.end();
}

const Archetype &ArchetypeCatalog::get(const std::string &id) const {
  auto it = archetypes_.find(id);
  if (it == archetypes_.end()) {
    throw std::out_of_range("Unknown archetype: " + id);
  }
  return it->second;
}

std::vector<std::string> ArchetypeCatalog::ids() const {
  std::vector<std::string> result;
  result.reserve(archetypes_.size());
  for (const auto &[id, archetype] : archetypes_) {
    result.push_back(id);
  }
  std::sort(result.begin(), result.end());
  return result;
}

const char *ArchetypeCatalog::standard_cell_for(power::SizeClass size) {
  switch (size) {
  case power::SizeClass::SMALL:
    return "PowerCellSmallStandard";
  case power::SizeClass::MEDIUM:
    return "PowerCellMediumStandard";
  case power::SizeClass::LARGE:
    return "PowerCellLargeStandard";
  }
  throw std::invalid_argument("Unknown slot size class: " +
                              std::to_string(static_cast<int>(size)));
}

const char *ArchetypeCatalog::standard_store_for(power::StoreKind kind,
                                                 power::SizeClass size) {
  if (kind == power::StoreKind::POWER_CELL) {
    return standard_cell_for(size);
  }
  switch (size) {
  case power::SizeClass::SMALL:
    return "BatterySmallStandard";
  case power::SizeClass::MEDIUM:
    return "BatteryMediumStandard";
  case power::SizeClass::LARGE:
    return "BatteryLargeStandard";
  }
  throw std::invalid_argument("Unknown slot size class: " +
                              std::to_string(static_cast<int>(size)));
}

void ArchetypeCatalog::add_defaults() {
  using power::SizeClass;

  // === Power cells ===
  add(make_cell("PowerCellSmallStandard", "small standard power cell", SizeClass::SMALL, 1500.0f));
  add(make_cell("PowerCellMediumStandard", "medium standard power cell", SizeClass::MEDIUM, 2000.0f));
  add(make_cell("PowerCellLargeStandard", "large standard power cell", SizeClass::LARGE, 3000.0f));
  add(make_cell("PowerCellSmallHigh", "small high-capacity power cell", SizeClass::SMALL, 3000.0f));
  add(make_cell("PowerCellLargeHyper", "large hyper-capacity power cell", SizeClass::LARGE, 10000.0f));

  // === Batteries (start part-charged) ===
  add(make_battery("BatterySmallStandard", "small battery", SizeClass::SMALL,
                   constants::DEFAULT_MAX_CHARGE, constants::DEFAULT_STARTING_CHARGE));
  add(make_battery("BatteryMediumStandard", "medium battery", SizeClass::MEDIUM, 2000.0f, 1000.0f));
  add(make_battery("BatteryLargeStandard", "large battery", SizeClass::LARGE, 4000.0f, 2000.0f));

  // === Devices ===
  {
    DeviceSpec spec;
    spec.wattage = 10.0f;
    spec.removable = true;
    spec.slot_size = SizeClass::SMALL;
    add(make_device("Flashlight", "flashlight", 'f', {255, 240, 140, 255}, spec));
  }
  {
    DeviceSpec spec;
    spec.wattage = 40.0f;
    spec.wattage_standby = 1.0f;
    spec.removable = true;
    spec.slot_size = SizeClass::MEDIUM;
    add(make_device("HandDrill", "hand drill", 'd', {230, 120, 60, 255}, spec));
  }
  {
    DeviceSpec spec;
    spec.wattage = 25.0f;
    spec.removable = false;
    spec.slot_size = SizeClass::LARGE;
    add(make_device("EmergencyLamp", "emergency lamp", 'L', {250, 80, 80, 255}, spec));
  }
  {
    DeviceSpec spec;
    spec.wattage = 5.0f;
    spec.removable = true;
    spec.slot_size = SizeClass::SMALL;
    spec.accepted_kind = power::StoreKind::BATTERY;
    add(make_device("Multimeter", "multimeter", 'm', {120, 180, 250, 255}, spec));
  }

  // === Actors ===
  {
    Archetype a;
    a.id = "Engineer";
    a.name = "engineer";
    a.glyph = '@';
    a.color = {140, 200, 255, 255};
    a.has_hands = true;
    add(a);
  }
}

} // namespace entities
} // namespace voltaic
