/**
 * @file test_devices.cpp
 * @brief Tests for powered devices, the scheduler, verbs and the World.
 */

#undef NDEBUG
#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

#include <voltaic/devices/device_state.hpp>
#include <voltaic/devices/device_update_scheduler.hpp>
#include <voltaic/devices/device_verbs.hpp>
#include <voltaic/devices/powered_device.hpp>
#include <voltaic/entities/world.hpp>

using namespace voltaic;
using devices::PoweredDevice;
using devices::PoweredDeviceSystem;

static bool near(float a, float b, float eps = 1e-3f) { return std::abs(a - b) < eps; }

namespace {

struct EventRecorder {
  std::vector<entities::DeviceShutoff> shutoffs;
  std::vector<entities::StoreInserted> inserted;
  std::vector<entities::StoreEjected> ejected;

  void on_shutoff(const entities::DeviceShutoff &e) { shutoffs.push_back(e); }
  void on_inserted(const entities::StoreInserted &e) { inserted.push_back(e); }
  void on_ejected(const entities::StoreEjected &e) { ejected.push_back(e); }

  void connect(entities::World &world) {
    auto &d = world.dispatcher();
    d.sink<entities::DeviceShutoff>().connect<&EventRecorder::on_shutoff>(*this);
    d.sink<entities::StoreInserted>().connect<&EventRecorder::on_inserted>(*this);
    d.sink<entities::StoreEjected>().connect<&EventRecorder::on_ejected>(*this);
  }
};

// Device of the given archetype with its standard store installed
entt::entity spawn_loaded(entities::World &world, const char *id, float x = 5.0f, float y = 5.0f) {
  entt::entity device = world.spawn(id, x, y, 0);
  PoweredDeviceSystem::map_init(world, device);
  return device;
}

} // namespace

void test_map_init() {
  std::cout << "Testing map init..." << std::endl;

  entities::World world;
  world.init();

  entt::entity flashlight = spawn_loaded(world, "Flashlight");
  entt::entity cell = world.occupant(flashlight);
  assert(cell != entt::null);
  assert(world.registry().get<entities::Label>(cell).archetype_id == "PowerCellSmallStandard");
  assert(world.registry().get<entities::Contained>(cell).holder == flashlight);

  const auto *store = PoweredDeviceSystem::installed_store(world, flashlight);
  assert(store && store->current_charge() == 1500.0f);
  assert(store->status() == power::StoreStatus::FULL);

  // Second call leaves the existing store alone
  PoweredDeviceSystem::map_init(world, flashlight);
  assert(world.occupant(flashlight) == cell);

  entt::entity lamp = spawn_loaded(world, "EmergencyLamp");
  assert(world.registry().get<entities::Label>(world.occupant(lamp)).archetype_id ==
         "PowerCellLargeStandard");

  // Battery devices get a battery, spawned part-charged
  entt::entity meter = spawn_loaded(world, "Multimeter");
  const auto *battery = PoweredDeviceSystem::installed_store(world, meter);
  assert(battery && battery->kind() == power::StoreKind::BATTERY);
  assert(battery->current_charge() == 500.0f);

  std::cout << "  Map init: PASS" << std::endl;
}

void test_start_threshold() {
  std::cout << "Testing start threshold..." << std::endl;

  entities::World world;
  world.init();

  entt::entity device = spawn_loaded(world, "Flashlight");
  auto &powered = world.registry().get<PoweredDevice>(device);
  powered.wattage_active = 500.0f;
  auto *store = PoweredDeviceSystem::installed_store(world, device);

  // Needs at least one second of draw: 500 W -> 0.5 mWh
  store->set_current_charge(0.25f);
  assert(!PoweredDeviceSystem::start_discharging(world, device));
  assert(!powered.discharging);

  store->set_current_charge(0.5f);
  assert(PoweredDeviceSystem::start_discharging(world, device));
  assert(powered.discharging);

  // Already on: idempotent even if the charge has since dropped
  store->set_current_charge(0.0f);
  assert(PoweredDeviceSystem::start_discharging(world, device));

  assert(PoweredDeviceSystem::stop_discharging(world, device));
  assert(PoweredDeviceSystem::stop_discharging(world, device));
  assert(!powered.discharging);

  // No store, no start
  entt::entity empty = world.spawn("Flashlight", 1.0f, 1.0f, 0);
  assert(!PoweredDeviceSystem::start_discharging(world, empty));
  assert(!PoweredDeviceSystem::toggle_discharging(world, empty));

  std::cout << "  Start threshold: PASS" << std::endl;
}

void test_update_and_shutoff() {
  std::cout << "Testing update and auto-shutoff..." << std::endl;

  entities::World world;
  world.init();
  EventRecorder recorder;
  recorder.connect(world);

  entt::entity device = spawn_loaded(world, "Flashlight");
  auto *store = PoweredDeviceSystem::installed_store(world, device);
  assert(PoweredDeviceSystem::toggle_discharging(world, device));

  // 10 W for 1 s = 10000/3600 mWh
  PoweredDeviceSystem::update(world, device, 1.0);
  assert(near(store->current_charge(), 1500.0f - 10000.0f / 3600.0f));
  assert(world.registry().get<PoweredDevice>(device).discharging);

  // Charge indicator follows the cell
  const auto &indicator = world.registry().get<entities::ChargeIndicator>(world.occupant(device));
  assert(near(indicator.level, store->charge_ratio()));

  // Not enough left for the next tick: shuts off, charge untouched
  store->set_current_charge(1.0f);
  PoweredDeviceSystem::update(world, device, 1.0);
  assert(!world.registry().get<PoweredDevice>(device).discharging);
  assert(store->current_charge() == 1.0f);

  world.update(0.0);
  assert(recorder.shutoffs.size() == 1);
  assert(recorder.shutoffs[0].device == device);

  // Off with zero standby: nothing drawn
  PoweredDeviceSystem::update(world, device, 100.0);
  assert(store->current_charge() == 1.0f);

  // Standby draw while off
  entt::entity drill = spawn_loaded(world, "HandDrill");
  auto *drill_store = PoweredDeviceSystem::installed_store(world, drill);
  PoweredDeviceSystem::update(world, drill, 3.6);
  assert(near(drill_store->current_charge(), 1999.0f));

  std::cout << "  Update and auto-shutoff: PASS" << std::endl;
}

void test_eject() {
  std::cout << "Testing eject..." << std::endl;

  entities::World world;
  world.init();
  EventRecorder recorder;
  recorder.connect(world);

  entt::entity engineer = world.spawn("Engineer", 2.0f, 3.0f, 0);

  // Fixed store stays put unless forced
  entt::entity lamp = spawn_loaded(world, "EmergencyLamp", 10.0f, 10.0f);
  entt::entity lamp_cell = world.occupant(lamp);
  float lamp_charge = world.registry().get<power::EnergyStore>(lamp_cell).current_charge();
  PoweredDeviceSystem::eject_store(world, lamp, engineer);
  assert(world.occupant(lamp) == lamp_cell);
  assert(world.registry().get<power::EnergyStore>(lamp_cell).current_charge() == lamp_charge);
  assert(world.registry().get<entities::Hands>(engineer).held == entt::null);

  PoweredDeviceSystem::eject_store(world, lamp, entt::null, true);
  assert(world.occupant(lamp) == entt::null);
  const auto &dropped = world.registry().get<entities::Position>(lamp_cell);
  assert(dropped.x == 10.0f && dropped.y == 10.0f);
  assert(!world.registry().all_of<entities::Contained>(lamp_cell));

  // Into the actor's free hand
  entt::entity light = spawn_loaded(world, "Flashlight", 4.0f, 4.0f);
  entt::entity cell = world.occupant(light);
  PoweredDeviceSystem::eject_store(world, light, engineer);
  assert(world.occupant(light) == entt::null);
  assert(world.registry().get<entities::Hands>(engineer).held == cell);
  assert(world.registry().get<entities::Contained>(cell).holder == engineer);

  // Hands full: dropped at the actor's feet
  entt::entity light2 = spawn_loaded(world, "Flashlight", 6.0f, 6.0f);
  entt::entity cell2 = world.occupant(light2);
  PoweredDeviceSystem::eject_store(world, light2, engineer);
  assert(world.occupant(light2) == entt::null);
  assert(world.registry().get<entities::Hands>(engineer).held == cell);
  const auto &at_feet = world.registry().get<entities::Position>(cell2);
  assert(at_feet.x == 2.0f && at_feet.y == 3.0f);

  // Empty slot: no-op, no event
  PoweredDeviceSystem::eject_store(world, light2, engineer);

  world.update(0.0);
  assert(recorder.ejected.size() == 3);
  assert(recorder.ejected[0].receiver == entt::null);
  assert(recorder.ejected[1].receiver == engineer);
  assert(recorder.ejected[2].receiver == entt::null);

  // Ejecting a running device leaves the flag alone; the next tick is a no-op
  entt::entity light3 = spawn_loaded(world, "Flashlight", 8.0f, 8.0f);
  assert(PoweredDeviceSystem::start_discharging(world, light3));
  PoweredDeviceSystem::eject_store(world, light3);
  PoweredDeviceSystem::update(world, light3, 1.0);
  assert(PoweredDeviceSystem::installed_store(world, light3) == nullptr);

  std::cout << "  Eject: PASS" << std::endl;
}

void test_insert() {
  std::cout << "Testing insert..." << std::endl;

  entities::World world;
  world.init();
  EventRecorder recorder;
  recorder.connect(world);

  entt::entity light = world.spawn("Flashlight", 1.0f, 1.0f, 0);
  entt::entity medium = world.spawn("PowerCellMediumStandard", 2.0f, 2.0f, 0);
  entt::entity battery = world.spawn("BatterySmallStandard", 2.0f, 2.0f, 0);
  entt::entity small = world.spawn("PowerCellSmallHigh", 2.0f, 2.0f, 0);
  entt::entity other = world.spawn("PowerCellSmallStandard", 2.0f, 2.0f, 0);
  entt::entity engineer = world.spawn("Engineer", 3.0f, 3.0f, 0);

  assert(!PoweredDeviceSystem::insert_store(world, light, medium));   // wrong size
  assert(!PoweredDeviceSystem::insert_store(world, light, battery));  // wrong kind
  assert(!PoweredDeviceSystem::insert_store(world, light, engineer)); // not a store
  assert(world.occupant(light) == entt::null);

  // From the hand straight into the slot
  assert(world.put_in_hand(engineer, small));
  assert(PoweredDeviceSystem::insert_store(world, light, small));
  assert(world.occupant(light) == small);
  assert(world.registry().get<entities::Hands>(engineer).held == entt::null);
  assert(world.registry().get<PoweredDevice>(light).dirty);

  // Occupied
  assert(!PoweredDeviceSystem::insert_store(world, light, other));

  // Both lookups resolve the same slot the same way
  const entities::World &view_only = world;
  assert(PoweredDeviceSystem::installed_store(world, light) ==
         PoweredDeviceSystem::installed_store(view_only, light));
  assert(PoweredDeviceSystem::installed_store(world, light) ==
         &world.registry().get<power::EnergyStore>(small));
  // Wrong-kind occupant placed directly by the host counts as no store
  entt::entity meter = world.spawn("Multimeter", 4.0f, 4.0f, 0);
  assert(world.insert(meter, other));
  assert(PoweredDeviceSystem::installed_store(world, meter) == nullptr);
  assert(PoweredDeviceSystem::installed_store(view_only, meter) == nullptr);

  world.update(0.0);
  assert(recorder.inserted.size() == 1);
  assert(recorder.inserted[0].store == small);

  std::cout << "  Insert: PASS" << std::endl;
}

void test_scheduler() {
  std::cout << "Testing scheduler..." << std::endl;

  entities::World world;
  world.init();

  std::vector<entt::entity> lights;
  for (int i = 0; i < 5; ++i) {
    lights.push_back(spawn_loaded(world, "Flashlight", static_cast<float>(i), 0.0f));
    PoweredDeviceSystem::start_discharging(world, lights.back());
  }
  world.spawn("Flashlight", 9.0f, 9.0f, 0); // empty, still counted

  assert(devices::DeviceUpdateScheduler::update(1.0, world) == 6);
  for (auto light : lights) {
    const auto *store = PoweredDeviceSystem::installed_store(world, light);
    assert(near(store->current_charge(), 1500.0f - 10000.0f / 3600.0f));
  }

  // Negative and NaN deltas act as zero
  float before = PoweredDeviceSystem::installed_store(world, lights[0])->current_charge();
  devices::DeviceUpdateScheduler::update(-5.0, world);
  assert(PoweredDeviceSystem::installed_store(world, lights[0])->current_charge() == before);
  devices::DeviceUpdateScheduler::update(std::nan(""), world);
  const auto *after = PoweredDeviceSystem::installed_store(world, lights[0]);
  assert(after->current_charge() == before);
  assert(!std::isnan(after->current_charge()));
  assert(world.registry().get<PoweredDevice>(lights[0]).discharging);

  std::cout << "  Scheduler: PASS" << std::endl;
}

void test_verbs() {
  std::cout << "Testing verbs..." << std::endl;

  using devices::DeviceVerbs;
  using devices::VerbVisibility;

  entities::World world;
  world.init();

  entt::entity engineer = world.spawn("Engineer", 0.0f, 0.0f, 0);
  entt::entity light = spawn_loaded(world, "Flashlight");
  entt::entity meter = spawn_loaded(world, "Multimeter");

  auto eject = DeviceVerbs::get_eject_verb(world, engineer, light);
  assert(eject.visibility == VerbVisibility::VISIBLE);
  assert(eject.text == "Eject cell");
  assert(DeviceVerbs::get_eject_verb(world, engineer, meter).text == "Eject battery");

  auto toggle = DeviceVerbs::get_toggle_verb(world, engineer, light);
  assert(toggle.visibility == VerbVisibility::VISIBLE && toggle.text == "Turn on");
  assert(DeviceVerbs::activate_toggle(world, engineer, light));
  assert(DeviceVerbs::get_toggle_verb(world, engineer, light).text == "Turn off");

  assert(DeviceVerbs::activate_eject(world, engineer, light));
  eject = DeviceVerbs::get_eject_verb(world, engineer, light);
  assert(eject.visibility == VerbVisibility::DISABLED);
  assert(eject.text == "Eject cell (cell missing)");
  assert(!DeviceVerbs::activate_eject(world, engineer, light));

  // Turning off works without a store, turning back on doesn't
  assert(DeviceVerbs::activate_toggle(world, engineer, light));
  assert(DeviceVerbs::get_toggle_verb(world, engineer, light).visibility == VerbVisibility::DISABLED);
  assert(!DeviceVerbs::activate_toggle(world, engineer, light));

  // Restrained actor sees nothing
  world.registry().get<entities::Hands>(engineer).can_interact = false;
  assert(DeviceVerbs::get_eject_verb(world, engineer, meter).visibility == VerbVisibility::INVISIBLE);
  assert(DeviceVerbs::get_toggle_verb(world, engineer, meter).visibility == VerbVisibility::INVISIBLE);
  assert(!DeviceVerbs::activate_eject(world, engineer, meter));

  // Actors without hands can't interact either
  assert(!DeviceVerbs::can_interact(world, light));
  assert(!DeviceVerbs::can_interact(world, entt::null));

  std::cout << "  Verbs: PASS" << std::endl;
}

void test_replication() {
  std::cout << "Testing replication..." << std::endl;

  entities::World world;
  world.init();

  entt::entity empty = world.spawn("Flashlight", 0.0f, 0.0f, 0);
  auto state = devices::get_component_state(world, empty);
  assert(!state.has_store);
  assert(!state.current_charge && !state.max_charge);
  assert(state.slot_size_class == power::SizeClass::SMALL);

  entt::entity drill = spawn_loaded(world, "HandDrill");
  state = devices::get_component_state(world, drill);
  assert(state.has_store);
  assert(*state.current_charge == 2000.0f && *state.max_charge == 2000.0f);
  assert(state.slot_size_class == power::SizeClass::MEDIUM);

  // Fresh spawns are dirty; collecting clears them
  auto dirty = devices::collect_dirty_states(world);
  assert(dirty.size() == 2);
  assert(devices::collect_dirty_states(world).empty());

  // Zero-draw tick doesn't dirty, a real draw does
  devices::DeviceUpdateScheduler::update(1.0, world);
  dirty = devices::collect_dirty_states(world);
  assert(dirty.size() == 1 && dirty[0].first == drill);

  std::cout << "  Replication: PASS" << std::endl;
}

void test_world() {
  std::cout << "Testing world..." << std::endl;

  entities::World world;
  world.init();

  entt::entity light = spawn_loaded(world, "Flashlight", 10.2f, 10.3f);
  entt::entity cell = world.occupant(light);
  entt::entity engineer = world.spawn("Engineer", 12.0f, 10.0f, 0);
  world.update(0.0);

  assert(world.get_entity_at(10.5f, 10.5f, 0, 1.5f) == light);
  assert(world.get_entity_at(10.5f, 10.5f, 1, 1.5f) == entt::null);

  // Slotted cell isn't on the floor
  auto nearby = world.get_entities_in_radius(11.0f, 10.0f, 0, 3.0f);
  assert(nearby.size() == 2);
  for (auto e : nearby) assert(e != cell);

  assert(world.count_devices() == 1);

  bool threw = false;
  try {
    world.spawn("NoSuchThing", 0.0f, 0.0f, 0);
  } catch (const std::out_of_range &) {
    threw = true;
  }
  assert(threw);

  // Self-insert and non-container insert are refused
  assert(!world.insert(light, light));
  assert(!world.insert(engineer, cell));

  // Destroying a device takes its store with it
  world.destroy(light);
  assert(!world.registry().valid(light));
  assert(!world.registry().valid(cell));
  assert(world.count_devices() == 0);

  // Destroying an actor drops what it held
  entt::entity spare = world.spawn("PowerCellSmallStandard", 0.0f, 0.0f, 0);
  assert(world.put_in_hand(engineer, spare));
  world.destroy(engineer);
  assert(world.registry().valid(spare));
  assert(!world.registry().all_of<entities::Contained>(spare));
  assert(world.registry().get<entities::Position>(spare).x == 12.0f);

  std::cout << "  World: PASS" << std::endl;
}

int main() {
  std::cout << "=== Running Device Tests ===" << std::endl;

  test_map_init();
  test_start_threshold();
  test_update_and_shutoff();
  test_eject();
  test_insert();
  test_scheduler();
  test_verbs();
  test_replication();
  test_world();

  std::cout << std::endl;
  std::cout << "All tests PASSED!" << std::endl;
  return 0;
}
