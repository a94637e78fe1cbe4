/**
 * @file main.cpp
 * @brief Entry point for the Voltaic device floor with visual inspector.
 */

#include <algorithm>
#include <chrono>
#include <iostream>

#include "raylib.h"

#include <voltaic/core/constants.hpp>
#include <voltaic/devices/device_state.hpp>
#include <voltaic/devices/device_update_scheduler.hpp>
#include <voltaic/devices/device_verbs.hpp>
#include <voltaic/devices/powered_device.hpp>
#include <voltaic/entities/world.hpp>
#include <voltaic/renderer/debug_ui.hpp>
#include <voltaic/renderer/renderer.hpp>

using namespace voltaic;

int main() {
  std::cout << "=== Voltaic Device Floor (C++) ===" << std::endl;
  std::cout << "Initializing systems..." << std::endl;

  // Initialize World (ECS)
  entities::WorldConfig world_config;
  world_config.width = 64;
  world_config.height = 40;

  entities::World world;
  world.init(world_config);
  std::cout << "[OK] ECS: EnTT initialized, " << world.catalog().ids().size()
            << " archetypes" << std::endl;

  // Populate the floor
  entt::entity engineer = world.spawn("Engineer", 30.0f, 20.0f, 0);

  const char *device_ids[] = {"Flashlight", "HandDrill", "EmergencyLamp", "Multimeter"};
  size_t powered_on = 0;
  for (int row = 0; row < 3; ++row) {
    for (int col = 0; col < 4; ++col) {
      float x = 20.0f + col * 6.0f;
      float y = 12.0f + row * 6.0f;
      entt::entity device = world.spawn(device_ids[col], x, y, 0);
      devices::PoweredDeviceSystem::map_init(world, device);

      // Leave the first row switched off
      if (row > 0 && devices::PoweredDeviceSystem::start_discharging(world, device)) {
        ++powered_on;
      }
    }
  }

  // Spares lying around
  world.spawn("PowerCellSmallHigh", 28.0f, 22.0f, 0);
  world.spawn("PowerCellMediumStandard", 32.0f, 22.0f, 0);
  world.spawn("PowerCellLargeHyper", 34.0f, 22.0f, 0);
  world.spawn("BatterySmallStandard", 26.0f, 22.0f, 0);

  world.update(0.0);
  std::cout << "[OK] Devices: " << world.count_devices() << " spawned, "
            << powered_on << " switched on" << std::endl;

  // Initialize Renderer
  renderer::RendererConfig render_config;
  render_config.window_width = 1280;
  render_config.window_height = 720;
  render_config.tile_size = 16;
  render_config.grid_width = world_config.width;
  render_config.grid_height = world_config.height;
  render_config.title = "Voltaic - Device Floor";
  render_config.target_fps = 60;

  renderer::Renderer game_renderer;
  game_renderer.init(render_config);
  std::cout << "[OK] Renderer: " << render_config.window_width << "x"
            << render_config.window_height << " window" << std::endl;

  // Initialize Debug UI
  renderer::DebugUI debug_ui;
  debug_ui.init();
  debug_ui.connect(world);
  std::cout << "[OK] Debug UI: Dear ImGui initialized" << std::endl;

  std::cout << std::endl;
  std::cout << "=== Simulation Running ===" << std::endl;
  std::cout << "Controls:" << std::endl;
  std::cout << "  WASD/Arrows: Pan camera" << std::endl;
  std::cout << "  Mouse Wheel: Zoom" << std::endl;
  std::cout << "  Left click: Select" << std::endl;
  std::cout << "  T: Toggle selected device" << std::endl;
  std::cout << "  X: Eject store from selected device" << std::endl;
  std::cout << "  1/0: Charge bars on/off" << std::endl;
  std::cout << "  Space: Pause/Resume" << std::endl;
  std::cout << "  N: Step (when paused)" << std::endl;
  std::cout << "  F3: Toggle event log" << std::endl;
  std::cout << std::endl;

  // Simulation parameters - Fixed Timestep
  const double fixed_dt = constants::FIXED_DT;
  double accumulator = 0.0;
  int step_count = 0;
  double sim_time = 0.0;

  renderer::SidebarStats stats;

  bool paused = false;
  float time_scale = 1.0f;

  // Main loop
  while (!game_renderer.should_close()) {
    if (IsKeyPressed(KEY_F3))
      debug_ui.toggle_log();

    game_renderer.update_input();

    // INPUT: Select Entity
    // (Only if not clicking the ImGui sidebar)
    if (IsMouseButtonPressed(MOUSE_BUTTON_LEFT) && !debug_ui.is_capturing_mouse()) {
      Vector2 mouse_world = GetScreenToWorld2D(GetMousePosition(), game_renderer.get_camera());
      float world_x = mouse_world.x / render_config.tile_size;
      float world_y = mouse_world.y / render_config.tile_size;

      // Radius 1.5 covers the full diagonal of the tile
      entt::entity hit = world.get_entity_at(world_x, world_y, game_renderer.get_z_level(), 1.5f);
      game_renderer.select_entity(hit);
    }

    // Device verbs on the selection, run by the engineer
    entt::entity selected = game_renderer.get_selected_entity();
    if (selected != entt::null && world.registry().valid(selected) &&
        world.registry().all_of<devices::PoweredDevice>(selected)) {
      if (IsKeyPressed(KEY_T))
        devices::DeviceVerbs::activate_toggle(world, engineer, selected);
      if (IsKeyPressed(KEY_X))
        devices::DeviceVerbs::activate_eject(world, engineer, selected);
    }

    if (IsKeyPressed(KEY_SPACE))
      paused = !paused;
    if (IsKeyPressed(KEY_EQUAL) || IsKeyPressed(KEY_KP_ADD))
      time_scale = std::min(time_scale * 2.0f, 10.0f);
    if (IsKeyPressed(KEY_MINUS) || IsKeyPressed(KEY_KP_SUBTRACT))
      time_scale = std::max(time_scale / 2.0f, 0.1f);

    // Fixed timestep accumulator
    double frame_time = static_cast<double>(GetFrameTime());
    if (!paused) {
      accumulator += frame_time * time_scale;
    }

    // Step-by-step mode: if paused and step requested, add exactly one tick
    if (game_renderer.should_step()) {
      if (paused) accumulator += fixed_dt;
      game_renderer.clear_step_request();
    }

    auto step_start = std::chrono::high_resolution_clock::now();
    int steps_this_frame = 0;

    while (accumulator >= fixed_dt && steps_this_frame < constants::MAX_STEPS_PER_FRAME) {
      stats.devices_ticked = devices::DeviceUpdateScheduler::update(fixed_dt, world);

      sim_time += fixed_dt;
      accumulator -= fixed_dt;
      step_count++;
      steps_this_frame++;
    }

    // If we hit max steps, drain remaining accumulator to prevent spiral
    if (steps_this_frame >= constants::MAX_STEPS_PER_FRAME && accumulator > fixed_dt) {
      accumulator = 0.0;
    }

    auto step_end = std::chrono::high_resolution_clock::now();
    stats.sim_step_time_ms = std::chrono::duration<double, std::milli>(step_end - step_start).count();
    stats.sim_time = sim_time;

    // Index rebuild + event delivery to the log, then replication snapshot
    world.update(fixed_dt);
    stats.snapshots_sent = devices::collect_dirty_states(world).size();

    // Render
    game_renderer.begin_frame();
    game_renderer.draw_floor();
    game_renderer.draw_entities(world);

    // Exit camera mode for ImGui (screen-space rendering)
    EndMode2D();

    debug_ui.begin_frame();
    debug_ui.draw_sidebar(world, paused, time_scale, stats,
                          game_renderer.get_selected_entity(), engineer);
    debug_ui.end_frame();

    game_renderer.end_frame();
  }

  // Cleanup
  debug_ui.shutdown();
  game_renderer.shutdown();

  std::cout << std::endl;
  std::cout << "=== Simulation Complete ===" << std::endl;
  std::cout << "Total steps: " << step_count << std::endl;
  std::cout << "Simulated time: " << sim_time << " s" << std::endl;

  return 0;
}
