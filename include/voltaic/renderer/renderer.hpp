#pragma once

/**
 * @file renderer.hpp
 * @brief Raylib-based view of the device floor.
 *
 * Features:
 * - Tile floor with camera pan/zoom
 * - Glyph rendering of devices, cells and actors
 * - Charge bars and an "on" halo for powered devices
 * - Single-step requests
 */

#include "raylib.h"
#include <string>
#include "entt/entt.hpp"

namespace voltaic {
namespace entities {
class World;
}

namespace renderer {

/**
 * @brief Active overlay type for visualization.
 */
enum class OverlayType { NONE, CHARGE };

/**
 * @brief Renderer configuration.
 */
struct RendererConfig {
  int window_width = 1280;
  int window_height = 720;
  int tile_size = 16;                       // Pixels per floor cell
  int grid_width = 64;
  int grid_height = 40;
  std::string title = "Voltaic";
  int target_fps = 60;
};

/**
 * @brief Floor and entity renderer.
 */
class Renderer {
public:
  Renderer() = default;
  ~Renderer() = default;

  // Lifecycle
  void init(const RendererConfig &config);
  void shutdown();
  bool should_close() const;

  // Input handling
  void update_input();

  // Rendering
  void begin_frame();
  void draw_floor();
  void draw_entities(const entities::World &world);

  // Selection
  void select_entity(entt::entity entity) { selected_entity_ = entity; }
  entt::entity get_selected_entity() const { return selected_entity_; }

  void end_frame();

  // State accessors
  bool should_step() const { return step_requested_; }
  void clear_step_request() { step_requested_ = false; }
  int get_z_level() const { return current_z_; }
  OverlayType get_overlay_type() const { return active_overlay_; }
  const Camera2D &get_camera() const { return camera_; }

private:
  RendererConfig config_;
  Camera2D camera_{};

  // View state
  int current_z_ = 0;
  OverlayType active_overlay_ = OverlayType::CHARGE;

  // Single-step request (N); main decides whether it applies
  bool step_requested_ = false;

  // Mouse state
  Vector2 last_mouse_pos_{};
  bool dragging_ = false;

  // Selection state
  entt::entity selected_entity_ = entt::null;

  // Internal helpers
  void handle_camera_input();
  void handle_overlay_input();
  void handle_simulation_input();
  void draw_charge_bar(float px, float py, float level) const;
};

// === Inline implementations ===

inline bool Renderer::should_close() const { return WindowShouldClose(); }

} // namespace renderer
} // namespace voltaic
