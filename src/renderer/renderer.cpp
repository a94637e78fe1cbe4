/**
 * @file renderer.cpp
 * @brief Implementation of the Raylib-based floor renderer.
 */

#include <voltaic/renderer/renderer.hpp>
#include <voltaic/devices/powered_device.hpp>
#include <voltaic/entities/components.hpp>
#include <voltaic/entities/world.hpp>
#include "entt/entt.hpp"

#include <algorithm>

namespace voltaic {
namespace renderer {

void Renderer::init(const RendererConfig &config) {
  config_ = config;

  // Initialize Raylib window
  SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_VSYNC_HINT);
  InitWindow(config_.window_width, config_.window_height, config_.title.c_str());
  SetTargetFPS(config_.target_fps);

  // Camera centered on the floor
  camera_.target = {static_cast<float>(config_.grid_width * config_.tile_size) / 2.0f,
                    static_cast<float>(config_.grid_height * config_.tile_size) / 2.0f};
  camera_.offset = {static_cast<float>(config_.window_width) / 2.0f,
                    static_cast<float>(config_.window_height) / 2.0f};
  camera_.rotation = 0.0f;
  camera_.zoom = 1.0f;
}

void Renderer::shutdown() { CloseWindow(); }

void Renderer::update_input() {
  handle_camera_input();
  handle_overlay_input();
  handle_simulation_input();
}

void Renderer::handle_camera_input() {
  // Pan with WASD or arrow keys
  const float pan_speed = 400.0f / camera_.zoom; // Faster pan when zoomed out
  float dt = GetFrameTime();

  if (IsKeyDown(KEY_W) || IsKeyDown(KEY_UP))
    camera_.target.y -= pan_speed * dt;
  if (IsKeyDown(KEY_S) || IsKeyDown(KEY_DOWN))
    camera_.target.y += pan_speed * dt;
  if (IsKeyDown(KEY_A) || IsKeyDown(KEY_LEFT))
    camera_.target.x -= pan_speed * dt;
  if (IsKeyDown(KEY_D) || IsKeyDown(KEY_RIGHT))
    camera_.target.x += pan_speed * dt;

  // Pan with middle mouse button drag
  Vector2 mouse_pos = GetMousePosition();
  if (IsMouseButtonPressed(MOUSE_BUTTON_MIDDLE)) {
    dragging_ = true;
    last_mouse_pos_ = mouse_pos;
  }
  if (IsMouseButtonReleased(MOUSE_BUTTON_MIDDLE)) {
    dragging_ = false;
  }
  if (dragging_) {
    camera_.target.x -= (mouse_pos.x - last_mouse_pos_.x) / camera_.zoom;
    camera_.target.y -= (mouse_pos.y - last_mouse_pos_.y) / camera_.zoom;
    last_mouse_pos_ = mouse_pos;
  }

  // Zoom toward mouse position
  float wheel = GetMouseWheelMove();
  if (wheel != 0) {
    Vector2 before = GetScreenToWorld2D(mouse_pos, camera_);
    camera_.zoom += wheel * 0.1f * camera_.zoom;
    camera_.zoom = std::clamp(camera_.zoom, 0.25f, 8.0f);
    Vector2 after = GetScreenToWorld2D(mouse_pos, camera_);
    camera_.target.x += before.x - after.x;
    camera_.target.y += before.y - after.y;
  }

  // Update camera offset if window resized
  camera_.offset = {static_cast<float>(GetScreenWidth()) / 2.0f,
                    static_cast<float>(GetScreenHeight()) / 2.0f};
}

void Renderer::handle_overlay_input() {
  if (IsKeyPressed(KEY_ONE))
    active_overlay_ = OverlayType::CHARGE;
  if (IsKeyPressed(KEY_ZERO) || IsKeyPressed(KEY_GRAVE))
    active_overlay_ = OverlayType::NONE;

  if (IsKeyPressed(KEY_E))
    current_z_ = std::min(current_z_ + 1, 8);
  if (IsKeyPressed(KEY_Q))
    current_z_ = std::max(current_z_ - 1, -8);
}

void Renderer::handle_simulation_input() {
  if (IsKeyPressed(KEY_N))
    step_requested_ = true;
}

void Renderer::begin_frame() {
  BeginDrawing();
  ClearBackground({15, 12, 8, 255});
  BeginMode2D(camera_);
}

void Renderer::draw_floor() {
  int tile = config_.tile_size;
  for (int y = 0; y < config_.grid_height; ++y) {
    for (int x = 0; x < config_.grid_width; ++x) {
      // Deterministic per-tile shade so the floor doesn't look flat
      unsigned int hash = static_cast<unsigned int>(x * 374761393 + y * 668265263);
      hash = (hash ^ (hash >> 13)) * 1274126177;
      unsigned char shade = static_cast<unsigned char>(38 + (hash % 8));
      DrawRectangle(x * tile, y * tile, tile, tile, {shade, shade, static_cast<unsigned char>(shade + 4), 255});
    }
  }
  DrawRectangleLines(0, 0, config_.grid_width * tile, config_.grid_height * tile, {90, 80, 60, 255});
}

void Renderer::draw_entities(const entities::World &world) {
  const entt::registry &registry = world.registry();
  int tile = config_.tile_size;

  // Use the default font as a texture atlas for DF-style rendering
  Font font = GetFontDefault();
  SetTextureFilter(font.texture, TEXTURE_FILTER_POINT);

  // Held and slotted entities are drawn by whoever holds them
  auto view = registry.view<const entities::Position, const entities::Renderable>(
      entt::exclude<entities::Contained>);

  for (auto [entity, pos, render] : view.each()) {
    if (pos.z != current_z_) continue;

    float px = pos.x * tile;
    float py = pos.y * tile;

    // "On" halo behind discharging devices
    const auto *powered = registry.try_get<devices::PoweredDevice>(entity);
    if (powered && powered->discharging) {
      DrawCircle(static_cast<int>(px + tile / 2.0f), static_cast<int>(py + tile / 2.0f),
                 tile * 0.8f, Fade(render.color, 0.25f));
    }

    // Aspect-correct glyph centered in the tile
    int glyph_index = GetGlyphIndex(font, render.glyph);
    Rectangle src_rec = font.recs[glyph_index];
    float aspect = src_rec.width / src_rec.height;
    float target_h = static_cast<float>(tile);
    float target_w = std::min(target_h * aspect, static_cast<float>(tile));
    target_h = target_w / aspect;

    Rectangle dest_rec = {px + (tile - target_w) / 2.0f, py + (tile - target_h) / 2.0f,
                          target_w, target_h};
    DrawTexturePro(font.texture, src_rec, dest_rec, {0, 0}, 0.0f, render.color);

    if (active_overlay_ == OverlayType::CHARGE) {
      if (powered) {
        const auto *store = devices::PoweredDeviceSystem::installed_store(world, entity);
        draw_charge_bar(px, py, store ? store->charge_ratio() : 0.0f);
      } else if (const auto *indicator = registry.try_get<entities::ChargeIndicator>(entity)) {
        draw_charge_bar(px, py, indicator->level);
      }
    }

    // Selection Highlight
    if (entity == selected_entity_) {
      DrawRectangleLines(static_cast<int>(px), static_cast<int>(py), tile, tile, YELLOW);
      if (tile * camera_.zoom > 10) {
        DrawRectangleLines(static_cast<int>(px) + 1, static_cast<int>(py) + 1, tile - 2, tile - 2, YELLOW);
      }
    }
  }
}

void Renderer::draw_charge_bar(float px, float py, float level) const {
  int tile = config_.tile_size;
  int bar_h = std::max(2, tile / 8);
  int bar_y = static_cast<int>(py) + tile - bar_h;
  level = std::clamp(level, 0.0f, 1.0f);

  Color fill = level > 0.5f ? Color{80, 200, 80, 255}
             : level > 0.2f ? Color{220, 180, 40, 255}
                            : Color{220, 60, 40, 255};

  DrawRectangle(static_cast<int>(px), bar_y, tile, bar_h, {20, 20, 20, 200});
  DrawRectangle(static_cast<int>(px), bar_y, static_cast<int>(tile * level), bar_h, fill);
}

void Renderer::end_frame() { EndDrawing(); }

} // namespace renderer
} // namespace voltaic
