#pragma once

/**
 * @file debug_ui.hpp
 * @brief Left-hand sidebar: simulation controls, device inspector, event log.
 */

#include <deque>
#include <string>
#include "entt/entt.hpp"

#include <voltaic/entities/events.hpp>

namespace voltaic {
namespace entities {
class World;
}

namespace renderer {

/**
 * @brief Log entry for the event log.
 */
struct LogEntry {
  double sim_time;
  std::string message;
  int severity; // 0=info, 1=warning, 2=error
};

/**
 * @brief Per-frame numbers shown in the sidebar.
 */
struct SidebarStats {
  double sim_step_time_ms = 0.0;
  double sim_time = 0.0;
  size_t devices_ticked = 0;
  size_t snapshots_sent = 0;
};

/**
 * @brief ImGui sidebar bound to one World.
 */
class DebugUI {
public:
  DebugUI() = default;
  ~DebugUI() = default;

  // Lifecycle
  void init();
  void shutdown();

  // Subscribes the event log to the world's dispatcher
  void connect(entities::World &world);

  // Frame management
  void begin_frame();
  void end_frame();

  /**
   * @brief Draw the sidebar.
   * @param selected Entity picked on the map (may be null)
   * @param operator_actor Actor whose hands run the device verbs
   */
  void draw_sidebar(entities::World &world, bool &paused, float &time_scale,
                    const SidebarStats &stats, entt::entity selected,
                    entt::entity operator_actor);

  // Logging
  void add_log(double sim_time, const std::string &message, int severity = 0);
  void clear_log();

  bool is_capturing_mouse() const;

  void toggle_log() { show_log_ = !show_log_; }

  // Dispatcher receivers
  void on_device_shutoff(const entities::DeviceShutoff &event);
  void on_store_inserted(const entities::StoreInserted &event);
  void on_store_ejected(const entities::StoreEjected &event);

private:
  bool initialized_ = false;
  entities::World *world_ = nullptr;
  double sim_time_ = 0.0;

  bool show_log_ = true;

  // Log storage
  std::deque<LogEntry> log_entries_;
  static constexpr size_t MAX_LOG_ENTRIES = 200;
  bool auto_scroll_log_ = true;

  std::string name_of(entt::entity entity) const;
  void draw_device_inspector(entities::World &world, entt::entity selected,
                             entt::entity operator_actor);
  void draw_store_inspector(entities::World &world, entt::entity selected);
};

} // namespace renderer
} // namespace voltaic
