/**
 * @file debug_ui.cpp
 * @brief Sidebar UI implementation.
 */

#include <voltaic/renderer/debug_ui.hpp>
#include <voltaic/devices/device_verbs.hpp>
#include <voltaic/devices/powered_device.hpp>
#include <voltaic/entities/components.hpp>
#include <voltaic/entities/world.hpp>
#include <voltaic/power/energy_store.hpp>

#include "imgui.h"
#include "rlImGui.h"
#include "raylib.h"

#include <algorithm>

namespace voltaic {
namespace renderer {

namespace {

// Button for a device verb; returns true when clicked
bool verb_button(const devices::VerbData &verb) {
  if (verb.visibility == devices::VerbVisibility::INVISIBLE) return false;

  bool disabled = verb.visibility == devices::VerbVisibility::DISABLED;
  if (disabled) ImGui::BeginDisabled();
  bool clicked = ImGui::Button(verb.text.c_str(), ImVec2(-1, 0));
  if (disabled) ImGui::EndDisabled();
  return clicked && !disabled;
}

ImVec4 status_color(power::StoreStatus status) {
  switch (status) {
  case power::StoreStatus::FULL:
    return ImVec4(0.3f, 0.9f, 0.3f, 1.0f);
  case power::StoreStatus::PARTLY_FULL:
    return ImVec4(0.9f, 0.8f, 0.2f, 1.0f);
  case power::StoreStatus::EMPTY:
    return ImVec4(0.9f, 0.3f, 0.2f, 1.0f);
  }
  return ImVec4(0.7f, 0.7f, 0.7f, 1.0f);
}

void draw_charge(const power::EnergyStore &store) {
  ImGui::Text("Status:");
  ImGui::SameLine();
  ImGui::TextColored(status_color(store.status()), "%s",
                     power::store_status_to_string(store.status()));
  ImGui::Text("Charge: %.1f / %.0f mWh", store.current_charge(), store.max_capacity());
  ImGui::PushStyleColor(ImGuiCol_PlotHistogram, status_color(store.status()));
  ImGui::ProgressBar(store.charge_ratio(), ImVec2(-1, 8), "");
  ImGui::PopStyleColor();
  ImGui::TextDisabled("%s, %s", power::store_kind_to_string(store.kind()),
                      power::size_class_to_string(store.size_class()));
}

} // namespace

void DebugUI::init() {
  rlImGuiSetup(true);
  initialized_ = true;

  ImGuiStyle &style = ImGui::GetStyle();

  // Square, compact
  style.WindowRounding = 0.0f;
  style.FrameRounding = 0.0f;
  style.GrabRounding = 0.0f;
  style.TabRounding = 0.0f;
  style.WindowPadding = ImVec2(8, 8);
  style.FramePadding = ImVec2(4, 2);
  style.ItemSpacing = ImVec2(6, 4);
  style.WindowBorderSize = 1.0f;
  style.FrameBorderSize = 1.0f;

  // Dark panel, electric-green accents
  ImVec4 *colors = style.Colors;
  colors[ImGuiCol_WindowBg] = ImVec4(0.05f, 0.06f, 0.07f, 0.97f);
  colors[ImGuiCol_ChildBg] = ImVec4(0.03f, 0.04f, 0.05f, 1.00f);
  colors[ImGuiCol_Border] = ImVec4(0.25f, 0.35f, 0.30f, 0.60f);
  colors[ImGuiCol_FrameBg] = ImVec4(0.08f, 0.10f, 0.10f, 1.00f);
  colors[ImGuiCol_FrameBgHovered] = ImVec4(0.12f, 0.18f, 0.16f, 1.00f);
  colors[ImGuiCol_Text] = ImVec4(0.80f, 0.88f, 0.82f, 1.00f);
  colors[ImGuiCol_TextDisabled] = ImVec4(0.42f, 0.50f, 0.45f, 1.00f);
  colors[ImGuiCol_Button] = ImVec4(0.10f, 0.20f, 0.16f, 1.00f);
  colors[ImGuiCol_ButtonHovered] = ImVec4(0.16f, 0.32f, 0.24f, 1.00f);
  colors[ImGuiCol_ButtonActive] = ImVec4(0.22f, 0.42f, 0.30f, 1.00f);
  colors[ImGuiCol_Header] = ImVec4(0.08f, 0.22f, 0.18f, 1.00f);
  colors[ImGuiCol_HeaderHovered] = ImVec4(0.12f, 0.32f, 0.26f, 1.00f);
  colors[ImGuiCol_HeaderActive] = ImVec4(0.16f, 0.40f, 0.32f, 1.00f);
  colors[ImGuiCol_PlotHistogram] = ImVec4(0.35f, 0.80f, 0.40f, 1.00f);
  colors[ImGuiCol_PlotLines] = ImVec4(0.55f, 0.75f, 0.45f, 1.00f);
}

void DebugUI::shutdown() {
  if (world_) {
    world_->dispatcher().disconnect(*this);
    world_ = nullptr;
  }
  if (initialized_) {
    rlImGuiShutdown();
    initialized_ = false;
  }
}

void DebugUI::connect(entities::World &world) {
  world_ = &world;
  auto &dispatcher = world.dispatcher();
  dispatcher.sink<entities::DeviceShutoff>().connect<&DebugUI::on_device_shutoff>(*this);
  dispatcher.sink<entities::StoreInserted>().connect<&DebugUI::on_store_inserted>(*this);
  dispatcher.sink<entities::StoreEjected>().connect<&DebugUI::on_store_ejected>(*this);
}

void DebugUI::begin_frame() { rlImGuiBegin(); }
void DebugUI::end_frame() { rlImGuiEnd(); }

void DebugUI::draw_sidebar(entities::World &world, bool &paused, float &time_scale,
                           const SidebarStats &stats, entt::entity selected,
                           entt::entity operator_actor) {
  sim_time_ = stats.sim_time;

  float sidebar_width = 260.0f;
  ImGui::SetNextWindowPos(ImVec2(0, 0), ImGuiCond_Always);
  ImGui::SetNextWindowSize(ImVec2(sidebar_width, static_cast<float>(GetScreenHeight())),
                           ImGuiCond_Always);

  ImGuiWindowFlags flags = ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize |
                           ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoTitleBar;

  if (ImGui::Begin("##Sidebar", nullptr, flags)) {
    ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(0.4f, 0.9f, 0.6f, 1.0f));
    ImGui::Text("VOLTAIC");
    ImGui::PopStyleColor();
    ImGui::Separator();

    // === SIMULATION ===
    if (ImGui::CollapsingHeader("Simulation", ImGuiTreeNodeFlags_DefaultOpen)) {
      if (paused) {
        ImGui::TextColored(ImVec4(1.0f, 0.8f, 0.2f, 1.0f), "[PAUSED]");
      } else {
        ImGui::TextColored(ImVec4(0.3f, 0.9f, 0.3f, 1.0f), "[RUNNING]");
      }
      ImGui::SameLine();
      ImGui::Text("%.1fx", time_scale);
      ImGui::Text("Time: %.1f s", stats.sim_time);
      ImGui::Text("Devices: %zu", world.count_devices());

      if (ImGui::Button(paused ? "[RESUME]" : "[PAUSE]", ImVec2(-1, 0))) {
        paused = !paused;
      }
      ImGui::SliderFloat("##speed", &time_scale, 0.1f, 10.0f, "%.1fx");
    }

    ImGui::Spacing();

    // === INSPECTOR ===
    if (ImGui::CollapsingHeader("Inspector", ImGuiTreeNodeFlags_DefaultOpen)) {
      const auto &registry = world.registry();
      if (selected != entt::null && registry.valid(selected)) {
        ImGui::Text("ID: %d", static_cast<int>(entt::to_integral(selected)));
        ImGui::TextColored(ImVec4(0.4f, 0.8f, 1.0f, 1.0f), "%s", name_of(selected).c_str());
        if (const auto *pos = registry.try_get<entities::Position>(selected)) {
          ImGui::Text("Pos: (%.1f, %.1f, %d)", pos->x, pos->y, pos->z);
        }
        ImGui::Separator();

        if (registry.all_of<devices::PoweredDevice>(selected)) {
          draw_device_inspector(world, selected, operator_actor);
        } else if (registry.all_of<power::EnergyStore>(selected)) {
          draw_store_inspector(world, selected);
        } else if (const auto *hands = registry.try_get<entities::Hands>(selected)) {
          ImGui::Text("Holding: %s",
                      hands->held == entt::null ? "nothing" : name_of(hands->held).c_str());
        }
      } else {
        ImGui::TextDisabled("Click an entity...");
      }
    }

    ImGui::Spacing();

    // === PERFORMANCE ===
    if (ImGui::CollapsingHeader("Performance")) {
      ImGui::Text("FPS: %d", GetFPS());
      ImGui::Text("Frame: %.1f ms", GetFrameTime() * 1000.0f);
      ImGui::Text("Sim:   %.2f ms", stats.sim_step_time_ms);
      ImGui::Text("Ticked: %zu  Snapshots: %zu", stats.devices_ticked, stats.snapshots_sent);
    }

    if (ImGui::CollapsingHeader("Controls")) {
      ImGui::TextDisabled("WASD/Arrows: Pan");
      ImGui::TextDisabled("Mouse Wheel: Zoom");
      ImGui::TextDisabled("Left click: Select");
      ImGui::TextDisabled("T: Toggle device  X: Eject");
      ImGui::TextDisabled("Space: Pause  N: Step");
      ImGui::TextDisabled("1/0: Charge bars on/off");
    }

    // === LOG ===
    if (show_log_ && ImGui::CollapsingHeader("Event Log", ImGuiTreeNodeFlags_DefaultOpen)) {
      ImGui::BeginChild("##log", ImVec2(-1, 160), true);
      for (const auto &entry : log_entries_) {
        ImVec4 col = entry.severity == 2 ? ImVec4(1, 0.3f, 0.3f, 1) :
                     entry.severity == 1 ? ImVec4(1, 0.8f, 0.2f, 1) :
                                           ImVec4(0.7f, 0.7f, 0.7f, 1);
        ImGui::TextColored(col, "[%.1f] %s", entry.sim_time, entry.message.c_str());
      }
      if (auto_scroll_log_) ImGui::SetScrollHereY(1.0f);
      ImGui::EndChild();
    }
  }
  ImGui::End();
}

void DebugUI::draw_device_inspector(entities::World &world, entt::entity selected,
                                    entt::entity operator_actor) {
  const auto &powered = world.registry().get<devices::PoweredDevice>(selected);

  ImGui::Text("State:");
  ImGui::SameLine();
  if (powered.discharging) {
    ImGui::TextColored(ImVec4(0.3f, 0.9f, 0.3f, 1.0f), "ON");
  } else {
    ImGui::TextDisabled("OFF");
  }
  ImGui::Text("Draw: %.1f W (standby %.1f W)", powered.wattage_active, powered.wattage_standby);
  ImGui::TextDisabled("Slot: %s %s%s", power::size_class_to_string(powered.slot_size_class),
                      power::store_kind_to_string(powered.accepted_kind),
                      powered.removable ? "" : " (fixed)");
  ImGui::Separator();

  if (const auto *store = devices::PoweredDeviceSystem::installed_store(world, selected)) {
    draw_charge(*store);
  } else {
    ImGui::TextColored(ImVec4(0.9f, 0.4f, 0.2f, 1.0f), "No store installed");
  }

  ImGui::Spacing();
  if (verb_button(devices::DeviceVerbs::get_toggle_verb(world, operator_actor, selected))) {
    if (!devices::DeviceVerbs::activate_toggle(world, operator_actor, selected)) {
      add_log(sim_time_, name_of(selected) + " won't turn on: not enough charge", 1);
    }
  }
  if (verb_button(devices::DeviceVerbs::get_eject_verb(world, operator_actor, selected))) {
    if (!devices::DeviceVerbs::activate_eject(world, operator_actor, selected)) {
      add_log(sim_time_, name_of(selected) + ": store is not removable", 1);
    }
  }

  // Slot whatever the operator is holding
  const auto *hands = world.registry().try_get<entities::Hands>(operator_actor);
  if (hands && hands->held != entt::null && world.occupant(selected) == entt::null) {
    std::string label = "Insert " + name_of(hands->held);
    if (ImGui::Button(label.c_str(), ImVec2(-1, 0))) {
      if (!devices::PoweredDeviceSystem::insert_store(world, selected, hands->held)) {
        add_log(sim_time_, name_of(hands->held) + " doesn't fit " + name_of(selected), 1);
      }
    }
  }
}

void DebugUI::draw_store_inspector(entities::World &world, entt::entity selected) {
  const auto &store = world.registry().get<power::EnergyStore>(selected);
  draw_charge(store);

  if (const auto *indicator = world.registry().try_get<entities::ChargeIndicator>(selected)) {
    ImGui::TextDisabled("Indicator: %.0f%%", indicator->level * 100.0f);
  }
}

void DebugUI::on_device_shutoff(const entities::DeviceShutoff &event) {
  add_log(sim_time_, name_of(event.device) + " ran out of power", 1);
}

void DebugUI::on_store_inserted(const entities::StoreInserted &event) {
  add_log(sim_time_, name_of(event.store) + " inserted into " + name_of(event.device));
}

void DebugUI::on_store_ejected(const entities::StoreEjected &event) {
  std::string where = event.receiver == entt::null ? "dropped" : "taken by " + name_of(event.receiver);
  add_log(sim_time_, name_of(event.store) + " ejected from " + name_of(event.device) + ", " + where);
}

void DebugUI::add_log(double sim_time, const std::string &message, int severity) {
  log_entries_.push_back({sim_time, message, severity});
  if (log_entries_.size() > MAX_LOG_ENTRIES) {
    log_entries_.pop_front();
  }
}

void DebugUI::clear_log() { log_entries_.clear(); }

bool DebugUI::is_capturing_mouse() const {
  return ImGui::GetIO().WantCaptureMouse;
}

std::string DebugUI::name_of(entt::entity entity) const {
  if (world_ && world_->registry().valid(entity)) {
    if (const auto *label = world_->registry().try_get<entities::Label>(entity)) {
      return label->name;
    }
  }
  return "entity " + std::to_string(static_cast<unsigned>(entt::to_integral(entity)));
}

} // namespace renderer
} // namespace voltaic
