#pragma once

/**
 * @file energy_store.hpp
 * @brief Bounded rechargeable energy reservoir shared by batteries and power cells.
 *
 * Charge is measured in milliwatt-hours. Every mutation clamps the charge to
 * [0, max_capacity], recomputes the status and notifies the charge listener.
 * try_* calls reject NaN amounts; draw/add treat them as zero.
 */

#include <functional>

namespace voltaic {
namespace power {

/**
 * @brief Compatibility tag restricting which slots a store fits into.
 */
enum class SizeClass { SMALL, MEDIUM, LARGE };

/**
 * @brief Store flavour. Power cells drive a charge indicator, batteries don't.
 */
enum class StoreKind { BATTERY, POWER_CELL };

/**
 * @brief Coarse fill state, recomputed on every change.
 */
enum class StoreStatus { FULL, PARTLY_FULL, EMPTY };

const char *size_class_to_string(SizeClass size);
const char *store_kind_to_string(StoreKind kind);
const char *store_status_to_string(StoreStatus status);

/**
 * @brief Energy drawn by a load of @p watts over @p seconds, in mWh.
 */
float watts_over_time_to_mwh(float watts, float seconds);

/**
 * @brief Rechargeable reservoir with bounded capacity.
 */
class EnergyStore {
public:
  using ChargeListener = std::function<void(const EnergyStore &)>;

  EnergyStore();
  EnergyStore(float max_capacity, float current_charge,
              SizeClass size = SizeClass::SMALL,
              StoreKind kind = StoreKind::BATTERY);

  // === Raw charge (mWh) ===

  /**
   * @brief Remove @p amount if strictly less than the current charge.
   *
   * A request equal to the remaining charge fails, so a store is never
   * drained to exactly zero through this call.
   * @return true if the charge was taken; false leaves the store untouched.
   */
  bool try_draw(float amount);

  /**
   * @brief Remove up to @p amount.
   * @return Charge actually removed.
   */
  float draw(float amount);

  /**
   * @brief Add @p amount only if it fits below the capacity.
   */
  bool try_add(float amount);

  /**
   * @brief Add up to @p amount, clamped at capacity.
   * @return Charge actually added.
   */
  float add(float amount);

  /**
   * @brief Top this store up from @p other.
   *
   * Moves min(empty capacity, other's charge); if @p other cannot cover the
   * whole deficit it is drained completely.
   */
  void fill_from(EnergyStore &other);

  // === Power over time ===
  bool try_draw_power(float watts, float seconds);
  float draw_power(float watts, float seconds);
  bool try_add_power(float watts, float seconds);
  float add_power(float watts, float seconds);

  // === Setters (clamping; NaN is ignored) ===
  void set_max_capacity(float value);
  void set_current_charge(float value);

  // === Accessors ===
  float max_capacity() const { return max_capacity_; }
  float current_charge() const { return current_charge_; }
  float charge_ratio() const;
  StoreStatus status() const { return status_; }
  SizeClass size_class() const { return size_class_; }
  StoreKind kind() const { return kind_; }

  /**
   * @brief Observer invoked after every charge or capacity change.
   */
  void set_charge_listener(ChargeListener listener);

private:
  float max_capacity_;
  float current_charge_;
  SizeClass size_class_;
  StoreKind kind_;
  StoreStatus status_ = StoreStatus::EMPTY;
  ChargeListener charge_listener_;

  void update_status();
  void notify_charge_changed();
};

} // namespace power
} // namespace voltaic
