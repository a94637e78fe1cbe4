#include <voltaic/power/energy_store.hpp>
#include <voltaic/core/constants.hpp>

#include <algorithm>
#include <cmath>
#include <utility>

namespace voltaic {
namespace power {

namespace {

// NaN and negative amounts count as nothing
float non_negative(float amount) { return std::isnan(amount) ? 0.0f : std::max(amount, 0.0f); }

} // namespace

const char *size_class_to_string(SizeClass size) {
  switch (size) {
  case SizeClass::SMALL:
    return "Small";
  case SizeClass::MEDIUM:
    return "Medium";
  case SizeClass::LARGE:
    return "Large";
  }
  return "Unknown";
}

const char *store_kind_to_string(StoreKind kind) {
  switch (kind) {
  case StoreKind::BATTERY:
    return "Battery";
  case StoreKind::POWER_CELL:
    return "Power Cell";
  }
  return "Unknown";
}

const char *store_status_to_string(StoreStatus status) {
  switch (status) {
  case StoreStatus::FULL:
    return "Full";
  case StoreStatus::PARTLY_FULL:
    return "Partly Full";
  case StoreStatus::EMPTY:
    return "Empty";
  }
  return "Unknown";
}

float watts_over_time_to_mwh(float watts, float seconds) {
  return watts * constants::MILLI_PER_UNIT * seconds / constants::SECONDS_PER_HOUR;
}

EnergyStore::EnergyStore()
    : EnergyStore(constants::DEFAULT_MAX_CHARGE, constants::DEFAULT_STARTING_CHARGE) {}

EnergyStore::EnergyStore(float max_capacity, float current_charge,
                         SizeClass size, StoreKind kind)
    : max_capacity_(non_negative(max_capacity)),
      current_charge_(std::clamp(non_negative(current_charge), 0.0f, max_capacity_)),
      size_class_(size), kind_(kind) {
  update_status();
}

bool EnergyStore::try_draw(float amount) {
  if (std::isnan(amount) || amount < 0.0f || amount >= current_charge_) {
    return false;
  }
  set_current_charge(current_charge_ - amount);
  return true;
}

float EnergyStore::draw(float amount) {
  float taken = std::min(current_charge_, non_negative(amount));
  set_current_charge(current_charge_ - taken);
  return taken;
}

bool EnergyStore::try_add(float amount) {
  if (std::isnan(amount) || amount < 0.0f || current_charge_ + amount > max_capacity_) {
    return false;
  }
  set_current_charge(current_charge_ + amount);
  return true;
}

float EnergyStore::add(float amount) {
  float added = std::min(non_negative(amount), max_capacity_ - current_charge_);
  set_current_charge(current_charge_ + added);
  return added;
}

void EnergyStore::fill_from(EnergyStore &other) {
  float deficit = max_capacity_ - current_charge_;
  if (other.try_draw(deficit)) {
    set_current_charge(current_charge_ + deficit);
    return;
  }

  // Source can't cover the deficit: take everything it has
  float available = other.current_charge_;
  other.set_current_charge(0.0f);
  set_current_charge(current_charge_ + available);
}

bool EnergyStore::try_draw_power(float watts, float seconds) {
  return try_draw(watts_over_time_to_mwh(watts, seconds));
}

float EnergyStore::draw_power(float watts, float seconds) {
  if (current_charge_ == 0.0f) {
    return 0.0f;
  }
  return draw(watts_over_time_to_mwh(watts, seconds));
}

bool EnergyStore::try_add_power(float watts, float seconds) {
  return try_add(watts_over_time_to_mwh(watts, seconds));
}

float EnergyStore::add_power(float watts, float seconds) {
  if (current_charge_ == max_capacity_) {
    return 0.0f;
  }
  return add(watts_over_time_to_mwh(watts, seconds));
}

void EnergyStore::set_max_capacity(float value) {
  if (std::isnan(value)) return;
  max_capacity_ = std::max(value, 0.0f);
  current_charge_ = std::min(current_charge_, max_capacity_);
  update_status();
  notify_charge_changed();
}

void EnergyStore::set_current_charge(float value) {
  if (std::isnan(value)) return;
  current_charge_ = std::clamp(value, 0.0f, max_capacity_);
  update_status();
  notify_charge_changed();
}

float EnergyStore::charge_ratio() const {
  return max_capacity_ > 0.0f ? current_charge_ / max_capacity_ : 0.0f;
}

void EnergyStore::set_charge_listener(ChargeListener listener) {
  charge_listener_ = std::move(listener);
}

void EnergyStore::update_status() {
  if (current_charge_ == max_capacity_) {
    status_ = StoreStatus::FULL;
  } else if (current_charge_ == 0.0f) {
    status_ = StoreStatus::EMPTY;
  } else {
    status_ = StoreStatus::PARTLY_FULL;
  }
}

void EnergyStore::notify_charge_changed() {
  if (charge_listener_) {
    charge_listener_(*this);
  }
}

} // namespace power
} // namespace voltaic
