#include "units/unit.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

#include "common/errors.hpp"

namespace fleet {

namespace {

// 构造前校验，返回原值，保证失败时对象不会被部分初始化
std::string ValidatedId(std::string id) {
  if (IsBlank(id)) {
    throw ValidationError("Unit id must not be empty or blank");
  }
  return id;
}

double ValidatedCapacity(double capacity_kg) {
  if (!std::isfinite(capacity_kg) || capacity_kg <= 0.0) {
    throw ValidationError("Unit capacity must be a positive value (got " + FormatFixed(capacity_kg, 2) + ")");
  }
  return capacity_kg;
}

std::string Kg(double v) { return FormatFixed(v, 2) + " kg"; }

} // namespace

bool IsBlank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

Unit::Unit(UnitKind kind, std::string id, double capacity_kg, std::string location)
    : kind_(kind),
      id_(ValidatedId(std::move(id))),
      capacity_kg_(ValidatedCapacity(capacity_kg)),
      location_(std::move(location)),
      capabilities_(CapabilitiesOf(kind)) {}

bool Unit::autonomy_enabled() const {
  if (kind_ == UnitKind::kAir) return true;
  return HasCapability(Capability::kAutonomyCapable) && autonomy_enabled_;
}

void Unit::RequireCapability(Capability c, const char* action) const {
  if (!HasCapability(c)) {
    throw IllegalStateError(std::string(ToString(kind_)) + " unit " + id_ + " cannot " + action +
                            " (missing capability " + ToString(c) + ")");
  }
}

void Unit::MoveTo(const std::string& destination, IReportSink& sink) {
  switch (kind_) {
    case UnitKind::kGround:
      sink.Info("Unit " + id_ + " moving by road towards " + destination);
      Drive(sink);
      break;
    case UnitKind::kAir:
      sink.Info("Unit " + id_ + " flying towards " + destination);
      Fly(sink);
      break;
    case UnitKind::kWater:
      sink.Info("Unit " + id_ + " sailing towards " + destination);
      Navigate(sink);
      break;
    case UnitKind::kAmphibious:
      sink.Info("Unit " + id_ + " heading towards " + destination);
      if (in_water_) {
        Navigate(sink);
      } else {
        Drive(sink);
      }
      break;
  }
  location_ = destination;
}

void Unit::Load(double amount_kg, IReportSink& sink) {
  if (!std::isfinite(amount_kg) || amount_kg < 0.0) {
    throw ValidationError("Unit " + id_ + ": load amount must be a finite value >= 0 (got " +
                          FormatFixed(amount_kg, 2) + ")");
  }
  if (amount_kg > capacity_kg_) {
    throw CapacityExceededError(id_, amount_kg, capacity_kg_);
  }
  last_loaded_kg_ = amount_kg;
  sink.Info("Unit " + id_ + " loading " + Kg(amount_kg));
}

void Unit::Unload(double amount_kg, IReportSink& sink) {
  last_unloaded_kg_ = amount_kg;
  sink.Info("Unit " + id_ + " unloading " + Kg(amount_kg));
}

void Unit::Drive(IReportSink& sink) {
  RequireCapability(Capability::kGround, "drive");
  if (kind_ == UnitKind::kAmphibious) {
    in_water_ = false;
    sink.Info("Unit " + id_ + " driving on land");
    return;
  }
  sink.Info("Unit " + id_ + " driving " + (autonomy_enabled() ? "in autonomous mode" : "manually"));
}

void Unit::Fly(IReportSink& sink) {
  RequireCapability(Capability::kAir, "fly");
  altitude_m_ = kCruiseAltitudeM;
  sink.Info("Unit " + id_ + " flying at " + FormatFixed(altitude_m_, 1) + " m altitude");
}

void Unit::Navigate(IReportSink& sink) {
  RequireCapability(Capability::kWater, "navigate");
  if (kind_ == UnitKind::kAmphibious) {
    in_water_ = true;
    sink.Info("Unit " + id_ + " navigating in water");
    return;
  }
  depth_m_ = kOperatingDepthM;
  sink.Info("Unit " + id_ + " navigating at " + FormatFixed(depth_m_, 1) + " m depth");
}

bool Unit::EnableAutonomy(IReportSink& sink) {
  RequireCapability(Capability::kAutonomyCapable, "toggle autonomy");
  if (kind_ == UnitKind::kAir) {
    sink.Info("Unit " + id_ + ": autonomy is always on");
    return true;
  }
  autonomy_enabled_ = true;
  sink.Info("Unit " + id_ + ": autonomy enabled");
  return true;
}

bool Unit::DisableAutonomy(IReportSink& sink) {
  RequireCapability(Capability::kAutonomyCapable, "toggle autonomy");
  if (kind_ == UnitKind::kAir) {
    // 固定自主策略：拒绝，保持常开
    sink.Warn("Unit " + id_ + ": air units cannot disable autonomy");
    return false;
  }
  autonomy_enabled_ = false;
  sink.Info("Unit " + id_ + ": autonomy disabled");
  return true;
}

void Unit::ToggleMedium(IReportSink& sink) {
  if (kind_ != UnitKind::kAmphibious) {
    throw IllegalStateError("Unit " + id_ + " is not amphibious; cannot toggle medium");
  }
  in_water_ = !in_water_;
  sink.Info("Unit " + id_ + " switched to " + (in_water_ ? "water" : "land") + " mode");
}

std::string Unit::Status() const {
  std::string s = "Unit ID: " + id_ + ", Kind: " + ToString(kind_) + ", Capacity: " + Kg(capacity_kg_) +
                  ", Location: " + location_;
  switch (kind_) {
    case UnitKind::kGround:
      s += std::string(", Autonomy: ") + (autonomy_enabled() ? "Enabled" : "Disabled");
      break;
    case UnitKind::kAir:
      s += ", Altitude: " + FormatFixed(altitude_m_, 1) + " m";
      break;
    case UnitKind::kWater:
      s += ", Depth: " + FormatFixed(depth_m_, 1) + " m";
      break;
    case UnitKind::kAmphibious:
      s += std::string(", Medium: ") + (in_water_ ? "Water" : "Land");
      break;
  }
  return s;
}

} // namespace fleet
