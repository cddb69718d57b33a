#include "common/types.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

#include "common/errors.hpp"

namespace fleet {

namespace {

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

} // namespace

CapabilitySet CapabilitiesOf(UnitKind kind) {
  CapabilitySet caps;
  switch (kind) {
    case UnitKind::kGround:
      return caps.With(Capability::kGround).With(Capability::kAutonomyCapable);
    case UnitKind::kAir:
      return caps.With(Capability::kAir).With(Capability::kAutonomyCapable);
    case UnitKind::kWater:
      return caps.With(Capability::kWater);
    case UnitKind::kAmphibious:
      return caps.With(Capability::kGround).With(Capability::kWater);
  }
  return caps;
}

const char* ToString(UnitKind kind) {
  switch (kind) {
    case UnitKind::kGround: return "Ground";
    case UnitKind::kAir: return "Air";
    case UnitKind::kWater: return "Water";
    case UnitKind::kAmphibious: return "Amphibious";
  }
  return "Unknown";
}

const char* ToString(Capability cap) {
  switch (cap) {
    case Capability::kGround: return "Ground";
    case Capability::kAir: return "Air";
    case Capability::kWater: return "Water";
    case Capability::kAutonomyCapable: return "AutonomyCapable";
  }
  return "Unknown";
}

const char* ToString(MissionKind kind) {
  switch (kind) {
    case MissionKind::kUrgentDelivery: return "UrgentDelivery";
    case MissionKind::kRescue: return "Rescue";
  }
  return "Unknown";
}

const char* ToString(MissionState state) {
  switch (state) {
    case MissionState::kPending: return "Pending";
    case MissionState::kAssigned: return "Assigned";
    case MissionState::kInProgress: return "InProgress";
    case MissionState::kCompleted: return "Completed";
  }
  return "Unknown";
}

const char* ToString(StepOutcome outcome) {
  switch (outcome) {
    case StepOutcome::kIdle: return "Idle";
    case StepOutcome::kStarted: return "Started";
    case StepOutcome::kCompleted: return "Completed";
    case StepOutcome::kEnRoute: return "EnRoute";
  }
  return "Unknown";
}

UnitKind ParseUnitKind(const std::string& text) {
  const std::string t = ToLower(text);
  if (t == "ground") return UnitKind::kGround;
  if (t == "air") return UnitKind::kAir;
  if (t == "water") return UnitKind::kWater;
  if (t == "amphibious") return UnitKind::kAmphibious;
  throw ValidationError("Unknown unit kind: '" + text + "'");
}

MissionKind ParseMissionKind(const std::string& text) {
  const std::string t = ToLower(text);
  if (t == "urgent_delivery" || t == "urgentdelivery") return MissionKind::kUrgentDelivery;
  if (t == "rescue") return MissionKind::kRescue;
  throw ValidationError("Unknown mission kind: '" + text + "'");
}

std::string FormatFixed(double value, int digits) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", digits, value);
  return buf;
}

} // namespace fleet
