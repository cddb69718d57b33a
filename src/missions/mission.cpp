#include "missions/mission.hpp"

#include <cmath>
#include <utility>

#include "common/errors.hpp"

namespace fleet {

namespace {

std::string ValidatedMissionId(std::string id) {
  if (IsBlank(id)) {
    throw ValidationError("Mission id must not be empty or blank");
  }
  return id;
}

double ValidatedPayload(double payload_kg) {
  if (!std::isfinite(payload_kg) || payload_kg < 0.0) {
    throw ValidationError("Mission payload must be >= 0 (got " + FormatFixed(payload_kg, 2) + ")");
  }
  return payload_kg;
}

} // namespace

Mission::Mission(MissionKind kind, std::string id, std::string origin, std::string destination, double payload_kg)
    : kind_(kind),
      id_(ValidatedMissionId(std::move(id))),
      origin_(std::move(origin)),
      destination_(std::move(destination)),
      payload_kg_(ValidatedPayload(payload_kg)) {}

void Mission::Assign(std::size_t unit_index, Unit& unit, IReportSink& sink) {
  if (state_ != MissionState::kPending) {
    throw IllegalStateError("Mission " + id_ + " cannot be assigned in state " + ToString(state_));
  }
  assigned_unit_ = unit_index;
  state_ = MissionState::kAssigned;
  unit.BindMission(id_);
  sink.Info("Unit " + unit.id() + " assigned to mission " + id_);
}

void Mission::Start(Unit* unit, IReportSink& sink) {
  if (kind_ == MissionKind::kUrgentDelivery) {
    sink.Info("=== Starting urgent delivery " + id_ + " from " + origin_ + " to " + destination_ + " ===");
  } else {
    sink.Info("=== Starting rescue mission " + id_ + " at " + destination_ + " ===");
  }
  if (unit == nullptr) {
    throw IllegalStateError("Mission " + id_ + " cannot start without an assigned unit");
  }

  unit->MoveTo(destination_, sink);
  if (kind_ == MissionKind::kRescue && unit->HasCapability(Capability::kAutonomyCapable)) {
    unit->EnableAutonomy(sink);
  }
  state_ = MissionState::kInProgress;
}

void Mission::Complete(Unit* unit, IReportSink& sink) {
  if (unit == nullptr) {
    throw IllegalStateError("Mission " + id_ + " cannot complete without an assigned unit");
  }

  switch (kind_) {
    case MissionKind::kUrgentDelivery:
      unit->Unload(payload_kg_, sink);
      break;
    case MissionKind::kRescue:
      // 超载只影响这次装载：报错后任务照常结束并释放单元
      try {
        unit->Load(payload_kg_, sink);
      } catch (const CapacityExceededError& e) {
        sink.Error("Mission " + id_ + ": " + e.what());
      }
      if (unit->HasCapability(Capability::kAutonomyCapable)) {
        unit->DisableAutonomy(sink);
      }
      break;
  }

  state_ = MissionState::kCompleted;
  unit->ReleaseMission();
  sink.Info(std::string("=== ") + (kind_ == MissionKind::kUrgentDelivery ? "Urgent delivery " : "Rescue mission ") +
            id_ + " completed ===");
}

Unit* Mission::ResolveUnit(std::vector<Unit>& fleet) const {
  if (!assigned_unit_ || *assigned_unit_ >= fleet.size()) return nullptr;
  return &fleet[*assigned_unit_];
}

StepOutcome Mission::Step(std::vector<Unit>& fleet, IReportSink& sink) {
  if (!IsActive()) return StepOutcome::kIdle;

  Unit* unit = ResolveUnit(fleet);
  if (unit == nullptr) {
    throw IllegalStateError("Mission " + id_ + " refers to a unit that is not in the fleet");
  }

  if (state_ == MissionState::kAssigned && unit->location() == origin_) {
    Start(unit, sink);
    return StepOutcome::kStarted;
  }
  if (state_ == MissionState::kInProgress && unit->location() == destination_) {
    Complete(unit, sink);
    return StepOutcome::kCompleted;
  }

  sink.Info("Unit " + unit->id() + " en route to " +
            (state_ == MissionState::kAssigned ? origin_ : destination_) + " for mission " + id_);
  return StepOutcome::kEnRoute;
}

std::string Mission::Status(const std::vector<Unit>& fleet) const {
  std::string s = "Mission ID: " + id_ + ", Kind: " + ToString(kind_) + ", Origin: " + origin_ +
                  ", Destination: " + destination_ + ", Payload: " + FormatFixed(payload_kg_, 2) +
                  " kg, State: " + ToString(state_);
  if (assigned_unit_ && *assigned_unit_ < fleet.size()) {
    s += ", Unit: " + fleet[*assigned_unit_].id();
  }
  return s;
}

} // namespace fleet
