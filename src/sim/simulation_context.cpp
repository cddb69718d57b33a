#include "sim/simulation_context.hpp"

#include <algorithm>
#include <utility>

#include "common/errors.hpp"

namespace fleet {

void AddUnit(SimulationContext& ctx, Unit unit, IReportSink& sink) {
  if (FindUnit(ctx, unit.id()) != nullptr) {
    throw ValidationError("Duplicate unit id: " + unit.id());
  }
  const std::string id = unit.id();
  const UnitKind kind = unit.kind();
  ctx.fleet.push_back(std::move(unit));
  sink.Info("Unit " + id + " (" + ToString(kind) + ") added to the fleet");
}

void AddMission(SimulationContext& ctx, Mission mission, IReportSink& sink) {
  if (FindMission(ctx, mission.id()) != nullptr) {
    throw ValidationError("Duplicate mission id: " + mission.id());
  }
  const std::string id = mission.id();
  const MissionKind kind = mission.kind();
  ctx.missions.push_back(std::move(mission));
  sink.Info("Mission " + id + " (" + ToString(kind) + ") added to the queue");
}

const Unit* FindUnit(const SimulationContext& ctx, const std::string& id) {
  for (const auto& u : ctx.fleet) {
    if (u.id() == id) return &u;
  }
  return nullptr;
}

const Mission* FindMission(const SimulationContext& ctx, const std::string& id) {
  for (const auto& m : ctx.missions) {
    if (m.id() == id) return &m;
  }
  return nullptr;
}

bool AllMissionsCompleted(const SimulationContext& ctx) {
  return std::all_of(ctx.missions.begin(), ctx.missions.end(),
                     [](const Mission& m) { return m.completed(); });
}

} // namespace fleet
