#include "dispatch/dispatcher.hpp"

#include "common/errors.hpp"

namespace fleet {

bool Dispatcher::IsUnitBusy(const std::vector<Mission>& missions, std::size_t unit_index,
                            std::optional<std::size_t> exclude_mission) {
  for (std::size_t i = 0; i < missions.size(); ++i) {
    if (exclude_mission && *exclude_mission == i) continue;
    const Mission& m = missions[i];
    if (m.IsActive() && m.assigned_unit() && *m.assigned_unit() == unit_index) {
      return true;
    }
  }
  return false;
}

std::optional<std::size_t> Dispatcher::SelectUnit(const std::vector<Unit>& fleet,
                                                  const std::vector<Mission>& missions,
                                                  std::size_t mission_index) {
  const Mission& mission = missions.at(mission_index);
  for (std::size_t u = 0; u < fleet.size(); ++u) {
    if (fleet[u].location() != mission.origin()) continue;
    if (IsUnitBusy(missions, u, mission_index)) continue;
    return u;
  }
  return std::nullopt;
}

bool Dispatcher::Dispatch(SimulationContext& ctx, std::size_t mission_index, IReportSink& sink) {
  if (mission_index >= ctx.missions.size()) {
    throw IllegalStateError("Dispatch: mission index out of range");
  }
  Mission& mission = ctx.missions[mission_index];
  if (mission.state() != MissionState::kPending || mission.assigned_unit()) return false;

  const auto pick = SelectUnit(ctx.fleet, ctx.missions, mission_index);
  if (!pick) {
    ctx.notices.push_back(DispatchNotice{ctx.cycle, mission.id(), mission.origin()});
    sink.Warn("No unit available at " + mission.origin() + " for mission " + mission.id());
    return false;
  }

  mission.Assign(*pick, ctx.fleet[*pick], sink);
  return true;
}

} // namespace fleet
