#include "stages/status_report_stage.hpp"

#include <utility>

namespace fleet {

CycleSnapshot StatusReportStage::TakeSnapshot(const SimulationContext& ctx) {
  CycleSnapshot snap;
  snap.cycle = ctx.cycle;

  snap.units.reserve(ctx.fleet.size());
  for (const auto& u : ctx.fleet) {
    UnitSnapshot us;
    us.id = u.id();
    us.kind = u.kind();
    us.location = u.location();
    us.mission_id = u.current_mission_id().value_or("");
    us.status = u.Status();
    snap.units.push_back(std::move(us));
  }

  snap.missions.reserve(ctx.missions.size());
  for (const auto& m : ctx.missions) {
    MissionSnapshot ms;
    ms.id = m.id();
    ms.kind = m.kind();
    ms.state = m.state();
    if (m.assigned_unit() && *m.assigned_unit() < ctx.fleet.size()) {
      ms.unit_id = ctx.fleet[*m.assigned_unit()].id();
    }
    ms.status = m.Status(ctx.fleet);
    snap.missions.push_back(std::move(ms));
  }
  return snap;
}

void StatusReportStage::Run(SimulationContext& ctx, IReportSink& sink) {
  CycleSnapshot snap = TakeSnapshot(ctx);

  sink.Info("--- Unit status ---");
  for (const auto& u : snap.units) sink.Info(u.status);
  sink.Info("--- Mission status ---");
  for (const auto& m : snap.missions) sink.Info(m.status);

  ctx.snapshots.push_back(std::move(snap));
}

} // namespace fleet
