#include "stages/progression_stage.hpp"

#include "common/errors.hpp"

namespace fleet {

void ProgressionStage::Run(SimulationContext& ctx, IReportSink& sink) {
  for (auto& mission : ctx.missions) {
    if (mission.completed() || !mission.assigned_unit()) continue;
    try {
      mission.Step(ctx.fleet, sink);
    } catch (const FleetError& e) {
      sink.Error("Mission " + mission.id() + " could not progress: " + e.what());
    }
  }
}

} // namespace fleet
