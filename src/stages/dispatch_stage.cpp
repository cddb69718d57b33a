#include "stages/dispatch_stage.hpp"

#include "dispatch/dispatcher.hpp"

namespace fleet {

void DispatchStage::Run(SimulationContext& ctx, IReportSink& sink) {
  for (std::size_t i = 0; i < ctx.missions.size(); ++i) {
    const Mission& m = ctx.missions[i];
    if (m.state() != MissionState::kPending || m.assigned_unit()) continue;
    Dispatcher::Dispatch(ctx, i, sink);
  }
}

} // namespace fleet
