#include "sim/simulation_loop.hpp"

#include <string>

// 具体 Stage
#include "stages/dispatch_stage.hpp"
#include "stages/progression_stage.hpp"
#include "stages/status_report_stage.hpp"

namespace fleet {

SimulationLoop::SimulationLoop() {
  stages_.emplace_back(std::make_unique<DispatchStage>());
  stages_.emplace_back(std::make_unique<ProgressionStage>());
  stages_.emplace_back(std::make_unique<StatusReportStage>());
}

void SimulationLoop::RunCycle(SimulationContext& ctx, IReportSink& sink) {
  ++ctx.cycle;
  sink.Info("=== Simulation cycle " + std::to_string(ctx.cycle) + " started ===");
  for (auto& stage : stages_) {
    stage->Run(ctx, sink);
  }
  sink.Info("=== Simulation cycle " + std::to_string(ctx.cycle) + " completed ===");
}

int SimulationLoop::RunCycles(SimulationContext& ctx, IReportSink& sink, int max_cycles, bool stop_when_complete) {
  int ran = 0;
  for (; ran < max_cycles; ++ran) {
    if (stop_when_complete && AllMissionsCompleted(ctx)) {
      sink.Info("All missions completed after " + std::to_string(ctx.cycle) + " cycle(s)");
      break;
    }
    RunCycle(ctx, sink);
  }
  return ran;
}

} // namespace fleet
