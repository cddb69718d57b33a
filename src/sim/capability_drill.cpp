#include "sim/capability_drill.hpp"

namespace fleet {

void ExerciseCapabilities(SimulationContext& ctx, const std::string& destination, IReportSink& sink) {
  sink.Info("=== Capability drill ===");
  for (auto& unit : ctx.fleet) {
    sink.Info("Exercising unit " + unit.id());
    unit.MoveTo(destination, sink);
    if (unit.HasCapability(Capability::kGround)) unit.Drive(sink);
    if (unit.HasCapability(Capability::kAir)) unit.Fly(sink);
    if (unit.HasCapability(Capability::kWater)) unit.Navigate(sink);
    if (unit.HasCapability(Capability::kAutonomyCapable)) unit.EnableAutonomy(sink);
    sink.Info("Current status: " + unit.Status());
  }
  sink.Info("=== Capability drill finished ===");
}

} // namespace fleet
