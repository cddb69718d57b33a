#pragma once
#include "common/report_sink.hpp"
#include "sim/simulation_context.hpp"

namespace fleet {

// 一个仿真周期由若干 Stage 顺序组成，输入输出都通过 SimulationContext 传递，
// 动作文本统一写到 sink。
// SimulationLoop 只关心顺序，替换某个 Stage 的内部策略不影响其它 Stage。
class IStage {
public:
  virtual ~IStage() = default;
  virtual void Run(SimulationContext& ctx, IReportSink& sink) = 0;
};

} // namespace fleet
