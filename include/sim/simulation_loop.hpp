#pragma once
#include <memory>
#include <vector>

#include "common/report_sink.hpp"
#include "sim/simulation_context.hpp"
#include "stages/stage_base.hpp"

namespace fleet {

// SimulationLoop 负责把一个周期内的各 Stage 按固定顺序串起来：
//   调度 -> 任务推进 -> 状态快照
// 单线程、同步；ctx 由驱动程序拥有并在周期之间保留。
class SimulationLoop {
public:
  SimulationLoop();

  // 执行一个周期（ctx.cycle 先 +1）
  void RunCycle(SimulationContext& ctx, IReportSink& sink);

  // 最多执行 max_cycles 个周期，返回实际执行数。
  // stop_when_complete 为 true 时，所有任务完成后提前结束（无任务时一个周期也不跑）。
  int RunCycles(SimulationContext& ctx, IReportSink& sink, int max_cycles, bool stop_when_complete = false);

private:
  std::vector<std::unique_ptr<IStage>> stages_;
};

} // namespace fleet
