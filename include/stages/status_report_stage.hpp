#pragma once
#include "stages/stage_base.hpp"

namespace fleet {

// ======================
// 环节 3：状态快照
//
// 输出：
//   ctx.snapshots 追加一条 CycleSnapshot（全部单元 + 全部任务）
//   每个单元/任务的状态字符串写到 sink
// ======================
class StatusReportStage final : public IStage {
public:
  void Run(SimulationContext& ctx, IReportSink& sink) override;

  // 纯读取，供测试和输出复用
  static CycleSnapshot TakeSnapshot(const SimulationContext& ctx);
};

} // namespace fleet
