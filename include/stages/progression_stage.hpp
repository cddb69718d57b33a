#pragma once
#include "stages/stage_base.hpp"

namespace fleet {

// ======================
// 环节 2：任务推进
//
// 输入：
//   ctx.missions 中已分配且未完成的任务
//   每个任务所分配单元的当前位置
//
// 输出：
//   每个任务最多一次状态迁移（Start / Complete / en route）
//
// 备注：
//   - 单个任务推进时抛出的 FleetError（例如任务引用了不在 fleet 中的单元）只影响该任务：
//     以 error 级别输出，任务保持原状态，其它任务继续推进。
// ======================
class ProgressionStage final : public IStage {
public:
  void Run(SimulationContext& ctx, IReportSink& sink) override;
};

} // namespace fleet
