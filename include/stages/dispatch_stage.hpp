#pragma once
#include "stages/stage_base.hpp"

namespace fleet {

// ======================
// 环节 1：调度
//
// 输入：
//   ctx.missions 中 state == Pending 且未分配的任务（按插入顺序）
//   ctx.fleet
//
// 输出：
//   命中的任务 -> Assigned，Mission::assigned_unit / Unit::current_mission_id 写好
//   未命中的任务 -> ctx.notices 追加一条
//
// 备注：
//   - 同一周期内先分配的任务会让后面的任务看到该单元“忙”。
// ======================
class DispatchStage final : public IStage {
public:
  void Run(SimulationContext& ctx, IReportSink& sink) override;
};

} // namespace fleet
