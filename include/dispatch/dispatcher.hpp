#pragma once
#include <cstddef>
#include <optional>
#include <vector>

#include "common/report_sink.hpp"
#include "missions/mission.hpp"
#include "sim/simulation_context.hpp"
#include "units/unit.hpp"

namespace fleet {

// ======================
// 调度器：为一个未分配的 Pending 任务挑选单元
//
// 规则（贪心，首个命中即选中，结果只取决于插入顺序）：
//   1) unit.location == mission.origin
//   2) 该单元不是任何“其它” Active（Assigned/InProgress）任务的 assigned_unit
//      （扫描完整任务列表）
//
// 找不到时任务保持 Pending，记录 DispatchNotice 并以 warn 级别输出，下周期重试。
// ======================
class Dispatcher {
public:
  // 单元是否被 mission_index 以外的 Active 任务占用
  static bool IsUnitBusy(const std::vector<Mission>& missions, std::size_t unit_index,
                         std::optional<std::size_t> exclude_mission = std::nullopt);

  // 纯查询：返回 fleet 下标，找不到返回 nullopt
  static std::optional<std::size_t> SelectUnit(const std::vector<Unit>& fleet,
                                               const std::vector<Mission>& missions,
                                               std::size_t mission_index);

  // 选中则调用 Mission::Assign 并返回 true；
  // 任务已分配/已完成时直接返回 false（不记 notice）
  static bool Dispatch(SimulationContext& ctx, std::size_t mission_index, IReportSink& sink);
};

} // namespace fleet
