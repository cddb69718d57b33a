#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "common/report_sink.hpp"
#include "common/types.hpp"
#include "missions/mission.hpp"
#include "units/unit.hpp"

namespace fleet {

// ========================
// 调度器报告的“本周期无可用单元”（非致命，下周期重试）
// ========================
struct DispatchNotice {
  int cycle{0};
  std::string mission_id;
  std::string origin;
};

// ========================
// 周期快照（StatusReportStage 输出）
// ========================
struct UnitSnapshot {
  std::string id;
  UnitKind kind{UnitKind::kGround};
  std::string location;
  std::string mission_id;  // 空表示空闲
  std::string status;      // Unit::Status()
};

struct MissionSnapshot {
  std::string id;
  MissionKind kind{MissionKind::kUrgentDelivery};
  MissionState state{MissionState::kPending};
  std::string unit_id;     // 空表示未分配
  std::string status;      // Mission::Status()
};

struct CycleSnapshot {
  int cycle{0};
  std::vector<UnitSnapshot> units;
  std::vector<MissionSnapshot> missions;
};

// ========================
// 一次仿真的全部状态（各 Stage 之间传递的“接口载体”）
//
// fleet / missions 是唯一拥有者；插入顺序即调度与推进的遍历顺序。
// 任务通过下标引用单元，因此单元只追加、不删除。
// 不同仿真实例之间不得共享 Unit / Mission。
// ========================
struct SimulationContext {
  std::vector<Unit> fleet;
  std::vector<Mission> missions;

  int cycle{0};  // 已开始的周期数（第一个周期为 1）

  // 每个周期都会追加，从不裁剪：内存随周期数线性增长。
  // 驱动程序按固定周期数运行；若改为无上限运行，需要由调用方定期清理。
  std::vector<DispatchNotice> notices;
  std::vector<CycleSnapshot> snapshots;
};

// 追加单元/任务并输出一行；id 重复时抛 ValidationError
void AddUnit(SimulationContext& ctx, Unit unit, IReportSink& sink);
void AddMission(SimulationContext& ctx, Mission mission, IReportSink& sink);

// 找不到返回 nullptr
const Unit* FindUnit(const SimulationContext& ctx, const std::string& id);
const Mission* FindMission(const SimulationContext& ctx, const std::string& id);

bool AllMissionsCompleted(const SimulationContext& ctx);

} // namespace fleet
