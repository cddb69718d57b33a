#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "common/report_sink.hpp"
#include "common/types.hpp"
#include "units/unit.hpp"

namespace fleet {

// ======================
// 任务（Mission）
//
// 状态机：
//   Pending    --Assign(unit)-->                        Assigned
//   Assigned   --[unit.location == origin]      Start -> InProgress
//   InProgress --[unit.location == destination] Complete -> Completed
//   Assigned/InProgress 且单元在别处：不迁移（en route）
//
// 两种任务只在 Start/Complete 行为上不同：
//   UrgentDelivery : Start = 单元前往 destination；Complete = 卸下 payload
//   Rescue         : Start = 单元前往 destination，若具备自主能力则开启自主；
//                    Complete = 装载 payload（被救援的人/物），若具备自主能力则关闭自主
//
// 单元由 Fleet 拥有，任务只记它在 Fleet 中的下标（非拥有）。
// ======================
class Mission {
public:
  // id 为空/空白、payload_kg 为负时抛 ValidationError
  Mission(MissionKind kind, std::string id, std::string origin, std::string destination, double payload_kg);

  MissionKind kind() const { return kind_; }
  const std::string& id() const { return id_; }
  const std::string& origin() const { return origin_; }
  const std::string& destination() const { return destination_; }
  double payload_kg() const { return payload_kg_; }
  MissionState state() const { return state_; }
  bool completed() const { return state_ == MissionState::kCompleted; }
  const std::optional<std::size_t>& assigned_unit() const { return assigned_unit_; }

  // Assigned / InProgress
  bool IsActive() const {
    return state_ == MissionState::kAssigned || state_ == MissionState::kInProgress;
  }

  // 仅允许从 Pending 分配，否则抛 IllegalStateError。
  // 同时在单元上记下反向引用。
  void Assign(std::size_t unit_index, Unit& unit, IReportSink& sink);

  // unit == nullptr 时抛 IllegalStateError
  void Start(Unit* unit, IReportSink& sink);
  // 救援装载超载时以 error 级别输出，任务仍然 Completed 并释放单元
  void Complete(Unit* unit, IReportSink& sink);

  // 根据单元当前位置推进一步（最多一次迁移）
  StepOutcome Step(std::vector<Unit>& fleet, IReportSink& sink);

  // 纯读取；fleet 用于解析单元 id
  std::string Status(const std::vector<Unit>& fleet) const;

private:
  Unit* ResolveUnit(std::vector<Unit>& fleet) const;

  MissionKind kind_;
  std::string id_;
  std::string origin_;
  std::string destination_;
  double payload_kg_{0.0};
  MissionState state_{MissionState::kPending};
  std::optional<std::size_t> assigned_unit_;
};

} // namespace fleet
