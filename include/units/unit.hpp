#pragma once
#include <optional>
#include <string>

#include "common/report_sink.hpp"
#include "common/types.hpp"

namespace fleet {

// ======================
// 运输单元（Unit）
//
// 一个类型覆盖所有种类：行为按 kind_ 分派，能力集合由种类决定且创建后不变。
//   Ground     : MoveTo = Drive 后到达；可切换自主模式（默认关闭）
//   Air        : MoveTo = Fly（巡航高度 100 m）后到达；自主模式常开，关闭请求被拒绝
//   Water      : MoveTo = Navigate（作业深度 50 m）后到达
//   Amphibious : MoveTo 根据当前介质（in_water）选择 Navigate / Drive；ToggleMedium 手动切换
//
// 移动是瞬移：MoveTo 返回时 location 已等于目的地。
// 所有动作都向 sink 输出一行文本。
// ======================
class Unit {
public:
  // id 为空/空白、capacity_kg <= 0 时抛 ValidationError（校验先于任何字段写入）
  Unit(UnitKind kind, std::string id, double capacity_kg, std::string location);

  UnitKind kind() const { return kind_; }
  const std::string& id() const { return id_; }
  double capacity_kg() const { return capacity_kg_; }
  const std::string& location() const { return location_; }
  CapabilitySet capabilities() const { return capabilities_; }
  bool HasCapability(Capability c) const { return capabilities_.Has(c); }

  // Air 恒为 true；不具备自主能力的单元恒为 false
  bool autonomy_enabled() const;
  double altitude_m() const { return altitude_m_; }
  double depth_m() const { return depth_m_; }
  bool in_water() const { return in_water_; }

  std::optional<double> last_loaded_kg() const { return last_loaded_kg_; }
  std::optional<double> last_unloaded_kg() const { return last_unloaded_kg_; }

  // 当前服务的任务（非拥有的反向引用，只记 id）
  const std::optional<std::string>& current_mission_id() const { return current_mission_id_; }
  void BindMission(const std::string& mission_id) { current_mission_id_ = mission_id; }
  void ReleaseMission() { current_mission_id_.reset(); }

  void MoveTo(const std::string& destination, IReportSink& sink);

  // amount_kg 为负/非有限值时抛 ValidationError；
  // amount_kg > capacity_kg 时抛 CapacityExceededError；两种情况状态都不变
  void Load(double amount_kg, IReportSink& sink);
  // 不检查是否卸下了比装上更多的货
  void Unload(double amount_kg, IReportSink& sink);

  // 能力动作：缺少对应能力时抛 IllegalStateError
  void Drive(IReportSink& sink);
  void Fly(IReportSink& sink);
  void Navigate(IReportSink& sink);

  // 返回是否真正改变了/确认了自主模式；Air 的 DisableAutonomy 返回 false（拒绝，不抛异常）
  bool EnableAutonomy(IReportSink& sink);
  bool DisableAutonomy(IReportSink& sink);

  // 仅 Amphibious
  void ToggleMedium(IReportSink& sink);

  // 纯读取
  std::string Status() const;

private:
  void RequireCapability(Capability c, const char* action) const;

  UnitKind kind_;
  std::string id_;
  double capacity_kg_{0.0};
  std::string location_;
  CapabilitySet capabilities_;

  bool autonomy_enabled_{false};
  double altitude_m_{0.0};
  double depth_m_{0.0};
  bool in_water_{false};

  std::optional<double> last_loaded_kg_;
  std::optional<double> last_unloaded_kg_;
  std::optional<std::string> current_mission_id_;
};

// 空或只含空白字符
bool IsBlank(const std::string& s);

} // namespace fleet
