#pragma once
#include <cstdint>
#include <ostream>
#include <string>

namespace fleet {

// ========================
// 1) 运输单元：种类 / 能力
// ========================

// 单元种类（创建时确定，之后不变）
enum class UnitKind {
  kGround,
  kAir,
  kWater,
  kAmphibious,
};

// 能力位：一个种类对应一组固定能力
enum class Capability : std::uint8_t {
  kGround          = 1u << 0,
  kAir             = 1u << 1,
  kWater           = 1u << 2,
  kAutonomyCapable = 1u << 3,
};

// 能力集合（位掩码）
struct CapabilitySet {
  std::uint8_t bits{0};

  bool Has(Capability c) const { return (bits & static_cast<std::uint8_t>(c)) != 0; }
  CapabilitySet With(Capability c) const {
    return CapabilitySet{static_cast<std::uint8_t>(bits | static_cast<std::uint8_t>(c))};
  }
};

// 种类 -> 能力集合
//   Ground     : {Ground, AutonomyCapable}
//   Air        : {Air, AutonomyCapable}
//   Water      : {Water}
//   Amphibious : {Ground, Water}
CapabilitySet CapabilitiesOf(UnitKind kind);

// 固定的巡航高度 / 作业深度（单位：m）
constexpr double kCruiseAltitudeM = 100.0;
constexpr double kOperatingDepthM = 50.0;

// ========================
// 2) 任务：种类 / 状态
// ========================

enum class MissionKind {
  kUrgentDelivery,
  kRescue,
};

// 状态只会单调前进：Pending < Assigned < InProgress < Completed
enum class MissionState {
  kPending = 0,
  kAssigned = 1,
  kInProgress = 2,
  kCompleted = 3,
};

// Mission::Step 的结果（一个周期内对该任务做了什么）
enum class StepOutcome {
  kIdle,       // 未分配 / 已完成，不做事
  kStarted,    // Assigned -> InProgress
  kCompleted,  // InProgress -> Completed
  kEnRoute,    // 单元不在期望位置，本周期不迁移
};

// ========================
// 3) 字符串互转（状态输出 / 配置解析）
// ========================

const char* ToString(UnitKind kind);
const char* ToString(Capability cap);
const char* ToString(MissionKind kind);
const char* ToString(MissionState state);
const char* ToString(StepOutcome outcome);

// 配置里使用的名字："ground" / "air" / "water" / "amphibious"
// 未知名字抛 ValidationError
UnitKind ParseUnitKind(const std::string& text);
// "urgent_delivery" / "rescue"
MissionKind ParseMissionKind(const std::string& text);

// 固定小数位格式化（状态字符串里的 kg / m）
std::string FormatFixed(double value, int digits);

inline std::ostream& operator<<(std::ostream& os, UnitKind v) { return os << ToString(v); }
inline std::ostream& operator<<(std::ostream& os, MissionKind v) { return os << ToString(v); }
inline std::ostream& operator<<(std::ostream& os, MissionState v) { return os << ToString(v); }
inline std::ostream& operator<<(std::ostream& os, StepOutcome v) { return os << ToString(v); }

} // namespace fleet
