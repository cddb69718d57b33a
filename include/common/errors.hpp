#pragma once
#include <stdexcept>
#include <string>

namespace fleet {

// 所有调度核心抛出的异常都派生自 FleetError（std::runtime_error），
// 驱动程序统一在最外层 catch std::exception。
class FleetError : public std::runtime_error {
public:
  explicit FleetError(const std::string& what) : std::runtime_error(what) {}
};

// 构造参数非法：id 为空/空白、容量 <= 0、载荷为负 ...
class ValidationError : public FleetError {
public:
  explicit ValidationError(const std::string& what) : FleetError(what) {}
};

// 装载量超过单元容量
class CapacityExceededError : public FleetError {
public:
  CapacityExceededError(const std::string& unit_id, double amount_kg, double capacity_kg);

  double amount_kg() const { return amount_kg_; }
  double capacity_kg() const { return capacity_kg_; }

private:
  double amount_kg_{0.0};
  double capacity_kg_{0.0};
};

// 操作与当前状态不符：无单元时启动任务、单元缺少对应能力 ...
class IllegalStateError : public FleetError {
public:
  explicit IllegalStateError(const std::string& what) : FleetError(what) {}
};

} // namespace fleet
