#pragma once
#include <string>

#include "common/report_sink.hpp"
#include "sim/simulation_context.hpp"

namespace fleet::io {

// 运行参数（scenario.json 的 "simulation" 段，全部可缺省）
struct SimulationOptions {
  int cycles{2};
  bool stop_when_complete{false};
  bool exercise_capabilities{false};
  std::string exercise_destination{"Generic Destination"};
  ReportLevel report_level{ReportLevel::kInfo};
};

struct Scenario {
  SimulationContext ctx;
  SimulationOptions options;
};

// ScenarioIO 只负责“把 scenario.json 读进 SimulationContext”。
//
// 结构：
//   {
//     "units":    [ {"id": "AUTO-001", "kind": "ground", "capacity_kg": 500, "location": "Base Central"}, ... ],
//     "missions": [ {"id": "M001", "kind": "urgent_delivery", "origin": "...", "destination": "...",
//                    "payload_kg": 300}, ... ],
//     "simulation": {"cycles": 2, "stop_when_complete": false, "exercise_capabilities": false,
//                    "exercise_destination": "Generic Destination", "report_level": "info"}
//   }
//
// 错误：
//   - 文件打不开 / JSON 语法错 / 缺必填字段 / 字段类型错 -> std::runtime_error（带文件名或字段名）
//   - 字段值非法（空 id、容量 <= 0、未知 kind、重复 id）-> ValidationError
class ScenarioIO {
public:
  // hint 用于错误信息（通常是文件名）
  static Scenario ParseScenario(const std::string& text, const std::string& hint, IReportSink& sink);

  static Scenario LoadScenario(const std::string& path, IReportSink& sink);
};

} // namespace fleet::io
