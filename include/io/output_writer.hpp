#pragma once
#include <string>
#include <vector>

#include "common/report_sink.hpp"
#include "sim/simulation_context.hpp"

namespace fleet::io {

// OutputWriter 负责把 ctx 中的“最终产物”写到 output_dir：
// 1) report.json：每个周期的快照、调度 notice、最终状态、全部输出行
// 2) missions.csv：最终任务表 id,kind,origin,destination,payload_kg,state,unit
class OutputWriter {
public:
  static void WriteAll(const SimulationContext& ctx, const std::vector<ReportLine>& lines,
                       const std::string& output_dir);

  // 分开暴露接口，方便只写某一种输出进行调试
  static void WriteReportJson(const SimulationContext& ctx, const std::vector<ReportLine>& lines,
                              const std::string& output_path);
  static void WriteMissionsCsv(const SimulationContext& ctx, const std::string& output_path);
};

} // namespace fleet::io
