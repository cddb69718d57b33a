#include "io/output_writer.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "stages/status_report_stage.hpp"

namespace fs = std::filesystem;

namespace fleet::io {

using json = nlohmann::json;

static void EnsureDir(const fs::path& p) {
  if (!fs::exists(p)) {
    fs::create_directories(p);
  }
}

static json SnapshotToJson(const CycleSnapshot& snap) {
  json j;
  j["cycle"] = snap.cycle;
  j["units"] = json::array();
  for (const auto& u : snap.units) {
    j["units"].push_back({
        {"id", u.id},
        {"kind", ToString(u.kind)},
        {"location", u.location},
        {"mission", u.mission_id.empty() ? json() : json(u.mission_id)},
        {"status", u.status},
    });
  }
  j["missions"] = json::array();
  for (const auto& m : snap.missions) {
    j["missions"].push_back({
        {"id", m.id},
        {"kind", ToString(m.kind)},
        {"state", ToString(m.state)},
        {"unit", m.unit_id.empty() ? json() : json(m.unit_id)},
        {"status", m.status},
    });
  }
  return j;
}

void OutputWriter::WriteAll(const SimulationContext& ctx, const std::vector<ReportLine>& lines,
                            const std::string& output_dir) {
  EnsureDir(output_dir);
  WriteReportJson(ctx, lines, (fs::path(output_dir) / "report.json").string());
  WriteMissionsCsv(ctx, (fs::path(output_dir) / "missions.csv").string());
}

void OutputWriter::WriteReportJson(const SimulationContext& ctx, const std::vector<ReportLine>& lines,
                                   const std::string& output_path) {
  json root;
  root["cycles_run"] = ctx.cycle;
  root["all_missions_completed"] = AllMissionsCompleted(ctx);

  root["snapshots"] = json::array();
  for (const auto& snap : ctx.snapshots) root["snapshots"].push_back(SnapshotToJson(snap));

  root["dispatch_notices"] = json::array();
  for (const auto& n : ctx.notices) {
    root["dispatch_notices"].push_back({{"cycle", n.cycle}, {"mission", n.mission_id}, {"origin", n.origin}});
  }

  // 最终状态（即使一个周期都没跑也能输出）
  root["final"] = SnapshotToJson(StatusReportStage::TakeSnapshot(ctx));

  root["log"] = json::array();
  for (const auto& l : lines) {
    root["log"].push_back({{"level", ToString(l.level)}, {"text", l.text}});
  }

  std::ofstream ofs(output_path);
  if (!ofs) throw std::runtime_error("Failed to write: " + output_path);
  ofs << root.dump(2) << "\n";
}

// 含逗号/引号的字段加引号
static std::string CsvField(const std::string& s) {
  if (s.find_first_of(",\"\n") == std::string::npos) return s;
  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

void OutputWriter::WriteMissionsCsv(const SimulationContext& ctx, const std::string& output_path) {
  std::ofstream ofs(output_path);
  if (!ofs) throw std::runtime_error("Failed to write: " + output_path);
  ofs << "id,kind,origin,destination,payload_kg,state,unit\n";
  ofs << std::fixed << std::setprecision(2);
  for (const auto& m : ctx.missions) {
    std::string unit_id;
    if (m.assigned_unit() && *m.assigned_unit() < ctx.fleet.size()) {
      unit_id = ctx.fleet[*m.assigned_unit()].id();
    }
    ofs << CsvField(m.id()) << "," << ToString(m.kind()) << "," << CsvField(m.origin()) << ","
        << CsvField(m.destination()) << "," << m.payload_kg() << "," << ToString(m.state()) << ","
        << CsvField(unit_id) << "\n";
  }
}

} // namespace fleet::io
