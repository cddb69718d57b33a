#include "io/scenario_io.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "common/errors.hpp"

namespace fs = std::filesystem;

namespace fleet::io {

using json = nlohmann::json;

static std::string ReadAllText(const fs::path& p) {
  std::ifstream ifs(p, std::ios::in | std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("Failed to open file: " + p.string());
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

static json ParseJson(const std::string& text, const std::string& hint) {
  try {
    return json::parse(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("JSON parse failed for " + hint + ": " + std::string(e.what()));
  }
}

// --------- typed field access (error message names the field) ---------

static const json& RequireField(const json& obj, const char* key, const std::string& where) {
  if (!obj.is_object() || !obj.contains(key)) {
    throw std::runtime_error("Missing field '" + std::string(key) + "' in " + where);
  }
  return obj.at(key);
}

static std::string RequireString(const json& obj, const char* key, const std::string& where) {
  const json& v = RequireField(obj, key, where);
  if (!v.is_string()) {
    throw std::runtime_error("Field '" + std::string(key) + "' in " + where + " must be a string");
  }
  return v.get<std::string>();
}

static double RequireNumber(const json& obj, const char* key, const std::string& where) {
  const json& v = RequireField(obj, key, where);
  if (!v.is_number()) {
    throw std::runtime_error("Field '" + std::string(key) + "' in " + where + " must be a number");
  }
  return v.get<double>();
}

template <typename T>
static T OptionalValue(const json& obj, const char* key, const T& fallback, const std::string& where) {
  if (!obj.contains(key)) return fallback;
  try {
    return obj.at(key).get<T>();
  } catch (const json::exception& e) {
    throw std::runtime_error("Field '" + std::string(key) + "' in " + where + " has wrong type: " + e.what());
  }
}

static Unit ParseUnit(const json& ju, const std::string& where) {
  return Unit(ParseUnitKind(RequireString(ju, "kind", where)),
              RequireString(ju, "id", where),
              RequireNumber(ju, "capacity_kg", where),
              RequireString(ju, "location", where));
}

static Mission ParseMission(const json& jm, const std::string& where) {
  return Mission(ParseMissionKind(RequireString(jm, "kind", where)),
                 RequireString(jm, "id", where),
                 RequireString(jm, "origin", where),
                 RequireString(jm, "destination", where),
                 // 救援任务可以没有载荷
                 jm.contains("payload_kg") ? RequireNumber(jm, "payload_kg", where) : 0.0);
}

static SimulationOptions ParseOptions(const json& js, const std::string& where) {
  SimulationOptions opt;
  if (js.is_null()) return opt;
  if (!js.is_object()) {
    throw std::runtime_error("'simulation' in " + where + " must be an object");
  }
  if (js.contains("cycles")) {
    // 不做隐式截断：2.9 或超出 int 的值直接报错
    const json& jc = js.at("cycles");
    if (!jc.is_number_integer()) {
      throw ValidationError("simulation.cycles must be an integer in " + where);
    }
    const bool in_range = jc.is_number_unsigned()
                              ? jc.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                              : jc.get<std::int64_t>() >= 0 &&
                                    jc.get<std::int64_t>() <= static_cast<std::int64_t>(std::numeric_limits<int>::max());
    if (!in_range) {
      throw ValidationError("simulation.cycles must be in [0, " + std::to_string(std::numeric_limits<int>::max()) +
                            "] in " + where + " (got " + jc.dump() + ")");
    }
    opt.cycles = jc.get<int>();
  }
  opt.stop_when_complete = OptionalValue<bool>(js, "stop_when_complete", opt.stop_when_complete, where);
  opt.exercise_capabilities = OptionalValue<bool>(js, "exercise_capabilities", opt.exercise_capabilities, where);
  opt.exercise_destination =
      OptionalValue<std::string>(js, "exercise_destination", opt.exercise_destination, where);
  if (js.contains("report_level")) {
    opt.report_level = ParseReportLevel(OptionalValue<std::string>(js, "report_level", "info", where));
  }
  return opt;
}

Scenario ScenarioIO::ParseScenario(const std::string& text, const std::string& hint, IReportSink& sink) {
  const json root = ParseJson(text, hint);
  if (!root.is_object()) {
    throw std::runtime_error("Scenario root must be an object: " + hint);
  }

  Scenario sc;
  sc.options = ParseOptions(root.value("simulation", json()), hint + ":simulation");

  const json units = root.value("units", json::array());
  if (!units.is_array()) {
    throw std::runtime_error("'units' must be an array in " + hint);
  }
  for (std::size_t i = 0; i < units.size(); ++i) {
    const std::string where = hint + ":units[" + std::to_string(i) + "]";
    AddUnit(sc.ctx, ParseUnit(units[i], where), sink);
  }

  const json missions = root.value("missions", json::array());
  if (!missions.is_array()) {
    throw std::runtime_error("'missions' must be an array in " + hint);
  }
  for (std::size_t i = 0; i < missions.size(); ++i) {
    const std::string where = hint + ":missions[" + std::to_string(i) + "]";
    AddMission(sc.ctx, ParseMission(missions[i], where), sink);
  }

  return sc;
}

Scenario ScenarioIO::LoadScenario(const std::string& path, IReportSink& sink) {
  return ParseScenario(ReadAllText(fs::path(path)), path, sink);
}

} // namespace fleet::io
