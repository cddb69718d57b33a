#include "tests/test_framework.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "common/errors.hpp"
#include "common/report_sink.hpp"
#include "missions/mission.hpp"
#include "units/unit.hpp"

// =========================
// Mission tests: 任务状态机
// =========================

namespace {

using fleet::MemoryReportSink;
using fleet::Mission;
using fleet::MissionKind;
using fleet::MissionState;
using fleet::StepOutcome;
using fleet::Unit;
using fleet::UnitKind;

void PrintBanner(const std::string& title) {
  std::cout << "\n";
  std::cout << "============================================================\n";
  std::cout << title << "\n";
  std::cout << "============================================================\n";
  std::cout << std::fixed << std::setprecision(2);
}

void DumpLines(const MemoryReportSink& sink) {
  for (const auto& l : sink.lines()) {
    std::cout << "  [" << fleet::ToString(l.level) << "] " << l.text << "\n";
  }
}

bool Test_Construction_Validation() {
  PrintBanner("Mission: construction validation");
  FLEET_EXPECT_THROW(Mission(MissionKind::kUrgentDelivery, "", "A", "B", 1.0), fleet::ValidationError);
  FLEET_EXPECT_THROW(Mission(MissionKind::kRescue, " ", "A", "B", 1.0), fleet::ValidationError);
  FLEET_EXPECT_THROW(Mission(MissionKind::kRescue, "M9", "A", "B", -1.0), fleet::ValidationError);

  // 无载荷的救援任务是合法的
  Mission m(MissionKind::kRescue, "M002", "Hangar Norte", "Zona de Desastre", 0.0);
  FLEET_EXPECT_EQ(m.state(), MissionState::kPending);
  FLEET_EXPECT_TRUE(!m.assigned_unit().has_value());
  FLEET_EXPECT_TRUE(!m.completed());
  return true;
}

bool Test_UrgentDelivery_FullLifecycle() {
  PrintBanner("Mission: urgent delivery lifecycle");
  MemoryReportSink sink;
  std::vector<Unit> units;
  units.emplace_back(UnitKind::kGround, "AUTO-001", 500.0, "Base Central");
  Mission m(MissionKind::kUrgentDelivery, "M001", "Base Central", "Centro de Distribución", 300.0);

  // 未分配时 Step 不做事
  FLEET_EXPECT_EQ(m.Step(units, sink), StepOutcome::kIdle);

  m.Assign(0, units[0], sink);
  FLEET_EXPECT_EQ(m.state(), MissionState::kAssigned);
  FLEET_EXPECT_EQ(units[0].current_mission_id().value_or(""), std::string("M001"));

  FLEET_EXPECT_EQ(m.Step(units, sink), StepOutcome::kStarted);
  FLEET_EXPECT_EQ(m.state(), MissionState::kInProgress);
  FLEET_EXPECT_EQ(units[0].location(), std::string("Centro de Distribución"));
  FLEET_EXPECT_TRUE(!units[0].last_unloaded_kg().has_value());

  FLEET_EXPECT_EQ(m.Step(units, sink), StepOutcome::kCompleted);
  FLEET_EXPECT_EQ(m.state(), MissionState::kCompleted);
  FLEET_EXPECT_TRUE(m.completed());
  FLEET_EXPECT_NEAR(units[0].last_unloaded_kg().value_or(-1.0), 300.0, 1e-12);
  FLEET_EXPECT_TRUE(!units[0].current_mission_id().has_value());

  // Completed 是吸收态
  FLEET_EXPECT_EQ(m.Step(units, sink), StepOutcome::kIdle);
  FLEET_EXPECT_EQ(m.state(), MissionState::kCompleted);
  DumpLines(sink);
  return true;
}

bool Test_Start_WithoutUnit_IllegalState() {
  PrintBanner("Mission: start without unit");
  MemoryReportSink sink;
  Mission urgent(MissionKind::kUrgentDelivery, "M001", "A", "B", 1.0);
  Mission rescue(MissionKind::kRescue, "M002", "A", "B", 0.0);

  FLEET_EXPECT_THROW(urgent.Start(nullptr, sink), fleet::IllegalStateError);
  FLEET_EXPECT_THROW(rescue.Start(nullptr, sink), fleet::IllegalStateError);
  FLEET_EXPECT_EQ(urgent.state(), MissionState::kPending);
  FLEET_EXPECT_EQ(rescue.state(), MissionState::kPending);
  return true;
}

bool Test_Assign_OnlyFromPending() {
  PrintBanner("Mission: assign only from Pending");
  MemoryReportSink sink;
  std::vector<Unit> units;
  units.emplace_back(UnitKind::kGround, "U1", 100.0, "A");
  units.emplace_back(UnitKind::kGround, "U2", 100.0, "A");
  Mission m(MissionKind::kUrgentDelivery, "M1", "A", "B", 1.0);

  m.Assign(0, units[0], sink);
  FLEET_EXPECT_THROW(m.Assign(1, units[1], sink), fleet::IllegalStateError);
  FLEET_EXPECT_EQ(m.assigned_unit().value_or(99), static_cast<std::size_t>(0));
  FLEET_EXPECT_TRUE(!units[1].current_mission_id().has_value());
  return true;
}

bool Test_Rescue_TogglesAutonomyOnGround() {
  PrintBanner("Mission: rescue with autonomy-capable ground unit");
  MemoryReportSink sink;
  std::vector<Unit> units;
  units.emplace_back(UnitKind::kGround, "AUTO-002", 500.0, "Base");
  Mission m(MissionKind::kRescue, "R1", "Base", "Flood Zone", 80.0);

  m.Assign(0, units[0], sink);
  FLEET_EXPECT_EQ(m.Step(units, sink), StepOutcome::kStarted);
  FLEET_EXPECT_TRUE(units[0].autonomy_enabled());
  FLEET_EXPECT_EQ(units[0].location(), std::string("Flood Zone"));

  FLEET_EXPECT_EQ(m.Step(units, sink), StepOutcome::kCompleted);
  FLEET_EXPECT_TRUE(!units[0].autonomy_enabled());
  FLEET_EXPECT_NEAR(units[0].last_loaded_kg().value_or(-1.0), 80.0, 1e-12);
  DumpLines(sink);
  return true;
}

bool Test_Rescue_WithAirUnit_RefusalIsNotAnError() {
  PrintBanner("Mission: rescue with air unit");
  MemoryReportSink sink;
  std::vector<Unit> units;
  units.emplace_back(UnitKind::kAir, "DRON-001", 10.0, "Hangar Norte");
  Mission m(MissionKind::kRescue, "M002", "Hangar Norte", "Zona de Desastre", 0.0);

  m.Assign(0, units[0], sink);
  m.Step(units, sink);
  m.Step(units, sink);
  DumpLines(sink);
  FLEET_EXPECT_EQ(m.state(), MissionState::kCompleted);
  FLEET_EXPECT_TRUE(units[0].autonomy_enabled());
  FLEET_EXPECT_TRUE(sink.Contains("cannot disable autonomy"));
  FLEET_EXPECT_EQ(sink.Count(fleet::ReportLevel::kError), static_cast<std::size_t>(0));
  return true;
}

bool Test_Rescue_WithoutAutonomyCapability() {
  PrintBanner("Mission: rescue with amphibious unit");
  MemoryReportSink sink;
  std::vector<Unit> units;
  units.emplace_back(UnitKind::kAmphibious, "ANF-001", 800.0, "Base Mixta");
  Mission m(MissionKind::kRescue, "M004", "Base Mixta", "Playa Accidentada", 5.0);

  m.Assign(0, units[0], sink);
  FLEET_EXPECT_EQ(m.Step(units, sink), StepOutcome::kStarted);
  FLEET_EXPECT_EQ(m.Step(units, sink), StepOutcome::kCompleted);
  FLEET_EXPECT_TRUE(!sink.Contains("autonomy"));
  FLEET_EXPECT_NEAR(units[0].last_loaded_kg().value_or(-1.0), 5.0, 1e-12);
  return true;
}

bool Test_Rescue_OverCapacity_CompletesAndReleasesUnit() {
  PrintBanner("Mission: rescue payload above capacity");
  MemoryReportSink sink;
  std::vector<Unit> units;
  units.emplace_back(UnitKind::kAir, "DRON-002", 10.0, "H");
  Mission m(MissionKind::kRescue, "R9", "H", "Z", 50.0);

  m.Assign(0, units[0], sink);
  m.Step(units, sink);
  FLEET_EXPECT_EQ(m.state(), MissionState::kInProgress);

  // 装载失败只报错，任务结束
  FLEET_EXPECT_EQ(m.Step(units, sink), StepOutcome::kCompleted);
  DumpLines(sink);
  FLEET_EXPECT_EQ(m.state(), MissionState::kCompleted);
  FLEET_EXPECT_TRUE(!units[0].current_mission_id().has_value());
  FLEET_EXPECT_TRUE(!units[0].last_loaded_kg().has_value());
  FLEET_EXPECT_EQ(sink.Count(fleet::ReportLevel::kError), static_cast<std::size_t>(1));
  FLEET_EXPECT_TRUE(sink.Contains("exceeds capacity of unit DRON-002"));

  // 吸收态：之后不会再报错
  FLEET_EXPECT_EQ(m.Step(units, sink), StepOutcome::kIdle);
  FLEET_EXPECT_EQ(sink.Count(fleet::ReportLevel::kError), static_cast<std::size_t>(1));
  return true;
}

bool Test_EnRoute_NoTransition() {
  PrintBanner("Mission: unit elsewhere -> en route");
  MemoryReportSink sink;
  std::vector<Unit> units;
  units.emplace_back(UnitKind::kWater, "SUB-001", 2000.0, "Puerto Este");
  Mission m(MissionKind::kUrgentDelivery, "M003", "Puerto Este", "Isla Remota", 1500.0);

  m.Assign(0, units[0], sink);
  // 分配后单元被外力移走
  units[0].MoveTo("Somewhere Else", sink);
  sink.Clear();

  FLEET_EXPECT_EQ(m.Step(units, sink), StepOutcome::kEnRoute);
  FLEET_EXPECT_EQ(m.state(), MissionState::kAssigned);
  FLEET_EXPECT_TRUE(sink.Contains("SUB-001 en route"));

  // 回到起点后可以启动
  units[0].MoveTo("Puerto Este", sink);
  FLEET_EXPECT_EQ(m.Step(units, sink), StepOutcome::kStarted);

  // InProgress 时单元被移走：同样不迁移
  units[0].MoveTo("Puerto Este", sink);
  FLEET_EXPECT_EQ(m.Step(units, sink), StepOutcome::kEnRoute);
  FLEET_EXPECT_EQ(m.state(), MissionState::kInProgress);
  DumpLines(sink);
  return true;
}

bool Test_SameOriginAndDestination_TakesTwoSteps() {
  PrintBanner("Mission: origin == destination");
  MemoryReportSink sink;
  std::vector<Unit> units;
  units.emplace_back(UnitKind::kGround, "U1", 100.0, "Yard");
  Mission m(MissionKind::kUrgentDelivery, "M1", "Yard", "Yard", 10.0);

  m.Assign(0, units[0], sink);
  FLEET_EXPECT_EQ(m.Step(units, sink), StepOutcome::kStarted);
  FLEET_EXPECT_EQ(m.state(), MissionState::kInProgress);
  FLEET_EXPECT_EQ(m.Step(units, sink), StepOutcome::kCompleted);
  return true;
}

bool Test_Status_String() {
  PrintBanner("Mission: status string");
  MemoryReportSink sink;
  std::vector<Unit> units;
  units.emplace_back(UnitKind::kGround, "AUTO-001", 500.0, "Base Central");
  Mission m(MissionKind::kUrgentDelivery, "M001", "Base Central", "Depot", 300.0);

  std::cout << m.Status(units) << "\n";
  FLEET_EXPECT_EQ(m.Status(units),
                  std::string("Mission ID: M001, Kind: UrgentDelivery, Origin: Base Central, Destination: Depot, "
                              "Payload: 300.00 kg, State: Pending"));
  m.Assign(0, units[0], sink);
  std::cout << m.Status(units) << "\n";
  FLEET_EXPECT_TRUE(m.Status(units).find("State: Assigned, Unit: AUTO-001") != std::string::npos);
  return true;
}

} // namespace

int main() {
  using fleet::test::TestCase;

  std::vector<TestCase> cases = {
      {"Mission: construction validation", Test_Construction_Validation},
      {"Mission: urgent delivery full lifecycle", Test_UrgentDelivery_FullLifecycle},
      {"Mission: start without unit is illegal", Test_Start_WithoutUnit_IllegalState},
      {"Mission: assign only from Pending", Test_Assign_OnlyFromPending},
      {"Mission: rescue toggles ground autonomy", Test_Rescue_TogglesAutonomyOnGround},
      {"Mission: rescue with air unit", Test_Rescue_WithAirUnit_RefusalIsNotAnError},
      {"Mission: rescue without autonomy capability", Test_Rescue_WithoutAutonomyCapability},
      {"Mission: rescue over capacity completes and releases unit", Test_Rescue_OverCapacity_CompletesAndReleasesUnit},
      {"Mission: en route means no transition", Test_EnRoute_NoTransition},
      {"Mission: origin == destination takes two steps", Test_SameOriginAndDestination_TakesTwoSteps},
      {"Mission: status string", Test_Status_String},
  };

  return fleet::test::RunAll(cases);
}
