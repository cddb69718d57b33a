#include <iostream>
#include <string>

#include "common/report_sink.hpp"
#include "io/output_writer.hpp"
#include "io/scenario_io.hpp"
#include "sim/capability_drill.hpp"
#include "sim/simulation_loop.hpp"

int main(int argc, char** argv) {
  // 默认使用 demo/input/scenario.json 和 demo/output
  //   ./fleet_dispatch
  // 或指定路径：
  //   ./fleet_dispatch /path/to/scenario.json /path/to/output
  std::string scenario_path = "demo/input/scenario.json";
  std::string output_dir = "demo/output";

  if (argc >= 2) scenario_path = argv[1];
  if (argc >= 3) output_dir = argv[2];

  try {
    fleet::StreamReportSink console(std::cout);
    fleet::MemoryReportSink memory;
    fleet::TeeReportSink sink(console, memory);

    // 1) 读取场景（单元、任务、运行参数）
    fleet::io::Scenario sc = fleet::io::ScenarioIO::LoadScenario(scenario_path, sink);
    console.set_min_level(sc.options.report_level);

    // 2) 可选：能力演练（会移动单元）
    if (sc.options.exercise_capabilities) {
      fleet::ExerciseCapabilities(sc.ctx, sc.options.exercise_destination, sink);
    }

    // 3) 固定周期数（或全部完成后提前结束）
    fleet::SimulationLoop loop;
    const int ran = loop.RunCycles(sc.ctx, sink, sc.options.cycles, sc.options.stop_when_complete);

    // 4) 输出（report.json + missions.csv）
    fleet::io::OutputWriter::WriteAll(sc.ctx, memory.lines(), output_dir);

    std::cout << "Done. " << ran << " cycle(s) run, output written to: " << output_dir << "\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 1;
  }
}
