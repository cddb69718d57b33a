#pragma once
#include <string>

#include "common/report_sink.hpp"
#include "sim/simulation_context.hpp"

namespace fleet {

// 能力演练：按插入顺序，把每个单元移动到 destination，
// 然后依次调用它具备的每个能力动作（Drive / Fly / Navigate / EnableAutonomy），
// 最后输出状态。
// 会改变单元位置（因此也会影响之后的调度），只在配置显式开启时运行。
void ExerciseCapabilities(SimulationContext& ctx, const std::string& destination, IReportSink& sink);

} // namespace fleet
