#include "common/report_sink.hpp"

#include <algorithm>
#include <cctype>

#include "common/errors.hpp"

namespace fleet {

const char* ToString(ReportLevel level) {
  switch (level) {
    case ReportLevel::kDebug: return "DEBUG";
    case ReportLevel::kInfo: return "INFO";
    case ReportLevel::kWarn: return "WARN";
    case ReportLevel::kError: return "ERROR";
  }
  return "";
}

ReportLevel ParseReportLevel(const std::string& text) {
  std::string t = text;
  std::transform(t.begin(), t.end(), t.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (t == "debug") return ReportLevel::kDebug;
  if (t == "info") return ReportLevel::kInfo;
  if (t == "warn" || t == "warning") return ReportLevel::kWarn;
  if (t == "error") return ReportLevel::kError;
  throw ValidationError("Unknown report level: '" + text + "'");
}

void StreamReportSink::Emit(ReportLevel level, const std::string& text) {
  if (level < min_level_) return;
  os_ << "[" << ToString(level) << "] " << text << "\n";
}

void MemoryReportSink::Emit(ReportLevel level, const std::string& text) {
  lines_.push_back(ReportLine{level, text});
}

bool MemoryReportSink::Contains(const std::string& needle) const {
  return std::any_of(lines_.begin(), lines_.end(),
                     [&](const ReportLine& l) { return l.text.find(needle) != std::string::npos; });
}

std::size_t MemoryReportSink::Count(ReportLevel level) const {
  return static_cast<std::size_t>(std::count_if(
      lines_.begin(), lines_.end(), [&](const ReportLine& l) { return l.level == level; }));
}

} // namespace fleet
