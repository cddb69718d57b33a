#pragma once
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace fleet {

enum class ReportLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* ToString(ReportLevel level);
// "debug" / "info" / "warn" / "error"，未知名字抛 ValidationError
ReportLevel ParseReportLevel(const std::string& text);

// 输出汇：调度核心里每个有意义的动作（分配、移动、装卸、自主模式切换、周期开始/结束）
// 都通过它输出一行可读文本。
// 核心代码只依赖这个接口，不依赖具体输出方式；没有全局 logger，调用方显式传入。
class IReportSink {
public:
  virtual ~IReportSink() = default;
  virtual void Emit(ReportLevel level, const std::string& text) = 0;

  void Debug(const std::string& text) { Emit(ReportLevel::kDebug, text); }
  void Info(const std::string& text) { Emit(ReportLevel::kInfo, text); }
  void Warn(const std::string& text) { Emit(ReportLevel::kWarn, text); }
  void Error(const std::string& text) { Emit(ReportLevel::kError, text); }
};

// 写到 std::ostream："[INFO] ..."，低于 min_level 的行丢弃
class StreamReportSink final : public IReportSink {
public:
  explicit StreamReportSink(std::ostream& os, ReportLevel min_level = ReportLevel::kInfo)
      : os_(os), min_level_(min_level) {}

  void Emit(ReportLevel level, const std::string& text) override;

  void set_min_level(ReportLevel level) { min_level_ = level; }
  ReportLevel min_level() const { return min_level_; }

private:
  std::ostream& os_;
  ReportLevel min_level_;
};

struct ReportLine {
  ReportLevel level{ReportLevel::kInfo};
  std::string text;
};

// 按顺序保存所有行（测试断言 / 写 report.json 用）
class MemoryReportSink final : public IReportSink {
public:
  void Emit(ReportLevel level, const std::string& text) override;

  const std::vector<ReportLine>& lines() const { return lines_; }
  void Clear() { lines_.clear(); }

  // 是否存在包含 needle 的行
  bool Contains(const std::string& needle) const;
  std::size_t Count(ReportLevel level) const;

private:
  std::vector<ReportLine> lines_;
};

// 同时写到两个 sink（驱动程序：控制台 + 内存）
class TeeReportSink final : public IReportSink {
public:
  TeeReportSink(IReportSink& a, IReportSink& b) : a_(a), b_(b) {}

  void Emit(ReportLevel level, const std::string& text) override {
    a_.Emit(level, text);
    b_.Emit(level, text);
  }

private:
  IReportSink& a_;
  IReportSink& b_;
};

} // namespace fleet
