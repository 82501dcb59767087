#include "chat_segmenter/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace cs {

void MetricsRegistry::reset() {
  lines_ = bytes_ = headers_ = system_lines_ = 0;
  continuations_ = orphans_ = messages_ = ts_errors_ = 0;
  stage_accum_ms_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::start_stage(std::string_view name) {
  stage_starts_[std::string(name)] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_ms_[key] += static_cast<std::uint64_t>(ms);
  stage_starts_.erase(it);
}

ScanStats MetricsRegistry::snapshot(double wall_ms) const {
  ScanStats s;
  s.lines = lines_;
  s.bytes = bytes_;
  s.headers = headers_;
  s.system_lines = system_lines_;
  s.continuations = continuations_;
  s.orphan_lines = orphans_;
  s.messages = messages_;
  s.timestamp_errors = ts_errors_;
  s.wall_time_ms = wall_ms;
  s.lines_per_sec = (wall_ms > 0.0) ? lines_ / (wall_ms / 1000.0) : 0.0;

  s.stages.reserve(stage_accum_ms_.size());
  for (auto& kv : stage_accum_ms_) s.stages.push_back(StageTiming{kv.first, kv.second});
  std::sort(s.stages.begin(), s.stages.end(),
            [](const StageTiming& a, const StageTiming& b){ return a.name < b.name; });
  return s;
}

}
