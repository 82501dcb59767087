#pragma once
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cs {

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct ScanStats {
  std::uint64_t lines = 0;
  std::uint64_t bytes = 0;
  std::uint64_t headers = 0;          // message header lines
  std::uint64_t system_lines = 0;     // notices + filtered system headers
  std::uint64_t continuations = 0;
  std::uint64_t orphan_lines = 0;     // non-header lines with nothing pending
  std::uint64_t messages = 0;
  std::uint64_t timestamp_errors = 0;
  double wall_time_ms = 0.0;
  double lines_per_sec = 0.0;

  std::vector<StageTiming> stages;
};

class MetricsRegistry {
public:
  void reset();
  void add_line() noexcept { ++lines_; }
  void add_bytes(std::uint64_t b) noexcept { bytes_ += b; }
  void add_header() noexcept { ++headers_; }
  void add_system_line() noexcept { ++system_lines_; }
  void add_continuation() noexcept { ++continuations_; }
  void add_orphan() noexcept { ++orphans_; }
  void add_message() noexcept { ++messages_; }
  void add_timestamp_error() noexcept { ++ts_errors_; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  ScanStats snapshot(double wall_ms) const;

private:
  std::uint64_t lines_{0};
  std::uint64_t bytes_{0};
  std::uint64_t headers_{0};
  std::uint64_t system_lines_{0};
  std::uint64_t continuations_{0};
  std::uint64_t orphans_{0};
  std::uint64_t messages_{0};
  std::uint64_t ts_errors_{0};
  std::unordered_map<std::string, std::uint64_t> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
