#include "chat_segmenter/artifact_writer.hpp"
#include "chat_segmenter/chat_stats.hpp"
#include "chat_segmenter/date_parse.hpp"
#include "chat_segmenter/mustache_renderer.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace cs {

static std::string fmt_ms(double ms) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.3f", ms);
  return buf;
}

static std::string fmt_1(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f", v);
  return buf;
}

static void add_chat_stats(ReportView& v, const ChatStatistics& c) {
  v.chat_stats = {
    {"messages",         std::to_string(c.total_messages)},
    {"first day",        c.first_date},
    {"last day",         c.last_date},
    {"active days",      std::to_string(c.active_days)},
    {"messages per day", fmt_1(c.avg_messages_per_day)},
    {"busiest day",      c.busiest_day},
    {"quietest day",     c.quietest_day},
    {"busiest hour",     c.total_messages ? std::to_string(c.busiest_hour) + ":00" : std::string()},
  };
  for (const auto& s : c.by_sender)
    v.sender_shares.push_back({s.sender, std::to_string(s.count), fmt_1(s.percentage)});
  if (c.total_messages == 0) return;
  for (int d = 0; d < 7; ++d) {
    const double pct = 100.0 * static_cast<double>(c.by_weekday[d]) / static_cast<double>(c.total_messages);
    v.weekday_shares.push_back({std::string(weekday_name(d)), std::to_string(c.by_weekday[d]), fmt_1(pct)});
  }
}

ReportView make_report_view(const MessagesJsonPayload& payload) {
  ReportView v;
  v.source = payload.source;
  v.user_identity = payload.user_identity;
  v.reference_timezone = payload.reference_timezone;
  if (!payload.source.empty()) v.title = "Chat transcript: " + payload.source;

  const ScanStats& s = payload.stats;
  v.stats = {
    {"lines",            std::to_string(s.lines)},
    {"bytes",            std::to_string(s.bytes)},
    {"messages",         std::to_string(s.messages)},
    {"headers",          std::to_string(s.headers)},
    {"system lines",     std::to_string(s.system_lines)},
    {"continuations",    std::to_string(s.continuations)},
    {"orphan lines",     std::to_string(s.orphan_lines)},
    {"timestamp errors", std::to_string(s.timestamp_errors)},
    {"wall time (ms)",   fmt_ms(s.wall_time_ms)},
  };

  if (payload.messages) add_chat_stats(v, compute_chat_statistics(*payload.messages));

  if (payload.messages) {
    v.rows.reserve(payload.messages->size());
    for (const auto& m : *payload.messages) {
      ReportRow r;
      r.id = std::to_string(m.id);
      r.timestamp = format_rfc3339(m.timestamp.epoch_seconds, m.timestamp.offset_minutes);
      r.sender = m.sender;
      r.content = m.content;
      r.type = std::string(to_string(m.message_type));
      r.self = !payload.user_identity.empty() && m.sender == payload.user_identity;
      v.rows.push_back(std::move(r));

      if (std::find(v.senders.begin(), v.senders.end(), m.sender) == v.senders.end())
        v.senders.push_back(m.sender);
    }
  }
  std::sort(v.senders.begin(), v.senders.end());
  return v;
}

bool write_report_dir(const std::string& artifact_root,
                      const std::string& slug,
                      const MessagesJsonPayload& payload,
                      std::string* err_out) {
  const std::filesystem::path out_dir =
      std::filesystem::path(artifact_root) / slug;

  {
    std::error_code ec;
    std::filesystem::create_directories(out_dir, ec);
    if (ec) {
      if (err_out) *err_out = "mkdir failed: " + out_dir.string() + " (" + ec.message() + ")";
      return false;
    }
    const std::string json = MessagesJsonWriter::to_json(payload);
    std::ofstream mj(out_dir / "messages.json", std::ios::binary);
    if (!mj) {
      if (err_out) *err_out = "failed to write messages.json";
      return false;
    }
    mj.write(json.data(), static_cast<std::streamsize>(json.size()));
  }

  MustacheRenderer::Config rcfg;
#ifdef CS_DEFAULT_TEMPLATE_DIR
  rcfg.template_dir = CS_DEFAULT_TEMPLATE_DIR;
#else
  rcfg.template_dir = "templates";
#endif
  rcfg.partials_dir = rcfg.template_dir + "/partials";
  rcfg.static_css   = {"web/css/report.css"};

  MustacheRenderer renderer(rcfg);
  const bool ok = renderer.render_to_dir("report.mustache",
                                         make_report_view(payload),
                                         out_dir.string(),
                                         "report.html",
                                         /*copy_assets=*/true);
  if (!ok && err_out) *err_out = renderer.error();
  return ok;
}

}
