#pragma once
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cs {

struct ReportRow {
  std::string id;
  std::string timestamp;
  std::string sender;
  std::string content;
  std::string type;
  bool self = false;   // sender == user_identity
};

struct ReportShare {
  std::string label;     // sender or weekday
  std::string count;
  std::string percent;   // "60.0"
};

// Everything report.mustache can see.
struct ReportView {
  std::string title = "Chat transcript";
  std::string source;
  std::string user_identity;
  std::string reference_timezone;
  std::vector<std::pair<std::string, std::string>> stats;  // label -> value
  std::vector<std::pair<std::string, std::string>> chat_stats;
  std::vector<ReportShare> sender_shares;
  std::vector<ReportShare> weekday_shares;
  std::vector<ReportRow> rows;
  std::vector<std::string> senders;
};

class MustacheRenderer {
public:
  struct Config {
    std::string template_dir = "templates";
    std::string partials_dir = "templates/partials";
    std::vector<std::string> static_css;
  };

  MustacheRenderer();
  explicit MustacheRenderer(Config cfg);

  bool render_to_file(std::string_view template_name,
                      const ReportView& view,
                      std::string_view out_path);

  bool render_to_dir(std::string_view template_name,
                     const ReportView& view,
                     std::string_view out_dir,
                     std::string_view out_name,
                     bool copy_assets);

  const std::string& error() const { return err_; }

private:
  Config cfg_;
  std::string err_;
};

}
