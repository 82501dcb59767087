#include "chat_segmenter/mustache_renderer.hpp"
#include "chat_segmenter/path_utils.hpp"

#include <kainjow/mustache.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace cs {

namespace mstch = kainjow::mustache;

MustacheRenderer::MustacheRenderer() : cfg_{} {}

MustacheRenderer::MustacheRenderer(Config cfg) : cfg_(std::move(cfg)) {}

static std::string read_file(const std::string& path, std::string& err) {
  std::ifstream in(path, std::ios::binary);
  if (!in) { err += "open failed: " + path + "\n"; return {}; }
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

// Every <partials_dir>/<name>.mustache becomes the partial {{> name}}.
static void add_partials(mstch::data& d, const std::filesystem::path& dir, std::string& err) {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) return;
  for (const auto& e : std::filesystem::directory_iterator(dir, ec)) {
    if (!e.is_regular_file() || e.path().extension() != ".mustache") continue;
    std::string body = read_file(e.path().string(), err);
    d.set(e.path().stem().string(), mstch::partial{[body]{ return body; }});
  }
}

// Looks for `rel` as given, then under CS_DEFAULT_STATIC_DIR.
static std::filesystem::path locate_asset(const std::filesystem::path& rel) {
  std::error_code ec;
  if (std::filesystem::exists(rel, ec)) return rel;
#ifdef CS_DEFAULT_STATIC_DIR
  const std::filesystem::path base(CS_DEFAULT_STATIC_DIR);
  if (std::filesystem::exists(base / rel.filename(), ec)) return base / rel.filename();
#endif
  return {};
}

// Failures are appended to `err`; a missing stylesheet does not fail the report.
static void copy_asset(const std::filesystem::path& rel,
                       const std::filesystem::path& out_dir,
                       std::string& err) {
  const auto src = locate_asset(rel);
  if (src.empty()) { err += "asset not found: " + rel.string() + "\n"; return; }

  std::error_code ec;
  const auto dst = out_dir / src.filename();
  std::filesystem::copy_file(src, dst, std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    err += "copy failed: " + src.string() + " -> " + dst.string() + " (" + ec.message() + ")\n";
  }
}

static mstch::data to_list(const std::vector<std::pair<std::string, std::string>>& kvs) {
  mstch::data list{mstch::data::type::list};
  for (const auto& kv : kvs) {
    mstch::data s;
    s.set("label", kv.first);
    s.set("value", kv.second);
    list.push_back(s);
  }
  return list;
}

static mstch::data to_list(const std::vector<ReportShare>& shares) {
  mstch::data list{mstch::data::type::list};
  for (const auto& sh : shares) {
    mstch::data s;
    s.set("label", sh.label);
    s.set("count", sh.count);
    s.set("percent", sh.percent);
    list.push_back(s);
  }
  return list;
}

static mstch::data to_data(const ReportView& v) {
  mstch::data d{mstch::data::type::object};
  d.set("title", v.title);
  d.set("source", v.source);
  d.set("user_identity", v.user_identity);
  d.set("has_user_identity", mstch::data{!v.user_identity.empty()});
  d.set("reference_timezone", v.reference_timezone);
  d.set("message_count", std::to_string(v.rows.size()));

  d.set("stats", to_list(v.stats));
  d.set("chat_stats", to_list(v.chat_stats));
  d.set("sender_shares", to_list(v.sender_shares));
  d.set("has_sender_shares", mstch::data{!v.sender_shares.empty()});
  d.set("weekday_shares", to_list(v.weekday_shares));
  d.set("has_weekday_shares", mstch::data{!v.weekday_shares.empty()});

  mstch::data senders{mstch::data::type::list};
  for (const auto& name : v.senders) {
    mstch::data s;
    s.set("name", name);
    senders.push_back(s);
  }
  d.set("senders", senders);

  mstch::data rows{mstch::data::type::list};
  for (const auto& r : v.rows) {
    mstch::data row;
    row.set("id", r.id);
    row.set("timestamp", r.timestamp);
    row.set("sender", r.sender);
    row.set("content", r.content);
    row.set("type", r.type);
    row.set("self", mstch::data{r.self});
    rows.push_back(row);
  }
  d.set("rows", rows);
  return d;
}

bool MustacheRenderer::render_to_file(std::string_view template_name,
                                      const ReportView& view_model,
                                      std::string_view out_path) {
  err_.clear();

  const auto tpl_path =
      (std::filesystem::path(cfg_.template_dir) / std::string(template_name)).string();

  std::string tpl = read_file(tpl_path, err_);
  if (tpl.empty() && !err_.empty()) return false;

  mstch::mustache view(tpl);
  if (!view.is_valid()) { err_ = view.error_message(); return false; }

  mstch::data ctx = to_data(view_model);
  add_partials(ctx, std::filesystem::path(cfg_.partials_dir), err_);

  const std::string rendered = view.render(ctx);
  if (!view.is_valid()) { err_ = view.error_message(); return false; }

  if (!ensure_parent_dirs(std::filesystem::path(out_path))) { err_ = "mkdir -p failed"; return false; }

  std::ofstream out(std::string(out_path), std::ios::binary);
  if (!out) { err_ = "write failed: " + std::string(out_path); return false; }
  out.write(rendered.data(), static_cast<std::streamsize>(rendered.size()));
  return true;
}

bool MustacheRenderer::render_to_dir(std::string_view template_name,
                                     const ReportView& view_model,
                                     std::string_view out_dir,
                                     std::string_view out_name,
                                     bool copy_assets) {
  err_.clear();
  const std::filesystem::path outdir{std::string(out_dir)};
  const std::filesystem::path outpath = outdir / std::string(out_name);

  if (!render_to_file(template_name, view_model, outpath.string())) {
    return false; // err_ set
  }
  if (!copy_assets) return true;

  std::vector<std::string> css = cfg_.static_css.empty()
      ? std::vector<std::string>{"web/css/report.css"}
      : cfg_.static_css;

  for (const auto& s : css) copy_asset(std::filesystem::path(s), outdir, err_);

  return true;
}

}
