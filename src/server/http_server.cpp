#include "chat_segmenter/http_server.hpp"
#include "chat_segmenter/artifact_writer.hpp"
#include "chat_segmenter/chat_parser.hpp"
#include "chat_segmenter/messages_json.hpp"
#include "chat_segmenter/metrics.hpp"
#include "chat_segmenter/path_utils.hpp"

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace cs {

static constexpr const char* kJson = "application/json; charset=utf-8";

static std::string guess_mime(const std::string& name) {
  auto ends = [&](const char* s){
    const size_t n = std::strlen(s), m = name.size();
    return m >= n && std::equal(s, s+n, name.c_str() + (m - n),
                                [](char a, char b){ return std::tolower(a)==std::tolower(b); });
  };
  if (ends(".html")) return "text/html; charset=utf-8";
  if (ends(".css"))  return "text/css; charset=utf-8";
  if (ends(".json")) return kJson;
  if (ends(".txt"))  return "text/plain; charset=utf-8";
  return "application/octet-stream";
}

static std::string html_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      default:  out += c;
    }
  }
  return out;
}

struct HttpServer::Impl {
  Config cfg;
  ChatParser parser;
  httplib::Server svr;
  int bound_port = -1;

  explicit Impl(Config c) : cfg(std::move(c)), parser(cfg.parser) {}

  std::vector<std::string> slugs() const {
    std::vector<std::string> out;
    std::error_code ec;
    std::filesystem::path root(cfg.artifact_root);
    if (!std::filesystem::exists(root, ec)) return out;
    for (auto& d : std::filesystem::directory_iterator(root, ec)) {
      if (d.is_directory()) out.push_back(d.path().filename().string());
    }
    std::sort(out.begin(), out.end());
    return out;
  }

  std::string index_html() const {
    auto items = slugs();
    const std::string title = html_escape(cfg.index_title);
    std::string html = "<!doctype html><html><head><meta charset='utf-8'><title>";
    html += title + "</title></head><body><h1>" + title + "</h1><ul>";
    for (auto& s : items) {
      const std::string e = html_escape(s);
      html += "<li><a href=\"/reports/" + e + "/report.html\">" + e + "</a></li>";
    }
    html += "</ul></body></html>";
    return html;
  }

  // Serve a file under artifact_root/<slug>/<rel>, preventing traversal.
  void serve_under_slug(const std::string& slug,
                        const std::string& rel,
                        httplib::Response& res) const {
    if (slug.find("..") != std::string::npos || rel.find("..") != std::string::npos) {
      res.status = 400;
      return;
    }

    std::filesystem::path base = std::filesystem::path(cfg.artifact_root) / slug;
    std::error_code ec;
    auto base_canon = std::filesystem::weakly_canonical(base, ec);
    if (ec) { res.status = 404; return; }

    auto target_canon = std::filesystem::weakly_canonical(base_canon / rel, ec);
    if (ec) { res.status = 404; return; }

    auto mismatch = std::mismatch(base_canon.begin(), base_canon.end(),
                                  target_canon.begin(), target_canon.end());
    if (mismatch.first != base_canon.end()) { res.status = 403; return; }

    std::ifstream in(target_canon, std::ios::binary);
    if (!in) { res.status = 404; return; }

    std::ostringstream ss; ss << in.rdbuf();
    res.set_content(ss.str(), guess_mime(target_canon.filename().string()).c_str());
  }

  MessagesJsonPayload payload_for(const std::vector<Message>& msgs,
                                  const std::vector<ParseError>* skipped,
                                  const MetricsRegistry& metrics,
                                  double wall_ms) const {
    MessagesJsonPayload p;
    p.source = "request";
    p.user_identity = cfg.parser.user_identity;
    p.reference_timezone = cfg.parser.reference_timezone;
    p.stats = metrics.snapshot(wall_ms);
    p.messages = &msgs;
    p.skipped = skipped;
    return p;
  }

  void handle_parse(const httplib::Request& req, httplib::Response& res) const {
    const bool lenient = req.has_param("lenient") && req.get_param_value("lenient") != "0";
    MetricsRegistry metrics;
    const auto t0 = std::chrono::steady_clock::now();

    if (lenient) {
      auto r = parser.parse_text_lenient(req.body, &metrics);
      const double ms = std::chrono::duration<double, std::milli>(
          std::chrono::steady_clock::now() - t0).count();
      res.set_content(MessagesJsonWriter::to_json(payload_for(r.messages, &r.skipped, metrics, ms)), kJson);
      std::cerr << "[http] parse lenient: " << r.messages.size() << " messages, "
                << r.skipped.size() << " skipped\n";
      return;
    }

    std::vector<Message> msgs;
    ParseError err;
    if (!parser.parse_text(req.body, msgs, &err, &metrics)) {
      res.status = 422;
      res.set_content(MessagesJsonWriter::error_json(err), kJson);
      std::cerr << "[http] parse rejected: " << err.message() << "\n";
      return;
    }
    const double ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - t0).count();
    res.set_content(MessagesJsonWriter::to_json(payload_for(msgs, nullptr, metrics, ms)), kJson);
    std::cerr << "[http] parse: " << msgs.size() << " messages\n";
  }

  void handle_senders(const httplib::Request& req, httplib::Response& res) const {
    auto senders = parser.detect_senders_text(req.body);
    res.set_content(MessagesJsonWriter::senders_json(senders), kJson);
  }

  void handle_report(const httplib::Request& req, httplib::Response& res) const {
    MetricsRegistry metrics;
    const auto t0 = std::chrono::steady_clock::now();
    std::vector<Message> msgs;
    ParseError err;
    if (!parser.parse_text(req.body, msgs, &err, &metrics)) {
      res.status = 422;
      res.set_content(MessagesJsonWriter::error_json(err), kJson);
      std::cerr << "[http] report rejected: " << err.message() << "\n";
      return;
    }
    const double ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - t0).count();

    const std::string slug = make_slug(req.body, "hashprefix", 12);
    std::string werr;
    if (!write_report_dir(cfg.artifact_root, slug, payload_for(msgs, nullptr, metrics, ms), &werr)) {
      for (auto& c : werr) {
        if (c == '"' || c == '\\') c = '\'';
        else if (static_cast<unsigned char>(c) < 0x20) c = ' ';
      }
      res.status = 500;
      res.set_content("{\"error\":{\"kind\":\"ReportError\",\"detail\":\"" + werr + "\"}}", kJson);
      std::cerr << "[http] report failed: " << werr << "\n";
      return;
    }
    res.status = 201;
    res.set_content("{\"slug\":\"" + slug + "\",\"report\":\"/reports/" + slug + "/report.html\"}", kJson);
    std::cerr << "[http] report written: " << slug << "\n";
  }

  void routes() {
    svr.Get("/", [this](const httplib::Request&, httplib::Response& res) {
      res.set_content(index_html(), "text/html; charset=utf-8");
    });

    svr.Get(R"(/reports/([^/]+)/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
      serve_under_slug(req.matches[1].str(), req.matches[2].str(), res);
    });

    svr.Post("/api/v1/parse", [this](const httplib::Request& req, httplib::Response& res) {
      handle_parse(req, res);
    });
    svr.Post("/api/v1/senders", [this](const httplib::Request& req, httplib::Response& res) {
      handle_senders(req, res);
    });
    svr.Post("/api/v1/reports", [this](const httplib::Request& req, httplib::Response& res) {
      handle_report(req, res);
    });
  }
};

HttpServer::HttpServer(Config cfg) : p_(new Impl(std::move(cfg))) { p_->routes(); }
HttpServer::~HttpServer() { delete p_; }

bool HttpServer::start() {
  if (p_->cfg.port == 0) {
    p_->bound_port = p_->svr.bind_to_any_port(p_->cfg.host);
    return p_->bound_port > 0;
  }
  if (!p_->svr.bind_to_port(p_->cfg.host, p_->cfg.port)) return false;
  p_->bound_port = p_->cfg.port;
  return true;
}

bool HttpServer::listen() { return p_->svr.listen_after_bind(); }

int HttpServer::run() {
  if (!start()) return -1;
  std::cerr << "[http] listening on " << p_->cfg.host << ":" << p_->bound_port << "\n";
  return listen() ? 0 : 1;
}

void HttpServer::wait_until_ready() const { p_->svr.wait_until_ready(); }

void HttpServer::stop() { p_->svr.stop(); }

int HttpServer::port() const { return p_->bound_port; }

}
