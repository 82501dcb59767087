#include "chat_segmenter/artifact_writer.hpp"
#include "chat_segmenter/chat_parser.hpp"
#include "chat_segmenter/http_server.hpp"
#include "chat_segmenter/messages_json.hpp"
#include "chat_segmenter/metrics.hpp"
#include "chat_segmenter/parser_config.hpp"
#include "chat_segmenter/path_utils.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

namespace {

// Exit codes
constexpr int kOk = 0;
constexpr int kInvalidTimestamp = 1;
constexpr int kIoOrUsage = 2;
constexpr int kReportFailed = 3;

struct Cli {
  int port = 8080;
  std::string artifact_root = "artifacts/chat-segmenter";
  std::string slug_mode = "hashprefix"; // hashprefix|basename|keypath
  int slug_len = 8;
  bool serve_only = false;
  bool lenient = false;
  bool report = false;

  std::string config_path;
  std::string tz;
  std::string user;
  std::string grammars;
  bool has_tz = false, has_user = false, has_grammars = false;

  std::vector<std::string> parses;  // transcripts to segment
  std::vector<std::string> senders; // transcripts to scan for senders
};

void usage(std::ostream& os) {
  os <<
    "Usage: chat-segmenter [--config=FILE] [--tz=local|UTC|+HH:MM] [--user=NAME]\n"
    "                      [--grammars=a,b,c] [--lenient] [--report]\n"
    "                      [--parse <file>|--parse=<file>]... [--senders <file>|--senders=<file>]...\n"
    "                      [--artifact-root=DIR] [--slug-mode=hashprefix|basename|keypath]\n"
    "                      [--slug-len=N] [--port=N] [--serve-only]\n"
    "Without --parse/--senders an HTTP server is started.\n";
}

bool parse_cli(int argc, char** argv, Cli& c) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_i = [&](const char* pfx, int* out){
      if (a.rfind(pfx, 0) != 0) return false;
      try {
        *out = std::stoi(a.substr(std::string(pfx).size()));
      } catch (const std::exception&) {
        std::cerr << "[config] bad integer in " << a << "\n";
        std::exit(kIoOrUsage);
      }
      return true;
    };
    if (eat_i("--port=", &c.port)) continue;
    if (eat_i("--slug-len=", &c.slug_len)) continue;
    if (eat("--artifact-root=", &c.artifact_root)) continue;
    if (eat("--slug-mode=", &c.slug_mode)) continue;
    if (eat("--config=", &c.config_path)) continue;
    if (eat("--tz=", &c.tz)) { c.has_tz = true; continue; }
    if (eat("--user=", &c.user)) { c.has_user = true; continue; }
    if (eat("--grammars=", &c.grammars)) { c.has_grammars = true; continue; }
    if (a == "--lenient")    { c.lenient = true; continue; }
    if (a == "--report")     { c.report = true; continue; }
    if (a == "--serve-only") { c.serve_only = true; continue; }
    if (a == "--parse" && i+1 < argc)   { c.parses.push_back(argv[++i]); continue; }
    if (a.rfind("--parse=",0)==0)       { c.parses.push_back(a.substr(8)); continue; }
    if (a == "--senders" && i+1 < argc) { c.senders.push_back(argv[++i]); continue; }
    if (a.rfind("--senders=",0)==0)     { c.senders.push_back(a.substr(10)); continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(kOk); }
    std::cerr << "[config] unknown argument: " << a << "\n";
    return false;
  }
  return true;
}

// Config file first, then flags on top.
bool build_config(const Cli& cli, cs::ParserConfig& cfg) {
  std::string err;
  if (!cli.config_path.empty() && !cs::load_parser_config(cli.config_path, cfg, &err)) {
    std::cerr << "[config] " << cli.config_path << ": " << err << "\n";
    return false;
  }
  if (cli.has_tz) cfg.reference_timezone = cli.tz;
  if (cli.has_user) cfg.user_identity = cli.user;
  if (cli.has_grammars) cfg.grammar_priority_order = cs::split_list(cli.grammars);
  if (!cfg.validate(&err)) {
    std::cerr << "[config] " << err << "\n";
    return false;
  }
  return true;
}

std::string make_slug_for(const std::string& path, const std::string& mode, int len) {
  std::string key = (mode == "hashprefix")
      ? std::filesystem::weakly_canonical(std::filesystem::path(path)).string()
      : path;
  return cs::make_slug(key, mode, len);
}

int exit_code_for(const cs::ParseError& e) {
  return e.kind == cs::ParseError::Kind::InvalidTimestamp ? kInvalidTimestamp : kIoOrUsage;
}

int parse_one_file(const cs::ChatParser& parser, const std::string& filepath, const Cli& cli) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  cs::MetricsRegistry metrics;
  std::vector<cs::Message> messages;
  cs::ChatParser::LenientResult lenient;
  cs::ParseError err;

  bool ok;
  if (cli.lenient) {
    ok = parser.parse_file_lenient(filepath, lenient, &err, &metrics);
    for (const auto& s : lenient.skipped)
      std::cerr << "[parse] skipped header: " << s.message() << "\n";
  } else {
    ok = parser.parse_file(filepath, messages, &err, &metrics);
  }
  if (!ok) {
    std::cerr << "[parse] " << filepath << ": " << err.message() << "\n";
    std::cout << cs::MessagesJsonWriter::error_json(err) << "\n";
    return exit_code_for(err);
  }

  const std::vector<cs::Message>& out = cli.lenient ? lenient.messages : messages;
  const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();

  cs::MessagesJsonPayload p;
  p.source = filepath;
  p.user_identity = parser.config().user_identity;
  p.reference_timezone = parser.config().reference_timezone;
  p.messages = &out;
  p.skipped = cli.lenient ? &lenient.skipped : nullptr;

  if (cli.report) {
    metrics.start_stage("render");
    p.stats = metrics.snapshot(wall_ms);
    const std::string slug = make_slug_for(filepath, cli.slug_mode, cli.slug_len);
    std::string werr;
    const bool written = cs::write_report_dir(cli.artifact_root, slug, p, &werr);
    metrics.end_stage("render");
    if (!written) {
      std::cerr << "[report] write_report_dir failed: " << werr << "\n";
      return kReportFailed;
    }
    std::cerr << "[report] " << filepath << " -> " << cli.artifact_root << "/" << slug
              << "/report.html\n";
  }

  p.stats = metrics.snapshot(wall_ms);
  std::cout << cs::MessagesJsonWriter::to_json(p) << "\n";
  std::cerr << "[parse] ok: " << filepath << " lines=" << p.stats.lines
            << " messages=" << out.size() << " ms=" << wall_ms << "\n";
  return kOk;
}

int senders_one_file(const cs::ChatParser& parser, const std::string& filepath) {
  std::unordered_set<std::string> found;
  cs::ParseError err;
  if (!parser.detect_senders_file(filepath, found, &err)) {
    std::cerr << "[senders] " << filepath << ": " << err.message() << "\n";
    std::cout << cs::MessagesJsonWriter::error_json(err) << "\n";
    return exit_code_for(err);
  }
  std::cout << cs::MessagesJsonWriter::senders_json(found) << "\n";
  std::cerr << "[senders] ok: " << filepath << " senders=" << found.size() << "\n";
  return kOk;
}

}

int main(int argc, char** argv) {
  Cli cli;
  if (!parse_cli(argc, argv, cli)) { usage(std::cerr); return kIoOrUsage; }

  cs::ParserConfig cfg;
  if (!build_config(cli, cfg)) return kIoOrUsage;

  const bool did_any = !cli.serve_only && (!cli.parses.empty() || !cli.senders.empty());
  if (did_any) {
    const cs::ChatParser parser(cfg);
    int rc = kOk;
    for (const auto& f : cli.parses) {
      const int r = parse_one_file(parser, f, cli);
      if (rc == kOk) rc = r;
    }
    for (const auto& f : cli.senders) {
      const int r = senders_one_file(parser, f);
      if (rc == kOk) rc = r;
    }
    return rc;
  }

  cs::HttpServer::Config scfg;
  scfg.port = cli.port;
  scfg.artifact_root = cli.artifact_root;
  scfg.parser = cfg;

  cs::HttpServer server(scfg);
  int rc = server.run();
  if (rc != 0) {
    std::cerr << "[http] failed to start on port " << scfg.port << "\n";
    return kIoOrUsage;
  }
  return kOk;
}
