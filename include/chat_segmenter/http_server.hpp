#pragma once
#include "chat_segmenter/parser_config.hpp"

#include <string>

namespace cs {

// Thin cpp-httplib front end:
//   GET  /                           index of rendered reports
//   GET  /reports/<slug>/<file>      files under artifact_root/<slug>
//   POST /api/v1/parse[?lenient=1]   transcript body -> messages JSON
//   POST /api/v1/senders             transcript body -> {"senders":[..]}
//   POST /api/v1/reports             transcript body -> rendered report dir
class HttpServer {
public:
  struct Config {
    std::string artifact_root = "artifacts/chat-segmenter";
    std::string index_title   = "Chat Segmenter Reports";
    std::string host = "0.0.0.0";
    int port = 8080;              // 0 = any free port, see port()
    ParserConfig parser;
  };

  explicit HttpServer(Config cfg);  // throws std::invalid_argument on bad parser config
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Binds only; returns false on bind error.
  bool start();

  // Accept loop on the bound socket; returns when stop() is called.
  bool listen();

  // start() + listen(). Returns non-zero on bind error.
  int run();

  void wait_until_ready() const;

  void stop();

  // Bound port after start().
  int port() const;

private:
  struct Impl;
  Impl* p_;
};

}
