#pragma once
#include "chat_segmenter/message.hpp"
#include "chat_segmenter/metrics.hpp"
#include "chat_segmenter/parse_error.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace cs {

struct MessagesJsonPayload {
  // Input metadata
  std::string source;          // file path or "request"
  std::string user_identity;
  std::string reference_timezone;

  ScanStats stats;
  const std::vector<Message>* messages = nullptr;
  const std::vector<ParseError>* skipped = nullptr;  // lenient runs only
};

class MessagesJsonWriter {
public:
  // {"source":..,"user_identity":..,"reference_timezone":..,"stats":{..},
  //  "chat_stats":{..},"messages":[..],"errors":[..]}
  // chat_stats is compute_chat_statistics over `messages`.
  static std::string to_json(const MessagesJsonPayload& p);

  // One message object; sentiment_score is null when absent.
  static std::string message_json(const Message& m);

  // {"senders":[..]} sorted for stable output.
  static std::string senders_json(const std::unordered_set<std::string>& senders);

  // {"error":{"kind":..,"line":..,"text":..,"detail":..}}
  static std::string error_json(const ParseError& e);
};

}
