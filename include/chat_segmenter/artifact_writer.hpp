#pragma once
#include "chat_segmenter/messages_json.hpp"
#include "chat_segmenter/mustache_renderer.hpp"

#include <string>

namespace cs {

// Flattens a parse result into what report.mustache renders. Rows whose
// sender equals payload.user_identity are flagged `self`.
ReportView make_report_view(const MessagesJsonPayload& payload);

// Writes:
//   <artifact_root>/<slug>/report.html
//   + co-located report.css
//   + messages.json (same document the CLI prints)
bool write_report_dir(const std::string& artifact_root,
                      const std::string& slug,
                      const MessagesJsonPayload& payload,
                      std::string* err_out = nullptr);

}
