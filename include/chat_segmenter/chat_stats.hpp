#pragma once
#include "chat_segmenter/message.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cs {

struct SenderShare {
  std::string sender;
  std::uint64_t count = 0;
  double percentage = 0.0;   // of total_messages, 0..100
};

// Activity summary over sealed messages. Days and hours are read from each
// message's own wall clock (epoch + offset), not from UTC.
struct ChatStatistics {
  std::uint64_t total_messages = 0;
  std::string first_date;                     // "YYYY-MM-DD", empty when no messages
  std::string last_date;
  std::vector<SenderShare> by_sender;         // count desc, then name
  std::array<std::uint64_t, 7> by_weekday{};  // 0 = Sunday
  std::array<std::uint64_t, 24> by_hour{};
  std::string busiest_day;                    // weekday name
  std::string quietest_day;                   // among weekdays with any message
  int busiest_hour = 0;
  std::uint64_t active_days = 0;              // distinct calendar dates
  double avg_messages_per_day = 0.0;          // total / active_days
};

// Ties go to the earlier weekday (Sunday first) and the earlier hour.
ChatStatistics compute_chat_statistics(const std::vector<Message>& messages);

// "Sunday".."Saturday"; empty outside 0..6.
std::string_view weekday_name(int weekday);

}
