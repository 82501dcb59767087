#include "chat_segmenter/chat_stats.hpp"
#include "chat_segmenter/date_parse.hpp"

#include <algorithm>
#include <cstdio>
#include <set>
#include <unordered_map>

namespace cs {

static std::string format_date(const CivilDateTime& c) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", c.year, c.month, c.day);
  return buf;
}

std::string_view weekday_name(int weekday) {
  static const char* names[] = {"Sunday", "Monday", "Tuesday", "Wednesday",
                                "Thursday", "Friday", "Saturday"};
  if (weekday < 0 || weekday > 6) return {};
  return names[weekday];
}

ChatStatistics compute_chat_statistics(const std::vector<Message>& messages) {
  ChatStatistics st;
  st.total_messages = messages.size();
  if (messages.empty()) return st;

  std::unordered_map<std::string, std::uint64_t> per_sender;
  std::set<std::int64_t> days;
  std::int64_t first = 0, last = 0;
  bool seen = false;

  for (const auto& m : messages) {
    const std::int64_t local = m.timestamp.epoch_seconds + m.timestamp.offset_minutes * 60LL;
    const CivilDateTime c = epoch_to_civil(local);
    const std::int64_t day = days_from_civil(c.year, static_cast<unsigned>(c.month),
                                             static_cast<unsigned>(c.day));
    // 1970-01-01 was a Thursday
    const int wd = static_cast<int>(((day + 4) % 7 + 7) % 7);

    ++st.by_weekday[wd];
    ++st.by_hour[c.hour];
    ++per_sender[m.sender];
    days.insert(day);

    if (!seen || local < first) first = local;
    if (!seen || local > last)  last = local;
    seen = true;
  }

  st.first_date = format_date(epoch_to_civil(first));
  st.last_date  = format_date(epoch_to_civil(last));

  st.by_sender.reserve(per_sender.size());
  for (const auto& kv : per_sender) {
    SenderShare s;
    s.sender = kv.first;
    s.count = kv.second;
    s.percentage = 100.0 * static_cast<double>(kv.second) / static_cast<double>(st.total_messages);
    st.by_sender.push_back(std::move(s));
  }
  std::sort(st.by_sender.begin(), st.by_sender.end(),
            [](const SenderShare& a, const SenderShare& b){
              if (a.count != b.count) return a.count > b.count;
              return a.sender < b.sender;
            });

  int busiest = 0, quietest = -1;
  for (int d = 0; d < 7; ++d) {
    if (st.by_weekday[d] > st.by_weekday[busiest]) busiest = d;
    if (st.by_weekday[d] == 0) continue;
    if (quietest < 0 || st.by_weekday[d] < st.by_weekday[quietest]) quietest = d;
  }
  st.busiest_day = std::string(weekday_name(busiest));
  st.quietest_day = std::string(weekday_name(quietest));

  for (int h = 1; h < 24; ++h)
    if (st.by_hour[h] > st.by_hour[st.busiest_hour]) st.busiest_hour = h;

  st.active_days = days.size();
  st.avg_messages_per_day = static_cast<double>(st.total_messages) / static_cast<double>(st.active_days);
  return st;
}

}
