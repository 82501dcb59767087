#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace cs {

// Streams a transcript file line by line in fixed-size chunks.
class ChunkReader {
public:
  struct Config {
    std::size_t chunk_bytes      = 256 * 1024;      // 256 KiB
    std::size_t max_line_bytes   = 1 * 1024 * 1024; // 1 MiB guard per line
    bool        strip_cr         = true;            // trim trailing '\r' (CRLF exports)
  };

  explicit ChunkReader(std::string path);      // uses default Config{}
  ChunkReader(std::string path, Config cfg);   // explicit Config
  ~ChunkReader();

  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;

  // Callback returns false to stop early (not an error).
  using LineCallback = std::function<bool(std::string_view)>;

  // Returns false only on open/read failure; see last_error()/error_text().
  // Lines longer than max_line_bytes are truncated, never dropped, so line
  // numbering stays aligned with the file.
  bool for_each_line(const LineCallback& cb);

  int  last_error() const noexcept;          // errno of the failure, 0 if none
  std::string error_text() const;            // strerror(last_error())
  std::uint64_t bytes_read() const noexcept;
  std::uint64_t lines_read() const noexcept;
  const std::string& path() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
