#include "chat_segmenter/chunk_reader.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string_view>
#include <vector>

namespace cs {

struct ChunkReader::Impl {
  std::string path;
  Config cfg;
  int last_errno{0};
  std::uint64_t bytes{0};
  std::uint64_t lines{0};

  // Emits one logical line; false means the callback asked to stop.
  bool emit(std::string_view out, const LineCallback& cb) {
    if (cfg.strip_cr && !out.empty() && out.back() == '\r') out.remove_suffix(1);
    ++lines;
    return cb(out);
  }

  bool for_each_line(const LineCallback& cb) {
    last_errno = 0; bytes = 0; lines = 0;
    FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) { last_errno = errno ? errno : ENOENT; return false; }

    std::vector<char> buf(cfg.chunk_bytes, 0);
    std::string carry;
    carry.reserve(256);
    bool truncating = false; // current line already hit the guard

    while (true) {
      std::size_t n = std::fread(buf.data(), 1, cfg.chunk_bytes, f);
      if (n == 0 && std::ferror(f)) { last_errno = errno ? errno : EIO; std::fclose(f); return false; }
      if (n == 0) break;
      bytes += n;

      std::string_view block(buf.data(), n);
      std::size_t start = 0;
      while (start <= block.size()) {
        std::size_t pos = block.find('\n', start);
        const bool hit_nl = (pos != std::string_view::npos);
        std::string_view slice = hit_nl ? block.substr(start, pos - start)
                                        : block.substr(start);

        if (!truncating) {
          const std::size_t room = cfg.max_line_bytes - carry.size();
          if (slice.size() > room) { carry.append(slice.substr(0, room)); truncating = true; }
          else carry.append(slice);
        }
        if (!hit_nl) break;

        const bool go_on = emit(carry, cb);
        carry.clear();
        truncating = false;
        if (!go_on) { std::fclose(f); return true; }
        start = pos + 1;
      }
    }

    // Final line without trailing newline.
    if (!carry.empty()) (void)emit(carry, cb);

    std::fclose(f);
    return true;
  }
};

ChunkReader::ChunkReader(std::string path)
  : ChunkReader(std::move(path), Config{}) {}

ChunkReader::ChunkReader(std::string path, Config cfg)
  : p_(new Impl{std::move(path), cfg}) {}

ChunkReader::~ChunkReader() { delete p_; }

bool ChunkReader::for_each_line(const LineCallback& cb) { return p_->for_each_line(cb); }
int  ChunkReader::last_error() const noexcept { return p_->last_errno; }
std::string ChunkReader::error_text() const { return p_->last_errno ? std::strerror(p_->last_errno) : ""; }
std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->bytes; }
std::uint64_t ChunkReader::lines_read() const noexcept { return p_->lines; }
const std::string& ChunkReader::path() const noexcept { return p_->path; }

}
