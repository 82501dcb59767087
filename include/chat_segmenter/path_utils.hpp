#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace cs {

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Exported transcripts are plain text (.txt); anything else is skipped by
// directory scans.
bool is_transcript_file(std::string_view path);

// Slug generation per mode: "hashprefix", "basename", or "keypath".
std::string make_slug(std::string_view key, std::string_view mode, int len);

// Lowercase hex of the first `len` nibbles of SHA-256(data).
std::string hex_hash_prefix(std::string_view data, int len);

}
