#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace dr {

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Slug generation: "hashprefix", "basename", or "keypath".
std::string make_slug(std::string_view key, std::string_view mode, int len);

// Hash helper (stable) used by slug.
std::string hex_hash_prefix(std::string_view data, int len);

}
