#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace sfs {

// Resolve a request path against the sandbox root. Returns the canonical
// path when it is the root itself or lies beneath it, std::nullopt otherwise.
// sandbox_root must already be canonical.
std::optional<std::filesystem::path> resolve_safe_path(const std::string& requested,
                                                       const std::filesystem::path& sandbox_root);

// True when `path` equals `root` or is a descendant of it (component-wise)
bool is_within(const std::filesystem::path& path, const std::filesystem::path& root);

} // namespace sfs
