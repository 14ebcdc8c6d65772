#include "path_guard.hpp"
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace sfs {

bool is_within(const fs::path& path, const fs::path& root) {
    auto root_it = root.begin();
    auto path_it = path.begin();
    for (; root_it != root.end(); ++root_it, ++path_it) {
        // A trailing separator on root shows up as an empty final element
        if (root_it->empty() && std::next(root_it) == root.end()) break;
        if (path_it == path.end() || *path_it != *root_it) return false;
    }
    return true;
}

std::optional<fs::path> resolve_safe_path(const std::string& requested, const fs::path& sandbox_root) {
    std::string relative = requested;
    relative.erase(0, relative.find_first_not_of('/'));

    // Cheap lexical rejection before any filesystem access
    if (relative.find("..") != std::string::npos) {
        return std::nullopt;
    }
    if (fs::path(relative).is_absolute() || fs::path(relative).has_root_name()) {
        return std::nullopt;
    }

    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(sandbox_root / relative, ec);
    if (ec) {
        return std::nullopt;
    }

    if (!is_within(canonical, sandbox_root)) {
        return std::nullopt;
    }
    return canonical;
}

} // namespace sfs
