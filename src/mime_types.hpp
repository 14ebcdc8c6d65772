#pragma once

#include <string>

namespace sfs {

// Content-Type for a file path, by extension (case-insensitive).
// Unknown extensions map to application/octet-stream.
std::string mime_type_for(const std::string& path);

} // namespace sfs
