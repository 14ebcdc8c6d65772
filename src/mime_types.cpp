#include "mime_types.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_map>

namespace fs = std::filesystem;

namespace sfs {

static const std::unordered_map<std::string, std::string> kMimeTypes = {
    {".html", "text/html; charset=utf-8"},
    {".htm",  "text/html; charset=utf-8"},
    {".css",  "text/css; charset=utf-8"},
    {".js",   "application/javascript; charset=utf-8"},
    {".json", "application/json; charset=utf-8"},
    {".txt",  "text/plain; charset=utf-8"},
    {".xml",  "application/xml"},
    {".png",  "image/png"},
    {".jpg",  "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif",  "image/gif"},
    {".svg",  "image/svg+xml"},
    {".ico",  "image/x-icon"},
    {".webp", "image/webp"},
    {".pdf",  "application/pdf"},
    {".woff", "font/woff"},
    {".woff2","font/woff2"},
    {".ttf",  "font/ttf"},
};

std::string mime_type_for(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = kMimeTypes.find(ext);
    if (it != kMimeTypes.end()) {
        return it->second;
    }
    return "application/octet-stream";
}

} // namespace sfs
