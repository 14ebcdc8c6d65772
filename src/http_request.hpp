#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace sfs {

enum class Method { Get, Head, Post };

const char* to_string(Method method);

struct Request {
    Method method = Method::Get;
    std::string method_name;   // upper-cased token as received
    std::string target;        // raw request target, e.g. "/a%20b?x=1"
    std::string path;          // percent-decoded path without query
    std::string query;         // raw query string (after '?'), may be empty
    std::string version;       // e.g. "HTTP/1.1"
    std::string headers;       // raw header block (without request line)
    std::string host;
    size_t content_length = 0;
    std::string body;
};

struct ParseError {
    int status;            // 400 or 405
    std::string reason;    // reason phrase
    std::string message;   // plain-text response body
};

using ParseResult = std::variant<Request, ParseError>;

// Parse a buffered request. Requires the CRLFCRLF header terminator to be
// present; performs no I/O.
ParseResult parse_request(std::string_view raw);

// Offset of the first byte after "\r\n\r\n", or std::nullopt if absent
std::optional<size_t> find_header_end(std::string_view raw);

// Value of the Content-Length header (case-insensitive) in a raw header
// block; a missing or malformed value yields 0.
size_t content_length_of(std::string_view header_block);

// True when the request line of a raw, possibly unparseable, request names
// HEAD (case-insensitive). Used to keep error replies to HEAD body-less.
bool is_head_request(std::string_view raw);

// Percent-decode a URL path component. Invalid escapes are kept verbatim.
std::string url_decode(std::string_view in);

} // namespace sfs
