#pragma once

#include <string>
#include <string_view>

namespace sfs {

constexpr const char* kTextPlain = "text/plain; charset=utf-8";
constexpr const char* kApplicationJson = "application/json; charset=utf-8";

// Standard reason phrase for the status codes this server emits
const char* status_reason(int status);

// Serialize a complete response. Content-Length always reflects body.size(),
// even when suppress_body drops the body bytes (HEAD).
std::string build_response(int status, std::string_view reason, std::string_view content_type,
                           std::string_view body, bool suppress_body);

// Send a response on a connected socket. Returns false if the peer went away
// or the write failed; never throws.
bool write_response(int fd, int status, std::string_view reason, std::string_view content_type,
                    std::string_view body, bool suppress_body);

// Write all bytes, retrying on partial sends and EINTR
bool send_all(int fd, std::string_view data);

} // namespace sfs
