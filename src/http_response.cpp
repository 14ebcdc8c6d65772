#include "http_response.hpp"
#include <sys/socket.h>
#include <cerrno>
#include <sstream>

namespace sfs {

const char* status_reason(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default:  return "Unknown";
    }
}

std::string build_response(int status, std::string_view reason, std::string_view content_type,
                           std::string_view body, bool suppress_body) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status << " " << reason << "\r\n"
        << "Content-Type: " << content_type << "\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "Access-Control-Allow-Origin: *\r\n"
        << "Connection: close\r\n"
        << "\r\n";
    if (!suppress_body) {
        oss << body;
    }
    return oss.str();
}

bool send_all(int fd, std::string_view data) {
    while (!data.empty()) {
        ssize_t n = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data.remove_prefix(static_cast<size_t>(n));
    }
    return true;
}

bool write_response(int fd, int status, std::string_view reason, std::string_view content_type,
                    std::string_view body, bool suppress_body) {
    std::string header = build_response(status, reason, content_type, body, true);
    if (!send_all(fd, header)) {
        return false;
    }
    if (suppress_body || body.empty()) {
        return true;
    }
    return send_all(fd, body);
}

} // namespace sfs
