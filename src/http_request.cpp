#include "http_request.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <vector>

namespace sfs {

namespace {

constexpr std::string_view kHeaderTerminator = "\r\n\r\n";

std::string to_upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

// Split on every single space; empty tokens are kept
std::vector<std::string_view> split_spaces(std::string_view line) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        size_t pos = line.find(' ', start);
        if (pos == std::string_view::npos) {
            parts.push_back(line.substr(start));
            break;
        }
        parts.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

// Calls fn(name, value) for each "Name: Value" line of a header block
template <typename Fn>
void for_each_header(std::string_view block, Fn&& fn) {
    size_t start = 0;
    while (start < block.size()) {
        size_t end = block.find("\r\n", start);
        if (end == std::string_view::npos) end = block.size();
        std::string_view line = block.substr(start, end - start);
        size_t colon = line.find(':');
        if (colon != std::string_view::npos) {
            fn(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
        }
        start = end + 2;
    }
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

ParseError bad_request(std::string message) {
    return ParseError{400, "Bad Request", std::move(message)};
}

} // namespace

const char* to_string(Method method) {
    switch (method) {
        case Method::Get:  return "GET";
        case Method::Head: return "HEAD";
        case Method::Post: return "POST";
    }
    return "UNKNOWN";
}

std::optional<size_t> find_header_end(std::string_view raw) {
    size_t pos = raw.find(kHeaderTerminator);
    if (pos == std::string_view::npos) return std::nullopt;
    return pos + kHeaderTerminator.size();
}

size_t content_length_of(std::string_view header_block) {
    size_t length = 0;
    for_each_header(header_block, [&](std::string_view name, std::string_view value) {
        if (!iequals(name, "Content-Length")) return;
        size_t parsed = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
        length = (ec == std::errc() && ptr == value.data() + value.size() && !value.empty()) ? parsed : 0;
    });
    return length;
}

bool is_head_request(std::string_view raw) {
    size_t end = raw.find_first_of(" \r\n");
    return iequals(raw.substr(0, end), "HEAD");
}

std::string url_decode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size()) {
            int hi = hex_value(in[i + 1]);
            int lo = hex_value(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(in[i]);
    }
    return out;
}

ParseResult parse_request(std::string_view raw) {
    auto header_end = find_header_end(raw);
    if (!header_end) {
        return bad_request("Incomplete request headers\n");
    }

    std::string_view head = raw.substr(0, *header_end - kHeaderTerminator.size());
    size_t line_end = head.find("\r\n");
    std::string_view request_line = head.substr(0, line_end);
    std::string_view header_block = line_end == std::string_view::npos
        ? std::string_view{}
        : head.substr(line_end + 2);

    auto parts = split_spaces(request_line);
    if (parts.size() < 3) {
        return bad_request("Malformed request line\n");
    }

    Request req;
    req.method_name = to_upper(parts[0]);
    if (req.method_name == "GET") {
        req.method = Method::Get;
    } else if (req.method_name == "HEAD") {
        req.method = Method::Head;
    } else if (req.method_name == "POST") {
        req.method = Method::Post;
    } else {
        return ParseError{405, "Method Not Allowed", "Method " + req.method_name + " not allowed\n"};
    }

    req.target = std::string(parts[1]);
    req.version = std::string(parts[2]);

    std::string_view target = parts[1];
    size_t fragment = target.find('#');
    if (fragment != std::string_view::npos) target = target.substr(0, fragment);
    size_t query = target.find('?');
    if (query != std::string_view::npos) {
        req.query = std::string(target.substr(query + 1));
        target = target.substr(0, query);
    }
    req.path = url_decode(target);

    req.headers = std::string(header_block);
    for_each_header(header_block, [&](std::string_view name, std::string_view value) {
        if (iequals(name, "Host")) req.host = std::string(value);
    });
    req.content_length = content_length_of(header_block);

    std::string_view buffered = raw.substr(*header_end);
    req.body = std::string(buffered.substr(0, std::min(req.content_length, buffered.size())));
    return req;
}

} // namespace sfs
