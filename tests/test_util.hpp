// Shared helpers for the sfs-server tests: temporary sandbox directories and
// a tiny blocking HTTP client speaking raw bytes over loopback.
#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>

#include "log_buffer.hpp"
#include "logger.hpp"
#include "socket.hpp"

namespace sfs::test {

// Directory under the system temp dir, removed recursively on destruction
class TempDir {
public:
    TempDir() {
        namespace fs = std::filesystem;
        std::random_device rd;
        std::mt19937_64 gen(rd());
        for (int attempt = 0; attempt < 16; ++attempt) {
            fs::path candidate = fs::temp_directory_path() / ("sfs-test-" + std::to_string(gen()));
            std::error_code ec;
            if (fs::create_directory(candidate, ec) && !ec) {
                path_ = fs::canonical(candidate);
                return;
            }
        }
        throw std::runtime_error("TempDir: unable to create unique directory");
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path write(const std::string& relative, std::string_view content) const {
        std::filesystem::path file = path_ / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream ofs(file, std::ios::binary | std::ios::trunc);
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        return file;
    }

    std::filesystem::path mkdir(const std::string& relative) const {
        std::filesystem::path dir = path_ / relative;
        std::filesystem::create_directories(dir);
        return dir;
    }

private:
    std::filesystem::path path_;
};

inline std::shared_ptr<spdlog::logger> test_logger(std::shared_ptr<LogBuffer> buffer) {
    return make_buffer_logger("sfs-test", std::move(buffer));
}

// Logger whose records land in the buffer as the bare message text
inline std::shared_ptr<spdlog::logger> plain_writer(const std::shared_ptr<LogBuffer>& buffer) {
    buffer->sink()->set_pattern("%v");
    auto logger = make_buffer_logger("sfs-plain", buffer);
    logger->set_level(spdlog::level::trace);
    return logger;
}

// Blocking loopback client; all reads time out after a few seconds
class ClientConnection {
public:
    explicit ClientConnection(uint16_t port) : sock_(::socket(AF_INET, SOCK_STREAM, 0)) {
        if (!sock_.valid()) throw std::runtime_error("socket() failed");
        timeval tv{};
        tv.tv_sec = 5;
        ::setsockopt(sock_.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (::connect(sock_.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            throw std::runtime_error("connect() failed");
        }
    }

    int fd() const { return sock_.get(); }

    bool send(std::string_view data) {
        while (!data.empty()) {
            ssize_t n = ::send(sock_.get(), data.data(), data.size(), MSG_NOSIGNAL);
            if (n <= 0) return false;
            data.remove_prefix(static_cast<size_t>(n));
        }
        return true;
    }

    void close_write() { ::shutdown(sock_.get(), SHUT_WR); }

    // Everything until the server closes the connection
    std::string read_all() {
        std::string out;
        char buf[4096];
        while (true) {
            ssize_t n = ::recv(sock_.get(), buf, sizeof(buf), 0);
            if (n <= 0) break;
            out.append(buf, static_cast<size_t>(n));
        }
        return out;
    }

private:
    Socket sock_;
};

inline std::string raw_request(uint16_t port, std::string_view request) {
    ClientConnection cnx(port);
    cnx.send(request);
    return cnx.read_all();
}

inline std::string simple_request(uint16_t port, std::string_view method, std::string_view target) {
    std::string req = std::string(method) + " " + std::string(target) +
                      " HTTP/1.1\r\nHost: 127.0.0.1\r\nConnection: close\r\n\r\n";
    return raw_request(port, req);
}

struct HttpReply {
    int status = 0;
    std::string reason;
    std::map<std::string, std::string> headers;   // lower-cased names
    std::string head;                             // raw header block incl. status line
    std::string body;
};

inline HttpReply parse_reply(const std::string& raw) {
    HttpReply reply;
    size_t end = raw.find("\r\n\r\n");
    if (end == std::string::npos) return reply;
    reply.head = raw.substr(0, end + 4);
    reply.body = raw.substr(end + 4);

    size_t line_end = raw.find("\r\n");
    std::string status_line = raw.substr(0, line_end);
    size_t sp1 = status_line.find(' ');
    size_t sp2 = status_line.find(' ', sp1 + 1);
    if (sp1 == std::string::npos) return reply;
    reply.status = std::stoi(status_line.substr(sp1 + 1, sp2 - sp1 - 1));
    reply.reason = sp2 == std::string::npos ? "" : status_line.substr(sp2 + 1);

    size_t pos = line_end + 2;
    while (pos < end) {
        size_t next = raw.find("\r\n", pos);
        std::string line = raw.substr(pos, next - pos);
        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            std::string name = line.substr(0, colon);
            std::transform(name.begin(), name.end(), name.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            std::string value = line.substr(colon + 1);
            value.erase(0, value.find_first_not_of(' '));
            reply.headers[name] = value;
        }
        pos = next + 2;
    }
    return reply;
}

} // namespace sfs::test
