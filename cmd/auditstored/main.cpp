#include "../../logging/logging.hpp"
#include "../../policy/config.hpp"
#include "../../rpc/protocol.hpp"
#include "../../store/registry.hpp"

#include <spdlog/spdlog.h>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>

namespace {

volatile std::sig_atomic_t g_terminate = 0;

void handle_signal(int) {
    g_terminate = 1;
}

bool write_all(int fd, const std::string &data) {
    std::size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    return true;
}

auditstore::StoreFactory make_factory(const auditstore::Config &cfg) {
    if (cfg.backend == "memory") {
        return auditstore::memory_store_factory();
    }
    return auditstore::sqlite_store_factory(cfg.data_dir);
}

} // namespace

int main(int argc, char **argv) {
    using namespace auditstore;

    Config cfg;
    try {
        cfg = argc > 1 ? load_config(argv[1]) : load_config_or_default();
        init_logging(cfg.log_level, cfg.log_path);
    } catch (const std::exception &ex) {
        std::cerr << "auditstored: " << ex.what() << std::endl;
        return 1;
    }

    Registry registry(make_factory(cfg));

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    std::signal(SIGPIPE, SIG_IGN);

    int server_fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (server_fd < 0) {
        spdlog::critical("socket: {}", std::strerror(errno));
        return 1;
    }

    ::unlink(cfg.socket_path.c_str());

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, cfg.socket_path.c_str(), sizeof(addr.sun_path) - 1);

    if (::bind(server_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        spdlog::critical("bind {}: {}", cfg.socket_path, std::strerror(errno));
        ::close(server_fd);
        return 1;
    }

    if (::listen(server_fd, 16) < 0) {
        spdlog::critical("listen: {}", std::strerror(errno));
        ::close(server_fd);
        return 1;
    }

    spdlog::info("auditstored listening on UNIX socket: {} (backend {})", cfg.socket_path, cfg.backend);

    while (!g_terminate) {
        int client_fd = ::accept(server_fd, nullptr, nullptr);
        if (client_fd < 0) {
            if (errno == EINTR && g_terminate) {
                break;
            }
            spdlog::warn("accept: {}", std::strerror(errno));
            continue;
        }

        std::string buffer;
        char chunk[4096];
        ssize_t n;
        bool open = true;
        while (open && (n = ::read(client_fd, chunk, sizeof(chunk))) > 0) {
            buffer.append(chunk, chunk + n);
            std::size_t pos;
            while ((pos = buffer.find('\n')) != std::string::npos) {
                std::string line = buffer.substr(0, pos);
                buffer.erase(0, pos + 1);

                if (line.empty()) continue;

                std::string response_json = handle_request_line(registry, cfg, line);
                response_json.push_back('\n');
                if (!write_all(client_fd, response_json)) {
                    spdlog::warn("client went away: {}", std::strerror(errno));
                    open = false;
                    break;
                }
            }
        }

        ::close(client_fd);
    }

    ::close(server_fd);
    ::unlink(cfg.socket_path.c_str());
    spdlog::info("auditstored stopped");

    return 0;
}
