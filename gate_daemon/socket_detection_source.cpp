/**
 * SocketDetectionSource Implementation
 */

#include "socket_detection_source.hpp"
#include "logger.h"
#include "relay_protocol.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

static const char *TAG = "Detect";

static constexpr size_t RX_LIMIT = 64 * 1024;

static bool setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) >= 0;
}

SocketDetectionSource::SocketDetectionSource(const std::string &path, float min_confidence)
    : m_path(path), m_min_confidence(min_confidence) {}

SocketDetectionSource::~SocketDetectionSource() {
    close();
}

bool SocketDetectionSource::open() {
    m_server_fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (m_server_fd < 0) {
        LOG_ERROR(TAG, "socket: %s", strerror(errno));
        return false;
    }

    unlink(m_path.c_str());

    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, m_path.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(m_server_fd, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
        LOG_ERROR(TAG, "bind %s: %s", m_path.c_str(), strerror(errno));
        ::close(m_server_fd);
        m_server_fd = -1;
        return false;
    }

    if (listen(m_server_fd, 2) < 0) {
        LOG_ERROR(TAG, "listen: %s", strerror(errno));
        ::close(m_server_fd);
        m_server_fd = -1;
        return false;
    }

    setNonBlocking(m_server_fd);
    LOG_INFO(TAG, "Waiting for inference engine on %s", m_path.c_str());
    return true;
}

void SocketDetectionSource::close() {
    dropEngine();
    if (m_server_fd >= 0) {
        ::close(m_server_fd);
        m_server_fd = -1;
        unlink(m_path.c_str());
    }
}

void SocketDetectionSource::dropEngine() {
    if (m_client_fd >= 0) {
        ::close(m_client_fd);
        m_client_fd = -1;
    }
    m_rx.clear();
}

bool SocketDetectionSource::takeLine(std::string &line) {
    size_t pos = m_rx.find('\n');
    if (pos == std::string::npos) {
        return false;
    }
    line = m_rx.substr(0, pos);
    m_rx.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

std::optional<DetectionSet> SocketDetectionSource::parseLine(const std::string &line) {
    if (line.empty()) {
        return std::nullopt;
    }
    DetectionSet ds;
    RelayProtocol::ParseResult result = RelayProtocol::parseDetection(line, m_min_confidence, ds);
    if (!result.valid) {
        throw DetectionError(result.error);
    }
    return ds;
}

std::optional<DetectionSet> SocketDetectionSource::nextDetections(int timeout_ms) {
    std::string line;
    if (takeLine(line)) {
        return parseLine(line);
    }

    if (m_server_fd < 0) {
        throw DetectionError("detection socket not open");
    }

    struct pollfd pfd;
    pfd.fd = (m_client_fd >= 0) ? m_client_fd : m_server_fd;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ret = poll(&pfd, 1, timeout_ms);
    if (ret < 0) {
        if (errno == EINTR) return std::nullopt;
        throw DetectionError(std::string("poll: ") + strerror(errno));
    }
    if (ret == 0) {
        return std::nullopt;
    }

    if (m_client_fd < 0) {
        int fd = accept(m_server_fd, nullptr, nullptr);
        if (fd >= 0) {
            setNonBlocking(fd);
            m_client_fd = fd;
            m_rx.clear();
            LOG_INFO(TAG, "Inference engine connected");
        }
        return std::nullopt;
    }

    char buf[4096];
    ssize_t n = recv(m_client_fd, buf, sizeof(buf), 0);
    if (n == 0) {
        dropEngine();
        throw DetectionError("inference engine disconnected");
    }
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return std::nullopt;
        }
        std::string err = strerror(errno);
        dropEngine();
        throw DetectionError("recv: " + err);
    }

    m_rx.append(buf, (size_t)n);
    if (takeLine(line)) {
        return parseLine(line);
    }
    if (m_rx.size() > RX_LIMIT) {
        m_rx.clear();
        throw DetectionError("detection line exceeds 64 KiB");
    }
    return std::nullopt;
}
