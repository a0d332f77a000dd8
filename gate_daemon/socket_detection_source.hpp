#ifndef SOCKET_DETECTION_SOURCE_HPP
#define SOCKET_DETECTION_SOURCE_HPP

#include <optional>
#include <string>

#include "detection.hpp"

/**
 * SocketDetectionSource - Receives detections from the inference process
 *
 * Listens on a Unix stream socket. The engine connects and writes one JSON
 * object per line. Only one engine connection is served at a time.
 */
class SocketDetectionSource : public DetectionSource {
public:
    static constexpr const char *DEFAULT_PATH = "/tmp/smartgate_detect.sock";

    SocketDetectionSource(const std::string &path, float min_confidence);
    ~SocketDetectionSource() override;

    SocketDetectionSource(const SocketDetectionSource &) = delete;
    SocketDetectionSource &operator=(const SocketDetectionSource &) = delete;

    bool open();
    void close();

    std::optional<DetectionSet> nextDetections(int timeout_ms) override;

    bool hasEngine() const { return m_client_fd >= 0; }
    const std::string &path() const { return m_path; }

private:
    bool takeLine(std::string &line);
    std::optional<DetectionSet> parseLine(const std::string &line);
    void dropEngine();

    const std::string m_path;
    const float m_min_confidence;

    int m_server_fd = -1;
    int m_client_fd = -1;
    std::string m_rx;
};

#endif // SOCKET_DETECTION_SOURCE_HPP
