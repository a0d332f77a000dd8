#include "gpio_backend.hpp"
#include "../logger.h"

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <cstdio>
#include <set>

static const char *TAG = "GPIO";

class GpioSysfs : public GpioBackend {
public:
    explicit GpioSysfs(const std::string &root) : m_root(root) {}
    ~GpioSysfs() override { cleanup(); }

    bool init() override {
        if (access(m_root.c_str(), F_OK) != 0) {
            LOG_ERROR(TAG, "GPIO root %s not available: %s", m_root.c_str(), strerror(errno));
            return false;
        }
        m_initialized = true;
        return true;
    }

    bool configurePin(int pin, Direction dir) override {
        if (!m_initialized || pin < 0) return false;

        if (!exportPin(pin)) {
            LOG_ERROR(TAG, "Failed to export gpio%d", pin);
            return false;
        }
        m_exported_pins.insert(pin);

        if (!setDirection(pin, dir)) {
            LOG_ERROR(TAG, "Failed to set direction of gpio%d", pin);
            return false;
        }

        return true;
    }

    bool write(int pin, int value) override {
        std::string path = pinPath(pin, "value");

        int fd = open(path.c_str(), O_WRONLY);
        if (fd < 0) {
            return false;
        }

        const char *val = (value != 0) ? "1" : "0";
        ssize_t written = ::write(fd, val, 1);
        close(fd);

        return written == 1;
    }

    int read(int pin) override {
        std::string path = pinPath(pin, "value");

        int fd = open(path.c_str(), O_RDONLY);
        if (fd < 0) {
            return -1;
        }

        char buf[4] = {0};
        ssize_t n = ::read(fd, buf, sizeof(buf) - 1);
        close(fd);

        if (n <= 0) {
            return -1;
        }

        return (buf[0] == '1') ? 1 : 0;
    }

    void cleanup() override {
        for (int pin : m_exported_pins) {
            unexportPin(pin);
        }
        m_exported_pins.clear();
        m_initialized = false;
    }

private:
    std::string pinPath(int pin, const char *leaf) const {
        char buf[32];
        snprintf(buf, sizeof(buf), "/gpio%d/%s", pin, leaf);
        return m_root + buf;
    }

    bool writeFile(const std::string &path, const char *text) {
        int fd = open(path.c_str(), O_WRONLY);
        if (fd < 0) {
            return false;
        }
        size_t len = strlen(text);
        ssize_t written = ::write(fd, text, len);
        close(fd);
        return written == static_cast<ssize_t>(len);
    }

    bool exportPin(int pin) {
        char dir[32];
        snprintf(dir, sizeof(dir), "/gpio%d", pin);
        if (access((m_root + dir).c_str(), F_OK) == 0) {
            // Already exported (by us or the board setup); leave it on cleanup
            m_preexisting_pins.insert(pin);
            return true;
        }

        char buf[16];
        snprintf(buf, sizeof(buf), "%d", pin);
        if (!writeFile(m_root + "/export", buf)) {
            return false;
        }

        usleep(50000);
        return true;
    }

    bool unexportPin(int pin) {
        if (m_preexisting_pins.count(pin) != 0) {
            return true;
        }
        char buf[16];
        snprintf(buf, sizeof(buf), "%d", pin);
        return writeFile(m_root + "/unexport", buf);
    }

    bool setDirection(int pin, Direction dir) {
        return writeFile(pinPath(pin, "direction"),
                         (dir == Direction::OUTPUT) ? "out" : "in");
    }

    std::string m_root;
    bool m_initialized = false;
    std::set<int> m_exported_pins;
    std::set<int> m_preexisting_pins;
};

std::unique_ptr<GpioBackend> createSysfsGpioBackend(const std::string &root) {
    return std::unique_ptr<GpioBackend>(new GpioSysfs(root));
}
