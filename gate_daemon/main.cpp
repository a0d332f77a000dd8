/**
 * SmartGate - Gate Daemon
 *
 * Main entry point for one gate controller.
 *
 * Responsibilities:
 * - Detection loop (inference engine socket -> rules -> gate motor)
 * - MQTT relay to the cloud dashboard (reports out, commands in)
 * - Reverse SSH tunnel for the camera stream
 * - HTTP JSON API for the dashboard
 */

#include <atomic>
#include <csignal>
#include <ctime>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <thread>
#include <unistd.h>

#include "alert_ledger.hpp"
#include "config_store.hpp"
#include "detection_loop.hpp"
#include "gate_controller.hpp"
#include "gate_directory.hpp"
#include "gpio/gpio_backend.hpp"
#include "gpio_actuator.hpp"
#include "http_api.hpp"
#include "logger.h"
#include "mqtt_transport.hpp"
#include "process_launcher.hpp"
#include "relay_client.hpp"
#include "rule_engine.hpp"
#include "simulated_actuator.hpp"
#include "socket_detection_source.hpp"
#include "telemetry.hpp"
#include "tunnel_supervisor.hpp"

#define DIRECTORY_SWEEP_INTERVAL_MS 1000

static const char *TAG = "Gate";

static std::atomic<bool> g_shutdown{false};

void signal_handler(int sig) {
    (void)sig;
    g_shutdown.store(true);
}

static uint64_t get_time_ms() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return (uint64_t)ts.tv_sec * 1000 + ts.tv_nsec / 1000000;
}

class GateDaemon {
public:
    GateDaemon(const ConfigStore &config, bool simulate)
        : m_config(config), m_simulate(simulate), m_rules(config.rules) {}

    bool init();
    void run();
    void shutdown();

private:
    bool initActuator();
    void initTunnel();
    void tickHeartbeat(uint64_t now);
    void tickDirectory(uint64_t now);
    void detectionThread();

    const ConfigStore m_config;
    const bool m_simulate;

    AlertLedger m_ledger;
    Telemetry m_telemetry;
    RuleEngine m_rules;

    std::unique_ptr<GpioBackend> m_gpio;
    std::unique_ptr<GpioActuator> m_gpio_actuator;
    std::unique_ptr<SimulatedActuator> m_sim_actuator;
    Actuator *m_actuator = nullptr;

    std::unique_ptr<GateController> m_gate;
    std::unique_ptr<MqttTransport> m_transport;
    std::unique_ptr<RelayClient> m_relay;
    std::unique_ptr<GateDirectory> m_directory;

    PosixProcessLauncher m_launcher;
    std::unique_ptr<TunnelSupervisor> m_tunnel;

    std::unique_ptr<SocketDetectionSource> m_source;
    std::unique_ptr<DetectionLoop> m_loop;
    std::thread m_loop_thread;

    std::unique_ptr<HttpApi> m_http;

    uint64_t m_last_heartbeat_ms = 0;
    uint64_t m_last_sweep_ms = 0;
};

bool GateDaemon::init() {
    LOG_INFO(TAG, "SmartGate daemon starting (gate %s, %zu rules)",
             m_config.gate_id.c_str(), m_config.rules.size());
    if (m_config.rules.empty()) {
        LOG_WARN(TAG, "No rules configured: detections will never move the gate");
    }

    if (!initActuator()) {
        LOG_ERROR(TAG, "CRITICAL: Failed to initialize gate actuator");
        return false;
    }

    m_gate.reset(new GateController(m_config.gate_id, *m_actuator, m_ledger));

    m_transport.reset(new MqttTransport(m_config.mqtt));
    m_relay.reset(new RelayClient(m_config.relayConfig(), *m_transport, *m_gate, m_ledger));
    m_directory.reset(new GateDirectory(m_config.topic_prefix, m_config.gate_id, m_ledger));

    RelayClient *relay = m_relay.get();
    m_gate->setStateCallback([relay](const std::string &, GateState state) {
        relay->reportStatus(state);
    });
    m_ledger.setListener([relay](const Alert &alert) {
        relay->reportAlert(alert);
    });

    m_relay->start();
    m_directory->attach(*m_transport);
    if (!m_transport->connect()) {
        LOG_WARN(TAG, "MQTT broker not reachable yet (retry every %u ms)",
                 m_config.mqtt.reconnect_interval_ms);
    }

    initTunnel();

    m_source.reset(new SocketDetectionSource(m_config.detection_socket, m_config.min_confidence));
    if (!m_source->open()) {
        LOG_ERROR(TAG, "CRITICAL: Failed to open detection socket %s", m_config.detection_socket.c_str());
        return false;
    }

    m_loop.reset(new DetectionLoop(*m_source, m_rules, *m_gate, *m_relay, m_ledger, m_telemetry));
    m_loop->setPollTimeoutMs(m_config.poll_timeout_ms);

    if (m_config.http_enabled) {
        m_http.reset(new HttpApi(m_config.http_port, m_ledger, *m_gate, *m_relay, m_telemetry));
        m_http->setDetectionLoop(m_loop.get());
        m_http->setDirectory(m_directory.get());
        m_http->setTunnel(m_tunnel.get());
        m_http->setTransport(m_transport.get());
        if (!m_http->start()) {
            LOG_ERROR(TAG, "CRITICAL: Failed to start HTTP API on port %u", (unsigned)m_config.http_port);
            return false;
        }
    }

    m_ledger.addAlert("SmartGate " + m_config.gate_id + " started", AlertLevel::INFO);
    LOG_INFO(TAG, "All systems initialized");
    return true;
}

bool GateDaemon::initActuator() {
    if (m_simulate || m_config.actuator_type == "simulated") {
        LOG_INFO(TAG, "Using simulated actuator");
        m_sim_actuator.reset(new SimulatedActuator());
        m_actuator = m_sim_actuator.get();
        return true;
    }

    m_gpio = createSysfsGpioBackend();
    if (!m_gpio->init()) {
        return false;
    }
    m_gpio_actuator.reset(new GpioActuator(*m_gpio, m_config.gpio));
    if (!m_gpio_actuator->init()) {
        return false;
    }
    m_actuator = m_gpio_actuator.get();
    return true;
}

void GateDaemon::initTunnel() {
    if (!m_config.tunnel_enabled) {
        LOG_INFO(TAG, "Camera tunnel disabled");
        return;
    }

    m_tunnel.reset(new TunnelSupervisor(m_config.tunnel, m_launcher, m_ledger));
    RelayClient *relay = m_relay.get();
    m_tunnel->setStatusCallback([relay](TunnelStatus status) {
        relay->reportStreamStatus(status);
    });
    m_relay->setTunnel(m_tunnel.get());

    if (m_config.tunnel_autostart) {
        m_tunnel->start();
    }
}

void GateDaemon::detectionThread() {
    try {
        m_loop->run(g_shutdown);
    } catch (const std::exception &e) {
        LOG_ERROR(TAG, "Detection thread terminated: %s", e.what());
    }
}

void GateDaemon::run() {
    uint64_t now = get_time_ms();
    m_last_sweep_ms = now;

    // First heartbeat goes out immediately
    m_relay->sendHeartbeat(m_telemetry.getUptimeSeconds());
    m_last_heartbeat_ms = now;

    m_loop_thread = std::thread(&GateDaemon::detectionThread, this);

    while (!g_shutdown.load()) {
        now = get_time_ms();

        if (m_http) {
            m_http->poll();
        }
        m_transport->tick();
        if (m_tunnel) {
            m_tunnel->tick();
        }
        m_actuator->tick();
        tickHeartbeat(now);
        tickDirectory(now);

        usleep(1000);
    }
}

void GateDaemon::tickHeartbeat(uint64_t now) {
    if (now - m_last_heartbeat_ms < m_config.heartbeat_interval_ms) {
        return;
    }
    m_last_heartbeat_ms = now;
    m_relay->sendHeartbeat(m_telemetry.getUptimeSeconds());
}

void GateDaemon::tickDirectory(uint64_t now) {
    if (now - m_last_sweep_ms < DIRECTORY_SWEEP_INTERVAL_MS) {
        return;
    }
    m_last_sweep_ms = now;
    m_directory->sweep();
}

void GateDaemon::shutdown() {
    LOG_INFO(TAG, "Shutting down...");
    g_shutdown.store(true);

    if (m_loop_thread.joinable()) {
        m_loop_thread.join();
    }

    if (m_http) {
        m_http->stop();
    }
    if (m_tunnel) {
        m_relay->setTunnel(nullptr);
        m_tunnel->stop();
    }

    if (m_relay) {
        m_ledger.setListener(nullptr);
        m_gate->setStateCallback(nullptr);
        m_relay->stop();
    }
    if (m_transport) {
        m_transport->disconnect();
    }

    if (m_gpio_actuator) {
        m_gpio_actuator->release();
    } else if (m_actuator) {
        m_actuator->stopMotor();
    }
    if (m_gpio) {
        m_gpio->cleanup();
    }
    if (m_source) {
        m_source->close();
    }

    LOG_INFO(TAG, "Shutdown complete (%llu detection cycles, %u gate actions)",
             (unsigned long long)m_telemetry.getCycleCount(), m_telemetry.getActionCount());
}

static void print_usage(const char *prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --config PATH       Configuration file (default: " << ConfigStore::DEFAULT_PATH << ")\n"
              << "  --log-level LEVEL   Set log level: DEBUG, INFO, WARN, ERROR (default: INFO)\n"
              << "  --log-file PATH     Log to file (in addition to stdout)\n"
              << "  --simulate          Use the simulated actuator (no GPIO)\n"
              << "  -h, --help          Show this help\n";
}

int main(int argc, char *argv[]) {
    static struct option long_options[] = {
        {"config",    required_argument, 0, 'c'},
        {"log-level", required_argument, 0, 'l'},
        {"log-file",  required_argument, 0, 'f'},
        {"simulate",  no_argument,       0, 's'},
        {"help",      no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    std::string config_path = ConfigStore::DEFAULT_PATH;
    std::string log_level;
    std::string log_file;
    bool simulate = false;

    int opt;
    while ((opt = getopt_long(argc, argv, "c:l:f:sh", long_options, nullptr)) != -1) {
        switch (opt) {
        case 'c':
            config_path = optarg;
            break;
        case 'l':
            log_level = optarg;
            break;
        case 'f':
            log_file = optarg;
            break;
        case 's':
            simulate = true;
            break;
        case 'h':
            print_usage(argv[0]);
            return 0;
        default:
            print_usage(argv[0]);
            return 1;
        }
    }

    ConfigStore config;
    ConfigStore::LoadStatus status = config.load(config_path);
    if (status == ConfigStore::LoadStatus::INVALID) {
        LOG_ERROR(TAG, "Invalid configuration %s: %s", config_path.c_str(), config.lastError().c_str());
        return 1;
    }

    // Command line wins over the config file
    if (log_level.empty()) log_level = config.log_level;
    if (log_file.empty()) log_file = config.log_file;

    if (!Logger::instance().setLevel(log_level)) {
        LOG_WARN(TAG, "Unknown log level '%s', keeping INFO", log_level.c_str());
    }
    if (!log_file.empty()) {
        if (!Logger::instance().openFile(log_file)) {
            std::cerr << "Warning: Could not open log file: " << log_file << std::endl;
        }
    }

    if (status == ConfigStore::LoadStatus::MISSING) {
        LOG_WARN(TAG, "Config %s not found, using defaults", config_path.c_str());
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    GateDaemon daemon(config, simulate);

    if (!daemon.init()) {
        LOG_ERROR(TAG, "Initialization failed");
        daemon.shutdown();
        return 1;
    }

    daemon.run();
    daemon.shutdown();

    LOG_INFO(TAG, "Exited cleanly");
    return 0;
}
