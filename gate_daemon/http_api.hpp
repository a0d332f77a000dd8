#ifndef HTTP_API_HPP
#define HTTP_API_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "alert_ledger.hpp"
#include "gate_controller.hpp"
#include "relay_client.hpp"
#include "telemetry.hpp"

class DetectionLoop;
class GateDirectory;

struct HttpRequest {
    std::string method;
    std::string path;
    std::string query;
    std::map<std::string, std::string> headers;  // lower-case names
    std::string body;

    /**
     * Value of a query parameter, empty if absent.
     */
    std::string queryParam(const std::string &name) const;
};

struct HttpResponse {
    int status = 200;
    std::string body;

    static HttpResponse fromJson(int status, const nlohmann::json &body);
    std::string serialize() const;
    static const char *reasonPhrase(int status);
};

/**
 * HttpApi - JSON API for the dashboard
 *
 * Non-blocking listener polled from the main loop. One request per
 * connection; responses always close the connection.
 */
class HttpApi {
public:
    enum class ParseStatus {
        COMPLETE,
        INCOMPLETE,
        INVALID,
        TOO_LARGE
    };

    static constexpr size_t MAX_REQUEST_BYTES = 64 * 1024;
    static constexpr uint64_t CLIENT_TIMEOUT_MS = 5000;

    HttpApi(uint16_t port, AlertLedger &ledger, GateController &gate,
            RelayClient &relay, Telemetry &telemetry);
    ~HttpApi();

    HttpApi(const HttpApi &) = delete;
    HttpApi &operator=(const HttpApi &) = delete;

    // Optional collaborators
    void setDetectionLoop(const DetectionLoop *loop) { m_loop = loop; }
    void setDirectory(const GateDirectory *directory) { m_directory = directory; }
    void setTunnel(const TunnelSupervisor *tunnel) { m_tunnel = tunnel; }
    void setTransport(const RelayTransport *transport) { m_transport = transport; }

    bool start();
    void stop();

    /**
     * Accept, read and answer whatever is ready. Never blocks.
     */
    void poll();

    HttpResponse handleRequest(const HttpRequest &request);

    static ParseStatus parseRequest(const std::string &raw, HttpRequest &out);

    uint16_t getPort() const { return m_port; }
    uint32_t getRequestCount() const { return m_requests; }

private:
    struct Client {
        int fd = -1;
        std::string rx;
        uint64_t opened_ms = 0;
    };

    HttpResponse handleAlerts(const HttpRequest &request);
    HttpResponse handleGateStatus();
    HttpResponse handleGates();
    HttpResponse handleLatestCapture();
    HttpResponse handleHealth();
    HttpResponse handleDetection(const HttpRequest &request);
    HttpResponse handleSendCommand(const HttpRequest &request);

    nlohmann::json captureJson() const;

    void acceptClients();
    bool serviceClient(Client &client, uint64_t now);
    void sendAll(int fd, const std::string &data);

    static uint64_t now_ms();

    const uint16_t m_port;
    AlertLedger &m_ledger;
    GateController &m_gate;
    RelayClient &m_relay;
    Telemetry &m_telemetry;

    const DetectionLoop *m_loop = nullptr;
    const GateDirectory *m_directory = nullptr;
    const TunnelSupervisor *m_tunnel = nullptr;
    const RelayTransport *m_transport = nullptr;

    int m_server_fd = -1;
    std::vector<Client> m_clients;
    uint32_t m_requests = 0;
};

#endif // HTTP_API_HPP
