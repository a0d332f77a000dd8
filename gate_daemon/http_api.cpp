/**
 * HttpApi Implementation
 */

#include "http_api.hpp"
#include "detection_loop.hpp"
#include "gate_directory.hpp"
#include "logger.h"
#include "relay_protocol.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sstream>
#include <sys/socket.h>
#include <unistd.h>

using json = nlohmann::json;

static const char *TAG = "HTTP";

static bool setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) >= 0;
}

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string trim(const std::string &s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

static HttpResponse errorResponse(int status, const std::string &message) {
    return HttpResponse::fromJson(status, {{"status", "error"}, {"message", message}});
}

// Gate ids arrive as JSON numbers from the dashboard and as strings from scripts
static std::string gateIdOf(const json &value, const std::string &fallback) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_integer()) return std::to_string(value.get<long long>());
    return fallback;
}

// ============================================================================
// Request / Response
// ============================================================================

std::string HttpRequest::queryParam(const std::string &name) const {
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t end = query.find('&', pos);
        if (end == std::string::npos) end = query.size();
        std::string pair = query.substr(pos, end - pos);
        size_t eq = pair.find('=');
        if (pair.substr(0, eq) == name) {
            return eq == std::string::npos ? "" : pair.substr(eq + 1);
        }
        pos = end + 1;
    }
    return "";
}

HttpResponse HttpResponse::fromJson(int status, const nlohmann::json &body) {
    HttpResponse response;
    response.status = status;
    response.body = body.dump();
    return response;
}

const char *HttpResponse::reasonPhrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
    }
    return "Unknown";
}

std::string HttpResponse::serialize() const {
    std::ostringstream ss;
    ss << "HTTP/1.1 " << status << " " << reasonPhrase(status) << "\r\n"
       << "Content-Type: application/json\r\n"
       << "Content-Length: " << body.size() << "\r\n"
       << "Access-Control-Allow-Origin: *\r\n"
       << "Connection: close\r\n"
       << "\r\n"
       << body;
    return ss.str();
}

HttpApi::ParseStatus HttpApi::parseRequest(const std::string &raw, HttpRequest &out) {
    size_t header_end = raw.find("\r\n\r\n");
    if (header_end == std::string::npos) {
        return raw.size() > MAX_REQUEST_BYTES ? ParseStatus::TOO_LARGE : ParseStatus::INCOMPLETE;
    }

    HttpRequest request;
    std::istringstream head(raw.substr(0, header_end));
    std::string line;

    if (!std::getline(head, line)) {
        return ParseStatus::INVALID;
    }
    std::istringstream request_line(trim(line));
    std::string target;
    std::string version;
    if (!(request_line >> request.method >> target >> version) ||
        version.compare(0, 5, "HTTP/") != 0 || target.empty() || target[0] != '/') {
        return ParseStatus::INVALID;
    }

    size_t qmark = target.find('?');
    request.path = target.substr(0, qmark);
    if (qmark != std::string::npos) {
        request.query = target.substr(qmark + 1);
    }

    while (std::getline(head, line)) {
        line = trim(line);
        if (line.empty()) continue;
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            return ParseStatus::INVALID;
        }
        request.headers[toLower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }

    size_t content_length = 0;
    auto it = request.headers.find("content-length");
    if (it != request.headers.end()) {
        const std::string &value = it->second;
        if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos ||
            value.size() > 9) {
            return ParseStatus::INVALID;
        }
        content_length = std::stoul(value);
    }

    size_t body_start = header_end + 4;
    if (body_start + content_length > MAX_REQUEST_BYTES) {
        return ParseStatus::TOO_LARGE;
    }
    if (raw.size() < body_start + content_length) {
        return ParseStatus::INCOMPLETE;
    }

    request.body = raw.substr(body_start, content_length);
    out = request;
    return ParseStatus::COMPLETE;
}

// ============================================================================
// Server
// ============================================================================

uint64_t HttpApi::now_ms() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

HttpApi::HttpApi(uint16_t port, AlertLedger &ledger, GateController &gate,
                 RelayClient &relay, Telemetry &telemetry)
    : m_port(port), m_ledger(ledger), m_gate(gate), m_relay(relay), m_telemetry(telemetry) {}

HttpApi::~HttpApi() {
    stop();
}

bool HttpApi::start() {
    m_server_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (m_server_fd < 0) {
        LOG_ERROR(TAG, "socket: %s", strerror(errno));
        return false;
    }

    int opt = 1;
    setsockopt(m_server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(m_port);

    if (bind(m_server_fd, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
        LOG_ERROR(TAG, "bind port %u: %s", (unsigned)m_port, strerror(errno));
        close(m_server_fd);
        m_server_fd = -1;
        return false;
    }

    if (listen(m_server_fd, 16) < 0) {
        LOG_ERROR(TAG, "listen: %s", strerror(errno));
        close(m_server_fd);
        m_server_fd = -1;
        return false;
    }

    setNonBlocking(m_server_fd);
    LOG_INFO(TAG, "Listening on port %u", (unsigned)m_port);
    return true;
}

void HttpApi::stop() {
    for (auto &client : m_clients) {
        close(client.fd);
    }
    m_clients.clear();

    if (m_server_fd >= 0) {
        close(m_server_fd);
        m_server_fd = -1;
        LOG_INFO(TAG, "Stopped after %u requests", m_requests);
    }
}

void HttpApi::poll() {
    if (m_server_fd < 0) {
        return;
    }

    acceptClients();

    uint64_t now = now_ms();
    for (auto it = m_clients.begin(); it != m_clients.end();) {
        if (serviceClient(*it, now)) {
            close(it->fd);
            it = m_clients.erase(it);
        } else {
            ++it;
        }
    }
}

void HttpApi::acceptClients() {
    while (true) {
        int fd = accept(m_server_fd, nullptr, nullptr);
        if (fd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                LOG_WARN(TAG, "accept: %s", strerror(errno));
            }
            return;
        }
        setNonBlocking(fd);
        Client client;
        client.fd = fd;
        client.opened_ms = now_ms();
        m_clients.push_back(client);
    }
}

bool HttpApi::serviceClient(Client &client, uint64_t now) {
    char buf[4096];
    bool peer_closed = false;
    while (true) {
        ssize_t n = recv(client.fd, buf, sizeof(buf), 0);
        if (n > 0) {
            client.rx.append(buf, (size_t)n);
            if (client.rx.size() > MAX_REQUEST_BYTES) break;
            continue;
        }
        if (n == 0) {
            peer_closed = true;
            break;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            break;
        }
        if (errno == EINTR) {
            continue;
        }
        LOG_DEBUG(TAG, "recv: %s", strerror(errno));
        return true;
    }

    HttpRequest request;
    switch (parseRequest(client.rx, request)) {
        case ParseStatus::INCOMPLETE:
            if (peer_closed) {
                return true;
            }
            if (now - client.opened_ms > CLIENT_TIMEOUT_MS) {
                sendAll(client.fd, errorResponse(408, "Request timeout").serialize());
                return true;
            }
            return false;
        case ParseStatus::INVALID:
            sendAll(client.fd, errorResponse(400, "Malformed request").serialize());
            return true;
        case ParseStatus::TOO_LARGE:
            sendAll(client.fd, errorResponse(413, "Request too large").serialize());
            return true;
        case ParseStatus::COMPLETE:
            break;
    }

    m_requests++;
    HttpResponse response = handleRequest(request);
    LOG_DEBUG(TAG, "%s %s -> %d", request.method.c_str(), request.path.c_str(), response.status);
    sendAll(client.fd, response.serialize());
    return true;
}

void HttpApi::sendAll(int fd, const std::string &data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += (size_t)n;
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            struct pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLOUT;
            pfd.revents = 0;
            if (::poll(&pfd, 1, 1000) > 0) {
                continue;
            }
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        LOG_DEBUG(TAG, "send aborted after %zu/%zu bytes", sent, data.size());
        return;
    }
}

// ============================================================================
// Routes
// ============================================================================

HttpResponse HttpApi::handleRequest(const HttpRequest &request) {
    struct Route {
        const char *method;
        const char *path;
    };
    static const Route routes[] = {
        {"GET", "/alerts"},
        {"GET", "/gate-status"},
        {"GET", "/gates"},
        {"GET", "/latest-capture"},
        {"GET", "/health"},
        {"POST", "/detection"},
        {"POST", "/send_command"},
    };

    bool path_known = false;
    for (const auto &route : routes) {
        if (request.path != route.path) continue;
        path_known = true;
        if (request.method != route.method) continue;

        const std::string path = route.path;
        if (path == "/alerts") return handleAlerts(request);
        if (path == "/gate-status") return handleGateStatus();
        if (path == "/gates") return handleGates();
        if (path == "/latest-capture") return handleLatestCapture();
        if (path == "/health") return handleHealth();
        if (path == "/detection") return handleDetection(request);
        if (path == "/send_command") return handleSendCommand(request);
    }

    if (path_known) {
        return errorResponse(405, "Method not allowed");
    }
    return errorResponse(404, "Not found");
}

HttpResponse HttpApi::handleAlerts(const HttpRequest &request) {
    size_t limit = 0;
    std::string value = request.queryParam("limit");
    if (!value.empty()) {
        if (value.find_first_not_of("0123456789") != std::string::npos || value.size() > 6) {
            return errorResponse(400, "Invalid limit");
        }
        limit = std::stoul(value);
        if (limit == 0) {
            return errorResponse(400, "limit must be at least 1");
        }
    }

    json alerts = json::array();
    for (const Alert &alert : m_ledger.listAlerts(limit)) {
        alerts.push_back(RelayProtocol::alertToJson(alert));
    }
    return HttpResponse::fromJson(200, {{"alerts", alerts}});
}

json HttpApi::captureJson() const {
    if (m_loop) {
        std::optional<DetectionSet> latest = m_loop->latestDetection();
        if (latest) {
            return RelayProtocol::detectionToJson(*latest);
        }
    }
    return {
        {"objects", json::array()},
        {"confidence", json::array()},
        {"timestamp", 0}
    };
}

HttpResponse HttpApi::handleGateStatus() {
    json gates = json::object();

    if (m_directory) {
        for (const GateInfo &info : m_directory->gates()) {
            gates[info.gate_id] = {
                {"status", info.gate_status},
                {"online", info.online},
                {"last_update", info.last_seen_ms / 1000.0}
            };
        }
    }

    // The local controller is authoritative for its own gate
    gates[m_gate.getGateId()] = {
        {"status", gateStateToString(m_gate.getState())},
        {"online", true},
        {"last_update", m_gate.getLastChangeMs() / 1000.0}
    };

    json context = nullptr;
    if (m_loop && m_loop->latestDetection()) {
        context = captureJson();
    }

    return HttpResponse::fromJson(200, {{"gates", gates}, {"detection_context", context}});
}

HttpResponse HttpApi::handleGates() {
    json gates = json::array();
    if (m_directory) {
        for (const GateInfo &info : m_directory->gates()) {
            gates.push_back({
                {"id", info.gate_id},
                {"status", info.gate_status},
                {"online_status", info.online ? "online" : "offline"},
                {"last_seen", info.last_seen_ms / 1000.0}
            });
        }
    }
    return HttpResponse::fromJson(200, {{"gates", gates}});
}

HttpResponse HttpApi::handleLatestCapture() {
    return HttpResponse::fromJson(200, {{"capture", captureJson()}});
}

HttpResponse HttpApi::handleHealth() {
    json detection = {
        {"cycles", m_telemetry.getCycleCount()},
        {"cycle_hz", m_telemetry.getCycleHz()},
        {"detections", m_telemetry.getDetectionCount()},
        {"actions", m_telemetry.getActionCount()},
        {"engine_errors", m_telemetry.getEngineErrorCount()}
    };
    json relay = {
        {"connected", m_transport ? m_transport->isConnected() : false},
        {"published", m_relay.getPublishedCount()},
        {"failed", m_relay.getFailedCount()},
        {"dropped", m_relay.getDroppedCount()},
        {"pending", m_relay.getPendingCount()}
    };

    return HttpResponse::fromJson(200, {
        {"status", "ok"},
        {"gate_id", m_gate.getGateId()},
        {"gate_status", gateStateToString(m_gate.getState())},
        {"uptime_s", m_telemetry.getUptimeSeconds()},
        {"detection", detection},
        {"relay", relay},
        {"tunnel", m_tunnel ? tunnelStatusToString(m_tunnel->status()) : "disabled"},
        {"alerts", m_ledger.size()}
    });
}

HttpResponse HttpApi::handleDetection(const HttpRequest &request) {
    json body;
    try {
        body = json::parse(request.body);
    } catch (const json::exception &) {
        return errorResponse(400, "Invalid JSON");
    }
    if (!body.is_object()) {
        return errorResponse(400, "Invalid JSON");
    }

    std::string gate_id = m_gate.getGateId();
    if (body.contains("gate")) {
        gate_id = gateIdOf(body["gate"], gate_id);
    }

    std::string objects;
    auto it = body.find("objects");
    if (it != body.end() && it->is_array()) {
        for (const auto &obj : *it) {
            if (!obj.is_string()) continue;
            if (!objects.empty()) objects += ", ";
            objects += obj.get<std::string>();
        }
    }

    if (!objects.empty()) {
        m_ledger.addAlert("Gate " + gate_id + ": Animal detected: " + objects, AlertLevel::WARNING);
    }
    return HttpResponse::fromJson(200, {{"status", "received"}});
}

HttpResponse HttpApi::handleSendCommand(const HttpRequest &request) {
    json body;
    try {
        body = json::parse(request.body);
    } catch (const json::exception &) {
        return errorResponse(400, "Invalid JSON");
    }
    if (!body.is_object()) {
        return errorResponse(400, "Invalid JSON");
    }

    auto it = body.find("command");
    if (it == body.end() || !it->is_string() || it->get<std::string>().empty()) {
        return errorResponse(400, "No command provided");
    }
    std::string command = it->get<std::string>();

    std::string gate_id = m_gate.getGateId();
    if (body.contains("gate")) {
        gate_id = gateIdOf(body["gate"], gate_id);
    }

    if (!m_relay.sendCommand(command, gate_id)) {
        return errorResponse(503, "Relay unavailable");
    }

    m_ledger.addAlert("Command sent to Gate " + gate_id + ": " + command, AlertLevel::INFO);
    return HttpResponse::fromJson(200, {{"status", "sent"}, {"gate", gate_id}});
}
