#include "infrastructure/api/RestApiServer.hpp"

#include "infrastructure/api/ApiJson.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace vlanvision::infra {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    auto end = str.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : str.substr(start, end - start + 1);
}

std::optional<int64_t> parseId(const std::string& text) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value <= 0) {
        return std::nullopt;
    }
    return value;
}

std::optional<int64_t> pathId(const ApiRequest& req, ApiResponse& res) {
    auto it = req.pathParams.find("id");
    auto id = it == req.pathParams.end() ? std::nullopt : parseId(it->second);
    if (!id) {
        res.setError(400, "Invalid id");
    }
    return id;
}

bool queryFlag(const ApiRequest& req, const std::string& name) {
    auto it = req.queryParams.find(name);
    return it != req.queryParams.end() && (it->second == "true" || it->second == "1");
}

const char* methodName(HttpMethod method) {
    switch (method) {
    case HttpMethod::GET:
        return "GET";
    case HttpMethod::POST:
        return "POST";
    case HttpMethod::PUT:
        return "PUT";
    case HttpMethod::DELETE:
        return "DELETE";
    case HttpMethod::OPTIONS:
        return "OPTIONS";
    case HttpMethod::UNKNOWN:
        break;
    }
    return "UNKNOWN";
}

} // namespace

void ApiResponse::setJson(const nlohmann::json& json) {
    body = json.dump();
    headers["Content-Type"] = "application/json";
}

void ApiResponse::setStatus(int code) {
    statusCode = code;
    switch (code) {
    case 200:
        statusText = "OK";
        break;
    case 202:
        statusText = "Accepted";
        break;
    case 204:
        statusText = "No Content";
        break;
    case 400:
        statusText = "Bad Request";
        break;
    case 404:
        statusText = "Not Found";
        break;
    case 405:
        statusText = "Method Not Allowed";
        break;
    case 409:
        statusText = "Conflict";
        break;
    case 413:
        statusText = "Payload Too Large";
        break;
    case 500:
        statusText = "Internal Server Error";
        break;
    case 503:
        statusText = "Service Unavailable";
        break;
    default:
        statusText = code < 400 ? "OK" : "Error";
    }
}

void ApiResponse::setError(int code, const std::string& message) {
    setStatus(code);
    nlohmann::json error;
    error["error"] = message;
    error["status"] = code;
    setJson(error);
}

std::string ApiResponse::toString() const {
    std::ostringstream ss;
    ss << "HTTP/1.1 " << statusCode << " " << statusText << "\r\n";
    for (const auto& [key, value] : headers) {
        ss << key << ": " << value << "\r\n";
    }
    ss << "Content-Length: " << body.size() << "\r\n";
    ss << "Connection: close\r\n";
    ss << "\r\n";
    ss << body;
    return ss.str();
}

RestApiServer::RestApiServer(AsioContext& asioContext, ApiBackends backends, std::string bindAddress,
                             uint16_t port)
    : asioContext_(asioContext), backends_(backends), bindAddress_(std::move(bindAddress)), port_(port) {
    registerRoutes();
}

RestApiServer::~RestApiServer() {
    stop();
}

void RestApiServer::registerRoutes() {
    routes_.push_back({HttpMethod::GET, "/api/health", [this](auto& req, auto& res) { handleHealth(req, res); }});

    // Devices
    routes_.push_back(
        {HttpMethod::GET, "/api/network/devices", [this](auto& req, auto& res) { handleGetDevices(req, res); }});
    routes_.push_back(
        {HttpMethod::GET, "/api/network/devices/:id", [this](auto& req, auto& res) { handleGetDevice(req, res); }});
    routes_.push_back({HttpMethod::POST, "/api/network/devices/:id/retire",
                       [this](auto& req, auto& res) { handleRetireDevice(req, res); }});

    // Discovery jobs
    routes_.push_back(
        {HttpMethod::POST, "/api/network/discover", [this](auto& req, auto& res) { handleDiscover(req, res); }});
    routes_.push_back(
        {HttpMethod::GET, "/api/network/jobs", [this](auto& req, auto& res) { handleGetJobs(req, res); }});
    routes_.push_back(
        {HttpMethod::GET, "/api/network/jobs/:id", [this](auto& req, auto& res) { handleGetJob(req, res); }});
    routes_.push_back({HttpMethod::POST, "/api/network/jobs/:id/cancel",
                       [this](auto& req, auto& res) { handleCancelJob(req, res); }});

    // Topology
    routes_.push_back(
        {HttpMethod::GET, "/api/network/vlans", [this](auto& req, auto& res) { handleGetVlans(req, res); }});
    routes_.push_back(
        {HttpMethod::GET, "/api/network/topology", [this](auto& req, auto& res) { handleGetTopology(req, res); }});
    routes_.push_back({HttpMethod::GET, "/api/network/topology/analysis",
                       [this](auto& req, auto& res) { handleGetTopologyAnalysis(req, res); }});

    // Alerts
    routes_.push_back({HttpMethod::GET, "/api/alerts", [this](auto& req, auto& res) { handleGetAlerts(req, res); }});
    routes_.push_back({HttpMethod::POST, "/api/alerts/:id/acknowledge",
                       [this](auto& req, auto& res) { handleAcknowledgeAlert(req, res); }});
}

void RestApiServer::start() {
    if (running_.load()) {
        return;
    }

    try {
        asio::ip::tcp::endpoint endpoint(asio::ip::make_address(bindAddress_), port_);
        acceptor_ = std::make_unique<asio::ip::tcp::acceptor>(asioContext_.getContext());
        acceptor_->open(endpoint.protocol());
        acceptor_->set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_->bind(endpoint);
        acceptor_->listen();
        port_ = acceptor_->local_endpoint().port();

        running_ = true;
        startAccept();
        spdlog::info("REST API server listening on {}:{}", bindAddress_, port_);
    } catch (const std::exception& e) {
        spdlog::error("Failed to start REST API server: {}", e.what());
        acceptor_.reset();
        throw;
    }
}

void RestApiServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (acceptor_) {
        asio::error_code ec;
        acceptor_->close(ec);
    }
    spdlog::info("REST API server stopped");
}

void RestApiServer::startAccept() {
    if (!running_.load()) {
        return;
    }

    auto socket = std::make_shared<asio::ip::tcp::socket>(asioContext_.getContext());
    auto self = shared_from_this();

    acceptor_->async_accept(*socket, [this, self, socket](const asio::error_code& ec) {
        if (!ec && running_.load()) {
            readRequest(socket);
        }
        if (running_.load()) {
            startAccept();
        }
    });
}

void RestApiServer::readRequest(std::shared_ptr<asio::ip::tcp::socket> socket) {
    auto buffer = std::make_shared<asio::streambuf>(MAX_BODY_SIZE);
    auto self = shared_from_this();

    asio::async_read_until(
        *socket, *buffer, "\r\n\r\n",
        [this, self, socket, buffer](const asio::error_code& ec, std::size_t /*bytesTransferred*/) {
            if (ec) {
                return;
            }

            std::string headerData((std::istreambuf_iterator<char>(&*buffer)), std::istreambuf_iterator<char>());
            auto request = parseRequest(headerData);

            size_t contentLength = 0;
            if (auto it = request.headers.find("content-length"); it != request.headers.end()) {
                auto [ptr, parseEc] =
                    std::from_chars(it->second.data(), it->second.data() + it->second.size(), contentLength);
                if (parseEc != std::errc() || contentLength > MAX_BODY_SIZE) {
                    ApiResponse response;
                    response.setError(parseEc != std::errc() ? 400 : 413, "Invalid Content-Length");
                    sendResponse(socket, response);
                    return;
                }
            }

            auto headerEnd = headerData.find("\r\n\r\n");
            size_t bodyInBuffer = headerEnd != std::string::npos ? headerData.size() - headerEnd - 4 : 0;
            size_t remaining = contentLength > bodyInBuffer ? contentLength - bodyInBuffer : 0;

            if (remaining == 0) {
                processRequest(socket, headerData);
                return;
            }

            auto bodyBuffer = std::make_shared<std::vector<char>>(remaining);
            asio::async_read(*socket, asio::buffer(*bodyBuffer),
                             [this, self, socket, headerData, bodyBuffer](const asio::error_code& ec2,
                                                                          std::size_t /*bytes*/) {
                                 if (!ec2) {
                                     processRequest(socket,
                                                    headerData + std::string(bodyBuffer->begin(), bodyBuffer->end()));
                                 }
                             });
        });
}

void RestApiServer::processRequest(std::shared_ptr<asio::ip::tcp::socket> socket, const std::string& rawRequest) {
    sendResponse(socket, handle(parseRequest(rawRequest)));
}

ApiResponse RestApiServer::handle(ApiRequest request) {
    ApiResponse response;
    response.headers["Access-Control-Allow-Origin"] = "*";
    response.headers["Access-Control-Allow-Methods"] = "GET, POST, OPTIONS";
    response.headers["Access-Control-Allow-Headers"] = "Content-Type";

    if (request.method == HttpMethod::OPTIONS) {
        response.setStatus(204);
        return response;
    }

    spdlog::debug("REST API request: {} {}", methodName(request.method), request.path);

    bool pathKnown = false;
    for (auto& route : routes_) {
        std::map<std::string, std::string> params;
        if (!matchRoute(route.pattern, request.path, params)) {
            continue;
        }
        pathKnown = true;
        if (route.method != request.method) {
            continue;
        }

        request.pathParams = std::move(params);
        try {
            route.handler(request, response);
        } catch (const nlohmann::json::exception& e) {
            response.setError(400, std::string("Invalid JSON: ") + e.what());
        } catch (const std::invalid_argument& e) {
            response.setError(400, e.what());
        } catch (const std::runtime_error& e) {
            spdlog::warn("REST API {} {} unavailable: {}", methodName(request.method), request.path, e.what());
            response.setError(503, e.what());
        } catch (const std::exception& e) {
            spdlog::error("REST API error on {} {}: {}", methodName(request.method), request.path, e.what());
            response.setError(500, "Internal server error");
        }
        return response;
    }

    if (pathKnown) {
        response.setError(405, "Method not allowed");
    } else {
        response.setError(404, "Endpoint not found");
    }
    return response;
}

void RestApiServer::sendResponse(std::shared_ptr<asio::ip::tcp::socket> socket, const ApiResponse& response) {
    auto responseStr = std::make_shared<std::string>(response.toString());

    asio::async_write(*socket, asio::buffer(*responseStr),
                      [socket, responseStr](const asio::error_code& /*ec*/, std::size_t /*bytes*/) {
                          asio::error_code shutdownEc;
                          socket->shutdown(asio::ip::tcp::socket::shutdown_both, shutdownEc);
                      });
}

ApiRequest RestApiServer::parseRequest(const std::string& rawRequest) {
    ApiRequest request;
    std::istringstream iss(rawRequest);
    std::string line;

    if (std::getline(iss, line)) {
        std::istringstream lineStream(trim(line));
        std::string method, path, version;
        lineStream >> method >> path >> version;

        request.method = parseMethod(method);

        auto queryPos = path.find('?');
        if (queryPos != std::string::npos) {
            request.queryParams = parseQueryString(path.substr(queryPos + 1));
            path = path.substr(0, queryPos);
        }
        request.path = path;
    }

    while (std::getline(iss, line) && line != "\r" && !line.empty()) {
        auto colonPos = line.find(':');
        if (colonPos != std::string::npos) {
            std::string key = trim(line.substr(0, colonPos));
            std::string value = trim(line.substr(colonPos + 1));
            std::transform(key.begin(), key.end(), key.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            request.headers[key] = value;
        }
    }

    auto bodyStart = rawRequest.find("\r\n\r\n");
    if (bodyStart != std::string::npos) {
        request.body = rawRequest.substr(bodyStart + 4);
    }

    return request;
}

HttpMethod RestApiServer::parseMethod(const std::string& method) {
    if (method == "GET")
        return HttpMethod::GET;
    if (method == "POST")
        return HttpMethod::POST;
    if (method == "PUT")
        return HttpMethod::PUT;
    if (method == "DELETE")
        return HttpMethod::DELETE;
    if (method == "OPTIONS")
        return HttpMethod::OPTIONS;
    return HttpMethod::UNKNOWN;
}

std::map<std::string, std::string> RestApiServer::parseQueryString(const std::string& queryString) {
    std::map<std::string, std::string> params;
    std::istringstream iss(queryString);
    std::string pair;

    while (std::getline(iss, pair, '&')) {
        auto eqPos = pair.find('=');
        if (eqPos != std::string::npos) {
            params[pair.substr(0, eqPos)] = pair.substr(eqPos + 1);
        } else if (!pair.empty()) {
            params[pair] = "true";
        }
    }

    return params;
}

bool RestApiServer::matchRoute(const std::string& pattern, const std::string& path,
                               std::map<std::string, std::string>& pathParams) {
    pathParams.clear();

    std::vector<std::string> patternParts, pathParts;
    std::istringstream patternStream(pattern), pathStream(path);
    std::string part;

    while (std::getline(patternStream, part, '/')) {
        if (!part.empty())
            patternParts.push_back(part);
    }
    while (std::getline(pathStream, part, '/')) {
        if (!part.empty())
            pathParts.push_back(part);
    }

    if (patternParts.size() != pathParts.size()) {
        return false;
    }

    for (size_t i = 0; i < patternParts.size(); ++i) {
        if (patternParts[i].front() == ':') {
            pathParams[patternParts[i].substr(1)] = pathParts[i];
        } else if (patternParts[i] != pathParts[i]) {
            return false;
        }
    }

    return true;
}

// Device endpoints
void RestApiServer::handleGetDevices(const ApiRequest& req, ApiResponse& res) {
    auto devices = backends_.registry.snapshot(queryFlag(req, "include_retired"));

    nlohmann::json list = nlohmann::json::array();
    for (const auto& device : devices) {
        list.push_back(api::deviceSummaryToJson(device));
    }

    nlohmann::json response;
    response["devices"] = list;
    response["count"] = devices.size();
    res.setJson(response);
}

void RestApiServer::handleGetDevice(const ApiRequest& req, ApiResponse& res) {
    auto id = pathId(req, res);
    if (!id) {
        return;
    }

    auto device = backends_.registry.find(*id);
    if (!device) {
        res.setError(404, "Device not found");
        return;
    }
    res.setJson(api::deviceToJson(*device));
}

void RestApiServer::handleRetireDevice(const ApiRequest& req, ApiResponse& res) {
    auto id = pathId(req, res);
    if (!id) {
        return;
    }

    auto existing = backends_.registry.find(*id);
    if (!existing) {
        res.setError(404, "Device not found");
        return;
    }
    auto retired = backends_.registry.retire(*id);
    if (!retired) {
        res.setError(409, "Device is already retired");
        return;
    }

    backends_.scheduler.persistDevice(*retired);
    backends_.topology.update(backends_.registry.snapshot());
    res.setJson(api::deviceSummaryToJson(*retired));
}

// Discovery endpoints
void RestApiServer::handleDiscover(const ApiRequest& req, ApiResponse& res) {
    auto body = nlohmann::json::parse(req.body.empty() ? "{}" : req.body);
    if (!body.is_object() || !body.contains("network_range") || !body["network_range"].is_string()) {
        res.setError(400, "'network_range' must be a CIDR string");
        return;
    }

    std::vector<core::ProbeTechnique> techniques;
    if (body.contains("techniques") && !body["techniques"].is_null()) {
        techniques = api::techniquesFromJson(body["techniques"]);
    }

    auto result = backends_.scheduler.submit(body["network_range"].get<std::string>(), techniques,
                                             core::JobOrigin::OnDemand);

    nlohmann::json response;
    response["job_id"] = result.jobId;
    response["status"] = core::jobStateToString(result.state);
    response["coalesced"] = result.coalesced;
    res.setStatus(202);
    res.setJson(response);
}

void RestApiServer::handleGetJobs(const ApiRequest& /*req*/, ApiResponse& res) {
    auto jobs = backends_.scheduler.jobs();

    nlohmann::json list = nlohmann::json::array();
    for (const auto& job : jobs) {
        list.push_back(api::jobToJson(job, false));
    }

    nlohmann::json response;
    response["jobs"] = list;
    response["count"] = jobs.size();
    res.setJson(response);
}

void RestApiServer::handleGetJob(const ApiRequest& req, ApiResponse& res) {
    auto id = pathId(req, res);
    if (!id) {
        return;
    }

    auto job = backends_.scheduler.job(*id);
    if (!job) {
        res.setError(404, "Job not found");
        return;
    }
    res.setJson(api::jobToJson(*job, true));
}

void RestApiServer::handleCancelJob(const ApiRequest& req, ApiResponse& res) {
    auto id = pathId(req, res);
    if (!id) {
        return;
    }

    auto job = backends_.scheduler.job(*id);
    if (!job) {
        res.setError(404, "Job not found");
        return;
    }
    if (!backends_.scheduler.cancel(*id)) {
        res.setError(409, "Job already finished");
        return;
    }

    auto current = backends_.scheduler.job(*id).value_or(*job);
    nlohmann::json response;
    response["job_id"] = current.id;
    response["status"] = current.stateToString();
    response["cancelled"] = true;
    res.setStatus(202);
    res.setJson(response);
}

// Topology endpoints
void RestApiServer::handleGetVlans(const ApiRequest& /*req*/, ApiResponse& res) {
    res.setJson(api::vlanGroupsToJson(backends_.registry.vlanGroups()));
}

void RestApiServer::handleGetTopology(const ApiRequest& /*req*/, ApiResponse& res) {
    res.setJson(api::topologyToJson(*backends_.topology.current()));
}

void RestApiServer::handleGetTopologyAnalysis(const ApiRequest& /*req*/, ApiResponse& res) {
    res.setJson(api::analysisToJson(engine::TopologyBuilder::analyze(*backends_.topology.current())));
}

// Alert endpoints
void RestApiServer::handleGetAlerts(const ApiRequest& req, ApiResponse& res) {
    size_t limit = 100;
    if (auto it = req.queryParams.find("limit"); it != req.queryParams.end()) {
        auto parsed = parseId(it->second);
        if (!parsed) {
            res.setError(400, "Invalid limit");
            return;
        }
        limit = static_cast<size_t>(*parsed);
    }

    auto alerts = queryFlag(req, "active") ? backends_.alerts.activeAlerts() : backends_.alerts.history(limit);

    nlohmann::json list = nlohmann::json::array();
    for (const auto& alert : alerts) {
        list.push_back(api::alertToJson(alert));
    }

    nlohmann::json response;
    response["alerts"] = list;
    response["count"] = alerts.size();
    response["open_count"] = backends_.alerts.activeAlerts().size();
    res.setJson(response);
}

void RestApiServer::handleAcknowledgeAlert(const ApiRequest& req, ApiResponse& res) {
    auto id = pathId(req, res);
    if (!id) {
        return;
    }

    auto alert = backends_.alerts.acknowledge(*id);
    if (!alert) {
        res.setError(404, "Alert not found");
        return;
    }

    backends_.scheduler.persistAlert(*alert);
    res.setJson(api::alertToJson(*alert));
}

void RestApiServer::handleHealth(const ApiRequest& /*req*/, ApiResponse& res) {
    nlohmann::json health;
    health["status"] = "healthy";
    health["timestamp"] = api::toUnixSeconds(std::chrono::system_clock::now());
    health["version"] = "1.0.0";
    health["uptime_seconds"] =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - startedAt_).count();
    health["devices"] = backends_.registry.activeCount();
    health["active_jobs"] = backends_.scheduler.activeJobCount();
    health["open_alerts"] = backends_.alerts.activeAlerts().size();
    health["scheduler_running"] = backends_.scheduler.isRunning();
    res.setJson(health);
}

} // namespace vlanvision::infra
