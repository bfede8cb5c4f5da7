#pragma once

#include "engine/AlertEvaluator.hpp"
#include "engine/DeviceRegistry.hpp"
#include "engine/DiscoveryScheduler.hpp"
#include "engine/TopologyBuilder.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace vlanvision::infra {

/**
 * @brief HTTP method enumeration.
 */
enum class HttpMethod { GET, POST, PUT, DELETE, OPTIONS, UNKNOWN };

/**
 * @brief Represents an incoming API request.
 */
struct ApiRequest {
    HttpMethod method{HttpMethod::UNKNOWN};         ///< HTTP method of the request.
    std::string path;                               ///< Request path.
    std::string body;                               ///< Request body content.
    std::map<std::string, std::string> headers;     ///< HTTP headers, keys in lower case.
    std::map<std::string, std::string> queryParams; ///< Query string parameters.
    std::map<std::string, std::string> pathParams;  ///< Path parameters from route matching.
};

/**
 * @brief Represents an API response to send.
 */
struct ApiResponse {
    int statusCode{200};                        ///< HTTP status code.
    std::string statusText{"OK"};               ///< HTTP status text.
    std::string body;                           ///< Response body content.
    std::map<std::string, std::string> headers; ///< Response headers.

    /**
     * @brief Sets the response body as JSON.
     */
    void setJson(const nlohmann::json& json);

    /**
     * @brief Sets the status code and the matching reason phrase.
     */
    void setStatus(int code);

    /**
     * @brief Sets an error response with body `{ "error": message, "status": code }`.
     */
    void setError(int code, const std::string& message);

    /**
     * @brief Converts the response to an HTTP response string.
     */
    std::string toString() const;
};

using RouteHandler = std::function<void(const ApiRequest&, ApiResponse&)>;

struct Route {
    HttpMethod method;    ///< HTTP method this route handles.
    std::string pattern;  ///< URL pattern, ":name" segments become path parameters.
    RouteHandler handler; ///< Handler function for this route.
};

/**
 * @brief Engine components served by the API.
 */
struct ApiBackends {
    engine::DeviceRegistry& registry;
    engine::TopologyBuilder& topology;
    engine::AlertEvaluator& alerts;
    engine::DiscoveryScheduler& scheduler;
};

/**
 * @brief HTTP/1.1 JSON API over the discovery engine.
 *
 * Reads are served from registry snapshots and the published topology, so
 * they never wait for a running discovery. Every connection carries exactly
 * one request and is closed after the response.
 *
 * Handler exceptions map to JSON errors: std::invalid_argument and JSON
 * parse errors to 400, std::runtime_error from a stopping scheduler to 503,
 * anything else to 500.
 *
 * @note This class is non-copyable and must be owned by a std::shared_ptr.
 */
class RestApiServer : public std::enable_shared_from_this<RestApiServer> {
public:
    static constexpr size_t MAX_BODY_SIZE = 1024 * 1024;

    /**
     * @param asioContext Context running the acceptor and connections.
     * @param backends Engine components to serve.
     * @param bindAddress Local address to listen on.
     * @param port TCP port, 0 picks an ephemeral port.
     */
    RestApiServer(AsioContext& asioContext, ApiBackends backends, std::string bindAddress = "127.0.0.1",
                  uint16_t port = 8080);

    ~RestApiServer();

    RestApiServer(const RestApiServer&) = delete;
    RestApiServer& operator=(const RestApiServer&) = delete;

    /**
     * @brief Binds the acceptor and begins accepting connections.
     * @throws std::system_error if the address cannot be bound.
     */
    void start();

    void stop();

    bool isRunning() const { return running_.load(); }

    /// Listening port; the bound port after start() when 0 was requested.
    uint16_t port() const { return port_; }

    /**
     * @brief Routes a parsed request to its handler.
     *
     * Used by the connection code and directly by tests.
     */
    ApiResponse handle(ApiRequest request);

    static ApiRequest parseRequest(const std::string& rawRequest);

private:
    void startAccept();
    void readRequest(std::shared_ptr<asio::ip::tcp::socket> socket);
    void processRequest(std::shared_ptr<asio::ip::tcp::socket> socket, const std::string& rawRequest);
    void sendResponse(std::shared_ptr<asio::ip::tcp::socket> socket, const ApiResponse& response);

    static HttpMethod parseMethod(const std::string& method);
    static std::map<std::string, std::string> parseQueryString(const std::string& queryString);
    static bool matchRoute(const std::string& pattern, const std::string& path,
                           std::map<std::string, std::string>& pathParams);

    void registerRoutes();

    // Device endpoints
    void handleGetDevices(const ApiRequest& req, ApiResponse& res);
    void handleGetDevice(const ApiRequest& req, ApiResponse& res);
    void handleRetireDevice(const ApiRequest& req, ApiResponse& res);

    // Discovery endpoints
    void handleDiscover(const ApiRequest& req, ApiResponse& res);
    void handleGetJobs(const ApiRequest& req, ApiResponse& res);
    void handleGetJob(const ApiRequest& req, ApiResponse& res);
    void handleCancelJob(const ApiRequest& req, ApiResponse& res);

    // Topology endpoints
    void handleGetVlans(const ApiRequest& req, ApiResponse& res);
    void handleGetTopology(const ApiRequest& req, ApiResponse& res);
    void handleGetTopologyAnalysis(const ApiRequest& req, ApiResponse& res);

    // Alert endpoints
    void handleGetAlerts(const ApiRequest& req, ApiResponse& res);
    void handleAcknowledgeAlert(const ApiRequest& req, ApiResponse& res);

    void handleHealth(const ApiRequest& req, ApiResponse& res);

    AsioContext& asioContext_;
    ApiBackends backends_;
    std::string bindAddress_;
    uint16_t port_;
    std::atomic<bool> running_{false};
    std::chrono::steady_clock::time_point startedAt_{std::chrono::steady_clock::now()};

    std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
    std::vector<Route> routes_;
};

} // namespace vlanvision::infra
