/**
 * @file docker_client.cpp
 * @brief Docker Engine API client implementation (libcurl, unix socket)
 *
 * Talks to the engine through its HTTP API instead of the docker CLI so the
 * raw multiplexed log stream, HTTP status codes and structured error bodies
 * are available to the caller.
 *
 * **Endpoints Used**:
 * - `GET    /_ping`                          availability probe
 * - `GET    /version`                        engine version
 * - `GET    /images/{name}/json`             image presence check
 * - `POST   /images/create?fromImage=&tag=`  pull (newline-delimited progress)
 * - `POST   /containers/create`              create from ContainerSpec
 * - `POST   /containers/{id}/start`          start (304 = already started)
 * - `POST   /containers/{id}/wait`           block until exit
 * - `GET    /containers/{id}/logs`           multiplexed stdout/stderr
 * - `GET    /containers/{id}/json`           inspect
 * - `POST   /containers/{id}/kill`           SIGKILL
 * - `DELETE /containers/{id}?force=true`     remove
 *
 * **Error Handling**:
 * - Transport failures: RuntimeError CONNECTION
 * - Non-2xx responses: RuntimeError classified by status (404 -> NOT_FOUND)
 * - Malformed JSON: RuntimeError PROTOCOL
 *
 * @date 2025
 */

#include "stockade/runtime/docker_client.hpp"
#include "stockade/runtime/log_demux.hpp"
#include "stockade/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

#include <cstdlib>
#include <mutex>
#include <sstream>

using json = nlohmann::json;

namespace stockade {
namespace runtime {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlHeaders = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

/// Raw HTTP exchange with the engine
struct Response {
    long status{0};
    std::string body;
};

std::once_flag curl_init_flag;

void EnsureCurlInitialized() {
    std::call_once(curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

std::size_t WriteCallback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::string*>(userdata);
    buffer->append(ptr, size * nmemb);
    return size * nmemb;
}

bool IsSuccess(long status) {
    return status >= 200 && status < 300;
}

// ============================================================================
// HTTP TRANSPORT
// ============================================================================
// One easy handle per request; nothing is shared between calls

std::string BuildUrl(const DockerClientOptions& options, const std::string& path) {
    // Host part is ignored when talking over a unix socket
    std::string url = "http://localhost";
    if (!options.api_version.empty()) {
        url += "/" + options.api_version;
    }
    return url + path;
}

Response Perform(const DockerClientOptions& options,
                 const std::string& method,
                 const std::string& path,
                 const std::string& body,
                 std::chrono::milliseconds timeout) {
    EnsureCurlInitialized();

    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        throw RuntimeError(ErrorKind::CONNECTION, "curl_easy_init failed");
    }

    const std::string url = BuildUrl(options, path);
    Response response;

    curl_easy_setopt(curl.get(), CURLOPT_UNIX_SOCKET_PATH, options.socket_path.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &WriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    CurlHeaders headers(nullptr, &curl_slist_free_all);
    if (method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        headers.reset(curl_slist_append(nullptr, "Content-Type: application/json"));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    } else if (method != "GET") {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    if (timeout.count() > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    }

    spdlog::debug("Docker API: {} {}", method, path);

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        throw RuntimeError(ErrorKind::CONNECTION,
                           "Docker request " + method + " " + path + " failed: " +
                           curl_easy_strerror(rc));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    spdlog::debug("Docker API: {} {} -> {}", method, path, response.status);

    return response;
}

[[noreturn]] void ThrowForStatus(const Response& response, const std::string& context) {
    throw RuntimeError(ClassifyStatus(response.status),
                       context + ": " + ExtractErrorMessage(response.body),
                       response.status);
}

Response PerformChecked(const DockerClientOptions& options,
                        const std::string& method,
                        const std::string& path,
                        const std::string& body,
                        std::chrono::milliseconds timeout) {
    auto response = Perform(options, method, path, body, timeout);
    if (!IsSuccess(response.status)) {
        ThrowForStatus(response, method + " " + path);
    }
    return response;
}

json ParseBody(const Response& response, const std::string& context) {
    try {
        return json::parse(response.body);
    }
    catch (const json::exception& e) {
        throw RuntimeError(ErrorKind::PROTOCOL,
                           context + ": malformed engine response (" + e.what() + ")",
                           response.status);
    }
}

// ============================================================================
// CONTAINER HANDLE
// ============================================================================

class DockerContainer : public Container {
public:
    DockerContainer(DockerClientOptions options, std::string id)
        : options_(std::move(options))
        , id_(std::move(id)) {
    }

    const std::string& Id() const override { return id_; }

    void Start() override {
        auto response = Perform(options_, "POST", "/containers/" + id_ + "/start", "",
                                options_.request_timeout);
        // 304: container already started
        if (!IsSuccess(response.status) && response.status != 304) {
            ThrowForStatus(response, "Failed to start container " + ShortId());
        }
        spdlog::debug("Container started: {}", ShortId());
    }

    WaitResult Wait() override {
        // No transfer timeout: blocks until the process exits or is killed
        auto response = PerformChecked(options_, "POST", "/containers/" + id_ + "/wait", "",
                                       std::chrono::milliseconds{0});
        auto body = ParseBody(response, "wait");

        if (body.contains("Error") && body["Error"].is_object()) {
            auto message = body["Error"].value("Message", "");
            if (!message.empty()) {
                throw RuntimeError(ErrorKind::SERVER, "Container wait failed: " + message);
            }
        }

        if (!body.contains("StatusCode") || !body["StatusCode"].is_number_integer()) {
            throw RuntimeError(ErrorKind::PROTOCOL, "wait: response has no StatusCode");
        }

        WaitResult result;
        result.exit_code = body["StatusCode"].get<int>();
        return result;
    }

    LogOutput Logs() override {
        auto response = PerformChecked(options_, "GET",
                                       "/containers/" + id_ + "/logs?stdout=1&stderr=1", "",
                                       options_.request_timeout);
        return DemuxLogStream(response.body);
    }

    void Remove() override {
        PerformChecked(options_, "DELETE", "/containers/" + id_ + "?force=true", "",
                       options_.request_timeout);
        spdlog::debug("Container removed: {}", ShortId());
    }

    ContainerState Inspect() override {
        auto response = PerformChecked(options_, "GET", "/containers/" + id_ + "/json", "",
                                       options_.request_timeout);
        auto body = ParseBody(response, "inspect");

        ContainerState state;
        try {
            const auto& s = body.at("State");
            state.running = s.value("Running", false);
            state.exit_code = s.value("ExitCode", 0);
            state.started_at = s.value("StartedAt", "");
            state.finished_at = s.value("FinishedAt", "");
        }
        catch (const json::exception& e) {
            throw RuntimeError(ErrorKind::PROTOCOL,
                               std::string("inspect: unexpected State block (") + e.what() + ")");
        }
        return state;
    }

private:
    DockerClientOptions options_;
    std::string id_;

    std::string ShortId() const { return id_.substr(0, 12); }
};

} // anonymous namespace

// ============================================================================
// FREE HELPERS
// ============================================================================

DockerClientOptions DockerClientOptions::FromEnvironment() {
    DockerClientOptions options;
    const char* host = std::getenv("DOCKER_HOST");
    if (host != nullptr) {
        std::string value(host);
        const std::string prefix = "unix://";
        if (utils::StringUtils::StartsWith(value, prefix)) {
            options.socket_path = value.substr(prefix.size());
        } else if (!value.empty()) {
            spdlog::warn("Ignoring unsupported DOCKER_HOST '{}' (only unix:// is supported)", value);
        }
    }
    return options;
}

ImageReference ParseImageReference(const std::string& image_ref) {
    if (image_ref.find('@') != std::string::npos) {
        return {image_ref, ""};
    }

    auto slash = image_ref.rfind('/');
    auto colon = image_ref.rfind(':');
    if (colon != std::string::npos && (slash == std::string::npos || colon > slash)) {
        return {image_ref.substr(0, colon), image_ref.substr(colon + 1)};
    }

    return {image_ref, "latest"};
}

void CheckPullProgress(const std::string& stream) {
    std::istringstream lines(stream);
    std::string line;

    while (std::getline(lines, line)) {
        line = utils::StringUtils::Trim(line);
        if (line.empty()) continue;

        json event;
        try {
            event = json::parse(line);
        }
        catch (const json::exception& e) {
            spdlog::debug("Skipping unparsable pull progress line: {}", e.what());
            continue;
        }

        if (!event.is_object()) continue;

        std::string message;
        if (event.contains("errorDetail") && event["errorDetail"].is_object()) {
            message = event["errorDetail"].value("message", "");
        }
        if (message.empty() && event.contains("error") && event["error"].is_string()) {
            message = event["error"].get<std::string>();
        }
        if (!message.empty()) {
            throw RuntimeError(ErrorKind::PULL_PROGRESS, "Image pull failed: " + message);
        }

        if (event.contains("status") && event["status"].is_string()) {
            spdlog::debug("Pull: {} {}", event["status"].get<std::string>(), event.value("id", ""));
        }
    }
}

std::string ExtractErrorMessage(const std::string& body) {
    try {
        auto parsed = json::parse(body);
        if (parsed.is_object() && parsed.contains("message") && parsed["message"].is_string()) {
            return parsed["message"].get<std::string>();
        }
    }
    catch (const json::exception&) {
        // Not JSON: report the raw body below
    }

    auto trimmed = utils::StringUtils::Trim(body);
    return trimmed.empty() ? "empty response" : trimmed;
}

// ============================================================================
// CLIENT
// ============================================================================

DockerClient::DockerClient(DockerClientOptions options)
    : options_(std::move(options)) {
    EnsureCurlInitialized();
    spdlog::debug("Docker client initialized (socket: {}, api: {})",
                  options_.socket_path,
                  options_.api_version.empty() ? "unversioned" : options_.api_version);
}

DockerClient::~DockerClient() = default;

bool DockerClient::IsAvailable() {
    try {
        auto response = Perform(options_, "GET", "/_ping", "", options_.ping_timeout);
        return response.status == 200;
    }
    catch (const std::exception& e) {
        spdlog::debug("Docker ping failed: {}", e.what());
        return false;
    }
}

std::string DockerClient::GetVersion() {
    try {
        auto response = PerformChecked(options_, "GET", "/version", "", options_.ping_timeout);
        return ParseBody(response, "version").value("Version", "unknown");
    }
    catch (const std::exception& e) {
        spdlog::debug("Docker version query failed: {}", e.what());
        return "unknown";
    }
}

bool DockerClient::ImageExists(const std::string& image_ref) {
    auto response = Perform(options_, "GET", "/images/" + image_ref + "/json", "",
                            options_.request_timeout);
    if (response.status == 200) return true;
    if (response.status == 404) return false;
    ThrowForStatus(response, "Failed to inspect image " + image_ref);
}

void DockerClient::PullImage(const std::string& image_ref) {
    if (ImageExists(image_ref)) {
        spdlog::debug("Image present locally: {}", image_ref);
        return;
    }

    spdlog::info("Pulling image: {}", image_ref);

    auto ref = ParseImageReference(image_ref);
    std::string path = "/images/create?fromImage=" + Escape(ref.name);
    if (!ref.tag.empty()) {
        path += "&tag=" + Escape(ref.tag);
    }

    // Blocks until the engine closes the progress stream
    auto response = Perform(options_, "POST", path, "", std::chrono::milliseconds{0});
    if (!IsSuccess(response.status)) {
        throw RuntimeError(ErrorKind::PULL_FAILED,
                           "Failed to pull image " + image_ref + ": " +
                           ExtractErrorMessage(response.body),
                           response.status);
    }

    CheckPullProgress(response.body);
    spdlog::info("✓ Image pulled: {}", image_ref);
}

std::shared_ptr<Container> DockerClient::CreateContainer(const ContainerSpec& spec) {
    auto body = ToJsonString(spec);
    spdlog::debug("Container spec: {}", body);

    auto response = PerformChecked(options_, "POST", "/containers/create", body,
                                   options_.request_timeout);
    auto created = ParseBody(response, "create");

    std::string id = created.value("Id", "");
    if (id.empty()) {
        throw RuntimeError(ErrorKind::PROTOCOL, "create: response has no container Id",
                           response.status);
    }

    if (created.contains("Warnings") && created["Warnings"].is_array()) {
        for (const auto& warning : created["Warnings"]) {
            if (warning.is_string()) {
                spdlog::warn("Docker: {}", warning.get<std::string>());
            }
        }
    }

    spdlog::debug("Container created: {}", id.substr(0, 12));
    return std::make_shared<DockerContainer>(options_, id);
}

void DockerClient::RemoveContainer(const std::string& container_id) {
    try {
        PerformChecked(options_, "DELETE", "/containers/" + container_id + "?force=true", "",
                       options_.request_timeout);
        spdlog::debug("Container removed: {}", container_id);
    }
    catch (const RuntimeError& e) {
        if (!e.IsNotFound()) throw;
        spdlog::debug("Container already gone: {}", container_id);
    }
}

void DockerClient::KillContainer(const std::string& container_id) {
    try {
        PerformChecked(options_, "POST", "/containers/" + container_id + "/kill", "",
                       options_.request_timeout);
        spdlog::info("Container killed: {}", container_id);
    }
    catch (const RuntimeError& e) {
        if (!e.IsNotFound()) throw;
        spdlog::debug("Container already gone: {}", container_id);
    }
}

std::string DockerClient::Escape(const std::string& value) const {
    EnsureCurlInitialized();

    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        throw RuntimeError(ErrorKind::CONNECTION, "curl_easy_init failed");
    }

    char* escaped = curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.size()));
    if (escaped == nullptr) {
        throw RuntimeError(ErrorKind::PROTOCOL, "Failed to escape '" + value + "'");
    }

    std::string result(escaped);
    curl_free(escaped);
    return result;
}

} // namespace runtime
} // namespace stockade
