/**
 * @file docker_client.hpp
 * @brief Docker Engine API client over a unix domain socket
 *
 * Implements ContainerRuntime against the Docker Engine HTTP API using
 * libcurl. Every request uses its own easy handle, so a single client may
 * be shared by several executors.
 *
 * **Usage Example**:
 * @code
 * auto docker = std::make_shared<DockerClient>();
 * if (!docker->IsAvailable()) {
 *     return;
 * }
 *
 * ContainerSpec spec;
 * spec.image = "alpine:3.19";
 * spec.cmd = {"/bin/sh", "-c", "echo hello"};
 *
 * auto container = docker->CreateContainer(spec);
 * container->Start();
 * auto status = container->Wait();
 * auto logs = container->Logs();
 * container->Remove();
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "stockade/runtime/container_runtime.hpp"

#include <string>
#include <vector>
#include <memory>
#include <chrono>

namespace stockade {
namespace runtime {

/**
 * @struct DockerClientOptions
 * @brief Connection settings for the Docker Engine
 */
struct DockerClientOptions {
    std::string socket_path{"/var/run/docker.sock"};   ///< Engine unix socket
    std::string api_version{"v1.41"};                  ///< API prefix, empty for unversioned
    std::chrono::milliseconds ping_timeout{5000};      ///< Availability probe timeout
    std::chrono::milliseconds request_timeout{60000};  ///< Timeout for short requests

    /**
     * @brief Defaults, with the socket taken from DOCKER_HOST when it is
     *        a unix:// URL
     */
    static DockerClientOptions FromEnvironment();
};

/**
 * @struct ImageReference
 * @brief Image name split for the image-create endpoint
 */
struct ImageReference {
    std::string name;   ///< Repository (may include registry and digest)
    std::string tag;    ///< Tag, empty when the reference is pinned by digest
};

/**
 * @brief Split "repo[:tag]" or "repo@digest"
 *
 * A missing tag defaults to "latest". A colon inside the registry part
 * ("localhost:5000/img") is not a tag separator.
 */
ImageReference ParseImageReference(const std::string& image_ref);

/**
 * @brief Scan a newline-delimited pull progress stream for errors
 * @throws RuntimeError PULL_PROGRESS on the first reported error
 */
void CheckPullProgress(const std::string& stream);

/**
 * @brief Extract the "message" field of an engine error body
 *
 * Falls back to the raw body when it is not JSON.
 */
std::string ExtractErrorMessage(const std::string& body);

/**
 * @class DockerClient
 * @brief ContainerRuntime backed by the Docker Engine API
 */
class DockerClient : public ContainerRuntime {
public:
    explicit DockerClient(DockerClientOptions options = DockerClientOptions::FromEnvironment());
    ~DockerClient() override;

    DockerClient(const DockerClient&) = delete;
    DockerClient& operator=(const DockerClient&) = delete;

    bool IsAvailable() override;
    void PullImage(const std::string& image_ref) override;
    std::shared_ptr<Container> CreateContainer(const ContainerSpec& spec) override;
    void RemoveContainer(const std::string& container_id) override;
    void KillContainer(const std::string& container_id) override;

    /**
     * @brief Engine version string ("unknown" if unreachable)
     */
    std::string GetVersion();

    const DockerClientOptions& GetOptions() const { return options_; }

    /**
     * @brief Percent-encode one path segment or query value
     */
    std::string Escape(const std::string& value) const;

private:
    DockerClientOptions options_;

    bool ImageExists(const std::string& image_ref);
};

} // namespace runtime
} // namespace stockade
