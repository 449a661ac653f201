#include "stockade/runtime/docker_client.hpp"
#include "stockade/core/sandbox_executor.hpp"
#include "stockade/runtime/log_demux.hpp"
#include "fake_engine_server.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <functional>
#include <memory>

using namespace stockade::runtime;
using json = nlohmann::json;

TEST(ContainerRuntimeTest, ClassifiesStatusCodes) {
    EXPECT_EQ(ClassifyStatus(404), ErrorKind::NOT_FOUND);
    EXPECT_EQ(ClassifyStatus(409), ErrorKind::CONFLICT);
    EXPECT_EQ(ClassifyStatus(400), ErrorKind::BAD_REQUEST);
    EXPECT_EQ(ClassifyStatus(500), ErrorKind::SERVER);
    EXPECT_EQ(ClassifyStatus(503), ErrorKind::SERVER);

    RuntimeError error(ErrorKind::NOT_FOUND, "No such container", 404);
    EXPECT_TRUE(error.IsNotFound());
    EXPECT_EQ(error.StatusCode(), std::optional<long>(404));
    EXPECT_STREQ(error.what(), "No such container");
}

TEST(ContainerRuntimeTest, SpecJsonOmitsUnsetFields) {
    ContainerSpec spec;
    spec.image = "alpine:3.19";
    spec.cmd = {"/bin/sh", "-c", "echo hi"};
    spec.working_dir = "/workspace";

    auto body = json::parse(ToJsonString(spec));

    EXPECT_EQ(body["Image"], "alpine:3.19");
    EXPECT_EQ(body["Cmd"].size(), 3u);
    EXPECT_EQ(body["Tty"], false);
    EXPECT_FALSE(body.contains("Env"));
    EXPECT_EQ(body["HostConfig"]["NetworkMode"], "none");
    EXPECT_EQ(body["HostConfig"]["ReadonlyRootfs"], true);
    EXPECT_EQ(body["HostConfig"]["AutoRemove"], false);
    EXPECT_FALSE(body["HostConfig"].contains("Memory"));
    EXPECT_FALSE(body["HostConfig"].contains("Binds"));
}

TEST(ContainerRuntimeTest, SpecJsonCarriesLimitsBindsAndEnv) {
    ContainerSpec spec;
    spec.image = "alpine";
    spec.cmd = {"true"};
    spec.env = std::vector<std::string>{"A=1"};
    spec.host_config.memory = 1024;
    spec.host_config.memory_swap = 2048;
    spec.host_config.cpu_quota = 50000;
    spec.host_config.cpu_period = 100000;
    spec.host_config.pids_limit = 16;
    spec.host_config.binds = {"/h:/c:ro"};

    auto host = json::parse(ToJsonString(spec))["HostConfig"];

    EXPECT_EQ(host["Memory"], 1024);
    EXPECT_EQ(host["MemorySwap"], 2048);
    EXPECT_EQ(host["CpuQuota"], 50000);
    EXPECT_EQ(host["CpuPeriod"], 100000);
    EXPECT_EQ(host["PidsLimit"], 16);
    EXPECT_EQ(host["Binds"][0], "/h:/c:ro");
}

TEST(DockerClientTest, ParsesImageReferences) {
    auto plain = ParseImageReference("alpine");
    EXPECT_EQ(plain.name, "alpine");
    EXPECT_EQ(plain.tag, "latest");

    auto tagged = ParseImageReference("python:3.12-slim");
    EXPECT_EQ(tagged.name, "python");
    EXPECT_EQ(tagged.tag, "3.12-slim");

    auto registry = ParseImageReference("localhost:5000/team/tool");
    EXPECT_EQ(registry.name, "localhost:5000/team/tool");
    EXPECT_EQ(registry.tag, "latest");

    auto registry_tagged = ParseImageReference("localhost:5000/tool:v2");
    EXPECT_EQ(registry_tagged.name, "localhost:5000/tool");
    EXPECT_EQ(registry_tagged.tag, "v2");

    auto digest = ParseImageReference("alpine@sha256:abcd");
    EXPECT_EQ(digest.name, "alpine@sha256:abcd");
    EXPECT_EQ(digest.tag, "");
}

TEST(DockerClientTest, PullProgressErrorsAreDistinct) {
    const std::string ok =
        "{\"status\":\"Pulling from library/alpine\",\"id\":\"3.19\"}\n"
        "{\"status\":\"Download complete\"}\n"
        "\n"
        "{\"status\":\"Status: Downloaded newer image for alpine:3.19\"}\n";
    EXPECT_NO_THROW(CheckPullProgress(ok));

    const std::string failed =
        "{\"status\":\"Pulling from library/nope\"}\n"
        "{\"errorDetail\":{\"message\":\"manifest unknown\"},\"error\":\"manifest unknown\"}\n";
    try {
        CheckPullProgress(failed);
        FAIL() << "expected a pull progress error";
    }
    catch (const RuntimeError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::PULL_PROGRESS);
        EXPECT_NE(std::string(e.what()).find("manifest unknown"), std::string::npos);
    }

    EXPECT_THROW(CheckPullProgress("{\"error\":\"denied\"}"), RuntimeError);
}

TEST(DockerClientTest, ExtractsEngineErrorMessages) {
    EXPECT_EQ(ExtractErrorMessage("{\"message\":\"No such container: abc\"}"),
              "No such container: abc");
    EXPECT_EQ(ExtractErrorMessage("page not found\n"), "page not found");
    EXPECT_EQ(ExtractErrorMessage(""), "empty response");
}

TEST(DockerClientTest, OptionsFromEnvironment) {
    ::setenv("DOCKER_HOST", "unix:///run/user/1000/docker.sock", 1);
    EXPECT_EQ(DockerClientOptions::FromEnvironment().socket_path, "/run/user/1000/docker.sock");

    ::setenv("DOCKER_HOST", "tcp://10.0.0.1:2375", 1);
    EXPECT_EQ(DockerClientOptions::FromEnvironment().socket_path, "/var/run/docker.sock");

    ::unsetenv("DOCKER_HOST");
    auto defaults = DockerClientOptions::FromEnvironment();
    EXPECT_EQ(defaults.socket_path, "/var/run/docker.sock");
    EXPECT_EQ(defaults.api_version, "v1.41");
}

TEST(DockerClientTest, UnreachableSocketIsUnavailable) {
    DockerClientOptions options;
    options.socket_path = "/nonexistent/stockade/docker.sock";
    options.ping_timeout = std::chrono::milliseconds(500);
    DockerClient client(options);

    EXPECT_FALSE(client.IsAvailable());
    EXPECT_EQ(client.GetVersion(), "unknown");

    try {
        client.KillContainer("abc");
        FAIL() << "expected a connection error";
    }
    catch (const RuntimeError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::CONNECTION);
    }
}

TEST(DockerClientTest, EscapesPathSegments) {
    DockerClient client;
    EXPECT_EQ(client.Escape("alpine"), "alpine");
    EXPECT_EQ(client.Escape("a b/c"), "a%20b%2Fc");
}

// Exercises the HTTP paths against a scripted engine on a unix socket
class DockerClientHttpTest : public ::testing::Test {
protected:
    void SetUp() override {
        server = std::make_unique<stockade::testing::FakeEngineServer>();
        client = std::make_unique<DockerClient>(server->Options());
    }

    std::shared_ptr<Container> CreateScriptedContainer() {
        server->Route("POST /v1.41/containers/create", 201,
                      R"({"Id":"c0ffee1234567890","Warnings":["low memory"]})");
        ContainerSpec spec;
        spec.image = "alpine:3.19";
        spec.cmd = {"/bin/sh", "-c", "true"};
        return client->CreateContainer(spec);
    }

    static ErrorKind KindOf(const std::function<void()>& call) {
        try {
            call();
        }
        catch (const RuntimeError& e) {
            return e.Kind();
        }
        ADD_FAILURE() << "expected a RuntimeError";
        return ErrorKind::PROTOCOL;
    }

    std::unique_ptr<stockade::testing::FakeEngineServer> server;
    std::unique_ptr<DockerClient> client;
};

TEST_F(DockerClientHttpTest, PingReportsAvailability) {
    EXPECT_FALSE(client->IsAvailable());

    server->Route("GET /v1.41/_ping", 200, "OK");
    EXPECT_TRUE(client->IsAvailable());

    server->Route("GET /v1.41/version", 200, R"({"Version":"24.0.7"})");
    EXPECT_EQ(client->GetVersion(), "24.0.7");
}

TEST_F(DockerClientHttpTest, RemoveSwallowsNotFoundOnly) {
    server->Route("DELETE /v1.41/containers/gone?force=true", 404,
                  R"({"message":"No such container: gone"})");
    EXPECT_NO_THROW(client->RemoveContainer("gone"));

    server->Route("DELETE /v1.41/containers/busy?force=true", 409,
                  R"({"message":"removal already in progress"})");
    try {
        client->RemoveContainer("busy");
        FAIL() << "expected a conflict";
    }
    catch (const RuntimeError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::CONFLICT);
        EXPECT_EQ(e.StatusCode(), std::optional<long>(409));
        EXPECT_NE(std::string(e.what()).find("removal already in progress"), std::string::npos);
    }

    server->Route("DELETE /v1.41/containers/ok?force=true", 204);
    EXPECT_NO_THROW(client->RemoveContainer("ok"));
    EXPECT_TRUE(server->Received("DELETE /v1.41/containers/ok?force=true"));
}

TEST_F(DockerClientHttpTest, KillSwallowsNotFoundOnly) {
    server->Route("POST /v1.41/containers/gone/kill", 404,
                  R"({"message":"No such container: gone"})");
    EXPECT_NO_THROW(client->KillContainer("gone"));

    server->Route("POST /v1.41/containers/broken/kill", 500, R"({"message":"boom"})");
    EXPECT_EQ(KindOf([&] { client->KillContainer("broken"); }), ErrorKind::SERVER);
}

TEST_F(DockerClientHttpTest, CreateRequiresContainerId) {
    auto container = CreateScriptedContainer();
    EXPECT_EQ(container->Id(), "c0ffee1234567890");

    server->Route("POST /v1.41/containers/create", 201, "{}");
    ContainerSpec spec;
    spec.image = "alpine:3.19";
    EXPECT_EQ(KindOf([&] { client->CreateContainer(spec); }), ErrorKind::PROTOCOL);

    server->Route("POST /v1.41/containers/create", 404, R"({"message":"No such image"})");
    EXPECT_EQ(KindOf([&] { client->CreateContainer(spec); }), ErrorKind::NOT_FOUND);
}

TEST_F(DockerClientHttpTest, StartAcceptsNotModified) {
    auto container = CreateScriptedContainer();

    server->Route("POST /v1.41/containers/c0ffee1234567890/start", 304);
    EXPECT_NO_THROW(container->Start());

    server->Route("POST /v1.41/containers/c0ffee1234567890/start", 204);
    EXPECT_NO_THROW(container->Start());

    server->Route("POST /v1.41/containers/c0ffee1234567890/start", 500,
                  R"({"message":"cannot start"})");
    EXPECT_EQ(KindOf([&] { container->Start(); }), ErrorKind::SERVER);
}

TEST_F(DockerClientHttpTest, WaitReportsExitCodeAndEngineErrors) {
    auto container = CreateScriptedContainer();
    const std::string wait = "POST /v1.41/containers/c0ffee1234567890/wait";

    server->Route(wait, 200, R"({"StatusCode":7,"Error":null})");
    EXPECT_EQ(container->Wait().exit_code, 7);

    server->Route(wait, 200, R"({"StatusCode":0,"Error":{"Message":""}})");
    EXPECT_EQ(container->Wait().exit_code, 0);

    server->Route(wait, 200, R"({"StatusCode":0,"Error":{"Message":"boom"}})");
    EXPECT_EQ(KindOf([&] { container->Wait(); }), ErrorKind::SERVER);

    server->Route(wait, 200, "{}");
    EXPECT_EQ(KindOf([&] { container->Wait(); }), ErrorKind::PROTOCOL);

    server->Route(wait, 200, "not json");
    EXPECT_EQ(KindOf([&] { container->Wait(); }), ErrorKind::PROTOCOL);
}

TEST_F(DockerClientHttpTest, LogsAreDemultiplexed) {
    auto container = CreateScriptedContainer();
    server->Route("GET /v1.41/containers/c0ffee1234567890/logs?stdout=1&stderr=1", 200,
                  EncodeLogFrame(StreamType::STDOUT, "out\n") +
                  EncodeLogFrame(StreamType::STDERR, "err\n") +
                  EncodeLogFrame(StreamType::STDOUT, "more\n"));

    auto logs = container->Logs();

    EXPECT_EQ(logs.stdout_output, "out\nmore\n");
    EXPECT_EQ(logs.stderr_output, "err\n");
}

TEST_F(DockerClientHttpTest, InspectReadsState) {
    auto container = CreateScriptedContainer();
    const std::string inspect = "GET /v1.41/containers/c0ffee1234567890/json";

    server->Route(inspect, 200,
                  R"({"State":{"Running":false,"ExitCode":5,)"
                  R"("StartedAt":"2024-01-01T00:00:00Z","FinishedAt":"2024-01-01T00:00:01Z"}})");
    auto state = container->Inspect();
    EXPECT_FALSE(state.running);
    EXPECT_EQ(state.exit_code, 5);
    EXPECT_EQ(state.finished_at, "2024-01-01T00:00:01Z");

    server->Route(inspect, 200, "{}");
    EXPECT_EQ(KindOf([&] { container->Inspect(); }), ErrorKind::PROTOCOL);
}

TEST_F(DockerClientHttpTest, PullSkipsPresentImages) {
    server->Route("GET /v1.41/images/alpine:3.19/json", 200, R"({"Id":"sha256:abc"})");

    EXPECT_NO_THROW(client->PullImage("alpine:3.19"));
    EXPECT_FALSE(server->Received("POST /v1.41/images/create?fromImage=alpine&tag=3.19"));
}

TEST_F(DockerClientHttpTest, PullFailuresAreDistinguished) {
    const std::string create = "POST /v1.41/images/create?fromImage=alpine&tag=3.19";

    server->Route(create, 200,
                  "{\"status\":\"Pulling from library/alpine\"}\n"
                  "{\"status\":\"Download complete\",\"id\":\"abc\"}\n");
    EXPECT_NO_THROW(client->PullImage("alpine:3.19"));
    EXPECT_TRUE(server->Received(create));

    server->Route(create, 500, R"({"message":"registry unreachable"})");
    EXPECT_EQ(KindOf([&] { client->PullImage("alpine:3.19"); }), ErrorKind::PULL_FAILED);

    server->Route(create, 200,
                  "{\"status\":\"Pulling from library/alpine\"}\n"
                  "{\"errorDetail\":{\"message\":\"manifest unknown\"},\"error\":\"manifest unknown\"}\n");
    EXPECT_EQ(KindOf([&] { client->PullImage("alpine:3.19"); }), ErrorKind::PULL_PROGRESS);

    server->Route("GET /v1.41/images/alpine:3.19/json", 500, R"({"message":"daemon error"})");
    EXPECT_EQ(KindOf([&] { client->PullImage("alpine:3.19"); }), ErrorKind::SERVER);
}

// Runs against a live engine when one is reachable
class DockerIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        client = std::make_shared<DockerClient>();
        if (!client->IsAvailable()) {
            GTEST_SKIP() << "Docker engine not available";
        }
        image = std::getenv("STOCKADE_TEST_IMAGE") ? std::getenv("STOCKADE_TEST_IMAGE")
                                                    : "alpine:3.19";
    }

    std::shared_ptr<DockerClient> client;
    std::string image;
};

TEST_F(DockerIntegrationTest, RunsCommandAndSplitsStreams) {
    auto config = stockade::core::SandboxBuilder()
        .WithImage(image)
        .WithWorkingDir("/")
        .WithTimeout(std::chrono::seconds(60))
        .PullMissingImage()
        .Build();
    stockade::core::SandboxExecutor executor(config, client);

    auto result = executor.Execute("echo out; echo err >&2; exit 3");

    EXPECT_EQ(result.status, stockade::core::SandboxStatus::FAILED);
    EXPECT_EQ(result.exit_code, std::optional<int>(3));
    EXPECT_EQ(result.stdout_output, "out\n");
    EXPECT_EQ(result.stderr_output, "err\n");
}

TEST_F(DockerIntegrationTest, TimeoutKillsContainer) {
    auto config = stockade::core::SandboxBuilder()
        .WithImage(image)
        .WithWorkingDir("/")
        .WithTimeout(std::chrono::milliseconds(1000))
        .PullMissingImage()
        .Build();
    stockade::core::SandboxExecutor executor(config, client);

    auto result = executor.Execute("sleep 30");

    EXPECT_EQ(result.status, stockade::core::SandboxStatus::TIMEOUT);
    EXPECT_EQ(result.exit_code, std::optional<int>(137));
    EXPECT_GE(result.duration, std::chrono::milliseconds(1000));
}

TEST_F(DockerIntegrationTest, InspectReportsExitedState) {
    client->PullImage(image);

    ContainerSpec spec;
    spec.image = image;
    spec.cmd = {"/bin/sh", "-c", "exit 5"};
    spec.working_dir = "/";

    auto container = client->CreateContainer(spec);
    container->Start();
    EXPECT_EQ(container->Wait().exit_code, 5);

    auto state = container->Inspect();
    EXPECT_FALSE(state.running);
    EXPECT_EQ(state.exit_code, 5);
    EXPECT_FALSE(state.finished_at.empty());

    container->Remove();
    EXPECT_NO_THROW(client->RemoveContainer(container->Id()));
}

TEST_F(DockerIntegrationTest, RemovingUnknownContainerIsIgnored) {
    EXPECT_NO_THROW(client->RemoveContainer("stockade-does-not-exist"));
    EXPECT_NO_THROW(client->KillContainer("stockade-does-not-exist"));
}
