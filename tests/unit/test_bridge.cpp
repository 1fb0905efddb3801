#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "bridge/bridge.hpp"
#include "core/config/bridge_config.hpp"
#include "core/errors/bridge_errors.hpp"
#include "net/response_sink.hpp"
#include "tools/tool_client.hpp"

namespace {

using namespace std::chrono_literals;
using nlohmann::json;
using toolbridge::bridge::Bridge;
using toolbridge::core::config::BridgeConfig;
using toolbridge::core::errors::BridgeError;
using toolbridge::core::errors::ErrorCategory;
using toolbridge::core::errors::Result;
using toolbridge::protocol::ConnectSpec;
using toolbridge::protocol::StdioSpec;
using toolbridge::protocol::StreamSpec;
using toolbridge::protocol::ToolCall;
using toolbridge::protocol::ToolCallResult;
using toolbridge::protocol::ToolInfo;
using toolbridge::session::ClientId;

class FakeToolClient;

// One scripted backend, shared by every adapter the bridge creates for it
struct FakeBackend {
    std::atomic_bool fail_connect{false};
    std::atomic_int creates{0};
    std::atomic_int connects{0};
    std::atomic_int closes{0};
    std::vector<ToolInfo> tools{{"echo", "Echoes its input", json::object()}};

    // Holds connect or get_all_tools until open_gate()
    std::atomic_bool hold_connect{false};
    std::atomic_bool hold_tools{false};

    std::mutex mutex;
    std::condition_variable released_cv;
    bool released = false;
    bool gate_open = false;
    std::weak_ptr<FakeToolClient> latest;

    void release() {
        std::lock_guard<std::mutex> lock(mutex);
        released = true;
        released_cv.notify_all();
    }

    void open_gate() {
        std::lock_guard<std::mutex> lock(mutex);
        gate_open = true;
        released_cv.notify_all();
    }

    void wait_for_gate() {
        std::unique_lock<std::mutex> lock(mutex);
        released_cv.wait_for(lock, 5s, [this]() { return gate_open; });
    }
};

class FakeToolClient : public toolbridge::tools::ToolClient {
public:
    explicit FakeToolClient(std::shared_ptr<FakeBackend> backend) : backend_(std::move(backend)) {}

    Result<bool> connect(const ConnectSpec&) override {
        backend_->connects++;
        if (backend_->hold_connect.load()) {
            backend_->wait_for_gate();
        }
        if (backend_->fail_connect.load()) {
            return BridgeError{ErrorCategory::Transport, "spawn failed", "spawn_failed"};
        }
        connected_ = true;
        return true;
    }

    Result<std::vector<ToolInfo>> get_all_tools() override {
        if (backend_->hold_tools.load()) {
            backend_->wait_for_gate();
        }
        return backend_->tools;
    }

    Result<ToolCallResult> call_tool(const ToolCall& call) override {
        ToolCallResult result;
        if (call.name == "echo") {
            result.content = json::array({{{"type", "text"}, {"text", call.arguments.value("text", "")}}});
        } else if (call.name == "fail") {
            result.content = json::array({{{"type", "text"}, {"text", "bad input"}}});
            result.is_error = true;
        } else if (call.name == "empty_fail") {
            result.is_error = true;
        } else if (call.name == "broken") {
            return BridgeError{ErrorCategory::Execution, "backend exploded", "rpc_error"};
        } else if (call.name == "block") {
            std::unique_lock<std::mutex> lock(backend_->mutex);
            backend_->released_cv.wait_for(lock, 5s, [this]() {
                return backend_->released || closed_.load();
            });
            result.content = json::array({{{"type", "text"}, {"text", "late"}}});
        }
        return result;
    }

    void close() override {
        if (!closed_.exchange(true)) {
            backend_->closes++;
            std::lock_guard<std::mutex> lock(backend_->mutex);
            backend_->released_cv.notify_all();
        }
    }

    // Like a real transport, nothing is alive until the handshake completes
    bool is_alive() const override { return connected_.load() && alive_.load() && !closed_.load(); }

    void die() { alive_ = false; }

private:
    std::shared_ptr<FakeBackend> backend_;
    std::atomic_bool connected_{false};
    std::atomic_bool alive_{true};
    std::atomic_bool closed_{false};
};

class FakeFactory : public toolbridge::tools::ToolClientFactory {
public:
    std::shared_ptr<toolbridge::tools::ToolClient> create(const ConnectSpec& spec) override {
        const std::string key = std::holds_alternative<StdioSpec>(spec)
                                    ? std::get<StdioSpec>(spec).command
                                    : std::get<StreamSpec>(spec).url;
        auto backend = backend_for(key);
        backend->creates++;
        auto client = std::make_shared<FakeToolClient>(backend);
        std::lock_guard<std::mutex> lock(backend->mutex);
        backend->latest = client;
        return client;
    }

    std::shared_ptr<FakeBackend> backend_for(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& backend = backends_[key];
        if (!backend) {
            backend = std::make_shared<FakeBackend>();
        }
        return backend;
    }

private:
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<FakeBackend>> backends_;
};

class RecordingSink : public toolbridge::net::ResponseSink {
public:
    bool send(ClientId client, const json& response) override {
        if (gone_.count(client) > 0) {
            return false;
        }
        responses_[client].push_back(response);
        return true;
    }

    std::size_t client_count() const override { return 2; }

    std::size_t count(ClientId client) const {
        auto it = responses_.find(client);
        return it == responses_.end() ? 0 : it->second.size();
    }

    const json& last(ClientId client) const { return responses_.at(client).back(); }

    void disconnect(ClientId client) { gone_[client] = true; }

private:
    std::map<ClientId, std::vector<json>> responses_;
    std::map<ClientId, bool> gone_;
};

BridgeConfig fast_config() {
    BridgeConfig config;
    config.request_timeout = 150ms;
    config.sweep_interval = 20ms;
    config.restart.base_delay = 5ms;
    config.restart.stability_window = 50ms;
    return config;
}

class BridgeTest : public ::testing::Test {
protected:
    BridgeTest()
        : factory_(std::make_shared<FakeFactory>()),
          bridge_(std::make_unique<Bridge>(fast_config(), factory_, &sink_)) {}

    void SetUp() override { ASSERT_FALSE(toolbridge::core::errors::is_error(bridge_->start())); }

    // Sends one command and spins the loop until its response arrives
    json call(const json& command, ClientId client = 1) {
        const std::size_t before = sink_.count(client);
        bridge_->handle_line(client, command.dump());
        const bool answered =
            bridge_->loop().run_until([&]() { return sink_.count(client) > before; }, 2s);
        EXPECT_TRUE(answered) << "no response to " << command.dump();
        return answered ? sink_.last(client) : json();
    }

    json raw(const std::string& line) {
        const std::size_t before = sink_.count(1);
        bridge_->handle_line(1, line);
        EXPECT_GT(sink_.count(1), before);
        return sink_.last(1);
    }

    void spawn_ready(const std::string& name, const std::string& command) {
        const json started = call({{"id", "s-" + name},
                                   {"command", "spawn"},
                                   {"params", {{"name", name}, {"command", command}}}});
        ASSERT_TRUE(started["success"].get<bool>());
        ASSERT_TRUE(bridge_->loop().run_until(
            [&]() { return bridge_->connections().is_ready(name); }, 2s));
    }

    void spin(std::chrono::milliseconds duration) {
        bridge_->loop().run_until([]() { return false; }, duration);
    }

    std::shared_ptr<FakeFactory> factory_;
    RecordingSink sink_;
    std::unique_ptr<Bridge> bridge_;
};

TEST_F(BridgeTest, PingReportsBridgeHealth) {
    const json response = call({{"id", "p1"}, {"command", "ping"}});
    EXPECT_EQ(response["id"], "p1");
    EXPECT_TRUE(response["success"].get<bool>());
    EXPECT_EQ(response["result"]["status"], "ok");
    EXPECT_EQ(response["result"]["serviceCount"], 0);
    EXPECT_TRUE(response["result"]["activeServices"].empty());
    EXPECT_TRUE(response["result"]["timestamp"].is_number());
}

TEST_F(BridgeTest, RejectsMalformedAndUnknownCommands) {
    const json parse_error = raw(R"({"id":"bad-1","command":"ping")");
    EXPECT_EQ(parse_error["error"]["code"], -32700);
    EXPECT_EQ(parse_error["id"], "bad-1");
    EXPECT_FALSE(parse_error["success"].get<bool>());

    const json no_command = raw(R"({"id":"x"})");
    EXPECT_EQ(no_command["error"]["code"], -32600);

    const json unknown = call({{"id", "u1"}, {"command", "bogus"}});
    EXPECT_EQ(unknown["error"]["code"], -32601);
    EXPECT_EQ(unknown["error"]["message"], "Unknown command: bogus");
}

TEST_F(BridgeTest, RegisterThenListWithoutStarting) {
    const json registered = call({{"id", "r1"},
                                  {"command", "register"},
                                  {"params", {{"name", "echo"}, {"type", "local"}, {"command", "echo-server"}}}});
    EXPECT_TRUE(registered["success"].get<bool>());
    EXPECT_EQ(registered["result"]["status"], "registered");
    EXPECT_EQ(registered["result"]["name"], "echo");

    const json listed = call({{"id", "l1"}, {"command", "list"}});
    ASSERT_EQ(listed["result"]["services"].size(), 1u);
    const json& entry = listed["result"]["services"][0];
    EXPECT_EQ(entry["name"], "echo");
    EXPECT_EQ(entry["type"], "local");
    EXPECT_EQ(entry["description"], "MCP Service: echo");
    EXPECT_FALSE(entry["active"].get<bool>());
    EXPECT_FALSE(entry["ready"].get<bool>());
    EXPECT_EQ(entry["toolCount"], 0);
    EXPECT_EQ(factory_->backend_for("echo-server")->creates.load(), 0);

    const json ping = call({{"id", "p2"}, {"command", "ping"}, {"params", {{"serviceName", "echo"}}}});
    EXPECT_EQ(ping["result"]["status"], "registered_not_active");
    EXPECT_FALSE(ping["result"]["active"].get<bool>());
    EXPECT_TRUE(bridge_->registry().get("echo")->last_used_at.has_value());
}

TEST_F(BridgeTest, FailedRegistrationLeavesRegistryUnchanged) {
    const json missing_command = call(
        {{"id", "r1"}, {"command", "register"}, {"params", {{"name", "x"}, {"type", "local"}}}});
    EXPECT_EQ(missing_command["error"]["code"], -32602);
    EXPECT_EQ(missing_command["error"]["message"], "Missing parameter 'command' for local service");

    const json missing_type = call({{"id", "r2"}, {"command", "register"}, {"params", {{"name", "x"}}}});
    EXPECT_EQ(missing_type["error"]["message"], "Missing required parameters: name, type");

    const json missing_endpoint = call(
        {{"id", "r3"}, {"command", "register"}, {"params", {{"name", "x"}, {"type", "remote"}}}});
    EXPECT_EQ(missing_endpoint["error"]["message"], "Missing 'endpoint' for remote service");

    EXPECT_EQ(bridge_->registry().size(), 0u);
}

TEST_F(BridgeTest, SpawnAutoRegistersAndToolcallEchoes) {
    spawn_ready("echo", "echo-server");
    EXPECT_EQ(bridge_->registry().get("echo")->description, "Auto-registered service echo");

    const json tools = call({{"id", "t1"}, {"command", "listtools"}, {"params", {{"name", "echo"}}}});
    ASSERT_EQ(tools["result"]["tools"].size(), 1u);
    EXPECT_EQ(tools["result"]["tools"][0]["name"], "echo");

    const json reply = call({{"id", "c1"},
                             {"command", "toolcall"},
                             {"params", {{"method", "echo"}, {"params", {{"text", "hi"}}}}}});
    EXPECT_EQ(reply["id"], "c1");
    EXPECT_TRUE(reply["success"].get<bool>());
    EXPECT_EQ(reply["result"]["content"][0]["text"], "hi");
    EXPECT_EQ(bridge_->tracker().size(), 0u);
}

TEST_F(BridgeTest, SpawnReportsStartedDescriptor) {
    call({{"id", "r1"},
          {"command", "register"},
          {"params",
           {{"name", "files"}, {"type", "local"}, {"command", "fs-server"}, {"args", {"--root", "/tmp"}}}}});
    const json started = call({{"id", "s1"}, {"command", "spawn"}, {"params", {{"name", "files"}}}});
    EXPECT_EQ(started["result"]["status"], "started");
    EXPECT_EQ(started["result"]["command"], "fs-server");
    EXPECT_EQ(started["result"]["args"][1], "/tmp");
    EXPECT_TRUE(bridge_->connections().is_active("files"));

    const json missing = call({{"id", "s2"}, {"command", "spawn"}, {"params", {{"name", "ghost"}}}});
    EXPECT_EQ(missing["error"]["code"], -32602);
    EXPECT_EQ(missing["error"]["message"], "Service 'ghost' is not registered and no command provided.");

    const json no_params = call({{"id", "s3"}, {"command", "spawn"}});
    EXPECT_EQ(no_params["error"]["code"], -32602);
}

TEST_F(BridgeTest, StatusAndListtoolsCoverActiveServices) {
    spawn_ready("alpha", "alpha-server");
    call({{"id", "r1"},
          {"command", "register"},
          {"params", {{"name", "beta"}, {"type", "remote"}, {"endpoint", "http://localhost:1/mcp"}}}});

    const json status = call({{"id", "st"}, {"command", "status"}});
    const json& result = status["result"];
    EXPECT_TRUE(result["registeredServices"].contains("alpha"));
    EXPECT_TRUE(result["registeredServices"].contains("beta"));
    EXPECT_TRUE(result["serviceStatus"]["alpha"]["active"].get<bool>());
    EXPECT_TRUE(result["serviceStatus"]["alpha"]["ready"].get<bool>());
    EXPECT_EQ(result["serviceStatus"]["alpha"]["toolCount"], 1);
    EXPECT_EQ(result["serviceStatus"]["beta"]["type"], "remote");
    EXPECT_FALSE(result["serviceStatus"]["beta"]["active"].get<bool>());
    EXPECT_EQ(result["pendingRequests"], 0);
    EXPECT_EQ(result["activeConnections"], 2);
    EXPECT_EQ(result["activeServiceCount"], 1);

    const json all = call({{"id", "lt"}, {"command", "listtools"}});
    EXPECT_TRUE(all["result"]["serviceTools"].contains("alpha"));
    EXPECT_FALSE(all["result"]["serviceTools"].contains("beta"));

    const json inactive = call({{"id", "lt2"}, {"command", "listtools"}, {"params", {{"name", "beta"}}}});
    EXPECT_EQ(inactive["error"]["code"], -32603);
}

TEST_F(BridgeTest, ToolcallWithoutTargetLeavesNoPendingRequest) {
    const json none = call({{"id", "c1"}, {"command", "toolcall"}, {"params", {{"method", "echo"}}}});
    EXPECT_EQ(none["error"]["code"], -32602);
    EXPECT_EQ(none["error"]["message"], "No service specified and no default available");

    const json named = call({{"id", "c2"},
                             {"command", "toolcall"},
                             {"params", {{"method", "echo"}, {"name", "ghost"}}}});
    EXPECT_EQ(named["error"]["code"], -32603);
    EXPECT_EQ(named["error"]["message"], "Service 'ghost' is not active");

    const json no_method = call({{"id", "c3"}, {"command", "toolcall"}, {"params", json::object()}});
    EXPECT_EQ(no_method["error"]["code"], -32602);
    EXPECT_EQ(bridge_->tracker().size(), 0u);
}

TEST_F(BridgeTest, ToolErrorsAreForwarded) {
    spawn_ready("echo", "echo-server");

    const json failed = call({{"id", "c1"},
                              {"command", "toolcall"},
                              {"params", {{"method", "fail"}, {"name", "echo"}}}});
    EXPECT_FALSE(failed["success"].get<bool>());
    EXPECT_EQ(failed["error"]["code"], -32000);
    EXPECT_EQ(failed["error"]["message"], "bad input");
    EXPECT_EQ(failed["result"]["content"][0]["text"], "bad input");

    const json empty = call({{"id", "c2"}, {"command", "toolcall"}, {"params", {{"method", "empty_fail"}}}});
    EXPECT_EQ(empty["error"]["message"], "Remote tool error");

    const json broken = call({{"id", "c3"}, {"command", "toolcall"}, {"params", {{"method", "broken"}}}});
    EXPECT_EQ(broken["error"]["code"], -32603);
    EXPECT_EQ(broken["error"]["message"], "Tool call failed: backend exploded");
    EXPECT_EQ(bridge_->tracker().size(), 0u);
}

TEST_F(BridgeTest, TimedOutRequestIsAnsweredExactlyOnce) {
    spawn_ready("echo", "echo-server");
    bridge_->handle_line(
        1, json({{"id", "slow"}, {"command", "toolcall"}, {"params", {{"method", "block"}}}}).dump());
    EXPECT_EQ(bridge_->tracker().size(), 1u);

    const std::size_t before = sink_.count(1);
    ASSERT_TRUE(bridge_->loop().run_until([&]() { return sink_.count(1) > before; }, 2s));
    EXPECT_EQ(sink_.last(1)["id"], "slow");
    EXPECT_EQ(sink_.last(1)["error"]["code"], -32603);
    EXPECT_EQ(sink_.last(1)["error"]["message"], "Request timeout");

    // The late backend result finds nothing pending and is dropped
    factory_->backend_for("echo-server")->release();
    spin(100ms);
    EXPECT_EQ(sink_.count(1), before + 1);
    EXPECT_EQ(bridge_->tracker().size(), 0u);
}

TEST_F(BridgeTest, DuplicatePendingIdIsRejected) {
    spawn_ready("echo", "echo-server");
    bridge_->handle_line(
        1, json({{"id", "dup"}, {"command", "toolcall"}, {"params", {{"method", "block"}}}}).dump());
    const json second = call({{"id", "dup"}, {"command", "toolcall"}, {"params", {{"method", "echo"}}}});
    EXPECT_EQ(second["error"]["code"], -32602);
    EXPECT_EQ(bridge_->tracker().size(), 1u);
    factory_->backend_for("echo-server")->release();
}

TEST_F(BridgeTest, DisconnectDropsPendingRequestsSilently) {
    spawn_ready("echo", "echo-server");
    bridge_->handle_line(
        2, json({{"id", "c9"}, {"command", "toolcall"}, {"params", {{"method", "block"}}}}).dump());
    ASSERT_EQ(bridge_->tracker().size(), 1u);

    sink_.disconnect(2);
    bridge_->client_disconnected(2);
    EXPECT_EQ(bridge_->tracker().size(), 0u);

    factory_->backend_for("echo-server")->release();
    spin(100ms);
    EXPECT_EQ(sink_.count(2), 0u);
}

TEST_F(BridgeTest, ShutdownUnregistersAndStopsForwarding) {
    spawn_ready("echo", "echo-server");
    const json down = call({{"id", "d1"}, {"command", "shutdown"}, {"params", {{"name", "echo"}}}});
    EXPECT_TRUE(down["success"].get<bool>());
    EXPECT_EQ(down["result"]["status"], "shutdown");
    EXPECT_FALSE(bridge_->registry().contains("echo"));
    EXPECT_FALSE(bridge_->connections().is_active("echo"));

    const json after = call({{"id", "c1"},
                             {"command", "toolcall"},
                             {"params", {{"method", "echo"}, {"name", "echo"}}}});
    EXPECT_EQ(after["error"]["code"], -32603);

    const json ping = call({{"id", "p1"}, {"command", "ping"}, {"params", {{"name", "echo"}}}});
    EXPECT_EQ(ping["error"]["code"], -32601);

    const json again = call({{"id", "d2"}, {"command", "shutdown"}, {"params", {{"name", "echo"}}}});
    EXPECT_EQ(again["error"]["code"], -32602);

    // No reconnection is attempted for a shut-down service
    spin(100ms);
    EXPECT_EQ(factory_->backend_for("echo-server")->creates.load(), 1);
}

TEST_F(BridgeTest, UnregisterClosesActiveService) {
    spawn_ready("echo", "echo-server");
    const json removed = call({{"id", "u1"}, {"command", "unregister"}, {"params", {{"name", "echo"}}}});
    EXPECT_EQ(removed["result"]["status"], "unregistered");
    EXPECT_FALSE(bridge_->connections().is_active("echo"));
    EXPECT_TRUE(bridge_->loop().run_until(
        [&]() { return factory_->backend_for("echo-server")->closes.load() == 1; }, 2s));

    const json unknown = call({{"id", "u2"}, {"command", "unregister"}, {"params", {{"name", "echo"}}}});
    EXPECT_EQ(unknown["error"]["code"], -32602);
    EXPECT_EQ(unknown["error"]["message"], "Service 'echo' not registered");
}

TEST_F(BridgeTest, ResetClearsEverything) {
    spawn_ready("echo", "echo-server");
    call({{"id", "r1"},
          {"command", "register"},
          {"params", {{"name", "web"}, {"type", "remote"}, {"endpoint", "http://localhost:1/mcp"}}}});

    const json reset = call({{"id", "x"}, {"command", "reset"}});
    EXPECT_EQ(reset["result"]["status"], "reset");
    EXPECT_EQ(reset["result"]["message"], "All services closed and registry cleared");

    const json listed = call({{"id", "l"}, {"command", "list"}});
    EXPECT_TRUE(listed["result"]["services"].empty());
    const json status = call({{"id", "s"}, {"command", "status"}});
    EXPECT_TRUE(status["result"]["registeredServices"].empty());
    EXPECT_EQ(status["result"]["pendingRequests"], 0);
    EXPECT_TRUE(bridge_->connections().active_services().empty());
}

TEST_F(BridgeTest, FailingServiceStopsAfterMaxAttempts) {
    auto backend = factory_->backend_for("flaky-server");
    backend->fail_connect = true;
    call({{"id", "s1"}, {"command", "spawn"}, {"params", {{"name", "flaky"}, {"command", "flaky-server"}}}});

    // Initial attempt plus five retries at 5, 10, 20, 40 and 80 ms
    ASSERT_TRUE(bridge_->loop().run_until(
        [&]() { return bridge_->connections().supervisor().exhausted("flaky"); }, 3s));
    EXPECT_EQ(backend->connects.load(), 6);
    EXPECT_FALSE(bridge_->connections().is_active("flaky"));
    EXPECT_TRUE(bridge_->connections().is_ready("flaky"));
    EXPECT_TRUE(bridge_->connections().tools("flaky").empty());

    const json status = call({{"id", "st"}, {"command", "status"}});
    EXPECT_EQ(status["result"]["serviceStatus"]["flaky"]["error"], "spawn failed");

    spin(200ms);
    EXPECT_EQ(backend->connects.load(), 6);

    // An explicit spawn gets a fresh budget
    backend->fail_connect = false;
    spawn_ready("flaky", "flaky-server");
    EXPECT_TRUE(bridge_->connections().is_connected("flaky"));
    EXPECT_FALSE(bridge_->connections().supervisor().exhausted("flaky"));
}

TEST_F(BridgeTest, LostBackendIsReconnected) {
    spawn_ready("echo", "echo-server");
    auto backend = factory_->backend_for("echo-server");
    {
        std::lock_guard<std::mutex> lock(backend->mutex);
        auto current = backend->latest.lock();
        ASSERT_TRUE(current);
        current->die();
    }

    ASSERT_TRUE(bridge_->loop().run_until([&]() { return backend->creates.load() == 2; }, 2s));
    ASSERT_TRUE(bridge_->loop().run_until(
        [&]() { return bridge_->connections().is_ready("echo"); }, 2s));
    EXPECT_TRUE(bridge_->connections().is_connected("echo"));
    EXPECT_TRUE(bridge_->loop().run_until([&]() { return backend->closes.load() == 1; }, 2s));
}

TEST_F(BridgeTest, ToolcallDuringHandshakeIsRejectedWithoutTeardown) {
    auto backend = factory_->backend_for("echo-server");
    backend->hold_connect = true;
    const json started = call({{"id", "s1"},
                               {"command", "spawn"},
                               {"params", {{"name", "echo"}, {"command", "echo-server"}}}});
    ASSERT_TRUE(started["success"].get<bool>());
    ASSERT_TRUE(bridge_->connections().is_active("echo"));
    ASSERT_FALSE(bridge_->connections().is_connected("echo"));

    const json named = call({{"id", "c1"},
                             {"command", "toolcall"},
                             {"params", {{"method", "echo"}, {"name", "echo"}}}});
    EXPECT_EQ(named["error"]["code"], -32603);
    EXPECT_EQ(named["error"]["message"], "Service 'echo' is not ready");

    const json implicit = call({{"id", "c2"}, {"command", "toolcall"}, {"params", {{"method", "echo"}}}});
    EXPECT_EQ(implicit["error"]["message"], "Service 'echo' is not ready");
    EXPECT_EQ(bridge_->tracker().size(), 0u);

    // A transport failure seen mid-handshake does not close the connecting adapter
    bridge_->connections().report_lost("echo", bridge_->connections().client("echo"));
    EXPECT_TRUE(bridge_->connections().is_active("echo"));
    EXPECT_EQ(bridge_->connections().supervisor().attempts("echo"), 0);
    EXPECT_FALSE(bridge_->connections().supervisor().retry_pending("echo"));

    backend->open_gate();
    ASSERT_TRUE(bridge_->loop().run_until(
        [&]() { return bridge_->connections().is_ready("echo"); }, 2s));
    EXPECT_EQ(backend->creates.load(), 1);
    EXPECT_EQ(bridge_->connections().supervisor().attempts("echo"), 0);

    const json reply = call({{"id", "c3"},
                             {"command", "toolcall"},
                             {"params", {{"method", "echo"}, {"params", {{"text", "after"}}}}}});
    EXPECT_TRUE(reply["success"].get<bool>());
    EXPECT_EQ(reply["result"]["content"][0]["text"], "after");
}

TEST_F(BridgeTest, LateConnectAfterShutdownIsIgnored) {
    auto backend = factory_->backend_for("echo-server");
    backend->hold_connect = true;
    call({{"id", "s1"}, {"command", "spawn"}, {"params", {{"name", "echo"}, {"command", "echo-server"}}}});
    ASSERT_FALSE(bridge_->connections().is_connected("echo"));

    const json down = call({{"id", "d1"}, {"command", "shutdown"}, {"params", {{"name", "echo"}}}});
    ASSERT_TRUE(down["success"].get<bool>());

    backend->open_gate();
    ASSERT_TRUE(bridge_->loop().run_until([&]() { return backend->closes.load() == 1; }, 2s));
    spin(100ms);

    EXPECT_FALSE(bridge_->connections().is_active("echo"));
    EXPECT_FALSE(bridge_->connections().is_ready("echo"));
    EXPECT_FALSE(bridge_->registry().contains("echo"));
    EXPECT_TRUE(bridge_->connections().tools("echo").empty());
    EXPECT_FALSE(bridge_->connections().supervisor().retry_pending("echo"));
    EXPECT_FALSE(bridge_->connections().has_state("echo"));
    EXPECT_EQ(backend->creates.load(), 1);
}

TEST_F(BridgeTest, LateConnectAfterResetIsIgnored) {
    auto backend = factory_->backend_for("echo-server");
    backend->hold_connect = true;
    call({{"id", "s1"}, {"command", "spawn"}, {"params", {{"name", "echo"}, {"command", "echo-server"}}}});

    call({{"id", "x"}, {"command", "reset"}});
    backend->open_gate();
    spin(100ms);

    EXPECT_TRUE(bridge_->connections().active_services().empty());
    EXPECT_FALSE(bridge_->registry().contains("echo"));
    EXPECT_FALSE(bridge_->connections().has_state("echo"));
    EXPECT_EQ(backend->creates.load(), 1);
}

TEST_F(BridgeTest, LateToolListAfterUnregisterIsIgnored) {
    auto backend = factory_->backend_for("echo-server");
    backend->hold_tools = true;
    call({{"id", "s1"}, {"command", "spawn"}, {"params", {{"name", "echo"}, {"command", "echo-server"}}}});
    ASSERT_TRUE(bridge_->loop().run_until(
        [&]() { return bridge_->connections().is_connected("echo"); }, 2s));
    ASSERT_FALSE(bridge_->connections().is_ready("echo"));

    const json removed = call({{"id", "u1"}, {"command", "unregister"}, {"params", {{"name", "echo"}}}});
    ASSERT_TRUE(removed["success"].get<bool>());

    backend->open_gate();
    spin(100ms);

    EXPECT_FALSE(bridge_->connections().is_active("echo"));
    EXPECT_FALSE(bridge_->connections().is_ready("echo"));
    EXPECT_TRUE(bridge_->connections().tools("echo").empty());
    EXPECT_FALSE(bridge_->registry().contains("echo"));
    EXPECT_FALSE(bridge_->connections().supervisor().retry_pending("echo"));
    EXPECT_FALSE(bridge_->connections().has_state("echo"));
    EXPECT_EQ(backend->creates.load(), 1);
}

TEST_F(BridgeTest, ClosureOfUnregisteredServiceKeepsNoState) {
    auto backend = factory_->backend_for("flaky-server");
    backend->fail_connect = true;
    call({{"id", "s1"}, {"command", "spawn"}, {"params", {{"name", "flaky"}, {"command", "flaky-server"}}}});
    ASSERT_TRUE(bridge_->loop().run_until(
        [&]() { return bridge_->connections().supervisor().retry_pending("flaky"); }, 2s));
    ASSERT_TRUE(bridge_->connections().has_state("flaky"));

    bridge_->registry().unregister_service("flaky");
    bridge_->connections().handle_service_closure("flaky");

    EXPECT_FALSE(bridge_->connections().has_state("flaky"));
    EXPECT_FALSE(bridge_->connections().supervisor().retry_pending("flaky"));
    spin(100ms);
    EXPECT_EQ(backend->creates.load(), 1);
}

TEST(BridgeLaneTest, CallsToOneServiceAreCappedAndQueued) {
    auto factory = std::make_shared<FakeFactory>();
    RecordingSink sink;
    BridgeConfig config = fast_config();
    config.request_timeout = 5s;
    config.max_calls_per_service = 2;
    Bridge bridge(config, factory, &sink);
    ASSERT_FALSE(toolbridge::core::errors::is_error(bridge.start()));

    bridge.handle_line(1, json({{"id", "s"}, {"command", "spawn"},
                                {"params", {{"name", "echo"}, {"command", "echo-server"}}}}).dump());
    ASSERT_TRUE(bridge.loop().run_until([&]() { return bridge.connections().is_ready("echo"); }, 2s));

    for (int i = 0; i < 3; ++i) {
        bridge.handle_line(1, json({{"id", "b" + std::to_string(i)},
                                    {"command", "toolcall"},
                                    {"params", {{"method", "block"}}}}).dump());
    }
    EXPECT_EQ(bridge.tracker().size(), 3u);
    EXPECT_EQ(bridge.runner().queued("echo"), 1u);

    factory->backend_for("echo-server")->release();
    ASSERT_TRUE(bridge.loop().run_until([&]() { return sink.count(1) == 4; }, 3s));
    EXPECT_EQ(bridge.tracker().size(), 0u);
    EXPECT_TRUE(sink.last(1)["success"].get<bool>());
}

TEST(BridgeSeedTest, RegistersDefaultServiceWithoutStartingIt) {
    auto factory = std::make_shared<FakeFactory>();
    RecordingSink sink;
    BridgeConfig config = fast_config();
    config.default_command = "node";
    config.default_args = {"server.js"};

    Bridge bridge(config, factory, &sink);
    const auto descriptor = bridge.registry().get("default");
    ASSERT_TRUE(descriptor.has_value());
    EXPECT_EQ(std::get<toolbridge::protocol::LocalService>(descriptor->kind).command, "node");
    EXPECT_FALSE(bridge.connections().is_active("default"));
    EXPECT_EQ(factory->backend_for("node")->creates.load(), 0);
}

}  // namespace
