// tests/test_engine.cpp
#include <catch2/catch_test_macros.hpp>
#include "pipeflow/core/engine.h"
#include "pipeflow/core/errors.h"
#include "test_fakes.h"
#include <filesystem>
#include <fstream>

using namespace pipeflow;
using namespace pipeflow::testing;

namespace fs = std::filesystem;

namespace {

const char* kGreetingPipeline = R"({
  "id": "greeting",
  "name": "Greeting",
  "nodes": [
    { "id": "greet", "type": "message_input_node", "config": { "message": "hi" } },
    { "id": "shout", "type": "code_execution_node", "config": { "code": "shout" } }
  ],
  "edges": [
    { "source": "greet", "target": "shout", "sourceHandle": "message", "targetHandle": "input" }
  ]
})";

struct Fakes {
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    std::shared_ptr<FakeSandbox> sandbox = std::make_shared<FakeSandbox>(
        [](const std::string& code, const ScriptScope& scope) -> std::optional<Value> {
            return Value{{"code", code}, {"seen", scope.input}};
        });
    std::shared_ptr<FakeApiClient> api = std::make_shared<FakeApiClient>();

    EngineDependencies deps() const { return {transport, sandbox, api}; }
};

fs::path write_temp(const std::string& name, const std::string& content) {
    auto path = fs::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

TEST_CASE("Engine runs a pipeline document end to end", "[engine]") {
    Fakes fakes;
    auto engine = PipelineEngine::from_document(Value::parse(kGreetingPipeline), EngineConfig{}, fakes.deps());

    std::vector<std::string> completed;
    engine->events().subscribe([&completed](const PipelineEvent& event) {
        if (event.type == PipelineEventType::NODE_COMPLETED) completed.push_back(*event.node_id);
    });

    auto execution = engine->run();

    REQUIRE(execution.status == ExecutionStatus::COMPLETED);
    REQUIRE(execution.logs.size() == 2);
    REQUIRE(completed == std::vector<std::string>{"greet", "shout"});
    REQUIRE(fakes.sandbox->codes == std::vector<std::string>{"shout"});
    REQUIRE(fakes.sandbox->scopes.at(0).input["input"]["message"] == "hi");

    auto shout = engine->store().node("shout");
    REQUIRE(shout->status == NodeStatus::COMPLETED);
    REQUIRE((*shout->result_metadata)["code"] == "shout");
    REQUIRE(engine->store().pipeline().status == PipelineStatus::COMPLETED);
}

TEST_CASE("Missing config keys are seeded from node defaults", "[engine]") {
    Fakes fakes;
    Value doc = {
        {"pipeline", {
            {"id", "p"},
            {"nodes", {
                {{"id", "h"}, {"type", "http_request_node"}, {"config", {{"url", "https://x.test"}}}},
                {{"id", "c"}, {"type", "code_execution_node"}},
                {{"id", "u"}, {"type", "unheard_of_node"}, {"config", {{"k", 1}}}}
            }}
        }}
    };

    auto engine = PipelineEngine::from_document(doc, EngineConfig{}, fakes.deps());

    auto http = engine->store().node("h");
    REQUIRE(http->config["url"] == "https://x.test");
    REQUIRE(http->config["method"] == "GET");
    REQUIRE(http->config["send_headers"] == true);
    REQUIRE(engine->store().node("c")->config["code"] == "return input;");
    REQUIRE(engine->store().node("u")->config == Value{{"k", 1}});
}

TEST_CASE("Malformed documents are configuration errors", "[engine]") {
    Fakes fakes;
    Value doc = Value::parse(R"({"nodes": [{"type": "input_node"}]})");
    REQUIRE_THROWS_AS(PipelineEngine::from_document(doc, EngineConfig{}, fakes.deps()), ConfigurationError);
    REQUIRE_THROWS_AS(PipelineEngine::from_file("/nonexistent/pipeline.json", EngineConfig{}, fakes.deps()),
                      ConfigurationError);
}

TEST_CASE("YAML pipeline files are accepted", "[engine]") {
    Fakes fakes;
    auto path = write_temp("pipeflow_engine_test.yaml", R"(
id: yaml-demo
name: From YAML
nodes:
  - id: in
    type: input_node
    config:
      filename: target.pdb
      file_id: f1
  - id: design
    type: rfdiffusion_node
    config:
      contigs: A1-50
edges:
  - source: in
    target: design
    targetHandle: target
)");

    auto engine = PipelineEngine::from_file(path.string(), EngineConfig{}, fakes.deps());
    fs::remove(path);

    auto pipeline = engine->store().pipeline();
    REQUIRE(pipeline.id == "yaml-demo");
    REQUIRE(pipeline.nodes.size() == 2);
    REQUIRE(pipeline.edges.at(0).target_handle == std::optional<std::string>("target"));
    REQUIRE(engine->validate().valid());

    engine->run();
    REQUIRE(fakes.api->calls.size() == 1);
    REQUIRE(fakes.api->calls[0].body["parameters"]["pdb_file_id"] == "f1");
    REQUIRE(fakes.api->calls[0].body["parameters"]["contigs"] == "A1-50");
}

TEST_CASE("An API base URL builds a client over the transport", "[engine]") {
    Fakes fakes;
    EngineConfig config;
    config.api_base_url = "https://api.test/";
    Value doc = Value::parse(R"({
      "id": "p",
      "nodes": [
        { "id": "in", "type": "input_node", "config": { "filename": "t.pdb", "file_id": "f1" } },
        { "id": "design", "type": "rfdiffusion_node" }
      ],
      "edges": [ { "source": "in", "target": "design", "targetHandle": "target" } ]
    })");

    auto engine = PipelineEngine::from_document(doc, config, {fakes.transport, fakes.sandbox, nullptr});
    REQUIRE(engine->api_client() != nullptr);

    engine->run();

    REQUIRE(fakes.transport->requests.size() == 1);
    const auto& request = fakes.transport->requests[0];
    REQUIRE(request.method == "POST");
    REQUIRE(request.url == "https://api.test/api/rfdiffusion/design");
    REQUIRE(request.body);
    auto body = Value::parse(*request.body);
    REQUIRE(body["jobId"] == "design");
    // seeded default
    REQUIRE(body["parameters"]["contigs"] == "50-100");
}

TEST_CASE("State is persisted after each run and can be restored", "[engine]") {
    Fakes fakes;
    auto state = fs::temp_directory_path() / "pipeflow_engine_state.json";
    fs::remove(state);
    EngineConfig config;
    config.state_file = state.string();

    std::string execution_id;
    {
        auto engine = PipelineEngine::from_document(Value::parse(kGreetingPipeline), config, fakes.deps());
        execution_id = engine->run().id;
    }
    REQUIRE(fs::exists(state));

    auto restored = PipelineEngine::from_document(Value::parse(kGreetingPipeline), config, fakes.deps());
    REQUIRE(restored->store().node("shout")->status == NodeStatus::IDLE);
    restored->load_state();
    fs::remove(state);

    REQUIRE(restored->store().node("shout")->status == NodeStatus::COMPLETED);
    REQUIRE(restored->store().current_execution()->id == execution_id);
    REQUIRE(restored->store().history().size() == 1);

    // Nothing left to do on a completed pipeline
    auto again = restored->run();
    REQUIRE(again.logs.empty());
    REQUIRE(fakes.sandbox->codes.size() == 1);
    fs::remove(state);
}

TEST_CASE("Saving without a state file is refused", "[engine]") {
    Fakes fakes;
    auto engine = PipelineEngine::from_document(Value::parse(kGreetingPipeline), EngineConfig{}, fakes.deps());
    REQUIRE_THROWS_AS(engine->save_state(), ConfigurationError);
    REQUIRE_THROWS_AS(engine->load_state(), ConfigurationError);
}

TEST_CASE("Engine config fields are parsed and checked", "[engine][config]") {
    Value doc = {
        {"definitions_dirs", {"nodes", "/opt/pipeflow/nodes"}},
        {"api_base_url", "https://api.test"},
        {"endpoint_overrides", {{"rfdiffusion_node", "https://gpu.test/design"}}},
        {"http_timeout_ms", 1500},
        {"script_timeout_ms", -4},
        {"history_limit", "many"},
        {"verify_ssl", false},
        {"user_agent", 12},
        {"state_file", "state/run.json"}
    };

    auto config = parse_engine_config(doc, "/srv/flows");

    REQUIRE(config.definitions_dirs == std::vector<std::string>{"/srv/flows/nodes", "/opt/pipeflow/nodes"});
    REQUIRE(config.api_base_url == "https://api.test");
    REQUIRE(config.endpoint_overrides.at("rfdiffusion_node") == "https://gpu.test/design");
    REQUIRE(config.http_timeout_ms == 1500);
    REQUIRE_FALSE(config.verify_ssl);
    REQUIRE(config.state_file == "/srv/flows/state/run.json");

    // wrong types and non-positive numbers keep the defaults
    REQUIRE(config.script_timeout_ms == 5000);
    REQUIRE(config.history_limit == 50);
    REQUIRE(config.user_agent == "pipeflow/1.0");
}

TEST_CASE("Engine config files", "[engine][config]") {
    SECTION("a missing file gives defaults") {
        auto config = load_engine_config((fs::temp_directory_path() / "pipeflow_no_such_config.json").string());
        REQUIRE(config.api_base_url.empty());
        REQUIRE(config.upload_url_template == "/api/upload/pdb/{file_id}");
        REQUIRE(config.state_file.empty());
    }

    SECTION("relative paths follow the file") {
        auto dir = fs::temp_directory_path() / "pipeflow_config_dir";
        fs::create_directories(dir);
        auto path = dir / "pipeflow_config.json";
        {
            std::ofstream out(path);
            out << R"({"state_file": "state.json", "public_base_url": "https://app.test"})";
        }
        auto config = load_engine_config(path.string());
        fs::remove_all(dir);

        REQUIRE(config.state_file == (dir / "state.json").lexically_normal().string());
        REQUIRE(config.public_base_url == "https://app.test");
    }

    SECTION("malformed JSON is rejected") {
        auto path = write_temp("pipeflow_bad_config.json", "{ not json");
        REQUIRE_THROWS_AS(load_engine_config(path.string()), ConfigurationError);
        fs::remove(path);
    }
}
