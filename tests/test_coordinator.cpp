// tests/test_coordinator.cpp
#include <catch2/catch_test_macros.hpp>
#include "pipeflow/core/coordinator.h"
#include "pipeflow/core/errors.h"
#include "test_fakes.h"
#include <memory>

using namespace pipeflow;
using namespace pipeflow::testing;

namespace {

// Scripts are keyed by their code: "fail" throws, "echo" returns its input, anything else
// returns {step: code}
std::optional<Value> scripted(const std::string& code, const ScriptScope& scope) {
    if (code == "fail") throw ScriptExecutionError("boom");
    if (code == "echo") return scope.input;
    return Value{{"step", code}};
}

PipelineNode code_node(const NodeId& id, const std::string& code, NodeStatus status = NodeStatus::IDLE) {
    return make_node(id, "code_execution_node", {{"code", code}}, status);
}

struct CoordinatorFixture {
    NodeDefinitionRegistry registry;
    ExecutionStateStore store;
    EventBus events;
    std::shared_ptr<FakeSandbox> sandbox = std::make_shared<FakeSandbox>(scripted);
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    FakeApiClient api;
    ExecutionDispatcher dispatcher{registry, transport, sandbox};
    ExecutionCoordinator coordinator{store, dispatcher, registry, &events};
    std::vector<PipelineEvent> seen;

    explicit CoordinatorFixture(Pipeline pipeline) {
        pipeline.id = "p";
        store.set_pipeline(std::move(pipeline));
        events.subscribe([this](const PipelineEvent& event) { seen.push_back(event); });
    }

    Execution run() { return coordinator.run(&api); }
};

Pipeline chain(std::vector<PipelineNode> nodes, const std::vector<std::pair<std::string, std::string>>& links) {
    Pipeline p;
    p.nodes = std::move(nodes);
    for (const auto& [s, t] : links) p.edges.push_back(make_edge(s, t, std::nullopt, std::string("input")));
    return p;
}

} // namespace

TEST_CASE("Linear chain runs A, B, C in order and completes", "[coordinator]") {
    CoordinatorFixture f(chain({code_node("C", "c"), code_node("A", "a"), code_node("B", "b")},
                               {{"A", "B"}, {"B", "C"}}));

    auto execution = f.run();

    REQUIRE(f.sandbox->codes == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(execution.status == ExecutionStatus::COMPLETED);
    REQUIRE(execution.completed_at.has_value());
    REQUIRE(execution.logs.size() == 3);
    REQUIRE(execution.logs[0].node_id == "A");
    REQUIRE(execution.logs[2].node_id == "C");
    REQUIRE(execution.logs[1].output == Value{{"step", "b"}});
    REQUIRE(execution.logs[1].duration_ms.has_value());

    for (const auto& id : {"A", "B", "C"}) {
        auto node = f.store.node(id);
        REQUIRE(node->status == NodeStatus::COMPLETED);
        REQUIRE(node->result_metadata.has_value());
    }
    REQUIRE(f.store.pipeline().status == PipelineStatus::COMPLETED);
    REQUIRE(f.store.history().size() == 1);

    REQUIRE(f.seen.size() == 5);
    REQUIRE(f.seen.front().type == PipelineEventType::RUN_STARTED);
    REQUIRE(f.seen[1].type == PipelineEventType::NODE_COMPLETED);
    REQUIRE(f.seen[1].node_id == std::optional<std::string>("A"));
    REQUIRE(f.seen.back().type == PipelineEventType::RUN_COMPLETED);
    REQUIRE(f.seen.back().status == std::optional<std::string>("completed"));
    REQUIRE(f.seen.back().nodes->size() == 3);
}

TEST_CASE("Upstream results feed downstream inputs", "[coordinator]") {
    CoordinatorFixture f(chain({code_node("A", "a"), code_node("B", "echo")}, {{"A", "B"}}));
    f.run();

    const auto& scope = f.sandbox->scopes.at(1);
    REQUIRE(scope.input["input"] == Value{{"step", "a"}});
    REQUIRE(f.store.current_execution()->logs.at(1).input["inputs"]["input"]["step"] == "a");
}

TEST_CASE("Completed nodes are not executed again", "[coordinator]") {
    auto done = code_node("A", "a", NodeStatus::COMPLETED);
    done.result_metadata = Value{{"step", "old"}};
    CoordinatorFixture f(chain({done, code_node("B", "echo")}, {{"A", "B"}}));

    auto execution = f.run();

    REQUIRE(f.sandbox->codes == std::vector<std::string>{"echo"});
    REQUIRE((*f.store.node("A")->result_metadata)["step"] == "old");
    REQUIRE(execution.logs.size() == 1);
    REQUIRE(execution.logs[0].node_id == "B");
    REQUIRE(f.sandbox->scopes.at(0).input["input"]["step"] == "old");
}

TEST_CASE("One failing node does not stop the run", "[coordinator]") {
    CoordinatorFixture f(chain({code_node("A", "a"), code_node("B", "fail"), code_node("C", "c")}, {}));

    auto execution = f.run();

    REQUIRE(execution.status == ExecutionStatus::COMPLETED);
    REQUIRE(execution.logs.size() == 3);
    REQUIRE(f.store.current_execution().has_value());

    auto failed = f.store.node("B");
    REQUIRE(failed->status == NodeStatus::ERROR);
    REQUIRE(failed->error->find("boom") != std::string::npos);
    REQUIRE_FALSE(failed->result_metadata.has_value());

    const auto& log = execution.logs[1];
    REQUIRE(log.status == NodeStatus::ERROR);
    REQUIRE(log.error->find("boom") != std::string::npos);
    REQUIRE(log.completed_at.has_value());

    REQUIRE(f.store.node("C")->status == NodeStatus::COMPLETED);
    REQUIRE(f.store.pipeline().status == PipelineStatus::COMPLETED);
}

TEST_CASE("Failure cascades through input validation", "[coordinator]") {
    Pipeline p;
    p.nodes.push_back(make_node("in", "input_node", {{"filename", ""}}));
    p.nodes.push_back(make_node("design", "rfdiffusion_node", {{"contigs", "A1-50"}}));
    p.edges.push_back(make_edge("in", "design", std::string("target"), std::string("target")));
    CoordinatorFixture f(p);

    auto execution = f.run();

    REQUIRE(execution.logs.size() == 2);
    REQUIRE(*f.store.node("in")->error == "No filename specified for input node");
    REQUIRE(*f.store.node("design")->error == "Missing required input 'target' (pdb_file) for node design (design)");
    REQUIRE(f.api.calls.empty());
    REQUIRE(execution.status == ExecutionStatus::COMPLETED);
}

TEST_CASE("HTTP failures keep request and response in the log", "[coordinator]") {
    auto source = make_node("in", "input_node", {{"filename", "t.pdb"}, {"file_id", "f1"}}, NodeStatus::COMPLETED);
    source.result_metadata = Value{{"file_info", {{"type", "pdb_file"}, {"filename", "t.pdb"}, {"file_id", "f1"}}}};
    Pipeline p;
    p.nodes.push_back(source);
    p.nodes.push_back(make_node("design", "rfdiffusion_node", {{"contigs", "A1-50"}, {"num_designs", 2}}));
    p.edges.push_back(make_edge("in", "design", std::string("target"), std::string("target")));
    CoordinatorFixture f(p);
    f.api.default_response = make_response(500, {{"detail", "GPU busy"}});

    auto execution = f.run();

    REQUIRE(f.api.calls.size() == 1);
    REQUIRE(f.api.calls[0].url == "/api/rfdiffusion/design");
    REQUIRE(f.api.calls[0].body["parameters"]["pdb_file_id"] == "f1");
    REQUIRE(f.api.calls[0].body["parameters"]["num_designs"] == 2);

    auto node = f.store.node("design");
    REQUIRE(node->status == NodeStatus::ERROR);
    REQUIRE(*node->error == "HTTP 500: Internal Server Error");

    const auto& log = execution.logs.at(0);
    REQUIRE(log.request);
    REQUIRE((*log.request)["method"] == "POST");
    REQUIRE(log.response);
    REQUIRE((*log.response)["status"] == 500);
    REQUIRE((*log.response)["data"]["detail"] == "GPU busy");
}

TEST_CASE("Design services hand files and sequences downstream", "[coordinator]") {
    auto source = make_node("in", "input_node", {{"filename", "t.pdb"}}, NodeStatus::COMPLETED);
    source.result_metadata = Value{{"file_info", {{"type", "pdb_file"}, {"filename", "t.pdb"}, {"file_id", "f1"}}}};
    Pipeline p;
    p.nodes.push_back(source);
    p.nodes.push_back(make_node("mpnn", "proteinmpnn_node", {{"num_sequences", 2}, {"temperature", 0.1}}));
    p.nodes.push_back(make_node("fold", "alphafold_node", {{"recycle_count", 3}, {"num_relax", 0}}));
    p.edges.push_back(make_edge("in", "mpnn", std::string("target"), std::string("backbone")));
    p.edges.push_back(make_edge("mpnn", "fold", std::string("sequence"), std::string("sequence")));
    CoordinatorFixture f(p);
    f.api.queued.push_back(make_response(200, {{"data", {{"sequence", "MKV"}}}}));
    f.api.queued.push_back(make_response(200, {{"data", {{"filepath", "/jobs/fold/model_1.pdb"}}}}));

    f.run();

    REQUIRE(f.api.calls.size() == 2);
    REQUIRE(f.api.calls[0].body["sourceFileId"] == "f1");
    REQUIRE(f.api.calls[1].url == "/api/alphafold/fold");
    REQUIRE(f.api.calls[1].body["sequence"] == "MKV");

    REQUIRE((*f.store.node("mpnn")->result_metadata)["sequence"] == "MKV");
    auto fold = f.store.node("fold");
    REQUIRE(fold->status == NodeStatus::COMPLETED);
    REQUIRE((*fold->result_metadata)["output_file"]["type"] == "pdb_file");
    REQUIRE((*fold->result_metadata)["output_file"]["filename"] == "model_1.pdb");
}

TEST_CASE("Cyclic pipelines are rejected before the run starts", "[coordinator]") {
    CoordinatorFixture f(chain({code_node("A", "a"), code_node("B", "b"), code_node("C", "c")},
                               {{"A", "B"}, {"B", "C"}, {"C", "A"}}));

    REQUIRE_THROWS_AS(f.run(), CycleError);

    REQUIRE(f.sandbox->codes.empty());
    REQUIRE_FALSE(f.store.current_execution().has_value());
    REQUIRE(f.store.history().empty());
    REQUIRE(f.store.pipeline().status == PipelineStatus::DRAFT);
    for (const auto& node : f.store.pipeline().nodes) {
        REQUIRE(node.status == NodeStatus::IDLE);
    }
    REQUIRE(f.seen.empty());
}

TEST_CASE("Cancellation stops before the next node", "[coordinator]") {
    auto stale = code_node("C", "c");
    stale.result_metadata = Value{{"step", "earlier"}};
    CoordinatorFixture f(chain({code_node("A", "a"), code_node("B", "b"), stale}, {}));
    f.events.subscribe([&f](const PipelineEvent& event) {
        if (event.type == PipelineEventType::NODE_COMPLETED) f.coordinator.cancel();
    });

    auto execution = f.run();

    REQUIRE(f.sandbox->codes == std::vector<std::string>{"a"});
    REQUIRE(execution.logs.size() == 1);
    REQUIRE(execution.status == ExecutionStatus::COMPLETED);
    REQUIRE(f.store.history().at(0).status == ExecutionStatus::STOPPED);
    REQUIRE(f.store.pipeline().status == PipelineStatus::DRAFT);
    REQUIRE(f.seen.back().status == std::optional<std::string>("draft"));

    REQUIRE(f.store.node("B")->status == NodeStatus::PENDING);
    // A leftover result counts as done
    REQUIRE(f.store.node("C")->status == NodeStatus::COMPLETED);
}

TEST_CASE("A single node can be re-run on its own", "[coordinator]") {
    CoordinatorFixture f(chain({code_node("A", "a"), code_node("B", "echo")}, {{"A", "B"}}));
    f.run();

    auto execution = f.coordinator.run_single_node("B", &f.api);

    REQUIRE(f.sandbox->codes == std::vector<std::string>{"a", "echo", "echo"});
    REQUIRE(execution.logs.size() == 1);
    REQUIRE(execution.logs[0].node_id == "B");
    REQUIRE(f.store.node("B")->status == NodeStatus::COMPLETED);
    REQUIRE(f.store.history().size() == 2);

    REQUIRE_THROWS_AS(f.coordinator.run_single_node("nope", &f.api), NotFoundError);
}

TEST_CASE("Validation reports problems without running anything", "[coordinator]") {
    Pipeline p;
    p.nodes.push_back(make_node("http", "http_request_node", {{"url", ""}}));
    p.nodes.push_back(make_node("design", "rfdiffusion_node", {{"contigs", "A1-50"}}));
    p.nodes.push_back(make_node("odd", "mystery_node"));
    p.nodes.push_back(code_node("x", "x"));
    p.nodes.push_back(code_node("y", "y"));
    p.edges.push_back(make_edge("x", "y"));
    p.edges.push_back(make_edge("y", "x"));
    CoordinatorFixture f(p);

    auto report = f.coordinator.validate();

    REQUIRE_FALSE(report.valid());
    REQUIRE(report.errors.size() == 1);
    REQUIRE(report.errors[0] == "Pipeline contains a cycle involving nodes: x, y");
    REQUIRE(report.node_errors.at("http") == std::vector<std::string>{"Missing required config field: url"});
    REQUIRE(report.node_errors.at("design") == std::vector<std::string>{"Missing required input 'target' (pdb_file)"});
    REQUIRE(report.node_errors.at("odd") == std::vector<std::string>{"Unknown node type: mystery_node"});
    REQUIRE(report.node_errors.count("x") == 0);
    REQUIRE(f.sandbox->codes.empty());

    auto json = report.to_json();
    REQUIRE(json["valid"] == false);
}

TEST_CASE("Connected inputs pass validation before upstream has run", "[coordinator]") {
    Pipeline p;
    p.nodes.push_back(make_node("in", "input_node", {{"filename", "t.pdb"}}));
    p.nodes.push_back(make_node("design", "rfdiffusion_node", {{"contigs", "A1-50"}}));
    p.edges.push_back(make_edge("in", "design", std::string("target"), std::string("target")));
    CoordinatorFixture f(p);

    REQUIRE(f.coordinator.validate().valid());
}

TEST_CASE("Malformed definitions are reported per node by validation", "[coordinator]") {
    Pipeline p;
    p.nodes.push_back(make_node("b", "bad_node"));
    p.nodes.push_back(code_node("c", "c"));
    CoordinatorFixture f(p);
    f.registry.register_definition("bad_node", Value::parse(R"({
      "schema": { "f": { "type": "string", "required": "yes" } },
      "handles": { "inputs": [], "outputs": [] },
      "execution": { "type": "log" },
      "defaultConfig": {}
    })"));

    auto report = f.coordinator.validate();

    REQUIRE_FALSE(report.valid());
    REQUIRE(report.node_errors.at("b").size() == 1);
    REQUIRE(report.node_errors.at("b")[0].rfind("Node config for bad_node is malformed: ", 0) == 0);
    REQUIRE(report.node_errors.count("c") == 0);

    // The run records the same failure on the node and carries on
    f.run();
    REQUIRE(f.store.node("b")->status == NodeStatus::ERROR);
    REQUIRE(f.store.node("c")->status == NodeStatus::COMPLETED);
}
