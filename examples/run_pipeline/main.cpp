#include "pipeflow/core/engine.h"
#include "pipeflow/core/errors.h"
#include <iostream>

int main(int argc, char** argv) {
    const std::string pipeline_path = argc > 1 ? argv[1] : "examples/run_pipeline/pipeline.json";
    const std::string config_path = argc > 2 ? argv[2] : "pipeflow_config.json";

    try {
        auto engine = pipeflow::PipelineEngine::from_file(pipeline_path, pipeflow::load_engine_config(config_path));

        engine->events().subscribe([](const pipeflow::PipelineEvent& event) {
            if (event.type == pipeflow::PipelineEventType::NODE_COMPLETED) {
                std::cout << "  -> " << *event.node_id << ": " << event.status.value_or("?") << std::endl;
            }
        });

        auto report = engine->validate();
        if (!report.valid()) {
            std::cerr << "[WARNING] Validation problems:\n" << report.to_json().dump(2) << std::endl;
        }

        auto execution = engine->run();

        std::cout << "\n=== Execution " << execution.id << " ===" << std::endl;
        for (const auto& log : execution.logs) {
            std::cout << log.node_label << " [" << pipeflow::to_string(log.status) << "]";
            if (log.duration_ms) std::cout << " " << *log.duration_ms << " ms";
            std::cout << std::endl;
            if (log.error) {
                std::cout << "  error: " << *log.error << std::endl;
            } else {
                std::cout << "  output: " << log.output.dump() << std::endl;
            }
        }
    } catch (const pipeflow::PipeflowError& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
