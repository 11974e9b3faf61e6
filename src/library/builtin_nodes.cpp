// src/library/builtin_nodes.cpp
#include "pipeflow/library/loader.h"

namespace pipeflow {

namespace {

constexpr const char* kInputNode = R"({
  "metadata": {
    "type": "input_node",
    "label": "Input",
    "description": "Provides a structure file to downstream nodes",
    "category": "io"
  },
  "schema": {
    "filename": { "type": "string", "required": true, "label": "PDB File" },
    "file_id": { "type": "string", "label": "File ID" },
    "file_url": { "type": "string", "label": "File URL" }
  },
  "handles": {
    "inputs": [],
    "outputs": [ { "id": "target", "dataType": "pdb_file" } ]
  },
  "execution": { "type": "file_check", "identifyingField": "filename", "descriptorType": "pdb_file" },
  "defaultConfig": { "filename": "", "file_id": "", "file_url": "" }
})";

constexpr const char* kMessageInputNode = R"({
  "metadata": {
    "type": "message_input_node",
    "label": "Message Input",
    "description": "Emits a message; useful as a pass-through or test node",
    "category": "io"
  },
  "schema": {
    "message": { "type": "string", "required": false, "label": "Message" }
  },
  "handles": {
    "inputs": [],
    "outputs": [ { "id": "message", "dataType": "message" } ]
  },
  "execution": { "type": "log", "message": "{{config.message}}" },
  "defaultConfig": { "message": "" }
})";

constexpr const char* kHttpRequestNode = R"({
  "metadata": {
    "type": "http_request_node",
    "label": "HTTP Request",
    "description": "Calls an arbitrary HTTP endpoint",
    "category": "integration"
  },
  "schema": {
    "url": { "type": "string", "required": true, "label": "URL" },
    "method": { "type": "string", "default": "GET", "label": "Method" },
    "query_params": { "type": "string", "label": "Query Parameters" },
    "send_headers": { "type": "boolean", "default": true, "label": "Send Headers" },
    "headers": { "type": "string", "label": "Headers" },
    "auth_type": { "type": "string", "default": "none", "label": "Authentication" },
    "send_body": { "type": "boolean", "default": false, "label": "Send Body" },
    "body_content_type": { "type": "string", "default": "json", "label": "Body Content Type" },
    "body_specify": { "type": "string", "default": "json", "label": "Specify Body" },
    "body_json": { "type": "string", "label": "JSON Body" },
    "body_raw": { "type": "string", "label": "Raw Body" }
  },
  "handles": {
    "inputs": [ { "id": "input", "dataType": "any" } ],
    "outputs": [ { "id": "response", "dataType": "any" } ]
  },
  "execution": {
    "type": "api_call",
    "endpoint": "{{config.url}}",
    "method": "{{config.method}}",
    "queryParams": "{{config.query_params}}",
    "headers": {
      "__send_headers__": "{{config.send_headers}}",
      "__custom_headers__": "{{config.headers}}",
      "__auth_type__": "{{config.auth_type}}",
      "__basic_auth_username__": "{{config.basic_auth_username}}",
      "__basic_auth_password__": "{{config.basic_auth_password}}",
      "__bearer_token__": "{{config.bearer_token}}",
      "__custom_auth_header_name__": "{{config.custom_auth_header_name}}",
      "__custom_auth_header_value__": "{{config.custom_auth_header_value}}"
    },
    "payload": {
      "__send_body__": "{{config.send_body}}",
      "__body_content_type__": "{{config.body_content_type}}",
      "__body_specify__": "{{config.body_specify}}",
      "__body_json__": "{{config.body_json}}",
      "__body_raw__": "{{config.body_raw}}"
    }
  },
  "defaultConfig": {
    "url": "",
    "method": "GET",
    "send_headers": true,
    "auth_type": "none",
    "send_body": false,
    "body_content_type": "json",
    "body_specify": "json"
  }
})";

constexpr const char* kCodeExecutionNode = R"({
  "metadata": {
    "type": "code_execution_node",
    "label": "Code Execution",
    "description": "Runs a JavaScript snippet against the upstream data",
    "category": "logic"
  },
  "schema": {
    "code": { "type": "string", "required": true, "label": "Code" }
  },
  "handles": {
    "inputs": [ { "id": "input", "dataType": "any" } ],
    "outputs": [ { "id": "output", "dataType": "any" } ]
  },
  "execution": { "type": "code_execution", "code": "{{config.code}}", "inputsOptional": true },
  "defaultConfig": { "code": "return input;" }
})";

constexpr const char* kRfdiffusionNode = R"({
  "metadata": {
    "type": "rfdiffusion_node",
    "label": "RFdiffusion",
    "description": "Submits a backbone design job",
    "category": "design"
  },
  "schema": {
    "design_mode": { "type": "string", "default": "unconditional", "label": "Design Mode" },
    "contigs": { "type": "string", "required": true, "default": "50-100", "label": "Contigs" },
    "hotspot_res": { "type": "string", "label": "Hotspot Residues" },
    "num_designs": { "type": "number", "default": 1, "label": "Number of Designs" }
  },
  "handles": {
    "inputs": [ { "id": "target", "dataType": "pdb_file" } ],
    "outputs": [ { "id": "backbone", "dataType": "pdb_file" } ]
  },
  "execution": {
    "type": "api_call",
    "endpoint": "/api/rfdiffusion/design",
    "method": "POST",
    "inputsOptional": false,
    "payload": {
      "jobId": "{{node.id}}",
      "parameters": {
        "design_mode": "{{config.design_mode}}",
        "contigs": "{{config.contigs}}",
        "hotspot_res": "{{config.hotspot_res}}",
        "num_designs": "{{config.num_designs}}",
        "pdb_file_id": "{{input.target.file_id}}",
        "pdb_filename": "{{input.target.filename}}"
      }
    }
  },
  "resultFileType": "pdb_file",
  "defaultConfig": { "design_mode": "unconditional", "contigs": "50-100", "hotspot_res": "", "num_designs": 1 }
})";

constexpr const char* kProteinMpnnNode = R"({
  "metadata": {
    "type": "proteinmpnn_node",
    "label": "ProteinMPNN",
    "description": "Designs sequences for a backbone",
    "category": "design"
  },
  "schema": {
    "num_sequences": { "type": "number", "default": 4, "label": "Sequences" },
    "temperature": { "type": "number", "default": 0.1, "label": "Sampling Temperature" }
  },
  "handles": {
    "inputs": [ { "id": "backbone", "dataType": "pdb_file" } ],
    "outputs": [ { "id": "sequence", "dataType": "sequence" } ]
  },
  "execution": {
    "type": "api_call",
    "endpoint": "/api/proteinmpnn/design",
    "method": "POST",
    "inputsOptional": false,
    "payload": {
      "jobId": "{{node.id}}",
      "pdbSource": "upload",
      "sourceFileId": "{{input.backbone.file_id}}",
      "sourceFileUrl": "{{input.backbone.file_url}}",
      "parameters": {
        "num_sequences": "{{config.num_sequences}}",
        "temperature": "{{config.temperature}}"
      }
    }
  },
  "defaultConfig": { "num_sequences": 4, "temperature": 0.1 }
})";

constexpr const char* kAlphafoldNode = R"({
  "metadata": {
    "type": "alphafold_node",
    "label": "AlphaFold",
    "description": "Predicts a structure for a sequence",
    "category": "prediction"
  },
  "schema": {
    "recycle_count": { "type": "number", "default": 3, "label": "Recycles" },
    "num_relax": { "type": "number", "default": 0, "label": "Relaxation Steps" }
  },
  "handles": {
    "inputs": [ { "id": "sequence", "dataType": "sequence" } ],
    "outputs": [ { "id": "structure", "dataType": "pdb_file" } ]
  },
  "execution": {
    "type": "api_call",
    "endpoint": "/api/alphafold/fold",
    "method": "POST",
    "inputsOptional": false,
    "payload": {
      "jobId": "{{node.id}}",
      "sequence": "{{input.sequence}}",
      "parameters": {
        "recycle_count": "{{config.recycle_count}}",
        "num_relax": "{{config.num_relax}}"
      }
    }
  },
  "resultFileType": "pdb_file",
  "defaultConfig": { "recycle_count": 3, "num_relax": 0 }
})";

} // namespace

std::map<NodeTypeName, Value> builtin_node_documents() {
    std::map<NodeTypeName, Value> docs;
    docs["input_node"] = Value::parse(kInputNode);
    docs["message_input_node"] = Value::parse(kMessageInputNode);
    docs["http_request_node"] = Value::parse(kHttpRequestNode);
    docs["code_execution_node"] = Value::parse(kCodeExecutionNode);
    docs["rfdiffusion_node"] = Value::parse(kRfdiffusionNode);
    docs["proteinmpnn_node"] = Value::parse(kProteinMpnnNode);
    docs["alphafold_node"] = Value::parse(kAlphafoldNode);
    return docs;
}

} // namespace pipeflow
