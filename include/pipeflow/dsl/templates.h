// pipeflow/dsl/templates.h
#ifndef PIPEFLOW_DSL_TEMPLATES_H
#define PIPEFLOW_DSL_TEMPLATES_H

#include "pipeflow/core/pipeline.h"
#include "common/types.h"
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pipeflow {

/**
 * TemplateResolver: {{path}} interpolation against {input, config, node}.
 *
 *   template := (text | "{{" ws path ws "}}")*
 *   path     := segment ("." segment)*
 *   segment  := name ("[" digits "]")*
 *
 * A string made of exactly one expression yields the looked-up value with its JSON type.
 * Missing paths resolve to empty; malformed expressions stay literal text.
 */
class TemplateResolver {
public:
    struct PathStep {
        std::variant<std::string, size_t> key; // object member or array index
    };
    using Path = std::vector<PathStep>;

    struct Segment {
        bool is_expression = false;
        std::string text; // literal text, or the raw expression source
        Path path;
    };

    static Value resolve(const Value& tmpl, const PipelineNode& node, const Value& input_data);

    static Value build_context(const PipelineNode& node, const Value& input_data);

    // Resolution against an explicit context object
    static Value resolve_with_context(const Value& tmpl, const Value& context);

    // Split a string into literal and expression segments
    static std::vector<Segment> parse(std::string_view text);

    static bool contains_expression(std::string_view text);

    // Look up a path; returns nullptr when any step is missing
    static const Value* lookup(const Value& context, const Path& path);

private:
    static Value resolve_string(const std::string& text, const Value& context);
};

// Keys such as __send_body__ or __auth_type__ steer the dispatcher and are never forwarded
bool is_reserved_flag(std::string_view key);

// Copy of an object without its reserved flag keys (non-objects returned unchanged)
Value strip_reserved_flags(const Value& obj);

} // namespace pipeflow

#endif // PIPEFLOW_DSL_TEMPLATES_H
