// src/dsl/templates.cpp
#include "pipeflow/dsl/templates.h"
#include "common/utils.h"
#include <cctype>
#include <charconv>
#include <limits>

namespace pipeflow {

namespace {

class PathParser {
public:
    explicit PathParser(std::string_view src) : src_(src) {}

    // path := segment ("." segment)*, surrounded by optional whitespace
    bool parse(TemplateResolver::Path& out) {
        skip_ws();
        if (!segment(out)) return false;
        while (peek() == '.') {
            ++pos_;
            if (!segment(out)) return false;
        }
        skip_ws();
        return pos_ == src_.size();
    }

private:
    // segment := name ("[" digits "]")*
    bool segment(TemplateResolver::Path& out) {
        std::string name;
        while (pos_ < src_.size() && is_name_char(src_[pos_])) {
            name.push_back(src_[pos_++]);
        }
        if (name.empty()) return false;
        out.push_back({name});

        while (peek() == '[') {
            ++pos_;
            size_t start = pos_;
            while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) ++pos_;
            if (pos_ == start || peek() != ']') return false;
            size_t index = 0;
            auto parsed = std::from_chars(src_.data() + start, src_.data() + pos_, index);
            if (parsed.ec == std::errc::result_out_of_range) {
                // No array is that long, so the lookup misses
                index = std::numeric_limits<size_t>::max();
            }
            out.push_back({index});
            ++pos_;
        }
        return true;
    }

    static bool is_name_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '$';
    }

    char peek() const { return pos_ < src_.size() ? src_[pos_] : '\0'; }

    void skip_ws() {
        while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) ++pos_;
    }

    std::string_view src_;
    size_t pos_ = 0;
};

void append_literal(std::vector<TemplateResolver::Segment>& out, std::string_view text) {
    if (text.empty()) return;
    if (!out.empty() && !out.back().is_expression) {
        out.back().text.append(text);
    } else {
        out.push_back({false, std::string(text), {}});
    }
}

} // namespace

std::vector<TemplateResolver::Segment> TemplateResolver::parse(std::string_view text) {
    std::vector<Segment> segments;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find("{{", pos);
        if (open == std::string_view::npos) {
            append_literal(segments, text.substr(pos));
            break;
        }
        append_literal(segments, text.substr(pos, open - pos));

        size_t close = text.find("}}", open + 2);
        if (close == std::string_view::npos) {
            // Unterminated: the remainder is literal
            append_literal(segments, text.substr(open));
            break;
        }

        std::string_view source = text.substr(open + 2, close - open - 2);
        Path path;
        if (PathParser(source).parse(path)) {
            segments.push_back({true, std::string(source), std::move(path)});
        } else {
            append_literal(segments, text.substr(open, close + 2 - open));
        }
        pos = close + 2;
    }
    return segments;
}

bool TemplateResolver::contains_expression(std::string_view text) {
    if (text.find("{{") == std::string_view::npos) return false;
    for (const auto& seg : parse(text)) {
        if (seg.is_expression) return true;
    }
    return false;
}

const Value* TemplateResolver::lookup(const Value& context, const Path& path) {
    const Value* current = &context;
    for (const auto& step : path) {
        if (const auto* key = std::get_if<std::string>(&step.key)) {
            if (!current->is_object()) return nullptr;
            auto it = current->find(*key);
            if (it == current->end()) return nullptr;
            current = &*it;
        } else {
            size_t index = std::get<size_t>(step.key);
            if (!current->is_array() || index >= current->size()) return nullptr;
            current = &(*current)[index];
        }
    }
    return current;
}

Value TemplateResolver::build_context(const PipelineNode& node, const Value& input_data) {
    return Value{
        {"input", input_data.is_null() ? Value::object() : input_data},
        {"config", node.config},
        {"node", {
            {"id", node.id},
            {"type", node.type},
            {"label", node.label},
            {"status", to_string(node.status)}
        }}
    };
}

Value TemplateResolver::resolve(const Value& tmpl, const PipelineNode& node, const Value& input_data) {
    return resolve_with_context(tmpl, build_context(node, input_data));
}

Value TemplateResolver::resolve_with_context(const Value& tmpl, const Value& context) {
    if (tmpl.is_string()) {
        return resolve_string(tmpl.get_ref<const std::string&>(), context);
    }
    if (tmpl.is_array()) {
        Value out = Value::array();
        for (const auto& item : tmpl) {
            out.push_back(resolve_with_context(item, context));
        }
        return out;
    }
    if (tmpl.is_object()) {
        Value out = Value::object();
        for (auto it = tmpl.begin(); it != tmpl.end(); ++it) {
            out[it.key()] = resolve_with_context(it.value(), context);
        }
        return out;
    }
    return tmpl;
}

Value TemplateResolver::resolve_string(const std::string& text, const Value& context) {
    if (text.find("{{") == std::string::npos) {
        return text;
    }
    auto segments = parse(text);

    // Whole-string expression keeps the JSON type of the value
    if (segments.size() == 1 && segments[0].is_expression) {
        const Value* found = lookup(context, segments[0].path);
        if (found == nullptr || found->is_null()) return "";
        return *found;
    }

    std::string out;
    for (const auto& seg : segments) {
        if (!seg.is_expression) {
            out += seg.text;
            continue;
        }
        const Value* found = lookup(context, seg.path);
        if (found != nullptr) {
            out += value_to_text(*found);
        }
    }
    return out;
}

bool is_reserved_flag(std::string_view key) {
    return key.size() > 4 && key.substr(0, 2) == "__" && key.substr(key.size() - 2) == "__";
}

Value strip_reserved_flags(const Value& obj) {
    if (!obj.is_object()) return obj;
    Value out = Value::object();
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (!is_reserved_flag(it.key())) {
            out[it.key()] = it.value();
        }
    }
    return out;
}

} // namespace pipeflow
