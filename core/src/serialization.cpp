#include "mcpforge/serialization.h"
#include "mcpforge/json_mini.h"

#include <sstream>

namespace mcpforge {

// --- JSON helpers ---

std::string json_quote(const std::string& s) {
    json_object* o = json_object_new_string_len(s.c_str(), (int)s.size());
    if (!o) return "\"\"";
    std::string out = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN);
    json_object_put(o);
    return out;
}

bool json_get_string(json_object* o, const char* k, std::string* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_string)) return false;
    *out = json_object_get_string(v);
    return true;
}

// --- Tool descriptors ---

bool tool_descriptor_from_json(json_object* o, ToolDescriptor* out) {
    if (!json_mini::is_object(o) || !out) return false;
    ToolDescriptor d;
    if (!json_get_string(o, "name", &d.name) || d.name.empty()) return false;
    (void)json_get_string(o, "description", &d.description);
    if (auto schema = json_mini::get_raw(o, "inputSchema")) d.input_schema_json = *schema;
    d.raw_json = json_mini::dump(o);
    *out = std::move(d);
    return true;
}

std::string tool_list_to_json(const std::vector<ToolDescriptor>& tools) {
    std::ostringstream oss;
    oss << "{\"tools\":[";
    for (size_t i = 0; i < tools.size(); i++) {
        if (i) oss << ",";
        oss << tools[i].raw_json;
    }
    oss << "]}";
    return oss.str();
}

// --- Dependency manifests ---

DependencyManifest manifest_from_json(json_object* o) {
    DependencyManifest m;
    if (!json_mini::is_object(o)) return m;
    json_object_object_foreach(o, key, val) {
        if (val && json_object_is_type(val, json_type_string)) {
            m[key] = json_object_get_string(val);
        }
    }
    return m;
}

// --- Upstream envelopes ---

json_object* text_content_result(const std::string& text) {
    json_object* item = json_object_new_object();
    json_object_object_add(item, "type", json_object_new_string("text"));
    json_object_object_add(item, "text", json_object_new_string_len(text.c_str(), (int)text.size()));

    json_object* content = json_object_new_array();
    json_object_array_add(content, item);

    json_object* res = json_object_new_object();
    json_object_object_add(res, "content", content);
    return res;
}

std::string error_payload(const std::string& message) {
    return "{\"error\":" + json_quote(message) + "}";
}

} // namespace mcpforge
