#pragma once

#include "types.h"

#include <json-c/json.h>

#include <string>
#include <vector>

namespace mcpforge {

// --- JSON helpers (json-c wrappers) ---

std::string json_quote(const std::string& s);

bool json_get_string(json_object* o, const char* k, std::string* out);

// --- Tool descriptors ---

// Parse one descriptor object as sent by a worker. Returns false when it has no name.
bool tool_descriptor_from_json(json_object* o, ToolDescriptor* out);

// {"tools":[<raw descriptor>,...]} in worker order.
std::string tool_list_to_json(const std::vector<ToolDescriptor>& tools);

// --- Dependency manifests ---

// Reads a {"pkg":"constraint",...} object; non-string values are skipped.
DependencyManifest manifest_from_json(json_object* o);

// --- Upstream envelopes ---

// {"content":[{"type":"text","text":<text>}]}
json_object* text_content_result(const std::string& text);

// {"error":<message>}
std::string error_payload(const std::string& message);

} // namespace mcpforge
