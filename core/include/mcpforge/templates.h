#pragma once

#include "types.h"

#include <string>

namespace mcpforge {

// Source of the default "echo" worker for a language. The echo tool takes
// {"message": string} and answers "Echo: <message>".
const std::string& echo_template(Language lang);

} // namespace mcpforge
