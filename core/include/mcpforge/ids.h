#pragma once
#include "types.h"

#include <cstddef>
#include <cstdint>

namespace mcpforge {

// Fill buf with n bytes from the kernel CSPRNG (getrandom, then /dev/urandom).
// Throws std::runtime_error if neither source is available.
void secure_random_bytes(uint8_t* buf, size_t n);

// Random RFC 4122 version 4 UUID in canonical lowercase 8-4-4-4-12 form.
SessionId new_session_id();

// True for canonical lowercase 8-4-4-4-12 hex text.
bool looks_like_session_id(const std::string& s);

} // namespace mcpforge
