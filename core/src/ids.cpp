#include "mcpforge/ids.h"

#include <cstdio>
#include <stdexcept>

#if defined(__linux__)
  #include <sys/random.h>
#endif

namespace mcpforge {

void secure_random_bytes(uint8_t* buf, size_t n) {
    size_t got = 0;
#if defined(__linux__)
    while (got < n) {
        ssize_t r = ::getrandom(buf + got, n - got, 0);
        if (r <= 0) break;
        got += (size_t)r;
    }
    if (got == n) return;
#endif
    FILE* f = std::fopen("/dev/urandom", "rb");
    if (f) {
        size_t rd = std::fread(buf + got, 1, n - got, f);
        std::fclose(f);
        if (got + rd == n) return;
    }
    throw std::runtime_error("secure_random_bytes: cannot obtain random bytes");
}

SessionId new_session_id() {
    uint8_t b[16];
    secure_random_bytes(b, sizeof(b));
    b[6] = (uint8_t)((b[6] & 0x0F) | 0x40);  // version 4
    b[8] = (uint8_t)((b[8] & 0x3F) | 0x80);  // variant 10xx

    static const char* H = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (int i = 0; i < 16; i++) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
        out.push_back(H[(b[i] >> 4) & 0xF]);
        out.push_back(H[b[i] & 0xF]);
    }
    return out;
}

bool looks_like_session_id(const std::string& s) {
    if (s.size() != 36) return false;
    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') return false;
        } else if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    return true;
}

} // namespace mcpforge
