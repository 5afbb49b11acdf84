#pragma once

#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>

namespace calibet::core {

// Cross-platform safe getenv wrapper.
// - Windows: uses _dupenv_s and frees the allocated buffer
// - POSIX/others: uses std::getenv (read-only)
// Returns std::nullopt if the variable is not set. If set but empty, returns an
// engaged optional with an empty string.
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || *name == '\0') return std::nullopt;
#if defined(_WIN32)
    char* buf = nullptr;
    size_t len = 0;
    const errno_t err = _dupenv_s(&buf, &len, name);
    if (err != 0 || buf == nullptr) {
        if (buf) std::free(buf);
        return std::nullopt;
    }
    std::string value(buf);
    std::free(buf);
    return value;
#else
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
#endif
}

// Reads an unsigned integer override from the environment. Unset, empty or
// non-numeric values yield std::nullopt so callers keep their struct default.
inline std::optional<std::size_t> getenv_size(const char* name) noexcept {
    auto v = safe_getenv(name);
    if (!v || v->empty()) return std::nullopt;
    std::size_t out = 0;
    const char* beg = v->data();
    const char* end = beg + v->size();
    auto [ptr, ec] = std::from_chars(beg, end, out, 10);
    if (ec != std::errc() || ptr != end) return std::nullopt;
    return out;
}

} // namespace calibet::core
