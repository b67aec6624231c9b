/// @file src/core/timestamp.cpp
/// @brief ISO-8601 parsing with mandatory offset, UTC formatting.

#include "gridsent/timestamp.hpp"

#include <fmt/format.h>

#include <cctype>
#include <chrono>

namespace gridsent::core {

using namespace std::chrono;

namespace {

/// Cursor over the input; every reader returns false on mismatch.
struct Cursor {
    std::string_view s;
    std::size_t      pos = 0;

    [[nodiscard]] bool done() const noexcept { return pos >= s.size(); }
    [[nodiscard]] char peek() const noexcept { return done() ? '\0' : s[pos]; }

    bool expect(char c) noexcept {
        if (peek() != c) return false;
        ++pos;
        return true;
    }

    /// Read exactly `n` decimal digits.
    bool digits(std::size_t n, int& out) noexcept {
        if (pos + n > s.size()) return false;
        int v = 0;
        for (std::size_t i = 0; i < n; ++i) {
            const char c = s[pos + i];
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
            v = v * 10 + (c - '0');
        }
        pos += n;
        out = v;
        return true;
    }
};

}  // namespace

// ─── parse_timestamp ──────────────────────────────────────────────────────────

std::optional<Timestamp> parse_timestamp(std::string_view text) noexcept {
    // Trim surrounding whitespace.
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }

    Cursor c{text};
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0;

    if (!c.digits(4, y) || !c.expect('-') ||
        !c.digits(2, mo) || !c.expect('-') ||
        !c.digits(2, d)) {
        return std::nullopt;
    }
    if (!c.expect('T') && !c.expect(' ')) return std::nullopt;
    if (!c.digits(2, h) || !c.expect(':') || !c.digits(2, mi)) return std::nullopt;

    if (c.expect(':')) {
        if (!c.digits(2, sec)) return std::nullopt;
        if (c.expect('.')) {
            // Fractional seconds are below storage resolution; skip them.
            std::size_t frac = 0;
            while (std::isdigit(static_cast<unsigned char>(c.peek()))) {
                ++c.pos;
                ++frac;
            }
            if (frac == 0) return std::nullopt;
        }
    }

    // Offset is mandatory.
    int offset_minutes = 0;
    if (c.expect('Z') || c.expect('z')) {
        offset_minutes = 0;
    } else if (c.peek() == '+' || c.peek() == '-') {
        const int sign = c.peek() == '-' ? -1 : 1;
        ++c.pos;
        int oh = 0, om = 0;
        if (!c.digits(2, oh)) return std::nullopt;
        c.expect(':');
        if (!c.digits(2, om)) return std::nullopt;
        if (oh > 23 || om > 59) return std::nullopt;
        offset_minutes = sign * (oh * 60 + om);
    } else {
        return std::nullopt;
    }
    if (!c.done()) return std::nullopt;

    if (h > 23 || mi > 59 || sec > 60) return std::nullopt;

    const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)},
                             day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) return std::nullopt;

    const sys_seconds local = sys_days{ymd} + hours{h} + minutes{mi} + seconds{sec};
    return local - minutes{offset_minutes};
}

// ─── format_timestamp ─────────────────────────────────────────────────────────

std::string format_timestamp(Timestamp ts) {
    const auto day_point = std::chrono::floor<days>(ts);
    const year_month_day ymd{day_point};
    const hh_mm_ss hms{ts - day_point};

    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()),
                       hms.hours().count(),
                       hms.minutes().count(),
                       hms.seconds().count());
}

// ─── floor_to_hour / make_utc ─────────────────────────────────────────────────

Timestamp floor_to_hour(Timestamp ts) noexcept {
    return std::chrono::floor<hours>(ts);
}

Timestamp make_utc(int y, unsigned mo, unsigned d,
                   int h, int mi, int sec) noexcept {
    const year_month_day ymd{year{y}, month{mo}, day{d}};
    return sys_days{ymd} + hours{h} + minutes{mi} + seconds{sec};
}

} // namespace gridsent::core
