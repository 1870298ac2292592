#include "quire/timestamp.hpp"

#include <cctype>
#include <charconv>
#include <format>

namespace quire {

namespace {

// Reads exactly `width` digits at `pos`.
bool read_fixed(std::string_view text, size_t &pos, size_t width, int &out) {
    if (pos + width > text.size())
        return false;
    for (size_t i = pos; i < pos + width; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i])))
            return false;
    }
    auto res = std::from_chars(text.data() + pos, text.data() + pos + width, out);
    if (res.ec != std::errc())
        return false;
    pos += width;
    return true;
}

bool expect(std::string_view text, size_t &pos, char c) {
    if (pos < text.size() && text[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

} // namespace

Timestamp system_now() {
    return std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

std::string format_iso8601(Timestamp ts) {
    return std::format("{:%FT%T}Z", ts);
}

std::optional<Timestamp> parse_iso8601(std::string_view text) {
    using namespace std::chrono;

    size_t pos = 0;
    int y = 0, mo = 0, d = 0;
    if (!read_fixed(text, pos, 4, y) || !expect(text, pos, '-') || !read_fixed(text, pos, 2, mo) ||
        !expect(text, pos, '-') || !read_fixed(text, pos, 2, d)) {
        return std::nullopt;
    }

    year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok())
        return std::nullopt;

    Timestamp result = sys_days{ymd};
    if (pos == text.size())
        return result;

    if (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ')
        return std::nullopt;
    ++pos;

    int h = 0, mi = 0, s = 0;
    if (!read_fixed(text, pos, 2, h) || !expect(text, pos, ':') || !read_fixed(text, pos, 2, mi))
        return std::nullopt;
    if (expect(text, pos, ':')) {
        if (!read_fixed(text, pos, 2, s))
            return std::nullopt;
    }
    if (h > 23 || mi > 59 || s > 60)
        return std::nullopt;

    milliseconds frac{0};
    if (expect(text, pos, '.')) {
        size_t start = pos;
        int64_t value = 0;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            // Only milliseconds survive; extra precision is truncated.
            if (digits < 3) {
                value = value * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (pos == start)
            return std::nullopt;
        while (digits < 3) {
            value *= 10;
            ++digits;
        }
        frac = milliseconds{value};
    }

    result += hours{h} + minutes{mi} + seconds{s} + frac;

    if (pos == text.size())
        return result;

    if (text[pos] == 'Z' || text[pos] == 'z') {
        ++pos;
    } else if (text[pos] == '+' || text[pos] == '-') {
        const bool negative = text[pos] == '-';
        ++pos;
        int oh = 0, om = 0;
        if (!read_fixed(text, pos, 2, oh))
            return std::nullopt;
        expect(text, pos, ':');
        if (!read_fixed(text, pos, 2, om))
            return std::nullopt;
        auto offset = hours{oh} + minutes{om};
        // Local time minus its offset gives UTC.
        result = negative ? result + offset : result - offset;
    } else {
        return std::nullopt;
    }

    if (pos != text.size())
        return std::nullopt;
    return result;
}

double days_between(Timestamp since, Timestamp now) {
    using days_f = std::chrono::duration<double, std::ratio<86400>>;
    return std::chrono::duration_cast<days_f>(now - since).count();
}

} // namespace quire
