#include "quire/glob.hpp"

#include <format>

namespace quire {

namespace {

// Returns the index one past the closing ']' of the class starting at `open`, or npos.
size_t class_end(std::string_view p, size_t open) {
    size_t i = open + 1;
    if (i < p.size() && (p[i] == '!' || p[i] == '^'))
        ++i;
    // A ']' right after the opening bracket is a literal member.
    if (i < p.size() && p[i] == ']')
        ++i;
    while (i < p.size() && p[i] != ']')
        ++i;
    return i < p.size() ? i + 1 : std::string_view::npos;
}

bool class_matches(std::string_view cls, char c) {
    // cls is the text between '[' and ']'.
    bool negate = false;
    size_t i = 0;
    if (!cls.empty() && (cls[0] == '!' || cls[0] == '^')) {
        negate = true;
        i = 1;
    }
    bool found = false;
    for (; i < cls.size(); ++i) {
        if (i + 2 < cls.size() && cls[i + 1] == '-') {
            if (c >= cls[i] && c <= cls[i + 2])
                found = true;
            i += 2;
        } else if (cls[i] == c) {
            found = true;
        }
    }
    return found != negate;
}

bool match_from(std::string_view p, std::string_view t) {
    size_t pi = 0;
    size_t ti = 0;
    while (pi < p.size()) {
        const char c = p[pi];

        if (c == '*') {
            if (pi + 1 < p.size() && p[pi + 1] == '*') {
                const size_t next = pi + 2;
                if (next < p.size() && p[next] == '/' && match_from(p.substr(next + 1), t.substr(ti)))
                    return true;
                for (size_t k = ti; k <= t.size(); ++k) {
                    if (match_from(p.substr(next), t.substr(k)))
                        return true;
                }
                return false;
            }
            for (size_t k = ti; k <= t.size(); ++k) {
                if (match_from(p.substr(pi + 1), t.substr(k)))
                    return true;
                if (k < t.size() && t[k] == '/')
                    break;
            }
            return false;
        }

        if (ti >= t.size())
            return false;

        if (c == '?') {
            if (t[ti] == '/')
                return false;
        } else if (c == '[') {
            const size_t end = class_end(p, pi);
            if (end == std::string_view::npos) {
                if (t[ti] != '[')
                    return false;
            } else {
                if (t[ti] == '/' || !class_matches(p.substr(pi + 1, end - pi - 2), t[ti]))
                    return false;
                pi = end;
                ++ti;
                continue;
            }
        } else if (c == '\\' && pi + 1 < p.size()) {
            ++pi;
            if (p[pi] != t[ti])
                return false;
        } else if (c != t[ti]) {
            return false;
        }
        ++pi;
        ++ti;
    }
    return ti == t.size();
}

} // namespace

bool glob_match(std::string_view pattern, std::string_view text) {
    return match_from(pattern, text);
}

Result<void> validate_glob(std::string_view pattern) {
    for (size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] == '\\') {
            if (i + 1 >= pattern.size())
                return std::unexpected(std::format("Dangling escape at end of pattern: {}", pattern));
            ++i;
        } else if (pattern[i] == '[') {
            const size_t end = class_end(pattern, i);
            if (end == std::string_view::npos)
                return std::unexpected(std::format("Unterminated character class in pattern: {}", pattern));
            i = end - 1;
        }
    }
    return {};
}

} // namespace quire
