#include "scan.hpp"
#include "errors.hpp"
#include <charconv>
#include <system_error>

// ----------------------------------------------------------------------------
// Marker search
// ----------------------------------------------------------------------------

std::vector<size_t> find_all(std::string_view text, std::string_view marker) {
    std::vector<size_t> offsets;
    if (marker.empty()) {
        return offsets;
    }
    size_t pos = text.find(marker);
    while (pos != std::string_view::npos) {
        offsets.push_back(pos);
        pos = text.find(marker, pos + marker.size());
    }
    return offsets;
}

std::vector<size_t> find_line_starts(std::string_view text, std::string_view marker) {
    std::vector<size_t> offsets;
    for (size_t pos : find_all(text, marker)) {
        if (pos == 0 || text[pos - 1] == '\n') {
            offsets.push_back(pos);
        }
    }
    return offsets;
}

std::vector<std::string_view> preceding_slices(std::string_view text, std::string_view marker) {
    std::vector<std::string_view> slices;
    size_t begin = 0;
    for (size_t pos : find_all(text, marker)) {
        slices.push_back(text.substr(begin, pos - begin));
        begin = pos + marker.size();
    }
    return slices;
}

std::vector<std::string_view> following_slices(std::string_view text, std::string_view marker,
                                               bool at_line_start) {
    std::vector<size_t> offsets = at_line_start ? find_line_starts(text, marker) : find_all(text, marker);
    std::vector<std::string_view> slices;
    slices.reserve(offsets.size());
    for (size_t i = 0; i < offsets.size(); ++i) {
        size_t end = (i + 1 < offsets.size()) ? offsets[i + 1] : text.size();
        slices.push_back(text.substr(offsets[i], end - offsets[i]));
    }
    return slices;
}

// ----------------------------------------------------------------------------
// Line navigation
// ----------------------------------------------------------------------------

std::string_view line_at(std::string_view text, size_t pos) {
    if (pos >= text.size()) {
        return std::string_view{};
    }
    size_t begin = (pos == 0) ? std::string_view::npos : text.rfind('\n', pos - 1);
    begin = (begin == std::string_view::npos) ? 0 : begin + 1;
    size_t end = text.find('\n', pos);
    if (end == std::string_view::npos) {
        end = text.size();
    }
    std::string_view line = text.substr(begin, end - begin);
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return line;
}

bool next_line(std::string_view& text, std::string_view& line) {
    if (text.empty()) {
        return false;
    }
    size_t end = text.find('\n');
    if (end == std::string_view::npos) {
        line = text;
        text = std::string_view{};
    } else {
        line = text.substr(0, end);
        text.remove_prefix(end + 1);
    }
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return true;
}

static bool is_ws(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

std::vector<std::string_view> split_ws(std::string_view s) {
    std::vector<std::string_view> tokens;
    size_t i = 0;
    const size_t n = s.size();
    while (i < n) {
        while (i < n && is_ws(s[i])) ++i;
        if (i >= n) break;
        size_t j = i;
        while (j < n && !is_ws(s[j])) ++j;
        tokens.emplace_back(s.substr(i, j - i));
        i = j;
    }
    return tokens;
}

bool is_blank(std::string_view line) {
    for (char c : line) {
        if (!is_ws(c)) return false;
    }
    return true;
}

// ----------------------------------------------------------------------------
// Token conversion
// ----------------------------------------------------------------------------

int to_int(std::string_view token, const std::string& field) {
    if (!token.empty() && token.front() == '+') {
        token.remove_prefix(1);
    }
    int value = 0;
    const char* end = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(token.data(), end, value);
    if (token.empty() || ec != std::errc() || ptr != end) {
        throw ParseError("cannot parse '" + std::string(token) + "' as an integer for " + field);
    }
    return value;
}

double to_double(std::string_view token, const std::string& field) {
    if (!token.empty() && token.front() == '+') {
        token.remove_prefix(1);
    }
    double value = 0.0;
    const char* end = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(token.data(), end, value);
    if (token.empty() || ec != std::errc() || ptr != end) {
        throw ParseError("cannot parse '" + std::string(token) + "' as a number for " + field);
    }
    return value;
}

std::vector<double> to_doubles(std::string_view s, const std::string& field) {
    std::vector<double> values;
    for (std::string_view token : split_ws(s)) {
        values.push_back(to_double(token, field));
    }
    return values;
}

std::string_view value_after(std::string_view text, std::string_view marker, const std::string& field) {
    size_t pos = text.find(marker);
    if (pos == std::string_view::npos) {
        throw FormatError("field not found: " + field + " (marker '" + std::string(marker) + "')");
    }
    std::string_view rest = text.substr(pos + marker.size());
    size_t eol = rest.find('\n');
    if (eol != std::string_view::npos) {
        rest = rest.substr(0, eol);
    }

    std::vector<std::string_view> tokens = split_ws(rest);
    if (tokens.empty()) {
        throw FormatError("no value after marker '" + std::string(marker) + "' for " + field);
    }
    return tokens.front();
}
