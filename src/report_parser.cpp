#include "unitpulse/report_parser.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>

namespace unitpulse {

namespace {

std::string_view trim(std::string_view sv) {
    auto start = sv.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string_view::npos) return {};
    auto end = sv.find_last_not_of(" \t\r\n\f\v");
    return sv.substr(start, end - start + 1);
}

bool iequals(std::string_view a, std::string_view b) {
    return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

// Non-blank lines; "\n", "\r\n" and bare "\r" all end a line.
std::vector<std::string_view> content_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find_first_of("\r\n", start);
        if (end == std::string_view::npos) end = text.size();

        auto line = text.substr(start, end - start);
        if (!trim(line).empty()) lines.push_back(line);

        if (end == text.size()) break;
        start = end + ((text[end] == '\r' && end + 1 < text.size() && text[end + 1] == '\n') ? 2 : 1);
    }
    return lines;
}

std::optional<std::int64_t> parse_int(std::string_view cell) {
    if (!cell.empty() && cell.front() == '+') {
        cell.remove_prefix(1);
        if (!cell.empty() && cell.front() == '-') return std::nullopt;
    }

    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(cell.data(), cell.data() + cell.size(), value);
    if (ec != std::errc{} || ptr != cell.data() + cell.size()) return std::nullopt;
    return value;
}

} // namespace

std::vector<std::string> split_tabs(std::string_view line) {
    std::vector<std::string> cols;
    size_t start = 0;
    for (;;) {
        auto tab = line.find('\t', start);
        if (tab == std::string_view::npos) {
            cols.emplace_back(line.substr(start));
            break;
        }
        cols.emplace_back(line.substr(start, tab - start));
        start = tab + 1;
    }
    return cols;
}

std::optional<size_t> find_units_column(const std::vector<std::string>& header) {
    auto exact = std::ranges::find(header, kUnitsColumn);
    if (exact != header.end()) return static_cast<size_t>(exact - header.begin());

    auto loose = std::ranges::find_if(header, [](const std::string& h) {
        return iequals(h, kUnitsColumn);
    });
    if (loose != header.end()) return static_cast<size_t>(loose - header.begin());

    return std::nullopt;
}

std::optional<std::int64_t> parse_units(std::string_view tsv) {
    auto lines = content_lines(tsv);
    if (lines.empty()) return std::nullopt;

    auto units_idx = find_units_column(split_tabs(lines.front()));
    if (!units_idx) return std::nullopt;

    std::int64_t total = 0;
    for (size_t i = 1; i < lines.size(); ++i) {
        auto cols = split_tabs(lines[i]);
        if (cols.size() <= *units_idx) continue;

        auto cell = trim(cols[*units_idx]);
        if (cell.empty()) continue;

        auto value = parse_int(cell);
        if (!value) continue;

        if ((*value > 0 && total > std::numeric_limits<std::int64_t>::max() - *value) ||
            (*value < 0 && total < std::numeric_limits<std::int64_t>::min() - *value)) {
            continue;
        }
        total += *value;
    }

    // Clamped per date: a refund-heavy day never offsets other days.
    return std::max<std::int64_t>(total, 0);
}

} // namespace unitpulse
