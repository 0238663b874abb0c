#include "csv_reader.hpp"
#include <algorithm>
#include <cctype>

namespace retirecalc {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter), line_number_(0) {}

std::vector<std::string> CsvReader::read_row() {
    std::string line;
    while (std::getline(is_, line)) {
        ++line_number_;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        std::string stripped = trim(line);
        if (!stripped.empty() && stripped[0] == '#') {
            continue;
        }
        return split(line);
    }
    return {};
}

bool CsvReader::has_more() {
    // Skip blank and comment lines so callers never see an empty trailing row
    while (is_.good()) {
        int c = is_.peek();
        if (c == EOF) {
            return false;
        }
        if (c == '\n' || c == '\r') {
            is_.get();
            if (c == '\n') ++line_number_;
            continue;
        }
        if (c == '#') {
            std::string discard;
            std::getline(is_, discard);
            ++line_number_;
            continue;
        }
        return true;
    }
    return false;
}

std::vector<std::string> CsvReader::split(const std::string& line) const {
    std::vector<std::string> row;
    std::string cell;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '"') {
            if (quoted && i + 1 < line.size() && line[i + 1] == '"') {
                cell.push_back('"');
                ++i;
            } else {
                quoted = !quoted;
            }
        } else if (c == delimiter_ && !quoted) {
            row.push_back(trim(cell));
            cell.clear();
        } else {
            cell.push_back(c);
        }
    }
    row.push_back(trim(cell));
    return row;
}

std::string CsvReader::trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

} // namespace retirecalc
