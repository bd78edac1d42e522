#include "planka/cli/table.hpp"

#include <algorithm>
#include <ostream>

namespace planka::cli {

namespace {

bool is_continuation_byte(unsigned char c) { return (c & 0xC0) == 0x80; }

std::string pad(const std::string& text, size_t width) {
    size_t current = Table::display_width(text);
    return current >= width ? text : text + std::string(width - current, ' ');
}

// Cells are single-line
std::string flatten(std::string text) {
    std::replace(text.begin(), text.end(), '\n', ' ');
    std::replace(text.begin(), text.end(), '\r', ' ');
    std::replace(text.begin(), text.end(), '\t', ' ');
    return text;
}

}  // namespace

Table::Table(std::string title) : title_(std::move(title)) {}

void Table::add_column(const std::string& header, size_t max_width) {
    columns_.push_back({header, max_width});
}

void Table::add_row(std::vector<std::string> cells) {
    cells.resize(columns_.size());
    for (size_t i = 0; i < cells.size(); ++i) {
        cells[i] = flatten(std::move(cells[i]));
        if (columns_[i].max_width > 0) {
            cells[i] = truncate(cells[i], columns_[i].max_width);
        }
    }
    rows_.push_back(std::move(cells));
}

size_t Table::display_width(const std::string& text) {
    return std::count_if(text.begin(), text.end(), [](char c) {
        return !is_continuation_byte(static_cast<unsigned char>(c));
    });
}

std::string Table::truncate(const std::string& text, size_t max_width) {
    if (display_width(text) <= max_width) {
        return text;
    }
    size_t keep = max_width > 3 ? max_width - 3 : 0;

    // Byte offset of the code point at index `keep`
    size_t points = 0;
    size_t offset = 0;
    while (offset < text.size()) {
        if (!is_continuation_byte(static_cast<unsigned char>(text[offset]))) {
            if (points == keep) {
                break;
            }
            ++points;
        }
        ++offset;
    }
    return text.substr(0, offset) + std::string(max_width - keep, '.');
}

void Table::print(std::ostream& os) const {
    std::vector<size_t> widths;
    for (const auto& column : columns_) {
        widths.push_back(display_width(column.header));
    }
    for (const auto& row : rows_) {
        for (size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], display_width(row[i]));
        }
    }

    if (!title_.empty()) {
        os << title_ << "\n";
    }

    auto print_row = [&](const std::vector<std::string>& cells) {
        std::string line;
        for (size_t i = 0; i < cells.size(); ++i) {
            if (i > 0) {
                line += "  ";
            }
            line += i + 1 < cells.size() ? pad(cells[i], widths[i]) : cells[i];
        }
        os << line << "\n";
    };

    std::vector<std::string> headers;
    std::vector<std::string> rules;
    for (size_t i = 0; i < columns_.size(); ++i) {
        headers.push_back(columns_[i].header);
        rules.emplace_back(widths[i], '-');
    }
    print_row(headers);
    print_row(rules);
    for (const auto& row : rows_) {
        print_row(row);
    }
    os.flush();
}

}  // namespace planka::cli
