#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace planka::cli {

/// @brief Plain-text table with a title, a header row and aligned columns.
///
/// Widths are counted in UTF-8 code points. A column with a max width
/// truncates longer cells and marks the cut with "...".
class Table {
public:
    explicit Table(std::string title = "");

    void add_column(const std::string& header, size_t max_width = 0);
    void add_row(std::vector<std::string> cells);

    size_t row_count() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

    void print(std::ostream& os) const;

    static size_t display_width(const std::string& text);
    static std::string truncate(const std::string& text, size_t max_width);

private:
    struct Column {
        std::string header;
        size_t max_width;
    };

    std::string title_;
    std::vector<Column> columns_;
    std::vector<std::vector<std::string>> rows_;
};

}  // namespace planka::cli
