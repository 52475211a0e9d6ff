#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace dw::shell {

enum class Align { Left, Right };

struct Column {
    std::string header;
    Align align = Align::Left;
    std::size_t min = 1;
    std::size_t max = std::numeric_limits<std::size_t>::max();
    bool ellipsize_middle = false;   // clamp long paths as "head...tail"
};

// Fixed-width text table; columns separated by " | ", header underlined.
// The last column is never padded or clamped.
class Table {
public:
    explicit Table(std::vector<Column> cols) : cols_(std::move(cols)) {}

    void add_row(std::vector<std::string> cells);

    [[nodiscard]] std::string render() const;
    [[nodiscard]] bool empty() const { return rows_.empty(); }

    static std::string ellipsize_middle(const std::string& s, std::size_t width);

private:
    std::vector<Column> cols_;
    std::vector<std::vector<std::string>> rows_;

    [[nodiscard]] std::vector<std::size_t> widths() const;
};

}
