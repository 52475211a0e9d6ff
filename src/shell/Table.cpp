#include "shell/Table.hpp"

#include <algorithm>
#include <iterator>
#include <fmt/format.h>

using namespace dw::shell;

namespace {

constexpr auto SEPARATOR = " | ";

}

void Table::add_row(std::vector<std::string> cells) {
    cells.resize(cols_.size());
    rows_.push_back(std::move(cells));
}

std::vector<std::size_t> Table::widths() const {
    std::vector<std::size_t> width(cols_.size(), 0);
    for (std::size_t i = 0; i < cols_.size(); ++i) width[i] = std::max(cols_[i].min, cols_[i].header.size());
    for (const auto& r : rows_)
        for (std::size_t i = 0; i < cols_.size(); ++i)
            width[i] = std::max(width[i], std::min(cols_[i].max, r[i].size()));
    return width;
}

std::string Table::ellipsize_middle(const std::string& s, const std::size_t width) {
    if (s.size() <= width) return s;
    if (width <= 3) return s.substr(0, width);
    const std::size_t keep = width - 3;
    const std::size_t left = keep / 2;
    return s.substr(0, left) + "..." + s.substr(s.size() - (keep - left));
}

std::string Table::render() const {
    if (cols_.empty()) return {};

    const auto width = widths();
    const auto last = cols_.size() - 1;

    std::string out;
    out.reserve(128 + rows_.size() * 96);

    const auto emit = [&](const std::vector<std::string>& cells) {
        for (std::size_t i = 0; i < cols_.size(); ++i) {
            if (i) out += SEPARATOR;
            auto cell = cells[i];
            if (i == last) {
                out += cell;
                break;
            }
            if (cell.size() > width[i])
                cell = cols_[i].ellipsize_middle ? ellipsize_middle(cell, width[i]) : cell.substr(0, width[i]);
            if (cols_[i].align == Align::Left)
                fmt::format_to(std::back_inserter(out), "{:<{}}", cell, width[i]);
            else
                fmt::format_to(std::back_inserter(out), "{:>{}}", cell, width[i]);
        }
        while (!out.empty() && out.back() == ' ') out.pop_back();
        out += '\n';
    };

    std::vector<std::string> header;
    header.reserve(cols_.size());
    for (const auto& c : cols_) header.push_back(c.header);
    emit(header);

    std::size_t rule = 0;
    for (std::size_t i = 0; i < last; ++i) rule += width[i] + 3;
    rule += std::max<std::size_t>(width[last], 30);
    out += std::string(rule, '-');
    out += '\n';

    for (const auto& r : rows_) emit(r);
    return out;
}
