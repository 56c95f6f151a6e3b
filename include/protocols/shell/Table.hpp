#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <iterator>
#include <limits>
#include <string>
#include <vector>
#include <fmt/format.h>

namespace mds::shell {

enum class Align { Left, Right };

struct Column {
    std::string header;
    Align align = Align::Left;
    std::size_t min = 1;
    std::size_t max = std::numeric_limits<std::size_t>::max();
    bool shrinkable = false;         // gives up width first when the terminal is narrow
    bool ellipsize_middle = false;   // clamp with "..." in the middle (paths, ids)
};

// Single-line text table for status output.
class Table {
public:
    explicit Table(std::vector<Column> cols, const std::size_t term_width = 0)
        : cols_(std::move(cols)), term_width_(term_width ? term_width : detectWidth()) {}

    void add_row(std::vector<std::string> cells) {
        cells.resize(cols_.size());
        rows_.push_back(std::move(cells));
    }

    [[nodiscard]] std::string render() const {
        if (cols_.empty()) return {};

        const auto width = layout();

        std::string out;
        out.reserve(128 + rows_.size() * 96);

        std::vector<std::string> header;
        header.reserve(cols_.size());
        for (const auto& c : cols_) header.push_back(c.header);
        emitLine(out, header, width);

        out += std::string(PAD_LEFT, ' ');
        for (std::size_t i = 0; i < cols_.size(); ++i) {
            if (i) out += std::string(GAP, ' ');
            out += std::string(width[i], '-');
        }
        out += '\n';

        for (const auto& row : rows_) {
            std::vector<std::string> cells;
            cells.reserve(cols_.size());
            for (std::size_t i = 0; i < cols_.size(); ++i) cells.push_back(clamp(row[i], width[i], cols_[i].ellipsize_middle));
            emitLine(out, cells, width);
        }

        return out;
    }

private:
    static constexpr std::size_t PAD_LEFT = 2;
    static constexpr std::size_t GAP = 2;

    std::vector<Column> cols_;
    std::vector<std::vector<std::string>> rows_;
    std::size_t term_width_;

    static std::size_t detectWidth() {
        if (const char* env = std::getenv("COLUMNS"); env && *env) {
            const long n = std::strtol(env, nullptr, 10);
            if (n > 20) return static_cast<std::size_t>(n);
        }
        return 100;
    }

    [[nodiscard]] std::vector<std::size_t> layout() const {
        std::vector<std::size_t> width(cols_.size(), 0);
        for (std::size_t i = 0; i < cols_.size(); ++i) {
            width[i] = std::max(cols_[i].min, cols_[i].header.size());
            for (const auto& r : rows_) width[i] = std::max(width[i], r[i].size());
            width[i] = std::clamp(width[i], cols_[i].min, std::max(cols_[i].min, cols_[i].max));
        }

        const auto total = [&] {
            std::size_t sum = PAD_LEFT + GAP * (cols_.size() - 1);
            for (const auto w : width) sum += w;
            return sum;
        };

        // shrink the widest shrinkable column one step at a time
        while (total() > term_width_) {
            std::size_t pick = cols_.size();
            for (std::size_t i = 0; i < cols_.size(); ++i)
                if (cols_[i].shrinkable && width[i] > cols_[i].min && (pick == cols_.size() || width[i] > width[pick])) pick = i;
            if (pick == cols_.size()) break;
            --width[pick];
        }

        return width;
    }

    void emitLine(std::string& out, const std::vector<std::string>& cells, const std::vector<std::size_t>& width) const {
        out += std::string(PAD_LEFT, ' ');
        for (std::size_t i = 0; i < cols_.size(); ++i) {
            if (i) out += std::string(GAP, ' ');
            if (cols_[i].align == Align::Left) fmt::format_to(std::back_inserter(out), "{:<{}}", cells[i], width[i]);
            else fmt::format_to(std::back_inserter(out), "{:>{}}", cells[i], width[i]);
        }
        // no trailing padding
        out.erase(out.find_last_not_of(' ') + 1);
        out += '\n';
    }

    static std::string clamp(const std::string& s, const std::size_t width, const bool middle) {
        if (s.size() <= width) return s;
        if (!middle || width <= 3) return s.substr(0, width);
        const std::size_t keep = width - 3;
        const std::size_t left = keep / 2;
        return s.substr(0, left) + "..." + s.substr(s.size() - (keep - left));
    }
};

}
