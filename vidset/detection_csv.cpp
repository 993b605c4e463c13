#include "vidset/detection_csv.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/optional.hpp>
#include <boost/spirit/home/x3.hpp>
#include <fmt/format.h>

#include <map>
#include <string>

namespace vidset {

namespace parser {
    namespace x3 = boost::spirit::x3;

    using x3::rule;
    using x3::char_;
    using x3::eol;

    // A row is a list of (possibly empty) cells separated by commas.
    const rule<class cell_tag, std::string> cell = "csv cell";

    const rule<class row_tag, std::vector<std::string>> row = "csv row";

    const auto cell_def = *(char_ - ',' - eol);

    const auto row_def = cell % ',';

    BOOST_SPIRIT_DEFINE(cell, row)

    struct bool_table : x3::symbols<bool> {
        bool_table() {
            add("True", true)
               ("true", true)
               ("1", true)
               ("False", false)
               ("false", false)
               ("0", false);
        }
    };

    const bool_table boolean;
} // namespace parser

namespace {

// Column indices of a single category.
struct category_columns {
    std::string name;
    size_t score;
    size_t cls;
    boost::optional<size_t> x1, x2, y1, y2;
};

struct column_layout {
    size_t size = 0;
    size_t frame = 0;
    boost::optional<size_t> video;
    std::vector<category_columns> categories;
};

std::vector<std::string> split_row(const std::string& line, size_t line_number) {
    namespace x3 = boost::spirit::x3;

    std::vector<std::string> cells;
    auto first = line.begin();
    const auto last = line.end();
    if (!x3::parse(first, last, parser::row, cells) || first != last) {
        throw parse_error(fmt::format("Failed to parse row in line {}", line_number));
    }
    for (std::string& cell : cells) {
        boost::algorithm::trim(cell);
    }
    return cells;
}

// Parses a single cell using the given x3 parser.
template<typename T, typename Parser>
T parse_cell(const std::string& text, const Parser& p, const char* what, size_t line_number) {
    namespace x3 = boost::spirit::x3;

    T value{};
    auto first = text.begin();
    const auto last = text.end();
    if (!x3::parse(first, last, p, value) || first != last) {
        throw parse_error(fmt::format("Expected {} in line {} but found \"{}\"",
                                      what, line_number, text));
    }
    return value;
}

column_layout parse_header(const std::vector<std::string>& header) {
    std::map<std::string, size_t> columns;
    for (size_t i = 0; i < header.size(); ++i) {
        if (!columns.emplace(header[i], i).second) {
            throw parse_error(fmt::format("Duplicate column \"{}\" in header", header[i]));
        }
    }

    auto find = [&](const std::string& name) -> boost::optional<size_t> {
        auto pos = columns.find(name);
        if (pos == columns.end()) {
            return boost::none;
        }
        return pos->second;
    };

    column_layout layout;
    layout.size = header.size();

    if (auto frame = find("frame")) {
        layout.frame = *frame;
    } else if (auto frame_id = find("frame_id")) {
        layout.frame = *frame_id;
    } else {
        throw parse_error("Missing frame column in header");
    }
    layout.video = find("video");

    const std::string score_suffix = "_score";
    for (const std::string& name : header) {
        if (name.size() <= score_suffix.size()
                || !boost::algorithm::ends_with(name, score_suffix)) {
            continue;
        }

        category_columns c;
        c.name = name.substr(0, name.size() - score_suffix.size());
        c.score = columns.at(name);

        auto cls = find(c.name + "_class");
        if (!cls) {
            throw parse_error(fmt::format("Missing column \"{}_class\" in header", c.name));
        }
        c.cls = *cls;

        c.x1 = find(c.name + "_x1");
        c.x2 = find(c.name + "_x2");
        c.y1 = find(c.name + "_y1");
        c.y2 = find(c.name + "_y2");
        const int box_columns = bool(c.x1) + bool(c.x2) + bool(c.y1) + bool(c.y2);
        if (box_columns != 0 && box_columns != 4) {
            throw parse_error(fmt::format("Incomplete box columns for category \"{}\"", c.name));
        }

        layout.categories.push_back(std::move(c));
    }
    return layout;
}

frame_record parse_record(const column_layout& layout, const std::vector<std::string>& cells,
                          size_t line_number)
{
    namespace x3 = boost::spirit::x3;

    if (cells.size() != layout.size) {
        throw parse_error(fmt::format("Expected {} columns in line {} but found {}",
                                      layout.size, line_number, cells.size()));
    }

    auto coordinate = [&](size_t column) {
        return parse_cell<double>(cells[column], x3::double_, "a coordinate", line_number);
    };

    frame_record record;
    record.frame = parse_cell<frame_index>(cells[layout.frame], x3::int64, "a frame index", line_number);
    if (layout.video) {
        record.video = parse_cell<video_id>(cells[*layout.video], x3::uint64, "a video id", line_number);
    }

    for (const category_columns& c : layout.categories) {
        object_detection object;
        object.category = c.name;
        object.payload.score = parse_cell<double>(cells[c.score], x3::double_, "a score", line_number);
        object.payload.detected = parse_cell<bool>(cells[c.cls], parser::boolean, "a boolean", line_number);
        if (c.x1) {
            try {
                object.x = spatial_extent(coordinate(*c.x1), coordinate(*c.x2));
                object.y = spatial_extent(coordinate(*c.y1), coordinate(*c.y2));
            } catch (const invalid_bounds_error& e) {
                throw parse_error(fmt::format("Invalid box in line {}: {}", line_number, e.what()));
            }
        }
        record.objects.push_back(std::move(object));
    }
    return record;
}

} // namespace

std::vector<frame_record> read_detection_csv(std::istream& in) {
    std::vector<frame_record> records;
    boost::optional<column_layout> layout;

    std::string line;
    size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (boost::algorithm::trim_copy(line).empty()) {
            continue;
        }

        std::vector<std::string> cells = split_row(line, line_number);
        if (!layout) {
            layout = parse_header(cells);
        } else {
            records.push_back(parse_record(*layout, cells, line_number));
        }
    }

    if (in.bad()) {
        throw parse_error("Failed to read from input stream");
    }
    if (!layout) {
        throw parse_error("Missing header");
    }
    return records;
}

} // namespace vidset
