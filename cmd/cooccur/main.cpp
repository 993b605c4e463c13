#include "common/common.hpp"
#include "vidset/detection.hpp"
#include "vidset/detection_csv.hpp"
#include "vidset/interval_set_mapping.hpp"
#include "vidset/predicates.hpp"

#include <boost/program_options.hpp>
#include <fmt/ostream.h>
#include <tpie/progress_indicator_arrow.h>

#include <chrono>
#include <fstream>
#include <functional>
#include <iostream>
#include <string>

using namespace vidset;
namespace po = boost::program_options;

using std::cout;
using std::cerr;

using detection_interval = interval<detection>;
using predicate_type = std::function<bool(const detection_interval&, const detection_interval&)>;

static std::string input_path;
static std::string left_category;
static std::string right_category;
static std::string predicate_name;
static double window;
static double min_score;
static double coalesce_epsilon;
static bool coalesce;

void parse_options(int argc, char** argv);

predicate_type get_predicate();

const detection_mapping& get_category(const category_mappings& categories, const std::string& name);

int main(int argc, char** argv) {
    return tpie_main([&]{
        parse_options(argc, argv);

        std::ifstream in(input_path);
        if (!in) {
            fmt::print(cerr, "Failed to open {}.\n", input_path);
            return 1;
        }

        category_mappings categories;
        try {
            categories = build_category_mappings(read_detection_csv(in));
        } catch (const parse_error& e) {
            fmt::print(cerr, "Failed to read {}: {}.\n", input_path, e.what());
            return 1;
        }

        auto keep = [&](const detection_interval& i) {
            return i.get_payload().detected && i.get_payload().score >= min_score;
        };
        const detection_mapping left = get_category(categories, left_category).filter(keep);
        const detection_mapping right = get_category(categories, right_category).filter(keep);

        fmt::print(cout, "{} intervals of category \"{}\", {} intervals of category \"{}\".\n",
                   left.total_size(), left_category, right.total_size(), right_category);

        const predicate_type predicate = get_predicate();

        tpie::progress_indicator_arrow arrow("Join", left.size());
        arrow.set_indicator_length(60);

        const auto start = std::chrono::steady_clock::now();
        const auto result = left.join(right, predicate, span_and_pair(), window, &arrow);
        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;

        fmt::print(cout, "\n"
                         "Time: {:.3f} s\n"
                         "Results: {}\n",
                   elapsed.count(), result.total_size());
        for (const auto& entry : result) {
            fmt::print(cout, "    video {}: {}\n", entry.first, entry.second.size());
        }

        if (coalesce) {
            // Keeps the payload of the first pair of every track.
            const auto tracks = result.coalesce(coalesce_epsilon, [](const auto& first, const auto&) {
                return first;
            });
            fmt::print(cout, "Co-occurrence tracks: {}\n", tracks.total_size());
            for (const auto& entry : tracks) {
                for (const auto& track : entry.second) {
                    fmt::print(cout, "    video {}: frames [{}, {})\n",
                               entry.first, track.get_bounds().t1(), track.get_bounds().t2());
                }
            }
        }
        return 0;
    });
}

void parse_options(int argc, char** argv) {
    po::options_description options("Options");
    options.add_options()
            ("help,h", "Show this message.")
            ("input", po::value(&input_path)->value_name("PATH")->required(),
             "Path to the detection table (CSV).")
            ("left", po::value(&left_category)->value_name("CATEGORY")->default_value("person"),
             "The category on the left side of the join.")
            ("right", po::value(&right_category)->value_name("CATEGORY")->default_value("dog"),
             "The category on the right side of the join.")
            ("predicate", po::value(&predicate_name)->value_name("PRED")->default_value("t-equal"),
             "The join predicate.\n"
             "Possible values are \"t-equal\", \"t-overlaps\" and \"overlaps\".")
            ("window", po::value(&window)->value_name("FRAMES")->default_value(0.0),
             "Maximum distance between the start frames of two partners.")
            ("min-score", po::value(&min_score)->value_name("SCORE")->default_value(0.0),
             "Ignore detections with a lower confidence.")
            ("coalesce", po::value(&coalesce_epsilon)->value_name("FRAMES"),
             "Merge results that are at most FRAMES apart into tracks.");

    po::variables_map vm;
    try {
        po::command_line_parser p(argc, argv);
        p.options(options);
        po::store(p.run(), vm);

        if (vm.count("help")) {
            fmt::print(cerr, "Usage: {} OPTION...\n"
                             "\n"
                             "Finds frames in which objects of two categories appear together.\n"
                             "\n",
                       argv[0]);
            cerr << options;
            throw exit_main(0);
        }

        po::notify(vm);
    } catch (const po::error& e) {
        fmt::print(cerr, "Failed to parse arguments: {}.\n", e.what());
        throw exit_main(1);
    }

    coalesce = vm.count("coalesce") > 0;
    if (window < 0 || (coalesce && coalesce_epsilon < 0)) {
        fmt::print(cerr, "Window and coalesce distance must not be negative.\n");
        throw exit_main(1);
    }
}

predicate_type get_predicate() {
    if (predicate_name == "t-equal") {
        return on_t(equal());
    } else if (predicate_name == "t-overlaps") {
        return on_t(overlaps());
    } else if (predicate_name == "overlaps") {
        return bounds_overlap();
    } else {
        fmt::print(cerr, "Invalid predicate: {}.\n", predicate_name);
        throw exit_main(1);
    }
}

const detection_mapping& get_category(const category_mappings& categories, const std::string& name) {
    auto pos = categories.find(name);
    if (pos == categories.end()) {
        fmt::print(cerr, "No detections of category \"{}\".\n", name);
        throw exit_main(1);
    }
    return pos->second;
}
