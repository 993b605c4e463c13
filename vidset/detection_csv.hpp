#ifndef VIDSET_DETECTION_CSV_HPP
#define VIDSET_DETECTION_CSV_HPP

#include "vidset/common.hpp"
#include "vidset/detection.hpp"

#include <istream>
#include <stdexcept>
#include <vector>

/// \file
/// Reader for detection tables in CSV format.

namespace vidset {

class parse_error : public std::runtime_error {
public:
    using runtime_error::runtime_error;
};

/// Reads a table of per-frame detections.
///
/// The first line is the header. Recognized columns:
///
///     frame | frame_id        Frame index (integer, required).
///     video                   Video id (unsigned integer, defaults to 0).
///     <category>_score        Confidence of the detector for <category>.
///     <category>_class        "True" if <category> was detected in that frame.
///     <category>_x1, _x2,     Optional box of the detection. Defaults to
///     <category>_y1, _y2      the whole (normalized) frame [0, 1) x [0, 1).
///
/// Every category that has both a score and a class column produces one
/// object per row. Other columns are ignored and empty lines are skipped.
///
/// \throws parse_error if the input is malformed.
std::vector<frame_record> read_detection_csv(std::istream& in);

} // namespace vidset

#endif // VIDSET_DETECTION_CSV_HPP
