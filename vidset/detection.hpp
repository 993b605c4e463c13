#ifndef VIDSET_DETECTION_HPP
#define VIDSET_DETECTION_HPP

#include "vidset/common.hpp"
#include "vidset/extent.hpp"
#include "vidset/interval_set.hpp"
#include "vidset/interval_set_mapping.hpp"

#include <map>
#include <ostream>
#include <string>
#include <vector>

/// \file
/// Turns per-frame object detections into interval sets.

namespace vidset {

using video_id = u64;

using frame_index = i64;

/// Payload of a single detection.
struct detection {
    double score = 0;       ///< Confidence of the detector.
    bool detected = false;  ///< True if the detector reported the class.
};

inline bool operator==(const detection& a, const detection& b) {
    return a.score == b.score && a.detected == b.detected;
}

inline bool operator!=(const detection& a, const detection& b) {
    return !(a == b);
}

inline std::ostream& operator<<(std::ostream& o, const detection& d) {
    return o << "{score: " << d.score << ", detected: " << std::boolalpha << d.detected
             << std::noboolalpha << "}";
}

/// One detected object of some category within a frame.
/// The box coordinates are normalized to the frame size.
struct object_detection {
    std::string category;
    spatial_extent x{0, 1};
    spatial_extent y{0, 1};
    detection payload;
};

/// All detections of a single frame of a video.
struct frame_record {
    video_id video = 0;
    frame_index frame = 0;
    std::vector<object_detection> objects;
};

using detection_set = interval_set<detection>;

using detection_mapping = interval_set_mapping<video_id, detection>;

/// Maps a category name (e.g. "person") to the detections of that
/// category, partitioned by video.
using category_mappings = std::map<std::string, detection_mapping>;

/// Builds one mapping per object category from a list of frame records.
///
/// Every object becomes an interval with the time extent
/// `[frame * frame_duration, (frame + 1) * frame_duration)` and the
/// spatial extents of its box. Within a set, intervals appear in record order.
/// Categories and videos without any object do not produce an entry.
///
/// \throws std::invalid_argument if `frame_duration` is not positive.
category_mappings build_category_mappings(const std::vector<frame_record>& records,
                                          time_type frame_duration = 1);

} // namespace vidset

#endif // VIDSET_DETECTION_HPP
