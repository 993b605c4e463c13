#include "vidset/detection.hpp"

#include <fmt/format.h>

#include <cmath>
#include <stdexcept>

namespace vidset {

category_mappings build_category_mappings(const std::vector<frame_record>& records,
                                          time_type frame_duration)
{
    if (!(frame_duration > 0) || std::isinf(frame_duration)) {
        throw std::invalid_argument(fmt::format("invalid frame duration: {}", frame_duration));
    }

    // category -> video -> intervals
    std::map<std::string, std::map<video_id, std::vector<interval<detection>>>> groups;
    for (const frame_record& record : records) {
        const time_type begin = time_type(record.frame) * frame_duration;
        const time_extent t(begin, begin + frame_duration);
        for (const object_detection& object : record.objects) {
            groups[object.category][record.video].emplace_back(
                        bounds(t, object.x, object.y), object.payload);
        }
    }

    category_mappings result;
    for (auto& category : groups) {
        std::map<video_id, detection_set> sets;
        for (auto& video : category.second) {
            sets.emplace(video.first, detection_set(std::move(video.second)));
        }
        result.emplace(category.first, detection_mapping(std::move(sets)));
    }
    return result;
}

} // namespace vidset
