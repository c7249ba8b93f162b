#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace railtriage::media {

/// Open `video_ref` (file path or URI understood by OpenCV) and return its first frame
/// encoded as PNG. Returns nullopt if the video cannot be opened or has no frame.
std::optional<std::vector<std::byte>> first_frame_png(const std::string& video_ref);

}  // namespace railtriage::media
