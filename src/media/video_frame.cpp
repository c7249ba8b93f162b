#include <railtriage/media/video_frame.hpp>
#include "cv_image_utils.hpp"
#include <opencv2/videoio.hpp>

namespace railtriage::media {

std::optional<std::vector<std::byte>> first_frame_png(const std::string& video_ref) {
  if (video_ref.empty()) return std::nullopt;

  cv::Mat frame;
  try {
    cv::VideoCapture cap(video_ref);
    if (!cap.isOpened()) return std::nullopt;
    const bool ok = cap.read(frame);
    cap.release();
    if (!ok || frame.empty()) return std::nullopt;
  } catch (const cv::Exception&) {
    return std::nullopt;
  }

  auto png = detail::encode_png(frame);
  if (png.empty()) return std::nullopt;
  return png;
}

}  // namespace railtriage::media
