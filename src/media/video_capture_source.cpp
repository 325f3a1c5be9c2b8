/**
 * @file    video_capture_source.cpp
 * @brief   OpenCV VideoCapture frame source
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "media/video_capture_source.hpp"
#include "utils/path_formatter.hpp"

namespace wms {

VideoCaptureSource::VideoCaptureSource(const std::filesystem::path& media)
    : capture_(to_utf8(media)) {}

VideoCaptureSource::~VideoCaptureSource() {
    capture_.release();
}

bool VideoCaptureSource::seek(double offset) {
    return capture_.set(cv::CAP_PROP_POS_MSEC, offset * 1000.0);
}

bool VideoCaptureSource::read(cv::Mat& frame) {
    return capture_.read(frame) && !frame.empty();
}

std::unique_ptr<FrameSource> VideoCaptureSourceFactory::open(const std::filesystem::path& media) {
    auto source = std::make_unique<VideoCaptureSource>(media);
    if (!source->is_open()) {
        return nullptr;
    }
    return source;
}

}  // namespace wms
