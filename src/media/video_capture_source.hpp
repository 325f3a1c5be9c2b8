/**
 * @file    video_capture_source.hpp
 * @brief   OpenCV VideoCapture frame source
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include "core/frame_sampler.hpp"

#include <opencv2/videoio.hpp>

#include <filesystem>
#include <memory>

namespace wms {

/**
 * Decoder over cv::VideoCapture
 *
 * Seeking is by timestamp (CAP_PROP_POS_MSEC). The capture is released in
 * the destructor, on every exit path of the sampler.
 */
class VideoCaptureSource : public FrameSource {
public:
    explicit VideoCaptureSource(const std::filesystem::path& media);
    ~VideoCaptureSource() override;

    VideoCaptureSource(const VideoCaptureSource&) = delete;
    VideoCaptureSource& operator=(const VideoCaptureSource&) = delete;

    [[nodiscard]] bool is_open() const { return capture_.isOpened(); }

    bool seek(double offset) override;
    bool read(cv::Mat& frame) override;

private:
    cv::VideoCapture capture_;
};

class VideoCaptureSourceFactory : public FrameSourceFactory {
public:
    std::unique_ptr<FrameSource> open(const std::filesystem::path& media) override;
};

}  // namespace wms
