#pragma once

#include <string>
#include <vector>

class VideoEncoder {
public:
    virtual ~VideoEncoder() = default;

    // Writes the frames in order at `fps` into output_path. Repeated paths are written repeatedly.
    virtual bool encode(const std::vector<std::string>& frame_paths, double fps,
                        const std::string& codec, const std::string& output_path) = 0;
};

// cv::VideoWriter backed encoder. The first frame fixes the video size.
class OpenCvVideoEncoder : public VideoEncoder {
public:
    bool encode(const std::vector<std::string>& frame_paths, double fps,
                const std::string& codec, const std::string& output_path) override;
};
