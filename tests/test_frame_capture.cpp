#include "frame_capture.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include <opencv2/imgcodecs.hpp>

#include "fakes.hpp"
#include "logger.hpp"

namespace lapsebot_test {

class FrameCaptureTest : public ::testing::Test {
protected:
    TempDir temp;
    FakeCamera camera;
    RecordingPowerDevice light;
    CameraConfig camera_config;

    void SetUp() override {
        set_log_dir("");
        camera_config.host = "fake";
        camera_config.picture_quality = "png";
        ASSERT_TRUE(create_dir(session_dir()));
    }

    std::string session_dir() const { return temp.path() + "/lapse_capture"; }
};

TEST_F(FrameCaptureTest, FramePathsAreZeroPadded) {
    EXPECT_EQ(FrameCapture::frame_path("/data/lapse", 42, "jpeg"), "/data/lapse/000042.jpeg");
    EXPECT_EQ(FrameCapture::frame_path("/data/lapse", 0, "webp"), "/data/lapse/000000.webp");
}

TEST_F(FrameCaptureTest, CaptureWritesFrame) {
    FrameCapture capture(camera, nullptr, "", camera_config);

    EXPECT_EQ(capture.capture(session_dir(), 0), CaptureResult::Captured);
    EXPECT_EQ(capture.capture(session_dir(), 1), CaptureResult::Captured);

    cv::Mat frame = cv::imread(capture.frame_path(session_dir(), 1));
    ASSERT_FALSE(frame.empty());
    EXPECT_EQ(frame.cols, 16);
    EXPECT_EQ(frame.rows, 12);
    EXPECT_EQ(camera.calls.load(), 2);
}

TEST_F(FrameCaptureTest, CameraFailureWritesNothing) {
    camera.fail = true;
    FrameCapture capture(camera, nullptr, "", camera_config);

    EXPECT_EQ(capture.capture(session_dir(), 0), CaptureResult::CameraError);
    EXPECT_FALSE(file_exists(capture.frame_path(session_dir(), 0)));
    EXPECT_FALSE(capture.busy());
}

TEST_F(FrameCaptureTest, LightIsSwitchedAroundTheGrab) {
    FrameCapture capture(camera, &light, "chamber", camera_config);

    EXPECT_EQ(capture.capture(session_dir(), 0), CaptureResult::Captured);

    auto switches = light.recorded();
    ASSERT_EQ(switches.size(), 2u);
    EXPECT_EQ(switches[0].first, "chamber");
    EXPECT_TRUE(switches[0].second);
    EXPECT_FALSE(switches[1].second);
}

TEST_F(FrameCaptureTest, LightIsSwitchedOffAfterCameraFailure) {
    camera.fail = true;
    FrameCapture capture(camera, &light, "chamber", camera_config);

    EXPECT_EQ(capture.capture(session_dir(), 0), CaptureResult::CameraError);
    auto switches = light.recorded();
    ASSERT_EQ(switches.size(), 2u);
    EXPECT_FALSE(switches[1].second);
}

TEST_F(FrameCaptureTest, ThrowingCameraIsReportedAndRecovers) {
    camera.throw_error = true;
    FrameCapture capture(camera, &light, "chamber", camera_config);

    std::atomic<int> result{-1};
    ASSERT_TRUE(capture.capture_async(session_dir(), 0, [&result](CaptureResult r) {
        result = static_cast<int>(r);
    }));
    capture.wait_idle();

    EXPECT_EQ(result.load(), static_cast<int>(CaptureResult::CameraError));
    EXPECT_FALSE(capture.busy());
    auto switches = light.recorded();
    ASSERT_EQ(switches.size(), 2u);
    EXPECT_FALSE(switches[1].second);

    camera.throw_error = false;
    ASSERT_TRUE(capture.capture_async(session_dir(), 1, [&result](CaptureResult r) {
        result = static_cast<int>(r);
    }));
    capture.wait_idle();
    EXPECT_EQ(result.load(), static_cast<int>(CaptureResult::Captured));
    EXPECT_EQ(camera.calls.load(), 2);

    camera.throw_error = true;
    EXPECT_FALSE(capture.snapshot(temp.path() + "/notification.png"));
}

TEST_F(FrameCaptureTest, MissingSessionDirectoryIsNotRecreated) {
    FrameCapture capture(camera, nullptr, "", camera_config);
    std::string gone = temp.path() + "/lapse_cleared";

    EXPECT_EQ(capture.capture(gone, 0), CaptureResult::WriteError);
    EXPECT_FALSE(dir_exists(gone));
    EXPECT_FALSE(capture.busy());
}

TEST_F(FrameCaptureTest, NoLightDeviceMeansNoSettleDelay) {
    camera_config.light_control_timeout = 30;
    FrameCapture capture(camera, nullptr, "", camera_config);

    auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(capture.capture(session_dir(), 0), CaptureResult::Captured);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
    EXPECT_TRUE(light.recorded().empty());
}

TEST_F(FrameCaptureTest, SecondRequestWhileInFlightIsDropped) {
    FrameCapture capture(camera, nullptr, "", camera_config);
    camera.gate.close();

    std::atomic<int> completed{0};
    ASSERT_TRUE(capture.capture_async(session_dir(), 0, [&completed](CaptureResult) { completed++; }));
    camera.gate.wait_entered();

    EXPECT_TRUE(capture.busy());
    EXPECT_FALSE(capture.capture_async(session_dir(), 1, [&completed](CaptureResult) { completed++; }));
    EXPECT_EQ(capture.capture(session_dir(), 1), CaptureResult::Dropped);

    camera.gate.open();
    capture.wait_idle();

    EXPECT_EQ(completed.load(), 1);
    EXPECT_EQ(camera.calls.load(), 1);
    EXPECT_TRUE(file_exists(capture.frame_path(session_dir(), 0)));
    EXPECT_FALSE(file_exists(capture.frame_path(session_dir(), 1)));
    EXPECT_FALSE(capture.busy());
}

TEST_F(FrameCaptureTest, CancelDuringSettleSkipsTheGrab) {
    camera_config.light_control_timeout = 30;
    FrameCapture capture(camera, &light, "chamber", camera_config);

    std::atomic<int> result{-1};
    ASSERT_TRUE(capture.capture_async(session_dir(), 0, [&result](CaptureResult r) {
        result = static_cast<int>(r);
    }));

    // Wait for the light to come on, then abort the settle wait
    for (int i = 0; i < 200 && light.recorded().empty(); i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    auto started = std::chrono::steady_clock::now();
    capture.cancel();
    capture.wait_idle();

    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
    EXPECT_EQ(result.load(), static_cast<int>(CaptureResult::Cancelled));
    EXPECT_EQ(camera.calls.load(), 0);
    EXPECT_FALSE(file_exists(capture.frame_path(session_dir(), 0)));

    auto switches = light.recorded();
    ASSERT_EQ(switches.size(), 2u);
    EXPECT_FALSE(switches[1].second);
}

TEST_F(FrameCaptureTest, SnapshotIsNotAffectedByEarlierCancel) {
    FrameCapture capture(camera, nullptr, "", camera_config);
    capture.cancel();

    ASSERT_TRUE(create_dir(temp.path()));
    std::string path = temp.path() + "/notification.png";
    EXPECT_TRUE(capture.snapshot(path));
    EXPECT_TRUE(file_exists(path));
}

TEST_F(FrameCaptureTest, TransformRotatesAndFlips) {
    cv::Mat frame(2, 3, CV_8UC1, cv::Scalar(0));
    frame.at<unsigned char>(0, 0) = 255;

    cv::Mat rotated = frame.clone();
    apply_transform(rotated, Rotation::Clockwise90, Flip::None);
    EXPECT_EQ(rotated.rows, 3);
    EXPECT_EQ(rotated.cols, 2);
    EXPECT_EQ(rotated.at<unsigned char>(0, 1), 255);

    cv::Mat flipped = frame.clone();
    apply_transform(flipped, Rotation::None, Flip::Horizontal);
    EXPECT_EQ(flipped.at<unsigned char>(0, 2), 255);

    CameraConfig config;
    config.rotate = "90_ccw";
    config.flip_vertically = true;
    EXPECT_EQ(rotation_from_config(config), Rotation::CounterClockwise90);
    EXPECT_EQ(flip_from_config(config), Flip::Vertical);
}

}  // namespace lapsebot_test
