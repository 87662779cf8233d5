#include "config.hpp"

#include <gtest/gtest.h>

#include <sstream>

#include "logger.hpp"

namespace lapsebot_test {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { set_log_dir(""); }

    bool parse(const std::string& text, Config& config, std::string& error) {
        std::istringstream input(text);
        return parse_config(input, config, error);
    }
};

TEST_F(ConfigTest, MinimalConfigGetsDefaults) {
    Config config;
    std::string error;
    ASSERT_TRUE(parse("[bot]\nchat_id = 42\n", config, error)) << error;

    EXPECT_EQ(config.bot.chat_id, "42");
    EXPECT_FALSE(config.camera.enabled());
    EXPECT_EQ(config.camera.fourcc, "mp4v");
    EXPECT_EQ(config.camera.image_extension(), "webp");
    EXPECT_FALSE(config.timelapse.enabled);
    EXPECT_EQ(config.timelapse.target_fps, 15);
    EXPECT_EQ(config.timelapse.last_frame_duration, 5);
    EXPECT_TRUE(config.timelapse.cleanup);
    EXPECT_DOUBLE_EQ(config.timelapse.height, 0.0);
    EXPECT_TRUE(config.notification.enabled);
    EXPECT_EQ(config.notification.percent, 0);
    EXPECT_EQ(config.ui.status_message_content.size(), 5u);
}

TEST_F(ConfigTest, ParsesAllSections) {
    const std::string text =
        "# comment\n"
        "[bot]\n"
        "chat_id = 7\n"
        "light_device = chamber\n"
        "[camera]\n"
        "host = 0\n"
        "rotate = 90_cw\n"
        "flip_horizontally = yes\n"
        "picture_quality = low\n"
        "light_control_timeout = 2\n"
        "[timelapse]\n"
        "enabled = true\n"
        "basedir = /tmp/lapses\n"
        "height = 0.2\n"
        "time = 30\n"
        "target_fps = 25\n"
        "min_lapse_duration = 5\n"
        "max_lapse_duration = 60\n"
        "[notification]\n"
        "percent = 10\n"
        "groups = -100, -200\n"
        "group_only = true\n"
        "[ui]\n"
        "silent_progress = on\n"
        "status_message_content = progress, height\n";

    Config config;
    std::string error;
    ASSERT_TRUE(parse(text, config, error)) << error;

    EXPECT_EQ(config.bot.light_device, "chamber");
    EXPECT_TRUE(config.camera.enabled());
    EXPECT_EQ(config.camera.rotate, "90_cw");
    EXPECT_TRUE(config.camera.flip_horizontally);
    EXPECT_EQ(config.camera.image_extension(), "jpeg");
    EXPECT_EQ(config.camera.light_control_timeout, 2);
    EXPECT_TRUE(config.timelapse.enabled);
    EXPECT_EQ(config.timelapse.base_dir, "/tmp/lapses");
    EXPECT_DOUBLE_EQ(config.timelapse.height, 0.2);
    EXPECT_EQ(config.timelapse.interval, 30);
    EXPECT_EQ(config.timelapse.target_fps, 25);
    EXPECT_EQ(config.notification.percent, 10);
    ASSERT_EQ(config.notification.groups.size(), 2u);
    EXPECT_EQ(config.notification.groups[1], "-200");
    EXPECT_TRUE(config.notification.group_only);
    EXPECT_TRUE(config.ui.silent_progress);
    EXPECT_EQ(config.ui.status_message_content.size(), 2u);
}

TEST_F(ConfigTest, RejectsUnknownSection) {
    Config config;
    std::string error;
    EXPECT_FALSE(parse("[bot]\nchat_id = 1\n[printer]\nhost = x\n", config, error));
    EXPECT_NE(error.find("unknown section"), std::string::npos);
}

TEST_F(ConfigTest, RejectsUnknownKey) {
    Config config;
    std::string error;
    EXPECT_FALSE(parse("[bot]\nchat_id = 1\n[timelapse]\nframerate = 30\n", config, error));
    EXPECT_NE(error.find("framerate"), std::string::npos);
}

TEST_F(ConfigTest, RejectsBadValues) {
    Config config;
    std::string error;
    EXPECT_FALSE(parse("[bot]\nchat_id = 1\n[timelapse]\nenabled = maybe\n", config, error));
    EXPECT_FALSE(parse("[bot]\nchat_id = 1\n[timelapse]\nheight = abc\n", config, error));
    EXPECT_FALSE(parse("[bot]\nchat_id = 1\n[timelapse]\ntarget_fps = 0\n", config, error));
    EXPECT_FALSE(parse("[bot]\nchat_id = 1\n[camera]\nrotate = 45\n", config, error));
    EXPECT_FALSE(parse("[bot]\nchat_id = 1\n[ui]\nstatus_message_content = weather\n", config, error));
}

TEST_F(ConfigTest, RejectsNonFiniteAndOutOfRangeNumbers) {
    Config config;
    std::string error;
    EXPECT_FALSE(parse("[bot]\nchat_id = 1\n[timelapse]\nheight = nan\n", config, error));
    EXPECT_FALSE(parse("[bot]\nchat_id = 1\n[notification]\nheight = inf\n", config, error));
    EXPECT_FALSE(parse("[bot]\nchat_id = 1\n[timelapse]\ntime = 4294967306\n", config, error));
    EXPECT_FALSE(parse("[bot]\nchat_id = 1\n[camera]\nhost = 99999999999\n", config, error));
    EXPECT_TRUE(parse("[bot]\nchat_id = 1\n[camera]\nhost = 2\n", config, error)) << error;
}

TEST_F(ConfigTest, NonAsciiValuesAreRejected) {
    Config config;
    std::string error;
    EXPECT_FALSE(parse("[bot]\nchat_id = 1\n[timelapse]\nenabled = tr\xc3\xbc" "e\n", config, error));
    ASSERT_TRUE(parse("[bot]\nchat_id = 1\n[camera]\nhost = /dev/v\xc3\xad" "deo0\n", config, error)) << error;
    EXPECT_FALSE(is_device_index(config.camera.host));
}

TEST_F(ConfigTest, SilentStatusIsNotAKey) {
    Config config;
    std::string error;
    EXPECT_FALSE(parse("[bot]\nchat_id = 1\n[ui]\nsilent_status = true\n", config, error));
    EXPECT_NE(error.find("silent_status"), std::string::npos);
}

TEST_F(ConfigTest, RequiresChatId) {
    Config config;
    std::string error;
    EXPECT_FALSE(parse("[bot]\ndebug = true\n", config, error));
    EXPECT_NE(error.find("chat_id"), std::string::npos);
}

TEST_F(ConfigTest, MissingFileFails) {
    Config config;
    std::string error;
    EXPECT_FALSE(load_config("/nonexistent/lapsebot.conf", config, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(ConfigTest, TimelapseOverrideAppliesAndEchoes) {
    Config initial;
    initial.bot.chat_id = "1";
    ConfigStore store(initial);

    TimelapseConfig applied;
    std::string response;
    ASSERT_TRUE(store.override_timelapse("height=0.4 target_fps=30 manual_mode=true", applied, response));

    EXPECT_DOUBLE_EQ(applied.height, 0.4);
    EXPECT_EQ(applied.target_fps, 30);
    EXPECT_TRUE(applied.manual_mode);
    EXPECT_EQ(store.snapshot().timelapse.target_fps, 30);
    EXPECT_NE(response.find("Changed timelapse params: height=0.4 target_fps=30 manual_mode=true"),
              std::string::npos);
    EXPECT_NE(response.find("Full timelapse config: "), std::string::npos);
}

TEST_F(ConfigTest, MalformedOverrideLeavesConfigUnchanged) {
    Config initial;
    initial.bot.chat_id = "1";
    initial.timelapse.height = 0.2;
    ConfigStore store(initial);

    TimelapseConfig applied;
    std::string response;
    EXPECT_FALSE(store.override_timelapse("target_fps=30 height=abc", applied, response));
    EXPECT_NE(response.find("Timelapse params error"), std::string::npos);
    EXPECT_FALSE(store.override_timelapse("target_fps=30 basedir=/etc", applied, response));
    EXPECT_FALSE(store.override_timelapse("target_fps", applied, response));
    EXPECT_FALSE(store.override_timelapse("target_fps=0", applied, response));
    EXPECT_FALSE(store.override_timelapse("", applied, response));
    EXPECT_FALSE(store.override_timelapse("height=nan", applied, response));
    EXPECT_FALSE(store.override_timelapse("height=inf", applied, response));
    EXPECT_FALSE(store.override_timelapse("time=4294967306", applied, response));

    Config after = store.snapshot();
    EXPECT_EQ(after.timelapse.interval, 0);
    EXPECT_EQ(after.timelapse.target_fps, 15);
    EXPECT_DOUBLE_EQ(after.timelapse.height, 0.2);
}

TEST_F(ConfigTest, NotificationOverrideOnlyTakesIntervals) {
    Config initial;
    initial.bot.chat_id = "1";
    ConfigStore store(initial);

    NotificationConfig applied;
    std::string response;
    ASSERT_TRUE(store.override_notification("percent=5 time=120", applied, response));
    EXPECT_EQ(store.snapshot().notification.percent, 5);
    EXPECT_EQ(store.snapshot().notification.interval, 120);
    EXPECT_NE(response.find("Full notification config: percent=5 height=0 time=120"), std::string::npos);

    EXPECT_FALSE(store.override_notification("photo=false", applied, response));
    EXPECT_FALSE(store.override_notification("percent=-1", applied, response));
    EXPECT_FALSE(store.override_notification("height=inf", applied, response));
    EXPECT_FALSE(store.override_notification("height=-nan", applied, response));
    EXPECT_FALSE(store.override_notification("time=99999999999999999999", applied, response));
    EXPECT_DOUBLE_EQ(store.snapshot().notification.height, 0.0);
    EXPECT_EQ(store.snapshot().notification.percent, 5);
    EXPECT_TRUE(store.snapshot().notification.photo);
}

}  // namespace lapsebot_test
