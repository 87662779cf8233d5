#include "trigger.hpp"

#include <gtest/gtest.h>

#include <vector>

#include "fakes.hpp"

namespace lapsebot_test {

class TriggerAccumulatorTest : public ::testing::Test {
protected:
    std::vector<double> fired_at(TriggerAccumulator& trigger, const std::vector<TelemetrySample>& samples) {
        std::vector<double> values;
        for (const auto& sample : samples) {
            if (trigger.observe(sample)) {
                values.push_back(sample.height_mm);
            }
        }
        return values;
    }
};

TEST_F(TriggerAccumulatorTest, EachHeightCrossingFiresOnce) {
    TriggerAccumulator trigger(TriggerSpec{TriggerKind::Height, 1.0, 0.0});

    std::vector<TelemetrySample> samples;
    for (int i = 1; i <= 50; i++) {
        samples.push_back(make_sample(i * 0.1, 0, i));
    }

    std::vector<double> fired = fired_at(trigger, samples);
    ASSERT_EQ(fired.size(), 5u);
    EXPECT_NEAR(fired[0], 1.0, 1e-9);
    EXPECT_NEAR(fired[4], 5.0, 1e-9);
}

TEST_F(TriggerAccumulatorTest, LayerHeightsAreNotLostToRounding) {
    TriggerAccumulator trigger(TriggerSpec{TriggerKind::Height, 0.2, 0.0});

    // Accumulated the way a printer reports z, errors included
    double z = 0.0;
    int fired = 0;
    for (int i = 0; i < 10; i++) {
        z += 0.2;
        if (trigger.observe(make_sample(z, 0, i + 1))) {
            fired++;
        }
    }
    EXPECT_EQ(fired, 10);
}

TEST_F(TriggerAccumulatorTest, JumpOverSeveralIntervalsFiresOnce) {
    TriggerAccumulator trigger(TriggerSpec{TriggerKind::Percent, 10.0, 0.0});

    EXPECT_TRUE(trigger.observe(make_sample(0, 35, 1)));
    EXPECT_FALSE(trigger.observe(make_sample(0, 38, 2)));
    EXPECT_TRUE(trigger.observe(make_sample(0, 40, 3)));
    EXPECT_DOUBLE_EQ(trigger.current_spec().last_fired_value, 40.0);
}

TEST_F(TriggerAccumulatorTest, ZeroIntervalNeverFires) {
    TriggerAccumulator trigger(TriggerSpec{TriggerKind::Height, 0.0, 0.0});

    EXPECT_FALSE(trigger.enabled());
    for (int i = 1; i <= 20; i++) {
        EXPECT_FALSE(trigger.observe(make_sample(i, i, i)));
    }
}

TEST_F(TriggerAccumulatorTest, TimeKeepsCountingWhilePaused) {
    TriggerAccumulator running(TriggerSpec{TriggerKind::Time, 60.0, 0.0});
    TriggerAccumulator toggling(TriggerSpec{TriggerKind::Time, 60.0, 0.0});

    int fired_running = 0;
    int fired_toggling = 0;
    for (int t = 10; t <= 600; t += 10) {
        JobState state = (t > 200 && t < 400) ? JobState::Paused : JobState::Printing;
        if (running.observe(make_sample(1, 10, t))) {
            fired_running++;
        }
        if (toggling.observe(make_sample(1, 10, t, state))) {
            fired_toggling++;
        }
    }
    EXPECT_EQ(fired_running, 10);
    EXPECT_EQ(fired_toggling, fired_running);
}

TEST_F(TriggerAccumulatorTest, OverrideDoesNotFireRetroactively) {
    TriggerAccumulator trigger(TriggerSpec{TriggerKind::Height, 1.0, 0.0});

    EXPECT_TRUE(trigger.observe(make_sample(5.5, 0, 1)));

    trigger.override_interval(2.0, make_sample(5.5, 0, 1));
    EXPECT_DOUBLE_EQ(trigger.current_spec().interval, 2.0);
    EXPECT_DOUBLE_EQ(trigger.current_spec().last_fired_value, 5.5);

    EXPECT_FALSE(trigger.observe(make_sample(5.6, 0, 2)));
    EXPECT_FALSE(trigger.observe(make_sample(5.9, 0, 3)));
    EXPECT_TRUE(trigger.observe(make_sample(6.0, 0, 4)));
}

TEST_F(TriggerAccumulatorTest, OverrideToZeroDisables) {
    TriggerAccumulator trigger(TriggerSpec{TriggerKind::Percent, 10.0, 0.0});
    trigger.override_interval(0.0, make_sample(0, 15, 1));

    EXPECT_FALSE(trigger.enabled());
    EXPECT_FALSE(trigger.observe(make_sample(0, 90, 2)));
}

TEST_F(TriggerAccumulatorTest, HeightDropRebasesWithoutFiring) {
    TriggerAccumulator trigger(TriggerSpec{TriggerKind::Height, 1.0, 0.0});

    EXPECT_TRUE(trigger.observe(make_sample(10.0, 0, 1)));
    // Next job starts from the bed again
    EXPECT_FALSE(trigger.observe(make_sample(0.4, 0, 2)));
    EXPECT_FALSE(trigger.observe(make_sample(0.8, 0, 3)));
    EXPECT_TRUE(trigger.observe(make_sample(1.0, 0, 4)));
}

TEST_F(TriggerAccumulatorTest, ResetStartsFromZero) {
    TriggerAccumulator trigger(TriggerSpec{TriggerKind::Percent, 25.0, 0.0});
    EXPECT_TRUE(trigger.observe(make_sample(0, 60, 1)));

    trigger.reset();
    EXPECT_DOUBLE_EQ(trigger.current_spec().last_fired_value, 0.0);
    EXPECT_TRUE(trigger.observe(make_sample(0, 30, 2)));
}

}  // namespace lapsebot_test
