#include <gtest/gtest.h>
#include "strategy/signals.hpp"

namespace {
const strategy::Thresholds kT{70.0, 30.0};
}

TEST(Signals, SameLengthAndFirstDayHolds) {
    const auto s = strategy::generate_signals({10.0, 50.0, 90.0}, kT);
    ASSERT_EQ(s.size(), 3u);
    EXPECT_EQ(s[0], Signal::Hold);
}

TEST(Signals, BuyOnUpwardCrossOfOversold) {
    const auto s = strategy::generate_signals({50.0, 0.0, 0.0, 60.0, 50.0}, kT);
    const std::vector<Signal> expected{Signal::Hold, Signal::Hold, Signal::Hold, Signal::Buy, Signal::Hold};
    EXPECT_EQ(s, expected);
}

TEST(Signals, SellOnDownwardCrossOfOverbought) {
    const auto s = strategy::generate_signals({50.0, 80.0, 65.0}, kT);
    EXPECT_EQ(s[1], Signal::Hold);
    EXPECT_EQ(s[2], Signal::Sell);
}

TEST(Signals, LevelAloneDoesNotTrigger) {
    for (auto sig : strategy::generate_signals({20.0, 20.0, 25.0, 10.0}, kT)) EXPECT_EQ(sig, Signal::Hold);
    for (auto sig : strategy::generate_signals({80.0, 85.0, 90.0, 75.0}, kT)) EXPECT_EQ(sig, Signal::Hold);
}

TEST(Signals, UpwardCrossOfOverboughtIsNotABuy) {
    const auto s = strategy::generate_signals({60.0, 75.0}, kT);
    EXPECT_EQ(s[1], Signal::Hold);
}

TEST(Signals, DownwardCrossOfOversoldIsNotASell) {
    const auto s = strategy::generate_signals({40.0, 25.0}, kT);
    EXPECT_EQ(s[1], Signal::Hold);
}

TEST(Signals, BoundaryValues) {
    EXPECT_EQ(strategy::crossing_signal(30.0, 30.5, kT), Signal::Buy);   // tegnap == OS
    EXPECT_EQ(strategy::crossing_signal(29.0, 30.0, kT), Signal::Hold);  // ma == OS
    EXPECT_EQ(strategy::crossing_signal(70.0, 69.5, kT), Signal::Sell);  // tegnap == OB
    EXPECT_EQ(strategy::crossing_signal(71.0, 70.0, kT), Signal::Hold);  // ma == OB
}

TEST(Signals, JumpAcrossBothLinesIsSingleSignal) {
    // 20 -> 80: OS felfelé keresztezve -> BUY
    EXPECT_EQ(strategy::crossing_signal(20.0, 80.0, kT), Signal::Buy);
    // 80 -> 20: OB lefelé keresztezve -> SELL
    EXPECT_EQ(strategy::crossing_signal(80.0, 20.0, kT), Signal::Sell);
}

TEST(Signals, EmptyInput) {
    EXPECT_TRUE(strategy::generate_signals({}, kT).empty());
}
