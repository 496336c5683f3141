#include <gtest/gtest.h>

#include "domain_throttle.hpp"

using namespace linkwatch;
using std::chrono::milliseconds;

static ThrottleSettings DefaultSettings() {
	ThrottleSettings settings;
	settings.default_crawl_delay = 2.0;
	settings.min_crawl_delay = 0.0;
	settings.max_crawl_delay = 60.0;
	settings.max_retry_backoff_seconds = 600;
	return settings;
}

TEST(DomainThrottleTest, SuccessiveSlots) {
	DomainThrottle throttle(DefaultSettings());
	auto &state = throttle.GetOrCreate("example.com");
	EXPECT_DOUBLE_EQ(2.0, state.crawl_delay_seconds);

	auto now = std::chrono::steady_clock::now();
	EXPECT_EQ(milliseconds(0), throttle.ReserveSlot(state, now));
	EXPECT_EQ(milliseconds(2000), throttle.ReserveSlot(state, now));
	EXPECT_EQ(milliseconds(4000), throttle.ReserveSlot(state, now));

	// other domains are independent
	auto &other = throttle.GetOrCreate("other.com");
	EXPECT_EQ(milliseconds(0), throttle.ReserveSlot(other, now));
	EXPECT_EQ(&state, &throttle.GetOrCreate("example.com"));
	EXPECT_EQ(2u, throttle.DomainCount());
}

TEST(DomainThrottleTest, SlotAfterDelayIsImmediate) {
	DomainThrottle throttle(DefaultSettings());
	auto &state = throttle.GetOrCreate("example.com");
	auto now = std::chrono::steady_clock::now();
	EXPECT_EQ(milliseconds(0), throttle.ReserveSlot(state, now));
	EXPECT_EQ(milliseconds(0), throttle.ReserveSlot(state, now + milliseconds(2500)));
}

TEST(DomainThrottleTest, RobotsDelayIsClamped) {
	ThrottleSettings settings = DefaultSettings();
	settings.min_crawl_delay = 1.0;
	settings.max_crawl_delay = 5.0;
	DomainThrottle throttle(settings);
	auto &state = throttle.GetOrCreate("example.com");
	EXPECT_TRUE(throttle.NeedsRobots(state));

	RobotsRules rules;
	rules.crawl_delay = 30.0;
	rules.rules.push_back({"/private", false});
	throttle.ApplyRobots(state, &rules);
	EXPECT_FALSE(throttle.NeedsRobots(state));
	EXPECT_DOUBLE_EQ(5.0, state.crawl_delay_seconds);
	EXPECT_FALSE(throttle.IsAllowed(state, "/private/x"));
	EXPECT_TRUE(throttle.IsAllowed(state, "/public"));

	// first install wins
	throttle.ApplyRobots(state, nullptr);
	EXPECT_FALSE(throttle.IsAllowed(state, "/private/x"));
}

TEST(DomainThrottleTest, MissingRobotsAllowsEverything) {
	DomainThrottle throttle(DefaultSettings());
	auto &state = throttle.GetOrCreate("example.com");
	throttle.ApplyRobots(state, nullptr);
	EXPECT_FALSE(throttle.NeedsRobots(state));
	EXPECT_TRUE(throttle.IsAllowed(state, "/anything"));
	EXPECT_DOUBLE_EQ(2.0, state.crawl_delay_seconds);
}

TEST(DomainThrottleTest, RateLimitBlocksDomain) {
	DomainThrottle throttle(DefaultSettings());
	auto &state = throttle.GetOrCreate("example.com");
	auto now = std::chrono::steady_clock::now();

	EXPECT_EQ(milliseconds(0), throttle.BlockedFor(state, now));
	EXPECT_EQ(milliseconds(3000), throttle.RecordThrottled(state, 0, now));
	EXPECT_EQ(milliseconds(6000), throttle.RecordThrottled(state, 0, now));
	EXPECT_EQ(milliseconds(6000), throttle.BlockedFor(state, now));
	EXPECT_EQ(milliseconds(1000), throttle.BlockedFor(state, now + milliseconds(5000)));

	throttle.RecordSuccess(state, 100.0, now);
	EXPECT_EQ(milliseconds(0), throttle.BlockedFor(state, now));
	EXPECT_EQ(0, state.consecutive_429s);
}

TEST(DomainThrottleTest, RetryAfterIsCapped) {
	DomainThrottle throttle(DefaultSettings());
	auto &state = throttle.GetOrCreate("example.com");
	auto now = std::chrono::steady_clock::now();
	EXPECT_EQ(milliseconds(120000), throttle.RecordThrottled(state, 120000, now));
	EXPECT_EQ(milliseconds(600000), throttle.RecordThrottled(state, 1000000000, now));
}

TEST(DomainThrottleTest, AdaptiveDelay) {
	DomainState state;
	state.crawl_delay_seconds = 2.0;
	state.min_crawl_delay_seconds = 2.0;

	UpdateAdaptiveDelay(state, 100.0, 60.0);
	UpdateAdaptiveDelay(state, 100.0, 60.0);
	EXPECT_DOUBLE_EQ(2.0, state.crawl_delay_seconds);

	// a slow response after warm-up backs off
	UpdateAdaptiveDelay(state, 1000.0, 60.0);
	EXPECT_DOUBLE_EQ(3.0, state.crawl_delay_seconds);

	// fast responses never go below the floor
	for (int i = 0; i < 20; i++) {
		UpdateAdaptiveDelay(state, 1.0, 60.0);
	}
	EXPECT_GE(state.crawl_delay_seconds, 2.0);
}
