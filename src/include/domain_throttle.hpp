#pragma once

//===--------------------------------------------------------------------===//
// domain_throttle.hpp - Per-domain politeness state
//===--------------------------------------------------------------------===//
// One DomainState per host: robots.txt rules, crawl delay (adaptive), and a
// block window after rate limiting or server errors.

#include "robots_parser.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace linkwatch {

using SteadyTime = std::chrono::steady_clock::time_point;

struct DomainState {
	std::mutex mutex;
	SteadyTime last_crawl_time;
	SteadyTime blocked_until;
	double crawl_delay_seconds = 0.0;
	double min_crawl_delay_seconds = 0.0;
	double average_response_ms = 0.0;
	int response_count = 0;
	int consecutive_429s = 0;  // Consecutive rate-limit / server / network errors
	bool robots_fetched = false;
	bool has_crawl_delay = false;
	RobotsRules rules;
};

// Adaptive rate limiting: adjust delay based on response times
// Uses exponential moving average (EMA) with alpha=0.2
// Caller holds state.mutex.
void UpdateAdaptiveDelay(DomainState &state, double response_ms, double max_delay);

struct ThrottleSettings {
	double default_crawl_delay = 2.0;
	double min_crawl_delay = 0.0;
	double max_crawl_delay = 60.0;
	int max_retry_backoff_seconds = 600;
};

class DomainThrottle {
public:
	explicit DomainThrottle(const ThrottleSettings &settings);

	// Disable copy/move
	DomainThrottle(const DomainThrottle&) = delete;
	DomainThrottle& operator=(const DomainThrottle&) = delete;

	// Stable reference, lives as long as the throttle
	DomainState &GetOrCreate(const std::string &domain);

	// True if robots.txt still has to be fetched for this domain
	bool NeedsRobots(DomainState &state);
	// Install robots rules; nullptr when robots.txt was unavailable (everything allowed)
	void ApplyRobots(DomainState &state, const RobotsRules *rules);
	bool IsAllowed(DomainState &state, const std::string &path);

	// Remaining block window, zero when the domain accepts requests
	std::chrono::milliseconds BlockedFor(DomainState &state, SteadyTime now);

	// Reserve the next request slot. Returns how long the caller must wait
	// before sending; concurrent callers get successive slots.
	std::chrono::milliseconds ReserveSlot(DomainState &state, SteadyTime now);

	void RecordSuccess(DomainState &state, double response_ms, SteadyTime now);

	// 429, 5XX or network error. retry_after_ms > 0 overrides the computed backoff.
	// Returns the block duration applied.
	std::chrono::milliseconds RecordThrottled(DomainState &state, int64_t retry_after_ms, SteadyTime now);

	size_t DomainCount();

private:
	double ClampDelay(double seconds) const;

	ThrottleSettings settings_;
	std::mutex map_mutex_;
	std::unordered_map<std::string, std::unique_ptr<DomainState>> states_;
};

} // namespace linkwatch
