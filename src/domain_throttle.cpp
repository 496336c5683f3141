#include "domain_throttle.hpp"
#include "crawler_utils.hpp"
#include "pipeline_config.hpp"

#include <algorithm>

namespace linkwatch {

// First domain block after a rate limit, doubled per consecutive error
static constexpr int64_t INITIAL_DOMAIN_BLOCK_MS = 3000;

void UpdateAdaptiveDelay(DomainState &state, double response_ms, double max_delay) {
	// Update EMA (alpha=0.2 for smoothing)
	constexpr double alpha = 0.2;
	if (state.response_count == 0) {
		state.average_response_ms = response_ms;
	} else {
		state.average_response_ms = alpha * response_ms + (1.0 - alpha) * state.average_response_ms;
	}
	state.response_count++;

	// Need at least 3 samples before adapting
	if (state.response_count < 3) {
		return;
	}

	// If response is significantly slower than average, increase delay
	if (response_ms > 2.0 * state.average_response_ms) {
		state.crawl_delay_seconds = std::min(state.crawl_delay_seconds * 1.5, max_delay);
	}
	// If response is significantly faster than average, decrease delay (but respect floor)
	else if (response_ms < 0.5 * state.average_response_ms) {
		state.crawl_delay_seconds = std::max(state.crawl_delay_seconds * 0.9, state.min_crawl_delay_seconds);
	}
}

DomainThrottle::DomainThrottle(const ThrottleSettings &settings) : settings_(settings) {
}

double DomainThrottle::ClampDelay(double seconds) const {
	seconds = std::max(seconds, settings_.min_crawl_delay);
	return std::min(seconds, settings_.max_crawl_delay);
}

DomainState &DomainThrottle::GetOrCreate(const std::string &domain) {
	std::lock_guard<std::mutex> lock(map_mutex_);
	auto it = states_.find(domain);
	if (it != states_.end()) {
		return *it->second;
	}
	auto state = std::make_unique<DomainState>();
	state->crawl_delay_seconds = ClampDelay(settings_.default_crawl_delay);
	state->min_crawl_delay_seconds = state->crawl_delay_seconds;
	auto &ref = *state;
	states_.emplace(domain, std::move(state));
	return ref;
}

size_t DomainThrottle::DomainCount() {
	std::lock_guard<std::mutex> lock(map_mutex_);
	return states_.size();
}

bool DomainThrottle::NeedsRobots(DomainState &state) {
	std::lock_guard<std::mutex> lock(state.mutex);
	return !state.robots_fetched;
}

void DomainThrottle::ApplyRobots(DomainState &state, const RobotsRules *rules) {
	std::lock_guard<std::mutex> lock(state.mutex);
	if (state.robots_fetched) {  // Another worker got there first
		return;
	}
	if (rules) {
		state.rules = *rules;
		state.has_crawl_delay = rules->HasCrawlDelay();
		double delay = state.has_crawl_delay ? rules->GetEffectiveDelay() : settings_.default_crawl_delay;
		state.crawl_delay_seconds = ClampDelay(delay);
	} else {
		state.rules = RobotsRules();
		state.has_crawl_delay = false;
		state.crawl_delay_seconds = ClampDelay(settings_.default_crawl_delay);
	}
	state.min_crawl_delay_seconds = state.crawl_delay_seconds;
	state.robots_fetched = true;
}

bool DomainThrottle::IsAllowed(DomainState &state, const std::string &path) {
	std::lock_guard<std::mutex> lock(state.mutex);
	return RobotsParser::IsAllowed(state.rules, path);
}

std::chrono::milliseconds DomainThrottle::BlockedFor(DomainState &state, SteadyTime now) {
	std::lock_guard<std::mutex> lock(state.mutex);
	if (state.blocked_until <= now) {
		return std::chrono::milliseconds(0);
	}
	return std::chrono::duration_cast<std::chrono::milliseconds>(state.blocked_until - now);
}

std::chrono::milliseconds DomainThrottle::ReserveSlot(DomainState &state, SteadyTime now) {
	// Update last_crawl_time while holding the lock so that concurrent
	// workers cannot all see "sufficient delay" and proceed together
	std::lock_guard<std::mutex> lock(state.mutex);
	auto required = std::chrono::milliseconds(static_cast<int64_t>(state.crawl_delay_seconds * 1000));
	if (state.last_crawl_time == SteadyTime() || state.last_crawl_time + required <= now) {
		state.last_crawl_time = now;
		return std::chrono::milliseconds(0);
	}
	auto slot = state.last_crawl_time + required;
	state.last_crawl_time = slot;
	return std::chrono::duration_cast<std::chrono::milliseconds>(slot - now);
}

void DomainThrottle::RecordSuccess(DomainState &state, double response_ms, SteadyTime now) {
	std::lock_guard<std::mutex> lock(state.mutex);
	state.consecutive_429s = 0;
	// Domain is responding normally again
	state.blocked_until = SteadyTime();
	state.last_crawl_time = std::max(state.last_crawl_time, now);
	UpdateAdaptiveDelay(state, response_ms, settings_.max_crawl_delay);
}

std::chrono::milliseconds DomainThrottle::RecordThrottled(DomainState &state, int64_t retry_after_ms,
                                                          SteadyTime now) {
	std::lock_guard<std::mutex> lock(state.mutex);
	state.consecutive_429s++;

	int64_t max_backoff_ms = static_cast<int64_t>(settings_.max_retry_backoff_seconds) * 1000;
	int64_t backoff_ms;
	if (retry_after_ms > 0) {
		backoff_ms = std::min(retry_after_ms, max_backoff_ms);
	} else {
		RetryConfig domain_backoff;
		domain_backoff.initial_backoff_ms = INITIAL_DOMAIN_BLOCK_MS;
		domain_backoff.backoff_multiplier = 2.0;
		domain_backoff.max_backoff_ms = max_backoff_ms;
		backoff_ms = ExponentialBackoffMs(state.consecutive_429s, domain_backoff);
	}

	auto block = std::chrono::milliseconds(backoff_ms);
	state.blocked_until = now + block;
	state.last_crawl_time = std::max(state.last_crawl_time, now);
	return block;
}

} // namespace linkwatch
