#pragma once

//===--------------------------------------------------------------------===//
// TestDoubles.hpp - Scripted fetch client and model scorer for unit tests
//===--------------------------------------------------------------------===//

#include "fetch_client.hpp"
#include "model_scorer.hpp"
#include "pipeline_config.hpp"
#include "pipeline_types.hpp"

#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace linkwatch {
namespace test {

// Fixed point in time so tests do not depend on the wall clock
inline Timestamp T0() {
	return FromEpochMs(1736856000000LL);  // 2025-01-14T12:00:00Z
}

inline Timestamp At(int64_t offset_ms) {
	return T0() + Duration(offset_ms);
}

inline PipelineConfig InMemoryConfig() {
	PipelineConfig config;
	config.store.database_path = ":memory:";
	config.workers.worker_threads = 2;
	config.workers.batch_size = 2;
	config.workers.idle_poll_interval_ms = 5;
	config.workers.stats_log_interval_ms = 0;
	config.frontier.retry.max_retries = 3;
	config.frontier.retry.initial_backoff_ms = 0;
	config.frontier.retry.max_backoff_ms = 0;
	return config;
}

inline FetchResult HtmlPage(const std::string &identifier, const std::string &html) {
	FetchResult result;
	result.target = identifier;
	result.timestamp = Clock::now();
	result.outcome = FetchOutcome::SUCCESS;
	result.raw_content = html;
	result.content_type = "text/html; charset=utf-8";
	result.final_url = identifier;
	result.status_code = 200;
	return result;
}

inline FetchResult Failure(const std::string &identifier, FetchOutcome outcome, int status_code,
                           const std::string &error) {
	FetchResult result;
	result.target = identifier;
	result.timestamp = Clock::now();
	result.outcome = outcome;
	result.status_code = status_code;
	result.error = error;
	result.error_type = outcome == FetchOutcome::PERMANENT_FAILURE ? "http_client_error" : "http_server_error";
	return result;
}

// What the fetch client reports while the target's domain is blocked
inline FetchResult Blocked(const std::string &identifier, Duration remaining) {
	FetchResult result = Failure(identifier, FetchOutcome::TRANSIENT_FAILURE, 0, "domain blocked");
	result.error_type = "domain_blocked";
	result.deferred_for = remaining;
	return result;
}

// Serves scripted results per identifier. The last scripted result of an
// identifier repeats; identifiers without a script fail permanently.
class FakeFetchClient : public FetchClient {
public:
	void Script(const std::string &identifier, const FetchResult &result) {
		std::lock_guard<std::mutex> lock(mutex_);
		scripts_[identifier].push_back(result);
	}

	// Called with the identifier after every fetch, outside the lock
	void OnFetch(std::function<void(const std::string &)> hook) {
		std::lock_guard<std::mutex> lock(mutex_);
		hook_ = std::move(hook);
	}

	FetchResult Fetch(const std::string &identifier, TargetKind) override {
		FetchResult result;
		std::function<void(const std::string &)> hook;
		{
			std::lock_guard<std::mutex> lock(mutex_);
			calls_[identifier]++;
			hook = hook_;
			auto it = scripts_.find(identifier);
			if (it == scripts_.end() || it->second.empty()) {
				result = Failure(identifier, FetchOutcome::PERMANENT_FAILURE, 404, "not scripted");
			} else {
				result = it->second.front();
				if (it->second.size() > 1) {
					it->second.pop_front();
				}
			}
		}
		if (hook) {
			hook(identifier);
		}
		return result;
	}

	int Calls(const std::string &identifier) {
		std::lock_guard<std::mutex> lock(mutex_);
		auto it = calls_.find(identifier);
		return it == calls_.end() ? 0 : it->second;
	}

private:
	std::mutex mutex_;
	std::map<std::string, std::deque<FetchResult>> scripts_;
	std::map<std::string, int> calls_;
	std::function<void(const std::string &)> hook_;
};

// Returns whatever score was set last
class FakeModelScorer : public ModelScorer {
public:
	FakeModelScorer() : score_(ModelScore::Unavailable("not configured")) {}

	void SetDistribution(const std::map<RiskLabel, double> &distribution) {
		std::lock_guard<std::mutex> lock(mutex_);
		score_ = ModelScore();
		score_.available = true;
		score_.distribution = distribution;
	}

	void SetUnavailable(const std::string &error) {
		std::lock_guard<std::mutex> lock(mutex_);
		score_ = ModelScore::Unavailable(error);
	}

	ModelScore Score(const std::string &, const std::string &) override {
		std::lock_guard<std::mutex> lock(mutex_);
		calls_++;
		return score_;
	}

	int Calls() {
		std::lock_guard<std::mutex> lock(mutex_);
		return calls_;
	}

private:
	std::mutex mutex_;
	ModelScore score_;
	int calls_ = 0;
};

} // namespace test
} // namespace linkwatch
