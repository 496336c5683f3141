#pragma once

//===--------------------------------------------------------------------===//
// worker_pool.hpp - Fixed pool of workers draining the frontier
//===--------------------------------------------------------------------===//
// Each worker dequeues a batch and processes its targets one at a time:
// fetch, extract, enqueue discoveries, classify, persist, release. Any
// exception raised for one target is folded into a frontier transition for
// that target and never leaves the worker thread.

#include "content_extractor.hpp"
#include "feedback_queue.hpp"
#include "fetch_client.hpp"
#include "frontier.hpp"
#include "pipeline_config.hpp"
#include "risk_ensemble.hpp"
#include "state_store.hpp"

#include <atomic>
#include <functional>
#include <optional>
#include <thread>
#include <vector>

namespace linkwatch {

struct WorkerStats {
	int64_t processed = 0;
	int64_t succeeded = 0;
	int64_t reused = 0;            // Unchanged content, stored verdict kept
	int64_t transient_failures = 0;
	int64_t permanent_failures = 0;
	int64_t rolled_back = 0;
	int64_t deferred = 0;          // Put off while the domain was blocked
	int64_t discovered = 0;        // Targets newly registered from extraction
	int64_t feedback_queued = 0;
};

class WorkerPool {
public:
	WorkerPool(const PipelineConfig &config, Frontier &frontier, StateStore &store, FetchClient &fetcher,
	           const ContentExtractor &extractor, RiskEnsemble &ensemble, FeedbackQueue &feedback);
	~WorkerPool();

	WorkerPool(const WorkerPool &) = delete;
	WorkerPool &operator=(const WorkerPool &) = delete;

	void Start();
	// Workers finish their current target, roll back the rest of their
	// batch and exit
	void RequestShutdown();
	void Join();

	// Start, wait until the frontier has no outstanding work (or should_stop
	// returns true), then shut down and join. should_stop is polled from the
	// calling thread.
	void RunUntilIdle(const std::function<bool()> &should_stop = {});

	bool ShutdownRequested() const { return shutdown_.load(); }

	// One dequeued entry, end to end
	void ProcessTarget(const FrontierEntry &entry);

	WorkerStats Stats() const;

private:
	void WorkerLoop(int worker_id);
	void ProcessSuccess(const FrontierEntry &entry, const FetchResult &result);
	void HandleFailure(const FrontierEntry &entry, const FetchResult &result);
	void HandleDeferral(const FrontierEntry &entry, const FetchResult &result);
	void RegisterDiscoveries(const FrontierEntry &entry, const std::vector<DiscoveredTarget> &discovered);
	// Release that never throws; failures are logged
	std::optional<TargetStatus> SafeRelease(const std::string &identifier, ReleaseOutcome outcome,
	                                        double risk_score = 0.0);

	PipelineConfig config_;
	Frontier &frontier_;
	StateStore &store_;
	FetchClient &fetcher_;
	const ContentExtractor &extractor_;
	RiskEnsemble &ensemble_;
	FeedbackQueue &feedback_;

	std::vector<std::thread> workers_;
	std::atomic<bool> shutdown_{false};

	std::atomic<int64_t> processed_{0};
	std::atomic<int64_t> succeeded_{0};
	std::atomic<int64_t> reused_{0};
	std::atomic<int64_t> transient_failures_{0};
	std::atomic<int64_t> permanent_failures_{0};
	std::atomic<int64_t> rolled_back_{0};
	std::atomic<int64_t> deferred_{0};
	std::atomic<int64_t> discovered_{0};
	std::atomic<int64_t> feedback_queued_{0};
};

} // namespace linkwatch
