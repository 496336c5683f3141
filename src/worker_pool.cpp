#include "worker_pool.hpp"
#include "pipeline_errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace linkwatch {

WorkerPool::WorkerPool(const PipelineConfig &config, Frontier &frontier, StateStore &store, FetchClient &fetcher,
                       const ContentExtractor &extractor, RiskEnsemble &ensemble, FeedbackQueue &feedback)
    : config_(config), frontier_(frontier), store_(store), fetcher_(fetcher), extractor_(extractor),
      ensemble_(ensemble), feedback_(feedback) {
}

WorkerPool::~WorkerPool() {
	RequestShutdown();
	Join();
}

void WorkerPool::Start() {
	if (!workers_.empty()) {
		return;
	}
	shutdown_ = false;
	int threads = std::max(1, config_.workers.worker_threads);
	workers_.reserve(threads);
	for (int i = 0; i < threads; i++) {
		workers_.emplace_back(&WorkerPool::WorkerLoop, this, i);
	}
	spdlog::info("Started {} workers (batch size {})", threads, config_.workers.batch_size);
}

void WorkerPool::RequestShutdown() {
	shutdown_ = true;
	frontier_.NotifyAll();
}

void WorkerPool::Join() {
	for (auto &t : workers_) {
		if (t.joinable()) {
			t.join();
		}
	}
	workers_.clear();
}

void WorkerPool::RunUntilIdle(const std::function<bool()> &should_stop) {
	Start();
	Duration poll(config_.workers.idle_poll_interval_ms);
	while (!shutdown_.load()) {
		if (should_stop && should_stop()) {
			break;
		}
		if (!frontier_.HasOutstandingWork()) {
			break;
		}
		frontier_.WaitForWork(poll);
	}
	RequestShutdown();
	Join();
}

void WorkerPool::WorkerLoop(int worker_id) {
	size_t batch_size = static_cast<size_t>(std::max(1, config_.workers.batch_size));
	Duration poll(config_.workers.idle_poll_interval_ms);

	while (!shutdown_.load()) {
		auto batch = frontier_.DequeueBatch(batch_size);
		if (batch.empty()) {
			frontier_.WaitForWork(poll);
			continue;
		}

		size_t next = 0;
		for (; next < batch.size() && !shutdown_.load(); next++) {
			ProcessTarget(batch[next]);
		}
		// Entries not started before shutdown go straight back
		for (; next < batch.size(); next++) {
			SafeRelease(batch[next].identifier, ReleaseOutcome::ROLLBACK);
		}
	}
	spdlog::debug("Worker {} exiting", worker_id);
}

std::optional<TargetStatus> WorkerPool::SafeRelease(const std::string &identifier, ReleaseOutcome outcome,
                                                    double risk_score) {
	try {
		return frontier_.Release(identifier, outcome, risk_score);
	} catch (const std::exception &e) {
		spdlog::error("{}: frontier release ({}) failed: {}", identifier, ReleaseOutcomeToString(outcome), e.what());
		return std::nullopt;
	}
}

void WorkerPool::ProcessTarget(const FrontierEntry &entry) {
	processed_++;
	try {
		store_.MarkInProgress(entry.identifier);
		auto result = fetcher_.Fetch(entry.identifier, entry.kind);
		if (result.outcome == FetchOutcome::SUCCESS) {
			ProcessSuccess(entry, result);
		} else {
			HandleFailure(entry, result);
		}
	} catch (const StoreWriteError &e) {
		rolled_back_++;
		spdlog::warn("{}: [{}] {}, rolling back to pending", entry.identifier,
		             PipelineErrorKindToString(PipelineErrorKind::STORE_WRITE), e.what());
		SafeRelease(entry.identifier, ReleaseOutcome::ROLLBACK);
		try {
			store_.RollbackToPending(entry.identifier);
		} catch (const std::exception &inner) {
			spdlog::warn("{}: cannot reset status: {}", entry.identifier, inner.what());
		}
	} catch (const std::exception &e) {
		// Anything else counts as a transient failure of this target
		transient_failures_++;
		spdlog::error("{}: unexpected error: {}", entry.identifier, e.what());
		auto status = SafeRelease(entry.identifier, ReleaseOutcome::TRANSIENT_FAILURE);
		try {
			store_.RecordFailure(entry.identifier, entry.retry_count + 1, e.what(),
			                     status && *status == TargetStatus::PERMANENTLY_FAILED);
		} catch (const std::exception &inner) {
			spdlog::warn("{}: cannot record failure: {}", entry.identifier, inner.what());
		}
	}
}

void WorkerPool::HandleFailure(const FrontierEntry &entry, const FetchResult &result) {
	if (result.deferred_for) {
		HandleDeferral(entry, result);
		return;
	}
	bool transient = result.outcome == FetchOutcome::TRANSIENT_FAILURE;
	auto kind = transient ? PipelineErrorKind::TRANSIENT_FETCH : PipelineErrorKind::PERMANENT_FETCH;
	std::string error = result.error_type.empty() ? result.error : result.error_type + ": " + result.error;

	// The frontier applies the same cap, so the store can be written first
	int retry_count = transient ? entry.retry_count + 1 : entry.retry_count;
	bool permanently_failed = !transient || retry_count >= config_.frontier.retry.max_retries;
	store_.RecordFailure(entry.identifier, retry_count, error, permanently_failed);

	auto status = frontier_.Release(entry.identifier, ToReleaseOutcome(result.outcome));
	if (transient) {
		transient_failures_++;
	} else {
		permanent_failures_++;
	}

	if (status == TargetStatus::PERMANENTLY_FAILED) {
		spdlog::warn("{}: [{}] permanently failed: {}", entry.identifier, PipelineErrorKindToString(kind), error);
	} else {
		spdlog::debug("{}: [{}] failure {} of {}: {}", entry.identifier, PipelineErrorKindToString(kind),
		              retry_count, config_.frontier.retry.max_retries, error);
	}
}

void WorkerPool::HandleDeferral(const FrontierEntry &entry, const FetchResult &result) {
	// Nothing was attempted, so the retry budget is left alone
	store_.RecordFailure(entry.identifier, entry.retry_count, result.error_type + ": " + result.error, false);
	frontier_.Defer(entry.identifier, *result.deferred_for);
	deferred_++;
	spdlog::debug("{}: deferred {} ms: {}", entry.identifier, result.deferred_for->count(), result.error);
}

void WorkerPool::RegisterDiscoveries(const FrontierEntry &entry, const std::vector<DiscoveredTarget> &discovered) {
	int depth = entry.depth + 1;
	Timestamp now = Clock::now();
	for (const auto &target : discovered) {
		if (target.identifier == entry.identifier) {
			continue;
		}
		// Channels are always followed; pages stop at the depth limit
		if (target.kind == TargetKind::PAGE && depth > config_.extract.max_discovery_depth) {
			continue;
		}
		if (frontier_.IsRetired(target.identifier)) {
			continue;
		}
		auto registered = store_.RegisterTarget(target.identifier, target.kind, depth, now);
		if (registered.first.status == TargetStatus::PERMANENTLY_FAILED) {
			frontier_.Retire(target.identifier);
			continue;
		}
		if (registered.second) {
			discovered_++;
		}
		frontier_.Enqueue(target.identifier, target.kind, config_.frontier.default_priority, depth, now);
	}
}

void WorkerPool::ProcessSuccess(const FrontierEntry &entry, const FetchResult &result) {
	Timestamp now = Clock::now();
	auto content = extractor_.Extract(result, entry.kind);
	RegisterDiscoveries(entry, content.discovered);

	Classification classification;
	bool reused = false;
	std::string hash = RiskEnsemble::SourceHash(content.text);
	if (config_.workers.reuse_unchanged_verdicts) {
		auto current = store_.GetCurrentVerdict(entry.identifier);
		if (current && current->source_hash == hash && current->model_score) {
			classification.verdict = *current;
			classification.verdict.id = 0;
			classification.verdict.produced_at = now;
			classification.uncertain = ensemble_.IsUncertain(current->probability);
			reused = true;
		}
	}
	if (!reused) {
		classification = entry.kind == TargetKind::CHANNEL
		                     ? ensemble_.ClassifyMessages(content.messages, content.text, entry.identifier)
		                     : ensemble_.Classify(content.text, entry.identifier);
	}

	Verdict &verdict = classification.verdict;
	store_.RecordVisit(entry.identifier, verdict, extractor_.MakeSnippet(content.text), now);

	// A reused verdict was already offered for labeling when first produced
	if (classification.uncertain && !reused && config_.feedback.enqueue_low_confidence) {
		try {
			feedback_.Enqueue(verdict, FeedbackReason::LOW_CONFIDENCE, now);
			feedback_queued_++;
		} catch (const LinkwatchException &e) {
			spdlog::warn("{}: cannot queue for feedback: {}", entry.identifier, e.what());
		}
	}

	frontier_.Release(entry.identifier, ReleaseOutcome::SUCCESS, verdict.risk_score);
	succeeded_++;
	if (reused) {
		reused_++;
	}
	spdlog::debug("{}: {} p={:.3f} risk={:.3f} signals={} discovered={}{}", entry.identifier,
	              RiskLabelToString(verdict.label), verdict.probability, verdict.risk_score,
	              verdict.rule_signals.size(), content.discovered.size(), reused ? " (unchanged)" : "");
}

WorkerStats WorkerPool::Stats() const {
	WorkerStats stats;
	stats.processed = processed_.load();
	stats.succeeded = succeeded_.load();
	stats.reused = reused_.load();
	stats.transient_failures = transient_failures_.load();
	stats.permanent_failures = permanent_failures_.load();
	stats.rolled_back = rolled_back_.load();
	stats.deferred = deferred_.load();
	stats.discovered = discovered_.load();
	stats.feedback_queued = feedback_queued_.load();
	return stats;
}

} // namespace linkwatch
