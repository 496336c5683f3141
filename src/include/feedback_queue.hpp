#pragma once

//===--------------------------------------------------------------------===//
// feedback_queue.hpp - Verdicts awaiting a human label
//===--------------------------------------------------------------------===//
// Low-confidence and analyst-flagged verdicts, persisted in the state
// store. The queue only collects labels; retraining happens elsewhere.

#include "pipeline_config.hpp"
#include "pipeline_types.hpp"
#include "state_store.hpp"

#include <vector>

namespace linkwatch {

class FeedbackQueue {
public:
	FeedbackQueue(StateStore &store, const FeedbackConfig &config);

	// The verdict must already be persisted (verdict.id != 0)
	int64_t Enqueue(const Verdict &verdict, FeedbackReason reason, Timestamp now = Clock::now());

	// Oldest unresolved items first. Items handed out are not redelivered
	// until the redelivery interval passes.
	std::vector<FeedbackItem> Drain(int64_t limit, Timestamp now = Clock::now());

	void Resolve(int64_t item_id, RiskLabel human_label, Timestamp now = Clock::now());

	// Enqueue the current verdict of a target as ANALYST_FLAGGED
	int64_t Flag(const std::string &identifier, Timestamp now = Clock::now());

	int64_t UnresolvedCount();

private:
	StateStore &store_;
	FeedbackConfig config_;
};

} // namespace linkwatch
