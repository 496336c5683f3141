#include "feedback_queue.hpp"
#include "pipeline_errors.hpp"

#include <spdlog/spdlog.h>

namespace linkwatch {

FeedbackQueue::FeedbackQueue(StateStore &store, const FeedbackConfig &config) : store_(store), config_(config) {
}

int64_t FeedbackQueue::Enqueue(const Verdict &verdict, FeedbackReason reason, Timestamp now) {
	if (verdict.id == 0) {
		throw InvalidInputException("cannot queue an unpersisted verdict for '" + verdict.target + "'");
	}
	int64_t id = store_.InsertFeedback(verdict.id, reason, now);
	spdlog::debug("Feedback item {} queued for {} ({}, {} {:.3f})", id, verdict.target,
	              FeedbackReasonToString(reason), RiskLabelToString(verdict.label), verdict.probability);
	return id;
}

std::vector<FeedbackItem> FeedbackQueue::Drain(int64_t limit, Timestamp now) {
	if (limit <= 0) {
		throw InvalidInputException("drain limit must be positive");
	}
	return store_.DrainFeedback(limit, now, Duration(config_.redelivery_interval_ms));
}

void FeedbackQueue::Resolve(int64_t item_id, RiskLabel human_label, Timestamp now) {
	store_.ResolveFeedback(item_id, human_label, now);
	spdlog::info("Feedback item {} resolved as {}", item_id, RiskLabelToString(human_label));
}

int64_t FeedbackQueue::Flag(const std::string &identifier, Timestamp now) {
	auto verdict = store_.GetCurrentVerdict(identifier);
	if (!verdict) {
		throw InvalidInputException("no verdict recorded for '" + identifier + "'");
	}
	return Enqueue(*verdict, FeedbackReason::ANALYST_FLAGGED, now);
}

int64_t FeedbackQueue::UnresolvedCount() {
	return store_.CountUnresolvedFeedback();
}

} // namespace linkwatch
