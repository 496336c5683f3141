#pragma once

//===--------------------------------------------------------------------===//
// frontier.hpp - Deduplicating priority queue with revisit and backoff
//===--------------------------------------------------------------------===//
// One mutex guards all scheduling state. Entries are keyed by canonical
// identifier; an entry stays in the frontier after a successful visit and
// becomes eligible again once its revisit interval has passed. Permanently
// failed identifiers are retired and never scheduled again.
//
// Entries that are not in progress live in one of two indexes: waiting
// entries ordered by not_before, and ready entries ordered for dequeue.
// Waiting entries move to the ready index as they come due, so a dequeue
// never walks the scheduled revisits.

#include "pipeline_config.hpp"
#include "pipeline_types.hpp"

#include <condition_variable>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace linkwatch {

enum class ReleaseOutcome : uint8_t {
	SUCCESS = 0,
	TRANSIENT_FAILURE = 1,
	PERMANENT_FAILURE = 2,
	ROLLBACK = 3,  // Persisting failed, hand the entry out again
	DEFERRED = 4   // Not attempted; eligible again after a delay, no retry charged
};

const char *ReleaseOutcomeToString(ReleaseOutcome outcome);
ReleaseOutcome ToReleaseOutcome(FetchOutcome outcome);

class Frontier {
public:
	explicit Frontier(const FrontierConfig &config);

	// Returns true when a new entry was created. Known entries only ever get
	// their priority raised; retired identifiers are ignored.
	bool Enqueue(const std::string &identifier, TargetKind kind, double priority, int depth = 0,
	             std::optional<Timestamp> now = std::nullopt);

	// Rebuild an entry from persisted state, replacing any existing one
	void Restore(const FrontierEntry &entry);

	// Up to n eligible entries, highest priority first, then oldest
	// discovery, then identifier. Returned entries are marked in progress.
	std::vector<FrontierEntry> DequeueBatch(size_t n, std::optional<Timestamp> now = std::nullopt);

	// Apply the outcome of processing a dequeued entry. Returns the status
	// the target ends up in: DONE, PENDING (retry or rollback) or
	// PERMANENTLY_FAILED. Throws InvalidInputException for entries that are
	// not in progress.
	TargetStatus Release(const std::string &identifier, ReleaseOutcome outcome, double risk_score = 0.0,
	                     std::optional<Timestamp> now = std::nullopt);

	// DEFERRED release: the entry keeps its retry count and becomes eligible
	// at now + delay
	TargetStatus Defer(const std::string &identifier, Duration delay, std::optional<Timestamp> now = std::nullopt);

	// Drop an entry and refuse it from now on
	void Retire(const std::string &identifier);

	Duration RevisitInterval(double risk_score) const;
	double PriorityForRisk(double risk_score) const;

	size_t Size() const;
	size_t InProgressCount() const;
	size_t RetiredCount() const;
	bool Contains(const std::string &identifier) const;
	bool IsRetired(const std::string &identifier) const;
	std::optional<FrontierEntry> Get(const std::string &identifier) const;

	// True while anything is in progress, never visited, or awaiting a retry
	bool HasOutstandingWork() const;

	// Earliest not_before among entries that are not in progress
	std::optional<Timestamp> NextEligibleTime() const;

	// Block until the frontier changes or the timeout passes
	void WaitForWork(Duration timeout);
	void NotifyAll();

	const FrontierConfig &Config() const { return config_; }

private:
	// Dequeue order: priority desc, discovered_at asc, identifier asc
	using OrderKey = std::tuple<double, Timestamp, std::string>;
	using TimeKey = std::pair<Timestamp, std::string>;
	static OrderKey KeyFor(const FrontierEntry &entry);
	static TimeKey TimeKeyFor(const FrontierEntry &entry);
	// Never visited, or visited and since failed
	static bool IsOutstanding(const FrontierEntry &entry);

	void AddToOrder(const FrontierEntry &entry);
	void RemoveFromOrder(const FrontierEntry &entry);
	// Move waiting entries due at ts into the ready index
	void PromoteDue(Timestamp ts);
	void Remove(const std::string &identifier);
	TargetStatus ReleaseLocked(FrontierEntry &entry, ReleaseOutcome outcome, double risk_score, Duration delay,
	                           Timestamp ts);

	FrontierConfig config_;

	mutable std::mutex mutex_;
	std::condition_variable cv_;
	uint64_t generation_ = 0;  // Bumped on every change that may create work

	std::unordered_map<std::string, FrontierEntry> entries_;
	std::set<TimeKey> waiting_;      // Not in progress, not_before in the future
	std::set<OrderKey> ready_;       // Not in progress and due
	std::set<TimeKey> ready_times_;  // ready_ by not_before
	std::unordered_set<std::string> retired_;
	size_t in_progress_ = 0;
	size_t outstanding_ = 0;  // Entries for which IsOutstanding holds
};

} // namespace linkwatch
