#pragma once

//===--------------------------------------------------------------------===//
// state_store.hpp - Durable pipeline state in an embedded DuckDB database
//===--------------------------------------------------------------------===//
// Owns targets, current verdicts, the append-only verdict history, feedback
// items and named checkpoints. One connection is shared by every worker and
// serialized by a mutex. Write failures raise StoreWriteError after the
// enclosing transaction has been rolled back.

#include "pipeline_config.hpp"
#include "pipeline_types.hpp"

#include "duckdb.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace linkwatch {

// Revisit interval for a target whose current verdict has this risk score
using RevisitFunction = std::function<Duration(double risk_score)>;

class StateStore {
public:
	explicit StateStore(const StoreConfig &config);
	virtual ~StateStore();

	StateStore(const StateStore &) = delete;
	StateStore &operator=(const StateStore &) = delete;

	//===--------------------------------------------------------------------===//
	// Targets
	//===--------------------------------------------------------------------===//

	// Insert if absent. Returns the stored target and whether it was created.
	std::pair<Target, bool> RegisterTarget(const std::string &identifier, TargetKind kind, int depth,
	                                       Timestamp now);
	std::optional<Target> GetTarget(const std::string &identifier);
	void PutTarget(const Target &target);
	void MarkInProgress(const std::string &identifier);
	void RollbackToPending(const std::string &identifier);

	// Append history, replace the current verdict and mark the target DONE
	// in one transaction. Sets verdict.id and returns it.
	virtual int64_t RecordVisit(const std::string &identifier, Verdict &verdict, const std::string &snippet,
	                            Timestamp now);

	void RecordFailure(const std::string &identifier, int retry_count, const std::string &error,
	                   bool permanently_failed);

	std::string GetSnippet(const std::string &identifier);

	//===--------------------------------------------------------------------===//
	// Verdicts
	//===--------------------------------------------------------------------===//

	std::optional<Verdict> GetCurrentVerdict(const std::string &identifier);
	std::optional<Verdict> GetVerdict(int64_t history_id);
	// Newest first
	std::vector<Verdict> GetVerdictHistory(const std::string &identifier, int64_t limit);

	//===--------------------------------------------------------------------===//
	// Frontier reconstruction and read API
	//===--------------------------------------------------------------------===//

	// Targets needing a visit: everything not DONE or PERMANENTLY_FAILED plus
	// DONE targets whose revisit interval has elapsed
	std::vector<PendingTarget> ListPending(Timestamp now, const RevisitFunction &revisit);
	// DONE targets not yet due, with the time they become due
	std::vector<PendingTarget> ListScheduled(Timestamp now, const RevisitFunction &revisit);

	// Risk score desc, then produced_at desc
	std::vector<FlaggedTarget> ListByRiskBand(RiskBand band, int64_t limit, int64_t offset,
	                                          std::optional<TargetKind> kind = std::nullopt);

	StoreStats Stats(Timestamp now);

	RiskBand BandFor(double risk_score) const;

	//===--------------------------------------------------------------------===//
	// Checkpoints
	//===--------------------------------------------------------------------===//

	void SaveCheckpoint(const std::string &name, const std::string &value);
	std::optional<std::string> LoadCheckpoint(const std::string &name);

	//===--------------------------------------------------------------------===//
	// Feedback persistence
	//===--------------------------------------------------------------------===//

	int64_t InsertFeedback(int64_t verdict_id, FeedbackReason reason, Timestamp now);
	// Oldest unresolved items not handed out within the redelivery interval;
	// marks them drained at now
	std::vector<FeedbackItem> DrainFeedback(int64_t limit, Timestamp now, Duration redelivery);
	// Throws InvalidInputException for unknown or resolved items
	void ResolveFeedback(int64_t item_id, RiskLabel human_label, Timestamp now);
	std::optional<FeedbackItem> GetFeedback(int64_t item_id);
	int64_t CountUnresolvedFeedback();

private:
	using Row = std::vector<duckdb::Value>;

	// Run one statement with bound parameters; the caller holds mutex_.
	// Failures throw StoreWriteError when write is set.
	std::vector<Row> Run(const std::string &sql, duckdb::vector<duckdb::Value> params, bool write);
	void Begin();
	void Commit();
	void Rollback() noexcept;

	void InitializeSchema();
	std::optional<Target> GetTargetLocked(const std::string &identifier);
	std::optional<Verdict> GetVerdictLocked(const std::string &where, duckdb::vector<duckdb::Value> params,
	                                        const std::string &table);
	std::vector<PendingTarget> ListDone(Timestamp now, const RevisitFunction &revisit, bool due);

	StoreConfig config_;
	std::mutex mutex_;
	std::unique_ptr<duckdb::DuckDB> db_;
	std::unique_ptr<duckdb::Connection> conn_;
};

} // namespace linkwatch
