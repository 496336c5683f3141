#pragma once

//===--------------------------------------------------------------------===//
// pipeline_types.hpp - Shared records for the discovery pipeline
//===--------------------------------------------------------------------===//
// Targets, fetch results, verdicts, frontier entries and feedback items.
// Persisted records are owned by the StateStore; everything else refers
// to targets by identifier.

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace linkwatch {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;
using Duration = std::chrono::milliseconds;

//===--------------------------------------------------------------------===//
// Enumerations
//===--------------------------------------------------------------------===//

enum class TargetKind : uint8_t { PAGE = 0, CHANNEL = 1 };

enum class TargetStatus : uint8_t { PENDING = 0, IN_PROGRESS = 1, DONE = 2, PERMANENTLY_FAILED = 3 };

enum class FetchOutcome : uint8_t { SUCCESS = 0, TRANSIENT_FAILURE = 1, PERMANENT_FAILURE = 2 };

// Closed label set. Enum order is the tie-break order used by the ensemble.
enum class RiskLabel : uint8_t {
	BENIGN = 0,
	FRAUD = 1,
	PHISHING = 2,
	GAMBLING = 3,
	MALWARE = 4,
	SUSPICIOUS = 5
};

enum class RiskBand : uint8_t { LOW = 0, MEDIUM = 1, HIGH = 2 };

enum class FeedbackReason : uint8_t { LOW_CONFIDENCE = 0, ANALYST_FLAGGED = 1 };

const std::vector<RiskLabel> &AllRiskLabels();

const char *TargetKindToString(TargetKind kind);
const char *TargetStatusToString(TargetStatus status);
const char *FetchOutcomeToString(FetchOutcome outcome);
const char *RiskLabelToString(RiskLabel label);
const char *RiskBandToString(RiskBand band);
const char *FeedbackReasonToString(FeedbackReason reason);

// Parsers return false on unknown input (case-insensitive)
bool TryParseTargetKind(const std::string &str, TargetKind &out);
bool TryParseTargetStatus(const std::string &str, TargetStatus &out);
bool TryParseRiskLabel(const std::string &str, RiskLabel &out);
bool TryParseRiskBand(const std::string &str, RiskBand &out);
bool TryParseFeedbackReason(const std::string &str, FeedbackReason &out);

//===--------------------------------------------------------------------===//
// Target
//===--------------------------------------------------------------------===//

struct Target {
	std::string identifier;
	TargetKind kind = TargetKind::PAGE;
	Timestamp discovered_at;
	std::optional<Timestamp> last_visited_at;
	int64_t visit_count = 0;
	TargetStatus status = TargetStatus::PENDING;
	int depth = 0;          // Link distance from a seed
	int retry_count = 0;    // Consecutive transient failures
	std::string last_error;
};

//===--------------------------------------------------------------------===//
// FetchResult - output of one fetch attempt plus extraction
//===--------------------------------------------------------------------===//

struct DiscoveredTarget {
	std::string identifier;
	TargetKind kind;
};

struct FetchResult {
	std::string target;
	Timestamp timestamp;
	FetchOutcome outcome = FetchOutcome::TRANSIENT_FAILURE;
	std::string raw_content;                         // Present only on success
	std::vector<DiscoveredTarget> discovered_targets; // Empty unless success
	std::string content_type;
	std::string final_url;
	int status_code = 0;
	std::string error;
	std::string error_type;
	int64_t elapsed_ms = 0;
	// Set when no request was made because the domain is blocked; the
	// target should be tried again once this much time has passed
	std::optional<Duration> deferred_for;
};

//===--------------------------------------------------------------------===//
// Verdict
//===--------------------------------------------------------------------===//

struct RuleSignal {
	std::string rule;
	RiskLabel label = RiskLabel::SUSPICIOUS;
	double weight = 0.0;

	bool operator==(const RuleSignal &other) const {
		return rule == other.rule && label == other.label && weight == other.weight;
	}
};

// Risk of each sampled channel message, summarized. The channel verdict is
// derived from avg_risk and pct90_risk.
struct MessageStats {
	int64_t sample_count = 0;
	double avg_risk = 0.0;
	double median_risk = 0.0;
	double pct90_risk = 0.0;
};

struct Verdict {
	int64_t id = 0;  // verdict_history row id, 0 until persisted
	std::string target;
	RiskLabel label = RiskLabel::BENIGN;
	double probability = 0.0;
	std::vector<RuleSignal> rule_signals;
	std::optional<double> model_score;
	Timestamp produced_at;
	std::string source_hash;
	double risk_score = 0.0;
	std::optional<MessageStats> message_stats;  // Channels only
};

// Risk of the target regardless of label: probability for risky labels,
// 1 - probability for BENIGN.
double ComputeRiskScore(RiskLabel label, double probability);

//===--------------------------------------------------------------------===//
// FrontierEntry
//===--------------------------------------------------------------------===//

struct FrontierEntry {
	std::string identifier;
	TargetKind kind = TargetKind::PAGE;
	double priority = 0.0;
	Timestamp discovered_at;
	Timestamp not_before;
	int depth = 0;
	int retry_count = 0;
	bool visited = false;
	bool in_progress = false;
};

//===--------------------------------------------------------------------===//
// FeedbackItem
//===--------------------------------------------------------------------===//

struct FeedbackItem {
	int64_t id = 0;
	Verdict verdict;
	FeedbackReason reason = FeedbackReason::LOW_CONFIDENCE;
	Timestamp enqueued_at;
	bool resolved = false;
	std::optional<RiskLabel> human_label;
	std::optional<Timestamp> resolved_at;
	std::optional<Timestamp> drained_at;
};

//===--------------------------------------------------------------------===//
// Store query results
//===--------------------------------------------------------------------===//

struct FlaggedTarget {
	Target target;
	Verdict verdict;
	std::string snippet;
	std::string domain;
};

struct PendingTarget {
	Target target;
	double risk_score = 0.0;   // Risk of the current verdict, 0 when none
	Timestamp not_before;
};

struct StoreStats {
	std::map<std::string, int64_t> by_status;
	std::map<std::string, int64_t> by_label;
	int64_t total_targets = 0;
	int64_t total_flagged = 0;  // Current verdicts with a risky label
	int64_t high_risk = 0;
	int64_t medium_risk = 0;
	int64_t low_risk = 0;
	int64_t found_today = 0;
	int64_t found_this_week = 0;
	double avg_risk_score = 0.0;
	int64_t unique_domains = 0;
	int64_t unresolved_feedback = 0;
	int64_t history_rows = 0;
};

// Milliseconds since the Unix epoch
int64_t ToEpochMs(Timestamp ts);
Timestamp FromEpochMs(int64_t ms);
// ISO-8601 UTC ("2025-01-14T12:00:00.000Z")
std::string FormatTimestamp(Timestamp ts);

} // namespace linkwatch
