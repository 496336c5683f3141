#pragma once

//===--------------------------------------------------------------------===//
// risk_ensemble.hpp - Rules and model combined into one verdict
//===--------------------------------------------------------------------===//
// Classify() never throws on scorer trouble: an unavailable model yields a
// rule-only verdict and is counted towards degraded mode.

#include "model_scorer.hpp"
#include "pipeline_config.hpp"
#include "pipeline_types.hpp"
#include "rule_engine.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace linkwatch {

struct Classification {
	Verdict verdict;
	bool uncertain = false;  // Probability within the band around a decision boundary
};

struct EnsembleHealth {
	bool degraded = false;
	int64_t consecutive_unavailable = 0;
	int64_t model_verdicts = 0;
	int64_t rule_only_verdicts = 0;
	std::string last_model_error;
};

class RiskEnsemble {
public:
	RiskEnsemble(const EnsembleConfig &config, const RuleEngine &rules, ModelScorer &model);

	Classification Classify(const std::string &text, const std::string &target);

	// Channel verdict: every message is classified on its own and the
	// channel is flagged when the average or 90th percentile message risk
	// reaches channel_threshold. Rule signals and the source hash come from
	// the joined text. Falls back to Classify() when there are no messages.
	Classification ClassifyMessages(const std::vector<std::string> &messages, const std::string &text,
	                                const std::string &target);

	// Count, mean, median and 90th percentile (the value at rank floor(0.9 n),
	// the largest for samples under two)
	static MessageStats SummarizeRisk(std::vector<double> risks);

	// Pure combination step, Classify() without the rule and model calls
	Classification Combine(const std::string &target, const std::vector<RuleSignal> &signals,
	                       const ModelScore &model, const std::string &source_hash, Timestamp produced_at) const;

	bool IsUncertain(double probability) const;

	// Fingerprint of normalized text
	static std::string SourceHash(const std::string &text);

	// rule_p for every label, BENIGN = 1 - max risky rule_p
	static std::map<RiskLabel, double> RuleDistribution(const std::vector<RuleSignal> &signals);

	bool Degraded() const { return degraded_.load(); }
	EnsembleHealth Health() const;

private:
	void RecordModelResult(const ModelScore &score);

	EnsembleConfig config_;
	const RuleEngine &rules_;
	ModelScorer &model_;

	std::atomic<bool> degraded_{false};
	std::atomic<int64_t> consecutive_unavailable_{0};
	std::atomic<int64_t> model_verdicts_{0};
	std::atomic<int64_t> rule_only_verdicts_{0};
	mutable std::mutex health_mutex_;  // Guards last_model_error_ and transitions
	std::string last_model_error_;
};

} // namespace linkwatch
