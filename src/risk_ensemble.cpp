#include "risk_ensemble.hpp"
#include "crawler_utils.hpp"
#include "pipeline_errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace linkwatch {

RiskEnsemble::RiskEnsemble(const EnsembleConfig &config, const RuleEngine &rules, ModelScorer &model)
    : config_(config), rules_(rules), model_(model) {
}

std::string RiskEnsemble::SourceHash(const std::string &text) {
	return GenerateContentHash(text);
}

std::map<RiskLabel, double> RiskEnsemble::RuleDistribution(const std::vector<RuleSignal> &signals) {
	std::map<RiskLabel, double> distribution;
	for (auto label : AllRiskLabels()) {
		distribution[label] = 0.0;
	}
	for (const auto &signal : signals) {
		if (signal.label != RiskLabel::BENIGN) {
			distribution[signal.label] += signal.weight;
		}
	}
	double max_risky = 0.0;
	for (auto &entry : distribution) {
		if (entry.first == RiskLabel::BENIGN) {
			continue;
		}
		entry.second = std::min(1.0, entry.second);
		max_risky = std::max(max_risky, entry.second);
	}
	distribution[RiskLabel::BENIGN] = 1.0 - max_risky;
	return distribution;
}

bool RiskEnsemble::IsUncertain(double probability) const {
	for (double boundary : config_.decision_boundaries) {
		// Small epsilon so that a value exactly on the band edge counts
		if (std::fabs(probability - boundary) <= config_.uncertainty_band + 1e-9) {
			return true;
		}
	}
	return false;
}

Classification RiskEnsemble::Combine(const std::string &target, const std::vector<RuleSignal> &signals,
                                     const ModelScore &model, const std::string &source_hash,
                                     Timestamp produced_at) const {
	Classification result;
	Verdict &verdict = result.verdict;
	verdict.target = target;
	verdict.rule_signals = signals;
	verdict.produced_at = produced_at;
	verdict.source_hash = source_hash;

	auto rule_p = RuleDistribution(signals);

	if (!model.available) {
		// Risky label with the highest cumulative rule weight, BENIGN if none
		std::map<RiskLabel, double> cumulative;
		for (const auto &signal : signals) {
			cumulative[signal.label] += signal.weight;
		}
		verdict.label = RiskLabel::BENIGN;
		double best = 0.0;
		for (auto label : AllRiskLabels()) {
			if (label == RiskLabel::BENIGN) {
				continue;
			}
			auto it = cumulative.find(label);
			if (it != cumulative.end() && it->second > best) {
				best = it->second;
				verdict.label = label;
			}
		}
		verdict.probability = rule_p[verdict.label];
	} else {
		double rule_weight = config_.rule_weight;
		double model_weight = 1.0 - rule_weight;
		verdict.label = RiskLabel::BENIGN;
		double best = -1.0;
		// AllRiskLabels() is in enum order, strict comparison keeps the first on ties
		for (auto label : AllRiskLabels()) {
			double p = rule_weight * rule_p[label] + model_weight * model.Probability(label);
			if (p > best + 1e-12) {
				best = p;
				verdict.label = label;
			}
		}
		verdict.probability = std::min(1.0, std::max(0.0, best));
		verdict.model_score = model.Probability(verdict.label);
	}

	verdict.risk_score = ComputeRiskScore(verdict.label, verdict.probability);
	result.uncertain = IsUncertain(verdict.probability);
	return result;
}

void RiskEnsemble::RecordModelResult(const ModelScore &score) {
	if (score.available) {
		model_verdicts_++;
		consecutive_unavailable_ = 0;
		if (degraded_.load()) {
			std::lock_guard<std::mutex> lock(health_mutex_);
			if (degraded_.exchange(false)) {
				spdlog::info("Model scorer recovered, leaving rule-only mode");
			}
		}
		return;
	}

	rule_only_verdicts_++;
	int64_t failures = ++consecutive_unavailable_;
	std::lock_guard<std::mutex> lock(health_mutex_);
	last_model_error_ = score.error;
	if (failures >= config_.degraded_after_failures && !degraded_.exchange(true)) {
		spdlog::warn("Model scorer unavailable {} times in a row ({}), degraded to rule-only verdicts", failures,
		             score.error);
	}
}

Classification RiskEnsemble::Classify(const std::string &text, const std::string &target) {
	auto signals = rules_.Evaluate(text, target);
	auto score = model_.Score(text, target);
	RecordModelResult(score);
	if (!score.available) {
		spdlog::debug("{}: [{}] {}, rule-only verdict", target,
		              PipelineErrorKindToString(PipelineErrorKind::SCORER_UNAVAILABLE), score.error);
	}
	return Combine(target, signals, score, SourceHash(text), Clock::now());
}

MessageStats RiskEnsemble::SummarizeRisk(std::vector<double> risks) {
	MessageStats stats;
	if (risks.empty()) {
		return stats;
	}
	std::sort(risks.begin(), risks.end());
	size_t n = risks.size();
	double sum = 0.0;
	for (double risk : risks) {
		sum += risk;
	}
	stats.sample_count = static_cast<int64_t>(n);
	stats.avg_risk = sum / static_cast<double>(n);
	stats.median_risk = n % 2 == 1 ? risks[n / 2] : (risks[n / 2 - 1] + risks[n / 2]) / 2.0;
	size_t rank = static_cast<size_t>(static_cast<double>(n) * 0.9);
	stats.pct90_risk = rank == 0 ? risks.back() : risks[rank - 1];
	return stats;
}

Classification RiskEnsemble::ClassifyMessages(const std::vector<std::string> &messages, const std::string &text,
                                              const std::string &target) {
	if (messages.empty()) {
		return Classify(text, target);
	}

	Timestamp now = Clock::now();
	std::vector<double> risks;
	std::vector<ModelScore> scores;
	std::map<RiskLabel, int64_t> votes;
	std::string model_error;
	risks.reserve(messages.size());
	for (const auto &message : messages) {
		auto score = model_.Score(message, target);
		RecordModelResult(score);
		auto per_message = Combine(target, rules_.Evaluate(message, target), score, std::string(), now);
		risks.push_back(per_message.verdict.risk_score);
		if (per_message.verdict.label != RiskLabel::BENIGN) {
			votes[per_message.verdict.label]++;
		}
		if (score.available) {
			scores.push_back(std::move(score));
		} else {
			model_error = score.error;
		}
	}
	if (!model_error.empty()) {
		spdlog::debug("{}: [{}] {} ({} of {} messages rule-only)", target,
		              PipelineErrorKindToString(PipelineErrorKind::SCORER_UNAVAILABLE), model_error,
		              messages.size() - scores.size(), messages.size());
	}

	Classification result;
	Verdict &verdict = result.verdict;
	verdict.target = target;
	verdict.rule_signals = rules_.Evaluate(text, target);
	verdict.produced_at = now;
	verdict.source_hash = SourceHash(text);
	verdict.message_stats = SummarizeRisk(risks);

	const MessageStats &stats = *verdict.message_stats;
	double channel_risk = std::max(stats.avg_risk, stats.pct90_risk);
	if (channel_risk >= config_.channel_threshold) {
		// Most frequent risky message label, enum order on ties
		verdict.label = RiskLabel::SUSPICIOUS;
		int64_t best = 0;
		for (auto label : AllRiskLabels()) {
			auto it = votes.find(label);
			if (it != votes.end() && it->second > best) {
				best = it->second;
				verdict.label = label;
			}
		}
		verdict.probability = channel_risk;
	} else {
		verdict.label = RiskLabel::BENIGN;
		verdict.probability = 1.0 - channel_risk;
	}

	if (!scores.empty()) {
		double sum = 0.0;
		for (const auto &score : scores) {
			sum += score.Probability(verdict.label);
		}
		verdict.model_score = sum / static_cast<double>(scores.size());
	}

	verdict.risk_score = ComputeRiskScore(verdict.label, verdict.probability);
	result.uncertain = std::fabs(channel_risk - config_.channel_threshold) <= config_.uncertainty_band + 1e-9;
	return result;
}

EnsembleHealth RiskEnsemble::Health() const {
	EnsembleHealth health;
	health.degraded = degraded_.load();
	health.consecutive_unavailable = consecutive_unavailable_.load();
	health.model_verdicts = model_verdicts_.load();
	health.rule_only_verdicts = rule_only_verdicts_.load();
	std::lock_guard<std::mutex> lock(health_mutex_);
	health.last_model_error = last_model_error_;
	return health;
}

} // namespace linkwatch
