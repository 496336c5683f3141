#pragma once

//===--------------------------------------------------------------------===//
// model_scorer.hpp - Learned model behind a capability interface
//===--------------------------------------------------------------------===//
// A scorer never throws: timeouts, transport errors and malformed payloads
// come back as an unavailable ModelScore.

#include "http_client.hpp"
#include "pipeline_config.hpp"
#include "pipeline_types.hpp"

#include <map>
#include <string>

namespace linkwatch {

struct ModelScore {
	bool available = false;
	std::map<RiskLabel, double> distribution;  // Sums to 1 when available
	std::string error;

	static ModelScore Unavailable(const std::string &error) {
		ModelScore score;
		score.error = error;
		return score;
	}

	double Probability(RiskLabel label) const {
		auto it = distribution.find(label);
		return it == distribution.end() ? 0.0 : it->second;
	}
};

class ModelScorer {
public:
	virtual ~ModelScorer() = default;
	virtual ModelScore Score(const std::string &text, const std::string &target) = 0;
};

// Rule-only deployments
class NullModelScorer : public ModelScorer {
public:
	ModelScore Score(const std::string &text, const std::string &target) override;
};

// POSTs {"text", "url"} to a model server and reads back one of
//   {"probabilities": {"fraud": 0.7, ...}}
//   {"prob_fraud": 0.7}
//   {"label": "phishing" | "not_phishing", "score": 0.7}
class HttpModelScorer : public ModelScorer {
public:
	HttpModelScorer(const EnsembleConfig &config, const std::string &user_agent);

	ModelScore Score(const std::string &text, const std::string &target) override;

	// Decode a model server response body
	static ModelScore ParseResponse(const std::string &body);

private:
	std::string url_;
	HttpRequestOptions options_;
};

} // namespace linkwatch
