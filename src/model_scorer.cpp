#include "model_scorer.hpp"
#include "yyjson_guard.hpp"

#include <algorithm>
#include <cmath>

namespace linkwatch {

ModelScore NullModelScorer::Score(const std::string &, const std::string &) {
	return ModelScore::Unavailable("no model configured");
}

HttpModelScorer::HttpModelScorer(const EnsembleConfig &config, const std::string &user_agent)
    : url_(config.model_url) {
	options_.user_agent = user_agent;
	options_.timeout_ms = config.model_timeout_ms;
	options_.connect_timeout_ms = std::min<int64_t>(config.model_timeout_ms, 5000);
	options_.max_redirects = 0;
	options_.compress = false;
	options_.max_response_bytes = 1024 * 1024;
}

// Helper: map a model label name onto the closed label set. "not_<label>"
// names the benign class of a binary model.
static bool MapModelLabel(const std::string &name, RiskLabel &label) {
	if (name == "spam") {
		label = RiskLabel::SUSPICIOUS;
		return true;
	}
	if (name == "ham") {
		label = RiskLabel::BENIGN;
		return true;
	}
	if (name.compare(0, 4, "not_") == 0) {
		RiskLabel negated;
		if (!MapModelLabel(name.substr(4), negated) || negated == RiskLabel::BENIGN) {
			return false;
		}
		label = RiskLabel::BENIGN;
		return true;
	}
	return TryParseRiskLabel(name, label);
}

// Helper: risky class of a binary model from either of its label names
// ("phishing" and "not_phishing" both give PHISHING)
static bool RiskySideOf(const std::string &name, RiskLabel &risky) {
	RiskLabel mapped;
	if (!MapModelLabel(name, mapped)) {
		return false;
	}
	if (mapped != RiskLabel::BENIGN) {
		risky = mapped;
		return true;
	}
	if (name.compare(0, 4, "not_") == 0 && MapModelLabel(name.substr(4), risky)) {
		return true;
	}
	risky = RiskLabel::SUSPICIOUS;
	return true;
}

// Helper: clamp a probability read from the wire, NaN becomes 0
static double ClampProbability(double p) {
	if (std::isnan(p)) {
		return 0.0;
	}
	return std::min(1.0, std::max(0.0, p));
}

static ModelScore BinaryScore(RiskLabel risky, double p) {
	ModelScore score;
	score.available = true;
	p = ClampProbability(p);
	score.distribution[risky] = p;
	score.distribution[RiskLabel::BENIGN] = 1.0 - p;
	return score;
}

ModelScore HttpModelScorer::ParseResponse(const std::string &body) {
	YyjsonDocGuard doc(yyjson_read(body.c_str(), body.size(), 0));
	if (!doc) {
		return ModelScore::Unavailable("model response is not valid JSON");
	}
	yyjson_val *root = doc.root();
	if (!yyjson_is_obj(root)) {
		return ModelScore::Unavailable("model response is not a JSON object");
	}

	yyjson_val *probabilities = yyjson_obj_get(root, "probabilities");
	if (!probabilities) {
		probabilities = yyjson_obj_get(root, "prob");
	}
	if (yyjson_is_obj(probabilities)) {
		ModelScore score;
		double total = 0.0;
		size_t idx, max;
		yyjson_val *key, *val;
		yyjson_obj_foreach(probabilities, idx, max, key, val) {
			RiskLabel label;
			// Unknown labels are dropped and the rest renormalized
			if (!yyjson_is_num(val) || !MapModelLabel(yyjson_get_str(key), label)) {
				continue;
			}
			double p = ClampProbability(yyjson_get_num(val));
			score.distribution[label] += p;
			total += p;
		}
		if (total <= 0.0) {
			return ModelScore::Unavailable("model returned no usable probabilities");
		}
		for (auto &entry : score.distribution) {
			entry.second /= total;
		}
		score.available = true;
		return score;
	}

	yyjson_val *prob_fraud = yyjson_obj_get(root, "prob_fraud");
	if (yyjson_is_num(prob_fraud)) {
		return BinaryScore(RiskLabel::FRAUD, yyjson_get_num(prob_fraud));
	}

	// {"label": "phishing" | "not_phishing", "score": p}: score is the
	// probability of the risky class whatever the predicted label
	yyjson_val *label = yyjson_obj_get(root, "label");
	yyjson_val *value = yyjson_obj_get(root, "score");
	if (yyjson_is_str(label) && yyjson_is_num(value)) {
		RiskLabel risky;
		if (!RiskySideOf(yyjson_get_str(label), risky)) {
			return ModelScore::Unavailable(std::string("unknown model label '") + yyjson_get_str(label) + "'");
		}
		return BinaryScore(risky, yyjson_get_num(value));
	}

	yyjson_val *probability = yyjson_obj_get(root, "probability");
	if (yyjson_is_num(probability)) {
		return BinaryScore(RiskLabel::FRAUD, yyjson_get_num(probability));
	}

	return ModelScore::Unavailable("unrecognized model response");
}

ModelScore HttpModelScorer::Score(const std::string &text, const std::string &target) {
	if (url_.empty()) {
		return ModelScore::Unavailable("no model configured");
	}

	YyjsonMutDocGuard doc;
	if (!doc) {
		return ModelScore::Unavailable("out of memory building model request");
	}
	yyjson_mut_val *root = yyjson_mut_obj(doc.get());
	yyjson_mut_doc_set_root(doc.get(), root);
	yyjson_mut_obj_add_strncpy(doc.get(), root, "text", text.c_str(), text.size());
	yyjson_mut_obj_add_strcpy(doc.get(), root, "url", target.c_str());
	std::string request = doc.Write();
	if (request.empty()) {
		return ModelScore::Unavailable("cannot serialize model request");
	}

	auto response = HttpClient::PostJson(url_, request, options_);
	if (!response.success) {
		std::string error = response.error.empty() ? "HTTP " + std::to_string(response.status_code) : response.error;
		return ModelScore::Unavailable("model server: " + error);
	}
	return ParseResponse(response.body);
}

} // namespace linkwatch
