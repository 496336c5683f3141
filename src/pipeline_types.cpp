#include "pipeline_types.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>

namespace linkwatch {

// Helper: lowercase copy for enum parsing
static std::string ToLower(const std::string &str) {
	std::string result = str;
	std::transform(result.begin(), result.end(), result.begin(),
	               [](unsigned char c) { return std::tolower(c); });
	return result;
}

const std::vector<RiskLabel> &AllRiskLabels() {
	static const std::vector<RiskLabel> labels = {RiskLabel::BENIGN,  RiskLabel::FRAUD,   RiskLabel::PHISHING,
	                                              RiskLabel::GAMBLING, RiskLabel::MALWARE, RiskLabel::SUSPICIOUS};
	return labels;
}

//===--------------------------------------------------------------------===//
// Enum <-> string
//===--------------------------------------------------------------------===//

const char *TargetKindToString(TargetKind kind) {
	switch (kind) {
		case TargetKind::PAGE: return "page";
		case TargetKind::CHANNEL: return "channel";
		default: return "unknown";
	}
}

const char *TargetStatusToString(TargetStatus status) {
	switch (status) {
		case TargetStatus::PENDING: return "pending";
		case TargetStatus::IN_PROGRESS: return "in_progress";
		case TargetStatus::DONE: return "done";
		case TargetStatus::PERMANENTLY_FAILED: return "permanently_failed";
		default: return "unknown";
	}
}

const char *FetchOutcomeToString(FetchOutcome outcome) {
	switch (outcome) {
		case FetchOutcome::SUCCESS: return "success";
		case FetchOutcome::TRANSIENT_FAILURE: return "transient_failure";
		case FetchOutcome::PERMANENT_FAILURE: return "permanent_failure";
		default: return "unknown";
	}
}

const char *RiskLabelToString(RiskLabel label) {
	switch (label) {
		case RiskLabel::BENIGN: return "benign";
		case RiskLabel::FRAUD: return "fraud";
		case RiskLabel::PHISHING: return "phishing";
		case RiskLabel::GAMBLING: return "gambling";
		case RiskLabel::MALWARE: return "malware";
		case RiskLabel::SUSPICIOUS: return "suspicious";
		default: return "unknown";
	}
}

const char *RiskBandToString(RiskBand band) {
	switch (band) {
		case RiskBand::LOW: return "LOW";
		case RiskBand::MEDIUM: return "MEDIUM";
		case RiskBand::HIGH: return "HIGH";
		default: return "unknown";
	}
}

const char *FeedbackReasonToString(FeedbackReason reason) {
	switch (reason) {
		case FeedbackReason::LOW_CONFIDENCE: return "low_confidence";
		case FeedbackReason::ANALYST_FLAGGED: return "analyst_flagged";
		default: return "unknown";
	}
}

bool TryParseTargetKind(const std::string &str, TargetKind &out) {
	auto lower = ToLower(str);
	if (lower == "page") {
		out = TargetKind::PAGE;
		return true;
	}
	if (lower == "channel") {
		out = TargetKind::CHANNEL;
		return true;
	}
	return false;
}

bool TryParseTargetStatus(const std::string &str, TargetStatus &out) {
	auto lower = ToLower(str);
	for (auto status : {TargetStatus::PENDING, TargetStatus::IN_PROGRESS, TargetStatus::DONE,
	                    TargetStatus::PERMANENTLY_FAILED}) {
		if (lower == TargetStatusToString(status)) {
			out = status;
			return true;
		}
	}
	return false;
}

bool TryParseRiskLabel(const std::string &str, RiskLabel &out) {
	auto lower = ToLower(str);
	for (auto label : AllRiskLabels()) {
		if (lower == RiskLabelToString(label)) {
			out = label;
			return true;
		}
	}
	return false;
}

bool TryParseRiskBand(const std::string &str, RiskBand &out) {
	auto lower = ToLower(str);
	if (lower == "low") {
		out = RiskBand::LOW;
		return true;
	}
	if (lower == "medium") {
		out = RiskBand::MEDIUM;
		return true;
	}
	if (lower == "high") {
		out = RiskBand::HIGH;
		return true;
	}
	return false;
}

bool TryParseFeedbackReason(const std::string &str, FeedbackReason &out) {
	auto lower = ToLower(str);
	if (lower == "low_confidence") {
		out = FeedbackReason::LOW_CONFIDENCE;
		return true;
	}
	if (lower == "analyst_flagged") {
		out = FeedbackReason::ANALYST_FLAGGED;
		return true;
	}
	return false;
}

double ComputeRiskScore(RiskLabel label, double probability) {
	double p = std::min(1.0, std::max(0.0, probability));
	return label == RiskLabel::BENIGN ? 1.0 - p : p;
}

//===--------------------------------------------------------------------===//
// Time helpers
//===--------------------------------------------------------------------===//

int64_t ToEpochMs(Timestamp ts) {
	return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

Timestamp FromEpochMs(int64_t ms) {
	return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

std::string FormatTimestamp(Timestamp ts) {
	int64_t ms = ToEpochMs(ts);
	time_t seconds = static_cast<time_t>(ms / 1000);
	int millis = static_cast<int>(ms % 1000);
	if (millis < 0) {
		millis += 1000;
		seconds -= 1;
	}
	struct tm gmt = {};
	gmtime_r(&seconds, &gmt);
	char buf[32];
	strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &gmt);
	char out[40];
	snprintf(out, sizeof(out), "%s.%03dZ", buf, millis);
	return std::string(out);
}

} // namespace linkwatch
