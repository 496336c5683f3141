#include "rule_engine.hpp"
#include "crawler_utils.hpp"
#include "pipeline_errors.hpp"
#include "yyjson_guard.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>

namespace linkwatch {

// Helper: Convert string to lowercase
static std::string ToLower(const std::string &str) {
	std::string result = str;
	std::transform(result.begin(), result.end(), result.begin(),
	               [](unsigned char c) { return std::tolower(c); });
	return result;
}

const char *RuleKindToString(RuleKind kind) {
	switch (kind) {
		case RuleKind::KEYWORD: return "keyword";
		case RuleKind::REGEX: return "regex";
		case RuleKind::INDICATOR: return "indicator";
		default: return "unknown";
	}
}

bool TryParseRuleKind(const std::string &str, RuleKind &out) {
	auto lower = ToLower(str);
	for (auto kind : {RuleKind::KEYWORD, RuleKind::REGEX, RuleKind::INDICATOR}) {
		if (lower == RuleKindToString(kind)) {
			out = kind;
			return true;
		}
	}
	return false;
}

RuleEngine::RuleEngine(std::vector<RuleDefinition> rules) {
	std::set<std::string> names;
	for (auto &definition : rules) {
		if (definition.name.empty()) {
			throw ConfigException("rule without a name");
		}
		if (!names.insert(definition.name).second) {
			throw ConfigException("duplicate rule '" + definition.name + "'");
		}
		if (definition.label == RiskLabel::BENIGN) {
			throw ConfigException("rule '" + definition.name + "' must hint a risky label");
		}
		if (definition.weight < 0.0 || definition.weight > 1.0) {
			throw ConfigException("rule '" + definition.name + "' weight must be within [0, 1]");
		}
		if (definition.patterns.empty()) {
			throw ConfigException("rule '" + definition.name + "' has no patterns");
		}

		CompiledRule compiled;
		for (const auto &pattern : definition.patterns) {
			if (definition.kind == RuleKind::REGEX) {
				try {
					compiled.regexes.emplace_back(pattern, std::regex::ECMAScript | std::regex::icase |
					                                           std::regex::optimize);
				} catch (const std::regex_error &e) {
					throw ConfigException("rule '" + definition.name + "' has an invalid regex '" + pattern +
					                      "': " + e.what());
				}
			} else {
				compiled.lowered.push_back(ToLower(pattern));
			}
		}
		compiled.definition = std::move(definition);
		rules_.push_back(std::move(compiled));
	}
}

std::vector<std::string> RuleEngine::ExtractUrlHosts(const std::string &text) {
	std::vector<std::string> hosts;
	std::set<std::string> seen;
	std::string lower = ToLower(text);

	auto add_url = [&](const std::string &url) {
		std::string host = ExtractDomain(url);
		if (!host.empty() && seen.insert(host).second) {
			hosts.push_back(host);
		}
	};
	auto token_end = [&](size_t from) {
		size_t end = from;
		while (end < lower.length() && !std::isspace(static_cast<unsigned char>(lower[end])) &&
		       lower[end] != '"' && lower[end] != '\'' && lower[end] != '<' && lower[end] != '>' &&
		       lower[end] != ')') {
			end++;
		}
		return end;
	};

	size_t pos = 0;
	while ((pos = lower.find("http", pos)) != std::string::npos) {
		size_t scheme_len = lower.compare(pos, 8, "https://") == 0 ? 8 : lower.compare(pos, 7, "http://") == 0 ? 7 : 0;
		if (scheme_len == 0) {
			pos += 4;
			continue;
		}
		size_t end = token_end(pos);
		add_url(lower.substr(pos, end - pos));
		pos = end;
	}

	pos = 0;
	while ((pos = lower.find("www.", pos)) != std::string::npos) {
		bool boundary = pos == 0 || std::isspace(static_cast<unsigned char>(lower[pos - 1])) || lower[pos - 1] == '(';
		size_t end = token_end(pos);
		if (boundary) {
			add_url("https://" + lower.substr(pos, end - pos));
		}
		pos = end;
	}
	return hosts;
}

std::vector<RuleSignal> RuleEngine::Evaluate(const std::string &text, const std::string &target) const {
	std::vector<RuleSignal> signals;
	std::string lower_text = ToLower(text);

	// Indicator inputs are computed once per evaluation
	bool hosts_ready = false;
	std::vector<std::string> hosts;
	std::string lower_target = ToLower(target);

	for (const auto &rule : rules_) {
		bool triggered = false;
		switch (rule.definition.kind) {
			case RuleKind::KEYWORD:
				for (const auto &keyword : rule.lowered) {
					if (!keyword.empty() && lower_text.find(keyword) != std::string::npos) {
						triggered = true;
						break;
					}
				}
				break;
			case RuleKind::REGEX:
				for (const auto &regex : rule.regexes) {
					if (std::regex_search(text, regex)) {
						triggered = true;
						break;
					}
				}
				break;
			case RuleKind::INDICATOR:
				if (!hosts_ready) {
					hosts = ExtractUrlHosts(text);
					std::string target_host = ExtractDomain(lower_target);
					if (!target_host.empty()) {
						hosts.insert(hosts.begin(), target_host);
					}
					hosts_ready = true;
				}
				for (const auto &indicator : rule.lowered) {
					// Channel indicators name the handle itself
					if (!indicator.empty() && indicator[0] == '@') {
						if (indicator == lower_target) {
							triggered = true;
							break;
						}
						continue;
					}
					for (const auto &host : hosts) {
						if (HostMatchesDomain(host, indicator)) {
							triggered = true;
							break;
						}
					}
					if (triggered) {
						break;
					}
				}
				break;
		}
		if (triggered) {
			signals.push_back({rule.definition.name, rule.definition.label, rule.definition.weight});
		}
	}
	return signals;
}

//===--------------------------------------------------------------------===//
// Rule files
//===--------------------------------------------------------------------===//

static RuleDefinition ParseRule(yyjson_val *obj, size_t index) {
	std::string where = "rule #" + std::to_string(index);
	if (!yyjson_is_obj(obj)) {
		throw ConfigException(where + " must be an object");
	}
	RuleDefinition rule;

	yyjson_val *name = yyjson_obj_get(obj, "name");
	if (!yyjson_is_str(name)) {
		throw ConfigException(where + " needs a string \"name\"");
	}
	rule.name = yyjson_get_str(name);
	where = "rule '" + rule.name + "'";

	yyjson_val *label = yyjson_obj_get(obj, "label");
	if (!yyjson_is_str(label) || !TryParseRiskLabel(yyjson_get_str(label), rule.label)) {
		throw ConfigException(where + " needs a known \"label\"");
	}

	yyjson_val *weight = yyjson_obj_get(obj, "weight");
	if (!yyjson_is_num(weight)) {
		throw ConfigException(where + " needs a numeric \"weight\"");
	}
	rule.weight = yyjson_get_num(weight);

	yyjson_val *kind = yyjson_obj_get(obj, "kind");
	if (kind && !(yyjson_is_str(kind) && TryParseRuleKind(yyjson_get_str(kind), rule.kind))) {
		throw ConfigException(where + " has an unknown \"kind\"");
	}

	yyjson_val *patterns = yyjson_obj_get(obj, "patterns");
	if (!yyjson_is_arr(patterns)) {
		throw ConfigException(where + " needs a \"patterns\" array");
	}
	size_t idx, max;
	yyjson_val *item;
	yyjson_arr_foreach(patterns, idx, max, item) {
		if (!yyjson_is_str(item)) {
			throw ConfigException(where + " patterns must be strings");
		}
		rule.patterns.emplace_back(yyjson_get_str(item));
	}
	return rule;
}

RuleEngine RuleEngine::FromJson(const std::string &json) {
	yyjson_read_err err;
	YyjsonDocGuard doc(yyjson_read_opts(const_cast<char *>(json.c_str()), json.size(),
	                                    YYJSON_READ_ALLOW_COMMENTS | YYJSON_READ_ALLOW_TRAILING_COMMAS,
	                                    nullptr, &err));
	if (!doc) {
		throw ConfigException(std::string("malformed rule file at byte ") + std::to_string(err.pos) + ": " +
		                      (err.msg ? err.msg : "unknown error"));
	}

	yyjson_val *list = doc.root();
	if (yyjson_is_obj(list)) {
		list = yyjson_obj_get(list, "rules");
	}
	if (!yyjson_is_arr(list)) {
		throw ConfigException("rule file must contain a \"rules\" array");
	}

	std::vector<RuleDefinition> rules;
	size_t idx, max;
	yyjson_val *item;
	yyjson_arr_foreach(list, idx, max, item) {
		rules.push_back(ParseRule(item, idx));
	}
	return RuleEngine(std::move(rules));
}

RuleEngine RuleEngine::FromFile(const std::string &path) {
	std::ifstream in(path);
	if (!in) {
		throw ConfigException("cannot open rule file '" + path + "'");
	}
	std::stringstream buffer;
	buffer << in.rdbuf();
	return FromJson(buffer.str());
}

std::vector<RuleDefinition> RuleEngine::DefaultRules() {
	return {
	    {"fraud_payment_request", RiskLabel::FRAUD, 0.9, RuleKind::KEYWORD,
	     {"send your bank details", "send bank details", "share your bank details", "pay the processing fee",
	      "pay registration fee", "advance payment required"}},
	    {"fraud_prize_claim", RiskLabel::FRAUD, 0.7, RuleKind::KEYWORD,
	     {"you have won a lottery", "lottery winner", "claim your prize", "you are the lucky winner"}},
	    {"fraud_investment_doubling", RiskLabel::FRAUD, 0.6, RuleKind::REGEX,
	     {R"(\b(double|triple|2x|10x)\s+(your\s+)?(bitcoin|btc|crypto|usdt|investment|money)\b)",
	      R"(\bguaranteed\s+(daily\s+)?(returns?|profits?)\b)"}},
	    {"fraud_task_job", RiskLabel::FRAUD, 0.5, RuleKind::KEYWORD,
	     {"work from home and earn", "earn money from home", "part time job daily payment", "like and earn",
	      "task based job", "earn daily from your phone"}},
	    {"fraud_instant_loan", RiskLabel::FRAUD, 0.4, RuleKind::KEYWORD,
	     {"instant loan without documents", "loan without cibil", "loan approved without verification"}},
	    {"phishing_credential_request", RiskLabel::PHISHING, 0.7, RuleKind::REGEX,
	     {R"(\b(verify|update|confirm)\s+your\s+(account|kyc|pan|password|card|upi)\b)",
	      R"(\b(share|send|enter)\s+(the\s+|your\s+)?otp\b)"}},
	    {"phishing_account_threat", RiskLabel::PHISHING, 0.5, RuleKind::KEYWORD,
	     {"your account will be suspended", "your account has been blocked", "your kyc has expired",
	      "kyc expired"}},
	    {"gambling_betting", RiskLabel::GAMBLING, 0.6, RuleKind::KEYWORD,
	     {"online betting", "satta matka", "casino bonus", "sure shot prediction", "fixed match", "betting tips"}},
	    {"malware_sideload", RiskLabel::MALWARE, 0.6, RuleKind::REGEX,
	     {R"(\b(download|install)\b[^\n]{0,40}\.(apk|exe|scr|bat)\b)", R"(\bmod\s+apk\b)"}},
	    {"suspicious_url_shortener", RiskLabel::SUSPICIOUS, 0.3, RuleKind::INDICATOR,
	     {"bit.ly", "tinyurl.com", "cutt.ly", "is.gd", "rb.gy", "t.ly"}},
	    {"suspicious_urgency", RiskLabel::SUSPICIOUS, 0.2, RuleKind::KEYWORD,
	     {"act now", "limited time offer", "offer valid only today", "hurry up"}},
	};
}

} // namespace linkwatch
