#pragma once

//===--------------------------------------------------------------------===//
// rule_engine.hpp - Deterministic weighted risk rules
//===--------------------------------------------------------------------===//
// Rules are side-effect free. Evaluate() reports triggered rules in rule
// definition order.

#include "pipeline_types.hpp"

#include <regex>
#include <string>
#include <vector>

namespace linkwatch {

enum class RuleKind : uint8_t {
	KEYWORD = 0,   // Case-insensitive substring, any pattern
	REGEX = 1,     // ECMAScript, case-insensitive, any pattern
	INDICATOR = 2  // Host list, matched against the target and URL hosts in the text
};

const char *RuleKindToString(RuleKind kind);
bool TryParseRuleKind(const std::string &str, RuleKind &out);

struct RuleDefinition {
	std::string name;
	RiskLabel label = RiskLabel::SUSPICIOUS;
	double weight = 0.0;
	RuleKind kind = RuleKind::KEYWORD;
	std::vector<std::string> patterns;
};

class RuleEngine {
public:
	// Throws ConfigException on empty names, BENIGN labels, weights outside
	// [0, 1] or invalid regular expressions
	explicit RuleEngine(std::vector<RuleDefinition> rules);

	// {"rules": [{"name", "label", "weight", "kind", "patterns"}]} or a bare array
	static RuleEngine FromJson(const std::string &json);
	static RuleEngine FromFile(const std::string &path);

	// Built-in rule set used when no rule file is configured
	static std::vector<RuleDefinition> DefaultRules();

	std::vector<RuleSignal> Evaluate(const std::string &text, const std::string &target) const;

	size_t RuleCount() const { return rules_.size(); }

	// Hosts of http(s) URLs and www. names mentioned in text
	static std::vector<std::string> ExtractUrlHosts(const std::string &text);

private:
	struct CompiledRule {
		RuleDefinition definition;
		std::vector<std::string> lowered;  // KEYWORD and INDICATOR patterns
		std::vector<std::regex> regexes;
	};

	std::vector<CompiledRule> rules_;
};

} // namespace linkwatch
