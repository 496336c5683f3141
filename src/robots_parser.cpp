#include "robots_parser.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace linkwatch {

// Helper: Convert string to lowercase
static std::string ToLower(const std::string &str) {
	std::string result = str;
	std::transform(result.begin(), result.end(), result.begin(),
	               [](unsigned char c) { return std::tolower(c); });
	return result;
}

// Helper: Trim whitespace
static std::string Trim(const std::string &str) {
	size_t start = str.find_first_not_of(" \t\r\n");
	if (start == std::string::npos) return "";
	size_t end = str.find_last_not_of(" \t\r\n");
	return str.substr(start, end - start + 1);
}

// Helper: parse a non-negative number, -1 on failure
static double ParseSeconds(const std::string &value) {
	if (value.empty()) {
		return -1.0;
	}
	char *end = nullptr;
	double seconds = std::strtod(value.c_str(), &end);
	if (end == value.c_str() || seconds < 0) {
		return -1.0;
	}
	return seconds;
}

// Helper: "1/5" or "1/5s" -> 5 seconds per request; "2/1m" -> 30
static double ParseRequestRate(const std::string &value) {
	size_t slash = value.find('/');
	if (slash == std::string::npos) {
		return -1.0;
	}
	double requests = ParseSeconds(Trim(value.substr(0, slash)));
	std::string period = Trim(value.substr(slash + 1));
	if (requests <= 0 || period.empty()) {
		return -1.0;
	}
	double multiplier = 1.0;
	char unit = static_cast<char>(std::tolower(static_cast<unsigned char>(period.back())));
	if (unit == 'm') {
		multiplier = 60.0;
		period.pop_back();
	} else if (unit == 'h') {
		multiplier = 3600.0;
		period.pop_back();
	} else if (unit == 's') {
		period.pop_back();
	}
	double seconds = ParseSeconds(period);
	if (seconds <= 0) {
		return -1.0;
	}
	return seconds * multiplier / requests;
}

double RobotsRules::GetEffectiveDelay() const {
	return std::max(std::max(crawl_delay, request_rate_delay), 0.0);
}

std::string RobotsParser::ProductToken(const std::string &user_agent) {
	std::string token = Trim(user_agent);
	size_t end = token.find_first_of("/ (");
	if (end != std::string::npos) {
		token = token.substr(0, end);
	}
	return ToLower(token);
}

RobotsData RobotsParser::Parse(const std::string &content) {
	RobotsData data;
	std::istringstream stream(content);
	std::string line;

	RobotsGroup current;
	bool in_agent_list = false;  // Last directive was User-agent

	auto flush_group = [&]() {
		if (!current.user_agents.empty()) {
			data.groups.push_back(std::move(current));
		}
		current = RobotsGroup();
	};

	while (std::getline(stream, line)) {
		size_t comment = line.find('#');
		if (comment != std::string::npos) {
			line = line.substr(0, comment);
		}
		size_t colon = line.find(':');
		if (colon == std::string::npos) {
			continue;
		}
		std::string key = ToLower(Trim(line.substr(0, colon)));
		std::string value = Trim(line.substr(colon + 1));

		if (key == "user-agent") {
			if (!in_agent_list) {
				flush_group();
			}
			current.user_agents.push_back(ToLower(value));
			in_agent_list = true;
			continue;
		}
		if (key == "sitemap") {
			if (!value.empty()) {
				data.sitemaps.push_back(value);
			}
			continue;
		}

		in_agent_list = false;
		if (current.user_agents.empty()) {
			// Rules before any User-agent line belong to no group
			continue;
		}
		if (key == "disallow") {
			// Empty Disallow allows everything
			if (!value.empty()) {
				current.rules.rules.push_back({value, false});
			}
		} else if (key == "allow") {
			if (!value.empty()) {
				current.rules.rules.push_back({value, true});
			}
		} else if (key == "crawl-delay") {
			current.rules.crawl_delay = ParseSeconds(value);
		} else if (key == "request-rate") {
			current.rules.request_rate_delay = ParseRequestRate(value);
		}
	}
	flush_group();

	return data;
}

RobotsRules RobotsParser::GetRulesForUserAgent(const RobotsData &data, const std::string &user_agent) {
	std::string token = ProductToken(user_agent);
	const RobotsGroup *best = nullptr;
	size_t best_length = 0;
	const RobotsGroup *wildcard = nullptr;

	for (const auto &group : data.groups) {
		for (const auto &agent : group.user_agents) {
			if (agent == "*") {
				if (!wildcard) {
					wildcard = &group;
				}
				continue;
			}
			if (!token.empty() && token.find(agent) != std::string::npos && agent.length() > best_length) {
				best = &group;
				best_length = agent.length();
			}
		}
	}

	if (best) {
		return best->rules;
	}
	if (wildcard) {
		return wildcard->rules;
	}
	return RobotsRules();
}

// Helper: match path against a robots pattern with '*' wildcards and '$' end anchor
static bool MatchPattern(const std::string &pattern, const std::string &path) {
	bool anchored = !pattern.empty() && pattern.back() == '$';
	std::string pat = anchored ? pattern.substr(0, pattern.length() - 1) : pattern;

	size_t p = 0;
	size_t s = 0;
	size_t star = std::string::npos;
	size_t star_match = 0;
	while (s < path.length()) {
		if (p < pat.length() && pat[p] == '*') {
			star = p++;
			star_match = s;
		} else if (p < pat.length() && pat[p] == path[s]) {
			p++;
			s++;
		} else if (p == pat.length() && !anchored) {
			return true;
		} else if (star != std::string::npos) {
			p = star + 1;
			s = ++star_match;
		} else {
			return false;
		}
	}
	while (p < pat.length() && pat[p] == '*') {
		p++;
	}
	return p == pat.length();
}

bool RobotsParser::IsAllowed(const RobotsRules &rules, const std::string &path) {
	std::string target = path.empty() ? "/" : path;
	if (target == "/robots.txt") {
		return true;
	}

	const RobotsRule *best = nullptr;
	for (const auto &rule : rules.rules) {
		if (!MatchPattern(rule.pattern, target)) {
			continue;
		}
		if (!best || rule.pattern.length() > best->pattern.length() ||
		    (rule.pattern.length() == best->pattern.length() && rule.allow && !best->allow)) {
			best = &rule;
		}
	}
	return !best || best->allow;
}

} // namespace linkwatch
