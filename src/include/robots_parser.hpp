#pragma once

#include <string>
#include <vector>

namespace linkwatch {

struct RobotsRule {
	std::string pattern;  // Path prefix, may contain '*' and a trailing '$'
	bool allow = false;
};

// Rules that apply to one user agent
struct RobotsRules {
	std::vector<RobotsRule> rules;
	double crawl_delay = -1.0;         // Crawl-delay seconds, -1 if absent
	double request_rate_delay = -1.0;  // Request-rate converted to seconds per request

	bool HasCrawlDelay() const { return crawl_delay >= 0 || request_rate_delay >= 0; }
	double GetEffectiveDelay() const;
};

struct RobotsGroup {
	std::vector<std::string> user_agents;  // Lower-case product tokens
	RobotsRules rules;
};

struct RobotsData {
	std::vector<RobotsGroup> groups;
	std::vector<std::string> sitemaps;
};

class RobotsParser {
public:
	// Parse a robots.txt body. Never fails; unknown lines are ignored.
	static RobotsData Parse(const std::string &content);

	// Most specific group matching the user agent's product token, else "*"
	static RobotsRules GetRulesForUserAgent(const RobotsData &data, const std::string &user_agent);

	// Longest matching rule wins, Allow wins ties. Path includes the query string.
	static bool IsAllowed(const RobotsRules &rules, const std::string &path);

	// "linkwatch/1.0 (+https://...)" -> "linkwatch"
	static std::string ProductToken(const std::string &user_agent);
};

} // namespace linkwatch
