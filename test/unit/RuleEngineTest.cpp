#include <gtest/gtest.h>

#include "pipeline_errors.hpp"
#include "rule_engine.hpp"

using namespace linkwatch;

TEST(RuleEngineTest, DefaultRulesFireInDefinitionOrder) {
	RuleEngine engine(RuleEngine::DefaultRules());
	auto signals = engine.Evaluate(
	    "Congratulations, you have won a lottery! Send your bank details to claim your prize.",
	    "https://example.com/");

	ASSERT_EQ(2u, signals.size());
	EXPECT_EQ("fraud_payment_request", signals[0].rule);
	EXPECT_EQ(RiskLabel::FRAUD, signals[0].label);
	EXPECT_DOUBLE_EQ(0.9, signals[0].weight);
	EXPECT_EQ("fraud_prize_claim", signals[1].rule);
	EXPECT_DOUBLE_EQ(0.7, signals[1].weight);
}

TEST(RuleEngineTest, BenignTextHasNoSignals) {
	RuleEngine engine(RuleEngine::DefaultRules());
	EXPECT_TRUE(engine.Evaluate("Weather forecast: light rain tomorrow afternoon.", "https://example.com/").empty());
	EXPECT_TRUE(engine.Evaluate("", "").empty());
}

TEST(RuleEngineTest, RegexRules) {
	RuleEngine engine(RuleEngine::DefaultRules());
	auto signals = engine.Evaluate("Double your Bitcoin in 24 hours!", "https://example.com/");
	ASSERT_EQ(1u, signals.size());
	EXPECT_EQ("fraud_investment_doubling", signals[0].rule);

	signals = engine.Evaluate("Please share the OTP to verify your account", "https://example.com/");
	ASSERT_EQ(1u, signals.size());
	EXPECT_EQ("phishing_credential_request", signals[0].rule);
	EXPECT_EQ(RiskLabel::PHISHING, signals[0].label);
}

TEST(RuleEngineTest, IndicatorRules) {
	RuleEngine engine(RuleEngine::DefaultRules());

	auto signals = engine.Evaluate("details at https://bit.ly/abc123 today", "https://example.com/");
	ASSERT_EQ(1u, signals.size());
	EXPECT_EQ("suspicious_url_shortener", signals[0].rule);

	// the target itself counts
	signals = engine.Evaluate("nothing to see", "https://go.tinyurl.com/x");
	ASSERT_EQ(1u, signals.size());
	EXPECT_EQ("suspicious_url_shortener", signals[0].rule);

	signals = engine.Evaluate("see www.cutt.ly/promo", "https://example.com/");
	ASSERT_EQ(1u, signals.size());

	EXPECT_TRUE(engine.Evaluate("https://notbit.ly/abc", "https://example.com/").empty());
}

TEST(RuleEngineTest, ChannelIndicator) {
	RuleEngine engine({{"known_scam_channel", RiskLabel::FRAUD, 1.0, RuleKind::INDICATOR, {"@Scam_Channel"}}});
	ASSERT_EQ(1u, engine.Evaluate("", "@scam_channel").size());
	EXPECT_TRUE(engine.Evaluate("@scam_channel mentioned", "@other_channel").empty());
}

TEST(RuleEngineTest, InvalidDefinitions) {
	EXPECT_THROW(RuleEngine({{"", RiskLabel::FRAUD, 0.5, RuleKind::KEYWORD, {"a"}}}), ConfigException);
	EXPECT_THROW(RuleEngine({{"benign", RiskLabel::BENIGN, 0.5, RuleKind::KEYWORD, {"a"}}}), ConfigException);
	EXPECT_THROW(RuleEngine({{"heavy", RiskLabel::FRAUD, 1.5, RuleKind::KEYWORD, {"a"}}}), ConfigException);
	EXPECT_THROW(RuleEngine({{"negative", RiskLabel::FRAUD, -0.1, RuleKind::KEYWORD, {"a"}}}), ConfigException);
	EXPECT_THROW(RuleEngine({{"empty", RiskLabel::FRAUD, 0.5, RuleKind::KEYWORD, {}}}), ConfigException);
	EXPECT_THROW(RuleEngine({{"regex", RiskLabel::FRAUD, 0.5, RuleKind::REGEX, {"(unclosed"}}}), ConfigException);
	EXPECT_THROW(RuleEngine({{"dup", RiskLabel::FRAUD, 0.5, RuleKind::KEYWORD, {"a"}},
	                         {"dup", RiskLabel::PHISHING, 0.5, RuleKind::KEYWORD, {"b"}}}),
	             ConfigException);
}

TEST(RuleEngineTest, FromJson) {
	auto engine = RuleEngine::FromJson(R"({
		// comments are allowed
		"rules": [
			{"name": "casino", "label": "gambling", "weight": 0.8, "kind": "keyword", "patterns": ["jackpot"]},
			{"name": "apk", "label": "MALWARE", "weight": 0.6, "kind": "regex", "patterns": ["\\.apk\\b"]},
		]
	})");
	EXPECT_EQ(2u, engine.RuleCount());

	auto signals = engine.Evaluate("Win the JACKPOT today, install casino.apk", "");
	ASSERT_EQ(2u, signals.size());
	EXPECT_EQ(RiskLabel::GAMBLING, signals[0].label);
	EXPECT_DOUBLE_EQ(0.8, signals[0].weight);
	EXPECT_EQ(RiskLabel::MALWARE, signals[1].label);

	// a bare array works too and kind defaults to keyword
	auto bare = RuleEngine::FromJson(R"([{"name": "x", "label": "fraud", "weight": 1, "patterns": ["wire money"]}])");
	EXPECT_EQ(1u, bare.Evaluate("please WIRE MONEY now", "").size());
}

TEST(RuleEngineTest, FromJsonRejectsBadFiles) {
	EXPECT_THROW(RuleEngine::FromJson("not json"), ConfigException);
	EXPECT_THROW(RuleEngine::FromJson(R"({"other": []})"), ConfigException);
	EXPECT_THROW(RuleEngine::FromJson(R"([{"name": "x", "label": "nope", "weight": 1, "patterns": ["a"]}])"),
	             ConfigException);
	EXPECT_THROW(RuleEngine::FromJson(R"([{"name": "x", "label": "fraud", "weight": "high", "patterns": ["a"]}])"),
	             ConfigException);
	EXPECT_THROW(RuleEngine::FromJson(R"([{"name": "x", "label": "fraud", "weight": 1, "kind": "magic", "patterns": ["a"]}])"),
	             ConfigException);
	EXPECT_THROW(RuleEngine::FromFile("/nonexistent/rules.json"), ConfigException);
}

TEST(RuleEngineTest, ExtractUrlHosts) {
	auto hosts = RuleEngine::ExtractUrlHosts("Go to https://Example.com/a, then http://foo.org and (www.bar.net/x)");
	ASSERT_EQ(3u, hosts.size());
	EXPECT_EQ("example.com", hosts[0]);
	EXPECT_EQ("foo.org", hosts[1]);
	EXPECT_EQ("www.bar.net", hosts[2]);
}
