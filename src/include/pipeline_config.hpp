#pragma once

//===--------------------------------------------------------------------===//
// pipeline_config.hpp - Operator configuration
//===--------------------------------------------------------------------===//
// Defaults, then a JSON config file, then LINKWATCH_* environment variables.

#include <cstdint>
#include <string>
#include <vector>

namespace linkwatch {

struct RetryConfig {
	int max_retries = 3;
	int64_t initial_backoff_ms = 30000;
	double backoff_multiplier = 2.0;
	int64_t max_backoff_ms = 3600000;
};

struct FetchConfig {
	std::string user_agent = "linkwatch/1.0 (+https://example.com/contact)";
	int64_t fetch_timeout_ms = 15000;
	int64_t connect_timeout_ms = 10000;
	int64_t max_response_bytes = 10 * 1024 * 1024;  // 10MB
	int max_redirects = 10;
	bool compress = true;
	std::string proxy;
	std::string proxy_username;
	std::string proxy_password;
	bool respect_robots_txt = true;
	double default_crawl_delay = 2.0;   // Seconds between requests to one domain
	double min_crawl_delay = 0.0;
	double max_crawl_delay = 60.0;
	int max_retry_backoff_seconds = 600; // Domain block after 429/5XX
	std::string accept_content_types = "text/html, application/xhtml+xml, text/plain";
	std::string reject_content_types;
	std::string channel_preview_base = "https://t.me/s/";
};

struct ExtractConfig {
	int64_t max_text_length = 20000;
	int64_t max_snippet_length = 2000;
	int channel_sample_size = 200;     // Most recent channel messages kept
	bool follow_links = true;
	bool discover_channels = true;
	bool respect_nofollow = true;
	int max_discovery_depth = 3;
	int max_links_per_page = 500;
};

struct FrontierConfig {
	double default_priority = 1.0;
	double seed_priority = 10.0;
	double risk_priority_boost = 5.0;
	int64_t revisit_interval_benign_ms = 7LL * 24 * 3600 * 1000;
	int64_t revisit_interval_high_risk_ms = 6LL * 3600 * 1000;
	RetryConfig retry;
};

struct EnsembleConfig {
	double rule_weight = 0.7;  // Model weight is 1 - rule_weight
	std::vector<double> decision_boundaries = {0.5};
	double uncertainty_band = 0.1;
	std::string rules_path;    // Empty: built-in rule set
	std::string model_url;     // Empty: rule-only classification
	int64_t model_timeout_ms = 10000;
	int degraded_after_failures = 3;
	// A channel is flagged when the average or 90th percentile risk of its
	// sampled messages reaches this
	double channel_threshold = 0.6;
};

struct StoreConfig {
	std::string database_path = "linkwatch.duckdb";
	int duckdb_threads = 0;      // 0 = DuckDB default
	std::string memory_limit;    // e.g. "1GB", empty = DuckDB default
	double high_risk_threshold = 0.8;
	double medium_risk_threshold = 0.6;
};

struct WorkerConfig {
	int worker_threads = 4;
	int batch_size = 8;
	int64_t idle_poll_interval_ms = 500;
	int64_t stats_log_interval_ms = 60000;
	bool reuse_unchanged_verdicts = true;
};

struct FeedbackConfig {
	bool enqueue_low_confidence = true;
	int64_t redelivery_interval_ms = 3600000;
};

struct LoggingConfig {
	std::string level = "info";
	std::string file;
};

struct PipelineConfig {
	FetchConfig fetch;
	ExtractConfig extract;
	FrontierConfig frontier;
	EnsembleConfig ensemble;
	StoreConfig store;
	WorkerConfig workers;
	FeedbackConfig feedback;
	LoggingConfig logging;
};

// Parse a JSON config document over the current values of config.
// Throws ConfigException on malformed JSON or wrongly typed values.
void ApplyConfigJson(const std::string &json, PipelineConfig &config);

// Read and apply a JSON config file
void LoadConfigFile(const std::string &path, PipelineConfig &config);

// Apply LINKWATCH_* environment overrides
void ApplyEnvironmentOverrides(PipelineConfig &config);

// Throws ConfigException describing the first invalid value
void ValidateConfig(const PipelineConfig &config);

// Defaults + optional file + environment, validated
PipelineConfig LoadPipelineConfig(const std::string &path);

} // namespace linkwatch
