#include "pipeline_config.hpp"
#include "pipeline_errors.hpp"
#include "yyjson_guard.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace linkwatch {

//===--------------------------------------------------------------------===//
// Typed field readers
//===--------------------------------------------------------------------===//

// Each reader leaves the target untouched when the key is absent or null
// and throws when the value has the wrong type.

static void ReadBool(yyjson_val *obj, const char *section, const char *key, bool &target) {
	yyjson_val *val = yyjson_obj_get(obj, key);
	if (!val || yyjson_is_null(val)) {
		return;
	}
	if (!yyjson_is_bool(val)) {
		throw ConfigException(std::string(section) + "." + key + " must be a boolean");
	}
	target = yyjson_get_bool(val);
}

static void ReadDouble(yyjson_val *obj, const char *section, const char *key, double &target) {
	yyjson_val *val = yyjson_obj_get(obj, key);
	if (!val || yyjson_is_null(val)) {
		return;
	}
	if (!yyjson_is_num(val)) {
		throw ConfigException(std::string(section) + "." + key + " must be a number");
	}
	target = yyjson_get_num(val);
}

static void ReadInt64(yyjson_val *obj, const char *section, const char *key, int64_t &target) {
	yyjson_val *val = yyjson_obj_get(obj, key);
	if (!val || yyjson_is_null(val)) {
		return;
	}
	if (!yyjson_is_int(val)) {
		throw ConfigException(std::string(section) + "." + key + " must be an integer");
	}
	target = yyjson_get_sint(val);
}

static void ReadInt(yyjson_val *obj, const char *section, const char *key, int &target) {
	int64_t value = target;
	ReadInt64(obj, section, key, value);
	target = static_cast<int>(value);
}

static void ReadString(yyjson_val *obj, const char *section, const char *key, std::string &target) {
	yyjson_val *val = yyjson_obj_get(obj, key);
	if (!val || yyjson_is_null(val)) {
		return;
	}
	if (!yyjson_is_str(val)) {
		throw ConfigException(std::string(section) + "." + key + " must be a string");
	}
	target = yyjson_get_str(val);
}

// Durations are written in seconds in the config file
static void ReadSecondsAsMs(yyjson_val *obj, const char *section, const char *key, int64_t &target_ms) {
	double seconds = static_cast<double>(target_ms) / 1000.0;
	ReadDouble(obj, section, key, seconds);
	target_ms = static_cast<int64_t>(seconds * 1000.0);
}

static yyjson_val *GetSection(yyjson_val *root, const char *name) {
	yyjson_val *section = yyjson_obj_get(root, name);
	if (!section || yyjson_is_null(section)) {
		return nullptr;
	}
	if (!yyjson_is_obj(section)) {
		throw ConfigException(std::string(name) + " must be an object");
	}
	return section;
}

//===--------------------------------------------------------------------===//
// Sections
//===--------------------------------------------------------------------===//

static void ApplyFetchSection(yyjson_val *obj, FetchConfig &fetch) {
	const char *s = "fetch";
	ReadString(obj, s, "user_agent", fetch.user_agent);
	ReadInt64(obj, s, "timeout_ms", fetch.fetch_timeout_ms);
	ReadInt64(obj, s, "connect_timeout_ms", fetch.connect_timeout_ms);
	ReadInt64(obj, s, "max_response_bytes", fetch.max_response_bytes);
	ReadInt(obj, s, "max_redirects", fetch.max_redirects);
	ReadBool(obj, s, "compress", fetch.compress);
	ReadString(obj, s, "proxy", fetch.proxy);
	ReadString(obj, s, "proxy_username", fetch.proxy_username);
	ReadString(obj, s, "proxy_password", fetch.proxy_password);
	ReadBool(obj, s, "respect_robots_txt", fetch.respect_robots_txt);
	ReadDouble(obj, s, "default_crawl_delay", fetch.default_crawl_delay);
	ReadDouble(obj, s, "min_crawl_delay", fetch.min_crawl_delay);
	ReadDouble(obj, s, "max_crawl_delay", fetch.max_crawl_delay);
	ReadInt(obj, s, "max_retry_backoff_seconds", fetch.max_retry_backoff_seconds);
	ReadString(obj, s, "accept_content_types", fetch.accept_content_types);
	ReadString(obj, s, "reject_content_types", fetch.reject_content_types);
	ReadString(obj, s, "channel_preview_base", fetch.channel_preview_base);
}

static void ApplyExtractSection(yyjson_val *obj, ExtractConfig &extract) {
	const char *s = "extract";
	ReadInt64(obj, s, "max_text_length", extract.max_text_length);
	ReadInt64(obj, s, "max_snippet_length", extract.max_snippet_length);
	ReadInt(obj, s, "channel_sample_size", extract.channel_sample_size);
	ReadBool(obj, s, "follow_links", extract.follow_links);
	ReadBool(obj, s, "discover_channels", extract.discover_channels);
	ReadBool(obj, s, "respect_nofollow", extract.respect_nofollow);
	ReadInt(obj, s, "max_discovery_depth", extract.max_discovery_depth);
	ReadInt(obj, s, "max_links_per_page", extract.max_links_per_page);
}

static void ApplyFrontierSection(yyjson_val *obj, FrontierConfig &frontier) {
	const char *s = "frontier";
	ReadDouble(obj, s, "default_priority", frontier.default_priority);
	ReadDouble(obj, s, "seed_priority", frontier.seed_priority);
	ReadDouble(obj, s, "risk_priority_boost", frontier.risk_priority_boost);
	ReadSecondsAsMs(obj, s, "revisit_interval_benign", frontier.revisit_interval_benign_ms);
	ReadSecondsAsMs(obj, s, "revisit_interval_high_risk", frontier.revisit_interval_high_risk_ms);
	ReadInt(obj, s, "max_retries", frontier.retry.max_retries);
	ReadSecondsAsMs(obj, s, "initial_backoff", frontier.retry.initial_backoff_ms);
	ReadDouble(obj, s, "backoff_multiplier", frontier.retry.backoff_multiplier);
	ReadSecondsAsMs(obj, s, "max_backoff", frontier.retry.max_backoff_ms);
}

static void ApplyEnsembleSection(yyjson_val *obj, EnsembleConfig &ensemble) {
	const char *s = "ensemble";
	ReadDouble(obj, s, "rule_weight", ensemble.rule_weight);
	ReadDouble(obj, s, "uncertainty_band", ensemble.uncertainty_band);
	ReadString(obj, s, "rules_path", ensemble.rules_path);
	ReadString(obj, s, "model_url", ensemble.model_url);
	ReadInt64(obj, s, "model_timeout_ms", ensemble.model_timeout_ms);
	ReadInt(obj, s, "degraded_after_failures", ensemble.degraded_after_failures);
	ReadDouble(obj, s, "channel_threshold", ensemble.channel_threshold);

	yyjson_val *boundaries = yyjson_obj_get(obj, "decision_boundaries");
	if (boundaries && !yyjson_is_null(boundaries)) {
		if (!yyjson_is_arr(boundaries)) {
			throw ConfigException("ensemble.decision_boundaries must be an array of numbers");
		}
		std::vector<double> values;
		size_t idx, max;
		yyjson_val *item;
		yyjson_arr_foreach(boundaries, idx, max, item) {
			if (!yyjson_is_num(item)) {
				throw ConfigException("ensemble.decision_boundaries must be an array of numbers");
			}
			values.push_back(yyjson_get_num(item));
		}
		ensemble.decision_boundaries = values;
	}
}

static void ApplyStoreSection(yyjson_val *obj, StoreConfig &store) {
	const char *s = "store";
	ReadString(obj, s, "database_path", store.database_path);
	ReadInt(obj, s, "duckdb_threads", store.duckdb_threads);
	ReadString(obj, s, "memory_limit", store.memory_limit);
	ReadDouble(obj, s, "high_risk_threshold", store.high_risk_threshold);
	ReadDouble(obj, s, "medium_risk_threshold", store.medium_risk_threshold);
}

static void ApplyWorkerSection(yyjson_val *obj, WorkerConfig &workers) {
	const char *s = "workers";
	ReadInt(obj, s, "threads", workers.worker_threads);
	ReadInt(obj, s, "batch_size", workers.batch_size);
	ReadInt64(obj, s, "idle_poll_interval_ms", workers.idle_poll_interval_ms);
	ReadSecondsAsMs(obj, s, "stats_log_interval", workers.stats_log_interval_ms);
	ReadBool(obj, s, "reuse_unchanged_verdicts", workers.reuse_unchanged_verdicts);
}

static void ApplyFeedbackSection(yyjson_val *obj, FeedbackConfig &feedback) {
	const char *s = "feedback";
	ReadBool(obj, s, "enqueue_low_confidence", feedback.enqueue_low_confidence);
	ReadSecondsAsMs(obj, s, "redelivery_interval", feedback.redelivery_interval_ms);
}

static void ApplyLoggingSection(yyjson_val *obj, LoggingConfig &logging) {
	ReadString(obj, "logging", "level", logging.level);
	ReadString(obj, "logging", "file", logging.file);
}

void ApplyConfigJson(const std::string &json, PipelineConfig &config) {
	yyjson_read_err err;
	YyjsonDocGuard doc(yyjson_read_opts(const_cast<char *>(json.c_str()), json.size(),
	                                    YYJSON_READ_ALLOW_COMMENTS | YYJSON_READ_ALLOW_TRAILING_COMMAS,
	                                    nullptr, &err));
	if (!doc) {
		throw ConfigException(std::string("malformed JSON at byte ") + std::to_string(err.pos) + ": " +
		                      (err.msg ? err.msg : "unknown error"));
	}

	yyjson_val *root = doc.root();
	if (!yyjson_is_obj(root)) {
		throw ConfigException("top-level value must be an object");
	}

	if (auto section = GetSection(root, "fetch")) {
		ApplyFetchSection(section, config.fetch);
	}
	if (auto section = GetSection(root, "extract")) {
		ApplyExtractSection(section, config.extract);
	}
	if (auto section = GetSection(root, "frontier")) {
		ApplyFrontierSection(section, config.frontier);
	}
	if (auto section = GetSection(root, "ensemble")) {
		ApplyEnsembleSection(section, config.ensemble);
	}
	if (auto section = GetSection(root, "store")) {
		ApplyStoreSection(section, config.store);
	}
	if (auto section = GetSection(root, "workers")) {
		ApplyWorkerSection(section, config.workers);
	}
	if (auto section = GetSection(root, "feedback")) {
		ApplyFeedbackSection(section, config.feedback);
	}
	if (auto section = GetSection(root, "logging")) {
		ApplyLoggingSection(section, config.logging);
	}
}

void LoadConfigFile(const std::string &path, PipelineConfig &config) {
	std::ifstream in(path);
	if (!in) {
		throw ConfigException("cannot open config file '" + path + "'");
	}
	std::stringstream buffer;
	buffer << in.rdbuf();
	ApplyConfigJson(buffer.str(), config);
}

//===--------------------------------------------------------------------===//
// Environment
//===--------------------------------------------------------------------===//

static const char *GetEnv(const char *name) {
	const char *value = std::getenv(name);
	if (!value || value[0] == '\0') {
		return nullptr;
	}
	return value;
}

static double EnvToDouble(const char *name, const char *value) {
	try {
		return std::stod(value);
	} catch (const std::exception &) {
		throw ConfigException(std::string(name) + " must be a number, got '" + value + "'");
	}
}

static int64_t EnvToInt64(const char *name, const char *value) {
	try {
		return std::stoll(value);
	} catch (const std::exception &) {
		throw ConfigException(std::string(name) + " must be an integer, got '" + value + "'");
	}
}

void ApplyEnvironmentOverrides(PipelineConfig &config) {
	if (auto value = GetEnv("LINKWATCH_USER_AGENT")) {
		config.fetch.user_agent = value;
	}
	if (auto value = GetEnv("LINKWATCH_MODEL_URL")) {
		config.ensemble.model_url = value;
	}
	if (auto value = GetEnv("LINKWATCH_DB")) {
		config.store.database_path = value;
	}
	if (auto value = GetEnv("LINKWATCH_THRESHOLD")) {
		double threshold = EnvToDouble("LINKWATCH_THRESHOLD", value);
		if (config.ensemble.decision_boundaries.empty()) {
			config.ensemble.decision_boundaries.push_back(threshold);
		} else {
			config.ensemble.decision_boundaries[0] = threshold;
		}
	}
	if (auto value = GetEnv("LINKWATCH_CRAWL_DELAY")) {
		config.fetch.default_crawl_delay = EnvToDouble("LINKWATCH_CRAWL_DELAY", value);
	}
	if (auto value = GetEnv("LINKWATCH_MAX_TEXT_LENGTH")) {
		config.extract.max_text_length = EnvToInt64("LINKWATCH_MAX_TEXT_LENGTH", value);
	}
	if (auto value = GetEnv("LINKWATCH_LOG_LEVEL")) {
		config.logging.level = value;
	}
}

//===--------------------------------------------------------------------===//
// Validation
//===--------------------------------------------------------------------===//

void ValidateConfig(const PipelineConfig &config) {
	if (config.fetch.fetch_timeout_ms <= 0 || config.fetch.connect_timeout_ms <= 0) {
		throw ConfigException("fetch timeouts must be positive");
	}
	if (config.fetch.max_response_bytes <= 0) {
		throw ConfigException("fetch.max_response_bytes must be positive");
	}
	if (config.fetch.min_crawl_delay < 0 || config.fetch.max_crawl_delay < config.fetch.min_crawl_delay) {
		throw ConfigException("fetch crawl delays must satisfy 0 <= min_crawl_delay <= max_crawl_delay");
	}
	if (config.extract.max_text_length <= 0 || config.extract.max_snippet_length < 0) {
		throw ConfigException("extract text limits must be positive");
	}
	if (config.extract.max_discovery_depth < 0) {
		throw ConfigException("extract.max_discovery_depth must not be negative");
	}
	if (config.frontier.retry.max_retries < 1) {
		throw ConfigException("frontier.max_retries must be at least 1");
	}
	if (config.frontier.retry.initial_backoff_ms < 0 || config.frontier.retry.max_backoff_ms < 0 ||
	    config.frontier.retry.backoff_multiplier < 1.0) {
		throw ConfigException("frontier backoff must be non-negative with a multiplier >= 1");
	}
	if (config.frontier.revisit_interval_high_risk_ms <= 0 ||
	    config.frontier.revisit_interval_high_risk_ms > config.frontier.revisit_interval_benign_ms) {
		throw ConfigException("frontier.revisit_interval_high_risk must be positive and not exceed "
		                      "revisit_interval_benign");
	}
	if (config.ensemble.rule_weight < 0.0 || config.ensemble.rule_weight > 1.0) {
		throw ConfigException("ensemble.rule_weight must be within [0, 1]");
	}
	if (config.ensemble.uncertainty_band < 0.0) {
		throw ConfigException("ensemble.uncertainty_band must not be negative");
	}
	for (double boundary : config.ensemble.decision_boundaries) {
		if (boundary < 0.0 || boundary > 1.0) {
			throw ConfigException("ensemble.decision_boundaries must be within [0, 1]");
		}
	}
	if (config.ensemble.channel_threshold < 0.0 || config.ensemble.channel_threshold > 1.0) {
		throw ConfigException("ensemble.channel_threshold must be within [0, 1]");
	}
	if (config.ensemble.model_timeout_ms <= 0) {
		throw ConfigException("ensemble.model_timeout_ms must be positive");
	}
	if (config.store.database_path.empty()) {
		throw ConfigException("store.database_path must not be empty");
	}
	if (config.store.medium_risk_threshold > config.store.high_risk_threshold) {
		throw ConfigException("store.medium_risk_threshold must not exceed high_risk_threshold");
	}
	if (config.workers.worker_threads < 1 || config.workers.worker_threads > 256) {
		throw ConfigException("workers.threads must be within [1, 256]");
	}
	if (config.workers.batch_size < 1) {
		throw ConfigException("workers.batch_size must be at least 1");
	}
	if (config.workers.idle_poll_interval_ms <= 0) {
		throw ConfigException("workers.idle_poll_interval_ms must be positive");
	}
	static const char *LEVELS[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
	bool known_level = false;
	for (const char *level : LEVELS) {
		known_level = known_level || config.logging.level == level;
	}
	if (!known_level) {
		throw ConfigException("logging.level '" + config.logging.level + "' is not a log level");
	}
}

PipelineConfig LoadPipelineConfig(const std::string &path) {
	PipelineConfig config;
	if (!path.empty()) {
		LoadConfigFile(path, config);
	}
	ApplyEnvironmentOverrides(config);
	ValidateConfig(config);
	return config;
}

} // namespace linkwatch
