#include "fetch_client.hpp"
#include "robots_parser.hpp"

#include <spdlog/spdlog.h>

#include <thread>

namespace linkwatch {

static constexpr int64_t MAX_ROBOTS_BYTES = 512 * 1024;

static ThrottleSettings MakeThrottleSettings(const FetchConfig &config) {
	ThrottleSettings settings;
	settings.default_crawl_delay = config.default_crawl_delay;
	settings.min_crawl_delay = config.min_crawl_delay;
	settings.max_crawl_delay = config.max_crawl_delay;
	settings.max_retry_backoff_seconds = config.max_retry_backoff_seconds;
	return settings;
}

HttpFetchClient::HttpFetchClient(const FetchConfig &config)
    : config_(config), throttle_(MakeThrottleSettings(config)) {
	options_.user_agent = config.user_agent;
	options_.timeout_ms = config.fetch_timeout_ms;
	options_.connect_timeout_ms = config.connect_timeout_ms;
	options_.max_redirects = config.max_redirects;
	options_.compress = config.compress;
	options_.max_response_bytes = config.max_response_bytes;
	options_.proxy = config.proxy;
	options_.proxy_username = config.proxy_username;
	options_.proxy_password = config.proxy_password;
}

std::string HttpFetchClient::FetchUrlFor(const std::string &identifier, TargetKind kind) const {
	if (kind == TargetKind::CHANNEL) {
		std::string handle = identifier;
		if (!handle.empty() && handle[0] == '@') {
			handle = handle.substr(1);
		}
		return config_.channel_preview_base + handle;
	}
	return identifier;
}

void HttpFetchClient::Fail(FetchResult &result, CrawlErrorType type, const std::string &error) {
	result.outcome = OutcomeForError(type, result.status_code);
	result.error_type = ErrorTypeToString(type);
	result.error = error;
	result.raw_content.clear();
}

void HttpFetchClient::EnsureRobots(DomainState &state, const std::string &url) {
	if (!throttle_.NeedsRobots(state)) {
		return;
	}
	// Fetched outside the domain lock; ApplyRobots keeps the first result
	size_t path_start = url.find('/', url.find("://") + 3);
	std::string robots_url = url.substr(0, path_start) + "/robots.txt";

	HttpRequestOptions robots_options = options_;
	robots_options.max_response_bytes = MAX_ROBOTS_BYTES;
	auto response = HttpClient::Get(robots_url, robots_options);

	if (response.success) {
		auto robots_data = RobotsParser::Parse(response.body);
		auto rules = RobotsParser::GetRulesForUserAgent(robots_data, config_.user_agent);
		spdlog::debug("robots.txt for {}: {} rules, crawl delay {}", robots_url, rules.rules.size(),
		              rules.HasCrawlDelay() ? rules.GetEffectiveDelay() : config_.default_crawl_delay);
		throttle_.ApplyRobots(state, &rules);
	} else {
		spdlog::debug("robots.txt unavailable for {} (status {}), allowing all", robots_url, response.status_code);
		throttle_.ApplyRobots(state, nullptr);
	}
}

FetchResult HttpFetchClient::Fetch(const std::string &identifier, TargetKind kind) {
	FetchResult result;
	result.target = identifier;
	result.timestamp = Clock::now();

	std::string url = FetchUrlFor(identifier, kind);
	std::string domain = ExtractDomain(url);
	if (domain.empty()) {
		Fail(result, CrawlErrorType::INVALID_TARGET, "cannot derive a URL from '" + identifier + "'");
		return result;
	}

	auto &state = throttle_.GetOrCreate(domain);

	auto blocked = throttle_.BlockedFor(state, std::chrono::steady_clock::now());
	if (blocked.count() > 0) {
		Fail(result, CrawlErrorType::DOMAIN_BLOCKED,
		     "domain " + domain + " blocked for another " + std::to_string(blocked.count()) + " ms");
		result.deferred_for = std::chrono::duration_cast<Duration>(blocked);
		return result;
	}

	if (config_.respect_robots_txt) {
		EnsureRobots(state, url);
		if (!throttle_.IsAllowed(state, ExtractPath(url))) {
			Fail(result, CrawlErrorType::ROBOTS_DISALLOWED, "robots.txt disallow");
			return result;
		}
	}

	// Enforce per-domain rate limit
	auto wait = throttle_.ReserveSlot(state, std::chrono::steady_clock::now());
	if (wait.count() > 0) {
		std::this_thread::sleep_for(wait);
	}

	auto response = HttpClient::Get(url, options_);
	result.timestamp = Clock::now();
	result.status_code = response.status_code;
	result.elapsed_ms = response.elapsed_ms;
	result.final_url = response.final_url;
	result.content_type = response.content_type;

	if (response.too_large) {
		Fail(result, CrawlErrorType::CONTENT_TOO_LARGE, response.error);
		return result;
	}

	if (!response.success) {
		CrawlErrorType type = ClassifyError(response.status_code, response.error);
		std::string error = response.error.empty() ? "HTTP " + std::to_string(response.status_code) : response.error;
		Fail(result, type, error);
		// Rate limits, server errors and network trouble slow the whole domain down
		if (type == CrawlErrorType::HTTP_RATE_LIMITED || type == CrawlErrorType::HTTP_SERVER_ERROR ||
		    type == CrawlErrorType::NETWORK_TIMEOUT || type == CrawlErrorType::NETWORK_CONNECTION_REFUSED) {
			auto block = throttle_.RecordThrottled(state, HttpClient::ParseRetryAfter(response.retry_after),
			                                       std::chrono::steady_clock::now());
			spdlog::debug("{}: {} ({}), blocking {} for {} ms", url, error, result.error_type, domain, block.count());
		}
		return result;
	}

	throttle_.RecordSuccess(state, static_cast<double>(response.elapsed_ms), std::chrono::steady_clock::now());

	if (!IsContentTypeAcceptable(response.content_type, config_.accept_content_types,
	                             config_.reject_content_types)) {
		Fail(result, CrawlErrorType::CONTENT_TYPE_REJECTED, "Content-Type rejected: " + response.content_type);
		return result;
	}

	// Some servers gzip without announcing it
	if (IsGzippedData(response.body)) {
		std::string inflated = DecompressGzip(response.body);
		if (!inflated.empty()) {
			response.body = std::move(inflated);
		}
	}

	result.outcome = FetchOutcome::SUCCESS;
	result.raw_content = std::move(response.body);
	return result;
}

} // namespace linkwatch
