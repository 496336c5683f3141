#pragma once

//===--------------------------------------------------------------------===//
// fetch_client.hpp - Single fetch of a page URL or channel handle
//===--------------------------------------------------------------------===//
// Failures are reported through FetchResult::outcome, never thrown.

#include "crawler_utils.hpp"
#include "domain_throttle.hpp"
#include "http_client.hpp"
#include "pipeline_config.hpp"
#include "pipeline_types.hpp"

#include <string>

namespace linkwatch {

class FetchClient {
public:
	virtual ~FetchClient() = default;

	// One attempt. raw_content is set only on SUCCESS; discovered_targets
	// is left for the extractor.
	virtual FetchResult Fetch(const std::string &identifier, TargetKind kind) = 0;
};

// libcurl-backed client with robots.txt, per-domain politeness and a
// content-type filter
class HttpFetchClient : public FetchClient {
public:
	explicit HttpFetchClient(const FetchConfig &config);

	FetchResult Fetch(const std::string &identifier, TargetKind kind) override;

	// URL actually requested for a target (channels use their web preview)
	std::string FetchUrlFor(const std::string &identifier, TargetKind kind) const;

	DomainThrottle &Throttle() { return throttle_; }

private:
	void EnsureRobots(DomainState &state, const std::string &url);
	static void Fail(FetchResult &result, CrawlErrorType type, const std::string &error);

	FetchConfig config_;
	HttpRequestOptions options_;
	DomainThrottle throttle_;
};

} // namespace linkwatch
