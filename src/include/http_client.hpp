#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <cstdint>
#include <curl/curl.h>

namespace linkwatch {

struct HttpResponse {
	int status_code = 0;
	std::string body;
	std::string content_type;
	std::string retry_after;
	std::string error;
	int64_t content_length = -1;  // -1 if unknown
	bool success = false;
	bool too_large = false;       // Body exceeded max_response_bytes, aborted
	int curl_code = 0;            // CURLcode of the transfer
	std::string final_url;        // Final URL after redirects
	int redirect_count = 0;       // Number of redirects followed
	int64_t elapsed_ms = 0;
};

struct HttpRequestOptions {
	std::string user_agent;
	int64_t timeout_ms = 30000;
	int64_t connect_timeout_ms = 10000;
	int max_redirects = 10;
	bool compress = true;
	int64_t max_response_bytes = 0;  // 0 = unlimited
	std::string proxy;
	std::string proxy_username;
	std::string proxy_password;
};

// Thread-safe connection pool for curl handles
class HttpConnectionPool {
public:
	HttpConnectionPool();
	~HttpConnectionPool();

	// Disable copy/move
	HttpConnectionPool(const HttpConnectionPool&) = delete;
	HttpConnectionPool& operator=(const HttpConnectionPool&) = delete;

	// Get a curl easy handle (reuses from pool or creates new)
	CURL* AcquireHandle();
	// Return handle to pool for reuse
	void ReleaseHandle(CURL* handle);

private:
	std::mutex pool_mutex_;
	std::vector<CURL*> available_handles_;
	bool initialized_ = false;
};

// Global connection pool access
HttpConnectionPool& GetConnectionPool();

// Initialize HTTP client (call once at startup, before any worker thread)
void InitializeHttpClient();
// Cleanup HTTP client (call at shutdown, after workers joined)
void CleanupHttpClient();

class HttpClient {
public:
	// Single GET attempt; retries are scheduled by the frontier
	static HttpResponse Get(const std::string &url, const HttpRequestOptions &options);

	// POST a JSON document
	static HttpResponse PostJson(const std::string &url, const std::string &json_body,
	                             const HttpRequestOptions &options);

	// Retry-After header in milliseconds, 0 if absent or unparseable
	static int64_t ParseRetryAfter(const std::string &retry_after);

private:
	static HttpResponse Execute(const std::string &url, const std::string *post_body,
	                            const HttpRequestOptions &options);
};

} // namespace linkwatch
