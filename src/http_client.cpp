#include "http_client.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>

namespace linkwatch {

static constexpr size_t MAX_POOLED_HANDLES = 100;

// Global connection pool (singleton)
static HttpConnectionPool* g_connection_pool = nullptr;

HttpConnectionPool& GetConnectionPool() {
	if (!g_connection_pool) {
		g_connection_pool = new HttpConnectionPool();
	}
	return *g_connection_pool;
}

void InitializeHttpClient() {
	curl_global_init(CURL_GLOBAL_DEFAULT);
	// Initialize connection pool
	GetConnectionPool();
}

void CleanupHttpClient() {
	if (g_connection_pool) {
		delete g_connection_pool;
		g_connection_pool = nullptr;
	}
	curl_global_cleanup();
}

HttpConnectionPool::HttpConnectionPool() : initialized_(true) {
}

HttpConnectionPool::~HttpConnectionPool() {
	std::lock_guard<std::mutex> lock(pool_mutex_);
	for (CURL* handle : available_handles_) {
		curl_easy_cleanup(handle);
	}
	available_handles_.clear();
	initialized_ = false;
}

CURL* HttpConnectionPool::AcquireHandle() {
	std::lock_guard<std::mutex> lock(pool_mutex_);
	if (!available_handles_.empty()) {
		CURL* handle = available_handles_.back();
		available_handles_.pop_back();
		curl_easy_reset(handle);  // Reset for reuse but keep connection alive
		return handle;
	}
	return curl_easy_init();
}

void HttpConnectionPool::ReleaseHandle(CURL* handle) {
	if (!handle) return;
	std::lock_guard<std::mutex> lock(pool_mutex_);
	if (initialized_ && available_handles_.size() < MAX_POOLED_HANDLES) {
		available_handles_.push_back(handle);
	} else {
		curl_easy_cleanup(handle);
	}
}

int64_t HttpClient::ParseRetryAfter(const std::string &retry_after) {
	if (retry_after.empty() || !std::isdigit(static_cast<unsigned char>(retry_after[0]))) {
		// HTTP-date form falls back to the domain backoff
		return 0;
	}
	char *end = nullptr;
	long long seconds = std::strtoll(retry_after.c_str(), &end, 10);
	if (seconds < 0) {
		return 0;
	}
	return static_cast<int64_t>(seconds) * 1000;
}

// Callback data structures
struct WriteData {
	std::string* body;
	int64_t max_bytes;
	bool too_large;
};

struct HeaderData {
	std::string content_type;
	std::string retry_after;
	int64_t content_length = -1;
};

// Write callback for response body; returning short aborts the transfer
static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
	size_t total_size = size * nmemb;
	WriteData* data = static_cast<WriteData*>(userp);
	if (data->max_bytes > 0 &&
	    static_cast<int64_t>(data->body->size() + total_size) > data->max_bytes) {
		data->too_large = true;
		return 0;
	}
	data->body->append(static_cast<char*>(contents), total_size);
	return total_size;
}

// Helper to trim whitespace
static std::string TrimString(const std::string& str) {
	size_t start = str.find_first_not_of(" \t\r\n");
	if (start == std::string::npos) return "";
	size_t end = str.find_last_not_of(" \t\r\n");
	return str.substr(start, end - start + 1);
}

// Helper to lowercase string
static std::string ToLower(const std::string& str) {
	std::string result = str;
	std::transform(result.begin(), result.end(), result.begin(),
	               [](unsigned char c) { return std::tolower(c); });
	return result;
}

// Header callback for response headers. Redirect hops reset the status line.
static size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
	size_t total_size = size * nitems;
	HeaderData* headers = static_cast<HeaderData*>(userdata);

	std::string header(buffer, total_size);
	if (header.compare(0, 5, "HTTP/") == 0) {
		*headers = HeaderData();
		return total_size;
	}

	// Find colon separator
	size_t colon_pos = header.find(':');
	if (colon_pos != std::string::npos) {
		std::string name = ToLower(TrimString(header.substr(0, colon_pos)));
		std::string value = TrimString(header.substr(colon_pos + 1));

		if (name == "content-type") {
			headers->content_type = value;
		} else if (name == "retry-after") {
			headers->retry_after = value;
		} else if (name == "content-length") {
			char *end = nullptr;
			long long length = std::strtoll(value.c_str(), &end, 10);
			headers->content_length = (end && end != value.c_str()) ? length : -1;
		}
	}

	return total_size;
}

HttpResponse HttpClient::Execute(const std::string &url, const std::string *post_body,
                                 const HttpRequestOptions &options) {
	HttpResponse response;
	auto start = std::chrono::steady_clock::now();

	auto& pool = GetConnectionPool();
	CURL* curl = pool.AcquireHandle();
	if (!curl) {
		response.error = "Failed to acquire curl handle";
		return response;
	}

	// Response data
	std::string body;
	WriteData write_data{&body, options.max_response_bytes, false};
	HeaderData header_data;

	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
	curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");

	// Set callbacks
	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_data);
	curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
	curl_easy_setopt(curl, CURLOPT_HEADERDATA, &header_data);

	if (!options.user_agent.empty()) {
		curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
	}
	if (options.compress) {
		curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "gzip, deflate");
	}

	curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout_ms));
	curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.connect_timeout_ms));

	if (options.max_redirects > 0) {
		curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
		curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(options.max_redirects));
	}
	if (options.max_response_bytes > 0) {
		curl_easy_setopt(curl, CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(options.max_response_bytes));
	}

	if (!options.proxy.empty()) {
		curl_easy_setopt(curl, CURLOPT_PROXY, options.proxy.c_str());
		if (!options.proxy_username.empty()) {
			curl_easy_setopt(curl, CURLOPT_PROXYUSERNAME, options.proxy_username.c_str());
			curl_easy_setopt(curl, CURLOPT_PROXYPASSWORD, options.proxy_password.c_str());
		}
	}

	struct curl_slist* custom_headers = nullptr;
	if (post_body) {
		custom_headers = curl_slist_append(custom_headers, "Content-Type: application/json");
		custom_headers = curl_slist_append(custom_headers, "Accept: application/json");
		curl_easy_setopt(curl, CURLOPT_POST, 1L);
		curl_easy_setopt(curl, CURLOPT_POSTFIELDS, post_body->c_str());
		curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(post_body->size()));
	}
	if (custom_headers) {
		curl_easy_setopt(curl, CURLOPT_HTTPHEADER, custom_headers);
	}

	// Perform the request
	CURLcode res = curl_easy_perform(curl);
	response.curl_code = static_cast<int>(res);

	if (res == CURLE_OK) {
		long status_code;
		curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);
		response.status_code = static_cast<int>(status_code);

		// Get redirect info
		char* effective_url = nullptr;
		curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective_url);
		if (effective_url) {
			response.final_url = effective_url;
		}
		long redirect_count = 0;
		curl_easy_getinfo(curl, CURLINFO_REDIRECT_COUNT, &redirect_count);
		response.redirect_count = static_cast<int>(redirect_count);

		response.body = std::move(body);
		response.content_type = std::move(header_data.content_type);
		response.retry_after = std::move(header_data.retry_after);
		response.content_length = header_data.content_length;
		response.success = response.status_code >= 200 && response.status_code < 300;
	} else if (write_data.too_large || res == CURLE_FILESIZE_EXCEEDED) {
		response.too_large = true;
		response.error = "response exceeds " + std::to_string(options.max_response_bytes) + " bytes";
	} else {
		response.error = curl_easy_strerror(res);
		response.status_code = 0;
		response.success = false;
	}

	// Cleanup
	if (custom_headers) {
		curl_slist_free_all(custom_headers);
	}
	pool.ReleaseHandle(curl);

	response.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
	                          std::chrono::steady_clock::now() - start).count();
	return response;
}

HttpResponse HttpClient::Get(const std::string &url, const HttpRequestOptions &options) {
	return Execute(url, nullptr, options);
}

HttpResponse HttpClient::PostJson(const std::string &url, const std::string &json_body,
                                  const HttpRequestOptions &options) {
	return Execute(url, &json_body, options);
}

} // namespace linkwatch
