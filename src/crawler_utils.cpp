#include "crawler_utils.hpp"
#include "pipeline_config.hpp"
#include "pipeline_errors.hpp"
#include <zlib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <sstream>
#include <vector>
#include <cctype>

namespace linkwatch {

static constexpr size_t MAX_URL_LENGTH = 2048;
static constexpr size_t MIN_HANDLE_LENGTH = 5;
static constexpr size_t MAX_HANDLE_LENGTH = 32;

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

static bool IsAllDigits(const std::string &str) {
	return !str.empty() && std::all_of(str.begin(), str.end(),
	                                   [](unsigned char c) { return std::isdigit(c); });
}

static bool StartsWith(const std::string &str, const std::string &prefix) {
	return str.compare(0, prefix.length(), prefix) == 0;
}

//===--------------------------------------------------------------------===//
// Error Classification
//===--------------------------------------------------------------------===//

const char* ErrorTypeToString(CrawlErrorType type) {
	switch (type) {
		case CrawlErrorType::NONE: return "";
		case CrawlErrorType::NETWORK_TIMEOUT: return "network_timeout";
		case CrawlErrorType::NETWORK_DNS_FAILURE: return "network_dns_failure";
		case CrawlErrorType::NETWORK_CONNECTION_REFUSED: return "network_connection_refused";
		case CrawlErrorType::NETWORK_SSL_ERROR: return "network_ssl_error";
		case CrawlErrorType::HTTP_CLIENT_ERROR: return "http_client_error";
		case CrawlErrorType::HTTP_SERVER_ERROR: return "http_server_error";
		case CrawlErrorType::HTTP_RATE_LIMITED: return "http_rate_limited";
		case CrawlErrorType::ROBOTS_DISALLOWED: return "robots_disallowed";
		case CrawlErrorType::CONTENT_TOO_LARGE: return "content_too_large";
		case CrawlErrorType::CONTENT_TYPE_REJECTED: return "content_type_rejected";
		case CrawlErrorType::INVALID_TARGET: return "invalid_target";
		case CrawlErrorType::DOMAIN_BLOCKED: return "domain_blocked";
		default: return "unknown";
	}
}

CrawlErrorType ClassifyError(int status_code, const std::string &error_msg) {
	if (status_code == 429) return CrawlErrorType::HTTP_RATE_LIMITED;
	if (status_code >= 500 && status_code < 600) return CrawlErrorType::HTTP_SERVER_ERROR;
	if (status_code >= 400 && status_code < 500) return CrawlErrorType::HTTP_CLIENT_ERROR;
	if (status_code <= 0) {
		// Network error - classify from message
		if (error_msg.find("timeout") != std::string::npos ||
		    error_msg.find("Timeout") != std::string::npos) {
			return CrawlErrorType::NETWORK_TIMEOUT;
		}
		if (error_msg.find("DNS") != std::string::npos ||
		    error_msg.find("resolve host") != std::string::npos) {
			return CrawlErrorType::NETWORK_DNS_FAILURE;
		}
		if (error_msg.find("SSL") != std::string::npos ||
		    error_msg.find("certificate") != std::string::npos) {
			return CrawlErrorType::NETWORK_SSL_ERROR;
		}
		if (error_msg.find("refused") != std::string::npos ||
		    error_msg.find("connect") != std::string::npos) {
			return CrawlErrorType::NETWORK_CONNECTION_REFUSED;
		}
		return CrawlErrorType::NETWORK_TIMEOUT;  // Default network error
	}
	return CrawlErrorType::NONE;
}

FetchOutcome OutcomeForError(CrawlErrorType type, int status_code) {
	switch (type) {
		case CrawlErrorType::NONE:
			return FetchOutcome::SUCCESS;
		case CrawlErrorType::NETWORK_TIMEOUT:
		case CrawlErrorType::NETWORK_CONNECTION_REFUSED:
		case CrawlErrorType::NETWORK_SSL_ERROR:
		case CrawlErrorType::HTTP_SERVER_ERROR:
		case CrawlErrorType::HTTP_RATE_LIMITED:
		case CrawlErrorType::DOMAIN_BLOCKED:
			return FetchOutcome::TRANSIENT_FAILURE;
		case CrawlErrorType::HTTP_CLIENT_ERROR:
			return status_code == 408 ? FetchOutcome::TRANSIENT_FAILURE : FetchOutcome::PERMANENT_FAILURE;
		case CrawlErrorType::NETWORK_DNS_FAILURE:
		case CrawlErrorType::ROBOTS_DISALLOWED:
		case CrawlErrorType::CONTENT_TOO_LARGE:
		case CrawlErrorType::CONTENT_TYPE_REJECTED:
		case CrawlErrorType::INVALID_TARGET:
		default:
			return FetchOutcome::PERMANENT_FAILURE;
	}
}

//===--------------------------------------------------------------------===//
// Compression Utilities
//===--------------------------------------------------------------------===//

std::string DecompressGzip(const std::string &compressed_data) {
	if (compressed_data.empty()) {
		return "";
	}

	z_stream zs;
	memset(&zs, 0, sizeof(zs));

	// Use inflateInit2 with 16+MAX_WBITS to handle gzip format
	if (inflateInit2(&zs, 16 + MAX_WBITS) != Z_OK) {
		return "";
	}

	zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed_data.data()));
	zs.avail_in = static_cast<uInt>(compressed_data.size());

	std::string decompressed;
	char buffer[32768];

	int ret;
	do {
		zs.next_out = reinterpret_cast<Bytef*>(buffer);
		zs.avail_out = sizeof(buffer);

		ret = inflate(&zs, Z_NO_FLUSH);

		if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
			inflateEnd(&zs);
			return "";
		}
		// Truncated stream: no progress possible
		if (ret == Z_BUF_ERROR && zs.avail_in == 0) {
			inflateEnd(&zs);
			return "";
		}

		size_t have = sizeof(buffer) - zs.avail_out;
		decompressed.append(buffer, have);
	} while (ret != Z_STREAM_END);

	inflateEnd(&zs);
	return decompressed;
}

bool IsGzippedData(const std::string &data) {
	return data.size() >= 2 &&
	       static_cast<unsigned char>(data[0]) == 0x1f &&
	       static_cast<unsigned char>(data[1]) == 0x8b;
}

//===--------------------------------------------------------------------===//
// Backoff
//===--------------------------------------------------------------------===//

int64_t ExponentialBackoffMs(int n, const RetryConfig &config) {
	if (n < 1) {
		n = 1;
	}
	double delay = static_cast<double>(config.initial_backoff_ms) * std::pow(config.backoff_multiplier, n - 1);
	if (!std::isfinite(delay) || delay > static_cast<double>(config.max_backoff_ms)) {
		return config.max_backoff_ms;
	}
	return static_cast<int64_t>(delay);
}

//===--------------------------------------------------------------------===//
// Identifier Canonicalization
//===--------------------------------------------------------------------===//

std::string NormalizeUrlPath(const std::string &path) {
	std::vector<std::string> segments;
	size_t pos = 0;

	while (pos < path.length()) {
		size_t next = path.find('/', pos);
		if (next == std::string::npos) {
			next = path.length();
		}

		std::string segment = path.substr(pos, next - pos);

		if (segment == "..") {
			if (!segments.empty()) {
				segments.pop_back();
			}
		} else if (segment != "." && !segment.empty()) {
			segments.push_back(segment);
		}

		pos = next + 1;
	}

	std::string result = "/";
	for (size_t i = 0; i < segments.size(); i++) {
		result += segments[i];
		if (i < segments.size() - 1) {
			result += "/";
		}
	}

	// Preserve trailing slash if original had one
	if (path.length() > 1 && path.back() == '/' && result.back() != '/') {
		result += "/";
	}

	return result;
}

std::string CanonicalizeUrl(const std::string &url) {
	std::string input = Trim(url);
	if (input.empty() || input.length() > MAX_URL_LENGTH) {
		return "";
	}
	for (char c : input) {
		if (std::isspace(static_cast<unsigned char>(c)) || std::iscntrl(static_cast<unsigned char>(c))) {
			return "";
		}
	}

	std::string scheme;
	std::string rest;
	bool explicit_scheme = false;
	size_t first_delim = input.find_first_of("/?#");
	size_t proto_end = input.find("://");
	if (proto_end != std::string::npos && (first_delim == std::string::npos || proto_end < first_delim)) {
		scheme = ToLower(input.substr(0, proto_end));
		rest = input.substr(proto_end + 3);
		explicit_scheme = true;
	} else if (StartsWith(input, "//")) {
		scheme = "https";
		rest = input.substr(2);
		explicit_scheme = true;
	} else {
		// Bare host, unless the prefix is a non-URL scheme such as mailto:
		size_t colon = input.find(':');
		if (colon != std::string::npos && (first_delim == std::string::npos || colon < first_delim)) {
			size_t port_end = input.find_first_of("/?#", colon);
			std::string after = port_end == std::string::npos ? input.substr(colon + 1)
			                                                  : input.substr(colon + 1, port_end - colon - 1);
			if (!IsAllDigits(after)) {
				return "";
			}
		}
		scheme = "https";
		rest = input;
	}
	if (scheme != "http" && scheme != "https") {
		return "";
	}

	size_t authority_end = rest.find_first_of("/?#");
	std::string authority = rest.substr(0, authority_end);
	std::string tail = authority_end == std::string::npos ? "" : rest.substr(authority_end);

	// Drop userinfo
	size_t at = authority.rfind('@');
	if (at != std::string::npos) {
		authority = authority.substr(at + 1);
	}

	std::string host = authority;
	std::string port;
	if (!host.empty() && host[0] == '[') {
		size_t close = host.find(']');
		if (close == std::string::npos) {
			return "";
		}
		if (close + 1 < host.length()) {
			if (host[close + 1] != ':') {
				return "";
			}
			port = host.substr(close + 2);
		}
		host = host.substr(0, close + 1);
	} else {
		size_t colon = host.rfind(':');
		if (colon != std::string::npos) {
			port = host.substr(colon + 1);
			host = host.substr(0, colon);
		}
	}

	host = ToLower(host);
	while (!host.empty() && host.back() == '.') {
		host.pop_back();
	}
	if (host.empty() || host.find_first_of("<>\"'{}|\\^`%") != std::string::npos) {
		return "";
	}
	if (!explicit_scheme && host.find('.') == std::string::npos) {
		return "";
	}

	if (!port.empty()) {
		if (!IsAllDigits(port) || port.length() > 5) {
			return "";
		}
		int port_num = std::stoi(port);
		if (port_num <= 0 || port_num > 65535) {
			return "";
		}
		if ((scheme == "http" && port_num == 80) || (scheme == "https" && port_num == 443)) {
			port.clear();
		} else {
			port = std::to_string(port_num);
		}
	}

	size_t hash = tail.find('#');
	if (hash != std::string::npos) {
		tail = tail.substr(0, hash);
	}
	std::string query;
	size_t query_pos = tail.find('?');
	if (query_pos != std::string::npos) {
		query = tail.substr(query_pos + 1);
		tail = tail.substr(0, query_pos);
	}

	std::string path = tail.empty() ? "/" : NormalizeUrlPath(tail);
	while (path.length() > 1 && path.back() == '/') {
		path.pop_back();
	}

	std::string result = scheme + "://" + host;
	if (!port.empty()) {
		result += ":" + port;
	}
	result += path;
	if (!query.empty()) {
		result += "?" + query;
	}
	return result;
}

bool IsChannelHost(const std::string &host) {
	std::string lower = ToLower(host);
	if (StartsWith(lower, "www.")) {
		lower = lower.substr(4);
	}
	return lower == "t.me" || lower == "telegram.me" || lower == "telegram.dog";
}

std::string CanonicalizeChannelHandle(const std::string &input) {
	std::string text = ToLower(Trim(input));
	if (text.empty()) {
		return "";
	}

	std::string handle;
	if (text[0] == '@') {
		handle = text.substr(1);
	} else {
		std::string rest = text;
		size_t proto_end = rest.find("://");
		if (proto_end != std::string::npos) {
			std::string scheme = rest.substr(0, proto_end);
			if (scheme != "http" && scheme != "https") {
				return "";
			}
			rest = rest.substr(proto_end + 3);
		}
		size_t slash = rest.find('/');
		if (slash != std::string::npos) {
			if (!IsChannelHost(rest.substr(0, slash))) {
				return "";
			}
			std::string path = rest.substr(slash + 1);
			if (StartsWith(path, "s/")) {
				path = path.substr(2);
			}
			// Invite links name private chats
			if (StartsWith(path, "joinchat/") || StartsWith(path, "+")) {
				return "";
			}
			handle = path.substr(0, path.find_first_of("/?#"));
		} else if (proto_end != std::string::npos) {
			return "";
		} else {
			handle = rest;
		}
	}

	if (handle.length() < MIN_HANDLE_LENGTH || handle.length() > MAX_HANDLE_LENGTH) {
		return "";
	}
	for (char c : handle) {
		if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
			return "";
		}
	}
	return "@" + handle;
}

std::string CanonicalizeIdentifier(const std::string &input, TargetKind &kind) {
	std::string trimmed = Trim(input);
	if (trimmed.empty()) {
		return "";
	}
	if (trimmed[0] == '@') {
		kind = TargetKind::CHANNEL;
		return CanonicalizeChannelHandle(trimmed);
	}

	std::string url = CanonicalizeUrl(trimmed);
	if (!url.empty()) {
		if (IsChannelHost(ExtractDomain(url))) {
			kind = TargetKind::CHANNEL;
			return CanonicalizeChannelHandle(url);
		}
		kind = TargetKind::PAGE;
		return url;
	}

	std::string handle = CanonicalizeChannelHandle(trimmed);
	if (!handle.empty()) {
		kind = TargetKind::CHANNEL;
	}
	return handle;
}

std::string RequireCanonicalIdentifier(const std::string &input, TargetKind kind) {
	std::string canonical = kind == TargetKind::CHANNEL ? CanonicalizeChannelHandle(input) : CanonicalizeUrl(input);
	if (canonical.empty()) {
		throw InvalidInputException(std::string("invalid ") + TargetKindToString(kind) + " identifier '" + input +
		                            "'");
	}
	return canonical;
}

//===--------------------------------------------------------------------===//
// URL Utilities
//===--------------------------------------------------------------------===//

std::string ExtractDomain(const std::string &url) {
	size_t proto_end = url.find("://");
	if (proto_end == std::string::npos) {
		return "";
	}
	size_t domain_start = proto_end + 3;
	size_t domain_end = url.find_first_of("/?#", domain_start);
	if (domain_end == std::string::npos) {
		domain_end = url.length();
	}
	std::string domain = url.substr(domain_start, domain_end - domain_start);

	size_t at = domain.rfind('@');
	if (at != std::string::npos) {
		domain = domain.substr(at + 1);
	}

	// Remove port if present
	if (!domain.empty() && domain[0] == '[') {
		size_t close = domain.find(']');
		if (close != std::string::npos) {
			domain = domain.substr(0, close + 1);
		}
	} else {
		size_t port_pos = domain.find(':');
		if (port_pos != std::string::npos) {
			domain = domain.substr(0, port_pos);
		}
	}

	return ToLower(domain);
}

std::string ExtractPath(const std::string &url) {
	size_t proto_end = url.find("://");
	if (proto_end == std::string::npos) {
		return "/";
	}
	size_t path_start = url.find_first_of("/?", proto_end + 3);
	if (path_start == std::string::npos) {
		return "/";
	}
	std::string path = url.substr(path_start);
	size_t frag = path.find('#');
	if (frag != std::string::npos) {
		path = path.substr(0, frag);
	}
	if (path.empty() || path[0] == '?') {
		path = "/" + path;
	}
	return path;
}

std::string TargetDomain(const std::string &identifier, TargetKind kind) {
	if (kind == TargetKind::CHANNEL) {
		return "t.me";
	}
	return ExtractDomain(identifier);
}

bool HostMatchesDomain(const std::string &host, const std::string &domain) {
	if (host.empty() || domain.empty()) {
		return false;
	}
	std::string h = ToLower(host);
	std::string d = ToLower(domain);
	if (h == d) {
		return true;
	}
	std::string suffix = "." + d;
	return h.length() > suffix.length() && h.compare(h.length() - suffix.length(), suffix.length(), suffix) == 0;
}

std::string GenerateContentHash(const std::string &content) {
	uint64_t hash = 14695981039346656037ULL;
	for (unsigned char c : content) {
		hash ^= c;
		hash *= 1099511628211ULL;
	}
	char buf[17];
	snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
	return std::string(buf);
}

//===--------------------------------------------------------------------===//
// Content-Type Utilities
//===--------------------------------------------------------------------===//

bool ContentTypeMatches(const std::string &content_type, const std::string &pattern) {
	if (pattern.empty()) {
		return false;
	}
	// Extract main type from content_type
	std::string ct = content_type;
	size_t semicolon = ct.find(';');
	if (semicolon != std::string::npos) {
		ct = ct.substr(0, semicolon);
	}
	std::string ct_lower = ToLower(Trim(ct));
	std::string pat_lower = ToLower(Trim(pattern));

	// Check for wildcard (e.g., "text/*")
	if (pat_lower.length() >= 2 && pat_lower.substr(pat_lower.length() - 2) == "/*") {
		std::string prefix = pat_lower.substr(0, pat_lower.length() - 1);
		return ct_lower.find(prefix) == 0;
	}

	return ct_lower == pat_lower;
}

// Helper: true if content_type matches any comma-separated pattern
static bool MatchesAnyPattern(const std::string &content_type, const std::string &patterns) {
	std::istringstream stream(patterns);
	std::string pattern;
	while (std::getline(stream, pattern, ',')) {
		if (ContentTypeMatches(content_type, Trim(pattern))) {
			return true;
		}
	}
	return false;
}

bool IsContentTypeAcceptable(const std::string &content_type,
                             const std::string &accept_types,
                             const std::string &reject_types) {
	if (accept_types.empty() && reject_types.empty()) {
		return true;
	}
	// Servers that omit Content-Type get the benefit of the doubt
	if (Trim(content_type).empty()) {
		return true;
	}
	if (!accept_types.empty() && !MatchesAnyPattern(content_type, accept_types)) {
		return false;
	}
	if (!reject_types.empty() && MatchesAnyPattern(content_type, reject_types)) {
		return false;
	}
	return true;
}

} // namespace linkwatch
