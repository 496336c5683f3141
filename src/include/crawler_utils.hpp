#pragma once

#include "pipeline_types.hpp"

#include <string>
#include <cstdint>

namespace linkwatch {

struct RetryConfig;

//===--------------------------------------------------------------------===//
// Error Classification
//===--------------------------------------------------------------------===//

enum class CrawlErrorType : uint8_t {
	NONE = 0,
	NETWORK_TIMEOUT = 1,
	NETWORK_DNS_FAILURE = 2,
	NETWORK_CONNECTION_REFUSED = 3,
	NETWORK_SSL_ERROR = 4,
	HTTP_CLIENT_ERROR = 5,
	HTTP_SERVER_ERROR = 6,
	HTTP_RATE_LIMITED = 7,
	ROBOTS_DISALLOWED = 8,
	CONTENT_TOO_LARGE = 9,
	CONTENT_TYPE_REJECTED = 10,
	INVALID_TARGET = 11,
	DOMAIN_BLOCKED = 12
};

const char* ErrorTypeToString(CrawlErrorType type);
CrawlErrorType ClassifyError(int status_code, const std::string &error_msg);

// Map a classified error onto the three-way fetch outcome.
// 408, 429, 5XX and network errors are transient; DNS failure, other 4XX
// and policy rejections are permanent.
FetchOutcome OutcomeForError(CrawlErrorType type, int status_code);

//===--------------------------------------------------------------------===//
// Compression Utilities
//===--------------------------------------------------------------------===//

// Decompress gzip data. Returns empty string on error.
std::string DecompressGzip(const std::string &compressed_data);

// Check if data starts with gzip magic bytes (0x1f 0x8b)
bool IsGzippedData(const std::string &data);

//===--------------------------------------------------------------------===//
// Backoff
//===--------------------------------------------------------------------===//

// Capped exponential backoff for the n-th consecutive failure (n >= 1):
// min(initial * multiplier^(n-1), max)
int64_t ExponentialBackoffMs(int n, const RetryConfig &config);

//===--------------------------------------------------------------------===//
// Identifier Canonicalization
//===--------------------------------------------------------------------===//

// Canonical http(s) URL, or empty string when the input is not a crawlable URL.
// Lower-cases scheme and host, drops default ports and fragments, resolves
// dot segments and strips a trailing slash on non-root paths.
std::string CanonicalizeUrl(const std::string &url);

// Canonical "@handle" for a public channel, or empty string when invalid.
// Accepts @name, name, t.me/name, t.me/s/name and telegram.me/name.
std::string CanonicalizeChannelHandle(const std::string &input);

// Detect the kind of a raw identifier and canonicalize it.
// Returns empty string when the input is neither a URL nor a channel handle.
std::string CanonicalizeIdentifier(const std::string &input, TargetKind &kind);

// Canonicalize as the given kind, throws InvalidInputException when invalid
std::string RequireCanonicalIdentifier(const std::string &input, TargetKind kind);

// True if the host belongs to a channel link domain (t.me and aliases)
bool IsChannelHost(const std::string &host);

// Resolve "." and ".." segments in a URL path
std::string NormalizeUrlPath(const std::string &path);

//===--------------------------------------------------------------------===//
// URL Utilities
//===--------------------------------------------------------------------===//

// Extract domain from URL (lower-case, without port)
std::string ExtractDomain(const std::string &url);

// Extract path from URL (including query string)
std::string ExtractPath(const std::string &url);

// Domain a target is served from; channels map to their preview host
std::string TargetDomain(const std::string &identifier, TargetKind kind);

// True if host equals domain or is a subdomain of it
bool HostMatchesDomain(const std::string &host, const std::string &domain);

// FNV-1a 64-bit fingerprint of content, 16 hex digits
std::string GenerateContentHash(const std::string &content);

//===--------------------------------------------------------------------===//
// Content-Type Utilities
//===--------------------------------------------------------------------===//

// Check if content-type matches pattern (supports wildcards like "text/*")
bool ContentTypeMatches(const std::string &content_type, const std::string &pattern);

// Check if content-type is acceptable (matches accept list, not in reject list)
bool IsContentTypeAcceptable(const std::string &content_type,
                             const std::string &accept_types,
                             const std::string &reject_types);

} // namespace linkwatch
