#pragma once

#include <string>
#include <vector>

namespace linkwatch {

struct ExtractedLink {
	std::string url;
	bool nofollow;  // rel="nofollow" present
};

class LinkParser {
public:
	// Extract all <a href="..."> links from HTML
	// base_url: URL of the page (for resolving relative URLs)
	static std::vector<ExtractedLink> ExtractLinks(const std::string &html, const std::string &base_url);

	// Resolve relative URL to absolute
	static std::string ResolveUrl(const std::string &base_url, const std::string &href);

	// Check for <meta name="robots" content="nofollow">
	static bool HasNoFollowMeta(const std::string &html);

	// Canonical channel handles mentioned in plain text: "@handle" mentions
	// and t.me/telegram.me links. Deduplicated, in order of appearance.
	static std::vector<std::string> ExtractChannelMentions(const std::string &text);
};

} // namespace linkwatch
