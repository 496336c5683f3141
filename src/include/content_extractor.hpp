#pragma once

//===--------------------------------------------------------------------===//
// content_extractor.hpp - Normalized text and discovered targets
//===--------------------------------------------------------------------===//

#include "pipeline_config.hpp"
#include "pipeline_types.hpp"

#include <set>
#include <string>
#include <vector>

namespace linkwatch {

struct ExtractedContent {
	std::string text;  // Normalized text, one line per block, truncated
	std::vector<std::string> messages;  // Channels: normalized message bodies, oldest first
	std::vector<DiscoveredTarget> discovered;
	bool nofollow = false;  // Page asked robots not to follow its links
};

struct ChannelMessage {
	std::string text;
	std::vector<std::string> links;  // Raw hrefs inside the message body
};

class ContentExtractor {
public:
	explicit ContentExtractor(const ExtractConfig &config);

	// Extract text and discovered targets from a successful fetch
	ExtractedContent Extract(const FetchResult &result, TargetKind kind) const;

	// Snippet stored with the target for analyst review
	std::string MakeSnippet(const std::string &text) const;

	// Visible text of an HTML document: script, style, noscript, header,
	// footer, nav, svg, form and iframe are dropped; one line per text node
	static std::string ExtractVisibleText(const std::string &html);

	// Message bodies of a channel web preview, oldest first, at most the
	// max_messages most recent ones
	static std::vector<ChannelMessage> ExtractChannelMessages(const std::string &html, size_t max_messages);

	// Trim every line, collapse runs of blanks, drop empty lines
	static std::string NormalizeText(const std::string &text);

	// Truncate to at most max_bytes without splitting a UTF-8 sequence
	static std::string TruncateUtf8(const std::string &text, size_t max_bytes);

	static bool LooksLikeHtml(const std::string &content_type, const std::string &body);

private:
	void AddDiscovered(const std::string &raw, ExtractedContent &out, std::set<std::string> &seen) const;

	ExtractConfig config_;
};

} // namespace linkwatch
