#include "link_parser.hpp"
#include "crawler_utils.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <utility>

namespace linkwatch {

// Helper: Convert string to lowercase
static std::string ToLower(const std::string &str) {
	std::string result = str;
	std::transform(result.begin(), result.end(), result.begin(),
	               [](unsigned char c) { return std::tolower(c); });
	return result;
}

// Helper: Trim whitespace
static std::string Trim(const std::string &str) {
	size_t start = 0;
	size_t end = str.length();
	while (start < end && std::isspace(static_cast<unsigned char>(str[start]))) {
		start++;
	}
	while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
		end--;
	}
	return str.substr(start, end - start);
}

// Helper: Find attribute value in tag (handles both " and ' quotes)
static std::string ExtractAttribute(const std::string &tag, const std::string &attr) {
	std::string lower_tag = ToLower(tag);
	std::string lower_attr = ToLower(attr);

	// Look for attr= or attr =
	size_t pos = lower_tag.find(lower_attr);
	while (pos != std::string::npos) {
		// Check it's not part of another attribute name
		if (pos > 0 && std::isalnum(static_cast<unsigned char>(lower_tag[pos - 1]))) {
			pos = lower_tag.find(lower_attr, pos + 1);
			continue;
		}

		// Skip to =
		size_t eq_pos = pos + lower_attr.length();
		while (eq_pos < lower_tag.length() && std::isspace(static_cast<unsigned char>(lower_tag[eq_pos]))) {
			eq_pos++;
		}

		if (eq_pos >= lower_tag.length() || lower_tag[eq_pos] != '=') {
			pos = lower_tag.find(lower_attr, pos + 1);
			continue;
		}

		eq_pos++; // Skip =

		// Skip whitespace after =
		while (eq_pos < tag.length() && std::isspace(static_cast<unsigned char>(tag[eq_pos]))) {
			eq_pos++;
		}

		if (eq_pos >= tag.length()) {
			return "";
		}

		char quote = tag[eq_pos];
		if (quote == '"' || quote == '\'') {
			// Quoted value
			size_t value_start = eq_pos + 1;
			size_t value_end = tag.find(quote, value_start);
			if (value_end == std::string::npos) {
				return "";
			}
			return tag.substr(value_start, value_end - value_start);
		} else {
			// Unquoted value - read until whitespace or >
			size_t value_start = eq_pos;
			size_t value_end = value_start;
			while (value_end < tag.length() &&
			       !std::isspace(static_cast<unsigned char>(tag[value_end])) &&
			       tag[value_end] != '>') {
				value_end++;
			}
			return tag.substr(value_start, value_end - value_start);
		}
	}

	return "";
}

// Helper: Check if rel attribute contains "nofollow"
static bool HasNoFollowRel(const std::string &rel) {
	std::string lower_rel = ToLower(rel);
	// rel can have multiple values separated by spaces
	return lower_rel.find("nofollow") != std::string::npos;
}

std::string LinkParser::ResolveUrl(const std::string &base_url, const std::string &href) {
	if (href.empty()) {
		return "";
	}

	std::string trimmed_href = Trim(href);

	// Already absolute (scheme before any path, query or fragment)
	size_t scheme_end = trimmed_href.find("://");
	if (scheme_end != std::string::npos && scheme_end < trimmed_href.find_first_of("/?#")) {
		return trimmed_href;
	}

	// Protocol-relative (//example.com/path)
	if (trimmed_href.length() >= 2 && trimmed_href[0] == '/' && trimmed_href[1] == '/') {
		size_t proto_end = base_url.find("://");
		if (proto_end != std::string::npos) {
			return base_url.substr(0, proto_end + 1) + trimmed_href;
		}
		return "https:" + trimmed_href;
	}

	// Extract base components
	size_t proto_end = base_url.find("://");
	if (proto_end == std::string::npos) {
		return "";
	}

	size_t domain_start = proto_end + 3;
	size_t path_start = base_url.find('/', domain_start);

	std::string base_origin = (path_start != std::string::npos)
	    ? base_url.substr(0, path_start)
	    : base_url;

	// Query only (?page=2) keeps the base path
	if (trimmed_href[0] == '?') {
		return base_url.substr(0, base_url.find_first_of("?#")) + trimmed_href;
	}

	// Absolute path (/path)
	if (trimmed_href[0] == '/') {
		return base_origin + trimmed_href;
	}

	// Relative path (path or ../path)
	std::string base_path = (path_start != std::string::npos)
	    ? base_url.substr(path_start)
	    : "/";

	// Remove query string and fragment from base path
	size_t query_pos = base_path.find('?');
	if (query_pos != std::string::npos) {
		base_path = base_path.substr(0, query_pos);
	}
	size_t frag_pos = base_path.find('#');
	if (frag_pos != std::string::npos) {
		base_path = base_path.substr(0, frag_pos);
	}

	// Remove filename from base path (keep directory)
	size_t last_slash = base_path.rfind('/');
	if (last_slash != std::string::npos) {
		base_path = base_path.substr(0, last_slash + 1);
	}

	std::string combined_path = base_path + trimmed_href;
	return base_origin + NormalizeUrlPath(combined_path);
}

// Helper: Decode the entities that commonly appear inside href values
static std::string DecodeHrefEntities(const std::string &href) {
	if (href.find('&') == std::string::npos) {
		return href;
	}
	static const std::pair<const char *, char> entities[] = {
	    {"&amp;", '&'}, {"&#38;", '&'}, {"&quot;", '"'}, {"&#39;", '\''}, {"&lt;", '<'}, {"&gt;", '>'}};
	std::string result;
	result.reserve(href.length());
	for (size_t i = 0; i < href.length(); i++) {
		bool decoded = false;
		if (href[i] == '&') {
			for (const auto &entity : entities) {
				size_t len = std::char_traits<char>::length(entity.first);
				if (href.compare(i, len, entity.first) == 0) {
					result += entity.second;
					i += len - 1;
					decoded = true;
					break;
				}
			}
		}
		if (!decoded) {
			result += href[i];
		}
	}
	return result;
}

// Helper: Find next "<name" tag opening (case-insensitive), npos if none
static size_t FindTag(const std::string &lower_html, const std::string &name, size_t from) {
	std::string needle = "<" + name;
	size_t pos = lower_html.find(needle, from);
	while (pos != std::string::npos) {
		size_t after = pos + needle.length();
		if (after < lower_html.length() &&
		    (std::isspace(static_cast<unsigned char>(lower_html[after])) || lower_html[after] == '>')) {
			return pos;
		}
		pos = lower_html.find(needle, pos + 1);
	}
	return std::string::npos;
}

std::vector<ExtractedLink> LinkParser::ExtractLinks(const std::string &html, const std::string &base_url) {
	std::vector<ExtractedLink> links;
	std::set<std::string> seen_urls;
	std::string lower_html = ToLower(html);

	// <base href> overrides the document URL for relative links
	std::string effective_base = base_url;
	size_t base_tag = FindTag(lower_html, "base", 0);
	if (base_tag != std::string::npos) {
		size_t base_end = html.find('>', base_tag);
		if (base_end != std::string::npos) {
			std::string base_href = ExtractAttribute(html.substr(base_tag, base_end - base_tag + 1), "href");
			// Resolved but not canonicalized: the trailing slash names the directory
			std::string resolved = ResolveUrl(base_url, DecodeHrefEntities(Trim(base_href)));
			if (!base_href.empty() && !CanonicalizeUrl(resolved).empty()) {
				effective_base = resolved;
			}
		}
	}

	size_t pos = 0;
	while (pos < html.length()) {
		size_t tag_start = FindTag(lower_html, "a", pos);
		if (tag_start == std::string::npos) {
			break;
		}
		size_t tag_end = html.find('>', tag_start);
		if (tag_end == std::string::npos) {
			break;
		}
		pos = tag_end + 1;

		std::string tag = html.substr(tag_start, tag_end - tag_start + 1);
		std::string href = DecodeHrefEntities(Trim(ExtractAttribute(tag, "href")));
		if (href.empty() || href[0] == '#') {
			continue;
		}

		// Skip javascript:, mailto:, tel:, data:
		std::string lower_href = ToLower(href);
		if (lower_href.find("javascript:") == 0 || lower_href.find("mailto:") == 0 ||
		    lower_href.find("tel:") == 0 || lower_href.find("data:") == 0) {
			continue;
		}

		// Canonical form doubles as the dedup key
		std::string url = CanonicalizeUrl(ResolveUrl(effective_base, href));
		if (url.empty() || !seen_urls.insert(url).second) {
			continue;
		}
		links.push_back({url, HasNoFollowRel(ExtractAttribute(tag, "rel"))});
	}

	return links;
}

// Helper: true for characters allowed in a channel handle
static bool IsHandleChar(char c) {
	return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::vector<std::string> LinkParser::ExtractChannelMentions(const std::string &text) {
	std::vector<std::string> handles;
	std::set<std::string> seen;
	auto add = [&](const std::string &raw) {
		std::string handle = CanonicalizeChannelHandle(raw);
		if (!handle.empty() && seen.insert(handle).second) {
			handles.push_back(handle);
		}
	};

	std::string lower = ToLower(text);
	for (size_t i = 0; i < text.length(); i++) {
		// @mention, not part of an e-mail address
		if (text[i] == '@' && (i == 0 || (!IsHandleChar(text[i - 1]) && text[i - 1] != '.'))) {
			size_t end = i + 1;
			while (end < text.length() && IsHandleChar(text[end])) {
				end++;
			}
			bool domain_follows = end + 1 < text.length() && text[end] == '.' && IsHandleChar(text[end + 1]);
			if (end > i + 1 && !domain_follows) {
				add(text.substr(i, end - i));
			}
			i = end - 1;
			continue;
		}

		// t.me/name and telegram.me/name links
		for (const char *host : {"t.me/", "telegram.me/"}) {
			size_t len = std::char_traits<char>::length(host);
			if (lower.compare(i, len, host) != 0) {
				continue;
			}
			if (i > 0 && (IsHandleChar(text[i - 1]) || text[i - 1] == '-')) {
				continue;
			}
			size_t end = i + len;
			while (end < text.length() && (IsHandleChar(text[end]) || text[end] == '/' || text[end] == '+')) {
				end++;
			}
			add(text.substr(i, end - i));
			i = end - 1;
			break;
		}
	}

	return handles;
}

bool LinkParser::HasNoFollowMeta(const std::string &html) {
	// Look for <meta name="robots" content="...nofollow...">
	std::string lower_html = ToLower(html);

	size_t pos = 0;
	while (pos < lower_html.length()) {
		size_t meta_start = lower_html.find("<meta", pos);
		if (meta_start == std::string::npos) {
			break;
		}

		size_t meta_end = html.find('>', meta_start);
		if (meta_end == std::string::npos) {
			break;
		}

		std::string tag = html.substr(meta_start, meta_end - meta_start + 1);
		std::string name = ExtractAttribute(tag, "name");

		if (ToLower(name) == "robots") {
			std::string content = ExtractAttribute(tag, "content");
			if (ToLower(content).find("nofollow") != std::string::npos) {
				return true;
			}
		}

		pos = meta_end + 1;
	}

	return false;
}

} // namespace linkwatch
