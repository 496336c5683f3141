#include "content_extractor.hpp"
#include "crawler_utils.hpp"
#include "link_parser.hpp"

#include <libxml/HTMLparser.h>
#include <libxml/tree.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <set>
#include <sstream>

namespace linkwatch {

// RAII wrapper for xmlDoc
class HtmlDocGuard {
public:
	explicit HtmlDocGuard(xmlDocPtr doc) : doc_(doc) {}
	~HtmlDocGuard() {
		if (doc_) {
			xmlFreeDoc(doc_);
		}
	}
	HtmlDocGuard(const HtmlDocGuard&) = delete;
	HtmlDocGuard& operator=(const HtmlDocGuard&) = delete;

	xmlDocPtr get() const { return doc_; }
	explicit operator bool() const { return doc_ != nullptr; }
private:
	xmlDocPtr doc_;
};

static xmlDocPtr ParseHtml(const std::string &html) {
	return htmlReadMemory(html.c_str(), static_cast<int>(html.size()), nullptr, "UTF-8",
	                      HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET);
}

// Helper: get attribute value from xmlNode, returns empty string if not found
static std::string GetAttribute(xmlNodePtr node, const char *attr) {
	xmlChar *value = xmlGetProp(node, BAD_CAST attr);
	if (!value) {
		return "";
	}
	std::string result(reinterpret_cast<char*>(value));
	xmlFree(value);
	return result;
}

// Elements whose text is never visible page content
static bool IsDroppedElement(const xmlChar *name) {
	static const char *dropped[] = {"script", "style", "noscript", "header", "footer",
	                                "nav",    "svg",   "form",     "iframe"};
	for (const char *tag : dropped) {
		if (xmlStrcasecmp(name, BAD_CAST tag) == 0) {
			return true;
		}
	}
	return false;
}

static bool IsBlank(unsigned char c) {
	return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

//===--------------------------------------------------------------------===//
// Text normalization
//===--------------------------------------------------------------------===//

std::string ContentExtractor::NormalizeText(const std::string &text) {
	std::string result;
	std::istringstream stream(text);
	std::string line;
	while (std::getline(stream, line)) {
		std::string collapsed;
		bool pending_space = false;
		for (size_t i = 0; i < line.length(); i++) {
			unsigned char c = static_cast<unsigned char>(line[i]);
			// U+00A0 no-break space counts as blank
			if (c == 0xC2 && i + 1 < line.length() && static_cast<unsigned char>(line[i + 1]) == 0xA0) {
				pending_space = true;
				i++;
				continue;
			}
			if (IsBlank(c)) {
				pending_space = true;
				continue;
			}
			if (pending_space && !collapsed.empty()) {
				collapsed += ' ';
			}
			pending_space = false;
			collapsed += static_cast<char>(c);
		}
		if (collapsed.empty()) {
			continue;
		}
		if (!result.empty()) {
			result += '\n';
		}
		result += collapsed;
	}
	return result;
}

std::string ContentExtractor::TruncateUtf8(const std::string &text, size_t max_bytes) {
	if (text.length() <= max_bytes) {
		return text;
	}
	size_t cut = max_bytes;
	// Back off continuation bytes (10xxxxxx)
	while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
		cut--;
	}
	return text.substr(0, cut);
}

bool ContentExtractor::LooksLikeHtml(const std::string &content_type, const std::string &body) {
	std::string ct = content_type;
	std::transform(ct.begin(), ct.end(), ct.begin(), [](unsigned char c) { return std::tolower(c); });
	if (ct.find("html") != std::string::npos) {
		return true;
	}
	if (!ct.empty()) {
		return false;
	}
	std::string head = body.substr(0, 1024);
	std::transform(head.begin(), head.end(), head.begin(), [](unsigned char c) { return std::tolower(c); });
	return head.find("<html") != std::string::npos || head.find("<!doctype html") != std::string::npos ||
	       head.find("<body") != std::string::npos;
}

//===--------------------------------------------------------------------===//
// HTML text
//===--------------------------------------------------------------------===//

static void CollectVisibleText(xmlNodePtr node, std::string &out) {
	for (xmlNodePtr cur = node; cur; cur = cur->next) {
		if (cur->type == XML_ELEMENT_NODE) {
			if (IsDroppedElement(cur->name)) {
				continue;
			}
			if (cur->children) {
				CollectVisibleText(cur->children, out);
			}
		} else if ((cur->type == XML_TEXT_NODE || cur->type == XML_CDATA_SECTION_NODE) && cur->content) {
			// Every text node becomes its own block
			out += reinterpret_cast<const char *>(cur->content);
			out += '\n';
		}
	}
}

std::string ContentExtractor::ExtractVisibleText(const std::string &html) {
	if (html.empty()) {
		return "";
	}
	HtmlDocGuard doc(ParseHtml(html));
	if (!doc) {
		return "";
	}
	xmlNodePtr root = xmlDocGetRootElement(doc.get());
	if (!root) {
		return "";
	}
	std::string raw;
	CollectVisibleText(root, raw);
	return NormalizeText(raw);
}

//===--------------------------------------------------------------------===//
// Channel preview
//===--------------------------------------------------------------------===//

static bool HasClass(xmlNodePtr node, const char *class_name) {
	std::string classes = GetAttribute(node, "class");
	if (classes.empty()) {
		return false;
	}
	std::istringstream stream(classes);
	std::string token;
	while (stream >> token) {
		if (token == class_name) {
			return true;
		}
	}
	return false;
}

static void CollectMessage(xmlNodePtr node, ChannelMessage &message) {
	for (xmlNodePtr cur = node; cur; cur = cur->next) {
		if (cur->type == XML_TEXT_NODE && cur->content) {
			message.text += reinterpret_cast<const char *>(cur->content);
		} else if (cur->type == XML_ELEMENT_NODE) {
			if (xmlStrcasecmp(cur->name, BAD_CAST "br") == 0) {
				message.text += '\n';
				continue;
			}
			if (xmlStrcasecmp(cur->name, BAD_CAST "a") == 0) {
				std::string href = GetAttribute(cur, "href");
				if (!href.empty()) {
					message.links.push_back(href);
				}
			}
			if (cur->children) {
				CollectMessage(cur->children, message);
			}
			if (xmlStrcasecmp(cur->name, BAD_CAST "p") == 0 || xmlStrcasecmp(cur->name, BAD_CAST "div") == 0) {
				message.text += '\n';
			}
		}
	}
}

static void FindMessages(xmlNodePtr node, std::vector<ChannelMessage> &messages) {
	for (xmlNodePtr cur = node; cur; cur = cur->next) {
		if (cur->type != XML_ELEMENT_NODE) {
			continue;
		}
		if (HasClass(cur, "tgme_widget_message_text")) {
			ChannelMessage message;
			CollectMessage(cur->children, message);
			messages.push_back(std::move(message));
			continue;
		}
		if (cur->children) {
			FindMessages(cur->children, messages);
		}
	}
}

std::vector<ChannelMessage> ContentExtractor::ExtractChannelMessages(const std::string &html, size_t max_messages) {
	std::vector<ChannelMessage> messages;
	if (html.empty()) {
		return messages;
	}
	HtmlDocGuard doc(ParseHtml(html));
	if (!doc) {
		return messages;
	}
	FindMessages(xmlDocGetRootElement(doc.get()), messages);

	// The preview lists messages oldest first; keep the most recent ones
	if (messages.size() > max_messages) {
		messages.erase(messages.begin(), messages.end() - static_cast<std::ptrdiff_t>(max_messages));
	}
	return messages;
}

//===--------------------------------------------------------------------===//
// ContentExtractor
//===--------------------------------------------------------------------===//

ContentExtractor::ContentExtractor(const ExtractConfig &config) : config_(config) {
}

std::string ContentExtractor::MakeSnippet(const std::string &text) const {
	return TruncateUtf8(text, static_cast<size_t>(config_.max_snippet_length));
}

void ContentExtractor::AddDiscovered(const std::string &raw, ExtractedContent &out,
                                     std::set<std::string> &seen) const {
	if (static_cast<int>(out.discovered.size()) >= config_.max_links_per_page) {
		return;
	}
	TargetKind kind = TargetKind::PAGE;
	std::string identifier = CanonicalizeIdentifier(raw, kind);
	if (identifier.empty()) {
		return;
	}
	if (kind == TargetKind::CHANNEL ? !config_.discover_channels : !config_.follow_links) {
		return;
	}
	if (seen.insert(identifier).second) {
		out.discovered.push_back({identifier, kind});
	}
}

ExtractedContent ContentExtractor::Extract(const FetchResult &result, TargetKind kind) const {
	ExtractedContent out;
	std::set<std::string> seen = {result.target};
	size_t max_text = static_cast<size_t>(config_.max_text_length);

	if (kind == TargetKind::CHANNEL) {
		auto messages = ExtractChannelMessages(result.raw_content, static_cast<size_t>(config_.channel_sample_size));
		std::string joined;
		for (const auto &message : messages) {
			std::string text = NormalizeText(message.text);
			if (text.empty()) {
				continue;
			}
			if (!joined.empty()) {
				joined += '\n';
			}
			joined += text;
			out.messages.push_back(TruncateUtf8(text, max_text));
			for (const auto &href : message.links) {
				AddDiscovered(href, out, seen);
			}
		}
		out.text = TruncateUtf8(joined, max_text);
	} else if (LooksLikeHtml(result.content_type, result.raw_content)) {
		out.text = TruncateUtf8(ExtractVisibleText(result.raw_content), max_text);

		std::string base = result.final_url;
		if (base.empty() || CanonicalizeUrl(base).empty()) {
			base = result.target;
		}
		out.nofollow = config_.respect_nofollow && LinkParser::HasNoFollowMeta(result.raw_content);
		if (!out.nofollow) {
			for (const auto &link : LinkParser::ExtractLinks(result.raw_content, base)) {
				if (config_.respect_nofollow && link.nofollow) {
					continue;
				}
				AddDiscovered(link.url, out, seen);
			}
		}
	} else {
		out.text = TruncateUtf8(NormalizeText(result.raw_content), max_text);
	}

	if (config_.discover_channels) {
		for (const auto &handle : LinkParser::ExtractChannelMentions(out.text)) {
			AddDiscovered(handle, out, seen);
		}
	}
	return out;
}

} // namespace linkwatch
