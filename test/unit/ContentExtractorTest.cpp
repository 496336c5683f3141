#include <gtest/gtest.h>

#include "content_extractor.hpp"
#include "TestDoubles.hpp"

using namespace linkwatch;

static const char *CHANNEL_PREVIEW =
    "<html><body>"
    "<div class=\"tgme_widget_message_wrap\">"
    "<div class=\"tgme_widget_message_text js-message_text\" dir=\"auto\">First post</div>"
    "</div>"
    "<div class=\"tgme_widget_message_wrap\">"
    "<div class=\"tgme_widget_message_text js-message_text\" dir=\"auto\">"
    "Win big <a href=\"https://bit.ly/x\">link</a><br/>today with @jackpot_tips"
    "</div></div>"
    "</body></html>";

TEST(ContentExtractorTest, NormalizeText) {
	EXPECT_EQ("Hello world\nsecond line", ContentExtractor::NormalizeText("  Hello \t  world  \n\n   second   line \n"));
	EXPECT_EQ("a b", ContentExtractor::NormalizeText("a\xC2\xA0\xC2\xA0 b"));
	EXPECT_EQ("", ContentExtractor::NormalizeText(" \n\t\n "));
}

TEST(ContentExtractorTest, TruncateUtf8) {
	EXPECT_EQ("hello", ContentExtractor::TruncateUtf8("hello", 10));
	EXPECT_EQ("hel", ContentExtractor::TruncateUtf8("hello", 3));
	// "é" is two bytes and must not be split
	EXPECT_EQ("h", ContentExtractor::TruncateUtf8("h\xC3\xA9llo", 2));
	EXPECT_EQ("h\xC3\xA9", ContentExtractor::TruncateUtf8("h\xC3\xA9llo", 3));
}

TEST(ContentExtractorTest, LooksLikeHtml) {
	EXPECT_TRUE(ContentExtractor::LooksLikeHtml("text/html; charset=utf-8", ""));
	EXPECT_TRUE(ContentExtractor::LooksLikeHtml("", "<!DOCTYPE html><html></html>"));
	EXPECT_FALSE(ContentExtractor::LooksLikeHtml("application/json", "<html></html>"));
	EXPECT_FALSE(ContentExtractor::LooksLikeHtml("", "just some text"));
}

TEST(ContentExtractorTest, VisibleTextDropsChrome) {
	std::string text = ContentExtractor::ExtractVisibleText(
	    "<html><head><style>body { color: red; }</style><script>var x = 1;</script></head>"
	    "<body><nav>Menu</nav><p>Claim   your prize</p><form>Login</form><footer>Foot</footer></body></html>");
	EXPECT_NE(std::string::npos, text.find("Claim your prize"));
	EXPECT_EQ(std::string::npos, text.find("var x"));
	EXPECT_EQ(std::string::npos, text.find("color"));
	EXPECT_EQ(std::string::npos, text.find("Menu"));
	EXPECT_EQ(std::string::npos, text.find("Login"));
	EXPECT_EQ(std::string::npos, text.find("Foot"));
}

TEST(ContentExtractorTest, PageDiscovery) {
	ContentExtractor extractor{ExtractConfig()};
	auto result = test::HtmlPage("https://example.com/",
	                             "<html><body><p>Contact @lucky_winner_bot now</p>"
	                             "<a href=\"/deals\">Deals</a>"
	                             "<a href=\"https://t.me/free_money_daily\">TG</a>"
	                             "<a href=\"/\">home</a>"
	                             "<script>var s = \"@hidden_channel\";</script>"
	                             "</body></html>");

	auto content = extractor.Extract(result, TargetKind::PAGE);
	EXPECT_FALSE(content.nofollow);
	EXPECT_NE(std::string::npos, content.text.find("Contact @lucky_winner_bot now"));

	ASSERT_EQ(3u, content.discovered.size());
	EXPECT_EQ("https://example.com/deals", content.discovered[0].identifier);
	EXPECT_EQ(TargetKind::PAGE, content.discovered[0].kind);
	EXPECT_EQ("@free_money_daily", content.discovered[1].identifier);
	EXPECT_EQ(TargetKind::CHANNEL, content.discovered[1].kind);
	EXPECT_EQ("@lucky_winner_bot", content.discovered[2].identifier);
	EXPECT_EQ(TargetKind::CHANNEL, content.discovered[2].kind);
}

TEST(ContentExtractorTest, RelativeLinksResolveAgainstFinalUrl) {
	ContentExtractor extractor{ExtractConfig()};
	auto result = test::HtmlPage("https://example.com/blog", "<html><body><a href=\"post-1\">p</a></body></html>");
	result.final_url = "https://example.com/blog/";

	auto content = extractor.Extract(result, TargetKind::PAGE);
	ASSERT_EQ(1u, content.discovered.size());
	EXPECT_EQ("https://example.com/blog/post-1", content.discovered[0].identifier);
}

TEST(ContentExtractorTest, NoFollowMetaSuppressesLinks) {
	const std::string html = "<html><head><meta name=\"robots\" content=\"nofollow\"></head>"
	                         "<body><p>Hello</p><a href=\"/x\">x</a></body></html>";
	auto result = test::HtmlPage("https://example.com/", html);

	ContentExtractor strict{ExtractConfig()};
	auto content = strict.Extract(result, TargetKind::PAGE);
	EXPECT_TRUE(content.nofollow);
	EXPECT_TRUE(content.discovered.empty());

	ExtractConfig config;
	config.respect_nofollow = false;
	ContentExtractor lenient(config);
	content = lenient.Extract(result, TargetKind::PAGE);
	EXPECT_FALSE(content.nofollow);
	ASSERT_EQ(1u, content.discovered.size());
	EXPECT_EQ("https://example.com/x", content.discovered[0].identifier);
}

TEST(ContentExtractorTest, DiscoverySwitchesAndLimits) {
	const std::string html = "<html><body><a href=\"/a\">a</a><a href=\"/b\">b</a>"
	                         "<a href=\"https://t.me/free_money_daily\">tg</a></body></html>";
	auto result = test::HtmlPage("https://example.com/", html);

	ExtractConfig no_pages;
	no_pages.follow_links = false;
	auto content = ContentExtractor(no_pages).Extract(result, TargetKind::PAGE);
	ASSERT_EQ(1u, content.discovered.size());
	EXPECT_EQ("@free_money_daily", content.discovered[0].identifier);

	ExtractConfig no_channels;
	no_channels.discover_channels = false;
	content = ContentExtractor(no_channels).Extract(result, TargetKind::PAGE);
	ASSERT_EQ(2u, content.discovered.size());
	EXPECT_EQ(TargetKind::PAGE, content.discovered[0].kind);
	EXPECT_EQ(TargetKind::PAGE, content.discovered[1].kind);

	ExtractConfig capped;
	capped.max_links_per_page = 1;
	content = ContentExtractor(capped).Extract(result, TargetKind::PAGE);
	EXPECT_EQ(1u, content.discovered.size());
}

TEST(ContentExtractorTest, ChannelMessages) {
	auto all = ContentExtractor::ExtractChannelMessages(CHANNEL_PREVIEW, 10);
	ASSERT_EQ(2u, all.size());
	EXPECT_EQ("First post", all[0].text);
	ASSERT_EQ(1u, all[1].links.size());
	EXPECT_EQ("https://bit.ly/x", all[1].links[0]);

	// the most recent messages are kept
	auto recent = ContentExtractor::ExtractChannelMessages(CHANNEL_PREVIEW, 1);
	ASSERT_EQ(1u, recent.size());
	EXPECT_EQ("Win big link\ntoday with @jackpot_tips", ContentExtractor::NormalizeText(recent[0].text));
}

TEST(ContentExtractorTest, ChannelExtraction) {
	ContentExtractor extractor{ExtractConfig()};
	FetchResult result = test::HtmlPage("@some_channel", CHANNEL_PREVIEW);
	result.final_url = "https://t.me/s/some_channel";

	auto content = extractor.Extract(result, TargetKind::CHANNEL);
	EXPECT_EQ("First post\nWin big link\ntoday with @jackpot_tips", content.text);
	ASSERT_EQ(2u, content.messages.size());
	EXPECT_EQ("First post", content.messages[0]);
	EXPECT_EQ("Win big link\ntoday with @jackpot_tips", content.messages[1]);
	ASSERT_EQ(2u, content.discovered.size());
	EXPECT_EQ("https://bit.ly/x", content.discovered[0].identifier);
	EXPECT_EQ(TargetKind::PAGE, content.discovered[0].kind);
	EXPECT_EQ("@jackpot_tips", content.discovered[1].identifier);
}

TEST(ContentExtractorTest, PlainTextAndTruncation) {
	ExtractConfig config;
	config.max_text_length = 10;
	config.max_snippet_length = 5;
	ContentExtractor extractor(config);

	FetchResult result = test::HtmlPage("https://example.com/notes.txt", "  abcdefghij  klmno \n\n");
	result.content_type = "text/plain";
	auto content = extractor.Extract(result, TargetKind::PAGE);
	EXPECT_EQ("abcdefghij", content.text);
	EXPECT_EQ("abcde", extractor.MakeSnippet(content.text));
}
