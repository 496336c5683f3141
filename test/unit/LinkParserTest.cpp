#include <gtest/gtest.h>

#include "link_parser.hpp"

using namespace linkwatch;

TEST(LinkParserTest, ExtractLinks) {
	const std::string html =
	    "<html><body>"
	    "<a href=\"/about\">About</a>"
	    "<a href='contact.html'>Contact</a>"
	    "<A HREF=\"https://Other.com/x#y\" rel=\"external nofollow\">Other</A>"
	    "<a href=\"mailto:someone@example.com\">Mail</a>"
	    "<a href=\"javascript:void(0)\">JS</a>"
	    "<a href=\"#top\">Top</a>"
	    "<a href=\"/about/\">Duplicate</a>"
	    "<abbr title=\"not a link\">abbr</abbr>"
	    "</body></html>";

	auto links = LinkParser::ExtractLinks(html, "https://example.com/dir/page.html");
	ASSERT_EQ(3u, links.size());
	EXPECT_EQ("https://example.com/about", links[0].url);
	EXPECT_FALSE(links[0].nofollow);
	EXPECT_EQ("https://example.com/dir/contact.html", links[1].url);
	EXPECT_EQ("https://other.com/x", links[2].url);
	EXPECT_TRUE(links[2].nofollow);
}

TEST(LinkParserTest, BaseHrefOverridesDocumentUrl) {
	const std::string html = "<head><base href=\"https://cdn.example.org/assets/\"></head>"
	                         "<body><a href=\"page?x=1&amp;y=2\">p</a></body>";
	auto links = LinkParser::ExtractLinks(html, "https://example.com/");
	ASSERT_EQ(1u, links.size());
	EXPECT_EQ("https://cdn.example.org/assets/page?x=1&y=2", links[0].url);
}

TEST(LinkParserTest, ResolveUrl) {
	EXPECT_EQ("https://example.com/c", LinkParser::ResolveUrl("https://example.com/a/b", "../c"));
	EXPECT_EQ("https://example.com/a/d", LinkParser::ResolveUrl("https://example.com/a/b", "d"));
	EXPECT_EQ("https://example.com/root", LinkParser::ResolveUrl("https://example.com/a/b?q=1", "/root"));
	EXPECT_EQ("https://example.com/list?page=2", LinkParser::ResolveUrl("https://example.com/list?page=1", "?page=2"));
	EXPECT_EQ("https://cdn.example.com/x", LinkParser::ResolveUrl("https://example.com/", "//cdn.example.com/x"));
	EXPECT_EQ("http://other.com/", LinkParser::ResolveUrl("https://example.com/", "http://other.com/"));
	EXPECT_EQ("", LinkParser::ResolveUrl("https://example.com/", ""));
}

TEST(LinkParserTest, NoFollowMeta) {
	EXPECT_TRUE(LinkParser::HasNoFollowMeta("<meta name=\"robots\" content=\"noindex, nofollow\">"));
	EXPECT_TRUE(LinkParser::HasNoFollowMeta("<META NAME='Robots' CONTENT='NOFOLLOW'>"));
	EXPECT_FALSE(LinkParser::HasNoFollowMeta("<meta name=\"description\" content=\"nofollow\">"));
	EXPECT_FALSE(LinkParser::HasNoFollowMeta("<meta name=\"robots\" content=\"noindex\">"));
}

TEST(LinkParserTest, ChannelMentions) {
	auto handles = LinkParser::ExtractChannelMentions(
	    "Join @crypto_signals and t.me/free_money_daily, mail bob@example.com, again @Crypto_Signals");
	ASSERT_EQ(2u, handles.size());
	EXPECT_EQ("@crypto_signals", handles[0]);
	EXPECT_EQ("@free_money_daily", handles[1]);
}

TEST(LinkParserTest, ChannelMentionsIgnoreInvitesAndShortNames) {
	auto handles = LinkParser::ExtractChannelMentions("t.me/joinchat/ABCDEF @abc notat.me/whatever");
	EXPECT_TRUE(handles.empty());
}
