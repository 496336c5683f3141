#include <gtest/gtest.h>

#include "crawler_utils.hpp"
#include "pipeline_config.hpp"
#include "pipeline_errors.hpp"

using namespace linkwatch;

TEST(CrawlerUtilsTest, CanonicalizeUrl) {
	EXPECT_EQ("http://example.com/a/c", CanonicalizeUrl("HTTP://Example.COM:80/a/./b/../c/#frag"));
	EXPECT_EQ("https://example.com/", CanonicalizeUrl("https://example.com:443"));
	EXPECT_EQ("https://example.com:8443/x", CanonicalizeUrl("https://example.com:8443/x"));
	EXPECT_EQ("https://example.com/path", CanonicalizeUrl("example.com/path/"));
	EXPECT_EQ("https://example.com/search?q=1", CanonicalizeUrl("https://example.com/search?q=1#top"));
	EXPECT_EQ("https://example.com/", CanonicalizeUrl("  https://user:pw@EXAMPLE.com./  "));
}

TEST(CrawlerUtilsTest, CanonicalizeUrlRejects) {
	EXPECT_EQ("", CanonicalizeUrl(""));
	EXPECT_EQ("", CanonicalizeUrl("mailto:someone@example.com"));
	EXPECT_EQ("", CanonicalizeUrl("ftp://example.com/file"));
	EXPECT_EQ("", CanonicalizeUrl("javascript:void(0)"));
	EXPECT_EQ("", CanonicalizeUrl("localhost"));
	EXPECT_EQ("", CanonicalizeUrl("https://exa mple.com/"));
	EXPECT_EQ("", CanonicalizeUrl("https://example.com:99999/"));
	EXPECT_EQ("", CanonicalizeUrl("https://" + std::string(3000, 'a') + ".com/"));
}

TEST(CrawlerUtilsTest, CanonicalizeChannelHandle) {
	EXPECT_EQ("@crypto_signals", CanonicalizeChannelHandle("@Crypto_Signals"));
	EXPECT_EQ("@crypto_signals", CanonicalizeChannelHandle("crypto_signals"));
	EXPECT_EQ("@crypto_signals", CanonicalizeChannelHandle("https://t.me/s/crypto_signals"));
	EXPECT_EQ("@crypto_signals", CanonicalizeChannelHandle("t.me/crypto_signals/123"));
	EXPECT_EQ("@crypto_signals", CanonicalizeChannelHandle("telegram.me/crypto_signals"));

	// private invites, wrong hosts and bad lengths
	EXPECT_EQ("", CanonicalizeChannelHandle("t.me/joinchat/AAAAAE"));
	EXPECT_EQ("", CanonicalizeChannelHandle("t.me/+AbCdEf"));
	EXPECT_EQ("", CanonicalizeChannelHandle("example.com/crypto_signals"));
	EXPECT_EQ("", CanonicalizeChannelHandle("@abc"));
	EXPECT_EQ("", CanonicalizeChannelHandle("@" + std::string(40, 'a')));
	EXPECT_EQ("", CanonicalizeChannelHandle("@bad-handle"));
}

TEST(CrawlerUtilsTest, CanonicalizeIdentifierDetectsKind) {
	TargetKind kind = TargetKind::PAGE;
	EXPECT_EQ("@crypto_signals", CanonicalizeIdentifier("https://t.me/crypto_signals", kind));
	EXPECT_EQ(TargetKind::CHANNEL, kind);

	kind = TargetKind::PAGE;
	EXPECT_EQ("@crypto_signals", CanonicalizeIdentifier("crypto_signals", kind));
	EXPECT_EQ(TargetKind::CHANNEL, kind);

	kind = TargetKind::CHANNEL;
	EXPECT_EQ("https://example.com/", CanonicalizeIdentifier("example.com", kind));
	EXPECT_EQ(TargetKind::PAGE, kind);

	EXPECT_EQ("", CanonicalizeIdentifier("not a url", kind));
	EXPECT_EQ("", CanonicalizeIdentifier("   ", kind));
}

TEST(CrawlerUtilsTest, RequireCanonicalIdentifier) {
	EXPECT_EQ("https://example.com/a", RequireCanonicalIdentifier("https://example.com/a/", TargetKind::PAGE));
	EXPECT_EQ("@crypto_signals", RequireCanonicalIdentifier("@crypto_signals", TargetKind::CHANNEL));
	EXPECT_THROW(RequireCanonicalIdentifier("mailto:x@example.com", TargetKind::PAGE), InvalidInputException);
	EXPECT_THROW(RequireCanonicalIdentifier("@ab", TargetKind::CHANNEL), InvalidInputException);
}

TEST(CrawlerUtilsTest, ExponentialBackoff) {
	RetryConfig retry;
	retry.initial_backoff_ms = 1000;
	retry.backoff_multiplier = 2.0;
	retry.max_backoff_ms = 5000;

	EXPECT_EQ(1000, ExponentialBackoffMs(0, retry));
	EXPECT_EQ(1000, ExponentialBackoffMs(1, retry));
	EXPECT_EQ(2000, ExponentialBackoffMs(2, retry));
	EXPECT_EQ(4000, ExponentialBackoffMs(3, retry));
	EXPECT_EQ(5000, ExponentialBackoffMs(4, retry));
	EXPECT_EQ(5000, ExponentialBackoffMs(1000, retry));
}

TEST(CrawlerUtilsTest, ErrorOutcomes) {
	EXPECT_EQ(FetchOutcome::PERMANENT_FAILURE, OutcomeForError(ClassifyError(404, ""), 404));
	EXPECT_EQ(FetchOutcome::PERMANENT_FAILURE, OutcomeForError(ClassifyError(410, ""), 410));
	EXPECT_EQ(FetchOutcome::TRANSIENT_FAILURE, OutcomeForError(ClassifyError(408, ""), 408));
	EXPECT_EQ(FetchOutcome::TRANSIENT_FAILURE, OutcomeForError(ClassifyError(429, ""), 429));
	EXPECT_EQ(FetchOutcome::TRANSIENT_FAILURE, OutcomeForError(ClassifyError(503, ""), 503));
	EXPECT_EQ(FetchOutcome::TRANSIENT_FAILURE, OutcomeForError(ClassifyError(0, "Timeout was reached"), 0));
	EXPECT_EQ(FetchOutcome::PERMANENT_FAILURE,
	          OutcomeForError(ClassifyError(0, "Could not resolve host: nowhere.invalid"), 0));
	EXPECT_EQ(FetchOutcome::PERMANENT_FAILURE, OutcomeForError(CrawlErrorType::ROBOTS_DISALLOWED, 0));
	EXPECT_EQ(FetchOutcome::TRANSIENT_FAILURE, OutcomeForError(CrawlErrorType::DOMAIN_BLOCKED, 0));

	EXPECT_STREQ("http_rate_limited", ErrorTypeToString(CrawlErrorType::HTTP_RATE_LIMITED));
	EXPECT_STREQ("", ErrorTypeToString(CrawlErrorType::NONE));
}

TEST(CrawlerUtilsTest, Domains) {
	EXPECT_EQ("example.com", ExtractDomain("https://Example.com:8080/path"));
	EXPECT_EQ("", ExtractDomain("no-scheme"));
	EXPECT_EQ("/path?q=1", ExtractPath("https://example.com/path?q=1#frag"));
	EXPECT_EQ("/?q=1", ExtractPath("https://example.com?q=1"));
	EXPECT_EQ("/", ExtractPath("https://example.com"));

	EXPECT_EQ("t.me", TargetDomain("@crypto_signals", TargetKind::CHANNEL));
	EXPECT_EQ("example.com", TargetDomain("https://example.com/x", TargetKind::PAGE));

	EXPECT_TRUE(HostMatchesDomain("bit.ly", "bit.ly"));
	EXPECT_TRUE(HostMatchesDomain("go.bit.ly", "bit.ly"));
	EXPECT_FALSE(HostMatchesDomain("notbit.ly", "bit.ly"));
	EXPECT_FALSE(HostMatchesDomain("", "bit.ly"));
}

TEST(CrawlerUtilsTest, ContentHash) {
	// FNV-1a offset basis
	EXPECT_EQ("cbf29ce484222325", GenerateContentHash(""));
	EXPECT_EQ(16u, GenerateContentHash("hello").size());
	EXPECT_EQ(GenerateContentHash("hello"), GenerateContentHash("hello"));
	EXPECT_NE(GenerateContentHash("hello"), GenerateContentHash("hello!"));
}

TEST(CrawlerUtilsTest, ContentTypes) {
	EXPECT_TRUE(ContentTypeMatches("text/html; charset=utf-8", "text/html"));
	EXPECT_TRUE(ContentTypeMatches("text/plain", "text/*"));
	EXPECT_FALSE(ContentTypeMatches("application/json", "text/*"));

	const std::string accept = "text/html, application/xhtml+xml, text/plain";
	EXPECT_TRUE(IsContentTypeAcceptable("text/html; charset=utf-8", accept, ""));
	EXPECT_FALSE(IsContentTypeAcceptable("application/pdf", accept, ""));
	EXPECT_FALSE(IsContentTypeAcceptable("text/plain", "text/*", "text/plain"));
	EXPECT_TRUE(IsContentTypeAcceptable("", accept, ""));
	EXPECT_TRUE(IsContentTypeAcceptable("anything/else", "", ""));
}

TEST(CrawlerUtilsTest, Gzip) {
	EXPECT_TRUE(IsGzippedData(std::string("\x1f\x8b\x08", 3)));
	EXPECT_FALSE(IsGzippedData("<html>"));
	EXPECT_EQ("", DecompressGzip(""));
	EXPECT_EQ("", DecompressGzip("definitely not gzip"));
}
