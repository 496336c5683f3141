#include <gtest/gtest.h>

#include "crawl_pipeline.hpp"
#include "pipeline_errors.hpp"
#include "worker_pool.hpp"
#include "TestDoubles.hpp"

#include <cstdio>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

using namespace linkwatch;
using test::At;
using test::T0;

static const char *FRAUD_PAGE = "<html><body><p>Send your bank details today</p>"
                                "<a href=\"/deals\">deals</a>"
                                "<a href=\"https://t.me/free_money_daily\">telegram</a></body></html>";

static const char *BENIGN_PAGE = "<html><body><p>Lovely weather this week</p></body></html>";

// Fails every visit write while failing is set
class FailingVisitStore : public StateStore {
public:
	using StateStore::StateStore;

	int64_t RecordVisit(const std::string &identifier, Verdict &verdict, const std::string &snippet,
	                    Timestamp now) override {
		if (failing) {
			throw StoreWriteError("disk full");
		}
		return StateStore::RecordVisit(identifier, verdict, snippet, now);
	}

	bool failing = true;
};

// Components wired the way CrawlPipeline wires them, around an in-memory
// store and scripted fetch and model doubles
template <class Store>
class BasicWorkerHarness {
public:
	explicit BasicWorkerHarness(const PipelineConfig &config)
	    : config(config), store(config.store), frontier(config.frontier), extractor(config.extract),
	      rules(RuleEngine::DefaultRules()), ensemble(config.ensemble, rules, model),
	      feedback(store, config.feedback), pool(config, frontier, store, fetcher, extractor, ensemble, feedback) {
	}

	void Seed(const std::string &identifier, TargetKind kind = TargetKind::PAGE) {
		store.RegisterTarget(identifier, kind, 0, Clock::now());
		frontier.Enqueue(identifier, kind, config.frontier.seed_priority);
	}

	// Dequeue and process the next eligible entry; false when none is due
	bool ProcessNext(Timestamp now = Clock::now()) {
		auto batch = frontier.DequeueBatch(1, now);
		if (batch.empty()) {
			return false;
		}
		pool.ProcessTarget(batch[0]);
		return true;
	}

	PipelineConfig config;
	Store store;
	Frontier frontier;
	test::FakeFetchClient fetcher;
	ContentExtractor extractor;
	RuleEngine rules;
	test::FakeModelScorer model;
	RiskEnsemble ensemble;
	FeedbackQueue feedback;
	WorkerPool pool;
};

using WorkerHarness = BasicWorkerHarness<StateStore>;

TEST(WorkerPoolTest, SuccessStoresVerdictAndDiscovers) {
	WorkerHarness h(test::InMemoryConfig());
	const std::string id = "https://example.com/";
	h.Seed(id);
	h.fetcher.Script(id, test::HtmlPage(id, FRAUD_PAGE));

	ASSERT_TRUE(h.ProcessNext());

	auto target = h.store.GetTarget(id);
	ASSERT_TRUE(target.has_value());
	EXPECT_EQ(TargetStatus::DONE, target->status);
	EXPECT_EQ(1, target->visit_count);
	EXPECT_NE(std::string::npos, h.store.GetSnippet(id).find("bank details"));

	auto verdict = h.store.GetCurrentVerdict(id);
	ASSERT_TRUE(verdict.has_value());
	EXPECT_EQ(RiskLabel::FRAUD, verdict->label);
	EXPECT_NEAR(0.9, verdict->probability, 1e-9);
	EXPECT_FALSE(verdict->model_score.has_value());

	// discoveries are registered one level deeper and queued
	auto deals = h.store.GetTarget("https://example.com/deals");
	ASSERT_TRUE(deals.has_value());
	EXPECT_EQ(1, deals->depth);
	EXPECT_TRUE(h.frontier.Contains("https://example.com/deals"));
	auto channel = h.store.GetTarget("@free_money_daily");
	ASSERT_TRUE(channel.has_value());
	EXPECT_EQ(TargetKind::CHANNEL, channel->kind);
	EXPECT_TRUE(h.frontier.Contains("@free_money_daily"));

	auto entry = h.frontier.Get(id);
	ASSERT_TRUE(entry.has_value());
	EXPECT_TRUE(entry->visited);
	EXPECT_FALSE(entry->in_progress);
	EXPECT_DOUBLE_EQ(h.frontier.PriorityForRisk(0.9), entry->priority);

	auto stats = h.pool.Stats();
	EXPECT_EQ(1, stats.processed);
	EXPECT_EQ(1, stats.succeeded);
	EXPECT_EQ(2, stats.discovered);
	EXPECT_EQ(0, stats.feedback_queued);
}

TEST(WorkerPoolTest, DiscoveryStopsAtDepthLimit) {
	PipelineConfig config = test::InMemoryConfig();
	config.extract.max_discovery_depth = 0;
	WorkerHarness h(config);
	const std::string id = "https://example.com/";
	h.Seed(id);
	h.fetcher.Script(id, test::HtmlPage(id, FRAUD_PAGE));

	ASSERT_TRUE(h.ProcessNext());
	EXPECT_FALSE(h.store.GetTarget("https://example.com/deals").has_value());
	// channels are followed regardless of depth
	EXPECT_TRUE(h.frontier.Contains("@free_money_daily"));
}

TEST(WorkerPoolTest, TransientFailuresExhaustRetries) {
	WorkerHarness h(test::InMemoryConfig());
	const std::string id = "https://flaky.com/";
	h.Seed(id);
	h.fetcher.Script(id, test::Failure(id, FetchOutcome::TRANSIENT_FAILURE, 503, "HTTP 503"));

	ASSERT_TRUE(h.ProcessNext());
	auto target = h.store.GetTarget(id);
	EXPECT_EQ(TargetStatus::PENDING, target->status);
	EXPECT_EQ(1, target->retry_count);
	EXPECT_NE(std::string::npos, target->last_error.find("HTTP 503"));
	EXPECT_TRUE(h.frontier.Contains(id));

	ASSERT_TRUE(h.ProcessNext());
	EXPECT_EQ(2, h.store.GetTarget(id)->retry_count);

	ASSERT_TRUE(h.ProcessNext());
	target = h.store.GetTarget(id);
	EXPECT_EQ(TargetStatus::PERMANENTLY_FAILED, target->status);
	EXPECT_EQ(3, target->retry_count);
	EXPECT_TRUE(h.frontier.IsRetired(id));
	EXPECT_FALSE(h.ProcessNext());

	EXPECT_EQ(3, h.fetcher.Calls(id));
	EXPECT_EQ(3, h.pool.Stats().transient_failures);
	EXPECT_FALSE(h.store.GetCurrentVerdict(id).has_value());
}

TEST(WorkerPoolTest, PermanentFailure) {
	WorkerHarness h(test::InMemoryConfig());
	const std::string id = "https://gone.com/";
	h.Seed(id);

	ASSERT_TRUE(h.ProcessNext());
	auto target = h.store.GetTarget(id);
	EXPECT_EQ(TargetStatus::PERMANENTLY_FAILED, target->status);
	EXPECT_NE(std::string::npos, target->last_error.find("not scripted"));
	EXPECT_TRUE(h.frontier.IsRetired(id));
	EXPECT_EQ(1, h.pool.Stats().permanent_failures);
	EXPECT_EQ(1, h.fetcher.Calls(id));
}

TEST(WorkerPoolTest, UnchangedContentReusesVerdict) {
	WorkerHarness h(test::InMemoryConfig());
	h.model.SetDistribution({{RiskLabel::BENIGN, 1.0}});
	const std::string id = "https://calm.com/";
	h.Seed(id);
	h.fetcher.Script(id, test::HtmlPage(id, BENIGN_PAGE));

	ASSERT_TRUE(h.ProcessNext());
	auto first = h.store.GetCurrentVerdict(id);
	ASSERT_TRUE(first.has_value());
	EXPECT_EQ(RiskLabel::BENIGN, first->label);

	// the revisit is not due yet, so look far ahead
	ASSERT_TRUE(h.ProcessNext(Clock::now() + std::chrono::hours(24 * 30)));
	auto second = h.store.GetCurrentVerdict(id);
	ASSERT_TRUE(second.has_value());
	EXPECT_NE(first->id, second->id);
	EXPECT_EQ(first->label, second->label);
	EXPECT_EQ(first->source_hash, second->source_hash);

	EXPECT_EQ(1, h.model.Calls());
	EXPECT_EQ(2, h.store.GetTarget(id)->visit_count);
	EXPECT_EQ(2u, h.store.GetVerdictHistory(id, 10).size());
	EXPECT_EQ(1, h.pool.Stats().reused);
}

TEST(WorkerPoolTest, RuleOnlyVerdictsAreRecomputed) {
	WorkerHarness h(test::InMemoryConfig());
	const std::string id = "https://calm.com/";
	h.Seed(id);
	h.fetcher.Script(id, test::HtmlPage(id, BENIGN_PAGE));

	ASSERT_TRUE(h.ProcessNext());
	ASSERT_TRUE(h.ProcessNext(Clock::now() + std::chrono::hours(24 * 30)));
	EXPECT_EQ(2, h.model.Calls());
	EXPECT_EQ(0, h.pool.Stats().reused);
}

TEST(WorkerPoolTest, UncertainVerdictGoesToFeedback) {
	PipelineConfig config = test::InMemoryConfig();
	config.ensemble.rule_weight = 0.5;
	WorkerHarness h(config);
	// BENIGN 0.5 * 1.0 + 0.5 * 0.1 = 0.55 against a 0.5 boundary
	h.model.SetDistribution({{RiskLabel::FRAUD, 0.9}, {RiskLabel::BENIGN, 0.1}});
	const std::string id = "https://borderline.com/";
	h.Seed(id);
	h.fetcher.Script(id, test::HtmlPage(id, BENIGN_PAGE));

	ASSERT_TRUE(h.ProcessNext());
	auto verdict = h.store.GetCurrentVerdict(id);
	ASSERT_TRUE(verdict.has_value());
	EXPECT_EQ(RiskLabel::BENIGN, verdict->label);
	EXPECT_NEAR(0.55, verdict->probability, 1e-9);

	EXPECT_EQ(1, h.feedback.UnresolvedCount());
	EXPECT_EQ(1, h.pool.Stats().feedback_queued);
	auto items = h.feedback.Drain(10, Clock::now());
	ASSERT_EQ(1u, items.size());
	EXPECT_EQ(verdict->id, items[0].verdict.id);
	EXPECT_EQ(FeedbackReason::LOW_CONFIDENCE, items[0].reason);
}

TEST(WorkerPoolTest, LowConfidenceQueueCanBeDisabled) {
	PipelineConfig config = test::InMemoryConfig();
	config.ensemble.rule_weight = 0.5;
	config.feedback.enqueue_low_confidence = false;
	WorkerHarness h(config);
	h.model.SetDistribution({{RiskLabel::FRAUD, 0.9}, {RiskLabel::BENIGN, 0.1}});
	const std::string id = "https://borderline.com/";
	h.Seed(id);
	h.fetcher.Script(id, test::HtmlPage(id, BENIGN_PAGE));

	ASSERT_TRUE(h.ProcessNext());
	EXPECT_EQ(0, h.feedback.UnresolvedCount());
}

TEST(WorkerPoolTest, ThreadedRunDrainsFrontier) {
	WorkerHarness h(test::InMemoryConfig());
	for (int i = 0; i < 6; i++) {
		std::string id = "https://site" + std::to_string(i) + ".com/";
		h.Seed(id);
		h.fetcher.Script(id, test::HtmlPage(id, BENIGN_PAGE));
	}
	h.pool.RunUntilIdle();

	EXPECT_FALSE(h.frontier.HasOutstandingWork());
	EXPECT_EQ(0u, h.frontier.InProgressCount());
	EXPECT_EQ(6, h.pool.Stats().succeeded);
	EXPECT_EQ(6, h.store.Stats(Clock::now()).by_status["done"]);
}

TEST(WorkerPoolTest, DomainBlockDefersWithoutChargingRetries) {
	WorkerHarness h(test::InMemoryConfig());
	const std::string id = "https://busy.com/page";
	h.Seed(id);
	for (int i = 0; i < 4; i++) {
		h.fetcher.Script(id, test::Blocked(id, Duration(600000)));
	}
	h.fetcher.Script(id, test::HtmlPage(id, BENIGN_PAGE));

	ASSERT_TRUE(h.ProcessNext());
	auto target = h.store.GetTarget(id);
	EXPECT_EQ(TargetStatus::PENDING, target->status);
	EXPECT_EQ(0, target->retry_count);
	EXPECT_NE(std::string::npos, target->last_error.find("domain_blocked"));
	auto entry = h.frontier.Get(id);
	ASSERT_TRUE(entry.has_value());
	EXPECT_EQ(0, entry->retry_count);
	EXPECT_GT(entry->not_before, Clock::now() + std::chrono::minutes(9));
	EXPECT_FALSE(h.ProcessNext());

	// more blocked attempts than max_retries, still never retired
	for (int i = 0; i < 3; i++) {
		ASSERT_TRUE(h.ProcessNext(Clock::now() + std::chrono::hours(1)));
		EXPECT_FALSE(h.frontier.IsRetired(id));
		EXPECT_EQ(0, h.store.GetTarget(id)->retry_count);
	}

	ASSERT_TRUE(h.ProcessNext(Clock::now() + std::chrono::hours(1)));
	EXPECT_EQ(TargetStatus::DONE, h.store.GetTarget(id)->status);
	EXPECT_EQ(5, h.fetcher.Calls(id));
	auto stats = h.pool.Stats();
	EXPECT_EQ(4, stats.deferred);
	EXPECT_EQ(0, stats.transient_failures);
	EXPECT_EQ(1, stats.succeeded);
}

TEST(WorkerPoolTest, StoreWriteFailureRollsBack) {
	BasicWorkerHarness<FailingVisitStore> h(test::InMemoryConfig());
	const std::string id = "https://calm.com/";
	h.Seed(id);
	h.fetcher.Script(id, test::HtmlPage(id, BENIGN_PAGE));

	ASSERT_TRUE(h.ProcessNext());
	auto target = h.store.GetTarget(id);
	EXPECT_EQ(TargetStatus::PENDING, target->status);
	EXPECT_EQ(0, target->retry_count);
	EXPECT_FALSE(h.store.GetCurrentVerdict(id).has_value());
	auto entry = h.frontier.Get(id);
	ASSERT_TRUE(entry.has_value());
	EXPECT_FALSE(entry->in_progress);
	EXPECT_EQ(0, entry->retry_count);
	EXPECT_EQ(0u, h.frontier.InProgressCount());

	auto stats = h.pool.Stats();
	EXPECT_EQ(1, stats.rolled_back);
	EXPECT_EQ(0, stats.transient_failures);
	EXPECT_EQ(0, stats.succeeded);

	// eligible again straight away
	h.store.failing = false;
	ASSERT_TRUE(h.ProcessNext());
	EXPECT_EQ(TargetStatus::DONE, h.store.GetTarget(id)->status);
	EXPECT_EQ(2, h.fetcher.Calls(id));
}

TEST(WorkerPoolTest, ShutdownRollsBackRestOfBatch) {
	PipelineConfig config = test::InMemoryConfig();
	config.workers.worker_threads = 1;
	config.workers.batch_size = 3;
	WorkerHarness h(config);
	std::vector<std::string> ids = {"https://one.com/", "https://two.com/", "https://three.com/"};
	for (const auto &id : ids) {
		h.Seed(id);
		h.fetcher.Script(id, test::HtmlPage(id, BENIGN_PAGE));
	}
	h.fetcher.OnFetch([&h](const std::string &) { h.pool.RequestShutdown(); });

	h.pool.Start();
	h.pool.Join();

	int fetched = 0;
	for (const auto &id : ids) {
		fetched += h.fetcher.Calls(id);
	}
	EXPECT_EQ(1, fetched);
	EXPECT_EQ(1, h.pool.Stats().succeeded);
	EXPECT_EQ(0u, h.frontier.InProgressCount());

	int pending = 0;
	for (const auto &id : ids) {
		if (h.fetcher.Calls(id) > 0) {
			continue;
		}
		auto entry = h.frontier.Get(id);
		ASSERT_TRUE(entry.has_value());
		EXPECT_FALSE(entry->in_progress);
		EXPECT_FALSE(entry->visited);
		EXPECT_EQ(0, entry->retry_count);
		EXPECT_EQ(TargetStatus::PENDING, h.store.GetTarget(id)->status);
		pending++;
	}
	EXPECT_EQ(2, pending);
	EXPECT_TRUE(h.frontier.HasOutstandingWork());
}

TEST(WorkerPoolTest, ChannelVerdictAggregatesMessages) {
	WorkerHarness h(test::InMemoryConfig());
	const std::string id = "@cash_helpdesk";
	h.Seed(id, TargetKind::CHANNEL);
	std::string preview = "<html><body>";
	for (const char *message : {"Good morning everyone", "Send your bank details today", "Please send bank details"}) {
		preview += "<div class=\"tgme_widget_message_wrap\"><div class=\"tgme_widget_message_text\">";
		preview += message;
		preview += "</div></div>";
	}
	preview += "</body></html>";
	h.fetcher.Script(id, test::HtmlPage(id, preview));

	ASSERT_TRUE(h.ProcessNext());
	auto verdict = h.store.GetCurrentVerdict(id);
	ASSERT_TRUE(verdict.has_value());
	// message risks 0, 0.9 and 0.9
	EXPECT_EQ(RiskLabel::FRAUD, verdict->label);
	EXPECT_NEAR(0.9, verdict->probability, 1e-9);
	ASSERT_TRUE(verdict->message_stats.has_value());
	EXPECT_EQ(3, verdict->message_stats->sample_count);
	EXPECT_NEAR(0.6, verdict->message_stats->avg_risk, 1e-9);
	EXPECT_NEAR(0.9, verdict->message_stats->median_risk, 1e-9);
	EXPECT_NEAR(0.9, verdict->message_stats->pct90_risk, 1e-9);
	EXPECT_EQ(3, h.model.Calls());

	auto history = h.store.GetVerdictHistory(id, 1);
	ASSERT_EQ(1u, history.size());
	ASSERT_TRUE(history[0].message_stats.has_value());
	EXPECT_EQ(3, history[0].message_stats->sample_count);
}

//===--------------------------------------------------------------------===//
// CrawlPipeline
//===--------------------------------------------------------------------===//

TEST(CrawlPipelineTest, SeedsRunToCompletion) {
	ResetShutdownFlag();
	PipelineConfig config = test::InMemoryConfig();
	config.extract.max_discovery_depth = 1;
	config.extract.discover_channels = false;

	auto fetcher = std::make_unique<test::FakeFetchClient>();
	fetcher->Script("https://example.com/", test::HtmlPage("https://example.com/", FRAUD_PAGE));
	fetcher->Script("https://example.com/deals",
	                test::HtmlPage("https://example.com/deals",
	                               "<html><body><p>Weekly deals</p><a href=\"/deeper\">more</a></body></html>"));
	CrawlPipeline pipeline(config, std::move(fetcher), std::make_unique<test::FakeModelScorer>());

	EXPECT_EQ(2u, pipeline.AddSeeds({"https://Example.com", "ftp://example.com/file", "@Some_Channel"}));
	pipeline.RunUntilIdle();

	auto &store = pipeline.Store();
	EXPECT_EQ(TargetStatus::DONE, store.GetTarget("https://example.com/")->status);
	EXPECT_EQ(RiskLabel::FRAUD, store.GetCurrentVerdict("https://example.com/")->label);
	EXPECT_EQ(TargetStatus::DONE, store.GetTarget("https://example.com/deals")->status);
	EXPECT_EQ(RiskLabel::BENIGN, store.GetCurrentVerdict("https://example.com/deals")->label);
	EXPECT_FALSE(store.GetTarget("https://example.com/deeper").has_value());
	EXPECT_EQ(TargetStatus::PERMANENTLY_FAILED, store.GetTarget("@some_channel")->status);

	auto stats = pipeline.Workers().Stats();
	EXPECT_EQ(2, stats.succeeded);
	EXPECT_EQ(1, stats.permanent_failures);
	EXPECT_FALSE(pipeline.GetFrontier().HasOutstandingWork());
	EXPECT_TRUE(store.LoadCheckpoint("ensemble_health").has_value());

	// a permanently failed seed is refused on the next run
	EXPECT_EQ(0u, pipeline.AddSeeds({"@some_channel"}));
}

TEST(CrawlPipelineTest, RestoreFrontierFromStore) {
	PipelineConfig config = test::InMemoryConfig();
	CrawlPipeline pipeline(config, std::make_unique<test::FakeFetchClient>(),
	                       std::make_unique<test::FakeModelScorer>());
	auto &store = pipeline.Store();

	store.RegisterTarget("https://interrupted.com/", TargetKind::PAGE, 0, T0());
	store.MarkInProgress("https://interrupted.com/");
	store.RegisterTarget("https://retrying.com/", TargetKind::PAGE, 2, T0());
	store.RecordFailure("https://retrying.com/", 2, "HTTP 503", false);
	store.RegisterTarget("https://dead.com/", TargetKind::PAGE, 0, T0());
	store.RecordFailure("https://dead.com/", 0, "HTTP 404", true);
	store.RegisterTarget("@visited_channel", TargetKind::CHANNEL, 0, T0());
	Verdict verdict;
	verdict.label = RiskLabel::FRAUD;
	verdict.probability = 0.9;
	verdict.risk_score = 0.9;
	verdict.produced_at = T0();
	store.RecordVisit("@visited_channel", verdict, "", T0());

	EXPECT_EQ(3u, pipeline.RestoreFrontier(At(1000)));
	auto &frontier = pipeline.GetFrontier();

	EXPECT_EQ(TargetStatus::PENDING, store.GetTarget("https://interrupted.com/")->status);
	auto interrupted = frontier.Get("https://interrupted.com/");
	ASSERT_TRUE(interrupted.has_value());
	EXPECT_DOUBLE_EQ(config.frontier.seed_priority, interrupted->priority);
	EXPECT_EQ(At(1000), interrupted->not_before);

	auto retrying = frontier.Get("https://retrying.com/");
	ASSERT_TRUE(retrying.has_value());
	EXPECT_EQ(2, retrying->retry_count);
	EXPECT_EQ(2, retrying->depth);
	EXPECT_DOUBLE_EQ(config.frontier.default_priority, retrying->priority);

	EXPECT_FALSE(frontier.Contains("https://dead.com/"));

	auto visited = frontier.Get("@visited_channel");
	ASSERT_TRUE(visited.has_value());
	EXPECT_TRUE(visited->visited);
	EXPECT_DOUBLE_EQ(frontier.PriorityForRisk(0.9), visited->priority);
	EXPECT_EQ(T0() + frontier.RevisitInterval(0.9), visited->not_before);
}

TEST(CrawlPipelineTest, ReadSeedsFile) {
	const std::string path = ::testing::TempDir() + "linkwatch_seeds_test.txt";
	{
		std::ofstream out(path);
		out << "# seeds\nhttps://example.com/\n\n  @some_channel  # trailing comment\n\t\n";
	}
	auto seeds = ReadSeedsFile(path);
	std::remove(path.c_str());
	ASSERT_EQ(2u, seeds.size());
	EXPECT_EQ("https://example.com/", seeds[0]);
	EXPECT_EQ("@some_channel", seeds[1]);
	EXPECT_THROW(ReadSeedsFile("/nonexistent/seeds.txt"), InvalidInputException);
}
