#pragma once

//===--------------------------------------------------------------------===//
// crawl_pipeline.hpp - Component wiring, restart recovery and run modes
//===--------------------------------------------------------------------===//

#include "content_extractor.hpp"
#include "feedback_queue.hpp"
#include "fetch_client.hpp"
#include "frontier.hpp"
#include "model_scorer.hpp"
#include "pipeline_config.hpp"
#include "risk_ensemble.hpp"
#include "rule_engine.hpp"
#include "state_store.hpp"
#include "worker_pool.hpp"

#include <memory>
#include <string>
#include <vector>

namespace linkwatch {

//===--------------------------------------------------------------------===//
// Shutdown signals
//===--------------------------------------------------------------------===//

// SIGINT/SIGTERM request a graceful shutdown; a second SIGINT within three
// seconds exits immediately
void InstallSignalHandlers();
bool ShutdownRequested();
void RequestShutdown();
void ResetShutdownFlag();

//===--------------------------------------------------------------------===//
// Factories shared with the classify command
//===--------------------------------------------------------------------===//

// Rule file when configured, built-in rules otherwise
std::unique_ptr<RuleEngine> LoadRuleEngine(const EnsembleConfig &config);

// HTTP scorer when a model URL is configured, NullModelScorer otherwise
std::unique_ptr<ModelScorer> MakeModelScorer(const EnsembleConfig &config, const std::string &user_agent);

// One URL or channel handle per line; blank lines and # comments skipped
std::vector<std::string> ReadSeedsFile(const std::string &path);

//===--------------------------------------------------------------------===//
// CrawlPipeline
//===--------------------------------------------------------------------===//

class CrawlPipeline {
public:
	explicit CrawlPipeline(const PipelineConfig &config);
	// Injected fetch client and model scorer (tests, replay)
	CrawlPipeline(const PipelineConfig &config, std::unique_ptr<FetchClient> fetcher,
	              std::unique_ptr<ModelScorer> model);
	~CrawlPipeline();

	CrawlPipeline(const CrawlPipeline &) = delete;
	CrawlPipeline &operator=(const CrawlPipeline &) = delete;

	// Rebuild frontier entries from the store. Returns the number restored.
	size_t RestoreFrontier(Timestamp now = Clock::now());

	// Canonicalize, register and enqueue seeds at seed priority. Invalid
	// seeds are logged and skipped. Returns the number accepted.
	size_t AddSeeds(const std::vector<std::string> &seeds, Timestamp now = Clock::now());

	// Process until nothing is outstanding or a shutdown is requested
	void RunUntilIdle();
	// Keep revisiting until a shutdown is requested
	void RunContinuous();

	void LogProgress();
	void SaveHealthCheckpoint();

	StateStore &Store() { return *store_; }
	Frontier &GetFrontier() { return *frontier_; }
	RiskEnsemble &Ensemble() { return *ensemble_; }
	FeedbackQueue &Feedback() { return *feedback_; }
	WorkerPool &Workers() { return *pool_; }

private:
	void Initialize(std::unique_ptr<FetchClient> fetcher, std::unique_ptr<ModelScorer> model);
	// Periodic bookkeeping from the monitoring thread; true once a shutdown
	// has been requested
	bool Tick();

	PipelineConfig config_;
	std::unique_ptr<StateStore> store_;
	std::unique_ptr<RuleEngine> rules_;
	std::unique_ptr<ModelScorer> model_;
	std::unique_ptr<RiskEnsemble> ensemble_;
	std::unique_ptr<Frontier> frontier_;
	std::unique_ptr<FetchClient> fetcher_;
	std::unique_ptr<ContentExtractor> extractor_;
	std::unique_ptr<FeedbackQueue> feedback_;
	std::unique_ptr<WorkerPool> pool_;

	std::chrono::steady_clock::time_point last_progress_log_;
	bool last_degraded_ = false;
};

} // namespace linkwatch
