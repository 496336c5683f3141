#include "crawl_pipeline.hpp"
#include "crawler_utils.hpp"
#include "pipeline_errors.hpp"
#include "yyjson_guard.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <fstream>

namespace linkwatch {

//===--------------------------------------------------------------------===//
// Shutdown signals
//===--------------------------------------------------------------------===//

static std::atomic<bool> g_shutdown_requested(false);
static std::atomic<int> g_sigint_count(0);
static std::atomic<int64_t> g_last_sigint_ms(0);

static int64_t SteadyNowMs() {
	return std::chrono::duration_cast<std::chrono::milliseconds>(
	           std::chrono::steady_clock::now().time_since_epoch())
	    .count();
}

static void SignalHandler(int signum) {
	if (signum == SIGINT) {
		int64_t now = SteadyNowMs();
		int64_t elapsed = now - g_last_sigint_ms.exchange(now);
		if (g_sigint_count.fetch_add(1) >= 1 && elapsed < 3000) {
			// Double Ctrl+C within 3 seconds - force exit
			std::_Exit(1);
		}
	}
	g_shutdown_requested = true;
}

void InstallSignalHandlers() {
	ResetShutdownFlag();
	std::signal(SIGINT, SignalHandler);
	std::signal(SIGTERM, SignalHandler);
}

bool ShutdownRequested() {
	return g_shutdown_requested.load();
}

void RequestShutdown() {
	g_shutdown_requested = true;
}

void ResetShutdownFlag() {
	g_shutdown_requested = false;
	g_sigint_count = 0;
	g_last_sigint_ms = 0;
}

//===--------------------------------------------------------------------===//
// Factories
//===--------------------------------------------------------------------===//

std::unique_ptr<RuleEngine> LoadRuleEngine(const EnsembleConfig &config) {
	if (config.rules_path.empty()) {
		return std::make_unique<RuleEngine>(RuleEngine::DefaultRules());
	}
	return std::make_unique<RuleEngine>(RuleEngine::FromFile(config.rules_path));
}

std::unique_ptr<ModelScorer> MakeModelScorer(const EnsembleConfig &config, const std::string &user_agent) {
	if (config.model_url.empty()) {
		return std::make_unique<NullModelScorer>();
	}
	return std::make_unique<HttpModelScorer>(config, user_agent);
}

std::vector<std::string> ReadSeedsFile(const std::string &path) {
	std::ifstream in(path);
	if (!in) {
		throw InvalidInputException("cannot open seeds file '" + path + "'");
	}
	std::vector<std::string> seeds;
	std::string line;
	while (std::getline(in, line)) {
		size_t comment = line.find('#');
		if (comment != std::string::npos) {
			line = line.substr(0, comment);
		}
		size_t start = line.find_first_not_of(" \t\r\n");
		if (start == std::string::npos) {
			continue;
		}
		size_t end = line.find_last_not_of(" \t\r\n");
		seeds.push_back(line.substr(start, end - start + 1));
	}
	return seeds;
}

//===--------------------------------------------------------------------===//
// CrawlPipeline
//===--------------------------------------------------------------------===//

CrawlPipeline::CrawlPipeline(const PipelineConfig &config) : config_(config) {
	Initialize(std::make_unique<HttpFetchClient>(config_.fetch),
	           MakeModelScorer(config_.ensemble, config_.fetch.user_agent));
}

CrawlPipeline::CrawlPipeline(const PipelineConfig &config, std::unique_ptr<FetchClient> fetcher,
                             std::unique_ptr<ModelScorer> model)
    : config_(config) {
	Initialize(std::move(fetcher), std::move(model));
}

CrawlPipeline::~CrawlPipeline() {
	if (pool_) {
		pool_->RequestShutdown();
		pool_->Join();
	}
}

void CrawlPipeline::Initialize(std::unique_ptr<FetchClient> fetcher, std::unique_ptr<ModelScorer> model) {
	store_ = std::make_unique<StateStore>(config_.store);
	rules_ = LoadRuleEngine(config_.ensemble);
	model_ = std::move(model);
	ensemble_ = std::make_unique<RiskEnsemble>(config_.ensemble, *rules_, *model_);
	frontier_ = std::make_unique<Frontier>(config_.frontier);
	fetcher_ = std::move(fetcher);
	extractor_ = std::make_unique<ContentExtractor>(config_.extract);
	feedback_ = std::make_unique<FeedbackQueue>(*store_, config_.feedback);
	pool_ = std::make_unique<WorkerPool>(config_, *frontier_, *store_, *fetcher_, *extractor_, *ensemble_,
	                                     *feedback_);
	last_progress_log_ = std::chrono::steady_clock::now();

	spdlog::info("Pipeline ready: {} rules, model {}", rules_->RuleCount(),
	             config_.ensemble.model_url.empty() ? "disabled (rule-only)" : config_.ensemble.model_url);
}

size_t CrawlPipeline::RestoreFrontier(Timestamp now) {
	auto revisit = [this](double risk) { return frontier_->RevisitInterval(risk); };
	size_t restored = 0;

	for (const auto &pending : store_->ListPending(now, revisit)) {
		const auto &target = pending.target;
		if (target.status == TargetStatus::IN_PROGRESS) {
			// Interrupted by a crash or forced exit
			store_->RollbackToPending(target.identifier);
		}
		FrontierEntry entry;
		entry.identifier = target.identifier;
		entry.kind = target.kind;
		entry.discovered_at = target.discovered_at;
		entry.not_before = pending.not_before;
		entry.depth = target.depth;
		entry.retry_count = target.retry_count;
		entry.visited = target.visit_count > 0;
		if (entry.visited) {
			entry.priority = frontier_->PriorityForRisk(pending.risk_score);
		} else {
			entry.priority = target.depth == 0 ? config_.frontier.seed_priority : config_.frontier.default_priority;
		}
		frontier_->Restore(entry);
		restored++;
	}

	for (const auto &scheduled : store_->ListScheduled(now, revisit)) {
		const auto &target = scheduled.target;
		FrontierEntry entry;
		entry.identifier = target.identifier;
		entry.kind = target.kind;
		entry.discovered_at = target.discovered_at;
		entry.not_before = scheduled.not_before;
		entry.depth = target.depth;
		entry.visited = true;
		entry.priority = frontier_->PriorityForRisk(scheduled.risk_score);
		frontier_->Restore(entry);
		restored++;
	}

	if (auto health = store_->LoadCheckpoint("ensemble_health")) {
		spdlog::debug("Previous ensemble health: {}", *health);
	}
	spdlog::info("Restored {} frontier entries from {}", restored, config_.store.database_path);
	return restored;
}

size_t CrawlPipeline::AddSeeds(const std::vector<std::string> &seeds, Timestamp now) {
	size_t accepted = 0;
	for (const auto &raw : seeds) {
		TargetKind kind;
		std::string identifier = CanonicalizeIdentifier(raw, kind);
		if (identifier.empty()) {
			spdlog::warn("Skipping invalid seed '{}'", raw);
			continue;
		}
		auto registered = store_->RegisterTarget(identifier, kind, 0, now);
		if (registered.first.status == TargetStatus::PERMANENTLY_FAILED) {
			spdlog::warn("Skipping seed {}: permanently failed ({})", identifier, registered.first.last_error);
			frontier_->Retire(identifier);
			continue;
		}
		frontier_->Enqueue(identifier, kind, config_.frontier.seed_priority, 0, now);
		accepted++;
	}
	spdlog::info("Accepted {} of {} seeds", accepted, seeds.size());
	return accepted;
}

void CrawlPipeline::LogProgress() {
	auto stats = pool_->Stats();
	auto health = ensemble_->Health();
	spdlog::info("Progress: {} processed, {} ok ({} unchanged), {} transient, {} permanent, {} rolled back, "
	             "{} discovered, {} queued for feedback; frontier {} ({} in progress){}",
	             stats.processed, stats.succeeded, stats.reused, stats.transient_failures,
	             stats.permanent_failures, stats.rolled_back, stats.discovered, stats.feedback_queued,
	             frontier_->Size(), frontier_->InProgressCount(), health.degraded ? ", rule-only mode" : "");
}

void CrawlPipeline::SaveHealthCheckpoint() {
	auto health = ensemble_->Health();
	YyjsonMutDocGuard doc;
	if (!doc) {
		return;
	}
	yyjson_mut_val *root = yyjson_mut_obj(doc.get());
	yyjson_mut_doc_set_root(doc.get(), root);
	yyjson_mut_obj_add_bool(doc.get(), root, "degraded", health.degraded);
	yyjson_mut_obj_add_int(doc.get(), root, "consecutive_unavailable", health.consecutive_unavailable);
	yyjson_mut_obj_add_int(doc.get(), root, "model_verdicts", health.model_verdicts);
	yyjson_mut_obj_add_int(doc.get(), root, "rule_only_verdicts", health.rule_only_verdicts);
	yyjson_mut_obj_add_strcpy(doc.get(), root, "last_model_error", health.last_model_error.c_str());
	yyjson_mut_obj_add_strcpy(doc.get(), root, "updated_at", FormatTimestamp(Clock::now()).c_str());
	try {
		store_->SaveCheckpoint("ensemble_health", doc.Write());
	} catch (const LinkwatchException &e) {
		spdlog::warn("Cannot save health checkpoint: {}", e.what());
	}
}

bool CrawlPipeline::Tick() {
	bool degraded = ensemble_->Degraded();
	if (degraded != last_degraded_) {
		last_degraded_ = degraded;
		SaveHealthCheckpoint();
	}

	auto now = std::chrono::steady_clock::now();
	if (config_.workers.stats_log_interval_ms > 0 &&
	    now - last_progress_log_ >= std::chrono::milliseconds(config_.workers.stats_log_interval_ms)) {
		last_progress_log_ = now;
		LogProgress();
	}
	return ShutdownRequested();
}

void CrawlPipeline::RunUntilIdle() {
	pool_->RunUntilIdle([this]() { return Tick(); });
	if (ShutdownRequested()) {
		spdlog::info("Shutdown requested, stopped with {} frontier entries", frontier_->Size());
	}
	LogProgress();
	SaveHealthCheckpoint();
}

void CrawlPipeline::RunContinuous() {
	pool_->Start();
	Duration poll(config_.workers.idle_poll_interval_ms);
	while (!Tick()) {
		frontier_->WaitForWork(poll);
	}
	spdlog::info("Shutdown requested, waiting for workers");
	pool_->RequestShutdown();
	pool_->Join();
	LogProgress();
	SaveHealthCheckpoint();
}

} // namespace linkwatch
