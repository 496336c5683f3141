//===--------------------------------------------------------------------===//
// linkwatch - continuous discovery and risk classification of pages and
// channels
//===--------------------------------------------------------------------===//

#include "crawl_pipeline.hpp"
#include "crawler_utils.hpp"
#include "http_client.hpp"
#include "pipeline_config.hpp"
#include "pipeline_errors.hpp"
#include "yyjson_guard.hpp"

#include <libxml/parser.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <getopt.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace linkwatch;

static const char *LINKWATCH_VERSION = "1.0.0";

static void PrintUsage(const char *argv0) {
	fprintf(stdout,
	        "Usage: %s [options] <command> [args]\n"
	        "\n"
	        "Commands:\n"
	        "  crawl                       Fetch, classify and persist targets until idle\n"
	        "  classify [file|-]           Classify text from a file or stdin, store untouched\n"
	        "  stats                       Dashboard counters as JSON\n"
	        "  list                        Current verdicts in a risk band as JSON\n"
	        "  feedback drain              Hand out unresolved feedback items as JSON\n"
	        "  feedback resolve <id> <label>\n"
	        "                              Record a human label for a feedback item\n"
	        "  feedback flag <target>      Queue the current verdict of a target for review\n"
	        "\n"
	        "Options:\n"
	        "  -c, --config <file>         JSON config file\n"
	        "  -d, --db <path>             Database file (overrides store.database_path)\n"
	        "  -s, --seeds <file>          crawl: seeds file, one URL or handle per line\n"
	        "  -u, --url <url>             crawl: seed page (repeatable)\n"
	        "  -C, --channel <handle>      crawl: seed channel (repeatable)\n"
	        "  -f, --continuous            crawl: keep revisiting until interrupted\n"
	        "  -j, --threads <n>           crawl: worker threads\n"
	        "  -t, --target <id>           classify: target the text came from\n"
	        "  -b, --band <LOW|MEDIUM|HIGH> list: risk band (default HIGH)\n"
	        "  -k, --kind <page|channel>   list: restrict to one target kind\n"
	        "  -n, --limit <n>             list, feedback drain: maximum items (default 50)\n"
	        "  -o, --offset <n>            list: items to skip\n"
	        "  -l, --log-level <level>     trace, debug, info, warn or error\n"
	        "  -L, --log-file <file>       Also write logs to a file\n"
	        "  -h, --help                  Show this help\n"
	        "  -v, --version               Show version\n",
	        argv0);
}

struct CommandLine {
	std::string config_path;
	std::string db_path;
	std::string seeds_path;
	std::vector<std::string> seeds;
	bool continuous = false;
	int threads = 0;
	std::string target;
	std::string band = "HIGH";
	std::string kind;
	int64_t limit = 50;
	int64_t offset = 0;
	std::string log_level;
	std::string log_file;
	std::vector<std::string> args;  // Command and its positional arguments
};

// Helper: parse a non-negative integer option
static int64_t ParseCount(const char *option, const char *value) {
	char *end = nullptr;
	long long parsed = std::strtoll(value, &end, 10);
	if (!end || *end != '\0' || end == value || parsed < 0) {
		throw InvalidInputException(std::string("--") + option + " expects a non-negative integer, got '" + value +
		                            "'");
	}
	return parsed;
}

//===--------------------------------------------------------------------===//
// Logging
//===--------------------------------------------------------------------===//

static void SetupLogging(const LoggingConfig &config) {
	std::vector<spdlog::sink_ptr> sinks;
	sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
	if (!config.file.empty()) {
		sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file));
	}
	auto logger = std::make_shared<spdlog::logger>("linkwatch", sinks.begin(), sinks.end());
	logger->set_level(spdlog::level::from_str(config.level));
	logger->flush_on(spdlog::level::warn);
	spdlog::set_default_logger(logger);
}

//===--------------------------------------------------------------------===//
// JSON output
//===--------------------------------------------------------------------===//

static yyjson_mut_val *VerdictToJson(yyjson_mut_doc *doc, const Verdict &verdict, const StoreConfig &store) {
	yyjson_mut_val *obj = yyjson_mut_obj(doc);
	if (verdict.id != 0) {
		yyjson_mut_obj_add_int(doc, obj, "id", verdict.id);
	}
	yyjson_mut_obj_add_strcpy(doc, obj, "target", verdict.target.c_str());
	yyjson_mut_obj_add_str(doc, obj, "label", RiskLabelToString(verdict.label));
	yyjson_mut_obj_add_real(doc, obj, "probability", verdict.probability);
	yyjson_mut_obj_add_real(doc, obj, "risk_score", verdict.risk_score);
	RiskBand band = RiskBand::LOW;
	if (verdict.risk_score >= store.high_risk_threshold) {
		band = RiskBand::HIGH;
	} else if (verdict.risk_score >= store.medium_risk_threshold) {
		band = RiskBand::MEDIUM;
	}
	yyjson_mut_obj_add_str(doc, obj, "risk_band", RiskBandToString(band));
	if (verdict.model_score) {
		yyjson_mut_obj_add_real(doc, obj, "model_score", *verdict.model_score);
	} else {
		yyjson_mut_obj_add_null(doc, obj, "model_score");
	}
	yyjson_mut_val *signals = yyjson_mut_obj_add_arr(doc, obj, "rule_signals");
	for (const auto &signal : verdict.rule_signals) {
		yyjson_mut_val *item = yyjson_mut_arr_add_obj(doc, signals);
		yyjson_mut_obj_add_strcpy(doc, item, "rule", signal.rule.c_str());
		yyjson_mut_obj_add_str(doc, item, "label", RiskLabelToString(signal.label));
		yyjson_mut_obj_add_real(doc, item, "weight", signal.weight);
	}
	yyjson_mut_obj_add_strcpy(doc, obj, "produced_at", FormatTimestamp(verdict.produced_at).c_str());
	yyjson_mut_obj_add_strcpy(doc, obj, "source_hash", verdict.source_hash.c_str());
	if (verdict.message_stats) {
		yyjson_mut_val *messages = yyjson_mut_obj_add_obj(doc, obj, "messages");
		yyjson_mut_obj_add_int(doc, messages, "sample_count", verdict.message_stats->sample_count);
		yyjson_mut_obj_add_real(doc, messages, "avg_risk", verdict.message_stats->avg_risk);
		yyjson_mut_obj_add_real(doc, messages, "median_risk", verdict.message_stats->median_risk);
		yyjson_mut_obj_add_real(doc, messages, "pct90_risk", verdict.message_stats->pct90_risk);
	}
	return obj;
}

static void PrintJson(const YyjsonMutDocGuard &doc) {
	std::string out = doc.Write(YYJSON_WRITE_PRETTY);
	if (out.empty()) {
		throw LinkwatchException("cannot serialize output");
	}
	fprintf(stdout, "%s\n", out.c_str());
}

//===--------------------------------------------------------------------===//
// Commands
//===--------------------------------------------------------------------===//

static int RunCrawl(const PipelineConfig &config, const CommandLine &cli) {
	std::vector<std::string> seeds;
	if (!cli.seeds_path.empty()) {
		seeds = ReadSeedsFile(cli.seeds_path);
	}
	seeds.insert(seeds.end(), cli.seeds.begin(), cli.seeds.end());

	CrawlPipeline pipeline(config);
	pipeline.RestoreFrontier();
	pipeline.AddSeeds(seeds);
	if (pipeline.GetFrontier().Size() == 0) {
		spdlog::warn("Nothing to crawl: no seeds given and no pending targets in {}", config.store.database_path);
		return 0;
	}

	InstallSignalHandlers();
	if (cli.continuous) {
		pipeline.RunContinuous();
	} else {
		pipeline.RunUntilIdle();
	}
	return 0;
}

static int RunClassify(const PipelineConfig &config, const CommandLine &cli) {
	std::string text;
	std::string source = cli.args.size() > 1 ? cli.args[1] : "-";
	if (source == "-") {
		text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
	} else {
		std::ifstream in(source);
		if (!in) {
			throw InvalidInputException("cannot open '" + source + "'");
		}
		std::stringstream buffer;
		buffer << in.rdbuf();
		text = buffer.str();
	}
	text = ContentExtractor::TruncateUtf8(ContentExtractor::NormalizeText(text),
	                                      static_cast<size_t>(config.extract.max_text_length));

	std::string target = cli.target;
	if (!target.empty()) {
		TargetKind kind;
		std::string canonical = CanonicalizeIdentifier(target, kind);
		if (canonical.empty()) {
			throw InvalidInputException("invalid target '" + target + "'");
		}
		target = canonical;
	}

	auto rules = LoadRuleEngine(config.ensemble);
	auto model = MakeModelScorer(config.ensemble, config.fetch.user_agent);
	RiskEnsemble ensemble(config.ensemble, *rules, *model);
	auto classification = ensemble.Classify(text, target);

	YyjsonMutDocGuard doc;
	yyjson_mut_val *root = VerdictToJson(doc.get(), classification.verdict, config.store);
	yyjson_mut_obj_add_bool(doc.get(), root, "uncertain", classification.uncertain);
	yyjson_mut_doc_set_root(doc.get(), root);
	PrintJson(doc);
	return 0;
}

static int RunStats(const PipelineConfig &config) {
	StateStore store(config.store);
	auto stats = store.Stats(Clock::now());

	YyjsonMutDocGuard doc;
	yyjson_mut_val *root = yyjson_mut_obj(doc.get());
	yyjson_mut_doc_set_root(doc.get(), root);
	yyjson_mut_obj_add_int(doc.get(), root, "total_targets", stats.total_targets);
	yyjson_mut_obj_add_int(doc.get(), root, "total_flagged", stats.total_flagged);
	yyjson_mut_obj_add_int(doc.get(), root, "high_risk", stats.high_risk);
	yyjson_mut_obj_add_int(doc.get(), root, "medium_risk", stats.medium_risk);
	yyjson_mut_obj_add_int(doc.get(), root, "low_risk", stats.low_risk);
	yyjson_mut_obj_add_int(doc.get(), root, "found_today", stats.found_today);
	yyjson_mut_obj_add_int(doc.get(), root, "found_this_week", stats.found_this_week);
	yyjson_mut_obj_add_real(doc.get(), root, "avg_risk_score", stats.avg_risk_score);
	yyjson_mut_obj_add_int(doc.get(), root, "unique_domains", stats.unique_domains);
	yyjson_mut_obj_add_int(doc.get(), root, "unresolved_feedback", stats.unresolved_feedback);
	yyjson_mut_obj_add_int(doc.get(), root, "history_rows", stats.history_rows);
	yyjson_mut_val *by_status = yyjson_mut_obj_add_obj(doc.get(), root, "by_status");
	for (const auto &kv : stats.by_status) {
		yyjson_mut_obj_add_int(doc.get(), by_status, kv.first.c_str(), kv.second);
	}
	yyjson_mut_val *by_label = yyjson_mut_obj_add_obj(doc.get(), root, "by_label");
	for (const auto &kv : stats.by_label) {
		yyjson_mut_obj_add_int(doc.get(), by_label, kv.first.c_str(), kv.second);
	}
	if (auto health = store.LoadCheckpoint("ensemble_health")) {
		YyjsonDocGuard parsed(yyjson_read(health->c_str(), health->size(), 0));
		if (parsed) {
			yyjson_mut_obj_add_val(doc.get(), root, "ensemble_health", yyjson_val_mut_copy(doc.get(), parsed.root()));
		}
	}
	PrintJson(doc);
	return 0;
}

static int RunList(const PipelineConfig &config, const CommandLine &cli) {
	RiskBand band;
	if (!TryParseRiskBand(cli.band, band)) {
		throw InvalidInputException("unknown risk band '" + cli.band + "'");
	}
	std::optional<TargetKind> kind;
	if (!cli.kind.empty()) {
		TargetKind parsed;
		if (!TryParseTargetKind(cli.kind, parsed)) {
			throw InvalidInputException("unknown target kind '" + cli.kind + "'");
		}
		kind = parsed;
	}

	StateStore store(config.store);
	auto flagged = store.ListByRiskBand(band, cli.limit, cli.offset, kind);

	YyjsonMutDocGuard doc;
	yyjson_mut_val *root = yyjson_mut_obj(doc.get());
	yyjson_mut_doc_set_root(doc.get(), root);
	yyjson_mut_obj_add_str(doc.get(), root, "band", RiskBandToString(band));
	yyjson_mut_obj_add_int(doc.get(), root, "count", static_cast<int64_t>(flagged.size()));
	yyjson_mut_val *items = yyjson_mut_obj_add_arr(doc.get(), root, "items");
	for (const auto &item : flagged) {
		yyjson_mut_val *obj = yyjson_mut_arr_add_obj(doc.get(), items);
		yyjson_mut_obj_add_strcpy(doc.get(), obj, "identifier", item.target.identifier.c_str());
		yyjson_mut_obj_add_str(doc.get(), obj, "kind", TargetKindToString(item.target.kind));
		yyjson_mut_obj_add_strcpy(doc.get(), obj, "domain", item.domain.c_str());
		yyjson_mut_obj_add_int(doc.get(), obj, "visit_count", item.target.visit_count);
		if (item.target.last_visited_at) {
			yyjson_mut_obj_add_strcpy(doc.get(), obj, "last_visited_at",
			                          FormatTimestamp(*item.target.last_visited_at).c_str());
		}
		yyjson_mut_obj_add_strcpy(doc.get(), obj, "snippet", item.snippet.c_str());
		yyjson_mut_obj_add_val(doc.get(), obj, "verdict", VerdictToJson(doc.get(), item.verdict, config.store));
	}
	PrintJson(doc);
	return 0;
}

static int RunFeedback(const PipelineConfig &config, const CommandLine &cli) {
	if (cli.args.size() < 2) {
		throw InvalidInputException("feedback needs a subcommand: drain, resolve or flag");
	}
	const std::string &action = cli.args[1];
	StateStore store(config.store);
	FeedbackQueue queue(store, config.feedback);

	if (action == "drain") {
		auto items = queue.Drain(cli.limit);
		YyjsonMutDocGuard doc;
		yyjson_mut_val *root = yyjson_mut_arr(doc.get());
		yyjson_mut_doc_set_root(doc.get(), root);
		for (const auto &item : items) {
			yyjson_mut_val *obj = yyjson_mut_arr_add_obj(doc.get(), root);
			yyjson_mut_obj_add_int(doc.get(), obj, "id", item.id);
			yyjson_mut_obj_add_str(doc.get(), obj, "reason", FeedbackReasonToString(item.reason));
			yyjson_mut_obj_add_strcpy(doc.get(), obj, "enqueued_at", FormatTimestamp(item.enqueued_at).c_str());
			yyjson_mut_obj_add_strcpy(doc.get(), obj, "snippet", store.GetSnippet(item.verdict.target).c_str());
			yyjson_mut_obj_add_val(doc.get(), obj, "verdict", VerdictToJson(doc.get(), item.verdict, config.store));
		}
		PrintJson(doc);
		return 0;
	}

	if (action == "resolve") {
		if (cli.args.size() != 4) {
			throw InvalidInputException("usage: feedback resolve <id> <label>");
		}
		int64_t id = ParseCount("id", cli.args[2].c_str());
		RiskLabel label;
		if (!TryParseRiskLabel(cli.args[3], label)) {
			throw InvalidInputException("unknown label '" + cli.args[3] + "'");
		}
		queue.Resolve(id, label);
		return 0;
	}

	if (action == "flag") {
		if (cli.args.size() != 3) {
			throw InvalidInputException("usage: feedback flag <target>");
		}
		TargetKind kind;
		std::string identifier = CanonicalizeIdentifier(cli.args[2], kind);
		if (identifier.empty()) {
			throw InvalidInputException("invalid target '" + cli.args[2] + "'");
		}
		int64_t id = queue.Flag(identifier);
		fprintf(stdout, "%lld\n", static_cast<long long>(id));
		return 0;
	}

	throw InvalidInputException("unknown feedback subcommand '" + action + "'");
}

//===--------------------------------------------------------------------===//
// main
//===--------------------------------------------------------------------===//

int main(int argc, char **argv) {
	static option options[] = {
	    {"config", required_argument, nullptr, 'c'},
	    {"db", required_argument, nullptr, 'd'},
	    {"seeds", required_argument, nullptr, 's'},
	    {"url", required_argument, nullptr, 'u'},
	    {"channel", required_argument, nullptr, 'C'},
	    {"continuous", no_argument, nullptr, 'f'},
	    {"threads", required_argument, nullptr, 'j'},
	    {"target", required_argument, nullptr, 't'},
	    {"band", required_argument, nullptr, 'b'},
	    {"kind", required_argument, nullptr, 'k'},
	    {"limit", required_argument, nullptr, 'n'},
	    {"offset", required_argument, nullptr, 'o'},
	    {"log-level", required_argument, nullptr, 'l'},
	    {"log-file", required_argument, nullptr, 'L'},
	    {"help", no_argument, nullptr, 'h'},
	    {"version", no_argument, nullptr, 'v'},
	    {nullptr, 0, nullptr, 0}};

	CommandLine cli;
	try {
		int c;
		int index;
		while ((c = getopt_long(argc, argv, "c:d:s:u:C:fj:t:b:k:n:o:l:L:hv", options, &index)) != -1) {
			switch (c) {
				case 'c': cli.config_path = optarg; break;
				case 'd': cli.db_path = optarg; break;
				case 's': cli.seeds_path = optarg; break;
				case 'u': cli.seeds.push_back(RequireCanonicalIdentifier(optarg, TargetKind::PAGE)); break;
				case 'C': cli.seeds.push_back(RequireCanonicalIdentifier(optarg, TargetKind::CHANNEL)); break;
				case 'f': cli.continuous = true; break;
				case 'j': cli.threads = static_cast<int>(ParseCount("threads", optarg)); break;
				case 't': cli.target = optarg; break;
				case 'b': cli.band = optarg; break;
				case 'k': cli.kind = optarg; break;
				case 'n': cli.limit = ParseCount("limit", optarg); break;
				case 'o': cli.offset = ParseCount("offset", optarg); break;
				case 'l': cli.log_level = optarg; break;
				case 'L': cli.log_file = optarg; break;
				case 'h':
					PrintUsage(argv[0]);
					return 0;
				case 'v':
					fprintf(stdout, "linkwatch %s\n", LINKWATCH_VERSION);
					return 0;
				default:
					PrintUsage(argv[0]);
					return 1;
			}
		}
	} catch (const LinkwatchException &e) {
		fprintf(stderr, "%s\n", e.what());
		return 1;
	}
	for (int i = optind; i < argc; i++) {
		cli.args.emplace_back(argv[i]);
	}
	if (cli.args.empty()) {
		PrintUsage(argv[0]);
		return 1;
	}

	xmlInitParser();
	InitializeHttpClient();

	int rc = 1;
	try {
		PipelineConfig config = LoadPipelineConfig(cli.config_path);
		if (!cli.db_path.empty()) {
			config.store.database_path = cli.db_path;
		}
		if (cli.threads > 0) {
			config.workers.worker_threads = cli.threads;
		}
		if (!cli.log_level.empty()) {
			config.logging.level = cli.log_level;
		}
		if (!cli.log_file.empty()) {
			config.logging.file = cli.log_file;
		}
		ValidateConfig(config);
		SetupLogging(config.logging);

		const std::string &command = cli.args[0];
		if (command == "crawl") {
			rc = RunCrawl(config, cli);
		} else if (command == "classify") {
			rc = RunClassify(config, cli);
		} else if (command == "stats") {
			rc = RunStats(config);
		} else if (command == "list") {
			rc = RunList(config, cli);
		} else if (command == "feedback") {
			rc = RunFeedback(config, cli);
		} else {
			throw InvalidInputException("unknown command '" + command + "'");
		}
	} catch (const std::exception &e) {
		spdlog::error("{}", e.what());
		rc = 1;
	}

	CleanupHttpClient();
	xmlCleanupParser();
	spdlog::shutdown();
	return rc;
}
