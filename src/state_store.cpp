#include "state_store.hpp"
#include "crawler_utils.hpp"
#include "pipeline_errors.hpp"
#include "yyjson_guard.hpp"

#include <spdlog/spdlog.h>

namespace linkwatch {

using duckdb::Value;

//===--------------------------------------------------------------------===//
// Value conversion helpers
//===--------------------------------------------------------------------===//

static Value TimestampValue(Timestamp ts) {
	auto micros = std::chrono::duration_cast<std::chrono::microseconds>(ts.time_since_epoch()).count();
	return Value::TIMESTAMP(duckdb::timestamp_t(micros));
}

static Value OptionalTimestampValue(const std::optional<Timestamp> &ts) {
	return ts ? TimestampValue(*ts) : Value();
}

static std::string GetString(const Value &value) {
	return value.IsNull() ? std::string() : duckdb::StringValue::Get(value);
}

static int64_t GetInt(const Value &value) {
	return value.IsNull() ? 0 : value.GetValue<int64_t>();
}

static double GetDouble(const Value &value) {
	return value.IsNull() ? 0.0 : value.GetValue<double>();
}

// Timestamps are read back through epoch_ms()
static std::optional<Timestamp> GetTimestamp(const Value &value) {
	if (value.IsNull()) {
		return std::nullopt;
	}
	return FromEpochMs(value.GetValue<int64_t>());
}

static std::string SerializeSignals(const std::vector<RuleSignal> &signals) {
	YyjsonMutDocGuard doc;
	if (!doc) {
		throw StoreWriteError("out of memory serializing rule signals");
	}
	yyjson_mut_val *arr = yyjson_mut_arr(doc.get());
	yyjson_mut_doc_set_root(doc.get(), arr);
	for (const auto &signal : signals) {
		yyjson_mut_val *obj = yyjson_mut_arr_add_obj(doc.get(), arr);
		yyjson_mut_obj_add_strcpy(doc.get(), obj, "rule", signal.rule.c_str());
		yyjson_mut_obj_add_str(doc.get(), obj, "label", RiskLabelToString(signal.label));
		yyjson_mut_obj_add_real(doc.get(), obj, "weight", signal.weight);
	}
	return doc.Write();
}

static std::vector<RuleSignal> DeserializeSignals(const std::string &json) {
	std::vector<RuleSignal> signals;
	if (json.empty()) {
		return signals;
	}
	YyjsonDocGuard doc(yyjson_read(json.c_str(), json.size(), 0));
	if (!doc || !yyjson_is_arr(doc.root())) {
		spdlog::warn("Ignoring malformed stored rule signals: {}", json);
		return signals;
	}
	size_t idx, max;
	yyjson_val *item;
	yyjson_arr_foreach(doc.root(), idx, max, item) {
		RuleSignal signal;
		yyjson_val *rule = yyjson_obj_get(item, "rule");
		yyjson_val *label = yyjson_obj_get(item, "label");
		yyjson_val *weight = yyjson_obj_get(item, "weight");
		if (!yyjson_is_str(rule) || !yyjson_is_str(label) ||
		    !TryParseRiskLabel(yyjson_get_str(label), signal.label)) {
			continue;
		}
		signal.rule = yyjson_get_str(rule);
		signal.weight = yyjson_is_num(weight) ? yyjson_get_num(weight) : 0.0;
		signals.push_back(std::move(signal));
	}
	return signals;
}

//===--------------------------------------------------------------------===//
// Row readers
//===--------------------------------------------------------------------===//

static const char *TARGET_COLUMNS =
    "t.identifier, t.kind, epoch_ms(t.discovered_at), epoch_ms(t.last_visited_at), t.visit_count, t.status, "
    "t.depth, t.retry_count, t.last_error";
static constexpr size_t TARGET_COLUMN_COUNT = 9;

static Target ReadTarget(const std::vector<Value> &row, size_t offset) {
	Target target;
	target.identifier = GetString(row[offset]);
	if (!TryParseTargetKind(GetString(row[offset + 1]), target.kind)) {
		target.kind = TargetKind::PAGE;
	}
	target.discovered_at = GetTimestamp(row[offset + 2]).value_or(Timestamp());
	target.last_visited_at = GetTimestamp(row[offset + 3]);
	target.visit_count = GetInt(row[offset + 4]);
	if (!TryParseTargetStatus(GetString(row[offset + 5]), target.status)) {
		target.status = TargetStatus::PENDING;
	}
	target.depth = static_cast<int>(GetInt(row[offset + 6]));
	target.retry_count = static_cast<int>(GetInt(row[offset + 7]));
	target.last_error = GetString(row[offset + 8]);
	return target;
}

// id column is history_id in current_verdicts and id in verdict_history
static std::string VerdictColumns(const std::string &alias, const std::string &id_column) {
	return alias + "." + id_column + ", " + alias + ".target, " + alias + ".label, " + alias + ".probability, " +
	       alias + ".risk_score, " + alias + ".model_score, " + alias + ".rule_signals, epoch_ms(" + alias +
	       ".produced_at), " + alias + ".source_hash, " + alias + ".sample_count, " + alias +
	       ".avg_message_risk, " + alias + ".median_message_risk, " + alias + ".pct90_message_risk";
}
static constexpr size_t VERDICT_COLUMN_COUNT = 13;

static Verdict ReadVerdict(const std::vector<Value> &row, size_t offset) {
	Verdict verdict;
	verdict.id = GetInt(row[offset]);
	verdict.target = GetString(row[offset + 1]);
	if (!TryParseRiskLabel(GetString(row[offset + 2]), verdict.label)) {
		verdict.label = RiskLabel::SUSPICIOUS;
	}
	verdict.probability = GetDouble(row[offset + 3]);
	verdict.risk_score = GetDouble(row[offset + 4]);
	if (!row[offset + 5].IsNull()) {
		verdict.model_score = GetDouble(row[offset + 5]);
	}
	verdict.rule_signals = DeserializeSignals(GetString(row[offset + 6]));
	verdict.produced_at = GetTimestamp(row[offset + 7]).value_or(Timestamp());
	verdict.source_hash = GetString(row[offset + 8]);
	if (!row[offset + 9].IsNull()) {
		MessageStats stats;
		stats.sample_count = GetInt(row[offset + 9]);
		stats.avg_risk = GetDouble(row[offset + 10]);
		stats.median_risk = GetDouble(row[offset + 11]);
		stats.pct90_risk = GetDouble(row[offset + 12]);
		verdict.message_stats = stats;
	}
	return verdict;
}

static duckdb::vector<Value> VerdictValues(const Verdict &verdict) {
	duckdb::vector<Value> values;
	values.push_back(Value(verdict.target));
	values.push_back(Value(RiskLabelToString(verdict.label)));
	values.push_back(Value::DOUBLE(verdict.probability));
	values.push_back(Value::DOUBLE(verdict.risk_score));
	values.push_back(verdict.model_score ? Value::DOUBLE(*verdict.model_score) : Value());
	values.push_back(Value(SerializeSignals(verdict.rule_signals)));
	values.push_back(TimestampValue(verdict.produced_at));
	values.push_back(Value(verdict.source_hash));
	if (verdict.message_stats) {
		values.push_back(Value::INTEGER(static_cast<int32_t>(verdict.message_stats->sample_count)));
		values.push_back(Value::DOUBLE(verdict.message_stats->avg_risk));
		values.push_back(Value::DOUBLE(verdict.message_stats->median_risk));
		values.push_back(Value::DOUBLE(verdict.message_stats->pct90_risk));
	} else {
		values.insert(values.end(), 4, Value());
	}
	return values;
}

//===--------------------------------------------------------------------===//
// Connection and schema
//===--------------------------------------------------------------------===//

StateStore::StateStore(const StoreConfig &config) : config_(config) {
	try {
		duckdb::DBConfig db_config;
		if (config_.duckdb_threads > 0) {
			db_config.SetOptionByName("threads", Value::BIGINT(config_.duckdb_threads));
		}
		if (!config_.memory_limit.empty()) {
			db_config.SetOptionByName("memory_limit", Value(config_.memory_limit));
		}
		db_ = std::make_unique<duckdb::DuckDB>(config_.database_path, &db_config);
		conn_ = std::make_unique<duckdb::Connection>(*db_);
	} catch (const std::exception &e) {
		throw LinkwatchException("cannot open database '" + config_.database_path + "': " + e.what());
	}
	InitializeSchema();
	spdlog::debug("State store opened at {}", config_.database_path);
}

StateStore::~StateStore() = default;

std::vector<StateStore::Row> StateStore::Run(const std::string &sql, duckdb::vector<Value> params, bool write) {
	auto fail = [&](const std::string &error) {
		if (write) {
			throw StoreWriteError(error);
		}
		throw LinkwatchException("store query failed: " + error);
	};

	std::vector<Row> rows;
	try {
		auto statement = conn_->Prepare(sql);
		if (statement->HasError()) {
			fail(statement->GetError());
		}
		auto result = statement->Execute(params, false);
		if (result->HasError()) {
			fail(result->GetError());
		}
		while (true) {
			auto chunk = result->Fetch();
			if (!chunk || chunk->size() == 0) {
				break;
			}
			for (duckdb::idx_t r = 0; r < chunk->size(); r++) {
				Row row;
				row.reserve(chunk->ColumnCount());
				for (duckdb::idx_t c = 0; c < chunk->ColumnCount(); c++) {
					row.push_back(chunk->GetValue(c, r));
				}
				rows.push_back(std::move(row));
			}
		}
	} catch (const LinkwatchException &) {
		throw;
	} catch (const std::exception &e) {
		fail(e.what());
	}
	return rows;
}

void StateStore::Begin() {
	try {
		conn_->BeginTransaction();
	} catch (const std::exception &e) {
		throw StoreWriteError(std::string("cannot begin transaction: ") + e.what());
	}
}

void StateStore::Commit() {
	try {
		conn_->Commit();
	} catch (const std::exception &e) {
		throw StoreWriteError(std::string("commit failed: ") + e.what());
	}
}

void StateStore::Rollback() noexcept {
	try {
		if (conn_->HasActiveTransaction()) {
			conn_->Rollback();
		}
	} catch (const std::exception &e) {
		spdlog::error("Rollback failed: {}", e.what());
	}
}

void StateStore::InitializeSchema() {
	std::lock_guard<std::mutex> lock(mutex_);
	static const char *SCHEMA[] = {
	    "CREATE TABLE IF NOT EXISTS targets ("
	    "identifier VARCHAR PRIMARY KEY, "
	    "kind VARCHAR NOT NULL, "
	    "discovered_at TIMESTAMP NOT NULL, "
	    "last_visited_at TIMESTAMP, "
	    "visit_count BIGINT NOT NULL DEFAULT 0, "
	    "status VARCHAR NOT NULL, "
	    "depth INTEGER NOT NULL DEFAULT 0, "
	    "retry_count INTEGER NOT NULL DEFAULT 0, "
	    "last_error VARCHAR, "
	    "snippet VARCHAR, "
	    "domain VARCHAR)",
	    "CREATE SEQUENCE IF NOT EXISTS verdict_history_seq START 1",
	    "CREATE TABLE IF NOT EXISTS verdict_history ("
	    "id BIGINT PRIMARY KEY DEFAULT nextval('verdict_history_seq'), "
	    "target VARCHAR NOT NULL, "
	    "label VARCHAR NOT NULL, "
	    "probability DOUBLE NOT NULL, "
	    "risk_score DOUBLE NOT NULL, "
	    "model_score DOUBLE, "
	    "rule_signals VARCHAR, "
	    "produced_at TIMESTAMP NOT NULL, "
	    "source_hash VARCHAR, "
	    "sample_count INTEGER, "
	    "avg_message_risk DOUBLE, "
	    "median_message_risk DOUBLE, "
	    "pct90_message_risk DOUBLE)",
	    "CREATE TABLE IF NOT EXISTS current_verdicts ("
	    "target VARCHAR PRIMARY KEY, "
	    "history_id BIGINT NOT NULL, "
	    "label VARCHAR NOT NULL, "
	    "probability DOUBLE NOT NULL, "
	    "risk_score DOUBLE NOT NULL, "
	    "model_score DOUBLE, "
	    "rule_signals VARCHAR, "
	    "produced_at TIMESTAMP NOT NULL, "
	    "source_hash VARCHAR, "
	    "sample_count INTEGER, "
	    "avg_message_risk DOUBLE, "
	    "median_message_risk DOUBLE, "
	    "pct90_message_risk DOUBLE)",
	    "CREATE SEQUENCE IF NOT EXISTS feedback_items_seq START 1",
	    "CREATE TABLE IF NOT EXISTS feedback_items ("
	    "id BIGINT PRIMARY KEY DEFAULT nextval('feedback_items_seq'), "
	    "verdict_id BIGINT NOT NULL, "
	    "target VARCHAR NOT NULL, "
	    "reason VARCHAR NOT NULL, "
	    "enqueued_at TIMESTAMP NOT NULL, "
	    "resolved BOOLEAN NOT NULL DEFAULT false, "
	    "human_label VARCHAR, "
	    "resolved_at TIMESTAMP, "
	    "drained_at TIMESTAMP)",
	    "CREATE TABLE IF NOT EXISTS checkpoints ("
	    "name VARCHAR PRIMARY KEY, "
	    "value VARCHAR, "
	    "updated_at TIMESTAMP)",
	};
	for (const char *sql : SCHEMA) {
		Run(sql, {}, true);
	}
}

//===--------------------------------------------------------------------===//
// Targets
//===--------------------------------------------------------------------===//

std::optional<Target> StateStore::GetTargetLocked(const std::string &identifier) {
	auto rows = Run(std::string("SELECT ") + TARGET_COLUMNS + " FROM targets t WHERE t.identifier = ?",
	                {Value(identifier)}, false);
	if (rows.empty()) {
		return std::nullopt;
	}
	return ReadTarget(rows[0], 0);
}

std::optional<Target> StateStore::GetTarget(const std::string &identifier) {
	std::lock_guard<std::mutex> lock(mutex_);
	return GetTargetLocked(identifier);
}

std::pair<Target, bool> StateStore::RegisterTarget(const std::string &identifier, TargetKind kind, int depth,
                                                   Timestamp now) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto existing = GetTargetLocked(identifier);
	if (existing) {
		return {*existing, false};
	}

	Target target;
	target.identifier = identifier;
	target.kind = kind;
	target.discovered_at = now;
	target.depth = depth;
	Run("INSERT INTO targets (identifier, kind, discovered_at, visit_count, status, depth, retry_count, domain) "
	    "VALUES (?, ?, ?, 0, ?, ?, 0, ?) ON CONFLICT (identifier) DO NOTHING",
	    {Value(identifier), Value(TargetKindToString(kind)), TimestampValue(now),
	     Value(TargetStatusToString(TargetStatus::PENDING)), Value::INTEGER(depth),
	     Value(TargetDomain(identifier, kind))},
	    true);
	return {target, true};
}

void StateStore::PutTarget(const Target &target) {
	std::lock_guard<std::mutex> lock(mutex_);
	Run("INSERT INTO targets (identifier, kind, discovered_at, last_visited_at, visit_count, status, depth, "
	    "retry_count, last_error, domain) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
	    "ON CONFLICT (identifier) DO UPDATE SET kind = EXCLUDED.kind, discovered_at = EXCLUDED.discovered_at, "
	    "last_visited_at = EXCLUDED.last_visited_at, visit_count = EXCLUDED.visit_count, "
	    "status = EXCLUDED.status, depth = EXCLUDED.depth, retry_count = EXCLUDED.retry_count, "
	    "last_error = EXCLUDED.last_error, domain = EXCLUDED.domain",
	    {Value(target.identifier), Value(TargetKindToString(target.kind)), TimestampValue(target.discovered_at),
	     OptionalTimestampValue(target.last_visited_at), Value::BIGINT(target.visit_count),
	     Value(TargetStatusToString(target.status)), Value::INTEGER(target.depth),
	     Value::INTEGER(target.retry_count), target.last_error.empty() ? Value() : Value(target.last_error),
	     Value(TargetDomain(target.identifier, target.kind))},
	    true);
}

void StateStore::MarkInProgress(const std::string &identifier) {
	std::lock_guard<std::mutex> lock(mutex_);
	Run("UPDATE targets SET status = ? WHERE identifier = ?",
	    {Value(TargetStatusToString(TargetStatus::IN_PROGRESS)), Value(identifier)}, true);
}

void StateStore::RollbackToPending(const std::string &identifier) {
	std::lock_guard<std::mutex> lock(mutex_);
	Run("UPDATE targets SET status = ? WHERE identifier = ? AND status = ?",
	    {Value(TargetStatusToString(TargetStatus::PENDING)), Value(identifier),
	     Value(TargetStatusToString(TargetStatus::IN_PROGRESS))},
	    true);
}

int64_t StateStore::RecordVisit(const std::string &identifier, Verdict &verdict, const std::string &snippet,
                                Timestamp now) {
	std::lock_guard<std::mutex> lock(mutex_);
	if (!GetTargetLocked(identifier)) {
		throw InvalidInputException("cannot record a visit for unknown target '" + identifier + "'");
	}
	verdict.target = identifier;

	Begin();
	try {
		auto rows = Run("INSERT INTO verdict_history (target, label, probability, risk_score, model_score, "
		                "rule_signals, produced_at, source_hash, sample_count, avg_message_risk, "
		                "median_message_risk, pct90_message_risk) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
		                "RETURNING id",
		                VerdictValues(verdict), true);
		if (rows.empty()) {
			throw StoreWriteError("verdict history insert returned no id");
		}
		int64_t history_id = GetInt(rows[0][0]);

		auto values = VerdictValues(verdict);
		values.insert(values.begin() + 1, Value::BIGINT(history_id));
		Run("INSERT OR REPLACE INTO current_verdicts (target, history_id, label, probability, risk_score, "
		    "model_score, rule_signals, produced_at, source_hash, sample_count, avg_message_risk, "
		    "median_message_risk, pct90_message_risk) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
		    std::move(values), true);

		Run("UPDATE targets SET last_visited_at = ?, visit_count = visit_count + 1, status = ?, retry_count = 0, "
		    "last_error = NULL, snippet = ? WHERE identifier = ?",
		    {TimestampValue(now), Value(TargetStatusToString(TargetStatus::DONE)), Value(snippet),
		     Value(identifier)},
		    true);
		Commit();
		verdict.id = history_id;
		return history_id;
	} catch (...) {
		Rollback();
		throw;
	}
}

void StateStore::RecordFailure(const std::string &identifier, int retry_count, const std::string &error,
                               bool permanently_failed) {
	std::lock_guard<std::mutex> lock(mutex_);
	TargetStatus status = permanently_failed ? TargetStatus::PERMANENTLY_FAILED : TargetStatus::PENDING;
	Run("UPDATE targets SET status = ?, retry_count = ?, last_error = ? WHERE identifier = ?",
	    {Value(TargetStatusToString(status)), Value::INTEGER(retry_count), Value(error), Value(identifier)}, true);
}

std::string StateStore::GetSnippet(const std::string &identifier) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto rows = Run("SELECT snippet FROM targets WHERE identifier = ?", {Value(identifier)}, false);
	return rows.empty() ? std::string() : GetString(rows[0][0]);
}

//===--------------------------------------------------------------------===//
// Verdicts
//===--------------------------------------------------------------------===//

std::optional<Verdict> StateStore::GetVerdictLocked(const std::string &where, duckdb::vector<Value> params,
                                                    const std::string &table) {
	std::string id_column = table == "current_verdicts" ? "history_id" : "id";
	auto rows = Run("SELECT " + VerdictColumns("v", id_column) + " FROM " + table + " v WHERE " + where,
	                std::move(params), false);
	if (rows.empty()) {
		return std::nullopt;
	}
	return ReadVerdict(rows[0], 0);
}

std::optional<Verdict> StateStore::GetCurrentVerdict(const std::string &identifier) {
	std::lock_guard<std::mutex> lock(mutex_);
	return GetVerdictLocked("v.target = ?", {Value(identifier)}, "current_verdicts");
}

std::optional<Verdict> StateStore::GetVerdict(int64_t history_id) {
	std::lock_guard<std::mutex> lock(mutex_);
	return GetVerdictLocked("v.id = ?", {Value::BIGINT(history_id)}, "verdict_history");
}

std::vector<Verdict> StateStore::GetVerdictHistory(const std::string &identifier, int64_t limit) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto rows = Run("SELECT " + VerdictColumns("v", "id") +
	                    " FROM verdict_history v WHERE v.target = ? ORDER BY v.id DESC LIMIT ?",
	                {Value(identifier), Value::BIGINT(limit)}, false);
	std::vector<Verdict> history;
	for (const auto &row : rows) {
		history.push_back(ReadVerdict(row, 0));
	}
	return history;
}

//===--------------------------------------------------------------------===//
// Frontier reconstruction
//===--------------------------------------------------------------------===//

std::vector<PendingTarget> StateStore::ListDone(Timestamp now, const RevisitFunction &revisit, bool due) {
	auto rows = Run(std::string("SELECT ") + TARGET_COLUMNS +
	                    ", v.risk_score FROM targets t LEFT JOIN current_verdicts v ON v.target = t.identifier "
	                    "WHERE t.status = ? ORDER BY t.discovered_at, t.identifier",
	                {Value(TargetStatusToString(TargetStatus::DONE))}, false);
	std::vector<PendingTarget> result;
	for (const auto &row : rows) {
		PendingTarget pending;
		pending.target = ReadTarget(row, 0);
		pending.risk_score = GetDouble(row[TARGET_COLUMN_COUNT]);
		Timestamp last = pending.target.last_visited_at.value_or(pending.target.discovered_at);
		pending.not_before = last + revisit(pending.risk_score);
		if ((pending.not_before <= now) == due) {
			result.push_back(std::move(pending));
		}
	}
	return result;
}

std::vector<PendingTarget> StateStore::ListPending(Timestamp now, const RevisitFunction &revisit) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto rows = Run(std::string("SELECT ") + TARGET_COLUMNS +
	                    ", v.risk_score FROM targets t LEFT JOIN current_verdicts v ON v.target = t.identifier "
	                    "WHERE t.status NOT IN (?, ?) ORDER BY t.discovered_at, t.identifier",
	                {Value(TargetStatusToString(TargetStatus::DONE)),
	                 Value(TargetStatusToString(TargetStatus::PERMANENTLY_FAILED))},
	                false);
	std::vector<PendingTarget> result;
	for (const auto &row : rows) {
		PendingTarget pending;
		pending.target = ReadTarget(row, 0);
		pending.risk_score = GetDouble(row[TARGET_COLUMN_COUNT]);
		pending.not_before = now;
		result.push_back(std::move(pending));
	}
	for (auto &pending : ListDone(now, revisit, true)) {
		result.push_back(std::move(pending));
	}
	return result;
}

std::vector<PendingTarget> StateStore::ListScheduled(Timestamp now, const RevisitFunction &revisit) {
	std::lock_guard<std::mutex> lock(mutex_);
	return ListDone(now, revisit, false);
}

//===--------------------------------------------------------------------===//
// Read API
//===--------------------------------------------------------------------===//

RiskBand StateStore::BandFor(double risk_score) const {
	if (risk_score >= config_.high_risk_threshold) {
		return RiskBand::HIGH;
	}
	if (risk_score >= config_.medium_risk_threshold) {
		return RiskBand::MEDIUM;
	}
	return RiskBand::LOW;
}

std::vector<FlaggedTarget> StateStore::ListByRiskBand(RiskBand band, int64_t limit, int64_t offset,
                                                      std::optional<TargetKind> kind) {
	std::string range;
	duckdb::vector<Value> params;
	switch (band) {
		case RiskBand::HIGH:
			range = "v.risk_score >= ?";
			params.push_back(Value::DOUBLE(config_.high_risk_threshold));
			break;
		case RiskBand::MEDIUM:
			range = "v.risk_score >= ? AND v.risk_score < ?";
			params.push_back(Value::DOUBLE(config_.medium_risk_threshold));
			params.push_back(Value::DOUBLE(config_.high_risk_threshold));
			break;
		case RiskBand::LOW:
			range = "v.risk_score < ?";
			params.push_back(Value::DOUBLE(config_.medium_risk_threshold));
			break;
	}

	std::string sql = std::string("SELECT ") + TARGET_COLUMNS + ", " + VerdictColumns("v", "history_id") +
	                  ", t.snippet, t.domain FROM current_verdicts v JOIN targets t ON t.identifier = v.target "
	                  "WHERE " + range;
	if (kind) {
		sql += " AND t.kind = ?";
		params.push_back(Value(TargetKindToString(*kind)));
	}
	sql += " ORDER BY v.risk_score DESC, v.produced_at DESC, t.identifier LIMIT ? OFFSET ?";
	params.push_back(Value::BIGINT(limit));
	params.push_back(Value::BIGINT(offset));

	std::lock_guard<std::mutex> lock(mutex_);
	auto rows = Run(sql, std::move(params), false);
	std::vector<FlaggedTarget> result;
	for (const auto &row : rows) {
		FlaggedTarget flagged;
		flagged.target = ReadTarget(row, 0);
		flagged.verdict = ReadVerdict(row, TARGET_COLUMN_COUNT);
		flagged.snippet = GetString(row[TARGET_COLUMN_COUNT + VERDICT_COLUMN_COUNT]);
		flagged.domain = GetString(row[TARGET_COLUMN_COUNT + VERDICT_COLUMN_COUNT + 1]);
		result.push_back(std::move(flagged));
	}
	return result;
}

StoreStats StateStore::Stats(Timestamp now) {
	std::lock_guard<std::mutex> lock(mutex_);
	StoreStats stats;
	const Value benign(RiskLabelToString(RiskLabel::BENIGN));

	for (const auto &row : Run("SELECT status, count(*) FROM targets GROUP BY status", {}, false)) {
		stats.by_status[GetString(row[0])] = GetInt(row[1]);
		stats.total_targets += GetInt(row[1]);
	}
	for (const auto &row : Run("SELECT label, count(*) FROM current_verdicts GROUP BY label", {}, false)) {
		stats.by_label[GetString(row[0])] = GetInt(row[1]);
	}

	auto bands = Run("SELECT count(*) FILTER (WHERE risk_score >= ?), "
	                 "count(*) FILTER (WHERE risk_score >= ? AND risk_score < ?), "
	                 "count(*) FILTER (WHERE risk_score < ?) FROM current_verdicts",
	                 {Value::DOUBLE(config_.high_risk_threshold), Value::DOUBLE(config_.medium_risk_threshold),
	                  Value::DOUBLE(config_.high_risk_threshold), Value::DOUBLE(config_.medium_risk_threshold)},
	                 false);
	if (!bands.empty()) {
		stats.high_risk = GetInt(bands[0][0]);
		stats.medium_risk = GetInt(bands[0][1]);
		stats.low_risk = GetInt(bands[0][2]);
	}

	auto flagged = Run("SELECT count(*), count(*) FILTER (WHERE produced_at >= ?), "
	                   "count(*) FILTER (WHERE produced_at >= ?), avg(risk_score) "
	                   "FROM current_verdicts WHERE label <> ?",
	                   {TimestampValue(now - std::chrono::hours(24)), TimestampValue(now - std::chrono::hours(24 * 7)),
	                    benign},
	                   false);
	if (!flagged.empty()) {
		stats.total_flagged = GetInt(flagged[0][0]);
		stats.found_today = GetInt(flagged[0][1]);
		stats.found_this_week = GetInt(flagged[0][2]);
		stats.avg_risk_score = GetDouble(flagged[0][3]);
	}

	auto domains = Run("SELECT count(DISTINCT t.domain) FROM current_verdicts v "
	                   "JOIN targets t ON t.identifier = v.target WHERE v.label <> ? AND t.kind = ?",
	                   {benign, Value(TargetKindToString(TargetKind::PAGE))}, false);
	if (!domains.empty()) {
		stats.unique_domains = GetInt(domains[0][0]);
	}

	auto feedback = Run("SELECT count(*) FROM feedback_items WHERE NOT resolved", {}, false);
	stats.unresolved_feedback = feedback.empty() ? 0 : GetInt(feedback[0][0]);
	auto history = Run("SELECT count(*) FROM verdict_history", {}, false);
	stats.history_rows = history.empty() ? 0 : GetInt(history[0][0]);
	return stats;
}

//===--------------------------------------------------------------------===//
// Checkpoints
//===--------------------------------------------------------------------===//

void StateStore::SaveCheckpoint(const std::string &name, const std::string &value) {
	std::lock_guard<std::mutex> lock(mutex_);
	Run("INSERT OR REPLACE INTO checkpoints (name, value, updated_at) VALUES (?, ?, ?)",
	    {Value(name), Value(value), TimestampValue(Clock::now())}, true);
}

std::optional<std::string> StateStore::LoadCheckpoint(const std::string &name) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto rows = Run("SELECT value FROM checkpoints WHERE name = ?", {Value(name)}, false);
	if (rows.empty()) {
		return std::nullopt;
	}
	return GetString(rows[0][0]);
}

//===--------------------------------------------------------------------===//
// Feedback persistence
//===--------------------------------------------------------------------===//

static const char *FEEDBACK_COLUMNS = "f.id, f.reason, epoch_ms(f.enqueued_at), f.resolved, f.human_label, "
                                      "epoch_ms(f.resolved_at), epoch_ms(f.drained_at)";
static constexpr size_t FEEDBACK_COLUMN_COUNT = 7;

static FeedbackItem ReadFeedback(const std::vector<Value> &row) {
	FeedbackItem item;
	item.id = GetInt(row[0]);
	if (!TryParseFeedbackReason(GetString(row[1]), item.reason)) {
		item.reason = FeedbackReason::LOW_CONFIDENCE;
	}
	item.enqueued_at = GetTimestamp(row[2]).value_or(Timestamp());
	item.resolved = !row[3].IsNull() && row[3].GetValue<bool>();
	RiskLabel label;
	if (!row[4].IsNull() && TryParseRiskLabel(GetString(row[4]), label)) {
		item.human_label = label;
	}
	item.resolved_at = GetTimestamp(row[5]);
	item.drained_at = GetTimestamp(row[6]);
	item.verdict = ReadVerdict(row, FEEDBACK_COLUMN_COUNT);
	return item;
}

static std::string FeedbackSelect() {
	return std::string("SELECT ") + FEEDBACK_COLUMNS + ", " + VerdictColumns("v", "id") +
	       " FROM feedback_items f JOIN verdict_history v ON v.id = f.verdict_id";
}

int64_t StateStore::InsertFeedback(int64_t verdict_id, FeedbackReason reason, Timestamp now) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto verdict = Run("SELECT target FROM verdict_history WHERE id = ?", {Value::BIGINT(verdict_id)}, false);
	if (verdict.empty()) {
		throw InvalidInputException("unknown verdict " + std::to_string(verdict_id));
	}
	auto rows = Run("INSERT INTO feedback_items (verdict_id, target, reason, enqueued_at, resolved) "
	                "VALUES (?, ?, ?, ?, false) RETURNING id",
	                {Value::BIGINT(verdict_id), verdict[0][0], Value(FeedbackReasonToString(reason)),
	                 TimestampValue(now)},
	                true);
	if (rows.empty()) {
		throw StoreWriteError("feedback insert returned no id");
	}
	return GetInt(rows[0][0]);
}

std::vector<FeedbackItem> StateStore::DrainFeedback(int64_t limit, Timestamp now, Duration redelivery) {
	std::lock_guard<std::mutex> lock(mutex_);
	Begin();
	try {
		auto rows = Run(FeedbackSelect() +
		                    " WHERE NOT f.resolved AND (f.drained_at IS NULL OR f.drained_at <= ?) "
		                    "ORDER BY f.enqueued_at, f.id LIMIT ?",
		                {TimestampValue(now - redelivery), Value::BIGINT(limit)}, true);
		std::vector<FeedbackItem> items;
		for (const auto &row : rows) {
			items.push_back(ReadFeedback(row));
		}
		for (auto &item : items) {
			Run("UPDATE feedback_items SET drained_at = ? WHERE id = ?",
			    {TimestampValue(now), Value::BIGINT(item.id)}, true);
			item.drained_at = now;
		}
		Commit();
		return items;
	} catch (...) {
		Rollback();
		throw;
	}
}

void StateStore::ResolveFeedback(int64_t item_id, RiskLabel human_label, Timestamp now) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto rows = Run("SELECT resolved FROM feedback_items WHERE id = ?", {Value::BIGINT(item_id)}, false);
	if (rows.empty()) {
		throw InvalidInputException("unknown feedback item " + std::to_string(item_id));
	}
	if (!rows[0][0].IsNull() && rows[0][0].GetValue<bool>()) {
		throw InvalidInputException("feedback item " + std::to_string(item_id) + " is already resolved");
	}
	Run("UPDATE feedback_items SET resolved = true, human_label = ?, resolved_at = ? WHERE id = ?",
	    {Value(RiskLabelToString(human_label)), TimestampValue(now), Value::BIGINT(item_id)}, true);
}

std::optional<FeedbackItem> StateStore::GetFeedback(int64_t item_id) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto rows = Run(FeedbackSelect() + " WHERE f.id = ?", {Value::BIGINT(item_id)}, false);
	if (rows.empty()) {
		return std::nullopt;
	}
	return ReadFeedback(rows[0]);
}

int64_t StateStore::CountUnresolvedFeedback() {
	std::lock_guard<std::mutex> lock(mutex_);
	auto rows = Run("SELECT count(*) FROM feedback_items WHERE NOT resolved", {}, false);
	return rows.empty() ? 0 : GetInt(rows[0][0]);
}

} // namespace linkwatch
