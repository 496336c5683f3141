#include "frontier.hpp"
#include "crawler_utils.hpp"
#include "pipeline_errors.hpp"

#include <algorithm>
#include <cmath>

namespace linkwatch {

const char *ReleaseOutcomeToString(ReleaseOutcome outcome) {
	switch (outcome) {
		case ReleaseOutcome::SUCCESS: return "success";
		case ReleaseOutcome::TRANSIENT_FAILURE: return "transient_failure";
		case ReleaseOutcome::PERMANENT_FAILURE: return "permanent_failure";
		case ReleaseOutcome::ROLLBACK: return "rollback";
		case ReleaseOutcome::DEFERRED: return "deferred";
		default: return "unknown";
	}
}

ReleaseOutcome ToReleaseOutcome(FetchOutcome outcome) {
	switch (outcome) {
		case FetchOutcome::SUCCESS: return ReleaseOutcome::SUCCESS;
		case FetchOutcome::PERMANENT_FAILURE: return ReleaseOutcome::PERMANENT_FAILURE;
		case FetchOutcome::TRANSIENT_FAILURE:
		default: return ReleaseOutcome::TRANSIENT_FAILURE;
	}
}

Frontier::Frontier(const FrontierConfig &config) : config_(config) {
}

Frontier::OrderKey Frontier::KeyFor(const FrontierEntry &entry) {
	return OrderKey(-entry.priority, entry.discovered_at, entry.identifier);
}

Frontier::TimeKey Frontier::TimeKeyFor(const FrontierEntry &entry) {
	return TimeKey(entry.not_before, entry.identifier);
}

bool Frontier::IsOutstanding(const FrontierEntry &entry) {
	return !entry.visited || entry.retry_count > 0;
}

void Frontier::AddToOrder(const FrontierEntry &entry) {
	waiting_.insert(TimeKeyFor(entry));
}

void Frontier::RemoveFromOrder(const FrontierEntry &entry) {
	if (waiting_.erase(TimeKeyFor(entry)) == 0) {
		ready_.erase(KeyFor(entry));
		ready_times_.erase(TimeKeyFor(entry));
	}
}

void Frontier::PromoteDue(Timestamp ts) {
	auto it = waiting_.begin();
	while (it != waiting_.end() && it->first <= ts) {
		const auto &entry = entries_.at(it->second);
		ready_.insert(KeyFor(entry));
		ready_times_.insert(*it);
		it = waiting_.erase(it);
	}
}

void Frontier::Remove(const std::string &identifier) {
	auto it = entries_.find(identifier);
	if (it == entries_.end()) {
		return;
	}
	if (it->second.in_progress) {
		in_progress_--;
	} else {
		RemoveFromOrder(it->second);
	}
	if (IsOutstanding(it->second)) {
		outstanding_--;
	}
	entries_.erase(it);
}

Duration Frontier::RevisitInterval(double risk_score) const {
	double risk = std::min(1.0, std::max(0.0, risk_score));
	double benign = static_cast<double>(config_.revisit_interval_benign_ms);
	double high = static_cast<double>(config_.revisit_interval_high_risk_ms);
	return Duration(static_cast<int64_t>(std::llround(benign + (high - benign) * risk)));
}

double Frontier::PriorityForRisk(double risk_score) const {
	double risk = std::min(1.0, std::max(0.0, risk_score));
	return config_.default_priority + config_.risk_priority_boost * risk;
}

bool Frontier::Enqueue(const std::string &identifier, TargetKind kind, double priority, int depth,
                       std::optional<Timestamp> now) {
	Timestamp ts = now ? *now : Clock::now();
	{
		std::lock_guard<std::mutex> lock(mutex_);
		if (retired_.count(identifier)) {
			return false;
		}

		auto it = entries_.find(identifier);
		if (it != entries_.end()) {
			auto &entry = it->second;
			if (priority > entry.priority) {
				if (!entry.in_progress) {
					RemoveFromOrder(entry);
				}
				entry.priority = priority;
				if (!entry.in_progress) {
					AddToOrder(entry);
				}
			}
			entry.depth = std::min(entry.depth, depth);
			return false;
		}

		FrontierEntry entry;
		entry.identifier = identifier;
		entry.kind = kind;
		entry.priority = priority;
		entry.discovered_at = ts;
		entry.not_before = ts;
		entry.depth = depth;
		AddToOrder(entry);
		outstanding_++;
		entries_.emplace(identifier, std::move(entry));
		generation_++;
	}
	cv_.notify_all();
	return true;
}

void Frontier::Restore(const FrontierEntry &entry) {
	{
		std::lock_guard<std::mutex> lock(mutex_);
		if (retired_.count(entry.identifier)) {
			return;
		}
		Remove(entry.identifier);
		FrontierEntry restored = entry;
		restored.in_progress = false;
		AddToOrder(restored);
		if (IsOutstanding(restored)) {
			outstanding_++;
		}
		entries_.emplace(restored.identifier, std::move(restored));
		generation_++;
	}
	cv_.notify_all();
}

std::vector<FrontierEntry> Frontier::DequeueBatch(size_t n, std::optional<Timestamp> now) {
	Timestamp ts = now ? *now : Clock::now();
	std::vector<FrontierEntry> batch;
	if (n == 0) {
		return batch;
	}

	std::lock_guard<std::mutex> lock(mutex_);
	PromoteDue(ts);
	auto it = ready_.begin();
	while (it != ready_.end() && batch.size() < n) {
		auto &entry = entries_.at(std::get<2>(*it));
		// Only possible when callers pass an earlier time than a previous dequeue
		if (entry.not_before > ts) {
			++it;
			continue;
		}
		ready_times_.erase(TimeKeyFor(entry));
		it = ready_.erase(it);
		entry.in_progress = true;
		batch.push_back(entry);
	}
	in_progress_ += batch.size();
	return batch;
}

TargetStatus Frontier::ReleaseLocked(FrontierEntry &entry, ReleaseOutcome outcome, double risk_score,
                                     Duration delay, Timestamp ts) {
	TargetStatus status = TargetStatus::PENDING;
	if (IsOutstanding(entry)) {
		outstanding_--;
	}

	switch (outcome) {
		case ReleaseOutcome::SUCCESS:
			entry.retry_count = 0;
			entry.visited = true;
			entry.priority = PriorityForRisk(risk_score);
			entry.not_before = ts + RevisitInterval(risk_score);
			status = TargetStatus::DONE;
			break;
		case ReleaseOutcome::TRANSIENT_FAILURE:
			entry.retry_count++;
			if (entry.retry_count >= config_.retry.max_retries) {
				status = TargetStatus::PERMANENTLY_FAILED;
				break;
			}
			entry.not_before = ts + Duration(ExponentialBackoffMs(entry.retry_count, config_.retry));
			break;
		case ReleaseOutcome::PERMANENT_FAILURE:
			status = TargetStatus::PERMANENTLY_FAILED;
			break;
		case ReleaseOutcome::ROLLBACK:
			entry.not_before = ts;
			break;
		case ReleaseOutcome::DEFERRED:
			entry.not_before = ts + std::max(delay, Duration(0));
			break;
	}

	entry.in_progress = false;
	in_progress_--;
	if (status == TargetStatus::PERMANENTLY_FAILED) {
		std::string identifier = entry.identifier;
		retired_.insert(identifier);
		entries_.erase(identifier);
	} else {
		AddToOrder(entry);
		if (IsOutstanding(entry)) {
			outstanding_++;
		}
	}
	generation_++;
	return status;
}

TargetStatus Frontier::Release(const std::string &identifier, ReleaseOutcome outcome, double risk_score,
                               std::optional<Timestamp> now) {
	Timestamp ts = now ? *now : Clock::now();
	TargetStatus status;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		auto it = entries_.find(identifier);
		if (it == entries_.end() || !it->second.in_progress) {
			throw InvalidInputException("cannot release '" + identifier + "': not in progress");
		}
		status = ReleaseLocked(it->second, outcome, risk_score, Duration(0), ts);
	}
	cv_.notify_all();
	return status;
}

TargetStatus Frontier::Defer(const std::string &identifier, Duration delay, std::optional<Timestamp> now) {
	Timestamp ts = now ? *now : Clock::now();
	TargetStatus status;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		auto it = entries_.find(identifier);
		if (it == entries_.end() || !it->second.in_progress) {
			throw InvalidInputException("cannot defer '" + identifier + "': not in progress");
		}
		status = ReleaseLocked(it->second, ReleaseOutcome::DEFERRED, 0.0, delay, ts);
	}
	cv_.notify_all();
	return status;
}

void Frontier::Retire(const std::string &identifier) {
	std::lock_guard<std::mutex> lock(mutex_);
	retired_.insert(identifier);
	Remove(identifier);
}

size_t Frontier::Size() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return entries_.size();
}

size_t Frontier::InProgressCount() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return in_progress_;
}

size_t Frontier::RetiredCount() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return retired_.size();
}

bool Frontier::Contains(const std::string &identifier) const {
	std::lock_guard<std::mutex> lock(mutex_);
	return entries_.count(identifier) > 0;
}

bool Frontier::IsRetired(const std::string &identifier) const {
	std::lock_guard<std::mutex> lock(mutex_);
	return retired_.count(identifier) > 0;
}

std::optional<FrontierEntry> Frontier::Get(const std::string &identifier) const {
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = entries_.find(identifier);
	if (it == entries_.end()) {
		return std::nullopt;
	}
	return it->second;
}

bool Frontier::HasOutstandingWork() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return in_progress_ > 0 || outstanding_ > 0;
}

std::optional<Timestamp> Frontier::NextEligibleTime() const {
	std::lock_guard<std::mutex> lock(mutex_);
	std::optional<Timestamp> next;
	if (!ready_times_.empty()) {
		next = ready_times_.begin()->first;
	}
	if (!waiting_.empty() && (!next || waiting_.begin()->first < *next)) {
		next = waiting_.begin()->first;
	}
	return next;
}

void Frontier::WaitForWork(Duration timeout) {
	std::unique_lock<std::mutex> lock(mutex_);
	uint64_t seen = generation_;
	cv_.wait_for(lock, timeout, [&]() { return generation_ != seen; });
}

void Frontier::NotifyAll() {
	{
		std::lock_guard<std::mutex> lock(mutex_);
		generation_++;
	}
	cv_.notify_all();
}

} // namespace linkwatch
