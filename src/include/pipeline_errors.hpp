#pragma once

//===--------------------------------------------------------------------===//
// pipeline_errors.hpp - Error taxonomy and exception types
//===--------------------------------------------------------------------===//
// Fetch and scorer failures travel as values (FetchOutcome, ModelScore);
// only configuration, input and persistence failures are thrown.

#include <cstdint>
#include <stdexcept>
#include <string>

namespace linkwatch {

enum class PipelineErrorKind : uint8_t {
	TRANSIENT_FETCH = 0,    // network/timeout, retried with backoff
	PERMANENT_FETCH = 1,    // unreachable or policy-blocked, terminal
	SCORER_UNAVAILABLE = 2, // degrade to rule-only classification
	STORE_WRITE = 3         // roll the target back to pending
};

inline const char *PipelineErrorKindToString(PipelineErrorKind kind) {
	switch (kind) {
		case PipelineErrorKind::TRANSIENT_FETCH: return "transient_fetch";
		case PipelineErrorKind::PERMANENT_FETCH: return "permanent_fetch";
		case PipelineErrorKind::SCORER_UNAVAILABLE: return "scorer_unavailable";
		case PipelineErrorKind::STORE_WRITE: return "store_write";
		default: return "unknown";
	}
}

class LinkwatchException : public std::runtime_error {
public:
	explicit LinkwatchException(const std::string &msg) : std::runtime_error(msg) {}
};

// Persistence failure. The failed transaction has already been rolled back.
class StoreWriteError : public LinkwatchException {
public:
	explicit StoreWriteError(const std::string &msg) : LinkwatchException("store write failed: " + msg) {}
};

class ConfigException : public LinkwatchException {
public:
	explicit ConfigException(const std::string &msg) : LinkwatchException("invalid configuration: " + msg) {}
};

class InvalidInputException : public LinkwatchException {
public:
	explicit InvalidInputException(const std::string &msg) : LinkwatchException(msg) {}
};

} // namespace linkwatch
