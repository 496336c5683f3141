#pragma once

// RAII wrappers for yyjson allocations
// Include this header in files that use yyjson to get automatic memory management

#include <yyjson.h>

#include <cstdlib>
#include <string>

namespace linkwatch {

// RAII wrapper for yyjson_doc (immutable document)
class YyjsonDocGuard {
public:
	explicit YyjsonDocGuard(yyjson_doc *doc) : doc_(doc) {}
	~YyjsonDocGuard() { if (doc_) yyjson_doc_free(doc_); }

	// Non-copyable
	YyjsonDocGuard(const YyjsonDocGuard&) = delete;
	YyjsonDocGuard& operator=(const YyjsonDocGuard&) = delete;

	// Movable
	YyjsonDocGuard(YyjsonDocGuard&& other) noexcept : doc_(other.doc_) { other.doc_ = nullptr; }
	YyjsonDocGuard& operator=(YyjsonDocGuard&& other) noexcept {
		if (this != &other) {
			if (doc_) yyjson_doc_free(doc_);
			doc_ = other.doc_;
			other.doc_ = nullptr;
		}
		return *this;
	}

	yyjson_doc* get() const { return doc_; }
	yyjson_val* root() const { return doc_ ? yyjson_doc_get_root(doc_) : nullptr; }
	explicit operator bool() const { return doc_ != nullptr; }

private:
	yyjson_doc *doc_;
};

// RAII wrapper for yyjson_mut_doc (mutable document)
class YyjsonMutDocGuard {
public:
	YyjsonMutDocGuard() : doc_(yyjson_mut_doc_new(nullptr)) {}
	explicit YyjsonMutDocGuard(yyjson_mut_doc *doc) : doc_(doc) {}
	~YyjsonMutDocGuard() { if (doc_) yyjson_mut_doc_free(doc_); }

	// Non-copyable
	YyjsonMutDocGuard(const YyjsonMutDocGuard&) = delete;
	YyjsonMutDocGuard& operator=(const YyjsonMutDocGuard&) = delete;

	yyjson_mut_doc* get() const { return doc_; }
	explicit operator bool() const { return doc_ != nullptr; }

	// Serialize the document, empty string on failure
	std::string Write(yyjson_write_flag flags = 0) const {
		if (!doc_) {
			return "";
		}
		size_t len = 0;
		char *json_str = yyjson_mut_write(doc_, flags, &len);
		if (!json_str) {
			return "";
		}
		std::string result(json_str, len);
		free(json_str);
		return result;
	}

private:
	yyjson_mut_doc *doc_;
};

} // namespace linkwatch
