#pragma once

#include <string>
#include <utility>
#include <vector>

namespace libsaberstat {
namespace core {

/**
 * Recoverable conditions detected by a pipeline stage
 *
 * None of these abort the operation: the affected subject, group or
 * indicator is excluded (or marked unavailable) and a Diagnostic is
 * attached to the stage result.
 */
enum class DiagnosticKind {
	MissingField,
	InsufficientSample,
	DegenerateVariance,
	EncodingMismatch
};

inline const char *DiagnosticKindName(DiagnosticKind kind) {
	switch (kind) {
	case DiagnosticKind::MissingField:
		return "MissingField";
	case DiagnosticKind::InsufficientSample:
		return "InsufficientSample";
	case DiagnosticKind::DegenerateVariance:
		return "DegenerateVariance";
	case DiagnosticKind::EncodingMismatch:
		return "EncodingMismatch";
	default:
		return "Unknown";
	}
}

struct Diagnostic {
	DiagnosticKind kind = DiagnosticKind::MissingField;

	/// What the diagnostic is about: a field, subject, group id or indicator key
	std::string scope;

	/// Number of records, rows or groups affected
	size_t count = 0;

	std::string message;

	Diagnostic() = default;
	Diagnostic(DiagnosticKind kind_, std::string scope_, size_t count_, std::string message_)
	    : kind(kind_), scope(std::move(scope_)), count(count_), message(std::move(message_)) {
	}
};

using DiagnosticList = std::vector<Diagnostic>;

inline size_t CountDiagnostics(const DiagnosticList &diagnostics, DiagnosticKind kind) {
	size_t n = 0;
	for (const auto &d : diagnostics) {
		if (d.kind == kind) {
			n++;
		}
	}
	return n;
}

} // namespace core
} // namespace libsaberstat
