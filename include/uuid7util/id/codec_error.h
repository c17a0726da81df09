#pragma once

#include <optional>
#include <string>
#include <vector>

namespace uuid7util::id {

// Error enumerations following E.14 (use purpose-designed types as error indicators).
// Callers route on CodecError and CodecStage; the text is for logs only.
enum class CodecError {
  kInvalidVersion,        // NOLINT(readability-identifier-naming)
  kMalformedInput,        // NOLINT(readability-identifier-naming)
  kEntropySourceFailure,  // NOLINT(readability-identifier-naming)
  kTimestampOutOfRange,   // NOLINT(readability-identifier-naming)
};

enum class CodecStage {
  kCheckingVersion,            // NOLINT(readability-identifier-naming)
  kParsingInput,               // NOLINT(readability-identifier-naming)
  kExtractingTimestamp,        // NOLINT(readability-identifier-naming)
  kDrawingEntropy,             // NOLINT(readability-identifier-naming)
  kConstructingFromTimestamp,  // NOLINT(readability-identifier-naming)
};

// CodecFailure is the error half of every codec Result.
//
// stages lists the operations the failure crossed, outermost first:
// restamp_from_string on v4 text yields
//   {kExtractingTimestamp, kCheckingVersion}.
// detail carries the underlying collaborator's message (parser or entropy
// source) and is empty when the code says it all.
// A default-constructed CodecFailure reads kMalformedInput with no stages and
// describes no real failure; the codec builds every failure via make_failure.
struct CodecFailure {
  CodecError code{CodecError::kMalformedInput};  // NOLINT(readability-identifier-naming)
  std::vector<CodecStage> stages;                // NOLINT(readability-identifier-naming)
  std::string detail;                            // NOLINT(readability-identifier-naming)

  // wrapped returns a copy with stage pushed in front of the chain.
  [[nodiscard]] CodecFailure wrapped(CodecStage stage) const;

  [[nodiscard]] std::optional<CodecStage> outermost_stage() const;
  [[nodiscard]] bool crossed(CodecStage stage) const;
};

[[nodiscard]] CodecFailure make_failure(CodecError code, CodecStage stage, std::string detail = {});

[[nodiscard]] const char* codec_error_name(CodecError code);
[[nodiscard]] const char* codec_stage_message(CodecStage stage);

// describe renders the chain the way wrapped errors read, e.g.
// "extracting timestamp: checking uuid version: invalid uuid version".
[[nodiscard]] std::string describe(const CodecFailure& failure);

// failure_to_log_string returns a deterministic single-line form for
// diagnostics: "[invalid_version] extracting timestamp: ...".
[[nodiscard]] std::string failure_to_log_string(const CodecFailure& failure);

}  // namespace uuid7util::id
