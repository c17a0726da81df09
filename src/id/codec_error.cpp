#include "uuid7util/id/codec_error.h"

#include <algorithm>
#include <utility>

namespace uuid7util::id {

CodecFailure CodecFailure::wrapped(const CodecStage stage) const {
  CodecFailure copy = *this;
  copy.stages.insert(copy.stages.begin(), stage);
  return copy;
}

std::optional<CodecStage> CodecFailure::outermost_stage() const {
  if (stages.empty()) {
    return std::nullopt;
  }
  return stages.front();
}

bool CodecFailure::crossed(const CodecStage stage) const {
  return std::find(stages.begin(), stages.end(), stage) != stages.end();
}

CodecFailure make_failure(const CodecError code, const CodecStage stage, std::string detail) {
  return CodecFailure{code, {stage}, std::move(detail)};
}

const char* codec_error_name(const CodecError code) {
  switch (code) {
    case CodecError::kInvalidVersion:
      return "invalid_version";
    case CodecError::kMalformedInput:
      return "malformed_input";
    case CodecError::kEntropySourceFailure:
      return "entropy_source_failure";
    case CodecError::kTimestampOutOfRange:
      return "timestamp_out_of_range";
  }
  return "unknown";
}

const char* codec_stage_message(const CodecStage stage) {
  switch (stage) {
    case CodecStage::kCheckingVersion:
      return "checking uuid version";
    case CodecStage::kParsingInput:
      return "parsing input identifier";
    case CodecStage::kExtractingTimestamp:
      return "extracting timestamp";
    case CodecStage::kDrawingEntropy:
      return "drawing random bytes";
    case CodecStage::kConstructingFromTimestamp:
      return "constructing identifier from timestamp";
  }
  return "unknown stage";
}

namespace {

const char* code_message(const CodecError code) {
  switch (code) {
    case CodecError::kInvalidVersion:
      return "invalid uuid version";
    case CodecError::kMalformedInput:
      return "malformed uuid text";
    case CodecError::kEntropySourceFailure:
      return "entropy source failure";
    case CodecError::kTimestampOutOfRange:
      return "timestamp out of 48-bit range";
  }
  return "unknown error";
}

}  // namespace

std::string describe(const CodecFailure& failure) {
  std::string out;
  for (const auto stage : failure.stages) {
    out += codec_stage_message(stage);
    out += ": ";
  }
  out += code_message(failure.code);
  if (!failure.detail.empty()) {
    out += ": ";
    out += failure.detail;
  }
  return out;
}

std::string failure_to_log_string(const CodecFailure& failure) {
  return std::string{"["} + codec_error_name(failure.code) + "] " + describe(failure);
}

}  // namespace uuid7util::id
