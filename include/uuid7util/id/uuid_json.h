#pragma once

#include "uuid7util/core/result.h"
#include "uuid7util/id/codec_error.h"
#include "uuid7util/id/uuid.h"
#include "uuid7util/id/uuid7_layout.h"

#include <nlohmann/json.hpp>

#include <string>

namespace uuid7util::id {

/// Serialize a Uuid as its canonical string
[[nodiscard]] nlohmann::json uuid_to_json(const Uuid& uuid);

/// Deserialize a Uuid from a JSON string in any form parse_uuid accepts.
/// Non-string or malformed values fail with kMalformedInput (stage kParsingInput).
[[nodiscard]] core::Result<Uuid, CodecFailure> uuid_from_json(const nlohmann::json& j);

/// Serialize decoded layout fields (rand_b as a 16-digit hex string, since
/// 62-bit integers lose precision in most JSON consumers)
[[nodiscard]] nlohmann::json fields_to_json(const Uuid7Fields& fields);

/// Inspection document: canonical text, version, variant, and for v7 the
/// decoded fields under "v7"
[[nodiscard]] nlohmann::json inspect_to_json(const Uuid& uuid);

/// Serialize to stable JSON string (sorted keys, no whitespace)
[[nodiscard]] std::string inspect_to_json_string(const Uuid& uuid);

}  // namespace uuid7util::id
