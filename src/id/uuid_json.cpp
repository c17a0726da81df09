#include "uuid7util/id/uuid_json.h"

#include "uuid7util/id/uuid_text.h"

#include <iomanip>
#include <sstream>

namespace uuid7util::id {

nlohmann::json uuid_to_json(const Uuid& uuid) {
  return uuid.to_string();
}

core::Result<Uuid, CodecFailure> uuid_from_json(const nlohmann::json& j) {
  if (!j.is_string()) {
    return core::Result<Uuid, CodecFailure>::err(
        make_failure(CodecError::kMalformedInput, CodecStage::kParsingInput,
                     std::string{"expected string, got "} + j.type_name()));
  }

  const auto parsed = parse_uuid(j.get_ref<const std::string&>());
  if (!parsed.has_value()) {
    return core::Result<Uuid, CodecFailure>::err(make_failure(
        CodecError::kMalformedInput, CodecStage::kParsingInput, describe(parsed.error())));
  }
  return core::Result<Uuid, CodecFailure>::ok(parsed.value());
}

nlohmann::json fields_to_json(const Uuid7Fields& fields) {
  std::ostringstream rand_b_hex;
  rand_b_hex << std::hex << std::setw(16) << std::setfill('0') << fields.rand_b;

  nlohmann::json j;
  j["unix_ts_ms"] = fields.unix_ts_ms;
  j["version"] = fields.version;
  j["rand_a"] = fields.rand_a;
  j["variant"] = fields.variant;
  j["rand_b"] = rand_b_hex.str();
  return j;
}

nlohmann::json inspect_to_json(const Uuid& uuid) {
  nlohmann::json j;
  j["uuid"] = uuid_to_json(uuid);
  j["version"] = uuid.version();
  j["variant"] = uuid.variant();

  if (uuid.version() == kVersion7) {
    j["v7"] = fields_to_json(unpack(uuid));
  }
  return j;
}

std::string inspect_to_json_string(const Uuid& uuid) {
  return inspect_to_json(uuid).dump();  // Compact JSON
}

}  // namespace uuid7util::id
