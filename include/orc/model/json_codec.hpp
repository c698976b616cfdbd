#pragma once

/**
 * @file json_codec.hpp
 * @brief JSON encoding of entities, change log entries and conflicts
 *
 * Used by the on-disk store and by transports that speak JSON. Decoding is
 * lenient about missing optional keys and strict about enum values: an
 * unknown status or entity type is a StorageError, never a silent default.
 *
 * FORWARD COMPATIBILITY:
 * Entity attributes this build does not know are kept verbatim in
 * Entity::unknown_attributes and written back unchanged.
 */

#include "orc/core/result.hpp"
#include "orc/model/types.hpp"

#include <nlohmann/json.hpp>

namespace orc {
namespace model {

nlohmann::json entity_to_json(const Entity& entity);
Result<Entity> entity_from_json(const nlohmann::json& json);

nlohmann::json entry_to_json(const ChangeLogEntry& entry);
Result<ChangeLogEntry> entry_from_json(const nlohmann::json& json);

nlohmann::json conflict_to_json(const ConflictRecord& conflict);
Result<ConflictRecord> conflict_from_json(const nlohmann::json& json);

} // namespace model
} // namespace orc
