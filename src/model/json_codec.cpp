#include "orc/model/json_codec.hpp"

#include <map>
#include <set>
#include <string>

using json = nlohmann::json;

namespace orc {
namespace model {
namespace {

const std::set<std::string>& known_entity_keys() {
    static const std::set<std::string> keys {
        "id", "type", "status", "fields", "collections",
        "server_updated_at", "local_updated_at", "needs_resolution"
    };
    return keys;
}

const std::set<std::string>& known_item_keys() {
    static const std::set<std::string> keys {"content", "author", "added_at"};
    return keys;
}

const std::set<std::string>& known_entry_keys() {
    static const std::set<std::string> keys {
        "entry_id", "entity_id", "entity_type", "kind", "target", "payload", "device_id",
        "created_at", "sequence", "resolution_override", "state", "state_changed_at"
    };
    return keys;
}

// Attributes written by a newer build are kept verbatim and written back
void put_unknown(json& j, const std::map<std::string, std::string>& unknown) {
    for (const auto& [key, raw] : unknown) {
        json parsed = json::parse(raw, nullptr, false);
        j[key] = parsed.is_discarded() ? json(raw) : parsed;
    }
}

std::map<std::string, std::string> take_unknown(const json& j, const std::set<std::string>& known) {
    std::map<std::string, std::string> unknown;
    for (const auto& [key, value] : j.items()) {
        if (known.count(key) == 0) {
            unknown[key] = value.dump();
        }
    }
    return unknown;
}

json item_to_json(const CollectionItem& item) {
    json j = json::object();
    put_unknown(j, item.unknown_attributes);
    j["content"] = item.content;
    j["author"] = item.author;
    j["added_at"] = item.added_at;
    return j;
}

CollectionItem item_from_json(const json& j) {
    CollectionItem item(j.at("content").get<std::string>(),
                        j.value("author", std::string{}),
                        j.value("added_at", Timestamp{0}));
    item.unknown_attributes = take_unknown(j, known_item_keys());
    return item;
}

Error malformed(const std::string& what, const std::string& detail) {
    return Error{ErrorCode::StorageError, "Malformed " + what + ": " + detail};
}

} // namespace

json entity_to_json(const Entity& entity) {
    json j;
    put_unknown(j, entity.unknown_attributes);

    j["id"] = entity.id;
    j["type"] = to_string(entity.type);
    j["status"] = to_string(entity.status);
    j["fields"] = entity.fields;

    json collections = json::object();
    for (const auto& [name, items] : entity.collections) {
        json arr = json::array();
        for (const auto& item : items) {
            arr.push_back(item_to_json(item));
        }
        collections[name] = std::move(arr);
    }
    j["collections"] = std::move(collections);
    j["server_updated_at"] = entity.server_updated_at;
    j["local_updated_at"] = entity.local_updated_at;
    j["needs_resolution"] = entity.needs_resolution;
    return j;
}

Result<Entity> entity_from_json(const json& j) {
    if (!j.is_object()) {
        return Err<Entity>(malformed("entity", "expected object"));
    }

    try {
        Entity entity;
        entity.id = j.at("id").get<std::string>();

        const auto type_name = j.at("type").get<std::string>();
        auto type = entity_type_from_string(type_name);
        if (!type) {
            return Err<Entity>(malformed("entity", "unknown type '" + type_name + "'"));
        }
        entity.type = *type;

        const auto status_name = j.at("status").get<std::string>();
        auto status = status_from_string(status_name);
        if (!status) {
            return Err<Entity>(malformed("entity", "unknown status '" + status_name + "'"));
        }
        entity.status = *status;

        if (j.contains("fields")) {
            entity.fields = j.at("fields").get<std::map<std::string, std::string>>();
        }
        if (j.contains("collections")) {
            for (const auto& [name, arr] : j.at("collections").items()) {
                auto& items = entity.collections[name];
                for (const auto& item : arr) {
                    items.push_back(item_from_json(item));
                }
            }
        }
        entity.server_updated_at = j.value("server_updated_at", Timestamp{0});
        entity.local_updated_at = j.value("local_updated_at", Timestamp{0});
        entity.needs_resolution = j.value("needs_resolution", false);

        entity.unknown_attributes = take_unknown(j, known_entity_keys());
        return Ok(std::move(entity));
    } catch (const json::exception& e) {
        return Err<Entity>(malformed("entity", e.what()));
    }
}

json entry_to_json(const ChangeLogEntry& entry) {
    json j = json::object();
    put_unknown(j, entry.unknown_attributes);
    j.update(json{
        {"entry_id", entry.entry_id},
        {"entity_id", entry.entity_id},
        {"entity_type", to_string(entry.entity_type)},
        {"kind", to_string(entry.kind)},
        {"target", entry.target},
        {"payload", entry.payload},
        {"device_id", entry.device_id},
        {"created_at", entry.created_at},
        {"sequence", entry.sequence},
        {"resolution_override", entry.resolution_override},
        {"state", to_string(entry.state)},
        {"state_changed_at", entry.state_changed_at}
    });
    return j;
}

Result<ChangeLogEntry> entry_from_json(const json& j) {
    try {
        ChangeLogEntry entry;
        entry.entry_id = j.at("entry_id").get<std::string>();
        entry.entity_id = j.at("entity_id").get<std::string>();

        auto type = entity_type_from_string(j.at("entity_type").get<std::string>());
        auto kind = mutation_kind_from_string(j.at("kind").get<std::string>());
        auto state = delivery_state_from_string(j.at("state").get<std::string>());
        if (!type || !kind || !state) {
            return Err<ChangeLogEntry>(malformed("change log entry", "unknown enum value in " + entry.entry_id));
        }
        entry.entity_type = *type;
        entry.kind = *kind;
        entry.state = *state;

        entry.target = j.value("target", std::string{});
        entry.payload = j.value("payload", std::string{});
        entry.device_id = j.value("device_id", std::string{});
        entry.created_at = j.value("created_at", Timestamp{0});
        entry.sequence = j.value("sequence", std::uint64_t{0});
        entry.resolution_override = j.value("resolution_override", false);
        entry.state_changed_at = j.value("state_changed_at", Timestamp{0});
        entry.unknown_attributes = take_unknown(j, known_entry_keys());
        return Ok(std::move(entry));
    } catch (const json::exception& e) {
        return Err<ChangeLogEntry>(malformed("change log entry", e.what()));
    }
}

json conflict_to_json(const ConflictRecord& conflict) {
    return json{
        {"conflict_id", conflict.conflict_id},
        {"entity_id", conflict.entity_id},
        {"entity_type", to_string(conflict.entity_type)},
        {"field", conflict.field},
        {"server_value", conflict.server_value},
        {"local_value", conflict.local_value},
        {"requires_user_choice", conflict.requires_user_choice},
        {"kind", to_string(conflict.kind)},
        {"detected_at", conflict.detected_at}
    };
}

Result<ConflictRecord> conflict_from_json(const json& j) {
    try {
        ConflictRecord conflict;
        conflict.entity_id = j.at("entity_id").get<std::string>();
        conflict.field = j.at("field").get<std::string>();
        conflict.conflict_id = j.value("conflict_id", ConflictRecord::make_id(conflict.entity_id, conflict.field));

        auto type = entity_type_from_string(j.at("entity_type").get<std::string>());
        auto kind = conflict_kind_from_string(j.at("kind").get<std::string>());
        if (!type || !kind) {
            return Err<ConflictRecord>(malformed("conflict", "unknown enum value in " + conflict.conflict_id));
        }
        conflict.entity_type = *type;
        conflict.kind = *kind;
        conflict.server_value = j.value("server_value", std::string{});
        conflict.local_value = j.value("local_value", std::string{});
        conflict.requires_user_choice = j.value("requires_user_choice", true);
        conflict.detected_at = j.value("detected_at", Timestamp{0});
        return Ok(std::move(conflict));
    } catch (const json::exception& e) {
        return Err<ConflictRecord>(malformed("conflict", e.what()));
    }
}

} // namespace model
} // namespace orc
