#include "orc/model/json_codec.hpp"

#include <gtest/gtest.h>

using orc::ErrorCode;
using namespace orc::model;
using json = nlohmann::json;

TEST(JsonCodecTest, ServerPayloadDecodes) {
    const auto payload = json::parse(R"({
        "id": "job-77",
        "type": "job",
        "status": "EN_ROUTE",
        "fields": {"address": "Mitre 1200", "total": "15000"},
        "collections": {"photos": [{"content": "photo://a", "author": "tablet-07", "added_at": 5}]},
        "server_updated_at": 1700000000000
    })");

    auto entity = entity_from_json(payload);

    ASSERT_TRUE(entity.is_ok());
    EXPECT_EQ(entity.value().id, "job-77");
    EXPECT_EQ(entity.value().status, LifecycleStatus::EnRoute);
    EXPECT_EQ(entity.value().fields.at("total"), "15000");
    ASSERT_EQ(entity.value().collections.at("photos").size(), 1u);
    EXPECT_EQ(entity.value().collections.at("photos")[0].author, "tablet-07");
    EXPECT_EQ(entity.value().server_updated_at, 1700000000000);
    EXPECT_FALSE(entity.value().needs_resolution);
}

TEST(JsonCodecTest, UnknownAttributesSurviveReencoding) {
    const auto payload = json::parse(R"({
        "id": "cust-4",
        "type": "customer",
        "status": "PENDING",
        "loyalty": {"tier": "gold", "points": 120},
        "tags": ["vip", "north"]
    })");

    auto entity = entity_from_json(payload);
    ASSERT_TRUE(entity.is_ok());
    EXPECT_EQ(entity.value().unknown_attributes.size(), 2u);

    const auto encoded = entity_to_json(entity.value());

    EXPECT_EQ(encoded.at("loyalty"), payload.at("loyalty"));
    EXPECT_EQ(encoded.at("tags"), payload.at("tags"));
    EXPECT_EQ(encoded.at("type"), "customer");
}

TEST(JsonCodecTest, UnknownStatusIsRejected) {
    auto entity = entity_from_json(json{{"id", "job-1"}, {"type", "job"}, {"status", "ON_HOLD"}});

    ASSERT_TRUE(entity.is_error());
    EXPECT_EQ(entity.error().code, ErrorCode::StorageError);
}

TEST(JsonCodecTest, MissingIdIsRejected) {
    auto entity = entity_from_json(json{{"type", "job"}, {"status", "PENDING"}});
    ASSERT_TRUE(entity.is_error());
    EXPECT_EQ(entity.error().code, ErrorCode::StorageError);

    EXPECT_TRUE(entity_from_json(json::array()).is_error());
}

TEST(JsonCodecTest, EntryKeepsDeliveryState) {
    ChangeLogEntry entry;
    entry.entry_id = "tablet-07-3";
    entry.entity_id = "job-1";
    entry.kind = MutationKind::StatusTransition;
    entry.target = kStatusField;
    entry.payload = "COMPLETED";
    entry.sequence = 3;
    entry.resolution_override = true;
    entry.state = DeliveryState::Conflicted;

    const auto encoded = entry_to_json(entry);
    EXPECT_EQ(encoded.at("kind"), "status_transition");
    EXPECT_EQ(encoded.at("state"), "conflicted");

    auto decoded = entry_from_json(encoded);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value().state, DeliveryState::Conflicted);
    EXPECT_TRUE(decoded.value().resolution_override);
    EXPECT_EQ(decoded.value().sequence, 3u);
}

TEST(JsonCodecTest, EntryWithUnknownKindIsRejected) {
    auto encoded = entry_to_json(ChangeLogEntry{});
    encoded["kind"] = "field_delete";

    auto decoded = entry_from_json(encoded);

    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().code, ErrorCode::StorageError);
}

TEST(JsonCodecTest, ConflictIdDefaultsFromEntityAndField) {
    auto conflict = conflict_from_json(json{
        {"entity_id", "item-9"},
        {"entity_type", "price_book_item"},
        {"field", "unit_price"},
        {"server_value", "310"},
        {"local_value", "290"},
        {"kind", "concurrent_edit"}
    });

    ASSERT_TRUE(conflict.is_ok());
    EXPECT_EQ(conflict.value().conflict_id, "item-9/unit_price");
    EXPECT_EQ(conflict.value().entity_type, EntityType::PriceBookItem);
    EXPECT_TRUE(conflict.value().requires_user_choice);
}

TEST(JsonCodecTest, NestedUnknownKeysSurviveReencoding) {
    const auto payload = json::parse(R"({
        "id": "job-5",
        "type": "job",
        "status": "IN_PROGRESS",
        "collections": {"photos": [{"content": "photo://b", "author": "tablet-07", "added_at": 9,
                                    "exif": {"iso": 400}}]}
    })");
    auto entity = entity_from_json(payload);
    ASSERT_TRUE(entity.is_ok());

    const auto encoded = entity_to_json(entity.value());
    EXPECT_EQ(encoded.at("collections").at("photos")[0].at("exif"), payload.at("collections").at("photos")[0].at("exif"));

    auto entry_json = entry_to_json(ChangeLogEntry{});
    entry_json["entity_id"] = "job-5";
    entry_json["client_request_id"] = "req-9";
    auto entry = entry_from_json(entry_json);
    ASSERT_TRUE(entry.is_ok());
    EXPECT_EQ(entry_to_json(entry.value()).at("client_request_id"), "req-9");
}
