#include "orc/sync/field_rules.hpp"

#include <sstream>
#include <unordered_set>

namespace orc::sync {
namespace {

using model::EntityType;
using S = ResolutionStrategy;

RuleTable build_table(EntityType type) {
    switch (type) {
        case EntityType::Job:
            return RuleTable(type, {
                {model::kStatusField, S::Custom},
                // Dispatcher-owned planning data
                {"customer_id", S::ServerWins},
                {"organization_id", S::ServerWins},
                {"assigned_to_id", S::ServerWins},
                {"service_type", S::ServerWins},
                {"priority", S::ServerWins},
                {"scheduled_start", S::ServerWins},
                {"scheduled_end", S::ServerWins},
                {"address", S::ServerWins},
                {"latitude", S::ServerWins},
                {"longitude", S::ServerWins},
                // Captured on site by the technician
                {"actual_start", S::LocalWins},
                {"actual_end", S::LocalWins},
                {"completion_notes", S::LocalWins},
                {"signature_url", S::LocalWins},
                {"notes", S::AppendMerge},
                {"internal_notes", S::AppendMerge},
                {"materials_used", S::UnionMerge},
                {"subtotal", S::RequireChoice},
                {"tax", S::RequireChoice},
                {"total", S::RequireChoice},
            }, S::ServerWins);
        case EntityType::Customer:
            return RuleTable(type, {
                {model::kStatusField, S::Custom},
                {"organization_id", S::ServerWins},
                {"dni", S::ServerWins},
                {"cuit", S::ServerWins},
                {"iva_condition", S::ServerWins},
                {"name", S::LocalWins},
                {"phone", S::LocalWins},
                {"email", S::LocalWins},
                {"address", S::LocalWins},
                {"city", S::LocalWins},
                {"province", S::LocalWins},
                {"notes", S::AppendMerge},
            }, S::ServerWins);
        case EntityType::PriceBookItem:
            return RuleTable(type, {
                {model::kStatusField, S::Custom},
                {"name", S::ServerWins},
                {"category", S::ServerWins},
                {"description", S::ServerWins},
                {"unit", S::ServerWins},
                {"is_active", S::ServerWins},
                {"unit_price", S::RequireChoice},
                {"tax_rate", S::RequireChoice},
            }, S::ServerWins);
    }
    return RuleTable(type, {}, S::ServerWins);
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream input(text);
    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

RuleTable::RuleTable(EntityType type,
                     std::map<std::string, ResolutionStrategy> rules,
                     ResolutionStrategy fallback)
    : type_(type), rules_(std::move(rules)), fallback_(fallback) {}

ResolutionStrategy RuleTable::strategy_for(const std::string& field) const {
    auto it = rules_.find(field);
    return it != rules_.end() ? it->second : fallback_;
}

const RuleTable& FieldResolutionRules::table(EntityType type) {
    static const RuleTable job = build_table(EntityType::Job);
    static const RuleTable customer = build_table(EntityType::Customer);
    static const RuleTable price_book = build_table(EntityType::PriceBookItem);

    switch (type) {
        case EntityType::Job: return job;
        case EntityType::Customer: return customer;
        case EntityType::PriceBookItem: return price_book;
    }
    return job;
}

FieldOutcome FieldResolutionRules::resolve(EntityType type,
                                           const std::string& field,
                                           const std::string& server_value,
                                           const std::string& local_value,
                                           bool has_local_pending_edit,
                                           const Attribution& attribution) const {
    if (server_value == local_value) {
        return FieldOutcome::use_server(server_value);
    }

    switch (table(type).strategy_for(field)) {
        case S::ServerWins:
            return FieldOutcome::use_server(server_value);

        case S::LocalWins:
            // Without a pending edit the local value is just a stale copy of an older server value
            if (has_local_pending_edit) {
                return FieldOutcome::use_local(local_value);
            }
            return FieldOutcome::use_server(server_value);

        case S::AppendMerge:
            return resolve_append(server_value, local_value, has_local_pending_edit, attribution);

        case S::UnionMerge: {
            auto merged = union_merge_lines(server_value, local_value);
            if (merged == server_value) {
                return FieldOutcome::use_server(server_value);
            }
            return FieldOutcome::merged(std::move(merged));
        }

        case S::Custom:
            return resolve_status(server_value, local_value, has_local_pending_edit);

        case S::RequireChoice:
            if (has_local_pending_edit) {
                return FieldOutcome::conflict();
            }
            return FieldOutcome::use_server(server_value);
    }
    return FieldOutcome::conflict();
}

FieldOutcome FieldResolutionRules::resolve_append(const std::string& server_value,
                                                  const std::string& local_value,
                                                  bool has_local_pending_edit,
                                                  const Attribution& attribution) const {
    if (!has_local_pending_edit || local_value.empty()) {
        return FieldOutcome::use_server(server_value);
    }
    if (server_value.empty()) {
        return FieldOutcome::use_local(local_value);
    }
    // Device appended to the text it last saw from the server
    if (local_value.rfind(server_value, 0) == 0) {
        return FieldOutcome::use_local(local_value);
    }
    // Server already carries the local text (merged on an earlier pass)
    if (ends_with(server_value, "\n" + local_value) || server_value.rfind(local_value, 0) == 0) {
        return FieldOutcome::use_server(server_value);
    }
    return FieldOutcome::merged(append_merge(server_value, local_value, attribution));
}

FieldOutcome FieldResolutionRules::resolve_status(const std::string& server_value,
                                                  const std::string& local_value,
                                                  bool has_local_pending_edit) const {
    if (!has_local_pending_edit) {
        return FieldOutcome::use_server(server_value);
    }

    auto server_status = model::status_from_string(server_value);
    auto local_status = model::status_from_string(local_value);
    if (!server_status || !local_status) {
        return FieldOutcome::conflict();
    }

    const auto result = status_reconciler_.merge(*server_status, *local_status);
    switch (result.decision) {
        case StatusDecision::Unchanged:
        case StatusDecision::ServerWins:
            return FieldOutcome::use_server(server_value);
        case StatusDecision::LocalWins:
            return FieldOutcome::use_local(local_value);
        case StatusDecision::TerminalWins:
            if (result.resolved == *server_status) {
                return FieldOutcome::use_server(server_value);
            }
            return FieldOutcome::use_local(local_value);
        case StatusDecision::Conflict:
            return FieldOutcome::conflict();
    }
    return FieldOutcome::conflict();
}

std::string FieldResolutionRules::attribution_marker(const Attribution& attribution) {
    std::ostringstream marker;
    marker << "--- " << (attribution.device_id.empty() ? "unknown-device" : attribution.device_id)
           << "@" << attribution.edited_at << " ---";
    return marker.str();
}

std::string FieldResolutionRules::append_merge(const std::string& server_text,
                                               const std::string& local_text,
                                               const Attribution& attribution) {
    return server_text + "\n" + attribution_marker(attribution) + "\n" + local_text;
}

std::string FieldResolutionRules::union_merge_lines(const std::string& server_text,
                                                    const std::string& local_text) {
    std::unordered_set<std::string> seen;
    std::vector<std::string> merged;
    for (const auto* source : {&server_text, &local_text}) {
        for (auto& line : split_lines(*source)) {
            if (seen.insert(model::content_hash(line)).second) {
                merged.push_back(std::move(line));
            }
        }
    }

    std::string out;
    for (std::size_t i = 0; i < merged.size(); ++i) {
        if (i > 0) {
            out += '\n';
        }
        out += merged[i];
    }
    return out;
}

std::vector<model::CollectionItem>
FieldResolutionRules::union_merge(const std::vector<model::CollectionItem>& server_items,
                                  const std::vector<model::CollectionItem>& local_items) {
    std::unordered_set<std::string> seen;
    std::vector<model::CollectionItem> merged;
    merged.reserve(server_items.size() + local_items.size());

    for (const auto* source : {&server_items, &local_items}) {
        for (const auto& item : *source) {
            if (seen.insert(item.content_key()).second) {
                merged.push_back(item);
            }
        }
    }
    return merged;
}

std::string to_string(ResolutionStrategy strategy) {
    switch (strategy) {
        case S::ServerWins: return "server_wins";
        case S::LocalWins: return "local_wins";
        case S::AppendMerge: return "append_merge";
        case S::UnionMerge: return "union_merge";
        case S::Custom: return "custom";
        case S::RequireChoice: return "require_choice";
    }
    return "unknown";
}

std::string to_string(FieldOutcome::Kind kind) {
    switch (kind) {
        case FieldOutcome::Kind::UseServer: return "use_server";
        case FieldOutcome::Kind::UseLocal: return "use_local";
        case FieldOutcome::Kind::Merged: return "merged";
        case FieldOutcome::Kind::Conflict: return "conflict";
    }
    return "unknown";
}

} // namespace orc::sync
