#pragma once

#include "orc/core/result.hpp"
#include "orc/model/types.hpp"

#include <string>
#include <vector>

namespace orc::sync {

/**
 * @brief Server verdict for one pushed change log entry
 */
struct PushAck {
    std::string entry_id;
    bool accepted = true;
    std::string server_entity_id;   ///< Set when the server assigned an id to a temporary entity
    std::string message;
};

/**
 * @brief Network collaborator used by the coordinator
 *
 * Implementations own framing, authentication and connection handling.
 * Error contract:
 * - fetch_snapshot returns ErrorCode::NotFound for entities the server has never seen
 * - transient failures return ErrorCode::TransportError and are retried
 * - push_entries must be idempotent: re-pushing an acknowledged entry is a no-op server-side
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual Result<model::Entity> fetch_snapshot(const std::string& entity_id) = 0;
    virtual Result<std::vector<PushAck>> push_entries(const std::vector<model::ChangeLogEntry>& entries) = 0;
};

} // namespace orc::sync
