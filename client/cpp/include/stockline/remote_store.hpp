#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/timestamp.pb.h>
#include "types.hpp"

namespace stockline {

/**
 * The authoritative store behind the local cache.
 *
 * Implementations report failures with the ClientError hierarchy: rejections
 * answer is_precondition_failed() (or is_not_found(), is_invalid_argument()),
 * link problems answer is_connection_error(). Callers use is_transient() to
 * tell the two apart.
 */
class RemoteStore {
public:
    virtual ~RemoteStore() = default;

    /// Returns the row as stored, server-maintained columns included.
    virtual google::protobuf::Struct insert(Entity entity, const google::protobuf::Struct& row) = 0;

    virtual void update(Entity entity, const std::string& id,
                        const google::protobuf::Struct& patch) = 0;

    virtual void remove(Entity entity, const std::string& id) = 0;

    /// nullopt when the record does not exist.
    virtual std::optional<google::protobuf::Timestamp> fetch_updated_at(Entity entity,
                                                                        const std::string& id) = 0;

    virtual int64_t count(Entity entity) = 0;

    virtual std::vector<google::protobuf::Struct> list(Entity entity) = 0;
};

} // namespace stockline
