#include "stockline/types.hpp"
#include "stockline/errors.hpp"

namespace stockline {

std::string to_string(Entity entity) {
    switch (entity) {
        case Entity::Items: return "items";
        case Entity::Transactions: return "transactions";
        case Entity::Categories: return "categories";
        case Entity::Contractors: return "contractors";
        case Entity::Users: return "users";
    }
    return "";
}

std::string to_string(Action action) {
    switch (action) {
        case Action::Create: return "create";
        case Action::Update: return "update";
        case Action::Delete: return "delete";
        case Action::Upsert: return "upsert";
    }
    return "";
}

std::string to_string(OpStatus status) {
    switch (status) {
        case OpStatus::Pending: return "pending";
        case OpStatus::Syncing: return "syncing";
        case OpStatus::Done: return "done";
        case OpStatus::Conflict: return "conflict";
        case OpStatus::Failed: return "failed";
    }
    return "";
}

Entity parse_entity(const std::string& name) {
    if (name == "items") return Entity::Items;
    if (name == "transactions") return Entity::Transactions;
    if (name == "categories") return Entity::Categories;
    if (name == "contractors") return Entity::Contractors;
    if (name == "users") return Entity::Users;
    throw InvalidArgumentError("Unknown entity: " + name);
}

Action parse_action(const std::string& name) {
    if (name == "create") return Action::Create;
    if (name == "update") return Action::Update;
    if (name == "delete") return Action::Delete;
    if (name == "upsert") return Action::Upsert;
    throw InvalidArgumentError("Unknown action: " + name);
}

OpStatus parse_status(const std::string& name) {
    if (name == "pending") return OpStatus::Pending;
    if (name == "syncing") return OpStatus::Syncing;
    if (name == "done") return OpStatus::Done;
    if (name == "conflict") return OpStatus::Conflict;
    // "error" is how older queues spelled a failed entry
    if (name == "failed" || name == "error") return OpStatus::Failed;
    throw InvalidArgumentError("Unknown status: " + name);
}

} // namespace stockline
