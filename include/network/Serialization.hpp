#pragma once

#include <optional>
#include <string>

#include "network/MessageTypes.hpp"

namespace caro::net {

// Line codec: "TAG;field;field..." without the trailing '\n'.
// ';' and '\' inside text fields are escaped with '\'. Optional values are
// empty fields; lists are a count followed by the elements' fields.

std::string serialize(const Message& msg);

/// std::nullopt for an unknown tag, a missing / extra / malformed field,
/// or a dangling escape.
std::optional<Message> deserialize(const std::string& line);

/// Wire tag of a message kind, e.g. "MAKE_MOVE".
std::string toString(MessageKind kind);

std::optional<MessageKind> parseKind(const std::string& tag);

} // namespace caro::net
