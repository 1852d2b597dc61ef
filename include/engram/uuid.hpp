#pragma once

#include <boost/uuid/uuid.hpp>
#include <optional>
#include <string>

namespace engram {

// Thought, relation and result ids double as backend point ids, so they are
// always caller-assigned UUIDs rendered in canonical lowercase form.
using Uuid = boost::uuids::uuid;

Uuid generate_uuid();

// Throws InvalidArgumentError for anything that is not a canonical UUID.
Uuid parse_uuid(const std::string& text);

std::optional<Uuid> try_parse_uuid(const std::string& text);

std::string to_string(const Uuid& id);

} // namespace engram
