#pragma once

#include <iosfwd>
#include <string>

#include "nlohmann/json.hpp"

namespace planka::commands {

// Text of entity[key]: strings verbatim, other values as JSON, absent or
// null as an empty string.
std::string field_text(const nlohmann::json& entity, const char* key);

// "<verb> <kind>: <name> (ID: <id>)"
void print_entity(std::ostream& os, const std::string& verb,
                  const std::string& kind, const nlohmann::json& entity);

}  // namespace planka::commands
