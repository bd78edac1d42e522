#include "planka/commands/output.hpp"

#include <ostream>

namespace planka::commands {

std::string field_text(const nlohmann::json& entity, const char* key) {
    if (!entity.is_object()) {
        return "";
    }
    auto it = entity.find(key);
    if (it == entity.end() || it->is_null()) {
        return "";
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

void print_entity(std::ostream& os, const std::string& verb,
                  const std::string& kind, const nlohmann::json& entity) {
    os << verb << " " << kind << ": " << field_text(entity, "name")
       << " (ID: " << field_text(entity, "id") << ")" << std::endl;
}

}  // namespace planka::commands
