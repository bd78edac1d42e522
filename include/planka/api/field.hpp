#pragma once

#include <cstddef>
#include <type_traits>
#include <utility>
#include <variant>

#include "nlohmann/json.hpp"

namespace planka::api {

/// @brief An optional request field with three states: unset (omitted from
/// the request body), null (sent as JSON null, clears the value on the
/// server) and set to a value.
///
/// @code
/// CardUpdate update;
/// update.name = "Release";   // {"name": "Release"}
/// update.due_date = nullptr; // {"name": "Release", "dueDate": null}
/// @endcode
template <typename T>
class Field {
public:
    Field() = default;
    Field(std::nullptr_t) : state_(nullptr) {}

    template <typename U,
              typename = std::enable_if_t<
                  std::is_constructible_v<T, U&&> &&
                  !std::is_same_v<std::decay_t<U>, Field> &&
                  !std::is_same_v<std::decay_t<U>, std::nullptr_t>>>
    Field(U&& value) : state_(std::in_place_type<T>, std::forward<U>(value)) {}

    bool is_set() const {
        return !std::holds_alternative<std::monostate>(state_);
    }
    bool is_null() const {
        return std::holds_alternative<std::nullptr_t>(state_);
    }
    bool has_value() const { return std::holds_alternative<T>(state_); }

    // Throws std::bad_variant_access unless has_value()
    const T& value() const { return std::get<T>(state_); }

    void reset() { state_ = std::monostate{}; }

    // Adds key to body only when the field is set
    void write_to(nlohmann::json& body, const char* key) const {
        if (has_value()) {
            body[key] = value();
        } else if (is_null()) {
            body[key] = nullptr;
        }
    }

private:
    std::variant<std::monostate, std::nullptr_t, T> state_;
};

}  // namespace planka::api
