#include "planka/api/board_layout.hpp"

#include <algorithm>

namespace planka::api {

using nlohmann::json;

namespace {

double position_of(const json& entity) {
    auto it = entity.find("position");
    if (it == entity.end() || !it->is_number()) {
        return 0.0;
    }
    return it->get<double>();
}

std::vector<json> sorted_by_position(const json& entities) {
    std::vector<json> result;
    if (!entities.is_array()) {
        return result;
    }
    for (const auto& entity : entities) {
        if (entity.is_object()) {
            result.push_back(entity);
        }
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const json& a, const json& b) {
                         return position_of(a) < position_of(b);
                     });
    return result;
}

const json& included_array(const json& response, const char* key) {
    static const json empty = json::array();
    if (!response.is_object()) {
        return empty;
    }
    auto included = response.find("included");
    if (included == response.end() || !included->is_object()) {
        return empty;
    }
    auto it = included->find(key);
    if (it == included->end()) {
        return empty;
    }
    return *it;
}

}  // namespace

std::vector<ListColumn> group_board(const json& board_response) {
    std::vector<json> lists =
        sorted_by_position(included_array(board_response, "lists"));
    std::vector<json> cards =
        sorted_by_position(included_array(board_response, "cards"));

    std::vector<ListColumn> columns;
    columns.reserve(lists.size());
    for (auto& list : lists) {
        ListColumn column;
        const json list_id = list.value("id", json());
        for (const auto& card : cards) {
            if (card.value("listId", json()) == list_id) {
                column.cards.push_back(card);
            }
        }
        column.list = std::move(list);
        columns.push_back(std::move(column));
    }
    return columns;
}

}  // namespace planka::api
