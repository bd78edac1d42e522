#pragma once

#include <vector>

#include "nlohmann/json.hpp"

namespace planka::api {

struct ListColumn {
    nlohmann::json list;
    std::vector<nlohmann::json> cards;
};

/// @brief Arranges the cards of a get_board() response under their lists.
///
/// Lists come from included.lists and cards from included.cards, both
/// ordered by "position" (absent or null counts as 0, ties keep server
/// order). Cards whose listId matches no list are dropped.
std::vector<ListColumn> group_board(const nlohmann::json& board_response);

}  // namespace planka::api
