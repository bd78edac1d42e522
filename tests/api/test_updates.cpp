// tests/api/test_updates.cpp
#define BOOST_TEST_MODULE UpdateTests
#include <boost/test/unit_test.hpp>

#include "planka/api/updates.hpp"

using nlohmann::json;

BOOST_AUTO_TEST_SUITE(UpdateTestSuite)

BOOST_AUTO_TEST_CASE(test_field_states) {
    planka::api::Field<std::string> field;
    BOOST_CHECK(!field.is_set());

    field = nullptr;
    BOOST_CHECK(field.is_set());
    BOOST_CHECK(field.is_null());
    BOOST_CHECK(!field.has_value());

    field = "value";
    BOOST_CHECK(field.has_value());
    BOOST_CHECK_EQUAL(field.value(), "value");

    field.reset();
    BOOST_CHECK(!field.is_set());
}

BOOST_AUTO_TEST_CASE(test_empty_update_is_empty_object) {
    BOOST_CHECK(planka::api::CardUpdate{}.to_json() == json::object());
    BOOST_CHECK(planka::api::UserUpdate{}.to_json() == json::object());
}

BOOST_AUTO_TEST_CASE(test_card_update_camel_case_keys) {
    planka::api::CardUpdate update;
    update.list_id = "l1";
    update.board_id = "b1";
    update.is_due_date_completed = true;
    update.cover_attachment_id = nullptr;

    BOOST_CHECK(update.to_json() == json({{"listId", "l1"},
                                          {"boardId", "b1"},
                                          {"isDueDateCompleted", true},
                                          {"coverAttachmentId", nullptr}}));
}

BOOST_AUTO_TEST_CASE(test_task_list_update) {
    planka::api::TaskListUpdate update;
    update.show_on_front_of_card = false;
    BOOST_CHECK(update.to_json() == json({{"showOnFrontOfCard", false}}));
}

BOOST_AUTO_TEST_CASE(test_user_update_clears_fields) {
    planka::api::UserUpdate update;
    update.phone = nullptr;
    update.organization = "ACME";
    BOOST_CHECK(update.to_json() ==
                json({{"phone", nullptr}, {"organization", "ACME"}}));
}

BOOST_AUTO_TEST_SUITE_END()
