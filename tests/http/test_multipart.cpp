// tests/http/test_multipart.cpp
#define BOOST_TEST_MODULE MultipartTests
#include <boost/test/unit_test.hpp>
#include <string>

#include "planka/http/multipart.hpp"

using planka::http::MultipartFormData;

BOOST_AUTO_TEST_SUITE(MultipartTestSuite)

BOOST_AUTO_TEST_CASE(test_file_part_encoding) {
    MultipartFormData form("XyZ");
    form.add_file("file", "notes.txt", "hello\nworld");

    const std::string expected =
        "--XyZ\r\n"
        "Content-Disposition: form-data; name=\"file\"; "
        "filename=\"notes.txt\"\r\n"
        "Content-Type: application/octet-stream\r\n"
        "\r\n"
        "hello\nworld\r\n"
        "--XyZ--\r\n";
    BOOST_CHECK_EQUAL(form.body(), expected);
    BOOST_CHECK_EQUAL(form.content_type(),
                      "multipart/form-data; boundary=XyZ");
}

BOOST_AUTO_TEST_CASE(test_explicit_content_type) {
    MultipartFormData form("b");
    form.add_file("file", "plan.pdf", "%PDF", "application/pdf");

    const std::string expected =
        "--b\r\n"
        "Content-Disposition: form-data; name=\"file\"; "
        "filename=\"plan.pdf\"\r\n"
        "Content-Type: application/pdf\r\n"
        "\r\n"
        "%PDF\r\n"
        "--b--\r\n";
    BOOST_CHECK_EQUAL(form.body(), expected);
}

BOOST_AUTO_TEST_CASE(test_binary_content_is_preserved) {
    const std::string content("\x00\xff\r\n\x01", 5);
    MultipartFormData form("b");
    form.add_file("file", "blob.bin", content);

    const std::string body = form.body();
    BOOST_CHECK(body.find(content) != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_filename_is_quoted) {
    MultipartFormData form("b");
    form.add_file("file", "my \"draft\"\r\n\\v2.txt", "x");

    BOOST_CHECK(form.body().find("filename=\"my \\\"draft\\\"\\\\v2.txt\"") !=
                std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_generated_boundary) {
    MultipartFormData first;
    MultipartFormData second;

    BOOST_CHECK_EQUAL(first.boundary().rfind("----PlankaFormBoundary", 0), 0u);
    BOOST_CHECK_EQUAL(first.boundary().size(),
                      std::string("----PlankaFormBoundary").size() + 24);
    BOOST_CHECK_NE(first.boundary(), second.boundary());
}

BOOST_AUTO_TEST_CASE(test_empty_form) {
    MultipartFormData form("b");
    BOOST_CHECK_EQUAL(form.body(), "--b--\r\n");
}

BOOST_AUTO_TEST_SUITE_END()
