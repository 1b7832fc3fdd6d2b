#include <stencil/runtime/path.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace stencil::runtime;

TEST_CASE("split_output_path drops empty and dot segments") {
    REQUIRE(split_output_path("a//b/./c") == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(split_output_path("a\\b/c") == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(split_output_path("a/b/").size() == 2);
    REQUIRE(split_output_path("").empty());
}

TEST_CASE("split_output_path keeps the root of absolute paths") {
    auto segments = split_output_path("/srv/invoices/2023/file.pdf");
    REQUIRE(segments == std::vector<std::string>{"", "srv", "invoices", "2023", "file.pdf"});
    REQUIRE(join_output_path(segments) == "/srv/invoices/2023/file.pdf");
}

TEST_CASE("split_output_path resolves parent segments") {
    REQUIRE(split_output_path("a/b/../c") == std::vector<std::string>{"a", "c"});
    REQUIRE(split_output_path("../a") == std::vector<std::string>{"..", "a"});
    REQUIRE(split_output_path("/../a") == std::vector<std::string>{"", "a"});
    REQUIRE(split_output_path("a/../../b") == std::vector<std::string>{"..", "b"});
}

TEST_CASE("join_output_path") {
    REQUIRE(join_output_path({}) == "");
    REQUIRE(join_output_path({"a", "b"}) == "a/b");
    REQUIRE(join_output_path({""}) == "/");
    REQUIRE(join_output_path(split_output_path("//a//b//")) == "/a/b");
}

TEST_CASE("sanitize_component never yields an unusable name") {
    REQUIRE(sanitize_component("acme: north/east") == "acme- north_east");
    REQUIRE(sanitize_component("") == "_");
    REQUIRE(sanitize_component("..") == "_");
    REQUIRE(sanitize_component("???") == "_");
    REQUIRE(sanitize_component("report.pdf") == "report.pdf");
}
