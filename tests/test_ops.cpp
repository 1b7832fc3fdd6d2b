#include <stencil/runtime/operation_registry.hpp>
#include <stencil/runtime/ops.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace stencil;
using ops::OpErrorKind;

namespace {

auto july_15() -> Value {
    return Value{*make_date(2023, 7, 15)};
}

auto require_text(const ops::OpResult& result) -> std::string {
    REQUIRE(result.has_value());
    const auto* text = std::get_if<std::string>(&*result);
    REQUIRE(text != nullptr);
    return *text;
}

auto call(parser::OpKind kind, std::vector<std::string> args = {}) -> parser::OperationCall {
    const auto& spec = runtime::builtin_operations().spec(kind);
    return parser::OperationCall{
        .kind = kind,
        .name = std::string(spec.name),
        .args = std::move(args),
        .offset = 0,
    };
}

}  // namespace

TEST_CASE("Registry lists every operation once") {
    const auto& registry = runtime::builtin_operations();
    REQUIRE(registry.size() == 12);
    REQUIRE(registry.specs().size() == 12);
    for (const auto& op : registry.specs()) {
        const auto* found = registry.find(op.name);
        REQUIRE(found != nullptr);
        REQUIRE(found->kind == op.kind);
        REQUIRE(&registry.spec(op.kind) == found);
    }
    REQUIRE(registry.contains("date.year_month"));
    REQUIRE_FALSE(registry.contains("str.shout"));
    REQUIRE(registry.find("STR.UPPER") == nullptr);
}

TEST_CASE("Registry arities") {
    const auto& registry = runtime::builtin_operations();
    REQUIRE(registry.find("date.format")->min_args == 1);
    REQUIRE(registry.find("date.format")->max_args == 1);
    REQUIRE(registry.find("str.replace")->min_args == 2);
    REQUIRE(registry.find("str.slice")->max_args == 2);
    REQUIRE(registry.find("str.upper")->max_args == 0);
}

TEST_CASE("date.year, date.month and date.year_month") {
    REQUIRE(require_text(ops::date_year(july_15())) == "2023");
    REQUIRE(require_text(ops::date_month(july_15())) == "07");
    REQUIRE(require_text(ops::date_year_month(july_15())) == "2023-07");
}

TEST_CASE("Date operations read date-like strings and timestamps") {
    REQUIRE(require_text(ops::date_year(Value{std::string("15/07/2023")})) == "2023");
    REQUIRE(require_text(ops::date_month(Value{std::string("2023-01-31 09:00")})) == "01");
    auto ts = *make_timestamp(*make_date(1999, 12, 31), 23, 59, 59);
    REQUIRE(require_text(ops::date_year_month(Value{ts})) == "1999-12");
}

TEST_CASE("Date operations reject values that are not dates") {
    auto result = ops::date_year(Value{std::string("ACME")});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == OpErrorKind::TypeMismatch);
    REQUIRE(result.error().message == "cannot read string value 'ACME' as a date");

    auto number = ops::date_month(Value{std::int64_t{42}});
    REQUIRE_FALSE(number.has_value());
    REQUIRE(number.error().kind == OpErrorKind::TypeMismatch);
}

TEST_CASE("Date operations read years far from the epoch") {
    REQUIRE(require_text(ops::date_year(Value{std::string("15/07/3023")})) == "3023");
    REQUIRE(require_text(ops::date_year_month(Value{std::string("01/01/1500")})) == "1500-01");
    REQUIRE(require_text(ops::date_year(Value{*make_date(2500, 1, 1)})) == "2500");
    REQUIRE(require_text(ops::date_format(Value{*make_date(2500, 1, 1)}, "%Y-%m-%d")) ==
            "2500-01-01");

    auto out_of_range = ops::date_year(Value{std::string("15/07/3023 10:00")});
    REQUIRE_FALSE(out_of_range.has_value());
    REQUIRE(out_of_range.error().kind == OpErrorKind::TypeMismatch);
    REQUIRE(out_of_range.error().message ==
            "cannot read string value '15/07/3023 10:00' as a date");
}

TEST_CASE("Date operations pass blank values through") {
    REQUIRE(require_text(ops::date_year(Value{})).empty());
    REQUIRE(require_text(ops::date_year_month(Value{std::string("   ")})).empty());
    REQUIRE(require_text(ops::date_format(Value{std::string()}, "%Y")).empty());
}

TEST_CASE("date.format renders strftime-style specs") {
    REQUIRE(require_text(ops::date_format(july_15(), "%Y/%m/%d")) == "2023/07/15");
    REQUIRE(require_text(ops::date_format(july_15(), "%d.%m.%Y")) == "15.07.2023");
    REQUIRE(require_text(ops::date_format(july_15(), "%Y-%m")) == "2023-07");
    REQUIRE(require_text(ops::date_format(july_15(), "%B %Y")) == "July 2023");
    REQUIRE(require_text(ops::date_format(july_15(), "archive")) == "archive");
}

TEST_CASE("date.format rejects invalid specs") {
    auto unknown = ops::date_format(july_15(), "%Q");
    REQUIRE_FALSE(unknown.has_value());
    REQUIRE(unknown.error().kind == OpErrorKind::InvalidFormatSpec);

    auto dangling = ops::date_format(july_15(), "%Y%");
    REQUIRE_FALSE(dangling.has_value());
    REQUIRE(dangling.error().kind == OpErrorKind::InvalidFormatSpec);

    auto empty = ops::date_format(july_15(), "");
    REQUIRE_FALSE(empty.has_value());
    REQUIRE(empty.error().kind == OpErrorKind::InvalidFormatSpec);
}

TEST_CASE("Case mapping") {
    REQUIRE(ops::str_upper("acme supplies") == "ACME SUPPLIES");
    REQUIRE(ops::str_lower("ACME Supplies") == "acme supplies");
    REQUIRE(ops::str_upper("soci\xC3\xA9t\xC3\xA9") == "SOCI\xC3\x89T\xC3\x89");
    REQUIRE(ops::str_lower("\xC3\x89T\xC3\x89") == "\xC3\xA9t\xC3\xA9");
    REQUIRE(ops::str_upper("stra\xC3\x9F" "e") == "STRA\xC3\x9F" "E");
    REQUIRE(ops::str_upper("a\xC3\xB7" "b") == "A\xC3\xB7" "B");
    REQUIRE(ops::str_upper("") == "");
}

TEST_CASE("Title case capitalizes after every non-letter") {
    REQUIRE(ops::str_title("hello world") == "Hello World");
    REQUIRE(ops::str_title("ACME SUPPLIES") == "Acme Supplies");
    REQUIRE(ops::str_title("o'neil-smith") == "O'Neil-Smith");
    REQUIRE(ops::str_title("2nd floor") == "2Nd Floor");
    REQUIRE(ops::str_title("\xC3\xA9" "cole") == "\xC3\x89" "cole");
}

TEST_CASE("Title case treats letters outside Latin-1 as part of the word") {
    // "łukasz żółw" has no Latin-1 capital for ł or ż and stays as is.
    REQUIRE(ops::str_title("\xC5\x82ukasz \xC5\xBC\xC3\xB3\xC5\x82w") ==
            "\xC5\x82ukasz \xC5\xBC\xC3\xB3\xC5\x82w");
    // "ŒUVRE" -> "Œuvre"
    REQUIRE(ops::str_title("\xC5\x92UVRE") == "\xC5\x92uvre");
    // "ÉCOLE ŁÓD" -> "École Łód"
    REQUIRE(ops::str_title("\xC3\x89" "COLE \xC5\x81\xC3\x93" "D") ==
            "\xC3\x89" "cole \xC5\x81\xC3\xB3" "d");
    // Latin-1 signs and General Punctuation still separate words.
    REQUIRE(ops::str_title("l\xE2\x80\x99oreal") == "L\xE2\x80\x99Oreal");
    REQUIRE(ops::str_title("n\xC2\xB0" "5 a\xC3\x97" "b") == "N\xC2\xB0" "5 A\xC3\x97" "B");
}

TEST_CASE("str.replace replaces every occurrence") {
    REQUIRE(ops::str_replace("a b c", " ", "_") == "a_b_c");
    REQUIRE(ops::str_replace("aaa", "aa", "b") == "ba");
    REQUIRE(ops::str_replace("abc", "x", "y") == "abc");
    REQUIRE(ops::str_replace("a-b", "-", "") == "ab");
    REQUIRE(ops::str_replace("abc", "", "x") == "abc");
}

TEST_CASE("str.slice counts code points and clamps") {
    auto slice = [](std::string_view text, std::string_view start, std::string_view end) {
        auto result = ops::str_slice(text, start, end);
        REQUIRE(result.has_value());
        return *result;
    };
    REQUIRE(slice("abcdef", "1", "3") == "bc");
    REQUIRE(slice("abcdef", "2", "") == "cdef");
    REQUIRE(slice("abcdef", "0", "100") == "abcdef");
    REQUIRE(slice("abcdef", "10", "12") == "");
    REQUIRE(slice("abcdef", "4", "2") == "");
    REQUIRE(slice("\xC3\xA9t\xC3\xA9", "0", "2") == "\xC3\xA9t");
    REQUIRE(slice("abc", " 1 ", " ") == "bc");
}

TEST_CASE("str.slice rejects bad bounds") {
    auto word = ops::str_slice("abc", "x", "2");
    REQUIRE_FALSE(word.has_value());
    REQUIRE(word.error().kind == OpErrorKind::InvalidArgs);

    auto negative = ops::str_slice("abc", "0", "-1");
    REQUIRE_FALSE(negative.has_value());
    REQUIRE(negative.error().kind == OpErrorKind::InvalidArgs);

    auto empty_start = ops::str_slice("abc", "", "2");
    REQUIRE_FALSE(empty_start.has_value());
    REQUIRE(empty_start.error().kind == OpErrorKind::InvalidArgs);
}

TEST_CASE("str.sanitize makes text safe for file names") {
    REQUIRE(ops::str_sanitize("acme: north/east") == "acme- north_east");
    REQUIRE(ops::str_sanitize("a\\b|c*d?\"e\"<f>") == "a_b-c+d'e'(f)");
    REQUIRE(ops::str_sanitize("  many   spaces\there ") == "many spaces here");
    REQUIRE(ops::str_sanitize("..hidden.") == "hidden");
    REQUIRE(ops::str_sanitize("???") == "");
}

TEST_CASE("str.first_word and str.split_no_last") {
    REQUIRE(ops::str_first_word("  ACME Supplies Ltd") == "ACME");
    REQUIRE(ops::str_first_word("   ") == "");

    REQUIRE(ops::str_split_no_last("Invoice N\xC2\xB0 12 N\xC2\xB0 345 ") == "N\xC2\xB0" "345");
    REQUIRE(ops::str_split_no_last("  plain text ") == "plain text");
}

TEST_CASE("apply_operation dispatches on the operation kind") {
    REQUIRE(require_text(ops::apply_operation(call(parser::OpKind::DateYear), july_15())) ==
            "2023");
    REQUIRE(require_text(ops::apply_operation(call(parser::OpKind::DateFormat, {"%m/%Y"}),
                                              july_15())) == "07/2023");
    REQUIRE(require_text(ops::apply_operation(call(parser::OpKind::StrUpper),
                                              Value{std::string("abc")})) == "ABC");
    REQUIRE(require_text(ops::apply_operation(call(parser::OpKind::StrReplace, {"-", "/"}),
                                              july_15())) == "2023/07/15");
    REQUIRE(require_text(ops::apply_operation(call(parser::OpKind::StrSlice, {"0", "4"}),
                                              july_15())) == "2023");
    REQUIRE(require_text(ops::apply_operation(call(parser::OpKind::StrLower),
                                              Value{std::int64_t{12}})) == "12");

    auto bad = ops::apply_operation(call(parser::OpKind::StrSlice, {"a", "b"}),
                                    Value{std::string("abc")});
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().kind == OpErrorKind::InvalidArgs);
}

TEST_CASE("apply_operation handles every registered operation") {
    for (const auto& spec : runtime::builtin_operations().specs()) {
        INFO(spec.name);
        std::vector<std::string> args;
        if (spec.kind == parser::OpKind::DateFormat) {
            args = {"%Y"};
        } else if (spec.kind == parser::OpKind::StrSlice) {
            args = {"0", "4"};
        } else if (spec.kind == parser::OpKind::StrReplace) {
            args = {"-", "/"};
        }
        REQUIRE(args.size() == spec.max_args);
        auto result = ops::apply_operation(call(spec.kind, args), july_15());
        REQUIRE(result.has_value());
        REQUIRE(std::holds_alternative<std::string>(*result));
    }
}
