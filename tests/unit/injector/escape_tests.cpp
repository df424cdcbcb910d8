#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <regex>

#include "injector.h"

TEST_CASE("escape_latex handles every reserved character")
{
    CHECK(escape_latex("&") == "\\&");
    CHECK(escape_latex("%") == "\\%");
    CHECK(escape_latex("$") == "\\$");
    CHECK(escape_latex("#") == "\\#");
    CHECK(escape_latex("_") == "\\_");
    CHECK(escape_latex("{") == "\\{");
    CHECK(escape_latex("}") == "\\}");
    CHECK(escape_latex("^") == "\\textasciicircum{}");
    CHECK(escape_latex("~") == "\\textasciitilde{}");
    CHECK(escape_latex("\\") == "\\textbackslash{}");
}

TEST_CASE("escape_latex is a single pass")
{
    // The braces emitted for \textbackslash{} must not be escaped again
    CHECK(escape_latex("C:\\temp") == "C:\\textbackslash{}temp");
    CHECK(escape_latex("\\{") == "\\textbackslash{}\\{");
}

TEST_CASE("escape_latex leaves ordinary text untouched")
{
    CHECK(escape_latex("") == "");
    CHECK(escape_latex("Jane Smith, (555) 123-4567") == "Jane Smith, (555) 123-4567");
    CHECK(escape_latex("Zürich") == "Zürich");
}

TEST_CASE("escape_regex produces a literal pattern")
{
    const string id = "a.b*c(d)[e]{f}+g?h|i^j$k\\l";
    const std::regex re(escape_regex(id));

    CHECK(std::regex_match(id, re));
    CHECK_FALSE(std::regex_match(string("aXb*c(d)[e]{f}+g?h|i^j$k\\l"), re));
    CHECK(escape_regex("plain_id9") == "plain_id9");
}
