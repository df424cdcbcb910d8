#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include "errors.h"
#include "injector.h"

namespace
{
string wrap_document(const string& preamble, const string& body)
{
    return "\\documentclass{article}\n" + preamble + "\n\\begin{document}\n" + body + "\n\\end{document}\n";
}

bool contains(const string& haystack, const string& needle)
{
    return haystack.find(needle) != string::npos;
}
} // namespace

TEST_CASE("newcommand definitions get their body replaced")
{
    const string tpl = wrap_document("\\newcommand{\\name}{John Doe}", "\\name");
    const string out = inject_values(tpl, {{"name", "Jane Smith"}});

    CHECK(contains(out, "\\newcommand{\\name}{Jane Smith}"));
    CHECK_FALSE(contains(out, "John Doe"));
    CHECK(contains(out, "\\begin{document}\n\\name\n"));
}

TEST_CASE("renewcommand, starred and unbraced definition forms are recognised")
{
    const string tpl = wrap_document(
        "\\renewcommand*{\\role}{Engineer}\n\\newcommand\\city{Berlin}", "\\role, \\city");
    const string out = inject_values(tpl, {{"role", "Pilot"}, {"city", "Oslo"}});

    CHECK(contains(out, "\\renewcommand*{\\role}{Pilot}"));
    CHECK(contains(out, "\\newcommand\\city{Oslo}"));
}

TEST_CASE("a field id does not match a longer command name")
{
    const string tpl = wrap_document("\\newcommand{\\name}{A}\n\\newcommand{\\namefull}{B}", "");
    const string out = inject_values(tpl, {{"name", "X"}});

    CHECK(contains(out, "\\newcommand{\\name}{X}"));
    CHECK(contains(out, "\\newcommand{\\namefull}{B}"));
}

TEST_CASE("definition bodies with nested braces are replaced whole")
{
    const string tpl = wrap_document("\\newcommand{\\title}{\\textbf{Senior} {Engineer}}", "\\title");
    const string out = inject_values(tpl, {{"title", "Lead"}});

    CHECK(contains(out, "\\newcommand{\\title}{Lead}\n"));
    CHECK_FALSE(contains(out, "Senior"));
}

TEST_CASE("def definitions get their body replaced")
{
    const string tpl = wrap_document("\\def\\email{john@example.com}\n\\def\\emailalt{other}", "\\email");
    const string out = inject_values(tpl, {{"email", "jane@example.org"}});

    CHECK(contains(out, "\\def\\email{jane@example.org}"));
    CHECK(contains(out, "\\def\\emailalt{other}"));
}

TEST_CASE("bare brace and bracket tokens are replaced")
{
    const string tpl = wrap_document("", "Phone: {phone}\nAlt: [phone]\nBold: \\textbf{phone}");
    const string out = inject_values(tpl, {{"phone", "555-0100"}});

    CHECK(contains(out, "Phone: 555-0100\n"));
    CHECK(contains(out, "Alt: 555-0100\n"));
    CHECK(contains(out, "Bold: \\textbf{555-0100}"));
}

TEST_CASE("structural command arguments and optional arguments are left alone")
{
    const string tpl = "\\documentclass[document]{article}\n\\usepackage{geometry}\n"
                       "\\begin{document}\n\\section[geometry]{Intro}\n\\end{document}\n";
    const string out = inject_values(tpl, {{"document", "X"}, {"geometry", "Y"}, {"article", "Z"}});

    CHECK(contains(out, "\\begin{document}"));
    CHECK(contains(out, "\\end{document}"));
    CHECK(contains(out, "\\usepackage{geometry}"));
    CHECK(contains(out, "\\documentclass[document]{article}"));
    CHECK(contains(out, "\\section[geometry]{Intro}"));
}

TEST_CASE("a token after other arguments of a command keeps its braces")
{
    const string tpl = wrap_document("", "\\href{mailto:x}{email}\n\\section[short]{email}");
    const string out = inject_values(tpl, {{"email", "jane@example.org"}});

    CHECK(contains(out, "\\href{mailto:x}{jane@example.org}"));
    CHECK(contains(out, "\\section[short]{jane@example.org}"));
}

TEST_CASE("VAR and angle-bracket placeholders are replaced")
{
    const string tpl = wrap_document("", "City: \\VAR{city}\nCountry: <<country>>");
    const string out = inject_values(tpl, {{"city", "Lyon"}, {"country", "France"}});

    CHECK(contains(out, "City: Lyon\n"));
    CHECK(contains(out, "Country: France"));
    CHECK_FALSE(contains(out, "VAR"));
}

TEST_CASE("values are escaped before substitution")
{
    const string tpl = wrap_document("\\newcommand{\\skills}{C}", "<<budget>>");
    const string out = inject_values(tpl, {{"skills", "C++ & Rust_2 {fast}"}, {"budget", "$100 at 5%"}});

    CHECK(contains(out, "\\newcommand{\\skills}{C++ \\& Rust\\_2 \\{fast\\}}"));
    CHECK(contains(out, "\\$100 at 5\\%"));
}

TEST_CASE("injecting the same values twice is idempotent")
{
    const string tpl = wrap_document(
        "\\newcommand{\\name}{John}\n\\def\\email{a@b.c}", "\\name \\email");
    const ValueMap values = {{"name", "A\\B {x}"}, {"email", "x_y@z.com"}};

    const string once  = inject_values(tpl, values);
    const string twice = inject_values(once, values);
    CHECK(once == twice);
}

TEST_CASE("one id in all five conventions is replaced everywhere, and again is a no-op")
{
    const string tpl = wrap_document(
        "\\newcommand{\\name}{John}\n\\def\\name{John}",
        "{name}\n[name]\n\\VAR{name}\n<<name>>\n\\textbf{name}");
    const ValueMap values = {{"name", "Jane Doe"}};

    const string once = inject_values(tpl, values);

    CHECK(contains(once, "\\newcommand{\\name}{Jane Doe}"));
    CHECK(contains(once, "\\def\\name{Jane Doe}"));
    CHECK(contains(once, "\\begin{document}\nJane Doe\nJane Doe\nJane Doe\nJane Doe\n\\textbf{Jane Doe}\n"));
    CHECK_FALSE(contains(once, "John"));
    CHECK_FALSE(contains(once, "{name}"));
    CHECK_FALSE(contains(once, "<<name>>"));

    const string twice = inject_values(once, values);
    CHECK(once == twice);
}

TEST_CASE("a value holding another field's placeholder stays literal")
{
    const string tpl = wrap_document("", "<<address>>\n[email]\n<<note>>");
    const string out = inject_values(tpl, {
        {"address", "Room [email] 5"},
        {"email", "x@y.z"},
        {"note", "see <<address>> and \\VAR{email}"},
    });

    CHECK(contains(out, "Room [email] 5\nx@y.z\n"));
    CHECK(contains(out, "see <<address>> and \\textbackslash{}VAR\\{email\\}"));
}

TEST_CASE("marker characters already in the template survive injection")
{
    const string tpl = wrap_document("", string("a\x1A") + "0\x1A <<id>> \x1A\x1A");
    const string out = inject_values(tpl, {{"id", "v"}});

    CHECK(contains(out, string("a\x1A") + "0\x1A v \x1A\x1A"));
}

TEST_CASE("keys that cannot be field ids are ignored")
{
    const string tpl = wrap_document("\\newcommand{\\name}{John}", "<<name>>");

    CHECK(inject_values(tpl, {{string(60000, 'a'), "v"}}) == tpl);
    CHECK(inject_values(tpl, {{"{}", "v"}, {"", "v"}}) == tpl);

    const string out = inject_values(tpl, {{string(5000, 'n'), "v"}, {"name", "Jane"}});
    CHECK(contains(out, "\\newcommand{\\name}{Jane}"));
    CHECK(contains(out, "\\begin{document}\nJane\n"));
}

TEST_CASE("unknown field ids leave the template unchanged")
{
    const string tpl = wrap_document("\\newcommand{\\name}{John}", "\\name");
    CHECK(inject_values(tpl, {{"missing", "value"}}) == tpl);
    CHECK(inject_values(tpl, {}) == tpl);
}

TEST_CASE("templates without required structure are rejected")
{
    SUBCASE("missing documentclass")
    {
        try {
            inject_values("\\begin{document}hi\\end{document}", {{"a", "b"}});
            FAIL("expected MissingStructure");
        } catch (const PipelineError& e) {
            CHECK(e.kind() == ErrorKind::MissingStructure);
            CHECK(e.details()["missing"] == "\\documentclass");
            CHECK_FALSE(e.troubleshooting().empty());
            CHECK(http_status_for(e.kind()) == 400);
        }
    }

    SUBCASE("missing begin document")
    {
        try {
            inject_values("\\documentclass{article}\nhello", {});
            FAIL("expected MissingStructure");
        } catch (const PipelineError& e) {
            CHECK(e.kind() == ErrorKind::MissingStructure);
            CHECK(e.details()["missing"] == "\\begin{document}");
        }
    }
}

TEST_CASE("value maps are built from request JSON")
{
    const json values = {{"name", "Jane"}, {"age", 42}, {"remote", true}, {"note", nullptr}};
    const ValueMap m = value_map_from_json(values);

    CHECK(m.at("name") == "Jane");
    CHECK(m.at("age") == "42");
    CHECK(m.at("remote") == "true");
    CHECK(m.at("note") == "");

    try {
        value_map_from_json(json::array({"x"}));
        FAIL("expected BadRequest");
    } catch (const PipelineError& e) {
        CHECK(e.kind() == ErrorKind::BadRequest);
    }
}

TEST_CASE("complete_values restricts to schema ids and fills gaps")
{
    const FieldSchema schema = {{"name", "Full Name", "John"}, {"email", "Email", ""}};
    const ValueMap out = complete_values(schema, {{"name", "Jane"}, {"extra", "ignored"}});

    REQUIRE(out.size() == 2);
    CHECK(out.at("name") == "Jane");
    CHECK(out.at("email") == "");
    CHECK(out.count("extra") == 0);
}
