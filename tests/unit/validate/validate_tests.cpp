#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include "validate.h"

TEST_CASE("a complete template validates cleanly")
{
    const LatexValidation v = validate_latex(
        "\\documentclass{article}\n\\newcommand{\\name}{John}\n\\begin{document}\\name\\end{document}");

    CHECK(v.valid);
    CHECK(v.errors.empty());
    CHECK(v.warnings.empty());
    CHECK(v.structure.has_document_class);
    CHECK(v.structure.has_begin_document);
    CHECK(v.structure.has_end_document);
    CHECK(v.structure.has_new_commands);
    CHECK_FALSE(v.structure.has_def_commands);
}

TEST_CASE("each missing structural marker is an error")
{
    const LatexValidation v = validate_latex("\\def\\name{John}\nHello");

    CHECK_FALSE(v.valid);
    REQUIRE(v.errors.size() == 3);
    CHECK(v.errors[0] == "Missing \\documentclass declaration");
    CHECK(v.errors[1] == "Missing \\begin{document}");
    CHECK(v.errors[2] == "Missing \\end{document}");
    CHECK(v.structure.has_def_commands);
}

TEST_CASE("templates without definitions get a warning")
{
    const LatexValidation v = validate_latex("\\documentclass{article}\\begin{document}<<name>>\\end{document}");

    CHECK(v.valid);
    REQUIRE(v.warnings.size() == 1);
    CHECK(v.warnings[0].find("No \\newcommand or \\def found") == 0);
}

TEST_CASE("brace balance ignores escaped braces")
{
    const string base = "\\documentclass{article}\\def\\a{x}\\begin{document}";

    const LatexValidation balanced = validate_latex(base + "\\{ literal \\}\\end{document}");
    CHECK(balanced.warnings.empty());

    const LatexValidation unbalanced = validate_latex(base + "{open\\end{document}");
    REQUIRE(unbalanced.warnings.size() == 1);
    CHECK(unbalanced.warnings[0] == "Unbalanced braces: 5 open, 4 close");
    CHECK(unbalanced.valid);
}

TEST_CASE("validation_to_json uses camelCase structure keys")
{
    const json j = validation_to_json(validate_latex("plain text"));

    CHECK(j["valid"] == false);
    CHECK(j["errors"].size() == 3);
    CHECK(j["structure"]["hasDocumentClass"] == false);
    CHECK(j["structure"].contains("hasBeginDocument"));
    CHECK(j["structure"].contains("hasEndDocument"));
    CHECK(j["structure"].contains("hasNewCommands"));
    CHECK(j["structure"].contains("hasDefCommands"));
}
