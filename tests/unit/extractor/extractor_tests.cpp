#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include "errors.h"
#include "extractor.h"

namespace
{
const char* const kTemplate =
    "\\documentclass{article}\n"
    "\\newcommand{\\name}{John Doe}\n"
    "\\begin{document}\\name\\end{document}\n";

class FakeModelClient : public ModelClient
{
public:
    enum class Mode { Reply, Timeout, Error };

    explicit FakeModelClient(string reply, Mode mode = Mode::Reply) : reply_(std::move(reply)), mode_(mode) {}

    string complete(const string& prompt, int max_tokens) override
    {
        calls++;
        last_prompt = prompt;
        last_max_tokens = max_tokens;

        if (mode_ == Mode::Timeout) throw ModelTimeout("Timeout after 45s");
        if (mode_ == Mode::Error) throw ModelError("quota exceeded");
        return reply_;
    }

    string name() const override { return "fake-model"; }
    bool configured() const override { return ready; }

    int    calls = 0;
    int    last_max_tokens = 0;
    string last_prompt;
    bool   ready = true;

private:
    string reply_;
    Mode   mode_;
};

PipelineError extract_failure(const string& latex, FakeModelClient& model)
{
    try {
        extract_schema(latex, model, 4000);
    } catch (const PipelineError& e) {
        return e;
    }
    FAIL("extract_schema did not throw");
    return PipelineError(ErrorKind::BadRequest, "unreachable");
}
} // namespace

TEST_CASE("extraction validates and normalises the model's fields")
{
    FakeModelClient model(
        "```json\n"
        "[{\"id\": \"Full Name!\", \"label\": \"  Full Name \", \"default\": \"John Doe\"},\n"
        " {\"id\": \"email\"},\n"
        " {\"id\": \"years\", \"label\": \"Years\", \"default\": 12},\n"
        " {\"id\": \"fullname\", \"label\": \"Duplicate\", \"default\": \"x\"}]\n"
        "```");

    const ExtractionResult r = extract_schema(kTemplate, model, 4000);

    REQUIRE(r.schema.size() == 2);
    CHECK(r.schema[0].id == "fullname");
    CHECK(r.schema[0].label == "Full Name");
    CHECK(r.schema[0].def == "John Doe");
    CHECK(r.schema[1].id == "years");
    CHECK(r.schema[1].def == "12");
    CHECK(r.total_found == 4);
    CHECK(r.model == "fake-model");
    CHECK_FALSE(r.extracted_at.empty());

    CHECK(model.calls == 1);
    CHECK(model.last_max_tokens == 4000);
    CHECK(model.last_prompt.find("\\newcommand{\\name}{John Doe}") != string::npos);
    CHECK(model.last_prompt.find("### LATEX TEMPLATE START ###") != string::npos);
}

TEST_CASE("extraction tolerates prose around the array")
{
    FakeModelClient model("Sure! Here are the fields:\n[{\"id\": \"name\", \"label\": \"Name [full]\", \"default\": \"\"}]\nDone.");
    const ExtractionResult r = extract_schema(kTemplate, model, 4000);

    REQUIRE(r.schema.size() == 1);
    CHECK(r.schema[0].label == "Name [full]");
}

TEST_CASE("extraction_to_json carries schema and metadata")
{
    FakeModelClient model("[{\"id\": \"name\", \"label\": \"Name\", \"default\": \"John\"}, {\"label\": \"x\"}]");
    const json j = extraction_to_json(extract_schema(kTemplate, model, 4000));

    REQUIRE(j["schema"].size() == 1);
    CHECK(j["schema"][0]["id"] == "name");
    CHECK(j["schema"][0]["default"] == "John");
    CHECK(j["meta"]["totalFound"] == 2);
    CHECK(j["meta"]["validFields"] == 1);
    CHECK(j["meta"]["model"] == "fake-model");
}

TEST_CASE("an empty field list is NoFieldsFound")
{
    FakeModelClient model("[]");
    const PipelineError e = extract_failure(kTemplate, model);

    CHECK(e.kind() == ErrorKind::NoFieldsFound);
    CHECK(e.details()["rawSchema"] == json::array());
    CHECK(http_status_for(e.kind()) == 400);
}

TEST_CASE("a list whose entries all fail validation is NoFieldsFound")
{
    FakeModelClient model("[{\"id\": \"!!!\", \"label\": \"Bad\"}, {\"id\": \"ok\", \"label\": \"   \"}]");
    CHECK(extract_failure(kTemplate, model).kind() == ErrorKind::NoFieldsFound);
}

TEST_CASE("unparseable model output is InvalidModelOutput with diagnostics")
{
    SUBCASE("no array at all")
    {
        FakeModelClient model("I cannot help with that.");
        const PipelineError e = extract_failure(kTemplate, model);

        CHECK(e.kind() == ErrorKind::InvalidModelOutput);
        CHECK(e.details()["raw"] == "I cannot help with that.");
        CHECK(e.details().contains("cleaned"));
    }

    SUBCASE("broken JSON inside the array")
    {
        FakeModelClient model("[{\"id\": \"name\", \"label\": }]");
        const PipelineError e = extract_failure(kTemplate, model);

        CHECK(e.kind() == ErrorKind::InvalidModelOutput);
        CHECK(e.details().contains("parseError"));
        CHECK(http_status_for(e.kind()) == 500);
    }
}

TEST_CASE("model failures map to pipeline errors")
{
    SUBCASE("timeout")
    {
        FakeModelClient model("", FakeModelClient::Mode::Timeout);
        const PipelineError e = extract_failure(kTemplate, model);

        CHECK(e.kind() == ErrorKind::ExtractionTimeout);
        CHECK(http_status_for(e.kind()) == 504);
        CHECK_FALSE(e.troubleshooting().empty());
    }

    SUBCASE("provider error")
    {
        FakeModelClient model("", FakeModelClient::Mode::Error);
        const PipelineError e = extract_failure(kTemplate, model);

        CHECK(e.kind() == ErrorKind::ModelUnavailable);
        CHECK(string(e.what()).find("quota exceeded") != string::npos);
    }

    SUBCASE("not configured")
    {
        FakeModelClient model("[]");
        model.ready = false;

        CHECK(extract_failure(kTemplate, model).kind() == ErrorKind::ModelUnavailable);
        CHECK(model.calls == 0);
    }
}

TEST_CASE("templates are checked before the model is called")
{
    FakeModelClient model("[{\"id\": \"name\", \"label\": \"Name\"}]");

    const PipelineError malformed = extract_failure("\\begin{document}hi\\end{document}", model);
    CHECK(malformed.kind() == ErrorKind::MalformedTemplate);

    const PipelineError empty = extract_failure("   \n\t", model);
    CHECK(empty.kind() == ErrorKind::BadRequest);

    CHECK(model.calls == 0);
}

TEST_CASE("strip_code_fences and find_json_array")
{
    CHECK(strip_code_fences("```json\n[1,2]\n```") == "[1,2]");
    CHECK(strip_code_fences("```\n[1]\n```\n") == "[1]");
    CHECK(strip_code_fences("`[1]`") == "[1]");
    CHECK(strip_code_fences("  [1]  ") == "[1]");

    CHECK(find_json_array("x [1, [2, 3]] y [4]") == "[1, [2, 3]]");
    CHECK(find_json_array("[{\"a\": \"]\"}]") == "[{\"a\": \"]\"}]");
    CHECK(find_json_array("[{\"a\": \"\\\"]\"}]") == "[{\"a\": \"\\\"]\"}]");
    CHECK(find_json_array("no array") == "");
    CHECK(find_json_array("[1, 2") == "");
}

TEST_CASE("content_from_response reads the first choice")
{
    const json ok = {{"choices", json::array({{{"message", {{"role", "assistant"}, {"content", "[]"}}}}})}};
    CHECK(CurlChatClient::content_from_response(ok) == "[]");

    const json err = {{"error", {{"message", "API key not valid"}}}};
    CHECK_THROWS_WITH_AS(CurlChatClient::content_from_response(err), "API key not valid", ModelError);

    CHECK_THROWS_AS(CurlChatClient::content_from_response(json::object()), ModelError);
}

TEST_CASE("a provider error with an odd message shape is still a ModelError")
{
    const json numeric = {{"error", {{"message", 429}, {"code", 429}}}};
    CHECK_THROWS_WITH_AS(CurlChatClient::content_from_response(numeric), "Model API error", ModelError);

    const json nested = {{"error", {{"message", {{"text", "quota"}}}}}};
    CHECK_THROWS_AS(CurlChatClient::content_from_response(nested), ModelError);
}
