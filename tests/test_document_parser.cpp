#include "util/document_parser.hpp"

#include <gtest/gtest.h>

using namespace hotpush;

TEST(DocumentParserTest, ParsesApplicationConfig) {
    const std::string raw = R"({
        "release": "2026.10.19-1",
        "min_native_interface": 3,
        "content_url": "https://cdn.example.com/www",
        "update": "now",
        "android_identifier": "com.example.app"
    })";

    auto cfg = DocumentParser::ParseApplicationConfig(raw);
    ASSERT_TRUE(cfg.has_value()) << cfg.error();
    EXPECT_EQ(cfg->release_version, "2026.10.19-1");
    EXPECT_EQ(cfg->minimum_native_version, 3);
    EXPECT_EQ(cfg->content_url, "https://cdn.example.com/www");
    EXPECT_EQ(cfg->update_phase, UpdatePhase::Now);
    EXPECT_EQ(cfg->raw_json, raw);
    EXPECT_EQ(DocumentParser::Serialize(*cfg), raw);
}

TEST(DocumentParserTest, ApplicationConfigDefaults) {
    auto cfg = DocumentParser::ParseApplicationConfig(R"({"release":"1"})");
    ASSERT_TRUE(cfg.has_value()) << cfg.error();
    EXPECT_EQ(cfg->minimum_native_version, 0);
    EXPECT_TRUE(cfg->content_url.empty());
    EXPECT_EQ(cfg->update_phase, UpdatePhase::OnResume);
}

TEST(DocumentParserTest, ApplicationConfigFailures) {
    struct FailCase {
        std::string json;
        std::string expected_error_substr;
    };
    const std::vector<FailCase> cases = {
        {"", "Empty input"},
        {"not json at all", "Syntax Error"},
        {"[]", "root must be an object"},
        {R"({"content_url":"x"})", "missing release"},
        {R"({"release":""})", "missing release"},
        {R"({"release":"1","min_native_interface":-4})", "must not be negative"},
        {R"({"release":"1","update":"later"})", "unknown update phase"},
        {R"({"release":7})", "type must be string"},
    };
    for (const auto& c : cases) {
        auto res = DocumentParser::ParseApplicationConfig(c.json);
        ASSERT_FALSE(res.has_value()) << c.json;
        EXPECT_NE(res.error().find(c.expected_error_substr), std::string::npos)
            << c.json << " -> " << res.error();
    }
}

TEST(DocumentParserTest, ParsesContentManifest) {
    const std::string raw =
        R"([{"file":"index.html","hash":"aa"},{"file":"js/app.js","hash":"bb"}])";
    auto m = DocumentParser::ParseContentManifest(raw);
    ASSERT_TRUE(m.has_value()) << m.error();
    ASSERT_EQ(m->files.size(), 2u);
    EXPECT_EQ(m->files[1].path, "js/app.js");
    EXPECT_EQ(m->files[1].fingerprint, "bb");
    ASSERT_NE(m->Find("index.html"), nullptr);
    EXPECT_EQ(m->Find("index.html")->fingerprint, "aa");
    EXPECT_EQ(m->Find("missing"), nullptr);
}

TEST(DocumentParserTest, ContentManifestFailures) {
    struct FailCase {
        std::string json;
        std::string expected_error_substr;
    };
    const std::vector<FailCase> cases = {
        {"  \n", "Empty input"},
        {R"({"file":"a"})", "root must be an array"},
        {R"([1])", "must be an object"},
        {R"([{"hash":"aa"}])", "missing file"},
        {R"([{"file":"a.js"}])", "missing hash: a.js"},
        {R"([{"file":"a.js","hash":"1"},{"file":"a.js","hash":"2"}])", "duplicate manifest entry: a.js"},
        {R"([{"file":"a.js","hash":"1"},{"file":"./a.js","hash":"2"}])", "duplicate manifest entry: ./a.js"},
        {R"([{"file":"js/app.js","hash":"1"},{"file":"/js//app.js","hash":"1"}])", "duplicate manifest entry: /js//app.js"},
    };
    for (const auto& c : cases) {
        auto res = DocumentParser::ParseContentManifest(c.json);
        ASSERT_FALSE(res.has_value()) << c.json;
        EXPECT_NE(res.error().find(c.expected_error_substr), std::string::npos)
            << c.json << " -> " << res.error();
    }
}

TEST(DocumentParserTest, SerializeWithoutRawJsonRendersFields) {
    ContentManifest m;
    m.files = {{"a.js", "h1"}};
    auto reparsed = DocumentParser::ParseContentManifest(DocumentParser::Serialize(m));
    ASSERT_TRUE(reparsed.has_value()) << reparsed.error();
    EXPECT_EQ(reparsed->files, m.files);

    ApplicationConfig cfg;
    cfg.release_version = "5";
    cfg.minimum_native_version = 2;
    cfg.content_url = "https://h/www";
    cfg.update_phase = UpdatePhase::OnStart;
    auto cfg2 = DocumentParser::ParseApplicationConfig(DocumentParser::Serialize(cfg));
    ASSERT_TRUE(cfg2.has_value()) << cfg2.error();
    EXPECT_EQ(cfg2->release_version, "5");
    EXPECT_EQ(cfg2->minimum_native_version, 2);
    EXPECT_EQ(cfg2->update_phase, UpdatePhase::OnStart);
}
