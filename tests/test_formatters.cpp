#include <gtest/gtest.h>
#include "../core/JsonCodec.hpp"
#include "../core/adapters/RecordFormatters.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace evhistory;

class FormatterTest : public ::testing::Test {
protected:
    TypeRegistry registry_;
    TypeHandle save_ = registry_.declare("doc.Save");
    EventRecord record_{save_, "wrote <a & b>", 7, "2025-01-02T03:04:05.000Z", "editor"};
};

TEST_F(FormatterTest, PlainTextLayout) {
    adapters::PlainTextRecordFormatter formatter;

    EXPECT_EQ(formatter.format(record_, false),
              "[2025-01-02T03:04:05.000Z] #7 doc.Save (editor): wrote <a & b>\n");
    EXPECT_EQ(formatter.format(record_, true),
              "* [2025-01-02T03:04:05.000Z] #7 doc.Save (editor): wrote <a & b>\n");
}

TEST_F(FormatterTest, PlainTextOmitsEmptyMetadata) {
    adapters::PlainTextRecordFormatter formatter;
    EventRecord bare(save_, "x", 0);

    EXPECT_EQ(formatter.format(bare, false), "#0 doc.Save: x\n");
}

TEST_F(FormatterTest, HtmlEscapesAndEmphasises) {
    adapters::HtmlRecordFormatter formatter;

    auto plain = formatter.format(record_, false);
    EXPECT_NE(plain.find("wrote &lt;a &amp; b&gt;"), std::string::npos);
    EXPECT_EQ(plain.find("<b>"), std::string::npos);
    EXPECT_EQ(plain.substr(plain.size() - 5), "<br>\n");

    auto bold = formatter.format(record_, true);
    EXPECT_EQ(bold.rfind("<b>", 0), 0u);
    EXPECT_NE(bold.find("</b><br>\n"), std::string::npos);
}

TEST_F(FormatterTest, HtmlEscapeHelper) {
    EXPECT_EQ(adapters::HtmlRecordFormatter::escape("\"<&>\""), "&quot;&lt;&amp;&gt;&quot;");
    EXPECT_EQ(adapters::HtmlRecordFormatter::escape("plain"), "plain");
}

TEST_F(FormatterTest, JsonLinesEncodesOneObjectPerLine) {
    adapters::JsonLinesRecordFormatter formatter;

    auto line = formatter.format(record_, true);
    ASSERT_EQ(line.back(), '\n');

    auto j = nlohmann::json::parse(line);
    EXPECT_EQ(j["seq"], 7);
    EXPECT_EQ(j["type"], "doc.Save");
    EXPECT_EQ(j["source"], "editor");
    EXPECT_EQ(j["summary"], "wrote <a & b>");
    EXPECT_EQ(j["highlighted"], true);

    auto plain = nlohmann::json::parse(formatter.format(record_, false));
    EXPECT_FALSE(plain.contains("highlighted"));
}

TEST_F(FormatterTest, FactoryPicksFormatter) {
    auto text = adapters::makeRecordFormatter(OutputFormat::Text);
    auto html = adapters::makeRecordFormatter(OutputFormat::Html);
    auto jsonl = adapters::makeRecordFormatter(OutputFormat::JsonLines);

    EXPECT_NE(dynamic_cast<const adapters::PlainTextRecordFormatter*>(text.get()), nullptr);
    EXPECT_NE(dynamic_cast<const adapters::HtmlRecordFormatter*>(html.get()), nullptr);
    EXPECT_NE(dynamic_cast<const adapters::JsonLinesRecordFormatter*>(jsonl.get()), nullptr);
}

TEST_F(FormatterTest, DecodeDeclaresMissingTypes) {
    auto event = JsonCodec::deserialize(
        R"({"type": "doc.AutoSave", "parent": "doc.Save", "source": "timer",
            "message": "autosaved", "extras": {"count": 3, "path": "/tmp/x", "none": null}})",
        registry_);

    EXPECT_EQ(event.type.name(), "doc.AutoSave");
    EXPECT_EQ(event.type.parent(), save_);
    EXPECT_EQ(event.source, "timer");
    EXPECT_EQ(event.message, "autosaved");
    EXPECT_EQ(event.extras.at("count"), "3");
    EXPECT_EQ(event.extras.at("path"), "/tmp/x");
    EXPECT_EQ(event.extras.at("none"), "");
    EXPECT_TRUE(registry_.find("doc.AutoSave").has_value());
}

TEST_F(FormatterTest, DecodeWithoutParentUsesRoot) {
    auto event = JsonCodec::deserialize(R"({"type": "net.Packet"})", registry_);
    EXPECT_EQ(event.type.parent(), registry_.root());
    EXPECT_EQ(event.describe(), "net.Packet");
}

TEST_F(FormatterTest, DecodeErrors) {
    EXPECT_THROW(JsonCodec::deserialize("not json", registry_), nlohmann::json::exception);
    EXPECT_THROW(JsonCodec::deserialize(R"({"message": "no type"})", registry_),
                 nlohmann::json::exception);
    EXPECT_THROW(JsonCodec::deserialize(R"({"type": "a.B", "parent": "missing"})", registry_),
                 std::invalid_argument);
}

TEST_F(FormatterTest, EventEncodeDecode) {
    auto event = makeEvent(save_, "saved", "editor");
    event.extras["path"] = "/tmp/y";

    TypeRegistry fresh;
    auto decoded = JsonCodec::deserialize(JsonCodec::serialize(event), fresh);

    EXPECT_EQ(decoded.type.name(), "doc.Save");
    EXPECT_EQ(decoded.type.parent(), fresh.root());
    EXPECT_EQ(decoded.describe(), event.describe());
    EXPECT_EQ(decoded.source, "editor");
}

TEST_F(FormatterTest, RecordsToJsonArray) {
    EventRecord second(save_, "again", 8);
    auto j = JsonCodec::recordsToJson({record_, second});

    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[0]["seq"], 7);
    EXPECT_EQ(j[1]["summary"], "again");
    EXPECT_FALSE(j[1].contains("source"));
}
