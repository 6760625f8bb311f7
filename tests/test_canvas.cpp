/**
 * @file test_canvas.cpp
 * @brief 캔버스 컨트롤 모델 단위 테스트
 *
 * 테스트 대상:
 *   - ClientSideText / CanvasControl: 렌더링 형식, 판별값, 파싱, 텍스트 홀더 모드
 *   - ClientSideWebPart: 웹 파트 데이터, html-properties 보존, 컴포넌트 정의 가져오기
 *   - CanvasSection / CanvasColumn: 기본 열, 순서 할당, 역참조
 *   - TreeReconciler: zone 순서 정렬, 빈 열 병합
 */

#include <gtest/gtest.h>

#include "canvas/canvas_config.h"
#include "canvas/canvas_control.h"
#include "canvas/canvas_section.h"
#include "canvas/client_side_text.h"
#include "canvas/client_side_web_part.h"
#include "canvas/tree_reconciler.h"
#include "markup/attribute_codec.h"
#include "markup/bounded_block_scanner.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include <deque>
#include <string>

using namespace pagecanvas;
using namespace pagecanvas::canvas;
using pagecanvas::markup::AttributeCodec;
using pagecanvas::markup::BoundedBlockScanner;

namespace {

/// 메타데이터 JSON 텍스트로 컨트롤 조각 생성
std::string controlFragment(const std::string& metadata_json, const std::string& body = "") {
    auto metadata = AttributeCodec::fromJsonText(metadata_json);
    return "<div data-sp-canvascontrol=\"\" data-sp-canvasdataversion=\"1.0\" data-sp-controldata=\"" +
           AttributeCodec::encode(metadata.value_or(QJsonValue())) + "\">" + body + "</div>";
}

std::string textFragment(const std::string& id, int zone, int section, const std::string& body) {
    return controlFragment(R"({"controlType":4,"editorType":"CKEditor","id":")" + id +
                               R"(","position":{"controlIndex":1,"sectionFactor":12,"sectionIndex":)" +
                               std::to_string(section) + R"(,"zoneIndex":)" + std::to_string(zone) +
                               "}}",
                           "<div data-sp-rte=\"\">" + body + "</div>");
}

} // namespace

// ============================================================
// 텍스트 / 공통 컨트롤 테스트
// ============================================================

class CanvasControlTest : public ::testing::Test {
protected:
    CanvasConfig config_;
    BoundedBlockScanner scanner_;
    ControlPlacement placement_{1, 1, CanvasColumnFactor::Full};
};

// 1. 텍스트 설정 시 <p> 감싸기
TEST_F(CanvasControlTest, TextIsWrappedInParagraph) {
    ClientSideText text("Hello");
    EXPECT_EQ(text.text(), "<p>Hello</p>");

    text.setText("<p>already</p>");
    EXPECT_EQ(text.text(), "<p>already</p>");
    EXPECT_EQ(text.renderBody(), "<div data-sp-rte=\"\"><p>already</p></div>");
}

// 2. 텍스트 컨트롤 마크업 형식
TEST_F(CanvasControlTest, RendersTextControlMarkup) {
    auto control = CanvasControl::text("Hi");
    control.setId("abc");

    const std::string expected =
        "<div data-sp-canvascontrol=\"\" data-sp-canvasdataversion=\"1.0\" data-sp-controldata=\""
        "&#123;&quot;controlType&quot;&#58;4,&quot;editorType&quot;&#58;&quot;CKEditor&quot;,"
        "&quot;id&quot;&#58;&quot;abc&quot;,&quot;position&quot;&#58;&#123;&quot;controlIndex&quot;&#58;2,"
        "&quot;sectionFactor&quot;&#58;12,&quot;sectionIndex&quot;&#58;1,&quot;zoneIndex&quot;&#58;1&#125;&#125;"
        "\"><div data-sp-rte=\"\"><p>Hi</p></div></div>";

    EXPECT_EQ(control.toHtml(2, placement_, config_), expected);
    EXPECT_EQ(control.order(), 2) << "렌더링 순서가 order에 기록되어야 합니다";
}

// 3. 빈 열 마커 형식
TEST_F(CanvasControlTest, RendersColumnMarker) {
    const std::string expected =
        "<div data-sp-canvascontrol=\"\" data-sp-canvasdataversion=\"1.0\" data-sp-controldata=\""
        "&#123;&quot;displayMode&quot;&#58;2,&quot;position&quot;&#58;&#123;&quot;sectionFactor&quot;&#58;6,"
        "&quot;sectionIndex&quot;&#58;2,&quot;zoneIndex&quot;&#58;3&#125;&#125;\"></div>";

    EXPECT_EQ(CanvasControl::renderColumnMarker({3, 2, CanvasColumnFactor::Six}, "1.0", config_),
              expected);
}

// 4. 판별값 읽기 (없으면 열 마커)
TEST_F(CanvasControlTest, ReadsControlType) {
    EXPECT_EQ(CanvasControl::readControlType(textFragment("t", 1, 1, "")).value_or(-1), 4);
    EXPECT_EQ(CanvasControl::readControlType(
                  CanvasControl::renderColumnMarker(placement_, "1.0", config_)).value_or(-1),
              0);

    CanvasError error;
    EXPECT_FALSE(CanvasControl::readControlType(
                     "<div data-sp-canvascontrol=\"\" data-sp-controldata=\"&#123;oops\"></div>",
                     &error).has_value());
    EXPECT_EQ(error.type, CanvasErrorType::Codec);
}

// 5. 텍스트 컨트롤 파싱
TEST_F(CanvasControlTest, ParsesTextControl) {
    CanvasControl control(ControlType::Text);
    CanvasError error;
    ASSERT_TRUE(control.fromHtml(textFragment("t-1", 2, 3, "<p><b>bold</b></p>"), scanner_,
                                 config_, &error))
        << error.message;

    EXPECT_EQ(control.id(), "t-1");
    EXPECT_EQ(control.dataVersion(), "1.0");
    EXPECT_EQ(control.asText()->text(), "<p><b>bold</b></p>");
    EXPECT_EQ(control.controlData().position.zone_index, 2);
    EXPECT_EQ(control.controlData().position.section_index, 3);
    EXPECT_EQ(control.asWebPart(), nullptr);
}

// 6. 텍스트 홀더 누락: 기본은 빈 텍스트, strict 모드는 에러
TEST_F(CanvasControlTest, MissingTextHolderDependsOnMode) {
    const std::string fragment = controlFragment(
        R"({"controlType":4,"id":"t","position":{"sectionIndex":1,"zoneIndex":1}})", "<p>loose</p>");

    CanvasControl tolerant(ControlType::Text);
    ASSERT_TRUE(tolerant.fromHtml(fragment, scanner_, config_));
    EXPECT_EQ(tolerant.asText()->text(), "");

    CanvasConfig strict;
    strict.strict_text_holder = true;
    CanvasControl control(ControlType::Text);
    CanvasError error;
    EXPECT_FALSE(control.fromHtml(fragment, scanner_, strict, &error));
    EXPECT_EQ(error.type, CanvasErrorType::MalformedMarkup);
}

// 7. 판별값 불일치 / position 누락은 Codec 에러
TEST_F(CanvasControlTest, RejectsInconsistentMetadata) {
    CanvasControl web_part(ControlType::WebPart);
    CanvasError mismatch;
    EXPECT_FALSE(web_part.fromHtml(textFragment("t", 1, 1, ""), scanner_, config_, &mismatch));
    EXPECT_EQ(mismatch.type, CanvasErrorType::Codec);

    CanvasControl text(ControlType::Text);
    CanvasError missing;
    EXPECT_FALSE(text.fromHtml(controlFragment(R"({"controlType":4,"id":"t"})"), scanner_, config_,
                               &missing));
    EXPECT_EQ(missing.type, CanvasErrorType::Codec);
}

// 8. 집합 밖의 열 비율은 12로 대체
TEST_F(CanvasControlTest, InvalidColumnFactorFallsBackToFull) {
    CanvasControl marker(ControlType::Column);
    ASSERT_TRUE(marker.fromHtml(
        controlFragment(R"({"displayMode":2,"position":{"sectionFactor":5,"sectionIndex":2,"zoneIndex":1}})"),
        scanner_, config_));

    ASSERT_NE(marker.asColumnMarker(), nullptr);
    EXPECT_EQ(marker.asColumnMarker()->factor, CanvasColumnFactor::Full);
    EXPECT_EQ(marker.asColumnMarker()->section_index, 2);
}

// ============================================================
// ClientSideWebPart 테스트
// ============================================================

class ClientSideWebPartTest : public ::testing::Test {
protected:
    static ClientSideWebPart samplePart() {
        return ClientSideWebPart("Title", "Desc", QJsonObject{{"a", 1}}, "wp-id");
    }

    CanvasConfig config_;
    BoundedBlockScanner scanner_;
    ControlPlacement placement_{1, 1, CanvasColumnFactor::Full};
};

// 9. 웹 파트 마크업 구조
TEST_F(ClientSideWebPartTest, RendersWebPartMarkup) {
    auto control = CanvasControl::webPart(samplePart());
    control.setId("inst");
    const std::string html = control.toHtml(1, placement_, config_);

    const std::string web_part_data =
        "&#123;&quot;dataVersion&quot;&#58;&quot;1.0&quot;,&quot;description&quot;&#58;&quot;Desc&quot;,"
        "&quot;id&quot;&#58;&quot;wp-id&quot;,&quot;instanceId&quot;&#58;&quot;inst&quot;,"
        "&quot;properties&quot;&#58;&#123;&quot;a&quot;&#58;1&#125;,&quot;title&quot;&#58;&quot;Title&quot;&#125;";

    EXPECT_NE(html.find("<div data-sp-webpart=\"\" data-sp-canvasdataversion=\"1.0\" "
                        "data-sp-webpartdata=\"" + web_part_data + "\">"),
              std::string::npos);
    EXPECT_NE(html.find("&quot;webPartId&quot;&#58;&quot;wp-id&quot;"), std::string::npos);

    const std::string tail =
        "<div data-sp-componentid>wp-id</div><div data-sp-htmlproperties=\"\"></div></div></div>";
    ASSERT_GE(html.size(), tail.size());
    EXPECT_EQ(html.substr(html.size() - tail.size()), tail);
}

// 10. 웹 파트 파싱
TEST_F(ClientSideWebPartTest, ParsesRenderedWebPart) {
    auto original = CanvasControl::webPart(samplePart());
    const std::string html = original.toHtml(1, placement_, config_);

    CanvasControl parsed(ControlType::WebPart);
    CanvasError error;
    ASSERT_TRUE(parsed.fromHtml(html, scanner_, config_, &error)) << error.message;

    const auto* part = parsed.asWebPart();
    ASSERT_NE(part, nullptr);
    EXPECT_EQ(parsed.id(), original.id());
    EXPECT_EQ(part->title(), "Title");
    EXPECT_EQ(part->description(), "Desc");
    EXPECT_EQ(part->webPartId(), "wp-id");
    EXPECT_EQ(part->properties(), (QJsonObject{{"a", 1}}));
    EXPECT_FALSE(part->serverProcessedContent().has_value());
}

// 11. html-properties 본문은 그대로 다시 내보냄
TEST_F(ClientSideWebPartTest, PreservesHtmlPropertiesBody) {
    const std::string body = "<div data-sp-prop-name=\"x\"><div>nested</div></div><a href=\"u\"></a>";

    auto original = CanvasControl::webPart(samplePart());
    std::string html = original.toHtml(1, placement_, config_);
    const std::string empty_holder = "<div data-sp-htmlproperties=\"\"></div>";
    html.replace(html.find(empty_holder), empty_holder.size(),
                 "<div data-sp-htmlproperties=\"\">" + body + "</div>");

    CanvasControl parsed(ControlType::WebPart);
    ASSERT_TRUE(parsed.fromHtml(html, scanner_, config_));
    EXPECT_EQ(parsed.asWebPart()->htmlProperties(), body);
    EXPECT_EQ(parsed.toHtml(1, placement_, config_), html);
}

// 12. 서버 처리 콘텐츠 본문 합성
TEST_F(ClientSideWebPartTest, RendersServerProcessedContent) {
    ServerProcessedContent content;
    content.searchable_plain_texts = QJsonArray{QJsonObject{{"Name", "title"}, {"Value", "Hello"}}};
    content.image_sources = QJsonObject{{"img", "/a.png"}};
    content.links = QJsonArray{QJsonObject{{"Name", "link"}, {"Value", "/page"}}};

    EXPECT_EQ(content.renderHtml(),
              "<div data-sp-prop-name=\"title\" data-sp-searchableplaintext=\"true\">Hello</div>"
              "<img data-sp-prop-name=\"img\" src=\"/a.png\" />"
              "<a data-sp-prop-name=\"link\" href=\"/page\"></a>");

    auto part = samplePart();
    part.setServerProcessedContent(content);
    const std::string html = part.renderBody("inst", "1.0");
    EXPECT_NE(html.find("<div data-sp-htmlproperties=\"\">" + content.renderHtml() + "</div>"),
              std::string::npos);
}

// 13. 컴포넌트 정의 가져오기 (속성 우선순위: webPartData.properties)
TEST_F(ClientSideWebPartTest, ImportsComponentDefinition) {
    QJsonObject entry{
        {"title", QJsonObject{{"default", "Embed"}}},
        {"description", QJsonObject{{"default", "Embeds a page"}}},
        {"properties", QJsonObject{
            {"webPartData", QJsonObject{
                {"properties", QJsonObject{{"url", "https://x"}}},
                {"serverProcessedContent", QJsonObject{
                    {"searchablePlainTexts", QJsonArray{QJsonObject{{"Name", "n"}, {"Value", "v"}}}}}}}},
            {"properties", QJsonObject{{"ignored", true}}}}}};
    QJsonObject manifest{{"preconfiguredEntries", QJsonArray{entry}}};

    ComponentDefinition definition = ComponentDefinition::fromJson(QJsonObject{
        {"Id", "{490d7c76-1824-45b2-9de3-676421c997fa}"},
        {"Manifest", QString::fromUtf8(QJsonDocument(manifest).toJson(QJsonDocument::Compact))},
        {"ComponentType", 1},
        {"Name", "Embed"},
        {"Status", 0}});
    EXPECT_EQ(definition.name, "Embed");

    CanvasError error;
    auto part = ClientSideWebPart::fromComponentDefinition(definition, &error);
    ASSERT_TRUE(part.has_value()) << error.message;
    EXPECT_EQ(part->webPartId(), "490d7c76-1824-45b2-9de3-676421c997fa");
    EXPECT_EQ(part->title(), "Embed");
    EXPECT_EQ(part->description(), "Embeds a page");
    EXPECT_EQ(part->properties(), (QJsonObject{{"url", "https://x"}}));
    ASSERT_TRUE(part->serverProcessedContent().has_value());
    EXPECT_EQ(part->serverProcessedContent()->renderHtml(),
              "<div data-sp-prop-name=\"n\" data-sp-searchableplaintext=\"true\">v</div>");
}

// 14. 속성 우선순위: properties.properties → properties
TEST_F(ClientSideWebPartTest, FallsBackThroughPropertyLocations) {
    auto makeDefinition = [](const QJsonObject& properties) {
        QJsonObject entry{{"title", QJsonObject{{"default", "T"}}}, {"properties", properties}};
        ComponentDefinition definition;
        definition.id = "{id}";
        definition.manifest = QJsonDocument(QJsonObject{{"preconfiguredEntries", QJsonArray{entry}}})
                                  .toJson(QJsonDocument::Compact)
                                  .toStdString();
        return definition;
    };

    auto nested = ClientSideWebPart::fromComponentDefinition(
        makeDefinition(QJsonObject{{"properties", QJsonObject{{"inner", 1}}}}));
    ASSERT_TRUE(nested.has_value());
    EXPECT_EQ(nested->properties(), (QJsonObject{{"inner", 1}}));
    EXPECT_EQ(nested->webPartId(), "id");

    auto flat = ClientSideWebPart::fromComponentDefinition(makeDefinition(QJsonObject{{"flat", 2}}));
    ASSERT_TRUE(flat.has_value());
    EXPECT_EQ(flat->properties(), (QJsonObject{{"flat", 2}}));
    EXPECT_FALSE(flat->serverProcessedContent().has_value());
}

// 15. 잘못된 매니페스트는 Codec 에러
TEST_F(ClientSideWebPartTest, RejectsMalformedManifest) {
    ComponentDefinition definition;
    definition.id = "{id}";
    definition.manifest = "{not json";

    CanvasError error;
    EXPECT_FALSE(ClientSideWebPart::fromComponentDefinition(definition, &error).has_value());
    EXPECT_EQ(error.type, CanvasErrorType::Codec);

    definition.manifest = R"({"preconfiguredEntries":[]})";
    CanvasError empty;
    EXPECT_FALSE(ClientSideWebPart::fromComponentDefinition(definition, &empty).has_value());
    EXPECT_EQ(empty.type, CanvasErrorType::Codec);
}

// ============================================================
// CanvasSection / CanvasColumn 테스트
// ============================================================

// 16. 열이 없으면 전체 너비 기본 열 생성
TEST(CanvasSectionTest, AddControlCreatesDefaultColumn) {
    CanvasSection section;
    section.attach(3);

    auto& first = section.addControl(CanvasControl::text("a"));
    auto& second = section.addControl(CanvasControl::text("b"));

    ASSERT_EQ(section.columns().size(), 1u);
    EXPECT_EQ(section.columns()[0].factor(), CanvasColumnFactor::Full);
    EXPECT_EQ(section.columns()[0].controls().size(), 2u);
    EXPECT_EQ(first.asText()->text(), "<p>a</p>") << "deque 참조는 추가 후에도 유효해야 합니다";
    EXPECT_EQ(second.columnRef(), (ColumnRef{3, 0}));
}

// 17. 새 열 순서는 최대값 + 1
TEST(CanvasSectionTest, NewColumnOrderFollowsMaximum) {
    CanvasSection section;
    section.addColumn(CanvasColumnFactor::Six).setOrder(5);
    auto& next = section.addColumn(CanvasColumnFactor::Six);
    EXPECT_EQ(next.order(), 6);

    section.reindex();
    EXPECT_EQ(section.columns()[0].order(), 1);
    EXPECT_EQ(section.columns()[1].order(), 2);
    EXPECT_EQ(section.findColumn(2), &section.columns()[1]);
    EXPECT_EQ(section.findColumn(6), nullptr);
}

// 18. 빈 열은 마커로 렌더링
TEST(CanvasSectionTest, EmptyColumnRendersMarker) {
    CanvasConfig config;
    CanvasSection section(2);
    section.addColumn(CanvasColumnFactor::Four);

    EXPECT_EQ(section.toHtml(config),
              CanvasControl::renderColumnMarker({2, 1, CanvasColumnFactor::Four}, "1.0", config));
}

// ============================================================
// TreeReconciler 테스트
// ============================================================

class TreeReconcilerTest : public ::testing::Test {
protected:
    CanvasControl parseText(const std::string& fragment) {
        CanvasControl control(ControlType::Text);
        EXPECT_TRUE(control.fromHtml(fragment, scanner_, config_));
        return control;
    }

    CanvasConfig config_;
    BoundedBlockScanner scanner_;
    std::deque<CanvasSection> sections_;
};

// 19. zone 순서 [2,1,2] → 섹션 2개, zone 1이 먼저
TEST_F(TreeReconcilerTest, OrdersSectionsByZoneIndex) {
    TreeReconciler reconciler(sections_, config_);
    reconciler.mergeControl(parseText(textFragment("first", 2, 1, "<p>A</p>")));
    reconciler.mergeControl(parseText(textFragment("second", 1, 1, "<p>B</p>")));
    reconciler.mergeControl(parseText(textFragment("third", 2, 1, "<p>C</p>")));
    reconciler.finalize();

    ASSERT_EQ(sections_.size(), 2u);
    EXPECT_EQ(sections_[0].order(), 1);
    EXPECT_EQ(sections_[1].order(), 2);

    const auto& zone_one = sections_[0].columns().at(0).controls();
    ASSERT_EQ(zone_one.size(), 1u);
    EXPECT_EQ(zone_one[0].id(), "second");

    const auto& zone_two = sections_[1].columns().at(0).controls();
    ASSERT_EQ(zone_two.size(), 2u);
    EXPECT_EQ(zone_two[0].id(), "first");
    EXPECT_EQ(zone_two[1].id(), "third");
    EXPECT_EQ(zone_two[1].columnRef(), (ColumnRef{1, 0})) << "정렬 후 역참조가 갱신되어야 합니다";
    EXPECT_EQ(reconciler.mergedCount(), 3u);
}

// 20. 빈 열 마커는 같은 섹션에 별도 열로 추가, 열은 sectionIndex 순
TEST_F(TreeReconcilerTest, MergesColumnMarkers) {
    CanvasControl marker(ControlType::Column);
    ASSERT_TRUE(marker.fromHtml(
        controlFragment(R"({"displayMode":2,"position":{"sectionFactor":6,"sectionIndex":2,"zoneIndex":1}})"),
        scanner_, config_));

    TreeReconciler reconciler(sections_, config_);
    reconciler.mergeColumn(marker);
    reconciler.mergeControl(parseText(textFragment("t", 1, 1, "<p>x</p>")));
    reconciler.finalize();

    ASSERT_EQ(sections_.size(), 1u);
    const auto& columns = sections_[0].columns();
    ASSERT_EQ(columns.size(), 2u);
    EXPECT_EQ(columns[0].order(), 1);
    EXPECT_EQ(columns[0].controls().size(), 1u);
    EXPECT_EQ(columns[1].order(), 2);
    EXPECT_EQ(columns[1].factor(), CanvasColumnFactor::Six);
    EXPECT_TRUE(columns[1].controls().empty());
    EXPECT_EQ(columns[0].controls()[0].columnRef(), (ColumnRef{0, 0}));
}

// GTest::gtest_main에 의해 자동으로 main() 제공됨
