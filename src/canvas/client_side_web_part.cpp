/**
 * @file client_side_web_part.cpp
 * @brief 웹 파트 컨트롤 구현
 */

#include "client_side_web_part.h"

#include "markup/attribute_codec.h"

#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QString>

#include <functional>

namespace pagecanvas::canvas {

namespace {

constexpr const char* kWebPartDataAttribute = "data-sp-webpartdata";
constexpr const char* kHtmlPropertiesAttribute = "data-sp-htmlproperties";

/// 속성 값 텍스트 (문자열은 그대로, 나머지는 JSON 텍스트)
std::string valueText(const QJsonValue& value) {
    if (value.isString()) {
        return value.toString().toStdString();
    }
    if (value.isUndefined() || value.isNull()) {
        return {};
    }
    return markup::AttributeCodec::toJsonText(value);
}

/// `{Name, Value}` 배열 또는 `{이름: 값}` 객체 순회
void forEachProperty(const QJsonValue& field,
                     const std::function<void(const std::string&, const std::string&)>& visit) {
    if (field.isArray()) {
        for (const auto& entry : field.toArray()) {
            const QJsonObject prop = entry.toObject();
            visit(valueText(prop["Name"]), valueText(prop["Value"]));
        }
    } else if (field.isObject()) {
        const QJsonObject props = field.toObject();
        for (auto it = props.begin(); it != props.end(); ++it) {
            visit(it.key().toStdString(), valueText(it.value()));
        }
    }
}

} // namespace

// ============================================================
// ServerProcessedContent
// ============================================================

ServerProcessedContent ServerProcessedContent::fromJson(const QJsonObject& obj) {
    ServerProcessedContent content;
    content.searchable_plain_texts = obj["searchablePlainTexts"];
    content.image_sources = obj["imageSources"];
    content.links = obj["links"];
    return content;
}

QJsonObject ServerProcessedContent::toJson() const {
    QJsonObject obj;
    if (!searchable_plain_texts.isUndefined()) obj["searchablePlainTexts"] = searchable_plain_texts;
    if (!image_sources.isUndefined()) obj["imageSources"] = image_sources;
    if (!links.isUndefined()) obj["links"] = links;
    return obj;
}

std::string ServerProcessedContent::renderHtml() const {
    std::string html;

    forEachProperty(searchable_plain_texts, [&](const std::string& name, const std::string& value) {
        html += "<div data-sp-prop-name=\"" + name + "\" data-sp-searchableplaintext=\"true\">";
        html += value;
        html += "</div>";
    });

    forEachProperty(image_sources, [&](const std::string& name, const std::string& value) {
        html += "<img data-sp-prop-name=\"" + name + "\" src=\"" + value + "\" />";
    });

    forEachProperty(links, [&](const std::string& name, const std::string& value) {
        html += "<a data-sp-prop-name=\"" + name + "\" href=\"" + value + "\"></a>";
    });

    return html;
}

// ============================================================
// ComponentDefinition
// ============================================================

ComponentDefinition ComponentDefinition::fromJson(const QJsonObject& obj) {
    ComponentDefinition def;
    def.component_type = obj["ComponentType"].toInt(def.component_type);
    def.id = obj["Id"].toString().toStdString();
    def.manifest = obj["Manifest"].toString().toStdString();
    def.manifest_type = obj["ManifestType"].toInt(def.manifest_type);
    def.name = obj["Name"].toString().toStdString();
    def.status = obj["Status"].toInt(def.status);
    return def;
}

// ============================================================
// ClientSideWebPart
// ============================================================

ClientSideWebPart::ClientSideWebPart(std::string title,
                                     std::string description,
                                     QJsonObject properties,
                                     std::string web_part_id)
    : title_(std::move(title))
    , description_(std::move(description))
    , properties_(std::move(properties))
    , web_part_id_(std::move(web_part_id)) {}

std::optional<ClientSideWebPart> ClientSideWebPart::fromComponentDefinition(
    const ComponentDefinition& definition, CanvasError* error) {
    ClientSideWebPart part;
    if (!part.importDefinition(definition, error)) {
        return std::nullopt;
    }
    return part;
}

bool ClientSideWebPart::importDefinition(const ComponentDefinition& definition, CanvasError* error) {
    // "{guid}" → "guid"
    std::string id = definition.id;
    if (!id.empty() && id.front() == '{') id.erase(0, 1);
    if (!id.empty() && id.back() == '}') id.pop_back();

    QJsonParseError parse_error;
    QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(definition.manifest),
                                                &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) {
            *error = CanvasError::make(CanvasErrorType::Codec,
                                       "컴포넌트 매니페스트 파싱 실패: " +
                                           parse_error.errorString().toStdString());
        }
        return false;
    }

    const QJsonArray entries = doc.object()["preconfiguredEntries"].toArray();
    if (entries.isEmpty() || !entries.at(0).isObject()) {
        if (error) {
            *error = CanvasError::make(CanvasErrorType::Codec,
                                       "매니페스트에 preconfiguredEntries 항목이 없음: " + id);
        }
        return false;
    }

    const QJsonObject entry = entries.at(0).toObject();
    web_part_id_ = id;
    title_ = entry["title"].toObject()["default"].toString().toStdString();
    description_ = entry["description"].toObject()["default"].toString().toStdString();
    properties_ = parseJsonProperties(entry["properties"].toObject());
    return true;
}

ClientSideWebPart& ClientSideWebPart::setProperties(const QJsonObject& properties) {
    properties_ = properties;
    return *this;
}

QJsonObject ClientSideWebPart::webPartData(const std::string& instance_id,
                                           const std::string& data_version) const {
    QJsonObject data;
    data["dataVersion"] = QString::fromStdString(data_version);
    data["description"] = QString::fromStdString(description_);
    data["id"] = QString::fromStdString(web_part_id_);
    data["instanceId"] = QString::fromStdString(instance_id);
    data["properties"] = properties_;
    data["title"] = QString::fromStdString(title_);
    return data;
}

std::string ClientSideWebPart::renderBody(const std::string& instance_id,
                                          const std::string& data_version) const {
    std::string html;

    html += "<div data-sp-webpart=\"\" data-sp-canvasdataversion=\"" + data_version +
            "\" " + kWebPartDataAttribute + "=\"" +
            markup::AttributeCodec::encode(webPartData(instance_id, data_version)) + "\">";

    html += "<div data-sp-componentid>";
    html += web_part_id_;
    html += "</div>";

    html += "<div " + std::string(kHtmlPropertiesAttribute) + "=\"\">";
    html += server_processed_content_ ? server_processed_content_->renderHtml() : html_properties_;
    html += "</div>";

    html += "</div>";
    return html;
}

bool ClientSideWebPart::parseBody(const std::string& markup,
                                  const markup::BoundedBlockScanner& scanner,
                                  CanvasError* error) {
    auto attribute = markup::AttributeCodec::readAttribute(markup, kWebPartDataAttribute);
    if (!attribute) {
        if (error) {
            *error = CanvasError::make(CanvasErrorType::Codec,
                                       "웹 파트에 data-sp-webpartdata 속성이 없음");
        }
        return false;
    }

    auto decoded = markup::AttributeCodec::decode(*attribute, error);
    if (!decoded) {
        return false;
    }
    if (!decoded->isObject()) {
        if (error) {
            *error = CanvasError::make(CanvasErrorType::Codec, "웹 파트 데이터가 객체가 아님");
        }
        return false;
    }

    const QJsonObject data = decoded->toObject();
    title_ = data["title"].toString().toStdString();
    description_ = data["description"].toString().toStdString();
    web_part_id_ = data["id"].toString().toStdString();
    setProperties(data["properties"].toObject());

    if (data.contains("serverProcessedContent")) {
        server_processed_content_ =
            ServerProcessedContent::fromJson(data["serverProcessedContent"].toObject());
    } else {
        server_processed_content_.reset();
    }

    // html-properties 본문은 다음 렌더링에서 그대로 다시 내보낸다
    CanvasError scan_error;
    auto holder = scanner.findFirst(markup, scanner.makeBoundary(kHtmlPropertiesAttribute),
                                    &scan_error);
    if (!scan_error.ok()) {
        if (error) *error = scan_error;
        return false;
    }
    html_properties_ = holder ? scanner.innerMarkup(*holder) : std::string();
    return true;
}

QJsonObject ClientSideWebPart::parseJsonProperties(const QJsonObject& props) {
    const QJsonObject web_part_data = props["webPartData"].toObject();

    if (props.contains("webPartData") && web_part_data.contains("serverProcessedContent")) {
        server_processed_content_ =
            ServerProcessedContent::fromJson(web_part_data["serverProcessedContent"].toObject());
    } else if (props.contains("serverProcessedContent")) {
        server_processed_content_ =
            ServerProcessedContent::fromJson(props["serverProcessedContent"].toObject());
    } else {
        server_processed_content_.reset();
    }

    if (props.contains("webPartData") && web_part_data.contains("properties")) {
        return web_part_data["properties"].toObject();
    }
    if (props.contains("properties")) {
        return props["properties"].toObject();
    }
    return props;
}

} // namespace pagecanvas::canvas
