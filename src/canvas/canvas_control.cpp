/**
 * @file canvas_control.cpp
 * @brief 캔버스 컨트롤 구현
 */

#include "canvas_control.h"

#include "markup/attribute_codec.h"

#include <QUuid>

#include <iostream>
#include <utility>

namespace pagecanvas::canvas {

namespace {

constexpr const char* kBoundaryAttribute = "data-sp-canvascontrol";
constexpr const char* kDataVersionAttribute = "data-sp-canvasdataversion";
constexpr const char* kControlDataAttribute = "data-sp-controldata";

CanvasControl::Payload makePayload(ControlType type) {
    switch (type) {
        case ControlType::Column:  return ColumnMarker{};
        case ControlType::Text:    return ClientSideText{};
        case ControlType::WebPart: return ClientSideWebPart{};
    }
    return ColumnMarker{};
}

} // namespace

// ============================================================
// 생성
// ============================================================

CanvasControl::CanvasControl(ControlType type, std::string data_version)
    : type_(type)
    , data_version_(std::move(data_version))
    , id_(newInstanceId())
    , payload_(makePayload(type)) {}

CanvasControl CanvasControl::text(const std::string& text) {
    CanvasControl control(ControlType::Text);
    control.payload_ = ClientSideText(text);
    return control;
}

CanvasControl CanvasControl::webPart(ClientSideWebPart part) {
    CanvasControl control(ControlType::WebPart);
    control.payload_ = std::move(part);
    return control;
}

// ============================================================
// 변형 접근
// ============================================================

ClientSideText* CanvasControl::asText() {
    return std::get_if<ClientSideText>(&payload_);
}

const ClientSideText* CanvasControl::asText() const {
    return std::get_if<ClientSideText>(&payload_);
}

ClientSideWebPart* CanvasControl::asWebPart() {
    return std::get_if<ClientSideWebPart>(&payload_);
}

const ClientSideWebPart* CanvasControl::asWebPart() const {
    return std::get_if<ClientSideWebPart>(&payload_);
}

const ColumnMarker* CanvasControl::asColumnMarker() const {
    return std::get_if<ColumnMarker>(&payload_);
}

// ============================================================
// 메타데이터 / 렌더링
// ============================================================

QJsonObject CanvasControl::describeMetadata(int control_index,
                                            const ControlPlacement& placement,
                                            const CanvasConfig& config) const {
    ControlData data;
    data.position.zone_index = placement.zone_index;
    data.position.section_index = placement.section_index;
    data.position.section_factor = toInt(placement.factor);

    switch (type_) {
        case ControlType::Column:
            data.display_mode = config.column_display_mode;
            break;

        case ControlType::Text:
            data.control_type = static_cast<int>(ControlType::Text);
            data.editor_type = config.text_editor_type;
            data.id = id_;
            data.position.control_index = control_index;
            break;

        case ControlType::WebPart:
            data.control_type = static_cast<int>(ControlType::WebPart);
            data.id = id_;
            data.position.control_index = control_index;
            data.web_part_id = std::get<ClientSideWebPart>(payload_).webPartId();
            break;
    }

    return data.toJson();
}

std::string CanvasControl::toHtml(int index, const ControlPlacement& placement,
                                  const CanvasConfig& config) {
    order_ = index;
    const std::string& version =
        data_version_.empty() ? config.canvas_data_version : data_version_;

    switch (type_) {
        case ControlType::Column:
            return renderColumnMarker(placement, version, config);

        case ControlType::Text:
            return openTag(version, describeMetadata(index, placement, config)) +
                   std::get<ClientSideText>(payload_).renderBody() + "</div>";

        case ControlType::WebPart:
            return openTag(version, describeMetadata(index, placement, config)) +
                   std::get<ClientSideWebPart>(payload_).renderBody(id_, version) +
                   "</div>";
    }

    return {};
}

std::string CanvasControl::renderColumnMarker(const ControlPlacement& placement,
                                              const std::string& data_version,
                                              const CanvasConfig& config) {
    ControlData data;
    data.display_mode = config.column_display_mode;
    data.position.zone_index = placement.zone_index;
    data.position.section_index = placement.section_index;
    data.position.section_factor = toInt(placement.factor);

    return openTag(data_version, data.toJson()) + "</div>";
}

std::string CanvasControl::openTag(const std::string& data_version, const QJsonObject& metadata) {
    return "<div " + std::string(kBoundaryAttribute) + "=\"\" " + kDataVersionAttribute +
           "=\"" + data_version + "\" " + kControlDataAttribute + "=\"" +
           markup::AttributeCodec::encode(metadata) + "\">";
}

// ============================================================
// 파싱
// ============================================================

std::optional<int> CanvasControl::readControlType(const std::string& markup, CanvasError* error) {
    auto attribute = markup::AttributeCodec::readAttribute(markup, kControlDataAttribute, true);
    if (!attribute) {
        if (error) {
            *error = CanvasError::make(CanvasErrorType::Codec,
                                       "컨트롤에 data-sp-controldata 속성이 없음");
        }
        return std::nullopt;
    }

    auto decoded = markup::AttributeCodec::decode(*attribute, error);
    if (!decoded) {
        return std::nullopt;
    }
    if (!decoded->isObject()) {
        if (error) {
            *error = CanvasError::make(CanvasErrorType::Codec, "컨트롤 메타데이터가 객체가 아님");
        }
        return std::nullopt;
    }

    const QJsonValue control_type = decoded->toObject()["controlType"];
    return control_type.isDouble() ? control_type.toInt() : static_cast<int>(ControlType::Column);
}

bool CanvasControl::fromHtml(const std::string& markup,
                             const markup::BoundedBlockScanner& scanner,
                             const CanvasConfig& config,
                             CanvasError* error) {
    auto attribute = markup::AttributeCodec::readAttribute(markup, kControlDataAttribute, true);
    if (!attribute) {
        if (error) {
            *error = CanvasError::make(CanvasErrorType::Codec,
                                       "컨트롤에 data-sp-controldata 속성이 없음");
        }
        return false;
    }

    auto decoded = markup::AttributeCodec::decode(*attribute, error);
    if (!decoded) {
        return false;
    }

    auto data = ControlData::fromJson(*decoded, error);
    if (!data) {
        return false;
    }

    const int discriminant = data->control_type.value_or(static_cast<int>(ControlType::Column));
    if (discriminant != static_cast<int>(type_)) {
        if (error) {
            *error = CanvasError::make(CanvasErrorType::Codec,
                                       "controlType 불일치: " + std::to_string(discriminant));
        }
        return false;
    }

    control_data_ = *data;
    if (!data->id.empty()) {
        id_ = data->id;
    }
    if (auto version = markup::AttributeCodec::readAttribute(markup, kDataVersionAttribute, true)) {
        data_version_ = *version;
    }

    switch (type_) {
        case ControlType::Column: {
            auto& marker = std::get<ColumnMarker>(payload_);
            const int raw_factor = data->position.section_factor.value_or(12);
            auto factor = columnFactorFromInt(raw_factor);
            if (!factor) {
                std::cerr << "[CanvasControl] 잘못된 열 비율 " << raw_factor
                          << ", 12로 대체" << std::endl;
            }
            marker.factor = factor.value_or(CanvasColumnFactor::Full);
            marker.section_index = data->position.section_index;
            marker.zone_index = data->position.zone_index;
            return true;
        }

        case ControlType::Text:
            return std::get<ClientSideText>(payload_).parseBody(markup, scanner, config, error);

        case ControlType::WebPart:
            return std::get<ClientSideWebPart>(payload_).parseBody(markup, scanner, error);
    }

    return false;
}

std::string CanvasControl::newInstanceId() {
    return QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString();
}

} // namespace pagecanvas::canvas
