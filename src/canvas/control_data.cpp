/**
 * @file control_data.cpp
 * @brief 컨트롤 메타데이터 변환 구현
 */

#include "control_data.h"

#include <QString>

namespace pagecanvas::canvas {

std::optional<CanvasColumnFactor> columnFactorFromInt(int value) {
    switch (value) {
        case 0:  return CanvasColumnFactor::Zero;
        case 2:  return CanvasColumnFactor::Two;
        case 4:  return CanvasColumnFactor::Four;
        case 6:  return CanvasColumnFactor::Six;
        case 8:  return CanvasColumnFactor::Eight;
        case 12: return CanvasColumnFactor::Full;
        default: return std::nullopt;
    }
}

// ============================================================
// ControlPosition
// ============================================================

QJsonObject ControlPosition::toJson() const {
    QJsonObject obj;
    if (control_index) obj["controlIndex"] = *control_index;
    if (section_factor) obj["sectionFactor"] = *section_factor;
    obj["sectionIndex"] = section_index;
    obj["zoneIndex"] = zone_index;
    return obj;
}

std::optional<ControlPosition> ControlPosition::fromJson(const QJsonValue& value) {
    if (!value.isObject()) {
        return std::nullopt;
    }

    const QJsonObject obj = value.toObject();
    if (!obj["zoneIndex"].isDouble() || !obj["sectionIndex"].isDouble()) {
        return std::nullopt;
    }

    ControlPosition position;
    position.zone_index = obj["zoneIndex"].toInt();
    position.section_index = obj["sectionIndex"].toInt();
    if (obj["sectionFactor"].isDouble()) position.section_factor = obj["sectionFactor"].toInt();
    if (obj["controlIndex"].isDouble()) position.control_index = obj["controlIndex"].toInt();
    return position;
}

// ============================================================
// ControlData
// ============================================================

QJsonObject ControlData::toJson() const {
    QJsonObject obj;
    if (control_type) obj["controlType"] = *control_type;
    if (display_mode) obj["displayMode"] = *display_mode;
    if (!editor_type.empty()) obj["editorType"] = QString::fromStdString(editor_type);
    if (!id.empty()) obj["id"] = QString::fromStdString(id);
    obj["position"] = position.toJson();
    if (!web_part_id.empty()) obj["webPartId"] = QString::fromStdString(web_part_id);
    return obj;
}

std::optional<ControlData> ControlData::fromJson(const QJsonValue& value, CanvasError* error) {
    if (!value.isObject()) {
        if (error) {
            *error = CanvasError::make(CanvasErrorType::Codec, "컨트롤 메타데이터가 객체가 아님");
        }
        return std::nullopt;
    }

    const QJsonObject obj = value.toObject();

    auto position = ControlPosition::fromJson(obj["position"]);
    if (!position) {
        if (error) {
            *error = CanvasError::make(CanvasErrorType::Codec,
                                       "컨트롤 메타데이터에 올바른 position이 없음");
        }
        return std::nullopt;
    }

    ControlData data;
    data.position = *position;
    if (obj["controlType"].isDouble()) data.control_type = obj["controlType"].toInt();
    if (obj["displayMode"].isDouble()) data.display_mode = obj["displayMode"].toInt();
    data.id = obj["id"].toString().toStdString();
    data.editor_type = obj["editorType"].toString().toStdString();
    data.web_part_id = obj["webPartId"].toString().toStdString();
    return data;
}

} // namespace pagecanvas::canvas
