#include "canvas_config.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QString>

#include <iostream>

namespace pagecanvas::canvas {

CanvasConfig CanvasConfig::fromJson(const QJsonObject& obj)
{
    CanvasConfig config;

    if (obj.contains("canvasDataVersion"))
        config.canvas_data_version = obj["canvasDataVersion"].toString().toStdString();
    if (obj.contains("textEditorType"))
        config.text_editor_type = obj["textEditorType"].toString().toStdString();
    if (obj.contains("columnDisplayMode"))
        config.column_display_mode = obj["columnDisplayMode"].toInt(config.column_display_mode);
    if (obj.contains("maxNestingDepth"))
        config.max_nesting_depth = obj["maxNestingDepth"].toInt(config.max_nesting_depth);
    config.strict_text_holder = obj["strictTextHolder"].toBool(config.strict_text_holder);
    config.verbose = obj["verbose"].toBool(config.verbose);

    return config;
}

std::optional<CanvasConfig> CanvasConfig::loadFromFile(const std::string& path)
{
    QFile file(QString::fromStdString(path));
    if (!file.open(QIODevice::ReadOnly)) {
        std::cerr << "[CanvasConfig] 설정 파일을 열 수 없음: " << path << std::endl;
        return std::nullopt;
    }

    QJsonParseError error;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        std::cerr << "[CanvasConfig] 잘못된 설정 파일: " << path
                  << " (" << error.errorString().toStdString() << ")" << std::endl;
        return std::nullopt;
    }

    return fromJson(doc.object());
}

QJsonObject CanvasConfig::toJson() const
{
    QJsonObject obj;
    obj["canvasDataVersion"] = QString::fromStdString(canvas_data_version);
    obj["textEditorType"] = QString::fromStdString(text_editor_type);
    obj["columnDisplayMode"] = column_display_mode;
    obj["maxNestingDepth"] = max_nesting_depth;
    obj["strictTextHolder"] = strict_text_holder;
    obj["verbose"] = verbose;
    return obj;
}

} // namespace pagecanvas::canvas
