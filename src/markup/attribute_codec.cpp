/**
 * @file attribute_codec.cpp
 * @brief HTML 속성용 JSON 코덱 구현
 */

#include "attribute_codec.h"

#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

#include <cctype>

namespace pagecanvas::markup {

// ============================================================
// 인코딩 / 디코딩
// ============================================================

std::string AttributeCodec::encode(const QJsonValue& value) {
    std::string text = toJsonText(value);

    // 순서 고정: 따옴표 치환 결과(&quot;)에는 나머지 세 문자가 없다
    replaceAll(text, "\"", "&quot;");
    replaceAll(text, ":", "&#58;");
    replaceAll(text, "{", "&#123;");
    replaceAll(text, "}", "&#125;");
    return text;
}

std::optional<QJsonValue> AttributeCodec::decode(const std::string& escaped, CanvasError* error) {
    std::string text = escaped;
    replaceAll(text, "&quot;", "\"");
    replaceAll(text, "&#58;", ":");
    replaceAll(text, "&#123;", "{");
    replaceAll(text, "&#125;", "}");
    return fromJsonText(text, error);
}

std::string AttributeCodec::toJsonText(const QJsonValue& value) {
    // QJsonDocument는 최상위에 객체/배열만 허용하므로 단일 원소 배열로 감싼 뒤 벗긴다
    QJsonArray wrapper;
    wrapper.append(value);
    QByteArray json = QJsonDocument(wrapper).toJson(QJsonDocument::Compact);
    if (json.size() < 2) {
        return {};
    }
    return json.mid(1, json.size() - 2).toStdString();
}

std::optional<QJsonValue> AttributeCodec::fromJsonText(const std::string& text, CanvasError* error) {
    QByteArray wrapped;
    wrapped.reserve(static_cast<int>(text.size() + 2));
    wrapped.append('[');
    wrapped.append(text.data(), static_cast<int>(text.size()));
    wrapped.append(']');

    QJsonParseError parse_error;
    QJsonDocument doc = QJsonDocument::fromJson(wrapped, &parse_error);

    if (parse_error.error != QJsonParseError::NoError || !doc.isArray() ||
        doc.array().size() != 1) {
        if (error) {
            std::string reason = parse_error.error != QJsonParseError::NoError
                ? parse_error.errorString().toStdString()
                : std::string("단일 JSON 값이 아님");
            *error = CanvasError::make(CanvasErrorType::Codec,
                                       "JSON 디코딩 실패: " + reason);
        }
        return std::nullopt;
    }

    return doc.array().at(0);
}

// ============================================================
// 속성 읽기
// ============================================================

std::optional<std::string> AttributeCodec::readAttribute(const std::string& markup,
                                                         const std::string& name,
                                                         bool opening_tag_only) {
    if (name.empty()) {
        return std::nullopt;
    }

    size_t limit = markup.size();
    if (opening_tag_only) {
        // 인코딩된 값 안에는 큰따옴표가 없으므로 따옴표 밖의 첫 '>'가 태그 끝
        bool in_quotes = false;
        for (size_t i = 0; i < markup.size(); ++i) {
            if (markup[i] == '"') {
                in_quotes = !in_quotes;
            } else if (markup[i] == '>' && !in_quotes) {
                limit = i;
                break;
            }
        }
    }

    auto matches_at = [&](size_t pos) {
        if (pos + name.size() + 2 > limit) return false;
        for (size_t i = 0; i < name.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(markup[pos + i])) !=
                std::tolower(static_cast<unsigned char>(name[i]))) {
                return false;
            }
        }
        return markup[pos + name.size()] == '=' && markup[pos + name.size() + 1] == '"';
    };

    for (size_t pos = 0; pos + name.size() + 2 <= limit; ++pos) {
        if (pos > 0) {
            char prev = markup[pos - 1];
            if (!std::isspace(static_cast<unsigned char>(prev)) && prev != '<') continue;
        }
        if (!matches_at(pos)) continue;

        size_t value_start = pos + name.size() + 2;
        size_t value_end = markup.find('"', value_start);
        if (value_end == std::string::npos || value_end > limit) {
            return std::nullopt;
        }
        return markup.substr(value_start, value_end - value_start);
    }

    return std::nullopt;
}

void AttributeCodec::replaceAll(std::string& text, const std::string& from, const std::string& to) {
    if (from.empty()) return;

    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace pagecanvas::markup
