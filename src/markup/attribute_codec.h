#pragma once

/**
 * @file attribute_codec.h
 * @brief HTML 속성용 JSON 코덱
 *
 * JSON 값을 큰따옴표 속성 값 안에 그대로 넣을 수 있도록
 * `"` `:` `{` `}` 네 문자를 순서대로 이스케이프하고, 그 역변환을 수행합니다.
 */

#include "core/canvas_error.h"

#include <QJsonValue>

#include <optional>
#include <string>

namespace pagecanvas::markup {

class AttributeCodec {
public:
    /**
     * @brief JSON 값 → 이스케이프된 속성 문자열
     *
     * 압축(Compact) JSON 직렬화 후 다음 순서로 치환:
     *   "  → &quot;
     *   :  → &#58;
     *   {  → &#123;
     *   }  → &#125;
     */
    [[nodiscard]] static std::string encode(const QJsonValue& value);

    /**
     * @brief 이스케이프된 속성 문자열 → JSON 값
     * @param error 실패 시 Codec 에러 기록 (선택)
     * @return 올바른 JSON이 아니면 std::nullopt (부분 결과 없음)
     */
    [[nodiscard]] static std::optional<QJsonValue> decode(const std::string& escaped,
                                                          CanvasError* error = nullptr);

    /**
     * @brief JSON 값의 압축 텍스트 (객체/배열 외 스칼라도 지원)
     */
    [[nodiscard]] static std::string toJsonText(const QJsonValue& value);

    /**
     * @brief JSON 텍스트 파싱 (스칼라 포함)
     */
    [[nodiscard]] static std::optional<QJsonValue> fromJsonText(const std::string& text,
                                                                CanvasError* error = nullptr);

    /**
     * @brief 마크업에서 `name="value"` 속성 값 읽기 (대소문자 무시)
     * @param opening_tag_only true면 첫 여는 태그 안에서만 탐색
     */
    [[nodiscard]] static std::optional<std::string> readAttribute(const std::string& markup,
                                                                  const std::string& name,
                                                                  bool opening_tag_only = false);

private:
    static void replaceAll(std::string& text, const std::string& from, const std::string& to);
};

} // namespace pagecanvas::markup
