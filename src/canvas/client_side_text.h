#pragma once

/**
 * @file client_side_text.h
 * @brief 리치 텍스트 컨트롤 (controlType 4)
 */

#include "canvas/canvas_config.h"
#include "core/canvas_error.h"
#include "markup/bounded_block_scanner.h"

#include <string>

namespace pagecanvas::canvas {

/**
 * @brief 텍스트 컨트롤 본문
 *
 * 본문은 항상 `<p>`로 시작하도록 보정됩니다.
 * 렌더링 시 `<div data-sp-rte="">본문</div>` 홀더로 감쌉니다.
 */
class ClientSideText {
public:
    explicit ClientSideText(const std::string& text = "");

    [[nodiscard]] const std::string& text() const { return text_; }

    /**
     * @brief 본문 설정 (`<p>`로 시작하지 않으면 `<p>...</p>`로 감쌈)
     */
    void setText(const std::string& text);

    /**
     * @brief 본문 홀더 마크업 렌더링
     */
    [[nodiscard]] std::string renderBody() const;

    /**
     * @brief 컨트롤 조각에서 본문 홀더 내부 추출
     *
     * 홀더가 없으면 빈 본문으로 처리합니다. config.strict_text_holder가
     * 켜져 있으면 대신 MalformedMarkup 에러를 기록하고 false를 반환합니다.
     */
    bool parseBody(const std::string& markup,
                   const markup::BoundedBlockScanner& scanner,
                   const CanvasConfig& config,
                   CanvasError* error = nullptr);

private:
    std::string text_;
};

} // namespace pagecanvas::canvas
