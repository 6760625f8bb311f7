#pragma once

/**
 * @file canvas_config.h
 * @brief 캔버스 모델 설정
 *
 * 직렬화 기본값(데이터 버전, 에디터 타입 등)과 파서 동작을
 * 생성 시점에 명시적으로 전달하는 설정 구조체입니다.
 */

#include <QJsonObject>

#include <optional>
#include <string>

namespace pagecanvas::canvas {

/**
 * @brief 캔버스 설정
 */
struct CanvasConfig {
    std::string canvas_data_version{"1.0"};  ///< data-sp-canvasdataversion 기본값
    std::string text_editor_type{"CKEditor"}; ///< 텍스트 컨트롤 editorType
    int column_display_mode{2};               ///< 빈 열 마커의 displayMode
    int max_nesting_depth{1000};              ///< 스캐너 중첩 카운터 상한
    bool strict_text_holder{false};           ///< 텍스트 본문 홀더 누락을 에러로 보고
    bool verbose{false};                      ///< 진행 로그 출력

    /**
     * @brief JSON 객체에서 설정 읽기 (없는 키는 기본값 유지)
     */
    [[nodiscard]] static CanvasConfig fromJson(const QJsonObject& obj);

    /**
     * @brief JSON 파일에서 설정 읽기
     * @return 파일을 열 수 없거나 JSON 객체가 아니면 std::nullopt
     */
    [[nodiscard]] static std::optional<CanvasConfig> loadFromFile(const std::string& path);

    [[nodiscard]] QJsonObject toJson() const;
};

} // namespace pagecanvas::canvas
