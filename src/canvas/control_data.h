#pragma once

/**
 * @file control_data.h
 * @brief 컨트롤 메타데이터 (data-sp-controldata) 구조체
 *
 * 컨트롤 판별값, 인스턴스 ID, 위치 좌표(zoneIndex/sectionIndex/controlIndex)와
 * 열 너비 비율을 담으며 Qt JSON 객체와 상호 변환합니다.
 */

#include "core/canvas_error.h"

#include <QJsonObject>
#include <QJsonValue>

#include <cstddef>
#include <optional>
#include <string>

namespace pagecanvas::canvas {

/**
 * @brief 컨트롤 판별값 (controlType)
 */
enum class ControlType : int {
    Column = 0,     ///< 빈 열 마커 (판별값 없음과 동일)
    WebPart = 3,    ///< 임베디드 컴포넌트
    Text = 4        ///< 리치 텍스트
};

/**
 * @brief 열 너비 비율 (12 = 전체 너비)
 */
enum class CanvasColumnFactor : int {
    Zero = 0,
    Two = 2,
    Four = 4,
    Six = 6,
    Eight = 8,
    Full = 12
};

/**
 * @brief 정수 → 열 비율 변환
 * @return {0,2,4,6,8,12} 밖의 값이면 std::nullopt
 */
[[nodiscard]] std::optional<CanvasColumnFactor> columnFactorFromInt(int value);

[[nodiscard]] inline int toInt(CanvasColumnFactor factor) { return static_cast<int>(factor); }

/**
 * @brief 메타데이터의 position 객체
 */
struct ControlPosition {
    int zone_index{1};                  ///< 소속 섹션 순서
    int section_index{1};               ///< 소속 열 순서
    std::optional<int> section_factor;  ///< 소속 열 너비 비율
    std::optional<int> control_index;   ///< 열 안에서의 컨트롤 순서 (열 마커에는 없음)

    [[nodiscard]] QJsonObject toJson() const;
    [[nodiscard]] static std::optional<ControlPosition> fromJson(const QJsonValue& value);
};

/**
 * @brief data-sp-controldata 디코딩 결과
 */
struct ControlData {
    std::optional<int> control_type;    ///< 없으면 열 마커
    std::string id;                     ///< 컨트롤 인스턴스 ID
    std::string editor_type;            ///< 텍스트 컨트롤 에디터
    std::optional<int> display_mode;    ///< 열 마커 표시 모드
    std::string web_part_id;            ///< 웹 파트 컴포넌트 ID
    ControlPosition position;

    [[nodiscard]] QJsonObject toJson() const;

    /**
     * @brief 디코딩된 JSON 값에서 메타데이터 구성
     * @param error position이 없거나 형식이 틀리면 Codec 에러 기록
     */
    [[nodiscard]] static std::optional<ControlData> fromJson(const QJsonValue& value,
                                                             CanvasError* error = nullptr);
};

/**
 * @brief 렌더링 시점의 위치 좌표
 *
 * 렌더링은 트리를 위에서 아래로 내려가며 수행되므로, 컨트롤은
 * 소속 열/섹션을 직접 참조하지 않고 이 값을 전달받습니다.
 */
struct ControlPlacement {
    int zone_index{1};
    int section_index{1};
    CanvasColumnFactor factor{CanvasColumnFactor::Full};
};

/**
 * @brief 컨트롤 → 소속 열 역참조 (페이지 아레나 내 위치)
 */
struct ColumnRef {
    size_t section{0};  ///< 페이지 섹션 목록 내 위치
    size_t column{0};   ///< 섹션 열 목록 내 위치

    bool operator==(const ColumnRef& other) const {
        return section == other.section && column == other.column;
    }
};

} // namespace pagecanvas::canvas
