#pragma once

/**
 * @file tree_reconciler.h
 * @brief 평면 컨트롤 목록 → 섹션/열 트리 병합
 *
 * 마크업에서 문서 순서로 발견된 컨트롤을 위치 메타데이터
 * (zoneIndex, sectionIndex)에 따라 섹션과 열에 배치합니다.
 */

#include "canvas/canvas_config.h"
#include "canvas/canvas_control.h"
#include "canvas/canvas_section.h"

#include <deque>

namespace pagecanvas::canvas {

/**
 * @brief 트리 병합기
 *
 * 페이지가 소유한 섹션 아레나를 빌려 쓰며, 병합이 끝나면 finalize()로
 * 구조 순서를 확정합니다.
 */
class TreeReconciler {
public:
    TreeReconciler(std::deque<CanvasSection>& sections, const CanvasConfig& config);

    /**
     * @brief 텍스트/웹 파트 컨트롤 병합
     *
     * zoneIndex에 해당하는 섹션과 sectionIndex에 해당하는 열을 찾거나
     * 만들고 컨트롤을 끝에 추가합니다.
     * @return 트리에 들어간 컨트롤
     */
    CanvasControl& mergeControl(CanvasControl control);

    /**
     * @brief 빈 열 마커 병합 (마커의 비율로 새 열 추가)
     */
    CanvasColumn& mergeColumn(const CanvasControl& marker);

    /**
     * @brief 섹션과 열을 위치 값 기준으로 안정 정렬하고 역참조 갱신
     */
    void finalize();

    [[nodiscard]] size_t mergedCount() const { return merged_count_; }

private:
    CanvasSection& sectionFor(int zone_index);

    std::deque<CanvasSection>& sections_;
    const CanvasConfig& config_;
    size_t merged_count_{0};
};

} // namespace pagecanvas::canvas
