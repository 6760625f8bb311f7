#pragma once

/**
 * @file canvas_section.h
 * @brief 캔버스 섹션과 열
 *
 * 페이지 → 섹션 → 열 → 컨트롤 트리의 중간 계층입니다.
 * 각 계층은 자식을 std::deque로 소유하므로 추가 후에도 기존 참조가 유지됩니다.
 * 역참조(열 → 섹션, 컨트롤 → 열)는 포인터가 아닌 아레나 내 위치로 기록합니다.
 */

#include "canvas/canvas_config.h"
#include "canvas/canvas_control.h"
#include "canvas/control_data.h"

#include <cstddef>
#include <deque>
#include <string>

namespace pagecanvas::canvas {

/**
 * @brief 캔버스 열
 */
class CanvasColumn {
public:
    /**
     * @param data_version 비어 있으면 렌더링 시 CanvasConfig 값을 사용
     */
    explicit CanvasColumn(int order = 1,
                          CanvasColumnFactor factor = CanvasColumnFactor::Full,
                          std::string data_version = {});

    [[nodiscard]] int order() const { return order_; }
    void setOrder(int order) { order_ = order; }
    [[nodiscard]] CanvasColumnFactor factor() const { return factor_; }
    void setFactor(CanvasColumnFactor factor) { factor_ = factor; }
    [[nodiscard]] const std::string& dataVersion() const { return data_version_; }

    [[nodiscard]] std::deque<CanvasControl>& controls() { return controls_; }
    [[nodiscard]] const std::deque<CanvasControl>& controls() const { return controls_; }

    /**
     * @brief 컨트롤 추가 (열 역참조 설정)
     * @return 추가된 컨트롤 참조
     */
    CanvasControl& addControl(CanvasControl control);

    /**
     * @brief 위치로 컨트롤 조회
     */
    [[nodiscard]] CanvasControl* getControl(size_t index);

    /// 소속 섹션 위치 (페이지 섹션 목록 기준)
    [[nodiscard]] size_t sectionSlot() const { return section_slot_; }
    /// 섹션 안에서의 자기 위치
    [[nodiscard]] size_t slot() const { return slot_; }

    /**
     * @brief 역참조 갱신 (자식 컨트롤 포함)
     */
    void attach(size_t section_slot, size_t slot);

    /**
     * @brief 열 렌더링 (컨트롤이 없으면 빈 열 마커)
     * @param zone_index 소속 섹션 순서
     */
    [[nodiscard]] std::string toHtml(int zone_index, const CanvasConfig& config);

private:
    int order_;
    CanvasColumnFactor factor_;
    std::string data_version_;
    std::deque<CanvasControl> controls_;
    size_t section_slot_{0};
    size_t slot_{0};
};

/**
 * @brief 캔버스 섹션
 */
class CanvasSection {
public:
    explicit CanvasSection(int order = 1);

    [[nodiscard]] int order() const { return order_; }
    void setOrder(int order) { order_ = order; }

    [[nodiscard]] std::deque<CanvasColumn>& columns() { return columns_; }
    [[nodiscard]] const std::deque<CanvasColumn>& columns() const { return columns_; }

    /**
     * @brief 기본 열 (첫 번째 열, 없으면 전체 너비 열 생성)
     */
    CanvasColumn& defaultColumn();

    /**
     * @brief 새 열 추가 (순서 = 기존 최대값 + 1)
     */
    CanvasColumn& addColumn(CanvasColumnFactor factor = CanvasColumnFactor::Full);

    /**
     * @brief 이미 만들어진 열을 그대로 끝에 추가 (트리 병합용)
     */
    CanvasColumn& appendColumn(CanvasColumn column);

    /**
     * @brief 기본 열에 컨트롤 추가
     */
    CanvasControl& addControl(CanvasControl control);

    /**
     * @brief 순서 값으로 열 찾기
     */
    [[nodiscard]] CanvasColumn* findColumn(int order);

    [[nodiscard]] size_t slot() const { return slot_; }

    /**
     * @brief 역참조 갱신 (열, 컨트롤까지)
     */
    void attach(size_t slot);

    /**
     * @brief 열 순서를 1부터 연속으로 다시 매기고 컨트롤까지 내려감
     */
    void reindex();

    /**
     * @brief 열을 순서 값 기준으로 안정 정렬
     */
    void sortColumns();

    [[nodiscard]] std::string toHtml(const CanvasConfig& config);

private:
    int order_;
    std::deque<CanvasColumn> columns_;
    size_t slot_{0};
};

} // namespace pagecanvas::canvas
