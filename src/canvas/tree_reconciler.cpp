/**
 * @file tree_reconciler.cpp
 * @brief 트리 병합기 구현
 */

#include "tree_reconciler.h"

#include <algorithm>
#include <iostream>
#include <utility>

namespace pagecanvas::canvas {

TreeReconciler::TreeReconciler(std::deque<CanvasSection>& sections, const CanvasConfig& config)
    : sections_(sections), config_(config) {}

// ============================================================
// 병합
// ============================================================

CanvasSection& TreeReconciler::sectionFor(int zone_index) {
    auto it = std::find_if(sections_.begin(), sections_.end(),
                           [zone_index](const CanvasSection& s) { return s.order() == zone_index; });
    if (it != sections_.end()) {
        return *it;
    }

    // 처음 참조된 순서대로 생성
    sections_.emplace_back(zone_index);
    sections_.back().attach(sections_.size() - 1);

    if (config_.verbose) {
        std::cout << "[TreeReconciler] 섹션 생성: zone " << zone_index << std::endl;
    }
    return sections_.back();
}

CanvasControl& TreeReconciler::mergeControl(CanvasControl control) {
    const ControlPosition& position = control.controlData().position;
    CanvasSection& section = sectionFor(position.zone_index);

    CanvasColumn* column = section.findColumn(position.section_index);
    if (!column) {
        const int raw_factor = position.section_factor.value_or(12);
        auto factor = columnFactorFromInt(raw_factor);
        if (!factor) {
            std::cerr << "[TreeReconciler] 잘못된 열 비율 " << raw_factor
                      << ", 12로 대체" << std::endl;
        }
        column = &section.appendColumn(CanvasColumn(position.section_index,
                                                    factor.value_or(CanvasColumnFactor::Full),
                                                    control.dataVersion()));
    }

    ++merged_count_;
    return column->addControl(std::move(control));
}

CanvasColumn& TreeReconciler::mergeColumn(const CanvasControl& marker) {
    const ColumnMarker* data = marker.asColumnMarker();
    const ColumnMarker fallback{};
    if (!data) {
        data = &fallback;
    }

    CanvasSection& section = sectionFor(data->zone_index);
    ++merged_count_;
    return section.appendColumn(CanvasColumn(data->section_index, data->factor, marker.dataVersion()));
}

// ============================================================
// 확정
// ============================================================

void TreeReconciler::finalize() {
    std::stable_sort(sections_.begin(), sections_.end(),
                     [](const CanvasSection& a, const CanvasSection& b) {
                         return a.order() < b.order();
                     });

    for (size_t i = 0; i < sections_.size(); ++i) {
        sections_[i].attach(i);
        sections_[i].sortColumns();
    }

    if (config_.verbose) {
        std::cout << "[TreeReconciler] 병합 완료: 섹션 " << sections_.size()
                  << "개, 항목 " << merged_count_ << "개" << std::endl;
    }
}

} // namespace pagecanvas::canvas
