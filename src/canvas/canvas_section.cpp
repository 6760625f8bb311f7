/**
 * @file canvas_section.cpp
 * @brief 캔버스 섹션과 열 구현
 */

#include "canvas_section.h"

#include <algorithm>
#include <utility>

namespace pagecanvas::canvas {

namespace {

/// 1-based 다음 순서 값 (비어 있으면 1)
template <typename Collection>
int nextOrder(const Collection& collection) {
    int max_order = 0;
    for (const auto& item : collection) {
        max_order = std::max(max_order, item.order());
    }
    return max_order + 1;
}

} // namespace

// ============================================================
// CanvasColumn
// ============================================================

CanvasColumn::CanvasColumn(int order, CanvasColumnFactor factor, std::string data_version)
    : order_(order), factor_(factor), data_version_(std::move(data_version)) {}

CanvasControl& CanvasColumn::addControl(CanvasControl control) {
    control.setColumnRef(ColumnRef{section_slot_, slot_});
    controls_.push_back(std::move(control));
    return controls_.back();
}

CanvasControl* CanvasColumn::getControl(size_t index) {
    return index < controls_.size() ? &controls_[index] : nullptr;
}

void CanvasColumn::attach(size_t section_slot, size_t slot) {
    section_slot_ = section_slot;
    slot_ = slot;
    for (auto& control : controls_) {
        control.setColumnRef(ColumnRef{section_slot_, slot_});
    }
}

std::string CanvasColumn::toHtml(int zone_index, const CanvasConfig& config) {
    const ControlPlacement placement{zone_index, order_, factor_};

    // 빈 열도 자리표시 마커를 남겨야 저장 후 다시 읽었을 때 사라지지 않는다
    if (controls_.empty()) {
        return CanvasControl::renderColumnMarker(
            placement, data_version_.empty() ? config.canvas_data_version : data_version_, config);
    }

    std::string html;
    for (size_t i = 0; i < controls_.size(); ++i) {
        html += controls_[i].toHtml(static_cast<int>(i + 1), placement, config);
    }
    return html;
}

// ============================================================
// CanvasSection
// ============================================================

CanvasSection::CanvasSection(int order) : order_(order) {}

CanvasColumn& CanvasSection::defaultColumn() {
    if (columns_.empty()) {
        addColumn(CanvasColumnFactor::Full);
    }
    return columns_.front();
}

CanvasColumn& CanvasSection::addColumn(CanvasColumnFactor factor) {
    return appendColumn(CanvasColumn(nextOrder(columns_), factor));
}

CanvasColumn& CanvasSection::appendColumn(CanvasColumn column) {
    columns_.push_back(std::move(column));
    columns_.back().attach(slot_, columns_.size() - 1);
    return columns_.back();
}

CanvasControl& CanvasSection::addControl(CanvasControl control) {
    return defaultColumn().addControl(std::move(control));
}

CanvasColumn* CanvasSection::findColumn(int order) {
    auto it = std::find_if(columns_.begin(), columns_.end(),
                           [order](const CanvasColumn& column) { return column.order() == order; });
    return it != columns_.end() ? &*it : nullptr;
}

void CanvasSection::attach(size_t slot) {
    slot_ = slot;
    for (size_t i = 0; i < columns_.size(); ++i) {
        columns_[i].attach(slot_, i);
    }
}

void CanvasSection::reindex() {
    for (size_t i = 0; i < columns_.size(); ++i) {
        auto& column = columns_[i];
        column.setOrder(static_cast<int>(i + 1));
        column.attach(slot_, i);

        auto& controls = column.controls();
        for (size_t k = 0; k < controls.size(); ++k) {
            controls[k].setOrder(static_cast<int>(k + 1));
        }
    }
}

void CanvasSection::sortColumns() {
    std::stable_sort(columns_.begin(), columns_.end(),
                     [](const CanvasColumn& a, const CanvasColumn& b) {
                         return a.order() < b.order();
                     });
    attach(slot_);
}

std::string CanvasSection::toHtml(const CanvasConfig& config) {
    std::string html;
    for (auto& column : columns_) {
        html += column.toHtml(order_, config);
    }
    return html;
}

} // namespace pagecanvas::canvas
