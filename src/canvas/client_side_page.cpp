/**
 * @file client_side_page.cpp
 * @brief 클라이언트 사이드 페이지 문서 구현
 */

#include "client_side_page.h"

#include "canvas/tree_reconciler.h"
#include "markup/bounded_block_scanner.h"

#include <algorithm>
#include <iostream>
#include <utility>

namespace pagecanvas::canvas {

namespace {

constexpr const char* kCanvasControlAttribute = "data-sp-canvascontrol";

PromotedState promotedStateFromInt(int value) {
    switch (value) {
        case 1:  return PromotedState::PromoteOnPublish;
        case 2:  return PromotedState::Promoted;
        default: return PromotedState::NotPromoted;
    }
}

} // namespace

std::string toString(PageLayoutType layout) {
    switch (layout) {
        case PageLayoutType::Article: return "Article";
        case PageLayoutType::Home:    return "Home";
    }
    return "Article";
}

std::optional<PageLayoutType> pageLayoutFromString(const std::string& value) {
    if (value == "Article") return PageLayoutType::Article;
    if (value == "Home") return PageLayoutType::Home;
    return std::nullopt;
}

// ============================================================
// 생성
// ============================================================

ClientSidePage::ClientSidePage(CanvasConfig config)
    : config_(std::move(config)) {}

ClientSidePage::ClientSidePage(std::shared_ptr<store::PageStore> store,
                               std::string page_ref,
                               CanvasConfig config)
    : config_(std::move(config))
    , store_(std::move(store))
    , page_ref_(std::move(page_ref)) {}

std::optional<ClientSidePage> ClientSidePage::create(std::shared_ptr<store::PageStore> store,
                                                     const std::string& page_name,
                                                     const std::string& title,
                                                     PageLayoutType layout,
                                                     CanvasConfig config,
                                                     CanvasError* error) {
    if (!store) {
        if (error) *error = CanvasError::make(CanvasErrorType::Store, "저장소가 지정되지 않음");
        return std::nullopt;
    }

    if (store->pageExists(page_name)) {
        if (error) {
            *error = CanvasError::make(CanvasErrorType::Store,
                                       "A file with the name '" + page_name + "' already exists");
        }
        return std::nullopt;
    }

    ClientSidePage page(store, page_name, std::move(config));
    page.title_ = title;
    page.layout_type_ = layout;

    store::PageRecord record;
    record.canvas_content = page.toHtml();
    record.title = title;
    record.layout_type = toString(layout);
    record.promoted_state = static_cast<int>(PromotedState::NotPromoted);

    auto result = store->createPage(page_name, record);
    if (!result.success) {
        if (error) *error = CanvasError::make(CanvasErrorType::Store, result.error_message);
        return std::nullopt;
    }

    if (page.config_.verbose) {
        std::cout << "[ClientSidePage] 페이지 생성: " << page_name
                  << " (" << record.layout_type << ")" << std::endl;
    }
    return page;
}

std::optional<ClientSidePage> ClientSidePage::fromStore(std::shared_ptr<store::PageStore> store,
                                                        const std::string& page_name,
                                                        CanvasConfig config,
                                                        CanvasError* error) {
    ClientSidePage page(std::move(store), page_name, std::move(config));
    if (!page.load(error)) {
        return std::nullopt;
    }
    return page;
}

bool ClientSidePage::requireStore(CanvasError* error) const {
    if (store_) return true;
    if (error) {
        *error = CanvasError::make(CanvasErrorType::Store, "페이지가 저장소에 연결되어 있지 않음");
    }
    return false;
}

// ============================================================
// 로드 / 저장
// ============================================================

bool ClientSidePage::load(CanvasError* error) {
    if (!requireStore(error)) return false;

    auto result = store_->fetchPageContent(page_ref_);
    if (!result.success) {
        if (error) *error = CanvasError::make(CanvasErrorType::Store, result.error_message);
        return false;
    }

    const store::PageRecord& record = result.record;
    comments_disabled_ = record.comments_disabled;
    title_ = record.title;
    promoted_state_ = promotedStateFromInt(record.promoted_state);

    auto layout = pageLayoutFromString(record.layout_type);
    if (!layout) {
        std::cerr << "[ClientSidePage] 알 수 없는 레이아웃 '" << record.layout_type
                  << "', Article로 처리" << std::endl;
    }
    layout_type_ = layout.value_or(PageLayoutType::Article);

    return fromHtml(record.canvas_content, error);
}

bool ClientSidePage::save(CanvasError* error) {
    if (!requireStore(error)) return false;

    const std::string html = toHtml();
    auto result = store_->writePageContent(page_ref_, html);
    if (!result.success) {
        if (error) *error = CanvasError::make(CanvasErrorType::Store, result.error_message);
        return false;
    }

    if (config_.verbose) {
        std::cout << "[ClientSidePage] 저장 완료: " << page_ref_
                  << " (" << html.size() << " bytes)" << std::endl;
    }
    return true;
}

// ============================================================
// 직렬화
// ============================================================

bool ClientSidePage::fromHtml(const std::string& html, CanvasError* error) {
    sections_.clear();
    errors_.clear();

    markup::BoundedBlockScanner scanner("div", config_.max_nesting_depth);
    markup::ScanResult scanned = scanner.scan(html, scanner.makeBoundary(kCanvasControlAttribute));
    if (!scanned.success) {
        std::cerr << "[ClientSidePage] 마크업 파싱 실패: " << scanned.error.message << std::endl;
        errors_.push_back(scanned.error);
        if (error) *error = scanned.error;
        return false;
    }

    TreeReconciler reconciler(sections_, config_);
    int discovery = 0;

    auto skip = [this](const CanvasError& control_error) {
        std::cerr << "[ClientSidePage] 컨트롤 건너뜀 (" << control_error.typeString() << "): "
                  << control_error.message << std::endl;
        errors_.push_back(control_error);
    };

    for (const auto& block : scanned.blocks) {
        CanvasError control_error;
        auto type = CanvasControl::readControlType(block, &control_error);
        if (!type) {
            skip(control_error);
            continue;
        }

        switch (*type) {
            case static_cast<int>(ControlType::Column): {
                CanvasControl marker(ControlType::Column);
                if (!marker.fromHtml(block, scanner, config_, &control_error)) {
                    skip(control_error);
                    break;
                }
                reconciler.mergeColumn(marker);
                break;
            }

            case static_cast<int>(ControlType::WebPart):
            case static_cast<int>(ControlType::Text): {
                CanvasControl control(static_cast<ControlType>(*type));
                control.setOrder(++discovery);
                if (!control.fromHtml(block, scanner, config_, &control_error)) {
                    skip(control_error);
                    break;
                }
                reconciler.mergeControl(std::move(control));
                break;
            }

            default:
                std::cerr << "[ClientSidePage] 알 수 없는 controlType " << *type
                          << ", 건너뜀" << std::endl;
                break;
        }
    }

    reconciler.finalize();

    if (config_.verbose) {
        std::cout << "[ClientSidePage] 파싱 완료: 조각 " << scanned.blocks.size()
                  << "개, 섹션 " << sections_.size() << "개, 실패 " << errors_.size()
                  << "개" << std::endl;
    }
    return true;
}

std::string ClientSidePage::toHtml() {
    for (size_t i = 0; i < sections_.size(); ++i) {
        sections_[i].setOrder(static_cast<int>(i + 1));
        sections_[i].attach(i);
        sections_[i].reindex();
    }

    std::string html = "<div>";
    for (auto& section : sections_) {
        html += section.toHtml(config_);
    }
    html += "</div>";
    return html;
}

// ============================================================
// 트리 조작 / 조회
// ============================================================

CanvasSection& ClientSidePage::addSection() {
    int max_order = 0;
    for (const auto& section : sections_) {
        max_order = std::max(max_order, section.order());
    }

    sections_.emplace_back(max_order + 1);
    sections_.back().attach(sections_.size() - 1);
    return sections_.back();
}

CanvasControl* ClientSidePage::findControl(const ControlPredicate& predicate) {
    for (auto& section : sections_) {
        for (auto& column : section.columns()) {
            for (auto& control : column.controls()) {
                if (predicate(control)) return &control;
            }
        }
    }
    return nullptr;
}

const CanvasControl* ClientSidePage::findControl(const ControlPredicate& predicate) const {
    for (const auto& section : sections_) {
        for (const auto& column : section.columns()) {
            for (const auto& control : column.controls()) {
                if (predicate(control)) return &control;
            }
        }
    }
    return nullptr;
}

CanvasControl* ClientSidePage::findControlById(const std::string& id) {
    return findControl([&id](const CanvasControl& control) { return control.id() == id; });
}

const CanvasControl* ClientSidePage::findControlById(const std::string& id) const {
    return findControl([&id](const CanvasControl& control) { return control.id() == id; });
}

const CanvasColumn* ClientSidePage::columnOf(const CanvasControl& control) const {
    const auto& ref = control.columnRef();
    if (!ref || ref->section >= sections_.size()) return nullptr;

    const auto& columns = sections_[ref->section].columns();
    return ref->column < columns.size() ? &columns[ref->column] : nullptr;
}

// ============================================================
// 댓글
// ============================================================

bool ClientSidePage::setComments(bool disabled, CanvasError* error) {
    if (!requireStore(error)) return false;

    auto result = store_->setCommentsDisabled(page_ref_, disabled);
    if (!result.success) {
        if (error) *error = CanvasError::make(CanvasErrorType::Store, result.error_message);
        return false;
    }

    comments_disabled_ = disabled;
    return true;
}

bool ClientSidePage::enableComments(CanvasError* error) {
    return setComments(false, error);
}

bool ClientSidePage::disableComments(CanvasError* error) {
    return setComments(true, error);
}

} // namespace pagecanvas::canvas
