#pragma once

/**
 * @file client_side_page.h
 * @brief 클라이언트 사이드 페이지 문서
 *
 * 저장소의 캔버스 마크업을 섹션 → 열 → 컨트롤 트리로 읽어 들이고,
 * 트리를 다시 호스트가 받아들이는 마크업으로 렌더링합니다.
 * 댓글 허용 여부, 레이아웃, 홍보 상태 같은 페이지 스칼라 속성도 함께 보관합니다.
 *
 * 사용 예:
 *   auto page = ClientSidePage::fromStore(store, "Home.aspx", config, &error);
 *   page->addSection().addControl(CanvasControl::text("Hello"));
 *   page->save(&error);
 */

#include "canvas/canvas_config.h"
#include "canvas/canvas_control.h"
#include "canvas/canvas_section.h"
#include "core/canvas_error.h"
#include "store/page_store.h"

#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pagecanvas::canvas {

/**
 * @brief 페이지 레이아웃
 */
enum class PageLayoutType {
    Article,
    Home
};

[[nodiscard]] std::string toString(PageLayoutType layout);
[[nodiscard]] std::optional<PageLayoutType> pageLayoutFromString(const std::string& value);

/**
 * @brief 페이지 홍보(뉴스) 상태
 */
enum class PromotedState : int {
    NotPromoted = 0,
    PromoteOnPublish = 1,
    Promoted = 2
};

/**
 * @brief 페이지 문서
 */
class ClientSidePage {
public:
    using ControlPredicate = std::function<bool(const CanvasControl&)>;

    /**
     * @brief 저장소 없이 메모리에서만 쓰는 페이지
     */
    explicit ClientSidePage(CanvasConfig config = {});

    /**
     * @brief 저장소 항목에 묶인 페이지 (load 전에는 빈 트리)
     */
    ClientSidePage(std::shared_ptr<store::PageStore> store,
                   std::string page_ref,
                   CanvasConfig config = {});

    // ============================================================
    // 생성 / 로드
    // ============================================================

    /**
     * @brief 새 페이지 항목 생성
     *
     * 같은 이름의 페이지가 있으면 Store 에러로 실패합니다.
     */
    [[nodiscard]] static std::optional<ClientSidePage> create(
        std::shared_ptr<store::PageStore> store,
        const std::string& page_name,
        const std::string& title,
        PageLayoutType layout = PageLayoutType::Article,
        CanvasConfig config = {},
        CanvasError* error = nullptr);

    /**
     * @brief 저장소에서 페이지를 읽어 트리 구성
     */
    [[nodiscard]] static std::optional<ClientSidePage> fromStore(
        std::shared_ptr<store::PageStore> store,
        const std::string& page_name,
        CanvasConfig config = {},
        CanvasError* error = nullptr);

    /**
     * @brief 저장소에서 다시 읽기
     *
     * 저장소 실패 시 트리와 속성은 그대로 두고 Store 에러를 돌려줍니다.
     */
    bool load(CanvasError* error = nullptr);

    /**
     * @brief 렌더링 결과를 저장소에 기록 (캔버스 속성 하나만 갱신)
     */
    bool save(CanvasError* error = nullptr);

    // ============================================================
    // 직렬화
    // ============================================================

    /**
     * @brief 마크업 → 트리
     *
     * 기존 트리를 비운 뒤 다시 구성합니다. 스캐너 실패(MalformedMarkup)는
     * 파싱 전체를 중단하고, 개별 컨트롤 실패는 errors()에 기록하고 건너뜁니다.
     * @return 스캐너 실패 시 false
     */
    bool fromHtml(const std::string& html, CanvasError* error = nullptr);

    /**
     * @brief 트리 → 마크업 (렌더링 전 모든 순서를 1부터 다시 매김)
     */
    std::string toHtml();

    // ============================================================
    // 트리 조작 / 조회
    // ============================================================

    /**
     * @brief 섹션 추가 (순서 = 기존 최대값 + 1)
     */
    CanvasSection& addSection();

    [[nodiscard]] std::deque<CanvasSection>& sections() { return sections_; }
    [[nodiscard]] const std::deque<CanvasSection>& sections() const { return sections_; }

    /**
     * @brief 깊이 우선 탐색으로 첫 번째 일치 컨트롤
     * @return 없으면 nullptr
     */
    [[nodiscard]] CanvasControl* findControl(const ControlPredicate& predicate);
    [[nodiscard]] const CanvasControl* findControl(const ControlPredicate& predicate) const;

    [[nodiscard]] CanvasControl* findControlById(const std::string& id);
    [[nodiscard]] const CanvasControl* findControlById(const std::string& id) const;

    /**
     * @brief 컨트롤의 소속 열 (역참조 해석)
     */
    [[nodiscard]] const CanvasColumn* columnOf(const CanvasControl& control) const;

    // ============================================================
    // 댓글
    // ============================================================

    bool enableComments(CanvasError* error = nullptr);
    bool disableComments(CanvasError* error = nullptr);

    // ============================================================
    // 속성
    // ============================================================

    [[nodiscard]] bool commentsDisabled() const { return comments_disabled_; }
    [[nodiscard]] PageLayoutType layoutType() const { return layout_type_; }
    void setLayoutType(PageLayoutType layout) { layout_type_ = layout; }
    [[nodiscard]] PromotedState promotedState() const { return promoted_state_; }
    [[nodiscard]] const std::string& title() const { return title_; }
    [[nodiscard]] const std::string& pageRef() const { return page_ref_; }

    /// 마지막 fromHtml에서 건너뛴 컨트롤 에러
    [[nodiscard]] const std::vector<CanvasError>& errors() const { return errors_; }
    [[nodiscard]] const CanvasConfig& config() const { return config_; }

private:
    bool setComments(bool disabled, CanvasError* error);
    bool requireStore(CanvasError* error) const;

    CanvasConfig config_;
    std::shared_ptr<store::PageStore> store_;
    std::string page_ref_;

    std::deque<CanvasSection> sections_;
    std::vector<CanvasError> errors_;

    bool comments_disabled_{false};
    PageLayoutType layout_type_{PageLayoutType::Article};
    PromotedState promoted_state_{PromotedState::NotPromoted};
    std::string title_;
};

} // namespace pagecanvas::canvas
