#pragma once

/**
 * @file page_store.h
 * @brief 페이지 저장소 인터페이스
 *
 * 페이지 항목(캔버스 마크업과 스칼라 속성)을 읽고 쓰는 외부 협력자입니다.
 * 전송 방식은 구현체가 결정하며, 모든 호출은 동기 요청/응답 1회입니다.
 */

#include <QJsonObject>

#include <string>

namespace pagecanvas::store {

// 호스트 플랫폼 기본값
inline constexpr const char* kDefaultBannerImageUrl = "/_layouts/15/images/sitepagethumbnail.png";
inline constexpr const char* kClientSideApplicationId = "b6917cb1-93a0-4b97-a84d-7cf49975d4ec";
inline constexpr const char* kPageContentTypeId = "0x0101009D1CB255DA76424F860D91F20E6C4118";

/**
 * @brief 저장된 페이지 항목
 */
struct PageRecord {
    std::string canvas_content;                 ///< CanvasContent1
    bool comments_disabled{false};
    std::string title;
    std::string layout_type{"Article"};         ///< "Article" | "Home"
    int promoted_state{0};                      ///< 0 NotPromoted, 1 PromoteOnPublish, 2 Promoted
    std::string banner_image_url{kDefaultBannerImageUrl};
    std::string client_side_application_id{kClientSideApplicationId};
    std::string content_type_id{kPageContentTypeId};

    [[nodiscard]] QJsonObject toJson() const;
    [[nodiscard]] static PageRecord fromJson(const QJsonObject& obj);
};

/**
 * @brief 페이지 조회 결과
 */
struct FetchResult {
    bool success{false};
    PageRecord record;
    std::string error_message;
};

/**
 * @brief 갱신/생성 결과
 */
struct UpdateResult {
    bool success{false};
    std::string error_message;
};

/**
 * @brief 페이지 저장소 (추상)
 */
class PageStore {
public:
    virtual ~PageStore() = default;

    /**
     * @brief 페이지 항목 조회 (캔버스 마크업 + 스칼라 속성)
     */
    virtual FetchResult fetchPageContent(const std::string& page_ref) = 0;

    /**
     * @brief 캔버스 마크업 단일 속성 갱신
     */
    virtual UpdateResult writePageContent(const std::string& page_ref, const std::string& markup) = 0;

    /**
     * @brief 댓글 허용 여부 갱신
     */
    virtual UpdateResult setCommentsDisabled(const std::string& page_ref, bool disabled) = 0;

    /**
     * @brief 새 페이지 항목 생성 (이미 있으면 실패)
     */
    virtual UpdateResult createPage(const std::string& page_ref, const PageRecord& record) = 0;

    [[nodiscard]] virtual bool pageExists(const std::string& page_ref) = 0;
};

} // namespace pagecanvas::store
