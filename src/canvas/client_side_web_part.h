#pragma once

/**
 * @file client_side_web_part.h
 * @brief 임베디드 컴포넌트(웹 파트) 컨트롤 (controlType 3)
 *
 * 컴포넌트 ID, 제목, 설명, 임의의 속성 묶음과 서버에서 처리된
 * 보조 콘텐츠(검색용 텍스트, 이미지 소스, 링크)를 보관합니다.
 */

#include "core/canvas_error.h"
#include "markup/bounded_block_scanner.h"

#include <QJsonObject>
#include <QJsonValue>

#include <optional>
#include <string>
#include <utility>

namespace pagecanvas::canvas {

/**
 * @brief 서버 처리 콘텐츠 (serverProcessedContent)
 *
 * 각 필드는 `{Name, Value}` 객체 배열 또는 `{이름: 값}` 객체입니다.
 */
struct ServerProcessedContent {
    QJsonValue searchable_plain_texts;  ///< 검색용 일반 텍스트
    QJsonValue image_sources;           ///< 이미지 소스
    QJsonValue links;                   ///< 링크 대상

    [[nodiscard]] static ServerProcessedContent fromJson(const QJsonObject& obj);
    [[nodiscard]] QJsonObject toJson() const;

    /**
     * @brief html-properties 본문 합성
     *
     * 검색 텍스트 → `<div data-sp-prop-name="N" data-sp-searchableplaintext="true">V</div>`
     * 이미지     → `<img data-sp-prop-name="N" src="V" />`
     * 링크       → `<a data-sp-prop-name="N" href="V"></a>`
     */
    [[nodiscard]] std::string renderHtml() const;
};

/**
 * @brief 플랫폼 컴포넌트 정의 (GetClientSideWebParts 결과 항목)
 */
struct ComponentDefinition {
    int component_type{1};
    std::string id;         ///< "{guid}" 형태 가능
    std::string manifest;   ///< JSON 문자열
    int manifest_type{1};
    std::string name;
    int status{0};

    [[nodiscard]] static ComponentDefinition fromJson(const QJsonObject& obj);
};

/**
 * @brief 웹 파트 컨트롤 본문
 */
class ClientSideWebPart {
public:
    explicit ClientSideWebPart(std::string title = "",
                               std::string description = "",
                               QJsonObject properties = {},
                               std::string web_part_id = "");

    /**
     * @brief 컴포넌트 정의에서 웹 파트 생성
     *
     * 매니페스트의 preconfiguredEntries[0]에서 기본 제목/설명/속성을 읽습니다.
     * @param error 매니페스트가 JSON이 아니거나 항목이 없으면 Codec 에러
     */
    [[nodiscard]] static std::optional<ClientSideWebPart> fromComponentDefinition(
        const ComponentDefinition& definition, CanvasError* error = nullptr);

    /**
     * @brief 컴포넌트 정의를 현재 객체에 반영
     */
    bool importDefinition(const ComponentDefinition& definition, CanvasError* error = nullptr);

    // 기본 속성
    [[nodiscard]] const std::string& title() const { return title_; }
    void setTitle(const std::string& title) { title_ = title; }
    [[nodiscard]] const std::string& description() const { return description_; }
    void setDescription(const std::string& description) { description_ = description; }
    [[nodiscard]] const std::string& webPartId() const { return web_part_id_; }
    void setWebPartId(const std::string& id) { web_part_id_ = id; }

    // 속성 묶음 (스키마 검증 없이 그대로 전달)
    [[nodiscard]] const QJsonObject& properties() const { return properties_; }
    ClientSideWebPart& setProperties(const QJsonObject& properties);

    [[nodiscard]] const std::optional<ServerProcessedContent>& serverProcessedContent() const {
        return server_processed_content_;
    }
    void setServerProcessedContent(std::optional<ServerProcessedContent> content) {
        server_processed_content_ = std::move(content);
    }

    /// 마지막 파싱에서 보존한 html-properties 원본
    [[nodiscard]] const std::string& htmlProperties() const { return html_properties_; }

    /**
     * @brief data-sp-webpartdata 값 (인코딩 전)
     */
    [[nodiscard]] QJsonObject webPartData(const std::string& instance_id,
                                          const std::string& data_version) const;

    /**
     * @brief 웹 파트 래퍼 이하 마크업 렌더링
     */
    [[nodiscard]] std::string renderBody(const std::string& instance_id,
                                         const std::string& data_version) const;

    /**
     * @brief 컨트롤 조각에서 웹 파트 데이터와 html-properties 본문 추출
     */
    bool parseBody(const std::string& markup,
                   const markup::BoundedBlockScanner& scanner,
                   CanvasError* error = nullptr);

private:
    /**
     * @brief 매니페스트 속성에서 실제 속성 묶음과 서버 처리 콘텐츠 추출
     */
    QJsonObject parseJsonProperties(const QJsonObject& props);

    std::string title_;
    std::string description_;
    QJsonObject properties_;
    std::string web_part_id_;
    std::string html_properties_;
    std::optional<ServerProcessedContent> server_processed_content_;
};

} // namespace pagecanvas::canvas
