#pragma once

/**
 * @file canvas_control.h
 * @brief 캔버스 컨트롤 (열 마커 / 텍스트 / 웹 파트)
 *
 * 세 가지 변형을 닫힌 std::variant로 보관하고, 렌더링·파싱·메타데이터
 * 생성은 ControlType에 대한 switch로 분기합니다.
 */

#include "canvas/canvas_config.h"
#include "canvas/client_side_text.h"
#include "canvas/client_side_web_part.h"
#include "canvas/control_data.h"
#include "core/canvas_error.h"
#include "markup/bounded_block_scanner.h"

#include <QJsonObject>

#include <optional>
#include <string>
#include <variant>

namespace pagecanvas::canvas {

/**
 * @brief 빈 열 마커
 *
 * 파싱 중에만 존재하며, 트리 병합 시 실제 CanvasColumn으로 바뀝니다.
 */
struct ColumnMarker {
    CanvasColumnFactor factor{CanvasColumnFactor::Full};
    int section_index{1};
    int zone_index{1};
};

/**
 * @brief 캔버스 컨트롤
 */
class CanvasControl {
public:
    using Payload = std::variant<ColumnMarker, ClientSideText, ClientSideWebPart>;

    /**
     * @brief 판별값으로 빈 컨트롤 생성 (ID는 새 GUID)
     * @param data_version 비어 있으면 렌더링 시 CanvasConfig 값을 사용
     */
    explicit CanvasControl(ControlType type, std::string data_version = {});

    // 생성 헬퍼
    [[nodiscard]] static CanvasControl text(const std::string& text);
    [[nodiscard]] static CanvasControl webPart(ClientSideWebPart part);

    // 기본 정보
    [[nodiscard]] ControlType type() const { return type_; }
    [[nodiscard]] const std::string& id() const { return id_; }
    void setId(const std::string& id) { id_ = id; }
    [[nodiscard]] int order() const { return order_; }
    void setOrder(int order) { order_ = order; }
    [[nodiscard]] const std::string& dataVersion() const { return data_version_; }

    /// 마지막 파싱에서 디코딩한 메타데이터
    [[nodiscard]] const ControlData& controlData() const { return control_data_; }

    // 소속 열 역참조 (메타데이터 조회 전용)
    [[nodiscard]] const std::optional<ColumnRef>& columnRef() const { return column_ref_; }
    void setColumnRef(const ColumnRef& ref) { column_ref_ = ref; }

    // 변형별 접근 (타입이 다르면 nullptr)
    [[nodiscard]] ClientSideText* asText();
    [[nodiscard]] const ClientSideText* asText() const;
    [[nodiscard]] ClientSideWebPart* asWebPart();
    [[nodiscard]] const ClientSideWebPart* asWebPart() const;
    [[nodiscard]] const ColumnMarker* asColumnMarker() const;

    /**
     * @brief 위치 메타데이터 생성 (인코딩 전)
     * @param control_index 열 안에서의 1-based 순서
     */
    [[nodiscard]] QJsonObject describeMetadata(int control_index,
                                               const ControlPlacement& placement,
                                               const CanvasConfig& config) const;

    /**
     * @brief 마크업 렌더링
     * @param index 열 안에서의 최종 1-based 순서 (order에 기록됨)
     */
    [[nodiscard]] std::string toHtml(int index, const ControlPlacement& placement,
                                     const CanvasConfig& config);

    /**
     * @brief 컨트롤 조각에서 필드 채우기
     *
     * data-sp-controldata를 디코딩한 뒤 변형별 본문을 파싱합니다.
     * @return 실패 시 false (error에 Codec/MalformedMarkup 기록)
     */
    bool fromHtml(const std::string& markup,
                  const markup::BoundedBlockScanner& scanner,
                  const CanvasConfig& config,
                  CanvasError* error = nullptr);

    /**
     * @brief 빈 열 자리표시 마크업
     */
    [[nodiscard]] static std::string renderColumnMarker(const ControlPlacement& placement,
                                                        const std::string& data_version,
                                                        const CanvasConfig& config);

    /**
     * @brief 컨트롤 조각의 판별값 읽기
     * @return controlType이 없으면 Column, 디코딩 실패 시 std::nullopt
     */
    [[nodiscard]] static std::optional<int> readControlType(const std::string& markup,
                                                            CanvasError* error = nullptr);

private:
    /**
     * @brief 컨트롤 여는 태그 (공통 속성 3개)
     */
    [[nodiscard]] static std::string openTag(const std::string& data_version,
                                             const QJsonObject& metadata);

    [[nodiscard]] static std::string newInstanceId();

    ControlType type_;
    std::string data_version_;
    std::string id_;
    int order_{1};
    ControlData control_data_;
    std::optional<ColumnRef> column_ref_;
    Payload payload_;
};

} // namespace pagecanvas::canvas
