#pragma once

/**
 * @file bounded_block_scanner.h
 * @brief 중첩 블록 스캐너
 *
 * 경계 패턴으로 시작하는 마크업 조각을 찾아, 같은 종류의 태그가
 * 임의 깊이로 중첩되어 있어도 짝이 맞는 닫힘 태그까지 잘라냅니다.
 * 페이지 의미는 전혀 모르며, 조각 해석은 호출자의 collector가 담당합니다.
 */

#include "core/canvas_error.h"

#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace pagecanvas::markup {

/**
 * @brief 조각 시작 패턴
 *
 * `<tag ...>` 여는 태그 중 태그 텍스트에 attribute가 포함된 것과 일치합니다.
 * (정규식 `<tag\b[^>]*attribute[^>]*?>` 과 같은 의미, 대소문자 무시)
 */
struct BoundaryPattern {
    std::string tag{"div"};
    std::string attribute;
};

/**
 * @brief 태그 위치 정보
 */
struct TagMatch {
    size_t position{std::string::npos};  ///< '<' 위치
    size_t length{0};                    ///< '<'부터 '>'까지 길이

    [[nodiscard]] bool found() const { return position != std::string::npos; }
    [[nodiscard]] size_t end() const { return position + length; }
};

/**
 * @brief 스캔 결과
 */
struct ScanResult {
    bool success{true};              ///< 스캔 성공 여부
    std::vector<std::string> blocks; ///< 문서 순서대로 찾은 조각
    CanvasError error;               ///< 실패 시 에러 (MalformedMarkup)
};

/**
 * @brief 중첩 블록 스캐너
 *
 * 알고리즘:
 *   1. 탭/CR/LF 제거
 *   2. 경계 패턴의 다음 일치 위치 탐색
 *   3. 카운터 1에서 시작하여 같은 태그의 열림 +1, 닫힘 -1
 *   4. 카운터가 0이 되는 닫힘 태그까지를 하나의 조각으로 보고
 *   5. 그 닫힘 태그 뒤에서 다음 경계를 다시 탐색
 */
class BoundedBlockScanner {
public:
    static constexpr int kDefaultMaxDepth = 1000;

    /**
     * @param tag_name 중첩을 셀 일반 태그 이름 (기본 div)
     * @param max_depth 중첩 카운터 상한
     */
    explicit BoundedBlockScanner(std::string tag_name = "div",
                                 int max_depth = kDefaultMaxDepth);

    /**
     * @brief 모든 경계 조각 스캔
     * @param html 검색할 마크업
     * @param boundary 조각 시작 패턴
     */
    [[nodiscard]] ScanResult scan(const std::string& html, const BoundaryPattern& boundary) const;

    /**
     * @brief 조각마다 collector를 적용하여 결과 수집
     *
     * 스캔이 실패하면 빈 목록을 반환하고 error에 원인을 기록합니다.
     */
    template <typename Collector>
    [[nodiscard]] auto collect(const std::string& html,
                               const BoundaryPattern& boundary,
                               Collector&& collector,
                               CanvasError* error = nullptr) const
        -> std::vector<std::decay_t<std::invoke_result_t<Collector&, const std::string&>>> {
        std::vector<std::decay_t<std::invoke_result_t<Collector&, const std::string&>>> out;

        auto result = scan(html, boundary);
        if (!result.success) {
            if (error) *error = result.error;
            return out;
        }

        out.reserve(result.blocks.size());
        for (const auto& block : result.blocks) {
            out.push_back(collector(block));
        }
        return out;
    }

    /**
     * @brief 첫 번째 조각만 추출 (단일 요소 추출용)
     * @return 조각이 없거나 스캔 실패 시 std::nullopt
     */
    [[nodiscard]] std::optional<std::string> findFirst(const std::string& html,
                                                       const BoundaryPattern& boundary,
                                                       CanvasError* error = nullptr) const;

    /**
     * @brief 이 스캐너의 태그 + 속성 이름으로 경계 패턴 생성
     */
    [[nodiscard]] BoundaryPattern makeBoundary(const std::string& attribute) const {
        return BoundaryPattern{tag_name_, attribute};
    }

    /**
     * @brief 조각의 여는 태그와 마지막 닫힘 태그를 떼어낸 내부 마크업
     */
    [[nodiscard]] std::string innerMarkup(const std::string& block) const;

    /**
     * @brief 탭, CR, LF 제거
     */
    [[nodiscard]] static std::string stripControlWhitespace(const std::string& html);

    /**
     * @brief pos 이후 첫 번째 `<tag ...>` 또는 `</tag>` 탐색
     * @param closing true면 닫힘 태그 탐색
     */
    [[nodiscard]] static TagMatch findTag(const std::string& text, const std::string& tag,
                                          size_t pos, bool closing);

    /**
     * @brief pos 이후 첫 번째 경계 패턴 일치
     */
    [[nodiscard]] static TagMatch findBoundary(const std::string& text,
                                               const BoundaryPattern& boundary, size_t pos);

    [[nodiscard]] const std::string& tagName() const { return tag_name_; }
    [[nodiscard]] int maxDepth() const { return max_depth_; }

private:
    std::string tag_name_;
    int max_depth_;
};

} // namespace pagecanvas::markup
