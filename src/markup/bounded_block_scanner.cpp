/**
 * @file bounded_block_scanner.cpp
 * @brief 중첩 블록 스캐너 구현
 */

#include "bounded_block_scanner.h"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>

namespace pagecanvas::markup {

namespace {

/// 정규식 \w 에 해당하는 문자
bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool equalsIgnoreCaseAt(const std::string& text, size_t pos, const std::string& word) {
    if (pos + word.size() > text.size()) return false;
    for (size_t i = 0; i < word.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[pos + i])) !=
            std::tolower(static_cast<unsigned char>(word[i]))) {
            return false;
        }
    }
    return true;
}

bool containsIgnoreCase(const std::string& text, size_t begin, size_t end,
                        const std::string& needle) {
    if (needle.empty()) return true;
    if (end < needle.size()) return false;
    for (size_t i = begin; i + needle.size() <= end; ++i) {
        if (equalsIgnoreCaseAt(text, i, needle)) return true;
    }
    return false;
}

} // namespace

// ============================================================
// 생성자
// ============================================================

BoundedBlockScanner::BoundedBlockScanner(std::string tag_name, int max_depth)
    : tag_name_(std::move(tag_name)), max_depth_(max_depth) {}

// ============================================================
// 공개 메서드
// ============================================================

ScanResult BoundedBlockScanner::scan(const std::string& html,
                                     const BoundaryPattern& boundary) const {
    ScanResult result;

    if (html.empty()) {
        return result;
    }

    // 의미 있는 데이터는 모두 속성에 인코딩되어 있으므로 제어 공백은 버린다
    const std::string cleaned = stripControlWhitespace(html);

    TagMatch start = findBoundary(cleaned, boundary, 0);

    while (start.found()) {
        // 경계 자신의 여는 태그를 1로 센다
        int open_counter = 1;
        size_t search = start.position + 1;
        size_t block_end = std::string::npos;

        while (true) {
            TagMatch next_open = findTag(cleaned, tag_name_, search, false);
            TagMatch next_close = findTag(cleaned, tag_name_, search, true);

            if (!next_close.found()) {
                result.success = false;
                result.blocks.clear();
                result.error = CanvasError::make(
                    CanvasErrorType::MalformedMarkup,
                    "닫히지 않은 <" + tag_name_ + "> 블록 (위치 " +
                        std::to_string(start.position) + ")");
                return result;
            }

            if (next_open.found() && next_open.position < next_close.position) {
                ++open_counter;
                search = next_open.position + 1;
            } else {
                --open_counter;
                search = next_close.position + 1;
            }

            if (open_counter == 0) {
                block_end = next_close.end();
                result.blocks.push_back(cleaned.substr(start.position, block_end - start.position));
                break;
            }

            if (open_counter > max_depth_ || open_counter < 0) {
                result.success = false;
                result.blocks.clear();
                result.error = CanvasError::make(
                    CanvasErrorType::MalformedMarkup,
                    "중첩 깊이 한도 초과 (" + std::to_string(max_depth_) + ")");
                return result;
            }
        }

        // 방금 찾은 닫힘 태그 뒤에서 다음 조각 탐색
        start = findBoundary(cleaned, boundary, block_end);
    }

    return result;
}

std::optional<std::string> BoundedBlockScanner::findFirst(const std::string& html,
                                                          const BoundaryPattern& boundary,
                                                          CanvasError* error) const {
    auto result = scan(html, boundary);
    if (!result.success) {
        if (error) *error = result.error;
        return std::nullopt;
    }
    if (result.blocks.empty()) {
        return std::nullopt;
    }
    return result.blocks.front();
}

std::string BoundedBlockScanner::innerMarkup(const std::string& block) const {
    TagMatch opening = findTag(block, tag_name_, 0, false);
    if (!opening.found()) {
        return {};
    }

    std::string inner = block.substr(opening.end());

    // 마지막 </div> 제거
    size_t last_close = std::string::npos;
    for (TagMatch close = findTag(inner, tag_name_, 0, true); close.found();
         close = findTag(inner, tag_name_, close.position + 1, true)) {
        if (close.end() == inner.size()) {
            last_close = close.position;
            break;
        }
    }
    if (last_close != std::string::npos) {
        inner.erase(last_close);
    }
    return inner;
}

std::string BoundedBlockScanner::stripControlWhitespace(const std::string& html) {
    std::string cleaned;
    cleaned.reserve(html.size());
    std::copy_if(html.begin(), html.end(), std::back_inserter(cleaned),
                 [](char c) { return c != '\t' && c != '\r' && c != '\n'; });
    return cleaned;
}

TagMatch BoundedBlockScanner::findTag(const std::string& text, const std::string& tag,
                                      size_t pos, bool closing) {
    const size_t size = text.size();

    for (size_t i = text.find('<', pos); i != std::string::npos; i = text.find('<', i + 1)) {
        size_t name_start = i + 1;
        if (closing) {
            if (name_start >= size || text[name_start] != '/') continue;
            ++name_start;
        }

        if (!equalsIgnoreCaseAt(text, name_start, tag)) continue;

        size_t after = name_start + tag.size();
        if (after < size && isWordChar(text[after])) continue;  // <divider> 등 제외

        if (closing) {
            size_t j = after;
            while (j < size && std::isspace(static_cast<unsigned char>(text[j]))) ++j;
            if (j < size && text[j] == '>') {
                return TagMatch{i, j - i + 1};
            }
            continue;
        }

        size_t gt = text.find('>', after);
        if (gt == std::string::npos) {
            // 이후로는 '>'가 없으므로 더 이상 여는 태그가 성립하지 않음
            return {};
        }
        return TagMatch{i, gt - i + 1};
    }

    return {};
}

TagMatch BoundedBlockScanner::findBoundary(const std::string& text,
                                           const BoundaryPattern& boundary, size_t pos) {
    for (TagMatch tag = findTag(text, boundary.tag, pos, false); tag.found();
         tag = findTag(text, boundary.tag, tag.position + 1, false)) {
        if (containsIgnoreCase(text, tag.position, tag.end(), boundary.attribute)) {
            return tag;
        }
    }
    return {};
}

} // namespace pagecanvas::markup
