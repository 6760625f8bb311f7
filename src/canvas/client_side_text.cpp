#include "client_side_text.h"

#include <iostream>

namespace pagecanvas::canvas {

namespace {
constexpr const char* kTextHolderAttribute = "data-sp-rte";
} // namespace

ClientSideText::ClientSideText(const std::string& text) {
    setText(text);
}

void ClientSideText::setText(const std::string& text) {
    if (text.rfind("<p>", 0) != 0) {
        text_ = "<p>" + text + "</p>";
    } else {
        text_ = text;
    }
}

std::string ClientSideText::renderBody() const {
    return "<div " + std::string(kTextHolderAttribute) + "=\"\">" + text_ + "</div>";
}

bool ClientSideText::parseBody(const std::string& markup,
                               const markup::BoundedBlockScanner& scanner,
                               const CanvasConfig& config,
                               CanvasError* error) {
    // 컨트롤 자신의 여는 태그 뒤에서 홀더를 찾는다
    const std::string inner = scanner.innerMarkup(markup);

    CanvasError scan_error;
    auto holder = scanner.findFirst(inner, scanner.makeBoundary(kTextHolderAttribute), &scan_error);

    if (!scan_error.ok()) {
        if (error) *error = scan_error;
        return false;
    }

    if (!holder) {
        if (config.strict_text_holder) {
            if (error) {
                *error = CanvasError::make(CanvasErrorType::MalformedMarkup,
                                           "텍스트 컨트롤에 본문 홀더(data-sp-rte)가 없음");
            }
            return false;
        }
        if (config.verbose) {
            std::cout << "[ClientSideText] 본문 홀더 없음, 빈 본문으로 처리" << std::endl;
        }
        text_.clear();
        return true;
    }

    std::string content = scanner.innerMarkup(*holder);
    if (content.empty()) {
        text_.clear();
    } else {
        setText(content);
    }
    return true;
}

} // namespace pagecanvas::canvas
