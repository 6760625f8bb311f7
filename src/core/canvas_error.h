#pragma once

/**
 * @file canvas_error.h
 * @brief 캔버스 모델 공통 에러 타입
 *
 * 스캐너, 코덱, 페이지 문서, 저장소가 공유하는 에러 분류와
 * 에러 정보 구조체를 정의합니다.
 */

#include <string>
#include <utility>

namespace pagecanvas {

/**
 * @brief 에러 분류
 */
enum class CanvasErrorType {
    None,
    MalformedMarkup,    ///< 마크업 중첩 한도 초과 / 균형 깨짐 (페이지 파싱 전체 중단)
    Codec,              ///< 속성 값이 올바른 인코딩 JSON이 아님 (해당 컨트롤만 실패)
    NotFound,           ///< 조회 결과 없음
    Store               ///< 저장소 실패 (그대로 전달)
};

/**
 * @brief 에러 정보
 */
struct CanvasError {
    CanvasErrorType type{CanvasErrorType::None};
    std::string message;

    [[nodiscard]] bool ok() const { return type == CanvasErrorType::None; }

    /**
     * @brief 에러 분류 문자열 변환
     */
    [[nodiscard]] std::string typeString() const {
        switch (type) {
            case CanvasErrorType::None:            return "None";
            case CanvasErrorType::MalformedMarkup: return "MalformedMarkup";
            case CanvasErrorType::Codec:           return "Codec";
            case CanvasErrorType::NotFound:        return "NotFound";
            case CanvasErrorType::Store:           return "Store";
        }
        return "Unknown";
    }

    static CanvasError make(CanvasErrorType type, std::string message) {
        return CanvasError{type, std::move(message)};
    }
};

} // namespace pagecanvas
