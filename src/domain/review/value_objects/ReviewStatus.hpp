/**
 * @file ReviewStatus.hpp
 * @brief Value Objects describing the kind and lifecycle state of a review.
 */

#pragma once

#include <string>

namespace safetyreview::domain::review {

/**
 * @enum ReviewKind
 * @brief Peer reviews collect comments only; joint reviews end with an approval.
 */
enum class ReviewKind {
    Peer,
    Joint
};

/**
 * @enum ReviewStatus
 * @brief Lifecycle of a review session.
 */
enum class ReviewStatus {
    Open,     ///< Accepting work.
    ReadOnly, ///< Due date passed and not extended.
    Approved  ///< Terminal.
};

inline std::string KindToString(ReviewKind kind) {
    return kind == ReviewKind::Joint ? "joint" : "peer";
}

inline ReviewKind KindFromString(const std::string& kind) {
    return kind == "joint" ? ReviewKind::Joint : ReviewKind::Peer;
}

inline std::string StatusToString(ReviewStatus status) {
    switch (status) {
        case ReviewStatus::Open: return "open";
        case ReviewStatus::ReadOnly: return "read-only";
        case ReviewStatus::Approved: return "approved";
        default: return "unknown";
    }
}

} // namespace safetyreview::domain::review
