/**
 * @file ReviewErrors.hpp
 * @brief User-facing error conditions of the review workflow.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace safetyreview::domain::review {

enum class ReviewErrorCode {
    PermissionDenied,    ///< Role guard failed.
    ApprovalBlocked,     ///< Reviewers incomplete or comments unresolved.
    ReviewLocked,        ///< Read-only window or approved review.
    OutOfScope,          ///< Comment target outside the review scope.
    EmptyExplanation,    ///< Resolution without explanation.
    AlreadyResolved,     ///< Comment resolved twice.
    DuplicateName,       ///< Review name already used.
    InvalidParticipants, ///< Role-count invariant violated.
    NotFound             ///< Unknown review, version or comment.
};

inline std::string ReviewErrorCodeToString(ReviewErrorCode code) {
    switch (code) {
        case ReviewErrorCode::PermissionDenied: return "PermissionDenied";
        case ReviewErrorCode::ApprovalBlocked: return "ApprovalBlocked";
        case ReviewErrorCode::ReviewLocked: return "ReviewLocked";
        case ReviewErrorCode::OutOfScope: return "OutOfScope";
        case ReviewErrorCode::EmptyExplanation: return "EmptyExplanation";
        case ReviewErrorCode::AlreadyResolved: return "AlreadyResolved";
        case ReviewErrorCode::DuplicateName: return "DuplicateName";
        case ReviewErrorCode::InvalidParticipants: return "InvalidParticipants";
        case ReviewErrorCode::NotFound: return "NotFound";
        default: return "Unknown";
    }
}

/**
 * @brief Message telling the user how to get past the error.
 */
inline std::string ErrorGuidance(ReviewErrorCode code) {
    switch (code) {
        case ReviewErrorCode::PermissionDenied:
            return "Your role in this review does not allow this action. Switch to a participant with the required role.";
        case ReviewErrorCode::ApprovalBlocked:
            return "Wait until every reviewer has marked the review done and all comments are resolved.";
        case ReviewErrorCode::ReviewLocked:
            return "The review is read-only. Ask the moderator to extend the due date.";
        case ReviewErrorCode::OutOfScope:
            return "Select an element that is part of the review scope.";
        case ReviewErrorCode::EmptyExplanation:
            return "Enter a resolution explaining how the comment was addressed.";
        case ReviewErrorCode::AlreadyResolved:
            return "The comment is already resolved. Reopen it to continue the discussion.";
        case ReviewErrorCode::DuplicateName:
            return "Choose a review name that is not used yet.";
        case ReviewErrorCode::InvalidParticipants:
            return "A review needs at least one moderator and one reviewer.";
        case ReviewErrorCode::NotFound:
            return "Select an existing review, version or comment.";
        default:
            return "";
    }
}

/**
 * @brief Exception carrying a ReviewErrorCode for display by the caller.
 */
class ReviewError : public std::runtime_error {
public:
    ReviewError(ReviewErrorCode code, const std::string& msg)
        : std::runtime_error(msg), m_code(code) {}

    ReviewErrorCode code() const { return m_code; }
    std::string guidance() const { return ErrorGuidance(m_code); }

private:
    ReviewErrorCode m_code;
};

} // namespace safetyreview::domain::review
