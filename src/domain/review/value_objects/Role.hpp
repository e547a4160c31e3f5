/**
 * @file Role.hpp
 * @brief Review roles and the permission table deciding who may do what.
 */

#pragma once

#include <string>

namespace safetyreview::domain::review {

enum class Role {
    Moderator,
    Reviewer,
    Approver
};

enum class ReviewAction {
    ExtendDueDate,
    EditDetails,
    EditParticipants,
    AddComment,
    ResolveComment,
    MarkComplete,
    Approve
};

inline std::string RoleToString(Role role) {
    switch (role) {
        case Role::Moderator: return "moderator";
        case Role::Reviewer: return "reviewer";
        case Role::Approver: return "approver";
        default: return "unknown";
    }
}

inline Role RoleFromString(const std::string& role) {
    if (role == "moderator") return Role::Moderator;
    if (role == "approver") return Role::Approver;
    return Role::Reviewer;
}

inline std::string ActionToString(ReviewAction action) {
    switch (action) {
        case ReviewAction::ExtendDueDate: return "extend the due date";
        case ReviewAction::EditDetails: return "edit the review details";
        case ReviewAction::EditParticipants: return "edit participants";
        case ReviewAction::AddComment: return "comment";
        case ReviewAction::ResolveComment: return "resolve comments";
        case ReviewAction::MarkComplete: return "mark the review done";
        case ReviewAction::Approve: return "approve";
        default: return "unknown action";
    }
}

/**
 * @brief Permission table: which role may perform which action.
 */
inline bool IsPermitted(Role role, ReviewAction action) {
    switch (action) {
        case ReviewAction::ExtendDueDate:
        case ReviewAction::EditDetails:
        case ReviewAction::EditParticipants:
        case ReviewAction::ResolveComment:
            return role == Role::Moderator;
        case ReviewAction::AddComment:
            return true;
        case ReviewAction::MarkComplete:
            return role == Role::Reviewer;
        case ReviewAction::Approve:
            return role == Role::Approver;
        default:
            return false;
    }
}

/**
 * @brief Actions still accepted after the due date: moderator housekeeping and comments.
 */
inline bool IsAllowedWhileReadOnly(ReviewAction action) {
    return action == ReviewAction::ExtendDueDate ||
           action == ReviewAction::EditDetails ||
           action == ReviewAction::EditParticipants ||
           action == ReviewAction::AddComment;
}

} // namespace safetyreview::domain::review
