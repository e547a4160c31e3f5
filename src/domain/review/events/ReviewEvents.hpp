/**
 * @file ReviewEvents.hpp
 * @brief Domain Events recorded by review sessions.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../entities/Comment.hpp"
#include "../value_objects/CommentTarget.hpp"
#include "../value_objects/Participant.hpp"
#include "../value_objects/ReviewScope.hpp"
#include "../value_objects/ReviewStatus.hpp"

namespace safetyreview::domain::review {

struct ReviewCreated {
    static constexpr const char* Type = "ReviewCreated";
    std::string reviewId;
    std::string name;
    std::string description;
    ReviewKind kind;
    ReviewScope scope;
    std::vector<Participant> participants;
    std::chrono::system_clock::time_point dueDate;
    std::string baselineVersion;
    std::chrono::system_clock::time_point timestamp;
};

struct DueDateExtended {
    static constexpr const char* Type = "DueDateExtended";
    std::string reviewId;
    std::string actor;
    std::chrono::system_clock::time_point newDueDate;
    std::chrono::system_clock::time_point timestamp;
};

struct ReviewerCompleted {
    static constexpr const char* Type = "ReviewerCompleted";
    std::string reviewId;
    std::string reviewer;
    std::chrono::system_clock::time_point timestamp;
};

struct CommentAdded {
    static constexpr const char* Type = "CommentAdded";
    std::string reviewId;
    int commentId;
    std::string author;
    CommentTarget target;
    std::string text;
    std::optional<int> reopens;
    std::chrono::system_clock::time_point timestamp;
};

struct CommentResolved {
    static constexpr const char* Type = "CommentResolved";
    std::string reviewId;
    int commentId;
    std::string resolvedBy;
    std::string explanation;
    std::chrono::system_clock::time_point timestamp;
};

// Comment merged from another review (offline consolidation).
struct CommentImported {
    static constexpr const char* Type = "CommentImported";
    std::string reviewId;
    Comment comment;
    std::chrono::system_clock::time_point timestamp;
};

struct DescriptionEdited {
    static constexpr const char* Type = "DescriptionEdited";
    std::string reviewId;
    std::string actor;
    std::string description;
    std::chrono::system_clock::time_point timestamp;
};

struct ParticipantAdded {
    static constexpr const char* Type = "ParticipantAdded";
    std::string reviewId;
    std::string actor;
    Participant participant;
    std::chrono::system_clock::time_point timestamp;
};

struct ParticipantRemoved {
    static constexpr const char* Type = "ParticipantRemoved";
    std::string reviewId;
    std::string actor;
    std::string name;
    std::chrono::system_clock::time_point timestamp;
};

struct ReviewApproved {
    static constexpr const char* Type = "ReviewApproved";
    std::string reviewId;
    std::string approver;
    std::string versionLabel;
    std::chrono::system_clock::time_point timestamp;
};

// variant for generic handling
using ReviewDomainEvent = std::variant<
    ReviewCreated,
    DueDateExtended,
    ReviewerCompleted,
    CommentAdded,
    CommentResolved,
    CommentImported,
    DescriptionEdited,
    ParticipantAdded,
    ParticipantRemoved,
    ReviewApproved
>;

} // namespace safetyreview::domain::review
