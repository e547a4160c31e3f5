/**
 * @file Comment.hpp
 * @brief Entity representing one review remark on a scoped model element.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "domain/review/value_objects/CommentTarget.hpp"

namespace safetyreview::domain::review {

/**
 * @class Comment
 * @brief A remark and, once addressed, its resolution.
 *
 * Invariant: resolution is non-empty iff resolved. A resolved comment is
 * never edited again; continuing the discussion appends a new comment
 * whose reopens field points back here.
 */
class Comment {
public:
    int commentId = 0;
    std::string author;
    CommentTarget target;
    std::string text;
    std::chrono::system_clock::time_point created;

    bool resolved = false;
    std::string resolution;
    std::string resolvedBy;
    std::chrono::system_clock::time_point resolvedAt;

    std::optional<int> reopens; ///< Id of the resolved comment this one continues.

    Comment() = default;

    Comment(int id, std::string a, CommentTarget t, std::string txt,
            std::chrono::system_clock::time_point at)
        : commentId(id), author(std::move(a)), target(std::move(t)), text(std::move(txt)), created(at) {}

    // Precondition checks live in CommentLedger::resolve.
    void markResolved(const std::string& explanation, const std::string& by,
                      std::chrono::system_clock::time_point at) {
        resolved = true;
        resolution = explanation;
        resolvedBy = by;
        resolvedAt = at;
    }

    // Same remark by the same author on the same element.
    bool duplicates(const Comment& other) const {
        return target == other.target && author == other.author && text == other.text;
    }

    bool operator==(const Comment& other) const {
        return commentId == other.commentId && author == other.author && target == other.target &&
               text == other.text && created == other.created && resolved == other.resolved &&
               resolution == other.resolution && resolvedBy == other.resolvedBy &&
               resolvedAt == other.resolvedAt && reopens == other.reopens;
    }
};

} // namespace safetyreview::domain::review
