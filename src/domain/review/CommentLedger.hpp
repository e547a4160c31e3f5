/**
 * @file CommentLedger.hpp
 * @brief Ordered comment threads of one review, validated against its scope.
 */

#pragma once

#include <chrono>
#include <set>
#include <string>
#include <vector>

#include "domain/review/entities/Comment.hpp"
#include "domain/review/value_objects/ReviewScope.hpp"

namespace safetyreview::domain::review {

class CommentLedger {
public:
    CommentLedger() = default;
    explicit CommentLedger(ReviewScope scope) : m_scope(std::move(scope)) {}

    /**
     * @brief Appends a comment on a scoped element.
     * @throws ReviewError(OutOfScope) if the target entity is not in scope.
     * @throws std::invalid_argument if the text is blank.
     */
    const Comment& addComment(const CommentTarget& target, const std::string& author,
                              const std::string& text, std::chrono::system_clock::time_point created);

    /**
     * @brief Resolves a comment with a mandatory explanation.
     * @throws ReviewError(EmptyExplanation) for a blank explanation.
     * @throws ReviewError(AlreadyResolved) when resolved before.
     * @throws std::out_of_range for an unknown id.
     */
    const Comment& resolve(int commentId, const std::string& explanation,
                           const std::string& resolvedBy = "",
                           std::chrono::system_clock::time_point at = std::chrono::system_clock::time_point());

    /**
     * @brief Continues the discussion of a resolved comment with a new entry.
     * @throws std::invalid_argument if the original comment is still open.
     */
    const Comment& reopen(int commentId, const std::string& author, const std::string& text,
                          std::chrono::system_clock::time_point created);

    // Inserts a comment carried over from another ledger, keeping its resolution state.
    const Comment& import(const Comment& foreign);

    // Comments on an entity (any field), insertion order.
    std::vector<Comment> commentsFor(const std::string& entityId) const;

    // Entities with at least one open comment.
    std::set<std::string> unresolvedTargets() const;

    bool allResolved() const;
    bool containsDuplicateOf(const Comment& comment) const;
    const Comment* findDuplicateOf(const Comment& comment) const;

    const Comment& find(int commentId) const;
    const std::vector<Comment>& comments() const { return m_comments; }
    const ReviewScope& scope() const { return m_scope; }
    size_t size() const { return m_comments.size(); }

    bool operator==(const CommentLedger& other) const {
        return m_scope == other.m_scope && m_comments == other.m_comments;
    }

private:
    ReviewScope m_scope;
    std::vector<Comment> m_comments;
    int m_nextId = 1;

    Comment& findMutable(int commentId);
    void requireInScope(const CommentTarget& target) const;
};

} // namespace safetyreview::domain::review
