/**
 * @file CommentLedger.cpp
 * @brief Implementation of CommentLedger.
 */

#include "domain/review/CommentLedger.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "domain/review/ReviewErrors.hpp"

namespace safetyreview::domain::review {

namespace {

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

} // namespace

void CommentLedger::requireInScope(const CommentTarget& target) const {
    if (!m_scope.contains(target.entityId)) {
        throw ReviewError(ReviewErrorCode::OutOfScope,
                          "Element " + target.entityId + " is not part of the review scope.");
    }
}

const Comment& CommentLedger::addComment(const CommentTarget& target, const std::string& author,
                                         const std::string& text,
                                         std::chrono::system_clock::time_point created) {
    requireInScope(target);
    if (isBlank(text)) {
        throw std::invalid_argument("CommentLedger: comment text cannot be empty.");
    }

    m_comments.emplace_back(m_nextId++, author, target, text, created);
    return m_comments.back();
}

const Comment& CommentLedger::resolve(int commentId, const std::string& explanation,
                                      const std::string& resolvedBy,
                                      std::chrono::system_clock::time_point at) {
    Comment& comment = findMutable(commentId);
    if (comment.resolved) {
        throw ReviewError(ReviewErrorCode::AlreadyResolved,
                          "Comment " + std::to_string(commentId) + " is already resolved.");
    }
    if (isBlank(explanation)) {
        throw ReviewError(ReviewErrorCode::EmptyExplanation,
                          "Resolving comment " + std::to_string(commentId) + " requires an explanation.");
    }

    comment.markResolved(explanation, resolvedBy, at);
    return comment;
}

const Comment& CommentLedger::reopen(int commentId, const std::string& author, const std::string& text,
                                     std::chrono::system_clock::time_point created) {
    const Comment& original = find(commentId);
    if (!original.resolved) {
        throw std::invalid_argument("CommentLedger: comment " + std::to_string(commentId) +
                                    " is still open.");
    }

    CommentTarget target = original.target;
    const Comment& added = addComment(target, author, text, created);
    m_comments.back().reopens = commentId;
    return added;
}

const Comment& CommentLedger::import(const Comment& foreign) {
    requireInScope(foreign.target);

    Comment copy = foreign;
    copy.commentId = m_nextId++;
    copy.reopens.reset();
    m_comments.push_back(std::move(copy));
    return m_comments.back();
}

std::vector<Comment> CommentLedger::commentsFor(const std::string& entityId) const {
    std::vector<Comment> result;
    for (const auto& c : m_comments) {
        if (c.target.entityId == entityId) {
            result.push_back(c);
        }
    }
    return result;
}

std::set<std::string> CommentLedger::unresolvedTargets() const {
    std::set<std::string> targets;
    for (const auto& c : m_comments) {
        if (!c.resolved) {
            targets.insert(c.target.entityId);
        }
    }
    return targets;
}

bool CommentLedger::allResolved() const {
    // Every stored comment passed the scope check, so this covers all in-scope comments.
    return std::all_of(m_comments.begin(), m_comments.end(),
                       [](const Comment& c) { return c.resolved; });
}

bool CommentLedger::containsDuplicateOf(const Comment& comment) const {
    return findDuplicateOf(comment) != nullptr;
}

const Comment* CommentLedger::findDuplicateOf(const Comment& comment) const {
    auto it = std::find_if(m_comments.begin(), m_comments.end(),
                           [&](const Comment& c) { return c.duplicates(comment); });
    return it == m_comments.end() ? nullptr : &*it;
}

const Comment& CommentLedger::find(int commentId) const {
    for (const auto& c : m_comments) {
        if (c.commentId == commentId) return c;
    }
    throw std::out_of_range("Comment not found: " + std::to_string(commentId));
}

Comment& CommentLedger::findMutable(int commentId) {
    for (auto& c : m_comments) {
        if (c.commentId == commentId) return c;
    }
    throw std::out_of_range("Comment not found: " + std::to_string(commentId));
}

} // namespace safetyreview::domain::review
