/**
 * @file CommentTarget.hpp
 * @brief Element of the model a review comment refers to.
 */

#pragma once

#include <string>

namespace safetyreview::domain::review {

/**
 * @struct CommentTarget
 * @brief An entity id, optionally narrowed to one of its fields
 * (e.g. the "cause" column of an FMEA row). The entity id is the scope key.
 */
struct CommentTarget {
    std::string entityId;
    std::string field;

    CommentTarget() = default;
    CommentTarget(std::string id, std::string f = "") : entityId(std::move(id)), field(std::move(f)) {}

    std::string label() const {
        return field.empty() ? entityId : entityId + "." + field;
    }

    bool operator==(const CommentTarget& other) const {
        return entityId == other.entityId && field == other.field;
    }
    bool operator!=(const CommentTarget& other) const { return !(*this == other); }
};

} // namespace safetyreview::domain::review
