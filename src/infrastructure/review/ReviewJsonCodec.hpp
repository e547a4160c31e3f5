/**
 * @file ReviewJsonCodec.hpp
 * @brief JSON mapping of snapshots and review value objects.
 */

#pragma once

#include <chrono>
#include <nlohmann/json.hpp>

#include "domain/model/Snapshot.hpp"
#include "domain/review/entities/Comment.hpp"
#include "domain/review/value_objects/Participant.hpp"
#include "domain/review/value_objects/ReviewScope.hpp"

namespace safetyreview::infrastructure::review {

namespace codec {

using json = nlohmann::json;

// Timestamps are stored as milliseconds since the epoch.
long long ToMillis(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point FromMillis(long long ms);

json ToJson(const domain::model::Snapshot& snapshot);
domain::model::Snapshot SnapshotFromJson(const json& j);

json ToJson(const domain::review::Participant& participant);
domain::review::Participant ParticipantFromJson(const json& j);

json ToJson(const domain::review::ReviewScope& scope);
domain::review::ReviewScope ScopeFromJson(const json& j);

json ToJson(const domain::review::CommentTarget& target);
domain::review::CommentTarget TargetFromJson(const json& j);

json ToJson(const domain::review::Comment& comment);
domain::review::Comment CommentFromJson(const json& j);

} // namespace codec

} // namespace safetyreview::infrastructure::review
