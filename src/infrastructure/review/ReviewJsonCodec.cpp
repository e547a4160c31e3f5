/**
 * @file ReviewJsonCodec.cpp
 * @brief Implementation of the review JSON mapping.
 */

#include "infrastructure/review/ReviewJsonCodec.hpp"

#include <vector>

namespace safetyreview::infrastructure::review::codec {

using namespace safetyreview::domain;

long long ToMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromMillis(long long ms) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
}

json ToJson(const model::Snapshot& snapshot) {
    json entities = json::array();
    for (const auto& [id, entity] : snapshot.entities()) {
        entities.push_back({
            {"id", entity.id},
            {"kind", model::EntityKindToString(entity.kind)},
            {"fields", entity.fields},
            {"allocations", entity.allocations}
        });
    }

    json links = json::array();
    for (const auto& link : snapshot.links()) {
        links.push_back({
            {"source", link.source},
            {"target", link.target},
            {"kind", link.kind}
        });
    }

    return {
        {"version", snapshot.version()},
        {"entities", entities},
        {"links", links}
    };
}

model::Snapshot SnapshotFromJson(const json& j) {
    std::vector<model::Entity> entities;
    for (const auto& e : j.value("entities", json::array())) {
        model::Entity entity(e.at("id").get<std::string>(),
                             model::EntityKindFromString(e.value("kind", "node")),
                             e.value("fields", std::map<std::string, std::string>{}));
        entity.allocations = e.value("allocations", std::set<std::string>{});
        entities.push_back(std::move(entity));
    }

    std::vector<model::Link> links;
    for (const auto& l : j.value("links", json::array())) {
        links.push_back({l.at("source").get<std::string>(),
                         l.at("target").get<std::string>(),
                         l.value("kind", "child")});
    }

    return model::Snapshot(j.value("version", ""), std::move(entities), std::move(links));
}

json ToJson(const domain::review::Participant& participant) {
    return {
        {"name", participant.name},
        {"email", participant.email},
        {"role", domain::review::RoleToString(participant.role)}
    };
}

domain::review::Participant ParticipantFromJson(const json& j) {
    return domain::review::Participant(j.at("name").get<std::string>(),
                               j.value("email", ""),
                               domain::review::RoleFromString(j.value("role", "reviewer")));
}

json ToJson(const domain::review::ReviewScope& scope) {
    return {
        {"entities", scope.entityIds()},
        {"requirements", scope.requirementIds()}
    };
}

domain::review::ReviewScope ScopeFromJson(const json& j) {
    return domain::review::ReviewScope(j.value("entities", std::set<std::string>{}),
                               j.value("requirements", std::set<std::string>{}));
}

json ToJson(const domain::review::CommentTarget& target) {
    return {
        {"entityId", target.entityId},
        {"field", target.field}
    };
}

domain::review::CommentTarget TargetFromJson(const json& j) {
    return domain::review::CommentTarget(j.at("entityId").get<std::string>(), j.value("field", ""));
}

json ToJson(const domain::review::Comment& comment) {
    json j = {
        {"commentId", comment.commentId},
        {"author", comment.author},
        {"target", ToJson(comment.target)},
        {"text", comment.text},
        {"created", ToMillis(comment.created)},
        {"resolved", comment.resolved},
        {"resolution", comment.resolution},
        {"resolvedBy", comment.resolvedBy},
        {"resolvedAt", ToMillis(comment.resolvedAt)}
    };
    if (comment.reopens) {
        j["reopens"] = *comment.reopens;
    }
    return j;
}

domain::review::Comment CommentFromJson(const json& j) {
    domain::review::Comment comment(j.at("commentId").get<int>(),
                            j.at("author").get<std::string>(),
                            TargetFromJson(j.at("target")),
                            j.at("text").get<std::string>(),
                            FromMillis(j.value("created", 0LL)));
    comment.resolved = j.value("resolved", false);
    comment.resolution = j.value("resolution", "");
    comment.resolvedBy = j.value("resolvedBy", "");
    comment.resolvedAt = FromMillis(j.value("resolvedAt", 0LL));
    if (j.contains("reopens")) {
        comment.reopens = j["reopens"].get<int>();
    }
    return comment;
}

} // namespace safetyreview::infrastructure::review::codec
