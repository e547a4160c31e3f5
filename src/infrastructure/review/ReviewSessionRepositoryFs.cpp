/**
 * @file ReviewSessionRepositoryFs.cpp
 * @brief Implementation of ReviewSessionRepositoryFs.
 */

#include "infrastructure/review/ReviewSessionRepositoryFs.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <type_traits>
#include <nlohmann/json.hpp>
#include "infrastructure/review/ReviewJsonCodec.hpp"

namespace safetyreview::infrastructure::review {

using json = nlohmann::json;

ReviewSessionRepositoryFs::ReviewSessionRepositoryFs(std::unique_ptr<ReviewEventStoreFs> eventStore)
    : m_eventStore(std::move(eventStore)) {}

std::vector<StoredEvent> ReviewSessionRepositoryFs::serializeEvents(const std::vector<ReviewDomainEvent>& domainEvents) {
    std::vector<StoredEvent> stored;
    for (const auto& varEvent : domainEvents) {
        std::visit([&](auto&& e) {
            using T = std::decay_t<decltype(e)>;
            json j;

            if constexpr (std::is_same_v<T, ReviewCreated>) {
                json participants = json::array();
                for (const auto& p : e.participants) {
                    participants.push_back(codec::ToJson(p));
                }
                j = {
                    {"name", e.name},
                    {"description", e.description},
                    {"kind", KindToString(e.kind)},
                    {"scope", codec::ToJson(e.scope)},
                    {"participants", participants},
                    {"dueDate", codec::ToMillis(e.dueDate)},
                    {"baselineVersion", e.baselineVersion}
                };
            }
            else if constexpr (std::is_same_v<T, DueDateExtended>) {
                j = {
                    {"actor", e.actor},
                    {"newDueDate", codec::ToMillis(e.newDueDate)}
                };
            }
            else if constexpr (std::is_same_v<T, ReviewerCompleted>) {
                j = {{"reviewer", e.reviewer}};
            }
            else if constexpr (std::is_same_v<T, CommentAdded>) {
                j = {
                    {"commentId", e.commentId},
                    {"author", e.author},
                    {"target", codec::ToJson(e.target)},
                    {"text", e.text}
                };
                if (e.reopens) j["reopens"] = *e.reopens;
            }
            else if constexpr (std::is_same_v<T, CommentResolved>) {
                j = {
                    {"commentId", e.commentId},
                    {"resolvedBy", e.resolvedBy},
                    {"explanation", e.explanation}
                };
            }
            else if constexpr (std::is_same_v<T, CommentImported>) {
                j = {{"comment", codec::ToJson(e.comment)}};
            }
            else if constexpr (std::is_same_v<T, DescriptionEdited>) {
                j = {
                    {"actor", e.actor},
                    {"description", e.description}
                };
            }
            else if constexpr (std::is_same_v<T, ParticipantAdded>) {
                j = {
                    {"actor", e.actor},
                    {"participant", codec::ToJson(e.participant)}
                };
            }
            else if constexpr (std::is_same_v<T, ParticipantRemoved>) {
                j = {
                    {"actor", e.actor},
                    {"name", e.name}
                };
            }
            else if constexpr (std::is_same_v<T, ReviewApproved>) {
                j = {
                    {"approver", e.approver},
                    {"versionLabel", e.versionLabel}
                };
            }

            stored.push_back({T::Type, j.dump(), e.timestamp});
        }, varEvent);
    }
    return stored;
}

void ReviewSessionRepositoryFs::save(const ReviewSession& session) {
    // The caller keeps ownership; update() is the variant that clears the events.
    auto storedEvents = serializeEvents(session.getUncommittedEvents());
    m_eventStore->append(session.getId(), storedEvents);
}

void ReviewSessionRepositoryFs::update(ReviewSession& session) {
    auto storedEvents = serializeEvents(session.getUncommittedEvents());
    m_eventStore->append(session.getId(), storedEvents);
    session.clearUncommittedEvents();
}

std::optional<ReviewSession> ReviewSessionRepositoryFs::findById(const std::string& id) {
    std::vector<StoredEvent> stored;
    try {
        stored = m_eventStore->readAll(id);
    } catch (const std::runtime_error& e) {
        std::cerr << "[ReviewSessionRepositoryFs] Cannot read review " << id << ": " << e.what() << std::endl;
        return std::nullopt;
    }
    if (stored.empty()) return std::nullopt;

    // Rehydrate
    auto session = ReviewSession::createEmpty(id);

    try {
        for (const auto& s : stored) {
            auto j = json::parse(s.eventDataJson);

            if (s.eventType == ReviewCreated::Type) {
                std::vector<Participant> participants;
                for (const auto& p : j.at("participants")) {
                    participants.push_back(codec::ParticipantFromJson(p));
                }
                session.applyEvent(ReviewCreated{
                    id,
                    j.at("name").get<std::string>(),
                    j.value("description", ""),
                    KindFromString(j.value("kind", "peer")),
                    codec::ScopeFromJson(j.at("scope")),
                    participants,
                    codec::FromMillis(j.at("dueDate").get<long long>()),
                    j.value("baselineVersion", ""),
                    s.timestamp
                });
            }
            else if (s.eventType == DueDateExtended::Type) {
                session.applyEvent(DueDateExtended{
                    id,
                    j.value("actor", ""),
                    codec::FromMillis(j.at("newDueDate").get<long long>()),
                    s.timestamp
                });
            }
            else if (s.eventType == ReviewerCompleted::Type) {
                session.applyEvent(ReviewerCompleted{id, j.at("reviewer").get<std::string>(), s.timestamp});
            }
            else if (s.eventType == CommentAdded::Type) {
                std::optional<int> reopens;
                if (j.contains("reopens")) reopens = j["reopens"].get<int>();
                session.applyEvent(CommentAdded{
                    id,
                    j.at("commentId").get<int>(),
                    j.at("author").get<std::string>(),
                    codec::TargetFromJson(j.at("target")),
                    j.at("text").get<std::string>(),
                    reopens,
                    s.timestamp
                });
            }
            else if (s.eventType == CommentResolved::Type) {
                session.applyEvent(CommentResolved{
                    id,
                    j.at("commentId").get<int>(),
                    j.value("resolvedBy", ""),
                    j.at("explanation").get<std::string>(),
                    s.timestamp
                });
            }
            else if (s.eventType == CommentImported::Type) {
                session.applyEvent(CommentImported{id, codec::CommentFromJson(j.at("comment")), s.timestamp});
            }
            else if (s.eventType == DescriptionEdited::Type) {
                session.applyEvent(DescriptionEdited{
                    id,
                    j.value("actor", ""),
                    j.at("description").get<std::string>(),
                    s.timestamp
                });
            }
            else if (s.eventType == ParticipantAdded::Type) {
                session.applyEvent(ParticipantAdded{
                    id,
                    j.value("actor", ""),
                    codec::ParticipantFromJson(j.at("participant")),
                    s.timestamp
                });
            }
            else if (s.eventType == ParticipantRemoved::Type) {
                session.applyEvent(ParticipantRemoved{
                    id,
                    j.value("actor", ""),
                    j.at("name").get<std::string>(),
                    s.timestamp
                });
            }
            else if (s.eventType == ReviewApproved::Type) {
                session.applyEvent(ReviewApproved{
                    id,
                    j.at("approver").get<std::string>(),
                    j.at("versionLabel").get<std::string>(),
                    s.timestamp
                });
            }
            else {
                std::cerr << "[ReviewSessionRepositoryFs] Unknown event type " << s.eventType
                          << " in review " << id << std::endl;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[ReviewSessionRepositoryFs] Error rehydrating review " << id << ": " << e.what() << std::endl;
        return std::nullopt;
    }

    return session;
}

std::vector<ReviewSession> ReviewSessionRepositoryFs::findAll() {
    std::vector<ReviewSession> sessions;
    auto ids = m_eventStore->getAllReviewIds();

    for (const auto& id : ids) {
        auto sessionOpt = findById(id);
        if (sessionOpt) {
            sessions.push_back(std::move(*sessionOpt));
        }
    }

    std::stable_sort(sessions.begin(), sessions.end(), [](const ReviewSession& a, const ReviewSession& b) {
        return a.getCreatedAt() < b.getCreatedAt();
    });
    return sessions;
}

} // namespace safetyreview::infrastructure::review
