/**
 * @file ReviewReportService.cpp
 * @brief Implementation of ReviewReportService.
 */

#include "ReviewReportService.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace safetyreview::application::review {

using namespace safetyreview::domain::model;
using namespace safetyreview::domain::review;

namespace {

std::string formatDate(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M UTC");
    return ss.str();
}

std::string describeRecord(const ChangeRecord& record) {
    std::ostringstream ss;
    switch (record.kind) {
        case ChangeKind::EntityAdded:
        case ChangeKind::EntityRemoved:
            ss << ChangeKindToString(record.kind) << " " << EntityKindToString(record.entityKind)
               << " " << record.entityId;
            break;
        case ChangeKind::EntityModified:
            ss << "modified " << EntityKindToString(record.entityKind) << " " << record.entityId;
            break;
        case ChangeKind::LinkAdded:
        case ChangeKind::LinkRemoved:
            ss << ChangeKindToString(record.kind) << " " << record.link.source << " -> "
               << record.link.target << " (" << record.link.kind << ")";
            break;
        case ChangeKind::AllocationAdded:
        case ChangeKind::AllocationRemoved:
            ss << ChangeKindToString(record.kind) << " " << record.requirementId << " on "
               << record.entityId;
            break;
    }
    return ss.str();
}

std::string describeField(const FieldChange& change) {
    if (change.added) return change.field + ": {+" + change.newValue + "+}";
    if (change.removed) return change.field + ": [-" + change.oldValue + "-]";
    return change.field + ": " + ReviewReportService::formatDelta(change.delta);
}

} // namespace

std::string ReviewReportService::formatDelta(const TextDelta& delta) {
    std::string out = delta.prefix;
    if (!delta.deleted.empty()) out += "[-" + delta.deleted + "-]";
    if (!delta.inserted.empty()) out += "{+" + delta.inserted + "+}";
    out += delta.suffix;
    return out;
}

std::string ReviewReportService::changeSetToText(const ChangeSet& changes) {
    std::stringstream ss;
    ss << "Changes " << changes.baseVersion() << " -> " << changes.targetVersion() << "\n";
    if (changes.empty()) {
        ss << "  (no changes)\n";
        return ss.str();
    }
    for (const auto& record : changes.records()) {
        ss << "  " << describeRecord(record) << "\n";
        for (const auto& field : record.fieldChanges) {
            ss << "    " << describeField(field) << "\n";
        }
    }
    return ss.str();
}

std::string ReviewReportService::changeSetToMarkdown(const ChangeSet& changes) {
    std::stringstream ss;
    ss << "## Changes " << changes.baseVersion() << " -> " << changes.targetVersion() << "\n\n";
    ss << "| Added | Removed | Modified | Links | Allocations |\n";
    ss << "|---|---|---|---|---|\n";
    ss << "| " << changes.count(ChangeKind::EntityAdded)
       << " | " << changes.count(ChangeKind::EntityRemoved)
       << " | " << changes.count(ChangeKind::EntityModified)
       << " | " << changes.count(ChangeKind::LinkAdded) + changes.count(ChangeKind::LinkRemoved)
       << " | " << changes.count(ChangeKind::AllocationAdded) + changes.count(ChangeKind::AllocationRemoved)
       << " |\n\n";

    for (const auto& record : changes.records()) {
        ss << "- " << describeRecord(record) << "\n";
        for (const auto& field : record.fieldChanges) {
            ss << "  - `" << describeField(field) << "`\n";
        }
    }
    return ss.str();
}

std::string ReviewReportService::reviewSummary(const ReviewSession& session,
                                               std::chrono::system_clock::time_point now) {
    std::stringstream ss;
    ss << "# " << session.getName() << " (" << session.getId() << ")\n\n";
    if (!session.getDescription().empty()) {
        ss << session.getDescription() << "\n\n";
    }
    ss << "**Kind:** " << KindToString(session.getKind()) << "\n";
    ss << "**Status:** " << StatusToString(session.status(now)) << "\n";
    ss << "**Due:** " << formatDate(session.getDueDate()) << "\n";
    if (!session.getBaselineVersion().empty()) {
        ss << "**Baseline:** " << session.getBaselineVersion() << "\n";
    }
    if (session.isApproved()) {
        ss << "**Approved by:** " << session.getApprover() << " on "
           << formatDate(session.getApprovedAt()) << "\n";
    }

    ss << "\n## Participants\n\n";
    const auto& done = session.getCompletedReviewers();
    for (const auto& p : session.getParticipants()) {
        ss << "- " << p.name;
        if (!p.email.empty()) ss << " <" << p.email << ">";
        ss << " (" << RoleToString(p.role) << ")";
        if (p.role == Role::Reviewer) {
            ss << (done.count(p.name) ? " [done]" : " [pending]");
        }
        ss << "\n";
    }

    ss << "\n## Comments\n\n";
    const auto& comments = session.getLedger().comments();
    if (comments.empty()) {
        ss << "No comments.\n";
    }
    for (const auto& c : comments) {
        ss << "- #" << c.commentId << " " << c.target.label() << " by " << c.author;
        if (c.reopens) ss << " (reopens #" << *c.reopens << ")";
        ss << ": " << c.text << "\n";
        if (c.resolved) {
            ss << "  - Resolved";
            if (!c.resolvedBy.empty()) ss << " by " << c.resolvedBy;
            ss << ": " << c.resolution << "\n";
        } else {
            ss << "  - Open\n";
        }
    }
    return ss.str();
}

} // namespace safetyreview::application::review
