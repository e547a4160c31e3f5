#include <cassert>
#include <chrono>
#include <iostream>

#include "domain/model/DiffEngine.hpp"
#include "domain/model/EntityStore.hpp"
#include "domain/review/ReviewErrors.hpp"
#include "domain/review/ReviewRegistry.hpp"

using namespace safetyreview::domain::review;
using namespace safetyreview::domain::model;
using std::chrono::hours;

namespace {

using TimePoint = std::chrono::system_clock::time_point;
const TimePoint T0 = TimePoint(std::chrono::milliseconds(1700000000000LL));
const TimePoint DUE = T0 + hours(24 * 7);

template <typename Fn>
ReviewErrorCode errorOf(Fn&& fn) {
    try {
        fn();
    } catch (const ReviewError& e) {
        return e.code();
    }
    assert(false && "Expected a ReviewError.");
    return ReviewErrorCode::NotFound;
}

std::vector<Participant> team() {
    return {
        {"mia", "", Role::Moderator},
        {"alice", "", Role::Reviewer},
        {"carl", "", Role::Approver}
    };
}

Snapshot hazardModel(const std::string& label) {
    return Snapshot(label,
                    {Entity("H1", EntityKind::Node, {{"description", "unintended acceleration"}}),
                     Entity("H2", EntityKind::Node, {{"description", "loss of steering"}}),
                     Entity("H3", EntityKind::Node, {{"description", "door opens while driving"}})},
                    {Link{"H1", "H2", "child"}});
}

void testCreateSession() {
    std::cout << "[Test] Session creation..." << std::endl;
    ReviewRegistry registry;

    ReviewSession& first = registry.createSession(ReviewKind::Peer, ReviewScope({"H1"}), team(),
                                                  "HARA pass 1", "", DUE, T0);
    assert(first.getId() == "review-001");
    assert(first.getBaselineVersion().empty());
    ReviewSession& second = registry.createSession(ReviewKind::Joint, ReviewScope({"H1", "H2"}), team(),
                                                   "HARA pass 2", "", DUE, T0);
    assert(second.getId() == "review-002");

    assert(errorOf([&] {
               registry.createSession(ReviewKind::Joint, ReviewScope({"H1"}), team(), "HARA pass 1", "", DUE, T0);
           }) == ReviewErrorCode::DuplicateName);
    assert(errorOf([&] {
               registry.createSession(ReviewKind::Joint, ReviewScope({"H1"}),
                                      {{"alice", "", Role::Reviewer}}, "No moderator", "", DUE, T0);
           }) == ReviewErrorCode::InvalidParticipants);

    assert(registry.size() == 2);
    auto sessions = registry.sessions();
    assert(sessions[0]->getName() == "HARA pass 1");
    assert(sessions[1]->getName() == "HARA pass 2");
    assert(registry.findByName("HARA pass 2") == registry.find("review-002"));
    assert(errorOf([&] { registry.require("review-404"); }) == ReviewErrorCode::NotFound);
}

void testMergeIsIdempotent() {
    std::cout << "[Test] Merging comments twice equals merging once..." << std::endl;
    ReviewRegistry registry;
    ReviewSession& target = registry.createSession(ReviewKind::Joint, ReviewScope({"H1", "H2"}), team(),
                                                   "Consolidated", "", DUE, T0);
    std::string targetId = target.getId();

    // Comments collected in another copy of the model.
    CommentLedger foreign(ReviewScope({"H1", "H2", "H3", "H9"}));
    foreign.addComment({"H1"}, "alice", "Exposure should be E4.", T0);
    foreign.addComment({"H2", "description"}, "bob", "Wording.", T0);
    foreign.addComment({"H3"}, "bob", "Outside the consolidated scope.", T0);
    foreign.addComment({"H9"}, "bob", "Element deleted in that copy.", T0);
    int resolvedId = foreign.addComment({"H2"}, "alice", "Severity S3?", T0).commentId;
    foreign.resolve(resolvedId, "Kept S2 after discussion.", "mia", T0);

    Snapshot source = hazardModel("copy");
    assert(registry.mergeComments(source, foreign, targetId, T0) == 3);
    const CommentLedger& ledger = registry.require(targetId).getLedger();
    assert(ledger.size() == 3);
    assert(ledger.find(3).resolved);
    assert((ledger.unresolvedTargets() == std::set<std::string>{"H1", "H2"}));

    CommentLedger before = ledger;
    assert(registry.mergeComments(source, foreign, targetId, T0) == 0);
    assert(registry.require(targetId).getLedger() == before);
}

void testMergeCarriesOverResolution() {
    std::cout << "[Test] Merging takes over a resolution made in the other copy..." << std::endl;
    ReviewRegistry registry;
    ReviewSession& target = registry.createSession(ReviewKind::Joint, ReviewScope({"H1", "H2"}), team(),
                                                   "Consolidated", "", DUE, T0);
    int localId = target.addComment("alice", {"H2"}, "Severity S3?", T0).commentId;
    target.clearUncommittedEvents();

    CommentLedger foreign(ReviewScope({"H1", "H2"}));
    int foreignId = foreign.addComment({"H2"}, "alice", "Severity S3?", T0).commentId;
    foreign.resolve(foreignId, "Kept S2 after discussion.", "mia", T0 + hours(1));

    assert(registry.mergeComments(hazardModel("copy"), foreign, target.getId(), T0 + hours(2)) == 1);
    const Comment& local = target.getLedger().find(localId);
    assert(local.resolved);
    assert(local.resolvedBy == "mia");
    assert(local.resolution == "Kept S2 after discussion.");
    assert(target.getLedger().size() == 1);
    assert(target.getUncommittedEvents().size() == 1);

    assert(registry.mergeComments(hazardModel("copy"), foreign, target.getId(), T0 + hours(3)) == 0);
}

void testApprovedHistory() {
    std::cout << "[Test] Approval appends to the version history..." << std::endl;
    ReviewRegistry registry("rev");
    EntityStore store;
    store.restore(hazardModel("working"));

    std::string id = registry.createSession(ReviewKind::Joint, ReviewScope({"H1", "H2", "H3"}), team(),
                                            "Release 1", "", DUE, T0).getId();
    registry.require(id).markReviewerComplete("alice", T0);

    assert(registry.nextVersionLabel() == "rev1");
    const ApprovedVersion& v1 = registry.approve(id, "carl", store.currentSnapshot(), T0 + hours(2));
    assert(v1.label == "rev1");
    assert(v1.snapshot.version() == "rev1");
    assert(v1.sessionId == id);
    assert(v1.approver == "carl");
    assert(registry.require(id).getBaselineVersion() == "rev1");

    // Later reviews start from the latest approved version.
    store.setField("H3", "description", "door opens above 5 km/h");
    std::string next = registry.createSession(ReviewKind::Joint, ReviewScope({"H3"}), team(),
                                              "Release 2", "", DUE, T0).getId();
    assert(registry.require(next).getBaselineVersion() == "rev1");
    registry.require(next).markReviewerComplete("alice", T0);
    registry.approve(next, "carl", store.currentSnapshot(), T0 + hours(3));

    const auto& history = registry.approvedHistory();
    assert(history.size() == 2);
    assert(history[1].label == "rev2");
    assert(registry.latestApproved() == &history[1]);
    assert(registry.findVersion("rev1") == &history[0]);
    assert(registry.findVersion("rev9") == nullptr);

    ChangeSet changes = DiffEngine::diff(history[0].snapshot, history[1].snapshot);
    assert(changes.size() == 1);
    assert(changes.records()[0].entityId == "H3");

    // Nothing more can be merged into an approved review.
    CommentLedger foreign(ReviewScope({"H3"}));
    foreign.addComment({"H3"}, "alice", "Too late.", T0);
    assert(errorOf([&] { registry.mergeComments(hazardModel("copy"), foreign, next, T0); }) ==
           ReviewErrorCode::ReviewLocked);

    // A failed approval leaves the history untouched.
    std::string blocked = registry.createSession(ReviewKind::Joint, ReviewScope({"H1"}), team(),
                                                 "Release 3", "", DUE, T0).getId();
    assert(errorOf([&] { registry.approve(blocked, "carl", store.currentSnapshot(), T0); }) ==
           ReviewErrorCode::ApprovalBlocked);
    assert(registry.approvedHistory().size() == 2);
}

} // namespace

int main() {
    testCreateSession();
    testMergeIsIdempotent();
    testMergeCarriesOverResolution();
    testApprovedHistory();

    std::cout << "[PASS] ReviewRegistry Test." << std::endl;
    return 0;
}
