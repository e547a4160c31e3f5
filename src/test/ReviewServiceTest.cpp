#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <iostream>

#include "application/review/ReviewReportService.hpp"
#include "application/review/ReviewService.hpp"
#include "domain/model/DiffEngine.hpp"
#include "domain/review/ReviewErrors.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/review/ReviewEventStoreFs.hpp"
#include "infrastructure/review/ReviewSessionRepositoryFs.hpp"
#include "infrastructure/review/VersionHistoryRepositoryFs.hpp"

using namespace safetyreview::application::review;
using namespace safetyreview::domain::model;
using namespace safetyreview::domain::review;
using namespace safetyreview::infrastructure;
using namespace safetyreview::infrastructure::review;
using std::chrono::hours;

namespace {

using TimePoint = std::chrono::system_clock::time_point;

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

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

struct Fixture {
    std::string root;
    std::shared_ptr<EntityStore> store = std::make_shared<EntityStore>();
    std::shared_ptr<PersistenceService> persistence = std::make_shared<PersistenceService>();
    // Sub-millisecond part must be dropped by the service clock.
    TimePoint clock = TimePoint(std::chrono::milliseconds(1700000000000LL)) + std::chrono::microseconds(250);

    std::unique_ptr<ReviewService> makeService(ReviewSettings settings = {}) {
        auto sessions = std::make_shared<ReviewSessionRepositoryFs>(std::make_unique<ReviewEventStoreFs>(root, persistence));
        auto versions = std::make_shared<VersionHistoryRepositoryFs>(root, persistence);
        return std::make_unique<ReviewService>(store, sessions, versions, settings, [this] { return clock; });
    }
};

std::vector<Participant> team() {
    return {
        {"mia", "mia@example.com", Role::Moderator},
        {"alice", "alice@example.com", Role::Reviewer},
        {"bob", "bob@example.com", Role::Reviewer},
        {"carl", "carl@example.com", Role::Approver}
    };
}

void seedModel(EntityStore& store) {
    store.upsertEntity(Entity("N0", EntityKind::Node, {{"description", "loss of braking"}}));
    store.upsertEntity(Entity("N1", EntityKind::Node, {{"description", "brake fails"}}));
    store.upsertEntity(Entity("N2", EntityKind::Node, {{"description", "pedal sensor fault"}}));
    store.upsertEntity(Entity("R1", EntityKind::Requirement, {{"text", "Brake shall be redundant"}}));
    store.addLink(Link{"N0", "N1", "child"});
    store.addLink(Link{"N0", "N2", "child"});
    store.allocate("N1", "R1");
}

void testJointReviewToApproval(Fixture& f) {
    std::cout << "[Test] Joint review from start to approved version..." << std::endl;
    auto service = f.makeService();
    TimePoint start = service->now();
    assert(start == TimePoint(std::chrono::milliseconds(1700000000000LL)));

    std::string id = service->startJointReview("Brake FTA", "Initial FTA", ReviewScope({"N0", "N1"}, {"R1"}), team());
    assert(id == "review-001");
    assert(service->getReview(id).getDueDate() == start + hours(24 * 14));
    assert(service->status(id) == ReviewStatus::Open);
    assert(errorOf([&] {
               service->startPeerReview("Brake FTA", "", ReviewScope({"N0"}), team());
           }) == ReviewErrorCode::DuplicateName);

    // Nothing approved yet: everything in scope shows up as added.
    ChangeSet onOpen = service->compareOnOpen(id);
    assert(onOpen.count(ChangeKind::EntityAdded) == 3);
    assert(onOpen.count(ChangeKind::LinkAdded) == 1);

    int c1 = service->addComment(id, "alice", {"N1", "description"}, "Too vague.");
    int c2 = service->addComment(id, "carl", {"R1"}, "Which redundancy?");
    assert(errorOf([&] { service->addComment(id, "bob", {"N2"}, "Not in scope."); }) == ReviewErrorCode::OutOfScope);
    assert((service->unresolvedTargets(id) == std::set<std::string>{"N1", "R1"}));

    service->markReviewerComplete(id, "alice");
    service->markReviewerComplete(id, "bob");
    assert(errorOf([&] { service->approve(id, "carl"); }) == ReviewErrorCode::ApprovalBlocked);

    assert(errorOf([&] { service->resolveComment(id, "mia", c1, ""); }) == ReviewErrorCode::EmptyExplanation);
    service->resolveComment(id, "mia", c1, "Described as hydraulic pressure loss.");
    service->resolveComment(id, "mia", c2, "Dual circuit.");
    assert(errorOf([&] { service->resolveComment(id, "mia", c2, "Again."); }) == ReviewErrorCode::AlreadyResolved);

    f.store->setField("N1", "description", "brake fails intermittently");
    std::string label = service->approve(id, "carl");
    assert(label == "v1");
    assert(service->status(id) == ReviewStatus::Approved);
    assert(service->registry().approvedHistory().size() == 1);
    assert(service->registry().latestApproved()->snapshot.find("N1")->field("description") ==
           "brake fails intermittently");
    assert(errorOf([&] { service->addComment(id, "alice", {"N1"}, "Late."); }) == ReviewErrorCode::ReviewLocked);
}

void testCompareVersions(Fixture& f) {
    std::cout << "[Test] Comparing approved versions with the working model..." << std::endl;
    auto service = f.makeService();
    assert(service->compareVersions("v1", "working").empty());

    f.store->setField("N2", "description", "pedal sensor stuck");
    f.store->upsertEntity(Entity("N3", EntityKind::Node, {{"description", "master cylinder leak"}}));
    f.store->addLink(Link{"N0", "N3", "child"});

    ChangeSet all = service->compareVersions("v1", "working");
    assert(all.baseVersion() == "v1");
    assert(all.targetVersion() == "working");
    assert(all.count(ChangeKind::EntityAdded) == 1);
    assert(all.count(ChangeKind::EntityModified) == 1);
    assert(all.count(ChangeKind::LinkAdded) == 1);

    ChangeSet scoped = service->compareVersions("v1", "working", std::set<std::string>{"N0", "N1"});
    assert(scoped.empty());

    assert(errorOf([&] { service->compareVersions("v7", "working"); }) == ReviewErrorCode::NotFound);

    // New reviews start from the latest approved version.
    std::string id = service->startPeerReview("Sensor follow-up", "", ReviewScope({"N2", "N3"}), team(),
                                              service->now() + hours(48));
    assert(service->getReview(id).getBaselineVersion() == "v1");
    ChangeSet onOpen = service->compareOnOpen(id);
    assert(onOpen.entityIds(ChangeKind::EntityAdded) == std::vector<std::string>{"N3"});
    assert(onOpen.entityIds(ChangeKind::EntityModified) == std::vector<std::string>{"N2"});
    // N0 -> N3 crosses the scope boundary.
    assert(onOpen.count(ChangeKind::LinkAdded) == 0);
    assert(errorOf([&] { service->approve(id, "carl"); }) == ReviewErrorCode::PermissionDenied);
}

void testReadOnlyAndMerge(Fixture& f) {
    std::cout << "[Test] Due dates, reopen and merging..." << std::endl;
    auto service = f.makeService();
    std::string id = "review-002";
    assert(service->getReview(id).getName() == "Sensor follow-up");

    int c = service->addComment(id, "alice", {"N3"}, "Leak rate unknown.");
    service->resolveComment(id, "mia", c, "Added 2 ml/min.");
    int follow = service->reopenComment(id, "bob", c, "Source for 2 ml/min?");
    assert(service->getReview(id).getLedger().find(follow).reopens == std::optional<int>(c));

    // Past the due date: comments still work, completion does not.
    f.clock += hours(72);
    assert(service->status(id) == ReviewStatus::ReadOnly);
    service->addComment(id, "carl", {"N2"}, "Comment after the due date.");
    assert(errorOf([&] { service->markReviewerComplete(id, "alice"); }) == ReviewErrorCode::ReviewLocked);
    assert(errorOf([&] { service->extendDueDate(id, "alice", f.clock + hours(24)); }) ==
           ReviewErrorCode::PermissionDenied);
    service->extendDueDate(id, "mia", f.clock + hours(24));
    assert(service->status(id) == ReviewStatus::Open);

    service->editDescription(id, "mia", "Sensor and leak follow-up");
    service->addParticipant(id, "mia", {"dora", "dora@example.com", Role::Reviewer});
    service->removeParticipant(id, "mia", "dora");

    CommentLedger copy(ReviewScope({"N2", "N3"}));
    copy.addComment({"N2"}, "erik", "Sensor plausibility check missing.", service->now());
    copy.addComment({"N3"}, "erik", "Leak detection?", service->now());
    Snapshot copyModel = f.store->currentSnapshot("copy");
    assert(service->mergeCommentsFrom(id, copyModel, copy) == 2);
    assert(service->mergeCommentsFrom(id, copyModel, copy) == 0);
    assert(service->getReview(id).getLedger().size() == 5);
}

void testReloadFromDisk(Fixture& f) {
    std::cout << "[Test] A fresh service sees the persisted state..." << std::endl;
    auto first = f.makeService();
    auto second = f.makeService();

    assert(second->registry().size() == 2);
    for (const auto* session : first->registry().sessions()) {
        assert(second->getReview(session->getId()) == *session);
    }
    assert(second->registry().approvedHistory() == first->registry().approvedHistory());
    assert(second->registry().nextVersionLabel() == "v2");

    ReviewSettings custom;
    custom.versionPrefix = "rel";
    auto prefixed = f.makeService(custom);
    assert(prefixed->registry().nextVersionLabel() == "rel2");
}

void testReports(Fixture& f) {
    std::cout << "[Test] Report rendering..." << std::endl;
    auto service = f.makeService();

    TextDelta delta = DiffEngine::textDelta("brake fails", "brake fails intermittently");
    assert(ReviewReportService::formatDelta(delta) == "brake fails{+ intermittently+}");
    TextDelta swap = DiffEngine::textDelta("stuck open", "stuck closed");
    assert(ReviewReportService::formatDelta(swap) == "stuck [-open-]{+closed+}");

    std::string text = ReviewReportService::changeSetToText(service->compareVersions("v1", "working"));
    assert(contains(text, "Changes v1 -> working"));
    assert(contains(text, "added node N3"));
    assert(contains(text, "description: pedal sensor [-fault-]{+stuck+}"));
    assert(contains(text, "link_added N0 -> N3 (child)"));
    assert(contains(ReviewReportService::changeSetToText(service->compareVersions("v1", "v1")), "(no changes)"));

    std::string md = ReviewReportService::changeSetToMarkdown(service->compareVersions("v1", "working"));
    assert(contains(md, "| 1 | 0 | 1 | 1 | 0 |"));

    std::string summary = ReviewReportService::reviewSummary(service->getReview("review-001"), service->now());
    assert(contains(summary, "# Brake FTA (review-001)"));
    assert(contains(summary, "**Status:** approved"));
    assert(contains(summary, "**Approved by:** carl"));
    assert(contains(summary, "- alice <alice@example.com> (reviewer) [done]"));
    assert(contains(summary, "Resolved by mia: Dual circuit."));
}

void testFailedApprovalIsRolledBack(const std::string& root) {
    std::cout << "[Test] An approval that cannot be stored changes nothing..." << std::endl;
    Fixture f;
    f.root = root;
    seedModel(*f.store);
    auto service = f.makeService();

    std::string id = service->startJointReview("Brake FTA", "", ReviewScope({"N0", "N1"}), team());
    service->markReviewerComplete(id, "alice");
    service->markReviewerComplete(id, "bob");

    std::filesystem::path index = std::filesystem::path(root) / "reviews" / "versions" / "index.json";
    std::filesystem::create_directories(index.parent_path());
    {
        std::ofstream out(index);
        out << "{ not json";
    }

    bool threw = false;
    try {
        service->approve(id, "carl");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    assert(service->status(id) == ReviewStatus::Open);
    assert(service->registry().approvedHistory().empty());
    assert(service->registry().nextVersionLabel() == "v1");

    auto reloaded = f.makeService();
    assert(reloaded->status(id) == ReviewStatus::Open);
    assert(reloaded->registry().approvedHistory().empty());
    assert(reloaded->getReview(id) == service->getReview(id));

    // Once the index is readable again the same approval goes through.
    {
        std::ofstream out(index);
        out << "[]";
    }
    assert(service->approve(id, "carl") == "v1");
    assert(f.makeService()->status(id) == ReviewStatus::Approved);
    f.persistence->stop();
}

} // namespace

int main() {
    std::cout << "[Test] Starting ReviewService Test..." << std::endl;

    Fixture f;
    f.root = (std::filesystem::temp_directory_path() / "safetyreview_service_test").string();
    std::filesystem::remove_all(f.root);
    std::filesystem::create_directories(f.root);
    seedModel(*f.store);

    testJointReviewToApproval(f);
    testCompareVersions(f);
    testReadOnlyAndMerge(f);
    testReloadFromDisk(f);
    testReports(f);

    f.persistence->stop();
    std::filesystem::remove_all(f.root);

    std::string rollbackRoot = (std::filesystem::temp_directory_path() / "safetyreview_rollback_test").string();
    std::filesystem::remove_all(rollbackRoot);
    std::filesystem::create_directories(rollbackRoot);
    testFailedApprovalIsRolledBack(rollbackRoot);
    std::filesystem::remove_all(rollbackRoot);

    std::cout << "[PASS] ReviewService Test." << std::endl;
    return 0;
}
