#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

#include "domain/model/EntityStore.hpp"
#include "domain/review/ReviewRegistry.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/review/ReviewEventStoreFs.hpp"
#include "infrastructure/review/ReviewSessionRepositoryFs.hpp"
#include "infrastructure/review/VersionHistoryRepositoryFs.hpp"

using namespace safetyreview::domain::model;
using namespace safetyreview::domain::review;
using namespace safetyreview::infrastructure;
using namespace safetyreview::infrastructure::review;
using std::chrono::hours;

namespace {

using TimePoint = std::chrono::system_clock::time_point;
const TimePoint T0 = TimePoint(std::chrono::milliseconds(1700000000123LL));

std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

Snapshot fmeaModel() {
    Entity row("F1", EntityKind::FmeaRow, {{"failure_mode", "valve stuck closed"}, {"severity", "8"}});
    row.allocations.insert("R1");
    return Snapshot("working",
                    {row,
                     Entity("R1", EntityKind::Requirement, {{"text", "Valve position shall be monitored"}}),
                     Entity("A1", EntityKind::ArchitectureElement, {{"name", "Hydraulic unit"}})},
                    {Link{"A1", "F1", "trace"}});
}

void testBackgroundWriterDrains(const std::string& root) {
    std::cout << "[Test] Queued writes land on disk after flush..." << std::endl;
    auto persistence = std::make_shared<PersistenceService>();
    std::filesystem::path file = std::filesystem::path(root) / "stress" / "out.txt";

    const int NUM_WRITERS = 8;
    const int WRITES_EACH = 25;
    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_WRITERS; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < WRITES_EACH; ++i) {
                persistence->saveTextAsync(file.string(), "writer " + std::to_string(t) + " #" + std::to_string(i));
            }
        });
    }
    for (auto& t : threads) t.join();

    persistence->flush();
    std::string content = readFile(file);
    assert(content.rfind("writer ", 0) == 0 && "Last write must be a complete document.");
    assert(persistence->failedWrites() == 0);

    persistence->saveTextAsync(file.string(), "final");
    persistence->stop();
    assert(readFile(file) == "final" && "stop() drains the queue.");
}

void testSessionRoundTrip(const std::string& root) {
    std::cout << "[Test] Sessions survive save and reload..." << std::endl;
    auto persistence = std::make_shared<PersistenceService>();
    auto repo = std::make_shared<ReviewSessionRepositoryFs>(std::make_unique<ReviewEventStoreFs>(root, persistence));

    ReviewRegistry registry;
    std::vector<Participant> team{
        {"mia", "mia@example.com", Role::Moderator},
        {"alice", "alice@example.com", Role::Reviewer},
        {"bob", "", Role::Reviewer},
        {"carl", "carl@example.com", Role::Approver}
    };
    ReviewSession& session = registry.createSession(ReviewKind::Joint, ReviewScope({"F1", "A1"}, {"R1"}), team,
                                                    "Hydraulics FMEA", "Second iteration", T0 + hours(240), T0);
    repo->update(session);

    int c1 = session.addComment("alice", {"F1", "severity"}, "Severity 8 seems high. Résumé below.", T0).commentId;
    session.addComment("bob", {"R1"}, "Requirement lacks a diagnostic interval.", T0);
    session.resolveComment("mia", c1, "Kept 8: loss of braking assist.", T0 + hours(1));
    session.reopenComment("alice", c1, "Please cite the HARA entry.", T0 + hours(2));
    session.extendDueDate("mia", T0 + hours(480), T0 + hours(3));
    session.editDescription("mia", "Second iteration, hydraulic unit only", T0 + hours(3));
    session.addParticipant("mia", {"dora", "", Role::Reviewer}, T0 + hours(4));
    session.removeParticipant("mia", "bob", T0 + hours(4));
    session.markReviewerComplete("alice", T0 + hours(5));

    Comment foreign(99, "erik", {"A1"}, "Merged from the supplier copy.", T0);
    foreign.markResolved("Accepted.", "mia", T0 + hours(1));
    assert(session.importComment(foreign, T0 + hours(6)));
    repo->update(session);
    assert(session.getUncommittedEvents().empty());

    auto loaded = repo->findById(session.getId());
    assert(loaded && "Session should be rehydrated.");
    assert(*loaded == session);
    assert(loaded->getLedger().size() == 4);
    assert(loaded->getLedger().find(3).reopens == std::optional<int>(c1));
    assert(loaded->getLedger().find(4).author == "erik");
    assert(loaded->getDescription() == "Second iteration, hydraulic unit only");
    assert(loaded->getDueDate() == T0 + hours(480));
    assert(loaded->getCreatedAt() == T0);

    auto all = repo->findAll();
    assert(all.size() == 1);
    assert(!repo->findById("review-404"));

    std::filesystem::path events = std::filesystem::path(root) / "reviews" / "sessions" / session.getId() / "events.ndjson";
    assert(std::filesystem::exists(events));

    // A damaged line makes the whole stream unreadable instead of shifting comment ids.
    persistence->flush();
    {
        std::ofstream out(events, std::ios::app);
        out << "{\"type\": \"CommentAdded\", \"data\": \n";
    }
    assert(!repo->findById(session.getId()));
    assert(repo->findAll().empty());
    persistence->stop();
}

void testVersionHistoryRoundTrip(const std::string& root) {
    std::cout << "[Test] Approved versions survive save and reload..." << std::endl;
    auto persistence = std::make_shared<PersistenceService>();
    VersionHistoryRepositoryFs repo(root, persistence);
    assert(repo.loadAll().empty());

    ApprovedVersion v1{"v1", fmeaModel().relabeled("v1"), "review-001", "carl", T0};
    EntityStore store;
    store.restore(fmeaModel());
    store.setField("F1", "severity", "7");
    store.deallocate("F1", "R1");
    ApprovedVersion v2{"v2", store.currentSnapshot("v2"), "review-002", "carl", T0 + hours(24)};

    repo.append(v1);
    repo.append(v2);

    auto versions = repo.loadAll();
    assert(versions.size() == 2);
    assert(versions[0] == v1);
    assert(versions[1] == v2);
    assert(versions[1].snapshot.find("F1")->allocations.empty());
    assert(std::filesystem::exists(std::filesystem::path(root) / "reviews" / "versions" / "v2.json"));

    // A second repository over the same directory sees the same history.
    VersionHistoryRepositoryFs reopened(root, std::make_shared<PersistenceService>());
    assert(reopened.loadAll().size() == 2);

    // A missing snapshot must not shorten the history, or v2 would be handed out again.
    persistence->flush();
    std::filesystem::remove(std::filesystem::path(root) / "reviews" / "versions" / "v1.json");
    bool threw = false;
    try {
        reopened.loadAll();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    persistence->stop();
}

void testSettings(const std::string& root) {
    std::cout << "[Test] settings.json load/save..." << std::endl;
    ReviewSettings defaults = ConfigLoader::LoadReviewSettings(root);
    assert(defaults.defaultReviewDays == 14);
    assert(defaults.versionPrefix == "v");

    {
        std::ofstream out(std::filesystem::path(root) / "settings.json");
        out << R"({"theme": "dark", "review_default_days": 0, "version_prefix": "rel-"})";
    }
    ReviewSettings partial = ConfigLoader::LoadReviewSettings(root);
    assert(partial.defaultReviewDays == 14 && "Non-positive durations fall back to the default.");
    assert(partial.versionPrefix == "rel-");

    ReviewSettings custom;
    custom.defaultReviewDays = 21;
    custom.versionPrefix = "baseline-";
    assert(ConfigLoader::SaveReviewSettings(root, custom));
    ReviewSettings reread = ConfigLoader::LoadReviewSettings(root);
    assert(reread.defaultReviewDays == 21);
    assert(reread.versionPrefix == "baseline-");
    assert(readFile(std::filesystem::path(root) / "settings.json").find("\"theme\"") != std::string::npos);

    {
        std::ofstream out(std::filesystem::path(root) / "settings.json");
        out << "{ not json";
    }
    assert(ConfigLoader::LoadReviewSettings(root).defaultReviewDays == 14);
}

} // namespace

int main() {
    std::cout << "[Test] Starting Review Persistence Round-Trip Test..." << std::endl;

    std::string testRoot = (std::filesystem::temp_directory_path() / "safetyreview_persistence_test").string();
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);

    testBackgroundWriterDrains(testRoot);
    testSessionRoundTrip(testRoot);
    testVersionHistoryRoundTrip(testRoot);
    testSettings(testRoot);

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] Review Persistence Round-Trip Test." << std::endl;
    return 0;
}
