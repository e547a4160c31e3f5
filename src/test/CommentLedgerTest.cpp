#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>

#include "domain/review/CommentLedger.hpp"
#include "domain/review/ReviewErrors.hpp"

using namespace safetyreview::domain::review;

namespace {

const auto T0 = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000000LL));

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

CommentLedger makeLedger() {
    return CommentLedger(ReviewScope({"N1", "N2"}, {"R1"}));
}

void testAddAndQuery() {
    std::cout << "[Test] Comments are numbered and grouped per element..." << std::endl;
    CommentLedger ledger = makeLedger();

    const Comment& first = ledger.addComment({"N1"}, "alice", "Probability looks too low.", T0);
    assert(first.commentId == 1);
    ledger.addComment({"N1", "description"}, "bob", "Typo in description.", T0);
    ledger.addComment({"R1"}, "bob", "Requirement is not testable.", T0);

    assert(ledger.size() == 3);
    assert(ledger.commentsFor("N1").size() == 2);
    assert(ledger.commentsFor("N2").empty());
    assert(ledger.find(2).target.label() == "N1.description");
    assert((ledger.unresolvedTargets() == std::set<std::string>{"N1", "R1"}));
    assert(!ledger.allResolved());
}

void testScopeAndBlankText() {
    std::cout << "[Test] Out-of-scope targets and blank text are rejected..." << std::endl;
    CommentLedger ledger = makeLedger();

    assert(errorOf([&] { ledger.addComment({"N9"}, "alice", "Not reviewed here.", T0); }) ==
           ReviewErrorCode::OutOfScope);

    bool thrown = false;
    try {
        ledger.addComment({"N1"}, "alice", "   ", T0);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    assert(ledger.size() == 0);
}

void testResolve() {
    std::cout << "[Test] Resolution requires an explanation and happens once..." << std::endl;
    CommentLedger ledger = makeLedger();
    int id = ledger.addComment({"N2"}, "alice", "Missing failure rate.", T0).commentId;

    assert(errorOf([&] { ledger.resolve(id, ""); }) == ReviewErrorCode::EmptyExplanation);
    assert(errorOf([&] { ledger.resolve(id, " \t "); }) == ReviewErrorCode::EmptyExplanation);
    assert(!ledger.find(id).resolved);

    const Comment& resolved = ledger.resolve(id, "Added FIT value from datasheet.", "mia", T0);
    assert(resolved.resolved);
    assert(resolved.resolution == "Added FIT value from datasheet.");
    assert(resolved.resolvedBy == "mia");
    assert(ledger.allResolved());
    assert(ledger.unresolvedTargets().empty());

    assert(errorOf([&] { ledger.resolve(id, "Again."); }) == ReviewErrorCode::AlreadyResolved);
    // A resolved comment takes precedence over a blank explanation.
    assert(errorOf([&] { ledger.resolve(id, ""); }) == ReviewErrorCode::AlreadyResolved);

    bool thrown = false;
    try {
        ledger.resolve(42, "No such comment.");
    } catch (const std::out_of_range&) {
        thrown = true;
    }
    assert(thrown);
}

void testReopenAppends() {
    std::cout << "[Test] Reopening appends a follow-up and keeps the resolution..." << std::endl;
    CommentLedger ledger = makeLedger();
    int id = ledger.addComment({"N1"}, "alice", "Severity should be S3.", T0).commentId;

    bool thrown = false;
    try {
        ledger.reopen(id, "alice", "Still wrong.", T0);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown && "Only resolved comments can be reopened.");

    ledger.resolve(id, "Changed to S3.", "mia", T0);
    const Comment& followUp = ledger.reopen(id, "alice", "Controllability also changes.", T0);
    assert(followUp.commentId == 2);
    assert(followUp.reopens && *followUp.reopens == id);
    assert(followUp.target == ledger.find(id).target);
    assert(ledger.find(id).resolved);
    assert(!ledger.allResolved());
}

void testImport() {
    std::cout << "[Test] Imported comments keep their state but get local ids..." << std::endl;
    CommentLedger source(ReviewScope({"N1", "N2", "N3"}));
    source.addComment({"N3"}, "carl", "Outside target scope.", T0);
    int resolvedId = source.addComment({"N2"}, "carl", "Check diagnostic coverage.", T0).commentId;
    source.resolve(resolvedId, "Coverage is 90%.", "mia", T0);

    CommentLedger target = makeLedger();
    target.addComment({"N1"}, "alice", "Local remark.", T0);

    const Comment& original = source.find(resolvedId);
    assert(!target.containsDuplicateOf(original));
    const Comment& imported = target.import(original);
    assert(imported.commentId == 2);
    assert(imported.resolved);
    assert(imported.resolution == "Coverage is 90%.");
    assert(target.containsDuplicateOf(original));

    assert(errorOf([&] { target.import(source.find(1)); }) == ReviewErrorCode::OutOfScope);
}

} // namespace

int main() {
    testAddAndQuery();
    testScopeAndBlankText();
    testResolve();
    testReopenAppends();
    testImport();

    std::cout << "[PASS] CommentLedger Test." << std::endl;
    return 0;
}
