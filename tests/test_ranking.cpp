#include "core/winner_resolver.h"
#include <cassert>
#include <cstdint>
#include <iostream>
#include <vector>

using zackathon::core::RankedScore;
using zackathon::core::rankTopThree;

static void expectEntry(const RankedScore& r, uint64_t submissionId, uint64_t score) {
    assert(r.submissionId == submissionId);
    assert(r.score == score);
}

static void testTieAtSecondPlaceKeepsSubmissionOrder() {
    auto ranked = rankTopThree({30, 45, 45, 10});
    assert(ranked.size() == 3);
    expectEntry(ranked[0], 1, 45);
    expectEntry(ranked[1], 2, 45);
    expectEntry(ranked[2], 0, 30);
}

static void testSingleSubmission() {
    auto ranked = rankTopThree({12});
    assert(ranked.size() == 1);
    expectEntry(ranked[0], 0, 12);
}

static void testTwoSubmissions() {
    auto ranked = rankTopThree({5, 9});
    assert(ranked.size() == 2);
    expectEntry(ranked[0], 1, 9);
    expectEntry(ranked[1], 0, 5);
}

static void testEmpty() {
    assert(rankTopThree({}).empty());
}

// Zero scores still fill empty places.
static void testAllZero() {
    auto ranked = rankTopThree({0, 0, 0, 0});
    assert(ranked.size() == 3);
    expectEntry(ranked[0], 0, 0);
    expectEntry(ranked[1], 1, 0);
    expectEntry(ranked[2], 2, 0);
}

static void testCascadeFromThird() {
    auto ranked = rankTopThree({10, 20, 30, 40, 25});
    assert(ranked.size() == 3);
    expectEntry(ranked[0], 3, 40);
    expectEntry(ranked[1], 2, 30);
    expectEntry(ranked[2], 4, 25);
}

static void testLaterEqualScoreNeverDisplaces() {
    auto ranked = rankTopThree({50, 40, 30, 50, 40, 30});
    expectEntry(ranked[0], 0, 50);
    expectEntry(ranked[1], 3, 50);
    expectEntry(ranked[2], 1, 40);
}

int main() {
    testTieAtSecondPlaceKeepsSubmissionOrder();
    testSingleSubmission();
    testTwoSubmissions();
    testEmpty();
    testAllZero();
    testCascadeFromThird();
    testLaterEqualScoreNeverDisplaces();
    std::cout << "ranking tests passed" << std::endl;
    return 0;
}
