#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

#include "application/IdentityPriorityQueue.hpp"

using namespace schedsync;
using schedsync::application::IdentityPriorityQueue;

namespace {

domain::Identity Id(const std::string& studentId) {
    return domain::Identity{studentId, studentId + "@example.edu", ""};
}

std::string PopId(IdentityPriorityQueue& queue) {
    auto identity = queue.popHighest();
    assert(identity && "Queue should not be empty here.");
    return identity->studentId;
}

void TestHighestFirst() {
    IdentityPriorityQueue queue;
    queue.updateScore(Id("A"), 3);
    queue.updateScore(Id("B"), 1);
    queue.updateScore(Id("C"), 7);

    assert(queue.size() == 3);
    assert(PopId(queue) == "C");
    assert(PopId(queue) == "A");
    assert(PopId(queue) == "B");
    assert(!queue.popHighest() && "Empty queue pops nothing.");
    std::cout << "[PASS] Highest score first (C, A, B)." << std::endl;
}

void TestTiesKeepInsertionOrder() {
    IdentityPriorityQueue queue;
    queue.updateScore(Id("X"), 2);
    queue.updateScore(Id("Y"), 2);
    queue.updateScore(Id("Z"), 1);
    queue.updateScore(Id("Z"), 1);

    assert(queue.score("Z") == 2);
    assert(PopId(queue) == "X");
    assert(PopId(queue) == "Y");
    assert(PopId(queue) == "Z" && "Increasing a score keeps the original insertion sequence.");
    std::cout << "[PASS] Ties broken by insertion order." << std::endl;
}

void TestZeroRemovesAndReinsertIsFresh() {
    IdentityPriorityQueue queue;
    queue.updateScore(Id("Z"), 2);
    queue.updateScore(Id("W"), 2);

    queue.updateScore(Id("Z"), -2);
    assert(!queue.contains("Z") && "A score of zero removes the identity.");
    assert(queue.score("Z") == 0);

    queue.updateScore(Id("Q"), -5);
    assert(!queue.contains("Q") && "Non-positive updates never insert.");

    queue.updateScore(Id("Z"), 2);
    assert(PopId(queue) == "W");
    assert(PopId(queue) == "Z" && "Re-inserted identity queues behind existing ties.");
    assert(queue.empty());
    std::cout << "[PASS] Removal and re-insertion." << std::endl;
}

void TestConcurrentUpdates() {
    IdentityPriorityQueue queue;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&queue]() {
            for (int i = 0; i < 100; ++i) queue.updateScore(Id("hot"), 1);
        });
    }
    for (auto& t : threads) t.join();
    assert(queue.score("hot") == 800);

    auto popped = queue.popHighestWithScore();
    assert(popped && popped->first.studentId == "hot" && popped->second == 800);
    std::cout << "[PASS] Concurrent updates." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting IdentityPriorityQueue Test..." << std::endl;
    TestHighestFirst();
    TestTiesKeepInsertionOrder();
    TestZeroRemovesAndReinsertIsFresh();
    TestConcurrentUpdates();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
