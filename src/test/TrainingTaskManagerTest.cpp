#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "application/TrainingTaskManager.hpp"
#include "TestDoubles.hpp"

using namespace ledgerlens;

namespace {

std::shared_ptr<application::CategorizationEngine> MakeEngine(std::shared_ptr<test::InMemoryMetricsRepository> metrics) {
    auto embedder = std::make_shared<test::HashingEmbedder>();
    auto index = std::make_shared<test::FlakyIndex>(embedder->dimension());
    auto expenses = std::make_shared<test::InMemoryExpenseRepository>();
    for (int i = 1; i <= 8; ++i) expenses->add(i, "Groceries", "milk and bread at lidl " + std::to_string(i));
    for (int i = 9; i <= 12; ++i) expenses->add(i, "Fuel", "diesel at orlen station " + std::to_string(i));
    return std::make_shared<application::CategorizationEngine>(embedder, index, expenses, metrics,
                                                               application::EngineConfig{}, test::CountingNamer("cv"));
}

} // namespace

int main() {
    std::cout << "[Test] Starting TrainingTaskManager Test..." << std::endl;

    auto metrics = std::make_shared<test::InMemoryMetricsRepository>();
    application::TrainingTaskManager tasks(MakeEngine(metrics));

    auto status = tasks.SubmitTraining(domain::TrainingType::Full);
    tasks.Wait(status);
    assert(status->isCompleted);
    assert(!status->failed);
    assert(status->progress == 1.0f);
    assert(status->snapshot && status->snapshot->categoryCount == 2);
    assert(metrics->snapshots.size() == 1);
    assert(tasks.GetActiveTasks().empty());
    assert(tasks.GetRetainedThreadCount() == 1);
    std::cout << "[PASS] Background training completes and records metrics" << std::endl;

    auto expired = tasks.SubmitTraining(domain::TrainingType::Full, std::chrono::milliseconds(0));
    tasks.Wait(expired);
    assert(tasks.GetRetainedThreadCount() == 1);
    assert(expired->failed);
    assert(!expired->snapshot);
    assert(!expired->Message().empty());
    assert(metrics->snapshots.size() == 1);
    std::cout << "[PASS] A run past its deadline is reported as failed" << std::endl;

    for (int i = 0; i < 3; ++i) {
        auto again = tasks.SubmitTraining(domain::TrainingType::Full, std::chrono::milliseconds(0));
        tasks.Wait(again);
    }
    assert(tasks.GetRetainedThreadCount() == 1);
    std::cout << "[PASS] Finished training threads are joined on the next submission" << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
