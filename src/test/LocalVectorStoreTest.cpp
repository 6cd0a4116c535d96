#include <cassert>
#include <filesystem>
#include <iostream>
#include <stdexcept>

#include "infrastructure/LocalVectorStore.hpp"
#include "infrastructure/PersistenceService.hpp"

using namespace ledgerlens;
using infrastructure::LocalVectorStore;

namespace {

domain::VectorPoint P(domain::ExpenseId id, std::vector<float> v, const std::string& category) {
    domain::VectorPoint p;
    p.id = id;
    p.vector = std::move(v);
    p.payload.category = category;
    p.payload.amount = 12.5;
    p.payload.date = "2024-05-01";
    return p;
}

void TestUpsertIsIdempotent() {
    LocalVectorStore store(3);
    store.createPartition("expenses");
    store.upsert("expenses", {P(1, {1, 0, 0}, "Fuel")});
    store.upsert("expenses", {P(1, {1, 0, 0}, "Fuel")});
    assert(store.pointCount("expenses") == 1);

    store.upsert("expenses", {P(1, {0, 1, 0}, "Groceries")});
    assert(store.pointCount("expenses") == 1);
    auto hits = store.query("expenses", {0, 1, 0}, 5);
    assert(hits.size() == 1 && *hits[0].payload.category == "Groceries");
    std::cout << "[PASS] Upsert replaces by id" << std::endl;
}

void TestQueryOrdering() {
    LocalVectorStore store(2);
    store.upsert("p", {
        P(1, {1.0f, 0.0f}, "A"),
        P(2, {0.7f, 0.7f}, "B"),
        P(3, {0.0f, 1.0f}, "C"),
        P(4, {-1.0f, 0.0f}, "D")
    });

    auto hits = store.query("p", {1.0f, 0.1f}, 3);
    assert(hits.size() == 3);
    assert(hits[0].id == 1 && hits[1].id == 2 && hits[2].id == 3);
    assert(hits[0].similarity >= hits[1].similarity && hits[1].similarity >= hits[2].similarity);
    assert(*hits[0].payload.amount == 12.5 && *hits[0].payload.date == "2024-05-01");

    assert(store.query("p", {1.0f, 0.0f}, 0).empty());
    assert(store.query("missing", {1.0f, 0.0f}, 3).empty());
    std::cout << "[PASS] Neighbors ordered by descending cosine similarity" << std::endl;
}

void TestPartitionsAreIsolated() {
    LocalVectorStore store(2);
    store.createPartition("expenses");
    store.createPartition("cv_a");
    store.upsert("cv_a", {P(7, {1, 0}, "A")});
    assert(store.pointCount("expenses") == 0);
    assert(store.pointCount("cv_a") == 1);

    store.deletePartition("cv_a");
    store.deletePartition("never-created");
    assert(store.pointCount("cv_a") == 0);
    assert(store.partitions().size() == 1);
    std::cout << "[PASS] Partitions are independent and deletable" << std::endl;
}

void TestDimensionIsFixed() {
    LocalVectorStore store(3);
    bool threw = false;
    try {
        store.upsert("p", {P(1, {1, 0}, "A")});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(store.pointCount("p") == 0);

    threw = false;
    try {
        store.query("p", {1, 0, 0, 0}, 1);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Wrong dimension is rejected" << std::endl;
}

void TestSnapshotReload() {
    std::filesystem::path root = "test_vector_store_root";
    std::filesystem::remove_all(root);
    auto snapshot = root / "vectors.json";

    {
        auto persistence = std::make_shared<infrastructure::PersistenceService>();
        LocalVectorStore store(2, persistence, snapshot, {"expenses"});
        store.upsert("expenses", {P(1, {1, 0}, "Fuel"), P(2, {0, 1}, "Groceries")});
        store.upsert("cv_tmp", {P(3, {1, 1}, "Fuel")});
        persistence->flush();
    }

    LocalVectorStore reloaded(2, nullptr, snapshot, {"expenses"});
    assert(reloaded.pointCount("expenses") == 2);
    assert(reloaded.pointCount("cv_tmp") == 0);
    auto hits = reloaded.query("expenses", {0, 1}, 1);
    assert(hits[0].id == 2 && *hits[0].payload.category == "Groceries");

    LocalVectorStore otherDimension(3, nullptr, snapshot, {"expenses"});
    assert(otherDimension.pointCount("expenses") == 0);

    std::filesystem::remove_all(root);
    std::cout << "[PASS] Durable partitions survive a reload" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting LocalVectorStore Test..." << std::endl;
    TestUpsertIsIdempotent();
    TestQueryOrdering();
    TestPartitionsAreIsolated();
    TestDimensionIsFixed();
    TestSnapshotReload();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
