#include <catch2/catch.hpp>
#include "test_helpers.hpp"

#include <set>
#include <stdexcept>

using namespace Latent;

namespace {
    torch::Tensor indexed_inputs(std::int64_t rows) {
        return torch::arange(rows, torch::kFloat32).unsqueeze(1);
    }

    std::set<std::int64_t> rows_of(const torch::Tensor& batch) {
        std::set<std::int64_t> rows;
        const auto values = batch.to(torch::kInt64).reshape({-1});
        for (std::int64_t i = 0; i < values.size(0); ++i) {
            rows.insert(values[i].item<std::int64_t>());
        }
        return rows;
    }
}

TEST_CASE("Every example is served once per epoch", "[data][batch]") {
    Data::BatchProvider provider(indexed_inputs(10), {}, 3);

    const auto first = rows_of(provider.next_batch(5).inputs);
    const auto second = rows_of(provider.next_batch(5).inputs);
    REQUIRE(first.size() == 5);
    REQUIRE(second.size() == 5);

    std::set<std::int64_t> all(first);
    all.insert(second.begin(), second.end());
    REQUIRE(all.size() == 10);
    REQUIRE(provider.epochs_completed() == 0);
}

TEST_CASE("A new permutation starts when the remainder cannot fill a batch", "[data][batch]") {
    Data::BatchProvider provider(indexed_inputs(10), {}, 3);
    (void)provider.next_batch(4);
    (void)provider.next_batch(4);
    REQUIRE(provider.epochs_completed() == 0);

    const auto third = provider.next_batch(4);
    REQUIRE(provider.epochs_completed() == 1);
    REQUIRE(rows_of(third.inputs).size() == 4);
}

TEST_CASE("Labels follow their inputs", "[data][batch]") {
    const auto labels = torch::arange(12, torch::kInt64) * 10;
    Data::BatchProvider provider(indexed_inputs(12), labels, 9);

    for (int step = 0; step < 5; ++step) {
        const auto batch = provider.next_batch(4);
        REQUIRE(batch.labels.defined());
        REQUIRE(torch::equal(batch.labels, batch.inputs.squeeze(1).to(torch::kInt64) * 10));
    }
}

TEST_CASE("Shuffling is reproducible and can be disabled", "[data][batch]") {
    Data::BatchProvider first(indexed_inputs(20), {}, 5);
    Data::BatchProvider second(indexed_inputs(20), {}, 5);
    REQUIRE(torch::equal(first.next_batch(20).inputs, second.next_batch(20).inputs));

    Data::BatchProvider ordered(indexed_inputs(6), {}, 5, false);
    REQUIRE(torch::equal(ordered.next_batch(3).inputs, indexed_inputs(3)));
    REQUIRE_FALSE(ordered.next_batch(3).labels.defined());
}

TEST_CASE("BatchProvider rejects invalid requests", "[data][batch]") {
    REQUIRE_THROWS_AS(Data::BatchProvider(torch::zeros({4})), std::invalid_argument);
    REQUIRE_THROWS_AS(Data::BatchProvider(torch::zeros({0, 3})), std::logic_error);
    REQUIRE_THROWS_AS(Data::BatchProvider(indexed_inputs(4), torch::zeros({3})), std::invalid_argument);

    Data::BatchProvider provider(indexed_inputs(4));
    REQUIRE_THROWS_AS(provider.next_batch(0), std::invalid_argument);
    REQUIRE_THROWS_AS(provider.next_batch(5), std::invalid_argument);
}
