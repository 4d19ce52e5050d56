#include <gtest/gtest.h>
#include <limits>
#include <thread>
#include <vector>
#include "../src/core/fee_aggregator.hpp"

using namespace fee_estimator;

namespace {

FeeExtra extra(const std::string& name, int64_t subtotal) {
    FeeExtra e;
    e.name = name;
    e.subtotal = subtotal;
    return e;
}

FeeEstimate estimate(int64_t base, std::vector<FeeExtra> extras = {}) {
    FeeEstimate e;
    e.base = base;
    e.extras = std::move(extras);
    return e;
}

FeeBreakdown example_breakdown() {
    FeeBreakdown b;
    b.network_multiplier = 3;
    b.node = estimate(100, {extra("SIGNATURES", 20), extra("BYTES", 5)});
    b.service = estimate(50);
    return b;
}

}  // namespace

TEST(FeeAggregatorTest, SubtotalIsBasePlusExtras) {
    EXPECT_EQ(compute_subtotal(estimate(100, {extra("a", 20), extra("b", 5)})), 125);
}

TEST(FeeAggregatorTest, SubtotalWithoutExtrasIsBase) {
    EXPECT_EQ(compute_subtotal(estimate(42)), 42);
    EXPECT_EQ(compute_subtotal(estimate(0)), 0);
}

TEST(FeeAggregatorTest, NetworkSubtotalScalesNodeSubtotal) {
    auto node = estimate(100, {extra("a", 25)});
    EXPECT_EQ(compute_network_subtotal(node, 3), 375);
    EXPECT_EQ(compute_network_subtotal(node, 1), 125);
}

TEST(FeeAggregatorTest, ZeroMultiplierGivesZeroNetworkFee) {
    EXPECT_EQ(compute_network_subtotal(estimate(1000000, {extra("a", 7)}), 0), 0);
}

TEST(FeeAggregatorTest, DeriveWorkedExample) {
    auto r = derive_response(example_breakdown());
    EXPECT_EQ(r.node.subtotal, 125);
    EXPECT_EQ(r.network.subtotal, 375);
    EXPECT_EQ(r.network.multiplier, 3);
    EXPECT_EQ(r.service.subtotal, 50);
    EXPECT_EQ(r.total, 550);
    EXPECT_EQ(compute_response_total(r), 550);
}

TEST(FeeAggregatorTest, DeriveAllZero) {
    FeeBreakdown b;
    b.network_multiplier = 0;
    b.node = estimate(0);
    b.service = estimate(0);
    auto r = derive_response(b);
    EXPECT_EQ(r.network.subtotal, 0);
    EXPECT_EQ(r.total, 0);
}

TEST(FeeAggregatorTest, DeriveDefaultsToStateMode) {
    auto b = example_breakdown();
    EXPECT_EQ(derive_response(b).mode, FeeEstimateMode::STATE);
    b.mode = FeeEstimateMode::INTRINSIC;
    EXPECT_EQ(derive_response(b).mode, FeeEstimateMode::INTRINSIC);
}

TEST(FeeAggregatorTest, ModeDoesNotChangeTotals) {
    auto state = example_breakdown();
    state.mode = FeeEstimateMode::STATE;
    auto intrinsic = example_breakdown();
    intrinsic.mode = FeeEstimateMode::INTRINSIC;
    EXPECT_EQ(derive_response(state).total, derive_response(intrinsic).total);
}

TEST(FeeAggregatorTest, DeriveKeepsNotesAndExtrasOrder) {
    auto b = example_breakdown();
    b.notes = {"first", "second"};
    auto r = derive_response(b);
    ASSERT_EQ(r.notes.size(), 2u);
    EXPECT_EQ(r.notes[0], "first");
    ASSERT_EQ(r.node.extras.size(), 2u);
    EXPECT_EQ(r.node.extras[0].name, "SIGNATURES");
    EXPECT_EQ(r.node.extras[1].name, "BYTES");
}

TEST(FeeAggregatorTest, DeriveIsIdempotent) {
    auto b = example_breakdown();
    auto first = derive_response(b);
    auto second = derive_response(b);
    EXPECT_EQ(first.total, second.total);
    EXPECT_EQ(first.network.subtotal, second.network.subtotal);
    EXPECT_EQ(compute_response_total(first), compute_response_total(first));
}

TEST(FeeAggregatorTest, NegativeBaseRejected) {
    auto b = example_breakdown();
    b.node->base = -1;
    EXPECT_THROW(derive_response(b), InvalidFeeComponent);
    EXPECT_THROW(compute_subtotal(estimate(-1)), InvalidFeeComponent);
}

TEST(FeeAggregatorTest, NegativeExtraRejected) {
    EXPECT_THROW(compute_subtotal(estimate(10, {extra("refund", -5)})), InvalidFeeComponent);
}

TEST(FeeAggregatorTest, NegativeMultiplierRejected) {
    auto b = example_breakdown();
    b.network_multiplier = -2;
    EXPECT_THROW(derive_response(b), InvalidFeeComponent);
}

TEST(FeeAggregatorTest, MissingComponentsRejected) {
    auto no_node = example_breakdown();
    no_node.node.reset();
    EXPECT_THROW(derive_response(no_node), InvalidFeeComponent);

    auto no_service = example_breakdown();
    no_service.service.reset();
    EXPECT_THROW(derive_response(no_service), InvalidFeeComponent);

    auto no_network = example_breakdown();
    no_network.network_multiplier.reset();
    EXPECT_THROW(derive_response(no_network), InvalidFeeComponent);
}

TEST(FeeAggregatorTest, OverflowRejected) {
    const int64_t max = std::numeric_limits<int64_t>::max();
    EXPECT_THROW(compute_subtotal(estimate(max, {extra("a", 1)})), InvalidFeeComponent);
    EXPECT_THROW(compute_network_subtotal(estimate(max / 2 + 1), 2), InvalidFeeComponent);
}

TEST(FeeAggregatorTest, ResponseTotalChecksNetworkDerivation) {
    auto r = derive_response(example_breakdown());
    r.network.subtotal += 1;
    EXPECT_THROW(compute_response_total(r), InvalidFeeComponent);
}

TEST(FeeAggregatorTest, ValidateAcceptsConsistentResponse) {
    auto r = derive_response(example_breakdown());
    EXPECT_NO_THROW(validate_response(r));
}

TEST(FeeAggregatorTest, ValidateRejectsWrongTotal) {
    auto r = derive_response(example_breakdown());
    r.total = 549;
    EXPECT_THROW(validate_response(r), InvalidFeeComponent);
}

TEST(FeeAggregatorTest, ValidateRejectsWrongReportedSubtotal) {
    auto r = derive_response(example_breakdown());
    r.service.subtotal = 60;
    r.service.subtotal_reported = true;
    EXPECT_THROW(validate_response(r), InvalidFeeComponent);

    // Unreported subtotals are recomputed, not compared.
    r.service.subtotal_reported = false;
    EXPECT_NO_THROW(validate_response(r));
}

TEST(FeeAggregatorTest, ConcurrentCallersAgree) {
    const auto b = example_breakdown();
    std::vector<std::thread> threads;
    std::vector<int64_t> totals(8, 0);
    for (size_t i = 0; i < totals.size(); ++i) {
        threads.emplace_back([&b, &totals, i] {
            for (int n = 0; n < 1000; ++n) {
                totals[i] = derive_response(b).total;
            }
        });
    }
    for (auto& t : threads) t.join();
    for (auto total : totals) {
        EXPECT_EQ(total, 550);
    }
}
