#include <gtest/gtest.h>

#include <map>
#include <set>
#include <string>

#include "ChaosPolicy.hpp"
#include "UselessError.hpp"

namespace {

constexpr int kDraws = 10000;
constexpr double kTolerance = 0.03;

struct ChaosFixture : public ::testing::Test {
    ChaosRng rng{42};
    ChaosPolicy chaos{rng};
};

}  // namespace

// ============================================================================
// RNG
// ============================================================================

TEST(ChaosRngTest, SameSeedSameSequence) {
    ChaosRng a(7), b(7);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(a.next_unit(), b.next_unit());
        EXPECT_EQ(a.next_index(13), b.next_index(13));
    }
    EXPECT_EQ(a.draws(), 200u);
}

TEST(ChaosRngTest, UnitIsHalfOpen) {
    ChaosRng rng(1);
    for (int i = 0; i < kDraws; ++i) {
        double x = rng.next_unit();
        ASSERT_GE(x, 0.0);
        ASSERT_LT(x, 1.0);
    }
}

TEST(ChaosRngTest, ReportsSeed) {
    ChaosRng rng(99);
    EXPECT_EQ(rng.seed(), 99u);
}

// ============================================================================
// EXPRESSION CHAOS
// ============================================================================

TEST_F(ChaosFixture, RandomizesAboutAQuarterOfResults) {
    int replaced = 0;
    for (int i = 0; i < kDraws; ++i) {
        Value v = chaos.maybe_randomize_expression_result(7.0);
        if (std::holds_alternative<bool>(v)) {
            ++replaced;
        } else {
            ASSERT_DOUBLE_EQ(std::get<double>(v), 7.0);
        }
    }
    EXPECT_NEAR(replaced / double(kDraws), chaos_odds::randomize_expression, kTolerance);
}

TEST_F(ChaosFixture, BooleanFlipDistribution) {
    std::map<BooleanFlip, int> counts;
    for (int i = 0; i < kDraws; ++i) counts[chaos.draw_boolean_flip()]++;

    EXPECT_NEAR(counts[BooleanFlip::Opposite] / double(kDraws), 0.30, kTolerance);
    EXPECT_NEAR(counts[BooleanFlip::Stringified] / double(kDraws), 0.20, kTolerance);
    EXPECT_NEAR(counts[BooleanFlip::Numeric] / double(kDraws), 0.20, kTolerance);
    EXPECT_NEAR(counts[BooleanFlip::Unchanged] / double(kDraws), 0.30, kTolerance);
}

TEST_F(ChaosFixture, FlipOutcomesAreOppositeStringOrNumber) {
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        Value v = chaos.maybe_flip_boolean(true);
        if (auto b = std::get_if<bool>(&v)) {
            seen.insert(*b ? "unchanged" : "opposite");
        } else if (auto s = std::get_if<std::string>(&v)) {
            EXPECT_EQ(*s, "false");
            seen.insert("text");
        } else {
            ASSERT_TRUE(std::holds_alternative<double>(v));
            EXPECT_DOUBLE_EQ(std::get<double>(v), 0.0);
            seen.insert("number");
        }
    }
    EXPECT_EQ(seen.size(), 4u);
}

// ============================================================================
// ARITHMETIC
// ============================================================================

TEST_F(ChaosFixture, AddBecomesSubtractOrMultiply) {
    int subtract = 0;
    for (int i = 0; i < kDraws; ++i) {
        ArithOp op = chaos.pick_arith_alt(ArithOp::Add);
        ASSERT_NE(op, ArithOp::Add);
        ASSERT_NE(op, ArithOp::Divide);
        if (op == ArithOp::Subtract) ++subtract;
    }
    EXPECT_NEAR(subtract / double(kDraws), 0.80, kTolerance);
}

TEST_F(ChaosFixture, MultiplyBecomesDivideOrAdd) {
    int divide = 0;
    for (int i = 0; i < kDraws; ++i) {
        ArithOp op = chaos.pick_arith_alt(ArithOp::Multiply);
        ASSERT_TRUE(op == ArithOp::Divide || op == ArithOp::Add);
        if (op == ArithOp::Divide) ++divide;
    }
    EXPECT_NEAR(divide / double(kDraws), 0.80, kTolerance);
}

// ============================================================================
// CONTAINERS
// ============================================================================

TEST_F(ChaosFixture, InRangeIndexStaysInRange) {
    int kept = 0;
    for (int i = 0; i < kDraws; ++i) {
        auto picked = chaos.pick_container_index(4, 2);
        ASSERT_TRUE(picked.has_value());
        ASSERT_LT(*picked, 4u);
        if (*picked == 2) ++kept;
    }
    // 25% honoured, plus a 1-in-4 chance the random pick lands on it anyway
    EXPECT_NEAR(kept / double(kDraws), 0.25 + 0.75 / 4, kTolerance);
}

TEST_F(ChaosFixture, OutOfRangeIndexDrawsNothing) {
    uint64_t before = rng.draws();
    EXPECT_FALSE(chaos.pick_container_index(3, 3).has_value());
    EXPECT_FALSE(chaos.pick_container_index(3, -1).has_value());
    EXPECT_FALSE(chaos.pick_container_index(0, 0).has_value());
    EXPECT_EQ(rng.draws(), before);
}

TEST_F(ChaosFixture, FieldPickIsAnExistingKeyOrTheRequestedOne) {
    RecordValue r;
    r.set("a", 1.0);
    r.set("b", 2.0);
    int requested = 0;
    for (int i = 0; i < kDraws; ++i) {
        auto k = chaos.pick_field(r, "zzz");
        ASSERT_TRUE(k.has_value());
        if (*k == "zzz") {
            ++requested;
        } else {
            ASSERT_TRUE(*k == "a" || *k == "b");
        }
    }
    EXPECT_NEAR(requested / double(kDraws), 0.50, kTolerance);
}

TEST_F(ChaosFixture, EmptyRecordHasNoField) {
    RecordValue empty;
    uint64_t before = rng.draws();
    EXPECT_FALSE(chaos.pick_field(empty, "a").has_value());
    EXPECT_EQ(rng.draws(), before);
}

// ============================================================================
// CONTROL FLOW AND MISC
// ============================================================================

TEST_F(ChaosFixture, BranchesAlwaysInvertAndLoopsRunOnce) {
    EXPECT_TRUE(chaos.invert_branch_always());
    EXPECT_EQ(chaos.loop_once(), 1);
}

TEST_F(ChaosFixture, PrintBrowserErrorRate) {
    int hits = 0;
    for (int i = 0; i < kDraws; ++i) {
        if (chaos.browser_error_on_print()) ++hits;
    }
    EXPECT_NEAR(hits / double(kDraws), 0.10, kTolerance);
}

TEST_F(ChaosFixture, SettlementDistribution) {
    std::map<Settlement, int> counts;
    for (int i = 0; i < kDraws; ++i) counts[chaos.settle_pending()]++;
    EXPECT_NEAR(counts[Settlement::Resolve] / double(kDraws), 0.30, kTolerance);
    EXPECT_NEAR(counts[Settlement::Abandon] / double(kDraws), 0.05, kTolerance);
    EXPECT_NEAR(counts[Settlement::Stay] / double(kDraws), 0.65, kTolerance);
}

TEST_F(ChaosFixture, SaveMessagesComeFromTheFixedSet) {
    std::set<std::string> allowed = {messages::save_error, messages::creative_breakage, messages::style_points};
    std::set<std::string> seen;
    for (int i = 0; i < 300; ++i) {
        std::string m = chaos.pick_save_message();
        ASSERT_TRUE(allowed.count(m)) << m;
        seen.insert(m);
    }
    EXPECT_EQ(seen.size(), 3u);
}

TEST_F(ChaosFixture, MischiefHooksAreSilentWhenOff) {
    uint64_t before = rng.draws();
    for (int i = 0; i < 100; ++i) {
        EXPECT_FALSE(chaos.mischief_teapot_at_start());
        EXPECT_FALSE(chaos.mischief_party_number());
        EXPECT_FALSE(chaos.mischief_identifier_vacation());
        EXPECT_FALSE(chaos.mischief_lost_binding());
        EXPECT_FALSE(chaos.mischief_loop_failure());
        EXPECT_FALSE(chaos.mischief_creative_else());
        EXPECT_FALSE(chaos.mischief_perfectly_wrong());
        EXPECT_FALSE(chaos.mischief_style_points());
        EXPECT_EQ(chaos.mischief_function_call(), CallMischief::None);
    }
    EXPECT_EQ(rng.draws(), before);
}

TEST(ChaosMischiefTest, HooksFireWhenOn) {
    ChaosRng rng(5);
    ChaosPolicy chaos(rng, ChaosOptions{true, false});
    int hits = 0;
    for (int i = 0; i < 1000; ++i) {
        if (chaos.mischief_loop_failure()) ++hits;
    }
    EXPECT_NEAR(hits / 1000.0, chaos_odds::mischief_loop_failure, 0.06);
}

TEST(ChaosMischiefTest, FunctionCallOutcomes) {
    ChaosRng rng(8);
    ChaosPolicy chaos(rng, ChaosOptions{true, false});
    const int N = 10000;
    int nulls = 0, failed = 0, coffee = 0;
    for (int i = 0; i < N; ++i) {
        switch (chaos.mischief_function_call()) {
            case CallMischief::ReturnNull: ++nulls; break;
            case CallMischief::TaskFailed: ++failed; break;
            case CallMischief::CoffeeBreak: ++coffee; break;
            case CallMischief::None: FAIL() << "mischief is on"; break;
        }
    }
    EXPECT_NEAR(nulls / double(N), 0.30, 0.03);
    EXPECT_NEAR(failed / double(N), 0.30, 0.03);
    EXPECT_NEAR(coffee / double(N), 0.40, 0.03);
}

TEST(ChaosMischiefTest, StylePointsOnPrint) {
    ChaosRng rng(9);
    ChaosPolicy chaos(rng, ChaosOptions{true, false});
    int hits = 0;
    for (int i = 0; i < 10000; ++i) {
        if (chaos.mischief_style_points()) ++hits;
    }
    EXPECT_NEAR(hits / 10000.0, chaos_odds::mischief_style_points, 0.03);
}

TEST(PartyTextTest, RepeatsPerUnitAndCaps) {
    const std::string party = "🎉🎊🎈";
    EXPECT_EQ(party_text(0), "");
    EXPECT_EQ(party_text(2.9), party + party);
    EXPECT_EQ(party_text(-1), party);
    EXPECT_EQ(party_text(1e9).size(), party.size() * 64);
}
