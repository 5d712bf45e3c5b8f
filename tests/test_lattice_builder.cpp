#include <gtest/gtest.h>

#include <cmath>

#include "xtalview/build/LatticeBuilder.hpp"
#include "xtalview/build/Replicator.hpp"
#include "xtalview/core/Errors.hpp"
#include "test_helpers.hpp"

using namespace xtalview;
using namespace xtalview::build;

// === B2 (CsCl) ===

TEST(LatticeBuilderTest, B2CellIsCubicWithBodyCentre) {
    const auto uc = make_b2_cell(B2Params{});

    ASSERT_EQ(uc.size(), 2u);
    EXPECT_EQ(uc.atoms()[0].species, "Ti");
    EXPECT_EQ(uc.atoms()[1].species, "Ni");
    EXPECT_TRUE(test_utils::near(uc.atoms()[0].position, {0.0, 0.0, 0.0}));
    EXPECT_TRUE(test_utils::near(uc.atoms()[1].position, {1.5075, 1.5075, 1.5075}));

    const auto p = uc.parameters();
    EXPECT_NEAR(p.a, 3.015, 1e-12);
    EXPECT_NEAR(p.b, 3.015, 1e-12);
    EXPECT_NEAR(p.c, 3.015, 1e-12);
    EXPECT_NEAR(p.alpha, 90.0, 1e-9);
    EXPECT_NEAR(p.beta, 90.0, 1e-9);
    EXPECT_NEAR(p.gamma, 90.0, 1e-9);
}

TEST(LatticeBuilderTest, B2TwoByTwoByTwoGivesSixteenAtoms) {
    const auto uc = make_b2_cell(B2Params{3.015, "A", "B"});
    const auto atoms = replicate(uc, RepeatCounts{2, 2, 2});

    EXPECT_EQ(atoms.size(), 16u);
    EXPECT_EQ(atoms.count_species("A"), 8u);
    EXPECT_EQ(atoms.count_species("B"), 8u);
}

TEST(LatticeBuilderTest, B2RejectsNonPositiveLattice) {
    EXPECT_THROW(make_b2_cell(B2Params{0.0, "Ti", "Ni"}), InvalidParameterError);
    EXPECT_THROW(make_b2_cell(B2Params{-3.0, "Ti", "Ni"}), InvalidParameterError);
    EXPECT_THROW(make_b2_cell(B2Params{NAN, "Ti", "Ni"}), InvalidParameterError);
    EXPECT_THROW(make_b2_cell(B2Params{3.0, "", "Ni"}), InvalidParameterError);
}

// === B19' (monoclinic) ===

TEST(LatticeBuilderTest, B19pVectorsPutBetaBetweenAandC) {
    const B19pParams p;
    const auto uc = make_b19p_cell(p);
    const double beta = 96.8 * kDegToRad;

    EXPECT_TRUE(test_utils::near(uc.a(), {2.89, 0.0, 0.0}));
    EXPECT_TRUE(test_utils::near(uc.b(), {0.0, 4.12, 0.0}));
    EXPECT_TRUE(test_utils::near(uc.c(), {4.62 * std::cos(beta), 0.0, 4.62 * std::sin(beta)}));

    const auto cp = uc.parameters();
    EXPECT_NEAR(cp.a, 2.89, 1e-12);
    EXPECT_NEAR(cp.b, 4.12, 1e-12);
    EXPECT_NEAR(cp.c, 4.62, 1e-12);
    EXPECT_NEAR(cp.alpha, 90.0, 1e-9);
    EXPECT_NEAR(cp.beta, 96.8, 1e-9);
    EXPECT_NEAR(cp.gamma, 90.0, 1e-9);
}

TEST(LatticeBuilderTest, B19pUsesApproximateFourAtomLayout) {
    const auto uc = make_b19p_cell(B19pParams{});

    ASSERT_EQ(uc.size(), 4u);
    EXPECT_EQ(uc.atoms()[0].species, "Ti");
    EXPECT_EQ(uc.atoms()[1].species, "Ni");
    EXPECT_EQ(uc.atoms()[2].species, "Ti");
    EXPECT_EQ(uc.atoms()[3].species, "Ni");
    EXPECT_TRUE(test_utils::near(uc.atoms()[1].position, {1.445, 2.06, 2.31}));
    EXPECT_TRUE(test_utils::near(uc.atoms()[2].position, {1.445, 0.0, 2.31}));
    EXPECT_TRUE(test_utils::near(uc.atoms()[3].position, {0.0, 2.06, 0.0}));
}

TEST(LatticeBuilderTest, B19pTwoByTwoByTwoGivesThirtyTwoAtoms) {
    const auto atoms = replicate(make_b19p_cell(B19pParams{2.89, 4.12, 4.62, 96.8, "Ti", "Ni"}),
                                 RepeatCounts{2, 2, 2});
    EXPECT_EQ(atoms.size(), 32u);
    EXPECT_EQ(atoms.count_species("Ti"), 16u);
    EXPECT_EQ(atoms.count_species("Ni"), 16u);
}

TEST(LatticeBuilderTest, B19pRejectsBadAngleAndLengths) {
    B19pParams p;
    p.beta_deg = 0.0;
    EXPECT_THROW(make_b19p_cell(p), InvalidParameterError);
    p.beta_deg = 180.0;
    EXPECT_THROW(make_b19p_cell(p), InvalidParameterError);
    p.beta_deg = -10.0;
    EXPECT_THROW(make_b19p_cell(p), InvalidParameterError);

    p = B19pParams{};
    p.c = 0.0;
    EXPECT_THROW(make_b19p_cell(p), InvalidParameterError);
    p = B19pParams{};
    p.b = -1.0;
    EXPECT_THROW(make_b19p_cell(p), InvalidParameterError);
}

TEST(LatticeBuilderTest, B19pAcceptsRightAngle) {
    B19pParams p;
    p.beta_deg = 90.0;
    const auto uc = make_b19p_cell(p);
    EXPECT_NEAR(uc.volume(), 2.89 * 4.12 * 4.62, 1e-9);
}

TEST(LatticeBuilderTest, BuildersAreDeterministic) {
    const auto a = make_b19p_cell(B19pParams{});
    const auto b = make_b19p_cell(B19pParams{});
    EXPECT_EQ(a.vectors(), b.vectors());
    EXPECT_EQ(a.atoms(), b.atoms());
}
