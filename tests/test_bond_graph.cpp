#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>

#include "xtalview/build/LatticeBuilder.hpp"
#include "xtalview/build/Replicator.hpp"
#include "xtalview/build/WireBuilder.hpp"
#include "xtalview/core/Errors.hpp"
#include "xtalview/graph/BondGraph.hpp"
#include "test_helpers.hpp"

using namespace xtalview;
using namespace xtalview::graph;

// === THRESHOLD ===

TEST(BondGraphTest, AtomsExactlyAtThresholdAreNotBonded) {
    auto s = test_utils::make_atom_set({{"A", {0.0, 0.0, 0.0}}, {"B", {2.5, 0.0, 0.0}}});
    EXPECT_EQ(build_bond_graph(s, 2.5).edge_count(), 0u);
    EXPECT_EQ(build_bond_graph_binned(s, 2.5).edge_count(), 0u);
}

TEST(BondGraphTest, AtomsJustInsideThresholdAreBonded) {
    const double t = 2.5;
    const double eps = 1e-9;
    auto s = test_utils::make_atom_set({{"A", {0.0, 0.0, 0.0}}, {"B", {t - eps, 0.0, 0.0}}});
    const auto g = build_bond_graph(s, t);
    ASSERT_EQ(g.edge_count(), 1u);
    EXPECT_EQ(g.edges()[0], (Edge{0, 1}));
    EXPECT_EQ(build_bond_graph_binned(s, t).edge_count(), 1u);
}

// === STRUCTURE ===

TEST(BondGraphTest, EdgesAreOrderedPairsWithoutSelfLoopsOrDuplicates) {
    const auto atoms = build::replicate(build::make_b19p_cell(build::B19pParams{}), build::RepeatCounts{2, 2, 2});
    const auto g = build_bond_graph(atoms, 3.2);

    ASSERT_GT(g.edge_count(), 0u);
    EXPECT_EQ(g.node_count(), atoms.size());
    for (const auto& e : g.edges()) {
        EXPECT_LT(e.first, e.second);
        EXPECT_LT(e.second, atoms.size());
    }
    EXPECT_TRUE(std::is_sorted(g.edges().begin(), g.edges().end()));
    EXPECT_EQ(std::adjacent_find(g.edges().begin(), g.edges().end()), g.edges().end());
}

TEST(BondGraphTest, MembershipIsSymmetricAndMatchesDistance) {
    const auto atoms = build::replicate(build::make_b19p_cell(build::B19pParams{}), build::RepeatCounts{2, 2, 2});
    const double t = 3.2;
    const auto g = build_bond_graph(atoms, t);

    for (std::size_t i = 0; i < atoms.size(); ++i) {
        EXPECT_FALSE(g.has_edge(i, i));
        for (std::size_t j = 0; j < atoms.size(); ++j) {
            EXPECT_EQ(g.has_edge(i, j), g.has_edge(j, i));
            if (i == j) continue;
            const double d = std::sqrt(distance_sq(atoms.atoms[i].position, atoms.atoms[j].position));
            EXPECT_EQ(g.has_edge(i, j), d < t) << "pair " << i << "," << j << " d=" << d;
        }
    }
}

TEST(BondGraphTest, B2BlockHasExpectedBondCount) {
    // 2x2x2 B2 block, threshold 3.2: Ti-Ni at a*sqrt(3)/2 (27 pairs) plus
    // Ti-Ti and Ni-Ni along the cube axes at a (12 pairs each).
    const auto atoms = build::replicate(build::make_b2_cell(build::B2Params{}), build::RepeatCounts{2, 2, 2});
    const auto g = build_bond_graph(atoms, 3.2);
    EXPECT_EQ(g.edge_count(), 51u);

    const auto deg = g.degree();
    // body centre of the first replica touches all eight corners plus three
    // Ni neighbours along +x, +y, +z
    EXPECT_EQ(deg[1], 11u);
}

TEST(BondGraphTest, AdjacencyMatchesEdgeList) {
    const auto atoms = build::replicate(build::make_b2_cell(build::B2Params{}), build::RepeatCounts{2, 2, 2});
    const auto g = build_bond_graph(atoms, 3.2);
    const auto adj = g.adjacency();
    const auto deg = g.degree();

    std::size_t sum = 0;
    for (std::size_t i = 0; i < adj.size(); ++i) {
        EXPECT_EQ(adj[i].size(), deg[i]);
        EXPECT_TRUE(std::is_sorted(adj[i].begin(), adj[i].end()));
        sum += adj[i].size();
    }
    EXPECT_EQ(sum, 2 * g.edge_count());
}

// === BINNED BUILDER ===

TEST(BondGraphTest, BinnedBuilderMatchesNaiveOnMonoclinicBlock) {
    const auto atoms = build::replicate(build::make_b19p_cell(build::B19pParams{}), build::RepeatCounts{3, 3, 3});
    for (const double t : {1.0, 2.6, 3.2, 4.5}) {
        const auto naive = build_bond_graph_naive(atoms, t);
        const auto binned = build_bond_graph_binned(atoms, t);
        EXPECT_EQ(naive.edges(), binned.edges()) << "threshold " << t;
    }
}

TEST(BondGraphTest, BinnedBuilderMatchesNaiveOnWire) {
    build::WireParams p;
    p.length = 30.0;
    p.diameter = 15.0;
    const auto w = build::build_wire(p);
    EXPECT_EQ(build_bond_graph_naive(w.atoms, 3.2).edges(), build_bond_graph_binned(w.atoms, 3.2).edges());
}

TEST(BondGraphTest, BinnedBuilderHandlesTinyThreshold) {
    const auto atoms = build::replicate(build::make_b2_cell(build::B2Params{}), build::RepeatCounts{4, 4, 4});
    const auto g = build_bond_graph_binned(atoms, 1e-6);
    EXPECT_EQ(g.edge_count(), 0u);
    EXPECT_EQ(g.node_count(), atoms.size());
}

TEST(BondGraphTest, LargeSetUsesBinnedBuilderWithSameResult) {
    const auto atoms = build::replicate(build::make_b2_cell(build::B2Params{}), build::RepeatCounts{6, 6, 8});
    ASSERT_GE(atoms.size(), kBinnedBondGraphMinAtoms);
    EXPECT_EQ(build_bond_graph(atoms, 3.2).edges(), build_bond_graph_naive(atoms, 3.2).edges());
}

// === ERRORS ===

TEST(BondGraphTest, NonPositiveThresholdIsRejected) {
    auto s = test_utils::make_atom_set({{"A", {0.0, 0.0, 0.0}}});
    EXPECT_THROW(build_bond_graph(s, 0.0), InvalidParameterError);
    EXPECT_THROW(build_bond_graph(s, -1.0), InvalidParameterError);
    EXPECT_THROW(build_bond_graph_binned(s, NAN), InvalidParameterError);
}

TEST(BondGraphTest, EmptyAtomSetIsRejected) {
    AtomSet empty;
    EXPECT_THROW(build_bond_graph(empty, 3.2), EmptyStructureError);
    EXPECT_THROW(build_bond_graph_binned(empty, 3.2), EmptyStructureError);
}
