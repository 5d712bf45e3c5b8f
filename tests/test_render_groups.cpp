#include <gtest/gtest.h>

#include "xtalview/build/LatticeBuilder.hpp"
#include "xtalview/build/Replicator.hpp"
#include "xtalview/core/Errors.hpp"
#include "xtalview/render/RenderGroups.hpp"
#include "xtalview/render/Scene.hpp"
#include "test_helpers.hpp"

using namespace xtalview;
using namespace xtalview::render;

TEST(RenderGroupsTest, GroupsFollowFirstAppearanceAndPartitionAtoms) {
    const auto atoms = build::replicate(build::make_b2_cell(build::B2Params{}), build::RepeatCounts{2, 2, 2});
    const auto groups = build_render_groups(atoms, SpeciesStyleTable::nitinol());

    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].species, "Ti");
    EXPECT_EQ(groups[0].style.color, "silver");
    EXPECT_EQ(groups[1].species, "Ni");
    EXPECT_EQ(groups[1].style.color, "gold");
    EXPECT_EQ(groups[0].idx.size() + groups[1].idx.size(), atoms.size());

    for (const auto& g : groups) {
        for (const auto i : g.idx) EXPECT_EQ(atoms.atoms[i].species, g.species);
    }
}

TEST(RenderGroupsTest, UnknownSpeciesUseFallbackStyle) {
    auto s = test_utils::make_atom_set({{"Cu", {0.0, 0.0, 0.0}}, {"Ti", {1.0, 0.0, 0.0}}, {"Cu", {2.0, 0.0, 0.0}}});
    auto table = SpeciesStyleTable::nitinol();
    table.set_fallback(SpeciesStyle{"red", "none"});

    const auto groups = build_render_groups(s, table);
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].species, "Cu");
    EXPECT_EQ(groups[0].style.color, "red");
    EXPECT_EQ(groups[0].idx, (std::vector<std::size_t>{0, 2}));
    EXPECT_EQ(groups[1].style.color, "silver");
}

TEST(RenderGroupsTest, StyleTableRejectsEmptySpecies) {
    SpeciesStyleTable t;
    EXPECT_THROW(t.set("", SpeciesStyle{}), InvalidParameterError);
    EXPECT_FALSE(t.has("Ti"));
    t.set("Ti", SpeciesStyle{"white", "black"});
    EXPECT_TRUE(t.has("Ti"));
    EXPECT_EQ(t.resolve("Ti").color, "white");
}

TEST(RenderGroupsTest, RenderSettingsValidation) {
    RenderSettings r;
    EXPECT_NO_THROW(r.validate());
    r.bond_alpha = 1.5;
    EXPECT_THROW(r.validate(), InvalidParameterError);
    r = RenderSettings{};
    r.atom_size = 0.0;
    EXPECT_THROW(r.validate(), InvalidParameterError);
}

TEST(RenderGroupsTest, SceneBundlesAllOutputs) {
    auto atoms = build::replicate(build::make_b2_cell(build::B2Params{}), build::RepeatCounts{2, 2, 2});
    const auto scene = build_scene("b2", atoms, 3.2, SpeciesStyleTable::nitinol());

    EXPECT_EQ(scene.title, "b2");
    EXPECT_EQ(scene.atoms.size(), 16u);
    EXPECT_EQ(scene.bonds.node_count(), 16u);
    EXPECT_EQ(scene.bonds.edge_count(), 51u);
    EXPECT_EQ(scene.groups.size(), 2u);
    EXPECT_EQ(scene.frame.cell_edges.size(), 12u);
}

TEST(RenderGroupsTest, SceneOfEmptySetIsRejected) {
    EXPECT_THROW(build_scene("empty", AtomSet{}, 3.2, SpeciesStyleTable{}), EmptyStructureError);
}
