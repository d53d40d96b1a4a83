#include <gtest/gtest.h>
#include <pagecraft/interaction/DropZone.h>

#include <algorithm>

using namespace pagecraft;

namespace {

const DropZone* findZone(const std::vector<DropZone>& zones, const std::string& id) {
    auto it = std::find_if(zones.begin(), zones.end(),
        [&id](const DropZone& z) { return z.id == id; });
    return it != zones.end() ? &*it : nullptr;
}

DropZone legalZone(const std::string& id, const Rect& bounds, bool legal = true) {
    DropZone zone;
    zone.id = id;
    zone.bounds = bounds;
    zone.isLegal = legal;
    return zone;
}

}  // namespace

class DropZoneBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        components = ComponentMap::fromRecords({
            ComponentRecord::create("root", ComponentType::Container),
            ComponentRecord::create("row", ComponentType::Row, "root", 0),
            ComponentRecord::create("col0", ComponentType::Col, "row", 0),
            ComponentRecord::create("col1", ComponentType::Col, "row", 1),
            ComponentRecord::create("text", ComponentType::Text, "col0", 0),
        });
        geometry.setBounds("root", {0, 0, 1000, 600});
        geometry.setBounds("row", {20, 20, 960, 200});
        geometry.setBounds("col0", {20, 20, 480, 200});
        geometry.setBounds("col1", {500, 20, 480, 200});
        geometry.setBounds("text", {30, 30, 100, 20});
    }

    ComponentMap components;
    StaticGeometryProvider geometry;
    DragConfig config;
};

TEST_F(DropZoneBuilderTest, BuildsCanvasInsideAndBetweenZones) {
    auto zones = DropZoneBuilder::build(components, geometry, config);

    ASSERT_FALSE(zones.empty());
    EXPECT_EQ(zones[0].id, "canvas");
    EXPECT_EQ(zones[0].kind, DropZoneKind::Canvas);
    EXPECT_FALSE(zones[0].ownerComponentId.has_value());
    EXPECT_EQ(zones[0].insertIndex, 1);

    // 1 canvas + 4 inside (root, row, col0, col1) + 4 between (row, col0, col1, text)
    EXPECT_EQ(zones.size(), 9u);
    EXPECT_TRUE(std::none_of(zones.begin(), zones.end(),
        [](const DropZone& z) { return z.isLegal; }));
}

TEST_F(DropZoneBuilderTest, InsideZoneIsShrunkAndAppends) {
    auto zones = DropZoneBuilder::build(components, geometry, config);

    const DropZone* inside = findZone(zones, "row-inside");
    ASSERT_NE(inside, nullptr);
    EXPECT_EQ(inside->kind, DropZoneKind::Inside);
    EXPECT_EQ(inside->ownerComponentId, std::optional<ComponentId>("row"));
    EXPECT_EQ(inside->bounds, (Rect{30, 30, 940, 180}));
    EXPECT_EQ(inside->insertIndex, 2);
}

TEST_F(DropZoneBuilderTest, BetweenZoneSitsBeforeChild) {
    auto zones = DropZoneBuilder::build(components, geometry, config);

    const DropZone* between = findZone(zones, "row-before-col1");
    ASSERT_NE(between, nullptr);
    EXPECT_EQ(between->kind, DropZoneKind::BetweenSiblings);
    EXPECT_EQ(between->insertIndex, 1);
    EXPECT_EQ(between->bounds, (Rect{495, 20, 10, 200}));
}

TEST_F(DropZoneBuilderTest, DraggedComponentIsExcludedFromChildLists) {
    auto zones = DropZoneBuilder::build(components, geometry, config, ComponentId("col0"));

    EXPECT_EQ(findZone(zones, "row-before-col0"), nullptr);
    const DropZone* before = findZone(zones, "row-before-col1");
    ASSERT_NE(before, nullptr);
    EXPECT_EQ(before->insertIndex, 0);
    EXPECT_EQ(findZone(zones, "row-inside")->insertIndex, 1);
}

TEST_F(DropZoneBuilderTest, ComponentsWithoutGeometryGetNoZones) {
    geometry.removeBounds("col1");

    auto zones = DropZoneBuilder::build(components, geometry, config);

    EXPECT_EQ(findZone(zones, "col1-inside"), nullptr);
    EXPECT_EQ(findZone(zones, "row-before-col1"), nullptr);
    EXPECT_NE(findZone(zones, "col0-inside"), nullptr);
}

TEST_F(DropZoneBuilderTest, SelectBestPrefersLegalOverCloserIllegal) {
    std::vector<DropZone> zones = {
        legalZone("near", {0, 0, 10, 10}, false),
        legalZone("far", {100, 100, 10, 10}, true),
    };

    const DropZone* best = DropZoneBuilder::selectBest(zones, {5, 5});

    ASSERT_NE(best, nullptr);
    EXPECT_EQ(best->id, "far");
}

TEST_F(DropZoneBuilderTest, SelectBestPicksNearestCentre) {
    std::vector<DropZone> zones = {
        legalZone("a", {0, 0, 100, 100}),
        legalZone("b", {200, 0, 100, 100}),
    };

    EXPECT_EQ(DropZoneBuilder::selectBest(zones, {240, 40})->id, "b");
    EXPECT_EQ(DropZoneBuilder::selectBest(zones, {60, 60})->id, "a");
}

TEST_F(DropZoneBuilderTest, SelectBestReturnsNullWithoutLegalZones) {
    std::vector<DropZone> zones = {legalZone("x", {0, 0, 10, 10}, false)};

    EXPECT_EQ(DropZoneBuilder::selectBest(zones, {0, 0}), nullptr);
    EXPECT_EQ(DropZoneBuilder::selectBest({}, {0, 0}), nullptr);
}

TEST(DropZoneKindTest, Names) {
    EXPECT_STREQ(dropZoneKindToString(DropZoneKind::Canvas), "canvas");
    EXPECT_STREQ(dropZoneKindToString(DropZoneKind::Inside), "inside");
    EXPECT_STREQ(dropZoneKindToString(DropZoneKind::BetweenSiblings), "between");
}
