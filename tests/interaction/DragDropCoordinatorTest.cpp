#include <gtest/gtest.h>
#include <pagecraft/interaction/DragDropCoordinator.h>

#include <algorithm>
#include <vector>

using namespace pagecraft;

namespace {

const DropZone* findZone(const std::vector<DropZone>& zones, const std::string& id) {
    auto it = std::find_if(zones.begin(), zones.end(),
        [&id](const DropZone& z) { return z.id == id; });
    return it != zones.end() ? &*it : nullptr;
}

std::vector<ComponentId> childIds(const ComponentMap& map, const ComponentId& parent) {
    std::vector<ComponentId> ids;
    for (const ComponentRecord* child : map.childrenOf(parent)) {
        ids.push_back(child->id);
    }
    return ids;
}

}  // namespace

class DragDropCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        // root -> row -> [col0 (narrow), col1 (wide)]
        components = ComponentMap::fromRecords({
            ComponentRecord::create("root", ComponentType::Container),
            ComponentRecord::create("row", ComponentType::Row, "root", 0),
            ComponentRecord::create("col0", ComponentType::Col, "row", 0),
            ComponentRecord::create("col1", ComponentType::Col, "row", 1),
        });
        geometry.setBounds("root", {0, 0, 1000, 600});
        geometry.setBounds("row", {20, 20, 960, 200});
        geometry.setBounds("col0", {30, 30, 300, 180});
        geometry.setBounds("col1", {340, 30, 630, 180});

        config.snapToGrid = false;
    }

    DragDropCoordinator makeCoordinator() {
        return DragDropCoordinator(rules, hierarchy, geometry, config);
    }

    RuleEngine rules;
    HierarchyManager hierarchy{rules};
    StaticGeometryProvider geometry;
    DragConfig config;
    ComponentMap components;
};

// =============================================================================
// Session state
// =============================================================================

TEST_F(DragDropCoordinatorTest, SecondStartDragIsRejected) {
    auto coordinator = makeCoordinator();

    EXPECT_TRUE(coordinator.startDrag(DragItem::fromPanel(ComponentType::Button), {0, 0}));
    EXPECT_FALSE(coordinator.startDrag(DragItem::fromPanel(ComponentType::Text), {5, 5}));

    ASSERT_TRUE(coordinator.dragState().item.has_value());
    EXPECT_EQ(coordinator.dragState().item->type, ComponentType::Button);
    EXPECT_EQ(coordinator.dragState().phase, DragPhase::Dragging);
}

TEST_F(DragDropCoordinatorTest, ExistingItemNeedsId) {
    auto coordinator = makeCoordinator();
    DragItem item;
    item.type = ComponentType::Col;

    EXPECT_FALSE(coordinator.startDrag(item, {0, 0}));
    EXPECT_EQ(coordinator.dragState().phase, DragPhase::Idle);
}

TEST_F(DragDropCoordinatorTest, MoveAndEndAreIgnoredWhenIdle) {
    auto coordinator = makeCoordinator();
    int moves = 0;
    coordinator.addEventListener(DragEventType::DragMove, [&](const DragEvent&) { ++moves; });

    coordinator.moveDrag({100, 100}, components);
    auto result = coordinator.endDrag(components);

    EXPECT_EQ(moves, 0);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "No drag in progress");
}

TEST_F(DragDropCoordinatorTest, MoveDragSnapsToGrid) {
    config.snapToGrid = true;
    auto coordinator = makeCoordinator();
    coordinator.startDrag(DragItem::fromPanel(ComponentType::Button), {0, 0});

    coordinator.moveDrag({741, 123}, components);

    EXPECT_EQ(coordinator.dragState().position, (Point{744, 120}));
}

TEST_F(DragDropCoordinatorTest, MoveDragTracksNearestLegalZone) {
    auto coordinator = makeCoordinator();
    std::optional<DropZone> reported;
    coordinator.addEventListener(DragEventType::DragMove, [&](const DragEvent& e) {
        reported = std::get<DragMoved>(e.payload).zone;
    });

    coordinator.startDrag(DragItem::fromPanel(ComponentType::Button), {0, 0});
    coordinator.moveDrag({655, 120}, components);

    EXPECT_EQ(coordinator.dragState().activeZoneId, std::optional<std::string>("col1-inside"));
    ASSERT_TRUE(reported.has_value());
    EXPECT_EQ(reported->id, "col1-inside");
}

TEST_F(DragDropCoordinatorTest, IllegalZonesCarryReason) {
    auto coordinator = makeCoordinator();
    coordinator.startDrag(DragItem::fromPanel(ComponentType::Button), {0, 0});
    coordinator.moveDrag({500, 120}, components);

    const auto& zones = coordinator.dropZones();
    const DropZone* rowInside = findZone(zones, "row-inside");
    ASSERT_NE(rowInside, nullptr);
    EXPECT_FALSE(rowInside->isLegal);
    EXPECT_FALSE(rowInside->reason.empty());

    const DropZone* canvas = findZone(zones, "canvas");
    ASSERT_NE(canvas, nullptr);
    EXPECT_FALSE(canvas->isLegal);

    EXPECT_TRUE(findZone(zones, "col0-inside")->isLegal);
    EXPECT_NE(coordinator.dragState().activeZoneId, std::optional<std::string>("row-inside"));
}

TEST_F(DragDropCoordinatorTest, DisabledValidationMarksEveryZoneLegal) {
    config.enableDropValidation = false;
    auto coordinator = makeCoordinator();
    coordinator.startDrag(DragItem::fromPanel(ComponentType::Button), {0, 0});
    coordinator.moveDrag({500, 120}, components);

    const auto& zones = coordinator.dropZones();
    EXPECT_TRUE(std::all_of(zones.begin(), zones.end(), [](const DropZone& z) { return z.isLegal; }));
}

// =============================================================================
// Commit
// =============================================================================

TEST_F(DragDropCoordinatorTest, PaletteDropCreatesComponentWithDefaults) {
    auto coordinator = makeCoordinator();
    coordinator.startDrag(DragItem::fromPanel(ComponentType::Col), {0, 0});
    coordinator.moveDrag({500, 120}, components);
    ASSERT_EQ(coordinator.dragState().activeZoneId, std::optional<std::string>("row-inside"));

    auto result = coordinator.endDrag(components);

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.componentId, "component_1");
    ASSERT_TRUE(result.updatedComponents.has_value());

    const auto& created = result.updatedComponents->get("component_1");
    EXPECT_EQ(created.type, ComponentType::Col);
    EXPECT_EQ(created.parentId, std::optional<ComponentId>("row"));
    EXPECT_EQ(created.order, 2);
    EXPECT_EQ(created.zIndex, 1);
    EXPECT_EQ(created.props["col"]["span"], 12);
    EXPECT_EQ(created.style["minHeight"], "50px");

    EXPECT_FALSE(components.contains("component_1"));
    EXPECT_EQ(coordinator.dragState().phase, DragPhase::Idle);
    EXPECT_TRUE(coordinator.dropZones().empty());
}

TEST_F(DragDropCoordinatorTest, ExistingDropReordersSiblings) {
    auto coordinator = makeCoordinator();
    coordinator.startDrag(DragItem::existing(components.get("col1")), {0, 0});
    coordinator.moveDrag({31, 120}, components);
    ASSERT_EQ(coordinator.dragState().activeZoneId, std::optional<std::string>("row-before-col0"));

    auto result = coordinator.endDrag(components);

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.componentId, "col1");
    EXPECT_EQ(childIds(*result.updatedComponents, "row"), (std::vector<ComponentId>{"col1", "col0"}));

    auto history = hierarchy.operationHistory();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].type, HierarchyOperationType::Reorder);
}

TEST_F(DragDropCoordinatorTest, ComponentCannotDropIntoOwnSubtree) {
    auto coordinator = makeCoordinator();
    coordinator.startDrag(DragItem::existing(components.get("row")), {0, 0});
    coordinator.moveDrag({180, 120}, components);

    const DropZone* inside = findZone(coordinator.dropZones(), "col0-inside");
    ASSERT_NE(inside, nullptr);
    EXPECT_FALSE(inside->isLegal);
    EXPECT_EQ(findZone(coordinator.dropZones(), "root-before-row"), nullptr);
}

TEST_F(DragDropCoordinatorTest, NoLegalZoneFailsAndReturnsToIdle) {
    StaticGeometryProvider empty;
    DragDropCoordinator coordinator(rules, hierarchy, empty, config);
    std::string endReason;
    coordinator.addEventListener(DragEventType::DragEnd, [&](const DragEvent& e) {
        endReason = std::get<DragEnded>(e.payload).reason;
    });

    coordinator.startDrag(DragItem::fromPanel(ComponentType::Text), {0, 0});
    coordinator.moveDrag({10, 10}, components);
    auto result = coordinator.endDrag(components);

    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.updatedComponents.has_value());
    EXPECT_EQ(result.error, "No legal drop zone");
    EXPECT_EQ(endReason, "No legal drop zone");
    EXPECT_EQ(coordinator.dragState().phase, DragPhase::Idle);
}

TEST_F(DragDropCoordinatorTest, CustomIdGeneratorCollisionFailsDrop) {
    auto coordinator = makeCoordinator();
    coordinator.setIdGenerator([]() { return ComponentId("col0"); });

    coordinator.startDrag(DragItem::fromPanel(ComponentType::Col), {0, 0});
    coordinator.moveDrag({500, 120}, components);
    auto result = coordinator.endDrag(components);

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(hierarchy.operationHistory().empty());
}

TEST_F(DragDropCoordinatorTest, CancelDragEmitsEndAndResets) {
    auto coordinator = makeCoordinator();
    std::optional<std::string> reason;
    DragPhase phaseDuringEvent = DragPhase::Idle;
    coordinator.addEventListener(DragEventType::DragEnd, [&](const DragEvent& e) {
        reason = std::get<DragEnded>(e.payload).reason;
        phaseDuringEvent = coordinator.dragState().phase;
    });

    coordinator.startDrag(DragItem::fromPanel(ComponentType::Row), {0, 0});
    coordinator.cancelDrag();

    EXPECT_EQ(reason, std::optional<std::string>(""));
    EXPECT_EQ(phaseDuringEvent, DragPhase::Cancelled);
    EXPECT_EQ(coordinator.dragState().phase, DragPhase::Idle);
    EXPECT_FALSE(coordinator.dragState().item.has_value());
    EXPECT_TRUE(coordinator.startDrag(DragItem::fromPanel(ComponentType::Row), {0, 0}));
}

// =============================================================================
// Events
// =============================================================================

TEST_F(DragDropCoordinatorTest, SuccessfulSessionEmitsStartMoveDrop) {
    auto coordinator = makeCoordinator();
    std::vector<DragEventType> seen;
    for (auto type : {DragEventType::DragStart, DragEventType::DragMove,
                      DragEventType::DragEnd, DragEventType::Drop}) {
        coordinator.addEventListener(type, [&seen](const DragEvent& e) { seen.push_back(e.type); });
    }

    coordinator.startDrag(DragItem::fromPanel(ComponentType::Button), {0, 0});
    coordinator.moveDrag({655, 120}, components);
    auto result = coordinator.endDrag(components);

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(seen, (std::vector<DragEventType>{
        DragEventType::DragStart, DragEventType::DragMove, DragEventType::Drop}));
}

TEST_F(DragDropCoordinatorTest, RemovedListenerIsNotCalled) {
    auto coordinator = makeCoordinator();
    int starts = 0;
    auto id = coordinator.addEventListener(DragEventType::DragStart, [&](const DragEvent&) { ++starts; });

    EXPECT_TRUE(coordinator.removeEventListener(id));
    coordinator.startDrag(DragItem::fromPanel(ComponentType::Row), {0, 0});

    EXPECT_EQ(starts, 0);
}
