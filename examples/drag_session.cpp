#include <pagecraft/pagecraft.h>
#include <pagecraft/common/Logger.h>
#include <iostream>
#include <iomanip>

using namespace pagecraft;

void printTree(const HierarchyManager& hierarchy, const ComponentMap& page) {
    auto tree = hierarchy.buildHierarchy(page, "root");
    for (const auto& node : tree.nodes()) {
        const auto& record = page.get(node.componentId);
        std::cout << "  " << std::string(node.depth * 2, ' ')
                  << componentTypeToString(record.type) << " " << record.id
                  << " (order " << record.order << ")\n";
    }
}

void printZones(const std::vector<DropZone>& zones) {
    for (const auto& zone : zones) {
        std::cout << "  " << std::left << std::setw(22) << zone.id
                  << (zone.isLegal ? "legal" : "illegal");
        if (!zone.isLegal) {
            std::cout << " - " << zone.reason;
        }
        std::cout << "\n";
    }
}

int main() {
    std::cout << "=== pagecraft " << versionString() << ": Drag Session ===\n\n";

    Logger::initialize();
    Logger::setLevel(LogLevel::Info);

    // 1. Page skeleton: container > row > two cols
    ComponentMap page = ComponentMap::fromRecords({
        ComponentDefaults::create("root", ComponentType::Container),
    });
    auto row = ComponentDefaults::create("row", ComponentType::Row);
    auto left = ComponentDefaults::create("left", ComponentType::Col);
    auto right = ComponentDefaults::create("right", ComponentType::Col);
    left.props["col"]["span"] = 4;
    right.props["col"]["span"] = 8;

    RuleEngine rules;
    HierarchyManager hierarchy(rules);

    for (auto [record, parent] : {std::pair{row, "root"}, std::pair{left, "row"}, std::pair{right, "row"}}) {
        auto added = hierarchy.insertComponent(record, ComponentId(parent), -1, page);
        if (!added.success) {
            std::cerr << "Insert of " << record.id << " failed: " << added.reason << "\n";
            return 1;
        }
        page = *added.updatedComponents;
    }

    std::cout << "1. Initial page:\n";
    printTree(hierarchy, page);

    // 2. Geometry a renderer would report
    StaticGeometryProvider geometry;
    geometry.setBounds("root", {0, 0, 1200, 800});
    geometry.setBounds("row", {20, 20, 1160, 300});
    geometry.setBounds("left", {30, 30, 380, 280});
    geometry.setBounds("right", {420, 30, 750, 280});

    DragDropCoordinator coordinator(rules, hierarchy, geometry);
    coordinator.addEventListener(DragEventType::Drop, [](const DragEvent& e) {
        const auto& dropped = std::get<Dropped>(e.payload);
        std::cout << "  [event] drop " << dropped.componentId << " into " << dropped.zone.id << "\n";
    });
    coordinator.addEventListener(DragEventType::DragEnd, [](const DragEvent& e) {
        const auto& ended = std::get<DragEnded>(e.payload);
        std::cout << "  [event] drag end"
                  << (ended.reason.empty() ? "" : ": " + ended.reason) << "\n";
    });

    // 3. Drag a button from the palette over the wide column
    std::cout << "\n2. Palette button over the right column:\n";
    coordinator.startDrag(DragItem::fromPanel(ComponentType::Button), {0, 0});
    coordinator.moveDrag({795, 170}, page);
    printZones(coordinator.dropZones());

    auto dropped = coordinator.endDrag(page);
    if (dropped.success) {
        page = *dropped.updatedComponents;
    }

    // 4. Swap the two columns
    std::cout << "\n3. Move the right column in front of the left one:\n";
    coordinator.startDrag(DragItem::existing(page.get("right")), {800, 100});
    coordinator.moveDrag({31, 170}, page);
    auto moved = coordinator.endDrag(page);
    if (moved.success) {
        page = *moved.updatedComponents;
    }
    printTree(hierarchy, page);

    // 5. Validate the result and report
    std::cout << "\n4. Tree validation:\n";
    auto outcome = rules.evaluateTree(page, "root");
    std::cout << outcome.toString() << "\n";

    auto stats = hierarchy.getStatistics(page);
    std::cout << "\n5. Statistics: " << stats.totalComponents << " components, max depth "
              << stats.maxDepth << "\n";
    for (const auto& op : hierarchy.operationHistory()) {
        std::cout << "  " << hierarchyOperationTypeToString(op.type) << " " << op.componentId
                  << " at " << op.position << "\n";
    }

    std::cout << "\n=== Session Complete ===\n";
    return 0;
}
