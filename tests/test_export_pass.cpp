/// Export pass tests:
///   - options gate splitting
///   - view -> level map from floor plans
///   - seeded default heights and reset
///   - element composition overrides

#include "export/composition.h"
#include "export/export_options.h"
#include "export/export_pass.h"
#include "model/document.h"
#include "model/element.h"
#include "common.h"

#include <cassert>
#include <cmath>
#include <cstdio>
#include <string>
#include <unordered_map>

using namespace levelsplit;

static bool approx(double a, double b) {
    return std::abs(a - b) < 1e-9;
}

static Level make_level(ElementId id, double elevation) {
    Level level;
    level.id        = id;
    level.elevation = elevation;
    return level;
}

/// Stories at 0 and 12 with floor plans 100 and 200; a reference level
/// at 6 that is not a story.
static Document make_building() {
    Document doc;
    doc.add_level(make_level(1, 0.0));
    doc.add_level(make_level(2, 12.0));
    Level reference = make_level(3, 6.0);
    reference.parameters[ParamId::LEVEL_IS_BUILDING_STORY] = 0;
    doc.add_level(reference);

    doc.add_view(View{100, ViewType::FLOOR_PLAN, 1, 1});
    doc.add_view(View{200, ViewType::FLOOR_PLAN, 2, 2});
    doc.add_view(View{300, ViewType::FLOOR_PLAN, 3, 3});
    doc.add_view(View{400, ViewType::SECTION, INVALID_ID, INVALID_ID});
    return doc;
}

static Element make_wall(ElementId id, ElementId base = INVALID_ID) {
    Element wall;
    wall.id          = id;
    wall.kind        = WallKind{};
    wall.export_type = {EntityType::IFC_WALL, EntityType::IFC_WALL_TYPE};
    wall.bounding_z  = Range{-1.0, 30.0};
    if (base != INVALID_ID) {
        wall.parameters[ParamId::WALL_BASE_CONSTRAINT] = base;
    }
    return wall;
}

static ExportOptions splitting_on() {
    ExportOptions options;
    options.wall_and_column_splitting = true;
    return options;
}

// ════════════════════════════════════════════════════════════════════
//  Tests
// ════════════════════════════════════════════════════════════════════

static void test_options_gate_splitting() {
    std::printf("Test 1: splitting follows the pass options\n");

    Document doc = make_building();

    ExportPass off(doc, ExportOptions{});
    assert(!off.options().wall_and_column_splitting);
    assert(off.split_element(make_wall(10)).empty());

    ExportPass on(doc, splitting_on());
    assert(on.options().wall_and_column_splitting);
    // No heights known: story 1 extends indefinitely and takes it all.
    auto result = on.split_element(make_wall(10));
    assert(result.size() == 1);
    assert(result.levels[0] == 1);
    assert(approx(result.ranges[0].start, 0.0));
    assert(approx(result.ranges[0].end, 30.0));

    std::printf("  PASS\n\n");
}

static void test_view_levels() {
    std::printf("Test 2: view -> level map covers story floor plans\n");

    Document doc = make_building();
    ExportPass pass(doc, splitting_on());

    const ViewLevelMap& views = pass.view_levels();
    assert(views.size() == 2);
    assert(views.at(100) == 1);
    assert(views.at(200) == 2);
    assert(!views.count(300)); // not a story
    assert(!views.count(400));

    Element tag = make_wall(20);
    tag.view_specific = true;
    tag.owner_view    = 200;
    assert(pass.base_level(tag) == 2);

    tag.owner_view = 400;
    assert(pass.base_level(tag) == INVALID_ID);
    pass.map_view_to_level(400, 1);
    assert(pass.base_level(tag) == 1);

    std::printf("  PASS\n\n");
}

static void test_seeded_heights() {
    std::printf("Test 3: seeded default heights drive the split\n");

    Document doc = make_building();
    ExportPass pass(doc, splitting_on());
    pass.seed_default_heights({{1, 12.0}, {2, 10.0}, {99, 5.0}});

    auto result = pass.split_element(make_wall(10), Range{-1.0, 30.0});
    assert(result.size() == 2);
    assert(approx(result.ranges[0].start, 0.0));
    assert(approx(result.ranges[0].end, 12.0));
    assert(approx(result.ranges[1].start, 12.0));
    assert(approx(result.ranges[1].end, 22.0));

    assert(approx(*pass.level_info_cache().find_height(1), 12.0));

    // After a reset the seeded heights are gone.
    pass.reset();
    assert(!pass.level_info_cache().find_height(1).has_value());
    auto unseeded = pass.split_element(make_wall(10), Range{-1.0, 30.0});
    assert(unseeded.size() == 1);
    assert(approx(unseeded.ranges[0].end, 30.0));

    std::printf("  PASS\n\n");
}

static void test_base_constraint_in_pass() {
    std::printf("Test 4: a wall based on the upper story\n");

    Document doc = make_building();
    ExportPass pass(doc, splitting_on());

    // The part below story 2 stays in its fragment.
    auto result = pass.split_element(make_wall(10, 2));
    assert(result.size() == 1);
    assert(result.levels[0] == 2);
    assert(approx(result.ranges[0].start, -1.0));
    assert(approx(result.ranges[0].end, 30.0));

    std::printf("  PASS\n\n");
}

static void test_composition_override() {
    std::printf("Test 5: IfcElementCompositionType override\n");

    Element wall = make_wall(10);
    assert(element_composition_override(wall) == ElementComposition::ELEMENT);

    wall.overrides["IfcElementCompositionType"] = "partial";
    assert(element_composition_override(wall) == ElementComposition::PARTIAL);

    wall.overrides["IfcElementCompositionType"] = "COMPLEX";
    assert(element_composition_override(wall) == ElementComposition::COMPLEX);

    wall.overrides["IfcElementCompositionType"] = "Assembly";
    assert(element_composition_override(wall) == ElementComposition::ELEMENT);

    assert(!parse_element_composition("").has_value());
    assert(parse_element_composition("Element") == ElementComposition::ELEMENT);
    assert(std::string(to_string(ElementComposition::PARTIAL)) == "PARTIAL");

    std::printf("  PASS\n\n");
}

static void test_seeding_after_split() {
    std::printf("Test 6: default heights seeded between splits\n");

    Document doc = make_building();
    ExportPass pass(doc, splitting_on());

    // Below every story: levels are looked up but no height is fixed.
    assert(pass.split_element(make_wall(10), Range{-5.0, -1.0}).empty());
    assert(pass.level_info_cache().size() > 0);
    assert(!pass.level_info_cache().find_height(1).has_value());

    pass.seed_default_heights({{1, 12.0}});
    auto result = pass.split_element(make_wall(11));
    assert(result.size() == 2);
    assert(approx(result.ranges[0].start, 0.0));
    assert(approx(result.ranges[0].end, 12.0));
    assert(approx(result.ranges[1].start, 12.0));
    assert(approx(result.ranges[1].end, 30.0));

    // Story 1's height is now fixed for the rest of the pass.
    pass.seed_default_heights({{1, 5.0}});
    auto again = pass.split_element(make_wall(12));
    assert(again.levels == result.levels);
    assert(again.ranges == result.ranges);

    std::printf("  PASS\n\n");
}

// ════════════════════════════════════════════════════════════════════
//  main
// ════════════════════════════════════════════════════════════════════

int main() {
    std::printf("=== Export pass tests ===\n\n");

    test_options_gate_splitting();
    test_view_levels();
    test_seeded_heights();
    test_base_constraint_in_pass();
    test_composition_override();
    test_seeding_after_split();

    std::printf("All %d tests passed.\n", 6);
    return 0;
}
