#include <catch2/catch.hpp>

#include "layout/workspace_state.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <vector>

namespace {

WorkspaceState stack_main_with(WindowId main, std::vector<WindowId> stack) {
    WorkspaceState ws(StackMainLayout{});
    ws.assign(main, stack);
    return ws;
}

bool stack_is_clean(const WorkspaceState& ws) {
    const auto& s = ws.stack();
    if (ws.main_window() && std::ranges::find(s, *ws.main_window()) != s.end()) return false;
    return std::set<WindowId>(s.begin(), s.end()).size() == s.size();
}

} // namespace

TEST_CASE("Layout modes", "[layout]") {

    SECTION("ParseNames") {
        REQUIRE(std::holds_alternative<ManualLayout>(*parse_layout_name("manual")));
        REQUIRE(std::holds_alternative<SpiralLayout>(*parse_layout_name("spiral")));
        REQUIRE(std::holds_alternative<StackMainLayout>(*parse_layout_name("stack-main")));
        REQUIRE(std::holds_alternative<StackMainLayout>(*parse_layout_name("stack_main")));
        REQUIRE_FALSE(parse_layout_name("bogus").has_value());
        REQUIRE(*parse_stack_layout("stacked") == StackLayout::Stacked);
        REQUIRE_FALSE(parse_stack_layout("grid").has_value());
    }

    SECTION("SeedOrientation") {
        REQUIRE(seed_orientation(1920, 1080) == Orientation::Horizontal);
        REQUIRE(seed_orientation(800, 800) == Orientation::Horizontal);
        REQUIRE(seed_orientation(600, 1200) == Orientation::Vertical);
        REQUIRE(std::string(split_command(Orientation::Vertical)) == "split v");
    }

    SECTION("SameLayoutIgnoresSpiralToggle") {
        SpiralLayout seeded{.last_split = Orientation::Vertical};
        REQUIRE(same_layout(SpiralLayout{}, seeded));
        REQUIRE_FALSE(same_layout(StackMainLayout{}, StackMainLayout{.size = 50}));
        REQUIRE_FALSE(same_layout(ManualLayout{}, SpiralLayout{}));
    }

    SECTION("StackLayoutCommands") {
        REQUIRE(std::string(stack_layout_command(StackLayout::Tabbed)) == "tabbed");
        REQUIRE(std::string(stack_layout_command(StackLayout::Stacked)) == "stacking");
        REQUIRE(std::string(stack_layout_command(StackLayout::Tiled)) == "splitv");
    }
}

TEST_CASE("Workspace state", "[layout]") {

    SECTION("SpiralAlternates") {
        WorkspaceState ws(SpiralLayout{});
        auto first = ws.next_split(1920, 1080);
        REQUIRE(first == Orientation::Horizontal);

        // Later rects do not matter once seeded.
        Orientation prev = *first;
        for (int i = 0; i < 6; i++) {
            auto next = ws.next_split(100, 2000);
            REQUIRE(next == opposite(prev));
            prev = *next;
        }
    }

    SECTION("SpiralSeedTall") {
        WorkspaceState ws(SpiralLayout{});
        REQUIRE(ws.next_split(500, 1000) == Orientation::Vertical);
        REQUIRE(ws.next_split(500, 1000) == Orientation::Horizontal);
    }

    SECTION("NoSplitOutsideSpiral") {
        WorkspaceState ws;
        REQUIRE_FALSE(ws.next_split(100, 100).has_value());
    }

    SECTION("SetModeResetsSeed") {
        WorkspaceState ws(SpiralLayout{});
        ws.next_split(1920, 1080);
        ws.set_mode(SpiralLayout{});
        REQUIRE(ws.next_split(600, 1200) == Orientation::Vertical);
    }

    SECTION("AddWindows") {
        WorkspaceState ws(StackMainLayout{});
        REQUIRE(ws.add_window(1) == WorkspaceState::Placement::Main);
        REQUIRE(ws.add_window(2) == WorkspaceState::Placement::Stack);
        REQUIRE(ws.add_window(3) == WorkspaceState::Placement::Stack);
        REQUIRE(ws.add_window(2) == WorkspaceState::Placement::Ignored);
        REQUIRE(ws.main_window() == WindowId{1});
        REQUIRE(ws.stack() == std::vector<WindowId>{2, 3});
        REQUIRE(ws.window_count() == 3);
    }

    SECTION("AddIgnoredOutsideStackMain") {
        WorkspaceState ws(SpiralLayout{});
        REQUIRE(ws.add_window(1) == WorkspaceState::Placement::Ignored);
        REQUIRE_FALSE(ws.main_window().has_value());
    }

    SECTION("RemoveMainPromotesFront") {
        auto ws = stack_main_with(1, {2, 3});
        auto r = ws.remove_window(1);
        REQUIRE(r.removed);
        REQUIRE(r.was_main);
        REQUIRE(r.promoted == WindowId{2});
        REQUIRE(ws.main_window() == WindowId{2});
        REQUIRE(ws.stack() == std::vector<WindowId>{3});
    }

    SECTION("RemoveLastWindow") {
        auto ws = stack_main_with(1, {});
        auto r = ws.remove_window(1);
        REQUIRE(r.was_main);
        REQUIRE_FALSE(r.promoted.has_value());
        REQUIRE_FALSE(ws.main_window().has_value());
    }

    SECTION("RemoveStackEntry") {
        auto ws = stack_main_with(1, {2, 3});
        ws.set_cursor(3);
        auto r = ws.remove_window(3);
        REQUIRE(r.removed);
        REQUIRE_FALSE(r.was_main);
        REQUIRE(ws.stack() == std::vector<WindowId>{2});
        REQUIRE_FALSE(ws.cursor().has_value());

        REQUIRE_FALSE(ws.remove_window(42).removed);
    }

    SECTION("AssignDeduplicates") {
        auto ws = stack_main_with(1, {2, 1, 3, 2});
        REQUIRE(ws.main_window() == WindowId{1});
        REQUIRE(ws.stack() == std::vector<WindowId>{2, 3});

        ws.assign(std::nullopt, {5, 6});
        REQUIRE(ws.main_window() == WindowId{5});
        REQUIRE(ws.stack() == std::vector<WindowId>{6});
    }

    SECTION("CursorWrapsAround") {
        auto ws = stack_main_with(1, {2, 3, 4});
        REQUIRE(ws.cursor_step(true) == WindowId{2});
        REQUIRE(ws.cursor_step(false) == WindowId{4});

        ws.set_cursor(4);
        REQUIRE(ws.cursor_step(true) == WindowId{2});
        ws.set_cursor(2);
        REQUIRE(ws.cursor_step(false) == WindowId{4});

        // Main is not a stack entry.
        ws.set_cursor(1);
        REQUIRE(ws.cursor() == WindowId{2});
        REQUIRE(ws.stack() == std::vector<WindowId>{2, 3, 4});
    }

    SECTION("CursorOnEmptyStack") {
        auto ws = stack_main_with(1, {});
        REQUIRE_FALSE(ws.cursor_step(true).has_value());
    }

    SECTION("SwapUsesCursor") {
        auto ws = stack_main_with(1, {2, 3});
        ws.set_cursor(3);
        auto s = ws.swap_main();
        REQUIRE(s.has_value());
        REQUIRE(s->old_main == 1);
        REQUIRE(s->new_main == 3);
        REQUIRE(s->index == 1);
        REQUIRE(ws.main_window() == WindowId{3});
        REQUIRE(ws.stack() == std::vector<WindowId>{2, 1});
        REQUIRE(ws.cursor() == WindowId{1});
    }

    SECTION("SwapTwiceRestores") {
        for (std::optional<WindowId> cursor : {std::optional<WindowId>{}, std::optional<WindowId>{3},
                                               std::optional<WindowId>{4}}) {
            auto ws = stack_main_with(1, {2, 3, 4});
            if (cursor) ws.set_cursor(*cursor);
            ws.swap_main();
            ws.swap_main();
            REQUIRE(ws.main_window() == WindowId{1});
            REQUIRE(ws.stack() == std::vector<WindowId>{2, 3, 4});
        }
    }

    SECTION("RotateNext") {
        auto ws = stack_main_with(10, {1, 2});
        auto r = ws.rotate_next();
        REQUIRE(r->old_main == 10);
        REQUIRE(r->new_main == 1);
        REQUIRE(ws.main_window() == WindowId{1});
        REQUIRE(ws.stack() == std::vector<WindowId>{2, 10});
    }

    SECTION("RotateNextFullCycleRestores") {
        for (size_t n = 0; n <= 5; n++) {
            std::vector<WindowId> stack;
            for (size_t i = 0; i < n; i++) stack.push_back(static_cast<WindowId>(100 + i));
            auto ws = stack_main_with(1, stack);

            for (size_t i = 0; i < n + 1; i++) ws.rotate_next();
            REQUIRE(ws.main_window() == WindowId{1});
            REQUIRE(ws.stack() == stack);
        }
    }

    SECTION("RotatePrevInvertsNext") {
        auto ws = stack_main_with(1, {2, 3, 4});
        ws.rotate_prev();
        REQUIRE(ws.main_window() == WindowId{4});
        REQUIRE(ws.stack() == std::vector<WindowId>{1, 2, 3});
        ws.rotate_next();
        REQUIRE(ws.main_window() == WindowId{1});
        REQUIRE(ws.stack() == std::vector<WindowId>{2, 3, 4});
    }

    SECTION("StackStaysClean") {
        auto ws = stack_main_with(1, {2, 3, 4, 5});
        ws.set_cursor(4);
        ws.swap_main();
        REQUIRE(stack_is_clean(ws));
        ws.rotate_next();
        REQUIRE(stack_is_clean(ws));
        ws.rotate_prev();
        REQUIRE(stack_is_clean(ws));
        ws.remove_window(*ws.main_window());
        REQUIRE(stack_is_clean(ws));
        ws.add_window(9);
        REQUIRE(stack_is_clean(ws));
    }

    SECTION("StackOpsOutsideStackMain") {
        WorkspaceState ws(SpiralLayout{});
        REQUIRE_FALSE(ws.swap_main().has_value());
        REQUIRE_FALSE(ws.rotate_next().has_value());
        REQUIRE_FALSE(ws.rotate_prev().has_value());
        REQUIRE(ws.stack().empty());
    }

    SECTION("FocusTracking") {
        auto ws = stack_main_with(1, {2, 3});
        REQUIRE_FALSE(ws.note_focus(1).has_value());
        REQUIRE(ws.note_focus(3) == WindowId{1});
        REQUIRE(ws.cursor() == WindowId{3});
        REQUIRE(ws.focused() == WindowId{3});

        ws.forget(3);
        REQUIRE_FALSE(ws.focused().has_value());
        REQUIRE_FALSE(ws.cursor().has_value());
    }
}
