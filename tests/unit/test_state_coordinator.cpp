#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "state/state_coordinator.hpp"
#include "util/fake_surface.hpp"

using namespace xplorer;
using namespace xplorer::state;
using xplorer::test::FakeSurface;

namespace
{

class StateCoordinatorTest : public ::testing::Test
{
   protected:
    WindowId open_window(FakeSurface& s)
    {
        WindowId id = coord.allocate_window_id();
        EXPECT_TRUE(coord.register_window(id, &s));
        return id;
    }

    void expect_invariants()
    {
        std::string why;
        EXPECT_TRUE(coord.check_invariants(&why)) << why;
    }

    StateCoordinator coord;
    FakeSurface      s1{Rect{0, 0, 800, 600}};
    FakeSurface      s2{Rect{900, 0, 800, 600}};
};

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Tab creation
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(StateCoordinatorTest, CreateTabDefaultsToHome)
{
    WindowId w  = open_window(s1);
    auto     t1 = coord.create_tab(std::nullopt, w);
    ASSERT_TRUE(t1.has_value());
    EXPECT_EQ(t1->path, HOME_PATH);
    EXPECT_EQ(t1->title, "Home");
    ASSERT_EQ(t1->history.size(), 1u);
    EXPECT_EQ(t1->history_index, 0u);
    EXPECT_EQ(t1->window_id, w);
    EXPECT_EQ(coord.active_tab(), t1->id);
    expect_invariants();
}

TEST_F(StateCoordinatorTest, CreateSecondTabBecomesActive)
{
    WindowId w  = open_window(s1);
    auto     t1 = coord.create_tab(std::nullopt, w);
    auto     t2 = coord.create_tab(std::string("C:\\Users"), w);
    ASSERT_TRUE(t1 && t2);

    EXPECT_EQ(coord.tabs_for_window(w).size(), 2u);
    EXPECT_EQ(coord.active_tab_for_window(w), t2->id);
    EXPECT_EQ(t2->title, "Users");
    EXPECT_EQ(s1.last_state().active_tab, t2->id);
    EXPECT_EQ(s1.last_state().tabs.size(), 2u);
    expect_invariants();
}

TEST_F(StateCoordinatorTest, CreateTabForUnknownWindowFails)
{
    EXPECT_FALSE(coord.create_tab(std::string("/tmp"), 42).has_value());
    EXPECT_EQ(coord.tab_count(), 0u);
}

TEST_F(StateCoordinatorTest, TabIdsAreUnique)
{
    WindowId w = open_window(s1);
    std::vector<TabId> ids;
    for (int i = 0; i < 20; ++i)
        ids.push_back(coord.create_tab(std::nullopt, w)->id);
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(std::unique(ids.begin(), ids.end()), ids.end());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Closing
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(StateCoordinatorTest, CloseSoleTabIsRefused)
{
    WindowId w  = open_window(s1);
    auto     t1 = coord.create_tab(std::nullopt, w);

    EXPECT_FALSE(coord.close_tab(t1->id));
    EXPECT_EQ(coord.tab_count(), 1u);
    EXPECT_EQ(coord.active_tab_for_window(w), t1->id);
    EXPECT_EQ(s1.close_calls(), 0u);
}

TEST_F(StateCoordinatorTest, CloseActiveTabPicksPreceding)
{
    WindowId w = open_window(s1);
    auto     a = coord.create_tab(std::string("/a"), w);
    auto     b = coord.create_tab(std::string("/b"), w);
    auto     c = coord.create_tab(std::string("/c"), w);
    coord.set_active_tab(b->id);

    EXPECT_TRUE(coord.close_tab(b->id));
    EXPECT_EQ(coord.active_tab_for_window(w), a->id);

    coord.set_active_tab(a->id);
    EXPECT_TRUE(coord.close_tab(a->id));
    // No preceding tab left, clamps to the first remaining one
    EXPECT_EQ(coord.active_tab_for_window(w), c->id);
    expect_invariants();
}

TEST_F(StateCoordinatorTest, CloseInactiveTabKeepsActive)
{
    WindowId w = open_window(s1);
    auto     a = coord.create_tab(std::string("/a"), w);
    auto     b = coord.create_tab(std::string("/b"), w);

    EXPECT_TRUE(coord.close_tab(a->id));
    EXPECT_EQ(coord.active_tab_for_window(w), b->id);
}

TEST_F(StateCoordinatorTest, ResetTabReturnsHome)
{
    WindowId w = open_window(s1);
    auto     t = coord.create_tab(std::string("/a"), w);
    coord.navigate_tab(t->id, "/a/b");

    EXPECT_TRUE(coord.reset_tab(t->id));
    const Tab* r = coord.tab(t->id);
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->path, HOME_PATH);
    EXPECT_EQ(r->history, std::vector<std::string>{HOME_PATH});
    EXPECT_FALSE(r->can_go_back());
}

// ═══════════════════════════════════════════════════════════════════════════════
// History
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(StateCoordinatorTest, NavigateBackThenNewPathTruncatesForward)
{
    WindowId w  = open_window(s1);
    TabId    t1 = coord.create_tab(std::nullopt, w)->id;

    coord.navigate_tab(t1, "C:\\A");
    coord.navigate_tab(t1, "C:\\B");
    EXPECT_TRUE(coord.go_back_tab(t1));
    EXPECT_EQ(coord.tab(t1)->path, "C:\\A");

    coord.navigate_tab(t1, "C:\\C");
    const Tab* t = coord.tab(t1);
    std::vector<std::string> expected{HOME_PATH, "C:\\A", "C:\\C"};
    EXPECT_EQ(t->history, expected);
    EXPECT_EQ(t->history_index, 2u);
    EXPECT_FALSE(coord.go_forward_tab(t1));
    expect_invariants();
}

TEST_F(StateCoordinatorTest, BackAndForwardBounds)
{
    WindowId w = open_window(s1);
    TabId    t = coord.create_tab(std::nullopt, w)->id;

    EXPECT_FALSE(coord.go_back_tab(t));
    coord.navigate_tab(t, "/x");
    EXPECT_TRUE(coord.go_back_tab(t));
    EXPECT_FALSE(coord.go_back_tab(t));
    EXPECT_TRUE(coord.go_forward_tab(t));
    EXPECT_EQ(coord.tab(t)->path, "/x");
    EXPECT_EQ(coord.tab(t)->title, "x");
}

TEST_F(StateCoordinatorTest, NavigateOnlyTouchesAddressedTab)
{
    WindowId w = open_window(s1);
    TabId    a = coord.create_tab(std::string("/a"), w)->id;
    TabId    b = coord.create_tab(std::string("/b"), w)->id;

    coord.navigate_tab(a, "/a/deeper");
    EXPECT_EQ(coord.tab(b)->path, "/b");
    EXPECT_EQ(coord.tab(b)->history.size(), 1u);
}

TEST_F(StateCoordinatorTest, GlobalActiveNavigation)
{
    WindowId w = open_window(s1);
    TabId    t = coord.create_tab(std::nullopt, w)->id;

    EXPECT_TRUE(coord.navigate_to("/srv"));
    EXPECT_EQ(coord.tab(t)->path, "/srv");
    EXPECT_TRUE(coord.go_back());
    EXPECT_EQ(coord.tab(t)->path, HOME_PATH);
    EXPECT_TRUE(coord.go_forward());
    EXPECT_EQ(coord.tab(t)->path, "/srv");
}

TEST_F(StateCoordinatorTest, NavigateToEmptyPathRejected)
{
    WindowId w = open_window(s1);
    TabId    t = coord.create_tab(std::nullopt, w)->id;
    EXPECT_FALSE(coord.navigate_tab(t, ""));
    EXPECT_EQ(coord.tab(t)->history.size(), 1u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Transfer primitives
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(StateCoordinatorTest, TransferMovesOwnershipAndFixesActives)
{
    WindowId w1 = open_window(s1);
    WindowId w2 = open_window(s2);
    TabId    t1 = coord.create_tab(std::nullopt, w1)->id;
    TabId    t3 = coord.create_tab(std::string("/keep"), w1)->id;
    TabId    t2 = coord.create_tab(std::nullopt, w2)->id;
    coord.set_active_tab(t1);

    EXPECT_TRUE(coord.transfer_tab(t1, w2));
    EXPECT_EQ(coord.tab(t1)->window_id, w2);
    EXPECT_EQ(coord.active_tab_for_window(w2), t1);
    EXPECT_EQ(coord.active_tab_for_window(w1), t3);
    EXPECT_EQ(coord.active_tab(), t1);

    // Transferred tab is appended to the target's order
    std::vector<TabId> expected{t2, t1};
    EXPECT_EQ(s2.tab_ids(), expected);
    EXPECT_EQ(s1.tab_ids(), std::vector<TabId>{t3});
    expect_invariants();
}

TEST_F(StateCoordinatorTest, TransferToUnknownWindowFails)
{
    WindowId w1 = open_window(s1);
    TabId    t1 = coord.create_tab(std::nullopt, w1)->id;

    EXPECT_FALSE(coord.transfer_tab(t1, 999));
    EXPECT_FALSE(coord.transfer_tab(12345, w1));
    EXPECT_EQ(coord.tab(t1)->window_id, w1);
}

TEST_F(StateCoordinatorTest, TransferLastTabClosesSourceWindow)
{
    WindowId w1 = open_window(s1);
    WindowId w2 = open_window(s2);
    TabId    t1 = coord.create_tab(std::nullopt, w1)->id;
    coord.create_tab(std::nullopt, w2);

    EXPECT_TRUE(coord.transfer_tab(t1, w2));
    EXPECT_EQ(s1.close_calls(), 1u);
    EXPECT_FALSE(coord.has_window(w1));
    EXPECT_EQ(coord.window_count(), 1u);
    EXPECT_EQ(coord.tabs_for_window(w2).size(), 2u);
    EXPECT_TRUE(s1.last_state().tabs.empty());

    // The host's own unregister after closing is a no-op
    coord.unregister_window(w1);
    EXPECT_EQ(coord.tabs_for_window(w2).size(), 2u);
    expect_invariants();
}

TEST_F(StateCoordinatorTest, EmptyWindowCloseCanBeDisabled)
{
    coord.set_close_empty_windows(false);
    WindowId w1 = open_window(s1);
    WindowId w2 = open_window(s2);
    TabId    t1 = coord.create_tab(std::nullopt, w1)->id;
    coord.create_tab(std::nullopt, w2);

    EXPECT_TRUE(coord.transfer_tab(t1, w2));
    EXPECT_EQ(s1.close_calls(), 0u);
    EXPECT_TRUE(coord.has_window(w1));
    EXPECT_EQ(coord.active_tab_for_window(w1), INVALID_TAB);
}

TEST_F(StateCoordinatorTest, AddTabAssignsFreshIdOnCollision)
{
    WindowId w1 = open_window(s1);
    WindowId w2 = open_window(s2);
    Tab      t  = *coord.create_tab(std::string("/data"), w1);

    auto copy = coord.add_tab(t, w2);
    ASSERT_TRUE(copy.has_value());
    EXPECT_NE(copy->id, t.id);
    EXPECT_EQ(copy->window_id, w2);
    EXPECT_EQ(copy->path, "/data");
    EXPECT_EQ(coord.active_tab_for_window(w2), copy->id);
    expect_invariants();
}

TEST_F(StateCoordinatorTest, AddTabSanitizesHistory)
{
    WindowId w = open_window(s1);

    Tab broken;
    broken.path          = "/ignored";
    broken.history       = {"/one", "/two"};
    broken.history_index = 7;
    auto stored          = coord.add_tab(broken, w);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->history_index, 1u);
    EXPECT_EQ(stored->path, "/two");
    EXPECT_EQ(stored->title, "two");

    Tab bare;
    bare.path = "/bare";
    auto b    = coord.add_tab(bare, w);
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->history, std::vector<std::string>{"/bare"});
    expect_invariants();
}

TEST_F(StateCoordinatorTest, AddTabIntoUnknownWindowFails)
{
    Tab t;
    t.path = "/x";
    EXPECT_FALSE(coord.add_tab(t, 77).has_value());
}

TEST_F(StateCoordinatorTest, RemoveTabIsAlwaysAllowed)
{
    WindowId w1 = open_window(s1);
    TabId    t1 = coord.create_tab(std::nullopt, w1)->id;

    auto removed = coord.remove_tab(t1);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->id, t1);
    EXPECT_EQ(coord.tab_count(), 0u);
    EXPECT_EQ(s1.close_calls(), 1u);
    EXPECT_FALSE(coord.remove_tab(t1).has_value());
}

TEST_F(StateCoordinatorTest, UnregisterWindowDropsItsTabs)
{
    WindowId w1 = open_window(s1);
    WindowId w2 = open_window(s2);
    coord.create_tab(std::nullopt, w1);
    coord.create_tab(std::string("/a"), w1);
    TabId keep = coord.create_tab(std::nullopt, w2)->id;

    coord.unregister_window(w1);
    EXPECT_EQ(coord.tab_count(), 1u);
    EXPECT_EQ(coord.active_tab(), keep);
    EXPECT_EQ(s1.close_calls(), 0u);
    expect_invariants();
}

TEST_F(StateCoordinatorTest, RemoveTabsForWindowKeepsRegistration)
{
    WindowId w1 = open_window(s1);
    coord.create_tab(std::nullopt, w1);
    coord.create_tab(std::nullopt, w1);

    coord.remove_tabs_for_window(w1);
    EXPECT_TRUE(coord.has_window(w1));
    EXPECT_TRUE(coord.tabs_for_window(w1).empty());
    EXPECT_EQ(coord.active_tab(), INVALID_TAB);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Broadcast
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(StateCoordinatorTest, WindowsOnlySeeTheirOwnTabs)
{
    WindowId w1 = open_window(s1);
    WindowId w2 = open_window(s2);
    TabId    a  = coord.create_tab(std::string("/a"), w1)->id;
    TabId    b  = coord.create_tab(std::string("/b"), w2)->id;

    EXPECT_EQ(s1.tab_ids(), std::vector<TabId>{a});
    EXPECT_EQ(s2.tab_ids(), std::vector<TabId>{b});
    EXPECT_EQ(s1.last_state().active_tab, a);
    EXPECT_EQ(s2.last_state().active_tab, b);
}

TEST_F(StateCoordinatorTest, EveryMutationBroadcasts)
{
    WindowId w      = open_window(s1);
    TabId    t      = coord.create_tab(std::nullopt, w)->id;
    size_t   before = s1.pushes();

    coord.navigate_tab(t, "/x");
    coord.go_back_tab(t);
    coord.set_active_tab(t);
    EXPECT_EQ(s1.pushes(), before + 3);
}

TEST_F(StateCoordinatorTest, ListenersRunAfterSurfacesAreUpdated)
{
    WindowId w         = open_window(s1);
    size_t   seen_tabs = 0;
    coord.add_change_listener([&] { seen_tabs = s1.last_state().tabs.size(); });

    coord.create_tab(std::nullopt, w);
    EXPECT_EQ(seen_tabs, 1u);
}

TEST_F(StateCoordinatorTest, ListenerMutationTriggersAnotherRound)
{
    WindowId w        = open_window(s1);
    TabId    t        = coord.create_tab(std::nullopt, w)->id;
    bool     mutated  = false;
    auto     listener = coord.add_change_listener(
        [&]
        {
            if (!mutated)
            {
                mutated = true;
                coord.navigate_tab(t, "/from-listener");
            }
        });

    coord.set_active_tab(t);
    EXPECT_EQ(s1.last_state().tabs.front().path, "/from-listener");
    coord.remove_change_listener(listener);
}

TEST_F(StateCoordinatorTest, RemovedListenerIsNotCalledInSameRound)
{
    WindowId w      = open_window(s1);
    int      second = 0;
    StateCoordinator::ChangeListenerId second_id = 0;
    coord.add_change_listener([&] { coord.remove_change_listener(second_id); });
    second_id = coord.add_change_listener([&] { ++second; });

    coord.create_tab(std::nullopt, w);
    EXPECT_EQ(second, 0);
}

TEST_F(StateCoordinatorTest, ThrowingListenerDoesNotStopBroadcasts)
{
    WindowId w     = open_window(s1);
    int      later = 0;
    auto     bad   = coord.add_change_listener([] { throw std::runtime_error("listener failed"); });
    coord.add_change_listener([&] { ++later; });

    EXPECT_NO_THROW(coord.create_tab(std::string("/a"), w));
    EXPECT_EQ(later, 1);

    coord.remove_change_listener(bad);
    uint64_t broadcasts = coord.broadcast_count();
    size_t   pushes     = s1.pushes();
    coord.create_tab(std::string("/b"), w);
    EXPECT_EQ(coord.broadcast_count(), broadcasts + 1);
    EXPECT_EQ(s1.pushes(), pushes + 1);
    EXPECT_EQ(later, 2);
}

TEST_F(StateCoordinatorTest, ThrowingSurfaceDoesNotWedgeLaterBroadcasts)
{
    struct FailingSurface : FakeSurface
    {
        void push_tab_state(const WindowTabState& state) override
        {
            if (fail)
                throw std::runtime_error("surface gone");
            FakeSurface::push_tab_state(state);
        }
        bool fail = false;
    };

    FailingSurface flaky;
    WindowId       w = open_window(flaky);
    flaky.fail       = true;
    EXPECT_THROW(coord.create_tab(std::string("/a"), w), std::runtime_error);

    flaky.fail          = false;
    uint64_t broadcasts = coord.broadcast_count();
    coord.create_tab(std::string("/b"), w);
    EXPECT_EQ(coord.broadcast_count(), broadcasts + 1);
    EXPECT_EQ(flaky.last_state().tabs.size(), 2u);
    coord.unregister_window(w);
}

TEST_F(StateCoordinatorTest, ViewOfEmptyWindowHasNoActiveTab)
{
    coord.set_close_empty_windows(false);
    WindowId w1 = open_window(s1);
    WindowId w2 = open_window(s2);
    TabId    a  = coord.create_tab(std::string("/a"), w1)->id;
    coord.transfer_tab(a, w2);

    auto view = coord.view_for_window(w1);
    EXPECT_TRUE(view.tabs.empty());
    EXPECT_EQ(view.active_tab, INVALID_TAB);
    EXPECT_EQ(coord.view_for_window(w2).active_tab, a);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Window registry
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(StateCoordinatorTest, RegisterRejectsDuplicatesAndNull)
{
    WindowId w = open_window(s1);
    EXPECT_FALSE(coord.register_window(w, &s2));
    EXPECT_FALSE(coord.register_window(INVALID_WINDOW, &s2));
    EXPECT_FALSE(coord.register_window(coord.allocate_window_id(), nullptr));
    EXPECT_EQ(coord.window_count(), 1u);
}

TEST_F(StateCoordinatorTest, WindowIdsKeepRegistrationOrder)
{
    WindowId a = open_window(s1);
    WindowId b = open_window(s2);
    std::vector<WindowId> expected{a, b};
    EXPECT_EQ(coord.window_ids(), expected);
    EXPECT_EQ(coord.surface(b), &s2);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Invariants under a mixed workload
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(StateCoordinatorTest, InvariantsHoldThroughMixedOperations)
{
    coord.set_close_empty_windows(false);
    WindowId w1 = open_window(s1);
    WindowId w2 = open_window(s2);

    std::vector<TabId> tabs;
    for (int i = 0; i < 6; ++i)
        tabs.push_back(coord.create_tab("/dir" + std::to_string(i), i % 2 ? w1 : w2)->id);

    for (size_t i = 0; i < tabs.size(); ++i)
    {
        TabId t = tabs[i];
        coord.navigate_tab(t, "/next" + std::to_string(i));
        expect_invariants();
        coord.go_back_tab(t);
        expect_invariants();
        coord.transfer_tab(t, (i % 2) ? w2 : w1);
        expect_invariants();
        if (i % 3 == 0)
            coord.close_tab(t);
        expect_invariants();
    }
}
