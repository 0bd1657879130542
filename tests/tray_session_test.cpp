/*
 * This file is part of TrayKit.
 *
 * Copyright (c) 2025 Ian Anthony R. Tancinco
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include <gtest/gtest.h>
#include "tray_session.h"
#include "fake_surface.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

bool WaitFor(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 5s)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

class TraySessionTest : public ::testing::Test {
protected:
    TraySessionTest()
    {
        auto fake = std::make_unique<FakeSurface>();
        surface = fake.get();
        session = std::make_unique<TraySession>(std::move(fake));
    }

    void TearDown() override { session.reset(); }

    TrayResult StartSession()
    {
        return session->Start([this] { ready.set_value(); }, [this] { exits.fetch_add(1); });
    }

    bool WaitReady() { return readyFuture.wait_for(5s) == std::future_status::ready; }

    NativeHandle Root() const
    {
        NativeHandle h = NULL_HANDLE;
        session->Sync().SubMenuOf(ROOT_MENU_ID, h);
        return h;
    }

    std::atomic<int> exits{0};
    std::promise<void> ready;
    std::future<void> readyFuture = ready.get_future();
    FakeSurface* surface = nullptr;
    std::unique_ptr<TraySession> session;
};

} // namespace

TEST_F(TraySessionTest, StartRunsReadyCallback)
{
    ASSERT_TRUE(StartSession().ok());
    ASSERT_TRUE(WaitReady());

    EXPECT_TRUE(session->IsReady());
    EXPECT_EQ(session->State(), DispatcherState::Ready);
    EXPECT_TRUE(surface->IsRegistered());
    EXPECT_TRUE(surface->TrayPresent());
    EXPECT_NE(Root(), NULL_HANDLE);
}

TEST_F(TraySessionTest, ItemsAddedEarlyAppearOnRegister)
{
    MenuItem a = session->AddMenuItem("A");
    EXPECT_EQ(session->AddSeparator().error, TrayError::NotReady);
    MenuItem b = session->AddMenuItem("B");
    MenuItem child = a.AddSubMenuItem("A.1");

    ASSERT_TRUE(StartSession().ok());

    std::vector<MenuItemId> top = surface->ItemsIn(Root());
    ASSERT_EQ(top.size(), 3u);
    EXPECT_EQ(top.front(), a.Id());
    EXPECT_EQ(top.back(), b.Id());

    NativeHandle sub = NULL_HANDLE;
    ASSERT_TRUE(session->Sync().SubMenuOf(a.Id(), sub));
    EXPECT_EQ(surface->ItemsIn(sub), std::vector<MenuItemId>{ child.Id() });
}

TEST_F(TraySessionTest, ClickReachesCallback)
{
    ASSERT_TRUE(StartSession().ok());

    MenuItem item = session->AddMenuItem("Open");
    std::promise<void> clicked;
    auto clickedFuture = clicked.get_future();
    item.SetCallback([&] { clicked.set_value(); });

    surface->InjectClick(item.Id());
    EXPECT_EQ(clickedFuture.wait_for(5s), std::future_status::ready);
}

TEST_F(TraySessionTest, ClickOnRemovedItemIsIgnored)
{
    ASSERT_TRUE(StartSession().ok());

    std::atomic<int> calls{0};
    MenuItem item = session->AddMenuItem("Gone");
    item.SetCallback([&] { calls.fetch_add(1); });
    ASSERT_TRUE(item.Remove().ok());

    surface->InjectClick(item.Id());
    ASSERT_TRUE(surface->Flush());
    session->Stop();
    EXPECT_EQ(calls.load(), 0);
}

TEST_F(TraySessionTest, ConcurrentQuitFiresExitOnce)
{
    ASSERT_TRUE(StartSession().ok());
    ASSERT_TRUE(WaitReady());

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i)
        threads.emplace_back([this] { session->Quit(); });
    for (auto& t : threads) t.join();

    session->Stop();
    EXPECT_EQ(exits.load(), 1);
    EXPECT_EQ(session->State(), DispatcherState::Terminated);
    EXPECT_FALSE(session->IsReady());
    EXPECT_FALSE(surface->TrayPresent());
    EXPECT_EQ(surface->TrayDeletes(), 1);
}

TEST_F(TraySessionTest, RunBlocksUntilQuit)
{
    TrayResult result;
    std::thread loop([&] {
        result = session->Run([this] { session->Quit(); }, [this] { exits.fetch_add(1); });
    });
    loop.join();

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(exits.load(), 1);
    EXPECT_EQ(session->State(), DispatcherState::Terminated);
}

TEST_F(TraySessionTest, OperationsBeforeRegisterAreNotReady)
{
    MenuItem item = session->AddMenuItem("Early");

    EXPECT_EQ(session->SetTooltip("tip").error, TrayError::NotReady);
    EXPECT_EQ(session->SetIcon({ 1, 2, 3 }).error, TrayError::NotReady);
    EXPECT_EQ(session->SetIconFromFilePath("app.ico").error, TrayError::NotReady);
    EXPECT_EQ(item.Hide().error, TrayError::NotReady);
    EXPECT_EQ(item.SetIcon({ 1, 2, 3 }).error, TrayError::NotReady);
    EXPECT_EQ(session->RunLoop().error, TrayError::NotReady);

    // The record itself is kept and updated
    EXPECT_EQ(item.SetTitle("Renamed").error, TrayError::NotReady);
    EXPECT_EQ(item.Title(), "Renamed");
    EXPECT_EQ(surface->Inserts(), 0);
}

TEST_F(TraySessionTest, SettersUpdateNativeEntry)
{
    ASSERT_TRUE(StartSession().ok());
    MenuItem item = session->AddMenuItem("Old");

    ASSERT_TRUE(item.SetTitle("New").ok());
    ASSERT_TRUE(item.Check().ok());
    ASSERT_TRUE(item.Disable().ok());

    NativeItemInfo info;
    ASSERT_TRUE(surface->Entry(Root(), item.Id(), info));
    EXPECT_EQ(info.title, "New");
    EXPECT_TRUE(info.checked);
    EXPECT_TRUE(info.disabled);
    EXPECT_TRUE(item.Checked());
    EXPECT_TRUE(item.Disabled());

    ASSERT_TRUE(item.Uncheck().ok());
    ASSERT_TRUE(item.Enable().ok());
    ASSERT_TRUE(surface->Entry(Root(), item.Id(), info));
    EXPECT_FALSE(info.checked);
    EXPECT_FALSE(info.disabled);
}

TEST_F(TraySessionTest, HideAndShowKeepOrder)
{
    ASSERT_TRUE(StartSession().ok());
    MenuItem a = session->AddMenuItem("A");
    MenuItem b = session->AddMenuItem("B");
    MenuItem c = session->AddMenuItem("C");

    ASSERT_TRUE(b.Hide().ok());
    EXPECT_EQ(surface->ItemsIn(Root()), (std::vector<MenuItemId>{ a.Id(), c.Id() }));

    ASSERT_TRUE(b.Show().ok());
    EXPECT_EQ(surface->ItemsIn(Root()), (std::vector<MenuItemId>{ a.Id(), b.Id(), c.Id() }));
}

TEST_F(TraySessionTest, RemovePurgesDescendants)
{
    ASSERT_TRUE(StartSession().ok());
    MenuItem keep = session->AddMenuItem("Keep");
    MenuItem parent = session->AddMenuItem("Parent");
    MenuItem child = parent.AddSubMenuItem("Child");
    MenuItem grandchild = child.AddSubMenuItem("Grandchild");
    ASSERT_TRUE(child.AddSeparator().ok());

    NativeHandle sub = NULL_HANDLE;
    ASSERT_TRUE(session->Sync().SubMenuOf(parent.Id(), sub));

    ASSERT_TRUE(parent.Remove().ok());

    EXPECT_EQ(session->Registry().Ids(), std::vector<MenuItemId>{ keep.Id() });
    EXPECT_EQ(surface->ItemsIn(Root()), std::vector<MenuItemId>{ keep.Id() });
    EXPECT_FALSE(surface->MenuExists(sub));
    EXPECT_FALSE(session->Sync().Visible().IsVisible(grandchild.Id()));

    EXPECT_EQ(child.Title(), "");
    EXPECT_EQ(child.SetTitle("again").error, TrayError::UnknownItem);
    EXPECT_EQ(grandchild.Remove().error, TrayError::UnknownItem);
}

TEST_F(TraySessionTest, ResetMenuStartsOver)
{
    ASSERT_TRUE(StartSession().ok());
    MenuItem a = session->AddMenuItem("A");
    a.AddSubMenuItem("A.1");
    session->AddMenuItem("B");
    NativeHandle oldRoot = Root();

    session->ResetMenu();

    EXPECT_EQ(session->Registry().Size(), 0u);
    EXPECT_FALSE(surface->MenuExists(oldRoot));
    ASSERT_NE(Root(), NULL_HANDLE);
    EXPECT_NE(Root(), oldRoot);
    EXPECT_TRUE(surface->ItemsIn(Root()).empty());

    MenuItem fresh = session->AddMenuItem("Fresh");
    EXPECT_GT(fresh.Id(), a.Id());
    EXPECT_EQ(surface->ItemsIn(Root()), std::vector<MenuItemId>{ fresh.Id() });
}

TEST_F(TraySessionTest, IconBytesLoadedOnce)
{
    ASSERT_TRUE(StartSession().ok());
    std::vector<uint8_t> ico = { 0, 0, 1, 0, 1, 0 };

    ASSERT_TRUE(session->SetIcon(ico).ok());
    ASSERT_TRUE(session->SetIcon(ico).ok());
    EXPECT_EQ(surface->ByteLoads(), 1);
    EXPECT_NE(surface->TrayIconHandle(), NULL_HANDLE);

    MenuItem item = session->AddMenuItem("With icon");
    ASSERT_TRUE(item.SetIcon(ico).ok());
    EXPECT_EQ(surface->ByteLoads(), 1);

    NativeItemInfo info;
    ASSERT_TRUE(surface->Entry(Root(), item.Id(), info));
    EXPECT_NE(info.bitmap, NULL_HANDLE);
}

TEST_F(TraySessionTest, ItemIconFailureLeavesEntryAlone)
{
    ASSERT_TRUE(StartSession().ok());
    MenuItem item = session->AddMenuItem("Plain");

    surface->Fail("IconToMenuBitmap");
    EXPECT_EQ(item.SetIconFromFilePath("app.ico").error, TrayError::NativeCallFailed);

    NativeItemInfo info;
    ASSERT_TRUE(surface->Entry(Root(), item.Id(), info));
    EXPECT_EQ(info.bitmap, NULL_HANDLE);
}

TEST_F(TraySessionTest, WindowFailureAbortsStart)
{
    surface->Fail("RegisterWindow");

    TrayResult r = StartSession();
    EXPECT_EQ(r.error, TrayError::NativeCallFailed);
    EXPECT_FALSE(session->IsReady());
    EXPECT_NE(readyFuture.wait_for(50ms), std::future_status::ready);
}

TEST_F(TraySessionTest, MenuFailureUndoesIcon)
{
    surface->Fail("CreateRootMenu");

    TrayResult r = StartSession();
    EXPECT_EQ(r.error, TrayError::NativeCallFailed);
    EXPECT_FALSE(surface->TrayPresent());
    EXPECT_FALSE(surface->IsRegistered());
    EXPECT_EQ(exits.load(), 0);
}

TEST_F(TraySessionTest, DeferredConfigAppliedOnRegister)
{
    TrayConfig cfg;
    cfg.tooltip = "Sync idle";
    cfg.openOnLeftClick = false;
    ASSERT_TRUE(session->ApplyConfig(cfg).ok());

    int opened = 0;
    session->OnTrayOpened([&] { ++opened; });

    ASSERT_TRUE(StartSession().ok());
    EXPECT_EQ(surface->TrayTooltip(), "Sync idle");

    surface->InjectTrayClick(TrayMouseButton::Left);
    ASSERT_TRUE(surface->Flush());
    EXPECT_EQ(surface->Popups(), 0);

    surface->InjectTrayClick(TrayMouseButton::Right);
    ASSERT_TRUE(surface->Flush());
    EXPECT_EQ(surface->Popups(), 1);
    EXPECT_EQ(opened, 1);
}

TEST_F(TraySessionTest, TaskbarRestartRestoresTooltip)
{
    ASSERT_TRUE(StartSession().ok());
    ASSERT_TRUE(session->SetTooltip("Watching").ok());

    TrayEvent ev;
    ev.kind = TrayEventKind::TaskbarCreated;
    surface->Inject(ev);
    ASSERT_TRUE(surface->Flush());

    EXPECT_EQ(surface->TrayAdds(), 2);
    EXPECT_EQ(surface->TooltipSets(), 2);
    EXPECT_EQ(surface->TrayTooltip(), "Watching");
}

TEST_F(TraySessionTest, PumpFailureEndsSession)
{
    ASSERT_TRUE(StartSession().ok());
    surface->BreakPump();

    EXPECT_TRUE(WaitFor([this] { return session->State() == DispatcherState::Terminated; }));
    EXPECT_TRUE(WaitFor([this] { return !session->IsReady(); }));
}

TEST_F(TraySessionTest, RemovalWinsOverConcurrentSetter)
{
    ASSERT_TRUE(StartSession().ok());
    MenuItem item = session->AddMenuItem("A");
    MenuItemId id = item.Id();

    surface->Hold("DeleteItem");
    std::future<TrayResult> removed = std::async(std::launch::async, [item]() mutable { return item.Remove(); });
    ASSERT_TRUE(surface->WaitParked("DeleteItem"));

    // The item is already claimed, so the setter neither renames nor re-adds it
    EXPECT_EQ(item.SetTitle("B").error, TrayError::UnknownItem);
    EXPECT_EQ(item.Show().error, TrayError::UnknownItem);

    surface->Release("DeleteItem");
    ASSERT_TRUE(removed.get().ok());

    EXPECT_FALSE(session->Registry().Contains(id));
    EXPECT_FALSE(session->Sync().Visible().IsVisible(id));
    EXPECT_TRUE(surface->ItemsIn(Root()).empty());
}

TEST_F(TraySessionTest, ChildOfRemovedItemIsRejected)
{
    ASSERT_TRUE(StartSession().ok());
    MenuItem parent = session->AddMenuItem("Parent");
    ASSERT_TRUE(parent.Remove().ok());

    MenuItem orphan = parent.AddSubMenuItem("orphan");
    EXPECT_FALSE(orphan.IsValid());
    EXPECT_EQ(parent.AddSeparator().error, TrayError::UnknownItem);

    EXPECT_EQ(session->Registry().Size(), 0u);
    EXPECT_EQ(surface->MenuCount(), 1u); // root only
    EXPECT_TRUE(surface->ItemsIn(Root()).empty());
}

TEST_F(TraySessionTest, ChildAddedDuringRemovalIsRejected)
{
    ASSERT_TRUE(StartSession().ok());
    MenuItem parent = session->AddMenuItem("Parent");

    surface->Hold("DeleteItem");
    std::future<TrayResult> removed = std::async(std::launch::async, [parent]() mutable { return parent.Remove(); });
    ASSERT_TRUE(surface->WaitParked("DeleteItem"));

    MenuItem late = parent.AddSubMenuItem("late");
    EXPECT_FALSE(late.IsValid());

    surface->Release("DeleteItem");
    ASSERT_TRUE(removed.get().ok());

    EXPECT_EQ(session->Registry().Size(), 0u);
    EXPECT_EQ(surface->MenuCount(), 1u);
    NativeHandle sub = NULL_HANDLE;
    EXPECT_FALSE(session->Sync().SubMenuOf(parent.Id(), sub));
}

TEST_F(TraySessionTest, ItemAddedDuringResetSurvives)
{
    ASSERT_TRUE(StartSession().ok());
    session->AddMenuItem("Old");

    surface->Hold("DeleteItem");
    std::thread reset([this] { session->ResetMenu(); });
    ASSERT_TRUE(surface->WaitParked("DeleteItem"));

    std::promise<MenuItem> added;
    std::future<MenuItem> addedItem = added.get_future();
    std::thread adder([this, &added] { added.set_value(session->AddMenuItem("New")); });

    // The old item is claimed, so the only live record is the new one
    ASSERT_TRUE(WaitFor([this] { return session->Registry().Size() == 1; }));
    surface->Release("DeleteItem");
    reset.join();
    adder.join();

    MenuItem fresh = addedItem.get();
    ASSERT_TRUE(fresh.IsValid());
    EXPECT_EQ(session->Registry().Ids(), std::vector<MenuItemId>{ fresh.Id() });
    EXPECT_EQ(surface->ItemsIn(Root()), std::vector<MenuItemId>{ fresh.Id() });
}

TEST_F(TraySessionTest, CallbackMayStopItsOwnSession)
{
    std::promise<void> stopped;
    std::future<void> stoppedFuture = stopped.get_future();

    ASSERT_TRUE(session->Start(
        [this, &stopped] {
            session->Stop();
            stopped.set_value();
            // Still running when the owner destroys the session
            std::this_thread::sleep_for(20ms);
        },
        [this] { exits.fetch_add(1); }).ok());

    ASSERT_EQ(stoppedFuture.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(session->State(), DispatcherState::Terminated);
    EXPECT_EQ(exits.load(), 1);

    // Joins the worker that is still sleeping
    session.reset();
}

TEST_F(TraySessionTest, CloseWithoutQuitDeletesIcon)
{
    ASSERT_TRUE(StartSession().ok());
    ASSERT_TRUE(WaitReady());

    TrayEvent close;
    close.kind = TrayEventKind::Close;
    surface->Inject(close);

    ASSERT_TRUE(WaitFor([this] { return exits.load() == 1; }));
    EXPECT_FALSE(surface->TrayPresent());
    EXPECT_EQ(surface->TrayDeletes(), 1);
    EXPECT_FALSE(session->Icon().IsPresent());
}
