// Copyright (c) 2019-2026 LG Electronics, Inc.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <set>
#include <thread>

#include "FakeClients.h"
#include "lifecycle/LifecycleOrchestrator.h"
#include "util/Time.h"

class LifecycleOrchestratorTest : public ::testing::Test {
protected:
    LifecycleOrchestratorTest()
        : m_windowManager(m_windowSystem),
          m_processMonitor(m_processTable),
          m_instanceManager(m_processMonitor, m_windowManager),
          m_orchestrator(m_processMonitor, m_windowManager, m_instanceManager),
          m_native(make_shared<FakeLauncher>(AppKind::AppKind_NativeProcess, CorrelationMode::CorrelationMode_Process)),
          m_web(make_shared<FakeLauncher>(AppKind::AppKind_WebPage, CorrelationMode::CorrelationMode_Heuristic))
    {
        m_windowSystem.setProcessTable(&m_processTable);
        m_windowManager.initialize();

        m_instanceManager.setTerminateTimeout(300);
        m_instanceManager.setKillTimeout(300);

        m_orchestrator.setAutoStartMonitoring(false);
        m_orchestrator.setWindowSearchTimeout(300);
        m_orchestrator.setWindowSearchInterval(50);
        m_orchestrator.setAuditSink(&m_auditSink);
        m_orchestrator.addLauncher(m_native);
        m_orchestrator.addLauncher(m_web);
    }

    ApplicationDescriptorPtr native(const string& appId, bool singleInstance = false)
    {
        shared_ptr<ApplicationDescriptor> descriptor = make_shared<ApplicationDescriptor>(appId, AppKind::AppKind_NativeProcess, "/usr/bin/" + appId);
        descriptor->setName("Editor");
        descriptor->setSingleInstance(singleInstance);
        return descriptor;
    }

    ApplicationDescriptorPtr web(const string& appId)
    {
        shared_ptr<ApplicationDescriptor> descriptor = make_shared<ApplicationDescriptor>(appId, AppKind::AppKind_WebPage, "https://" + appId);
        descriptor->setName("Mail");
        return descriptor;
    }

    // Process with its main window, ready for the next native launch
    void prepareProcess(pid_t pid, WindowHandle handle, bool ignoreTerm = false)
    {
        m_processTable.spawn(pid, ignoreTerm);
        m_windowSystem.addWindow(handle, "Editor", pid, "editor");
        m_native->setNextPid(pid);
    }

    RecordingAuditSink m_auditSink;
    FakeProcessTable m_processTable;
    FakeWindowSystem m_windowSystem;
    WindowManager m_windowManager;
    ProcessMonitor m_processMonitor;
    InstanceManager m_instanceManager;
    LifecycleOrchestrator m_orchestrator;
    shared_ptr<FakeLauncher> m_native;
    shared_ptr<FakeLauncher> m_web;
};

TEST_F(LifecycleOrchestratorTest, LaunchUsesLauncherOfKindAndFindsProcessWindow)
{
    prepareProcess(400, 0x400);

    LaunchResult result = m_orchestrator.launch(native("editor"), "alice");
    ASSERT_TRUE(result.isSuccess()) << result.getErrorText();
    EXPECT_FALSE(result.getInstanceId().empty());
    EXPECT_EQ(400, result.getPid());
    EXPECT_EQ(1, m_native->getLaunchCount());
    EXPECT_EQ(0, m_web->getLaunchCount());

    ConstApplicationInstancePtr instance = m_orchestrator.get(result.getInstanceId());
    ASSERT_TRUE(instance != nullptr);
    EXPECT_EQ(InstanceState::InstanceState_Running, instance->getState());
    EXPECT_TRUE(instance->hasRealWindow());
    EXPECT_EQ(0x400UL, instance->getWindow()->getHandle());
    EXPECT_EQ("Fake", instance->getMetadata("LauncherType"));
    EXPECT_EQ(1, m_auditSink.count(result.getInstanceId(), InstanceEventType::InstanceEventType_Started));
}

TEST_F(LifecycleOrchestratorTest, MissingLauncherIsReported)
{
    shared_ptr<ApplicationDescriptor> folder = make_shared<ApplicationDescriptor>("docs", AppKind::AppKind_Folder, "/srv/docs");
    LaunchResult result = m_orchestrator.launch(folder, "alice");
    EXPECT_FALSE(result.isSuccess());
    EXPECT_EQ(ErrCode_NO_SUITABLE_LAUNCHER, result.getErrorCode());
    EXPECT_EQ(0, m_orchestrator.getCount());
}

TEST_F(LifecycleOrchestratorTest, InvalidArgumentsAreRejected)
{
    EXPECT_EQ(ErrCode_ARGUMENT_INVALID, m_orchestrator.launch(nullptr, "alice").getErrorCode());
    EXPECT_EQ(ErrCode_ARGUMENT_INVALID, m_orchestrator.launch(native("editor"), "").getErrorCode());
    EXPECT_EQ(ErrCode_ARGUMENT_INVALID, m_orchestrator.launch("unknown.app", "alice").getErrorCode());
    EXPECT_EQ(0, m_native->getLaunchCount());
}

TEST_F(LifecycleOrchestratorTest, LauncherExceptionBecomesLaunchFailure)
{
    m_native->setThrows(true);
    LaunchResult result = m_orchestrator.launch(native("editor"), "alice");
    EXPECT_FALSE(result.isSuccess());
    EXPECT_EQ(ErrCode_LAUNCH_FAILED, result.getErrorCode());
    EXPECT_EQ(0, m_orchestrator.getCount());

    m_native->setThrows(false);
    m_native->setFails(true);
    result = m_orchestrator.launch(native("editor"), "alice");
    EXPECT_EQ(ErrCode_LAUNCH_FAILED, result.getErrorCode());
    EXPECT_EQ(0, m_orchestrator.getCount());
}

TEST_F(LifecycleOrchestratorTest, UnknownInstanceCommandsReturnFalse)
{
    EXPECT_FALSE(m_orchestrator.switchTo("missing"));
    EXPECT_FALSE(m_orchestrator.terminate("missing"));
    EXPECT_FALSE(m_orchestrator.forceTerminate("missing"));
    EXPECT_FALSE(m_orchestrator.minimize("missing"));
    EXPECT_FALSE(m_orchestrator.restore("missing"));
    EXPECT_FALSE(m_orchestrator.switchTo(""));
    EXPECT_TRUE(m_orchestrator.get("missing") == nullptr);
}

TEST_F(LifecycleOrchestratorTest, HeuristicLaunchMatchesNewWindow)
{
    CorrelationRequest request;
    request.windowClass = "chromium";
    request.titleHint = "Mail";
    request.placeholderTitle = "Mail";
    m_web->setRequest(request);

    m_windowSystem.addWindow(0x500, "Corporate Mail - Chromium", 0, "Chromium", Time::getCurrentTime());
    LaunchResult result = m_orchestrator.launch(web("mail"), "alice");
    ASSERT_TRUE(result.isSuccess());

    ConstApplicationInstancePtr instance = m_orchestrator.get(result.getInstanceId());
    EXPECT_EQ(0x500UL, instance->getWindow()->getHandle());
    EXPECT_EQ("WindowSearch", instance->getMetadata("WindowDetectionMethod"));
}

TEST_F(LifecycleOrchestratorTest, HeuristicLaunchFallsBackToPlaceholder)
{
    LaunchResult result = m_orchestrator.launch(web("mail"), "alice");
    ASSERT_TRUE(result.isSuccess());

    ConstApplicationInstancePtr instance = m_orchestrator.get(result.getInstanceId());
    EXPECT_EQ(InstanceState::InstanceState_Running, instance->getState());
    ASSERT_TRUE(instance->getWindow() != nullptr);
    EXPECT_TRUE(instance->getWindow()->isPlaceholder());
    EXPECT_EQ("Mail", instance->getWindow()->getTitle());
    EXPECT_EQ("VirtualFallback", instance->getMetadata("WindowDetectionMethod"));
}

TEST_F(LifecycleOrchestratorTest, HeuristicLaunchWithoutFallbackEndsInError)
{
    CorrelationRequest request;
    request.windowClass = "waydroid";
    request.titleHint = "Badge Scanner";
    request.exactTitle = true;
    request.waitForWindow = false;
    request.allowPlaceholder = false;
    m_web->setRequest(request);

    LaunchResult result = m_orchestrator.launch(web("scanner"), "alice");
    ASSERT_FALSE(result.getInstanceId().empty());

    ConstApplicationInstancePtr instance = m_orchestrator.get(result.getInstanceId());
    EXPECT_EQ(InstanceState::InstanceState_Error, instance->getState());
    EXPECT_EQ("Failed_NoVirtualFallback", instance->getMetadata("WindowDetectionMethod"));
    EXPECT_EQ(1, m_auditSink.count(result.getInstanceId(), InstanceEventType::InstanceEventType_Error));
    EXPECT_TRUE(m_orchestrator.getRunning().empty());
}

TEST_F(LifecycleOrchestratorTest, SwitchToWindowlessInstanceRelaunches)
{
    LaunchResult result = m_orchestrator.launch(web("mail"), "alice");
    ASSERT_TRUE(result.isSuccess());

    EXPECT_FALSE(m_orchestrator.switchTo(result.getInstanceId()));
    EXPECT_EQ(1, m_web->getRelaunchCount());

    m_web->setRelaunchResult(true);
    EXPECT_TRUE(m_orchestrator.switchTo(result.getInstanceId()));
    EXPECT_EQ(InstanceState::InstanceState_Active, m_orchestrator.get(result.getInstanceId())->getState());
    EXPECT_EQ(1, m_auditSink.count(result.getInstanceId(), InstanceEventType::InstanceEventType_Activated));
}

TEST_F(LifecycleOrchestratorTest, SwitchToDeadProcessMarksTerminated)
{
    prepareProcess(401, 0x401);
    LaunchResult result = m_orchestrator.launch(native("editor"), "alice");
    ASSERT_TRUE(result.isSuccess());

    m_processTable.exit(401);
    EXPECT_FALSE(m_orchestrator.switchTo(result.getInstanceId()));
    EXPECT_EQ(InstanceState::InstanceState_Terminated, m_orchestrator.get(result.getInstanceId())->getState());
    EXPECT_EQ(1, m_auditSink.count(result.getInstanceId(), InstanceEventType::InstanceEventType_Stopped));
}

TEST_F(LifecycleOrchestratorTest, SwitchToBringsWindowToFront)
{
    prepareProcess(402, 0x402);
    LaunchResult first = m_orchestrator.launch(native("editor"), "alice");
    prepareProcess(403, 0x403);
    LaunchResult second = m_orchestrator.launch(native("editor"), "alice");

    EXPECT_TRUE(m_orchestrator.switchTo(first.getInstanceId()));
    EXPECT_TRUE(m_orchestrator.switchTo(second.getInstanceId()));
    EXPECT_EQ(0x403UL, m_windowSystem.getActiveWindow());
    EXPECT_EQ(InstanceState::InstanceState_Inactive, m_orchestrator.get(first.getInstanceId())->getState());
    EXPECT_EQ(InstanceState::InstanceState_Active, m_orchestrator.get(second.getInstanceId())->getState());
}

TEST_F(LifecycleOrchestratorTest, TerminateIsIdempotent)
{
    prepareProcess(404, 0x404);
    LaunchResult result = m_orchestrator.launch(native("editor"), "alice");

    EXPECT_TRUE(m_orchestrator.terminate(result.getInstanceId()));
    EXPECT_TRUE(m_orchestrator.terminate(result.getInstanceId()));
    EXPECT_TRUE(m_orchestrator.forceTerminate(result.getInstanceId()));
    EXPECT_EQ(1, m_auditSink.count(result.getInstanceId(), InstanceEventType::InstanceEventType_Stopped));
    EXPECT_FALSE(m_orchestrator.switchTo(result.getInstanceId()));
}

TEST_F(LifecycleOrchestratorTest, ProcessExitIsReportedOnce)
{
    int stopped = 0;
    m_orchestrator.EventInstanceStopped.connect([&stopped](const InstanceEvent& event) { ++stopped; });

    prepareProcess(405, 0x405);
    LaunchResult result = m_orchestrator.launch(native("editor"), "alice");
    m_processTable.exit(405);
    m_processMonitor.poll();
    m_processMonitor.poll();
    EXPECT_TRUE(m_orchestrator.terminate(result.getInstanceId()));

    EXPECT_EQ(1, stopped);
    EXPECT_EQ(1, m_auditSink.count(result.getInstanceId(), InstanceEventType::InstanceEventType_Stopped));
    EXPECT_TRUE(m_orchestrator.getRunning().empty());
    ASSERT_TRUE(m_orchestrator.get(result.getInstanceId()) != nullptr);
}

TEST_F(LifecycleOrchestratorTest, SingleInstanceSwitchesToRunningInstance)
{
    prepareProcess(406, 0x406);
    LaunchResult first = m_orchestrator.launch(native("editor", true), "alice");
    LaunchResult second = m_orchestrator.launch(native("editor", true), "alice");

    ASSERT_TRUE(second.isSuccess());
    EXPECT_TRUE(second.isAlreadyRunning());
    EXPECT_EQ(first.getInstanceId(), second.getInstanceId());
    EXPECT_EQ(1, m_native->getLaunchCount());

    prepareProcess(407, 0x407);
    LaunchResult other = m_orchestrator.launch(native("editor", true), "bob");
    EXPECT_FALSE(other.isAlreadyRunning());
    EXPECT_EQ(2, m_native->getLaunchCount());
}

TEST_F(LifecycleOrchestratorTest, ConcurrentLaunchesGetDistinctIds)
{
    const int COUNT = 8;
    vector<string> instanceIds(COUNT);
    vector<std::thread> threads;
    for (int i = 0; i < COUNT; ++i) {
        threads.push_back(std::thread([this, i, &instanceIds]() {
            instanceIds[i] = m_orchestrator.launch(native("editor"), "user" + std::to_string(i % 2)).getInstanceId();
        }));
    }
    for (std::thread& thread : threads) {
        thread.join();
    }

    set<string> unique(instanceIds.begin(), instanceIds.end());
    EXPECT_EQ((size_t) COUNT, unique.size());
    EXPECT_EQ(0U, unique.count(""));
    EXPECT_EQ(COUNT, m_orchestrator.getCount());
    EXPECT_EQ((size_t) COUNT / 2, m_orchestrator.getRunningForUser("user0").size());
    EXPECT_EQ((size_t) COUNT, m_orchestrator.getByApplicationId("editor").size());
}

TEST_F(LifecycleOrchestratorTest, AuditFailureDoesNotFailLaunch)
{
    m_auditSink.setThrows(true);
    prepareProcess(408, 0x408);
    LaunchResult result = m_orchestrator.launch(native("editor"), "alice");
    EXPECT_TRUE(result.isSuccess());
    EXPECT_EQ(InstanceState::InstanceState_Running, m_orchestrator.get(result.getInstanceId())->getState());
}

TEST_F(LifecycleOrchestratorTest, ShutdownAllEscalatesToKill)
{
    prepareProcess(409, 0x409);
    m_orchestrator.launch(native("editor"), "alice");

    // No window to close and SIGTERM is ignored
    m_processTable.spawn(410, true);
    m_native->setNextPid(410);
    m_orchestrator.launch(native("daemon"), "alice");

    ShutdownResult result = m_orchestrator.shutdownAll(300, 300);
    EXPECT_EQ(2, result.getTotal());
    EXPECT_EQ(1, result.getGraceful());
    EXPECT_EQ(1, result.getForced());
    EXPECT_TRUE(result.isSuccess());
    EXPECT_TRUE(m_orchestrator.getRunning().empty());
}

TEST_F(LifecycleOrchestratorTest, CloseAllReportsSurvivors)
{
    m_processTable.spawn(411, true);
    m_native->setNextPid(411);
    m_orchestrator.launch(native("daemon"), "alice");

    ShutdownResult result = m_orchestrator.closeAll(200);
    EXPECT_EQ(1, result.getFailed());
    EXPECT_FALSE(result.isSuccess());
    EXPECT_EQ(1, m_orchestrator.killAll());
    EXPECT_EQ(0, m_orchestrator.getCount());
}

TEST_F(LifecycleOrchestratorTest, RegisterExistingAdoptsProcessOnce)
{
    m_processTable.spawn(412);
    m_windowSystem.addWindow(0x412, "Editor", 412, "editor");

    string errorText;
    ConstApplicationInstancePtr instance = m_orchestrator.registerExisting(native("editor"), 412, "alice", errorText);
    ASSERT_TRUE(instance != nullptr) << errorText;
    EXPECT_EQ(InstanceState::InstanceState_Running, instance->getState());
    EXPECT_EQ(0x412UL, instance->getWindow()->getHandle());

    ConstApplicationInstancePtr again = m_orchestrator.registerExisting(native("editor"), 412, "alice", errorText);
    ASSERT_TRUE(again != nullptr);
    EXPECT_EQ(instance->getInstanceId(), again->getInstanceId());

    EXPECT_TRUE(m_orchestrator.registerExisting(native("editor"), 999, "alice", errorText) == nullptr);
    EXPECT_FALSE(errorText.empty());
}

TEST_F(LifecycleOrchestratorTest, ReconcileAttachesLateWindowAndFollowsFocus)
{
    m_processTable.spawn(413);
    m_native->setNextPid(413);
    LaunchResult result = m_orchestrator.launch(native("editor"), "alice");
    EXPECT_FALSE(m_orchestrator.get(result.getInstanceId())->hasRealWindow());

    m_windowSystem.addWindow(0x413, "Editor", 413, "editor");
    m_windowSystem.setActiveWindow(0x413);
    m_orchestrator.reconcileWindows();

    ConstApplicationInstancePtr instance = m_orchestrator.get(result.getInstanceId());
    EXPECT_TRUE(instance->hasRealWindow());
    EXPECT_EQ(InstanceState::InstanceState_Active, instance->getState());

    m_windowSystem.setActiveWindow(0);
    m_orchestrator.reconcileWindows();
    EXPECT_EQ(InstanceState::InstanceState_Inactive, m_orchestrator.get(result.getInstanceId())->getState());
}

TEST_F(LifecycleOrchestratorTest, MonitoringStartsAndStops)
{
    EXPECT_FALSE(m_orchestrator.isMonitoring());
    m_orchestrator.startMonitoring();
    m_orchestrator.startMonitoring();
    EXPECT_TRUE(m_orchestrator.isMonitoring());
    EXPECT_TRUE(m_processMonitor.isRunning());

    m_orchestrator.stopMonitoring();
    EXPECT_FALSE(m_orchestrator.isMonitoring());
    EXPECT_FALSE(m_processMonitor.isRunning());
}
