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

#include "FakeClients.h"
#include "conf/LAMConf.h"
#include "lifecycle/LifecycleOrchestrator.h"
#include "lifecycle/launcher/AndroidLauncher.h"
#include "util/Time.h"

class AndroidLauncherTest : public ::testing::Test {
protected:
    AndroidLauncherTest()
        : m_windowManager(m_windowSystem),
          m_processMonitor(m_processTable),
          m_instanceManager(m_processMonitor, m_windowManager),
          m_orchestrator(m_processMonitor, m_windowManager, m_instanceManager),
          m_launcher(make_shared<AndroidLauncher>(m_subsystem, m_windowManager, 50))
    {
        LAMConf::getInstance().load(pbnjson::Object());
        m_subsystem.install("com.corp.scanner");
        m_windowManager.initialize();

        m_orchestrator.setAutoStartMonitoring(false);
        m_orchestrator.setWindowSearchTimeout(200);
        m_orchestrator.setWindowSearchInterval(50);
        m_orchestrator.setAuditSink(&m_auditSink);
        m_orchestrator.addLauncher(m_launcher);
    }

    ApplicationDescriptorPtr scanner(const string& arguments, const string& target = "com.corp.scanner")
    {
        shared_ptr<ApplicationDescriptor> descriptor = make_shared<ApplicationDescriptor>("scanner", AppKind::AppKind_AndroidPackage, target);
        descriptor->setName("Badge Scanner");
        descriptor->setArguments(arguments);
        return descriptor;
    }

    RecordingAuditSink m_auditSink;
    FakeProcessTable m_processTable;
    FakeWindowSystem m_windowSystem;
    FakeAndroidSubsystem m_subsystem;
    WindowManager m_windowManager;
    ProcessMonitor m_processMonitor;
    InstanceManager m_instanceManager;
    LifecycleOrchestrator m_orchestrator;
    shared_ptr<AndroidLauncher> m_launcher;
};

TEST_F(AndroidLauncherTest, RejectsInvalidOrMissingPackages)
{
    EXPECT_EQ(ErrCode_ARGUMENT_INVALID, m_launcher->launch(*scanner("", "not a package"), "alice").getErrorCode());
    EXPECT_EQ(ErrCode_LAUNCH_FAILED, m_launcher->launch(*scanner("", "com.corp.missing"), "alice").getErrorCode());

    m_subsystem.setAvailable(false);
    LaunchResult result = m_launcher->launch(*scanner(""), "alice");
    EXPECT_EQ(ErrCode_LAUNCH_FAILED, result.getErrorCode());
    EXPECT_EQ("Android subsystem is not available", result.getErrorText());
    EXPECT_EQ(0, m_subsystem.getLaunchCount());
}

TEST_F(AndroidLauncherTest, MetadataCarriesActivityAndCustomParameters)
{
    LaunchResult result = m_launcher->launch(*scanner("--activity_name=.Scan --site=berlin"), "alice");
    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(0, result.getPid());
    EXPECT_EQ(".Scan", m_subsystem.getLastActivity());
    EXPECT_EQ("com.corp.scanner", result.getMetadata("AndroidPackageName"));
    EXPECT_EQ(".Scan", result.getMetadata("AndroidActivity"));
    EXPECT_EQ("berlin", result.getMetadata("Android.site"));
}

TEST_F(AndroidLauncherTest, CorrelationRequestFollowsArguments)
{
    CorrelationRequest request = m_launcher->getCorrelationRequest(*scanner("--window_name='Badge Scanner' --launch_timeout=7 --virtual_fallback=false"));
    EXPECT_EQ("waydroid", request.windowClass);
    EXPECT_EQ("Badge Scanner", request.titleHint);
    EXPECT_TRUE(request.exactTitle);
    EXPECT_EQ(7000, request.searchTimeout);
    EXPECT_FALSE(request.allowPlaceholder);

    request = m_launcher->getCorrelationRequest(*scanner(""));
    EXPECT_FALSE(request.exactTitle);
    EXPECT_EQ("Badge Scanner (Android)", request.placeholderTitle);
}

TEST_F(AndroidLauncherTest, ExactWindowNameIsCorrelated)
{
    m_windowSystem.addWindow(0x700, "Badge Scanner - Settings", 0, "Waydroid", Time::getCurrentTime());
    m_windowSystem.addWindow(0x701, "Badge Scanner", 0, "Waydroid", Time::getCurrentTime());

    LaunchResult result = m_orchestrator.launch(scanner("--window_name='Badge Scanner'"), "alice");
    ASSERT_TRUE(result.isSuccess());

    ConstApplicationInstancePtr instance = m_orchestrator.get(result.getInstanceId());
    EXPECT_EQ(0x701UL, instance->getWindow()->getHandle());
    EXPECT_EQ("WindowNameArgument", instance->getMetadata("WindowDetectionMethod"));
    EXPECT_EQ("com.corp.scanner", instance->getMetadata("AndroidPackageName"));
}

TEST_F(AndroidLauncherTest, WatchedWindowReportsFocusAndClosure)
{
    m_windowSystem.addWindow(0x710, "Badge Scanner", 0, "waydroid", Time::getCurrentTime());
    LaunchResult result = m_orchestrator.launch(scanner(""), "alice");
    ASSERT_TRUE(result.isSuccess());

    m_windowSystem.setActiveWindow(0x710);
    m_launcher->checkWindows();
    EXPECT_EQ(InstanceState::InstanceState_Active, m_orchestrator.get(result.getInstanceId())->getState());

    m_windowSystem.removeWindow(0x710);
    m_launcher->checkWindows();
    m_launcher->checkWindows();
    EXPECT_EQ(InstanceState::InstanceState_Terminated, m_orchestrator.get(result.getInstanceId())->getState());
    EXPECT_EQ(1, m_auditSink.count(result.getInstanceId(), InstanceEventType::InstanceEventType_Stopped));
}

TEST_F(AndroidLauncherTest, SwitchToPlaceholderRelaunchesPackage)
{
    LaunchResult result = m_orchestrator.launch(scanner("--wait_for_window=false"), "alice");
    ASSERT_TRUE(result.isSuccess());
    ConstApplicationInstancePtr instance = m_orchestrator.get(result.getInstanceId());
    ASSERT_TRUE(instance->getWindow()->isPlaceholder());
    EXPECT_EQ("Badge Scanner (Android)", instance->getWindow()->getTitle());

    EXPECT_TRUE(m_orchestrator.switchTo(result.getInstanceId()));
    EXPECT_EQ(2, m_subsystem.getLaunchCount());
    EXPECT_EQ(InstanceState::InstanceState_Active, m_orchestrator.get(result.getInstanceId())->getState());
}

TEST_F(AndroidLauncherTest, TerminatePlaceholderStopsPackage)
{
    LaunchResult result = m_orchestrator.launch(scanner("--wait_for_window=false"), "alice");
    ASSERT_TRUE(result.isSuccess());
    ASSERT_EQ("VirtualFallback", m_orchestrator.get(result.getInstanceId())->getMetadata("WindowDetectionMethod"));

    EXPECT_TRUE(m_orchestrator.terminate(result.getInstanceId()));
    ASSERT_EQ(1U, m_subsystem.getStopped().size());
    EXPECT_EQ("com.corp.scanner", m_subsystem.getStopped()[0]);
    EXPECT_EQ(InstanceState::InstanceState_Terminated, m_orchestrator.get(result.getInstanceId())->getState());
    EXPECT_EQ(1, m_auditSink.count(result.getInstanceId(), InstanceEventType::InstanceEventType_Stopped));
}

TEST_F(AndroidLauncherTest, FailedStopKeepsInstanceRunning)
{
    LaunchResult result = m_orchestrator.launch(scanner("--wait_for_window=false"), "alice");
    ASSERT_TRUE(result.isSuccess());
    m_subsystem.setStopFails(true);

    EXPECT_FALSE(m_orchestrator.terminate(result.getInstanceId()));
    EXPECT_FALSE(m_orchestrator.forceTerminate(result.getInstanceId()));
    EXPECT_EQ(InstanceState::InstanceState_Running, m_orchestrator.get(result.getInstanceId())->getState());
    EXPECT_EQ(0, m_auditSink.count(result.getInstanceId(), InstanceEventType::InstanceEventType_Stopped));

    m_subsystem.setStopFails(false);
    EXPECT_EQ(1, m_orchestrator.killAll());
    EXPECT_EQ(1U, m_subsystem.getStopped().size());
}

TEST_F(AndroidLauncherTest, ForceTerminateStopsPackageBehindRealWindow)
{
    m_windowSystem.addWindow(0x720, "Badge Scanner", 0, "waydroid", Time::getCurrentTime());
    LaunchResult result = m_orchestrator.launch(scanner(""), "alice");
    ASSERT_TRUE(result.isSuccess());
    ASSERT_TRUE(m_orchestrator.get(result.getInstanceId())->hasRealWindow());

    EXPECT_TRUE(m_orchestrator.forceTerminate(result.getInstanceId()));
    EXPECT_EQ(1U, m_subsystem.getStopped().size());
    EXPECT_EQ(InstanceState::InstanceState_Terminated, m_orchestrator.get(result.getInstanceId())->getState());
}

TEST_F(AndroidLauncherTest, FocusChangeIsReportedOnce)
{
    m_windowSystem.addWindow(0x730, "Badge Scanner", 0, "waydroid", Time::getCurrentTime());
    LaunchResult result = m_orchestrator.launch(scanner(""), "alice");
    ASSERT_TRUE(result.isSuccess());

    m_windowSystem.setActiveWindow(0x730);
    m_orchestrator.reconcileWindows();
    m_launcher->checkWindows();
    m_orchestrator.reconcileWindows();
    EXPECT_EQ(InstanceState::InstanceState_Active, m_orchestrator.get(result.getInstanceId())->getState());
    EXPECT_EQ(1, m_auditSink.count(result.getInstanceId(), InstanceEventType::InstanceEventType_Activated));

    m_windowSystem.setActiveWindow(0);
    m_orchestrator.reconcileWindows();
    EXPECT_EQ(InstanceState::InstanceState_Inactive, m_orchestrator.get(result.getInstanceId())->getState());
}
