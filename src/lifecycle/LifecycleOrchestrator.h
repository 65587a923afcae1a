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

#ifndef LIFECYCLE_LIFECYCLEORCHESTRATOR_H_
#define LIFECYCLE_LIFECYCLEORCHESTRATOR_H_

#include <iostream>
#include <mutex>
#include <vector>
#include <boost/signals2.hpp>

#include "base/InstanceEvent.h"
#include "base/LaunchResult.h"
#include "base/ShutdownResult.h"
#include "interface/IApplicationCatalog.h"
#include "interface/IAuditSink.h"
#include "interface/IClassName.h"
#include "interface/IPrincipalProvider.h"
#include "lifecycle/InstanceManager.h"
#include "lifecycle/ProcessMonitor.h"
#include "lifecycle/WindowManager.h"
#include "lifecycle/launcher/AbsLauncher.h"
#include "util/Ticker.h"

using namespace std;

class LifecycleOrchestrator : public IClassName {
public:
    LifecycleOrchestrator(ProcessMonitor& processMonitor, WindowManager& windowManager, InstanceManager& instanceManager);
    virtual ~LifecycleOrchestrator();

    // Reads timeouts and intervals from LAMConf
    void applyConf();

    // Launchers are asked in the order they were added. The first that accepts a descriptor wins.
    void addLauncher(AbsLauncherPtr launcher);

    void setAuditSink(IAuditSink* auditSink)
    {
        m_auditSink = auditSink;
    }
    void setCatalog(IApplicationCatalog* catalog)
    {
        m_catalog = catalog;
    }
    void setPrincipalProvider(IPrincipalProvider* principalProvider)
    {
        m_principalProvider = principalProvider;
    }

    void setWindowSearchTimeout(long long windowSearchTimeout)
    {
        m_windowSearchTimeout = windowSearchTimeout;
    }
    void setWindowSearchInterval(long long windowSearchInterval)
    {
        m_windowSearchInterval = windowSearchInterval;
    }
    void setTerminatedRetention(long long terminatedRetention)
    {
        m_terminatedRetention = terminatedRetention;
    }
    void setAutoStartMonitoring(bool autoStartMonitoring)
    {
        m_autoStartMonitoring = autoStartMonitoring;
    }

    // COMMANDS
    LaunchResult launch(ApplicationDescriptorPtr descriptor, const string& principal);
    LaunchResult launch(const string& appId, const string& principal);
    // Principal comes from the principal provider
    LaunchResult launch(const string& appId);

    bool switchTo(const string& instanceId);
    bool terminate(const string& instanceId);
    bool forceTerminate(const string& instanceId);
    bool minimize(const string& instanceId);
    bool restore(const string& instanceId);

    // Adopts a live process that was not started by us. Returns the existing
    // instance when pid is already tracked.
    ConstApplicationInstancePtr registerExisting(ApplicationDescriptorPtr descriptor, pid_t pid, const string& principal, string& errorText);

    ShutdownResult closeAll(long long timeout = 5000);
    int killAll();
    ShutdownResult shutdownAll(long long gracefulTimeout = 5000, long long finalWait = 2000);

    // QUERIES (instances that are not terminal)
    vector<ConstApplicationInstancePtr> getRunning();
    vector<ConstApplicationInstancePtr> getRunningForUser(const string& principal);
    vector<ConstApplicationInstancePtr> getByApplicationId(const string& appId);
    // Any registered instance, terminal ones included until they are cleaned up
    ConstApplicationInstancePtr get(const string& instanceId);
    int getCount();

    // MONITORING
    void startMonitoring();
    void stopMonitoring();
    bool isMonitoring();

    int cleanup();

    // Attaches late windows and syncs Active/Inactive with the focused window
    void reconcileWindows();

    boost::signals2::signal<void(const InstanceEvent& event)> EventInstanceStarted;
    boost::signals2::signal<void(const InstanceEvent& event)> EventInstanceStopped;
    boost::signals2::signal<void(const InstanceEvent& event)> EventInstanceStateChanged;
    boost::signals2::signal<void(const InstanceEvent& event)> EventInstanceActivated;
    boost::signals2::signal<void(const InstanceEvent& event)> EventInstanceError;

private:
    AbsLauncherPtr findLauncher(const ApplicationDescriptor& descriptor);
    vector<AbsLauncherPtr> getLaunchers();

    // Instances without a pid are stopped by their launcher. A real window
    // is enough for a graceful close but not for a forced one.
    bool stopDetached(const string& instanceId, bool force);

    LaunchResult switchToExisting(const ApplicationDescriptor& descriptor, const string& principal);
    WindowInfoPtr findProcessWindow(pid_t pid, const CorrelationRequest& request);
    WindowInfoPtr searchWindow(const ApplicationDescriptor& descriptor, const CorrelationRequest& request, long long launchTime);

    void onInstanceChanged(const InstanceEvent& event);
    void onWindowActivated(const string& instanceId);
    void onWindowClosed(const string& instanceId);
    void onMonitorTick();

    ProcessMonitor& m_processMonitor;
    WindowManager& m_windowManager;
    InstanceManager& m_instanceManager;

    IAuditSink* m_auditSink;
    IApplicationCatalog* m_catalog;
    IPrincipalProvider* m_principalProvider;

    long long m_windowSearchTimeout;
    long long m_windowSearchInterval;
    long long m_terminatedRetention;
    bool m_autoStartMonitoring;

    mutex m_mutex;
    vector<AbsLauncherPtr> m_launchers;
    bool m_isMonitoring;

    Ticker m_windowTicker;

    vector<boost::signals2::connection> m_connections;

};

#endif /* LIFECYCLE_LIFECYCLEORCHESTRATOR_H_ */
