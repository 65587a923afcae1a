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

#ifndef MAIN_DAEMON_H
#define MAIN_DAEMON_H

#include <glib.h>
#include <memory>
#include <string>
#include <vector>

#include "base/ApplicationCatalog.h"
#include "client/LinuxProcessTable.h"
#include "client/LogAuditSink.h"
#include "client/SessionPrincipalProvider.h"
#include "client/WaydroidSubsystem.h"
#include "client/X11WindowSystem.h"
#include "interface/ISingleton.h"
#include "interface/IClassName.h"
#include "lifecycle/InstanceManager.h"
#include "lifecycle/LifecycleOrchestrator.h"
#include "lifecycle/ProcessMonitor.h"
#include "lifecycle/WindowManager.h"

using namespace std;

class MainDaemon : public ISingleton<MainDaemon>,
                   public IClassName {
friend class ISingleton<MainDaemon>;
public:
    virtual ~MainDaemon();

    bool initialize(const string& confPath = "", const string& catalogPath = "");
    void finalize();

    void start();
    void stop();

    // Launches catalog applications once the main loop is running
    void scheduleLaunch(const vector<string>& appIds);

    ApplicationCatalog& getCatalog()
    {
        return m_catalog;
    }
    LifecycleOrchestrator* getOrchestrator()
    {
        return m_orchestrator.get();
    }

private:
    static gboolean onLaunchScheduled(gpointer data);

    MainDaemon();

    void onInstanceStopped(const InstanceEvent& event);

    GMainLoop *m_mainLoop;

    ApplicationCatalog m_catalog;
    LogAuditSink m_auditSink;
    SessionPrincipalProvider m_principalProvider;
    LinuxProcessTable m_processTable;
    X11WindowSystem m_windowSystem;

    unique_ptr<WaydroidSubsystem> m_androidSubsystem;
    unique_ptr<WindowManager> m_windowManager;
    unique_ptr<ProcessMonitor> m_processMonitor;
    unique_ptr<InstanceManager> m_instanceManager;
    unique_ptr<LifecycleOrchestrator> m_orchestrator;

    vector<string> m_pendingLaunches;
    bool m_exitWhenIdle;

};

#endif
