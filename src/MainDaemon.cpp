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

#include "MainDaemon.h"

#include <X11/Xlib.h>
#include <boost/bind.hpp>

#include "conf/LAMConf.h"
#include "lifecycle/launcher/AndroidLauncher.h"
#include "lifecycle/launcher/BrowserAppLauncher.h"
#include "lifecycle/launcher/FolderLauncher.h"
#include "lifecycle/launcher/NativeLauncher.h"
#include "lifecycle/launcher/WebPageLauncher.h"
#include "util/Logger.h"

MainDaemon::MainDaemon()
    : m_exitWhenIdle(false)
{
    setClassName("MainDaemon");
    m_mainLoop = g_main_loop_new(NULL, FALSE);
}

MainDaemon::~MainDaemon()
{
    if (m_mainLoop) {
        g_main_loop_unref(m_mainLoop);
    }
}

bool MainDaemon::initialize(const string& confPath, const string& catalogPath)
{
    // Tickers talk to the display from their own threads
    if (!XInitThreads()) {
        Logger::warning(getClassName(), __FUNCTION__, "XInitThreads failed");
    }

    LAMConf& conf = LAMConf::getInstance();
    conf.initialize(confPath);
    Logger::getInstance().setLevel(Logger::toLogLevel(conf.getLogLevel()));
    Logger::getInstance().setType(Logger::toLogType(conf.getLogType()));

    string catalog = catalogPath.empty() ? conf.getCatalogPath() : catalogPath;
    if (!m_catalog.load(catalog)) {
        Logger::warning(getClassName(), __FUNCTION__, catalog, "Catalog is not loaded. Continue with empty catalog");
    }

    if (!m_windowSystem.open()) {
        Logger::error(getClassName(), __FUNCTION__, "Cannot open X display");
        return false;
    }

    m_androidSubsystem.reset(new WaydroidSubsystem(conf.getAndroidSubsystemPath()));
    m_windowManager.reset(new WindowManager(m_windowSystem));
    m_processMonitor.reset(new ProcessMonitor(m_processTable, conf.getProcessPollInterval()));
    m_instanceManager.reset(new InstanceManager(*m_processMonitor, *m_windowManager));
    m_orchestrator.reset(new LifecycleOrchestrator(*m_processMonitor, *m_windowManager, *m_instanceManager));

    m_windowManager->initialize();
    m_orchestrator->applyConf();
    m_orchestrator->setAuditSink(&m_auditSink);
    m_orchestrator->setCatalog(&m_catalog);
    m_orchestrator->setPrincipalProvider(&m_principalProvider);

    m_orchestrator->addLauncher(make_shared<NativeLauncher>());
    m_orchestrator->addLauncher(make_shared<WebPageLauncher>());
    m_orchestrator->addLauncher(make_shared<BrowserAppLauncher>());
    m_orchestrator->addLauncher(make_shared<FolderLauncher>());
    m_orchestrator->addLauncher(make_shared<AndroidLauncher>(*m_androidSubsystem, *m_windowManager, conf.getWindowWatchInterval()));

    m_orchestrator->EventInstanceStopped.connect(boost::bind(&MainDaemon::onInstanceStopped, this, boost::placeholders::_1));

    Logger::info(getClassName(), __FUNCTION__,
                 Logger::format("conf(%s) applications(%d)", conf.getPath().c_str(), (int) m_catalog.size()));
    return true;
}

void MainDaemon::finalize()
{
    if (!m_orchestrator)
        return;

    ShutdownResult result = m_orchestrator->shutdownAll(LAMConf::getInstance().getTerminateTimeout(),
                                                        LAMConf::getInstance().getKillTimeout());
    for (const string& error : result.getErrors()) {
        Logger::warning(getClassName(), __FUNCTION__, error);
    }
    m_orchestrator->stopMonitoring();

    m_orchestrator.reset();
    m_instanceManager.reset();
    m_processMonitor.reset();
    m_windowManager.reset();
    m_androidSubsystem.reset();
    m_windowSystem.close();
}

void MainDaemon::start()
{
    if (!m_pendingLaunches.empty())
        g_idle_add(onLaunchScheduled, this);

    Logger::info(getClassName(), __FUNCTION__, "Start event handler thread");
    g_main_loop_run(m_mainLoop);
}

void MainDaemon::stop()
{
    if (m_mainLoop)
        g_main_loop_quit(m_mainLoop);
}

void MainDaemon::scheduleLaunch(const vector<string>& appIds)
{
    m_pendingLaunches.insert(m_pendingLaunches.end(), appIds.begin(), appIds.end());
    m_exitWhenIdle = !m_pendingLaunches.empty();
}

gboolean MainDaemon::onLaunchScheduled(gpointer data)
{
    MainDaemon* self = static_cast<MainDaemon*>(data);

    int launched = 0;
    for (const string& appId : self->m_pendingLaunches) {
        LaunchResult result = self->m_orchestrator->launch(appId);
        if (!result.isSuccess()) {
            Logger::error(self->getClassName(), __FUNCTION__, appId,
                          Logger::format("Launch failed (%s)", Logger::toString(result.getErrorCode())), result.getErrorText());
            continue;
        }
        ++launched;
    }
    self->m_pendingLaunches.clear();

    if (launched == 0 && self->m_exitWhenIdle)
        self->stop();
    return G_SOURCE_REMOVE;
}

void MainDaemon::onInstanceStopped(const InstanceEvent& event)
{
    if (!m_exitWhenIdle || m_orchestrator->getCount() > 0)
        return;

    Logger::info(getClassName(), __FUNCTION__, event.getInstanceId(), "Last instance stopped");
    stop();
}
