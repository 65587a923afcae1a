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

#ifndef LIFECYCLE_INSTANCEMANAGER_H_
#define LIFECYCLE_INSTANCEMANAGER_H_

#include <deque>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <vector>
#include <boost/signals2.hpp>

#include "base/ApplicationInstance.h"
#include "base/InstanceEvent.h"
#include "interface/IClassName.h"
#include "lifecycle/ProcessMonitor.h"
#include "lifecycle/WindowManager.h"
#include "util/Logger.h"

using namespace std;

// Registry of running instances and owner of their state machine.
//
// Every state change happens under m_mutex and queues exactly one event.
// Events are emitted after the lock is released, in the order they were queued.
// One thread emits at a time. A thread that finds emission in progress leaves
// its events to that thread and returns without waiting.
// Slots may call back into InstanceManager.
class InstanceManager : public IClassName {
public:
    InstanceManager(ProcessMonitor& processMonitor, WindowManager& windowManager);
    virtual ~InstanceManager();

    void setTerminateTimeout(long long terminateTimeout)
    {
        m_terminateTimeout = terminateTimeout;
    }
    void setKillTimeout(long long killTimeout)
    {
        m_killTimeout = killTimeout;
    }

    // The registry keeps its own copy. Later changes go through InstanceManager.
    bool registerInstance(ApplicationInstancePtr instance, ErrCode& errorCode, string& errorText, const string& source = "Launcher");

    ConstApplicationInstancePtr get(const string& instanceId);
    vector<ConstApplicationInstancePtr> getAll();
    vector<ConstApplicationInstancePtr> getByPrincipal(const string& principal);
    vector<ConstApplicationInstancePtr> getByAppId(const string& appId);
    // Live instance owning pid
    ConstApplicationInstancePtr getByPid(pid_t pid);
    size_t getCount();

    // Returns false for unknown ids and transitions the state machine does not allow
    bool setState(const string& instanceId, InstanceState state, const string& reason, const string& source);

    // Brings the real window to front, then marks the instance Active
    bool activate(const string& instanceId, const string& source = "User");
    // Marks the instance Active without touching windows. Other Active instances
    // of the same principal become Inactive.
    bool markActivated(const string& instanceId, const string& reason, const string& source);

    bool minimize(const string& instanceId);
    bool restore(const string& instanceId);

    // A real window is never replaced by a placeholder
    bool attachWindow(const string& instanceId, WindowInfoPtr window);
    bool setMetadata(const string& instanceId, const string& key, const string& value);

    // Closes the window (or sends SIGTERM) and waits. Never kills.
    // An instance with neither is only marked Terminated.
    bool terminate(const string& instanceId)
    {
        return terminate(instanceId, m_terminateTimeout);
    }
    bool terminate(const string& instanceId, long long timeout);

    // SIGKILL to the process group and waits
    bool forceTerminate(const string& instanceId)
    {
        return forceTerminate(instanceId, m_killTimeout);
    }
    bool forceTerminate(const string& instanceId, long long timeout);

    // Removes terminal instances that ended more than retention ms ago
    int cleanup(long long retention);

    boost::signals2::signal<void(const InstanceEvent& event)> EventInstanceChanged;

private:
    ConstApplicationInstancePtr snapshot(ApplicationInstancePtr instance);

    // Callers hold m_mutex
    bool transition(ApplicationInstancePtr instance, InstanceState state, const string& reason, const string& source);

    void dispatch();

    void onProcessExited(pid_t pid);
    void onProcessResponsivenessChanged(pid_t pid, bool responding);

    ProcessMonitor& m_processMonitor;
    WindowManager& m_windowManager;

    long long m_terminateTimeout;
    long long m_killTimeout;

    mutex m_mutex;
    map<string, ApplicationInstancePtr> m_map;
    deque<InstanceEvent> m_events;
    bool m_isDispatching;

    boost::signals2::scoped_connection m_exitedConnection;
    boost::signals2::scoped_connection m_responsivenessConnection;

};

#endif /* LIFECYCLE_INSTANCEMANAGER_H_ */
