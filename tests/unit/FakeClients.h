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

#ifndef TESTS_UNIT_FAKECLIENTS_H_
#define TESTS_UNIT_FAKECLIENTS_H_

#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <vector>

#include "base/InstanceEvent.h"
#include "client/AbsAndroidSubsystem.h"
#include "client/AbsProcessTable.h"
#include "client/AbsWindowSystem.h"
#include "interface/IAuditSink.h"
#include "lifecycle/launcher/AbsLauncher.h"

using namespace std;

class FakeProcessTable : public AbsProcessTable {
public:
    FakeProcessTable()
        : m_selfPid(1)
    {
    }
    virtual ~FakeProcessTable() {}

    void spawn(pid_t pid, bool ignoreTerm = false)
    {
        lock_guard<mutex> lock(m_mutex);
        Entry entry;
        entry.ignoreTerm = ignoreTerm;
        m_entries[pid] = entry;
    }

    void exit(pid_t pid)
    {
        lock_guard<mutex> lock(m_mutex);
        m_entries.erase(pid);
    }

    void setState(pid_t pid, char state)
    {
        lock_guard<mutex> lock(m_mutex);
        m_entries[pid].state = state;
    }

    void setSelfPid(pid_t pid)
    {
        m_selfPid = pid;
    }

    int getTermCount()
    {
        lock_guard<mutex> lock(m_mutex);
        return m_termCount;
    }

    virtual bool isAlive(pid_t pid) override
    {
        lock_guard<mutex> lock(m_mutex);
        return m_entries.find(pid) != m_entries.end();
    }

    virtual bool getInfo(pid_t pid, ProcessInfo& info) override
    {
        lock_guard<mutex> lock(m_mutex);
        auto it = m_entries.find(pid);
        if (it == m_entries.end())
            return false;
        info.setPid(pid);
        info.setState(it->second.state);
        return true;
    }

    virtual bool term(pid_t pid) override
    {
        lock_guard<mutex> lock(m_mutex);
        ++m_termCount;
        auto it = m_entries.find(pid);
        if (it == m_entries.end())
            return false;
        if (!it->second.ignoreTerm)
            m_entries.erase(it);
        return true;
    }

    virtual bool kill(pid_t pid) override
    {
        lock_guard<mutex> lock(m_mutex);
        return m_entries.erase(pid) > 0;
    }

    virtual pid_t getSelfPid() override
    {
        return m_selfPid;
    }

private:
    struct Entry {
        Entry() : state('S'), ignoreTerm(false) {}

        char state;
        bool ignoreTerm;
    };

    mutex m_mutex;
    map<pid_t, Entry> m_entries;
    pid_t m_selfPid;
    int m_termCount = 0;

};

class FakeWindowSystem : public AbsWindowSystem {
public:
    FakeWindowSystem()
        : m_activeWindow(0),
          m_processTable(nullptr),
          m_refuseActivate(false),
          m_listCount(0)
    {
    }
    virtual ~FakeWindowSystem() {}

    // Closing a window ends its owner in processTable
    void setProcessTable(FakeProcessTable* processTable)
    {
        m_processTable = processTable;
    }

    void addWindow(WindowHandle handle, const string& title, pid_t pid, const string& windowClass, long long creationTime = 0)
    {
        lock_guard<mutex> lock(m_mutex);
        m_windows[handle] = make_shared<WindowInfo>(handle, title, pid, windowClass, creationTime);
    }

    void removeWindow(WindowHandle handle)
    {
        lock_guard<mutex> lock(m_mutex);
        m_windows.erase(handle);
        m_minimized.erase(handle);
        if (m_activeWindow == handle)
            m_activeWindow = 0;
    }

    void setActiveWindow(WindowHandle handle)
    {
        lock_guard<mutex> lock(m_mutex);
        m_activeWindow = handle;
    }

    void setRefuseActivate(bool refuseActivate)
    {
        m_refuseActivate = refuseActivate;
    }

    int getListCount()
    {
        lock_guard<mutex> lock(m_mutex);
        return m_listCount;
    }

    virtual vector<WindowInfoPtr> listWindows() override
    {
        vector<WindowInfoPtr> windows;
        lock_guard<mutex> lock(m_mutex);
        ++m_listCount;
        for (auto it = m_windows.begin(); it != m_windows.end(); ++it) {
            windows.push_back(it->second);
        }
        return windows;
    }

    virtual bool isWindow(WindowHandle handle) override
    {
        lock_guard<mutex> lock(m_mutex);
        return m_windows.find(handle) != m_windows.end();
    }

    virtual bool activate(WindowHandle handle) override
    {
        lock_guard<mutex> lock(m_mutex);
        if (m_refuseActivate || m_windows.find(handle) == m_windows.end())
            return false;
        m_activeWindow = handle;
        return true;
    }

    virtual bool minimize(WindowHandle handle) override
    {
        lock_guard<mutex> lock(m_mutex);
        if (m_windows.find(handle) == m_windows.end())
            return false;
        m_minimized.insert(handle);
        if (m_activeWindow == handle)
            m_activeWindow = 0;
        return true;
    }

    virtual bool restore(WindowHandle handle) override
    {
        lock_guard<mutex> lock(m_mutex);
        if (m_windows.find(handle) == m_windows.end())
            return false;
        m_minimized.erase(handle);
        return true;
    }

    virtual bool close(WindowHandle handle) override
    {
        pid_t owner = 0;
        {
            lock_guard<mutex> lock(m_mutex);
            auto it = m_windows.find(handle);
            if (it == m_windows.end())
                return false;
            owner = it->second->getPid();
            m_windows.erase(it);
            m_minimized.erase(handle);
            if (m_activeWindow == handle)
                m_activeWindow = 0;
        }
        if (m_processTable && owner > 0)
            m_processTable->exit(owner);
        return true;
    }

    virtual WindowHandle getActiveWindow() override
    {
        lock_guard<mutex> lock(m_mutex);
        return m_activeWindow;
    }

    virtual bool isMinimized(WindowHandle handle) override
    {
        lock_guard<mutex> lock(m_mutex);
        return m_minimized.count(handle) > 0;
    }

private:
    mutex m_mutex;
    map<WindowHandle, WindowInfoPtr> m_windows;
    set<WindowHandle> m_minimized;
    WindowHandle m_activeWindow;
    FakeProcessTable* m_processTable;
    bool m_refuseActivate;
    int m_listCount;

};

class FakeAndroidSubsystem : public AbsAndroidSubsystem {
public:
    FakeAndroidSubsystem()
        : m_isAvailable(true),
          m_launchCount(0),
          m_stopFails(false)
    {
    }
    virtual ~FakeAndroidSubsystem() {}

    void setAvailable(bool isAvailable)
    {
        m_isAvailable = isAvailable;
    }
    void install(const string& packageName)
    {
        m_packages.insert(packageName);
    }
    int getLaunchCount() const
    {
        return m_launchCount;
    }
    const string& getLastActivity() const
    {
        return m_lastActivity;
    }
    void setStopFails(bool stopFails)
    {
        m_stopFails = stopFails;
    }
    const vector<string>& getStopped() const
    {
        return m_stopped;
    }

    virtual bool isAvailable() override
    {
        return m_isAvailable;
    }

    virtual bool isInstalled(const string& packageName) override
    {
        return m_packages.count(packageName) > 0;
    }

    virtual bool launch(const string& packageName, const string& activity, string& errorText) override
    {
        if (!isInstalled(packageName)) {
            errorText = "not installed";
            return false;
        }
        ++m_launchCount;
        m_lastActivity = activity;
        return true;
    }

    virtual bool stop(const string& packageName, string& errorText) override
    {
        if (m_stopFails) {
            errorText = "force-stop failed";
            return false;
        }
        m_stopped.push_back(packageName);
        return true;
    }

private:
    bool m_isAvailable;
    set<string> m_packages;
    int m_launchCount;
    string m_lastActivity;
    bool m_stopFails;
    vector<string> m_stopped;

};

class RecordingAuditSink : public IAuditSink {
public:
    RecordingAuditSink()
        : m_throws(false)
    {
    }
    virtual ~RecordingAuditSink() {}

    void setThrows(bool throws)
    {
        m_throws = throws;
    }

    vector<InstanceEvent> getEvents()
    {
        lock_guard<mutex> lock(m_mutex);
        return m_events;
    }

    int count(const string& instanceId, InstanceEventType type)
    {
        int count = 0;
        lock_guard<mutex> lock(m_mutex);
        for (const InstanceEvent& event : m_events) {
            if (event.getInstanceId() == instanceId && event.getType() == type)
                ++count;
        }
        return count;
    }

    virtual void record(const InstanceEvent& event) override
    {
        {
            lock_guard<mutex> lock(m_mutex);
            m_events.push_back(event);
        }
        if (m_throws)
            throw runtime_error("audit storage is full");
    }

private:
    mutex m_mutex;
    vector<InstanceEvent> m_events;
    bool m_throws;

};

// Launcher whose outcome is scripted by the test
class FakeLauncher : public AbsLauncher {
public:
    FakeLauncher(AppKind kind, CorrelationMode mode)
        : m_kind(kind),
          m_mode(mode),
          m_nextPid(0),
          m_throws(false),
          m_fails(false),
          m_launchCount(0),
          m_relaunchResult(false),
          m_relaunchCount(0)
    {
        setClassName("FakeLauncher");
    }
    virtual ~FakeLauncher() {}

    void setNextPid(pid_t pid)
    {
        m_nextPid = pid;
    }
    void setThrows(bool throws)
    {
        m_throws = throws;
    }
    void setFails(bool fails)
    {
        m_fails = fails;
    }
    void setRequest(const CorrelationRequest& request)
    {
        m_request = request;
        m_hasRequest = true;
    }
    void setRelaunchResult(bool relaunchResult)
    {
        m_relaunchResult = relaunchResult;
    }
    int getLaunchCount()
    {
        lock_guard<mutex> lock(m_mutex);
        return m_launchCount;
    }
    int getRelaunchCount() const
    {
        return m_relaunchCount;
    }

    virtual AppKind getSupportedKind() const override
    {
        return m_kind;
    }
    virtual CorrelationMode getCorrelationMode() const override
    {
        return m_mode;
    }

    virtual LaunchResult launch(const ApplicationDescriptor& descriptor, const string& principal) override
    {
        lock_guard<mutex> lock(m_mutex);
        ++m_launchCount;
        if (m_throws)
            throw runtime_error("launcher exploded");
        if (m_fails)
            return LaunchResult::failure(ErrCode_LAUNCH_FAILED, "scripted failure");

        LaunchResult result = LaunchResult::success(m_nextPid);
        result.setMetadata("LauncherType", "Fake");
        return result;
    }

    virtual CorrelationRequest getCorrelationRequest(const ApplicationDescriptor& descriptor) override
    {
        if (m_hasRequest)
            return m_request;
        return AbsLauncher::getCorrelationRequest(descriptor);
    }

    virtual bool relaunch(const ApplicationInstance& instance, string& errorText) override
    {
        ++m_relaunchCount;
        if (!m_relaunchResult)
            errorText = "scripted relaunch failure";
        return m_relaunchResult;
    }

private:
    mutex m_mutex;
    AppKind m_kind;
    CorrelationMode m_mode;
    pid_t m_nextPid;
    bool m_throws;
    bool m_fails;
    int m_launchCount;
    bool m_relaunchResult;
    int m_relaunchCount;
    CorrelationRequest m_request;
    bool m_hasRequest = false;

};

#endif /* TESTS_UNIT_FAKECLIENTS_H_ */
