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

#include "lifecycle/ProcessMonitor.h"

#include <boost/bind.hpp>
#include <vector>

#include "util/Logger.h"
#include "util/Time.h"

ProcessMonitor::ProcessMonitor(AbsProcessTable& processTable, guint interval)
    : m_processTable(processTable),
      m_ticker("ProcessMonitorTicker", interval)
{
    setClassName("ProcessMonitor");
    m_tickConnection = m_ticker.EventTick.connect(boost::bind(&ProcessMonitor::onTick, this));
}

ProcessMonitor::~ProcessMonitor()
{
    stop();
}

void ProcessMonitor::start()
{
    if (m_ticker.isRunning())
        return;
    m_ticker.start();
    Logger::info(getClassName(), __FUNCTION__, Logger::format("interval(%u)", m_ticker.getInterval()));
}

void ProcessMonitor::stop()
{
    if (!m_ticker.isRunning())
        return;
    m_ticker.stop();
    Logger::info(getClassName(), __FUNCTION__, "Stopped");
}

bool ProcessMonitor::isRunning()
{
    return m_ticker.isRunning();
}

void ProcessMonitor::setInterval(guint interval)
{
    m_ticker.setInterval(interval);
}

bool ProcessMonitor::watch(pid_t pid)
{
    if (pid <= 0)
        return false;

    lock_guard<mutex> lock(m_mutex);
    if (m_watched.find(pid) != m_watched.end())
        return true;
    m_watched[pid] = true;
    Logger::debug(getClassName(), __FUNCTION__, std::to_string(pid), Logger::format("watching(%d)", (int) m_watched.size()));
    return true;
}

bool ProcessMonitor::unwatch(pid_t pid)
{
    lock_guard<mutex> lock(m_mutex);
    return m_watched.erase(pid) > 0;
}

bool ProcessMonitor::isWatching(pid_t pid)
{
    lock_guard<mutex> lock(m_mutex);
    return m_watched.find(pid) != m_watched.end();
}

bool ProcessMonitor::isProcessAlive(pid_t pid)
{
    if (pid <= 0)
        return false;
    return m_processTable.isAlive(pid);
}

bool ProcessMonitor::getProcessInfo(pid_t pid, ProcessInfo& info)
{
    if (pid <= 0)
        return false;
    return m_processTable.getInfo(pid, info);
}

bool ProcessMonitor::terminateProcess(pid_t pid)
{
    if (pid <= 0 || isSelf(pid))
        return false;
    return m_processTable.term(pid);
}

bool ProcessMonitor::killProcess(pid_t pid)
{
    if (pid <= 0 || isSelf(pid))
        return false;
    return m_processTable.kill(pid);
}

bool ProcessMonitor::waitForExit(pid_t pid, long long timeout)
{
    if (pid <= 0)
        return true;

    long long deadline = Time::getCurrentTime() + timeout;
    while (isProcessAlive(pid)) {
        if (Time::getCurrentTime() >= deadline)
            return false;
        Time::sleep(100);
    }
    return true;
}

void ProcessMonitor::poll()
{
    vector<pid_t> exited;
    vector<pair<pid_t, bool>> changed;

    map<pid_t, bool> watched;
    {
        lock_guard<mutex> lock(m_mutex);
        watched = m_watched;
    }

    for (auto it = watched.begin(); it != watched.end(); ++it) {
        pid_t pid = it->first;
        if (!m_processTable.isAlive(pid)) {
            exited.push_back(pid);
            continue;
        }

        ProcessInfo info;
        if (!m_processTable.getInfo(pid, info))
            continue;
        if (info.isResponding() != it->second)
            changed.push_back(make_pair(pid, info.isResponding()));
    }

    {
        lock_guard<mutex> lock(m_mutex);
        // unwatch() may have raced with us. Only report pids that are still watched.
        for (auto it = exited.begin(); it != exited.end();) {
            if (m_watched.erase(*it) == 0)
                it = exited.erase(it);
            else
                ++it;
        }
        for (auto it = changed.begin(); it != changed.end();) {
            auto found = m_watched.find(it->first);
            if (found == m_watched.end() || found->second == it->second) {
                it = changed.erase(it);
            } else {
                found->second = it->second;
                ++it;
            }
        }
    }

    for (pid_t pid : exited) {
        Logger::info(getClassName(), __FUNCTION__, std::to_string(pid), "Process exited");
        EventProcessExited(pid);
    }
    for (auto& item : changed) {
        Logger::warning(getClassName(), __FUNCTION__, std::to_string(item.first),
                        item.second ? "Responding again" : "Not responding");
        EventProcessResponsivenessChanged(item.first, item.second);
    }
}

void ProcessMonitor::onTick()
{
    poll();
    EventTick();
}

bool ProcessMonitor::isSelf(pid_t pid)
{
    if (pid == m_processTable.getSelfPid()) {
        Logger::error(getClassName(), __FUNCTION__, std::to_string(pid), "Refused to signal own process");
        return true;
    }
    return false;
}
