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

#ifndef LIFECYCLE_PROCESSMONITOR_H_
#define LIFECYCLE_PROCESSMONITOR_H_

#include <iostream>
#include <map>
#include <mutex>
#include <sys/types.h>
#include <boost/signals2.hpp>

#include "client/AbsProcessTable.h"
#include "interface/IClassName.h"
#include "util/Ticker.h"

using namespace std;

// Polls watched pids. Signals are raised on the ticker thread,
// or on the caller's thread when poll() is called directly.
class ProcessMonitor : public IClassName {
public:
    ProcessMonitor(AbsProcessTable& processTable, guint interval = 2000);
    virtual ~ProcessMonitor();

    void start();
    void stop();
    bool isRunning();

    void setInterval(guint interval);

    // Adding an already watched pid is ignored
    bool watch(pid_t pid);
    bool unwatch(pid_t pid);
    bool isWatching(pid_t pid);

    bool isProcessAlive(pid_t pid);
    bool getProcessInfo(pid_t pid, ProcessInfo& info);

    bool terminateProcess(pid_t pid);
    bool killProcess(pid_t pid);

    // Returns true once pid is gone. Polls every 100ms until timeout.
    bool waitForExit(pid_t pid, long long timeout);

    // One monitoring round
    void poll();

    boost::signals2::signal<void(pid_t pid)> EventProcessExited;
    boost::signals2::signal<void(pid_t pid, bool responding)> EventProcessResponsivenessChanged;
    // Raised after every poll round
    boost::signals2::signal<void()> EventTick;

private:
    void onTick();
    bool isSelf(pid_t pid);

    AbsProcessTable& m_processTable;
    Ticker m_ticker;
    boost::signals2::scoped_connection m_tickConnection;

    mutex m_mutex;
    // pid ==> responding
    map<pid_t, bool> m_watched;

};

#endif /* LIFECYCLE_PROCESSMONITOR_H_ */
