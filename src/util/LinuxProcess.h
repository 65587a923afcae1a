// Copyright (c) 2020-2026 LG Electronics, Inc.
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

#ifndef UTIL_LINUXPROCESS_H_
#define UTIL_LINUXPROCESS_H_

#include <iostream>
#include <vector>
#include <sys/types.h>

#include "base/ProcessInfo.h"

using namespace std;

typedef vector<pid_t> PidVector;

class LinuxProcess {
public:
    static string convertPidsToString(const PidVector& pids);

    // Reaps the exit status when pid is our own child.
    static bool isAlive(pid_t pid);
    static bool readProcessInfo(pid_t pid, ProcessInfo& info);
    static PidVector findChildPids(pid_t pid);

    // Signals the whole process group when pid leads one, otherwise pid and its descendants.
    static bool sendSignal(pid_t pid, int sig);

    static bool runCommand(const vector<string>& arguments, string& output, string& errorText);

private:
    static const string CLASS_NAME;

    static bool killProcesses(const PidVector& pids, int sig);

    LinuxProcess();
    virtual ~LinuxProcess();

};

#endif /* UTIL_LINUXPROCESS_H_ */
