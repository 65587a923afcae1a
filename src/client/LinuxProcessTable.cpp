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

#include "client/LinuxProcessTable.h"

#include <signal.h>
#include <unistd.h>

#include "util/LinuxProcess.h"
#include "util/Logger.h"

LinuxProcessTable::LinuxProcessTable()
{
    setClassName("LinuxProcessTable");
}

LinuxProcessTable::~LinuxProcessTable()
{
}

bool LinuxProcessTable::isAlive(pid_t pid)
{
    return LinuxProcess::isAlive(pid);
}

bool LinuxProcessTable::getInfo(pid_t pid, ProcessInfo& info)
{
    return LinuxProcess::readProcessInfo(pid, info);
}

bool LinuxProcessTable::term(pid_t pid)
{
    Logger::info(getClassName(), __FUNCTION__, std::to_string(pid), "SIGTERM");
    return LinuxProcess::sendSignal(pid, SIGTERM);
}

bool LinuxProcessTable::kill(pid_t pid)
{
    Logger::info(getClassName(), __FUNCTION__, std::to_string(pid), "SIGKILL");
    return LinuxProcess::sendSignal(pid, SIGKILL);
}

pid_t LinuxProcessTable::getSelfPid()
{
    return getpid();
}
