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

#include "util/LinuxProcess.h"

#include <errno.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>

#include <glib.h>
#include <proc/readproc.h>

#include "util/Logger.h"

const string LinuxProcess::CLASS_NAME = "LinuxProcess";

string LinuxProcess::convertPidsToString(const PidVector& pids)
{
    string result;
    string delim;
    for (pid_t pid : pids) {
        result += delim;
        result += std::to_string(pid);
        delim = " ";
    }
    return result;
}

bool LinuxProcess::killProcesses(const PidVector& pids, int sig)
{
    auto it = pids.begin();
    if (it == pids.end())
        return true;

    // first process is parent process, killing child processes later can fail if parent itself terminates them
    bool success = ::kill(*it, sig) == 0;
    while (++it != pids.end()) {
        ::kill(*it, sig);
    }
    return success;
}

bool LinuxProcess::isAlive(pid_t pid)
{
    if (pid <= 0)
        return false;

    int status = 0;
    pid_t result = waitpid(pid, &status, WNOHANG);
    if (result == pid) {
        Logger::info(CLASS_NAME, __FUNCTION__, std::to_string(pid), Logger::format("Reaped child (status %d)", status));
        return false;
    }
    if (result == 0) {
        return true;
    }

    // Not our child
    if (::kill(pid, 0) == -1 && errno != EPERM)
        return false;

    ProcessInfo info;
    if (readProcessInfo(pid, info) && info.isZombie())
        return false;
    return true;
}

bool LinuxProcess::readProcessInfo(pid_t pid, ProcessInfo& info)
{
    if (pid <= 0)
        return false;

    pid_t pids[2] = { pid, 0 };
    PROCTAB* proctab = openproc(PROC_FILLSTAT | PROC_FILLSTATUS | PROC_PID, pids);
    if (!proctab) {
        Logger::warning(CLASS_NAME, __FUNCTION__, std::to_string(pid), "Failed to open proctab");
        return false;
    }

    bool found = false;
    proc_t* proc = readproc(proctab, NULL);
    if (proc) {
        static const long ticks = sysconf(_SC_CLK_TCK);

        info.setPid(proc->tid);
        info.setParentPid(proc->ppid);
        info.setName(proc->cmd);
        info.setState(proc->state);
        info.setResidentMemory(proc->vm_rss);
        if (ticks > 0)
            info.setStartTime((long long) proc->start_time * 1000 / ticks);
        freeproc(proc);
        found = true;
    }
    closeproc(proctab);
    return found;
}

PidVector LinuxProcess::findChildPids(pid_t pid)
{
    PidVector pids;
    pids.push_back(pid);

    proc_t **proctab = readproctab(PROC_FILLSTAT);
    if (!proctab) {
        Logger::error(CLASS_NAME, __FUNCTION__, "readproctab_error", "failed to read proctab");
        return pids;
    }

    size_t idx = 0;
    while (idx != pids.size()) {
        for (proc_t **proc = proctab; *proc; ++proc) {
            pid_t tid = (*proc)->tid;
            pid_t ppid = (*proc)->ppid;
            if (ppid == pids[idx]) {
                pids.push_back(tid);
            }
        }
        ++idx;
    }

    for (proc_t **proc = proctab; *proc; ++proc) {
        freeproc(*proc);
    }

    free(proctab);

    return pids;
}

bool LinuxProcess::sendSignal(pid_t pid, int sig)
{
    if (pid <= 0)
        return false;

    if (getpgid(pid) == pid) {
        if (killpg(pid, sig) == 0)
            return true;
        Logger::warning(CLASS_NAME, __FUNCTION__, std::to_string(pid), Logger::format("killpg failed: %s", strerror(errno)));
    }

    PidVector pids = findChildPids(pid);
    Logger::debug(CLASS_NAME, __FUNCTION__, std::to_string(pid), Logger::format("signal(%d) pids(%s)", sig, convertPidsToString(pids).c_str()));
    if (!killProcesses(pids, sig)) {
        Logger::error(CLASS_NAME, __FUNCTION__, std::to_string(pid), strerror(errno));
        return false;
    }
    return true;
}

bool LinuxProcess::runCommand(const vector<string>& arguments, string& output, string& errorText)
{
    if (arguments.empty()) {
        errorText = "Command is empty";
        return false;
    }

    vector<const char*> argv;
    for (const string& argument : arguments) {
        argv.push_back(argument.c_str());
    }
    argv.push_back(NULL);

    gchar* standardOutput = NULL;
    gchar* standardError = NULL;
    gint waitStatus = 0;
    GError* gerr = NULL;
    gboolean result = g_spawn_sync(NULL,
                                   const_cast<char**>(argv.data()),
                                   NULL,
                                   G_SPAWN_SEARCH_PATH,
                                   NULL, NULL,
                                   &standardOutput,
                                   &standardError,
                                   &waitStatus,
                                   &gerr);
    if (gerr) {
        errorText = gerr->message;
        Logger::warning(CLASS_NAME, __FUNCTION__, arguments[0], gerr->message);
        g_error_free(gerr);
        g_free(standardOutput);
        g_free(standardError);
        return false;
    }

    output = standardOutput ? standardOutput : "";
    string errorOutput = standardError ? standardError : "";
    g_free(standardOutput);
    g_free(standardError);

    if (!result || !WIFEXITED(waitStatus) || WEXITSTATUS(waitStatus) != 0) {
        errorText = errorOutput.empty() ? Logger::format("'%s' exited abnormally", arguments[0].c_str()) : errorOutput;
        Logger::warning(CLASS_NAME, __FUNCTION__, arguments[0], errorText);
        return false;
    }
    return true;
}
