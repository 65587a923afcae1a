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

#ifndef UTIL_NATIVEPROCESS_H_
#define UTIL_NATIVEPROCESS_H_

#include <iostream>
#include <vector>
#include <map>
#include <glib.h>

using namespace std;

// Spawns one child in its own process group. The child is not reaped here:
// LinuxProcess::isAlive() collects the exit status when the monitor polls it.
class NativeProcess {
public:
    static map<string, string> getSessionEnvironments();
    static bool parseArguments(const string& commandLine, vector<string>& arguments, string& errorText);

    NativeProcess();
    virtual ~NativeProcess();

    void setWorkingDirectory(const string& directory)
    {
        m_workingDirectory = directory;
    }

    void setCommand(const string& command)
    {
        m_command = command;
    }
    const string& getCommand() const
    {
        return m_command;
    }

    void addArgument(const string& argument);
    void addArgument(const string& option, const string& value);
    void addArguments(const vector<string>& arguments);
    void addEnv(const map<string, string>& environments);
    void addEnv(const string& variable, const string& value);

    pid_t getPid() const
    {
        return m_pid;
    }

    void openStdFile(const string& stdFile);
    const string& getStdFile() const
    {
        return m_stdFile;
    }

    void closeStdFd();

    bool run(string& errorText);

private:
    static const string CLASS_NAME;

    static void convertEnvToStr(const map<string, string>& src, vector<string>& dest);
    static void prepareSpawn(gpointer user_data);

    NativeProcess(const NativeProcess&);
    NativeProcess& operator=(const NativeProcess&);

    string m_workingDirectory;
    string m_command;

    vector<string> m_arguments;
    map<string, string> m_environments;

    pid_t m_pid;
    string m_stdFile;
    gint m_stdFd;

};

#endif /* UTIL_NATIVEPROCESS_H_ */
