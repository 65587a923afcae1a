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

#include "client/WaydroidSubsystem.h"

#include <sstream>

#include "util/File.h"
#include "util/LinuxProcess.h"
#include "util/Logger.h"

WaydroidSubsystem::WaydroidSubsystem(const string& command)
    : m_command(command)
{
    setClassName("WaydroidSubsystem");
}

WaydroidSubsystem::~WaydroidSubsystem()
{
}

vector<string> WaydroidSubsystem::parsePackages(const string& output)
{
    static const string PREFIX = "packageName:";

    vector<string> packages;
    istringstream stream(output);
    string line;
    while (getline(stream, line)) {
        size_t pos = line.find(PREFIX);
        if (pos == string::npos)
            continue;

        string name = line.substr(pos + PREFIX.size());
        size_t begin = name.find_first_not_of(" \t");
        size_t end = name.find_last_not_of(" \t\r");
        if (begin == string::npos)
            continue;
        packages.push_back(name.substr(begin, end - begin + 1));
    }
    return packages;
}

bool WaydroidSubsystem::isAvailable()
{
    if (File::findProgram(m_command).empty()) {
        Logger::warning(getClassName(), __FUNCTION__, m_command, "Command is not found");
        return false;
    }

    string output;
    string errorText;
    if (!run({ m_command, "status" }, output, errorText))
        return false;

    if (output.find("RUNNING") == string::npos) {
        Logger::info(getClassName(), __FUNCTION__, "Session is not running");
        return false;
    }
    return true;
}

bool WaydroidSubsystem::isInstalled(const string& packageName)
{
    string output;
    string errorText;
    if (!run({ m_command, "app", "list" }, output, errorText))
        return false;

    for (const string& name : parsePackages(output)) {
        if (name == packageName)
            return true;
    }
    return false;
}

bool WaydroidSubsystem::launch(const string& packageName, const string& activity, string& errorText)
{
    vector<string> arguments;
    if (activity.empty()) {
        arguments = { m_command, "app", "launch", packageName };
    } else {
        string component = activity.find('/') == string::npos ? packageName + "/" + activity : activity;
        arguments = { m_command, "shell", "am", "start", "-n", component };
    }

    string output;
    if (!run(arguments, output, errorText))
        return false;

    Logger::info(getClassName(), __FUNCTION__, packageName, "Launch requested", activity);
    return true;
}

bool WaydroidSubsystem::stop(const string& packageName, string& errorText)
{
    string output;
    if (!run({ m_command, "shell", "am", "force-stop", packageName }, output, errorText))
        return false;

    Logger::info(getClassName(), __FUNCTION__, packageName, "Stopped");
    return true;
}

bool WaydroidSubsystem::run(const vector<string>& arguments, string& output, string& errorText)
{
    if (!LinuxProcess::runCommand(arguments, output, errorText)) {
        Logger::warning(getClassName(), __FUNCTION__, arguments[1], errorText);
        return false;
    }
    return true;
}
