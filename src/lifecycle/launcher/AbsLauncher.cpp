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

#include "lifecycle/launcher/AbsLauncher.h"

#include <glib.h>

#include "conf/LAMConf.h"
#include "util/File.h"
#include "util/Logger.h"
#include "util/NativeProcess.h"

const char* AbsLauncher::toString(CorrelationMode mode)
{
    switch (mode) {
    case CorrelationMode::CorrelationMode_None:
        return "none";

    case CorrelationMode::CorrelationMode_Process:
        return "process";

    case CorrelationMode::CorrelationMode_Heuristic:
        return "heuristic";
    }
    return "unknown";
}

string AbsLauncher::findFirstProgram(const vector<string>& candidates)
{
    for (const string& candidate : candidates) {
        string path = File::findProgram(candidate);
        if (!path.empty())
            return path;
    }
    return "";
}

LaunchResult AbsLauncher::spawn(const string& program, const vector<string>& arguments, const string& workingDirectory,
                                const ApplicationDescriptor& descriptor, const string& principal)
{
    NativeProcess process;
    process.setCommand(program);
    process.addArguments(arguments);
    process.setWorkingDirectory(File::isDirectory(workingDirectory) ? workingDirectory : g_get_home_dir());
    process.addEnv(NativeProcess::getSessionEnvironments());
    process.addEnv("LAM_APP_ID", descriptor.getId());
    process.addEnv("LAM_INSTANCE_PRINCIPAL", principal);

    string logDirectory = LAMConf::getInstance().getAppLogDirectory();
    if (!logDirectory.empty()) {
        if (File::makeDirectory(logDirectory))
            process.openStdFile(File::join(logDirectory, descriptor.getId() + ".log"));
        else
            Logger::warning(getClassName(), __FUNCTION__, logDirectory, "Failed to create log directory");
    }

    string errorText;
    if (!process.run(errorText)) {
        Logger::error(getClassName(), __FUNCTION__, descriptor.getId(), errorText);
        return LaunchResult::failure(ErrCode_LAUNCH_FAILED, errorText);
    }

    Logger::info(getClassName(), __FUNCTION__, descriptor.getId(), Logger::format("pid(%d) %s", process.getPid(), program.c_str()));
    return LaunchResult::success(process.getPid());
}
