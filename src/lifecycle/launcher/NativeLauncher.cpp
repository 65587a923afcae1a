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

#include "lifecycle/launcher/NativeLauncher.h"

#include "util/File.h"
#include "util/Logger.h"
#include "util/NativeProcess.h"

NativeLauncher::NativeLauncher()
{
    setClassName("NativeLauncher");
}

NativeLauncher::~NativeLauncher()
{
}

LaunchResult NativeLauncher::launch(const ApplicationDescriptor& descriptor, const string& principal)
{
    if (descriptor.getTarget().empty())
        return LaunchResult::failure(ErrCode_ARGUMENT_INVALID, "Executable is not specified");

    string executable = File::findProgram(descriptor.getTarget());
    if (executable.empty()) {
        Logger::warning(getClassName(), __FUNCTION__, descriptor.getId(), "Executable is not found", descriptor.getTarget());
        return LaunchResult::failure(ErrCode_LAUNCH_FAILED, "Executable not found: " + descriptor.getTarget());
    }

    vector<string> arguments;
    string errorText;
    if (!NativeProcess::parseArguments(descriptor.getArguments(), arguments, errorText))
        return LaunchResult::failure(ErrCode_ARGUMENT_INVALID, "Invalid arguments: " + errorText);

    string workingDirectory = descriptor.getWorkingDirectory();
    if (workingDirectory.empty() && executable.find('/') != string::npos)
        workingDirectory = executable.substr(0, executable.rfind('/'));

    LaunchResult result = spawn(executable, arguments, workingDirectory, descriptor, principal);
    if (result.isSuccess())
        result.setMetadata("ExecutablePath", executable);
    return result;
}
