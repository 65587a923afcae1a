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

#include "lifecycle/launcher/BrowserAppLauncher.h"

#include "conf/LAMConf.h"
#include "util/File.h"
#include "util/Logger.h"
#include "util/NativeProcess.h"

BrowserAppLauncher::BrowserAppLauncher()
{
    setClassName("BrowserAppLauncher");
}

BrowserAppLauncher::~BrowserAppLauncher()
{
}

LaunchResult BrowserAppLauncher::launch(const ApplicationDescriptor& descriptor, const string& principal)
{
    const string& url = descriptor.getTarget();
    if (url.find("://") == string::npos)
        return LaunchResult::failure(ErrCode_ARGUMENT_INVALID, "Invalid URL: " + url);

    string browser = findFirstProgram(LAMConf::getInstance().getAppModeBrowserPaths());
    if (browser.empty()) {
        Logger::error(getClassName(), __FUNCTION__, descriptor.getId(), "No app-mode browser available");
        return LaunchResult::failure(ErrCode_LAUNCH_FAILED, "No app-mode browser available");
    }

    string profile = File::join(LAMConf::getInstance().getAppModeProfileDirectory(), descriptor.getId());
    if (!File::makeDirectory(profile))
        Logger::warning(getClassName(), __FUNCTION__, profile, "Failed to create profile directory");

    vector<string> arguments;
    arguments.push_back("--app=" + url);
    arguments.push_back("--user-data-dir=" + profile);
    arguments.push_back("--class=" + descriptor.getId());
    arguments.push_back("--no-first-run");

    vector<string> extra;
    string errorText;
    if (!NativeProcess::parseArguments(descriptor.getArguments(), extra, errorText))
        return LaunchResult::failure(ErrCode_ARGUMENT_INVALID, "Invalid arguments: " + errorText);
    arguments.insert(arguments.end(), extra.begin(), extra.end());

    LaunchResult result = spawn(browser, arguments, descriptor.getWorkingDirectory(), descriptor, principal);
    if (result.isSuccess()) {
        result.setMetadata("WebUrl", url);
        result.setMetadata("ExpectedWindowTitle", descriptor.getName());
        result.setMetadata("Browser", browser);
    }
    return result;
}

CorrelationRequest BrowserAppLauncher::getCorrelationRequest(const ApplicationDescriptor& descriptor)
{
    CorrelationRequest request = AbsLauncher::getCorrelationRequest(descriptor);
    request.windowClass = descriptor.getId();
    return request;
}
