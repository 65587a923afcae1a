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

#include "lifecycle/launcher/WebPageLauncher.h"

#include "conf/LAMConf.h"
#include "util/Logger.h"
#include "util/NativeProcess.h"

WebPageLauncher::WebPageLauncher()
{
    setClassName("WebPageLauncher");
}

WebPageLauncher::~WebPageLauncher()
{
}

LaunchResult WebPageLauncher::launch(const ApplicationDescriptor& descriptor, const string& principal)
{
    const string& url = descriptor.getTarget();
    if (url.find("://") == string::npos)
        return LaunchResult::failure(ErrCode_ARGUMENT_INVALID, "Invalid URL: " + url);

    string browser = findFirstProgram(LAMConf::getInstance().getBrowserPaths());
    if (browser.empty()) {
        Logger::error(getClassName(), __FUNCTION__, descriptor.getId(), "No web browser available");
        return LaunchResult::failure(ErrCode_LAUNCH_FAILED, "No web browser available");
    }

    vector<string> arguments;
    string errorText;
    if (!NativeProcess::parseArguments(descriptor.getArguments(), arguments, errorText))
        return LaunchResult::failure(ErrCode_ARGUMENT_INVALID, "Invalid arguments: " + errorText);
    arguments.push_back(url);

    LaunchResult result = spawn(browser, arguments, descriptor.getWorkingDirectory(), descriptor, principal);
    if (result.isSuccess()) {
        result.setMetadata("WebUrl", url);
        result.setMetadata("Browser", browser);
    }
    return result;
}
