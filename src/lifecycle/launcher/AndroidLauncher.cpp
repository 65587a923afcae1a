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

#include "lifecycle/launcher/AndroidLauncher.h"

#include <boost/bind.hpp>
#include <vector>

#include "conf/LAMConf.h"
#include "util/Logger.h"

AndroidLauncher::AndroidLauncher(AbsAndroidSubsystem& subsystem, WindowManager& windowManager, guint watchInterval)
    : m_subsystem(subsystem),
      m_windowManager(windowManager),
      m_ticker("AndroidWindowTicker", watchInterval)
{
    setClassName("AndroidLauncher");
    m_tickConnection = m_ticker.EventTick.connect(boost::bind(&AndroidLauncher::checkWindows, this));
}

AndroidLauncher::~AndroidLauncher()
{
    stopWatching();
}

LaunchResult AndroidLauncher::launch(const ApplicationDescriptor& descriptor, const string& principal)
{
    const string& packageName = descriptor.getTarget();
    if (!AndroidArguments::isValidPackageName(packageName))
        return LaunchResult::failure(ErrCode_ARGUMENT_INVALID, "Invalid package name: " + packageName);

    AndroidArguments arguments;
    arguments.parse(descriptor.getArguments());

    if (!m_subsystem.isAvailable()) {
        Logger::error(getClassName(), __FUNCTION__, descriptor.getId(), "Android subsystem is not available");
        return LaunchResult::failure(ErrCode_LAUNCH_FAILED, "Android subsystem is not available");
    }
    if (!m_subsystem.isInstalled(packageName)) {
        Logger::error(getClassName(), __FUNCTION__, descriptor.getId(), "Package is not installed", packageName);
        return LaunchResult::failure(ErrCode_LAUNCH_FAILED, "Package is not installed: " + packageName);
    }

    string errorText;
    if (!m_subsystem.launch(packageName, arguments.getActivityName(), errorText)) {
        Logger::error(getClassName(), __FUNCTION__, descriptor.getId(), "Failed to launch", errorText);
        return LaunchResult::failure(ErrCode_LAUNCH_FAILED, "Failed to launch " + packageName + ": " + errorText);
    }

    LaunchResult result = LaunchResult::success(0);
    result.setMetadata("AndroidPackageName", packageName);
    result.setMetadata("LauncherType", "Android");
    if (!arguments.getActivityName().empty())
        result.setMetadata("AndroidActivity", arguments.getActivityName());
    for (auto it = arguments.getCustomParameters().begin(); it != arguments.getCustomParameters().end(); ++it) {
        result.setMetadata("Android." + it->first, it->second);
    }
    Logger::info(getClassName(), __FUNCTION__, descriptor.getId(), Logger::format("package(%s) principal(%s)", packageName.c_str(), principal.c_str()));
    return result;
}

CorrelationRequest AndroidLauncher::getCorrelationRequest(const ApplicationDescriptor& descriptor)
{
    AndroidArguments arguments;
    arguments.parse(descriptor.getArguments());

    CorrelationRequest request;
    request.windowClass = LAMConf::getInstance().getAndroidWindowClass();
    if (!arguments.getWindowName().empty()) {
        request.titleHint = arguments.getWindowName();
        request.exactTitle = true;
    } else {
        request.titleHint = descriptor.getName();
    }
    request.waitForWindow = arguments.isWaitForWindow();
    request.searchTimeout = (long long) arguments.getLaunchTimeout() * 1000;
    request.allowPlaceholder = arguments.isVirtualFallback();
    request.placeholderTitle = descriptor.getName() + " (Android)";
    return request;
}

bool AndroidLauncher::relaunch(const ApplicationInstance& instance, string& errorText)
{
    ApplicationDescriptorPtr descriptor = instance.getDescriptor();
    AndroidArguments arguments;
    arguments.parse(descriptor->getArguments());

    if (!m_subsystem.launch(descriptor->getTarget(), arguments.getActivityName(), errorText)) {
        Logger::warning(getClassName(), __FUNCTION__, instance.getInstanceId(), "Relaunch failed", errorText);
        return false;
    }
    Logger::info(getClassName(), __FUNCTION__, instance.getInstanceId(), "Relaunched", descriptor->getTarget());
    return true;
}

bool AndroidLauncher::terminate(const ApplicationInstance& instance, bool force, string& errorText)
{
    const string& packageName = instance.getDescriptor()->getTarget();
    if (!m_subsystem.stop(packageName, errorText)) {
        Logger::warning(getClassName(), __FUNCTION__, instance.getInstanceId(), "Failed to stop " + packageName, errorText);
        return false;
    }
    unwatch(instance.getInstanceId());
    Logger::info(getClassName(), __FUNCTION__, instance.getInstanceId(), "Stopped", packageName);
    return true;
}

void AndroidLauncher::watch(const string& instanceId, WindowInfoPtr window)
{
    if (!window || window->isPlaceholder())
        return;

    lock_guard<mutex> lock(m_mutex);
    WatchedWindow watched;
    watched.handle = window->getHandle();
    watched.active = false;
    m_watched[instanceId] = watched;
}

void AndroidLauncher::unwatch(const string& instanceId)
{
    lock_guard<mutex> lock(m_mutex);
    m_watched.erase(instanceId);
}

void AndroidLauncher::startWatching()
{
    m_ticker.start();
}

void AndroidLauncher::stopWatching()
{
    m_ticker.stop();
}

void AndroidLauncher::checkWindows()
{
    map<string, WatchedWindow> watched;
    {
        lock_guard<mutex> lock(m_mutex);
        watched = m_watched;
    }
    if (watched.empty())
        return;

    WindowHandle activeWindow = m_windowManager.getActiveWindow();
    vector<string> closed;
    vector<string> activated;
    for (auto it = watched.begin(); it != watched.end(); ++it) {
        if (!m_windowManager.isWindowValid(it->second.handle)) {
            closed.push_back(it->first);
            continue;
        }
        bool active = it->second.handle == activeWindow;
        if (active && !it->second.active)
            activated.push_back(it->first);

        lock_guard<mutex> lock(m_mutex);
        auto found = m_watched.find(it->first);
        if (found != m_watched.end())
            found->second.active = active;
    }

    for (const string& instanceId : closed) {
        unwatch(instanceId);
        Logger::info(getClassName(), __FUNCTION__, instanceId, "Window closed");
        EventWindowClosed(instanceId);
    }
    for (const string& instanceId : activated) {
        EventWindowActivated(instanceId);
    }
}
