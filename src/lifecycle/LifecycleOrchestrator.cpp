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

#include "lifecycle/LifecycleOrchestrator.h"

#include <algorithm>
#include <boost/bind.hpp>

#include "conf/LAMConf.h"
#include "interface/IWindowEventSource.h"
#include "lifecycle/WindowCorrelator.h"
#include "util/Logger.h"
#include "util/Time.h"

LifecycleOrchestrator::LifecycleOrchestrator(ProcessMonitor& processMonitor, WindowManager& windowManager, InstanceManager& instanceManager)
    : m_processMonitor(processMonitor),
      m_windowManager(windowManager),
      m_instanceManager(instanceManager),
      m_auditSink(nullptr),
      m_catalog(nullptr),
      m_principalProvider(nullptr),
      m_windowSearchTimeout(5000),
      m_windowSearchInterval(500),
      m_terminatedRetention(60000),
      m_autoStartMonitoring(true),
      m_isMonitoring(false),
      m_windowTicker("WindowReconcileTicker", 5000)
{
    setClassName("LifecycleOrchestrator");

    m_connections.push_back(m_instanceManager.EventInstanceChanged.connect(
        boost::bind(&LifecycleOrchestrator::onInstanceChanged, this, boost::placeholders::_1)));
    m_connections.push_back(m_processMonitor.EventTick.connect(
        boost::bind(&LifecycleOrchestrator::onMonitorTick, this)));
    m_connections.push_back(m_windowTicker.EventTick.connect(
        boost::bind(&LifecycleOrchestrator::reconcileWindows, this)));
}

LifecycleOrchestrator::~LifecycleOrchestrator()
{
    stopMonitoring();
    for (boost::signals2::connection& connection : m_connections) {
        connection.disconnect();
    }
}

void LifecycleOrchestrator::applyConf()
{
    LAMConf& conf = LAMConf::getInstance();
    m_windowSearchTimeout = conf.getWindowSearchTimeout();
    m_windowSearchInterval = conf.getWindowSearchInterval();
    m_terminatedRetention = conf.getTerminatedRetention();
    m_autoStartMonitoring = conf.isAutoStartMonitoring();
    m_windowTicker.setInterval(conf.getWindowWatchInterval());

    m_processMonitor.setInterval(conf.getProcessPollInterval());
    m_windowManager.setCacheTtl(conf.getCorrelationCacheTtl());
    m_windowManager.setCorrelationWindow(conf.getCorrelationWindow());
    m_instanceManager.setTerminateTimeout(conf.getTerminateTimeout());
    m_instanceManager.setKillTimeout(conf.getKillTimeout());
}

void LifecycleOrchestrator::addLauncher(AbsLauncherPtr launcher)
{
    if (!launcher)
        return;

    IWindowEventSource* source = dynamic_cast<IWindowEventSource*>(launcher.get());
    if (source) {
        m_connections.push_back(source->EventWindowActivated.connect(
            boost::bind(&LifecycleOrchestrator::onWindowActivated, this, boost::placeholders::_1)));
        m_connections.push_back(source->EventWindowClosed.connect(
            boost::bind(&LifecycleOrchestrator::onWindowClosed, this, boost::placeholders::_1)));
    }

    bool isMonitoring = false;
    {
        lock_guard<mutex> lock(m_mutex);
        m_launchers.push_back(launcher);
        isMonitoring = m_isMonitoring;
    }
    if (source && isMonitoring)
        source->startWatching();

    Logger::info(getClassName(), __FUNCTION__, launcher->getClassName(),
                 Logger::format("kind(%s) correlation(%s) windowEvents(%s)",
                 ApplicationDescriptor::toString(launcher->getSupportedKind()).c_str(),
                 AbsLauncher::toString(launcher->getCorrelationMode()), Logger::toString(source != nullptr)));
}

LaunchResult LifecycleOrchestrator::launch(ApplicationDescriptorPtr descriptor, const string& principal)
{
    if (!descriptor || descriptor->getId().empty()) {
        Logger::warning(getClassName(), __FUNCTION__, "Descriptor is empty");
        return LaunchResult::failure(ErrCode_ARGUMENT_INVALID, "Application descriptor is empty");
    }
    if (principal.empty()) {
        Logger::warning(getClassName(), __FUNCTION__, descriptor->getId(), "Principal is empty");
        return LaunchResult::failure(ErrCode_ARGUMENT_INVALID, "Principal is empty");
    }

    if (m_autoStartMonitoring && !isMonitoring())
        startMonitoring();

    if (descriptor->isSingleInstance() && descriptor->getKind() != AppKind::AppKind_Folder) {
        LaunchResult existing = switchToExisting(*descriptor, principal);
        if (existing.isSuccess())
            return existing;
    }

    AbsLauncherPtr launcher = findLauncher(*descriptor);
    if (!launcher) {
        string errorText = "No suitable launcher for " + ApplicationDescriptor::toString(descriptor->getKind()) + " application";
        Logger::error(getClassName(), __FUNCTION__, descriptor->getId(), errorText);
        return LaunchResult::failure(ErrCode_NO_SUITABLE_LAUNCHER, errorText);
    }

    Logger::info(getClassName(), __FUNCTION__, descriptor->getId(),
                 Logger::format("launcher(%s) principal(%s)", launcher->getClassName().c_str(), principal.c_str()));

    long long startTime = Time::getCurrentTime();
    LaunchResult result;
    try {
        result = launcher->launch(*descriptor, principal);
    } catch (const std::exception& e) {
        Logger::error(getClassName(), __FUNCTION__, descriptor->getId(), "Launcher threw an exception", e.what());
        result = LaunchResult::failure(ErrCode_LAUNCH_FAILED, string("Launcher failed: ") + e.what());
    }
    long long launchTime = Time::getCurrentTime();
    result.setLaunchTime(launchTime);
    result.setDuration(launchTime - startTime);

    if (!result.isSuccess()) {
        Logger::error(getClassName(), __FUNCTION__, descriptor->getId(),
                      Logger::format("Launch failed (%s)", Logger::toString(result.getErrorCode())), result.getErrorText());
        return result;
    }

    ApplicationInstancePtr instance = make_shared<ApplicationInstance>(Time::generateUid(), descriptor, principal);
    instance->setPid(result.getPid());
    instance->addMetadata(result.getMetadata());

    CorrelationRequest request = launcher->getCorrelationRequest(*descriptor);
    bool correlationFailed = false;
    switch (launcher->getCorrelationMode()) {
    case CorrelationMode::CorrelationMode_Process:
        instance->setWindow(findProcessWindow(result.getPid(), request));
        break;

    case CorrelationMode::CorrelationMode_Heuristic: {
        WindowInfoPtr window = searchWindow(*descriptor, request, launchTime);
        if (window) {
            instance->setWindow(window);
            instance->setMetadata("WindowDetectionMethod", request.exactTitle ? "WindowNameArgument" : "WindowSearch");
        } else if (request.allowPlaceholder) {
            Logger::warning(getClassName(), __FUNCTION__, descriptor->getId(), "Window correlation failed. Placeholder is used");
            instance->setWindow(WindowInfo::createPlaceholder(request.placeholderTitle));
            instance->setMetadata("WindowDetectionMethod", "VirtualFallback");
        } else {
            Logger::warning(getClassName(), __FUNCTION__, descriptor->getId(), "Window correlation failed");
            instance->setMetadata("WindowDetectionMethod", "Failed_NoVirtualFallback");
            correlationFailed = true;
        }
        break;
    }

    default:
        break;
    }

    ErrCode errorCode = ErrCode_NOERROR;
    string errorText;
    if (!m_instanceManager.registerInstance(instance, errorCode, errorText)) {
        result.setError(errorCode, errorText);
        return result;
    }

    const string& instanceId = instance->getInstanceId();
    if (correlationFailed) {
        m_instanceManager.setState(instanceId, InstanceState::InstanceState_Error, "Window not found", getClassName());
    } else {
        m_instanceManager.setState(instanceId, InstanceState::InstanceState_Running, "Launched", getClassName());

        IWindowEventSource* source = dynamic_cast<IWindowEventSource*>(launcher.get());
        if (source && instance->hasRealWindow())
            source->watch(instanceId, instance->getWindow());
    }

    result.setInstanceId(instanceId);
    Logger::info(getClassName(), __FUNCTION__, descriptor->getId(),
                 Logger::format("instanceId(%s) pid(%d) duration(%lldms)", instanceId.c_str(), result.getPid(), result.getDuration()));
    return result;
}

LaunchResult LifecycleOrchestrator::launch(const string& appId, const string& principal)
{
    if (appId.empty())
        return LaunchResult::failure(ErrCode_ARGUMENT_INVALID, "AppId is empty");

    ApplicationDescriptorPtr descriptor = m_catalog ? m_catalog->getDescriptor(appId) : nullptr;
    if (!descriptor) {
        Logger::warning(getClassName(), __FUNCTION__, appId, "Unknown application");
        return LaunchResult::failure(ErrCode_ARGUMENT_INVALID, "Unknown application: " + appId);
    }
    return launch(descriptor, principal);
}

LaunchResult LifecycleOrchestrator::launch(const string& appId)
{
    string principal = m_principalProvider ? m_principalProvider->getCurrentPrincipal() : "";
    return launch(appId, principal);
}

bool LifecycleOrchestrator::switchTo(const string& instanceId)
{
    if (instanceId.empty())
        return false;

    ConstApplicationInstancePtr instance = m_instanceManager.get(instanceId);
    if (!instance) {
        Logger::warning(getClassName(), __FUNCTION__, instanceId, "Instance is not found");
        return false;
    }
    if (instance->isTerminal()) {
        Logger::warning(getClassName(), __FUNCTION__, instanceId,
                        Logger::format("Cannot switch in %s state", ApplicationInstance::toString(instance->getState())));
        return false;
    }

    pid_t pid = instance->getPid();
    if (pid > 0 && !m_processMonitor.isProcessAlive(pid)) {
        Logger::warning(getClassName(), __FUNCTION__, instanceId, Logger::format("pid(%d) is not alive", pid));
        m_instanceManager.setState(instanceId, InstanceState::InstanceState_Terminated, "Process not alive", getClassName());
        return false;
    }

    if (instance->hasRealWindow() && m_windowManager.isWindowValid(instance->getWindow()->getHandle()))
        return m_instanceManager.activate(instanceId);

    AbsLauncherPtr launcher = findLauncher(*instance->getDescriptor());
    if (launcher && launcher->getCorrelationMode() == CorrelationMode::CorrelationMode_Process && pid > 0) {
        WindowInfoPtr window = findProcessWindow(pid, launcher->getCorrelationRequest(*instance->getDescriptor()));
        if (window && m_instanceManager.attachWindow(instanceId, window))
            return m_instanceManager.activate(instanceId);
    }

    if (!launcher) {
        Logger::warning(getClassName(), __FUNCTION__, instanceId, "No window and no launcher to relaunch");
        return false;
    }

    string errorText;
    bool relaunched = false;
    try {
        relaunched = launcher->relaunch(*instance, errorText);
    } catch (const std::exception& e) {
        errorText = e.what();
    }
    if (!relaunched) {
        Logger::warning(getClassName(), __FUNCTION__, instanceId, "Cannot switch", errorText);
        return false;
    }
    return m_instanceManager.markActivated(instanceId, "Relaunched", launcher->getClassName());
}

bool LifecycleOrchestrator::terminate(const string& instanceId)
{
    if (instanceId.empty() || !stopDetached(instanceId, false))
        return false;
    return m_instanceManager.terminate(instanceId);
}

bool LifecycleOrchestrator::forceTerminate(const string& instanceId)
{
    if (instanceId.empty() || !stopDetached(instanceId, true))
        return false;
    return m_instanceManager.forceTerminate(instanceId);
}

bool LifecycleOrchestrator::minimize(const string& instanceId)
{
    if (instanceId.empty())
        return false;
    return m_instanceManager.minimize(instanceId);
}

bool LifecycleOrchestrator::restore(const string& instanceId)
{
    if (instanceId.empty())
        return false;
    return m_instanceManager.restore(instanceId);
}

ConstApplicationInstancePtr LifecycleOrchestrator::registerExisting(ApplicationDescriptorPtr descriptor, pid_t pid, const string& principal, string& errorText)
{
    if (!descriptor || descriptor->getId().empty() || principal.empty() || pid <= 0) {
        errorText = "Invalid arguments";
        return nullptr;
    }
    if (!m_processMonitor.isProcessAlive(pid)) {
        errorText = Logger::format("pid(%d) is not alive", pid);
        return nullptr;
    }

    ConstApplicationInstancePtr existing = m_instanceManager.getByPid(pid);
    if (existing)
        return existing;

    if (m_autoStartMonitoring && !isMonitoring())
        startMonitoring();

    ApplicationInstancePtr instance = make_shared<ApplicationInstance>(Time::generateUid(), descriptor, principal);
    instance->setPid(pid);
    instance->setMetadata("Adopted", "true");

    CorrelationRequest request;
    request.titleHint = descriptor->getName();
    instance->setWindow(findProcessWindow(pid, request));

    ErrCode errorCode = ErrCode_NOERROR;
    if (!m_instanceManager.registerInstance(instance, errorCode, errorText, getClassName()))
        return nullptr;

    m_instanceManager.setState(instance->getInstanceId(), InstanceState::InstanceState_Running, "Adopted existing process", getClassName());
    Logger::info(getClassName(), __FUNCTION__, descriptor->getId(), Logger::format("pid(%d) instanceId(%s)", pid, instance->getInstanceId().c_str()));
    return m_instanceManager.get(instance->getInstanceId());
}

ShutdownResult LifecycleOrchestrator::closeAll(long long timeout)
{
    ShutdownResult result;
    long long startTime = Time::getCurrentTime();
    long long deadline = startTime + timeout;

    for (ConstApplicationInstancePtr instance : getRunning()) {
        string detail = instance->getAppId() + " (" + instance->getInstanceId() + ")";
        long long remaining = std::max(deadline - Time::getCurrentTime(), 100LL);
        if (stopDetached(instance->getInstanceId(), false) && m_instanceManager.terminate(instance->getInstanceId(), remaining))
            result.addGraceful(detail);
        else
            result.addFailed(detail, "Did not close within timeout: " + detail);
    }

    result.setDuration(Time::getCurrentTime() - startTime);
    Logger::info(getClassName(), __FUNCTION__,
                 Logger::format("total(%d) graceful(%d) failed(%d)", result.getTotal(), result.getGraceful(), result.getFailed()));
    return result;
}

int LifecycleOrchestrator::killAll()
{
    int count = 0;
    for (ConstApplicationInstancePtr instance : getRunning()) {
        if (stopDetached(instance->getInstanceId(), true) && m_instanceManager.forceTerminate(instance->getInstanceId()))
            ++count;
    }
    Logger::info(getClassName(), __FUNCTION__, Logger::format("killed(%d)", count));
    return count;
}

ShutdownResult LifecycleOrchestrator::shutdownAll(long long gracefulTimeout, long long finalWait)
{
    ShutdownResult result;
    long long startTime = Time::getCurrentTime();
    long long deadline = startTime + gracefulTimeout;

    for (ConstApplicationInstancePtr instance : getRunning()) {
        const string& instanceId = instance->getInstanceId();
        string detail = instance->getAppId() + " (" + instanceId + ")";
        long long remaining = std::max(deadline - Time::getCurrentTime(), 100LL);

        if (stopDetached(instanceId, false) && m_instanceManager.terminate(instanceId, remaining)) {
            result.addGraceful(detail);
            continue;
        }

        Logger::warning(getClassName(), __FUNCTION__, instanceId, "Graceful close failed. Killing");
        if (stopDetached(instanceId, true) && m_instanceManager.forceTerminate(instanceId, finalWait))
            result.addForced(detail);
        else
            result.addFailed(detail, "Still running after kill: " + detail);
    }

    result.setDuration(Time::getCurrentTime() - startTime);
    Logger::info(getClassName(), __FUNCTION__,
                 Logger::format("total(%d) graceful(%d) forced(%d) failed(%d)",
                 result.getTotal(), result.getGraceful(), result.getForced(), result.getFailed()));
    return result;
}

vector<ConstApplicationInstancePtr> LifecycleOrchestrator::getRunning()
{
    vector<ConstApplicationInstancePtr> instances;
    for (ConstApplicationInstancePtr instance : m_instanceManager.getAll()) {
        if (!instance->isTerminal())
            instances.push_back(instance);
    }
    return instances;
}

vector<ConstApplicationInstancePtr> LifecycleOrchestrator::getRunningForUser(const string& principal)
{
    vector<ConstApplicationInstancePtr> instances;
    for (ConstApplicationInstancePtr instance : m_instanceManager.getByPrincipal(principal)) {
        if (!instance->isTerminal())
            instances.push_back(instance);
    }
    return instances;
}

vector<ConstApplicationInstancePtr> LifecycleOrchestrator::getByApplicationId(const string& appId)
{
    vector<ConstApplicationInstancePtr> instances;
    for (ConstApplicationInstancePtr instance : m_instanceManager.getByAppId(appId)) {
        if (!instance->isTerminal())
            instances.push_back(instance);
    }
    return instances;
}

ConstApplicationInstancePtr LifecycleOrchestrator::get(const string& instanceId)
{
    if (instanceId.empty())
        return nullptr;
    return m_instanceManager.get(instanceId);
}

int LifecycleOrchestrator::getCount()
{
    return (int) getRunning().size();
}

void LifecycleOrchestrator::startMonitoring()
{
    {
        lock_guard<mutex> lock(m_mutex);
        if (m_isMonitoring)
            return;
        m_isMonitoring = true;
    }

    m_processMonitor.start();
    m_windowTicker.start();
    for (AbsLauncherPtr launcher : getLaunchers()) {
        IWindowEventSource* source = dynamic_cast<IWindowEventSource*>(launcher.get());
        if (source)
            source->startWatching();
    }
    Logger::info(getClassName(), __FUNCTION__, "Monitoring started");
}

void LifecycleOrchestrator::stopMonitoring()
{
    {
        lock_guard<mutex> lock(m_mutex);
        if (!m_isMonitoring)
            return;
        m_isMonitoring = false;
    }

    m_processMonitor.stop();
    m_windowTicker.stop();
    for (AbsLauncherPtr launcher : getLaunchers()) {
        IWindowEventSource* source = dynamic_cast<IWindowEventSource*>(launcher.get());
        if (source)
            source->stopWatching();
    }
    Logger::info(getClassName(), __FUNCTION__, "Monitoring stopped");
}

bool LifecycleOrchestrator::isMonitoring()
{
    lock_guard<mutex> lock(m_mutex);
    return m_isMonitoring;
}

int LifecycleOrchestrator::cleanup()
{
    return m_instanceManager.cleanup(m_terminatedRetention);
}

void LifecycleOrchestrator::reconcileWindows()
{
    vector<ConstApplicationInstancePtr> instances = getRunning();
    if (instances.empty())
        return;

    for (ConstApplicationInstancePtr instance : instances) {
        if (instance->hasRealWindow() || instance->getPid() <= 0)
            continue;

        AbsLauncherPtr launcher = findLauncher(*instance->getDescriptor());
        if (!launcher || launcher->getCorrelationMode() != CorrelationMode::CorrelationMode_Process)
            continue;

        WindowInfoPtr window = findProcessWindow(instance->getPid(), launcher->getCorrelationRequest(*instance->getDescriptor()));
        if (window && m_instanceManager.attachWindow(instance->getInstanceId(), window))
            Logger::info(getClassName(), __FUNCTION__, instance->getInstanceId(), "Late window attached");
    }

    WindowHandle activeWindow = m_windowManager.getActiveWindow();
    for (ConstApplicationInstancePtr instance : getRunning()) {
        if (!instance->hasRealWindow())
            continue;

        bool focused = activeWindow != 0 && instance->getWindow()->getHandle() == activeWindow;
        if (focused && instance->getState() != InstanceState::InstanceState_Active) {
            // Window event sources report focus of the windows they watch
            AbsLauncherPtr launcher = findLauncher(*instance->getDescriptor());
            if (launcher && dynamic_cast<IWindowEventSource*>(launcher.get()))
                continue;
            m_instanceManager.markActivated(instance->getInstanceId(), "Window focused", "WindowManager");
        } else if (!focused && instance->getState() == InstanceState::InstanceState_Active) {
            m_instanceManager.setState(instance->getInstanceId(), InstanceState::InstanceState_Inactive, "Window lost focus", "WindowManager");
        }
    }
}

AbsLauncherPtr LifecycleOrchestrator::findLauncher(const ApplicationDescriptor& descriptor)
{
    for (AbsLauncherPtr launcher : getLaunchers()) {
        if (launcher->canLaunch(descriptor))
            return launcher;
    }
    return nullptr;
}

vector<AbsLauncherPtr> LifecycleOrchestrator::getLaunchers()
{
    lock_guard<mutex> lock(m_mutex);
    return m_launchers;
}

bool LifecycleOrchestrator::stopDetached(const string& instanceId, bool force)
{
    ConstApplicationInstancePtr instance = m_instanceManager.get(instanceId);
    if (!instance || instance->isTerminal() || instance->getPid() > 0)
        return true;
    if (instance->hasRealWindow() && !force)
        return true;

    AbsLauncherPtr launcher = findLauncher(*instance->getDescriptor());
    if (!launcher)
        return true;

    string errorText;
    bool stopped = false;
    try {
        stopped = launcher->terminate(*instance, force, errorText);
    } catch (const std::exception& e) {
        errorText = e.what();
    }
    if (!stopped) {
        Logger::warning(getClassName(), __FUNCTION__, instanceId, "Cannot stop", errorText);
        return false;
    }
    return true;
}

LaunchResult LifecycleOrchestrator::switchToExisting(const ApplicationDescriptor& descriptor, const string& principal)
{
    for (ConstApplicationInstancePtr instance : m_instanceManager.getByAppId(descriptor.getId())) {
        if (instance->isTerminal() || instance->getPrincipal() != principal)
            continue;
        if (!switchTo(instance->getInstanceId()))
            continue;

        Logger::info(getClassName(), __FUNCTION__, descriptor.getId(), "Already running", instance->getInstanceId());
        LaunchResult result = LaunchResult::success(instance->getPid());
        result.setInstanceId(instance->getInstanceId());
        result.setAlreadyRunning(true);
        result.setLaunchTime(Time::getCurrentTime());
        return result;
    }
    return LaunchResult::failure(ErrCode_INSTANCE_NOT_FOUND, "No running instance");
}

WindowInfoPtr LifecycleOrchestrator::findProcessWindow(pid_t pid, const CorrelationRequest& request)
{
    WindowInfoPtr window = m_windowManager.findMainWindow(pid, request.titleHint);
    if (window || request.windowClass.empty())
        return window;

    // Browsers hand the window over to an already running process
    WindowInfoPtr first = nullptr;
    for (const WindowInfoPtr& candidate : m_windowManager.findWindowsByClass(request.windowClass)) {
        if (WindowCorrelator::containsIgnoreCase(candidate->getTitle(), request.titleHint))
            return candidate;
        if (!first)
            first = candidate;
    }
    return first;
}

WindowInfoPtr LifecycleOrchestrator::searchWindow(const ApplicationDescriptor& descriptor, const CorrelationRequest& request, long long launchTime)
{
    long long timeout = request.searchTimeout > 0 ? request.searchTimeout : m_windowSearchTimeout;
    long long deadline = Time::getCurrentTime() + timeout;
    const string& cacheKey = descriptor.getTarget();

    while (true) {
        WindowInfoPtr window = m_windowManager.findAmbiguousWindow(cacheKey, request.windowClass, request.titleHint, request.exactTitle, launchTime);
        if (window)
            return window;
        if (!request.waitForWindow || Time::getCurrentTime() >= deadline)
            break;
        Time::sleep(std::min(m_windowSearchInterval, std::max(deadline - Time::getCurrentTime(), 1LL)));
    }
    return nullptr;
}

void LifecycleOrchestrator::onInstanceChanged(const InstanceEvent& event)
{
    switch (event.getType()) {
    case InstanceEventType::InstanceEventType_Started:
        EventInstanceStarted(event);
        break;

    case InstanceEventType::InstanceEventType_Stopped:
        EventInstanceStopped(event);
        break;

    case InstanceEventType::InstanceEventType_Activated:
        EventInstanceActivated(event);
        break;

    case InstanceEventType::InstanceEventType_Error:
        EventInstanceError(event);
        break;

    default:
        EventInstanceStateChanged(event);
        break;
    }

    if (event.getType() == InstanceEventType::InstanceEventType_Stopped ||
        event.getType() == InstanceEventType::InstanceEventType_Error) {
        for (AbsLauncherPtr launcher : getLaunchers()) {
            IWindowEventSource* source = dynamic_cast<IWindowEventSource*>(launcher.get());
            if (source)
                source->unwatch(event.getInstanceId());
        }
    }

    if (m_auditSink) {
        try {
            m_auditSink->record(event);
        } catch (const std::exception& e) {
            Logger::error(getClassName(), __FUNCTION__, event.getInstanceId(), "Audit sink failed", e.what());
        }
    }
}

void LifecycleOrchestrator::onWindowActivated(const string& instanceId)
{
    m_instanceManager.markActivated(instanceId, "Window focused", "WindowEventSource");
}

void LifecycleOrchestrator::onWindowClosed(const string& instanceId)
{
    m_instanceManager.setState(instanceId, InstanceState::InstanceState_Terminated, "Window closed", "WindowEventSource");
}

void LifecycleOrchestrator::onMonitorTick()
{
    cleanup();
}
