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

#include "lifecycle/InstanceManager.h"

#include <boost/bind.hpp>

#include "util/Time.h"

InstanceManager::InstanceManager(ProcessMonitor& processMonitor, WindowManager& windowManager)
    : m_processMonitor(processMonitor),
      m_windowManager(windowManager),
      m_terminateTimeout(5000),
      m_killTimeout(3000),
      m_isDispatching(false)
{
    setClassName("InstanceManager");

    m_exitedConnection = m_processMonitor.EventProcessExited.connect(
        boost::bind(&InstanceManager::onProcessExited, this, boost::placeholders::_1));
    m_responsivenessConnection = m_processMonitor.EventProcessResponsivenessChanged.connect(
        boost::bind(&InstanceManager::onProcessResponsivenessChanged, this, boost::placeholders::_1, boost::placeholders::_2));
}

InstanceManager::~InstanceManager()
{
}

bool InstanceManager::registerInstance(ApplicationInstancePtr instance, ErrCode& errorCode, string& errorText, const string& source)
{
    if (!instance || instance->getInstanceId().empty() || !instance->getDescriptor()) {
        errorCode = ErrCode_ARGUMENT_INVALID;
        errorText = "Invalid instance";
        return false;
    }

    ApplicationInstancePtr copy = make_shared<ApplicationInstance>(*instance);
    {
        lock_guard<mutex> lock(m_mutex);
        if (m_map.find(copy->getInstanceId()) != m_map.end()) {
            errorCode = ErrCode_DUPLICATE_INSTANCE;
            errorText = "InstanceId is already exist";
            Logger::warning(getClassName(), __FUNCTION__, copy->getInstanceId(), errorText);
            return false;
        }

        copy->setState(InstanceState::InstanceState_Starting, "Registered");
        m_map[copy->getInstanceId()] = copy;
        m_events.push_back(InstanceEvent::createStarted(snapshot(copy), source));
    }
    Logger::info(getClassName(), __FUNCTION__, copy->getInstanceId(),
                 Logger::format("appId(%s) pid(%d) principal(%s)", copy->getAppId().c_str(), copy->getPid(), copy->getPrincipal().c_str()));

    if (copy->getPid() > 0)
        m_processMonitor.watch(copy->getPid());

    dispatch();
    return true;
}

ConstApplicationInstancePtr InstanceManager::get(const string& instanceId)
{
    lock_guard<mutex> lock(m_mutex);
    auto it = m_map.find(instanceId);
    if (it == m_map.end())
        return nullptr;
    return snapshot(it->second);
}

vector<ConstApplicationInstancePtr> InstanceManager::getAll()
{
    vector<ConstApplicationInstancePtr> instances;
    lock_guard<mutex> lock(m_mutex);
    for (auto it = m_map.begin(); it != m_map.end(); ++it) {
        instances.push_back(snapshot(it->second));
    }
    return instances;
}

vector<ConstApplicationInstancePtr> InstanceManager::getByPrincipal(const string& principal)
{
    vector<ConstApplicationInstancePtr> instances;
    lock_guard<mutex> lock(m_mutex);
    for (auto it = m_map.begin(); it != m_map.end(); ++it) {
        if (it->second->getPrincipal() == principal)
            instances.push_back(snapshot(it->second));
    }
    return instances;
}

vector<ConstApplicationInstancePtr> InstanceManager::getByAppId(const string& appId)
{
    vector<ConstApplicationInstancePtr> instances;
    lock_guard<mutex> lock(m_mutex);
    for (auto it = m_map.begin(); it != m_map.end(); ++it) {
        if (it->second->getAppId() == appId)
            instances.push_back(snapshot(it->second));
    }
    return instances;
}

ConstApplicationInstancePtr InstanceManager::getByPid(pid_t pid)
{
    if (pid <= 0)
        return nullptr;

    lock_guard<mutex> lock(m_mutex);
    for (auto it = m_map.begin(); it != m_map.end(); ++it) {
        if (it->second->getPid() == pid && !it->second->isTerminal())
            return snapshot(it->second);
    }
    return nullptr;
}

size_t InstanceManager::getCount()
{
    lock_guard<mutex> lock(m_mutex);
    return m_map.size();
}

bool InstanceManager::setState(const string& instanceId, InstanceState state, const string& reason, const string& source)
{
    bool result = false;
    {
        lock_guard<mutex> lock(m_mutex);
        auto it = m_map.find(instanceId);
        if (it == m_map.end())
            return false;
        result = transition(it->second, state, reason, source);
    }
    dispatch();
    return result;
}

bool InstanceManager::activate(const string& instanceId, const string& source)
{
    ConstApplicationInstancePtr instance = get(instanceId);
    if (!instance || instance->isTerminal())
        return false;

    if (!instance->hasRealWindow()) {
        Logger::warning(getClassName(), __FUNCTION__, instanceId, "No window to activate");
        return false;
    }
    if (!m_windowManager.switchToWindow(instance->getWindow()->getHandle())) {
        Logger::warning(getClassName(), __FUNCTION__, instanceId, "Window system refused the switch");
        return false;
    }
    return markActivated(instanceId, "Switched to window", source);
}

bool InstanceManager::markActivated(const string& instanceId, const string& reason, const string& source)
{
    bool result = false;
    {
        lock_guard<mutex> lock(m_mutex);
        auto it = m_map.find(instanceId);
        if (it == m_map.end() || it->second->isTerminal())
            return false;

        ApplicationInstancePtr instance = it->second;
        if (instance->getState() == InstanceState::InstanceState_Starting)
            transition(instance, InstanceState::InstanceState_Running, reason, source);

        if (instance->getState() == InstanceState::InstanceState_Active) {
            // Focus came back without a state change. Still reported as activation.
            m_events.push_back(InstanceEvent::createTransition(snapshot(instance), InstanceState::InstanceState_Active, reason, source));
            result = true;
        } else {
            result = transition(instance, InstanceState::InstanceState_Active, reason, source);
        }

        if (result) {
            for (auto other = m_map.begin(); other != m_map.end(); ++other) {
                if (other->second == instance || other->second->getPrincipal() != instance->getPrincipal())
                    continue;
                if (other->second->getState() == InstanceState::InstanceState_Active)
                    transition(other->second, InstanceState::InstanceState_Inactive, "Another instance activated", source);
            }
        }
    }
    dispatch();
    return result;
}

bool InstanceManager::minimize(const string& instanceId)
{
    ConstApplicationInstancePtr instance = get(instanceId);
    if (!instance || instance->isTerminal() || !instance->hasRealWindow())
        return false;

    if (!m_windowManager.minimize(instance->getWindow()->getHandle()))
        return false;

    if (instance->getState() == InstanceState::InstanceState_Active)
        setState(instanceId, InstanceState::InstanceState_Inactive, "Minimized", "User");
    return true;
}

bool InstanceManager::restore(const string& instanceId)
{
    ConstApplicationInstancePtr instance = get(instanceId);
    if (!instance || instance->isTerminal() || !instance->hasRealWindow())
        return false;

    if (!m_windowManager.restore(instance->getWindow()->getHandle()))
        return false;
    return markActivated(instanceId, "Restored", "User");
}

bool InstanceManager::attachWindow(const string& instanceId, WindowInfoPtr window)
{
    if (!window)
        return false;

    lock_guard<mutex> lock(m_mutex);
    auto it = m_map.find(instanceId);
    if (it == m_map.end() || it->second->isTerminal())
        return false;

    if (window->isPlaceholder() && it->second->hasRealWindow()) {
        Logger::warning(getClassName(), __FUNCTION__, instanceId, "Real window is kept");
        return false;
    }
    it->second->setWindow(window);
    Logger::info(getClassName(), __FUNCTION__, instanceId,
                 Logger::format("0x%lx '%s'", window->getHandle(), window->getTitle().c_str()));
    return true;
}

bool InstanceManager::setMetadata(const string& instanceId, const string& key, const string& value)
{
    lock_guard<mutex> lock(m_mutex);
    auto it = m_map.find(instanceId);
    if (it == m_map.end())
        return false;
    it->second->setMetadata(key, value);
    return true;
}

bool InstanceManager::terminate(const string& instanceId, long long timeout)
{
    ConstApplicationInstancePtr instance = get(instanceId);
    if (!instance)
        return false;
    if (instance->isTerminal())
        return true;

    pid_t pid = instance->getPid();
    bool windowClosed = false;
    if (instance->hasRealWindow())
        windowClosed = m_windowManager.close(instance->getWindow()->getHandle());

    if (pid > 0) {
        if (!windowClosed && !m_processMonitor.terminateProcess(pid) && m_processMonitor.isProcessAlive(pid)) {
            Logger::warning(getClassName(), __FUNCTION__, instanceId, "Failed to request termination");
            return false;
        }
        if (!m_processMonitor.waitForExit(pid, timeout)) {
            Logger::warning(getClassName(), __FUNCTION__, instanceId,
                            Logger::format("pid(%d) is still alive after %lldms", pid, timeout));
            return false;
        }
        m_processMonitor.unwatch(pid);
    } else if (windowClosed) {
        long long deadline = Time::getCurrentTime() + timeout;
        while (m_windowManager.isWindowValid(instance->getWindow()->getHandle())) {
            if (Time::getCurrentTime() >= deadline) {
                Logger::warning(getClassName(), __FUNCTION__, instanceId, "Window is still open");
                return false;
            }
            Time::sleep(100);
        }
    }

    setState(instanceId, InstanceState::InstanceState_Terminated, "Terminated", "User");
    return true;
}

bool InstanceManager::forceTerminate(const string& instanceId, long long timeout)
{
    ConstApplicationInstancePtr instance = get(instanceId);
    if (!instance)
        return false;
    if (instance->isTerminal())
        return true;

    pid_t pid = instance->getPid();
    if (pid > 0) {
        if (!m_processMonitor.killProcess(pid) && m_processMonitor.isProcessAlive(pid)) {
            Logger::error(getClassName(), __FUNCTION__, instanceId, Logger::format("Failed to kill pid(%d)", pid));
            return false;
        }
        if (!m_processMonitor.waitForExit(pid, timeout)) {
            Logger::error(getClassName(), __FUNCTION__, instanceId,
                          Logger::format("pid(%d) is still alive after %lldms", pid, timeout));
            return false;
        }
        m_processMonitor.unwatch(pid);
    } else if (instance->hasRealWindow()) {
        m_windowManager.close(instance->getWindow()->getHandle());
    }

    setState(instanceId, InstanceState::InstanceState_Terminated, "Killed", "User");
    return true;
}

int InstanceManager::cleanup(long long retention)
{
    long long threshold = Time::getSystemTime() - retention;
    int count = 0;

    lock_guard<mutex> lock(m_mutex);
    for (auto it = m_map.begin(); it != m_map.end();) {
        if (it->second->isTerminal() && it->second->getEndTime() <= threshold) {
            Logger::debug(getClassName(), __FUNCTION__, it->first, "Removed");
            it = m_map.erase(it);
            ++count;
        } else {
            ++it;
        }
    }
    if (count > 0)
        Logger::info(getClassName(), __FUNCTION__, Logger::format("Removed(%d) Remained(%d)", count, (int) m_map.size()));
    return count;
}

ConstApplicationInstancePtr InstanceManager::snapshot(ApplicationInstancePtr instance)
{
    return make_shared<const ApplicationInstance>(*instance);
}

bool InstanceManager::transition(ApplicationInstancePtr instance, InstanceState state, const string& reason, const string& source)
{
    InstanceState previous = instance->getState();
    if (!ApplicationInstance::isValidTransition(previous, state)) {
        if (previous != state) {
            Logger::warning(getClassName(), __FUNCTION__, instance->getInstanceId(),
                            Logger::format("Refused: %s (%s ==> %s)", instance->getAppId().c_str(),
                            ApplicationInstance::toString(previous), ApplicationInstance::toString(state)));
        }
        return false;
    }

    instance->setState(state, reason);
    Logger::info(getClassName(), __FUNCTION__, instance->getInstanceId(),
                 Logger::format("Changed: %s (%s ==> %s)", instance->getAppId().c_str(),
                 ApplicationInstance::toString(previous), ApplicationInstance::toString(state)), reason);

    m_events.push_back(InstanceEvent::createTransition(snapshot(instance), previous, reason, source));
    return true;
}

void InstanceManager::dispatch()
{
    {
        lock_guard<mutex> lock(m_mutex);
        if (m_isDispatching)
            return;
        m_isDispatching = true;
    }

    while (true) {
        shared_ptr<InstanceEvent> event;
        {
            lock_guard<mutex> lock(m_mutex);
            if (m_events.empty()) {
                m_isDispatching = false;
                return;
            }
            event = make_shared<InstanceEvent>(m_events.front());
            m_events.pop_front();
        }

        try {
            EventInstanceChanged(*event);
        } catch (const std::exception& e) {
            Logger::error(getClassName(), __FUNCTION__, event->getInstanceId(), "Subscriber failed", e.what());
        } catch (...) {
            lock_guard<mutex> lock(m_mutex);
            m_isDispatching = false;
            throw;
        }
    }
}

void InstanceManager::onProcessExited(pid_t pid)
{
    {
        lock_guard<mutex> lock(m_mutex);
        for (auto it = m_map.begin(); it != m_map.end(); ++it) {
            if (it->second->getPid() == pid && !it->second->isTerminal())
                transition(it->second, InstanceState::InstanceState_Terminated, "Process exited", "ProcessMonitor");
        }
    }
    dispatch();
}

void InstanceManager::onProcessResponsivenessChanged(pid_t pid, bool responding)
{
    {
        lock_guard<mutex> lock(m_mutex);
        for (auto it = m_map.begin(); it != m_map.end(); ++it) {
            if (it->second->getPid() != pid || it->second->isTerminal())
                continue;
            if (!responding)
                transition(it->second, InstanceState::InstanceState_NotResponding, "Process stopped", "ProcessMonitor");
            else if (it->second->getState() == InstanceState::InstanceState_NotResponding)
                transition(it->second, InstanceState::InstanceState_Running, "Process resumed", "ProcessMonitor");
        }
    }
    dispatch();
}
