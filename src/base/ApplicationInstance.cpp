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

#include "base/ApplicationInstance.h"

#include "util/Time.h"

const char* ApplicationInstance::toString(InstanceState state)
{
    switch (state) {
    case InstanceState::InstanceState_Starting:
        return "starting";

    case InstanceState::InstanceState_Running:
        return "running";

    case InstanceState::InstanceState_Active:
        return "active";

    case InstanceState::InstanceState_Inactive:
        return "inactive";

    case InstanceState::InstanceState_NotResponding:
        return "notResponding";

    case InstanceState::InstanceState_Terminated:
        return "terminated";

    case InstanceState::InstanceState_Error:
        return "error";
    }
    return "unknown";
}

bool ApplicationInstance::isTerminal(InstanceState state)
{
    return state == InstanceState::InstanceState_Terminated ||
           state == InstanceState::InstanceState_Error;
}

bool ApplicationInstance::isValidTransition(InstanceState from, InstanceState to)
{
    if (from == to || isTerminal(from))
        return false;

    if (to == InstanceState::InstanceState_Terminated || to == InstanceState::InstanceState_Error)
        return true;

    switch (from) {
    case InstanceState::InstanceState_Starting:
        return to == InstanceState::InstanceState_Running;

    case InstanceState::InstanceState_Running:
        return to == InstanceState::InstanceState_Active ||
               to == InstanceState::InstanceState_Inactive ||
               to == InstanceState::InstanceState_NotResponding;

    case InstanceState::InstanceState_Active:
        return to == InstanceState::InstanceState_Inactive ||
               to == InstanceState::InstanceState_NotResponding;

    case InstanceState::InstanceState_Inactive:
        return to == InstanceState::InstanceState_Active ||
               to == InstanceState::InstanceState_NotResponding;

    case InstanceState::InstanceState_NotResponding:
        return to == InstanceState::InstanceState_Running ||
               to == InstanceState::InstanceState_Active ||
               to == InstanceState::InstanceState_Inactive;

    default:
        break;
    }
    return false;
}

ApplicationInstance::ApplicationInstance(const string& instanceId, ApplicationDescriptorPtr descriptor, const string& principal)
    : m_instanceId(instanceId),
      m_descriptor(descriptor),
      m_principal(principal),
      m_pid(0),
      m_window(nullptr),
      m_state(InstanceState::InstanceState_Starting),
      m_startTime(Time::getSystemTime()),
      m_lastUpdateTime(m_startTime),
      m_endTime(0)
{
}

ApplicationInstance::~ApplicationInstance()
{
}

void ApplicationInstance::setState(InstanceState state, const string& reason)
{
    m_state = state;
    m_reason = reason;
    m_lastUpdateTime = Time::getSystemTime();
    if (isTerminal(state))
        m_endTime = m_lastUpdateTime;
}

JValue ApplicationInstance::toJson() const
{
    JValue json = pbnjson::Object();
    json.put("instanceId", m_instanceId);
    json.put("appId", getAppId());
    json.put("type", ApplicationDescriptor::toString(m_descriptor->getKind()));
    json.put("principal", m_principal);
    json.put("processId", (int) m_pid);
    json.put("state", toString(m_state));
    json.put("startTime", Time::toISO8601(m_startTime));
    json.put("lastUpdateTime", Time::toISO8601(m_lastUpdateTime));
    if (m_endTime > 0)
        json.put("endTime", Time::toISO8601(m_endTime));
    if (!m_reason.empty())
        json.put("reason", m_reason);
    if (m_window)
        json.put("window", m_window->toJson());

    if (!m_metadata.empty()) {
        JValue metadata = pbnjson::Object();
        for (auto it = m_metadata.begin(); it != m_metadata.end(); ++it) {
            metadata.put(it->first, it->second);
        }
        json.put("metadata", metadata);
    }
    return json;
}
