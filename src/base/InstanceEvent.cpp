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

#include "base/InstanceEvent.h"

#include "util/Time.h"

const char* InstanceEvent::toString(InstanceEventType type)
{
    switch (type) {
    case InstanceEventType::InstanceEventType_Started:
        return "started";

    case InstanceEventType::InstanceEventType_Stopped:
        return "stopped";

    case InstanceEventType::InstanceEventType_StateChanged:
        return "stateChanged";

    case InstanceEventType::InstanceEventType_Activated:
        return "activated";

    case InstanceEventType::InstanceEventType_Error:
        return "error";
    }
    return "unknown";
}

InstanceEventType InstanceEvent::toEventType(InstanceState to)
{
    switch (to) {
    case InstanceState::InstanceState_Terminated:
        return InstanceEventType::InstanceEventType_Stopped;

    case InstanceState::InstanceState_Active:
        return InstanceEventType::InstanceEventType_Activated;

    case InstanceState::InstanceState_Error:
        return InstanceEventType::InstanceEventType_Error;

    default:
        return InstanceEventType::InstanceEventType_StateChanged;
    }
}

InstanceEvent InstanceEvent::createStarted(ConstApplicationInstancePtr instance, const string& source)
{
    InstanceEvent event(InstanceEventType::InstanceEventType_Started, instance);
    event.m_reason = "Registered";
    event.m_source = source;
    return event;
}

InstanceEvent InstanceEvent::createTransition(ConstApplicationInstancePtr instance, InstanceState previous, const string& reason, const string& source)
{
    InstanceEvent event(toEventType(instance->getState()), instance);
    event.m_hasPreviousState = true;
    event.m_previousState = previous;
    event.m_reason = reason;
    event.m_source = source;
    return event;
}

InstanceEvent::InstanceEvent(InstanceEventType type, ConstApplicationInstancePtr instance)
    : m_type(type),
      m_instance(instance),
      m_timestamp(Time::getSystemTime()),
      m_hasPreviousState(false),
      m_previousState(instance->getState()),
      m_newState(instance->getState())
{
}

InstanceEvent::~InstanceEvent()
{
}

JValue InstanceEvent::toJson() const
{
    JValue json = pbnjson::Object();
    json.put("event", toString(m_type));
    json.put("timestamp", Time::toISO8601(m_timestamp));
    json.put("instanceId", m_instance->getInstanceId());
    json.put("appId", m_instance->getAppId());
    json.put("principal", m_instance->getPrincipal());
    if (m_hasPreviousState)
        json.put("previousState", ApplicationInstance::toString(m_previousState));
    json.put("newState", ApplicationInstance::toString(m_newState));
    if (!m_reason.empty())
        json.put("reason", m_reason);
    if (!m_source.empty())
        json.put("source", m_source);
    return json;
}
