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

#ifndef BASE_INSTANCEEVENT_H_
#define BASE_INSTANCEEVENT_H_

#include <string>
#include <stdint.h>
#include <pbnjson.hpp>

#include "base/ApplicationInstance.h"

using namespace std;
using namespace pbnjson;

enum class InstanceEventType : int8_t {
    InstanceEventType_Started,
    InstanceEventType_Stopped,
    InstanceEventType_StateChanged,
    InstanceEventType_Activated,
    InstanceEventType_Error,
};

class InstanceEvent {
public:
    static const char* toString(InstanceEventType type);

    // Picks the event type a transition into 'to' is reported as
    static InstanceEventType toEventType(InstanceState to);

    static InstanceEvent createStarted(ConstApplicationInstancePtr instance, const string& source);
    static InstanceEvent createTransition(ConstApplicationInstancePtr instance, InstanceState previous, const string& reason, const string& source);

    InstanceEvent(InstanceEventType type, ConstApplicationInstancePtr instance);
    virtual ~InstanceEvent();

    JValue toJson() const;

    InstanceEventType getType() const
    {
        return m_type;
    }

    // Copy of the instance taken when the event was raised
    ConstApplicationInstancePtr getInstance() const
    {
        return m_instance;
    }

    const string& getInstanceId() const
    {
        return m_instance->getInstanceId();
    }

    // Wall-clock milliseconds
    long long getTimestamp() const
    {
        return m_timestamp;
    }

    bool hasPreviousState() const
    {
        return m_hasPreviousState;
    }
    InstanceState getPreviousState() const
    {
        return m_previousState;
    }
    InstanceState getNewState() const
    {
        return m_newState;
    }

    const string& getReason() const
    {
        return m_reason;
    }
    const string& getSource() const
    {
        return m_source;
    }

private:
    InstanceEventType m_type;
    ConstApplicationInstancePtr m_instance;
    long long m_timestamp;

    bool m_hasPreviousState;
    InstanceState m_previousState;
    InstanceState m_newState;

    string m_reason;
    string m_source;

};

#endif /* BASE_INSTANCEEVENT_H_ */
