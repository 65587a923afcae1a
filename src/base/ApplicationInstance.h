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

#ifndef BASE_APPLICATIONINSTANCE_H_
#define BASE_APPLICATIONINSTANCE_H_

#include <map>
#include <memory>
#include <string>
#include <stdint.h>
#include <sys/types.h>
#include <pbnjson.hpp>

#include "base/ApplicationDescriptor.h"
#include "base/WindowInfo.h"

using namespace std;
using namespace pbnjson;

//                  < ApplicationInstance LIFECYCLES >
//
//                                      ----> ACTIVE <----
//                                      |        |       |
// STARTING ----> RUNNING ---------------        |       |
//    |              |                  |        v       |
//    |              |                  ----> INACTIVE ---
//    |              |                           |
//    |              -------> NOT_RESPONDING <----  (back to RUNNING/ACTIVE/INACTIVE)
//    |
//    ------------------------------------------------------> TERMINATED
//
// ERROR is reachable from every state except TERMINATED and ERROR.
enum class InstanceState : int8_t {
    InstanceState_Starting,
    InstanceState_Running,
    InstanceState_Active,
    InstanceState_Inactive,
    InstanceState_NotResponding,
    InstanceState_Terminated,
    InstanceState_Error,
};

class ApplicationInstance;

typedef shared_ptr<ApplicationInstance> ApplicationInstancePtr;
typedef shared_ptr<const ApplicationInstance> ConstApplicationInstancePtr;

class ApplicationInstance {
friend class InstanceManager;
public:
    static const char* toString(InstanceState state);
    static bool isTerminal(InstanceState state);
    static bool isValidTransition(InstanceState from, InstanceState to);

    ApplicationInstance(const string& instanceId, ApplicationDescriptorPtr descriptor, const string& principal);
    virtual ~ApplicationInstance();

    JValue toJson() const;

    const string& getInstanceId() const
    {
        return m_instanceId;
    }

    ApplicationDescriptorPtr getDescriptor() const
    {
        return m_descriptor;
    }

    const string& getAppId() const
    {
        return m_descriptor->getId();
    }

    const string& getPrincipal() const
    {
        return m_principal;
    }

    pid_t getPid() const
    {
        return m_pid;
    }
    void setPid(pid_t pid)
    {
        m_pid = pid;
    }

    WindowInfoPtr getWindow() const
    {
        return m_window;
    }
    void setWindow(WindowInfoPtr window)
    {
        m_window = window;
    }

    // A real window is known and can be driven by the window system
    bool hasRealWindow() const
    {
        return m_window && !m_window->isPlaceholder();
    }

    InstanceState getState() const
    {
        return m_state;
    }

    bool isTerminal() const
    {
        return isTerminal(m_state);
    }

    // Wall-clock milliseconds
    long long getStartTime() const
    {
        return m_startTime;
    }
    long long getLastUpdateTime() const
    {
        return m_lastUpdateTime;
    }
    long long getEndTime() const
    {
        return m_endTime;
    }

    const string& getReason() const
    {
        return m_reason;
    }

    const map<string, string>& getMetadata() const
    {
        return m_metadata;
    }
    string getMetadata(const string& key) const
    {
        auto it = m_metadata.find(key);
        return it == m_metadata.end() ? "" : it->second;
    }
    void setMetadata(const string& key, const string& value)
    {
        m_metadata[key] = value;
    }
    void addMetadata(const map<string, string>& metadata)
    {
        for (auto it = metadata.begin(); it != metadata.end(); ++it) {
            m_metadata[it->first] = it->second;
        }
    }

private:
    // Only InstanceManager moves the state once the instance is registered
    void setState(InstanceState state, const string& reason);

    string m_instanceId;
    ApplicationDescriptorPtr m_descriptor;
    string m_principal;

    pid_t m_pid;
    WindowInfoPtr m_window;

    InstanceState m_state;
    long long m_startTime;
    long long m_lastUpdateTime;
    long long m_endTime;
    string m_reason;

    map<string, string> m_metadata;

};

#endif /* BASE_APPLICATIONINSTANCE_H_ */
