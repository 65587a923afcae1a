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

#ifndef BASE_LAUNCHRESULT_H_
#define BASE_LAUNCHRESULT_H_

#include <map>
#include <string>
#include <sys/types.h>

#include "util/Logger.h"

using namespace std;

// Outcome of one launch request. Launchers fill process and metadata,
// the orchestrator fills instance id and timing.
class LaunchResult {
public:
    static LaunchResult success(pid_t pid)
    {
        LaunchResult result;
        result.m_success = true;
        result.m_pid = pid;
        return result;
    }

    static LaunchResult failure(ErrCode errorCode, const string& errorText)
    {
        LaunchResult result;
        result.m_success = false;
        result.m_errorCode = errorCode;
        result.m_errorText = errorText;
        return result;
    }

    LaunchResult()
        : m_success(false),
          m_errorCode(ErrCode_NOERROR),
          m_pid(0),
          m_duration(0),
          m_launchTime(0),
          m_alreadyRunning(false)
    {
    }
    virtual ~LaunchResult() {}

    bool isSuccess() const
    {
        return m_success;
    }

    ErrCode getErrorCode() const
    {
        return m_errorCode;
    }
    const string& getErrorText() const
    {
        return m_errorText;
    }
    void setError(ErrCode errorCode, const string& errorText)
    {
        m_success = false;
        m_errorCode = errorCode;
        m_errorText = errorText;
    }

    const string& getInstanceId() const
    {
        return m_instanceId;
    }
    void setInstanceId(const string& instanceId)
    {
        m_instanceId = instanceId;
    }

    pid_t getPid() const
    {
        return m_pid;
    }
    void setPid(pid_t pid)
    {
        m_pid = pid;
    }

    // Milliseconds spent inside launch()
    long long getDuration() const
    {
        return m_duration;
    }
    void setDuration(long long duration)
    {
        m_duration = duration;
    }

    // Monotonic milliseconds taken when the launcher returned
    long long getLaunchTime() const
    {
        return m_launchTime;
    }
    void setLaunchTime(long long launchTime)
    {
        m_launchTime = launchTime;
    }

    bool isAlreadyRunning() const
    {
        return m_alreadyRunning;
    }
    void setAlreadyRunning(bool alreadyRunning)
    {
        m_alreadyRunning = alreadyRunning;
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

private:
    bool m_success;
    ErrCode m_errorCode;
    string m_errorText;

    string m_instanceId;
    pid_t m_pid;
    long long m_duration;
    long long m_launchTime;
    bool m_alreadyRunning;

    map<string, string> m_metadata;

};

#endif /* BASE_LAUNCHRESULT_H_ */
