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

#ifndef BASE_PROCESSINFO_H_
#define BASE_PROCESSINFO_H_

#include <string>
#include <sys/types.h>

using namespace std;

class ProcessInfo {
public:
    ProcessInfo()
        : m_pid(0),
          m_parentPid(0),
          m_state('?'),
          m_residentMemory(0),
          m_startTime(0)
    {
    }
    virtual ~ProcessInfo() {}

    pid_t getPid() const
    {
        return m_pid;
    }
    void setPid(pid_t pid)
    {
        m_pid = pid;
    }

    pid_t getParentPid() const
    {
        return m_parentPid;
    }
    void setParentPid(pid_t pid)
    {
        m_parentPid = pid;
    }

    const string& getName() const
    {
        return m_name;
    }
    void setName(const string& name)
    {
        m_name = name;
    }

    // Single-letter kernel state (R, S, D, Z, T, t, ...)
    char getState() const
    {
        return m_state;
    }
    void setState(char state)
    {
        m_state = state;
    }

    // kB
    unsigned long getResidentMemory() const
    {
        return m_residentMemory;
    }
    void setResidentMemory(unsigned long residentMemory)
    {
        m_residentMemory = residentMemory;
    }

    // Milliseconds since boot
    long long getStartTime() const
    {
        return m_startTime;
    }
    void setStartTime(long long startTime)
    {
        m_startTime = startTime;
    }

    bool isZombie() const
    {
        return m_state == 'Z' || m_state == 'X';
    }

    bool isResponding() const
    {
        return m_state != 'T' && m_state != 't';
    }

private:
    pid_t m_pid;
    pid_t m_parentPid;
    string m_name;
    char m_state;
    unsigned long m_residentMemory;
    long long m_startTime;

};

#endif /* BASE_PROCESSINFO_H_ */
