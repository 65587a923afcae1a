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

#ifndef BASE_SHUTDOWNRESULT_H_
#define BASE_SHUTDOWNRESULT_H_

#include <string>
#include <vector>

using namespace std;

class ShutdownResult {
public:
    ShutdownResult()
        : m_total(0),
          m_graceful(0),
          m_forced(0),
          m_failed(0),
          m_duration(0)
    {
    }
    virtual ~ShutdownResult() {}

    bool isSuccess() const
    {
        return m_failed == 0;
    }

    int getTotal() const
    {
        return m_total;
    }
    int getGraceful() const
    {
        return m_graceful;
    }
    int getForced() const
    {
        return m_forced;
    }
    int getFailed() const
    {
        return m_failed;
    }

    long long getDuration() const
    {
        return m_duration;
    }
    void setDuration(long long duration)
    {
        m_duration = duration;
    }

    const vector<string>& getDetails() const
    {
        return m_details;
    }
    const vector<string>& getErrors() const
    {
        return m_errors;
    }

    void addGraceful(const string& detail)
    {
        ++m_total;
        ++m_graceful;
        m_details.push_back(detail);
    }

    void addForced(const string& detail)
    {
        ++m_total;
        ++m_forced;
        m_details.push_back(detail);
    }

    void addFailed(const string& detail, const string& error)
    {
        ++m_total;
        ++m_failed;
        m_details.push_back(detail);
        m_errors.push_back(error);
    }

private:
    int m_total;
    int m_graceful;
    int m_forced;
    int m_failed;
    long long m_duration;

    vector<string> m_details;
    vector<string> m_errors;

};

#endif /* BASE_SHUTDOWNRESULT_H_ */
