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

#include "base/WindowInfo.h"

WindowInfoPtr WindowInfo::createPlaceholder(const string& title)
{
    return make_shared<WindowInfo>(0, title, 0, "");
}

WindowInfo::WindowInfo(WindowHandle handle, const string& title, pid_t pid, const string& windowClass, long long creationTime)
    : m_handle(handle),
      m_title(title),
      m_pid(pid),
      m_windowClass(windowClass),
      m_creationTime(creationTime)
{
}

WindowInfo::~WindowInfo()
{
}

JValue WindowInfo::toJson() const
{
    JValue json = pbnjson::Object();
    json.put("handle", (int64_t) m_handle);
    json.put("title", m_title);
    json.put("processId", (int) m_pid);
    json.put("class", m_windowClass);
    json.put("placeholder", isPlaceholder());
    return json;
}
