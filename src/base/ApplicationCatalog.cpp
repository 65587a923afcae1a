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

#include "base/ApplicationCatalog.h"

#include "util/JValueUtil.h"
#include "util/Logger.h"

ApplicationCatalog::ApplicationCatalog()
{
    setClassName("ApplicationCatalog");
}

ApplicationCatalog::~ApplicationCatalog()
{
}

bool ApplicationCatalog::load(const string& path)
{
    JValue array = JDomParser::fromFile(path.c_str(), JValueUtil::getSchema("catalog"));
    if (array.isNull() || !array.isArray()) {
        Logger::warning(getClassName(), __FUNCTION__, path, "Failed to parse catalog");
        return false;
    }
    if (!loadJson(array))
        return false;

    Logger::info(getClassName(), __FUNCTION__, path, Logger::format("Loaded %d applications", (int) size()));
    return true;
}

bool ApplicationCatalog::loadJson(const JValue& array)
{
    if (!array.isArray())
        return false;

    map<string, ApplicationDescriptorPtr> entries;
    int size = array.arraySize();
    for (int i = 0; i < size; ++i) {
        ApplicationDescriptorPtr descriptor = ApplicationDescriptor::createByJson(array[i]);
        if (!descriptor) {
            Logger::warning(getClassName(), __FUNCTION__, "Entry without id is skipped");
            continue;
        }
        if (descriptor->getKind() == AppKind::AppKind_None) {
            Logger::warning(getClassName(), __FUNCTION__, descriptor->getId(), "Unknown application type");
        }
        if (entries.find(descriptor->getId()) != entries.end()) {
            Logger::warning(getClassName(), __FUNCTION__, descriptor->getId(), "Duplicated id. The first entry is kept");
            continue;
        }
        entries[descriptor->getId()] = descriptor;
    }

    lock_guard<mutex> lock(m_mutex);
    m_map.swap(entries);
    return true;
}

bool ApplicationCatalog::add(ApplicationDescriptorPtr descriptor)
{
    if (!descriptor || descriptor->getId().empty())
        return false;

    lock_guard<mutex> lock(m_mutex);
    if (m_map.find(descriptor->getId()) != m_map.end()) {
        Logger::warning(getClassName(), __FUNCTION__, descriptor->getId(), "AppId is already exist");
        return false;
    }
    m_map[descriptor->getId()] = descriptor;
    return true;
}

bool ApplicationCatalog::removeByAppId(const string& appId)
{
    lock_guard<mutex> lock(m_mutex);
    return m_map.erase(appId) > 0;
}

ApplicationDescriptorPtr ApplicationCatalog::getDescriptor(const string& appId)
{
    lock_guard<mutex> lock(m_mutex);
    auto it = m_map.find(appId);
    if (it == m_map.end())
        return nullptr;
    return it->second;
}

vector<ApplicationDescriptorPtr> ApplicationCatalog::getAll()
{
    vector<ApplicationDescriptorPtr> descriptors;
    lock_guard<mutex> lock(m_mutex);
    for (auto it = m_map.begin(); it != m_map.end(); ++it) {
        descriptors.push_back(it->second);
    }
    return descriptors;
}

size_t ApplicationCatalog::size()
{
    lock_guard<mutex> lock(m_mutex);
    return m_map.size();
}

void ApplicationCatalog::toJson(JValue& array)
{
    array = pbnjson::Array();
    for (ApplicationDescriptorPtr descriptor : getAll()) {
        array.append(descriptor->toJson());
    }
}
