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

#include "base/ApplicationDescriptor.h"

#include "util/JValueUtil.h"

string ApplicationDescriptor::toString(AppKind kind)
{
    string str;
    switch (kind) {
    case AppKind::AppKind_NativeProcess:
        str = "native";
        break;

    case AppKind::AppKind_WebPage:
        str = "webpage";
        break;

    case AppKind::AppKind_BrowserApp:
        str = "browserapp";
        break;

    case AppKind::AppKind_Folder:
        str = "folder";
        break;

    case AppKind::AppKind_AndroidPackage:
        str = "android";
        break;

    default:
        str = "unknown";
        break;
    }
    return str;
}

AppKind ApplicationDescriptor::toAppKind(const string& kind)
{
    if (kind == "native") {
        return AppKind::AppKind_NativeProcess;
    } else if (kind == "webpage" || kind == "web") {
        return AppKind::AppKind_WebPage;
    } else if (kind == "browserapp") {
        return AppKind::AppKind_BrowserApp;
    } else if (kind == "folder") {
        return AppKind::AppKind_Folder;
    } else if (kind == "android") {
        return AppKind::AppKind_AndroidPackage;
    }
    return AppKind::AppKind_None;
}

shared_ptr<ApplicationDescriptor> ApplicationDescriptor::createByJson(const JValue& json)
{
    string id;
    if (!JValueUtil::getValue(json, "id", id) || id.empty())
        return nullptr;

    string type;
    string target;
    JValueUtil::getValue(json, "type", type);
    JValueUtil::getValue(json, "target", target);

    shared_ptr<ApplicationDescriptor> descriptor = make_shared<ApplicationDescriptor>(id, toAppKind(type), target);

    string value;
    if (JValueUtil::getValue(json, "arguments", value))
        descriptor->setArguments(value);
    if (JValueUtil::getValue(json, "workingDirectory", value))
        descriptor->setWorkingDirectory(value);
    if (JValueUtil::getValue(json, "name", value))
        descriptor->setName(value);
    if (JValueUtil::getValue(json, "description", value))
        descriptor->setDescription(value);
    if (JValueUtil::getValue(json, "category", value))
        descriptor->setCategory(value);
    if (JValueUtil::getValue(json, "icon", value))
        descriptor->setIcon(value);

    bool singleInstance = false;
    if (JValueUtil::getValue(json, "singleInstance", singleInstance))
        descriptor->setSingleInstance(singleInstance);
    return descriptor;
}

ApplicationDescriptor::ApplicationDescriptor(const string& id, AppKind kind, const string& target)
    : m_id(id),
      m_kind(kind),
      m_target(target),
      m_singleInstance(false)
{
}

ApplicationDescriptor::~ApplicationDescriptor()
{
}

JValue ApplicationDescriptor::toJson() const
{
    JValue json = pbnjson::Object();
    json.put("id", m_id);
    json.put("type", toString(m_kind));
    json.put("target", m_target);
    json.put("name", getName());
    if (!m_arguments.empty())
        json.put("arguments", m_arguments);
    if (!m_workingDirectory.empty())
        json.put("workingDirectory", m_workingDirectory);
    if (!m_category.empty())
        json.put("category", m_category);
    json.put("singleInstance", m_singleInstance);
    return json;
}
