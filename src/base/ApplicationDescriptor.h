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

#ifndef BASE_APPLICATIONDESCRIPTOR_H_
#define BASE_APPLICATIONDESCRIPTOR_H_

#include <memory>
#include <string>
#include <stdint.h>
#include <pbnjson.hpp>

using namespace std;
using namespace pbnjson;

enum class AppKind : int8_t {
    AppKind_None = 0,
    AppKind_NativeProcess,   // Executable on the local filesystem
    AppKind_WebPage,         // URL opened in a regular browser
    AppKind_BrowserApp,      // URL opened in a browser app-mode window
    AppKind_Folder,          // Directory opened in a file manager
    AppKind_AndroidPackage   // Package inside the Android subsystem
};

class ApplicationDescriptor;

typedef shared_ptr<const ApplicationDescriptor> ApplicationDescriptorPtr;

// Catalog entry. Never modified once it is shared.
class ApplicationDescriptor {
public:
    static string toString(AppKind kind);
    static AppKind toAppKind(const string& kind);

    // Returns nullptr when the mandatory "id" is missing
    static shared_ptr<ApplicationDescriptor> createByJson(const JValue& json);

    ApplicationDescriptor(const string& id, AppKind kind, const string& target);
    virtual ~ApplicationDescriptor();

    JValue toJson() const;

    const string& getId() const
    {
        return m_id;
    }

    AppKind getKind() const
    {
        return m_kind;
    }

    const string& getTarget() const
    {
        return m_target;
    }

    const string& getArguments() const
    {
        return m_arguments;
    }
    void setArguments(const string& arguments)
    {
        m_arguments = arguments;
    }

    const string& getWorkingDirectory() const
    {
        return m_workingDirectory;
    }
    void setWorkingDirectory(const string& workingDirectory)
    {
        m_workingDirectory = workingDirectory;
    }

    // Falls back to id when no display name is given
    const string& getName() const
    {
        return m_name.empty() ? m_id : m_name;
    }
    void setName(const string& name)
    {
        m_name = name;
    }

    const string& getDescription() const
    {
        return m_description;
    }
    void setDescription(const string& description)
    {
        m_description = description;
    }

    const string& getCategory() const
    {
        return m_category;
    }
    void setCategory(const string& category)
    {
        m_category = category;
    }

    const string& getIcon() const
    {
        return m_icon;
    }
    void setIcon(const string& icon)
    {
        m_icon = icon;
    }

    bool isSingleInstance() const
    {
        return m_singleInstance;
    }
    void setSingleInstance(bool singleInstance)
    {
        m_singleInstance = singleInstance;
    }

private:
    string m_id;
    AppKind m_kind;
    string m_target;
    string m_arguments;
    string m_workingDirectory;

    string m_name;
    string m_description;
    string m_category;
    string m_icon;

    bool m_singleInstance;

};

#endif /* BASE_APPLICATIONDESCRIPTOR_H_ */
