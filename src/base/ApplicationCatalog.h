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

#ifndef BASE_APPLICATIONCATALOG_H_
#define BASE_APPLICATIONCATALOG_H_

#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "base/ApplicationDescriptor.h"
#include "interface/IApplicationCatalog.h"
#include "interface/IClassName.h"

using namespace std;

// File-backed catalog. The file holds a JSON array of descriptors.
class ApplicationCatalog : public IApplicationCatalog,
                           public IClassName {
public:
    ApplicationCatalog();
    virtual ~ApplicationCatalog();

    // Replaces the current entries. Returns false when the file cannot be parsed.
    bool load(const string& path);
    bool loadJson(const JValue& array);

    bool add(ApplicationDescriptorPtr descriptor);
    bool removeByAppId(const string& appId);

    virtual ApplicationDescriptorPtr getDescriptor(const string& appId) override;

    vector<ApplicationDescriptorPtr> getAll();
    size_t size();

    void toJson(JValue& array);

private:
    mutex m_mutex;
    map<string, ApplicationDescriptorPtr> m_map;

};

#endif /* BASE_APPLICATIONCATALOG_H_ */
