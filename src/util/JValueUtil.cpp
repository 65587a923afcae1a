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

#include "util/JValueUtil.h"

#include "Environment.h"

mutex JValueUtil::s_mutex;
map<string, JSchema> JValueUtil::s_schemas;

JSchema JValueUtil::getSchema(const string& name)
{
    if (name.empty())
        return JSchema::AllSchema();

    lock_guard<mutex> lock(s_mutex);
    auto it = s_schemas.find(name);
    if (it != s_schemas.end())
        return it->second;

    string path = string(PATH_LAM_SCHEMAS) + "/" + name + ".schema";
    JSchema schema = JSchema::fromFile(path.c_str());
    if (!schema.isInitialized())
        return JSchema::AllSchema();

    s_schemas.insert(pair<string, JSchema>(name, schema));
    return schema;
}

bool JValueUtil::convertValue(const JValue& json, string& value)
{
    if (!json.isString())
        return false;
    if (json.asString(value) != CONV_OK) {
        value = "";
        return false;
    }
    return true;
}

bool JValueUtil::convertValue(const JValue& json, int& value)
{
    if (!json.isNumber())
        return false;
    if (json.asNumber<int>(value) != CONV_OK) {
        value = 0;
        return false;
    }
    return true;
}

bool JValueUtil::convertValue(const JValue& json, long long& value)
{
    if (!json.isNumber())
        return false;
    int64_t number = 0;
    if (json.asNumber<int64_t>(number) != CONV_OK) {
        value = 0;
        return false;
    }
    value = (long long) number;
    return true;
}

bool JValueUtil::convertValue(const JValue& json, bool& value)
{
    if (!json.isBoolean())
        return false;
    if (json.asBool(value) != CONV_OK) {
        value = false;
        return false;
    }
    return true;
}

bool JValueUtil::convertValue(const JValue& json, vector<string>& value)
{
    if (!json.isArray())
        return false;

    vector<string> items;
    for (int i = 0; i < json.arraySize(); ++i) {
        if (!json[i].isString())
            continue;
        items.push_back(json[i].asString());
    }
    value.swap(items);
    return true;
}
