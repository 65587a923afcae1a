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

#include "conf/LAMConf.h"

#include <glib.h>

#include "Environment.h"
#include "util/File.h"

LAMConf::LAMConf()
    : m_readOnlyDatabase(pbnjson::Object())
{
    setClassName("LAMConf");
}

LAMConf::~LAMConf()
{
}

bool LAMConf::initialize(const string& path)
{
    m_path = path.empty() ? PATH_RO_LAM_CONF : path;
    if (!File::isFile(m_path)) {
        Logger::warning(getClassName(), __FUNCTION__, m_path, "Configuration file is not found. Defaults are used");
        m_readOnlyDatabase = pbnjson::Object();
        return false;
    }

    JValue database = JDomParser::fromFile(m_path.c_str(), JValueUtil::getSchema("lam-conf"));
    if (database.isNull() || !database.isObject()) {
        Logger::warning(getClassName(), __FUNCTION__, m_path, "Failed to parse read-only lam-conf. Defaults are used");
        m_readOnlyDatabase = pbnjson::Object();
        return false;
    }
    m_readOnlyDatabase = database;

    Logger::info(getClassName(), __FUNCTION__, m_path,
                 Logger::format("LogLevel(%s) ProcessPollInterval(%d) WindowWatchInterval(%d)",
                 getLogLevel().c_str(), getProcessPollInterval(), getWindowWatchInterval()));
    return true;
}

string LAMConf::getAppModeProfileDirectory() const
{
    string AppModeProfileDirectory = File::join(File::join(g_get_user_cache_dir(), "lam"), "profiles");
    JValueUtil::getValue(m_readOnlyDatabase, "AppModeProfileDirectory", AppModeProfileDirectory);
    return AppModeProfileDirectory;
}

string LAMConf::getCatalogPath() const
{
    string CatalogPath = PATH_LAM_CATALOG;
    JValueUtil::getValue(m_readOnlyDatabase, "CatalogPath", CatalogPath);
    return CatalogPath;
}
