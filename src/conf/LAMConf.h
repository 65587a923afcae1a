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

#ifndef CONF_LAMCONF_H_
#define CONF_LAMCONF_H_

#include <string>
#include <vector>
#include <pbnjson.hpp>

#include "interface/IClassName.h"
#include "interface/ISingleton.h"
#include "util/JValueUtil.h"
#include "util/Logger.h"

class LAMConf : public ISingleton<LAMConf>,
                public IClassName {
friend class ISingleton<LAMConf> ;
public:
    virtual ~LAMConf();

    // Loads the read-only configuration. Missing or invalid files leave every getter on its default.
    bool initialize(const string& path = "");

    // Replaces the loaded configuration. Used by the daemon options and by tests.
    void load(const JValue& database)
    {
        m_readOnlyDatabase = database.isObject() ? database : pbnjson::Object();
    }

    /** LOGGING **/

    string getLogLevel() const
    {
        string LogLevel = "info";
        JValueUtil::getValue(m_readOnlyDatabase, "LogLevel", LogLevel);
        return LogLevel;
    }

    string getLogType() const
    {
        string LogType = "console";
        JValueUtil::getValue(m_readOnlyDatabase, "LogType", LogType);
        return LogType;
    }

    /** MONITORING (milliseconds) **/

    int getProcessPollInterval() const
    {
        return getPositive("ProcessPollInterval", 2000);
    }

    int getWindowWatchInterval() const
    {
        return getPositive("WindowWatchInterval", 5000);
    }

    int getCorrelationWindow() const
    {
        return getPositive("CorrelationWindow", 30000);
    }

    int getCorrelationCacheTtl() const
    {
        return getPositive("CorrelationCacheTtl", 30000);
    }

    int getWindowSearchTimeout() const
    {
        return getPositive("WindowSearchTimeout", 5000);
    }

    int getWindowSearchInterval() const
    {
        return getPositive("WindowSearchInterval", 500);
    }

    int getTerminateTimeout() const
    {
        return getPositive("TerminateTimeout", 5000);
    }

    int getKillTimeout() const
    {
        return getPositive("KillTimeout", 3000);
    }

    int getTerminatedRetention() const
    {
        return getPositive("TerminatedRetention", 60000);
    }

    bool isAutoStartMonitoring() const
    {
        bool AutoStartMonitoring = true;
        JValueUtil::getValue(m_readOnlyDatabase, "AutoStartMonitoring", AutoStartMonitoring);
        return AutoStartMonitoring;
    }

    /** ANDROID **/

    string getAndroidWindowClass() const
    {
        string AndroidWindowClass = "waydroid";
        JValueUtil::getValue(m_readOnlyDatabase, "AndroidWindowClass", AndroidWindowClass);
        return AndroidWindowClass;
    }

    string getAndroidSubsystemPath() const
    {
        string AndroidSubsystemPath = "waydroid";
        JValueUtil::getValue(m_readOnlyDatabase, "AndroidSubsystemPath", AndroidSubsystemPath);
        return AndroidSubsystemPath;
    }

    /** PROGRAMS **/

    vector<string> getBrowserPaths() const
    {
        vector<string> BrowserPaths = { "firefox", "chromium", "google-chrome", "xdg-open" };
        JValueUtil::getValue(m_readOnlyDatabase, "BrowserPaths", BrowserPaths);
        return BrowserPaths;
    }

    vector<string> getAppModeBrowserPaths() const
    {
        vector<string> AppModeBrowserPaths = { "chromium", "chromium-browser", "google-chrome", "microsoft-edge" };
        JValueUtil::getValue(m_readOnlyDatabase, "AppModeBrowserPaths", AppModeBrowserPaths);
        return AppModeBrowserPaths;
    }

    vector<string> getFileManagerPaths() const
    {
        vector<string> FileManagerPaths = { "nautilus", "dolphin", "thunar", "xdg-open" };
        JValueUtil::getValue(m_readOnlyDatabase, "FileManagerPaths", FileManagerPaths);
        return FileManagerPaths;
    }

    string getAppModeProfileDirectory() const;

    // Empty means children inherit our stdout/stderr
    string getAppLogDirectory() const
    {
        string AppLogDirectory = "";
        JValueUtil::getValue(m_readOnlyDatabase, "AppLogDirectory", AppLogDirectory);
        return AppLogDirectory;
    }

    string getCatalogPath() const;

    const string& getPath() const
    {
        return m_path;
    }

private:
    LAMConf();

    int getPositive(const string& key, int defaultValue) const
    {
        int value = defaultValue;
        if (!JValueUtil::getValue(m_readOnlyDatabase, key, value) || value <= 0)
            return defaultValue;
        return value;
    }

    string m_path;
    JValue m_readOnlyDatabase;

};

#endif /* CONF_LAMCONF_H_ */
