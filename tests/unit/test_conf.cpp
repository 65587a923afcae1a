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

#include <gtest/gtest.h>

#include <stdio.h>
#include <unistd.h>

#include "conf/LAMConf.h"
#include "util/File.h"

class LAMConfTest : public ::testing::Test {
protected:
    virtual void TearDown() override
    {
        LAMConf::getInstance().load(pbnjson::Object());
    }
};

TEST_F(LAMConfTest, DefaultsWithoutConfiguration)
{
    LAMConf& conf = LAMConf::getInstance();
    conf.load(pbnjson::Object());

    EXPECT_EQ("info", conf.getLogLevel());
    EXPECT_EQ(2000, conf.getProcessPollInterval());
    EXPECT_EQ(5000, conf.getWindowWatchInterval());
    EXPECT_EQ(30000, conf.getCorrelationWindow());
    EXPECT_EQ(5000, conf.getTerminateTimeout());
    EXPECT_EQ(60000, conf.getTerminatedRetention());
    EXPECT_TRUE(conf.isAutoStartMonitoring());
    EXPECT_EQ("waydroid", conf.getAndroidWindowClass());
    EXPECT_FALSE(conf.getBrowserPaths().empty());
    EXPECT_TRUE(conf.getAppLogDirectory().empty());
    EXPECT_FALSE(conf.getAppModeProfileDirectory().empty());
}

TEST_F(LAMConfTest, ValuesOverrideDefaults)
{
    LAMConf& conf = LAMConf::getInstance();
    conf.load(pbnjson::JDomParser::fromString(R"({
        "LogLevel": "debug",
        "ProcessPollInterval": 750,
        "AutoStartMonitoring": false,
        "AndroidWindowClass": "anbox",
        "BrowserPaths": [ "/opt/corp/browser" ],
        "AppLogDirectory": "/var/log/lam/apps"
    })"));

    EXPECT_EQ("debug", conf.getLogLevel());
    EXPECT_EQ(750, conf.getProcessPollInterval());
    EXPECT_FALSE(conf.isAutoStartMonitoring());
    EXPECT_EQ("anbox", conf.getAndroidWindowClass());
    ASSERT_EQ(1U, conf.getBrowserPaths().size());
    EXPECT_EQ("/opt/corp/browser", conf.getBrowserPaths()[0]);
    EXPECT_EQ("/var/log/lam/apps", conf.getAppLogDirectory());
}

TEST_F(LAMConfTest, NonPositiveIntervalsFallBack)
{
    LAMConf& conf = LAMConf::getInstance();
    conf.load(pbnjson::JDomParser::fromString(R"({ "ProcessPollInterval": 0, "KillTimeout": -10, "WindowSearchTimeout": "soon" })"));

    EXPECT_EQ(2000, conf.getProcessPollInterval());
    EXPECT_EQ(3000, conf.getKillTimeout());
    EXPECT_EQ(5000, conf.getWindowSearchTimeout());
}

TEST_F(LAMConfTest, InitializeFromFile)
{
    char path[] = "/tmp/lam-conf-XXXXXX";
    int fd = mkstemp(path);
    ASSERT_NE(-1, fd);
    close(fd);
    ASSERT_TRUE(File::writeFile(path, R"({ "WindowWatchInterval": 1500 })"));

    LAMConf& conf = LAMConf::getInstance();
    EXPECT_TRUE(conf.initialize(path));
    EXPECT_EQ(path, conf.getPath());
    EXPECT_EQ(1500, conf.getWindowWatchInterval());

    unlink(path);
    EXPECT_FALSE(conf.initialize(path));
    EXPECT_EQ(5000, conf.getWindowWatchInterval());
}
