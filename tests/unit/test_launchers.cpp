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

#include <stdlib.h>

#include "conf/LAMConf.h"
#include "lifecycle/launcher/BrowserAppLauncher.h"
#include "lifecycle/launcher/FolderLauncher.h"
#include "lifecycle/launcher/WebPageLauncher.h"
#include "util/File.h"
#include "util/LinuxProcess.h"
#include "util/Time.h"

// 'true' stands in for browsers and file managers. It exits at once.
class LaunchersTest : public ::testing::Test {
protected:
    virtual void SetUp() override
    {
        char directory[] = "/tmp/lam-profiles-XXXXXX";
        ASSERT_TRUE(mkdtemp(directory) != NULL);
        m_profileDirectory = directory;

        JValue conf = pbnjson::Object();
        conf.put("BrowserPaths", pbnjson::JDomParser::fromString(R"([ "/nonexistent/firefox", "true" ])"));
        conf.put("AppModeBrowserPaths", pbnjson::JDomParser::fromString(R"([ "true" ])"));
        conf.put("FileManagerPaths", pbnjson::JDomParser::fromString(R"([ "true" ])"));
        conf.put("AppModeProfileDirectory", m_profileDirectory);
        LAMConf::getInstance().load(conf);
    }

    virtual void TearDown() override
    {
        LAMConf::getInstance().load(pbnjson::Object());
    }

    void reap(const LaunchResult& result)
    {
        for (int i = 0; i < 50 && LinuxProcess::isAlive(result.getPid()); ++i) {
            Time::sleep(20);
        }
    }

    string m_profileDirectory;
};

TEST_F(LaunchersTest, WebPageNeedsUrl)
{
    WebPageLauncher launcher;
    ApplicationDescriptor descriptor("intranet", AppKind::AppKind_WebPage, "intranet.example.com");
    EXPECT_EQ(ErrCode_ARGUMENT_INVALID, launcher.launch(descriptor, "alice").getErrorCode());
    EXPECT_EQ(CorrelationMode::CorrelationMode_Process, launcher.getCorrelationMode());
}

TEST_F(LaunchersTest, WebPageUsesFirstAvailableBrowser)
{
    WebPageLauncher launcher;
    ApplicationDescriptor descriptor("intranet", AppKind::AppKind_WebPage, "https://intranet.example.com");
    LaunchResult result = launcher.launch(descriptor, "alice");
    ASSERT_TRUE(result.isSuccess()) << result.getErrorText();
    EXPECT_GT(result.getPid(), 0);
    EXPECT_EQ("https://intranet.example.com", result.getMetadata("WebUrl"));
    EXPECT_EQ("true", File::getBaseName(result.getMetadata("Browser")));
    reap(result);
}

TEST_F(LaunchersTest, WebPageWithoutBrowserFails)
{
    LAMConf::getInstance().load(pbnjson::JDomParser::fromString(R"({ "BrowserPaths": [ "/nonexistent/firefox" ] })"));

    WebPageLauncher launcher;
    ApplicationDescriptor descriptor("intranet", AppKind::AppKind_WebPage, "https://intranet.example.com");
    LaunchResult result = launcher.launch(descriptor, "alice");
    EXPECT_EQ(ErrCode_LAUNCH_FAILED, result.getErrorCode());
    EXPECT_EQ("No web browser available", result.getErrorText());
}

TEST_F(LaunchersTest, BrowserAppGetsOwnProfileAndWindowClass)
{
    BrowserAppLauncher launcher;
    ApplicationDescriptor descriptor("com.corp.mail", AppKind::AppKind_BrowserApp, "https://mail.example.com");
    descriptor.setName("Mail");

    LaunchResult result = launcher.launch(descriptor, "alice");
    ASSERT_TRUE(result.isSuccess()) << result.getErrorText();
    EXPECT_EQ("Mail", result.getMetadata("ExpectedWindowTitle"));
    EXPECT_TRUE(File::isDirectory(File::join(m_profileDirectory, "com.corp.mail")));
    reap(result);

    CorrelationRequest request = launcher.getCorrelationRequest(descriptor);
    EXPECT_EQ("com.corp.mail", request.windowClass);
    EXPECT_EQ("Mail", request.titleHint);
    EXPECT_FALSE(request.exactTitle);
}

TEST_F(LaunchersTest, FolderMustExist)
{
    FolderLauncher launcher;
    ApplicationDescriptor missing("docs", AppKind::AppKind_Folder, "/nonexistent/docs");
    LaunchResult result = launcher.launch(missing, "alice");
    EXPECT_EQ(ErrCode_LAUNCH_FAILED, result.getErrorCode());
    EXPECT_EQ("Folder not found: /nonexistent/docs", result.getErrorText());

    ApplicationDescriptor tmp("tmp", AppKind::AppKind_Folder, "/tmp");
    result = launcher.launch(tmp, "alice");
    ASSERT_TRUE(result.isSuccess()) << result.getErrorText();
    EXPECT_EQ("/tmp", result.getMetadata("FolderPath"));
    EXPECT_EQ(CorrelationMode::CorrelationMode_None, launcher.getCorrelationMode());
    reap(result);
}

TEST_F(LaunchersTest, LaunchersOnlyAcceptTheirKind)
{
    WebPageLauncher web;
    FolderLauncher folder;
    ApplicationDescriptor descriptor("tmp", AppKind::AppKind_Folder, "/tmp");
    EXPECT_FALSE(web.canLaunch(descriptor));
    EXPECT_TRUE(folder.canLaunch(descriptor));
}
