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

#include "lifecycle/launcher/AndroidArguments.h"

TEST(AndroidArguments, PackageNameValidation)
{
    EXPECT_TRUE(AndroidArguments::isValidPackageName("com.corp.scanner"));
    EXPECT_TRUE(AndroidArguments::isValidPackageName("org.example_app.v2"));
    EXPECT_FALSE(AndroidArguments::isValidPackageName("scanner"));
    EXPECT_FALSE(AndroidArguments::isValidPackageName("com..scanner"));
    EXPECT_FALSE(AndroidArguments::isValidPackageName("com.1corp.scanner"));
    EXPECT_FALSE(AndroidArguments::isValidPackageName("com.corp.scanner;reboot"));
    EXPECT_FALSE(AndroidArguments::isValidPackageName(""));
}

TEST(AndroidArguments, DefaultsWithoutArguments)
{
    AndroidArguments arguments;
    arguments.parse("");
    EXPECT_TRUE(arguments.getWindowName().empty());
    EXPECT_TRUE(arguments.getActivityName().empty());
    EXPECT_EQ(0, arguments.getLaunchTimeout());
    EXPECT_TRUE(arguments.isWaitForWindow());
    EXPECT_TRUE(arguments.isVirtualFallback());
    EXPECT_TRUE(arguments.getCustomParameters().empty());
}

TEST(AndroidArguments, QuotedAndPlainValues)
{
    AndroidArguments arguments;
    arguments.parse("--window_name='Badge Scanner' --activity_name=\".ScanActivity\" --launch_timeout=12 --wait_for_window=false");
    EXPECT_EQ("Badge Scanner", arguments.getWindowName());
    EXPECT_EQ(".ScanActivity", arguments.getActivityName());
    EXPECT_EQ(12, arguments.getLaunchTimeout());
    EXPECT_FALSE(arguments.isWaitForWindow());
    EXPECT_TRUE(arguments.isVirtualFallback());
}

TEST(AndroidArguments, UnknownKeysAreCustomParameters)
{
    AndroidArguments arguments;
    arguments.parse("--virtual_fallback=no --site=berlin --badge_mode='kiosk mode' stray-token");
    EXPECT_FALSE(arguments.isVirtualFallback());
    ASSERT_EQ(2U, arguments.getCustomParameters().size());
    EXPECT_EQ("berlin", arguments.getCustomParameters().at("site"));
    EXPECT_EQ("kiosk mode", arguments.getCustomParameters().at("badge_mode"));
}

TEST(AndroidArguments, InvalidTimeoutIsIgnored)
{
    AndroidArguments arguments;
    arguments.parse("--launch_timeout=-3");
    EXPECT_EQ(0, arguments.getLaunchTimeout());
    arguments.parse("--launch_timeout=soon");
    EXPECT_EQ(0, arguments.getLaunchTimeout());
}
