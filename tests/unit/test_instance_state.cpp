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

#include "base/ApplicationInstance.h"
#include "base/InstanceEvent.h"

namespace {

ApplicationInstancePtr createInstance()
{
    ApplicationDescriptorPtr descriptor = make_shared<ApplicationDescriptor>("com.corp.editor", AppKind::AppKind_NativeProcess, "/usr/bin/editor");
    return make_shared<ApplicationInstance>("instance-1", descriptor, "alice");
}

}  // namespace

TEST(InstanceState, ForwardTransitionsAreAllowed)
{
    EXPECT_TRUE(ApplicationInstance::isValidTransition(InstanceState::InstanceState_Starting, InstanceState::InstanceState_Running));
    EXPECT_TRUE(ApplicationInstance::isValidTransition(InstanceState::InstanceState_Running, InstanceState::InstanceState_Active));
    EXPECT_TRUE(ApplicationInstance::isValidTransition(InstanceState::InstanceState_Active, InstanceState::InstanceState_Inactive));
    EXPECT_TRUE(ApplicationInstance::isValidTransition(InstanceState::InstanceState_Inactive, InstanceState::InstanceState_Active));
    EXPECT_TRUE(ApplicationInstance::isValidTransition(InstanceState::InstanceState_Running, InstanceState::InstanceState_NotResponding));
    EXPECT_TRUE(ApplicationInstance::isValidTransition(InstanceState::InstanceState_NotResponding, InstanceState::InstanceState_Running));
}

TEST(InstanceState, TerminatedAndErrorReachableFromLiveStates)
{
    InstanceState live[] = {
        InstanceState::InstanceState_Starting,
        InstanceState::InstanceState_Running,
        InstanceState::InstanceState_Active,
        InstanceState::InstanceState_Inactive,
        InstanceState::InstanceState_NotResponding,
    };
    for (InstanceState state : live) {
        EXPECT_TRUE(ApplicationInstance::isValidTransition(state, InstanceState::InstanceState_Terminated)) << ApplicationInstance::toString(state);
        EXPECT_TRUE(ApplicationInstance::isValidTransition(state, InstanceState::InstanceState_Error)) << ApplicationInstance::toString(state);
    }
}

TEST(InstanceState, TerminalStatesAreFinal)
{
    EXPECT_TRUE(ApplicationInstance::isTerminal(InstanceState::InstanceState_Terminated));
    EXPECT_TRUE(ApplicationInstance::isTerminal(InstanceState::InstanceState_Error));
    EXPECT_FALSE(ApplicationInstance::isTerminal(InstanceState::InstanceState_NotResponding));

    EXPECT_FALSE(ApplicationInstance::isValidTransition(InstanceState::InstanceState_Terminated, InstanceState::InstanceState_Running));
    EXPECT_FALSE(ApplicationInstance::isValidTransition(InstanceState::InstanceState_Terminated, InstanceState::InstanceState_Error));
    EXPECT_FALSE(ApplicationInstance::isValidTransition(InstanceState::InstanceState_Error, InstanceState::InstanceState_Terminated));
}

TEST(InstanceState, SkippingRunningIsRefused)
{
    EXPECT_FALSE(ApplicationInstance::isValidTransition(InstanceState::InstanceState_Starting, InstanceState::InstanceState_Active));
    EXPECT_FALSE(ApplicationInstance::isValidTransition(InstanceState::InstanceState_Active, InstanceState::InstanceState_Running));
    EXPECT_FALSE(ApplicationInstance::isValidTransition(InstanceState::InstanceState_Running, InstanceState::InstanceState_Running));
}

TEST(InstanceState, NewInstanceStartsWithoutWindow)
{
    ApplicationInstancePtr instance = createInstance();
    EXPECT_EQ(InstanceState::InstanceState_Starting, instance->getState());
    EXPECT_EQ("com.corp.editor", instance->getAppId());
    EXPECT_EQ("alice", instance->getPrincipal());
    EXPECT_FALSE(instance->hasRealWindow());
    EXPECT_GT(instance->getStartTime(), 0);

    instance->setWindow(WindowInfo::createPlaceholder("Editor"));
    EXPECT_FALSE(instance->hasRealWindow());
    instance->setWindow(make_shared<WindowInfo>(0x42, "Editor", 100, "editor"));
    EXPECT_TRUE(instance->hasRealWindow());
}

TEST(InstanceEvent, TypeFollowsNewState)
{
    EXPECT_EQ(InstanceEventType::InstanceEventType_Stopped, InstanceEvent::toEventType(InstanceState::InstanceState_Terminated));
    EXPECT_EQ(InstanceEventType::InstanceEventType_Activated, InstanceEvent::toEventType(InstanceState::InstanceState_Active));
    EXPECT_EQ(InstanceEventType::InstanceEventType_Error, InstanceEvent::toEventType(InstanceState::InstanceState_Error));
    EXPECT_EQ(InstanceEventType::InstanceEventType_StateChanged, InstanceEvent::toEventType(InstanceState::InstanceState_Inactive));
}

TEST(InstanceEvent, JsonCarriesInstanceAndTransition)
{
    ApplicationInstancePtr instance = createInstance();
    InstanceEvent event = InstanceEvent::createTransition(instance, InstanceState::InstanceState_Starting, "Launched", "Test");

    JValue json = event.toJson();
    EXPECT_EQ("instance-1", json["instanceId"].asString());
    EXPECT_EQ("Launched", json["reason"].asString());
    EXPECT_EQ("Test", json["source"].asString());
}
