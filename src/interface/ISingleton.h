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

#ifndef INTERFACE_ISINGLETON_H_
#define INTERFACE_ISINGLETON_H_

#include <iostream>

using namespace std;

// Only process-wide services (configuration, logger, daemon) are singletons.
// Lifecycle components are constructed explicitly so that they can be wired
// against fake platform clients.
template <class T>
class ISingleton {
public:
    virtual ~ISingleton() {};

    static T& getInstance()
    {
        static T _instance;
        return _instance;
    }

protected:
    ISingleton() {};

private:
    ISingleton(const ISingleton&);
    ISingleton& operator=(const ISingleton&);

};

#endif /* INTERFACE_ISINGLETON_H_ */
