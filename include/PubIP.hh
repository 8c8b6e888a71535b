//
// PubIP.hh
//
// Copyright 2023-Present Couchbase, Inc. All rights reserved.
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

#pragma once
#include "Address.hh"
#include "Error.hh"
#include "EventLoop.hh"
#include "Future.hh"
#include "Generator.hh"
#include "Providers.hh"
#include "Resolution.hh"
#include "Resolve.hh"
#include "Resolver.hh"
#include "Result.hh"
#include "Scheduler.hh"

#include "dns/DNSMessage.hh"
#include "dns/DNSResolver.hh"
#include "http/HTTPResolver.hh"
