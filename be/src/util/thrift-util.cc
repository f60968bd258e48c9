// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#include "util/thrift-util.h"

#include <gflags/gflags.h>

#include "common/names.h"

using namespace apache::thrift;
using namespace apache::thrift::protocol;
using namespace apache::thrift::transport;

DEFINE_int64(thrift_max_message_size, 0, "(Advanced) The maximum size of a thrift "
    "structure, such as a file footer, that readers accept. A value of 0 or less uses "
    "the default of the Thrift library.");

namespace strata {

int64_t ThriftMaxMessageSize() {
  return FLAGS_thrift_max_message_size <= 0 ?
      TConfiguration::DEFAULT_MAX_MESSAGE_SIZE : FLAGS_thrift_max_message_size;
}

std::shared_ptr<TConfiguration> DefaultTConfiguration() {
  return std::make_shared<TConfiguration>(ThriftMaxMessageSize());
}

ThriftSerializer::ThriftSerializer(int initial_buffer_size)
  : mem_buffer_(new TMemoryBuffer(initial_buffer_size, DefaultTConfiguration())) {
  TCompactProtocolFactoryT<TMemoryBuffer> factory;
  protocol_ = factory.getProtocol(mem_buffer_);
}

std::shared_ptr<TProtocol> CreateDeserializeProtocol(std::shared_ptr<TMemoryBuffer> mem) {
  TCompactProtocolFactoryT<TMemoryBuffer> tproto_factory;
  return tproto_factory.getProtocol(mem);
}

}
