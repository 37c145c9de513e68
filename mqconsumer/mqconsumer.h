/*
** Copyright 2026 The mqconsumer Authors
**
** Licensed under the Apache License, Version 2.0 (the "License");
** you may not use this file except in compliance with the License.
** You may obtain a copy of the License at
**
**     http://www.apache.org/licenses/LICENSE-2.0
**
** Unless required by applicable law or agreed to in writing, software
** distributed under the License is distributed on an "AS IS" BASIS,
** WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
** See the License for the specific language governing permissions and
** limitations under the License.
*/
#ifndef ROCKET_MQCONSUMER_H
#define ROCKET_MQCONSUMER_H

#include <mqconsumer/mqconsumer_allocate_strategy.h>
#include <mqconsumer/mqconsumer_callbacks.h>
#include <mqconsumer/mqconsumer_client_options.h>
#include <mqconsumer/mqconsumer_configuration.h>
#include <mqconsumer/mqconsumer_consumer_configuration.h>
#include <mqconsumer/mqconsumer_consumer_options.h>
#include <mqconsumer/mqconsumer_consumer_options_builder.h>
#include <mqconsumer/mqconsumer_exception.h>
#include <mqconsumer/mqconsumer_flow_control.h>
#include <mqconsumer/mqconsumer_interceptor.h>
#include <mqconsumer/mqconsumer_message_queue.h>
#include <mqconsumer/mqconsumer_option.h>
#include <mqconsumer/mqconsumer_queue_thresholds.h>
#include <mqconsumer/mqconsumer_threshold.h>
#include <mqconsumer/mqconsumer_utils.h>
#include <mqconsumer/utils/mqconsumer_json_builder.h>
#include <mqconsumer/utils/mqconsumer_snapshot.h>

#endif //ROCKET_MQCONSUMER_H
