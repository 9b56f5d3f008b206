#pragma once

#include "beacon/v1/heartbeat.pb.h"
#include "beacon/v1/server_state.pb.h"
