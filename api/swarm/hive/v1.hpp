#pragma once

#include "swarm/hive/v1/events.pb.h"
#include "swarm/hive/v1/export.pb.h"
