#pragma once

#include "omni/v1/types.pb.h"

#include "omni/v1/ingest_service.pb.h"
#include "omni/v1/query_service.pb.h"
