#pragma once

#include "blegw/v1/ingest_service.pb.h"
#include "blegw/v1/telemetry.pb.h"

#include "blegw/v1/ingest_service.grpc.pb.h"
