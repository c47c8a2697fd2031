#pragma once

#include "cadence/analysis/v1/records.pb.h"
#include "cadence/analysis/v1/report.pb.h"

#include "cadence/analysis/v1/analysis_service.pb.h"
#include "cadence/analysis/v1/analysis_service.grpc.pb.h"
