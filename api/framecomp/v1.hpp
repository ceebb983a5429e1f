#pragma once

#include "framecomp/v1/types.pb.h"

#include "framecomp/v1/admin_service.pb.h"
#include "framecomp/v1/frame_service.pb.h"
#include "framecomp/v1/health_service.pb.h"

#include "framecomp/v1/admin_service.grpc.pb.h"
#include "framecomp/v1/frame_service.grpc.pb.h"
#include "framecomp/v1/health_service.grpc.pb.h"
