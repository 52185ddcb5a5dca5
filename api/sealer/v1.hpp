#pragma once

#include "sealer/v1/sealed_export.pb.h"
#include "sealer/v1/sealed_export.grpc.pb.h"
