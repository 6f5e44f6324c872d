#pragma once

#include "x402/registry/v1/types.pb.h"

#include "x402/registry/v1/registry_service.pb.h"
