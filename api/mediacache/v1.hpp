#pragma once

#include "mediacache/v1/cache_admin.pb.h"
#include "mediacache/v1/cache_admin.grpc.pb.h"

namespace mediacache::api {
namespace v1 = ::mediacache::v1;
}
