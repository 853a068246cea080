#pragma once

#include "install/manager/v1/request.pb.h"
#include "install/manager/v1/status.pb.h"
