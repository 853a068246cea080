#pragma once

#include "google/protobuf/timestamp.pb.h"

namespace install::util {

// Wall-clock timestamp for status records and snapshots.
google::protobuf::Timestamp NowProto();

} // namespace install::util
