#include "time.hpp"

#include <chrono>
#include <cstdint>

namespace install::util {

google::protobuf::Timestamp NowProto() {
  using namespace std::chrono;
  const auto since_epoch = system_clock::now().time_since_epoch();
  const auto whole       = floor<seconds>(since_epoch);

  google::protobuf::Timestamp ts;
  ts.set_seconds(whole.count());
  ts.set_nanos(static_cast<int32_t>(duration_cast<nanoseconds>(since_epoch - whole).count()));
  return ts;
}

} // namespace install::util
