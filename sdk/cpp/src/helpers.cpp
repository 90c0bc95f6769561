#include "biteledger/helpers.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>

namespace biteledger {
namespace helpers {

google::protobuf::Timestamp now() {
    auto time_point = std::chrono::system_clock::now();
    auto duration = time_point.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(duration - seconds);

    google::protobuf::Timestamp ts;
    ts.set_seconds(seconds.count());
    ts.set_nanos(static_cast<int32_t>(nanos.count()));
    return ts;
}

google::protobuf::Timestamp from_seconds(int64_t seconds) {
    google::protobuf::Timestamp ts;
    ts.set_seconds(seconds);
    return ts;
}

std::string record_key(const std::string& prefix, uint64_t id) {
    std::ostringstream ss;
    ss << prefix << '/' << std::setw(20) << std::setfill('0') << id;
    return ss.str();
}

} // namespace helpers
} // namespace biteledger
