#pragma once
#include <cstdint>

namespace cuebridge::time {

class ITimeSource {
public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowUtcMs() const = 0;
};

}  // namespace cuebridge::time
