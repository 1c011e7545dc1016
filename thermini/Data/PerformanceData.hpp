#ifndef THERMINI_DATA_PERFORMANCE_DATA_HPP_
#define THERMINI_DATA_PERFORMANCE_DATA_HPP_

#include <Eigen/Dense>

namespace thermini {
struct PerformanceData {
  using Index = Eigen::Index;

  Index cores; // Number of CPU cores to use (0 for auto)
};
} // namespace thermini

#endif  // THERMINI_DATA_PERFORMANCE_DATA_HPP_
