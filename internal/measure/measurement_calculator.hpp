#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace trailwatch::measure {

struct Measurement {
  uint64_t inode     = 0;
  uint64_t file_size = 0;

  // 0 for binaries
  int64_t line_count = 0;

  // nullopt for binaries and unsupported extensions
  std::optional<int64_t> block_count;

  bool binary = false;
};

/*
  Pure function of file contents at call time.

  Never throws: a read failure yields a zeroed measurement (keeping the
  caller's inode) and a warning log, so classification can proceed.
*/
class MeasurementCalculator {
 public:
  static constexpr std::size_t kSampleSize = 8192;

  // non-printable share above which a sample is binary (exclusive)
  static constexpr int kBinaryPercent = 30;

  Measurement Measure(const std::string& path, uint64_t inode) const;

  static bool IsPrintable(unsigned char byte);
  static bool IsBinarySample(std::string_view sample);

  // count of '\n' plus one; empty content is one line
  static int64_t CountLines(std::string_view content);

  // nullopt when the extension has no structural analysis
  static std::optional<int64_t> CountStructures(std::string_view extension, std::string_view content);

  static bool SupportsStructure(std::string_view extension);
};

} // namespace trailwatch::measure
