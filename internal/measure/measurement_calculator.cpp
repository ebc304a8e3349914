#include "internal/measure/measurement_calculator.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <regex>
#include <sstream>
#include <system_error>

#include "internal/observability/logging.hpp"

namespace trailwatch::measure {

namespace {

using observability::StringField;

// Lines longer than this are skipped by the structural scan; minified
// bundles would otherwise dominate the regex cost.
constexpr std::size_t kMaxStructureLine = 4096;

enum class StructureKind { kNone, kMarkdown, kPython, kCurlyBrace };

StructureKind KindFor(std::string_view extension) {
  if (extension == ".md" || extension == ".markdown") return StructureKind::kMarkdown;
  if (extension == ".py") return StructureKind::kPython;
  if (extension == ".js" || extension == ".jsx" || extension == ".ts" || extension == ".tsx" || extension == ".mjs" ||
      extension == ".cjs") {
    return StructureKind::kCurlyBrace;
  }
  return StructureKind::kNone;
}

std::string_view Trim(std::string_view line) {
  const auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
  while (!line.empty() && is_space(line.front())) line.remove_prefix(1);
  while (!line.empty() && is_space(line.back())) line.remove_suffix(1);
  return line;
}

template <typename Fn>
void ForEachLine(std::string_view content, Fn&& fn) {
  std::size_t start = 0;
  while (start <= content.size()) {
    const auto end  = content.find('\n', start);
    const auto line = content.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
    fn(line);
    if (end == std::string_view::npos) break;
    start = end + 1;
  }
}

int64_t CountMatches(const std::regex& re, std::string_view text) {
  using It = std::regex_iterator<std::string_view::const_iterator>;
  return static_cast<int64_t>(std::distance(It(text.begin(), text.end(), re), It()));
}

int64_t CountMarkdownSections(std::string_view content) {
  static const std::regex kHeading(R"(^#+\s+)");
  int64_t count = 0;
  ForEachLine(content, [&](std::string_view line) {
    const auto trimmed = Trim(line);
    if (trimmed.size() > kMaxStructureLine) return;
    if (std::regex_search(trimmed.begin(), trimmed.end(), kHeading)) ++count;
  });
  return count;
}

int64_t CountPythonStructures(std::string_view content) {
  static const std::regex kDeclaration(R"(^(class|def)\s+\w+)");
  int64_t count = 0;
  ForEachLine(content, [&](std::string_view line) {
    const auto trimmed = Trim(line);
    if (trimmed.size() > kMaxStructureLine) return;
    if (std::regex_search(trimmed.begin(), trimmed.end(), kDeclaration)) ++count;
  });
  return count;
}

int64_t CountCurlyBraceFunctions(std::string_view content) {
  static const std::array<std::regex, 5> kInlinePatterns = {
      std::regex(R"(function\s+\w+\s*\()"),          // function name(
      std::regex(R"(\w+\s*:\s*function\s*\()"),      // name: function(
      std::regex(R"(\w+\s*=\s*function\s*\()"),      // name = function(
      std::regex(R"(\w+\s*=\s*\([^)]*\)\s*=>)"),     // name = (...) =>
      std::regex(R"(\w+\s*:\s*\([^)]*\)\s*=>)"),     // name: (...) =>
  };
  static const std::regex kMethod(R"(^\s*\w+\s*\([^)]*\)\s*\{)"); // name(...) {

  int64_t count = 0;
  ForEachLine(content, [&](std::string_view line) {
    if (line.size() > kMaxStructureLine) return;
    for (const auto& pattern : kInlinePatterns) {
      count += CountMatches(pattern, line);
    }
    if (std::regex_search(line.begin(), line.end(), kMethod)) ++count;
  });
  return count;
}

std::string LowerExtension(const std::string& path) {
  auto extension = std::filesystem::path(path).extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return extension;
}

} // namespace

bool MeasurementCalculator::IsPrintable(unsigned char byte) {
  return byte == 9 || byte == 10 || byte == 13 || (byte >= 32 && byte <= 126) || byte >= 128;
}

bool MeasurementCalculator::IsBinarySample(std::string_view sample) {
  if (sample.empty()) return false;

  if (sample.find('\0') != std::string_view::npos) return true;

  std::size_t non_printable = 0;
  for (char c : sample) {
    if (!IsPrintable(static_cast<unsigned char>(c))) ++non_printable;
  }

  // integer form of non_printable / size > 0.30
  return non_printable * 100 > sample.size() * kBinaryPercent;
}

int64_t MeasurementCalculator::CountLines(std::string_view content) {
  return static_cast<int64_t>(std::count(content.begin(), content.end(), '\n')) + 1;
}

bool MeasurementCalculator::SupportsStructure(std::string_view extension) {
  return KindFor(extension) != StructureKind::kNone;
}

std::optional<int64_t> MeasurementCalculator::CountStructures(std::string_view extension, std::string_view content) {
  switch (KindFor(extension)) {
    case StructureKind::kMarkdown:
      return CountMarkdownSections(content);
    case StructureKind::kPython:
      return CountPythonStructures(content);
    case StructureKind::kCurlyBrace:
      return CountCurlyBraceFunctions(content);
    case StructureKind::kNone:
      break;
  }
  return std::nullopt;
}

Measurement MeasurementCalculator::Measure(const std::string& path, uint64_t inode) const {
  Measurement zeroed;
  zeroed.inode = inode;

  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    TRAILWATCH_LOG_WARN("measurement failed", {StringField("path", path), StringField("error", ec.message())});
    return zeroed;
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    TRAILWATCH_LOG_WARN("measurement failed", {StringField("path", path), StringField("error", "cannot open")});
    return zeroed;
  }

  // the binary check only needs the leading sample
  std::string content(kSampleSize, '\0');
  in.read(content.data(), static_cast<std::streamsize>(kSampleSize));
  if (in.bad()) {
    TRAILWATCH_LOG_WARN("measurement failed", {StringField("path", path), StringField("error", "read error")});
    return zeroed;
  }
  content.resize(static_cast<std::size_t>(in.gcount()));

  Measurement m;
  m.inode     = inode;
  m.file_size = static_cast<uint64_t>(size);

  if (IsBinarySample(content)) {
    m.binary = true;
    return m;
  }

  if (content.size() == kSampleSize) {
    std::ostringstream rest;
    rest << in.rdbuf();
    if (in.bad()) {
      TRAILWATCH_LOG_WARN("measurement failed", {StringField("path", path), StringField("error", "read error")});
      return zeroed;
    }
    content += rest.str();
  }

  const std::string_view view(content);
  m.line_count = CountLines(view);
  try {
    m.block_count = CountStructures(LowerExtension(path), view);
  } catch (const std::regex_error& e) {
    TRAILWATCH_LOG_WARN("structure count failed", {StringField("path", path), StringField("error", e.what())});
  }
  return m;
}

} // namespace trailwatch::measure
