#include "internal/measure/measurement_calculator.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "tests/support/test_support.hpp"

namespace {

using trailwatch::measure::MeasurementCalculator;
using trailwatch::testing::TempDir;
using trailwatch::testing::WriteFile;

// n bytes, of which `non_printable` are 0x01 and the rest 'a'
std::string Sample(std::size_t n, std::size_t non_printable) {
  std::string out(n, 'a');
  for (std::size_t i = 0; i < non_printable; ++i) out[i] = '\x01';
  return out;
}

void TestPrintableSet() {
  assert(MeasurementCalculator::IsPrintable(9));
  assert(MeasurementCalculator::IsPrintable(10));
  assert(MeasurementCalculator::IsPrintable(13));
  assert(MeasurementCalculator::IsPrintable(' '));
  assert(MeasurementCalculator::IsPrintable('~'));
  assert(MeasurementCalculator::IsPrintable(200));
  assert(!MeasurementCalculator::IsPrintable(0));
  assert(!MeasurementCalculator::IsPrintable(8));
  assert(!MeasurementCalculator::IsPrintable(11));
  assert(!MeasurementCalculator::IsPrintable(12));
  assert(!MeasurementCalculator::IsPrintable(27));
  assert(!MeasurementCalculator::IsPrintable(127));
}

void TestBinaryBoundary() {
  // exactly 30% non-printable is text, 31% is binary
  assert(!MeasurementCalculator::IsBinarySample(Sample(100, 30)));
  assert(MeasurementCalculator::IsBinarySample(Sample(100, 31)));
  assert(!MeasurementCalculator::IsBinarySample(""));
  assert(MeasurementCalculator::IsBinarySample(std::string("hello\0world", 11)));
}

void TestLineCounting() {
  assert(MeasurementCalculator::CountLines("") == 1);
  assert(MeasurementCalculator::CountLines("one") == 1);
  assert(MeasurementCalculator::CountLines("one\n") == 2);
  assert(MeasurementCalculator::CountLines("a\nb\nc") == 3);
}

void TestMarkdownSections() {
  const std::string doc = "# Title\n\nintro\n## Part\n  ### Indented\n#nospace\ntext # not a heading\n";
  auto count = MeasurementCalculator::CountStructures(".md", doc);
  assert(count && *count == 3);
  assert(*MeasurementCalculator::CountStructures(".markdown", doc) == 3);
}

void TestPythonStructures() {
  const std::string src =
      "import os\n"
      "class Foo:\n"
      "    def bar(self):\n"
      "        pass\n"
      "def baz():\n"
      "    return 1\n"
      "# def commented\n"
      "classy = 1\n";
  auto count = MeasurementCalculator::CountStructures(".py", src);
  assert(count && *count == 3);
}

void TestCurlyBraceFunctions() {
  const std::string src =
      "function alpha(a) {\n"
      "const beta = function(x) { return x; };\n"
      "const gamma = (a, b) => a + b;\n"
      "const obj = {\n"
      "  delta: function() {},\n"
      "  epsilon: (x) => x,\n"
      "};\n"
      "  zeta(arg) {\n";
  auto count = MeasurementCalculator::CountStructures(".ts", src);
  assert(count && *count == 6);
  assert(*MeasurementCalculator::CountStructures(".js", src) == 6);
  assert(*MeasurementCalculator::CountStructures(".mjs", "") == 0);
}

void TestUnsupportedExtensionHasNoBlocks() {
  assert(!MeasurementCalculator::CountStructures(".txt", "# heading\n"));
  assert(!MeasurementCalculator::CountStructures("", "def x():\n"));
  assert(!MeasurementCalculator::SupportsStructure(".cpp"));
  assert(MeasurementCalculator::SupportsStructure(".tsx"));
}

void TestMeasureTextFile() {
  TempDir dir("trailwatch_measure");
  const auto path = dir.File("notes.md");
  WriteFile(path, "# One\nbody\n## Two\n");

  MeasurementCalculator calculator;
  const auto m = calculator.Measure(path, 42);
  assert(m.inode == 42);
  assert(m.file_size == 18);
  assert(m.line_count == 4);
  assert(m.block_count && *m.block_count == 2);
  assert(!m.binary);
}

void TestMeasureUppercaseExtension() {
  TempDir dir("trailwatch_measure");
  const auto path = dir.File("Script.PY");
  WriteFile(path, "def run():\n    pass\n");

  MeasurementCalculator calculator;
  const auto m = calculator.Measure(path, 1);
  assert(m.block_count && *m.block_count == 1);
}

void TestMeasureBinaryFile() {
  TempDir dir("trailwatch_measure");
  const auto path = dir.File("blob.bin");
  WriteFile(path, std::string("\x7f" "ELF\0\0\0\x01\x02", 9));

  MeasurementCalculator calculator;
  const auto m = calculator.Measure(path, 7);
  assert(m.binary);
  assert(m.file_size == 9);
  assert(m.line_count == 0);
  assert(!m.block_count);
}

void TestBinaryVerdictComesFromLeadingSample() {
  TempDir dir("trailwatch_measure");
  const auto path = dir.File("image.raw");

  // binary header, then megabytes of text that must not be counted
  std::string tail;
  for (int i = 0; i < 200000; ++i) tail += "plain text line\n";
  const auto content = Sample(MeasurementCalculator::kSampleSize, MeasurementCalculator::kSampleSize) + tail;
  WriteFile(path, content);

  MeasurementCalculator calculator;
  const auto m = calculator.Measure(path, 5);
  assert(m.binary);
  assert(m.file_size == content.size());
  assert(m.line_count == 0);
  assert(!m.block_count);
}

void TestTextBeyondSampleIsFullyCounted() {
  TempDir dir("trailwatch_measure");
  const auto path = dir.File("long.md");

  std::string content;
  for (int i = 0; i < 1000; ++i) content += "## heading\nsome body text here\n";
  assert(content.size() > MeasurementCalculator::kSampleSize);
  WriteFile(path, content);

  MeasurementCalculator calculator;
  const auto m = calculator.Measure(path, 6);
  assert(!m.binary);
  assert(m.file_size == content.size());
  assert(m.line_count == 2001);
  assert(m.block_count && *m.block_count == 1000);
}

void TestMeasureEmptyFile() {
  TempDir dir("trailwatch_measure");
  const auto path = dir.File("empty.txt");
  WriteFile(path, "");

  MeasurementCalculator calculator;
  const auto m = calculator.Measure(path, 3);
  assert(!m.binary);
  assert(m.file_size == 0);
  assert(m.line_count == 1);
  assert(!m.block_count);
}

void TestMeasureMissingFileIsZeroed() {
  MeasurementCalculator calculator;
  const auto m = calculator.Measure("/nonexistent/trailwatch/file.md", 9);
  assert(m.inode == 9);
  assert(m.file_size == 0);
  assert(m.line_count == 0);
  assert(!m.block_count);
  assert(!m.binary);
}

} // namespace

int main() {
  TestPrintableSet();
  TestBinaryBoundary();
  TestLineCounting();
  TestMarkdownSections();
  TestPythonStructures();
  TestCurlyBraceFunctions();
  TestUnsupportedExtensionHasNoBlocks();
  TestMeasureTextFile();
  TestMeasureUppercaseExtension();
  TestMeasureBinaryFile();
  TestBinaryVerdictComesFromLeadingSample();
  TestTextBeyondSampleIsFullyCounted();
  TestMeasureEmptyFile();
  TestMeasureMissingFileIsZeroed();

  std::cout << "trailwatch_unit_measurement_calculator: pass\n";
  return 0;
}
