#include "internal/watch/exclusion_filter.hpp"

#include <cassert>
#include <iostream>

#include "internal/util/errors.hpp"

namespace {

using trailwatch::watch::ExclusionFilter;

void TestGlobTranslation() {
  assert(ExclusionFilter::GlobToRegex("**/node_modules/**") == "(.*/)?node_modules/.*");
  assert(ExclusionFilter::GlobToRegex("*.log") == "[^/]*\\.log");
  assert(ExclusionFilter::GlobToRegex("file?.txt") == "file[^/]\\.txt");
}

void TestDirectoryPatterns() {
  ExclusionFilter filter({"**/node_modules/**", "**/.git/**"});

  assert(filter.IsExcluded("/home/u/proj/node_modules/pkg/index.js"));
  assert(filter.IsExcluded("/home/u/proj/node_modules", true));
  assert(!filter.IsExcluded("/home/u/proj/node_modules"));
  assert(filter.IsExcluded("/home/u/proj/.git/HEAD"));
  assert(!filter.IsExcluded("/home/u/proj/src/node_modules_notes.md"));
}

void TestFilePatterns() {
  ExclusionFilter filter({"**/*.log", "**/.*"});

  assert(filter.IsExcluded("/var/app/server.log"));
  assert(filter.IsExcluded("/var/app/logs/deep/trace.log"));
  assert(!filter.IsExcluded("/var/app/server.log.txt"));
  assert(filter.IsExcluded("/var/app/.env"));
  assert(filter.IsExcluded("/var/app/.cache", true));
  assert(!filter.IsExcluded("/var/app/visible.txt"));
}

void TestSingleStarStaysInOneSegment() {
  ExclusionFilter filter({"/data/*/tmp"});

  assert(filter.IsExcluded("/data/a/tmp"));
  assert(!filter.IsExcluded("/data/a/b/tmp"));
}

void TestEmptyFilterExcludesNothing() {
  ExclusionFilter filter;
  assert(filter.Size() == 0);
  assert(!filter.IsExcluded("/anything"));
}

void TestRegexMetacharactersAreLiteral() {
  ExclusionFilter filter({"**/build+(1)/**"});
  assert(filter.IsExcluded("/p/build+(1)/out.o"));
  assert(!filter.IsExcluded("/p/buildd1/out.o"));
}

} // namespace

int main() {
  TestGlobTranslation();
  TestDirectoryPatterns();
  TestFilePatterns();
  TestSingleStarStaysInOneSegment();
  TestEmptyFilterExcludesNothing();
  TestRegexMetacharactersAreLiteral();

  std::cout << "trailwatch_unit_exclusion_filter: pass\n";
  return 0;
}
