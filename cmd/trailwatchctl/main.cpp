#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/factory.hpp"
#include "internal/model/event_type.hpp"
#include "internal/observability/logging.hpp"

using trailwatch::db::model::EventQuery;
using trailwatch::db::model::EventRow;
using trailwatch::model::EventType;

static void Usage() {
  std::cout << "Usage:\n"
            << "  trailwatchctl <config.yaml|-> events [--types=create,modify,...] [--keyword=<words>] [--unique]\n"
            << "                                       [--limit=N] [--offset=N]\n"
            << "  trailwatchctl <config.yaml|-> file <path>\n"
            << "  trailwatchctl <config.yaml|-> stats\n"
            << "  trailwatchctl <config.yaml|-> types\n";
}

static std::vector<std::string> Split(const std::string& value, char separator) {
  std::vector<std::string> parts;
  std::string              current;
  for (char c : value) {
    const bool boundary = separator == ' ' ? std::isspace(static_cast<unsigned char>(c)) != 0 : c == separator;
    if (boundary) {
      if (!current.empty()) parts.push_back(current);
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  if (!current.empty()) parts.push_back(current);
  return parts;
}

static std::optional<std::string> FlagValue(const std::string& arg, const std::string& name) {
  const auto prefix = "--" + name + "=";
  if (arg.rfind(prefix, 0) != 0) return std::nullopt;
  return arg.substr(prefix.size());
}

static std::string FormatTimestamp(uint64_t timestamp_ms) {
  const std::time_t seconds = static_cast<std::time_t>(timestamp_ms / 1000);
  std::tm           local{};
  localtime_r(&seconds, &local);

  std::ostringstream out;
  out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << (timestamp_ms % 1000);
  return out.str();
}

static std::string FormatOptional(const std::optional<int64_t>& value) {
  return value ? std::to_string(*value) : "-";
}

static void PrintEvents(const std::vector<EventRow>& rows) {
  std::cout << std::left << std::setw(24) << "TIME" << std::setw(9) << "EVENT" << std::setw(10) << "SIZE" << std::setw(8) << "LINES"
            << std::setw(8) << "BLOCKS" << "PATH\n";
  for (const auto& row : rows) {
    std::cout << std::left << std::setw(24) << FormatTimestamp(row.timestamp_ms) << std::setw(9) << row.type_name << std::setw(10)
              << row.file_size << std::setw(8) << FormatOptional(row.line_count) << std::setw(8) << FormatOptional(row.block_count)
              << row.file_path << "\n";
  }
}

static int RunEvents(trailwatch::db::Repository& repository, int argc, char** argv) {
  EventQuery query;

  for (int i = 3; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--unique") {
      query.unique = true;
    } else if (auto types = FlagValue(arg, "types")) {
      for (const auto& code : Split(*types, ',')) {
        auto type = trailwatch::model::FromCode(code);
        if (!type) {
          std::cerr << "unknown event type: " << code << "\n";
          return 1;
        }
        query.types.push_back(*type);
      }
    } else if (auto keyword = FlagValue(arg, "keyword")) {
      query.keywords = Split(*keyword, ' ');
    } else if (auto limit = FlagValue(arg, "limit")) {
      query.limit = static_cast<uint32_t>(std::stoul(*limit));
    } else if (auto offset = FlagValue(arg, "offset")) {
      query.offset = static_cast<uint32_t>(std::stoul(*offset));
    } else {
      std::cerr << "unknown option: " << arg << "\n";
      return 1;
    }
  }

  auto tx   = repository.BeginRead();
  auto rows = repository.QueryEvents(*tx, query);
  tx->Commit();

  PrintEvents(rows);
  return 0;
}

static int RunFile(trailwatch::db::Repository& repository, const std::string& path) {
  auto tx     = repository.BeginRead();
  auto latest = repository.LatestEventForPath(*tx, path);
  if (!latest) {
    std::cerr << "no events for " << path << "\n";
    return 2;
  }
  auto aggregate = repository.GetAggregate(*tx, latest->file_id);
  tx->Commit();

  if (!aggregate) {
    std::cerr << "no aggregate for " << path << "\n";
    return 2;
  }

  const auto type_code = [](int id) -> std::string {
    auto type = trailwatch::model::FromId(id);
    return type ? std::string(trailwatch::model::ToCode(*type)) : "-";
  };

  std::cout << "path=" << path << "\n"
            << "file_id=" << aggregate->file_id << "\n"
            << "events=" << aggregate->total_events << " find=" << aggregate->total_finds << " create=" << aggregate->total_creates
            << " modify=" << aggregate->total_modifies << " delete=" << aggregate->total_deletes << " move=" << aggregate->total_moves
            << " restore=" << aggregate->total_restores << "\n"
            << "first_event=" << FormatTimestamp(aggregate->first_event_timestamp) << "\n"
            << "last_event=" << FormatTimestamp(aggregate->last_event_timestamp) << "\n"
            << "size first=" << aggregate->first_size << " max=" << aggregate->max_size << " last=" << aggregate->last_size << "\n"
            << "lines first=" << FormatOptional(aggregate->first_lines) << " max=" << FormatOptional(aggregate->max_lines)
            << " last=" << FormatOptional(aggregate->last_lines) << "\n"
            << "blocks first=" << FormatOptional(aggregate->first_blocks) << " max=" << FormatOptional(aggregate->max_blocks)
            << " last=" << FormatOptional(aggregate->last_blocks) << "\n"
            << "dominant=" << type_code(aggregate->dominant_event_type) << " last=" << type_code(aggregate->last_event_type_id) << "\n";
  return 0;
}

static int RunStats(trailwatch::db::Repository& repository) {
  auto tx    = repository.BeginRead();
  auto stats = repository.GetGlobalStatistics(*tx);
  tx->Commit();

  std::cout << "events=" << stats.total_events << "\n"
            << "find=" << stats.total_finds << "\n"
            << "create=" << stats.total_creates << "\n"
            << "modify=" << stats.total_modifies << "\n"
            << "delete=" << stats.total_deletes << "\n"
            << "move=" << stats.total_moves << "\n"
            << "restore=" << stats.total_restores << "\n"
            << "files=" << stats.total_files << "\n"
            << "active_files=" << stats.active_files << "\n";
  return 0;
}

static int RunTypes(trailwatch::db::Repository& repository) {
  auto tx    = repository.BeginRead();
  auto types = repository.ListEventTypes(*tx);
  tx->Commit();

  for (const auto& type : types) {
    std::cout << type.id << "\t" << type.code << "\t" << type.name << "\t" << type.description << "\n";
  }
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string cmd         = argv[2];

  try {
    auto config = config_path == "-" ? trailwatch::config::ConfigLoader::Defaults()
                                     : trailwatch::config::ConfigLoader::LoadFromYaml(config_path);

    // query output goes to stdout; keep the log quiet and off the daemon's file
    config.mutable_logging()->set_level("warn");
    config.mutable_logging()->clear_file();
    trailwatch::observability::InitializeLogging(config);

    auto repository = trailwatch::factory::BuildRepository(config, /*read_only=*/true);

    int rc = 1;
    if (cmd == "events") {
      rc = RunEvents(*repository, argc, argv);
    } else if (cmd == "file" && argc == 4) {
      rc = RunFile(*repository, argv[3]);
    } else if (cmd == "stats") {
      rc = RunStats(*repository);
    } else if (cmd == "types") {
      rc = RunTypes(*repository);
    } else {
      Usage();
    }

    trailwatch::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    trailwatch::observability::ShutdownLogging();
    return 2;
  }
}
