#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace trailwatch::db::sqlite {

namespace {

// first/last metric of a file, ordered by (timestamp, id)
std::string MetricAt(const char* column, const char* direction) {
  return std::string("(SELECT m2.") + column +
         " FROM measurements m2 JOIN events e2 ON e2.id = m2.event_id"
         " WHERE e2.file_id = e.file_id ORDER BY e2.timestamp " + direction + ", e2.id " + direction + " LIMIT 1)";
}

std::string AggregateTriggerSql() {
  return "CREATE TRIGGER IF NOT EXISTS trg_aggregates_on_measurement "
         "AFTER INSERT ON measurements FOR EACH ROW BEGIN "
         "DELETE FROM aggregates WHERE file_id = (SELECT file_id FROM events WHERE id = NEW.event_id); "
         "INSERT INTO aggregates ("
         "file_id, period_start, total_size, total_lines, total_blocks, "
         "total_events, total_finds, total_creates, total_modifies, total_deletes, total_moves, total_restores, "
         "first_event_timestamp, last_event_timestamp, "
         "first_size, max_size, last_size, first_lines, max_lines, last_lines, first_blocks, max_blocks, last_blocks, "
         "dominant_event_type, last_event_type_id, last_updated) "
         "SELECT e.file_id, (MIN(e.timestamp) / 86400000) * 86400000, "
         "COALESCE(SUM(m.file_size), 0), COALESCE(SUM(m.line_count), 0), COALESCE(SUM(m.block_count), 0), "
         "COUNT(e.id), "
         "SUM(e.event_type_id = 1), SUM(e.event_type_id = 2), SUM(e.event_type_id = 3), "
         "SUM(e.event_type_id = 4), SUM(e.event_type_id = 5), SUM(e.event_type_id = 6), "
         "MIN(e.timestamp), MAX(e.timestamp), " +
         MetricAt("file_size", "ASC") + ", COALESCE(MAX(m.file_size), 0), " + MetricAt("file_size", "DESC") + ", " +
         MetricAt("line_count", "ASC") + ", MAX(m.line_count), " + MetricAt("line_count", "DESC") + ", " +
         MetricAt("block_count", "ASC") + ", MAX(m.block_count), " + MetricAt("block_count", "DESC") + ", " +
         "(SELECT e3.event_type_id FROM events e3 WHERE e3.file_id = e.file_id "
         " GROUP BY e3.event_type_id ORDER BY COUNT(*) DESC, MAX(e3.id) DESC LIMIT 1), "
         "(SELECT e4.event_type_id FROM events e4 WHERE e4.file_id = e.file_id "
         " ORDER BY e4.timestamp DESC, e4.id DESC LIMIT 1), "
         "(SELECT timestamp FROM events WHERE id = NEW.event_id) "
         "FROM events e LEFT JOIN measurements m ON m.event_id = e.id "
         "WHERE e.file_id = (SELECT file_id FROM events WHERE id = NEW.event_id) "
         "GROUP BY e.file_id; "
         "END;";
}

} // namespace

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS event_types (id INTEGER PRIMARY KEY, code TEXT NOT NULL UNIQUE, name TEXT NOT NULL, description TEXT);",
      "CREATE TABLE IF NOT EXISTS files (id INTEGER PRIMARY KEY AUTOINCREMENT, inode INTEGER NOT NULL, is_active INTEGER NOT NULL DEFAULT 1);",
      "CREATE TABLE IF NOT EXISTS events (id INTEGER PRIMARY KEY AUTOINCREMENT, timestamp INTEGER NOT NULL, event_type_id INTEGER NOT NULL, file_id INTEGER NOT NULL, file_path TEXT NOT NULL, file_name TEXT NOT NULL, directory TEXT NOT NULL, FOREIGN KEY(event_type_id) REFERENCES event_types(id), FOREIGN KEY(file_id) REFERENCES files(id));",
      "CREATE TABLE IF NOT EXISTS measurements (event_id INTEGER PRIMARY KEY, inode INTEGER NOT NULL, file_size INTEGER NOT NULL DEFAULT 0, line_count INTEGER, block_count INTEGER, FOREIGN KEY(event_id) REFERENCES events(id));",
      "CREATE TABLE IF NOT EXISTS aggregates (id INTEGER PRIMARY KEY AUTOINCREMENT, file_id INTEGER NOT NULL UNIQUE, period_start INTEGER, "
      "total_size INTEGER DEFAULT 0, total_lines INTEGER DEFAULT 0, total_blocks INTEGER DEFAULT 0, "
      "total_events INTEGER DEFAULT 0, total_finds INTEGER DEFAULT 0, total_creates INTEGER DEFAULT 0, total_modifies INTEGER DEFAULT 0, "
      "total_deletes INTEGER DEFAULT 0, total_moves INTEGER DEFAULT 0, total_restores INTEGER DEFAULT 0, "
      "first_event_timestamp INTEGER, last_event_timestamp INTEGER, "
      "first_size INTEGER, max_size INTEGER, last_size INTEGER, first_lines INTEGER, max_lines INTEGER, last_lines INTEGER, "
      "first_blocks INTEGER, max_blocks INTEGER, last_blocks INTEGER, "
      "dominant_event_type INTEGER, last_event_type_id INTEGER, last_updated INTEGER, "
      "FOREIGN KEY(file_id) REFERENCES files(id), FOREIGN KEY(dominant_event_type) REFERENCES event_types(id), FOREIGN KEY(last_event_type_id) REFERENCES event_types(id));",

      "CREATE INDEX IF NOT EXISTS idx_events_timestamp ON events(timestamp);",
      "CREATE INDEX IF NOT EXISTS idx_events_file_path ON events(file_path);",
      "CREATE INDEX IF NOT EXISTS idx_events_file_id ON events(file_id);",
      "CREATE INDEX IF NOT EXISTS idx_events_file_timestamp ON events(file_id, timestamp);",
      "CREATE INDEX IF NOT EXISTS idx_files_inode ON files(inode);",
      "CREATE INDEX IF NOT EXISTS idx_measurements_inode ON measurements(inode);",

      // the log is append-only
      "CREATE TRIGGER IF NOT EXISTS trg_events_no_update BEFORE UPDATE ON events BEGIN SELECT RAISE(ABORT, 'events are append-only'); END;",
      "CREATE TRIGGER IF NOT EXISTS trg_events_no_delete BEFORE DELETE ON events BEGIN SELECT RAISE(ABORT, 'events are append-only'); END;",
      "CREATE TRIGGER IF NOT EXISTS trg_measurements_no_update BEFORE UPDATE ON measurements BEGIN SELECT RAISE(ABORT, 'measurements are append-only'); END;",
      "CREATE TRIGGER IF NOT EXISTS trg_measurements_no_delete BEFORE DELETE ON measurements BEGIN SELECT RAISE(ABORT, 'measurements are append-only'); END;",
      AggregateTriggerSql()};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT id,code,name,description FROM event_types LIMIT 1;");
  db.Exec("SELECT id,inode,is_active FROM files LIMIT 1;");
  db.Exec("SELECT id,timestamp,event_type_id,file_id,file_path,file_name,directory FROM events LIMIT 1;");
  db.Exec("SELECT event_id,inode,file_size,line_count,block_count FROM measurements LIMIT 1;");
  db.Exec("SELECT file_id,total_events,dominant_event_type,last_event_type_id,last_updated FROM aggregates LIMIT 1;");
}

} // namespace trailwatch::db::sqlite
