#pragma once

#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "etlq/datasource.h"
#include "etlq/relation.h"

namespace etlq {

/// Produces a relation from a source path.
/// MUST throw on failure; the engine wraps the error with the source identifier.
class Extractor {
 public:
  virtual ~Extractor() = default;
  virtual Relation extract(const std::string& path) = 0;
};

/// Writes a relation to a destination.
/// MUST throw on failure; the engine wraps the error with the destination identifier.
class Loader {
 public:
  virtual ~Loader() = default;
  virtual void load(const Relation& relation, const std::string& destination) = 0;
};

/// Host-provided collector for the remote earth-observation source.
class RemoteCollector {
 public:
  virtual ~RemoteCollector() = default;
  virtual Relation collect(const RemoteDescriptor& descriptor) = 0;
};

/// Maps source-type tags to adapters.
/// Type names are matched case-insensitively. The registry MUST be read-only while queries run.
class AdapterRegistry {
 public:
  void register_extractor(const std::string& type, std::shared_ptr<Extractor> extractor);
  void register_loader(const std::string& type, std::shared_ptr<Loader> loader);

  bool has_extractor(const std::string& type) const;
  bool has_loader(const std::string& type) const;

  /// Returns the extractor for type or throws UnknownSourceType.
  Extractor& extractor(const std::string& type) const;
  /// Returns the loader for type or throws UnknownSourceType.
  Loader& loader(const std::string& type) const;

  std::vector<std::string> extractor_types() const;
  std::vector<std::string> loader_types() const;

 private:
  std::map<std::string, std::shared_ptr<Extractor>> extractors_;
  std::map<std::string, std::shared_ptr<Loader>> loaders_;
};

/// Settings shared by the built-in adapters.
struct AdapterOptions {
  char csv_delimiter = ',';
  int http_timeout_ms = 5000;
  std::shared_ptr<RemoteCollector> remote_collector;
};

/// Registers csv, json, parquet, html, http/https, and (with a collector) gee.
/// Adapters whose library was not built in stay registered and fail with a
/// message naming the missing feature.
AdapterRegistry make_default_registry(const AdapterOptions& options = AdapterOptions{});

/// Infers a cell value from text: empty -> NULL, integer, float, true/false, else string.
Value infer_value(const std::string& text);

/// Parses delimited text with a mandatory header row.
/// MUST keep every row at header width and MUST throw std::runtime_error on ragged rows.
Relation read_csv(std::istream& in, char delimiter = ',');
/// Writes a header row and one line per row; NULL becomes an empty field.
void write_csv(std::ostream& out, const Relation& relation, char delimiter = ',');

/// Parses a JSON array of objects into a relation (columns in first-seen key order).
Relation relation_from_json(const std::string& text);
/// Serializes a relation as a JSON array of objects.
std::string relation_to_json(const Relation& relation, int indent = 2);

}  // namespace etlq
