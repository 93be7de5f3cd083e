#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "etlq/adapters.h"

namespace etlq::adapters_internal {

/// Reads a whole file, throwing std::runtime_error when it cannot be opened.
std::string read_file(const std::string& path);
/// Writes text to a file, replacing its contents.
void write_file(const std::string& path, const std::string& text);

/// Extracts every <table> in document order as a relation.
/// MUST take headers from <th> cells when present, else the first row.
/// Inputs are HTML text; outputs are relations; throws when libxml2 is not built in.
std::vector<Relation> parse_html_tables(const std::string& html);

enum class BodyFormat { Json, Csv, Unknown };

/// Decides how to decode an HTTP body: content type first, then the URL suffix.
BodyFormat detect_body_format(const std::string& content_type, const std::string& url);

class CsvAdapter : public Extractor, public Loader {
 public:
  explicit CsvAdapter(char delimiter) : delimiter_(delimiter) {}
  Relation extract(const std::string& path) override;
  void load(const Relation& relation, const std::string& destination) override;

 private:
  char delimiter_;
};

class JsonAdapter : public Extractor, public Loader {
 public:
  Relation extract(const std::string& path) override;
  void load(const Relation& relation, const std::string& destination) override;
};

class ParquetAdapter : public Extractor, public Loader {
 public:
  Relation extract(const std::string& path) override;
  void load(const Relation& relation, const std::string& destination) override;
};

/// Reads `file.html` (first table) or `file.html#N` (Nth table, 1-based).
class HtmlTableExtractor : public Extractor {
 public:
  Relation extract(const std::string& path) override;
};

/// Fetches `scheme:path` and decodes the body as JSON or CSV.
class HttpExtractor : public Extractor {
 public:
  HttpExtractor(std::string scheme, int timeout_ms, char delimiter)
      : scheme_(std::move(scheme)), timeout_ms_(timeout_ms), delimiter_(delimiter) {}
  Relation extract(const std::string& path) override;

 private:
  std::string scheme_;
  int timeout_ms_;
  char delimiter_;
};

/// Hands the parsed 7-field descriptor to the host's collector.
class RemoteExtractor : public Extractor {
 public:
  explicit RemoteExtractor(std::shared_ptr<RemoteCollector> collector) : collector_(std::move(collector)) {}
  Relation extract(const std::string& path) override;

 private:
  std::shared_ptr<RemoteCollector> collector_;
};

}  // namespace etlq::adapters_internal
