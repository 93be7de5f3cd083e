#include "etlq/adapters.h"

#include "../util/string_util.h"
#include "adapters_internal.h"
#include "etlq/errors.h"

namespace etlq {

namespace {

template <typename Map>
std::vector<std::string> keys_of(const Map& map) {
  std::vector<std::string> out;
  out.reserve(map.size());
  for (const auto& entry : map) out.push_back(entry.first);
  return out;
}

std::string list_types(const std::vector<std::string>& types) {
  std::string out = "[";
  for (size_t i = 0; i < types.size(); ++i) {
    if (i > 0) out += ", ";
    out += "'" + types[i] + "'";
  }
  return out + "]";
}

}  // namespace

void AdapterRegistry::register_extractor(const std::string& type, std::shared_ptr<Extractor> extractor) {
  extractors_[util::to_lower(type)] = std::move(extractor);
}

void AdapterRegistry::register_loader(const std::string& type, std::shared_ptr<Loader> loader) {
  loaders_[util::to_lower(type)] = std::move(loader);
}

bool AdapterRegistry::has_extractor(const std::string& type) const {
  return extractors_.count(util::to_lower(type)) > 0;
}

bool AdapterRegistry::has_loader(const std::string& type) const {
  return loaders_.count(util::to_lower(type)) > 0;
}

namespace {

/// Builds the UnknownSourceType message; bare table names get a hint since only hosts register `table`.
std::string unknown_type_message(const char* role, const std::string& type, const std::string& available) {
  std::string message = "Unknown " + std::string(role) + " type '" + type + "'. Available: " + available;
  if (util::to_lower(type) == "table") {
    message += ". Bare table names need a registered table adapter; write {type:path} instead, e.g. {csv:sales.csv}";
  }
  return message;
}

}  // namespace

Extractor& AdapterRegistry::extractor(const std::string& type) const {
  auto it = extractors_.find(util::to_lower(type));
  if (it == extractors_.end()) {
    throw QueryError(ErrorKind::UnknownSourceType,
                     unknown_type_message("source", type, list_types(extractor_types())));
  }
  return *it->second;
}

Loader& AdapterRegistry::loader(const std::string& type) const {
  auto it = loaders_.find(util::to_lower(type));
  if (it == loaders_.end()) {
    throw QueryError(ErrorKind::UnknownSourceType,
                     unknown_type_message("destination", type, list_types(loader_types())));
  }
  return *it->second;
}

std::vector<std::string> AdapterRegistry::extractor_types() const {
  return keys_of(extractors_);
}

std::vector<std::string> AdapterRegistry::loader_types() const {
  return keys_of(loaders_);
}

/// Builds the registry the CLI runs with.
/// MUST register every built-in type even when its library is absent so the
/// failure names the missing feature instead of reporting an unknown type.
AdapterRegistry make_default_registry(const AdapterOptions& options) {
  using namespace adapters_internal;
  AdapterRegistry registry;

  auto csv = std::make_shared<CsvAdapter>(options.csv_delimiter);
  registry.register_extractor("csv", csv);
  registry.register_loader("csv", csv);

  auto json = std::make_shared<JsonAdapter>();
  registry.register_extractor("json", json);
  registry.register_loader("json", json);

  auto parquet = std::make_shared<ParquetAdapter>();
  registry.register_extractor("parquet", parquet);
  registry.register_loader("parquet", parquet);

  registry.register_extractor("html", std::make_shared<HtmlTableExtractor>());
  registry.register_extractor("http",
                              std::make_shared<HttpExtractor>("http", options.http_timeout_ms, options.csv_delimiter));
  registry.register_extractor("https",
                              std::make_shared<HttpExtractor>("https", options.http_timeout_ms, options.csv_delimiter));

  if (options.remote_collector) {
    registry.register_extractor("gee", std::make_shared<RemoteExtractor>(options.remote_collector));
  }
  return registry;
}

}  // namespace etlq
