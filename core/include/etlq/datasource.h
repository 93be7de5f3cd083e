#pragma once

#include <optional>
#include <string>

namespace etlq {

/// Typed form of the 7-field earth-observation descriptor
/// `project|dataset|start_date|end_date|longitude|latitude|scale`.
/// MUST be validated before construction (ISO dates, start <= end, scale > 0).
struct RemoteDescriptor {
  std::string project;
  std::string dataset;
  std::string start_date;
  std::string end_date;
  double longitude = 0.0;
  double latitude = 0.0;
  double scale = 0.0;
};

/// Where a relation is extracted from or loaded to: `{type:path}`.
/// The core passes path through to adapters unchanged.
struct Datasource {
  std::string type;
  std::string path;
  std::optional<RemoteDescriptor> remote;
};

/// Renders a datasource as `type:path` for diagnostics.
inline std::string datasource_label(const Datasource& source) {
  return source.type + ":" + source.path;
}

/// Parses the pipe-delimited remote descriptor.
/// MUST return nullopt and fill error when any field is malformed.
/// Inputs are raw descriptor text; outputs are descriptor or error text.
std::optional<RemoteDescriptor> parse_remote_descriptor(const std::string& text, std::string& error);

}  // namespace etlq
