#include "asteria/version.hpp"

#include <sstream>

#include "asteria/hash.hpp"
#include "asteria/jsonlite.hpp"

namespace asteria {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  const auto info = hash_runtime_info();
  m.manifest_hash = info.manifest_primitive;
  m.chain_hash = info.chain_primitive;
  m.build_timestamp = __DATE__ " " __TIME__;
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  const auto info = hash_runtime_info();
  std::ostringstream o;
  o << "{"
    << "\"semver\":\"" << m.semver << "\""
    << ",\"artifact_format\":" << m.artifact_format
    << ",\"ledger_format\":" << m.ledger_format
    << ",\"report_format\":" << m.report_format
    << ",\"manifest_hash\":\"" << m.manifest_hash << "\""
    << ",\"manifest_hash_backend\":\"" << jsonlite::escape(info.manifest_backend) << "\""
    << ",\"chain_hash\":\"" << m.chain_hash << "\""
    << ",\"chain_hash_version\":\"" << info.chain_version << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace asteria
