#pragma once

// asteria/manifest.hpp — Loading and type validation of governance documents.
//
// Two documents:
//   run manifest     {weld_id, tol, residual, seed, manifest_sha256}
//   study constants  {omega_gates:{stable, collapse}, C_ref, Ilow, notes}
//
// ERRORS:
//   parse_error   unreadable file, malformed JSON, duplicate key, trailing data,
//                 top level not an object.
//   schema_error  missing or mistyped required field, or a value invariant
//                 violated (tol < 0, residual < 0, stable >= collapse).

#include <optional>
#include <string>

#include "asteria/jsonlite.hpp"
#include "asteria/types.hpp"

namespace asteria {

std::optional<ReproManifest> parse_repro_manifest(const std::string& text, Error* error);
std::optional<StudyConstants> parse_study_constants(const std::string& text, Error* error);

std::optional<ReproManifest> load_repro_manifest(const std::string& path, Error* error);
std::optional<StudyConstants> load_study_constants(const std::string& path, Error* error);

std::string manifest_to_json(const ReproManifest& m);
std::string constants_to_json(const StudyConstants& c);

// Owns both parsed documents for the process lifetime. Read-only after load().
class ManifestStore {
 public:
  ManifestStore() = default;

  // Loads both documents. On failure the store is left unchanged.
  bool load(const std::string& manifest_path, const std::string& constants_path, Error* error);

  bool loaded() const { return manifest_.has_value() && constants_.has_value(); }

  // Precondition: loaded().
  const ReproManifest& manifest() const { return *manifest_; }
  const StudyConstants& constants() const { return *constants_; }
  const std::string& manifest_path() const { return manifest_path_; }

 private:
  std::optional<ReproManifest> manifest_;
  std::optional<StudyConstants> constants_;
  std::string manifest_path_;
};

}  // namespace asteria
