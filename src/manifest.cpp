#include "asteria/manifest.hpp"

#include "asteria/hash.hpp"

#include <cmath>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

namespace asteria {

namespace {

bool read_file(const std::string& path, std::string* out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  *out = std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return !ifs.bad();
}

bool parse_object(const std::string& text, const std::string& what, jsonlite::Object* out,
                  Error* error) {
  std::optional<jsonlite::JsonError> jerr;
  *out = jsonlite::parse(text, &jerr);
  if (jerr) {
    if (error) *error = make_error(ErrorCode::parse_error, what + ": " + jerr->code + ": " + jerr->message);
    return false;
  }
  return true;
}

Error schema(const std::string& what, const std::string& field, const std::string& problem) {
  return make_error(ErrorCode::schema_error, what + ": field '" + field + "' " + problem);
}

// Required finite number. prefix names the enclosing object in messages.
bool require_number(const jsonlite::Object& obj, const std::string& what, const std::string& field,
                    double* out, Error* error, const std::string& prefix = "") {
  const jsonlite::Value* v = jsonlite::find(obj, field);
  if (!v) {
    if (error) *error = schema(what, prefix + field, "is missing");
    return false;
  }
  if (!jsonlite::is_number(*v)) {
    if (error) *error = schema(what, prefix + field, "must be a number");
    return false;
  }
  *out = jsonlite::as_double(*v);
  if (!std::isfinite(*out)) {
    if (error) *error = schema(what, prefix + field, "must be finite");
    return false;
  }
  return true;
}

bool require_string(const jsonlite::Object& obj, const std::string& what, const std::string& field,
                    std::string* out, Error* error) {
  const jsonlite::Value* v = jsonlite::find(obj, field);
  if (!v) {
    if (error) *error = schema(what, field, "is missing");
    return false;
  }
  if (!std::holds_alternative<std::string>(v->v)) {
    if (error) *error = schema(what, field, "must be a string");
    return false;
  }
  *out = std::get<std::string>(v->v);
  return true;
}

// Absent is fine; present-but-mistyped is not.
bool optional_string(const jsonlite::Object& obj, const std::string& what, const std::string& field,
                     std::string* out, Error* error) {
  const jsonlite::Value* v = jsonlite::find(obj, field);
  if (!v) return true;
  if (!std::holds_alternative<std::string>(v->v)) {
    if (error) *error = schema(what, field, "must be a string");
    return false;
  }
  *out = std::get<std::string>(v->v);
  return true;
}

}  // namespace

std::optional<ReproManifest> parse_repro_manifest(const std::string& text, Error* error) {
  static const std::string what = "run manifest";
  jsonlite::Object obj;
  if (!parse_object(text, what, &obj, error)) return std::nullopt;

  ReproManifest m;
  if (!require_string(obj, what, "weld_id", &m.weld_id, error)) return std::nullopt;
  if (m.weld_id.empty()) {
    if (error) *error = schema(what, "weld_id", "must not be empty");
    return std::nullopt;
  }
  if (!require_number(obj, what, "tol", &m.tol, error)) return std::nullopt;
  if (!require_number(obj, what, "residual", &m.residual, error)) return std::nullopt;
  if (m.tol < 0.0) {
    if (error) *error = schema(what, "tol", "must be non-negative");
    return std::nullopt;
  }
  if (m.residual < 0.0) {
    if (error) *error = schema(what, "residual", "must be non-negative");
    return std::nullopt;
  }

  const jsonlite::Value* seed = jsonlite::find(obj, "seed");
  if (!seed) {
    if (error) *error = schema(what, "seed", "is missing");
    return std::nullopt;
  }
  const auto seed_value = jsonlite::as_int64(*seed);
  if (!seed_value) {
    if (error) *error = schema(what, "seed", "must be an integer");
    return std::nullopt;
  }
  m.seed = *seed_value;

  if (!optional_string(obj, what, "manifest_sha256", &m.manifest_sha256, error)) return std::nullopt;
  if (!m.manifest_sha256.empty() && !is_hex_digest(m.manifest_sha256)) {
    if (error) *error = schema(what, "manifest_sha256", "must be 64 lowercase hex characters");
    return std::nullopt;
  }
  return m;
}

std::optional<StudyConstants> parse_study_constants(const std::string& text, Error* error) {
  static const std::string what = "study constants";
  jsonlite::Object obj;
  if (!parse_object(text, what, &obj, error)) return std::nullopt;

  StudyConstants c;
  const jsonlite::Value* gates = jsonlite::find(obj, "omega_gates");
  if (!gates) {
    if (error) *error = schema(what, "omega_gates", "is missing");
    return std::nullopt;
  }
  if (!std::holds_alternative<jsonlite::Object>(gates->v)) {
    if (error) *error = schema(what, "omega_gates", "must be an object");
    return std::nullopt;
  }
  const auto& gates_obj = std::get<jsonlite::Object>(gates->v);
  if (!require_number(gates_obj, what, "stable", &c.omega_gates.stable, error, "omega_gates.")) {
    return std::nullopt;
  }
  if (!require_number(gates_obj, what, "collapse", &c.omega_gates.collapse, error, "omega_gates.")) {
    return std::nullopt;
  }
  if (!(c.omega_gates.stable < c.omega_gates.collapse)) {
    if (error) *error = schema(what, "omega_gates", "requires stable < collapse");
    return std::nullopt;
  }

  if (!require_number(obj, what, "C_ref", &c.c_ref, error)) return std::nullopt;
  if (!require_number(obj, what, "Ilow", &c.i_low, error)) return std::nullopt;
  if (!optional_string(obj, what, "notes", &c.notes, error)) return std::nullopt;
  return c;
}

std::optional<ReproManifest> load_repro_manifest(const std::string& path, Error* error) {
  std::string text;
  if (!read_file(path, &text)) {
    if (error) *error = make_error(ErrorCode::parse_error, "cannot read run manifest: " + path);
    return std::nullopt;
  }
  return parse_repro_manifest(text, error);
}

std::optional<StudyConstants> load_study_constants(const std::string& path, Error* error) {
  std::string text;
  if (!read_file(path, &text)) {
    if (error) *error = make_error(ErrorCode::parse_error, "cannot read study constants: " + path);
    return std::nullopt;
  }
  return parse_study_constants(text, error);
}

std::string manifest_to_json(const ReproManifest& m) {
  std::ostringstream o;
  o << "{\"weld_id\":\"" << jsonlite::escape(m.weld_id) << "\""
    << ",\"tol\":" << jsonlite::format_double(m.tol)
    << ",\"residual\":" << jsonlite::format_double(m.residual)
    << ",\"seed\":" << m.seed
    << ",\"manifest_sha256\":\"" << m.manifest_sha256 << "\""
    << "}";
  return o.str();
}

std::string constants_to_json(const StudyConstants& c) {
  std::ostringstream o;
  o << "{\"omega_gates\":{\"stable\":" << jsonlite::format_double(c.omega_gates.stable)
    << ",\"collapse\":" << jsonlite::format_double(c.omega_gates.collapse) << "}"
    << ",\"C_ref\":" << jsonlite::format_double(c.c_ref)
    << ",\"Ilow\":" << jsonlite::format_double(c.i_low)
    << ",\"notes\":\"" << jsonlite::escape(c.notes) << "\""
    << "}";
  return o.str();
}

bool ManifestStore::load(const std::string& manifest_path, const std::string& constants_path,
                         Error* error) {
  auto manifest = load_repro_manifest(manifest_path, error);
  if (!manifest) return false;
  auto constants = load_study_constants(constants_path, error);
  if (!constants) return false;
  manifest_ = std::move(manifest);
  constants_ = std::move(constants);
  manifest_path_ = manifest_path;
  return true;
}

}  // namespace asteria
