#include "SchemaValidate.hpp"
#include "EngineConfig.hpp"
#include <sstream>
#include <nlohmann/json.hpp>
#include <nlohmann/json-schema.hpp>

namespace {

// Collects every violation instead of stopping at the first one.
class CollectingErrorHandler : public nlohmann::json_schema::basic_error_handler {
public:
  void error(const nlohmann::json::json_pointer& ptr, const nlohmann::json& instance,
             const std::string& message) override {
    nlohmann::json_schema::basic_error_handler::error(ptr, instance, message);
    std::string where = ptr.to_string();
    if (where.empty()) where = "/";
    ss_ << where << ": " << message << "\n";
    ++count_;
  }
  int count() const { return count_; }
  std::string text() const { return ss_.str(); }
private:
  std::ostringstream ss_;
  int count_ = 0;
};

int validateParsed(const nlohmann::json& doc, const std::string& schemaPath, std::string& outDiagnostics) {
  nlohmann::json schema;
  try {
    schema = nlohmann::json::parse(readFileWithSearchPaths(schemaPath));
  } catch (const std::exception& e) {
    outDiagnostics = std::string("Schema load failed: ") + e.what();
    return 1;
  }
  nlohmann::json_schema::json_validator validator;
  try {
    validator.set_root_schema(schema);
  } catch (const std::exception& e) {
    outDiagnostics = std::string("Invalid schema: ") + e.what();
    return 1;
  }
  CollectingErrorHandler handler;
  validator.validate(doc, handler);
  if (handler.count() > 0) {
    outDiagnostics = handler.text();
    return 2;
  }
  outDiagnostics.clear();
  return 0;
}

} // namespace

int validateJsonTextWithSchema(const std::string& jsonText,
                               const std::string& schemaPath,
                               std::string& outDiagnostics) {
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(jsonText);
  } catch (const nlohmann::json::parse_error& e) {
    outDiagnostics = std::string("JSON parse error: ") + e.what();
    return 1;
  }
  return validateParsed(doc, schemaPath, outDiagnostics);
}

int validateJsonWithSchema(const std::string& jsonPath,
                           const std::string& schemaPath,
                           std::string& outDiagnostics) {
  std::string text;
  try {
    text = readFileWithSearchPaths(jsonPath);
  } catch (const std::exception& e) {
    outDiagnostics = e.what();
    return 1;
  }
  return validateJsonTextWithSchema(text, schemaPath, outDiagnostics);
}
