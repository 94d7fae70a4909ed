#pragma once

#include <string>

// Returns 0 on success, 2 on validation errors, 1 on fatal errors (I/O, parser).
// Uses pboettch/json-schema-validator (draft-07) over nlohmann/json.
int validateJsonWithSchema(const std::string& jsonPath,
                           const std::string& schemaPath,
                           std::string& outDiagnostics);

// Same as above for an in-memory document.
int validateJsonTextWithSchema(const std::string& jsonText,
                               const std::string& schemaPath,
                               std::string& outDiagnostics);
