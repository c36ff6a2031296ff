#pragma once
#include <string>

// Creates the DB file (and parent directories) if needed, applies pragmas and
// the schema file. Safe to run on every start.
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);
