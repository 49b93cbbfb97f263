#pragma once
#include <string>

namespace pkgstore {

class Database;

// Connection pragmas plus the DDL in schemaPath. Idempotent.
void initDatabase(Database& db, const std::string& schemaPath);

// Opens (creating parent directories) and initialises the database at dbPath.
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);

} // namespace pkgstore
