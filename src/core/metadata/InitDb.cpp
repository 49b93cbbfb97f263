// src/core/metadata/InitDb.cpp
#include "InitDb.hpp"
#include "core/db/Database.hpp"

#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace pkgstore {

static std::string readSchema(const std::string& schemaPath) {
    std::ifstream in(schemaPath);
    if (!in) throw std::runtime_error("Cannot open schema file: " + schemaPath);
    std::ostringstream buf; buf << in.rdbuf();
    return buf.str();
}

void initDatabase(Database& db, const std::string& schemaPath) {
    // WAL is refused for in-memory databases, sqlite keeps "memory" then
    db.exec("PRAGMA journal_mode=WAL;");
    db.exec("PRAGMA synchronous=NORMAL;");

    db.exec(readSchema(schemaPath));
    db.exec("PRAGMA user_version=1;");
    spdlog::debug("schema {} applied to {}", schemaPath, db.path());
}

bool initDatabase(const std::string& dbPath, const std::string& schemaPath) {
    const auto parent = std::filesystem::path(dbPath).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);

    Database db(dbPath);
    initDatabase(db, schemaPath);
    return true;
}

} // namespace pkgstore
