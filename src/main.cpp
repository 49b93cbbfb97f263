// src/main.cpp
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "core/Config.hpp"
#include "core/Logging.hpp"
#include "core/metadata/InitDb.hpp"
#include "core/storage/DbPackageStorage.hpp"
#include "core/storage/StorageFactory.hpp"
#include "services/api/HttpServer.hpp"

using namespace pkgstore;

// ---------- helpers ----------

static PackageKey parseKey(const std::string& usageText, const std::string& archText) {
  auto usage = parseUsage(usageText);
  if (!usage) throw std::runtime_error("unknown package usage: " + usageText);
  auto arch = parseArch(archText);
  if (!arch) throw std::runtime_error("unknown architecture: " + archText);
  return PackageKey{*usage, *arch};
}

static std::string readAll(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open " + path);
  std::ostringstream buf; buf << in.rdbuf();
  return buf.str();
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init                                   # create/upgrade SQLite schema\n"
            << "  " << argv0 << " --serve                                  # start HTTP server (PKGSTORE_PORT or 8080)\n"
            << "  " << argv0 << " --upload <usage> <arch> <version> <file> [mimetype]\n"
            << "  " << argv0 << " --download <usage> <arch> <out-file>\n"
            << "  " << argv0 << " --info <usage> <arch>\n"
            << "  " << argv0 << " --delete <usage> <arch>\n"
            << "  " << argv0 << " --list\n"
            << "  " << argv0 << " --purge                                  # drop orphaned packages (db storage)\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      print_usage(argv[0]);
      return 1;
    }
    const std::string cmd = argv[1];
    const Config cfg = loadConfig();
    initLogging(cfg.logLevel);

    if (cmd == "--init") {
      initDatabase(cfg.dbPath, findSchemaPath(cfg));
      std::cout << "DB initialized at: " << cfg.dbPath << "\n";
      return 0;
    }

    if (cmd == "--serve") {
      auto storage = makeStorage(cfg);
      run_http_server(*storage, cfg.port, cfg.apiKey);
      storage->shutdown();
      return 0;
    }

    if (cmd == "--upload" && (argc == 6 || argc == 7)) {
      auto storage = makeStorage(cfg);
      const PackageKey key = parseKey(argv[2], argv[3]);
      const std::string mimetype = argc == 7 ? argv[6] : kApkMimetype;
      const std::string data = readAll(argv[5]);
      const bool ok = storage->saveFile(key, argv[4], mimetype, data);
      storage->shutdown();
      if (!ok) {
        std::cerr << "upload failed, see log\n";
        return 1;
      }
      std::cout << "stored " << to_string(key) << " version " << argv[4] << " (" << data.size() << " bytes)\n";
      return 0;
    }

    if (cmd == "--download" && argc == 5) {
      auto storage = makeStorage(cfg);
      auto data = storage->readFile(parseKey(argv[2], argv[3]));
      if (!data) {
        std::cerr << "no package stored\n";
        return 1;
      }
      std::ofstream os(argv[4], std::ios::binary | std::ios::trunc);
      os.write(data->data(), static_cast<std::streamsize>(data->size()));
      if (!os) throw std::runtime_error(std::string("cannot write ") + argv[4]);
      return 0;
    }

    if (cmd == "--info" && argc == 4) {
      auto storage = makeStorage(cfg);
      auto info = storage->getCurrentPackageInfo(parseKey(argv[2], argv[3]));
      if (!info) {
        std::cerr << "no package stored\n";
        return 1;
      }
      std::cout << toJson(*info).dump(2) << "\n";
      return 0;
    }

    if (cmd == "--delete" && argc == 4) {
      auto storage = makeStorage(cfg);
      const bool ok = storage->deleteFile(parseKey(argv[2], argv[3]));
      storage->shutdown();
      return ok ? 0 : 1;
    }

    if (cmd == "--list") {
      auto storage = makeStorage(cfg);
      nlohmann::json out = nlohmann::json::array();
      for (const auto& info : storage->listPackages()) out.push_back(toJson(info));
      std::cout << out.dump(2) << "\n";
      return 0;
    }

    if (cmd == "--purge") {
      auto storage = makeStorage(cfg);
      auto* db = dynamic_cast<DbPackageStorage*>(storage.get());
      if (!db) {
        std::cerr << "--purge needs the db storage\n";
        return 1;
      }
      std::cout << "purged " << db->purgeOrphans() << " orphaned packages\n";
      return 0;
    }

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
