#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <optional>
#include <string>

#include "core/storage/PackageStorage.hpp"

using nlohmann::json;

// -------- helpers --------

static bool check_api_key(const httplib::Request& req,
                          const std::string& apiKey,
                          httplib::Response& res) {
  if (apiKey.empty()) return true; // auth disabled
  auto k = req.get_header_value("X-API-Key");
  if (k == apiKey) return true;
  res.status = 401;
  res.set_content("unauthorized", "text/plain");
  return false;
}

static std::string param_or(const httplib::Request& req, const char* k, const std::string& def = {}) {
  if (req.has_param(k)) return req.get_param_value(k);
  return def;
}

// Route captures 1 and 2 are usage and arch.
static std::optional<pkgstore::PackageKey> key_from(const httplib::Request& req, httplib::Response& res) {
  auto usage = pkgstore::parseUsage(req.matches[1].str());
  auto arch  = pkgstore::parseArch(req.matches[2].str());
  if (!usage || !arch) {
    res.status = 422;
    res.set_content("unknown package usage or architecture", "text/plain");
    return std::nullopt;
  }
  return pkgstore::PackageKey{*usage, *arch};
}

static void storage_error(httplib::Response& res, const std::exception& e) {
  spdlog::error("storage request failed: {}", e.what());
  res.status = 500;
  res.set_content("storage error", "text/plain");
}

// -------- server --------

namespace pkgstore {

json toJson(const PackageInfo& info) {
  return {
    {"usage",    to_string(info.key.usage)},
    {"arch",     to_string(info.key.arch)},
    {"version",  info.version},
    {"filename", info.meta.filename},
    {"size",     info.meta.size},
    {"mimetype", info.meta.mimetype}
  };
}

void run_http_server(PackageStorage& storage,
                     int port,
                     const std::string& apiKey) {
  httplib::Server svr;
  const std::string packageRoute = R"(/api/packages/([A-Za-z0-9_-]+)/([A-Za-z0-9_-]+))";

  // Health check
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  svr.Get("/api/packages", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    try {
      json out = json::array();
      for (const auto& info : storage.listPackages()) out.push_back(toJson(info));
      res.status = 200;
      res.set_content(out.dump(), "application/json");
    } catch (const std::exception& e) {
      storage_error(res, e);
    }
  });

  svr.Get(packageRoute, [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    auto key = key_from(req, res);
    if (!key) return;
    try {
      auto info = storage.getCurrentPackageInfo(*key);
      if (!info) { res.status = 404; res.set_content("no package", "text/plain"); return; }
      res.status = 200;
      res.set_content(toJson(*info).dump(), "application/json");
    } catch (const std::exception& e) {
      storage_error(res, e);
    }
  });

  svr.Get(packageRoute + "/download", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    auto key = key_from(req, res);
    if (!key) return;
    try {
      auto info = storage.getCurrentPackageInfo(*key);
      std::optional<std::string> data;
      if (info) data = storage.readFile(*key);
      if (!info || !data) { res.status = 404; res.set_content("no package", "text/plain"); return; }
      res.status = 200;
      res.set_header("Content-Disposition", "attachment; filename=\"" + info->meta.filename + "\"");
      res.set_content(*data, info->meta.mimetype.c_str());
    } catch (const std::exception& e) {
      storage_error(res, e);
    }
  });

  // POST /api/packages/<usage>/<arch>?version=<v>
  // Body: raw package bytes, Content-Type: package mimetype
  svr.Post(packageRoute, [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    auto key = key_from(req, res);
    if (!key) return;

    if (req.body.empty()) {
      res.status = 400; res.set_content("empty body", "text/plain"); return;
    }
    const std::string version = param_or(req, "version");
    if (version.empty()) {
      res.status = 400; res.set_content("version required", "text/plain"); return;
    }
    const std::string mimetype = req.get_header_value("Content-Type").empty()
      ? std::string(kApkMimetype)
      : req.get_header_value("Content-Type");
    const bool retry = param_or(req, "retry") == "true";

    if (!storage.saveFile(*key, version, mimetype, req.body, retry)) {
      res.status = 500;
      res.set_content("upload failed", "text/plain");
      return;
    }
    spdlog::info("uploaded {} version {} via API", to_string(*key), version);
    json out = {{"usage", to_string(key->usage)}, {"arch", to_string(key->arch)}, {"version", version}};
    res.status = 200;
    res.set_content(out.dump(), "application/json");
  });

  svr.Delete(packageRoute, [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    auto key = key_from(req, res);
    if (!key) return;
    try {
      if (!storage.deleteFile(*key)) {
        res.status = 500; res.set_content("delete failed", "text/plain"); return;
      }
      res.status = 200;
      res.set_content("deleted", "text/plain");
    } catch (const std::exception& e) {
      storage_error(res, e);
    }
  });

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) res.set_content("not found", "text/plain");
  });

  spdlog::info("HTTP server listening on http://0.0.0.0:{}", port);
  if (!svr.listen("0.0.0.0", port)) {
    spdlog::error("Failed to bind port {}", port);
  }
}

} // namespace pkgstore
