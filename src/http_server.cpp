#include "http_server.hpp"

#include <exception>
#include <optional>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "json.hpp"
#include "reports.hpp"

namespace {

void set_json_response(httplib::Response &res, const nlohmann::json &payload, int status = 200) {
    res.status = status;
    res.set_content(payload.dump(), "application/json");
}

void set_error_response(httplib::Response &res, int status, const std::string &message) {
    nlohmann::json body = {{"error", message}};
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

// Missing or empty parameter gives the fallback; garbage throws std::invalid_argument
int IntParam(const httplib::Request &req, const char *name, int fallback) {
    if (!req.has_param(name)) {
        return fallback;
    }
    const std::string raw = req.get_param_value(name);
    if (raw.empty()) {
        return fallback;
    }
    return std::stoi(raw);
}

std::string StringParam(const httplib::Request &req, const char *name,
                        const std::string &fallback) {
    if (!req.has_param(name)) {
        return fallback;
    }
    return req.get_param_value(name);
}

std::optional<double> OptionalDoubleParam(const httplib::Request &req, const char *name) {
    if (!req.has_param(name) || req.get_param_value(name).empty()) {
        return std::nullopt;
    }
    return std::stod(req.get_param_value(name));
}

std::optional<std::string> OptionalStringParam(const httplib::Request &req, const char *name) {
    if (!req.has_param(name) || req.get_param_value(name).empty()) {
        return std::nullopt;
    }
    return req.get_param_value(name);
}

} // namespace

// ─────────────────────────────────────
AnalyticsServer::AnalyticsServer(AnalyticsEngine &engine, SettingsStore &settings,
                                 const Config &config)
    : m_Engine(engine), m_Settings(settings), m_Config(config) {}

// ─────────────────────────────────────
AnalyticsServer::~AnalyticsServer() {
    Stop();
}

// ─────────────────────────────────────
bool AnalyticsServer::InitServer() {
    m_Server.set_payload_max_length(4 * 1024 * 1024); // behaviour event batches
    m_Server.set_read_timeout(5, 0);
    m_Server.set_write_timeout(5, 0);

    InitAnalyticsRoutes();
    InitRollupRoutes();
    InitSettingsRoutes();

    m_Server.Get("/api/v1/health", [](const httplib::Request &, httplib::Response &res) {
        res.status = 200;
        res.set_content(R"({"status":"ok"})", "application/json");
    });

    m_Server.set_error_handler([](const httplib::Request &, httplib::Response &res) {
        if (res.body.empty()) {
            set_error_response(res, res.status, "not found");
        }
    });

    return true;
}

// ─────────────────────────────────────
bool AnalyticsServer::Listen() {
    spdlog::info("Serving on: http://{}:{}", m_Config.host, m_Config.port);
    if (!m_Server.listen(m_Config.host, m_Config.port)) {
        spdlog::error("Unable to listen on {}:{}", m_Config.host, m_Config.port);
        return false;
    }
    return true;
}

// ─────────────────────────────────────
void AnalyticsServer::Stop() {
    if (m_Server.is_running()) {
        m_Server.stop();
    }
}

// ─────────────────────────────────────
void AnalyticsServer::InitAnalyticsRoutes() {
    m_Server.Get("/api/v1/analytics/overview",
                 [this](const httplib::Request &req, httplib::Response &res) {
                     try {
                         const int days = IntParam(req, "days", 7);
                         nlohmann::json body;
                         {
                             std::lock_guard<std::mutex> lock(m_EngineMutex);
                             body = m_Engine.GetOverview(days);
                         }
                         set_json_response(res, body);
                     } catch (const std::exception &e) {
                         set_error_response(res, 400, e.what());
                     }
                 });

    m_Server.Get("/api/v1/analytics/time-of-day",
                 [this](const httplib::Request &req, httplib::Response &res) {
                     try {
                         const int days = IntParam(req, "days", 7);
                         nlohmann::json body;
                         {
                             std::lock_guard<std::mutex> lock(m_EngineMutex);
                             body = m_Engine.GetTimeOfDayAnalysis(days);
                         }
                         set_json_response(res, body);
                     } catch (const std::exception &e) {
                         set_error_response(res, 400, e.what());
                     }
                 });

    m_Server.Get("/api/v1/analytics/trends",
                 [this](const httplib::Request &req, httplib::Response &res) {
                     const std::string raw = StringParam(req, "granularity", "day");
                     const std::optional<TrendGranularity> granularity = ParseGranularity(raw);
                     if (!granularity) {
                         set_error_response(res, 400, "granularity must be hour, day or week");
                         return;
                     }
                     try {
                         nlohmann::json body;
                         {
                             std::lock_guard<std::mutex> lock(m_EngineMutex);
                             body = m_Engine.GetTrends(*granularity);
                         }
                         set_json_response(res, body);
                     } catch (const std::exception &e) {
                         set_error_response(res, 500, e.what());
                     }
                 });

    m_Server.Get("/api/v1/analytics/patterns",
                 [this](const httplib::Request &req, httplib::Response &res) {
                     try {
                         const int days = IntParam(req, "days", 30);
                         nlohmann::json body;
                         {
                             std::lock_guard<std::mutex> lock(m_EngineMutex);
                             body = m_Engine.GetBehavioralPatterns(days);
                         }
                         set_json_response(res, body);
                     } catch (const std::exception &e) {
                         set_error_response(res, 400, e.what());
                     }
                 });

    m_Server.Get("/api/v1/analytics/episodes",
                 [this](const httplib::Request &req, httplib::Response &res) {
                     try {
                         EpisodeQuery query;
                         query.start = OptionalStringParam(req, "start");
                         query.end = OptionalStringParam(req, "end");
                         query.hours = OptionalDoubleParam(req, "hours");
                         query.gap_minutes = OptionalDoubleParam(req, "gapMinutes");
                         query.bin_seconds = OptionalDoubleParam(req, "binSeconds");
                         query.max_episodes = OptionalDoubleParam(req, "maxEpisodes");
                         nlohmann::json body;
                         {
                             std::lock_guard<std::mutex> lock(m_EngineMutex);
                             body = m_Engine.GetBehaviorEpisodes(query);
                         }
                         set_json_response(res, body);
                     } catch (const std::exception &e) {
                         set_error_response(res, 400, e.what());
                     }
                 });

    m_Server.Get(R"(/api/v1/analytics/engagement/([^/]+))",
                 [this](const httplib::Request &req, httplib::Response &res) {
                     try {
                         const std::string domain = req.matches[1];
                         const int days = IntParam(req, "days", 7);
                         nlohmann::json body;
                         {
                             std::lock_guard<std::mutex> lock(m_EngineMutex);
                             body = m_Engine.GetEngagementMetrics(domain, days);
                         }
                         set_json_response(res, body);
                     } catch (const std::exception &e) {
                         set_error_response(res, 400, e.what());
                     }
                 });

    m_Server.Post("/api/v1/analytics/behavior-events",
                  [this](const httplib::Request &req, httplib::Response &res) {
                      try {
                          const std::vector<BehaviorEvent> events =
                            ParseBehaviorEvents(nlohmann::json::parse(req.body));
                          std::string error;
                          bool ok = false;
                          {
                              std::lock_guard<std::mutex> lock(m_EngineMutex);
                              ok = m_Engine.IngestBehaviorEvents(events, error);
                          }
                          if (!ok) {
                              set_error_response(res, 400, error);
                              return;
                          }
                          set_json_response(res, {{"ok", true}, {"count", events.size()}});
                      } catch (const std::exception &e) {
                          set_error_response(res, 400, e.what());
                      }
                  });
}

// ─────────────────────────────────────
void AnalyticsServer::InitRollupRoutes() {
    m_Server.Get("/api/v1/rollups/summary",
                 [this](const httplib::Request &req, httplib::Response &res) {
                     try {
                         std::string deviceId = StringParam(req, "device_id", "");
                         if (deviceId == "all") {
                             deviceId.clear();
                         }
                         const int hours = IntParam(req, "hours", 24);
                         nlohmann::json body;
                         {
                             std::lock_guard<std::mutex> lock(m_EngineMutex);
                             body = m_Engine.GetRollupSummary(deviceId, hours);
                         }
                         set_json_response(res, body);
                     } catch (const std::exception &e) {
                         set_error_response(res, 400, e.what());
                     }
                 });

    m_Server.Post("/api/v1/rollups/generate",
                  [this](const httplib::Request &req, httplib::Response &res) {
                      try {
                          const nlohmann::json j = nlohmann::json::parse(req.body);
                          if (!j.contains("start") || !j["start"].is_string() ||
                              !j.contains("end") || !j["end"].is_string()) {
                              set_error_response(res, 400, "start and end are required");
                              return;
                          }
                          const std::string deviceId =
                            GetString(j, "device_id", m_Config.device_id);
                          nlohmann::json body;
                          {
                              std::lock_guard<std::mutex> lock(m_EngineMutex);
                              body = m_Engine.GenerateLocalRollups(
                                deviceId, j["start"].get<std::string>(),
                                j["end"].get<std::string>());
                          }
                          set_json_response(res, body);
                      } catch (const std::exception &e) {
                          set_error_response(res, 400, e.what());
                      }
                  });

    m_Server.Get("/api/v1/rollups/since",
                 [this](const httplib::Request &req, httplib::Response &res) {
                     if (!req.has_param("since")) {
                         set_error_response(res, 400, "since is required");
                         return;
                     }
                     const std::string deviceId =
                       StringParam(req, "device_id", m_Config.device_id);
                     nlohmann::json body;
                     {
                         std::lock_guard<std::mutex> lock(m_EngineMutex);
                         body = m_Engine.ListSince(deviceId, req.get_param_value("since"));
                     }
                     set_json_response(res, body);
                 });

    m_Server.Post("/api/v1/rollups", [this](const httplib::Request &req,
                                            httplib::Response &res) {
        try {
            const std::vector<ActivityRollup> rollups =
              ParseActivityRollups(nlohmann::json::parse(req.body));
            std::string error;
            bool ok = false;
            {
                std::lock_guard<std::mutex> lock(m_EngineMutex);
                ok = m_Engine.UpsertRollups(rollups, error);
            }
            if (!ok) {
                set_error_response(res, 400, error);
                return;
            }
            set_json_response(res, {{"ok", true}, {"count", rollups.size()}});
        } catch (const std::exception &e) {
            set_error_response(res, 400, e.what());
        }
    });
}

// ─────────────────────────────────────
void AnalyticsServer::InitSettingsRoutes() {
    m_Server.Get("/api/v1/settings", [this](const httplib::Request &, httplib::Response &res) {
        try {
            AnalyticsSettings settings;
            {
                std::lock_guard<std::mutex> lock(m_EngineMutex);
                settings = m_Settings.Load();
            }
            set_json_response(res, {{"excludedKeywords", settings.excluded_keywords},
                                    {"dayStartHour", settings.day_start_hour}});
        } catch (const std::exception &e) {
            set_error_response(res, 500, e.what());
        }
    });

    m_Server.Post("/api/v1/settings", [this](const httplib::Request &req,
                                             httplib::Response &res) {
        try {
            const nlohmann::json j = nlohmann::json::parse(req.body);
            if (!j.is_object()) {
                set_error_response(res, 400, "expected a JSON object");
                return;
            }
            if (j.contains("excludedKeywords") && !j["excludedKeywords"].is_array()) {
                set_error_response(res, 400, "excludedKeywords must be an array");
                return;
            }
            if (j.contains("dayStartHour") && !j["dayStartHour"].is_number_integer()) {
                set_error_response(res, 400, "dayStartHour must be an integer");
                return;
            }

            std::string error;
            std::lock_guard<std::mutex> lock(m_EngineMutex);
            if (j.contains("excludedKeywords") &&
                !m_Settings.SaveExcludedKeywords(JsonArray2String(j["excludedKeywords"]), error)) {
                set_error_response(res, 500, error);
                return;
            }
            if (j.contains("dayStartHour") &&
                !m_Settings.SaveDayStartHour(j["dayStartHour"].get<int>(), error)) {
                set_error_response(res, 500, error);
                return;
            }

            const AnalyticsSettings settings = m_Settings.Load();
            set_json_response(res, {{"excludedKeywords", settings.excluded_keywords},
                                    {"dayStartHour", settings.day_start_hour}});
        } catch (const std::exception &e) {
            set_error_response(res, 400, e.what());
        }
    });
}
