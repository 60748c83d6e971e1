#pragma once

#include <mutex>
#include <string>

#include <httplib.h>

#include "analytics_engine.hpp"
#include "config.hpp"
#include "settings.hpp"

class AnalyticsServer {
  public:
    AnalyticsServer(AnalyticsEngine &engine, SettingsStore &settings, const Config &config);
    ~AnalyticsServer();

    // Registers every route; must run before Listen
    bool InitServer();

    // Blocks until Stop() is called or the socket fails
    bool Listen();
    void Stop();

  private:
    void InitAnalyticsRoutes();
    void InitRollupRoutes();
    void InitSettingsRoutes();

  private:
    AnalyticsEngine &m_Engine;
    SettingsStore &m_Settings;
    Config m_Config;

    // httplib runs handlers on a thread pool; the engine and its sqlite
    // connection are used by one request at a time
    std::mutex m_EngineMutex;
    httplib::Server m_Server;
};
