#pragma once

#include <chrono>
#include <cstddef>

namespace sbr {

    inline constexpr const char* PLUGIN_NAME      = "seabird-radio";
    inline constexpr const char* DEFAULT_CORE_URL = "https://api.seabird.chat";

    // Core session
    inline constexpr int HANDSHAKE_TIMEOUT_MS = 10 * 1000;
    inline constexpr int LIVENESS_TIMEOUT_MS  = 90 * 1000; // core pings every 30s
    inline constexpr int LIVENESS_CHECK_MS    = 5 * 1000;
    inline constexpr int KEEPALIVE_TIME_MS    = 30 * 1000;
    inline constexpr std::size_t OUTBOUND_QUEUE_LIMIT = 256; // frames waiting for the writer thread

    // Reconnect backoff
    inline constexpr int BACKOFF_BASE_MS = 500;
    inline constexpr int BACKOFF_CAP_MS  = 60 * 1000;

    // Command dispatch
    inline constexpr int MAX_IN_FLIGHT_COMMANDS = 8;
    inline constexpr int COMMAND_TIMEOUT_MS     = 10 * 1000;

    // Upstream radio APIs
    inline constexpr int    UPSTREAM_BUCKET_CAPACITY  = 5;
    inline constexpr double UPSTREAM_REFILL_PER_SEC   = 0.5;
    inline constexpr int    UPSTREAM_MAX_WAIT_MS      = 2000;
    inline constexpr int    UPSTREAM_FETCH_ATTEMPTS   = 3;
    inline constexpr int    UPSTREAM_RETRY_DELAY_MS   = 250;
    inline constexpr int    UPSTREAM_TRANSFER_TIMEOUT = 8000;
    inline constexpr int    DEFAULT_CACHE_TTL_MS      = 60 * 1000;
    inline constexpr int    POTA_CACHE_TTL_MS         = 30 * 1000;
    inline constexpr int    SOLAR_CACHE_TTL_MS        = 2 * 60 * 1000;

    inline constexpr const char* SOLAR_KEY         = "solar";
    inline constexpr const char* POTA_SPOTS_KEY    = "pota.spots";
    inline constexpr const char* DEFAULT_SOLAR_URL = "https://www.hamqsl.com/solarxml.php";
    inline constexpr const char* DEFAULT_POTA_URL  = "https://api.pota.app/v1/spots";

    // Exit codes
    inline constexpr int EXIT_OK            = 0;
    inline constexpr int EXIT_FAILURE_OTHER = 1;
    inline constexpr int EXIT_CONFIG_ERROR  = 2;
    inline constexpr int EXIT_AUTH_REJECTED = 3;

} // namespace sbr
