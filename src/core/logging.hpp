/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: logging.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Engine log. Each line is "[HH:MM:SS] [LEVEL] message", echoed to stdout and
 * kept in a bounded in-memory ring so the front end can serve recent activity
 * without touching the filesystem.
 * ============================================================================
 */

#ifndef ASSETS_LOGGING_HPP
#define ASSETS_LOGGING_HPP

#include <string>
#include <vector>

namespace assets {

    // Levels used across the engine: DEBUG, INFO, WARN, ERROR, FATAL.
    void log(const std::string& level, const std::string& message);

    // Snapshot of the retained lines, oldest first.
    std::vector<std::string> recent_logs();

    // Tests switch the stdout echo off; the ring keeps recording.
    void set_log_echo(bool enabled);

    void clear_logs();

} // namespace assets

#endif // ASSETS_LOGGING_HPP
