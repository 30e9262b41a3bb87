// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "process_executor.h"
#include "radio_gate.h"
#include "wifi_error.h"
#include "wifi_types.h"

#include <memory>
#include <string>
#include <vector>

namespace wlanctl {

/**
 * @brief Which platform backend to use
 */
enum class BackendKind {
    Auto,  ///< Default backend (nmcli)
    Nmcli, ///< NetworkManager command-line tool
    Netsh, ///< netsh wlan, run through the POSIX executor
    Mock   ///< Canned networks, no external tools
};

/**
 * @brief Parse "auto", "nmcli", "netsh" or "mock"
 * @return false if name is not recognized (kind unchanged)
 */
bool parse_backend_kind(const std::string& name, BackendKind& kind);

const char* backend_kind_name(BackendKind kind);

/**
 * @brief Inputs for WifiBackend::create()
 */
struct BackendOptions {
    BackendKind kind = BackendKind::Auto;
    std::string interface_name = "wlan0";
    std::string nmcli_path = "nmcli"; ///< nmcli program (PATH lookup if no '/')
    std::string netsh_path = "netsh"; ///< netsh program
};

/**
 * @brief Abstract WiFi backend interface
 *
 * Provides a clean, platform-agnostic API for WiFi operations.
 * Concrete implementations handle platform-specific details:
 * - WifiBackendNmcli: NetworkManager via nmcli (Linux)
 * - WifiBackendNetsh: netsh wlan (Windows tool, e.g. netsh.exe via WSL interop)
 * - WifiBackendMock: Simulator mode with fake data
 *
 * Design principles:
 * - Hide all tool-specific formats/commands from callers
 * - Synchronous: each call blocks for one external command plus parsing
 * - Not thread-safe: callers serialize access to a backend
 * - A tool that runs but does not report success is a normal `false`,
 *   distinct from a tool that could not be run (error)
 *
 * Each backend owns the WirelessInterface it controls, including the record
 * of the currently associated network.
 */
class WifiBackend {
  public:
    virtual ~WifiBackend() = default;

    /**
     * @brief Short backend name for logs ("nmcli", "netsh", "mock")
     */
    virtual const char* name() const = 0;

    // ========================================================================
    // Connection Management
    // ========================================================================

    /**
     * @brief Connect to network (blocking)
     *
     * Validates parameters, refuses with RADIO_DISABLED if the radio gate
     * reports the radio off, then runs the platform join command. On
     * `activated == true` the interface records the new connection; otherwise
     * the previous connection state is left untouched.
     *
     * @param ssid Network name (non-empty)
     * @param password Password (empty string for open networks)
     * @param[out] activated True if the tool reported a successful join
     * @return WiFiError with detailed status information
     */
    virtual WiFiError connect_network(const std::string& ssid, const std::string& password,
                                      bool& activated) = 0;

    /**
     * @brief Disconnect the interface (blocking)
     *
     * On `disconnected == true` the recorded connection is cleared.
     *
     * @param[out] disconnected True if the tool reported the disconnect
     * @return WiFiError with detailed status information
     */
    virtual WiFiError disconnect_network(bool& disconnected) = 0;

    // ========================================================================
    // Network Scanning
    // ========================================================================

    /**
     * @brief List visible networks (blocking)
     *
     * @param[out] networks Fresh list in tool output order (cleared first)
     * @return SCAN_EXECUTION_FAILED if the listing command could not run
     */
    virtual WiFiError scan(std::vector<DiscoveredNetwork>& networks) = 0;

    // ========================================================================
    // Status Queries
    // ========================================================================

    /**
     * @brief Interface controlled by this backend and its current connection
     */
    virtual const WirelessInterface& get_interface() const = 0;

    // ========================================================================
    // Factory Methods
    // ========================================================================

    /**
     * @brief Create the backend selected by options
     *
     * BackendKind::Auto resolves to nmcli; netsh must be requested explicitly.
     * Real backends receive a radio gate matching their tool.
     *
     * @param options Backend selection, interface and tool paths
     * @param executor Process runner; must outlive the backend
     * @return Unique pointer to backend instance
     */
    static std::unique_ptr<WifiBackend> create(const BackendOptions& options,
                                               ProcessExecutor& executor);
};

/**
 * @brief Shared connect preconditions: parameter validation, then radio gate
 *
 * Runs no connection command. Returns INVALID_PARAMETERS, RADIO_QUERY_FAILED
 * or RADIO_DISABLED, or success.
 */
WiFiError check_connect_preconditions(const std::string& ssid, const std::string& password,
                                      RadioGate& gate, const std::string& interface_name);

} // namespace wlanctl
