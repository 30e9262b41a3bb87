// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "process_executor.h"
#include "wifi_error.h"

#include <string>

namespace wlanctl {

/**
 * @brief Reports whether the local wireless radio is enabled
 *
 * Connect consults the gate before running any connection command and fails
 * with RADIO_DISABLED when it reports false. Scan and disconnect do not.
 */
class RadioGate {
  public:
    virtual ~RadioGate() = default;

    /**
     * @param[out] enabled Radio state, valid only on success
     * @return RADIO_QUERY_FAILED if the state could not be determined
     */
    virtual WiFiError is_enabled(bool& enabled) = 0;
};

/**
 * @brief Fixed answer (mock backend and tests)
 */
class StaticRadioGate : public RadioGate {
  public:
    explicit StaticRadioGate(bool enabled = true) : enabled_(enabled) {}

    WiFiError is_enabled(bool& enabled) override {
        enabled = enabled_;
        return WiFiErrorHelper::success();
    }

    void set_enabled(bool enabled) {
        enabled_ = enabled;
    }

  private:
    bool enabled_;
};

/**
 * @brief `nmcli radio wifi` ("enabled" / "disabled")
 */
class NmcliRadioGate : public RadioGate {
  public:
    NmcliRadioGate(ProcessExecutor& executor, const std::string& nmcli = "nmcli")
        : executor_(executor), nmcli_(nmcli) {}

    WiFiError is_enabled(bool& enabled) override;

  private:
    ProcessExecutor& executor_;
    std::string nmcli_;
};

/**
 * @brief Linux RF-kill state from sysfs
 *
 * Every rfkill entry of type "wlan" is checked: a soft or hard block on any
 * of them means disabled. A system without rfkill entries is treated as enabled.
 */
class RfkillRadioGate : public RadioGate {
  public:
    explicit RfkillRadioGate(const std::string& sysfs_root = "/sys/class/rfkill")
        : sysfs_root_(sysfs_root) {}

    WiFiError is_enabled(bool& enabled) override;

  private:
    std::string sysfs_root_;
};

/**
 * @brief `netsh wlan show interfaces` radio status lines
 *
 * Disabled if any radio reports "Software Off" or "Hardware Off".
 */
class NetshRadioGate : public RadioGate {
  public:
    NetshRadioGate(ProcessExecutor& executor, const std::string& netsh = "netsh")
        : executor_(executor), netsh_(netsh) {}

    WiFiError is_enabled(bool& enabled) override;

  private:
    ProcessExecutor& executor_;
    std::string netsh_;
};

} // namespace wlanctl
