/**
 * @file oids.hpp
 * @brief SNMP object identifiers queried by the device drivers and scanner.
 *
 * Table columns are listed without an instance suffix and are walked; scalar
 * objects carry their ".0" (or entity index) suffix and are fetched with GET.
 */

#pragma once

#include <cstdint>

namespace fleetwatch::oids {

// ── SNMPv2-MIB system group ──────────────────
inline constexpr const char* SYS_DESCR    = "1.3.6.1.2.1.1.1.0";
inline constexpr const char* SYS_UPTIME   = "1.3.6.1.2.1.1.3.0";
inline constexpr const char* SYS_NAME     = "1.3.6.1.2.1.1.5.0";
inline constexpr const char* SYS_LOCATION = "1.3.6.1.2.1.1.6.0";

// ── ENTITY-MIB, chassis entry (index 1) ──────
inline constexpr const char* ENT_FIRMWARE = "1.3.6.1.2.1.47.1.1.1.1.9.1";
inline constexpr const char* ENT_SOFTWARE = "1.3.6.1.2.1.47.1.1.1.1.10.1";
inline constexpr const char* ENT_SERIAL   = "1.3.6.1.2.1.47.1.1.1.1.11.1";
inline constexpr const char* ENT_MODEL    = "1.3.6.1.2.1.47.1.1.1.1.13.1";

// ── Aruba WLSX (enterprise 14823) ────────────
inline constexpr const char* ARUBA_CLIENT_COUNT = "1.3.6.1.4.1.14823.2.2.1.1.3.2.0";
inline constexpr const char* ARUBA_CPU_PERCENT  = "1.3.6.1.4.1.14823.2.2.1.1.1.9.0";
inline constexpr const char* ARUBA_MEM_PERCENT  = "1.3.6.1.4.1.14823.2.2.1.1.1.10.0";

/// ESSID table, indexed by ESSID ordinal.
inline constexpr const char* ARUBA_ESSID_NAME    = "1.3.6.1.4.1.14823.2.2.1.5.2.1.7.1.2";
inline constexpr const char* ARUBA_ESSID_STATUS  = "1.3.6.1.4.1.14823.2.2.1.5.2.1.7.1.3";
inline constexpr const char* ARUBA_ESSID_CLIENTS = "1.3.6.1.4.1.14823.2.2.1.5.2.1.7.1.4";
inline constexpr const char* ARUBA_ESSID_BAND    = "1.3.6.1.4.1.14823.2.2.1.5.2.1.7.1.5";

/// Radio table, indexed by radio number.
inline constexpr const char* ARUBA_RADIO_BAND        = "1.3.6.1.4.1.14823.2.2.1.5.2.1.5.1.2";
inline constexpr const char* ARUBA_RADIO_ENABLED     = "1.3.6.1.4.1.14823.2.2.1.5.2.1.5.1.3";
inline constexpr const char* ARUBA_RADIO_CHANNEL     = "1.3.6.1.4.1.14823.2.2.1.5.2.1.5.1.4";
inline constexpr const char* ARUBA_RADIO_POWER       = "1.3.6.1.4.1.14823.2.2.1.5.2.1.5.1.5";
inline constexpr const char* ARUBA_RADIO_UTILIZATION = "1.3.6.1.4.1.14823.2.2.1.5.2.1.5.1.6";

// ── H3C / Comware entity extension (enterprise 25506), chassis board ──
inline constexpr const char* COMWARE_CPU_PERCENT  = "1.3.6.1.4.1.25506.2.6.1.1.1.1.6.1";
inline constexpr const char* COMWARE_MEM_PERCENT  = "1.3.6.1.4.1.25506.2.6.1.1.1.1.8.1";
inline constexpr const char* COMWARE_TEMPERATURE  = "1.3.6.1.4.1.25506.2.6.1.1.1.1.12.1";

// ── IF-MIB ───────────────────────────────────
inline constexpr const char* IF_DESCR        = "1.3.6.1.2.1.2.2.1.2";
inline constexpr const char* IF_TYPE         = "1.3.6.1.2.1.2.2.1.3";
inline constexpr const char* IF_SPEED        = "1.3.6.1.2.1.2.2.1.5";
inline constexpr const char* IF_ADMIN_STATUS = "1.3.6.1.2.1.2.2.1.7";
inline constexpr const char* IF_OPER_STATUS  = "1.3.6.1.2.1.2.2.1.8";
inline constexpr const char* IF_ALIAS        = "1.3.6.1.2.1.31.1.1.1.18";

inline constexpr int64_t IF_TYPE_ETHERNET = 6;
inline constexpr int64_t IF_STATUS_UP = 1;

// ── Q-BRIDGE-MIB ─────────────────────────────
inline constexpr const char* DOT1Q_VLAN_NAME       = "1.3.6.1.2.1.17.7.1.4.3.1.1";
inline constexpr const char* DOT1Q_VLAN_EGRESS     = "1.3.6.1.2.1.17.7.1.4.3.1.2";
inline constexpr const char* DOT1Q_VLAN_ROW_STATUS = "1.3.6.1.2.1.17.7.1.4.3.1.5";
inline constexpr const char* DOT1Q_PVID            = "1.3.6.1.2.1.17.7.1.4.5.1.1";

// ── BRIDGE-MIB spanning tree ─────────────────
inline constexpr const char* DOT1D_STP_PROTOCOL    = "1.3.6.1.2.1.17.2.1.0";
inline constexpr const char* DOT1D_STP_PRIORITY    = "1.3.6.1.2.1.17.2.2.0";
inline constexpr const char* DOT1D_STP_ROOT        = "1.3.6.1.2.1.17.2.5.0";
inline constexpr const char* DOT1D_STP_PORT_STATE  = "1.3.6.1.2.1.17.2.15.1.3";

}  // namespace fleetwatch::oids
