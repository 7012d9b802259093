// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

// Numeric OIDs queried by the scanner. Written without a leading dot, the
// form snmp_response.hpp normalizes every transport OID to.

namespace netsnmp {
namespace scan {
namespace oids {

// SNMPv2-MIB
inline constexpr const char* SYS_DESCR = "1.3.6.1.2.1.1.1.0";
inline constexpr const char* SYS_NAME = "1.3.6.1.2.1.1.5.0";

// IF-MIB ifPhysAddress.1
inline constexpr const char* IF_PHYS_ADDRESS_1 = "1.3.6.1.2.1.2.2.1.6.1";

// Serial number candidates, most widely implemented first
inline constexpr const char* ENT_PHYSICAL_SERIAL_1 = "1.3.6.1.2.1.47.1.1.1.1.11.1";  // ENTITY-MIB entPhysicalSerialNum.1
inline constexpr const char* CISCO_CHASSIS_SERIAL = "1.3.6.1.4.1.9.3.6.3.0";         // OLD-CISCO-CHASSIS-MIB chassisId
inline constexpr const char* JUNIPER_BOX_SERIAL = "1.3.6.1.4.1.2636.3.1.3.0";        // JUNIPER-MIB jnxBoxSerialNo
inline constexpr const char* HP_SERIAL = "1.3.6.1.4.1.11.2.36.1.1.2.9.0";            // hpHttpMgSerialNumber

// CISCO-CDP-MIB cdpCacheTable; entry is TABLE.1, columns are ENTRY.<n>
inline constexpr const char* CDP_CACHE_TABLE = "1.3.6.1.4.1.9.9.23.1.2.1";
inline constexpr const char* CDP_CACHE_ENTRY = "1.3.6.1.4.1.9.9.23.1.2.1.1";
inline constexpr unsigned CDP_COL_ADDRESS = 4;
inline constexpr unsigned CDP_COL_VERSION = 5;
inline constexpr unsigned CDP_COL_DEVICE_ID = 6;
inline constexpr unsigned CDP_COL_DEVICE_PORT = 7;
inline constexpr unsigned CDP_COL_PLATFORM = 8;

// LLDP-MIB lldpRemoteSystemsData; covers lldpRemTable and lldpRemManAddrTable
inline constexpr const char* LLDP_REM_SYSTEMS_DATA = "1.0.8802.1.1.2.1.4";
inline constexpr const char* LLDP_REM_PORT_ID = "1.0.8802.1.1.2.1.4.1.1.7";
inline constexpr const char* LLDP_REM_SYS_NAME = "1.0.8802.1.1.2.1.4.1.1.9";
inline constexpr const char* LLDP_REM_SYS_DESC = "1.0.8802.1.1.2.1.4.1.1.10";
inline constexpr const char* LLDP_REM_MAN_ADDR_ENTRY = "1.0.8802.1.1.2.1.4.2.1";

// lldpRemManAddrSubtype value for IPv4 (IANA address family 1)
inline constexpr unsigned LLDP_MAN_ADDR_IPV4 = 1;

}  // namespace oids
}  // namespace scan
}  // namespace netsnmp
