#pragma once

#include <vector>

#include "core/fact_prober.hpp"
#include "core/pattern_table.hpp"

namespace sysmend {

/**
 * Fact queries for a Linux host, read from /proc, /sys, /etc and a few
 * external tools. Keys:
 * - kernel_version, os_name, firmware_type, secure_boot, process_uid
 * - system_manufacturer, system_model, cpu_model, cpu_hypervisor_flag
 * - memory_total_kb, gpu_list, dns_servers
 */
FactSource makeLinuxFactSource(int commandTimeoutMs);

// is_admin, is_virtual_machine, gpu_vendor, cpu_vendor.
std::vector<DerivedFact> makeLinuxDerivedFacts();

const PatternTable &gpuVendorTable();
const PatternTable &cpuVendorTable();
const PatternTable &virtualPlatformTable();

} // namespace sysmend
