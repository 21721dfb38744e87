#pragma once

#include <optional>
#include <string>

#include <QString>
#include <QStringList>

#include "core/mutation.hpp"

namespace sysmend {

/**
 * OS-mutation operations for a Linux host:
 * - sysctl.set           {key, value}
 * - service.set_enabled  {unit, value: "enabled" | "disabled"}
 * - service.set_active   {unit, value: "active" | "inactive"}
 * - service.restart      {unit}
 * - firewall.set_default {direction: incoming|outgoing|routed, value: allow|deny|reject}
 * - dns.set              {link, value: [servers]}   empty list reverts the link
 * - cpu.set_governor     {value}
 * - file.write           {path, value: string | null}   null removes the file
 *
 * Every operation except service.restart exposes a read of its current value.
 * Reads only report values their apply accepts; anything else reads as
 * unknown, so a journaled original can always be written back.
 */
MutationSource makeLinuxMutationSource(int commandTimeoutMs);

// "systemctl is-active" output folded onto active/inactive.
std::optional<std::string> normalizeActiveState(const QString &state);
// "systemctl is-enabled" output folded onto enabled/disabled.
std::optional<std::string> normalizeEnabledState(const QString &state);
// Policy for one direction from "ufw status verbose"; allow, deny or reject.
std::optional<std::string> ufwDefaultPolicy(const QString &status, const QString &direction);
// The governor shared by every CPU, or nullopt when they differ.
std::optional<std::string> commonGovernor(const QStringList &governors);

} // namespace sysmend
