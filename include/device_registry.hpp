/**
 * @page hz-device-registry Device Enumeration
 * @file device_registry.hpp
 * @brief Find candidate wallet links on this host and turn a user path into a transport.
 *
 * @details
 * PURPOSE
 * -------
 * The CLI accepts a device path (`-p/--path`, or `HIDEEZ_PATH`) of the form
 * `serial:<tty>`. This layer lists what is plugged in and resolves such a
 * path, or no path at all, into an ITransport ready to open.
 *
 * ENUMERATION
 * -----------
 * - Prefer `/dev/serial/by-id/*` symlinks, canonicalized to the tty they name.
 * - Without that directory, fall back to `/dev/ttyACM*` and `/dev/ttyUSB*`.
 * - Candidates are not probed. Which of them answers as a wallet is decided
 *   when the client talks to it.
 *
 * RESOLUTION (find_device)
 * ------------------------
 * 1. Empty path: first enumerated device.
 * 2. Exact match on the `serial:` path.
 * 3. With prefix_search: first device whose path starts with the given text.
 * 4. A `serial:` path naming an existing file is accepted as-is, so pseudo
 *    terminals and udev aliases outside by-id still work.
 *
 * Failure is reported as "device_not_found" regardless of cause.
 */
#pragma once

#include "hideez/transport.hpp"

#include <memory>
#include <string>
#include <vector>

namespace hideez {

struct DeviceInfo {
    std::string path;       // "serial:/dev/ttyACM0"
    std::string dev_path;   // "/dev/ttyACM0"
};

/// List candidate devices. Never throws; an unreadable /dev yields an empty list.
std::vector<DeviceInfo> enumerate_devices();

/// Accept "/dev/ttyACM0" as shorthand for "serial:/dev/ttyACM0".
std::string normalize_path(const std::string& path);

/**
 * @brief Resolve @p path against @p devices.
 *
 * @param path           user supplied path; may be empty
 * @param devices        enumeration result
 * @param prefix_search  allow prefix matches after the exact pass
 * @param out            resolved device on success
 * @return false when nothing matches
 */
bool find_device(const std::string& path,
                 const std::vector<DeviceInfo>& devices,
                 bool prefix_search,
                 DeviceInfo& out);

/**
 * @brief Enumerate, resolve and construct an unopened SerialTransport.
 *
 * Tries an exact match first and then a prefix match.
 *
 * @param path  user supplied path; may be empty
 * @param cfg   link settings (baud, boot delay); cfg.dev is replaced
 * @param err   "device_not_found" on failure
 */
std::unique_ptr<ITransport> get_transport(const std::string& path,
                                          const SerialConfig& cfg,
                                          std::string& err);

} // namespace hideez
