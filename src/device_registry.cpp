// ============================================================================
// device_registry.cpp: implementation for device_registry.hpp
// ============================================================================

#include "device_registry.hpp"

#include <filesystem>
#include <glob.h>             // tty fallbacks when /dev/serial/by-id is absent
#include <system_error>

namespace fs = std::filesystem;
namespace hideez {

// -------- helpers --------

/*
 * append_glob()
 * Append the matches of a glob() pattern. globfree() runs even when
 * glob() reports no match.
 */
static void append_glob(std::vector<std::string>& out, const char* pattern) {
    glob_t g{};
    if (glob(pattern, 0, nullptr, &g) == 0) {
        for (size_t i = 0; i < g.gl_pathc; ++i)
            out.emplace_back(g.gl_pathv[i]);
    }
    globfree(&g);
}

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// -------- public API --------

std::vector<DeviceInfo> enumerate_devices() {
    std::vector<std::string> ttys;

    std::error_code ec;
    const fs::path by_id("/dev/serial/by-id");
    if (fs::exists(by_id, ec)) {
        for (fs::directory_iterator it(by_id, ec), end; !ec && it != end; it.increment(ec)) {
            if (!it->is_symlink(ec)) continue;
            std::error_code cec;
            auto canon = fs::canonical(it->path(), cec);
            if (!cec) ttys.push_back(canon.string());
        }
    } else {
        append_glob(ttys, "/dev/ttyACM*");
        append_glob(ttys, "/dev/ttyUSB*");
    }

    std::vector<DeviceInfo> result;
    result.reserve(ttys.size());
    for (const auto& dev : ttys) {
        result.push_back({SERIAL_PREFIX + dev, dev});
    }
    return result;
}

std::string normalize_path(const std::string& path) {
    if (!path.empty() && path[0] == '/') return SERIAL_PREFIX + path;
    return path;
}

bool find_device(const std::string& raw_path,
                 const std::vector<DeviceInfo>& devices,
                 bool prefix_search,
                 DeviceInfo& out) {
    if (raw_path.empty()) {
        if (devices.empty()) return false;
        out = devices.front();
        return true;
    }

    const std::string path = normalize_path(raw_path);

    // Phase 1: exact
    for (const auto& d : devices) {
        if (d.path == path) { out = d; return true; }
    }

    // Phase 2: prefix
    if (prefix_search) {
        for (const auto& d : devices) {
            if (starts_with(d.path, path)) { out = d; return true; }
        }
    }

    // Phase 3: explicit serial path outside the enumerated set
    const std::string prefix = SERIAL_PREFIX;
    if (starts_with(path, prefix) && path.size() > prefix.size()) {
        const std::string dev = path.substr(prefix.size());
        std::error_code ec;
        if (fs::exists(dev, ec)) {
            out = {path, dev};
            return true;
        }
    }
    return false;
}

std::unique_ptr<ITransport> get_transport(const std::string& path,
                                          const SerialConfig& cfg,
                                          std::string& err) {
    const auto devices = enumerate_devices();

    DeviceInfo found;
    if (!find_device(path, devices, /*prefix_search=*/false, found) &&
        !find_device(path, devices, /*prefix_search=*/true, found)) {
        err = "device_not_found";
        return nullptr;
    }

    SerialConfig c = cfg;
    c.dev = found.dev_path;
    return std::make_unique<SerialTransport>(c);
}

} // namespace hideez
