#pragma once
/**
 * @file link_linux_sysfs.hpp
 * @brief Link-up signal read from /sys/class/net/<iface>/operstate (header-only).
 *
 * "up" counts as up. "unknown" also counts: loopback and several Wi-Fi/USB
 * drivers never report anything else while carrying traffic.
 */

#if !defined(__linux__)
#  error "link_linux_sysfs.hpp is Linux-only."
#endif

#include "wqlink/link_status.hpp"
#include <fstream>
#include <string>

namespace wqlink::transport {

class LinuxSysfsLink : public ILinkStatus {
public:
  explicit LinuxSysfsLink(const std::string& iface,
                          const std::string& sysfs_root = "/sys/class/net")
  : path_(sysfs_root + "/" + iface + "/operstate") {}

  /// true when the interface exists at all (checked once at startup).
  bool present() const {
    std::ifstream in(path_);
    return static_cast<bool>(in);
  }

  bool link_up() const override {
    std::ifstream in(path_);
    if (!in) return false;
    std::string state;
    in >> state;
    return state == "up" || state == "unknown";
  }

private:
  std::string path_;
};

} // namespace wqlink::transport
