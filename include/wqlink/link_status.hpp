#pragma once
/**
 * @file link_status.hpp
 * @brief "Link up" signal from the external network-join procedure.
 *
 * The uplink never joins a network itself. It only asks whether the link is
 * up; when it is not, the tick reports LinkWaiting and attempts nothing.
 */

namespace wqlink {

class ILinkStatus {
public:
  virtual ~ILinkStatus() = default;
  virtual bool link_up() const = 0;
};

/// Wired hosts and bench setups: the link is assumed to be there.
class AlwaysUpLink : public ILinkStatus {
public:
  bool link_up() const override { return true; }
};

} // namespace wqlink
