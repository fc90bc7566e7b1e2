#include "host_endpoint.hpp"

#include "internal/util/errors.hpp"

namespace zreplicate::host {

std::string HostEndpoint::Destination() const {
  if (host.empty()) {
    return {};
  }
  return user.empty() ? host : user + "@" + host;
}

std::string HostEndpoint::ToString() const {
  return IsLocal() ? dataset : Destination() + ":" + dataset;
}

HostEndpoint HostEndpoint::Parse(std::string_view text) {
  HostEndpoint endpoint;

  // A ':' only separates a host when it precedes the first '/'; "pool:x" is
  // therefore dataset x on host pool, never a local pool named "pool:x".
  const auto colon = text.find(':');
  const auto slash = text.find('/');
  if (colon != std::string_view::npos && (slash == std::string_view::npos || colon < slash)) {
    auto destination = text.substr(0, colon);
    text             = text.substr(colon + 1);

    const auto at = destination.find('@');
    if (at != std::string_view::npos) {
      endpoint.user = std::string(destination.substr(0, at));
      destination   = destination.substr(at + 1);
    }
    endpoint.host = std::string(destination);
    if (endpoint.host.empty()) {
      throw util::InvalidArgument("missing host in endpoint");
    }
  }

  while (!text.empty() && text.back() == '/') {
    text.remove_suffix(1);
  }
  if (text.empty()) {
    throw util::InvalidArgument("missing dataset in endpoint");
  }
  endpoint.dataset = std::string(text);
  return endpoint;
}

} // namespace zreplicate::host
