#pragma once

#include <string>
#include <string_view>

namespace zreplicate::host {

/*
  "[user@]host:pool/dataset" or a bare "pool/dataset" for the local host.
*/
struct HostEndpoint {
  std::string user;
  std::string host;
  std::string dataset;

  bool IsLocal() const {
    return host.empty();
  }

  // "user@host", "host" or "" for the local host.
  std::string Destination() const;

  std::string ToString() const;

  // Throws util::InvalidArgument on an empty dataset or host.
  static HostEndpoint Parse(std::string_view text);
};

} // namespace zreplicate::host
