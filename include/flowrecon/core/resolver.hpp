/* Physical-interface resolver: host-provided lookup for Interface rows. */
#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace flowrecon::core {

// Lookup key of a physical interface in the host system: a parameter group
// identifier plus the row index inside that group.
struct PhysicalInterfaceRef {
  std::int32_t parameter_group { -1 };
  std::string index {};
};

// Resolves a PhysicalInterfaceRef to the identifier stored in
// Interface::physical_interface. Only decorates interface rows; the flow
// lifecycle never depends on it.
class PhysicalInterfaceResolver {
public:
  virtual ~PhysicalInterfaceResolver() noexcept = default;

  // nullopt when the interface is not found.
  [[nodiscard]] virtual std::optional<std::string> resolve(std::int32_t parameter_group,
                                                           const std::string& index) = 0;
};

} // namespace flowrecon::core
