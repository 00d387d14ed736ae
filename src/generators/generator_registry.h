// Registry mapping symbol kinds to their generators.

#ifndef SYMFORGE_GENERATORS_GENERATOR_REGISTRY_H
#define SYMFORGE_GENERATORS_GENERATOR_REGISTRY_H

#include <map>
#include <memory>
#include <vector>

#include "core/basic_types.h"
#include "generators/symbol_generator.h"

namespace symforge {

/// @brief Owns one generator per symbol kind.
///
/// Populated once at the composition root, then only read. Lookups are
/// const and safe to share across threads after construction.
class GeneratorRegistry {
 public:
  GeneratorRegistry() = default;
  GeneratorRegistry(GeneratorRegistry&&) = default;
  GeneratorRegistry& operator=(GeneratorRegistry&&) = default;
  GeneratorRegistry(const GeneratorRegistry&) = delete;
  GeneratorRegistry& operator=(const GeneratorRegistry&) = delete;

  /// @brief Register a generator under its supported kind.
  /// A later registration for the same kind replaces the earlier one.
  void add(std::unique_ptr<ISymbolGenerator> generator);

  /// @brief Look up the generator for a kind.
  /// @return Borrowed pointer, or nullptr if no generator is registered.
  const ISymbolGenerator* find(SymbolType type) const;

  /// @brief Kinds with a registered generator, in enum order.
  std::vector<SymbolType> supportedTypes() const;

  size_t size() const { return generators_.size(); }

 private:
  std::map<SymbolType, std::unique_ptr<ISymbolGenerator>> generators_;
};

/// @brief Registry with the built-in generator for every SymbolType.
GeneratorRegistry createDefaultGeneratorRegistry();

}  // namespace symforge

#endif  // SYMFORGE_GENERATORS_GENERATOR_REGISTRY_H
