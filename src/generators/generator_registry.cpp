// Implementation of the generator registry.

#include "generators/generator_registry.h"

#include <utility>

#include "generators/accidental_generators.h"
#include "generators/treble_generator.h"

namespace symforge {

void GeneratorRegistry::add(std::unique_ptr<ISymbolGenerator> generator) {
  if (!generator) return;
  SymbolType type = generator->supportedType();
  generators_[type] = std::move(generator);
}

const ISymbolGenerator* GeneratorRegistry::find(SymbolType type) const {
  auto iter = generators_.find(type);
  return iter != generators_.end() ? iter->second.get() : nullptr;
}

std::vector<SymbolType> GeneratorRegistry::supportedTypes() const {
  std::vector<SymbolType> types;
  types.reserve(generators_.size());
  for (const auto& entry : generators_) types.push_back(entry.first);
  return types;
}

GeneratorRegistry createDefaultGeneratorRegistry() {
  GeneratorRegistry registry;
  registry.add(std::make_unique<FlatGenerator>());
  registry.add(std::make_unique<SharpGenerator>());
  registry.add(std::make_unique<NaturalGenerator>());
  registry.add(std::make_unique<DoubleSharpGenerator>());
  registry.add(std::make_unique<TrebleGenerator>());
  return registry;
}

}  // namespace symforge
