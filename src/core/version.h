// Library identity recorded in capsule metadata.

#ifndef SYMFORGE_CORE_VERSION_H
#define SYMFORGE_CORE_VERSION_H

namespace symforge {

/// Written into TemplateMetadata::generated_by for every forged capsule.
constexpr const char* kGeneratorIdentity = "SymbolForge v1.0.0";

/// Written into ProvenanceMetadata::validated_by by the validator chain.
constexpr const char* kValidatorIdentity = "SymbolForge ValidatorChain";

}  // namespace symforge

#endif  // SYMFORGE_CORE_VERSION_H
