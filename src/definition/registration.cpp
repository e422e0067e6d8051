/// @file registration.cpp
/// @brief Catalog of the definitions base library
///
/// Modules resolve the ancestry of their definitions through these entries.

#include <pipeforge/definition/registration.hpp>

PIPEFORGE_ABSTRACT(pipeforge_definition::IDefinition)
PIPEFORGE_ABSTRACT(pipeforge_definition::DefinitionBase)
PIPEFORGE_ABSTRACT(pipeforge_definition::PipelineDefinition)

PIPEFORGE_MODULE(pipeforge_definitions)
