#pragma once

#include "field_schema.h"

// The highest version introducing any schema field present in a live object or
// the current trailer. Directly nested dictionaries count toward their parent;
// indirect ones are counted on their own. At least "1.0".
std::string ComputeMinimumVersion( Document const & doc,
	FieldSchemaRegistry const & registry = FieldSchemaRegistry::Standard() );

// Raises the document version to the minimum if it is lower. Returns the
// resulting version.
std::string RaiseVersionToMinimum( Document & doc,
	FieldSchemaRegistry const & registry = FieldSchemaRegistry::Standard() );
