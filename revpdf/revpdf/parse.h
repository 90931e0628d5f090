#pragma once

#include "types.h"

// All parse functions read from [p, end) and throw MalformedPdfError on syntax
// they cannot make sense of. `objmap` may be null; it is only used to resolve an
// indirect stream /Length. `depth` counts the enclosing arrays and dictionaries.
PObject Parse( const char*& p, char const * end, size_t depth = 0 );
PDictionary ParseDict( const char*& p, char const * end, size_t depth = 1 );
PArray ParseArray( const char*& p, char const * end, size_t depth = 1 );
PObject ParseDirect( const char*& p, char const * end, const ObjectResolver* objmap );
PObject ParseIndirect( const char* p, char const * end, ObjectId expected, const ObjectResolver* objmap );

// Reads "n g obj" and leaves p after the keyword; false if p does not start an object.
bool ParseObjectHeader( const char*& p, char const * end, ObjectId & id );

std::string UnescapeString( char const * src, char const * srcend );
std::string DecodeHexString( char const * src, char const * srcend );
std::string DecodeName( char const * src, char const * srcend );
