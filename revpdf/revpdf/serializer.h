#pragma once

#include "types.h"

// Appends `obj` in PDF syntax. Object handles are written as "n g R", or as
// their value when they were never made indirect. A stream is written with a
// /Length matching its raw bytes.
void Serialize( PObject const & obj, std::string & out );

// "n g obj\n...\nendobj\n"
void SerializeIndirect( IndirectObject const & obj, std::string & out );

std::string SerializeName( std::string const & name );
std::string SerializeString( std::string const & value );
std::string SerializeDouble( double value );
