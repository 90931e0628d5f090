#pragma once

#include <set>
#include <string>

struct DocumentConfig
{
	// maximum number of members packed into one object stream
	size_t objectStreamSize;

	// /Type names that are never packed into an object stream
	std::set<std::string> objectStreamExclusions;

	// version used for documents created from scratch
	std::string defaultVersion;

	// scan the whole file for objects when the newest xref section is unreadable
	bool reconstructOnError;

	DocumentConfig()
		: objectStreamSize( 200 ), defaultVersion( "1.2" ), reconstructOnError( true )
	{
		objectStreamExclusions.insert( "XRef" );
		objectStreamExclusions.insert( "ObjStm" );
	}
};
