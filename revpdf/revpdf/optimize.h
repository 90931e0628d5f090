#pragma once

#include "field_schema.h"

namespace StreamMode
{
enum StreamMode
{
	Preserve,
	Generate,
	Delete,
};
}

struct OptimizeOptions
{
	bool compact;
	StreamMode::StreamMode objectStreams;
	StreamMode::StreamMode xrefStreams;
	bool pruneDefaults;

	OptimizeOptions()
		: compact( false ), objectStreams( StreamMode::Preserve ), xrefStreams( StreamMode::Preserve ),
		pruneDefaults( true )
	{
	}
};

// Runs the selected rewrites: compaction first, then default pruning, then the
// object stream or cross-reference stream conversion. Generating object streams
// implies cross-reference streams; asking to delete them at the same time is a
// UsageError.
void Optimize( Document & doc, OptimizeOptions const & options,
	FieldSchemaRegistry const & registry = FieldSchemaRegistry::Standard() );

// Merges the chain, drops every unreached, freed and object stream object (and
// cross-reference streams unless `xrefStreams` is Preserve), and renumbers the
// rest from 1 into a single revision. Throws IntegrityError if a reference is
// left dangling.
void Compact( Document & doc, StreamMode::StreamMode xrefStreams );

// Packs the eligible objects of every revision into new object streams,
// replacing the old ones, and gives each revision a cross-reference stream.
void GenerateObjectStreams( Document & doc );

// Frees every object stream; members are written standalone from now on.
void DeleteObjectStreams( Document & doc, StreamMode::StreamMode xrefStreams );

void GenerateXrefStreams( Document & doc );

// Throws UsageError while object streams remain.
void DeleteXrefStreams( Document & doc );

// Removes optional entries set to their documented default.
void PruneDefaultFields( Document & doc, FieldSchemaRegistry const & registry );

// Every object handle reachable from the trailer must be the one the resolver
// returns for its identity, and every remaining reference must resolve.
void CheckIntegrity( Document const & doc );
