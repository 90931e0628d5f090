#pragma once

#include <boost/noncopyable.hpp>

class FileParser;
class ObjectStream;

// Finds indirect objects by identity across a revision chain, loading them on
// first use. The first revision (newest to oldest) that binds the object number
// decides the outcome; a free entry there hides every older binding.
//
// Resolution never throws for damaged objects: they are logged and reported as
// not found (an empty handle).
class ObjectResolver : boost::noncopyable
{
	RevisionChain & revisions;
	FileParser const * parser;

	mutable std::map<ObjectId, PIndirectObject> cache;
	mutable std::map<ObjectId, boost::shared_ptr<ObjectStream> > objectStreams;
	mutable std::set<ObjectId> inProgress;

	PObject LoadCompressed( Xref const & entry ) const;

public:
	explicit ObjectResolver( RevisionChain & revisions )
		: revisions( revisions ), parser( 0 )
	{
	}

	void SetParser( FileParser const * p ) { parser = p; }

	PIndirectObject Resolve( ObjectId id ) const;

	// Materializes one entry of `revision`'s section and stores it there. Free
	// entries are stored as tombstones and yield an empty handle.
	PIndirectObject LoadEntry( Revision & revision, Xref const & entry ) const;

	// Materializes every entry of the section that is not in the table yet.
	void LoadRevision( Revision & revision ) const;

	void Invalidate();
	void Invalidate( ObjectId id );

	// Empties every cached object, then the cache.
	void Release();
};
