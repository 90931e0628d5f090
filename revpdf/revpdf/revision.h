#pragma once

// One cross-reference section with its trailer, plus the objects that have been
// materialized from it or added to it in memory. A table entry always shadows the
// section; a freed entry (empty value) shadows it as a tombstone.
class Revision
{
	std::map<unsigned, PIndirectObject> objects;

public:
	typedef std::map<unsigned, PIndirectObject>::const_iterator const_iterator;

	static const size_t InMemory = (size_t)-1;

	PDictionary trailer;
	XrefSection xref;
	size_t fileOffset;	// where the section was read from, InMemory if created by Add

	explicit Revision( PDictionary const & trailer, size_t fileOffset = InMemory )
		: trailer( trailer ), fileOffset( fileOffset )
	{
	}

	// The table entry for `num`, without loading anything.
	PIndirectObject Loaded( unsigned num ) const
	{
		const_iterator it = objects.find( num );
		return it == objects.end() ? PIndirectObject() : it->second;
	}

	// True if the number is bound here, freed entries included.
	bool Contains( unsigned num ) const
	{
		return objects.find( num ) != objects.end() || xref.find( num ) != 0;
	}

	// Live object (not freed) with this exact identity is bound here.
	bool Has( ObjectId id ) const;

	// Records an object loaded from this revision's section.
	void Store( PIndirectObject const & obj );

	// Adds a new object; throws UsageError for number 0 or a number already bound here.
	void Add( PIndirectObject const & obj );

	// With markAsFree the number stays bound as a tombstone, otherwise every
	// trace of it is removed from this revision.
	void Delete( unsigned num, bool markAsFree );

	// One past the highest number bound here.
	unsigned NextFreeNumber() const;

	const_iterator begin() const { return objects.begin(); }
	const_iterator end() const { return objects.end(); }

	void Clear()
	{
		objects.clear();
	}
};

typedef boost::shared_ptr<Revision> PRevision;
