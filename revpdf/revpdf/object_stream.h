#pragma once

// The decoded member table of an /Type /ObjStm container.
class ObjectStream
{
	std::string data;
	std::vector< std::pair<unsigned, size_t> > members;	// object number, offset from /First
	size_t first;

public:
	ObjectStream()
		: first( 0 )
	{
	}

	// Decodes `stream` and reads its /N number-offset pairs.
	void Load( Stream const & stream, ObjectResolver const & objmap );

	size_t Size() const { return members.size(); }
	unsigned MemberNumber( size_t index ) const { return members.at( index ).first; }

	PObject ParseMember( size_t index ) const;

	// Object numbers listed in the header of a container, in order, without
	// decoding member values.
	static void ReadMemberNumbers( Stream const & stream, ObjectResolver const & objmap, std::vector<unsigned> & out );

	// Replaces the contents of `stream` with `members`, Flate compressed.
	static void Pack( Stream & stream, std::vector<PIndirectObject> const & members );
};

// Whether `obj` may be stored inside an object stream. Streams, objects with a
// non-zero generation, the trailer's /Encrypt dictionary, the catalog of an
// encrypted document and the configured /Type exclusions stay outside.
bool CanPackIntoObjectStream( PIndirectObject const & obj, PDictionary const & trailer,
	DocumentConfig const & config );
