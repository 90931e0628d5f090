#pragma once

struct Xref
{
	enum Kind
	{
		Free,
		InUse,
		Compressed,
	};

	Kind kind;
	unsigned num;
	unsigned generation;
	size_t pos;		// InUse: byte offset of "n g obj"; Compressed: index within the container
	unsigned stream;	// Compressed: object number of the container

	Xref( Kind kind, unsigned num, unsigned generation, size_t pos, unsigned stream )
		: kind( kind ), num( num ), generation( generation ), pos( pos ), stream( stream )
	{
	}

	bool IsFree() const { return kind == Free; }
	bool IsInUse() const { return kind == InUse; }
	bool IsCompressed() const { return kind == Compressed; }

	// objects inside a container always have generation 0
	ObjectId Id() const { return ObjectId( num, generation ); }
};

// One revision's map from object number to location. Entries are write-once:
// a number can be bound once per section, later changes go to a newer section.
class XrefSection
{
	std::map<unsigned, Xref> entries;

	// free-list links as read from a classic table, keyed by free object number
	std::map<unsigned, unsigned> nextFree;

	bool insert( Xref const & xref, bool strict );
	void BuildFreeList( std::vector<unsigned> & order ) const;

public:
	typedef std::map<unsigned, Xref>::const_iterator const_iterator;

	const Xref* find( unsigned objectNum ) const
	{
		const_iterator it = entries.find( objectNum );
		return it == entries.end() ? 0 : &it->second;
	}

	// Only if the generation matches as well.
	const Xref* find( ObjectId id ) const
	{
		const Xref* xref = find( id.num );
		return (xref && xref->generation == id.gen) ? xref : 0;
	}

	void addInUse( unsigned num, unsigned generation, size_t pos );
	void addFree( unsigned num, unsigned generation );
	void addCompressed( unsigned num, unsigned stream, size_t index );

	// Adds the entries of `other` whose numbers are not bound here yet.
	void merge( XrefSection const & other );

	void erase( unsigned num )
	{
		entries.erase( num );
		nextFree.erase( num );
	}

	bool empty() const { return entries.empty(); }
	size_t size() const { return entries.size(); }
	unsigned maxNum() const { return entries.empty() ? 0 : entries.rbegin()->first; }

	const_iterator begin() const { return entries.begin(); }
	const_iterator end() const { return entries.end(); }

	// Reads a classic table starting at the "xref" keyword. Returns the position
	// right after the "trailer" keyword.
	char const * ReadXrefSection( char const * p, char const * end );

	// Reads the rows of a cross-reference stream; `data` is the decoded stream content.
	void ReadXrefStream( Dictionary const & xrefDict, std::string const & data, ObjectResolver const & objmap );

	// Classic "xref" table text, free entries linked into a list headed by object 0.
	void WriteTable( std::string & out ) const;

	// Rows for a cross-reference stream, with the matching /Index and /W arrays.
	void WriteStream( std::string & data, PArray & index, PArray & w ) const;
};
