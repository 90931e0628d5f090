#pragma once

#include <boost/noncopyable.hpp>

class FileParser;
class Document;
typedef boost::shared_ptr< Document > PDocument;

// Both return an empty pointer when the file can't be opened. Structural damage
// is repaired per `config`; with reconstruction turned off a damaged newest
// revision throws MalformedPdfError.
PDocument LoadFile( char const * filename, DocumentConfig const & config = DocumentConfig() );
PDocument LoadFromMemory( std::string const & bytes, DocumentConfig const & config = DocumentConfig() );

typedef std::vector< std::pair<PIndirectObject, PRevision> > ObjectList;

class Document : boost::noncopyable
{
	MappedFile * f;
	FileParser * parser;

	DocumentConfig config;
	RevisionChain revisions;
	ObjectResolver resolver;
	std::string version;

	void Load( MappedFile * file );
	PDictionary FindCatalog() const;

	friend PDocument LoadFile( char const * filename, DocumentConfig const & config );
	friend PDocument LoadFromMemory( std::string const & bytes, DocumentConfig const & config );

public:
	// A new document with one empty revision.
	explicit Document( DocumentConfig const & config = DocumentConfig() );

	// Empties every materialized object so that reference cycles are released;
	// handles kept past this point see freed objects.
	~Document();

	DocumentConfig const & Config() const { return config; }
	RevisionChain & Revisions() { return revisions; }
	RevisionChain const & Revisions() const { return revisions; }
	ObjectResolver & Resolver() { return resolver; }
	ObjectResolver const & Resolver() const { return resolver; }

	// The bytes the document was loaded from, null for a new document.
	MappedFile const * File() const { return f; }

	PIndirectObject GetObject( ObjectId id ) const;

	// The object behind a reference or handle; other values are returned as is.
	PObject Deref( PObject const & value ) const;

	// Makes `value` an indirect object of the current revision (or of the
	// revision at `revisionIndex`). Handles that are already indirect keep their
	// identity, everything else gets the next free object number.
	PIndirectObject Add( PObject const & value );
	PIndirectObject Add( PObject const & value, size_t revisionIndex );

	// Frees the object in every revision that binds its number.
	void Delete( ObjectId id );

	// A handle for `value` that is not indirect yet (object number 0).
	PIndirectObject Wrap( PObject const & value ) const;

	PDictionary Trailer() const { return revisions.Current()->trailer; }

	// The document catalog; created and linked from the trailer if missing.
	PDictionary Catalog();

	// With onlyCurrent the objects of the current revision, otherwise the newest
	// binding of every object number in the chain. Everything is loaded first.
	void EachObject( bool onlyCurrent, ObjectList & out ) const;

	// The greater of the header version and the catalog's /Version.
	std::string Version() const;

	// Throws UsageError unless `v` has the form "M.N".
	void SetVersion( std::string const & v );

	// The page walks throw MalformedPdfError on a page tree that loops.
	PDictionary GetPage( size_t n );
	size_t GetPageIndex( PDictionary page );
	PDictionary GetNextPage( PDictionary page );
	PDictionary GetPrevPage( PDictionary page );
	size_t GetPageCount();
};
