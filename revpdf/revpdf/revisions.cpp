#include "pch.h"
#include "file_parser.h"

RevisionChain::RevisionChain()
{
	revisions.push_back( PRevision( new Revision( PDictionary( new Dictionary() ) ) ) );
}

void RevisionChain::Load( FileParser const & parser, size_t entryPoint, ObjectResolver const & objmap, bool reconstructOnError )
{
	std::vector<PRevision> found;	// newest first
	std::set<size_t> seen;
	size_t offset = entryPoint;

	for(;;)
	{
		if( !seen.insert( offset ).second )
		{
			DebugOutput( DebugLevel::Warning, "cross-reference section at %zu was already read, stopping", offset );
			break;
		}

		PRevision revision;
		try
		{
			revision = parser.ReadRevisionAt( offset, objmap );
		}
		catch( MalformedPdfError const & e )
		{
			if( !found.empty() )
			{
				DebugOutput( DebugLevel::Warning, "revision chain truncated at %zu: %s", e.offset, e.what() );
				break;
			}

			if( !reconstructOnError )
				throw;

			DebugOutput( DebugLevel::Warning, "newest revision unreadable (%s at %zu), reconstructing", e.what(), e.offset );
			Reconstruct( parser );
			return;
		}

		PObject xrefStm = revision->trailer->Get( "XRefStm" );
		if( xrefStm && xrefStm->Type() == ObjectType::Number )
			seen.insert( (size_t)((Number *)xrefStm.get())->num );

		found.push_back( revision );

		PObject prev = revision->trailer->Get( "Prev" );
		if( !prev )
			break;

		if( prev->Type() != ObjectType::Number || ((Number *)prev.get())->num < 0 )
		{
			DebugOutput( DebugLevel::Warning, "invalid /Prev in trailer at %zu", offset );
			break;
		}

		offset = (size_t)((Number *)prev.get())->num;
	}

	revisions.assign( found.rbegin(), found.rend() );
}

void RevisionChain::Reconstruct( FileParser const & parser )
{
	PRevision revision = parser.Reconstruct();
	revisions.clear();
	revisions.push_back( revision );
}

PRevision RevisionChain::Add()
{
	PDictionary trailer = CopyDictionary( Current()->trailer );
	trailer->Remove( "Prev" );
	trailer->Remove( "XRefStm" );

	PRevision revision( new Revision( trailer ) );
	revisions.push_back( revision );
	return revision;
}

void RevisionChain::Delete( size_t index )
{
	if( revisions.size() == 1 )
		throw UsageError( "a document needs at least one revision, can't delete the last one" );
	if( index >= revisions.size() )
		throw UsageError( "revision index out of range" );

	revisions.erase( revisions.begin() + index );
}

void RevisionChain::Delete( PRevision const & revision )
{
	size_t index = IndexOf( revision );
	if( revisions.size() == 1 )
		throw UsageError( "a document needs at least one revision, can't delete the last one" );
	if( index == revisions.size() )
		return;

	revisions.erase( revisions.begin() + index );
}

size_t RevisionChain::IndexOf( PRevision const & revision ) const
{
	for( size_t i = 0; i < revisions.size(); i++ )
		if( revisions[i] == revision )
			return i;
	return revisions.size();
}

void RevisionChain::Merge( ObjectResolver const & objmap )
{
	if( revisions.size() == 1 )
		return;

	for( const_iterator it = revisions.begin(); it != revisions.end(); ++it )
		objmap.LoadRevision( **it );

	PRevision oldest = revisions.front();

	for( size_t i = revisions.size() - 1; i > 0; i-- )
	{
		Revision & rev = *revisions[i];
		Revision & prev = *revisions[i - 1];

		prev.trailer = rev.trailer;

		for( Revision::const_iterator obj = rev.begin(); obj != rev.end(); ++obj )
		{
			PIndirectObject older = prev.Loaded( obj->first );
			if( older == obj->second )
				continue;

			if( older )
				prev.Delete( obj->first, false );

			prev.Store( obj->second );
		}
	}

	revisions.erase( revisions.begin() + 1, revisions.end() );
	oldest->trailer->Remove( "Prev" );
	oldest->trailer->Remove( "XRefStm" );
}
