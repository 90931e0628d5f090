#include "pch.h"
#include "file_parser.h"
#include "object_stream.h"

namespace
{
	// Marks an identity as being loaded for the lifetime of the guard.
	class InProgressGuard
	{
		std::set<ObjectId> & set;
		ObjectId id;

	public:
		InProgressGuard( std::set<ObjectId> & set, ObjectId id )
			: set( set ), id( id )
		{
			set.insert( id );
		}

		~InProgressGuard()
		{
			set.erase( id );
		}
	};
}

PIndirectObject ObjectResolver::Resolve( ObjectId id ) const
{
	if( id.num == 0 )
		return PIndirectObject();

	std::map<ObjectId, PIndirectObject>::iterator cached = cache.find( id );
	if( cached != cache.end() )
	{
		if( !cached->second->IsFree() && cached->second->id == id )
			return cached->second;
		cache.erase( cached );
	}

	if( inProgress.count( id ) )
	{
		DebugOutput( DebugLevel::Warning, "object %u %u is needed to load itself", id.num, id.gen );
		return PIndirectObject();
	}

	for( RevisionChain::const_iterator it = revisions.end(); it != revisions.begin(); )
	{
		Revision & revision = **--it;

		PIndirectObject obj = revision.Loaded( id.num );
		if( obj )
		{
			if( obj->IsFree() || obj->id.gen != id.gen )
				return PIndirectObject();

			cache[ id ] = obj;
			return obj;
		}

		const Xref* entry = revision.xref.find( id.num );
		if( !entry )
			continue;

		if( entry->IsFree() || entry->generation != id.gen )
			return PIndirectObject();

		obj = LoadEntry( revision, *entry );
		if( obj )
			cache[ id ] = obj;
		return obj;
	}

	return PIndirectObject();
}

PIndirectObject ObjectResolver::LoadEntry( Revision & revision, Xref const & entry ) const
{
	ObjectId id = entry.Id();

	if( entry.IsFree() )
	{
		revision.Store( PIndirectObject( new IndirectObject( id, PObject() ) ) );
		return PIndirectObject();
	}

	PObject value;
	{
		InProgressGuard guard( inProgress, id );

		try
		{
			if( entry.IsCompressed() )
				value = LoadCompressed( entry );
			else if( parser )
				value = parser->ParseObjectAt( entry.pos, id, this );
			else
				throw MalformedPdfError( "no file to load the object from", entry.pos );
		}
		catch( MalformedPdfError const & e )
		{
			DebugOutput( DebugLevel::Warning, "object %u %u could not be loaded: %s (at %zu)",
				id.num, id.gen, e.what(), e.offset );
			return PIndirectObject();
		}
	}

	if( !value )
		return PIndirectObject();

	// the object may have been stored while its own value was being loaded
	PIndirectObject existing = revision.Loaded( id.num );
	if( existing && existing->id == id && !existing->IsFree() )
		return existing;

	PIndirectObject obj( new IndirectObject( id, value ) );
	revision.Store( obj );
	return obj;
}

PObject ObjectResolver::LoadCompressed( Xref const & entry ) const
{
	ObjectId containerId( entry.stream, 0 );

	std::map<ObjectId, boost::shared_ptr<ObjectStream> >::iterator it = objectStreams.find( containerId );
	if( it == objectStreams.end() )
	{
		PIndirectObject container = Resolve( containerId );
		PStream stream = container ? boost::dynamic_pointer_cast<Stream>( container->value ) : PStream();
		if( !stream )
			throw MalformedPdfError( "object stream is missing", 0 );

		boost::shared_ptr<ObjectStream> table( new ObjectStream() );
		table->Load( *stream, *this );
		it = objectStreams.insert( std::make_pair( containerId, table ) ).first;
	}

	ObjectStream const & table = *it->second;
	if( entry.pos >= table.Size() || table.MemberNumber( entry.pos ) != entry.num )
		throw MalformedPdfError( "object stream does not hold the object at the given index", 0 );

	return table.ParseMember( entry.pos );
}

void ObjectResolver::LoadRevision( Revision & revision ) const
{
	for( XrefSection::const_iterator it = revision.xref.begin(); it != revision.xref.end(); ++it )
		if( !revision.Loaded( it->first ) )
			LoadEntry( revision, it->second );
}

void ObjectResolver::Invalidate()
{
	cache.clear();
	objectStreams.clear();
}

void ObjectResolver::Invalidate( ObjectId id )
{
	cache.erase( id );
	objectStreams.erase( id );
}

void ObjectResolver::Release()
{
	for( std::map<ObjectId, PIndirectObject>::iterator it = cache.begin(); it != cache.end(); ++it )
		it->second->value.reset();
	Invalidate();
}
