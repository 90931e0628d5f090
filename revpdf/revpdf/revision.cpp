#include "pch.h"

const size_t Revision::InMemory;

bool Revision::Has( ObjectId id ) const
{
	const_iterator it = objects.find( id.num );
	if( it != objects.end() )
		return !it->second->IsFree() && it->second->id == id;

	const Xref* entry = xref.find( id );
	return entry && !entry->IsFree();
}

void Revision::Store( PIndirectObject const & obj )
{
	objects[ obj->id.num ] = obj;
}

void Revision::Add( PIndirectObject const & obj )
{
	if( !obj->IsIndirect() )
		throw UsageError( "only indirect objects can be added to a revision" );

	unsigned num = obj->id.num;
	if( Contains( num ) )
	{
		char sz[96];
		snprintf( sz, sizeof( sz ), "object %u is already part of this revision", num );
		throw UsageError( sz );
	}

	objects[ num ] = obj;
}

void Revision::Delete( unsigned num, bool markAsFree )
{
	if( !Contains( num ) )
		return;

	PIndirectObject existing = Loaded( num );
	if( existing )
		existing->value.reset();

	if( !markAsFree )
	{
		objects.erase( num );
		xref.erase( num );
	}
	else if( !existing )
	{
		const Xref* entry = xref.find( num );
		objects[ num ] = PIndirectObject( new IndirectObject( ObjectId( num, entry->generation ), PObject() ) );
	}
}

unsigned Revision::NextFreeNumber() const
{
	unsigned highest = xref.maxNum();
	if( !objects.empty() && objects.rbegin()->first > highest )
		highest = objects.rbegin()->first;
	return highest + 1;
}
