#include "pch.h"
#include "dereference.h"
#include "object_stream.h"
#include "optimize.h"

static void LoadAll( Document & doc )
{
	RevisionChain const & revisions = doc.Revisions();
	for( RevisionChain::const_iterator it = revisions.begin(); it != revisions.end(); ++it )
		doc.Resolver().LoadRevision( **it );
}

static PIndirectObject AddXrefStream( Document & doc, size_t revisionIndex )
{
	PDictionary dict( new Dictionary() );
	dict->Add( "Type", PName( new Name( String( "XRef" ) ) ) );
	return doc.Add( PStream( new Stream( dict, std::string() ) ), revisionIndex );
}

static bool HasLiveObjectOfType( Revision const & revision, char const * type )
{
	for( Revision::const_iterator it = revision.begin(); it != revision.end(); ++it )
		if (!it->second->IsFree() && GetTypeName( it->second->value ) == type)
			return true;
	return false;
}

// Indirect /Length values are dropped with their objects; the writer emits the
// real length anyway.
static void FixStreamLengths( Revision const & revision )
{
	for( Revision::const_iterator it = revision.begin(); it != revision.end(); ++it )
	{
		PObject value = it->second->value;
		if (!value || value->Type() != ObjectType::Stream)
			continue;

		Stream & stream = *(Stream *)value.get();
		PObject length = stream.dict->Get( "Length" );
		if (length && (length->Type() == ObjectType::IndirectObject || length->Type() == ObjectType::Ref))
			stream.dict->Add( "Length", PNumber( new Number( (long long)stream.raw.size() ) ) );
	}
}

void Compact( Document & doc, StreamMode::StreamMode xrefStreams )
{
	RevisionChain & revisions = doc.Revisions();

	revisions.Merge( doc.Resolver() );
	doc.Resolver().Invalidate();

	std::vector<PIndirectObject> unusedList;
	DereferenceAll( doc, unusedList );
	std::set<IndirectObject const *> unused;
	for( std::vector<PIndirectObject>::const_iterator it = unusedList.begin(); it != unusedList.end(); ++it )
		unused.insert( it->get() );

	PRevision old = revisions[0];
	PRevision fresh = revisions.Add();

	unsigned next = 1;
	for( Revision::const_iterator it = old->begin(); it != old->end(); ++it )
	{
		PIndirectObject const & obj = it->second;
		if (obj->IsFree())
			continue;

		std::string type = GetTypeName( obj->value );
		if (unused.count( obj.get() ) || type == "ObjStm" || (type == "XRef" && xrefStreams != StreamMode::Preserve))
		{
			obj->value.reset();
			continue;
		}

		obj->id = ObjectId( next++, 0 );
		fresh->Add( obj );
	}

	revisions.Delete( old );
	fresh->trailer->Add( "Size", PNumber( new Number( (long long)next ) ) );
	doc.Resolver().Invalidate();

	FixStreamLengths( *fresh );

	DebugOutput( DebugLevel::Info, "compacted to %u objects, %u unused dropped",
		next - 1, (unsigned)unusedList.size() );

	CheckIntegrity( doc );
}

void GenerateObjectStreams( Document & doc )
{
	// members of the old containers must be loaded before any container goes away
	LoadAll( doc );

	DocumentConfig const & config = doc.Config();
	size_t chunk = std::max<size_t>( config.objectStreamSize, 1 );

	for( size_t index = 0; index < doc.Revisions().Size(); index++ )
	{
		PRevision revision = doc.Revisions()[index];

		bool hasXrefStream = false;
		std::vector<PIndirectObject> oldContainers, candidates;

		for( Revision::const_iterator it = revision->begin(); it != revision->end(); ++it )
		{
			PIndirectObject const & obj = it->second;
			if (obj->IsFree())
				continue;

			std::string type = GetTypeName( obj->value );
			if (type == "XRef")
				hasXrefStream = true;
			else if (type == "ObjStm")
				oldContainers.push_back( obj );
			else if (CanPackIntoObjectStream( obj, doc.Trailer(), config ))
				candidates.push_back( obj );
		}

		for( std::vector<PIndirectObject>::const_iterator it = oldContainers.begin(); it != oldContainers.end(); ++it )
		{
			ObjectId id = (*it)->id;
			revision->Delete( id.num, true );
			doc.Resolver().Invalidate( id );
		}

		for( size_t i = 0; i < candidates.size(); i += chunk )
		{
			std::vector<PIndirectObject> members( candidates.begin() + i,
				candidates.begin() + std::min( i + chunk, candidates.size() ) );

			PStream container( new Stream( PDictionary( new Dictionary() ), std::string() ) );
			ObjectStream::Pack( *container, members );
			doc.Add( container, index );
		}

		if (!hasXrefStream)
			AddXrefStream( doc, index );

		DebugOutput( DebugLevel::Info, "revision %u: %u objects packed, %u old object streams removed",
			(unsigned)index, (unsigned)candidates.size(), (unsigned)oldContainers.size() );
	}
}

void DeleteObjectStreams( Document & doc, StreamMode::StreamMode xrefStreams )
{
	LoadAll( doc );

	for( size_t index = 0; index < doc.Revisions().Size(); index++ )
	{
		PRevision revision = doc.Revisions()[index];

		bool hasXrefStream = false;
		std::vector<unsigned> doomed;

		for( Revision::const_iterator it = revision->begin(); it != revision->end(); ++it )
		{
			if (it->second->IsFree())
				continue;

			std::string type = GetTypeName( it->second->value );
			if (type == "ObjStm")
				doomed.push_back( it->first );
			else if (type == "XRef")
			{
				hasXrefStream = true;
				if (xrefStreams == StreamMode::Delete)
					doomed.push_back( it->first );
			}
		}

		for( std::vector<unsigned>::const_iterator it = doomed.begin(); it != doomed.end(); ++it )
			revision->Delete( *it, true );

		if (xrefStreams == StreamMode::Generate && !hasXrefStream)
			AddXrefStream( doc, index );
	}

	doc.Resolver().Invalidate();
}

void GenerateXrefStreams( Document & doc )
{
	LoadAll( doc );

	for( size_t index = 0; index < doc.Revisions().Size(); index++ )
		if (!HasLiveObjectOfType( *doc.Revisions()[index], "XRef" ))
			AddXrefStream( doc, index );
}

void DeleteXrefStreams( Document & doc )
{
	LoadAll( doc );

	RevisionChain const & revisions = doc.Revisions();
	for( RevisionChain::const_iterator rev = revisions.begin(); rev != revisions.end(); ++rev )
		if (HasLiveObjectOfType( **rev, "ObjStm" ))
			throw UsageError( "object streams need a cross-reference stream, delete them first" );

	for( RevisionChain::const_iterator rev = revisions.begin(); rev != revisions.end(); ++rev )
	{
		std::vector<unsigned> doomed;
		for( Revision::const_iterator it = (*rev)->begin(); it != (*rev)->end(); ++it )
			if (!it->second->IsFree() && GetTypeName( it->second->value ) == "XRef")
				doomed.push_back( it->first );

		for( std::vector<unsigned>::const_iterator it = doomed.begin(); it != doomed.end(); ++it )
			(*rev)->Delete( *it, true );
	}

	doc.Resolver().Invalidate();
}

static void PruneDictionary( Dictionary & dict, std::string const & schema, FieldSchemaRegistry const & registry )
{
	std::vector<String> doomed;

	for( Dictionary::const_iterator it = dict.begin(); it != dict.end(); ++it )
	{
		FieldSpec const * field = registry.Field( schema, it->first.value );

		if (field && !field->required && field->defaultValue && ObjectsEqual( it->second, field->defaultValue ))
		{
			doomed.push_back( it->first );
			continue;
		}

		if (it->second->Type() != ObjectType::Dictionary)
			continue;

		Dictionary & nested = *(Dictionary *)it->second.get();
		std::string nestedSchema = registry.SchemaOf( nested, field ? field->nestedType : std::string() );
		if (!nestedSchema.empty())
			PruneDictionary( nested, nestedSchema, registry );
	}

	for( std::vector<String>::const_iterator it = doomed.begin(); it != doomed.end(); ++it )
		dict.Remove( *it );
}

void PruneDefaultFields( Document & doc, FieldSchemaRegistry const & registry )
{
	ObjectList objects;
	doc.EachObject( false, objects );

	// typed before anything is pruned: a default /Type may go away
	SchemaTypes types;
	InferSchemaTypes( doc, objects, registry, types );

	PruneDictionary( *doc.Trailer(), "Trailer", registry );

	for( ObjectList::const_iterator it = objects.begin(); it != objects.end(); ++it )
	{
		PDictionary dict = GetDictionary( it->first->value );
		if (!dict)
			continue;

		SchemaTypes::const_iterator inferred = types.find( it->first.get() );
		std::string schema = registry.SchemaOf( *dict, inferred == types.end() ? std::string() : inferred->second );
		if (!schema.empty())
			PruneDictionary( *dict, schema, registry );
	}
}

static void CheckValue( Document const & doc, PObject const & value, std::set<Object const *> & seen )
{
	if (!value)
		return;

	char sz[96];

	switch( value->Type() )
	{
	case ObjectType::Ref:
		{
			ObjectId id = ((Indirect *)value.get())->Id();
			PIndirectObject target = doc.GetObject( id );
			if (!target)
			{
				snprintf( sz, sizeof( sz ), "reference to missing object %u %u", id.num, id.gen );
				throw IntegrityError( sz );
			}
			CheckValue( doc, target, seen );
			return;
		}

	case ObjectType::IndirectObject:
		{
			IndirectObject const & obj = *(IndirectObject *)value.get();
			if (!obj.IsIndirect())
			{
				CheckValue( doc, obj.value, seen );
				return;
			}

			if (!seen.insert( &obj ).second)
				return;

			if (obj.IsFree() || doc.GetObject( obj.id ).get() != &obj)
			{
				snprintf( sz, sizeof( sz ), "object %u %u is referenced but not part of the document", obj.id.num, obj.id.gen );
				throw IntegrityError( sz );
			}

			CheckValue( doc, obj.value, seen );
			return;
		}

	case ObjectType::Dictionary:
		if (seen.insert( value.get() ).second)
		{
			Dictionary const & dict = *(Dictionary *)value.get();
			for( Dictionary::const_iterator it = dict.begin(); it != dict.end(); ++it )
				CheckValue( doc, it->second, seen );
		}
		return;

	case ObjectType::Stream:
		CheckValue( doc, ((Stream *)value.get())->dict, seen );
		return;

	case ObjectType::Array:
		if (seen.insert( value.get() ).second)
		{
			Array const & array = *(Array *)value.get();
			for( std::vector<PObject>::const_iterator it = array.elements.begin(); it != array.elements.end(); ++it )
				CheckValue( doc, *it, seen );
		}
		return;

	default:
		return;
	}
}

void CheckIntegrity( Document const & doc )
{
	std::set<Object const *> seen;
	CheckValue( doc, doc.Trailer(), seen );
}

void Optimize( Document & doc, OptimizeOptions const & options, FieldSchemaRegistry const & registry )
{
	if (options.objectStreams == StreamMode::Generate && options.xrefStreams == StreamMode::Delete)
		throw UsageError( "object streams can't be generated without cross-reference streams" );

	if (options.compact)
		Compact( doc, options.xrefStreams );

	if (options.pruneDefaults)
		PruneDefaultFields( doc, registry );

	if (options.objectStreams == StreamMode::Generate)
		GenerateObjectStreams( doc );
	else if (options.objectStreams == StreamMode::Delete)
		DeleteObjectStreams( doc, options.xrefStreams );
	else if (options.xrefStreams == StreamMode::Generate)
		GenerateXrefStreams( doc );
	else if (options.xrefStreams == StreamMode::Delete)
		DeleteXrefStreams( doc );
}
