#include "pch.h"
#include "min_version.h"

static void Raise( std::string & version, std::string const & candidate )
{
	if (CompareVersions( candidate, version ) > 0)
		version = candidate;
}

static void WalkValue( PObject const & value, std::string const & hint,
	FieldSchemaRegistry const & registry, std::string & version );

static void WalkDictionary( Dictionary const & dict, std::string const & schema,
	FieldSchemaRegistry const & registry, std::string & version )
{
	for( Dictionary::const_iterator it = dict.begin(); it != dict.end(); ++it )
	{
		FieldSpec const * field = schema.empty() ? 0 : registry.Field( schema, it->first.value );
		if (field)
			Raise( version, field->minVersion );

		WalkValue( it->second, field ? field->nestedType : std::string(), registry, version );
	}
}

static void WalkValue( PObject const & value, std::string const & hint,
	FieldSchemaRegistry const & registry, std::string & version )
{
	if (!value)
		return;

	if (value->Type() == ObjectType::Dictionary)
	{
		Dictionary const & dict = *(Dictionary *)value.get();
		WalkDictionary( dict, registry.SchemaOf( dict, hint ), registry, version );
	}
	else if (value->Type() == ObjectType::Array)
	{
		Array const & array = *(Array *)value.get();
		for( std::vector<PObject>::const_iterator it = array.elements.begin(); it != array.elements.end(); ++it )
			WalkValue( *it, std::string(), registry, version );
	}
}

std::string ComputeMinimumVersion( Document const & doc, FieldSchemaRegistry const & registry )
{
	ObjectList objects;
	doc.EachObject( false, objects );

	SchemaTypes types;
	InferSchemaTypes( doc, objects, registry, types );

	std::string version = "1.0";
	WalkDictionary( *doc.Trailer(), "Trailer", registry, version );

	for( ObjectList::const_iterator it = objects.begin(); it != objects.end(); ++it )
	{
		PDictionary dict = GetDictionary( it->first->value );
		if (!dict)
			continue;

		SchemaTypes::const_iterator inferred = types.find( it->first.get() );
		std::string schema = registry.SchemaOf( *dict, inferred == types.end() ? std::string() : inferred->second );
		WalkDictionary( *dict, schema, registry, version );
	}

	return version;
}

std::string RaiseVersionToMinimum( Document & doc, FieldSchemaRegistry const & registry )
{
	std::string minimum = ComputeMinimumVersion( doc, registry );
	if (CompareVersions( minimum, doc.Version() ) > 0)
	{
		DebugOutput( DebugLevel::Info, "raising version from %s to %s", doc.Version().c_str(), minimum.c_str() );
		doc.SetVersion( minimum );
	}

	return doc.Version();
}
