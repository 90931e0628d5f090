#pragma once

struct FieldSpec
{
	std::string name;
	bool required;
	PObject defaultValue;	// empty when the field has no default
	std::string minVersion;
	std::string nestedType;	// schema of a dictionary value, "" if untyped

	FieldSpec( std::string const & name, bool required, PObject const & defaultValue,
		std::string const & minVersion, std::string const & nestedType )
		: name( name ), required( required ), defaultValue( defaultValue ),
		minVersion( minVersion ), nestedType( nestedType )
	{
	}
};

// Field tables keyed by schema name. A schema name is the /Type of a
// dictionary, or one of the names used for untyped dictionaries: Trailer,
// Info, ViewerPreferences, Resources, Names, Encrypt.
class FieldSchemaRegistry
{
	std::map< std::string, std::vector<FieldSpec> > schemas;

public:
	// The built-in tables.
	static FieldSchemaRegistry const & Standard();

	// Adds a field, replacing one of the same name.
	void Register( std::string const & type, FieldSpec const & field );

	bool Has( std::string const & type ) const { return schemas.find( type ) != schemas.end(); }

	std::vector<FieldSpec> const * Fields( std::string const & type ) const;
	FieldSpec const * Field( std::string const & type, std::string const & name ) const;

	// The registered /Type of `dict`, else `hint`.
	std::string SchemaOf( Dictionary const & dict, std::string const & hint ) const;
};

typedef std::map<IndirectObject const *, std::string> SchemaTypes;

// Schema names for indirect objects without a registered /Type, derived from
// the typed fields that point at them, starting at the current trailer.
void InferSchemaTypes( Document const & doc, ObjectList const & objects,
	FieldSchemaRegistry const & registry, SchemaTypes & out );

// "1.6" > "1.4"
int CompareVersions( std::string const & a, std::string const & b );
